#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace chatmine::crypto {

// SHA-256 implementation
class SHA256Hasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init();
    void update(std::span<const std::byte> data);
    void update(std::string_view text);

    // Lowercase hex digest; the hasher is re-initialized afterwards
    std::string finalize();

    // Static utility for one-shot hashing
    static std::string hash(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

inline constexpr size_t kStableIdLength = 16;

/**
 * @brief Deterministic short identifier for a tuple of strings
 *
 * The parts are joined with '|' and hashed with SHA-256; the first
 * kStableIdLength hex characters form the id. The same parts always produce
 * the same id, which is what keeps thread and message ids stable across
 * repeated extractions.
 */
std::string stableId(std::initializer_list<std::string_view> parts);

} // namespace chatmine::crypto
