#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <chatmine/storage/database.h>
#include <chatmine/storage/key_value_source.h>

namespace spdlog {
class logger;
}

namespace chatmine::storage {

/**
 * @brief Facts about the opened copy, for diagnostics
 */
struct ReaderMetadata {
    std::vector<std::string> tables;
    int64_t userVersion = 0;
    int64_t sizeBytes = 0;
    std::filesystem::path originalPath;
    std::filesystem::path tempPath;
};

/**
 * @brief Copy-isolated, read-only accessor for a live key-value database
 *
 * open() never touches the source file beyond reading it: the database and
 * whichever -wal / -shm sidecars exist are copied into a fresh, randomly named
 * temporary directory, the copy's write-ahead log is checkpointed into the
 * copy's main file, and the copy is then opened read-only. The host
 * application can keep writing to the original throughout.
 *
 * The reader owns the temporary directory. close() releases the connection
 * and deletes the directory; it is idempotent and also runs from the
 * destructor and from a failed open(), so every exit path cleans up.
 *
 * Example usage:
 * @code
 *   SafeReader reader(dbPath);
 *   if (auto opened = reader.open(); !opened) {
 *       // opened.error().code == ErrorCode::DatabaseOpenFailed
 *   }
 *   auto entries = reader.getEntriesByPrefix("composerData:%");
 * @endcode
 */
class SafeReader final : public IKeyValueSource {
public:
    explicit SafeReader(std::filesystem::path sourcePath,
                        std::shared_ptr<spdlog::logger> logger = nullptr);
    ~SafeReader() override;

    SafeReader(const SafeReader&) = delete;
    SafeReader& operator=(const SafeReader&) = delete;
    SafeReader(SafeReader&&) = delete;
    SafeReader& operator=(SafeReader&&) = delete;

    /**
     * @brief Copy the database into a private temp directory and open the copy
     * @return DatabaseOpenFailed if copying or opening fails, InvalidState if already open
     */
    Result<void> open();

    Result<std::vector<KeyValueEntry>> getAllEntries() override;
    Result<std::vector<KeyValueEntry>> getEntriesByKeys(const std::vector<std::string>& keys) override;
    Result<std::vector<KeyValueEntry>> getEntriesByPrefix(std::string_view likePattern) override;

    Result<ReaderMetadata> metadata();

    /**
     * @brief Close the copy and delete its temporary directory. Safe to call repeatedly.
     */
    void close() noexcept;

    [[nodiscard]] bool isOpen() const { return db_.isOpen(); }
    [[nodiscard]] const std::filesystem::path& sourcePath() const { return sourcePath_; }
    /// Temporary directory of the current copy; empty when closed
    [[nodiscard]] const std::filesystem::path& tempDirectory() const { return tempDir_; }

    /// Parent directory for temporary copies: $CHATMINE_TMPDIR, else the system temp directory
    static std::filesystem::path tempRoot();

private:
    std::filesystem::path sourcePath_;
    std::filesystem::path tempDir_;
    std::filesystem::path tempDbPath_;
    Database db_;
    std::shared_ptr<spdlog::logger> logger_;

    Result<void> copyToTemp();
    Result<void> checkpointCopy();
    Result<std::vector<KeyValueEntry>> collect(Statement& stmt);
};

} // namespace chatmine::storage
