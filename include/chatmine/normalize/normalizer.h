#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <chatmine/core/types.h>
#include <chatmine/discovery/path_discovery.h>
#include <chatmine/extraction/format_adapter.h>
#include <chatmine/model/conversation.h>

namespace spdlog {
class logger;
}

namespace chatmine::normalize {

inline constexpr size_t kDefaultMaxThreadsPerDb = 1000;
inline constexpr size_t kDefaultMaxMessagesPerThread = 1000;

struct NormalizerOptions {
    /// Per-adapter switches keyed by adapter name; adapters not listed are enabled
    std::map<std::string, bool, std::less<>> enabledAdapters;
    /// When the first (modern) adapter yields threads, later adapters only fill gaps
    bool preferModern = true;
    size_t maxThreadsPerDb = kDefaultMaxThreadsPerDb;           ///< 0 = unlimited
    size_t maxMessagesPerThread = kDefaultMaxMessagesPerThread; ///< 0 = unlimited
    /// Mask API keys, bearer tokens and e-mail addresses in content and previews
    bool redactSecrets = false;

    [[nodiscard]] bool isAdapterEnabled(std::string_view name) const;
};

/**
 * @brief Counters of the most recent normalizeAllDatabases() pass
 */
struct PassStats {
    size_t databasesFound = 0;
    size_t databasesSkipped = 0; ///< Open or query failure; logged at error level
    size_t databasesEmpty = 0;   ///< Opened fine but produced no threads
    size_t recordsSkipped = 0;   ///< Malformed records dropped by adapters
};

/**
 * @brief Runs the registered adapters over each database and merges their output
 *
 * One pass opens, extracts and closes each database in turn. Adapters run in
 * registry order; the first one to produce threads wins id collisions. After
 * merging, the retention limits are applied: threads are capped by most
 * recent activity, then each thread's messages are capped keeping the oldest.
 *
 * Example usage:
 * @code
 *   Normalizer normalizer;
 *   auto results = normalizer.normalizeAllDatabases();
 *   if (!results) {
 *       // only ErrorCode::UnsupportedPlatform ends up here
 *   }
 * @endcode
 */
class Normalizer {
public:
    explicit Normalizer(NormalizerOptions options = {},
                        discovery::DiscoveryOptions discoveryOptions =
                            discovery::DiscoveryOptions::fromEnvironment(),
                        std::shared_ptr<spdlog::logger> logger = nullptr,
                        extraction::AdapterRegistry registry =
                            extraction::AdapterRegistry::withBuiltins());

    /**
     * @brief Normalize one database file
     * @return DatabaseOpenFailed or QueryFailed when the database cannot be read
     */
    Result<NormalizationResult> normalizeDatabase(const std::filesystem::path& dbPath);

    /**
     * @brief Discover and normalize every database on this machine
     *
     * Databases that fail are logged and skipped; databases without threads are
     * omitted. Counters are available from lastPassStats() afterwards.
     * @return UnsupportedPlatform when there is no base-directory table for this platform
     */
    Result<std::vector<NormalizationResult>> normalizeAllDatabases();

    /// Counters since the last normalizeAllDatabases() started
    [[nodiscard]] const PassStats& lastPassStats() const { return stats_; }
    [[nodiscard]] const NormalizerOptions& options() const { return options_; }

    /// Clock substituted for missing source timestamps and used for extractedAt
    void setClock(extraction::Clock clock) { clock_ = std::move(clock); }

    /**
     * @brief Apply thread and per-thread message limits in place (0 = unlimited)
     *
     * Also keeps messageCount / lastMessage consistent with the surviving
     * messages and refreshes the metadata totals.
     */
    static void applyRetention(NormalizationResult& result, size_t maxThreads, size_t maxMessages);

private:
    NormalizerOptions options_;
    discovery::PathDiscovery discovery_;
    std::shared_ptr<spdlog::logger> logger_;
    extraction::AdapterRegistry registry_;
    extraction::Clock clock_ = extraction::systemNowMillis;
    PassStats stats_;

    void redact(NormalizationResult& result) const;
};

} // namespace chatmine::normalize
