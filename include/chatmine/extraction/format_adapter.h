#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <chatmine/core/types.h>
#include <chatmine/model/conversation.h>
#include <chatmine/storage/key_value_source.h>

namespace spdlog {
class logger;
}

namespace chatmine::extraction {

/**
 * @brief Threads and messages produced by one adapter for one database
 */
struct AdapterOutput {
    std::vector<Thread> threads;
    std::vector<Message> messages;
    size_t skippedRecords = 0; ///< Records dropped as malformed; each one was logged
};

using Clock = std::function<EpochMillis()>;

/// Wall-clock time in epoch milliseconds
EpochMillis systemNowMillis();

/**
 * @brief Per-database inputs shared by every adapter run
 */
struct ExtractionContext {
    std::string workspaceId;
    std::shared_ptr<spdlog::logger> logger;
    /// Substituted for missing source timestamps. Ids derived from it are not reproducible.
    Clock now = systemNowMillis;
};

/**
 * @brief Strategy that extracts conversations assuming one source schema generation
 *
 * Implementations read only through the key-value source, tolerate missing or
 * malformed fields at every level, and skip (and log) a bad record instead of
 * failing the whole extraction. They never apply retention limits.
 */
class IFormatAdapter {
public:
    virtual ~IFormatAdapter() = default;

    /// Short name recorded as provenance, e.g. "composer"
    virtual std::string name() const = 0;

    /**
     * @brief Extract threads and messages
     * @return QueryFailed if the source could not be read; malformed records are not errors
     */
    virtual Result<AdapterOutput> extract(storage::IKeyValueSource& source,
                                          const ExtractionContext& context) = 0;
};

/**
 * @brief Ordered set of adapter factories
 *
 * Registration order is precedence order: the Normalizer runs adapters in
 * this order and earlier adapters win id collisions. A new schema generation
 * is supported by registering another adapter.
 */
class AdapterRegistry {
public:
    using AdapterCreator = std::function<std::unique_ptr<IFormatAdapter>()>;

    /**
     * @brief Register (or replace, keeping its position) the adapter called @p name
     */
    void registerAdapter(const std::string& name, AdapterCreator creator);

    /// Create a fresh adapter instance, or nullptr for an unknown name
    std::unique_ptr<IFormatAdapter> create(std::string_view name) const;

    /// Names in precedence order
    std::vector<std::string> names() const;

    bool contains(std::string_view name) const;
    size_t size() const { return entries_.size(); }

    /// "composer" (modern format) followed by "chatdata" (legacy format)
    static AdapterRegistry withBuiltins();

private:
    struct Entry {
        std::string name;
        AdapterCreator creator;
    };
    std::vector<Entry> entries_;
};

} // namespace chatmine::extraction
