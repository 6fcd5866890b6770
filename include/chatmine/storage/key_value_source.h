#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <chatmine/core/types.h>

namespace chatmine::storage {

/// Name of the host application's single key-value table
inline constexpr std::string_view kItemTable = "ItemTable";

/**
 * @brief One row of the key-value table. The value is opaque (normally JSON) and not parsed here.
 */
struct KeyValueEntry {
    std::string key;
    std::string value;
};

/**
 * @brief Read-only query surface over the key-value table
 *
 * Format adapters see the store only through this interface.
 */
class IKeyValueSource {
public:
    virtual ~IKeyValueSource() = default;

    /// Every row with a non-NULL key and value
    virtual Result<std::vector<KeyValueEntry>> getAllEntries() = 0;

    /// Rows whose key is one of @p keys; an empty list yields no rows
    virtual Result<std::vector<KeyValueEntry>> getEntriesByKeys(const std::vector<std::string>& keys) = 0;

    /// Rows whose key matches a SQL LIKE pattern, e.g. "composerData:%"
    virtual Result<std::vector<KeyValueEntry>> getEntriesByPrefix(std::string_view likePattern) = 0;
};

} // namespace chatmine::storage
