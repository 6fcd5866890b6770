#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <chatmine/core/types.h>

namespace spdlog {
class logger;
}

namespace chatmine::discovery {

enum class Platform { Linux, MacOS, Windows, Unknown };

/// Platform this binary was compiled for
Platform currentPlatform();

constexpr const char* platformName(Platform platform) {
    switch (platform) {
        case Platform::Linux:
            return "linux";
        case Platform::MacOS:
            return "darwin";
        case Platform::Windows:
            return "win32";
        case Platform::Unknown:
            return "unknown";
    }
    return "unknown";
}

/// Workspace id reported for databases under globalStorage
inline constexpr std::string_view kGlobalWorkspaceId = "_global_";

/// Workspace id callers substitute when workspaceIdFor() finds nothing
inline constexpr std::string_view kUnknownWorkspaceId = "unknown";

/// File name of the per-workspace and global key-value stores
inline constexpr std::string_view kDatabaseFileName = "state.vscdb";

struct DiscoveryOptions {
    Platform platform = currentPlatform();
    /// Home directory the base-directory table is resolved against (empty: $HOME / %USERPROFILE%)
    std::filesystem::path homeDir;
    /// When non-empty, replaces the platform base-directory table
    std::vector<std::filesystem::path> baseDirOverride;

    /// Defaults plus CHATMINE_CURSOR_USER_DIR as a base-directory override
    static DiscoveryOptions fromEnvironment();
};

/**
 * @brief Locates the host application's key-value databases on this machine
 *
 * The base directories come from a fixed per-platform table. Under each base
 * directory, globalStorage and workspaceStorage are searched recursively for
 * kDatabaseFileName. A missing base directory is normal (the application is
 * simply not installed) and yields no paths rather than an error.
 */
class PathDiscovery {
public:
    explicit PathDiscovery(DiscoveryOptions options = DiscoveryOptions::fromEnvironment(),
                           std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Base directories for the configured platform
     * @return UnsupportedPlatform when the platform has no table entry
     */
    Result<std::vector<std::filesystem::path>> baseDirectories() const;

    /**
     * @brief All database files found under the base directories, sorted
     * @return UnsupportedPlatform when the platform has no table entry
     */
    Result<std::vector<std::filesystem::path>> findDatabases() const;

    /**
     * @brief Workspace identifier encoded in a database path
     *
     * ".../workspaceStorage/<id>/state.vscdb" yields "<id>", anything under
     * globalStorage yields kGlobalWorkspaceId, other paths yield std::nullopt.
     */
    static std::optional<std::string> workspaceIdFor(const std::filesystem::path& dbPath);

    /// True when a -wal or -shm sidecar exists next to the database
    static bool isDatabaseInUse(const std::filesystem::path& dbPath);

    /// The database file followed by whichever of its -wal / -shm sidecars exist
    static std::vector<std::filesystem::path> databaseFiles(const std::filesystem::path& dbPath);

    [[nodiscard]] const DiscoveryOptions& options() const { return options_; }

private:
    DiscoveryOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    void scanTree(const std::filesystem::path& root, std::vector<std::filesystem::path>& out) const;
};

} // namespace chatmine::discovery
