#include <chatmine/discovery/path_discovery.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <regex>
#include <system_error>

namespace chatmine::discovery {

namespace fs = std::filesystem;

namespace {

fs::path resolveHome(const fs::path& configured) {
    if (!configured.empty())
        return configured;
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home);
    if (const char* profile = std::getenv("USERPROFILE"); profile && *profile)
        return fs::path(profile);
    return {};
}

} // namespace

Platform currentPlatform() {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

DiscoveryOptions DiscoveryOptions::fromEnvironment() {
    DiscoveryOptions options;
    if (const char* dir = std::getenv("CHATMINE_CURSOR_USER_DIR"); dir && *dir) {
        options.baseDirOverride.emplace_back(dir);
    }
    return options;
}

PathDiscovery::PathDiscovery(DiscoveryOptions options, std::shared_ptr<spdlog::logger> logger)
    : options_(std::move(options)), logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

Result<std::vector<fs::path>> PathDiscovery::baseDirectories() const {
    if (options_.platform == Platform::Unknown) {
        return Error{ErrorCode::UnsupportedPlatform, "No database locations known for this platform"};
    }
    if (!options_.baseDirOverride.empty()) {
        return options_.baseDirOverride;
    }

    const fs::path home = resolveHome(options_.homeDir);
    std::vector<fs::path> bases;
    switch (options_.platform) {
        case Platform::MacOS:
            bases.push_back(home / "Library" / "Application Support" / "Cursor" / "User");
            break;
        case Platform::Windows:
            bases.push_back(home / "AppData" / "Roaming" / "Cursor" / "User");
            bases.push_back(home / "AppData" / "Local" / "Cursor" / "User");
            break;
        case Platform::Linux:
            bases.push_back(home / ".config" / "Cursor" / "User");
            break;
        case Platform::Unknown:
            break;
    }
    return bases;
}

Result<std::vector<fs::path>> PathDiscovery::findDatabases() const {
    auto basesResult = baseDirectories();
    if (!basesResult)
        return basesResult.error();

    std::vector<fs::path> databases;
    for (const auto& base : basesResult.value()) {
        std::error_code ec;
        if (!fs::is_directory(base, ec)) {
            logger_->debug("Base directory {} not present, skipping", base.string());
            continue;
        }
        scanTree(base / "globalStorage", databases);
        scanTree(base / "workspaceStorage", databases);
    }

    std::sort(databases.begin(), databases.end());
    databases.erase(std::unique(databases.begin(), databases.end()), databases.end());
    logger_->debug("Discovered {} database(s)", databases.size());
    return databases;
}

void PathDiscovery::scanTree(const fs::path& root, std::vector<fs::path>& out) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        return;

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        logger_->warn("Failed to search in {}: {}", root.string(), ec.message());
        return;
    }
    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            logger_->warn("Failed to search in {}: {}", root.string(), ec.message());
            return;
        }
        std::error_code typeEc;
        if (it->path().filename() == fs::path(kDatabaseFileName) && it->is_regular_file(typeEc)) {
            out.push_back(it->path());
        }
    }
}

std::optional<std::string> PathDiscovery::workspaceIdFor(const fs::path& dbPath) {
    static const std::regex kWorkspacePattern(R"(workspaceStorage[/\\]([^/\\]+)[/\\])");

    const std::string path = dbPath.string();
    std::smatch match;
    if (std::regex_search(path, match, kWorkspacePattern)) {
        return match[1].str();
    }
    if (path.find("globalStorage") != std::string::npos) {
        return std::string(kGlobalWorkspaceId);
    }
    return std::nullopt;
}

bool PathDiscovery::isDatabaseInUse(const fs::path& dbPath) {
    std::error_code ec;
    return fs::exists(dbPath.string() + "-wal", ec) || fs::exists(dbPath.string() + "-shm", ec);
}

std::vector<fs::path> PathDiscovery::databaseFiles(const fs::path& dbPath) {
    std::vector<fs::path> files{dbPath};
    for (const char* suffix : {"-wal", "-shm"}) {
        fs::path sidecar = dbPath.string() + suffix;
        std::error_code ec;
        if (fs::exists(sidecar, ec)) {
            files.push_back(std::move(sidecar));
        }
    }
    return files;
}

} // namespace chatmine::discovery
