#include <chatmine/storage/safe_reader.h>

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <random>
#include <system_error>
#include <chatmine/discovery/path_discovery.h>

namespace chatmine::storage {

namespace fs = std::filesystem;

namespace {

constexpr int kMaxTempDirAttempts = 64;

std::string randomSuffix(size_t length) {
    static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, sizeof(kAlphabet) - 2);
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(kAlphabet[pick(rng)]);
    }
    return out;
}

Result<fs::path> makeUniqueTempDir(const fs::path& root) {
    std::error_code ec;
    fs::create_directories(root, ec);
    for (int attempt = 0; attempt < kMaxTempDirAttempts; ++attempt) {
        fs::path candidate = root / ("chatmine-db-" + randomSuffix(6));
        if (fs::create_directory(candidate, ec)) {
            return candidate;
        }
        if (ec) {
            return Error{ErrorCode::IoError, "Failed to create temp directory " +
                                                 candidate.string() + ": " + ec.message()};
        }
    }
    return Error{ErrorCode::IoError, "Failed to create a unique temp directory under " + root.string()};
}

} // namespace

SafeReader::SafeReader(fs::path sourcePath, std::shared_ptr<spdlog::logger> logger)
    : sourcePath_(std::move(sourcePath)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

SafeReader::~SafeReader() {
    close();
}

fs::path SafeReader::tempRoot() {
    if (const char* t = std::getenv("CHATMINE_TMPDIR"); t && *t) {
        return fs::path(t);
    }
    return fs::temp_directory_path();
}

Result<void> SafeReader::open() {
    if (db_.isOpen()) {
        return Error{ErrorCode::InvalidState, "Database is already open: " + sourcePath_.string()};
    }

    auto copied = copyToTemp();
    if (!copied) {
        close();
        return Error{ErrorCode::DatabaseOpenFailed, "Failed to open database safely: " +
                                                        copied.error().message};
    }

    auto checkpointed = checkpointCopy();
    if (!checkpointed) {
        close();
        return Error{ErrorCode::DatabaseOpenFailed, "Failed to open database safely: " +
                                                        checkpointed.error().message};
    }

    auto opened = db_.open(tempDbPath_.string(), ConnectionMode::ReadOnly);
    if (!opened) {
        close();
        return Error{ErrorCode::DatabaseOpenFailed, "Failed to open database safely: " +
                                                        opened.error().message};
    }

    logger_->debug("Opened copy of {} at {}", sourcePath_.string(), tempDbPath_.string());
    return {};
}

Result<void> SafeReader::copyToTemp() {
    std::error_code ec;
    if (!fs::is_regular_file(sourcePath_, ec)) {
        return Error{ErrorCode::FileNotFound, "Database file not found: " + sourcePath_.string()};
    }

    auto dirResult = makeUniqueTempDir(tempRoot());
    if (!dirResult)
        return dirResult.error();
    tempDir_ = std::move(dirResult).value();
    tempDbPath_ = tempDir_ / sourcePath_.filename();

    for (const auto& file : discovery::PathDiscovery::databaseFiles(sourcePath_)) {
        const fs::path target = tempDir_ / file.filename();
        if (!fs::copy_file(file, target, fs::copy_options::overwrite_existing, ec)) {
            // A sidecar may be removed by the host between the existence check and the copy
            std::error_code existsEc;
            if (file != sourcePath_ && !fs::exists(file, existsEc)) {
                logger_->debug("Sidecar {} vanished before copy, continuing", file.string());
                continue;
            }
            return Error{ErrorCode::IoError,
                         "Failed to copy " + file.string() + ": " + ec.message()};
        }
    }
    return {};
}

Result<void> SafeReader::checkpointCopy() {
    std::error_code ec;
    if (!fs::exists(tempDbPath_.string() + "-wal", ec)) {
        return {};
    }

    // Checkpointing writes; only the private copy is ever opened read-write
    Database writer;
    auto opened = writer.open(tempDbPath_.string(), ConnectionMode::ReadWrite);
    if (!opened)
        return opened.error();

    auto stats = writer.checkpoint();
    if (!stats)
        return stats.error();

    logger_->debug("Checkpointed {}: {} of {} WAL frames{}", tempDbPath_.string(),
                   stats.value().checkpointedFrames, stats.value().logFrames,
                   stats.value().busy ? " (busy)" : "");
    return {};
}

Result<std::vector<KeyValueEntry>> SafeReader::collect(Statement& stmt) {
    std::vector<KeyValueEntry> entries;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        entries.push_back(KeyValueEntry{stmt.getString(0), stmt.getString(1)});
    }
    return entries;
}

Result<std::vector<KeyValueEntry>> SafeReader::getAllEntries() {
    auto stmtResult = db_.prepare("SELECT key, value FROM ItemTable "
                                  "WHERE key IS NOT NULL AND value IS NOT NULL");
    if (!stmtResult)
        return Error{ErrorCode::QueryFailed, "Query failed: " + stmtResult.error().message};
    return collect(stmtResult.value());
}

Result<std::vector<KeyValueEntry>>
SafeReader::getEntriesByKeys(const std::vector<std::string>& keys) {
    if (keys.empty())
        return std::vector<KeyValueEntry>{};

    std::string sql = "SELECT key, value FROM ItemTable WHERE key IN (";
    for (size_t i = 0; i < keys.size(); ++i) {
        sql += (i == 0) ? "?" : ",?";
    }
    sql += ") AND value IS NOT NULL";

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return Error{ErrorCode::QueryFailed, "Query failed: " + stmtResult.error().message};

    Statement& stmt = stmtResult.value();
    for (size_t i = 0; i < keys.size(); ++i) {
        auto bound = stmt.bind(static_cast<int>(i + 1), keys[i]);
        if (!bound)
            return bound.error();
    }
    return collect(stmt);
}

Result<std::vector<KeyValueEntry>> SafeReader::getEntriesByPrefix(std::string_view likePattern) {
    auto stmtResult = db_.prepare("SELECT key, value FROM ItemTable "
                                  "WHERE key LIKE ? AND value IS NOT NULL");
    if (!stmtResult)
        return Error{ErrorCode::QueryFailed, "Query failed: " + stmtResult.error().message};

    Statement& stmt = stmtResult.value();
    auto bound = stmt.bind(1, likePattern);
    if (!bound)
        return bound.error();
    return collect(stmt);
}

Result<ReaderMetadata> SafeReader::metadata() {
    ReaderMetadata meta;
    meta.originalPath = sourcePath_;
    meta.tempPath = tempDbPath_;

    auto tables = db_.prepare("SELECT name FROM sqlite_master WHERE type='table' ORDER BY name");
    if (!tables)
        return Error{ErrorCode::QueryFailed, "Query failed: " + tables.error().message};
    while (true) {
        auto row = tables.value().step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        meta.tables.push_back(tables.value().getString(0));
    }

    auto version = db_.prepare("PRAGMA user_version");
    if (!version)
        return Error{ErrorCode::QueryFailed, "Query failed: " + version.error().message};
    if (auto row = version.value().step(); row && row.value()) {
        meta.userVersion = version.value().getInt64(0);
    }

    auto size = db_.prepare("SELECT page_count * page_size FROM pragma_page_count(), "
                            "pragma_page_size()");
    if (!size)
        return Error{ErrorCode::QueryFailed, "Query failed: " + size.error().message};
    if (auto row = size.value().step(); row && row.value()) {
        meta.sizeBytes = size.value().getInt64(0);
    }
    return meta;
}

void SafeReader::close() noexcept {
    db_.close();
    if (!tempDir_.empty()) {
        std::error_code ec;
        fs::remove_all(tempDir_, ec);
        if (ec) {
            logger_->warn("Failed to cleanup temp directory {}: {}", tempDir_.string(),
                          ec.message());
        } else {
            logger_->debug("Removed temp directory {}", tempDir_.string());
        }
        tempDir_.clear();
        tempDbPath_.clear();
    }
}

} // namespace chatmine::storage
