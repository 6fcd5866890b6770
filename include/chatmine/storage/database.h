#pragma once

#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <chatmine/core/types.h>

namespace chatmine::storage {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Read-write mode
    ReadOnly,  ///< Read-only mode (default)
    Create     ///< Create if not exists
};

/**
 * @brief Outcome of a WAL checkpoint
 */
struct CheckpointStats {
    bool busy = false;        ///< Checkpoint could not complete because of another connection
    int logFrames = 0;        ///< Frames in the write-ahead log (-1 when not in WAL mode)
    int checkpointedFrames = 0;
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement (1-based index)
     */
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    /// TEXT or BLOB column as bytes; empty for NULL
    std::string getString(int column) const;

private:
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open database connection
     *
     * Fails with DatabaseOpenFailed when the file is missing (for the read
     * modes) or is not a SQLite database.
     */
    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadOnly);

    /**
     * @brief Close database connection. Safe to call repeatedly.
     */
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries)
     */
    Result<void> execute(const std::string& sql);

    /**
     * @brief Run PRAGMA wal_checkpoint(FULL), folding the write-ahead log into the main file
     */
    Result<CheckpointStats> checkpoint();

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace chatmine::storage
