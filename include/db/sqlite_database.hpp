#pragma once

#include "core/error.hpp"

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace shiplog {

/**
 * @brief Prepared statement (owns sqlite3_stmt*)
 *
 * Parameter indices are 1-based, column indices 0-based, as in the C API.
 * Failures throw StorageError.
 */
class Statement {
public:
    Statement(sqlite3* db, std::string_view sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    Statement& bind(int index, int64_t value);
    Statement& bind(int index, std::string_view value);
    Statement& bind(int index, const std::string& value) { return bind(index, std::string_view(value)); }
    Statement& bind(int index, const char* value) { return bind(index, std::string_view(value)); }
    Statement& bind(int index, const std::optional<std::string>& value);
    Statement& bind(int index, const std::optional<int64_t>& value);
    Statement& bind_null(int index);

    /**
     * @brief Advance the statement.
     * @return true when a row is available, false when done
     */
    bool step();

    /// Run to completion, ignoring any rows
    void run();

    /// Reset for re-execution and clear bindings
    void reset();

    [[nodiscard]] bool is_null(int column) const;
    [[nodiscard]] int64_t column_int64(int column) const;
    [[nodiscard]] std::string column_text(int column) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int column) const;
    [[nodiscard]] std::optional<int64_t> column_optional_int64(int column) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief One SQLite connection (owns sqlite3*)
 *
 * Read-write connections create the parent directory and switch the
 * database to WAL with synchronous=NORMAL. Every statement on a shared
 * connection runs under write_mutex(), so transactions never interleave
 * and no reader sees another thread's uncommitted rows.
 */
class SqliteDatabase {
public:
    enum class Mode { READ_WRITE, READ_ONLY };

    struct Config {
        std::string path;          // ":memory:" for an in-memory database
        Mode mode = Mode::READ_WRITE;
        std::chrono::milliseconds busy_timeout{30000};
    };

    /**
     * @brief Open the database.
     * @throws StorageError if the file cannot be opened or configured
     */
    explicit SqliteDatabase(Config config);
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    /// Execute one or more statements without results
    void exec(std::string_view sql);

    [[nodiscard]] Statement prepare(std::string_view sql);

    /// Rows modified by the most recent INSERT/UPDATE/DELETE
    [[nodiscard]] int64_t changes() const;

    [[nodiscard]] bool table_exists(std::string_view name);

    [[nodiscard]] std::mutex& write_mutex() { return write_mutex_; }
    [[nodiscard]] const std::string& path() const { return config_.path; }
    [[nodiscard]] bool read_only() const { return config_.mode == Mode::READ_ONLY; }
    [[nodiscard]] sqlite3* handle() const { return db_; }

private:
    Config config_;
    sqlite3* db_ = nullptr;
    std::mutex write_mutex_;
};

/**
 * @brief BEGIN IMMEDIATE on construction, ROLLBACK on unwind unless committed.
 * The caller holds the database write mutex for the lifetime of the guard.
 */
class Transaction {
public:
    explicit Transaction(SqliteDatabase& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    SqliteDatabase& db_;
    bool done_ = false;
};

} // namespace shiplog
