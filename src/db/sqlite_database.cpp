#include "db/sqlite_database.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>

namespace shiplog {

namespace {

[[noreturn]] void throw_sqlite(sqlite3* db, int rc, std::string_view what) {
    const char* msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    throw StorageError(std::format("{}: {}", what, msg ? msg : "unknown error"), rc);
}

} // anonymous namespace

// ============================================================================
// Statement
// ============================================================================

Statement::Statement(sqlite3* db, std::string_view sql) : db_(db) {
    const int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()),
                                      &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw_sqlite(db_, rc, "prepare failed");
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Statement& Statement::bind(int index, int64_t value) {
    const int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK) throw_sqlite(db_, rc, "bind failed");
    return *this;
}

Statement& Statement::bind(int index, std::string_view value) {
    const int rc = sqlite3_bind_text(stmt_, index, value.data(),
                                     static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) throw_sqlite(db_, rc, "bind failed");
    return *this;
}

Statement& Statement::bind(int index, const std::optional<std::string>& value) {
    return value ? bind(index, std::string_view(*value)) : bind_null(index);
}

Statement& Statement::bind(int index, const std::optional<int64_t>& value) {
    return value ? bind(index, *value) : bind_null(index);
}

Statement& Statement::bind_null(int index) {
    const int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) throw_sqlite(db_, rc, "bind failed");
    return *this;
}

bool Statement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite(db_, rc, "step failed");
}

void Statement::run() {
    while (step()) {}
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

bool Statement::is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int64_t Statement::column_int64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string Statement::column_text(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (!text) return {};
    const int len = sqlite3_column_bytes(stmt_, column);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
}

std::optional<std::string> Statement::column_optional_text(int column) const {
    if (is_null(column)) return std::nullopt;
    return column_text(column);
}

std::optional<int64_t> Statement::column_optional_int64(int column) const {
    if (is_null(column)) return std::nullopt;
    return column_int64(column);
}

// ============================================================================
// SqliteDatabase
// ============================================================================

SqliteDatabase::SqliteDatabase(Config config) : config_(std::move(config)) {
    const bool in_memory = config_.path == ":memory:";
    int flags = SQLITE_OPEN_FULLMUTEX;
    if (config_.mode == Mode::READ_ONLY) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        if (!in_memory) {
            std::error_code ec;
            const auto parent = std::filesystem::path(config_.path).parent_path();
            if (!parent.empty()) std::filesystem::create_directories(parent, ec);
        }
    }

    const int rc = sqlite3_open_v2(config_.path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        const std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(std::format("Cannot open database {}: {}", config_.path, msg), rc);
    }

    sqlite3_busy_timeout(db_, static_cast<int>(config_.busy_timeout.count()));

    try {
        if (config_.mode == Mode::READ_WRITE) {
            if (!in_memory) exec("PRAGMA journal_mode=WAL");
            exec("PRAGMA synchronous=NORMAL");
        }
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    utils::log::debug(std::format("Opened database {} ({})", config_.path,
        config_.mode == Mode::READ_ONLY ? "read-only" : "read-write"));
}

SqliteDatabase::~SqliteDatabase() {
    if (db_) sqlite3_close_v2(db_);
}

void SqliteDatabase::exec(std::string_view sql) {
    const std::string text(sql);
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, text.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StorageError(std::format("exec failed: {}", msg), rc);
    }
}

Statement SqliteDatabase::prepare(std::string_view sql) {
    return Statement(db_, sql);
}

int64_t SqliteDatabase::changes() const {
    return sqlite3_changes(db_);
}

bool SqliteDatabase::table_exists(std::string_view name) {
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type IN ('table','view') AND name = ?");
    stmt.bind(1, name);
    return stmt.step();
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(SqliteDatabase& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE");
}

Transaction::~Transaction() {
    if (done_) return;
    char* err = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
        utils::log::error(std::format("Rollback failed: {}", err ? err : "unknown error"));
    }
    sqlite3_free(err);
}

void Transaction::commit() {
    db_.exec("COMMIT");
    done_ = true;
}

} // namespace shiplog
