#pragma once

#include "db/ievent_log.hpp"
#include "db/schema_migrator.hpp"
#include "db/sqlite_database.hpp"

#include <memory>
#include <string>
#include <vector>

namespace shiplog {

struct SearchHit {
    int64_t id = 0;
    std::string file_name;
    int64_t line_number = 0;
    std::optional<std::string> event_type;
    std::optional<std::string> event_message;
    std::optional<std::string> session_id;
};

/**
 * @brief Durable, deduplicated event log on SQLite.
 *
 * The stored payload is the line exactly as read; derived columns are
 * computed from it on insert. Shares its connection (and write mutex)
 * with the cursor tracker when both live in one file.
 */
class EventStore : public IEventLog {
public:
    EventStore(SqliteDatabase& db, std::string user_name);

    /**
     * @brief Bring the schema up to date. Must complete before the first insert.
     * @throws StorageError
     */
    SchemaMigrator::Report migrate();

    size_t insert_batch(const std::vector<NewEvent>& events) override;
    [[nodiscard]] std::vector<PendingEvent> get_unsynced(size_t limit) override;
    bool mark_synced(int64_t id) override;
    [[nodiscard]] SyncStats sync_stats() override;

    [[nodiscard]] const char* name() const override { return "local store"; }
    [[nodiscard]] bool is_durable() const override { return true; }

    /**
     * @brief Full-text query over message text, type and session id.
     * @param query FTS5 MATCH expression
     */
    [[nodiscard]] std::vector<SearchHit> search(const std::string& query, size_t limit);

    [[nodiscard]] const std::string& user_name() const { return user_name_; }

    /// Connection for external readers (no schema changes, no writes)
    [[nodiscard]] static std::unique_ptr<SqliteDatabase> open_read_only(
        const std::string& path,
        std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));

private:
    SqliteDatabase& db_;
    std::string user_name_;
};

} // namespace shiplog
