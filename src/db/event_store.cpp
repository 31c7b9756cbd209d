#include "db/event_store.hpp"
#include "event/event_parser.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>

namespace shiplog {

namespace {

constexpr std::string_view kInsertSql = R"(
INSERT OR IGNORE INTO conversation_events (
    file_name, line_number, event_data, user_name,
    event_type, event_message, event_git_branch, event_session_id, event_uuid,
    event_timestamp, event_model, event_input_tokens,
    event_cache_creation_input_tokens, event_cache_read_input_tokens, event_output_tokens,
    git_remote_url, git_commit_hash)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?))";

constexpr std::string_view kUnsyncedSql = R"(
SELECT id, file_name, line_number, event_data, git_remote_url, git_commit_hash
FROM conversation_events
WHERE synced_at IS NULL
ORDER BY id DESC
LIMIT ?)";

constexpr std::string_view kSearchSql = R"(
SELECT ce.id, ce.file_name, ce.line_number, ce.event_type, ce.event_message, ce.event_session_id
FROM messages_fts
JOIN conversation_events ce ON ce.id = messages_fts.rowid
WHERE messages_fts MATCH ?
ORDER BY messages_fts.rank
LIMIT ?)";

} // anonymous namespace

EventStore::EventStore(SqliteDatabase& db, std::string user_name)
    : db_(db), user_name_(std::move(user_name)) {}

SchemaMigrator::Report EventStore::migrate() {
    SchemaMigrator migrator(db_);
    return migrator.migrate();
}

size_t EventStore::insert_batch(const std::vector<NewEvent>& events) {
    if (events.empty()) return 0;

    std::lock_guard<std::mutex> lock(db_.write_mutex());
    Transaction txn(db_);
    auto stmt = db_.prepare(kInsertSql);

    size_t inserted = 0;
    for (const auto& event : events) {
        const auto derived = extract_derived_fields(std::string_view(event.event_data));
        stmt.bind(1, event.file_name)
            .bind(2, event.line_number)
            .bind(3, event.event_data)
            .bind(4, user_name_)
            .bind(5, derived.type)
            .bind(6, derived.message)
            .bind(7, derived.git_branch)
            .bind(8, derived.session_id)
            .bind(9, derived.uuid)
            .bind(10, derived.timestamp)
            .bind(11, derived.model)
            .bind(12, derived.input_tokens)
            .bind(13, derived.cache_creation_input_tokens)
            .bind(14, derived.cache_read_input_tokens)
            .bind(15, derived.output_tokens)
            .bind(16, event.git.remote_url)
            .bind(17, event.git.commit_hash);
        stmt.run();
        inserted += static_cast<size_t>(db_.changes());
        stmt.reset();
    }

    txn.commit();
    return inserted;
}

std::vector<PendingEvent> EventStore::get_unsynced(size_t limit) {
    std::vector<PendingEvent> events;
    std::lock_guard<std::mutex> lock(db_.write_mutex());
    auto stmt = db_.prepare(kUnsyncedSql);
    stmt.bind(1, static_cast<int64_t>(limit));
    while (stmt.step()) {
        PendingEvent event;
        event.id = stmt.column_int64(0);
        event.file_name = stmt.column_text(1);
        event.line_number = stmt.column_int64(2);
        event.event_data = stmt.column_text(3);
        event.git.remote_url = stmt.column_optional_text(4);
        event.git.commit_hash = stmt.column_optional_text(5);
        events.push_back(std::move(event));
    }
    return events;
}

bool EventStore::mark_synced(int64_t id) {
    std::lock_guard<std::mutex> lock(db_.write_mutex());
    auto stmt = db_.prepare(
        "UPDATE conversation_events SET synced_at = CURRENT_TIMESTAMP "
        "WHERE id = ? AND synced_at IS NULL");
    stmt.bind(1, id);
    stmt.run();
    return db_.changes() > 0;
}

SyncStats EventStore::sync_stats() {
    SyncStats stats;
    std::lock_guard<std::mutex> lock(db_.write_mutex());
    auto stmt = db_.prepare("SELECT COUNT(*), COUNT(synced_at) FROM conversation_events");
    if (stmt.step()) {
        stats.total = static_cast<uint64_t>(stmt.column_int64(0));
        stats.synced = static_cast<uint64_t>(stmt.column_int64(1));
        stats.pending = stats.total - stats.synced;
    }
    return stats;
}

std::vector<SearchHit> EventStore::search(const std::string& query, size_t limit) {
    std::vector<SearchHit> hits;
    std::lock_guard<std::mutex> lock(db_.write_mutex());
    auto stmt = db_.prepare(kSearchSql);
    stmt.bind(1, query).bind(2, static_cast<int64_t>(limit));
    while (stmt.step()) {
        SearchHit hit;
        hit.id = stmt.column_int64(0);
        hit.file_name = stmt.column_text(1);
        hit.line_number = stmt.column_int64(2);
        hit.event_type = stmt.column_optional_text(3);
        hit.event_message = stmt.column_optional_text(4);
        hit.session_id = stmt.column_optional_text(5);
        hits.push_back(std::move(hit));
    }
    return hits;
}

std::unique_ptr<SqliteDatabase> EventStore::open_read_only(const std::string& path,
                                                           std::chrono::milliseconds busy_timeout) {
    SqliteDatabase::Config config;
    config.path = path;
    config.mode = SqliteDatabase::Mode::READ_ONLY;
    config.busy_timeout = busy_timeout;
    return std::make_unique<SqliteDatabase>(std::move(config));
}

} // namespace shiplog
