#include <catch2/catch_test_macros.hpp>
#include "db/event_store.hpp"
#include "mocks/temp_dir.hpp"

#include <chrono>
#include <future>
#include <mutex>

using namespace shiplog;
using shiplog::testing::TmpDir;

namespace {

NewEvent make_event(const std::string& file, int64_t line, const std::string& data) {
    NewEvent e;
    e.file_name = file;
    e.line_number = line;
    e.event_data = data;
    return e;
}

SqliteDatabase::Config memory_db() {
    SqliteDatabase::Config cfg;
    cfg.path = ":memory:";
    return cfg;
}

} // namespace

TEST_CASE("EventStore: duplicate (file, line) pairs are ignored", "[store]") {
    SqliteDatabase db(memory_db());
    EventStore store(db, "tester");
    store.migrate();

    const std::vector<NewEvent> batch = {
        make_event("a.jsonl", 1, R"({"type":"user"})"),
        make_event("a.jsonl", 2, R"({"type":"assistant"})"),
    };
    CHECK(store.insert_batch(batch) == 2);
    CHECK(store.insert_batch(batch) == 0);
    CHECK(store.insert_batch({make_event("a.jsonl", 2, R"({"type":"changed"})"),
                              make_event("a.jsonl", 3, R"({"type":"user"})")}) == 1);

    const auto stats = store.sync_stats();
    CHECK(stats.total == 3);
    CHECK(stats.synced == 0);
    CHECK(stats.pending == 3);
}

TEST_CASE("EventStore: payload is stored byte-identical with derived columns", "[store]") {
    SqliteDatabase db(memory_db());
    EventStore store(db, "tester");
    store.migrate();

    const std::string payload =
        R"({"type":"user",  "sessionId":"s1","message":{"content":"hi  there","model":"m"}})";
    NewEvent event = make_event("p/s.jsonl", 7, payload);
    event.git.remote_url = "git@example.com:me/repo.git";
    event.git.commit_hash = "abc123";
    REQUIRE(store.insert_batch({event}) == 1);

    auto stmt = db.prepare(
        "SELECT event_data, user_name, event_type, event_message, event_session_id, "
        "event_model, git_remote_url, git_commit_hash, synced_at FROM conversation_events");
    REQUIRE(stmt.step());
    CHECK(stmt.column_text(0) == payload);
    CHECK(stmt.column_text(1) == "tester");
    CHECK(stmt.column_text(2) == "user");
    CHECK(stmt.column_text(3) == "hi  there");
    CHECK(stmt.column_text(4) == "s1");
    CHECK(stmt.column_text(5) == "m");
    CHECK(stmt.column_text(6) == "git@example.com:me/repo.git");
    CHECK(stmt.column_text(7) == "abc123");
    CHECK(stmt.is_null(8));
}

TEST_CASE("EventStore: unsynced events come newest first and respect the limit", "[store]") {
    SqliteDatabase db(memory_db());
    EventStore store(db, "tester");
    store.migrate();

    std::vector<NewEvent> batch;
    for (int i = 1; i <= 5; ++i) {
        batch.push_back(make_event("a.jsonl", i, R"({"type":"user"})"));
    }
    store.insert_batch(batch);

    auto pending = store.get_unsynced(3);
    REQUIRE(pending.size() == 3);
    CHECK(pending[0].line_number == 5);
    CHECK(pending[1].line_number == 4);
    CHECK(pending[2].line_number == 3);
    CHECK(pending[0].id > pending[1].id);
    CHECK(pending[0].event_data == R"({"type":"user"})");
}

TEST_CASE("EventStore: mark_synced is a one-way transition", "[store]") {
    SqliteDatabase db(memory_db());
    EventStore store(db, "tester");
    store.migrate();

    store.insert_batch({make_event("a.jsonl", 1, R"({"type":"user"})"),
                        make_event("a.jsonl", 2, R"({"type":"user"})")});
    const auto pending = store.get_unsynced(10);
    REQUIRE(pending.size() == 2);

    CHECK(store.mark_synced(pending[0].id));
    CHECK_FALSE(store.mark_synced(pending[0].id));
    CHECK_FALSE(store.mark_synced(999999));

    const auto stats = store.sync_stats();
    CHECK(stats.total == 2);
    CHECK(stats.synced == 1);
    CHECK(stats.pending == 1);

    const auto remaining = store.get_unsynced(10);
    REQUIRE(remaining.size() == 1);
    CHECK(remaining[0].id == pending[1].id);
}

TEST_CASE("EventStore: full-text search over message text", "[store][fts]") {
    SqliteDatabase db(memory_db());
    EventStore store(db, "tester");
    const auto report = store.migrate();
    if (!report.fts_available) return;   // SQLite built without FTS5

    store.insert_batch({
        make_event("a.jsonl", 1, R"({"type":"user","sessionId":"s1","message":{"content":"deploy the kubernetes cluster"}})"),
        make_event("a.jsonl", 2, R"({"type":"assistant","sessionId":"s1","message":{"content":[{"type":"text","text":"cluster is ready"}]}})"),
        make_event("a.jsonl", 3, R"({"type":"user","sessionId":"s2","message":{"content":"unrelated"}})"),
    });

    auto hits = store.search("cluster", 10);
    CHECK(hits.size() == 2);

    hits = store.search("kubernetes", 10);
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].line_number == 1);
    CHECK(hits[0].session_id == "s1");

    // Index follows updates to derived columns
    db.exec("UPDATE conversation_events SET event_message = 'rewritten text' WHERE line_number = 1");
    CHECK(store.search("kubernetes", 10).empty());
    CHECK(store.search("rewritten", 10).size() == 1);

    // and drops deleted rows
    db.exec("DELETE FROM conversation_events WHERE line_number = 2");
    hits = store.search("cluster", 10);
    CHECK(hits.empty());
    auto count = db.prepare("SELECT COUNT(*) FROM messages_fts WHERE messages_fts MATCH 'ready'");
    REQUIRE(count.step());
    CHECK(count.column_int64(0) == 0);
}

TEST_CASE("EventStore: external readers open the file read-only", "[store]") {
    TmpDir tmp("store_readonly");
    SqliteDatabase::Config cfg;
    cfg.path = tmp.str("events.db");

    SqliteDatabase db(cfg);
    EventStore store(db, "tester");
    store.migrate();
    store.insert_batch({make_event("a.jsonl", 1, R"({"type":"user"})")});

    auto reader = EventStore::open_read_only(cfg.path);
    REQUIRE(reader->read_only());
    auto count = reader->prepare("SELECT COUNT(*) FROM conversation_events");
    REQUIRE(count.step());
    CHECK(count.column_int64(0) == 1);

    CHECK_THROWS_AS(reader->exec("DELETE FROM conversation_events"), StorageError);
}

TEST_CASE("EventStore: readers on a shared connection never see uncommitted rows", "[store]") {
    SqliteDatabase db(memory_db());
    EventStore store(db, "tester");
    store.migrate();

    std::future<size_t> unsynced;
    std::future<uint64_t> total;
    {
        // An ingestion batch in flight on another thread
        std::lock_guard<std::mutex> lock(db.write_mutex());
        Transaction txn(db);
        db.exec("INSERT INTO conversation_events (file_name, line_number, event_data, user_name) "
                "VALUES ('a.jsonl', 1, '{}', 'tester')");

        unsynced = std::async(std::launch::async, [&] { return store.get_unsynced(10).size(); });
        total = std::async(std::launch::async, [&] { return store.sync_stats().total; });
        CHECK(unsynced.wait_for(std::chrono::milliseconds(100)) == std::future_status::timeout);
        // txn rolls back on scope exit
    }

    CHECK(unsynced.get() == 0);
    CHECK(total.get() == 0);
    CHECK(store.sync_stats().total == 0);
}
