#include <catch2/catch_test_macros.hpp>
#include "db/memory_event_queue.hpp"

using namespace shiplog;

namespace {

NewEvent make_event(int64_t line) {
    NewEvent e;
    e.file_name = "a.jsonl";
    e.line_number = line;
    e.event_data = R"({"type":"user"})";
    return e;
}

} // namespace

TEST_CASE("MemoryEventQueue: behaves like an event log", "[queue]") {
    MemoryEventQueue queue(10);
    CHECK_FALSE(queue.is_durable());

    CHECK(queue.insert_batch({make_event(1), make_event(2), make_event(3)}) == 3);
    CHECK(queue.insert_batch({make_event(3)}) == 0);

    auto pending = queue.get_unsynced(2);
    REQUIRE(pending.size() == 2);
    CHECK(pending[0].line_number == 3);
    CHECK(pending[1].line_number == 2);

    CHECK(queue.mark_synced(pending[0].id));
    CHECK_FALSE(queue.mark_synced(pending[0].id));

    const auto stats = queue.sync_stats();
    CHECK(stats.total == 3);
    CHECK(stats.synced == 1);
    CHECK(stats.pending == 2);
}

TEST_CASE("MemoryEventQueue: overflow drops the oldest pending event", "[queue]") {
    MemoryEventQueue queue(2);

    queue.insert_batch({make_event(1), make_event(2), make_event(3)});
    CHECK(queue.size() == 2);
    CHECK(queue.dropped() == 1);

    const auto pending = queue.get_unsynced(10);
    REQUIRE(pending.size() == 2);
    CHECK(pending[0].line_number == 3);
    CHECK(pending[1].line_number == 2);

    CHECK(queue.mark_synced(pending[0].id));
    queue.insert_batch({make_event(4), make_event(5)});
    CHECK(queue.dropped() == 2);

    // Dropped events are not part of the totals
    const auto stats = queue.sync_stats();
    CHECK(stats.pending == 2);
    CHECK(stats.synced == 1);
    CHECK(stats.total == stats.synced + stats.pending);
}

TEST_CASE("MemoryEventQueue: synced events free capacity", "[queue]") {
    MemoryEventQueue queue(2);
    queue.insert_batch({make_event(1), make_event(2)});

    for (const auto& e : queue.get_unsynced(10)) {
        CHECK(queue.mark_synced(e.id));
    }
    CHECK(queue.size() == 0);

    queue.insert_batch({make_event(3), make_event(4)});
    CHECK(queue.dropped() == 0);
    CHECK(queue.size() == 2);
}
