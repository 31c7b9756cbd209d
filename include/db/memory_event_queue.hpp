#pragma once

#include "db/ievent_log.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace shiplog {

/**
 * @brief Bounded in-memory event log used when local storage is unavailable.
 *
 * Holds events only until the collector acknowledges them. When full, the
 * oldest pending event is dropped and counted in dropped(), not in
 * sync_stats(), so total == synced + pending holds. Contents are lost on exit.
 */
class MemoryEventQueue : public IEventLog {
public:
    explicit MemoryEventQueue(size_t capacity);

    size_t insert_batch(const std::vector<NewEvent>& events) override;
    [[nodiscard]] std::vector<PendingEvent> get_unsynced(size_t limit) override;
    bool mark_synced(int64_t id) override;
    [[nodiscard]] SyncStats sync_stats() override;

    [[nodiscard]] const char* name() const override { return "memory queue"; }
    [[nodiscard]] bool is_durable() const override { return false; }

    [[nodiscard]] uint64_t dropped() const { return dropped_.load(); }
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] size_t size() const;

private:
    using Key = std::pair<std::string, int64_t>;

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<PendingEvent> pending_;   // oldest at front
    std::set<Key> keys_;                 // (file_name, line_number) of pending_
    int64_t next_id_ = 1;
    uint64_t total_ = 0;
    uint64_t synced_ = 0;
    std::atomic<uint64_t> dropped_{0};
};

} // namespace shiplog
