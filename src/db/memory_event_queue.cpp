#include "db/memory_event_queue.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace shiplog {

MemoryEventQueue::MemoryEventQueue(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

size_t MemoryEventQueue::insert_batch(const std::vector<NewEvent>& events) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t inserted = 0;
    uint64_t dropped_now = 0;

    for (const auto& event : events) {
        if (!keys_.emplace(event.file_name, event.line_number).second) continue;

        if (pending_.size() >= capacity_) {
            const auto& oldest = pending_.front();
            keys_.erase({oldest.file_name, oldest.line_number});
            pending_.pop_front();
            --total_;
            ++dropped_now;
        }

        PendingEvent pending;
        pending.id = next_id_++;
        pending.file_name = event.file_name;
        pending.line_number = event.line_number;
        pending.event_data = event.event_data;
        pending.git = event.git;
        pending_.push_back(std::move(pending));
        ++total_;
        ++inserted;
    }

    if (dropped_now > 0) {
        dropped_ += dropped_now;
        utils::log::warn(std::format(
            "Memory queue full (capacity {}): dropped {} oldest events, {} total",
            capacity_, dropped_now, dropped_.load()));
    }
    return inserted;
}

std::vector<PendingEvent> MemoryEventQueue::get_unsynced(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PendingEvent> result;
    result.reserve(std::min(limit, pending_.size()));
    for (auto it = pending_.rbegin(); it != pending_.rend() && result.size() < limit; ++it) {
        result.push_back(*it);
    }
    return result;
}

bool MemoryEventQueue::mark_synced(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Ids are assigned in increasing order
    const auto it = std::lower_bound(pending_.begin(), pending_.end(), id,
        [](const PendingEvent& e, int64_t target) { return e.id < target; });
    if (it == pending_.end() || it->id != id) return false;

    keys_.erase({it->file_name, it->line_number});
    pending_.erase(it);
    ++synced_;
    return true;
}

SyncStats MemoryEventQueue::sync_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    SyncStats stats;
    stats.total = total_;
    stats.synced = synced_;
    stats.pending = pending_.size();
    return stats;
}

size_t MemoryEventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace shiplog
