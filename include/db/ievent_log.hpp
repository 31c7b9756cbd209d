#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <vector>

namespace shiplog {

/**
 * @brief Sink the ingestion pipeline writes to and the sync worker drains.
 *
 * Implementations serialise their own mutations. Durable implementations
 * throw StorageError on engine failure.
 */
class IEventLog {
public:
    virtual ~IEventLog() = default;

    /**
     * @brief Write a batch atomically, ignoring (file_name, line_number) duplicates.
     * @return rows the sink reports as written
     */
    virtual size_t insert_batch(const std::vector<NewEvent>& events) = 0;

    /// Events not yet acknowledged by the collector, newest first
    [[nodiscard]] virtual std::vector<PendingEvent> get_unsynced(size_t limit) = 0;

    /**
     * @brief Record remote acknowledgement. A second call for the same id is a no-op.
     * @return true if this call changed the event's state
     */
    virtual bool mark_synced(int64_t id) = 0;

    [[nodiscard]] virtual SyncStats sync_stats() = 0;

    [[nodiscard]] virtual const char* name() const = 0;

    /// false for sinks that lose their contents on exit
    [[nodiscard]] virtual bool is_durable() const = 0;
};

} // namespace shiplog
