#pragma once

#include "classifier/event_redactor.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/cursor_tracker.hpp"
#include "db/event_store.hpp"
#include "db/memory_event_queue.hpp"
#include "db/sqlite_database.hpp"
#include "git/git_context_resolver.hpp"
#include "ingest/ingestion_pipeline.hpp"
#include "sync/remote_collector.hpp"
#include "sync/sync_worker.hpp"
#include "watch/file_watcher.hpp"

#include <memory>
#include <string>
#include <vector>

namespace shiplog {

/**
 * @brief Owns and wires every component of the daemon.
 *
 * Startup order: cursor store -> event store -> remote probe -> sink
 * selection -> legacy import -> optional backlog skip -> startup sweep ->
 * sync worker -> watcher. stop() tears down in reverse.
 */
class Shipper {
public:
    /**
     * @param collector Collector to use instead of an HttpRemoteCollector
     *        built from [remote] (remote must still be enabled)
     * @param git Resolver to use instead of shelling out to git
     */
    explicit Shipper(ShipperConfig config,
                     std::unique_ptr<IRemoteCollector> collector = nullptr,
                     std::unique_ptr<IGitContextResolver> git = nullptr);
    ~Shipper();

    Shipper(const Shipper&) = delete;
    Shipper& operator=(const Shipper&) = delete;

    /// Fails when no destination (local store or remote) is usable
    Result<bool> start();

    void stop();

    [[nodiscard]] bool is_running() const { return running_; }

    /// Human-readable list of where events are recorded
    [[nodiscard]] const std::vector<std::string>& destinations() const { return destinations_; }

    [[nodiscard]] bool local_storage_active() const { return event_store_ != nullptr; }
    [[nodiscard]] bool remote_active() const { return remote_active_; }

    [[nodiscard]] IEventLog* sink() { return sink_; }
    [[nodiscard]] LineCursorTracker* cursors() { return cursors_.get(); }
    [[nodiscard]] IngestionPipeline* pipeline() { return pipeline_.get(); }
    [[nodiscard]] SyncWorker* sync_worker() { return sync_worker_.get(); }

private:
    void open_state_store();
    void open_event_store();
    void probe_remote();
    void import_legacy_state();

    ShipperConfig config_;
    std::filesystem::path root_;

    std::unique_ptr<SqliteDatabase> state_db_;
    std::unique_ptr<SqliteDatabase> events_db_;   // null when sharing state_db_
    std::unique_ptr<LineCursorTracker> cursors_;
    std::unique_ptr<EventStore> event_store_;
    std::unique_ptr<MemoryEventQueue> memory_queue_;
    IEventLog* sink_ = nullptr;

    std::unique_ptr<EventRedactor> redactor_;
    std::unique_ptr<IRemoteCollector> collector_;
    std::unique_ptr<IGitContextResolver> git_;
    bool remote_active_ = false;

    std::unique_ptr<IngestionPipeline> pipeline_;
    std::unique_ptr<SyncWorker> sync_worker_;
    std::unique_ptr<FileWatcher> watcher_;

    std::vector<std::string> destinations_;
    bool running_ = false;
};

} // namespace shiplog
