#include "sync/sync_worker.hpp"
#include "core/utils.hpp"

#include <format>

namespace shiplog {

SyncWorker::SyncWorker(Config config,
                       IEventLog& source,
                       IRemoteCollector& collector,
                       const EventRedactor& redactor)
    : config_(config),
      source_(source),
      collector_(collector),
      redactor_(redactor),
      backoff_(config.initial_backoff, config.max_backoff) {}

SyncWorker::~SyncWorker() {
    request_stop();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void SyncWorker::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;

    // A previous loop that outlived stop() must be gone before reuse
    if (worker_thread_.joinable()) worker_thread_.join();

    stop_requested_.store(false);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        exited_ = false;
    }
    worker_thread_ = std::thread(&SyncWorker::sync_loop, this);
    utils::log::info(std::format("Sync worker started: {} -> {}", source_.name(), collector_.endpoint()));
}

void SyncWorker::request_stop() {
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        stop_requested_.store(true);
    }
    cv_.notify_all();
}

bool SyncWorker::stop(std::chrono::milliseconds timeout) {
    if (!worker_thread_.joinable()) return true;
    request_stop();

    bool exited = false;
    {
        std::unique_lock<std::mutex> lock(cv_mutex_);
        exited = exit_cv_.wait_for(lock, timeout, [this] { return exited_; });
    }
    if (!exited) {
        utils::log::warn(std::format("Sync worker did not stop within {}ms", timeout.count()));
        return false;
    }
    worker_thread_.join();
    utils::log::info("Sync worker stopped");
    return true;
}

bool SyncWorker::wait_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(cv_mutex_);
    cv_.wait_for(lock, delay, [this] { return stop_requested_.load(); });
    return !stop_requested_.load();
}

std::chrono::milliseconds SyncWorker::record_failure(ErrorCategory category) {
    ++failures_;
    if (category == ErrorCategory::REMOTE_REJECTED) ++rejections_;
    std::lock_guard<std::mutex> lock(backoff_mutex_);
    return backoff_.on_failure();
}

SyncWorker::CycleResult SyncWorker::run_cycle() {
    CycleResult result;
    ++cycles_;

    std::vector<PendingEvent> pending;
    try {
        pending = source_.get_unsynced(config_.batch_size);
    } catch (const StorageError& e) {
        result.outcome = CycleOutcome::FAILED;
        result.error = ErrorCategory::STORAGE_ERROR;
        const auto delay = record_failure(result.error);
        utils::log::error(std::format("Sync: cannot read pending events: {} (retry in {}ms)",
                                      e.what(), delay.count()));
        return result;
    }

    result.fetched = pending.size();
    if (pending.empty()) return result;

    for (const auto& event : pending) {
        RemoteEvent remote;
        remote.file_name = event.file_name;
        remote.line_number = event.line_number;
        remote.event_data = redactor_.redact_payload(event.event_data).event;
        remote.git = event.git;

        auto sent = collector_.submit(remote);
        if (sent.is_error()) {
            result.outcome = CycleOutcome::FAILED;
            result.error = sent.error_category();
            const auto delay = record_failure(result.error);
            if (result.error == ErrorCategory::REMOTE_REJECTED) {
                utils::log::warn(std::format(
                    "Sync: collector rejected event {} ({}:{}): {}; left pending for manual review, retry in {}ms",
                    event.id, event.file_name, event.line_number, sent.error_message(), delay.count()));
            } else {
                utils::log::warn(std::format("Sync failed for event {}: {} (retry in {}ms)",
                                             event.id, sent.error_message(), delay.count()));
            }
            break;
        }

        try {
            source_.mark_synced(event.id);
        } catch (const StorageError& e) {
            // Delivered but not recorded: the next cycle resends it
            result.outcome = CycleOutcome::FAILED;
            result.error = ErrorCategory::STORAGE_ERROR;
            const auto delay = record_failure(result.error);
            utils::log::error(std::format("Sync: cannot mark event {} synced: {} (retry in {}ms)",
                                          event.id, e.what(), delay.count()));
            break;
        }
        ++result.synced;
        ++events_synced_;
        {
            std::lock_guard<std::mutex> lock(backoff_mutex_);
            backoff_.reset();
        }

        if (config_.request_interval.count() > 0 && !wait_for(config_.request_interval)) {
            result.outcome = CycleOutcome::STOPPED;
            break;
        }
        if (stop_requested_.load()) {
            result.outcome = CycleOutcome::STOPPED;
            break;
        }
    }

    if (result.outcome == CycleOutcome::IDLE) {
        result.outcome = CycleOutcome::PROGRESS;
    }
    if (result.synced > 0) {
        utils::log::info(std::format("Background sync: synced {} of {} events",
                                     result.synced, result.fetched));
    }
    return result;
}

void SyncWorker::sync_loop() {
    while (!stop_requested_.load()) {
        const auto result = run_cycle();

        std::chrono::milliseconds delay{0};
        switch (result.outcome) {
            case CycleOutcome::IDLE:
                delay = config_.idle_interval;
                break;
            case CycleOutcome::PROGRESS:
                delay = config_.batch_pause;
                break;
            case CycleOutcome::FAILED: {
                std::lock_guard<std::mutex> lock(backoff_mutex_);
                delay = backoff_.current();
                break;
            }
            case CycleOutcome::STOPPED:
                break;
        }
        if (result.outcome == CycleOutcome::STOPPED || !wait_for(delay)) break;
    }

    running_.store(false, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        exited_ = true;
    }
    exit_cv_.notify_all();
}

SyncWorker::Stats SyncWorker::stats() const {
    Stats s;
    s.cycles = cycles_.load(std::memory_order_relaxed);
    s.events_synced = events_synced_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    s.rejections = rejections_.load(std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(backoff_mutex_);
        s.current_backoff = backoff_.current();
        s.consecutive_failures = backoff_.consecutive_failures();
    }
    s.running = running_.load(std::memory_order_acquire);
    return s;
}

} // namespace shiplog
