#pragma once

#include "classifier/event_redactor.hpp"
#include "core/error.hpp"
#include "db/ievent_log.hpp"
#include "sync/backoff.hpp"
#include "sync/remote_collector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace shiplog {

/**
 * @brief Background loop forwarding unsynced events to the collector.
 *
 * Each cycle fetches up to batch_size pending events (newest first) and
 * sends them one at a time, pausing request_interval between sends. An
 * event is marked synced only after the collector acknowledges it. The
 * first failure ends the cycle and doubles the retry delay up to the cap;
 * a success resets it. Local events are never modified or deleted here.
 *
 * All sleeps wait on a condition variable, so request_stop() takes effect
 * within one request interval (or one in-flight request).
 */
class SyncWorker {
public:
    struct Config {
        size_t batch_size = 50;
        std::chrono::milliseconds idle_interval{60000};
        std::chrono::milliseconds batch_pause{2000};
        std::chrono::milliseconds request_interval{100};
        std::chrono::milliseconds initial_backoff{100};
        std::chrono::milliseconds max_backoff{300000};
    };

    enum class CycleOutcome {
        IDLE,       // nothing pending
        PROGRESS,   // the whole batch was delivered
        FAILED,     // stopped early on a delivery or storage failure
        STOPPED     // stop requested mid-batch
    };

    struct CycleResult {
        CycleOutcome outcome = CycleOutcome::IDLE;
        size_t fetched = 0;
        size_t synced = 0;
        ErrorCategory error = ErrorCategory::NONE;
    };

    struct Stats {
        uint64_t cycles = 0;
        uint64_t events_synced = 0;
        uint64_t failures = 0;
        uint64_t rejections = 0;
        std::chrono::milliseconds current_backoff{0};
        uint32_t consecutive_failures = 0;
        bool running = false;
    };

    SyncWorker(Config config,
               IEventLog& source,
               IRemoteCollector& collector,
               const EventRedactor& redactor);

    /// Joins the thread if it is still running
    ~SyncWorker();

    SyncWorker(const SyncWorker&) = delete;
    SyncWorker& operator=(const SyncWorker&) = delete;

    void start();

    /// Signal the loop to exit without waiting
    void request_stop();

    /**
     * @brief Signal the loop and wait up to @p timeout for it to exit.
     * @return false if the loop is still busy (it is joined on destruction)
     */
    bool stop(std::chrono::milliseconds timeout);

    /// One poll-and-send pass on the calling thread
    CycleResult run_cycle();

    [[nodiscard]] Stats stats() const;
    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }

private:
    void sync_loop();

    /// Interruptible sleep; false if stop was requested
    bool wait_for(std::chrono::milliseconds delay);

    std::chrono::milliseconds record_failure(ErrorCategory category);

    Config config_;
    IEventLog& source_;
    IRemoteCollector& collector_;
    const EventRedactor& redactor_;

    mutable std::mutex backoff_mutex_;
    ExponentialBackoff backoff_;

    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool exited_ = true;                      // guarded by cv_mutex_
    std::condition_variable exit_cv_;

    std::atomic<uint64_t> cycles_{0};
    std::atomic<uint64_t> events_synced_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> rejections_{0};
};

} // namespace shiplog
