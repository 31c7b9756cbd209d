#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <sys/types.h>

namespace shiplog {

/**
 * @brief Recursive inotify watcher for source files under one root.
 *
 * Reports created, modified, closed-after-write and moved-in files that
 * carry the configured extension. Directories created after start() are
 * watched as they appear, and files already inside them are reported.
 *
 * The callback runs on the watcher thread, one file at a time.
 */
class FileWatcher {
public:
    using Callback = std::function<void(const std::filesystem::path& file)>;

    struct Config {
        std::filesystem::path root;
        std::string extension = ".jsonl";
        std::chrono::milliseconds poll_interval{100};
    };

    FileWatcher(Config config, Callback callback);
    ~FileWatcher();

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    /**
     * @brief Start watching (spawns background thread)
     * @return false if inotify cannot be initialised or the root is missing
     */
    bool start();

    /**
     * @brief Stop watching (joins background thread)
     */
    void stop();

    /**
     * @brief Report every matching file currently under the root, in path order.
     * Runs on the calling thread.
     * @return number of files reported
     */
    size_t sweep();

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] size_t watched_directories() const;

private:
    void watch_loop(std::stop_token stop);
    void add_watch_recursive(const std::filesystem::path& dir, bool report_files);
    void handle_events(const char* buf, ssize_t len);
    void notify(const std::filesystem::path& file);

    Config config_;
    Callback callback_;

    int inotify_fd_ = -1;
    mutable std::mutex watches_mutex_;
    std::unordered_map<int, std::filesystem::path> watches_;   // wd -> directory

    std::atomic<bool> running_{false};
    std::jthread watch_thread_;
};

} // namespace shiplog
