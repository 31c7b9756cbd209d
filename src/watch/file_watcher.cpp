#include "watch/file_watcher.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <vector>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace shiplog {

namespace {

constexpr uint32_t kFileMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO;
constexpr uint32_t kWatchMask = kFileMask | IN_DELETE_SELF | IN_ONLYDIR;

} // anonymous namespace

FileWatcher::FileWatcher(Config config, Callback callback)
    : config_(std::move(config)),
      callback_(std::move(callback)) {}

FileWatcher::~FileWatcher() {
    stop();
}

bool FileWatcher::start() {
    if (running_.load()) return true;

    std::error_code ec;
    if (!std::filesystem::is_directory(config_.root, ec)) {
        utils::log::error(std::format("Watch root {} is not a directory", config_.root.string()));
        return false;
    }

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        utils::log::error(std::format("inotify_init1 failed: {}", std::strerror(errno)));
        return false;
    }

    add_watch_recursive(config_.root, false);

    running_.store(true);
    watch_thread_ = std::jthread([this](std::stop_token stop) {
        watch_loop(std::move(stop));
    });
    utils::log::info(std::format("Watching {} ({} directories) for *{} changes",
        config_.root.string(), watched_directories(), config_.extension));
    return true;
}

void FileWatcher::stop() {
    if (!running_.load()) return;
    running_.store(false);
    if (watch_thread_.joinable()) {
        watch_thread_.request_stop();
        watch_thread_.join();
    }
    if (inotify_fd_ >= 0) {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
    {
        std::lock_guard<std::mutex> lock(watches_mutex_);
        watches_.clear();
    }
    utils::log::info("File watcher stopped");
}

size_t FileWatcher::watched_directories() const {
    std::lock_guard<std::mutex> lock(watches_mutex_);
    return watches_.size();
}

size_t FileWatcher::sweep() {
    namespace fs = std::filesystem;
    std::vector<fs::path> files;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(config_.root, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code file_ec;
        if (it->is_regular_file(file_ec) && it->path().extension() == config_.extension) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        utils::log::warn(std::format("Startup sweep of {} incomplete: {}",
                                     config_.root.string(), ec.message()));
    }
    std::sort(files.begin(), files.end());

    utils::log::info(std::format("Startup sweep: {} file(s) under {}", files.size(), config_.root.string()));
    for (const auto& file : files) {
        notify(file);
    }
    return files.size();
}

void FileWatcher::add_watch_recursive(const std::filesystem::path& dir, bool report_files) {
    namespace fs = std::filesystem;

    const int wd = inotify_add_watch(inotify_fd_, dir.c_str(), kWatchMask);
    if (wd < 0) {
        utils::log::warn(std::format("Cannot watch {}: {}", dir.string(), std::strerror(errno)));
        return;
    }
    {
        std::lock_guard<std::mutex> lock(watches_mutex_);
        watches_[wd] = dir;
    }

    std::error_code ec;
    for (auto it = fs::directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec)) {
            add_watch_recursive(it->path(), report_files);
        } else if (report_files && it->is_regular_file(entry_ec)
                   && it->path().extension() == config_.extension) {
            // Written before the watch on this new directory existed
            notify(it->path());
        }
    }
}

void FileWatcher::watch_loop(std::stop_token stop) {
    alignas(struct inotify_event) char buf[16 * 1024];
    const int timeout_ms = static_cast<int>(config_.poll_interval.count());

    while (!stop.stop_requested()) {
        pollfd pfd{inotify_fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            utils::log::error(std::format("File watcher poll failed: {}", std::strerror(errno)));
            break;
        }
        if (ready == 0) continue;

        for (;;) {
            const ssize_t len = ::read(inotify_fd_, buf, sizeof(buf));
            if (len <= 0) break;
            handle_events(buf, len);
            if (stop.stop_requested()) break;
        }
    }
}

void FileWatcher::handle_events(const char* buf, ssize_t len) {
    for (ssize_t offset = 0; offset < len;) {
        const auto* event = reinterpret_cast<const struct inotify_event*>(buf + offset);
        offset += static_cast<ssize_t>(sizeof(struct inotify_event) + event->len);

        if (event->mask & IN_Q_OVERFLOW) {
            utils::log::warn("inotify queue overflow, rescanning");
            sweep();
            continue;
        }

        std::filesystem::path dir;
        {
            std::lock_guard<std::mutex> lock(watches_mutex_);
            const auto it = watches_.find(event->wd);
            if (it == watches_.end()) continue;
            if (event->mask & (IN_DELETE_SELF | IN_IGNORED)) {
                watches_.erase(it);
                continue;
            }
            dir = it->second;
        }
        if (event->len == 0) continue;

        const auto path = dir / event->name;
        if (event->mask & IN_ISDIR) {
            if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
                add_watch_recursive(path, true);
            }
            continue;
        }
        if ((event->mask & kFileMask) && path.extension() == config_.extension) {
            notify(path);
        }
    }
}

void FileWatcher::notify(const std::filesystem::path& file) {
    if (!callback_) return;
    try {
        callback_(file);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Error processing {}: {}", file.string(), e.what()));
    }
}

} // namespace shiplog
