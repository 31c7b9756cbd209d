#include <catch2/catch_test_macros.hpp>
#include "watch/file_watcher.hpp"
#include "mocks/temp_dir.hpp"

#include <algorithm>
#include <mutex>
#include <thread>
#include <vector>

using namespace shiplog;
using shiplog::testing::TmpDir;
using std::chrono::milliseconds;

namespace {

class Recorder {
public:
    FileWatcher::Callback callback() {
        return [this](const std::filesystem::path& file) {
            std::lock_guard<std::mutex> lock(mutex_);
            files_.push_back(file);
        };
    }

    std::vector<std::filesystem::path> files() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return files_;
    }

    bool saw(const std::filesystem::path& file) const {
        const auto all = files();
        return std::find(all.begin(), all.end(), file) != all.end();
    }

    bool wait_for(const std::filesystem::path& file, milliseconds timeout = milliseconds(3000)) const {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (saw(file)) return true;
            std::this_thread::sleep_for(milliseconds(10));
        }
        return saw(file);
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::filesystem::path> files_;
};

} // namespace

TEST_CASE("FileWatcher: sweep reports matching files in path order", "[watch]") {
    TmpDir tmp("watch_sweep");
    tmp.file("b/2.jsonl", "{}\n");
    tmp.file("a/1.jsonl", "{}\n");
    tmp.file("a/notes.md", "x\n");

    Recorder recorder;
    FileWatcher watcher(FileWatcher::Config{tmp.path, ".jsonl"}, recorder.callback());

    CHECK(watcher.sweep() == 2);
    const auto files = recorder.files();
    REQUIRE(files.size() == 2);
    CHECK(files[0] == tmp.path / "a/1.jsonl");
    CHECK(files[1] == tmp.path / "b/2.jsonl");
}

TEST_CASE("FileWatcher: missing root cannot be watched", "[watch]") {
    TmpDir tmp("watch_missing");
    Recorder recorder;
    FileWatcher watcher(FileWatcher::Config{tmp.path / "nope", ".jsonl"}, recorder.callback());
    CHECK_FALSE(watcher.start());
    CHECK_FALSE(watcher.is_running());
}

TEST_CASE("FileWatcher: reports appended and new files", "[watch]") {
    TmpDir tmp("watch_live");
    tmp.file("proj/existing.jsonl", "{}\n");

    Recorder recorder;
    FileWatcher watcher(FileWatcher::Config{tmp.path, ".jsonl"}, recorder.callback());
    REQUIRE(watcher.start());
    CHECK(watcher.watched_directories() == 2);

    tmp.append("proj/existing.jsonl", "{}\n");
    CHECK(recorder.wait_for(tmp.path / "proj/existing.jsonl"));

    tmp.file("proj/new.jsonl", "{}\n");
    CHECK(recorder.wait_for(tmp.path / "proj/new.jsonl"));

    tmp.file("proj/ignored.txt", "x\n");
    std::this_thread::sleep_for(milliseconds(200));
    CHECK_FALSE(recorder.saw(tmp.path / "proj/ignored.txt"));

    watcher.stop();
    CHECK_FALSE(watcher.is_running());
}

TEST_CASE("FileWatcher: new subdirectories are watched as they appear", "[watch]") {
    TmpDir tmp("watch_subdir");

    Recorder recorder;
    FileWatcher watcher(FileWatcher::Config{tmp.path, ".jsonl"}, recorder.callback());
    REQUIRE(watcher.start());

    // create_directories + write happen before or after the watch is added;
    // either way the file must be reported
    tmp.file("fresh/session.jsonl", "{}\n");
    CHECK(recorder.wait_for(tmp.path / "fresh/session.jsonl"));

    tmp.append("fresh/session.jsonl", "{}\n");
    std::this_thread::sleep_for(milliseconds(100));
    CHECK(watcher.watched_directories() == 2);
}
