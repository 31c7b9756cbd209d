#pragma once

#include "classifier/event_redactor.hpp"
#include "config/config_types.hpp"
#include "core/types.hpp"
#include "db/cursor_tracker.hpp"
#include "db/ievent_log.hpp"
#include "git/git_context_resolver.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shiplog {

/**
 * @brief Turns newly appended lines of a source file into stored events.
 *
 * One pass over one file:
 *   - only newline-terminated lines beyond the cursor are considered; an
 *     unterminated tail is left for the next pass
 *   - blank lines are skipped, malformed lines are logged (and optionally
 *     quarantined) but still advance the cursor
 *   - git context is resolved once per pass and stamped on every event
 *   - the batch is written before the cursor moves; a failed write leaves
 *     the cursor where it was
 *
 * Never performs network I/O. Passes are serialised internally, so the
 * watcher thread and the startup sweep may both call in.
 */
class IngestionPipeline {
public:
    struct Config {
        std::filesystem::path root;
        std::string extension = ".jsonl";
        std::optional<std::string> filter_prefix;
        MalformedLinePolicy malformed_policy = MalformedLinePolicy::SKIP;
        std::filesystem::path quarantine_file;
    };

    struct Stats {
        uint64_t passes = 0;
        uint64_t events_stored = 0;
        uint64_t malformed_lines = 0;
        uint64_t storage_failures = 0;
    };

    IngestionPipeline(Config config,
                      LineCursorTracker& cursors,
                      IEventLog& sink,
                      IGitContextResolver& git,
                      const EventRedactor& redactor);

    /// Process new lines of one file (absolute path or relative to root)
    PassResult process_file(const std::filesystem::path& path);

    /// Process every matching file under the root, in path order
    std::vector<PassResult> process_existing();

    /// Whether @p path has the source extension and passes the project filter
    [[nodiscard]] bool accepts(const std::filesystem::path& path) const;

    [[nodiscard]] Stats stats() const;

private:
    struct Line {
        int64_t number;
        std::string_view text;
    };

    void quarantine(const std::string& file_name, int64_t line_number,
                    std::string_view line, const std::string& error);

    Config config_;
    LineCursorTracker& cursors_;
    IEventLog& sink_;
    IGitContextResolver& git_;
    const EventRedactor& redactor_;

    std::mutex pass_mutex_;

    std::atomic<uint64_t> passes_{0};
    std::atomic<uint64_t> events_stored_{0};
    std::atomic<uint64_t> malformed_lines_{0};
    std::atomic<uint64_t> storage_failures_{0};
};

} // namespace shiplog
