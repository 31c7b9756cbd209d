#pragma once

#include "db/sqlite_database.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace shiplog {

/**
 * @brief Durable map of source file -> last processed line.
 *
 * Stored values never decrease: every write is an upsert keeping the
 * larger of the stored and supplied line numbers. All methods throw
 * StorageError on engine failure.
 */
class LineCursorTracker {
public:
    /// Creates the cursor table if needed
    explicit LineCursorTracker(SqliteDatabase& db);

    /// Last processed line of @p file_name, 0 if never seen
    [[nodiscard]] int64_t get_last_line(const std::string& file_name);

    void set_last_line(const std::string& file_name, int64_t line);

    /**
     * @brief Move every matching file's cursor to its current line count
     * without ingesting anything. Only newline-terminated lines count.
     * @return number of files updated
     */
    size_t fast_forward_all(const std::filesystem::path& root,
                            const std::string& extension,
                            const std::optional<std::string>& filter_prefix);

    [[nodiscard]] int64_t file_count();

    /**
     * @brief One-time import of a legacy JSON snapshot `{"file": last_line}`.
     *
     * Imports only when the cursor table is empty, then renames the
     * snapshot to `<name>.bak` so it is never read again.
     * @return number of cursors imported
     */
    size_t import_legacy_snapshot(const std::filesystem::path& snapshot);

    /// Count of newline-terminated lines in @p file (nullopt if unreadable)
    [[nodiscard]] static std::optional<int64_t> count_complete_lines(
        const std::filesystem::path& file);

private:
    void upsert_locked(const std::string& file_name, int64_t line);

    SqliteDatabase& db_;
};

} // namespace shiplog
