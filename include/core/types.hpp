#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace shiplog {

// ============================================================================
// Provenance
// ============================================================================

/**
 * @brief Version-control context of the working directory at ingestion time.
 * Both fields are absent outside a repository or when lookup fails.
 */
struct GitContext {
    std::optional<std::string> remote_url;
    std::optional<std::string> commit_hash;

    [[nodiscard]] bool empty() const { return !remote_url && !commit_hash; }
};

// ============================================================================
// Events
// ============================================================================

/**
 * @brief An event about to be written: one parsed line of one source file.
 *
 * event_data is the line text exactly as read from disk. Derived columns
 * are computed from it by the store at write time.
 */
struct NewEvent {
    std::string file_name;      // relative to the watched root
    int64_t line_number = 0;    // 1-based
    std::string event_data;
    GitContext git;
};

/**
 * @brief An event waiting for remote delivery (synced_at IS NULL).
 */
struct PendingEvent {
    int64_t id = 0;
    std::string file_name;
    int64_t line_number = 0;
    std::string event_data;
    GitContext git;
};

struct SyncStats {
    uint64_t total = 0;
    uint64_t synced = 0;
    uint64_t pending = 0;
};

// ============================================================================
// Ingestion
// ============================================================================

/**
 * @brief Outcome of one pipeline pass over one source file.
 */
struct PassResult {
    std::string file_name;
    bool skipped = false;           // filtered out, missing, or unreadable
    int64_t previous_cursor = 0;
    int64_t cursor = 0;             // cursor after the pass
    size_t new_lines = 0;
    size_t parsed = 0;
    size_t malformed = 0;
    size_t blank = 0;
    size_t stored = 0;              // rows the sink reported as written
    std::string error;              // storage failure; cursor not advanced

    [[nodiscard]] bool ok() const { return error.empty(); }
};

} // namespace shiplog
