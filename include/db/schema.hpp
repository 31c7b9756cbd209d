#pragma once

#include <array>
#include <format>
#include <string>
#include <string_view>

namespace shiplog::schema {

// ============================================================================
// Table and index names shared with external readers
// ============================================================================

inline constexpr std::string_view kEventsTable = "conversation_events";
inline constexpr std::string_view kEventsShadowTable = "conversation_events_new";
inline constexpr std::string_view kFileStateTable = "conversation_file_state";
inline constexpr std::string_view kFtsTable = "messages_fts";

struct IndexDef {
    std::string_view name;
    std::string_view column;
};

inline constexpr std::array<IndexDef, 13> kEventIndexes = {{
    {"idx_file_name", "file_name"},
    {"idx_user_name", "user_name"},
    {"idx_inserted_at", "inserted_at"},
    {"idx_event_type", "event_type"},
    {"idx_event_message", "event_message"},
    {"idx_event_git_branch", "event_git_branch"},
    {"idx_event_session_id", "event_session_id"},
    {"idx_event_uuid", "event_uuid"},
    {"idx_event_timestamp", "event_timestamp"},
    {"idx_event_model", "event_model"},
    {"idx_git_remote_url", "git_remote_url"},
    {"idx_git_commit_hash", "git_commit_hash"},
    {"idx_synced_at", "synced_at"},
}};

/// Columns computed from event_data by extract_derived_fields(), in table order
inline constexpr std::array<std::string_view, 11> kDerivedColumns = {
    "event_type",
    "event_message",
    "event_git_branch",
    "event_session_id",
    "event_uuid",
    "event_timestamp",
    "event_model",
    "event_input_tokens",
    "event_cache_creation_input_tokens",
    "event_cache_read_input_tokens",
    "event_output_tokens",
};

// ============================================================================
// DDL
// ============================================================================

[[nodiscard]] inline std::string events_table_ddl(std::string_view table_name) {
    return std::format(R"(CREATE TABLE IF NOT EXISTS {} (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    file_name TEXT NOT NULL,
    line_number INTEGER NOT NULL,
    event_data TEXT NOT NULL,
    user_name TEXT NOT NULL,
    inserted_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    event_type TEXT,
    event_message TEXT,
    event_git_branch TEXT,
    event_session_id TEXT,
    event_uuid TEXT,
    event_timestamp TEXT,
    event_model TEXT,
    event_input_tokens INTEGER,
    event_cache_creation_input_tokens INTEGER,
    event_cache_read_input_tokens INTEGER,
    event_output_tokens INTEGER,
    git_remote_url TEXT,
    git_commit_hash TEXT,
    synced_at TIMESTAMP DEFAULT NULL,
    UNIQUE(file_name, line_number)
))", table_name);
}

inline constexpr std::string_view kFileStateDdl = R"(CREATE TABLE IF NOT EXISTS conversation_file_state (
    file_name TEXT PRIMARY KEY,
    last_line INTEGER NOT NULL DEFAULT 0,
    updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
))";

inline constexpr std::string_view kFtsDdl = R"(CREATE VIRTUAL TABLE IF NOT EXISTS messages_fts USING fts5(
    event_message,
    event_type,
    event_session_id,
    content='conversation_events',
    content_rowid='id'
))";

// External-content FTS5 tables are maintained with the 'delete' command
inline constexpr std::string_view kFtsTriggersDdl = R"(
CREATE TRIGGER IF NOT EXISTS messages_fts_insert AFTER INSERT ON conversation_events BEGIN
    INSERT INTO messages_fts(rowid, event_message, event_type, event_session_id)
    VALUES (new.id, new.event_message, new.event_type, new.event_session_id);
END;
CREATE TRIGGER IF NOT EXISTS messages_fts_delete AFTER DELETE ON conversation_events BEGIN
    INSERT INTO messages_fts(messages_fts, rowid, event_message, event_type, event_session_id)
    VALUES ('delete', old.id, old.event_message, old.event_type, old.event_session_id);
END;
CREATE TRIGGER IF NOT EXISTS messages_fts_update
AFTER UPDATE OF event_message, event_type, event_session_id ON conversation_events BEGIN
    INSERT INTO messages_fts(messages_fts, rowid, event_message, event_type, event_session_id)
    VALUES ('delete', old.id, old.event_message, old.event_type, old.event_session_id);
    INSERT INTO messages_fts(rowid, event_message, event_type, event_session_id)
    VALUES (new.id, new.event_message, new.event_type, new.event_session_id);
END;
)";

inline constexpr std::string_view kDropFtsTriggers = R"(
DROP TRIGGER IF EXISTS messages_fts_insert;
DROP TRIGGER IF EXISTS messages_fts_delete;
DROP TRIGGER IF EXISTS messages_fts_update;
)";

inline constexpr std::string_view kFtsRebuild =
    "INSERT INTO messages_fts(messages_fts) VALUES('rebuild')";

} // namespace shiplog::schema
