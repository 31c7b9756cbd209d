#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shiplog {

// ============================================================================
// Configuration Types
// ============================================================================

enum class MalformedLinePolicy {
    SKIP,        // log and advance the cursor
    QUARANTINE   // also append the raw line to the quarantine file
};

[[nodiscard]] inline std::optional<MalformedLinePolicy> parse_malformed_line_policy(
    const std::string& name) {
    if (name == "skip") return MalformedLinePolicy::SKIP;
    if (name == "quarantine") return MalformedLinePolicy::QUARANTINE;
    return std::nullopt;
}

struct MonitorConfig {
    std::string conversation_dir = "~/.claude/projects";
    std::string extension = ".jsonl";
    std::optional<std::string> debug_filter_project;  // only process files under this prefix
    bool skip_backlog = false;
    std::string malformed_lines = "skip";   // "skip" | "quarantine"
    std::string quarantine_file = "~/.shiplog/quarantine.jsonl";
};

struct StorageConfig {
    bool enabled = true;
    std::string database_path = "~/.shiplog/shiplog.db";
    std::string state_path;           // empty = same file as database_path
    std::string user_name;            // empty = $USER or "unknown"
    std::chrono::milliseconds busy_timeout{30000};
    std::string schema_docs_path;     // empty = no export
};

struct RemoteConfig {
    bool enabled = false;
    std::string url;
    std::string api_key;
    std::chrono::milliseconds request_timeout{30000};
    std::string user_agent = "shiplog/1.0";
};

struct SyncConfig {
    size_t batch_size = 50;
    std::chrono::seconds idle_interval{60};
    std::chrono::milliseconds batch_pause{2000};
    std::chrono::milliseconds request_interval{100};   // 10 requests/second
    std::chrono::milliseconds initial_backoff{100};
    std::chrono::seconds max_backoff{300};
    std::chrono::milliseconds shutdown_timeout{5000};
    size_t memory_queue_capacity = 10000;
};

struct RedactionConfig {
    bool enabled = true;
    std::string sentinel = "<SECRET REDACTED>";
    std::vector<std::string> extra_patterns;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;                 // empty = stderr
    uint64_t max_size_bytes = 10 * 1024 * 1024;
    int backup_count = 5;
};

// ============================================================================
// ShipperConfig - Complete parsed configuration
// ============================================================================

struct ShipperConfig {
    MonitorConfig monitor;
    StorageConfig storage;
    RemoteConfig remote;
    SyncConfig sync;
    RedactionConfig redaction;
    LoggingConfig logging;
};

} // namespace shiplog
