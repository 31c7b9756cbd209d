#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace shiplog {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (node.is_string()) {
        auto& s = *node.as_string();
        auto expanded = expand_env_vars(s.get());
        if (expanded != s.get()) {
            s = std::move(expanded);
        }
    } else if (node.is_table()) {
        expand_env_vars_recursive(*node.as_table());
    } else if (node.is_array()) {
        for (auto& elem : *node.as_array()) {
            expand_env_vars_in_node(elem);
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars, arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format(
            "Config include depth exceeds {} (circular include?)", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path =
            fs::canonical(fs::path(base_dir) / utils::expand_user(rel_path)).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file overrides it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir.empty() ? "." : base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

// Unsigned counts: negative values clamp to 0 so that validation rejects
// them instead of wrapping to a huge size_t
uint64_t toml_count(const toml::table& tbl, const std::string_view key, int64_t fallback) {
    return static_cast<uint64_t>(std::max<int64_t>(tbl[key].value_or(fallback), 0));
}

const toml::table& section(const toml::table& root, const std::string_view name) {
    static const toml::table empty;
    const auto* t = root[name].as_table();
    return t ? *t : empty;
}

std::string default_user_name() {
    const char* user = std::getenv("USER");
    return (user && *user) ? std::string(user) : "unknown"s;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

MonitorConfig ConfigLoader::extract_monitor(const toml::table& root) {
    MonitorConfig cfg;
    const auto& m = section(root, "monitor");

    cfg.conversation_dir = utils::expand_user(m["conversation_dir"].value_or(cfg.conversation_dir));
    cfg.extension = m["extension"].value_or(cfg.extension);
    cfg.debug_filter_project = toml_optional_string(m, "debug_filter_project");
    cfg.skip_backlog = m["skip_backlog"].value_or(cfg.skip_backlog);
    cfg.malformed_lines = utils::to_lower(m["malformed_lines"].value_or(cfg.malformed_lines));
    cfg.quarantine_file = utils::expand_user(m["quarantine_file"].value_or(cfg.quarantine_file));
    return cfg;
}

StorageConfig ConfigLoader::extract_storage(const toml::table& root) {
    StorageConfig cfg;
    const auto& s = section(root, "storage");

    cfg.enabled = s["enabled"].value_or(cfg.enabled);
    cfg.database_path = utils::expand_user(s["database_path"].value_or(cfg.database_path));
    cfg.state_path = utils::expand_user(s["state_path"].value_or(""s));
    if (cfg.state_path.empty()) cfg.state_path = cfg.database_path;
    cfg.user_name = s["user_name"].value_or(""s);
    if (cfg.user_name.empty()) cfg.user_name = default_user_name();
    cfg.busy_timeout = std::chrono::milliseconds(
        s["busy_timeout_ms"].value_or(int64_t{cfg.busy_timeout.count()}));
    cfg.schema_docs_path = utils::expand_user(s["schema_docs_path"].value_or(""s));
    return cfg;
}

RemoteConfig ConfigLoader::extract_remote(const toml::table& root) {
    RemoteConfig cfg;
    const auto& r = section(root, "remote");

    cfg.enabled = r["enabled"].value_or(cfg.enabled);
    cfg.url = utils::trim(r["url"].value_or(""s));
    cfg.api_key = r["api_key"].value_or(""s);
    cfg.request_timeout = std::chrono::milliseconds(
        r["request_timeout_ms"].value_or(int64_t{cfg.request_timeout.count()}));
    cfg.user_agent = r["user_agent"].value_or(cfg.user_agent);
    return cfg;
}

SyncConfig ConfigLoader::extract_sync(const toml::table& root) {
    SyncConfig cfg;
    const auto& s = section(root, "sync");

    cfg.batch_size = static_cast<size_t>(toml_count(s, "batch_size", 50));
    cfg.idle_interval = std::chrono::seconds(
        s["idle_interval_seconds"].value_or(int64_t{cfg.idle_interval.count()}));
    cfg.batch_pause = std::chrono::milliseconds(
        s["batch_pause_ms"].value_or(int64_t{cfg.batch_pause.count()}));
    cfg.request_interval = std::chrono::milliseconds(
        s["request_interval_ms"].value_or(int64_t{cfg.request_interval.count()}));
    cfg.initial_backoff = std::chrono::milliseconds(
        s["initial_backoff_ms"].value_or(int64_t{cfg.initial_backoff.count()}));
    cfg.max_backoff = std::chrono::seconds(
        s["max_backoff_seconds"].value_or(int64_t{cfg.max_backoff.count()}));
    cfg.shutdown_timeout = std::chrono::milliseconds(
        s["shutdown_timeout_ms"].value_or(int64_t{cfg.shutdown_timeout.count()}));
    cfg.memory_queue_capacity = static_cast<size_t>(toml_count(s, "memory_queue_capacity", 10000));
    return cfg;
}

RedactionConfig ConfigLoader::extract_redaction(const toml::table& root) {
    RedactionConfig cfg;
    const auto& r = section(root, "redaction");

    cfg.enabled = r["enabled"].value_or(cfg.enabled);
    cfg.sentinel = r["sentinel"].value_or(cfg.sentinel);
    cfg.extra_patterns = toml_string_array(r, "extra_patterns");
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto& l = section(root, "logging");

    cfg.level = l["level"].value_or(cfg.level);
    cfg.file = utils::expand_user(l["file"].value_or(""s));
    cfg.max_size_bytes = toml_count(l, "max_size_bytes", 10 * 1024 * 1024);
    cfg.backup_count = static_cast<int>(l["backup_count"].value_or(int64_t{5}));
    return cfg;
}

// ---- Aggregate -------------------------------------------------------------

ShipperConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    ShipperConfig config;
    config.monitor = extract_monitor(tbl);
    config.storage = extract_storage(tbl);
    config.remote = extract_remote(tbl);
    config.sync = extract_sync(tbl);
    config.redaction = extract_redaction(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ShipperConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// First-run defaults
// ============================================================================

std::string ConfigLoader::default_config_text() {
    return R"(# shiplog configuration

[monitor]
conversation_dir = "~/.claude/projects"
extension = ".jsonl"
skip_backlog = false
# "skip" or "quarantine"
malformed_lines = "skip"
quarantine_file = "~/.shiplog/quarantine.jsonl"

[storage]
enabled = true
database_path = "~/.shiplog/shiplog.db"
busy_timeout_ms = 30000
# schema_docs_path = "~/.shiplog/SCHEMA.md"

[remote]
enabled = false
url = ""
api_key = "${SHIPLOG_API_KEY}"
request_timeout_ms = 30000

[sync]
batch_size = 50
idle_interval_seconds = 60
batch_pause_ms = 2000
request_interval_ms = 100
initial_backoff_ms = 100
max_backoff_seconds = 300
shutdown_timeout_ms = 5000

[redaction]
enabled = true
sentinel = "<SECRET REDACTED>"
extra_patterns = []

[logging]
level = "info"
# file = "~/.shiplog/shiplog.log"
max_size_bytes = 10485760
backup_count = 5
)";
}

bool ConfigLoader::write_default(const std::string& config_path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (fs::exists(config_path, ec)) return true;

    const auto parent = fs::path(config_path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    std::ofstream out(config_path);
    if (!out) {
        utils::log::error(std::format("Cannot write default config to {}", config_path));
        return false;
    }
    out << default_config_text();
    out.close();
    if (!out) {
        utils::log::error(std::format("Failed writing default config to {}", config_path));
        return false;
    }
    utils::log::info(std::format("Wrote default config to {}", config_path));
    return true;
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ShipperConfig& config) {
    std::vector<std::string> errors;

    if (config.monitor.conversation_dir.empty()) {
        errors.push_back("monitor.conversation_dir must not be empty");
    }
    if (!parse_malformed_line_policy(config.monitor.malformed_lines)) {
        errors.push_back(std::format(
            "monitor.malformed_lines must be \"skip\" or \"quarantine\", got \"{}\"",
            config.monitor.malformed_lines));
    }
    if (config.monitor.malformed_lines == "quarantine" && config.monitor.quarantine_file.empty()) {
        errors.push_back("monitor.quarantine_file required when malformed_lines is \"quarantine\"");
    }

    if (config.storage.enabled && config.storage.database_path.empty()) {
        errors.push_back("storage.database_path must not be empty when storage is enabled");
    }
    if (config.storage.busy_timeout.count() < 0) {
        errors.push_back("storage.busy_timeout_ms must be >= 0");
    }

    if (config.remote.enabled && config.remote.url.empty()) {
        errors.push_back("remote.url required when remote is enabled");
    }
    if (config.remote.request_timeout.count() <= 0) {
        errors.push_back("remote.request_timeout_ms must be > 0");
    }

    const auto& sync = config.sync;
    if (sync.batch_size == 0) {
        errors.push_back("sync.batch_size must be > 0");
    }
    if (sync.idle_interval.count() <= 0) {
        errors.push_back("sync.idle_interval_seconds must be > 0");
    }
    if (sync.batch_pause.count() < 0) {
        errors.push_back("sync.batch_pause_ms must be >= 0");
    }
    if (sync.request_interval.count() < 0) {
        errors.push_back("sync.request_interval_ms must be >= 0");
    }
    if (sync.initial_backoff.count() <= 0) {
        errors.push_back("sync.initial_backoff_ms must be > 0");
    }
    if (sync.max_backoff.count() <= 0) {
        errors.push_back("sync.max_backoff_seconds must be > 0");
    } else if (sync.initial_backoff > sync.max_backoff) {
        errors.push_back(std::format(
            "sync.initial_backoff_ms ({}) exceeds max_backoff_seconds ({})",
            sync.initial_backoff.count(), sync.max_backoff.count()));
    }
    if (sync.shutdown_timeout.count() <= 0) {
        errors.push_back("sync.shutdown_timeout_ms must be > 0");
    }
    if (sync.memory_queue_capacity == 0) {
        errors.push_back("sync.memory_queue_capacity must be > 0");
    }

    if (config.redaction.enabled && config.redaction.sentinel.empty()) {
        errors.push_back("redaction.sentinel must not be empty");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got \"{}\"", config.logging.level));
    }
    if (config.logging.backup_count < 0) {
        errors.push_back("logging.backup_count must be >= 0");
    }

    return errors;
}

} // namespace shiplog
