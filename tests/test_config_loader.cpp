#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "mocks/temp_dir.hpp"

#include <cstdlib>

using namespace shiplog;
using shiplog::testing::TmpDir;

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.monitor.extension == ".jsonl");
    CHECK_FALSE(cfg.monitor.skip_backlog);
    CHECK(cfg.monitor.malformed_lines == "skip");
    CHECK_FALSE(cfg.monitor.debug_filter_project.has_value());

    CHECK(cfg.storage.enabled);
    CHECK(cfg.storage.state_path == cfg.storage.database_path);
    CHECK_FALSE(cfg.storage.user_name.empty());
    CHECK(cfg.storage.busy_timeout == std::chrono::milliseconds(30000));

    CHECK_FALSE(cfg.remote.enabled);

    CHECK(cfg.sync.batch_size == 50);
    CHECK(cfg.sync.idle_interval == std::chrono::seconds(60));
    CHECK(cfg.sync.batch_pause == std::chrono::milliseconds(2000));
    CHECK(cfg.sync.request_interval == std::chrono::milliseconds(100));
    CHECK(cfg.sync.initial_backoff == std::chrono::milliseconds(100));
    CHECK(cfg.sync.max_backoff == std::chrono::seconds(300));
    CHECK(cfg.sync.shutdown_timeout == std::chrono::milliseconds(5000));

    CHECK(cfg.redaction.enabled);
    CHECK(cfg.redaction.sentinel == "<SECRET REDACTED>");
    CHECK(cfg.logging.level == "info");
}

TEST_CASE("ConfigLoader: sections are parsed", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[monitor]
conversation_dir = "/data/projects"
extension = ".log"
debug_filter_project = "-home-me-proj"
skip_backlog = true
malformed_lines = "Quarantine"
quarantine_file = "/data/bad.jsonl"

[storage]
database_path = "/data/events.db"
state_path = "/data/state.db"
user_name = "alice"
busy_timeout_ms = 1000

[remote]
enabled = true
url = "https://collector.example.com/api"
api_key = "k-123"
request_timeout_ms = 2500

[sync]
batch_size = 10
idle_interval_seconds = 5
request_interval_ms = 0
max_backoff_seconds = 30

[redaction]
sentinel = "[gone]"
extra_patterns = ["internal-[0-9]{6}"]

[logging]
level = "debug"
file = "/data/shiplog.log"
backup_count = 2
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.monitor.conversation_dir == "/data/projects");
    CHECK(cfg.monitor.extension == ".log");
    REQUIRE(cfg.monitor.debug_filter_project.has_value());
    CHECK(*cfg.monitor.debug_filter_project == "-home-me-proj");
    CHECK(cfg.monitor.skip_backlog);
    CHECK(cfg.monitor.malformed_lines == "quarantine");
    CHECK(cfg.monitor.quarantine_file == "/data/bad.jsonl");

    CHECK(cfg.storage.database_path == "/data/events.db");
    CHECK(cfg.storage.state_path == "/data/state.db");
    CHECK(cfg.storage.user_name == "alice");
    CHECK(cfg.storage.busy_timeout == std::chrono::milliseconds(1000));

    CHECK(cfg.remote.enabled);
    CHECK(cfg.remote.url == "https://collector.example.com/api");
    CHECK(cfg.remote.api_key == "k-123");
    CHECK(cfg.remote.request_timeout == std::chrono::milliseconds(2500));

    CHECK(cfg.sync.batch_size == 10);
    CHECK(cfg.sync.idle_interval == std::chrono::seconds(5));
    CHECK(cfg.sync.request_interval == std::chrono::milliseconds(0));
    CHECK(cfg.sync.max_backoff == std::chrono::seconds(30));

    CHECK(cfg.redaction.sentinel == "[gone]");
    REQUIRE(cfg.redaction.extra_patterns.size() == 1);
    CHECK(cfg.redaction.extra_patterns[0] == "internal-[0-9]{6}");

    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.logging.file == "/data/shiplog.log");
    CHECK(cfg.logging.backup_count == 2);
}

TEST_CASE("ConfigLoader: environment variables are expanded", "[config]") {
    ::setenv("SHIPLOG_TEST_API_KEY", "secret-from-env", 1);
    auto result = ConfigLoader::load_from_string(R"(
[remote]
enabled = true
url = "http://localhost:8080"
api_key = "${SHIPLOG_TEST_API_KEY}"
)");
    ::unsetenv("SHIPLOG_TEST_API_KEY");

    REQUIRE(result.success);
    CHECK(result.config.remote.api_key == "secret-from-env");
}

TEST_CASE("ConfigLoader: home directory is expanded in paths", "[config]") {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') return;

    auto result = ConfigLoader::load_from_string(R"(
[storage]
database_path = "~/x/events.db"
)");
    REQUIRE(result.success);
    CHECK(result.config.storage.database_path == std::string(home) + "/x/events.db");
}

TEST_CASE("ConfigLoader: validation collects every problem", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[monitor]
malformed_lines = "explode"

[remote]
enabled = true

[sync]
batch_size = 0
initial_backoff_ms = 600000
max_backoff_seconds = 300

[logging]
level = "loud"
)");
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.find("malformed_lines") != std::string::npos);
    CHECK(msg.find("remote.url required") != std::string::npos);
    CHECK(msg.find("batch_size") != std::string::npos);
    CHECK(msg.find("initial_backoff_ms") != std::string::npos);
    CHECK(msg.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigLoader: negative sizes are rejected, not wrapped", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[sync]
batch_size = -1
memory_queue_capacity = -5
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("sync.batch_size must be > 0") != std::string::npos);
    CHECK(result.error_message.find("sync.memory_queue_capacity must be > 0") != std::string::npos);

    auto logging = ConfigLoader::load_from_string("[logging]\nmax_size_bytes = -10\n");
    REQUIRE(logging.success);
    CHECK(logging.config.logging.max_size_bytes == 0);
}

TEST_CASE("ConfigLoader: syntax errors are reported", "[config]") {
    auto result = ConfigLoader::load_from_string("[monitor\nextension = ");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: included file is overridden by the including file", "[config][include]") {
    TmpDir tmp("config_include");

    tmp.file("remote.toml", R"(
[remote]
enabled = true
url = "http://included:9000"
api_key = "from-include"
)");
    const auto main_path = tmp.file("main.toml", R"(
include = "remote.toml"

[remote]
api_key = "from-main"
)");

    auto result = ConfigLoader::load_from_file(main_path.string());
    REQUIRE(result.success);
    CHECK(result.config.remote.enabled);
    CHECK(result.config.remote.url == "http://included:9000");
    CHECK(result.config.remote.api_key == "from-main");
}

TEST_CASE("ConfigLoader: circular include is rejected", "[config][include]") {
    TmpDir tmp("config_circular");
    tmp.file("a.toml", "include = \"b.toml\"\n");
    tmp.file("b.toml", "include = \"a.toml\"\n");

    auto result = ConfigLoader::load_from_file(tmp.str("a.toml"));
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Circular") != std::string::npos);
}

TEST_CASE("ConfigLoader: default config is written once and loads", "[config]") {
    TmpDir tmp("config_default");
    const std::string path = tmp.str("nested/dir/config.toml");

    REQUIRE(ConfigLoader::write_default(path));
    REQUIRE(std::filesystem::exists(path));

    auto result = ConfigLoader::load_from_file(path);
    REQUIRE(result.success);
    CHECK(result.config.storage.enabled);
    CHECK_FALSE(result.config.remote.enabled);

    // An existing file is never overwritten
    tmp.file("nested/dir/config.toml", "[logging]\nlevel = \"warn\"\n");
    REQUIRE(ConfigLoader::write_default(path));
    auto again = ConfigLoader::load_from_file(path);
    REQUIRE(again.success);
    CHECK(again.config.logging.level == "warn");
}
