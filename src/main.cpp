#include "app/shipper.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <thread>

using namespace shiplog;

namespace {

constexpr const char* kDefaultConfigPath = "~/.shiplog/config.toml";
constexpr auto kMainLoopTick = std::chrono::milliseconds(200);

std::atomic<bool> g_stop_requested{false};

void signal_handler(int /*signal*/) {
    g_stop_requested.store(true);
}

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} [config.toml] [--skip-backlog] [--verbose]\n"
        "  config.toml      configuration file (default {})\n"
        "  --skip-backlog   mark existing lines as processed without recording them\n"
        "  --verbose        log at debug level\n",
        argv0, kDefaultConfigPath);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file = kDefaultConfigPath;
    bool skip_backlog = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--skip-backlog") {
            skip_backlog = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.starts_with("-")) {
            config_file = arg;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    try {
        config_file = utils::expand_user(config_file);

        std::error_code ec;
        if (!std::filesystem::exists(config_file, ec)) {
            utils::log::info(std::format("No configuration at {}, writing defaults", config_file));
            if (!ConfigLoader::write_default(config_file)) {
                utils::log::error(std::format("Cannot write default configuration to {}", config_file));
                return 1;
            }
        }

        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(std::format("Configuration error in {}: {}",
                                          config_file, config_result.error_message));
            return 1;
        }
        ShipperConfig config = std::move(config_result.config);
        if (skip_backlog) config.monitor.skip_backlog = true;

        // Logging
        if (verbose) {
            utils::log::set_level(utils::log::Level::DEBUG);
        } else if (auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        if (!config.logging.file.empty()) {
            const auto log_path = utils::expand_user(config.logging.file);
            if (!utils::log::set_file(log_path, config.logging.max_size_bytes,
                                      config.logging.backup_count)) {
                utils::log::warn(std::format("Cannot open log file {}, logging to stderr", log_path));
            }
        }

        utils::log::info(std::format("shiplog starting (config {})", config_file));

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        Shipper shipper(std::move(config));
        auto started = shipper.start();
        if (started.is_error()) {
            utils::log::error(std::format("Cannot start: {}", started.error_message()));
            return 1;
        }

        while (!g_stop_requested.load()) {
            std::this_thread::sleep_for(kMainLoopTick);
        }

        utils::log::info("Shutdown requested");
        shipper.stop();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
