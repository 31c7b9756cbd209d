#pragma once

#include <string>
#include <string_view>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <type_traits>
#include <vector>

namespace shiplog::utils {

// ============================================================================
// Time Utilities
// ============================================================================

inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    ::localtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    char tz_buf[8];
    std::strftime(tz_buf, sizeof(tz_buf), "%z", &tm_buf);

    return std::format("{}.{:03d}{}", time_buf, static_cast<int>(ms.count()), tz_buf);
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

// ============================================================================
// Boolean Formatting
// ============================================================================

inline constexpr const char* booltostr(bool x) { return x ? "true" : "false"; }

// ============================================================================
// Numeric Parsing (std::from_chars — no exceptions, no locale, no allocations)
// ============================================================================

// Parse integer, returns std::nullopt on failure (for cases where 0 is ambiguous)
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

// ============================================================================
// Path Utilities
// ============================================================================

/**
 * @brief Expand a leading "~" or "~/" to $HOME.
 * Other paths are returned unchanged.
 */
[[nodiscard]] inline std::string expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;  // ~user form is not supported
    const char* home = std::getenv("HOME");
    if (!home || !*home) return path;
    return std::string(home) + path.substr(1);
}

/**
 * @brief Path of @p file relative to @p root as a generic (forward-slash) string.
 * Falls back to the file name when @p file is not under @p root.
 */
[[nodiscard]] inline std::string relative_name(const std::filesystem::path& file,
                                               const std::filesystem::path& root) {
    const auto rel = file.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty() || *rel.begin() == "..") {
        return file.filename().generic_string();
    }
    return rel.generic_string();
}

// ============================================================================
// Logging (thread-safe, level-tagged, stderr or rotating file)
// ============================================================================

namespace log {

enum class Level { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

[[nodiscard]] inline std::optional<Level> parse_level(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

namespace detail {
    struct State {
        std::mutex mutex;
        std::atomic<Level> min_level{Level::INFO};
        std::string file_path;
        std::ofstream file;
        uint64_t file_size = 0;
        uint64_t max_size_bytes = 10 * 1024 * 1024;
        int backup_count = 5;
    };

    inline State& state() {
        static State s;
        return s;
    }

    // Caller holds state().mutex
    inline void rotate_locked(State& s) {
        namespace fs = std::filesystem;
        s.file.close();
        std::error_code ec;
        if (s.backup_count > 0) {
            fs::remove(std::format("{}.{}", s.file_path, s.backup_count), ec);
            for (int i = s.backup_count - 1; i >= 1; --i) {
                const auto from = std::format("{}.{}", s.file_path, i);
                if (fs::exists(from, ec)) {
                    fs::rename(from, std::format("{}.{}", s.file_path, i + 1), ec);
                }
            }
            fs::rename(s.file_path, s.file_path + ".1", ec);
        } else {
            fs::remove(s.file_path, ec);
        }
        s.file.open(s.file_path, std::ios::out | std::ios::trunc);
        s.file_size = 0;
    }

    inline void write(Level level, const std::string& msg) {
        State& s = state();
        if (level < s.min_level.load()) return;

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[32];
        std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.file.is_open()) {
            if (s.max_size_bytes > 0 && s.file_size + formatted.size() > s.max_size_bytes) {
                rotate_locked(s);
            }
            s.file << formatted;
            s.file.flush();
            s.file_size += formatted.size();
            if (s.file.good()) return;
        }
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::state().min_level = level;
}

/**
 * @brief Redirect log output to a size-rotated file.
 * @return false if the file cannot be opened (output stays on stderr)
 */
inline bool set_file(const std::string& path, uint64_t max_size_bytes, int backup_count) {
    auto& s = detail::state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file.is_open()) s.file.close();

    std::error_code ec;
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    s.file.open(path, std::ios::out | std::ios::app);
    if (!s.file.is_open()) return false;

    s.file_path = path;
    s.max_size_bytes = max_size_bytes;
    s.backup_count = backup_count;
    const auto size = std::filesystem::file_size(path, ec);
    s.file_size = ec ? 0 : size;
    return true;
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace shiplog::utils
