#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace shiplog::testing {

/**
 * @brief RAII temporary directory, unique per instance
 */
struct TmpDir {
    std::filesystem::path path;

    explicit TmpDir(const std::string& tag = "test") {
        static std::atomic<int> counter{0};
        path = std::filesystem::temp_directory_path() /
               ("shiplog_" + tag + "_" + std::to_string(::getpid()) + "_" +
                std::to_string(counter.fetch_add(1)));
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TmpDir(const TmpDir&) = delete;
    TmpDir& operator=(const TmpDir&) = delete;

    /// Write (truncate) a file relative to the directory
    std::filesystem::path file(const std::string& name, const std::string& content) const {
        const auto p = path / name;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream f(p, std::ios::binary | std::ios::trunc);
        f << content;
        return p;
    }

    /// Append to a file relative to the directory
    std::filesystem::path append(const std::string& name, const std::string& content) const {
        const auto p = path / name;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream f(p, std::ios::binary | std::ios::app);
        f << content;
        return p;
    }

    [[nodiscard]] std::string str(const std::string& name) const {
        return (path / name).string();
    }
};

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace shiplog::testing
