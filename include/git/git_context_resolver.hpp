#pragma once

#include "core/types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace shiplog {

/**
 * @brief Best-effort lookup of the repository a directory belongs to.
 * Never throws; any failure yields an empty GitContext.
 */
class IGitContextResolver {
public:
    virtual ~IGitContextResolver() = default;

    [[nodiscard]] virtual GitContext resolve(const std::filesystem::path& dir) = 0;
};

/**
 * @brief Resolver that runs the git CLI, each call bounded by a timeout.
 */
class CommandGitContextResolver : public IGitContextResolver {
public:
    explicit CommandGitContextResolver(std::chrono::seconds timeout = std::chrono::seconds(1));

    [[nodiscard]] GitContext resolve(const std::filesystem::path& dir) override;

    /// Single-quote @p arg for /bin/sh
    [[nodiscard]] static std::string shell_quote(const std::string& arg);

private:
    /// Trimmed stdout of a successful command, nullopt on failure or empty output
    [[nodiscard]] std::optional<std::string> run(const std::string& command) const;

    std::chrono::seconds timeout_;
};

} // namespace shiplog
