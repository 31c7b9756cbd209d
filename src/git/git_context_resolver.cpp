#include "git/git_context_resolver.hpp"
#include "core/utils.hpp"

#include <cstdio>
#include <format>
#include <sys/wait.h>

namespace shiplog {

CommandGitContextResolver::CommandGitContextResolver(std::chrono::seconds timeout)
    : timeout_(timeout) {}

std::string CommandGitContextResolver::shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (const char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::optional<std::string> CommandGitContextResolver::run(const std::string& command) const {
    // coreutils timeout kills git if it hangs (network remotes, locked index)
    const std::string cmd = std::format("timeout {} {} 2>/dev/null", timeout_.count(), command);
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return std::nullopt;

    std::string output;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }
    const int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return std::nullopt;
    }

    output = utils::trim(output);
    if (output.empty()) return std::nullopt;
    return output;
}

GitContext CommandGitContextResolver::resolve(const std::filesystem::path& dir) {
    GitContext ctx;
    std::error_code ec;
    if (dir.empty() || !std::filesystem::is_directory(dir, ec)) return ctx;

    const auto quoted = shell_quote(dir.string());
    ctx.remote_url = run(std::format("git -C {} remote get-url origin", quoted));
    ctx.commit_hash = run(std::format("git -C {} rev-parse HEAD", quoted));

    utils::log::debug(std::format("Git context for {}: remote={}, commit={}",
        dir.string(), ctx.remote_url.value_or("-"), ctx.commit_hash.value_or("-")));
    return ctx;
}

} // namespace shiplog
