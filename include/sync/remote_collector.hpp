#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace shiplog {

/**
 * @brief The remote-bound copy of one event.
 * event_data is already redacted.
 */
struct RemoteEvent {
    std::string file_name;
    int64_t line_number = 0;
    nlohmann::json event_data;
    GitContext git;

    /// Request body: {file_name, line_number, event_data, git_remote_url?, git_commit_hash?}
    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Client side of the collector protocol.
 *
 * Failures carry REMOTE_TRANSIENT (retry with backoff) or REMOTE_REJECTED
 * (the collector refused the request; retrying unchanged will not help).
 */
class IRemoteCollector {
public:
    virtual ~IRemoteCollector() = default;

    [[nodiscard]] virtual Result<bool> health_check() = 0;
    [[nodiscard]] virtual Result<bool> submit(const RemoteEvent& event) = 0;
    [[nodiscard]] virtual std::string endpoint() const = 0;
};

/**
 * @brief Collector client over HTTP(S) using cpp-httplib.
 *
 * GET <base>/health probes liveness, POST <base>/events submits one event.
 * Every request carries X-API-Key and User-Agent headers.
 */
class HttpRemoteCollector : public IRemoteCollector {
public:
    struct Config {
        std::string url;
        std::string api_key;
        std::chrono::milliseconds timeout{30000};
        std::string user_agent = "shiplog/1.0";
    };

    struct ParsedUrl {
        bool use_ssl = false;
        std::string host;
        int port = 80;
        std::string base_path;   // no trailing slash, may be empty
    };

    explicit HttpRemoteCollector(Config config);

    [[nodiscard]] Result<bool> health_check() override;
    [[nodiscard]] Result<bool> submit(const RemoteEvent& event) override;
    [[nodiscard]] std::string endpoint() const override;

    /**
     * @brief Probe the collector, retrying under <base>/api.php when the
     * plain base fails. On success later requests use the working base.
     */
    [[nodiscard]] Result<bool> connect();

    [[nodiscard]] static std::optional<ParsedUrl> parse_url(const std::string& url);

    /// Category for a non-2xx HTTP status
    [[nodiscard]] static ErrorCategory classify_status(int status);

    [[nodiscard]] uint64_t requests_sent() const { return requests_sent_.load(); }

private:
    Result<bool> get_health(const std::string& base_path);
    std::string scheme_host() const;

    Config config_;
    std::optional<ParsedUrl> url_;
    mutable std::mutex base_mutex_;
    std::string base_path_;
    std::atomic<uint64_t> requests_sent_{0};
};

} // namespace shiplog
