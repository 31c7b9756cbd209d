#include "sync/remote_collector.hpp"
#include "sync/http_constants.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>

namespace shiplog {

namespace {

constexpr size_t kMaxLoggedBody = 200;

httplib::Headers request_headers(const std::string& api_key, const std::string& user_agent) {
    httplib::Headers headers;
    if (!api_key.empty()) {
        headers.emplace(http::kApiKeyHeader, api_key);
    }
    headers.emplace(http::kUserAgentHeader, user_agent);
    headers.emplace(http::kAcceptHeader, http::kJsonContentType);
    return headers;
}

std::string truncate_body(const std::string& body) {
    if (body.size() <= kMaxLoggedBody) return body;
    return body.substr(0, kMaxLoggedBody) + "...";
}

} // anonymous namespace

// ============================================================================
// RemoteEvent
// ============================================================================

nlohmann::json RemoteEvent::to_json() const {
    nlohmann::json body = {
        {"file_name", file_name},
        {"line_number", line_number},
        {"event_data", event_data},
    };
    if (git.remote_url) body["git_remote_url"] = *git.remote_url;
    if (git.commit_hash) body["git_commit_hash"] = *git.commit_hash;
    return body;
}

// ============================================================================
// HttpRemoteCollector
// ============================================================================

HttpRemoteCollector::HttpRemoteCollector(Config config)
    : config_(std::move(config)),
      url_(parse_url(config_.url)) {
    if (url_) {
        base_path_ = url_->base_path;
    } else {
        utils::log::error(std::format("Invalid collector URL: \"{}\"", config_.url));
    }
}

std::optional<HttpRemoteCollector::ParsedUrl> HttpRemoteCollector::parse_url(const std::string& input) {
    ParsedUrl parsed;
    std::string url = utils::trim(input);

    if (url.starts_with("https://")) {
        parsed.use_ssl = true;
        parsed.port = 443;
        url = url.substr(8);
    } else if (url.starts_with("http://")) {
        parsed.use_ssl = false;
        parsed.port = 80;
        url = url.substr(7);
    } else if (url.find("://") != std::string::npos) {
        return std::nullopt;   // unsupported scheme
    }

    const auto path_pos = url.find('/');
    if (path_pos != std::string::npos) {
        parsed.host = url.substr(0, path_pos);
        parsed.base_path = url.substr(path_pos);
    } else {
        parsed.host = url;
    }
    while (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }

    const auto port_pos = parsed.host.find(':');
    if (port_pos != std::string::npos) {
        const auto port = utils::try_parse_int<int>(parsed.host.substr(port_pos + 1));
        if (!port || *port <= 0 || *port > 65535) return std::nullopt;
        parsed.port = *port;
        parsed.host = parsed.host.substr(0, port_pos);
    }
    if (parsed.host.empty()) return std::nullopt;
    return parsed;
}

ErrorCategory HttpRemoteCollector::classify_status(int status) {
    switch (status) {
        case 400: case 401: case 403: case 404: case 413: case 422:
            return ErrorCategory::REMOTE_REJECTED;
        default:
            return ErrorCategory::REMOTE_TRANSIENT;
    }
}

std::string HttpRemoteCollector::scheme_host() const {
    return std::format("{}{}:{}", url_->use_ssl ? "https://" : "http://", url_->host, url_->port);
}

std::string HttpRemoteCollector::endpoint() const {
    if (!url_) return config_.url;
    std::lock_guard<std::mutex> lock(base_mutex_);
    return scheme_host() + base_path_;
}

Result<bool> HttpRemoteCollector::get_health(const std::string& base_path) {
    if (!url_) {
        return Result<bool>::error(ErrorCategory::CONFIG_ERROR,
                                   std::format("invalid collector URL \"{}\"", config_.url));
    }
    try {
        httplib::Client client(scheme_host());
        client.set_connection_timeout(config_.timeout);
        client.set_read_timeout(config_.timeout);

        ++requests_sent_;
        auto res = client.Get(base_path + std::string(http::kHealthPath),
                              request_headers(config_.api_key, config_.user_agent));
        if (!res) {
            return Result<bool>::error(ErrorCategory::REMOTE_TRANSIENT,
                                       httplib::to_string(res.error()));
        }
        if (res->status < 200 || res->status >= 300) {
            return Result<bool>::error(classify_status(res->status),
                std::format("HTTP {}: {}", res->status, truncate_body(res->body)));
        }
        return Result<bool>::ok(true);
    } catch (const std::exception& e) {
        return Result<bool>::error(ErrorCategory::REMOTE_TRANSIENT, e.what());
    }
}

Result<bool> HttpRemoteCollector::health_check() {
    std::string base;
    {
        std::lock_guard<std::mutex> lock(base_mutex_);
        base = base_path_;
    }
    return get_health(base);
}

Result<bool> HttpRemoteCollector::connect() {
    auto result = health_check();
    if (result.is_ok()) {
        utils::log::info(std::format("Connected to collector: {}", endpoint()));
        return result;
    }
    if (!url_ || url_->base_path.find(http::kPhpEntryPoint) != std::string::npos) {
        return result;
    }

    const std::string fallback = url_->base_path + std::string(http::kPhpEntryPoint);
    auto retry = get_health(fallback);
    if (retry.is_ok()) {
        {
            std::lock_guard<std::mutex> lock(base_mutex_);
            base_path_ = fallback;
        }
        utils::log::info(std::format("Connected to collector: {}", endpoint()));
        return retry;
    }
    return result;
}

Result<bool> HttpRemoteCollector::submit(const RemoteEvent& event) {
    if (!url_) {
        return Result<bool>::error(ErrorCategory::CONFIG_ERROR,
                                   std::format("invalid collector URL \"{}\"", config_.url));
    }
    std::string base;
    {
        std::lock_guard<std::mutex> lock(base_mutex_);
        base = base_path_;
    }

    try {
        const std::string body = event.to_json().dump(-1, ' ', false,
                                                      nlohmann::json::error_handler_t::replace);

        httplib::Client client(scheme_host());
        client.set_connection_timeout(config_.timeout);
        client.set_read_timeout(config_.timeout);
        client.set_write_timeout(config_.timeout);

        ++requests_sent_;
        auto res = client.Post(base + std::string(http::kEventsPath),
                               request_headers(config_.api_key, config_.user_agent),
                               body, http::kJsonContentType);
        if (!res) {
            return Result<bool>::error(ErrorCategory::REMOTE_TRANSIENT,
                                       httplib::to_string(res.error()));
        }
        if (res->status < 200 || res->status >= 300) {
            return Result<bool>::error(classify_status(res->status),
                std::format("HTTP {}: {}", res->status, truncate_body(res->body)));
        }
        return Result<bool>::ok(true);
    } catch (const std::exception& e) {
        return Result<bool>::error(ErrorCategory::REMOTE_TRANSIENT, e.what());
    }
}

} // namespace shiplog
