#include "classifier/secret_classifier.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace shiplog {

namespace {

// std::regex matching recurses per repeated character, so built-in patterns
// use bounded repeats and every pattern is searched over bounded windows.
// A match longer than the overlap that straddles a window edge is missed.
constexpr size_t kScanWindow = 4096;
constexpr size_t kScanOverlap = 256;

bool search_windowed(const std::string& text, const std::regex& pattern) {
    if (text.size() <= kScanWindow) {
        return std::regex_search(text, pattern);
    }
    for (size_t pos = 0; pos < text.size(); pos += kScanWindow - kScanOverlap) {
        const size_t end = std::min(text.size(), pos + kScanWindow);
        if (std::regex_search(text.begin() + static_cast<std::ptrdiff_t>(pos),
                              text.begin() + static_cast<std::ptrdiff_t>(end), pattern)) {
            return true;
        }
        if (end == text.size()) break;
    }
    return false;
}

} // anonymous namespace

PatternSecretClassifier::PatternSecretClassifier(std::string sentinel,
                                                 const std::vector<std::string>& extra_patterns)
    : sentinel_(std::move(sentinel)) {
    init_patterns();

    for (size_t i = 0; i < extra_patterns.size(); ++i) {
        try {
            patterns_.push_back({std::format("extra[{}]", i),
                                 std::regex(extra_patterns[i], std::regex::ECMAScript | std::regex::optimize)});
        } catch (const std::regex_error& e) {
            utils::log::error(std::format("Ignoring invalid redaction pattern \"{}\": {}",
                                          extra_patterns[i], e.what()));
        }
    }
}

void PatternSecretClassifier::init_patterns() {
    const auto flags = std::regex::ECMAScript | std::regex::optimize;

    patterns_.push_back({"aws_access_key", std::regex(R"((?:AKIA|ASIA)[0-9A-Z]{16})", flags)});
    patterns_.push_back({"github_token", std::regex(R"(gh[pousr]_[A-Za-z0-9]{36})", flags)});
    patterns_.push_back({"github_pat", std::regex(R"(github_pat_[A-Za-z0-9_]{22})", flags)});
    patterns_.push_back({"gitlab_token", std::regex(R"(glpat-[A-Za-z0-9_-]{20})", flags)});
    patterns_.push_back({"slack_token", std::regex(R"(xox[abprs]-[A-Za-z0-9-]{10})", flags)});
    patterns_.push_back({"provider_api_key", std::regex(R"(sk-[A-Za-z0-9_-]{20})", flags)});
    patterns_.push_back({"stripe_key", std::regex(R"([sr]k_live_[0-9A-Za-z]{16})", flags)});
    patterns_.push_back({"google_api_key", std::regex(R"(AIza[0-9A-Za-z_-]{35})", flags)});
    patterns_.push_back({"private_key", std::regex(R"(-----BEGIN [A-Z ]{0,32}PRIVATE KEY-----)", flags)});
    patterns_.push_back({"jwt", std::regex(
        R"(eyJ[A-Za-z0-9_-]{8,1024}\.eyJ[A-Za-z0-9_-]{8,1024}\.[A-Za-z0-9_-]{8})", flags)});
    patterns_.push_back({"credential_assignment", std::regex(
        R"((?:password|passwd|secret|token|api[_-]?key)\s{0,8}[:=]\s{0,8}['"]?[^\s'"]{8})",
        flags | std::regex::icase)});
}

std::string PatternSecretClassifier::match(const std::string& text) const {
    for (const auto& p : patterns_) {
        if (search_windowed(text, p.pattern)) {
            return p.name;
        }
    }
    return {};
}

std::string PatternSecretClassifier::classify(const std::string& text) const {
    if (text.empty()) return text;
    const auto hit = match(text);
    if (hit.empty()) return text;
    utils::log::debug(std::format("Redacting text block ({})", hit));
    return sentinel_;
}

} // namespace shiplog
