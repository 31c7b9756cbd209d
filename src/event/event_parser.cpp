#include "event/event_parser.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <initializer_list>

namespace shiplog {

namespace {

constexpr size_t kMaxMessageBlocks = 5;

const nlohmann::json* find_path(const nlohmann::json& root,
                                std::initializer_list<const char*> keys) {
    const nlohmann::json* node = &root;
    for (const char* key : keys) {
        if (!node->is_object()) return nullptr;
        const auto it = node->find(key);
        if (it == node->end()) return nullptr;
        node = &*it;
    }
    return node;
}

// Scalars only: strings as-is, numbers and booleans in their JSON spelling
std::optional<std::string> scalar_text(const nlohmann::json* node) {
    if (!node || node->is_null() || node->is_structured()) return std::nullopt;
    if (node->is_string()) return node->get<std::string>();
    return node->dump();
}

std::optional<int64_t> integer_value(const nlohmann::json* node) {
    if (!node) return std::nullopt;
    if (node->is_number_unsigned()) {
        const auto u = node->get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return static_cast<int64_t>(u);
    }
    if (node->is_number_integer()) return node->get<int64_t>();
    if (node->is_number_float()) {
        // [-2^63, 2^63) is exactly the range that converts without overflow
        const double d = node->get<double>();
        if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            return std::nullopt;
        }
        return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

} // anonymous namespace

ParsedLine parse_event_line(std::string_view line) {
    ParsedLine result;
    auto parsed = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (parsed.is_discarded()) {
        result.error = "invalid JSON";
        return result;
    }
    if (!parsed.is_object()) {
        result.error = std::string("expected JSON object, got ") + parsed.type_name();
        return result;
    }
    result.json = std::move(parsed);
    return result;
}

std::optional<std::string> extract_message_text(const nlohmann::json& event) {
    if (const auto* content = find_path(event, {"message", "content"})) {
        if (content->is_array() && !content->empty()) {
            const auto* first = find_path((*content)[0], {"text"});
            if (first && first->is_string()) {
                std::string text = first->get<std::string>();
                const size_t n = std::min(content->size(), kMaxMessageBlocks);
                for (size_t i = 1; i < n; ++i) {
                    const auto* block_text = find_path((*content)[i], {"text"});
                    if (block_text && block_text->is_string()) {
                        text += "\n\n";
                        text += block_text->get_ref<const std::string&>();
                    }
                }
                return text;
            }
        }
        if (content->is_string()) return content->get<std::string>();
    }
    if (const auto* content = find_path(event, {"content"}); content && content->is_string()) {
        return content->get<std::string>();
    }
    return std::nullopt;
}

DerivedFields extract_derived_fields(const nlohmann::json& event) {
    DerivedFields f;
    if (!event.is_object()) return f;

    f.type = scalar_text(find_path(event, {"type"}));
    f.message = extract_message_text(event);
    f.git_branch = scalar_text(find_path(event, {"gitBranch"}));
    f.session_id = scalar_text(find_path(event, {"sessionId"}));
    f.uuid = scalar_text(find_path(event, {"uuid"}));
    f.timestamp = scalar_text(find_path(event, {"timestamp"}));
    f.model = scalar_text(find_path(event, {"message", "model"}));
    f.input_tokens = integer_value(find_path(event, {"message", "usage", "input_tokens"}));
    f.cache_creation_input_tokens = integer_value(
        find_path(event, {"message", "usage", "cache_creation_input_tokens"}));
    f.cache_read_input_tokens = integer_value(
        find_path(event, {"message", "usage", "cache_read_input_tokens"}));
    f.output_tokens = integer_value(find_path(event, {"message", "usage", "output_tokens"}));
    return f;
}

DerivedFields extract_derived_fields(std::string_view event_data) {
    auto parsed = parse_event_line(event_data);
    if (!parsed.json) return {};
    return extract_derived_fields(*parsed.json);
}

} // namespace shiplog
