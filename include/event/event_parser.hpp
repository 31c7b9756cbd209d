#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace shiplog {

/**
 * @brief Columns derived from an event payload at write time.
 * Every field is absent when the payload does not carry it.
 */
struct DerivedFields {
    std::optional<std::string> type;
    std::optional<std::string> message;
    std::optional<std::string> git_branch;
    std::optional<std::string> session_id;
    std::optional<std::string> uuid;
    std::optional<std::string> timestamp;
    std::optional<std::string> model;
    std::optional<int64_t> input_tokens;
    std::optional<int64_t> cache_creation_input_tokens;
    std::optional<int64_t> cache_read_input_tokens;
    std::optional<int64_t> output_tokens;
};

struct ParsedLine {
    std::optional<nlohmann::json> json;   // set when the line is a JSON object
    std::string error;                    // parse error otherwise
};

/**
 * @brief Parse one JSONL line. Only JSON objects are accepted.
 */
[[nodiscard]] ParsedLine parse_event_line(std::string_view line);

/**
 * @brief Apply the extraction rules to a parsed payload.
 *
 * Message text is taken from the first rule that matches:
 *   1. message.content is a block list whose first block has a string
 *      "text"; string texts of blocks 1..4 are appended after a blank line
 *   2. message.content is a string
 *   3. top-level content is a string
 */
[[nodiscard]] DerivedFields extract_derived_fields(const nlohmann::json& event);

/// Parse then extract; all fields absent when the text does not parse
[[nodiscard]] DerivedFields extract_derived_fields(std::string_view event_data);

/// Message text only (rules above)
[[nodiscard]] std::optional<std::string> extract_message_text(const nlohmann::json& event);

} // namespace shiplog
