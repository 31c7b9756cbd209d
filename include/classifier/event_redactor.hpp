#pragma once

#include "classifier/secret_classifier.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string_view>

namespace shiplog {

/**
 * @brief Produces the remote-bound copy of an event.
 *
 * Only events of type user, assistant or message are touched, and within
 * them only message.content[i].text of blocks whose type is "text". The
 * input is never modified.
 */
class EventRedactor {
public:
    struct Result {
        nlohmann::json event;
        size_t redacted_blocks = 0;
    };

    /// A null classifier yields an unmodified copy
    explicit EventRedactor(std::shared_ptr<const ISecretClassifier> classifier);

    [[nodiscard]] Result redact(const nlohmann::json& event) const;

    /**
     * @brief Parse a stored payload and redact it.
     * Unparseable payloads are returned as a JSON string value.
     */
    [[nodiscard]] Result redact_payload(std::string_view event_data) const;

    [[nodiscard]] bool enabled() const { return classifier_ != nullptr; }

private:
    std::shared_ptr<const ISecretClassifier> classifier_;
};

} // namespace shiplog
