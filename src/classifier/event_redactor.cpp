#include "classifier/event_redactor.hpp"

namespace shiplog {

namespace {

bool is_redactable_type(const nlohmann::json& event) {
    const auto it = event.find("type");
    if (it == event.end() || !it->is_string()) return false;
    const auto& type = it->get_ref<const std::string&>();
    return type == "user" || type == "assistant" || type == "message";
}

} // anonymous namespace

EventRedactor::EventRedactor(std::shared_ptr<const ISecretClassifier> classifier)
    : classifier_(std::move(classifier)) {}

EventRedactor::Result EventRedactor::redact(const nlohmann::json& event) const {
    Result result{event, 0};
    if (!classifier_ || !event.is_object() || !is_redactable_type(event)) return result;

    auto message = result.event.find("message");
    if (message == result.event.end() || !message->is_object()) return result;

    auto content = message->find("content");
    if (content == message->end() || !content->is_array()) return result;

    for (auto& block : *content) {
        if (!block.is_object()) continue;
        const auto type = block.find("type");
        if (type == block.end() || *type != "text") continue;

        auto text = block.find("text");
        if (text == block.end() || !text->is_string()) continue;

        const auto& original = text->get_ref<const std::string&>();
        auto classified = classifier_->classify(original);
        if (classified != original) {
            *text = std::move(classified);
            ++result.redacted_blocks;
        }
    }
    return result;
}

EventRedactor::Result EventRedactor::redact_payload(std::string_view event_data) const {
    auto parsed = nlohmann::json::parse(event_data.begin(), event_data.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return Result{nlohmann::json(std::string(event_data)), 0};
    }
    return redact(parsed);
}

} // namespace shiplog
