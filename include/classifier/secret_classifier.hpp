#pragma once

#include <regex>
#include <string>
#include <vector>

namespace shiplog {

/**
 * @brief Decides whether a text must be withheld from the remote copy.
 *
 * classify() returns the text unchanged, or a fixed sentinel replacing it
 * entirely. Implementations are stateless and thread-safe.
 */
class ISecretClassifier {
public:
    virtual ~ISecretClassifier() = default;

    [[nodiscard]] virtual std::string classify(const std::string& text) const = 0;
};

/**
 * @brief Regex-based classifier for well-known credential shapes.
 *
 * Detects cloud access keys, provider API keys, VCS and chat tokens,
 * PEM private keys, JWTs and generic `password = ...` style assignments,
 * plus any extra patterns from configuration.
 */
class PatternSecretClassifier : public ISecretClassifier {
public:
    struct SecretPattern {
        std::string name;
        std::regex pattern;
    };

    /**
     * @param sentinel Replacement text for a classified input
     * @param extra_patterns Additional ECMAScript regexes (invalid ones are logged and skipped)
     */
    explicit PatternSecretClassifier(std::string sentinel = "<SECRET REDACTED>",
                                     const std::vector<std::string>& extra_patterns = {});

    [[nodiscard]] std::string classify(const std::string& text) const override;

    /// Name of the first matching pattern, empty if none
    [[nodiscard]] std::string match(const std::string& text) const;

    [[nodiscard]] const std::string& sentinel() const { return sentinel_; }
    [[nodiscard]] size_t pattern_count() const { return patterns_.size(); }

private:
    void init_patterns();

    std::string sentinel_;
    std::vector<SecretPattern> patterns_;
};

} // namespace shiplog
