#pragma once

#include "rule.hpp"

namespace tproxy {

/**
 * @brief Rule holding one opaque line of restore input
 *
 * The text is emitted verbatim in both modes and is independent of the
 * owning chain; correctness of the text is the caller's responsibility.
 */
class TextRule : public Rule {
public:
    explicit TextRule(std::string text,
                      std::optional<std::string> annotation = std::nullopt);

    std::string render(const std::string& chain_name, bool verbose) const override;

    const std::string& getText() const { return text_; }

private:
    std::string text_;
};

} // namespace tproxy
