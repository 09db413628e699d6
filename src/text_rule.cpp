#include "text_rule.hpp"
#include <utility>

namespace tproxy {

TextRule::TextRule(std::string text, std::optional<std::string> annotation)
    : Rule(std::move(annotation))
    , text_(std::move(text)) {}

std::string TextRule::render(const std::string& /*chain_name*/, bool /*verbose*/) const {
    return text_;
}

} // namespace tproxy
