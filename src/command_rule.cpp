#include "command_rule.hpp"
#include <stdexcept>
#include <utility>

namespace tproxy {

CommandRule::CommandRule(std::vector<Parameter> parameters,
                         std::optional<std::string> annotation)
    : Rule(std::move(annotation))
    , parameters_(std::move(parameters)) {}

std::string CommandRule::renderParameters(bool verbose) const {
    std::string rendered;
    for (const auto& parameter : parameters_) {
        std::string text = parameter.render(verbose);
        if (!text.empty()) {
            rendered += " " + text;
        }
    }
    return rendered;
}

AppendRule::AppendRule(std::vector<Parameter> parameters,
                       std::optional<std::string> annotation)
    : CommandRule(std::move(parameters), std::move(annotation)) {}

std::string AppendRule::render(const std::string& chain_name, bool verbose) const {
    return flagSpelling(Directive::Append, verbose) + " " + chain_name +
           renderParameters(verbose);
}

InsertRule::InsertRule(std::size_t position,
                       std::vector<Parameter> parameters,
                       std::optional<std::string> annotation)
    : CommandRule(std::move(parameters), std::move(annotation))
    , position_(position) {
    if (position_ == 0) {
        throw std::invalid_argument("Insert position is 1-based and cannot be 0");
    }
}

std::string InsertRule::render(const std::string& chain_name, bool verbose) const {
    return flagSpelling(Directive::Insert, verbose) + " " + chain_name + " " +
           std::to_string(position_) + renderParameters(verbose);
}

} // namespace tproxy
