#include "chain.hpp"
#include "command_rule.hpp"
#include "parameters.hpp"
#include "text_rule.hpp"
#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace tproxy {

namespace {

// iptables refuses longer chain names (XT_EXTENSION_MAXNAMELEN - 1)
constexpr std::size_t kMaxChainNameLength = 29;

constexpr std::array<BuiltinChain, 5> kAllBuiltinChains = {
    BuiltinChain::Prerouting, BuiltinChain::Input, BuiltinChain::Forward,
    BuiltinChain::Output, BuiltinChain::Postrouting};

} // namespace

std::string builtinChainName(BuiltinChain role) {
    switch (role) {
        case BuiltinChain::Prerouting:
            return "PREROUTING";
        case BuiltinChain::Input:
            return "INPUT";
        case BuiltinChain::Forward:
            return "FORWARD";
        case BuiltinChain::Output:
            return "OUTPUT";
        case BuiltinChain::Postrouting:
            return "POSTROUTING";
        default:
            throw std::runtime_error("Unknown built-in chain");
    }
}

Chain::Chain(BuiltinChain role)
    : id_(role) {}

Chain::Chain(const std::string& name)
    : id_(CustomChainName{name}) {
    std::string error = getNameValidationError(name);
    if (!error.empty()) {
        throw std::invalid_argument(error);
    }
}

std::string Chain::getName() const {
    if (const auto* role = std::get_if<BuiltinChain>(&id_)) {
        return builtinChainName(*role);
    }
    return std::get<CustomChainName>(id_).value;
}

Chain& Chain::addRule(std::unique_ptr<Rule> rule) {
    if (!rule) {
        throw std::invalid_argument("Cannot add a null rule to chain '" + getName() + "'");
    }
    rules_.push_back(std::move(rule));
    return *this;
}

Chain& Chain::append(std::vector<Parameter> parameters,
                     std::optional<std::string> annotation) {
    return addRule(std::make_unique<AppendRule>(std::move(parameters), std::move(annotation)));
}

Chain& Chain::insert(std::size_t position,
                     std::vector<Parameter> parameters,
                     std::optional<std::string> annotation) {
    return addRule(std::make_unique<InsertRule>(position, std::move(parameters),
                                                std::move(annotation)));
}

Chain& Chain::appendText(const std::string& text) {
    return addRule(std::make_unique<TextRule>(text));
}

std::vector<std::string> Chain::build(bool verbose) const {
    const std::string name = getName();
    std::vector<std::string> lines;
    for (const auto& rule : rules_) {
        std::vector<std::string> rule_lines = rule->build(name, verbose);
        lines.insert(lines.end(), rule_lines.begin(), rule_lines.end());
    }
    return lines;
}

bool Chain::isValidCustomName(const std::string& name) {
    return getNameValidationError(name).empty();
}

std::string Chain::getNameValidationError(const std::string& name) {
    if (name.empty()) {
        return "Chain name cannot be empty";
    }
    if (name.length() > kMaxChainNameLength) {
        return "Chain name '" + name + "' is longer than " +
               std::to_string(kMaxChainNameLength) + " characters";
    }
    // A leading hyphen would be parsed as an option by iptables
    if (name.front() == '-') {
        return "Chain name '" + name + "' cannot start with a hyphen";
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return "Chain name '" + name + "' contains invalid characters. "
                   "Only alphanumeric, underscore, hyphen, and dot are allowed.";
        }
    }
    // Built-in names are reserved in every table, not only where the role exists
    for (BuiltinChain role : kAllBuiltinChains) {
        if (name == builtinChainName(role)) {
            return "Chain name '" + name + "' is reserved for a built-in chain";
        }
    }
    return "";
}

} // namespace tproxy
