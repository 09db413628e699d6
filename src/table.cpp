#include "table.hpp"
#include "flags.hpp"
#include <stdexcept>
#include <utility>

namespace tproxy {

namespace {

std::string join(const std::vector<std::string>& lines, const std::string& separator) {
    std::string joined;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) joined += separator;
        joined += lines[i];
    }
    return joined;
}

} // namespace

std::string tableName(TableType type) {
    switch (type) {
        case TableType::Nat:
            return "nat";
        case TableType::Mangle:
            return "mangle";
        case TableType::Raw:
            return "raw";
        default:
            throw std::runtime_error("Unknown table type");
    }
}

const std::vector<BuiltinChain>& builtinRoles(TableType type) {
    static const std::vector<BuiltinChain> nat = {
        BuiltinChain::Prerouting, BuiltinChain::Input,
        BuiltinChain::Output, BuiltinChain::Postrouting};
    static const std::vector<BuiltinChain> mangle = {
        BuiltinChain::Prerouting, BuiltinChain::Input, BuiltinChain::Forward,
        BuiltinChain::Output, BuiltinChain::Postrouting};
    static const std::vector<BuiltinChain> raw = {
        BuiltinChain::Prerouting, BuiltinChain::Output};

    switch (type) {
        case TableType::Nat:
            return nat;
        case TableType::Mangle:
            return mangle;
        case TableType::Raw:
            return raw;
        default:
            throw std::runtime_error("Unknown table type");
    }
}

Table::Table(TableType type)
    : type_(type) {
    for (BuiltinChain role : builtinRoles(type_)) {
        builtin_chains_.emplace_back(role);
    }
}

// Non-const overload reuses the const lookup
Chain& Table::builtin(BuiltinChain role) {
    return const_cast<Chain&>(static_cast<const Table&>(*this).builtin(role));
}

const Chain& Table::builtin(BuiltinChain role) const {
    for (const auto& chain : builtin_chains_) {
        if (std::get<BuiltinChain>(chain.getId()) == role) {
            return chain;
        }
    }
    throw std::invalid_argument("Table '" + getName() + "' has no built-in chain " +
                                builtinChainName(role));
}

Table& Table::addChain(std::unique_ptr<Chain> chain) {
    if (!chain) {
        throw std::invalid_argument("Cannot attach a null chain to table '" + getName() + "'");
    }
    if (chain->isBuiltin()) {
        throw std::invalid_argument("Built-in chain " + chain->getName() +
                                    " cannot be attached as a custom chain");
    }
    if (findChain(chain->getName()) != nullptr) {
        throw std::invalid_argument("Chain '" + chain->getName() +
                                    "' is already attached to table '" + getName() + "'");
    }
    custom_chains_.push_back(std::move(chain));
    return *this;
}

Chain* Table::findChain(const std::string& name) {
    for (auto& chain : custom_chains_) {
        if (chain->getName() == name) {
            return chain.get();
        }
    }
    return nullptr;
}

bool Table::isEmpty() const {
    if (!custom_chains_.empty()) {
        return false;
    }
    for (const auto& chain : builtin_chains_) {
        if (!chain.empty()) {
            return false;
        }
    }
    return true;
}

std::string Table::build(bool verbose) const {
    const std::string table_line = "* " + getName();
    std::vector<std::string> new_chain_lines;
    std::vector<std::string> rule_lines;

    // Built-in chains contribute rules only, in their fixed role order
    for (const auto& chain : builtin_chains_) {
        std::vector<std::string> rules = chain.build(verbose);
        rule_lines.insert(rule_lines.end(), rules.begin(), rules.end());
    }

    // Custom chains are declared and contribute rules, in attachment order
    for (const auto& chain : custom_chains_) {
        new_chain_lines.push_back(flagSpelling(Directive::NewChain, verbose) + " " +
                                  chain->getName());
        std::vector<std::string> rules = chain->build(verbose);
        rule_lines.insert(rule_lines.end(), rules.begin(), rules.end());
    }

    // Section headers only for non-empty groups
    if (verbose) {
        if (!new_chain_lines.empty()) {
            new_chain_lines.insert(new_chain_lines.begin(), "# Custom Chains:");
        }
        if (!rule_lines.empty()) {
            rule_lines.insert(rule_lines.begin(), "# Rules:");
        }
    }

    // Header, declarations, rules, COMMIT; empty segments are dropped so no
    // stray separators appear
    std::vector<std::string> segments = {table_line};

    std::string new_chains = join(new_chain_lines, "\n");
    if (!new_chains.empty()) {
        segments.push_back(new_chains);
    }

    std::string rules = join(rule_lines, "\n");
    if (!rules.empty()) {
        segments.push_back(rules);
    }

    segments.push_back("COMMIT");

    // Verbose output separates segments with a blank line
    return join(segments, verbose ? "\n\n" : "\n");
}

} // namespace tproxy
