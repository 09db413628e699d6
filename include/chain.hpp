/**
 * @file chain.hpp
 * @brief Built-in and custom chains
 * @author tproxy-compose Development Team
 * @date 2024
 *
 * A chain is an ordered, named collection of rules. Its identity is either
 * one of the fixed built-in roles of a table or a custom name that has to
 * be declared in the restore input before it is used.
 */

#pragma once

#include "parameters.hpp"
#include "rule.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace tproxy {

/**
 * @enum BuiltinChain
 * @brief Fixed entry chains of the iptables tables
 */
enum class BuiltinChain {
    Prerouting,   ///< PREROUTING
    Input,        ///< INPUT
    Forward,      ///< FORWARD
    Output,       ///< OUTPUT
    Postrouting   ///< POSTROUTING
};

/**
 * @brief Convert a built-in role to its iptables chain name
 */
std::string builtinChainName(BuiltinChain role);

/**
 * @struct CustomChainName
 * @brief Name of a user-defined chain
 */
struct CustomChainName {
    std::string value;
};

/// Chain identity: a built-in role or a custom name
using ChainId = std::variant<BuiltinChain, CustomChainName>;

/**
 * @class Chain
 * @brief Ordered collection of rules rendered under one chain name
 *
 * The built-in/custom classification is fixed at construction. Rules are
 * only ever appended and keep their insertion order in the output.
 */
class Chain {
public:
    /**
     * @brief Construct a built-in chain for a table role
     */
    explicit Chain(BuiltinChain role);

    /**
     * @brief Construct a custom chain
     * @param name Chain name
     * @throws std::invalid_argument if the name is not a valid custom chain name
     */
    explicit Chain(const std::string& name);

    Chain(Chain&&) = default;
    Chain& operator=(Chain&&) = default;

    const ChainId& getId() const { return id_; }

    /**
     * @brief Get the chain name used for rule lines and declarations
     */
    std::string getName() const;

    bool isBuiltin() const { return std::holds_alternative<BuiltinChain>(id_); }

    /**
     * @brief Append a rule, taking ownership of it
     * @return Reference to this chain for chaining
     */
    Chain& addRule(std::unique_ptr<Rule> rule);

    /**
     * @brief Append an "-A <chain> <parameters>" rule
     */
    Chain& append(std::vector<Parameter> parameters,
                  std::optional<std::string> annotation = std::nullopt);

    /**
     * @brief Append an "-I <chain> <position> <parameters>" rule
     * @throws std::invalid_argument if position is 0
     */
    Chain& insert(std::size_t position,
                  std::vector<Parameter> parameters,
                  std::optional<std::string> annotation = std::nullopt);

    /**
     * @brief Append an opaque text rule emitted verbatim
     */
    Chain& appendText(const std::string& text);

    std::size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

    /**
     * @brief Render all rules in insertion order
     * @param verbose Whether to render the annotated form
     * @return Rendered lines, possibly more than one per rule in verbose mode
     */
    std::vector<std::string> build(bool verbose) const;

    /**
     * @brief Check whether a name is acceptable for a custom chain
     *
     * Names must be 1-29 characters of alphanumerics, '_', '-' or '.', must
     * not start with '-' and must not be a built-in chain name.
     */
    static bool isValidCustomName(const std::string& name);

    /**
     * @brief Get the reason a custom chain name is rejected
     * @return Error description or empty string if the name is valid
     */
    static std::string getNameValidationError(const std::string& name);

private:
    ChainId id_;
    std::vector<std::unique_ptr<Rule>> rules_;
};

} // namespace tproxy
