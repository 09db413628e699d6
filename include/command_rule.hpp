/**
 * @file command_rule.hpp
 * @brief Append and insert rules built from parameters
 * @author tproxy-compose Development Team
 * @date 2024
 */

#pragma once

#include "parameters.hpp"
#include "rule.hpp"
#include <cstddef>

namespace tproxy {

/**
 * @class CommandRule
 * @brief Common base for rules rendered as "<command> <chain> ... <parameters>"
 */
class CommandRule : public Rule {
public:
    const std::vector<Parameter>& getParameters() const { return parameters_; }

protected:
    CommandRule(std::vector<Parameter> parameters,
                std::optional<std::string> annotation);

    /**
     * @brief Render the parameter list, each preceded by a space
     * @param verbose Whether to use long flag spellings
     */
    std::string renderParameters(bool verbose) const;

    std::vector<Parameter> parameters_;  ///< Ordered rule parameters
};

/**
 * @class AppendRule
 * @brief "-A CHAIN <parameters>" rule
 */
class AppendRule : public CommandRule {
public:
    explicit AppendRule(std::vector<Parameter> parameters,
                        std::optional<std::string> annotation = std::nullopt);

    std::string render(const std::string& chain_name, bool verbose) const override;
};

/**
 * @class InsertRule
 * @brief "-I CHAIN <position> <parameters>" rule
 */
class InsertRule : public CommandRule {
public:
    /**
     * @brief Construct an insert rule
     * @param position 1-based position in the chain
     * @param parameters Ordered rule parameters
     * @param annotation Optional annotation for verbose output
     * @throws std::invalid_argument if position is 0
     */
    InsertRule(std::size_t position,
               std::vector<Parameter> parameters,
               std::optional<std::string> annotation = std::nullopt);

    std::string render(const std::string& chain_name, bool verbose) const override;

    std::size_t getPosition() const { return position_; }

private:
    std::size_t position_;
};

} // namespace tproxy
