/**
 * @file flags.hpp
 * @brief Flag spellings used when rendering iptables-restore input
 * @author tproxy-compose Development Team
 * @date 2024
 *
 * Every directive the rule construction layer emits has two spellings:
 * the short flag used in compact output and the long flag used in verbose
 * output. The lookup is a pure function of the directive and the mode.
 */

#pragma once

#include <string>

namespace tproxy {

/**
 * @enum Directive
 * @brief Semantic names of the iptables flags used by the rule builders
 */
enum class Directive {
    NewChain,         ///< -N / --new-chain
    Append,           ///< -A / --append
    Insert,           ///< -I / --insert
    Jump,             ///< -j / --jump
    Goto,             ///< -g / --goto
    Protocol,         ///< -p / --protocol
    Match,            ///< -m / --match
    Source,           ///< -s / --source
    Destination,      ///< -d / --destination
    InInterface,      ///< -i / --in-interface
    OutInterface,     ///< -o / --out-interface
    SourcePort,       ///< --sport / --source-port
    DestinationPort,  ///< --dport / --destination-port
    UidOwner,         ///< --uid-owner
    GidOwner,         ///< --gid-owner
    ToPorts,          ///< --to-ports
    Comment           ///< --comment
};

/**
 * @brief Get the spelling of a directive for the given rendering mode
 * @param directive The directive to spell
 * @param verbose true for the long (annotated) form, false for the short form
 * @return Flag text, e.g. "-N" or "--new-chain"
 */
std::string flagSpelling(Directive directive, bool verbose);

/**
 * @brief Map a verbose spelling back to its compact spelling
 * @param token A single whitespace-free token of a rendered line
 * @return The compact spelling if @p token is a known verbose flag,
 *         otherwise @p token unchanged
 */
std::string compactSpellingOf(const std::string& token);

} // namespace tproxy
