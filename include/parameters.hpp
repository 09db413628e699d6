/**
 * @file parameters.hpp
 * @brief Rule parameters and the helpers that construct them
 * @author tproxy-compose Development Team
 * @date 2024
 *
 * A Parameter is one flag of an iptables rule together with its values and
 * the options that belong to it (e.g. "-p tcp --dport 80" or
 * "-m owner ! --uid-owner 5678"). Parameters render differently in compact
 * and verbose mode only through the flag spelling.
 */

#pragma once

#include "flags.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tproxy {

/**
 * @class Parameter
 * @brief A single flag with its values and nested options
 *
 * Rendered as "[! ]<flag> <values...> <options...>". A parameter without a
 * directive renders only its values, which allows literal tokens such as
 * target names that take no flag of their own.
 */
class Parameter {
public:
    /**
     * @brief Construct a flagged parameter
     * @param directive Flag to render in front of the values
     * @param values Value tokens following the flag
     * @param options Parameters that belong to this one (match options)
     */
    Parameter(Directive directive,
              std::vector<std::string> values,
              std::vector<Parameter> options = {});

    /**
     * @brief Construct a literal parameter rendered as its values only
     * @param values Value tokens
     */
    explicit Parameter(std::vector<std::string> values);

    /**
     * @brief Render the parameter for the given mode
     * @param verbose Whether to use long flag spellings
     * @return Space separated parameter text
     */
    std::string render(bool verbose) const;

    /**
     * @brief Get a copy of this parameter with the negation marker set
     */
    Parameter negated() const;

    bool isNegated() const { return negated_; }
    const std::optional<Directive>& getDirective() const { return directive_; }
    const std::vector<std::string>& getValues() const { return values_; }
    const std::vector<Parameter>& getOptions() const { return options_; }

private:
    std::optional<Directive> directive_;
    std::vector<std::string> values_;
    std::vector<Parameter> options_;
    bool negated_ = false;
};

// Protocol matches ("-p tcp" with optional port options)
Parameter protocol(const std::string& name, std::vector<Parameter> options = {});
Parameter tcp(std::vector<Parameter> options = {});
Parameter udp(std::vector<Parameter> options = {});
Parameter sourcePort(uint16_t port);
Parameter destinationPort(uint16_t port);

// Address and interface matches
Parameter source(const std::string& address);
Parameter destination(const std::string& address);
Parameter inInterface(const std::string& name);
Parameter outInterface(const std::string& name);

/// Longest text the comment match accepts (XT_MAX_COMMENT_LEN - 1)
constexpr std::size_t kMaxCommentLength = 255;

// Match extensions
Parameter match(const std::string& module, std::vector<Parameter> options = {});
Parameter owner(std::vector<Parameter> options);
Parameter uidOwner(const std::string& uid);
Parameter gidOwner(const std::string& gid);

/**
 * @brief Attach a comment to the rule using the comment match
 * @param text Comment text, quoted in the rendered output
 * @throws std::invalid_argument if the text contains a double quote or a
 *         line break, or is longer than kMaxCommentLength
 */
Parameter comment(const std::string& text);

// Targets
Parameter jump(const std::string& target, std::vector<Parameter> options = {});
Parameter jumpReturn();
Parameter jumpRedirect(uint16_t port);
Parameter gotoChain(const std::string& chain);
Parameter toPorts(uint16_t port);

/**
 * @brief Negate a parameter ("! -d 127.0.0.1/32")
 */
Parameter negate(const Parameter& parameter);

} // namespace tproxy
