/**
 * @file rule.hpp
 * @brief Base rule class for tproxy-compose
 * @author tproxy-compose Development Team
 * @date 2024
 *
 * This file contains the abstract Rule base class. A rule is one immutable
 * line of iptables-restore input owned by a Chain. Concrete rule types
 * (opaque text, append and insert commands) implement the rendering of the
 * rule line; the base class adds the optional annotation line shown in
 * verbose output.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tproxy {

/**
 * @class Rule
 * @brief Abstract base class for all rules
 *
 * Uses the Template Method pattern: build() is implemented here and calls
 * the pure virtual render() of the derived class for the rule line itself.
 * Rules are immutable once constructed and are not validated at this layer.
 */
class Rule {
public:
    /**
     * @brief Virtual destructor for proper cleanup of derived classes
     */
    virtual ~Rule() = default;

    /**
     * @brief Render the lines of this rule for the owning chain
     * @param chain_name Name of the chain that owns the rule
     * @param verbose Whether to render the annotated (verbose) form
     * @return The rule line, preceded by "# <annotation>" in verbose mode
     *         when the rule carries an annotation
     */
    std::vector<std::string> build(const std::string& chain_name, bool verbose) const;

    /**
     * @brief Render the rule line only
     * @param chain_name Name of the chain that owns the rule
     * @param verbose Whether to use long flag spellings
     * @return The single rule line
     */
    virtual std::string render(const std::string& chain_name, bool verbose) const = 0;

    /**
     * @brief Get the annotation shown above the rule in verbose output
     */
    const std::optional<std::string>& getAnnotation() const { return annotation_; }

protected:
    /**
     * @brief Protected constructor for derived classes
     * @param annotation Optional annotation for verbose output
     * @throws std::invalid_argument if the annotation contains a line break
     */
    explicit Rule(std::optional<std::string> annotation = std::nullopt);

    std::optional<std::string> annotation_;  ///< Verbose-only annotation
};

} // namespace tproxy
