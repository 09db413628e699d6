/**
 * @file table.hpp
 * @brief Tables and their iptables-restore rendering
 * @author tproxy-compose Development Team
 * @date 2024
 *
 * A table owns one chain per fixed built-in role of its type plus the
 * custom chains attached by the caller. Table::build() renders the table
 * block of the iptables-restore input:
 *
 *   * <table>
 *   <custom chain declarations>
 *   <rules of the built-in chains, then of the custom chains>
 *   COMMIT
 *
 * Declarations are grouped in front of every rule so a custom chain is
 * always declared before any rule jumps to it.
 */

#pragma once

#include "chain.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tproxy {

/**
 * @enum TableType
 * @brief Supported iptables tables
 */
enum class TableType {
    Nat,     ///< nat table
    Mangle,  ///< mangle table
    Raw      ///< raw table
};

/**
 * @brief Convert a table type to the name used in the table header
 */
std::string tableName(TableType type);

/**
 * @brief Get the built-in roles of a table type in their fixed order
 */
const std::vector<BuiltinChain>& builtinRoles(TableType type);

/**
 * @class Table
 * @brief Built-in chains of one table plus attached custom chains
 *
 * Built-in chains are created empty with the table and are never removed or
 * reordered. Custom chains are appended in attachment order and owned by
 * the table from then on. build() only reads state, so concurrent builds of
 * an unmodified table are safe.
 */
class Table {
public:
    explicit Table(TableType type);

    Table(Table&&) = default;
    Table& operator=(Table&&) = default;

    TableType getType() const { return type_; }
    std::string getName() const { return tableName(type_); }

    /**
     * @brief Get the built-in chain for a role
     * @throws std::invalid_argument if the table type has no such role
     */
    Chain& builtin(BuiltinChain role);
    const Chain& builtin(BuiltinChain role) const;

    /**
     * @brief Attach a custom chain, taking ownership of it
     * @param chain The chain to attach
     * @return Reference to this table for chaining
     * @throws std::invalid_argument if the chain is null, built-in, or its
     *         name is already attached
     */
    Table& addChain(std::unique_ptr<Chain> chain);

    /**
     * @brief Find an attached custom chain by name
     * @return Pointer to the chain or nullptr if not attached
     */
    Chain* findChain(const std::string& name);

    const std::vector<Chain>& getBuiltinChains() const { return builtin_chains_; }
    const std::vector<std::unique_ptr<Chain>>& getCustomChains() const { return custom_chains_; }

    /**
     * @brief Check whether the table has no rules and no custom chains
     */
    bool isEmpty() const;

    /**
     * @brief Render the table block
     * @param verbose Whether to render the annotated form with section
     *        comments and blank lines between segments
     * @return Table block without a trailing newline
     */
    std::string build(bool verbose) const;

private:
    TableType type_;
    std::vector<Chain> builtin_chains_;                 ///< In fixed role order
    std::vector<std::unique_ptr<Chain>> custom_chains_; ///< In attachment order
};

/**
 * @class NatTable
 * @brief nat table with PREROUTING, INPUT, OUTPUT and POSTROUTING
 */
class NatTable : public Table {
public:
    NatTable() : Table(TableType::Nat) {}

    Chain& prerouting() { return builtin(BuiltinChain::Prerouting); }
    Chain& input() { return builtin(BuiltinChain::Input); }
    Chain& output() { return builtin(BuiltinChain::Output); }
    Chain& postrouting() { return builtin(BuiltinChain::Postrouting); }
};

/**
 * @class MangleTable
 * @brief mangle table with all five built-in chains
 */
class MangleTable : public Table {
public:
    MangleTable() : Table(TableType::Mangle) {}

    Chain& prerouting() { return builtin(BuiltinChain::Prerouting); }
    Chain& input() { return builtin(BuiltinChain::Input); }
    Chain& forward() { return builtin(BuiltinChain::Forward); }
    Chain& output() { return builtin(BuiltinChain::Output); }
    Chain& postrouting() { return builtin(BuiltinChain::Postrouting); }
};

/**
 * @class RawTable
 * @brief raw table with PREROUTING and OUTPUT
 */
class RawTable : public Table {
public:
    RawTable() : Table(TableType::Raw) {}

    Chain& prerouting() { return builtin(BuiltinChain::Prerouting); }
    Chain& output() { return builtin(BuiltinChain::Output); }
};

} // namespace tproxy
