#pragma once

#include "table.hpp"
#include <string>

namespace tproxy {

/**
 * @brief Complete iptables-restore input made of the raw, mangle and nat tables
 *
 * Empty tables are left out. Table blocks are separated by a newline in
 * compact mode and by a blank line in verbose mode, and the result ends with
 * a newline as iptables-restore expects. A ruleset with only empty tables
 * renders as the empty string.
 */
class RulesetBuilder {
public:
    RawTable& raw() { return raw_; }
    MangleTable& mangle() { return mangle_; }
    NatTable& nat() { return nat_; }

    const RawTable& raw() const { return raw_; }
    const MangleTable& mangle() const { return mangle_; }
    const NatTable& nat() const { return nat_; }

    std::string build(bool verbose) const;

private:
    RawTable raw_;
    MangleTable mangle_;
    NatTable nat_;
};

} // namespace tproxy
