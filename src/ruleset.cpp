#include "ruleset.hpp"
#include <vector>

namespace tproxy {

std::string RulesetBuilder::build(bool verbose) const {
    std::vector<const Table*> tables = {&raw_, &mangle_, &nat_};
    const std::string separator = verbose ? "\n\n" : "\n";

    std::string ruleset;
    for (const Table* table : tables) {
        if (table->isEmpty()) {
            continue;
        }
        if (!ruleset.empty()) {
            ruleset += separator;
        }
        ruleset += table->build(verbose);
    }

    if (!ruleset.empty()) {
        ruleset += "\n";
    }
    return ruleset;
}

} // namespace tproxy
