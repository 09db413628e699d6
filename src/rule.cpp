#include "rule.hpp"
#include <stdexcept>
#include <utility>

namespace tproxy {

Rule::Rule(std::optional<std::string> annotation)
    : annotation_(std::move(annotation)) {
    // A line break would end the "# " comment and leak text into the restore input
    if (annotation_ && annotation_->find_first_of("\r\n") != std::string::npos) {
        throw std::invalid_argument("Rule annotation cannot contain line breaks");
    }
}

std::vector<std::string> Rule::build(const std::string& chain_name, bool verbose) const {
    std::vector<std::string> lines;
    if (verbose && annotation_.has_value()) {
        lines.push_back("# " + *annotation_);
    }
    lines.push_back(render(chain_name, verbose));
    return lines;
}

} // namespace tproxy
