#include "parameters.hpp"
#include <stdexcept>
#include <sstream>
#include <utility>

namespace tproxy {

Parameter::Parameter(Directive directive,
                     std::vector<std::string> values,
                     std::vector<Parameter> options)
    : directive_(directive)
    , values_(std::move(values))
    , options_(std::move(options)) {}

Parameter::Parameter(std::vector<std::string> values)
    : values_(std::move(values)) {}

std::string Parameter::render(bool verbose) const {
    std::ostringstream out;
    bool first = true;
    auto put = [&out, &first](const std::string& token) {
        if (token.empty()) {
            return;
        }
        if (!first) out << " ";
        out << token;
        first = false;
    };

    if (negated_) {
        put("!");
    }
    if (directive_.has_value()) {
        put(flagSpelling(*directive_, verbose));
    }
    for (const auto& value : values_) {
        put(value);
    }
    for (const auto& option : options_) {
        put(option.render(verbose));
    }
    return out.str();
}

Parameter Parameter::negated() const {
    Parameter copy = *this;
    copy.negated_ = true;
    return copy;
}

Parameter protocol(const std::string& name, std::vector<Parameter> options) {
    return Parameter(Directive::Protocol, {name}, std::move(options));
}

Parameter tcp(std::vector<Parameter> options) {
    return protocol("tcp", std::move(options));
}

Parameter udp(std::vector<Parameter> options) {
    return protocol("udp", std::move(options));
}

Parameter sourcePort(uint16_t port) {
    return Parameter(Directive::SourcePort, {std::to_string(port)});
}

Parameter destinationPort(uint16_t port) {
    return Parameter(Directive::DestinationPort, {std::to_string(port)});
}

Parameter source(const std::string& address) {
    return Parameter(Directive::Source, {address});
}

Parameter destination(const std::string& address) {
    return Parameter(Directive::Destination, {address});
}

Parameter inInterface(const std::string& name) {
    return Parameter(Directive::InInterface, {name});
}

Parameter outInterface(const std::string& name) {
    return Parameter(Directive::OutInterface, {name});
}

Parameter match(const std::string& module, std::vector<Parameter> options) {
    return Parameter(Directive::Match, {module}, std::move(options));
}

Parameter owner(std::vector<Parameter> options) {
    return match("owner", std::move(options));
}

Parameter uidOwner(const std::string& uid) {
    return Parameter(Directive::UidOwner, {uid});
}

Parameter gidOwner(const std::string& gid) {
    return Parameter(Directive::GidOwner, {gid});
}

Parameter comment(const std::string& text) {
    // The text is emitted inside double quotes on a single restore line
    if (text.find_first_of("\"\r\n") != std::string::npos) {
        throw std::invalid_argument("Comment cannot contain double quotes or line breaks: " + text);
    }
    if (text.size() > kMaxCommentLength) {
        throw std::invalid_argument("Comment longer than " + std::to_string(kMaxCommentLength) +
                                    " characters");
    }
    return match("comment", {Parameter(Directive::Comment, {"\"" + text + "\""})});
}

Parameter jump(const std::string& target, std::vector<Parameter> options) {
    return Parameter(Directive::Jump, {target}, std::move(options));
}

Parameter jumpReturn() {
    return jump("RETURN");
}

Parameter jumpRedirect(uint16_t port) {
    return jump("REDIRECT", {toPorts(port)});
}

Parameter gotoChain(const std::string& chain) {
    return Parameter(Directive::Goto, {chain});
}

Parameter toPorts(uint16_t port) {
    return Parameter(Directive::ToPorts, {std::to_string(port)});
}

Parameter negate(const Parameter& parameter) {
    return parameter.negated();
}

} // namespace tproxy
