#include "flags.hpp"
#include <array>

namespace tproxy {

namespace {

struct Spelling {
    Directive directive;
    const char* compact;
    const char* verbose;
};

constexpr std::array<Spelling, 17> kSpellings = {{
    {Directive::NewChain,        "-N",        "--new-chain"},
    {Directive::Append,          "-A",        "--append"},
    {Directive::Insert,          "-I",        "--insert"},
    {Directive::Jump,            "-j",        "--jump"},
    {Directive::Goto,            "-g",        "--goto"},
    {Directive::Protocol,        "-p",        "--protocol"},
    {Directive::Match,           "-m",        "--match"},
    {Directive::Source,          "-s",        "--source"},
    {Directive::Destination,     "-d",        "--destination"},
    {Directive::InInterface,     "-i",        "--in-interface"},
    {Directive::OutInterface,    "-o",        "--out-interface"},
    {Directive::SourcePort,      "--sport",   "--source-port"},
    {Directive::DestinationPort, "--dport",   "--destination-port"},
    {Directive::UidOwner,        "--uid-owner", "--uid-owner"},
    {Directive::GidOwner,        "--gid-owner", "--gid-owner"},
    {Directive::ToPorts,         "--to-ports",  "--to-ports"},
    {Directive::Comment,         "--comment",   "--comment"},
}};

} // namespace

std::string flagSpelling(Directive directive, bool verbose) {
    for (const auto& spelling : kSpellings) {
        if (spelling.directive == directive) {
            return verbose ? spelling.verbose : spelling.compact;
        }
    }
    // Every enumerator has an entry above
    return "";
}

std::string compactSpellingOf(const std::string& token) {
    for (const auto& spelling : kSpellings) {
        if (token == spelling.verbose) {
            return spelling.compact;
        }
    }
    return token;
}

} // namespace tproxy
