#include "redirect_rules.hpp"
#include "logger.hpp"
#include "parameters.hpp"
#include <memory>
#include <stdexcept>
#include <vector>

namespace tproxy {

namespace {

void addInboundChains(NatTable& nat, const Config& config, const RedirectChainNames& names) {
    const TrafficFlowConfig& inbound = config.redirect.inbound;

    // Excluded ports return to PREROUTING before the redirect
    auto chain = std::make_unique<Chain>(names.inbound);
    for (uint16_t port : inbound.exclude_ports) {
        chain->append({tcp({destinationPort(port)}), jumpReturn()},
                      "inbound port " + std::to_string(port) + " bypasses the proxy");
    }
    chain->append({tcp(), jump(names.inbound_redirect)});

    auto redirect = std::make_unique<Chain>(names.inbound_redirect);
    redirect->append({tcp(), jumpRedirect(inbound.port)},
                     "redirect inbound TCP traffic to the proxy");

    nat.addChain(std::move(chain));
    nat.addChain(std::move(redirect));

    // Attach the chains first, then send all inbound TCP through them
    nat.prerouting().append({tcp(), jump(names.inbound)});
}

void addOutboundChains(NatTable& nat, const Config& config, const RedirectChainNames& names) {
    const TrafficFlowConfig& outbound = config.redirect.outbound;
    const std::string& uid = config.owner_uid;

    auto chain = std::make_unique<Chain>(names.outbound);
    chain->append({source(kInboundPassthroughSource), outInterface(kLoopbackInterface), jumpReturn()},
                  "traffic the proxy passes through to the application");
    for (uint16_t port : outbound.exclude_ports) {
        chain->append({tcp({destinationPort(port)}), jumpReturn()},
                      "outbound port " + std::to_string(port) + " bypasses the proxy");
    }
    if (config.redirect.inbound.enabled) {
        // The proxy talking to a pod address over loopback is inbound traffic
        chain->append({outInterface(kLoopbackInterface),
                       negate(destination(kLocalhost)),
                       owner({uidOwner(uid)}),
                       jump(names.inbound_redirect)});
    }
    // Loopback traffic of other users stays local
    chain->append({outInterface(kLoopbackInterface), owner({negate(uidOwner(uid))}), jumpReturn()});
    chain->append({owner({uidOwner(uid)}), jumpReturn()},
                  "traffic generated by the proxy itself");
    chain->append({destination(kLocalhost), jumpReturn()});
    chain->append({jump(names.outbound_redirect)});

    auto redirect = std::make_unique<Chain>(names.outbound_redirect);
    redirect->append({tcp(), jumpRedirect(outbound.port)},
                     "redirect outbound TCP traffic to the proxy");

    nat.addChain(std::move(chain));
    nat.addChain(std::move(redirect));

    nat.output().append({tcp(), jump(names.outbound)});
}

void addDnsRules(NatTable& nat, const Config& config) {
    const std::string& uid = config.owner_uid;

    nat.output().append({udp({destinationPort(kDnsPort)}), owner({uidOwner(uid)}), jumpReturn()},
                        "DNS queries of the proxy itself");
    nat.output().append({udp({destinationPort(kDnsPort)}), jumpRedirect(config.redirect.dns.port)},
                        "redirect DNS queries to the DNS proxy");
}

} // namespace

RedirectChainNames RedirectChainNames::fromPrefix(const std::string& prefix) {
    return RedirectChainNames{
        prefix + "INBOUND",
        prefix + "INBOUND_REDIRECT",
        prefix + "OUTBOUND",
        prefix + "OUTBOUND_REDIRECT",
    };
}

void addRedirectRules(NatTable& nat, const Config& config) {
    if (!config.isValid()) {
        throw std::invalid_argument("Invalid configuration: " + config.getErrorMessage());
    }

    const RedirectChainNames names = RedirectChainNames::fromPrefix(config.redirect.chain_prefix);

    // Reject name clashes before touching the table so a failure leaves it unchanged
    std::vector<std::string> chain_names;
    if (config.redirect.inbound.enabled) {
        chain_names.push_back(names.inbound);
        chain_names.push_back(names.inbound_redirect);
    }
    if (config.redirect.outbound.enabled) {
        chain_names.push_back(names.outbound);
        chain_names.push_back(names.outbound_redirect);
    }
    for (const auto& name : chain_names) {
        if (nat.findChain(name) != nullptr) {
            throw std::invalid_argument("Chain '" + name + "' is already attached to table '" +
                                        nat.getName() + "'");
        }
    }

    // DNS rules go first so they are evaluated before the outbound jump in OUTPUT
    if (config.redirect.dns.enabled) {
        addDnsRules(nat, config);
    }
    if (config.redirect.inbound.enabled) {
        addInboundChains(nat, config, names);
    }
    if (config.redirect.outbound.enabled) {
        addOutboundChains(nat, config, names);
    }

    Logger::debug("RedirectRules", "Added redirect rules with chain prefix '" +
                  config.redirect.chain_prefix + "'");
}

std::string buildRedirectRuleset(const Config& config) {
    RulesetBuilder ruleset;
    addRedirectRules(ruleset.nat(), config);
    return ruleset.build(config.verbose);
}

} // namespace tproxy
