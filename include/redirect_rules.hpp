/**
 * @file redirect_rules.hpp
 * @brief nat table rules redirecting pod traffic to the local proxy
 * @author tproxy-compose Development Team
 * @date 2024
 *
 * Builds the custom chains <prefix>INBOUND, <prefix>INBOUND_REDIRECT,
 * <prefix>OUTBOUND and <prefix>OUTBOUND_REDIRECT and the jumps from the
 * built-in PREROUTING and OUTPUT chains into them. Traffic generated by the
 * proxy itself (identified by its owner UID) is never redirected again.
 */

#pragma once

#include "config.hpp"
#include "ruleset.hpp"
#include <string>

namespace tproxy {

/// Address the proxy uses as source for traffic it passes through to the application
constexpr const char* kInboundPassthroughSource = "127.0.0.6/32";
constexpr const char* kLocalhost = "127.0.0.1/32";
constexpr const char* kLoopbackInterface = "lo";
constexpr uint16_t kDnsPort = 53;

/**
 * @struct RedirectChainNames
 * @brief Names of the custom chains derived from the configured prefix
 */
struct RedirectChainNames {
    std::string inbound;
    std::string inbound_redirect;
    std::string outbound;
    std::string outbound_redirect;

    static RedirectChainNames fromPrefix(const std::string& prefix);
};

/**
 * @brief Add the redirect rules for a configuration to a nat table
 * @param nat Table to populate
 * @param config Validated configuration
 * @throws std::invalid_argument if the configuration is invalid or one of
 *         the custom chains is already attached to @p nat
 */
void addRedirectRules(NatTable& nat, const Config& config);

/**
 * @brief Build the complete iptables-restore input for a configuration
 * @param config Configuration; config.verbose selects the rendering mode
 * @return Restore input ending with a newline
 * @throws std::invalid_argument if the configuration is invalid
 */
std::string buildRedirectRuleset(const Config& config);

} // namespace tproxy
