#include "redirect_rules.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>

namespace tproxy {
namespace {

TEST(RedirectRulesTest, ChainNamesUsePrefix) {
    RedirectChainNames names = RedirectChainNames::fromPrefix("KUMA_MESH_");
    EXPECT_EQ(names.inbound, "KUMA_MESH_INBOUND");
    EXPECT_EQ(names.inbound_redirect, "KUMA_MESH_INBOUND_REDIRECT");
    EXPECT_EQ(names.outbound, "KUMA_MESH_OUTBOUND");
    EXPECT_EQ(names.outbound_redirect, "KUMA_MESH_OUTBOUND_REDIRECT");
}

TEST(RedirectRulesTest, DefaultConfiguration) {
    Config config;

    std::string expected =
        "* nat\n"
        "-N MESH_INBOUND\n"
        "-N MESH_INBOUND_REDIRECT\n"
        "-N MESH_OUTBOUND\n"
        "-N MESH_OUTBOUND_REDIRECT\n"
        "-A PREROUTING -p tcp -j MESH_INBOUND\n"
        "-A OUTPUT -p tcp -j MESH_OUTBOUND\n"
        "-A MESH_INBOUND -p tcp -j MESH_INBOUND_REDIRECT\n"
        "-A MESH_INBOUND_REDIRECT -p tcp -j REDIRECT --to-ports 15006\n"
        "-A MESH_OUTBOUND -s 127.0.0.6/32 -o lo -j RETURN\n"
        "-A MESH_OUTBOUND -o lo ! -d 127.0.0.1/32 -m owner --uid-owner 5678 -j MESH_INBOUND_REDIRECT\n"
        "-A MESH_OUTBOUND -o lo -m owner ! --uid-owner 5678 -j RETURN\n"
        "-A MESH_OUTBOUND -m owner --uid-owner 5678 -j RETURN\n"
        "-A MESH_OUTBOUND -d 127.0.0.1/32 -j RETURN\n"
        "-A MESH_OUTBOUND -j MESH_OUTBOUND_REDIRECT\n"
        "-A MESH_OUTBOUND_REDIRECT -p tcp -j REDIRECT --to-ports 15001\n"
        "COMMIT\n";
    EXPECT_EQ(buildRedirectRuleset(config), expected);
}

TEST(RedirectRulesTest, OutboundOnlySkipsInboundChains) {
    Config config;
    config.redirect.inbound.enabled = false;
    config.redirect.outbound.exclude_ports = {22};

    NatTable nat;
    addRedirectRules(nat, config);

    ASSERT_EQ(nat.getCustomChains().size(), 2u);
    EXPECT_EQ(nat.findChain("MESH_INBOUND"), nullptr);
    EXPECT_TRUE(nat.prerouting().empty());

    std::string rendered = nat.build(false);
    EXPECT_NE(rendered.find("-A MESH_OUTBOUND -p tcp --dport 22 -j RETURN\n"), std::string::npos);
    EXPECT_EQ(rendered.find("INBOUND_REDIRECT"), std::string::npos);
}

TEST(RedirectRulesTest, ExcludedInboundPortsReturnEarly) {
    Config config;
    config.redirect.outbound.enabled = false;
    config.redirect.inbound.exclude_ports = {8080, 9090};

    NatTable nat;
    addRedirectRules(nat, config);

    Chain* inbound = nat.findChain("MESH_INBOUND");
    ASSERT_NE(inbound, nullptr);
    std::vector<std::string> expected = {
        "-A MESH_INBOUND -p tcp --dport 8080 -j RETURN",
        "-A MESH_INBOUND -p tcp --dport 9090 -j RETURN",
        "-A MESH_INBOUND -p tcp -j MESH_INBOUND_REDIRECT",
    };
    EXPECT_EQ(inbound->build(false), expected);
    EXPECT_TRUE(nat.output().empty());
}

TEST(RedirectRulesTest, DnsRulesComeFirstInOutput) {
    Config config;
    config.redirect.dns.enabled = true;
    config.redirect.dns.port = 15053;

    NatTable nat;
    addRedirectRules(nat, config);

    std::vector<std::string> expected = {
        "-A OUTPUT -p udp --dport 53 -m owner --uid-owner 5678 -j RETURN",
        "-A OUTPUT -p udp --dport 53 -j REDIRECT --to-ports 15053",
        "-A OUTPUT -p tcp -j MESH_OUTBOUND",
    };
    EXPECT_EQ(nat.output().build(false), expected);
}

TEST(RedirectRulesTest, VerboseOutputCarriesAnnotations) {
    Config config;
    config.verbose = true;

    std::string rendered = buildRedirectRuleset(config);
    EXPECT_NE(rendered.find("# Custom Chains:\n--new-chain MESH_INBOUND\n"), std::string::npos);
    EXPECT_NE(rendered.find("# redirect outbound TCP traffic to the proxy\n"
                            "--append MESH_OUTBOUND_REDIRECT --protocol tcp --jump REDIRECT --to-ports 15001"),
              std::string::npos);
}

TEST(RedirectRulesTest, InvalidConfigurationIsRejected) {
    Config config;
    config.redirect.outbound.port = config.redirect.inbound.port;

    NatTable nat;
    EXPECT_THROW(addRedirectRules(nat, config), std::invalid_argument);
    EXPECT_TRUE(nat.isEmpty());
}

TEST(RedirectRulesTest, ChainClashLeavesTableUnchanged) {
    Config config;
    config.redirect.dns.enabled = true;

    NatTable nat;
    nat.addChain(std::make_unique<Chain>("MESH_OUTBOUND"));
    const std::string before = nat.build(false);

    try {
        addRedirectRules(nat, config);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("MESH_OUTBOUND"), std::string::npos);
    }

    EXPECT_EQ(nat.build(false), before);
    EXPECT_EQ(nat.getCustomChains().size(), 1u);
    EXPECT_TRUE(nat.output().empty());
    EXPECT_TRUE(nat.prerouting().empty());
}

} // namespace
} // namespace tproxy
