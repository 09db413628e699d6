#include "flags.hpp"
#include "parameters.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace tproxy {
namespace {

TEST(FlagSpellingTest, NewChainSpellingDependsOnMode) {
    EXPECT_EQ(flagSpelling(Directive::NewChain, false), "-N");
    EXPECT_EQ(flagSpelling(Directive::NewChain, true), "--new-chain");
}

TEST(FlagSpellingTest, ShortAndLongFlags) {
    EXPECT_EQ(flagSpelling(Directive::Append, false), "-A");
    EXPECT_EQ(flagSpelling(Directive::Append, true), "--append");
    EXPECT_EQ(flagSpelling(Directive::Jump, false), "-j");
    EXPECT_EQ(flagSpelling(Directive::Jump, true), "--jump");
    EXPECT_EQ(flagSpelling(Directive::DestinationPort, false), "--dport");
    EXPECT_EQ(flagSpelling(Directive::DestinationPort, true), "--destination-port");
}

TEST(FlagSpellingTest, MatchOptionsSpellTheSameInBothModes) {
    EXPECT_EQ(flagSpelling(Directive::UidOwner, false), flagSpelling(Directive::UidOwner, true));
    EXPECT_EQ(flagSpelling(Directive::ToPorts, false), "--to-ports");
    EXPECT_EQ(flagSpelling(Directive::ToPorts, true), "--to-ports");
}

TEST(FlagSpellingTest, CompactSpellingOfMapsVerboseFlagsBack) {
    EXPECT_EQ(compactSpellingOf("--new-chain"), "-N");
    EXPECT_EQ(compactSpellingOf("--out-interface"), "-o");
    EXPECT_EQ(compactSpellingOf("--source-port"), "--sport");
    EXPECT_EQ(compactSpellingOf("--source"), "-s");
    EXPECT_EQ(compactSpellingOf("-j"), "-j");
    EXPECT_EQ(compactSpellingOf("MESH_INBOUND"), "MESH_INBOUND");
}

TEST(ParameterTest, RendersFlagValuesAndOptions) {
    Parameter parameter = tcp({destinationPort(8080)});
    EXPECT_EQ(parameter.render(false), "-p tcp --dport 8080");
    EXPECT_EQ(parameter.render(true), "--protocol tcp --destination-port 8080");
}

TEST(ParameterTest, NegationPrecedesTheFlag) {
    EXPECT_EQ(negate(destination("127.0.0.1/32")).render(false), "! -d 127.0.0.1/32");
    EXPECT_EQ(owner({negate(uidOwner("5678"))}).render(false), "-m owner ! --uid-owner 5678");
}

TEST(ParameterTest, RedirectTarget) {
    EXPECT_EQ(jumpRedirect(15001).render(false), "-j REDIRECT --to-ports 15001");
    EXPECT_EQ(jumpRedirect(15001).render(true), "--jump REDIRECT --to-ports 15001");
}

TEST(ParameterTest, CommentIsQuoted) {
    EXPECT_EQ(comment("mesh traffic").render(false), "-m comment --comment \"mesh traffic\"");
}

TEST(ParameterTest, InterfaceAndPortMatches) {
    Parameter in = inInterface("eth0");
    EXPECT_EQ(in.render(false), "-i eth0");
    EXPECT_EQ(in.render(true), "--in-interface eth0");

    Parameter ports = udp({sourcePort(5353)});
    EXPECT_EQ(ports.render(false), "-p udp --sport 5353");
    EXPECT_EQ(ports.render(true), "--protocol udp --source-port 5353");
}

TEST(ParameterTest, GroupOwnerMatch) {
    Parameter group = owner({gidOwner("1337")});
    EXPECT_EQ(group.render(false), "-m owner --gid-owner 1337");
    EXPECT_EQ(group.render(true), "--match owner --gid-owner 1337");
}

TEST(ParameterTest, GotoTarget) {
    EXPECT_EQ(gotoChain("MESH_OUTBOUND").render(false), "-g MESH_OUTBOUND");
    EXPECT_EQ(gotoChain("MESH_OUTBOUND").render(true), "--goto MESH_OUTBOUND");
}

TEST(ParameterTest, CommentRejectsTextThatBreaksTheLine) {
    EXPECT_THROW(comment("say \"hi\""), std::invalid_argument);
    EXPECT_THROW(comment("two\nlines"), std::invalid_argument);
    EXPECT_THROW(comment(std::string(kMaxCommentLength + 1, 'a')), std::invalid_argument);
    EXPECT_NO_THROW(comment(std::string(kMaxCommentLength, 'a')));
}

TEST(ParameterTest, LiteralParameterRendersValuesOnly) {
    Parameter literal(std::vector<std::string>{"--log-prefix", "mesh"});
    EXPECT_FALSE(literal.getDirective().has_value());
    EXPECT_EQ(literal.render(true), "--log-prefix mesh");
}

} // namespace
} // namespace tproxy
