#include "ruleset.hpp"
#include <gtest/gtest.h>

namespace tproxy {
namespace {

TEST(RulesetBuilderTest, EmptyRulesetRendersNothing) {
    RulesetBuilder ruleset;
    EXPECT_EQ(ruleset.build(false), "");
    EXPECT_EQ(ruleset.build(true), "");
}

TEST(RulesetBuilderTest, EmptyTablesAreSkipped) {
    RulesetBuilder ruleset;
    ruleset.nat().output().appendText("-A OUTPUT -j RETURN");

    EXPECT_EQ(ruleset.build(false), "* nat\n-A OUTPUT -j RETURN\nCOMMIT\n");
}

TEST(RulesetBuilderTest, TablesRenderInFixedOrder) {
    RulesetBuilder ruleset;
    ruleset.nat().output().appendText("-A OUTPUT -j RETURN");
    ruleset.raw().prerouting().appendText("-A PREROUTING -j NOTRACK");
    ruleset.mangle().forward().appendText("-A FORWARD -j ACCEPT");

    std::string expected =
        "* raw\n-A PREROUTING -j NOTRACK\nCOMMIT\n"
        "* mangle\n-A FORWARD -j ACCEPT\nCOMMIT\n"
        "* nat\n-A OUTPUT -j RETURN\nCOMMIT\n";
    EXPECT_EQ(ruleset.build(false), expected);
}

TEST(RulesetBuilderTest, VerboseTablesAreSeparatedByBlankLine) {
    RulesetBuilder ruleset;
    ruleset.raw().output().appendText("-A OUTPUT -j NOTRACK");
    ruleset.nat().output().appendText("-A OUTPUT -j RETURN");

    std::string expected =
        "* raw\n\n# Rules:\n-A OUTPUT -j NOTRACK\n\nCOMMIT\n\n"
        "* nat\n\n# Rules:\n-A OUTPUT -j RETURN\n\nCOMMIT\n";
    EXPECT_EQ(ruleset.build(true), expected);
}

} // namespace
} // namespace tproxy
