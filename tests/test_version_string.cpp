#include <gtest/gtest.h>

#include "util/version_string.hpp"

namespace wdi {

TEST(VersionStringTest, TrimWhitespace) {
    EXPECT_EQ(TrimWhitespace("  114.0.5735.90\n"), "114.0.5735.90");
    EXPECT_EQ(TrimWhitespace("\t \n"), "");
}

TEST(VersionStringTest, NthTokenAndLastToken) {
    const std::string out = "operadriver 114.0.5735.90 (abc)\n";
    EXPECT_EQ(NthToken(out, 0), "operadriver");
    EXPECT_EQ(NthToken(out, 1), "114.0.5735.90");
    EXPECT_FALSE(NthToken("operadriver\n", 1).has_value());
    EXPECT_FALSE(NthToken("   ", 0).has_value());

    EXPECT_EQ(LastToken("Mozilla Firefox 115.0.2\n"), "115.0.2");
    EXPECT_FALSE(LastToken("").has_value());
}

TEST(VersionStringTest, StripTagPrefix) {
    EXPECT_EQ(StripTagPrefix("v.114.0.5735.90"), "114.0.5735.90");
    EXPECT_EQ(StripTagPrefix("v0.34.0"), "0.34.0");
    EXPECT_EQ(StripTagPrefix("1.2.3"), "1.2.3");
    EXPECT_EQ(StripTagPrefix("v."), "");
}

} // namespace wdi
