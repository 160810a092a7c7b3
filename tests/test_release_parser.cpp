#include <gtest/gtest.h>

#include "installer/release_parser.hpp"

namespace wdi {

TEST(ReleaseParserTest, ReturnsTagName) {
    auto tag = ParseLatestReleaseTag(R"({"tag_name":"v.114.0.5735.90","name":"114"})");
    ASSERT_TRUE(tag.has_value()) << tag.error();
    EXPECT_EQ(*tag, "v.114.0.5735.90");
}

TEST(ReleaseParserTest, RejectsMissingOrEmptyTag) {
    EXPECT_FALSE(ParseLatestReleaseTag(R"({"name":"x"})").has_value());
    EXPECT_FALSE(ParseLatestReleaseTag(R"({"tag_name":""})").has_value());
    EXPECT_FALSE(ParseLatestReleaseTag(R"({"tag_name":12})").has_value());
}

TEST(ReleaseParserTest, RejectsMalformedInput) {
    EXPECT_FALSE(ParseLatestReleaseTag("").has_value());
    EXPECT_FALSE(ParseLatestReleaseTag("[1,2]").has_value());

    auto bad = ParseLatestReleaseTag("{not json");
    ASSERT_FALSE(bad.has_value());
    EXPECT_NE(bad.error().find("JSON parse error"), std::string::npos);
}

} // namespace wdi
