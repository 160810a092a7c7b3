#include <gtest/gtest.h>

#include "driver/version_probe.hpp"

namespace wdi {
namespace {

VersionProbe Yields(std::optional<std::string> v, int* calls) {
    return [v, calls](std::optional<std::string>& out) {
        ++*calls;
        out = v;
        return Result::Ok();
    };
}

TEST(VersionProbeTest, StopsAtFirstHit) {
    int a = 0, b = 0, c = 0;
    std::optional<std::string> out;

    auto res = FirstAvailableVersion({Yields(std::nullopt, &a), Yields("1.0", &b), Yields("2.0", &c)}, out);
    ASSERT_TRUE(res.is_ok());
    EXPECT_EQ(out, "1.0");
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 1);
    EXPECT_EQ(c, 0);
}

TEST(VersionProbeTest, AllAbsentYieldsAbsent) {
    int a = 0;
    std::optional<std::string> out = "stale";
    ASSERT_TRUE(FirstAvailableVersion({Yields(std::nullopt, &a), Yields(std::nullopt, &a)}, out).is_ok());
    EXPECT_FALSE(out.has_value());
    EXPECT_EQ(a, 2);

    ASSERT_TRUE(FirstAvailableVersion({}, out).is_ok());
    EXPECT_FALSE(out.has_value());
}

TEST(VersionProbeTest, FailureStopsChain) {
    int after = 0;
    std::vector<VersionProbe> probes;
    probes.emplace_back([](std::optional<std::string>&) {
        return Result::Fail(ErrorKind::Timeout, "timed out");
    });
    probes.push_back(Yields("1.0", &after));

    std::optional<std::string> out;
    auto res = FirstAvailableVersion(probes, out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::Timeout);
    EXPECT_EQ(after, 0);
    EXPECT_FALSE(out.has_value());
}

} // namespace
} // namespace wdi
