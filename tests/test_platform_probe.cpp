#include <gtest/gtest.h>

#include "platform/platform_probe.hpp"
#include "testing.hpp"

namespace wdi {
namespace {

using namespace std::chrono_literals;

TEST(PlatformProbeTest, CommandOutputReturnedVerbatim) {
    auto runner = std::make_shared<testutil::FakeCommandRunner>();
    runner->Output("opera --version", "114.0.5282.21\n");
    PlatformProbe probe(runner);

    std::optional<std::string> out;
    auto res = probe.GetCommandOutputOrNullIfMissing({"opera", "--version"}, out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "114.0.5282.21\n");
}

TEST(PlatformProbeTest, MissingOrFailingCommandIsAbsent) {
    auto runner = std::make_shared<testutil::FakeCommandRunner>();
    runner->Output("opera --version", "boom", 1);
    PlatformProbe probe(runner);

    std::optional<std::string> out = "stale";
    ASSERT_TRUE(probe.GetCommandOutputOrNullIfMissing({"opera", "--version"}, out).is_ok());
    EXPECT_FALSE(out.has_value());

    out = "stale";
    ASSERT_TRUE(probe.GetCommandOutputOrNullIfMissing({"not-installed", "--version"}, out).is_ok());
    EXPECT_FALSE(out.has_value());
}

TEST(PlatformProbeTest, TimeoutPropagatesWithConfiguredBudget) {
    auto runner = std::make_shared<testutil::FakeCommandRunner>();
    runner->Fail("opera --version", Result::Fail(ErrorKind::Timeout, "command timed out"));
    PlatformProbe::Options opt;
    opt.command_timeout = 1234ms;
    PlatformProbe probe(runner, opt);

    std::optional<std::string> out;
    auto res = probe.GetCommandOutputOrNullIfMissing({"opera", "--version"}, out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::Timeout);
    EXPECT_EQ(runner->LastTimeout(), 1234ms);
}

TEST(PlatformProbeTest, MacAppVersionReadsInfoPlist) {
    auto runner = std::make_shared<testutil::FakeCommandRunner>();
    runner->Output("defaults read /Applications/Opera.app/Contents/Info.plist CFBundleShortVersionString",
                   "  114.0.5282.21 \n");
    PlatformProbe probe(runner);

    std::optional<std::string> out;
    ASSERT_TRUE(probe.GetMacAppVersion("Opera", out).is_ok());
    EXPECT_EQ(out, "114.0.5282.21");

    ASSERT_TRUE(probe.GetMacAppVersion("Opera Stable", out).is_ok());
    EXPECT_FALSE(out.has_value());
}

TEST(PlatformProbeTest, WindowsExeVersionQuotesPathForPowerShell) {
    auto runner = std::make_shared<testutil::FakeCommandRunner>();
    runner->Output(
        "powershell -NoProfile -NonInteractive -Command "
        "(Get-Item 'C:\\Program Files\\Opera\\opera.exe' -ErrorAction Stop).VersionInfo.ProductVersion",
        "114.0.5282.21\r\n");
    PlatformProbe probe(runner);

    std::optional<std::string> out;
    ASSERT_TRUE(probe.GetWindowsExeVersion("C:\\Program Files\\Opera\\opera.exe", out).is_ok());
    EXPECT_EQ(out, "114.0.5282.21");
}

TEST(PlatformProbeTest, WindowsBareNameResolvedThroughPath) {
    auto runner = std::make_shared<testutil::FakeCommandRunner>();
    PlatformProbe probe(runner);

    std::optional<std::string> out;
    ASSERT_TRUE(probe.GetWindowsExeVersion("opera.exe", out).is_ok());
    EXPECT_FALSE(out.has_value());

    const auto calls = runner->Calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_NE(calls[0].find("(Get-Command 'opera.exe' -ErrorAction Stop).Source"), std::string::npos);
}

TEST(PlatformProbeTest, EmptyVersionResourceIsAbsent) {
    auto runner = std::make_shared<testutil::FakeCommandRunner>();
    runner->Output(
        "powershell -NoProfile -NonInteractive -Command "
        "(Get-Item 'C:\\x\\opera.exe' -ErrorAction Stop).VersionInfo.ProductVersion",
        "\r\n");
    PlatformProbe probe(runner);

    std::optional<std::string> out;
    ASSERT_TRUE(probe.GetWindowsExeVersion("C:\\x\\opera.exe", out).is_ok());
    EXPECT_FALSE(out.has_value());
}

} // namespace
} // namespace wdi
