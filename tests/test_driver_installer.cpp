#include <gtest/gtest.h>

#include "driver/opera_installer.hpp"
#include "testing.hpp"

#include <filesystem>

namespace wdi {
namespace {

using testutil::ArchiveKind;

constexpr const char* kLatestUrl = "https://api.github.com/repos/operasoftware/operachromiumdriver/releases/latest";
constexpr const char* kZipUrl =
    "https://github.com/operasoftware/operachromiumdriver/releases/download/v.114.0.5735.90/operadriver_linux64.zip";

class InstallIfNeededTest : public ::testing::Test {
protected:
    OperaInstaller Make() const {
        InstallerContext ctx;
        ctx.platform = PlatformDescriptor::For(OsFamily::Linux);
        ctx.probe = std::make_shared<PlatformProbe>(runner_);
        ctx.archives = std::make_shared<ArchiveInstaller>(http_);
        return OperaInstaller(std::move(ctx));
    }

    std::string DriverCommand() const { return dir_.Path() + "/operadriver --version"; }

    testutil::TemporaryDirectory dir_;
    std::shared_ptr<testutil::FakeCommandRunner> runner_ = std::make_shared<testutil::FakeCommandRunner>();
    std::shared_ptr<testutil::FakeHttpClient> http_ = std::make_shared<testutil::FakeHttpClient>();
};

TEST_F(InstallIfNeededTest, BrowserMissingSkipsEverything) {
    auto opera = Make();
    InstallOutcome outcome;

    auto res = opera.InstallIfNeeded(dir_.Path(), outcome);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(outcome.status, InstallStatus::BrowserNotFound);
    EXPECT_TRUE(http_->Requests().empty());
}

TEST_F(InstallIfNeededTest, InstallsWhenNoDriverPresent) {
    runner_->Output("opera --version", "114.0.5282.21\n");
    http_->Serve(kLatestUrl, 200, R"({"tag_name":"v.114.0.5735.90"})");
    http_->Serve(kZipUrl, 200, testutil::BuildArchive(ArchiveKind::Zip, {{"operadriver_linux64/operadriver", "bin"}}));
    auto opera = Make();
    InstallOutcome outcome;

    auto res = opera.InstallIfNeeded(dir_.Path(), outcome);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(outcome.status, InstallStatus::Installed);
    EXPECT_EQ(outcome.browser_version, "114.0.5282.21");
    EXPECT_EQ(outcome.driver_version, "114.0.5735.90");
    EXPECT_FALSE(outcome.previous_driver_version.has_value());
    EXPECT_EQ(outcome.artifact_path, dir_.Path() + "/operadriver");
    EXPECT_EQ(testutil::ReadFile(outcome.artifact_path), "bin");
}

TEST_F(InstallIfNeededTest, MatchingDriverIsUpToDate) {
    runner_->Output("opera --version", "114.0.5282.21\n");
    runner_->Output(DriverCommand(), "operadriver 114.0.5735.90 (abcd1234)\n");
    http_->Serve(kLatestUrl, 200, R"({"tag_name":"v.114.0.5735.90"})");
    auto opera = Make();
    InstallOutcome outcome;

    auto res = opera.InstallIfNeeded(dir_.Path(), outcome);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(outcome.status, InstallStatus::UpToDate);
    EXPECT_EQ(outcome.previous_driver_version, "114.0.5735.90");

    const std::vector<std::string> expected = {kLatestUrl};
    EXPECT_EQ(http_->RequestedUrls(), expected);
}

TEST_F(InstallIfNeededTest, OutdatedDriverIsReplaced) {
    testutil::WriteFile(dir_.Path() + "/operadriver", "old", 0755);
    runner_->Output("opera --version", "114.0.5282.21\n");
    runner_->Output(DriverCommand(), "operadriver 113.0.5672.127 (ffff)\n");
    http_->Serve(kLatestUrl, 200, R"({"tag_name":"v.114.0.5735.90"})");
    http_->Serve(kZipUrl, 200, testutil::BuildArchive(ArchiveKind::Zip, {{"operadriver_linux64/operadriver", "new"}}));
    auto opera = Make();
    InstallOutcome outcome;

    auto res = opera.InstallIfNeeded(dir_.Path(), outcome);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(outcome.status, InstallStatus::Installed);
    EXPECT_EQ(outcome.previous_driver_version, "113.0.5672.127");
    EXPECT_EQ(testutil::ReadFile(dir_.Path() + "/operadriver"), "new");
}

TEST_F(InstallIfNeededTest, ResolutionFailurePropagates) {
    runner_->Output("opera --version", "114.0.5282.21\n");
    auto opera = Make();
    InstallOutcome outcome;

    auto res = opera.InstallIfNeeded(dir_.Path(), outcome);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::RemoteResolutionFailure);
    EXPECT_TRUE(std::filesystem::is_empty(dir_.Path()));
}

TEST(InstallStatusTest, Names) {
    EXPECT_STREQ(InstallStatusName(InstallStatus::BrowserNotFound), "browser-not-found");
    EXPECT_STREQ(InstallStatusName(InstallStatus::UpToDate), "up-to-date");
    EXPECT_STREQ(InstallStatusName(InstallStatus::Installed), "installed");
}

} // namespace
} // namespace wdi
