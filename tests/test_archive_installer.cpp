#include <gtest/gtest.h>

#include "installer/archive_installer.hpp"
#include "testing.hpp"

#include <filesystem>
#include <sys/stat.h>

namespace wdi {
namespace {

using testutil::ArchiveKind;

constexpr const char* kLatestUrl = "https://api.github.com/repos/operasoftware/operachromiumdriver/releases/latest";
constexpr const char* kZipUrl =
    "https://github.com/operasoftware/operachromiumdriver/releases/download/v.114.0.5735.90/operadriver_linux64.zip";

class RecordingProgress final : public IProgress {
public:
    void OnProgress(const ProgressEvent& e) override {
        ++events;
        last_component = std::string(e.component);
    }
    int events = 0;
    std::string last_component;
};

TEST(ArchiveInstallerTest, FetchLatestTagSendsGitHubHeaders) {
    auto http = std::make_shared<testutil::FakeHttpClient>();
    http->Serve(kLatestUrl, 200, R"({"tag_name":"v.114.0.5735.90"})");

    ArchiveInstaller::Options opt;
    opt.github_token = "secret";
    ArchiveInstaller installer(http, opt);

    std::string tag;
    auto res = installer.FetchLatestGitHubTag("operasoftware/operachromiumdriver", tag);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(tag, "v.114.0.5735.90");

    const auto reqs = http->Requests();
    ASSERT_EQ(reqs.size(), 1u);
    bool saw_accept = false;
    bool saw_auth = false;
    for (const auto& [k, v] : reqs[0].headers) {
        if (k == "Accept" && v == "application/vnd.github+json") saw_accept = true;
        if (k == "Authorization" && v == "Bearer secret") saw_auth = true;
    }
    EXPECT_TRUE(saw_accept);
    EXPECT_TRUE(saw_auth);
}

TEST(ArchiveInstallerTest, FetchLatestTagUsesConfiguredApiBase) {
    auto http = std::make_shared<testutil::FakeHttpClient>();
    http->Serve("http://mirror.local/api/repos/mozilla/geckodriver/releases/latest", 200,
                R"({"tag_name":"v0.34.0"})");

    ArchiveInstaller::Options opt;
    opt.github_api_base = "http://mirror.local/api";
    ArchiveInstaller installer(http, opt);

    std::string tag;
    ASSERT_TRUE(installer.FetchLatestGitHubTag("mozilla/geckodriver", tag).is_ok());
    EXPECT_EQ(tag, "v0.34.0");
}

TEST(ArchiveInstallerTest, FetchLatestTagFailuresAreRemoteResolution) {
    auto http = std::make_shared<testutil::FakeHttpClient>();
    ArchiveInstaller installer(http);
    std::string tag;

    // Unknown URL -> 404 from the fake.
    auto res = installer.FetchLatestGitHubTag("operasoftware/operachromiumdriver", tag);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::RemoteResolutionFailure);
    EXPECT_EQ(res.err, 404);

    http->Serve(kLatestUrl, 200, R"({"name":"no tag"})");
    res = installer.FetchLatestGitHubTag("operasoftware/operachromiumdriver", tag);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::RemoteResolutionFailure);

    http->Fail(kLatestUrl, Result::Fail(ErrorKind::DownloadFailure, "could not resolve host"));
    res = installer.FetchLatestGitHubTag("operasoftware/operachromiumdriver", tag);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::RemoteResolutionFailure);

    http->Fail(kLatestUrl, Result::Fail(ErrorKind::Timeout, "timed out"));
    res = installer.FetchLatestGitHubTag("operasoftware/operachromiumdriver", tag);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::Timeout);
    EXPECT_TRUE(tag.empty());
}

TEST(ArchiveInstallerTest, InstallBinaryWritesExecutable) {
    testutil::TemporaryDirectory tmp;
    auto http = std::make_shared<testutil::FakeHttpClient>();
    http->Serve(kZipUrl, 200,
                testutil::BuildArchive(ArchiveKind::Zip, {{"operadriver_linux64/operadriver", "ELF"}}));

    RecordingProgress progress;
    ArchiveInstaller::Options opt;
    opt.progress_sink = &progress;
    ArchiveInstaller installer(http, opt);

    const std::string out_dir = tmp.Path() + "/drivers/nested";
    std::string path;
    auto res = installer.InstallBinary(kZipUrl, "operadriver_linux64/operadriver", "operadriver", out_dir,
                                       /*is_zip=*/true, path);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(path, out_dir + "/operadriver");
    EXPECT_EQ(testutil::ReadFile(path), "ELF");

    struct stat st{};
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_NE(st.st_mode & S_IXUSR, 0u);

    EXPECT_GT(progress.events, 0);
    EXPECT_EQ(progress.last_component, "operadriver");
}

TEST(ArchiveInstallerTest, InstallBinaryOverwritesPreviousDriver) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.Path() + "/geckodriver", "old", 0755);

    const std::string url = "https://example.test/geckodriver.tar.gz";
    auto http = std::make_shared<testutil::FakeHttpClient>();
    http->Serve(url, 200, testutil::BuildArchive(ArchiveKind::TarGz, {{"geckodriver", "new"}}));
    ArchiveInstaller installer(http);

    std::string path;
    auto res = installer.InstallBinary(url, "geckodriver", "geckodriver", tmp.Path(), /*is_zip=*/false, path);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(testutil::ReadFile(tmp.Path() + "/geckodriver"), "new");
}

TEST(ArchiveInstallerTest, MissingEntryLeavesNoArtifact) {
    testutil::TemporaryDirectory tmp;
    auto http = std::make_shared<testutil::FakeHttpClient>();
    http->Serve(kZipUrl, 200, testutil::BuildArchive(ArchiveKind::Zip, {{"README", "hello"}}));
    ArchiveInstaller installer(http);

    std::string path;
    auto res = installer.InstallBinary(kZipUrl, "operadriver_linux64/operadriver", "operadriver", tmp.Path(),
                                       /*is_zip=*/true, path);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ArchiveFormatOrEntryMissing);
    EXPECT_NE(res.msg.find("operadriver_linux64/operadriver"), std::string::npos);
    EXPECT_NE(res.msg.find(kZipUrl), std::string::npos);
    EXPECT_TRUE(path.empty());
    EXPECT_TRUE(std::filesystem::is_empty(tmp.Path()));
}

TEST(ArchiveInstallerTest, HttpErrorIsDownloadFailure) {
    testutil::TemporaryDirectory tmp;
    auto http = std::make_shared<testutil::FakeHttpClient>();
    ArchiveInstaller installer(http);

    std::string path;
    auto res = installer.InstallBinary(kZipUrl, "operadriver_linux64/operadriver", "operadriver", tmp.Path(),
                                       /*is_zip=*/true, path);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::DownloadFailure);
    EXPECT_EQ(res.err, 404);
    EXPECT_FALSE(std::filesystem::exists(tmp.Path() + "/operadriver"));
}

TEST(ArchiveInstallerTest, RejectsOutputNameWithSeparator) {
    testutil::TemporaryDirectory tmp;
    auto http = std::make_shared<testutil::FakeHttpClient>();
    ArchiveInstaller installer(http);

    std::string path;
    auto res = installer.InstallBinary(kZipUrl, "operadriver", "../operadriver", tmp.Path(), true, path);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::InvalidArgument);
    EXPECT_TRUE(http->Requests().empty());
}

} // namespace
} // namespace wdi
