#include "driver/driver_installer.hpp"

#include "util/logger.hpp"
#include "util/version_string.hpp"

#include <filesystem>

namespace wdi {

const char* InstallStatusName(InstallStatus status) {
    switch (status) {
        case InstallStatus::BrowserNotFound: return "browser-not-found";
        case InstallStatus::UpToDate:        return "up-to-date";
        case InstallStatus::Installed:       return "installed";
    }
    return "unknown";
}

DriverInstaller::DriverInstaller(InstallerContext ctx) : ctx_(std::move(ctx)) {
    if (!ctx_.probe) ctx_.probe = std::make_shared<PlatformProbe>();
    if (!ctx_.archives) ctx_.archives = std::make_shared<ArchiveInstaller>();
}

Result DriverInstaller::UnsupportedPlatform() const {
    return Result::Fail(ErrorKind::UnsupportedPlatform, "Unsupported platform: " + ctx_.platform.os_name);
}

Result DriverInstaller::LatestReleaseVersion(std::string_view repo, std::string& out) const {
    std::string tag;
    auto r = Archives().FetchLatestGitHubTag(repo, tag);
    if (!r.is_ok()) return r;

    out = StripTagPrefix(tag);
    if (out.empty()) {
        return Result::Fail(ErrorKind::RemoteResolutionFailure,
                            "Release tag '" + tag + "' of " + std::string(repo) + " holds no version");
    }
    return Result::Ok();
}

Result DriverInstaller::GetInstalledDriverVersion(const std::string& output_directory,
                                                  std::optional<std::string>& out) const {
    out.reset();
    const std::string driver_path =
        (std::filesystem::path(output_directory) / DriverFileName()).string();

    std::optional<std::string> output;
    auto r = Probe().GetCommandOutputOrNullIfMissing({driver_path, "--version"}, output);
    if (!r.is_ok()) return r;
    if (!output) return Result::Ok();

    // "operadriver 114.0.5735.90 (...)": the first token is the program name.
    out = NthToken(*output, 1);
    return Result::Ok();
}

Result DriverInstaller::Install(const std::string& driver_version,
                                const std::string& output_directory,
                                std::string& out_path) const {
    out_path.clear();
    if (!ctx_.platform.IsSupported()) return UnsupportedPlatform();

    DriverArchive archive;
    auto r = ResolveArchive(driver_version, archive);
    if (!r.is_ok()) return r;

    LogInfo("[%s] installing %s %s for %s", BrowserName().c_str(), DriverName().c_str(),
            driver_version.c_str(), ctx_.platform.os_name.c_str());
    return Archives().InstallBinary(archive.url, archive.name_in_archive, archive.output_name,
                                    output_directory, archive.is_zip, out_path);
}

Result DriverInstaller::InstallIfNeeded(const std::string& output_directory, InstallOutcome& out) const {
    out = InstallOutcome{};
    const std::string browser = BrowserName();

    std::optional<std::string> browser_version;
    auto r = GetInstalledBrowserVersion(browser_version);
    if (!r.is_ok()) return r;
    if (!browser_version) {
        LogWarn("[%s] browser not found, skipping %s", browser.c_str(), DriverName().c_str());
        out.status = InstallStatus::BrowserNotFound;
        return Result::Ok();
    }
    out.browser_version = *browser_version;
    LogInfo("[%s] installed browser version %s", browser.c_str(), browser_version->c_str());

    r = GetBestDriverVersion(*browser_version, out.driver_version);
    if (!r.is_ok()) return r;

    r = GetInstalledDriverVersion(output_directory, out.previous_driver_version);
    if (!r.is_ok()) return r;

    if (out.previous_driver_version && *out.previous_driver_version == out.driver_version) {
        LogInfo("[%s] %s %s is up to date", browser.c_str(), DriverName().c_str(), out.driver_version.c_str());
        out.status = InstallStatus::UpToDate;
        out.artifact_path = (std::filesystem::path(output_directory) / DriverFileName()).string();
        return Result::Ok();
    }

    if (out.previous_driver_version) {
        LogInfo("[%s] replacing %s %s with %s", browser.c_str(), DriverName().c_str(),
                out.previous_driver_version->c_str(), out.driver_version.c_str());
    }

    r = Install(out.driver_version, output_directory, out.artifact_path);
    if (!r.is_ok()) return r;

    out.status = InstallStatus::Installed;
    return Result::Ok();
}

} // namespace wdi
