#include "driver/firefox_installer.hpp"

#include "driver/version_probe.hpp"
#include "util/version_string.hpp"

#include <vector>

namespace wdi {

Result FirefoxInstaller::GetInstalledBrowserVersion(std::optional<std::string>& out) const {
    out.reset();
    const PlatformProbe& probe = Probe();
    std::vector<VersionProbe> candidates;

    switch (Platform().os) {
        case OsFamily::MacOS:
            candidates.emplace_back([&probe](std::optional<std::string>& v) {
                return probe.GetMacAppVersion("Firefox", v);
            });
            break;

        case OsFamily::Linux:
            // "Mozilla Firefox 115.0"
            candidates.emplace_back([&probe](std::optional<std::string>& v) {
                auto r = probe.GetCommandOutputOrNullIfMissing({"firefox", "--version"}, v);
                if (r.is_ok() && v) v = LastToken(*v);
                return r;
            });
            break;

        case OsFamily::Windows:
            for (const char* path : {"C:\\Program Files\\Mozilla Firefox\\firefox.exe",
                                     "C:\\Program Files (x86)\\Mozilla Firefox\\firefox.exe",
                                     "firefox.exe"}) {
                candidates.emplace_back([&probe, path](std::optional<std::string>& v) {
                    return probe.GetWindowsExeVersion(path, v);
                });
            }
            break;

        case OsFamily::Unsupported:
            return UnsupportedPlatform();
    }

    return FirstAvailableVersion(candidates, out);
}

Result FirefoxInstaller::GetBestDriverVersion(const std::string& /*browser_version*/, std::string& out) const {
    return LatestReleaseVersion(kRepository, out);
}

Result FirefoxInstaller::ResolveArchive(const std::string& driver_version, DriverArchive& out) const {
    if (driver_version.empty()) return Result::Fail(ErrorKind::InvalidArgument, "empty geckodriver version");

    const bool arm64 = Platform().arch == CpuArch::Arm64;
    std::string platform;
    bool is_zip = false;
    switch (Platform().os) {
        case OsFamily::Linux:
            platform = arm64 ? "linux-aarch64" : "linux64";
            break;
        case OsFamily::MacOS:
            platform = arm64 ? "macos-aarch64" : "macos";
            break;
        case OsFamily::Windows:
            platform = arm64 ? "win-aarch64" : "win64";
            is_zip = true;
            break;
        case OsFamily::Unsupported:
            return UnsupportedPlatform();
    }

    const std::string tag = "v" + driver_version;
    out.url = "https://github.com/mozilla/geckodriver/releases/download/" + tag + "/geckodriver-" + tag +
              "-" + platform + (is_zip ? ".zip" : ".tar.gz");
    out.name_in_archive = DriverFileName();
    out.output_name = DriverFileName();
    out.is_zip = is_zip;
    return Result::Ok();
}

} // namespace wdi
