#include "driver/opera_installer.hpp"

#include "driver/version_probe.hpp"
#include "util/version_string.hpp"

#include <vector>

namespace wdi {

namespace {

constexpr const char* kReleaseDownloadBase =
    "https://github.com/operasoftware/operachromiumdriver/releases/download/";

} // namespace

Result OperaInstaller::GetInstalledBrowserVersion(std::optional<std::string>& out) const {
    out.reset();
    const PlatformProbe& probe = Probe();
    std::vector<VersionProbe> candidates;

    switch (Platform().os) {
        case OsFamily::MacOS:
            for (const char* bundle : {"Opera", "Opera Stable"}) {
                candidates.emplace_back([&probe, bundle](std::optional<std::string>& v) {
                    return probe.GetMacAppVersion(bundle, v);
                });
            }
            break;

        case OsFamily::Linux: {
            // Snap first, then whatever "opera" resolves to on PATH.
            for (const char* exe : {"/snap/bin/opera", "opera"}) {
                candidates.emplace_back([&probe, exe](std::optional<std::string>& v) {
                    auto r = probe.GetCommandOutputOrNullIfMissing({exe, "--version"}, v);
                    if (r.is_ok() && v) v = NthToken(*v, 0);
                    return r;
                });
            }
            break;
        }

        case OsFamily::Windows: {
            std::vector<std::string> paths = {
                "C:\\Program Files\\Opera\\opera.exe",
                "C:\\Program Files (x86)\\Opera\\opera.exe",
            };
            if (!Platform().user_name.empty()) {
                paths.push_back("C:\\Users\\" + Platform().user_name +
                                "\\AppData\\Local\\Programs\\Opera\\opera.exe");
            }
            paths.push_back("opera.exe");
            for (auto& path : paths) {
                candidates.emplace_back([&probe, path = std::move(path)](std::optional<std::string>& v) {
                    return probe.GetWindowsExeVersion(path, v);
                });
            }
            break;
        }

        case OsFamily::Unsupported:
            return UnsupportedPlatform();
    }

    return FirstAvailableVersion(candidates, out);
}

Result OperaInstaller::GetBestDriverVersion(const std::string& /*browser_version*/, std::string& out) const {
    // Always the latest release: an exact match for the installed build often has no published driver.
    return LatestReleaseVersion(kRepository, out);
}

Result OperaInstaller::ResolveArchive(const std::string& driver_version, DriverArchive& out) const {
    if (!Platform().IsSupported()) return UnsupportedPlatform();
    if (driver_version.empty()) return Result::Fail(ErrorKind::InvalidArgument, "empty operadriver version");

    const std::string platform_tag = Platform().archive_tag;
    const std::string binary_name = DriverFileName();
    const std::string folder = "operadriver_" + platform_tag;

    out.url = std::string(kReleaseDownloadBase) + "v." + driver_version + "/" + folder + ".zip";
    out.name_in_archive = folder + "/" + binary_name;
    out.output_name = binary_name;
    out.is_zip = true;
    return Result::Ok();
}

} // namespace wdi
