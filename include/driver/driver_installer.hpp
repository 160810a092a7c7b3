#pragma once

#include "installer/archive_installer.hpp"
#include "platform/platform.hpp"
#include "platform/platform_probe.hpp"
#include "util/result.hpp"

#include <memory>
#include <optional>
#include <string>

namespace wdi {

// Shared, immutable collaborators of every installer in a run.
struct InstallerContext {
    PlatformDescriptor platform;
    std::shared_ptr<const PlatformProbe> probe;
    std::shared_ptr<const ArchiveInstaller> archives;
};

// Where a driver release lives and what to take out of it.
struct DriverArchive {
    std::string url;
    std::string name_in_archive;
    std::string output_name;
    bool is_zip = true;
};

enum class InstallStatus {
    BrowserNotFound,
    UpToDate,
    Installed,
};

const char* InstallStatusName(InstallStatus status);

struct InstallOutcome {
    InstallStatus status = InstallStatus::BrowserNotFound;
    std::string browser_version;
    std::optional<std::string> previous_driver_version;
    std::string driver_version;
    std::string artifact_path;
};

class DriverInstaller {
public:
    virtual ~DriverInstaller() = default;

    virtual std::string BrowserName() const = 0;
    virtual std::string DriverName() const = 0;

    // Absent when the browser is not installed. UnsupportedPlatform for unknown host OS.
    virtual Result GetInstalledBrowserVersion(std::optional<std::string>& out) const = 0;

    // Runs "<output_directory>/<driver>[.exe] --version" and takes the second token.
    virtual Result GetInstalledDriverVersion(const std::string& output_directory,
                                             std::optional<std::string>& out) const;

    // `browser_version` may be ignored by installers that always take the latest release.
    virtual Result GetBestDriverVersion(const std::string& browser_version, std::string& out) const = 0;

    // Release archive for `driver_version` on this installer's platform.
    virtual Result ResolveArchive(const std::string& driver_version, DriverArchive& out) const = 0;

    virtual Result Install(const std::string& driver_version,
                           const std::string& output_directory,
                           std::string& out_path) const;

    // detect -> resolve -> compare with installed driver -> fetch and place when different.
    Result InstallIfNeeded(const std::string& output_directory, InstallOutcome& out) const;

    const PlatformDescriptor& Platform() const { return ctx_.platform; }

protected:
    explicit DriverInstaller(InstallerContext ctx);

    const PlatformProbe& Probe() const { return *ctx_.probe; }
    const ArchiveInstaller& Archives() const { return *ctx_.archives; }

    std::string DriverFileName() const { return DriverName() + ctx_.platform.binary_suffix; }

    Result UnsupportedPlatform() const;

    // Latest release tag of `repo` with any "v"/"v." prefix removed.
    Result LatestReleaseVersion(std::string_view repo, std::string& out) const;

private:
    InstallerContext ctx_;
};

} // namespace wdi
