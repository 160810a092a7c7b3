#pragma once

#include "driver/driver_installer.hpp"

namespace wdi {

// geckodriver from mozilla/geckodriver releases: tar.gz on Linux and macOS, zip on Windows,
// binary at the archive root.
class FirefoxInstaller final : public DriverInstaller {
public:
    static constexpr const char* kRepository = "mozilla/geckodriver";

    explicit FirefoxInstaller(InstallerContext ctx) : DriverInstaller(std::move(ctx)) {}

    std::string BrowserName() const override { return "Firefox"; }
    std::string DriverName() const override { return "geckodriver"; }

    Result GetInstalledBrowserVersion(std::optional<std::string>& out) const override;
    Result GetBestDriverVersion(const std::string& browser_version, std::string& out) const override;
    Result ResolveArchive(const std::string& driver_version, DriverArchive& out) const override;
};

} // namespace wdi
