#pragma once

#include "driver/driver_installer.hpp"

namespace wdi {

// OperaDriver from operasoftware/operachromiumdriver releases. The driver sits one
// directory deep inside the zip ("operadriver_linux64/operadriver").
class OperaInstaller final : public DriverInstaller {
public:
    static constexpr const char* kRepository = "operasoftware/operachromiumdriver";

    explicit OperaInstaller(InstallerContext ctx) : DriverInstaller(std::move(ctx)) {}

    std::string BrowserName() const override { return "Opera"; }
    std::string DriverName() const override { return "operadriver"; }

    Result GetInstalledBrowserVersion(std::optional<std::string>& out) const override;
    Result GetBestDriverVersion(const std::string& browser_version, std::string& out) const override;
    Result ResolveArchive(const std::string& driver_version, DriverArchive& out) const override;
};

} // namespace wdi
