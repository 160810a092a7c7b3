#pragma once

#include "driver/driver_installer.hpp"
#include "util/result.hpp"

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace wdi {

// Browser name -> installer factory. Names are case-insensitive.
class DriverRegistry {
public:
    using Factory = std::function<std::unique_ptr<DriverInstaller>(InstallerContext)>;

    // Registry with "opera" and "firefox".
    static DriverRegistry WithBuiltins();

    void Register(std::string_view name, Factory factory);

    Result Create(std::string_view name, const InstallerContext& ctx, std::unique_ptr<DriverInstaller>& out) const;

    bool Contains(std::string_view name) const;

    // Sorted, lowercase.
    std::vector<std::string> Names() const;

private:
    std::map<std::string, Factory> factories_;
};

// "Opera, firefox" -> {"opera", "firefox"}; duplicates dropped, order kept.
std::expected<std::vector<std::string>, std::string> ParseBrowserList(std::string_view csv);

} // namespace wdi
