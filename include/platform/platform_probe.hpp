#pragma once

#include "system/command_runner.hpp"
#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wdi {

// Version-detection primitives shared by all driver installers.
// "Not found" is an absent result, never a failure; only timeouts and local errors fail.
class PlatformProbe {
  public:
    struct Options {
        std::chrono::milliseconds command_timeout{10000};
        std::string applications_dir = "/Applications";
        std::string powershell = "powershell";
    };

    PlatformProbe();
    explicit PlatformProbe(std::shared_ptr<const ICommandRunner> runner);
    PlatformProbe(std::shared_ptr<const ICommandRunner> runner, Options opt);

    // CFBundleShortVersionString of /Applications/<app_name>.app, trimmed.
    Result GetMacAppVersion(std::string_view app_name, std::optional<std::string>& out) const;

    // Raw stdout of a successful run; absent if the command is missing or exits non-zero.
    Result GetCommandOutputOrNullIfMissing(const std::vector<std::string>& argv,
                                           std::optional<std::string>& out) const;

    // ProductVersion resource of a PE file. A bare executable name is resolved through PATH.
    Result GetWindowsExeVersion(std::string_view path, std::optional<std::string>& out) const;

  private:
    std::shared_ptr<const ICommandRunner> runner_;
    Options opt_{};
};

} // namespace wdi
