#include "platform/platform_probe.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/version_string.hpp"

namespace wdi {

namespace {

std::string PowerShellQuote(std::string_view s) {
    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') out.push_back('\'');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::optional<std::string> NonEmptyTrimmed(const std::optional<std::string>& raw) {
    if (!raw) return std::nullopt;
    std::string v = TrimWhitespace(*raw);
    if (v.empty()) return std::nullopt;
    return v;
}

} // namespace

PlatformProbe::PlatformProbe() : runner_(DefaultCommandRunner()) {}

PlatformProbe::PlatformProbe(std::shared_ptr<const ICommandRunner> runner)
    : runner_(runner ? std::move(runner) : DefaultCommandRunner()) {}

PlatformProbe::PlatformProbe(std::shared_ptr<const ICommandRunner> runner, Options opt)
    : runner_(runner ? std::move(runner) : DefaultCommandRunner()), opt_(std::move(opt)) {}

Result PlatformProbe::GetCommandOutputOrNullIfMissing(const std::vector<std::string>& argv,
                                                      std::optional<std::string>& out) const {
    out.reset();

    CommandOutput co;
    auto r = runner_->Run(argv, opt_.command_timeout, co);
    if (!r.is_ok()) return r;

    if (!co.launched) {
        LogDebug("command not found: %s", argv.front().c_str());
        return Result::Ok();
    }
    if (co.exit_code != 0) {
        LogDebug("command %s exited with %d", argv.front().c_str(), co.exit_code);
        return Result::Ok();
    }

    out = std::move(co.stdout_text);
    return Result::Ok();
}

Result PlatformProbe::GetMacAppVersion(std::string_view app_name,
                                       std::optional<std::string>& out) const {
    const std::string plist =
        opt_.applications_dir + "/" + std::string(app_name) + ".app/Contents/Info.plist";

    std::optional<std::string> raw;
    auto r = GetCommandOutputOrNullIfMissing({"defaults", "read", plist, "CFBundleShortVersionString"}, raw);
    if (!r.is_ok()) return r;

    out = NonEmptyTrimmed(raw);
    return Result::Ok();
}

Result PlatformProbe::GetWindowsExeVersion(std::string_view path,
                                           std::optional<std::string>& out) const {
    std::string item = PowerShellQuote(path);
    if (!HasPathSeparator(path)) {
        item = "(Get-Command " + item + " -ErrorAction Stop).Source";
    }
    const std::string script = "(Get-Item " + item + " -ErrorAction Stop).VersionInfo.ProductVersion";

    std::optional<std::string> raw;
    auto r = GetCommandOutputOrNullIfMissing(
        {opt_.powershell, "-NoProfile", "-NonInteractive", "-Command", script}, raw);
    if (!r.is_ok()) return r;

    out = NonEmptyTrimmed(raw);
    return Result::Ok();
}

} // namespace wdi
