#include "driver/driver_registry.hpp"

#include "driver/firefox_installer.hpp"
#include "driver/opera_installer.hpp"
#include "util/version_string.hpp"

#include <algorithm>
#include <cctype>

namespace wdi {

namespace {

std::string Lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace

DriverRegistry DriverRegistry::WithBuiltins() {
    DriverRegistry reg;
    reg.Register("opera", [](InstallerContext ctx) -> std::unique_ptr<DriverInstaller> {
        return std::make_unique<OperaInstaller>(std::move(ctx));
    });
    reg.Register("firefox", [](InstallerContext ctx) -> std::unique_ptr<DriverInstaller> {
        return std::make_unique<FirefoxInstaller>(std::move(ctx));
    });
    return reg;
}

void DriverRegistry::Register(std::string_view name, Factory factory) {
    factories_[Lower(name)] = std::move(factory);
}

Result DriverRegistry::Create(std::string_view name,
                              const InstallerContext& ctx,
                              std::unique_ptr<DriverInstaller>& out) const {
    out.reset();
    auto it = factories_.find(Lower(name));
    if (it == factories_.end() || !it->second) {
        std::string known;
        for (const auto& [k, _] : factories_) {
            if (!known.empty()) known += ", ";
            known += k;
        }
        return Result::Fail(ErrorKind::InvalidArgument,
                            "Unknown browser '" + std::string(name) + "' (known: " + known + ")");
    }
    out = it->second(ctx);
    if (!out) {
        return Result::Fail(ErrorKind::InvalidArgument, "Factory for '" + std::string(name) + "' returned null");
    }
    return Result::Ok();
}

bool DriverRegistry::Contains(std::string_view name) const {
    return factories_.contains(Lower(name));
}

std::vector<std::string> DriverRegistry::Names() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& [k, _] : factories_) out.push_back(k);
    return out;
}

std::expected<std::vector<std::string>, std::string> ParseBrowserList(std::string_view csv) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= csv.size()) {
        const size_t comma = csv.find(',', pos);
        const size_t end = comma == std::string_view::npos ? csv.size() : comma;
        const std::string name = Lower(TrimWhitespace(csv.substr(pos, end - pos)));
        if (name.empty()) {
            return std::unexpected("empty browser name in '" + std::string(csv) + "'");
        }
        if (std::find(out.begin(), out.end(), name) == out.end()) out.push_back(name);
        if (comma == std::string_view::npos) break;
        pos = comma + 1;
    }
    return out;
}

} // namespace wdi
