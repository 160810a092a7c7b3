#include "driver/version_probe.hpp"

namespace wdi {

Result FirstAvailableVersion(const std::vector<VersionProbe>& probes, std::optional<std::string>& out) {
    out.reset();
    for (const auto& probe : probes) {
        std::optional<std::string> candidate;
        auto r = probe(candidate);
        if (!r.is_ok()) return r;
        if (candidate) {
            out = std::move(candidate);
            return Result::Ok();
        }
    }
    return Result::Ok();
}

} // namespace wdi
