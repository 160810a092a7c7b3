#pragma once

#include "util/result.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace wdi {

// One candidate way of finding an installed version; absent means "try the next one".
using VersionProbe = std::function<Result(std::optional<std::string>&)>;

// Evaluates probes in order and stops at the first that yields a version.
// A failing probe (timeout, local error) stops the chain and is returned.
Result FirstAvailableVersion(const std::vector<VersionProbe>& probes, std::optional<std::string>& out);

} // namespace wdi
