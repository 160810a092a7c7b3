#pragma once

#include <expected>
#include <string>

namespace wdi {

// tag_name of a GitHub "latest release" response body.
std::expected<std::string, std::string> ParseLatestReleaseTag(const std::string& json_input);

} // namespace wdi
