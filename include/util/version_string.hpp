#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wdi {

std::string TrimWhitespace(std::string_view s);

std::vector<std::string> SplitWhitespace(std::string_view s);

// Zero-based whitespace token of the trimmed text, absent if there are fewer tokens.
std::optional<std::string> NthToken(std::string_view s, size_t index);
std::optional<std::string> LastToken(std::string_view s);

// Drops a leading "v" or "v." release-tag prefix: "v.1.2" -> "1.2", "v1.2" -> "1.2".
std::string StripTagPrefix(std::string_view tag);

} // namespace wdi
