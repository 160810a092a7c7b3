#include "util/version_string.hpp"

#include <cctype>

namespace wdi {

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string TrimWhitespace(std::string_view s) {
    while (!s.empty() && IsSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && IsSpace(s.back())) s.remove_suffix(1);
    return std::string(s);
}

std::vector<std::string> SplitWhitespace(std::string_view s) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && IsSpace(s[i])) ++i;
        const size_t start = i;
        while (i < s.size() && !IsSpace(s[i])) ++i;
        if (i > start) out.emplace_back(s.substr(start, i - start));
    }
    return out;
}

std::optional<std::string> NthToken(std::string_view s, size_t index) {
    auto tokens = SplitWhitespace(s);
    if (index >= tokens.size()) return std::nullopt;
    return std::move(tokens[index]);
}

std::optional<std::string> LastToken(std::string_view s) {
    auto tokens = SplitWhitespace(s);
    if (tokens.empty()) return std::nullopt;
    return std::move(tokens.back());
}

std::string StripTagPrefix(std::string_view tag) {
    if (!tag.empty() && tag.front() == 'v') {
        tag.remove_prefix(1);
        if (!tag.empty() && tag.front() == '.') tag.remove_prefix(1);
    }
    return std::string(tag);
}

} // namespace wdi
