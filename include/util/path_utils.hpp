#pragma once

#include <string>
#include <string_view>

namespace wdi {

// Normalize an archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
// - drop a trailing "/" (directory entries)
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

// True when s is a bare file name usable inside an output directory.
inline bool IsPlainFileName(std::string_view s) {
    if (s.empty() || s == "." || s == "..") return false;
    return s.find('/') == std::string_view::npos && s.find('\\') == std::string_view::npos;
}

inline bool HasPathSeparator(std::string_view s) {
    return s.find('/') != std::string_view::npos || s.find('\\') != std::string_view::npos;
}

} // namespace wdi
