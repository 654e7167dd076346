#pragma once

#include <string>
#include <string_view>

namespace takeout {

inline bool HasSuffix(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool HasPrefix(std::string_view s, std::string_view prefix) {
    return s.rfind(prefix, 0) == 0;
}

// Normalize archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
// - drop a trailing "/" (directory entries)
inline std::string NormalizeEntryPath(std::string s) {
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

} // namespace takeout
