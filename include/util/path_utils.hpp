#pragma once

#include <string>
#include <string_view>

namespace pkgrepo {

inline bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Normalize a storage key or prefix to a clean relative form:
// - strip leading "./" and "/"
// - collapse duplicate slashes
// - strip trailing "/"
inline std::string NormalizeKey(std::string_view in) {
    std::string s(in);
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
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

inline std::string JoinKey(std::string_view a, std::string_view b) {
    const std::string left = NormalizeKey(a);
    const std::string right = NormalizeKey(b);
    if (left.empty()) return right;
    if (right.empty()) return left;
    return left + "/" + right;
}

inline std::string_view KeyBaseName(std::string_view key) {
    const auto pos = key.rfind('/');
    return pos == std::string_view::npos ? key : key.substr(pos + 1);
}

} // namespace pkgrepo
