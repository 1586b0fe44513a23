#pragma once

#include <string>
#include <string_view>

namespace kiosk {

inline bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Portable separator form for paths stored in config documents:
// - '\' becomes '/'
// - duplicate slashes collapse
// - leading "./" segments are dropped
inline std::string NormalizeSeparators(std::string s) {
    for (char& c : s) {
        if (c == '\\') c = '/';
    }
    while (StartsWith(s, "./")) s.erase(0, 2);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

inline std::string JoinPath(std::string_view base, std::string_view leaf) {
    if (base.empty()) return std::string(leaf);
    if (leaf.empty()) return std::string(base);
    std::string out(base);
    if (out.back() != '/') out.push_back('/');
    while (!leaf.empty() && leaf.front() == '/') leaf.remove_prefix(1);
    out.append(leaf);
    return out;
}

// Relative, non-empty, and no ".." segment.
inline bool IsSafeRelativePath(std::string_view p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;

    while (!p.empty()) {
        while (!p.empty() && p.front() == '/') p.remove_prefix(1);
        const auto pos = p.find('/');
        const auto seg = p.substr(0, pos);
        if (seg == "..") return false;
        if (pos == std::string_view::npos) break;
        p.remove_prefix(pos);
    }
    return true;
}

// True when `path` is `dir` itself or lies below it. Purely lexical.
inline bool IsUnderDirectory(std::string_view path, std::string_view dir) {
    while (dir.size() > 1 && dir.back() == '/') dir.remove_suffix(1);
    if (dir.empty()) return false;
    if (!StartsWith(path, dir)) return false;
    return path.size() == dir.size() || path[dir.size()] == '/' || dir == "/";
}

} // namespace kiosk
