#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace apg {

// Splits on '/', dropping empty segments. "." segments are kept.
inline std::vector<std::string_view> SplitPathSegments(std::string_view s) {
    std::vector<std::string_view> out;
    while (!s.empty()) {
        while (!s.empty() && s.front() == '/') s.remove_prefix(1);
        if (s.empty()) break;
        const auto pos = s.find('/');
        out.push_back(s.substr(0, pos));
        if (pos == std::string_view::npos) break;
        s.remove_prefix(pos);
    }
    return out;
}

// Lexically clean a tar entry name into a relative form:
// - drop "." segments (covers leading "./")
// - collapse duplicate and trailing slashes
// - keep ".." segments so the caller can reject them
// A leading "/" is not preserved; callers check IsAbsoluteTarPath() on the raw
// name first.
inline std::string CleanTarPath(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const auto seg : SplitPathSegments(s)) {
        if (seg == ".") continue;
        if (!out.empty()) out.push_back('/');
        out.append(seg);
    }
    return out;
}

inline bool IsAbsoluteTarPath(std::string_view s) {
    return !s.empty() && s.front() == '/';
}

inline bool HasParentSegment(std::string_view s) {
    for (const auto seg : SplitPathSegments(s)) {
        if (seg == "..") return true;
    }
    return false;
}

} // namespace apg
