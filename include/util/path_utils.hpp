#pragma once

#include <string>
#include <string_view>

namespace otafetch {

// A bare file name: non-empty, no separators, not "." or "..".
inline bool IsPlainFileName(std::string_view s) {
    if (s.empty() || s == "." || s == "..") return false;
    return s.find('/') == std::string_view::npos && s.find('\0') == std::string_view::npos;
}

// Strips an optional "file://" scheme from a local mirror URL.
inline std::string LocalPathFromUrl(std::string_view url) {
    constexpr std::string_view kScheme = "file://";
    if (url.rfind(kScheme, 0) == 0) url.remove_prefix(kScheme.size());
    return std::string(url);
}

} // namespace otafetch
