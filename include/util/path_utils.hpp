#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <string>
#include <string_view>

namespace peel {

inline bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

inline bool IsUrl(std::string_view s) {
    const std::string lower = ToLower(std::string(s));
    return StartsWith(lower, "http://") || StartsWith(lower, "https://") ||
           StartsWith(lower, "ftp://");
}

// Last path segment of a URL, without query string or fragment.
// Returns an empty string when the URL path ends in '/'.
inline std::string UrlBasename(std::string_view url) {
    const auto scheme = url.find("://");
    std::string_view rest = scheme == std::string_view::npos ? url : url.substr(scheme + 3);
    const auto cut = rest.find_first_of("?#");
    if (cut != std::string_view::npos) rest = rest.substr(0, cut);
    const auto host_end = rest.find('/');
    if (host_end == std::string_view::npos) return {};
    rest = rest.substr(host_end);
    const auto slash = rest.rfind('/');
    return std::string(rest.substr(slash + 1));
}

// Lexical containment: true when `path` is `root` or lies beneath it.
inline bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& path) {
    const auto r = root.lexically_normal();
    const auto p = path.lexically_normal();
    auto rit = r.begin();
    auto pit = p.begin();
    for (; rit != r.end(); ++rit, ++pit) {
        if (rit->empty() && std::next(rit) == r.end()) break; // trailing separator
        if (pit == p.end() || *rit != *pit) return false;
    }
    return true;
}

} // namespace peel
