#include "nestar/types.hpp"

#include <algorithm>
#include <cctype>

namespace nestar {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<LayoutKind> parse_layout_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "flat") return LayoutKind::Flat;
    if (lower == "inline") return LayoutKind::Inline;
    return std::nullopt;
}

std::string normalize_logical_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    while (!result.empty() && result.front() == '/') {
        result.erase(result.begin());
    }
    return result;
}

std::string namespace_prefix(const std::string& path) {
    size_t last_slash = path.rfind('/');
    if (last_slash == std::string::npos || last_slash == 0) {
        return "";
    }
    return path.substr(0, last_slash + 1);
}

std::string namespace_key(const std::string& name) {
    size_t start = 0;
    while (start < name.size() && name[start] == '/') ++start;
    size_t end = name.size();
    while (end > start && name[end - 1] == '/') --end;
    return name.substr(start, end - start);
}

bool has_suffix(const std::string& name, const std::vector<std::string>& suffixes) {
    std::string lower = to_lower(name);
    for (const auto& suffix : suffixes) {
        std::string s = to_lower(suffix);
        if (s.empty() || lower.size() < s.size()) continue;
        if (lower.compare(lower.size() - s.size(), s.size(), s) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace nestar
