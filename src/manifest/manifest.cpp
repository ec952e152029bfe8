#include "nestar/manifest.hpp"
#include "nestar/archive.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>

namespace nestar {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

std::optional<std::string> Manifest::get(const std::string& key) const {
    auto it = attributes.find(to_lower(key));
    if (it == attributes.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<LayoutKind> Manifest::layout() const {
    auto value = get(MANIFEST_KEY_LAYOUT);
    if (!value) return std::nullopt;
    return parse_layout_kind(trim(*value));
}

std::string Manifest::format_version() const {
    return trim(get(MANIFEST_KEY_VERSION).value_or(""));
}

std::vector<std::string> Manifest::class_path() const {
    std::vector<std::string> result;
    auto value = get(MANIFEST_KEY_CLASS_PATH);
    if (!value) return result;

    std::istringstream iss(*value);
    std::string item;
    while (iss >> item) {
        result.push_back(item);
    }
    return result;
}

PackageInfo Manifest::package_info() const {
    PackageInfo info;
    info.specification_title = get("Specification-Title").value_or("");
    info.specification_version = get("Specification-Version").value_or("");
    info.specification_vendor = get("Specification-Vendor").value_or("");
    info.implementation_title = get("Implementation-Title").value_or("");
    info.implementation_version = get("Implementation-Version").value_or("");
    info.implementation_vendor = get("Implementation-Vendor").value_or("");
    info.sealed = to_lower(trim(get("Sealed").value_or(""))) == "true";
    return info;
}

ManifestParseResult parse_manifest(const std::string& text) {
    ManifestParseResult result;

    std::istringstream in(text);
    std::string line;
    std::string current_key;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        // Main section ends at the first blank line
        if (line.empty()) {
            break;
        }

        if (line[0] == ' ') {
            if (current_key.empty()) {
                result.error = "continuation line without attribute at line " + std::to_string(line_no);
                return result;
            }
            result.manifest.attributes[current_key] += line.substr(1);
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            result.warnings.push_back("ignoring malformed manifest line " + std::to_string(line_no));
            current_key.clear();
            continue;
        }

        current_key = to_lower(line.substr(0, colon));
        std::string value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') {
            value.erase(0, 1);
        }
        result.manifest.attributes[current_key] = value;
    }

    result.ok = true;
    return result;
}

Result<Manifest> read_manifest(const ArchiveReader& reader) {
    const ArchiveEntry* entry = reader.find(MANIFEST_ENTRY);
    if (!entry && !reader.is_random_access()) {
        for (const auto& e : reader.entries()) {
            if (e.name == MANIFEST_ENTRY) {
                entry = &e;
                break;
            }
        }
    }
    if (!entry) {
        return Result<Manifest>::ok(Manifest{});
    }

    auto bytes = reader.read(*entry);
    if (bytes.isErr()) {
        return Result<Manifest>::err(bytes.error());
    }

    const Bytes& b = bytes.value();
    auto parsed = parse_manifest(std::string(b.begin(), b.end()));
    if (!parsed.ok) {
        return Result<Manifest>::err(Error(ErrorCode::CORRUPT_ARCHIVE,
            nested_locator(reader.locator(), MANIFEST_ENTRY) + ": " + parsed.error));
    }
    return Result<Manifest>::ok(std::move(parsed.manifest));
}

Result<void> check_format_version(const Manifest& manifest) {
    std::string version = manifest.format_version();
    if (version.empty()) {
        return Result<void>::ok();
    }

    try {
        auto parsed = semver::version::parse(version);
        if (parsed.major() != SUPPORTED_FORMAT_MAJOR) {
            return Result<void>::err(Error(ErrorCode::UNSUPPORTED_VERSION,
                "container format " + version + " is not supported (expected " +
                std::to_string(SUPPORTED_FORMAT_MAJOR) + ".x)"));
        }
    } catch (const semver::semver_exception&) {
        return Result<void>::err(Error(ErrorCode::UNSUPPORTED_VERSION,
            "invalid container format version: " + version));
    }
    return Result<void>::ok();
}

} // namespace nestar
