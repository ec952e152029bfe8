#pragma once

#include "nestar/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nestar {

class ArchiveReader;

// ============================================================================
// Container Manifest
// ============================================================================

/// Entry name of the governing descriptor inside every container
constexpr const char* MANIFEST_ENTRY = "META-INF/MANIFEST.MF";

/// Header keys understood by the resolver
constexpr const char* MANIFEST_KEY_LAYOUT = "Nestar-Layout";
constexpr const char* MANIFEST_KEY_VERSION = "Nestar-Version";
constexpr const char* MANIFEST_KEY_CLASS_PATH = "Class-Path";

/// Major version of the container format this build understands
constexpr uint64_t SUPPORTED_FORMAT_MAJOR = 1;

/**
 * @brief Package metadata declared by the manifest governing a namespace
 */
struct PackageInfo {
    std::string specification_title;
    std::string specification_version;
    std::string specification_vendor;
    std::string implementation_title;
    std::string implementation_version;
    std::string implementation_vendor;
    bool sealed = false;
};

/**
 * @brief Main section of a container's META-INF/MANIFEST.MF
 *
 * Attribute names are matched case-insensitively, as in the JAR manifest
 * format the descriptor follows.
 */
struct Manifest {
    std::unordered_map<std::string, std::string> attributes;  // lowercased key -> value

    std::optional<std::string> get(const std::string& key) const;

    /// Layout kind; nullopt when absent or unrecognized
    std::optional<LayoutKind> layout() const;

    /// Nestar-Version value, empty when absent
    std::string format_version() const;

    /// Class-Path split on spaces
    std::vector<std::string> class_path() const;

    /// Package attributes for namespaces governed by this manifest
    PackageInfo package_info() const;
};

struct ManifestParseResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> warnings;
    Manifest manifest;
};

/**
 * @brief Parse manifest text
 *
 * Only the main section (up to the first blank line) is read. Lines starting
 * with a single space continue the previous value. CRLF and LF are accepted.
 */
ManifestParseResult parse_manifest(const std::string& text);

/**
 * @brief Read the manifest of an archive
 * @return Parsed manifest, an empty manifest if the archive has none,
 *         or the archive read error
 */
Result<Manifest> read_manifest(const ArchiveReader& reader);

/**
 * @brief Check the Nestar-Version attribute
 *
 * A missing version is accepted. A value that is not SemVer, or whose major
 * differs from SUPPORTED_FORMAT_MAJOR, is UNSUPPORTED_VERSION.
 */
Result<void> check_format_version(const Manifest& manifest);

} // namespace nestar
