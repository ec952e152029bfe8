#pragma once

#include "nestar/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace nestar {

// ============================================================================
// Configuration
// ============================================================================

constexpr const char* CONFIG_SCHEMA = "nestar.config.v1";

struct LogConfig {
    std::string level = "info";   // trace, debug, info, warn, error, off
    std::string file;             // empty: stderr
};

/**
 * @brief Runtime configuration for opening and resolving a container
 *
 * @example
 * ```json
 * {
 *   "$schema": "nestar.config.v1",
 *   "log": { "level": "debug", "file": "/tmp/nestar.log" },
 *   "layout": "auto",
 *   "archive_suffixes": [".zip", ".jar"],
 *   "fallback_paths": ["/opt/app/resources"],
 *   "native_search_paths": ["/usr/lib"],
 *   "materialize": { "reuse": true }
 * }
 * ```
 */
struct Config {
    LogConfig log;

    /// Forced layout; nullopt ("auto") follows the container manifest
    std::optional<LayoutKind> layout;

    std::vector<std::string> archive_suffixes = {".zip", ".jar", ".pkg"};
    std::vector<std::string> native_suffixes = {".so", ".dll", ".dylib"};

    /// Directories consulted, in order, after the container
    std::vector<std::string> fallback_paths;

    /// Directories searched for native libraries the container lacks
    std::vector<std::string> native_search_paths;

    /// Where materialized files go; empty: system temp directory
    std::string temp_dir;

    bool reuse_materialized = false;

    std::string source_path;
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> warnings;
    Config config;
};

/// Parse configuration JSON
ConfigParseResult parse_config(const std::string& json_str,
                               const std::string& source_path = "");

/// Read and parse a configuration file
ConfigParseResult load_config(const std::string& path);

/// Apply NESTAR_LOG_LEVEL, NESTAR_LOG_FILE and NESTAR_TMPDIR on top of `config`
void apply_env_overrides(Config& config);

} // namespace nestar
