#pragma once

#include "nestar/config.hpp"
#include "nestar/types.hpp"

#include <optional>
#include <string>

#include <spdlog/common.h>

namespace nestar {

/// "trace", "debug", "info", "warn", "error" or "off" (case-insensitive)
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

/**
 * @brief Install the "nestar" logger as spdlog's default logger
 *
 * Logs go to stderr, or to `config.file` when set. Library code logs through
 * the spdlog free functions, so it follows whatever this installs.
 */
Result<void> init_logging(const LogConfig& config);

} // namespace nestar
