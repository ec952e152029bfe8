#include "nestar/logging.hpp"

#include <algorithm>
#include <cctype>
#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace nestar {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "info") return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "off") return spdlog::level::off;
    return std::nullopt;
}

Result<void> init_logging(const LogConfig& config) {
    auto level = parse_log_level(config.level);
    if (!level) {
        return Result<void>::err(Error(ErrorCode::CONFIG_PARSE_ERROR,
                                       "unknown log level: " + config.level));
    }

    std::shared_ptr<spdlog::sinks::sink> sink;
    try {
        if (config.file.empty()) {
            sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        } else {
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file);
        }
    } catch (const spdlog::spdlog_ex& e) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "cannot open log file " + config.file + ": " + e.what()));
    }

    auto logger = std::make_shared<spdlog::logger>("nestar", sink);
    logger->set_level(*level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    spdlog::set_default_logger(logger);
    return Result<void>::ok();
}

} // namespace nestar
