#include "nestar/config.hpp"
#include "nestar/platform.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace nestar {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// nullopt when the key is absent; warns about non-string elements
std::optional<std::vector<std::string>> get_string_array(const nlohmann::json& j,
                                                         const std::string& key,
                                                         std::vector<std::string>& warnings) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    if (!j[key].is_array()) {
        warnings.push_back("invalid_configuration:" + key + " must be an array");
        return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto& elem : j[key]) {
        if (elem.is_string()) {
            result.push_back(elem.get<std::string>());
        } else {
            warnings.push_back("invalid_configuration:" + key + " element is not a string");
        }
    }
    return result;
}

bool is_known_log_level(const std::string& level) {
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "off"};
    for (const char* l : levels) {
        if (level == l) return true;
    }
    return false;
}

} // namespace

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        if (auto schema = get_string(j, "$schema")) {
            if (trim(*schema) != CONFIG_SCHEMA) {
                result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
                return result;
            }
        } else {
            result.error = "$schema missing";
            return result;
        }

        // "log" section
        if (j.contains("log") && j["log"].is_object()) {
            const auto& log = j["log"];
            if (auto level = get_string(log, "level")) {
                std::string lowered = to_lower(trim(*level));
                if (is_known_log_level(lowered)) {
                    result.config.log.level = lowered;
                } else {
                    result.warnings.push_back("invalid_configuration:log.level " + *level);
                }
            }
            if (auto file = get_string(log, "file")) {
                result.config.log.file = *file;
            }
        }

        if (auto layout = get_string(j, "layout")) {
            std::string lowered = to_lower(trim(*layout));
            if (lowered != "auto") {
                auto parsed = parse_layout_kind(lowered);
                if (parsed) {
                    result.config.layout = *parsed;
                } else {
                    result.warnings.push_back("invalid_configuration:layout " + *layout);
                }
            }
        }

        if (auto suffixes = get_string_array(j, "archive_suffixes", result.warnings)) {
            result.config.archive_suffixes = *suffixes;
        }
        if (auto suffixes = get_string_array(j, "native_suffixes", result.warnings)) {
            result.config.native_suffixes = *suffixes;
        }
        if (auto paths = get_string_array(j, "fallback_paths", result.warnings)) {
            result.config.fallback_paths = *paths;
        }
        if (auto paths = get_string_array(j, "native_search_paths", result.warnings)) {
            result.config.native_search_paths = *paths;
        }

        if (auto dir = get_string(j, "temp_dir")) {
            result.config.temp_dir = *dir;
        }

        // "materialize" section
        if (j.contains("materialize") && j["materialize"].is_object()) {
            const auto& mat = j["materialize"];
            if (mat.contains("reuse")) {
                if (mat["reuse"].is_boolean()) {
                    result.config.reuse_materialized = mat["reuse"].get<bool>();
                } else {
                    result.warnings.push_back("invalid_configuration:materialize.reuse must be a boolean");
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ConfigParseResult load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        ConfigParseResult result;
        result.error = "cannot open config file: " + path;
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str(), path);
}

void apply_env_overrides(Config& config) {
    if (auto level = get_env("NESTAR_LOG_LEVEL")) {
        std::string lowered = to_lower(trim(*level));
        if (is_known_log_level(lowered)) {
            config.log.level = lowered;
        }
    }
    if (auto file = get_env("NESTAR_LOG_FILE")) {
        config.log.file = *file;
    }
    if (auto dir = get_env("NESTAR_TMPDIR")) {
        config.temp_dir = *dir;
    }
}

} // namespace nestar
