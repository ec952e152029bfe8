/**
 * nestar CLI - Common utilities and types
 */

#pragma once

#include <nestar/config.hpp>
#include <nestar/container.hpp>
#include <nestar/logging.hpp>
#include <nestar/platform.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace nestar::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Load the effective configuration.
 * Priority: --config flag > NESTAR_CONFIG env > built-in defaults,
 * then NESTAR_* environment overrides, then -v / -q.
 */
inline bool load_cli_config(const GlobalOptions& opts, Config& out) {
    std::string path = opts.config;
    if (path.empty()) {
        path = get_env("NESTAR_CONFIG").value_or("");
    }

    Config config;
    if (!path.empty()) {
        auto parsed = load_config(path);
        if (!parsed.ok) {
            print_error("CONFIG_PARSE_ERROR: " + path + ": " + parsed.error, opts.json);
            return false;
        }
        for (const auto& w : parsed.warnings) {
            print_warning(w);
        }
        config = parsed.config;
    }

    apply_env_overrides(config);

    if (opts.verbose) {
        config.log.level = "debug";
    } else if (opts.quiet) {
        config.log.level = "error";
    }

    out = config;
    return true;
}

/**
 * Load configuration, set up logging and open a container.
 * Prints the error and returns nullptr on failure.
 */
inline std::unique_ptr<Container> open_container(const GlobalOptions& opts,
                                                 const std::string& container_path) {
    init_warning_collector(opts.json, opts.quiet);

    Config config;
    if (!load_cli_config(opts, config)) {
        return nullptr;
    }

    auto logging = init_logging(config.log);
    if (logging.isErr()) {
        print_error(logging.error().toString(), opts.json);
        return nullptr;
    }

    auto container = Container::open(container_path, config);
    if (container.isErr()) {
        print_error(container.error().toString(), opts.json);
        return nullptr;
    }
    return container.takeValue();
}

} // namespace nestar::cli
