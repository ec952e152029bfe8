/**
 * nestar CLI - Entry Point
 *
 * Inspect nested-archive containers and resolve resources from them.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

namespace nestar::cli::commands {
    void setup_info(CLI::App* app, GlobalOptions& opts);
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_materialize(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace nestar::cli;

    CLI::App app{"nestar - nested-archive resource resolver"};
    app.set_version_flag("-V,--version", NESTAR_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    app.add_option("--config", opts.config, "Configuration file (nestar.config.v1)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    auto* info_cmd = app.add_subcommand("info", "Describe a container and its index");
    commands::setup_info(info_cmd, opts);

    auto* resolve_cmd = app.add_subcommand("resolve", "Print the bytes a path resolves to");
    commands::setup_resolve(resolve_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List every match for a path");
    commands::setup_list(list_cmd, opts);

    auto* materialize_cmd = app.add_subcommand("materialize", "Write a native library to disk");
    commands::setup_materialize(materialize_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
