/**
 * nestar CLI - materialize command
 *
 * Write a native library from the container to a temporary file.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace nestar::cli::commands {

namespace {

struct MaterializeOptions {
    std::string container;
    std::string path;
    bool keep = false;
};

int cmd_materialize(const GlobalOptions& opts, const MaterializeOptions& mat_opts) {
    auto container = open_container(opts, mat_opts.container);
    if (!container) {
        return 1;
    }

    auto& materializer = container->materializer();
    if (!materializer.is_native_library(mat_opts.path)) {
        print_error("not a native library path: " + mat_opts.path, opts.json);
        return 1;
    }

    auto result = materializer.materialize(mat_opts.path);
    if (result.isErr()) {
        print_error(result.error().toString(), opts.json);
        return 1;
    }
    if (!result.value()) {
        print_error("not found: " + mat_opts.path, opts.json);
        return 1;
    }
    std::string file = *result.value();

    // Without --keep the file goes away with the container
    if (mat_opts.keep) {
        materializer.release();
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["path"] = mat_opts.path;
        if (mat_opts.keep) {
            j["file"] = file;
        }
        j["kept"] = mat_opts.keep;
        output_json(j);
    } else if (mat_opts.keep) {
        std::cout << file << std::endl;
    } else {
        std::cout << mat_opts.path << ": materialized and removed on exit; pass --keep to leave it on disk" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_materialize(CLI::App* app, GlobalOptions& opts) {
    static MaterializeOptions mat_opts;

    app->add_option("container", mat_opts.container, "Outer container file")->required();
    app->add_option("path", mat_opts.path, "Logical path of the native library")->required();
    app->add_flag("--keep", mat_opts.keep, "Leave the file on disk after exit");

    app->callback([&opts]() {
        std::exit(cmd_materialize(opts, mat_opts));
    });
}

} // namespace nestar::cli::commands
