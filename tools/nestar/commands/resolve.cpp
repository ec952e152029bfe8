/**
 * nestar CLI - resolve command
 *
 * Write the bytes a logical path resolves to, to stdout or a file.
 */

#include "../common.hpp"
#include <nestar/digest.hpp>
#include <CLI/CLI.hpp>

#include <fstream>

namespace nestar::cli::commands {

namespace {

struct ResolveOptions {
    std::string container;
    std::string path;
    std::string output;
};

int cmd_resolve(const GlobalOptions& opts, const ResolveOptions& resolve_opts) {
    auto container = open_container(opts, resolve_opts.container);
    if (!container) {
        return 1;
    }

    const auto& resolver = container->resolver();
    auto locator = resolver.find(resolve_opts.path);
    if (!locator) {
        print_error("not found: " + resolve_opts.path, opts.json);
        return 1;
    }

    auto bytes = locator->read_all();
    if (bytes.isErr()) {
        print_error(bytes.error().toString(), opts.json);
        return 1;
    }
    const Bytes& data = bytes.value();

    if (!resolve_opts.output.empty()) {
        std::ofstream out(resolve_opts.output, std::ios::binary | std::ios::trunc);
        if (!out) {
            print_error("cannot write " + resolve_opts.output, opts.json);
            return 1;
        }
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        if (!out) {
            print_error("cannot write " + resolve_opts.output, opts.json);
            return 1;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["path"] = resolve_opts.path;
        j["locator"] = locator->to_string();
        j["size"] = data.size();
        auto hash = compute_sha256(data);
        if (hash.ok) {
            j["sha256"] = hash.hex_digest;
        }
        if (!resolve_opts.output.empty()) {
            j["output"] = resolve_opts.output;
        }
        output_json(j);
        return 0;
    }

    if (resolve_opts.output.empty()) {
        std::cout.write(reinterpret_cast<const char*>(data.data()),
                        static_cast<std::streamsize>(data.size()));
        std::cout.flush();
    } else if (!opts.quiet) {
        std::cout << "Wrote " << data.size() << " bytes from " << locator->to_string()
                  << " to " << resolve_opts.output << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_resolve(CLI::App* app, GlobalOptions& opts) {
    static ResolveOptions resolve_opts;

    app->add_option("container", resolve_opts.container, "Outer container file")->required();
    app->add_option("path", resolve_opts.path, "Logical resource path")->required();
    app->add_option("-o,--output", resolve_opts.output, "Write bytes to this file instead of stdout");

    app->callback([&opts]() {
        std::exit(cmd_resolve(opts, resolve_opts));
    });
}

} // namespace nestar::cli::commands
