/**
 * nestar CLI - list command
 *
 * List every location a logical path resolves to, in priority order.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace nestar::cli::commands {

namespace {

struct ListOptions {
    std::string container;
    std::string path;
};

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    auto container = open_container(opts, list_opts.container);
    if (!container) {
        return 1;
    }

    auto matches = container->resolver().list_all(list_opts.path);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = !matches.empty();
        j["path"] = list_opts.path;
        nlohmann::json locators = nlohmann::json::array();
        for (const auto& locator : matches) {
            locators.push_back(locator.to_string());
        }
        j["matches"] = locators;
        output_json(j);
        return matches.empty() ? 1 : 0;
    }

    if (matches.empty()) {
        print_error("not found: " + list_opts.path, opts.json);
        return 1;
    }

    for (const auto& locator : matches) {
        std::cout << locator.to_string() << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    app->add_option("container", list_opts.container, "Outer container file")->required();
    app->add_option("path", list_opts.path, "Logical resource path or namespace")->required();

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

} // namespace nestar::cli::commands
