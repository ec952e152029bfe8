/**
 * nestar CLI - info command
 *
 * Describe a container: layout, format version, index and conflicts.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace nestar::cli::commands {

namespace {

struct InfoOptions {
    std::string container;
};

nlohmann::json package_to_json(const PackageInfo& info) {
    nlohmann::json j;
    if (!info.specification_title.empty()) j["specification_title"] = info.specification_title;
    if (!info.specification_version.empty()) j["specification_version"] = info.specification_version;
    if (!info.specification_vendor.empty()) j["specification_vendor"] = info.specification_vendor;
    if (!info.implementation_title.empty()) j["implementation_title"] = info.implementation_title;
    if (!info.implementation_version.empty()) j["implementation_version"] = info.implementation_version;
    if (!info.implementation_vendor.empty()) j["implementation_vendor"] = info.implementation_vendor;
    j["sealed"] = info.sealed;
    return j;
}

int cmd_info(const GlobalOptions& opts, const InfoOptions& info_opts) {
    auto container = open_container(opts, info_opts.container);
    if (!container) {
        return 1;
    }

    const auto& registrar = container->registrar();
    std::string version = container->manifest().format_version();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["container"] = container->path();
        j["layout"] = layout_to_string(container->layout());
        j["format_version"] = version;
        j["class_path"] = container->manifest().class_path();
        j["resolver"] = container->resolver().describe();

        nlohmann::json packages = nlohmann::json::object();
        for (const auto& name : registrar.namespaces()) {
            auto info = registrar.lookup(name);
            packages[name] = info ? package_to_json(*info) : nlohmann::json::object();
        }
        j["namespaces"] = packages;

        if (const auto* eager = container->eager()) {
            j["archives"] = eager->archives();
            j["resource_count"] = eager->resource_count();
            nlohmann::json conflicts = nlohmann::json::array();
            for (const auto& c : eager->conflicts()) {
                conflicts.push_back({
                    {"path", c.path},
                    {"first_origin", c.first_origin},
                    {"duplicate_origin", c.duplicate_origin},
                    {"first_sha256", c.first_sha256},
                    {"duplicate_sha256", c.duplicate_sha256},
                });
            }
            j["conflicts"] = conflicts;
        }

        if (const auto* lazy = container->lazy()) {
            nlohmann::json index = nlohmann::json::object();
            for (const auto& prefix : lazy->prefixes()) {
                index[prefix] = lazy->candidates(prefix);
            }
            j["index"] = index;
        }

        output_json(j);
        return 0;
    }

    std::cout << "Container: " << container->path() << std::endl;
    std::cout << "Layout: " << layout_to_string(container->layout()) << std::endl;
    std::cout << "Format version: " << (version.empty() ? "(unspecified)" : version) << std::endl;
    std::cout << "Resolver: " << container->resolver().describe() << std::endl;

    if (const auto* eager = container->eager()) {
        std::cout << "Archives (" << eager->archives().size() << "):" << std::endl;
        for (const auto& a : eager->archives()) {
            std::cout << "  " << a << std::endl;
        }
        std::cout << "Resources: " << eager->resource_count() << std::endl;
        if (!eager->conflicts().empty()) {
            std::cout << "Conflicts (" << eager->conflicts().size() << "):" << std::endl;
            for (const auto& c : eager->conflicts()) {
                std::cout << "  " << c.path << std::endl;
                std::cout << "    kept    " << c.first_origin << " (" << c.first_sha256 << ")" << std::endl;
                std::cout << "    ignored " << c.duplicate_origin << " (" << c.duplicate_sha256 << ")" << std::endl;
            }
        }
    }

    if (const auto* lazy = container->lazy()) {
        std::cout << "Index (" << lazy->prefixes().size() << " prefixes):" << std::endl;
        for (const auto& prefix : lazy->prefixes()) {
            std::cout << "  " << prefix << " ->";
            for (const auto& locator : lazy->candidates(prefix)) {
                std::cout << " " << (locator.empty() ? "<container>" : locator);
            }
            std::cout << std::endl;
        }
    }

    if (opts.verbose) {
        std::cout << "Namespaces (" << registrar.size() << "):" << std::endl;
        for (const auto& name : registrar.namespaces()) {
            std::cout << "  " << name << std::endl;
        }
    } else {
        std::cout << "Namespaces: " << registrar.size() << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_info(CLI::App* app, GlobalOptions& opts) {
    static InfoOptions info_opts;

    app->add_option("container", info_opts.container, "Outer container file")->required();

    app->callback([&opts]() {
        std::exit(cmd_info(opts, info_opts));
    });
}

} // namespace nestar::cli::commands
