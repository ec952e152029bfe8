#include "nestar/container.hpp"
#include "nestar/platform.hpp"

#include <spdlog/spdlog.h>

namespace nestar {

Result<std::unique_ptr<Container>> Container::open(const std::string& path, const Config& config) {
    using R = Result<std::unique_ptr<Container>>;

    // The inline layout needs name lookups; the flat layout only walks entries
    auto reader = ArchiveReader::open_file(path, ArchiveOpenMode::RandomAccess);
    if (reader.isErr()) {
        return R::err(reader.error());
    }
    std::shared_ptr<const ArchiveReader> outer(reader.takeValue());

    auto manifest = read_manifest(*outer);
    if (manifest.isErr()) {
        return R::err(manifest.error());
    }

    auto version = check_format_version(manifest.value());
    if (version.isErr()) {
        Error error = version.error();
        return R::err(error.withContext(path));
    }

    std::unique_ptr<Container> container(new Container());
    container->path_ = path;
    container->manifest_ = manifest.takeValue();
    container->registrar_ = std::make_unique<PackageRegistrar>();

    if (config.layout) {
        container->layout_ = *config.layout;
    } else if (auto declared = container->manifest_.layout()) {
        container->layout_ = *declared;
    } else {
        if (container->manifest_.get(MANIFEST_KEY_LAYOUT)) {
            spdlog::warn("{}: unrecognized {}, using flat", path, MANIFEST_KEY_LAYOUT);
        }
        container->layout_ = LayoutKind::Flat;
    }

    spdlog::debug("opening {} with {} layout", path, layout_to_string(container->layout_));

    std::shared_ptr<const ResourceSource> primary;
    if (container->layout_ == LayoutKind::Inline) {
        auto lazy = LazyStrategy::create(outer, container->manifest_, *container->registrar_);
        if (lazy.isErr()) {
            return R::err(lazy.error());
        }
        std::shared_ptr<const LazyStrategy> strategy(lazy.takeValue());
        container->lazy_ = strategy.get();
        primary = strategy;
    } else {
        EagerOptions options;
        options.archive_suffixes = config.archive_suffixes;
        options.base_directory = get_parent_directory(absolute_path(path));

        auto eager = EagerStrategy::create(*outer, container->manifest_, *container->registrar_, options);
        if (eager.isErr()) {
            return R::err(eager.error());
        }
        std::shared_ptr<const EagerStrategy> strategy(eager.takeValue());
        container->eager_ = strategy.get();
        primary = strategy;
    }

    container->resolver_ = std::make_unique<Resolver>(primary);
    for (const auto& dir : config.fallback_paths) {
        container->resolver_->add_fallback(std::make_shared<DirectorySource>(dir));
    }

    MaterializerOptions mat_options;
    mat_options.native_suffixes = config.native_suffixes;
    mat_options.temp_dir = config.temp_dir;
    mat_options.policy = config.reuse_materialized ? MaterializePolicy::ReusePerProcess
                                                   : MaterializePolicy::AlwaysFresh;

    std::shared_ptr<const NativeLibrarySearch> native_search;
    if (!config.native_search_paths.empty()) {
        native_search = std::make_shared<DirectoryLibrarySearch>(config.native_search_paths);
    }
    container->materializer_ = std::make_unique<NativeMaterializer>(
        *container->resolver_, mat_options, native_search);

    return R::ok(std::move(container));
}

} // namespace nestar
