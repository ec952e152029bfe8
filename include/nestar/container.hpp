#pragma once

/**
 * @file container.hpp
 * @brief Open an outer container and get a ready-to-use resolver
 *
 * @example
 * ```cpp
 * auto container = nestar::Container::open("app.zip");
 * if (container.isErr()) {
 *     std::cerr << container.error().toString() << "\n";
 *     return 1;
 * }
 * auto& c = *container.value();
 * auto bytes = c.resolver().resolve("util/Helper.bin");
 * auto lib = c.materializer().materialize("native/libfoo.so");
 * ```
 */

#include "nestar/archive.hpp"
#include "nestar/config.hpp"
#include "nestar/eager_strategy.hpp"
#include "nestar/lazy_strategy.hpp"
#include "nestar/manifest.hpp"
#include "nestar/materializer.hpp"
#include "nestar/registrar.hpp"
#include "nestar/resolver.hpp"

#include <memory>
#include <string>

namespace nestar {

class Container {
public:
    /**
     * @brief Open the container at `path`, build its index and wire the
     *        resolver chain, registrar and materializer
     *
     * The layout comes from `config.layout` when set, else from the
     * container's manifest (flat when unspecified).
     *
     * @return The container, or CORRUPT_ARCHIVE, INDEX_MISSING,
     *         UNSUPPORTED_VERSION, FILE_NOT_FOUND or IO_ERROR
     */
    static Result<std::unique_ptr<Container>> open(const std::string& path,
                                                   const Config& config = Config{});

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;

    const std::string& path() const { return path_; }
    const Manifest& manifest() const { return manifest_; }
    LayoutKind layout() const { return layout_; }

    const Resolver& resolver() const { return *resolver_; }
    NativeMaterializer& materializer() { return *materializer_; }
    const PackageRegistrar& registrar() const { return *registrar_; }

    /// Active strategy when the layout is flat, else nullptr
    const EagerStrategy* eager() const { return eager_; }

    /// Active strategy when the layout is inline, else nullptr
    const LazyStrategy* lazy() const { return lazy_; }

private:
    Container() = default;

    std::string path_;
    Manifest manifest_;
    LayoutKind layout_ = LayoutKind::Flat;

    std::unique_ptr<PackageRegistrar> registrar_;
    const EagerStrategy* eager_ = nullptr;
    const LazyStrategy* lazy_ = nullptr;
    std::unique_ptr<Resolver> resolver_;
    std::unique_ptr<NativeMaterializer> materializer_;
};

} // namespace nestar
