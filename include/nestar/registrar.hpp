#pragma once

#include "nestar/manifest.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nestar {

// ============================================================================
// Package Registrar
// ============================================================================

/**
 * @brief Declares each namespace exactly once
 *
 * The first registration of a namespace wins; later registrations of the same
 * namespace are no-ops rather than errors. Namespaces are keyed without
 * leading or trailing '/', so "util/" and "util" are the same namespace.
 * All methods are safe to call from multiple threads.
 */
class PackageRegistrar {
public:
    PackageRegistrar() = default;

    PackageRegistrar(const PackageRegistrar&) = delete;
    PackageRegistrar& operator=(const PackageRegistrar&) = delete;

    /// @return true if this call registered the namespace
    bool register_once(const std::string& name, const PackageInfo& metadata);

    bool contains(const std::string& name) const;

    std::optional<PackageInfo> lookup(const std::string& name) const;

    size_t size() const;

    /// Registered namespace keys, sorted
    std::vector<std::string> namespaces() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, PackageInfo> packages_;
};

} // namespace nestar
