#pragma once

#include "nestar/source.hpp"

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nestar {

// ============================================================================
// Directory Source
// ============================================================================

/**
 * @brief Resolves logical paths against a directory on disk
 *
 * Used as a fallback behind a container strategy. A directory under the root
 * counts as a namespace. Paths with a ".." segment and the root itself
 * never match.
 */
class DirectorySource : public ResourceSource {
public:
    explicit DirectorySource(std::string root);

    std::optional<Bytes> resolve(const std::string& path) const override;
    std::optional<Locator> find(const std::string& path) const override;
    bool exists(const std::string& path) const override;
    std::vector<Locator> list_all(const std::string& path) const override;
    std::string describe() const override;

    const std::string& root() const { return root_; }

private:
    // Empty for the root or a path that climbs out of it
    std::optional<std::string> full_path(const std::string& path) const;

    std::string root_;
};

// ============================================================================
// Resolver
// ============================================================================

/**
 * @brief Single query surface over a primary strategy and its fallbacks
 *
 * Sources are consulted in order; the primary strategy always comes first.
 * resolve() and find() stop at the first source that answers, list_all()
 * concatenates every source's matches in chain order.
 */
class Resolver : public ResourceSource {
public:
    explicit Resolver(std::shared_ptr<const ResourceSource> primary);

    /// Append a fallback; call before the resolver is shared between threads
    void add_fallback(std::shared_ptr<const ResourceSource> fallback);

    std::optional<Bytes> resolve(const std::string& path) const override;
    std::optional<Locator> find(const std::string& path) const override;
    bool exists(const std::string& path) const override;
    std::vector<Locator> list_all(const std::string& path) const override;
    std::string describe() const override;

    /// Open the first match as a stream; FILE_NOT_FOUND if nothing matches
    Result<std::unique_ptr<std::istream>> open(const std::string& path) const;

    const ResourceSource& primary() const { return *chain_.front(); }

    const std::vector<std::shared_ptr<const ResourceSource>>& chain() const { return chain_; }

private:
    std::vector<std::shared_ptr<const ResourceSource>> chain_;
};

} // namespace nestar
