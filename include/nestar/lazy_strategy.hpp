#pragma once

#include "nestar/archive.hpp"
#include "nestar/index_list.hpp"
#include "nestar/manifest.hpp"
#include "nestar/registrar.hpp"
#include "nestar/source.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace nestar {

// ============================================================================
// Lazy Resolution Strategy (inline layout)
// ============================================================================

/**
 * @brief Resolves paths through the container's INDEX.LIST without loading
 *        any payload up front
 *
 * The namespace prefix of a requested path selects the candidate archive
 * locators in index order; a top-level path is looked up by its own name. Each candidate is tried as the container entry
 * "<locator><path>"; the first entry that reads successfully wins.
 */
class LazyStrategy : public ResourceSource {
public:
    /**
     * @param outer Outer container opened with ArchiveOpenMode::RandomAccess
     * @return The strategy, INDEX_MISSING if the container has no index,
     *         or the read error for the index entry
     */
    static Result<std::unique_ptr<LazyStrategy>> create(std::shared_ptr<const ArchiveReader> outer,
                                                        const Manifest& manifest,
                                                        PackageRegistrar& registrar);

    std::optional<Bytes> resolve(const std::string& path) const override;
    std::optional<Locator> find(const std::string& path) const override;
    bool exists(const std::string& path) const override;
    std::vector<Locator> list_all(const std::string& path) const override;
    std::string describe() const override;

    bool is_known_namespace(const std::string& path) const;

    /// Candidate locators for a namespace prefix or top-level name, empty if none
    const std::vector<std::string>& candidates(const std::string& prefix) const;

    /// Prefixes in index order
    const std::vector<std::string>& prefixes() const { return prefixes_; }

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    explicit LazyStrategy(std::shared_ptr<const ArchiveReader> outer) : outer_(std::move(outer)) {}

    std::shared_ptr<const ArchiveReader> outer_;
    std::unordered_map<std::string, std::vector<std::string>> table_;
    std::vector<std::string> prefixes_;
    std::unordered_set<std::string> namespaces_;
    std::vector<std::string> warnings_;
};

} // namespace nestar
