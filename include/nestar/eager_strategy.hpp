#pragma once

#include "nestar/archive.hpp"
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
// Eager Resolution Strategy (flat layout)
// ============================================================================

/**
 * @brief A path defined more than once with different content
 *
 * Identical duplicates are benign and never produce a record.
 */
struct ConflictRecord {
    std::string path;
    std::string first_origin;      // archive whose bytes are kept
    std::string duplicate_origin;  // archive whose bytes were shadowed
    std::string first_sha256;
    std::string duplicate_sha256;
};

struct EagerOptions {
    /// Entry suffixes treated as nested archives
    std::vector<std::string> archive_suffixes = {".zip", ".jar", ".pkg"};

    /// Directory against which Class-Path items outside the container are
    /// resolved; empty disables the lookup
    std::string base_directory;
};

/**
 * @brief Loads every entry of every nested archive into memory up front
 *
 * The container is walked depth-first in physical order. The first archive
 * to define a path wins; later definitions are kept only for list_all().
 */
class EagerStrategy : public ResourceSource {
public:
    /**
     * @brief Index the outer container and everything nested in it
     * @return The strategy, or the first structural error naming its archive
     */
    static Result<std::unique_ptr<EagerStrategy>> create(const ArchiveReader& outer,
                                                         const Manifest& manifest,
                                                         PackageRegistrar& registrar,
                                                         const EagerOptions& options = EagerOptions{});

    std::optional<Bytes> resolve(const std::string& path) const override;
    std::optional<Locator> find(const std::string& path) const override;
    bool exists(const std::string& path) const override;
    std::vector<Locator> list_all(const std::string& path) const override;
    std::string describe() const override;

    /// True if `path` names a directory seen in any archive
    bool is_known_namespace(const std::string& path) const;

    const std::vector<ConflictRecord>& conflicts() const { return conflicts_; }

    /// Archive origins in the order they were indexed
    const std::vector<std::string>& archives() const { return archives_; }

    size_t resource_count() const { return index_.size(); }

private:
    struct Occurrence {
        std::string origin;
        std::shared_ptr<const Bytes> data;
    };

    EagerStrategy(std::string root, EagerOptions options)
        : root_(std::move(root)), options_(std::move(options)) {}

    Result<void> index_archive(const ArchiveReader& reader,
                               const Manifest& governing,
                               PackageRegistrar& registrar);
    void add_resource(const std::string& path, const std::string& origin, Bytes bytes);
    void index_class_path(const Manifest& manifest, PackageRegistrar& registrar);

    std::string root_;
    EagerOptions options_;
    std::unordered_map<std::string, std::vector<Occurrence>> index_;
    std::unordered_set<std::string> namespaces_;
    std::vector<ConflictRecord> conflicts_;
    std::vector<std::string> archives_;
};

} // namespace nestar
