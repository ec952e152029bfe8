#include "nestar/eager_strategy.hpp"
#include "nestar/digest.hpp"
#include "nestar/platform.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace nestar {

namespace {

// Both forms of a directory name resolve to the same namespace
std::string directory_key(const std::string& path) {
    return namespace_key(normalize_logical_path(path));
}

std::string digest_or_empty(const Bytes& data) {
    auto hash = compute_sha256(data);
    return hash.ok ? hash.hex_digest : std::string();
}

} // namespace

// ============================================================================
// Indexing
// ============================================================================

Result<std::unique_ptr<EagerStrategy>> EagerStrategy::create(const ArchiveReader& outer,
                                                             const Manifest& manifest,
                                                             PackageRegistrar& registrar,
                                                             const EagerOptions& options) {
    std::unique_ptr<EagerStrategy> strategy(new EagerStrategy(outer.locator(), options));

    auto walked = strategy->index_archive(outer, manifest, registrar);
    if (walked.isErr()) {
        return Result<std::unique_ptr<EagerStrategy>>::err(walked.error());
    }

    strategy->index_class_path(manifest, registrar);

    spdlog::info("indexed {} resources from {} archives ({} conflicts)",
                 strategy->index_.size(), strategy->archives_.size(),
                 strategy->conflicts_.size());

    return Result<std::unique_ptr<EagerStrategy>>::ok(std::move(strategy));
}

Result<void> EagerStrategy::index_archive(const ArchiveReader& reader,
                                          const Manifest& governing,
                                          PackageRegistrar& registrar) {
    archives_.push_back(reader.locator());
    spdlog::debug("indexing {} ({} entries)", reader.locator(), reader.entry_count());

    PackageInfo package = governing.package_info();

    for (const auto& entry : reader.entries()) {
        if (entry.is_directory) {
            std::string key = directory_key(entry.name);
            if (key.empty()) {
                continue;
            }
            namespaces_.insert(key);
            registrar.register_once(key, package);
            continue;
        }

        auto bytes = reader.read(entry);
        if (bytes.isErr()) {
            return Result<void>::err(bytes.error());
        }

        if (has_suffix(entry.name, options_.archive_suffixes)) {
            std::string origin = nested_locator(reader.locator(), entry.name);
            auto inner = ArchiveReader::open_memory(bytes.takeValue(), origin);
            if (inner.isErr()) {
                return Result<void>::err(inner.error());
            }

            auto inner_manifest = read_manifest(*inner.value());
            if (inner_manifest.isErr()) {
                return Result<void>::err(inner_manifest.error());
            }

            // An inner archive without its own manifest inherits the parent's
            const Manifest& inner_governing =
                inner_manifest.value().attributes.empty() ? governing : inner_manifest.value();

            auto nested = index_archive(*inner.value(), inner_governing, registrar);
            if (nested.isErr()) {
                return nested;
            }
            continue;
        }

        add_resource(normalize_logical_path(entry.name), reader.locator(), bytes.takeValue());
    }

    return Result<void>::ok();
}

void EagerStrategy::add_resource(const std::string& path, const std::string& origin, Bytes bytes) {
    auto& occurrences = index_[path];

    if (occurrences.empty()) {
        occurrences.push_back({origin, std::make_shared<const Bytes>(std::move(bytes))});
        return;
    }

    const auto& first = occurrences.front();
    if (*first.data == bytes) {
        spdlog::trace("identical duplicate {} in {} (first in {})", path, origin, first.origin);
        occurrences.push_back({origin, first.data});
        return;
    }

    // Every archive carries its own metadata; differing copies are expected
    if (path.rfind("META-INF/", 0) == 0) {
        spdlog::debug("shadowed metadata {} in {} (first in {})", path, origin, first.origin);
        occurrences.push_back({origin, std::make_shared<const Bytes>(std::move(bytes))});
        return;
    }

    ConflictRecord record;
    record.path = path;
    record.first_origin = first.origin;
    record.duplicate_origin = origin;
    record.first_sha256 = digest_or_empty(*first.data);
    record.duplicate_sha256 = digest_or_empty(bytes);
    spdlog::warn("conflicting definitions of {}: keeping {}, ignoring {}",
                 path, record.first_origin, record.duplicate_origin);
    conflicts_.push_back(std::move(record));

    occurrences.push_back({origin, std::make_shared<const Bytes>(std::move(bytes))});
}

void EagerStrategy::index_class_path(const Manifest& manifest, PackageRegistrar& registrar) {
    auto items = manifest.class_path();
    if (items.empty()) {
        return;
    }

    std::unordered_set<std::string> visited(archives_.begin(), archives_.end());

    for (const auto& item : items) {
        if (visited.count(nested_locator(root_, item))) {
            continue;
        }
        if (options_.base_directory.empty()) {
            spdlog::debug("Class-Path item {} not in container and no base directory", item);
            continue;
        }

        std::string disk_path = join_path(options_.base_directory, item);
        if (!is_regular_file(disk_path)) {
            spdlog::debug("Class-Path item {} not found at {}", item, disk_path);
            continue;
        }

        auto reader = ArchiveReader::open_file(disk_path);
        if (reader.isErr()) {
            spdlog::warn("skipping Class-Path archive: {}", reader.error().toString());
            continue;
        }

        auto own = read_manifest(*reader.value());
        if (own.isErr()) {
            spdlog::warn("skipping Class-Path archive: {}", own.error().toString());
            continue;
        }
        const Manifest& governing = own.value().attributes.empty() ? manifest : own.value();

        auto walked = index_archive(*reader.value(), governing, registrar);
        if (walked.isErr()) {
            spdlog::warn("Class-Path archive {} partially indexed: {}",
                         disk_path, walked.error().toString());
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Bytes> EagerStrategy::resolve(const std::string& path) const {
    auto it = index_.find(normalize_logical_path(path));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return *it->second.front().data;
}

std::optional<Locator> EagerStrategy::find(const std::string& path) const {
    std::string logical = normalize_logical_path(path);
    auto it = index_.find(logical);
    if (it == index_.end()) {
        return std::nullopt;
    }
    const auto& first = it->second.front();
    return Locator::memory(first.origin, logical, first.data);
}

bool EagerStrategy::is_known_namespace(const std::string& path) const {
    std::string key = directory_key(path);
    return !key.empty() && namespaces_.count(key) != 0;
}

bool EagerStrategy::exists(const std::string& path) const {
    return index_.count(normalize_logical_path(path)) != 0 || is_known_namespace(path);
}

std::vector<Locator> EagerStrategy::list_all(const std::string& path) const {
    std::vector<Locator> result;
    std::string logical = normalize_logical_path(path);

    auto it = index_.find(logical);
    if (it != index_.end()) {
        for (const auto& occurrence : it->second) {
            result.push_back(Locator::memory(occurrence.origin, logical, occurrence.data));
        }
    }
    if (is_known_namespace(path)) {
        result.push_back(Locator::namespace_marker(directory_key(path)));
    }
    return result;
}

std::string EagerStrategy::describe() const {
    return "eager:" + root_;
}

} // namespace nestar
