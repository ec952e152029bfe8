#include "nestar/lazy_strategy.hpp"

#include <spdlog/spdlog.h>

namespace nestar {

namespace {

const std::vector<std::string> kNoCandidates;

// Top-level resources are indexed under their own name
std::string index_key(const std::string& logical) {
    std::string prefix = namespace_prefix(logical);
    return prefix.empty() ? logical : prefix;
}

} // namespace

Result<std::unique_ptr<LazyStrategy>> LazyStrategy::create(std::shared_ptr<const ArchiveReader> outer,
                                                           const Manifest& manifest,
                                                           PackageRegistrar& registrar) {
    using R = Result<std::unique_ptr<LazyStrategy>>;

    if (!outer->is_random_access()) {
        return R::err(Error(ErrorCode::IO_ERROR,
                            outer->locator() + ": inline layout needs a random-access reader"));
    }

    const ArchiveEntry* index_entry = outer->find(INDEX_ENTRY);
    if (!index_entry) {
        return R::err(Error(ErrorCode::INDEX_MISSING,
                            outer->locator() + ": no " + std::string(INDEX_ENTRY)));
    }

    auto bytes = outer->read(*index_entry);
    if (bytes.isErr()) {
        return R::err(bytes.error());
    }

    std::string text(bytes.value().begin(), bytes.value().end());
    IndexParseResult parsed = parse_index_list(text);
    if (!parsed.ok) {
        return R::err(Error(ErrorCode::CORRUPT_ARCHIVE,
                            outer->locator() + "!/" + INDEX_ENTRY + ": " + parsed.error));
    }

    std::unique_ptr<LazyStrategy> strategy(new LazyStrategy(outer));
    for (const auto& w : parsed.warnings) {
        spdlog::warn("{}: {}", INDEX_ENTRY, w);
        strategy->warnings_.push_back(w);
    }

    PackageInfo package = manifest.package_info();
    for (const auto& mapping : parsed.mappings) {
        auto it = strategy->table_.find(mapping.prefix);
        if (it == strategy->table_.end()) {
            strategy->prefixes_.push_back(mapping.prefix);
            it = strategy->table_.emplace(mapping.prefix, std::vector<std::string>{}).first;
        }
        it->second.push_back(mapping.locator);

        // Only '/'-terminated lines name a package directory
        if (mapping.prefix.empty() || mapping.prefix.back() != '/') {
            continue;
        }
        std::string key = namespace_key(mapping.prefix);
        if (!key.empty()) {
            strategy->namespaces_.insert(key);
            registrar.register_once(key, package);
        }
    }

    spdlog::info("loaded index of {} with {} namespace prefixes",
                 outer->locator(), strategy->prefixes_.size());

    return R::ok(std::move(strategy));
}

const std::vector<std::string>& LazyStrategy::candidates(const std::string& prefix) const {
    auto it = table_.find(prefix);
    return it == table_.end() ? kNoCandidates : it->second;
}

std::optional<Bytes> LazyStrategy::resolve(const std::string& path) const {
    std::string logical = normalize_logical_path(path);

    for (const auto& locator : candidates(index_key(logical))) {
        const ArchiveEntry* entry = outer_->find(locator + logical);
        if (!entry || entry->is_directory) {
            continue;
        }
        auto bytes = outer_->read(*entry);
        if (bytes.isErr()) {
            spdlog::warn("cannot read {}: {}", entry->name, bytes.error().toString());
            continue;
        }
        return bytes.takeValue();
    }
    return std::nullopt;
}

std::optional<Locator> LazyStrategy::find(const std::string& path) const {
    std::string logical = normalize_logical_path(path);

    for (const auto& locator : candidates(index_key(logical))) {
        const ArchiveEntry* entry = outer_->find(locator + logical);
        if (entry && !entry->is_directory) {
            return Locator::archive_member(outer_, entry->name);
        }
    }
    return std::nullopt;
}

bool LazyStrategy::is_known_namespace(const std::string& path) const {
    std::string key = namespace_key(normalize_logical_path(path));
    return !key.empty() && namespaces_.count(key) != 0;
}

bool LazyStrategy::exists(const std::string& path) const {
    return find(path).has_value() || is_known_namespace(path);
}

std::vector<Locator> LazyStrategy::list_all(const std::string& path) const {
    std::vector<Locator> result;
    std::string logical = normalize_logical_path(path);

    for (const auto& locator : candidates(index_key(logical))) {
        const ArchiveEntry* entry = outer_->find(locator + logical);
        if (entry && !entry->is_directory) {
            result.push_back(Locator::archive_member(outer_, entry->name));
        }
    }
    if (is_known_namespace(path)) {
        result.push_back(Locator::namespace_marker(namespace_key(logical)));
    }
    return result;
}

std::string LazyStrategy::describe() const {
    return "lazy:" + outer_->locator();
}

} // namespace nestar
