#include "nestar/resolver.hpp"
#include "nestar/platform.hpp"

#include <spdlog/spdlog.h>

namespace nestar {

// ============================================================================
// DirectorySource
// ============================================================================

DirectorySource::DirectorySource(std::string root) : root_(std::move(root)) {}

std::optional<std::string> DirectorySource::full_path(const std::string& path) const {
    std::string logical = normalize_logical_path(path);
    if (namespace_key(logical).empty()) {
        return std::nullopt;
    }

    // Stay below the root
    size_t start = 0;
    while (start <= logical.size()) {
        size_t end = logical.find('/', start);
        if (end == std::string::npos) end = logical.size();
        if (logical.compare(start, end - start, "..") == 0) {
            spdlog::debug("rejecting {} outside {}", path, root_);
            return std::nullopt;
        }
        start = end + 1;
    }
    return join_path(root_, logical);
}

std::optional<Bytes> DirectorySource::resolve(const std::string& path) const {
    auto full = full_path(path);
    if (!full || !is_regular_file(*full)) {
        return std::nullopt;
    }
    auto bytes = read_file_bytes(*full);
    if (bytes.isErr()) {
        spdlog::warn("cannot read {}: {}", *full, bytes.error().toString());
        return std::nullopt;
    }
    return bytes.takeValue();
}

std::optional<Locator> DirectorySource::find(const std::string& path) const {
    auto full = full_path(path);
    if (!full || !is_regular_file(*full)) {
        return std::nullopt;
    }
    return Locator::file(*full);
}

bool DirectorySource::exists(const std::string& path) const {
    auto full = full_path(path);
    return full && path_exists(*full);
}

std::vector<Locator> DirectorySource::list_all(const std::string& path) const {
    std::vector<Locator> result;
    auto full = full_path(path);
    if (!full) {
        return result;
    }
    if (is_regular_file(*full)) {
        result.push_back(Locator::file(*full));
    } else if (is_directory(*full)) {
        std::string key = namespace_key(normalize_logical_path(path));
        if (!key.empty()) {
            result.push_back(Locator::namespace_marker(key));
        }
    }
    return result;
}

std::string DirectorySource::describe() const {
    return "dir:" + root_;
}

// ============================================================================
// Resolver
// ============================================================================

Resolver::Resolver(std::shared_ptr<const ResourceSource> primary) {
    chain_.push_back(std::move(primary));
}

void Resolver::add_fallback(std::shared_ptr<const ResourceSource> fallback) {
    spdlog::debug("resolver fallback: {}", fallback->describe());
    chain_.push_back(std::move(fallback));
}

std::optional<Bytes> Resolver::resolve(const std::string& path) const {
    for (const auto& source : chain_) {
        auto bytes = source->resolve(path);
        if (bytes) {
            return bytes;
        }
    }
    spdlog::debug("unresolved: {}", path);
    return std::nullopt;
}

std::optional<Locator> Resolver::find(const std::string& path) const {
    for (const auto& source : chain_) {
        auto locator = source->find(path);
        if (locator) {
            return locator;
        }
    }
    return std::nullopt;
}

bool Resolver::exists(const std::string& path) const {
    for (const auto& source : chain_) {
        if (source->exists(path)) {
            return true;
        }
    }
    return false;
}

std::vector<Locator> Resolver::list_all(const std::string& path) const {
    std::vector<Locator> result;
    for (const auto& source : chain_) {
        auto found = source->list_all(path);
        result.insert(result.end(), found.begin(), found.end());
    }
    return result;
}

std::string Resolver::describe() const {
    std::string out;
    for (const auto& source : chain_) {
        if (!out.empty()) out += " -> ";
        out += source->describe();
    }
    return out;
}

Result<std::unique_ptr<std::istream>> Resolver::open(const std::string& path) const {
    auto locator = find(path);
    if (!locator) {
        return Result<std::unique_ptr<std::istream>>::err(
            Error(ErrorCode::FILE_NOT_FOUND, "no resource at " + path));
    }
    return locator->open();
}

} // namespace nestar
