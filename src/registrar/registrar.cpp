#include "nestar/registrar.hpp"

#include <spdlog/spdlog.h>

namespace nestar {

bool PackageRegistrar::register_once(const std::string& name, const PackageInfo& metadata) {
    std::string key = namespace_key(name);
    if (key.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    bool inserted = packages_.emplace(key, metadata).second;
    if (inserted) {
        spdlog::trace("registered namespace {}", key);
    }
    return inserted;
}

bool PackageRegistrar::contains(const std::string& name) const {
    std::string key = namespace_key(name);
    std::lock_guard<std::mutex> lock(mutex_);
    return packages_.count(key) != 0;
}

std::optional<PackageInfo> PackageRegistrar::lookup(const std::string& name) const {
    std::string key = namespace_key(name);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = packages_.find(key);
    if (it == packages_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t PackageRegistrar::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return packages_.size();
}

std::vector<std::string> PackageRegistrar::namespaces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(packages_.size());
    for (const auto& kv : packages_) {
        result.push_back(kv.first);
    }
    return result;
}

} // namespace nestar
