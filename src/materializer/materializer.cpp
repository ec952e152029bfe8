#include "nestar/materializer.hpp"
#include "nestar/platform.hpp"

#include <spdlog/spdlog.h>

namespace nestar {

// ============================================================================
// DirectoryLibrarySearch
// ============================================================================

std::optional<std::string> DirectoryLibrarySearch::find_library(const std::string& name) const {
    std::string filename = get_filename(normalize_logical_path(name));
    for (const auto& dir : directories_) {
        std::string candidate = join_path(dir, filename);
        if (is_regular_file(candidate)) {
            return absolute_path(candidate);
        }
    }
    return std::nullopt;
}

// ============================================================================
// NativeMaterializer
// ============================================================================

NativeMaterializer::NativeMaterializer(const ResourceSource& source,
                                       MaterializerOptions options,
                                       std::shared_ptr<const NativeLibrarySearch> fallback)
    : source_(source), options_(std::move(options)), fallback_(std::move(fallback)) {}

NativeMaterializer::~NativeMaterializer() {
    cleanup();
}

bool NativeMaterializer::is_native_library(const std::string& path) const {
    return has_suffix(path, options_.native_suffixes);
}

std::mutex& NativeMaterializer::lock_for(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = path_locks_[path];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

Result<std::optional<std::string>> NativeMaterializer::materialize(const std::string& path) {
    using R = Result<std::optional<std::string>>;

    std::string logical = normalize_logical_path(path);
    if (!is_native_library(logical)) {
        spdlog::debug("not a native library: {}", logical);
        return R::ok(std::nullopt);
    }

    std::lock_guard<std::mutex> path_lock(lock_for(logical));

    if (options_.policy == MaterializePolicy::ReusePerProcess) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = reused_.find(logical);
        if (it != reused_.end() && is_regular_file(it->second)) {
            return R::ok(it->second);
        }
    }

    auto bytes = source_.resolve(logical);
    if (!bytes) {
        if (fallback_) {
            auto found = fallback_->find_library(logical);
            if (found) {
                spdlog::debug("native library {} found outside the container at {}", logical, *found);
                return R::ok(found);
            }
        }
        spdlog::debug("native library {} not found", logical);
        return R::ok(std::nullopt);
    }

    // "lib/libfoo.so" -> stem "libfoo", suffix ".so"
    std::string filename = get_filename(logical);
    std::string stem = filename;
    std::string suffix;
    auto dot = filename.rfind('.');
    if (dot != std::string::npos) {
        stem = filename.substr(0, dot);
        suffix = filename.substr(dot);
    }

    std::string dir = options_.temp_dir.empty() ? get_temp_directory() : options_.temp_dir;
    auto created = create_unique_file(dir, stem, suffix, *bytes);
    if (created.isErr()) {
        return R::err(Error(ErrorCode::MATERIALIZE_FAILED,
                            logical + ": " + created.error().message()));
    }
    std::string file = created.value();

    auto perms = set_read_execute_only(file);
    if (perms.isErr()) {
        remove_file(file);
        return R::err(Error(ErrorCode::MATERIALIZE_FAILED,
                            logical + ": " + perms.error().message()));
    }

    std::string absolute = absolute_path(file);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        files_.push_back(absolute);
        if (options_.policy == MaterializePolicy::ReusePerProcess) {
            reused_[logical] = absolute;
        }
    }

    spdlog::debug("materialized {} ({} bytes) to {}", logical, bytes->size(), absolute);
    return R::ok(absolute);
}

std::vector<std::string> NativeMaterializer::materialized_files() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_;
}

size_t NativeMaterializer::cleanup() {
    std::vector<std::string> files;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        files.swap(files_);
        reused_.clear();
    }

    size_t removed = 0;
    for (const auto& file : files) {
        if (remove_file(file)) {
            ++removed;
        } else {
            spdlog::warn("could not remove materialized file {}", file);
        }
    }
    return removed;
}

std::vector<std::string> NativeMaterializer::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;
    files.swap(files_);
    reused_.clear();
    return files;
}

} // namespace nestar
