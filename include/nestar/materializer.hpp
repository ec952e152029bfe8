#pragma once

/**
 * @file materializer.hpp
 * @brief Write natively loaded artifacts (shared libraries) to real files
 *
 * The OS loader can only map a file on disk, so a native library stored in a
 * container is copied to a fresh temporary file before it is handed out.
 * Each file is created exclusively, made read-only and executable, and is
 * removed again when the materializer is cleaned up or destroyed.
 */

#include "nestar/source.hpp"
#include "nestar/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nestar {

// ============================================================================
// Native Library Search
// ============================================================================

/// Where to look for a native library the container does not carry
class NativeLibrarySearch {
public:
    virtual ~NativeLibrarySearch() = default;

    /// Absolute path of the library, or nullopt
    virtual std::optional<std::string> find_library(const std::string& name) const = 0;
};

/// Looks for the library's file name in a list of directories, in order
class DirectoryLibrarySearch : public NativeLibrarySearch {
public:
    explicit DirectoryLibrarySearch(std::vector<std::string> directories)
        : directories_(std::move(directories)) {}

    std::optional<std::string> find_library(const std::string& name) const override;

private:
    std::vector<std::string> directories_;
};

// ============================================================================
// Native Materializer
// ============================================================================

enum class MaterializePolicy {
    AlwaysFresh,      // every request writes a new file
    ReusePerProcess   // the first file written for a path is handed out again
};

struct MaterializerOptions {
    std::vector<std::string> native_suffixes = {".so", ".dll", ".dylib"};
    std::string temp_dir;   // empty: get_temp_directory()
    MaterializePolicy policy = MaterializePolicy::AlwaysFresh;
};

class NativeMaterializer {
public:
    NativeMaterializer(const ResourceSource& source,
                       MaterializerOptions options = MaterializerOptions{},
                       std::shared_ptr<const NativeLibrarySearch> fallback = nullptr);
    ~NativeMaterializer();

    NativeMaterializer(const NativeMaterializer&) = delete;
    NativeMaterializer& operator=(const NativeMaterializer&) = delete;

    /// True if `path` carries one of the native suffixes
    bool is_native_library(const std::string& path) const;

    /**
     * @brief Produce an on-disk file for a native library
     * @return Absolute file path; nullopt if neither the source nor the
     *         fallback search knows the library; MATERIALIZE_FAILED if the
     *         file could not be written
     */
    Result<std::optional<std::string>> materialize(const std::string& path);

    /// Every file written so far, in creation order
    std::vector<std::string> materialized_files() const;

    /// Remove every file written so far; returns how many were removed
    size_t cleanup();

    /// Stop tracking the files written so far and leave them on disk
    std::vector<std::string> release();

private:
    std::mutex& lock_for(const std::string& path);

    const ResourceSource& source_;
    MaterializerOptions options_;
    std::shared_ptr<const NativeLibrarySearch> fallback_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> path_locks_;
    std::unordered_map<std::string, std::string> reused_;
    std::vector<std::string> files_;
};

} // namespace nestar
