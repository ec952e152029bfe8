#pragma once

#include "nestar/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace nestar {

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Absolute, lexically normalized form of a path
std::string absolute_path(const std::string& path);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// Remove a file; false if it did not exist or could not be removed
bool remove_file(const std::string& path);

// Read a whole file into memory
Result<Bytes> read_file_bytes(const std::string& path);

// ============================================================================
// Temporary Files
// ============================================================================

// Directory used for temporary files: NESTAR_TMPDIR, then the system default
std::string get_temp_directory();

/**
 * @brief Create a new, uniquely named file and write `content` to it
 *
 * The name is `<dir>/<stem><random><suffix>`, created exclusively so two
 * callers can never receive the same file. The file is left with owner
 * read/write permissions; callers adjust them afterwards.
 */
Result<std::string> create_unique_file(const std::string& dir,
                                       const std::string& stem,
                                       const std::string& suffix,
                                       const Bytes& content);

// Restrict a file to owner read + owner execute (no write bits anywhere)
Result<void> set_read_execute_only(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Generate a UUID string
std::string generate_uuid();

} // namespace nestar
