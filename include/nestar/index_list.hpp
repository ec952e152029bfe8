#pragma once

#include <string>
#include <utility>
#include <vector>

namespace nestar {

// ============================================================================
// Inline Layout Index Document (META-INF/INDEX.LIST)
// ============================================================================
//
//   NestarIndex-Version: 1.0
//   <blank>
//   _NESTAR_CURRENT_ARCHIVE_
//   com/example/app/
//   <blank>
//   lib/util.pkg
//   util/
//   util/io/
//
// Each block names one archive locator followed by the namespace prefixes it
// provides. The sentinel locator denotes the outer container itself.

constexpr const char* INDEX_ENTRY = "META-INF/INDEX.LIST";
constexpr const char* INDEX_VERSION_LINE = "NestarIndex-Version: 1.0";
constexpr const char* INDEX_CURRENT_ARCHIVE = "_NESTAR_CURRENT_ARCHIVE_";

/// One (locator, namespace prefix) pair, in document order
struct IndexMapping {
    std::string locator;   // "" for the outer container, else "<archive>/"
    std::string prefix;    // "/"-terminated namespace prefix, no leading '/'
};

struct IndexParseResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> warnings;
    std::vector<IndexMapping> mappings;
};

/**
 * @brief Parse an index document
 *
 * An unrecognized version line yields ok with no mappings and a warning.
 */
IndexParseResult parse_index_list(const std::string& text);

} // namespace nestar
