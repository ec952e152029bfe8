#pragma once

#include "nestar/locator.hpp"
#include "nestar/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace nestar {

// ============================================================================
// Resource Source
// ============================================================================

/**
 * @brief Anything that can answer "what bytes does logical path X resolve to"
 *
 * Strategies, fallback directories and the Resolver itself all implement this
 * contract, so resolvers can be chained in any order. Paths may carry a
 * leading '/', which is ignored. Implementations are immutable after
 * construction and may be queried from several threads at once.
 */
class ResourceSource {
public:
    virtual ~ResourceSource() = default;

    /// Bytes of the first match, or nullopt
    virtual std::optional<Bytes> resolve(const std::string& path) const = 0;

    /// Locator of the first match, or nullopt
    virtual std::optional<Locator> find(const std::string& path) const = 0;

    /// True if resolve() would succeed or `path` names a known namespace
    virtual bool exists(const std::string& path) const = 0;

    /// Every match, in priority order
    virtual std::vector<Locator> list_all(const std::string& path) const = 0;

    /// Short description for diagnostics
    virtual std::string describe() const = 0;
};

} // namespace nestar
