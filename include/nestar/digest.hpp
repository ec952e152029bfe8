#pragma once

#include "nestar/types.hpp"

#include <string>

namespace nestar {

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

// Compute SHA-256 of an in-memory payload
HashResult compute_sha256(const Bytes& data);

} // namespace nestar
