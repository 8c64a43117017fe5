#pragma once

#include <cstdint>
#include <string>

#include "cataphract/core/campaign.h"

namespace cataphract {

// Options controlling which parts of a Campaign are included in a digest.
struct DigestOptions {
  // Include the append-only audit log.
  bool include_audit{true};
};

// Compute a stable 64-bit digest of the in-memory campaign.
//
// Properties:
//  - Deterministic across runs/platforms (no dependence on unordered_map iteration order).
//  - Sensitive to ordering of queue-like vectors (order queues, ship routes).
std::uint64_t digest_campaign64(const Campaign& c, const DigestOptions& opt = {});

// Format a 64-bit digest as a fixed-width lowercase hex string.
std::string digest64_to_hex(std::uint64_t v);

} // namespace cataphract
