#pragma once

#include <cstdint>

namespace cataphract {

// Every entity in a campaign is keyed by an opaque id drawn from
// Campaign::next_id. Cross references are always stored as ids.
using Id = std::uint64_t;
constexpr Id kInvalidId = 0;

} // namespace cataphract
