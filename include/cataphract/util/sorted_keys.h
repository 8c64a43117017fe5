#pragma once

#include <algorithm>
#include <vector>

namespace cataphract::util {

// Campaign arenas are std::unordered_map; anything that rolls dice or appends
// to the audit log while iterating them must go through sorted keys so the
// result does not depend on hash-table order.
template <typename Map>
inline std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& kv : m) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace cataphract::util
