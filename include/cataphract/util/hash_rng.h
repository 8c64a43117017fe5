#pragma once

#include <cstdint>
#include <string>

namespace cataphract::util {

// splitmix64 finalizer (Sebastiano Vigna). Not cryptographically secure.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Fold a value into a running seed. Order matters.
inline std::uint64_t mix_seed(std::uint64_t seed, std::uint64_t v) {
  return splitmix64(seed ^ (v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2)));
}

// FNV-1a over the bytes of `s`, folded into `seed`.
inline std::uint64_t mix_seed(std::uint64_t seed, const std::string& s) {
  std::uint64_t h = 1469598103934665603ull;
  for (unsigned char c : s) {
    h ^= c;
    h *= 1099511628211ull;
  }
  return mix_seed(seed, h);
}

// Stream of die faces derived from one seed. The same seed always yields the
// same faces, which is what lets an audited roll be re-derived.
class DieStream {
 public:
  explicit DieStream(std::uint64_t seed) : state_(seed) {}

  // Uniform face in [1, sides]; rejection sampling keeps it unbiased.
  int face(int sides) {
    if (sides <= 1) return 1;
    const std::uint64_t bound = static_cast<std::uint64_t>(sides);
    const std::uint64_t threshold = (std::uint64_t(0) - bound) % bound;
    for (;;) {
      state_ = splitmix64(state_);
      if (state_ >= threshold) return 1 + static_cast<int>(state_ % bound);
    }
  }

 private:
  std::uint64_t state_;
};

} // namespace cataphract::util
