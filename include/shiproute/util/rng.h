#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace shiproute::util {

// splitmix64 mixing step (Sebastiano Vigna).
//
// Not cryptographically secure. Used both to advance Rng streams and to derive
// independent child seeds in Rng::fork().
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Explicit random source handed to every operator call.
//
// Operators never keep one of these as a member; the caller owns the stream.
// Two streams built from the same seed produce the same draws, which is what
// the tests rely on. For parallel evaluation give each task its own fork().
class Rng {
 public:
  explicit Rng(std::uint64_t seed) : state_(seed) {}

  std::uint64_t next_u64() {
    state_ = splitmix64(state_);
    return state_;
  }

  // Uniform double in [0,1) from the top 53 bits.
  double next_u01() {
    return static_cast<double>(next_u64() >> 11) * (1.0 / 9007199254740992.0);
  }

  // Unbiased integer in [lo, hi] (inclusive). Bounds may be given in either order.
  int uniform_int(int lo, int hi) {
    if (hi < lo) std::swap(lo, hi);
    const std::uint64_t span = static_cast<std::uint64_t>(static_cast<std::int64_t>(hi) - lo) + 1ULL;
    return lo + static_cast<int>(bounded(span));
  }

  // Index in [0, n). Returns 0 for n <= 1.
  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    return static_cast<std::size_t>(bounded(static_cast<std::uint64_t>(n)));
  }

  // Uniform double in [lo, hi).
  double uniform(double lo, double hi) {
    if (hi < lo) std::swap(lo, hi);
    return lo + (hi - lo) * next_u01();
  }

  // True with probability p (p <= 0 never, p >= 1 always).
  bool chance(double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    return next_u01() < p;
  }

  // Derives an independent stream and advances this one.
  Rng fork() { return Rng(splitmix64(next_u64() ^ 0xd1b54a32d192ed03ULL)); }

 private:
  std::uint64_t bounded(std::uint64_t bound_exclusive) {
    if (bound_exclusive <= 1) return 0;
    // Rejection sampling against the largest multiple of the bound.
    const std::uint64_t threshold = (std::uint64_t(0) - bound_exclusive) % bound_exclusive;
    for (;;) {
      const std::uint64_t r = next_u64();
      if (r >= threshold) return r % bound_exclusive;
    }
  }

  std::uint64_t state_{0};
};

} // namespace shiproute::util
