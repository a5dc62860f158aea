#include <iostream>
#include <set>

#include "shiproute/util/rng.h"

#define SR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_rng() {
  using shiproute::util::Rng;

  // Same seed, same stream.
  {
    Rng a(42);
    Rng b(42);
    for (int i = 0; i < 100; ++i) SR_ASSERT(a.next_u64() == b.next_u64());
  }

  // Inclusive integer bounds are both reachable and never exceeded.
  {
    Rng r(7);
    std::set<int> seen;
    for (int i = 0; i < 2000; ++i) {
      const int v = r.uniform_int(1, 4);
      SR_ASSERT(v >= 1 && v <= 4);
      seen.insert(v);
    }
    SR_ASSERT(seen.size() == 4);
    SR_ASSERT(r.uniform_int(3, 3) == 3);
  }

  {
    Rng r(9);
    for (int i = 0; i < 1000; ++i) {
      const double u = r.uniform(-1.0, 1.0);
      SR_ASSERT(u >= -1.0 && u < 1.0);
      SR_ASSERT(r.index(5) < 5);
    }
    SR_ASSERT(!r.chance(0.0));
    SR_ASSERT(r.chance(1.0));
  }

  // Forked streams differ from the parent and from each other.
  {
    Rng parent(123);
    Rng c1 = parent.fork();
    Rng c2 = parent.fork();
    const auto x1 = c1.next_u64();
    const auto x2 = c2.next_u64();
    SR_ASSERT(x1 != x2);

    Rng replay(123);
    Rng r1 = replay.fork();
    SR_ASSERT(r1.next_u64() == x1);
  }

  return 0;
}
