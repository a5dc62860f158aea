#include <cstddef>
#include <cstdint>
#include <iostream>
#include <vector>

#include "shiproute/core/crossover.h"
#include "shiproute/core/errors.h"
#include "test_fakes.h"

#define SR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

shiproute::Route along_lat(double lat, int n) {
  shiproute::Route r;
  for (int i = 0; i < n; ++i) r.emplace_back(lat, static_cast<double>(i));
  return r;
}

shiproute::Route concat(const shiproute::Route& a, std::size_t a_end, const shiproute::Route& mid,
                        const shiproute::Route& b, std::size_t b_begin) {
  shiproute::Route out(a.begin(), a.begin() + static_cast<std::ptrdiff_t>(a_end));
  out.insert(out.end(), mid.begin(), mid.end());
  out.insert(out.end(), b.begin() + static_cast<std::ptrdiff_t>(b_begin), b.end());
  return out;
}

} // namespace

int test_crossover() {
  using namespace shiproute;

  const GeneticCrossover xo;
  SR_ASSERT(Crossover::kParents == 2);
  SR_ASSERT(Crossover::kOffsprings == 2);
  SR_ASSERT(xo.probability() == 1.0);

  // Connector point counts follow round(distance / 50 km) - 1.
  {
    const Route one = xo.connection({0, 0}, {0, 1});
    SR_ASSERT(one.size() == 1);
    SR_ASSERT(one[0] == LatLon(0.0, 0.5));
    SR_ASSERT(xo.connection(LatLon(0, 0), LatLon(0, 0.3)).empty());
    SR_ASSERT(xo.connection(LatLon(0, 0), LatLon(0, 0)).empty());

    const Route three = xo.connection({0, 0}, {0, 2});
    SR_ASSERT(three.size() == 3);
    SR_ASSERT(three[0] == LatLon(0.0, 0.5));
    SR_ASSERT(three[2] == LatLon(0.0, 1.5));

    GeneticConfig fine;
    fine.connector_spacing_m = 10000.0;
    SR_ASSERT(GeneticCrossover(fine).connection(LatLon(0, 0), LatLon(0, 1)).size() == 10);
  }

  // Both children take c1 for their head and c2 for their tail.
  {
    const Route p1 = along_lat(0.0, 6);
    const Route p2 = along_lat(2.0, 8);
    for (std::uint64_t seed = 1; seed <= 40; ++seed) {
      util::Rng probe(seed);
      const auto c1 = static_cast<std::size_t>(probe.uniform_int(1, 4));
      const auto c2 = static_cast<std::size_t>(probe.uniform_int(1, 4));

      util::Rng rng(seed);
      const RoutePair kids = xo.crossover_noint(p1, p2, rng);
      const Route want1 = concat(p1, c1 + 1, xo.connection(p1[c1], p2[c2]), p2, c2);
      const Route want2 = concat(p2, c1 + 1, xo.connection(p2[c1], p1[c2]), p1, c2);
      SR_ASSERT(kids.first == want1);
      SR_ASSERT(kids.second == want2);
      SR_ASSERT(kids.first.front() == p1.front());
      SR_ASSERT(kids.first.back() == p2.back());
      SR_ASSERT(kids.second.front() == p2.front());
      SR_ASSERT(kids.second.back() == p1.back());
    }
  }

  // Parents sharing their endpoints pass them on.
  {
    const Route p1{{0, 0}, {0.5, 1}, {0.5, 2}, {0.5, 3}, {0, 4}};
    const Route p2{{0, 0}, {-0.5, 1}, {-0.5, 2}, {-0.5, 3}, {0, 4}};
    util::Rng rng(99);
    for (int i = 0; i < 25; ++i) {
      const RoutePair kids = xo.crossover(p1, p2, rng);
      SR_ASSERT(has_endpoints(kids.first, LatLon(0, 0), LatLon(0, 4)));
      SR_ASSERT(has_endpoints(kids.second, LatLon(0, 0), LatLon(0, 4)));
    }
  }

  // Minimal parents: the only cut is index 1.
  {
    const Route p1{{0, 0}, {1, 1}, {2, 2}};
    const Route p2{{0, 0}, {-1, 1}, {2, 2}};
    util::Rng rng(5);
    const RoutePair kids = xo.crossover_noint(p1, p2, rng);
    SR_ASSERT(kids.first.front() == LatLon(0, 0));
    SR_ASSERT(kids.first[1] == LatLon(1, 1));
    SR_ASSERT(kids.first.back() == LatLon(2, 2));
    SR_ASSERT(kids.second[1] == LatLon(-1, 1));
  }

  {
    int errors = 0;
    util::Rng rng(1);
    try {
      (void)xo.crossover_noint(Route{{0, 0}, {1, 1}}, along_lat(0.0, 5), rng);
    } catch (const InvalidRouteError&) {
      ++errors;
    }
    try {
      (void)xo.crossover_noint(along_lat(0.0, 5), Route{{0, 0}, {1, 1}}, rng);
    } catch (const InvalidRouteError&) {
      ++errors;
    }
    SR_ASSERT(errors == 2);
  }

  // Intersection splice.
  {
    GeneticConfig cfg;
    cfg.crossover_strategy = CrossoverStrategy::Intersection;
    const auto op = make_crossover(cfg);

    const Route p1{{1, 0}, {1, 1}, {0, 2}, {1, 3}, {1, 4}};
    const Route p2{{-1, 0}, {-1, 1}, {0, 2}, {-1, 3}, {-1, 4}};
    util::Rng rng(8);
    const RoutePair kids = op->crossover(p1, p2, rng);
    const Route want1{{1, 0}, {1, 1}, {0, 2}, {-1, 3}, {-1, 4}};
    const Route want2{{-1, 0}, {-1, 1}, {0, 2}, {1, 3}, {1, 4}};
    SR_ASSERT(kids.first == want1);
    SR_ASSERT(kids.second == want2);

    const Route q1 = along_lat(3.0, 4);
    const Route q2 = along_lat(4.0, 4);
    const RoutePair same = op->crossover(q1, q2, rng);
    SR_ASSERT(same.first == q1);
    SR_ASSERT(same.second == q2);
  }

  // Probability gate.
  {
    GeneticConfig off;
    off.crossover_probability = 0.0;
    const GeneticCrossover never(off);
    const std::vector<RoutePair> matings{{along_lat(0.0, 5), along_lat(1.0, 5)},
                                         {along_lat(2.0, 6), along_lat(3.0, 6)}};
    util::Rng rng(4);
    const auto out = never.apply(matings, rng);
    SR_ASSERT(out.size() == 2);
    SR_ASSERT(out[0] == matings[0]);
    SR_ASSERT(out[1] == matings[1]);

    util::Rng a(4);
    const auto spliced = xo.apply(matings, a);
    SR_ASSERT(spliced.size() == 2);
    SR_ASSERT(spliced[0].first.front() == LatLon(0, 0));
    SR_ASSERT(spliced[0].first.back() == LatLon(1, 4));
  }

  // A mating that cannot be spliced keeps its parents; the rest still cross.
  {
    testing::LogCapture cap(log::Level::Warn);
    const Route good1 = along_lat(0.0, 6);
    const Route good2 = along_lat(1.0, 6);
    const Route two_points{{5, 0}, {5, 5}};
    const std::vector<RoutePair> matings{{good1, good2}, {good1, two_points}, {good2, good1}};
    util::Rng rng(12);
    const auto out = xo.apply(matings, rng);
    SR_ASSERT(out.size() == 3);
    SR_ASSERT(out[1] == matings[1]);
    SR_ASSERT(out[0].first.front() == good1.front());
    SR_ASSERT(out[0].first.back() == good2.back());
    SR_ASSERT(out[2].first.front() == good2.front());
    SR_ASSERT(out[2].first.back() == good1.back());
    SR_ASSERT(cap.count(log::Level::Warn, "mating 1") == 1);
  }

  {
    GeneticConfig bad;
    bad.crossover_probability = 1.5;
    bool threw = false;
    try {
      GeneticCrossover op(bad);
    } catch (const ConfigurationError&) {
      threw = true;
    }
    SR_ASSERT(threw);
  }

  return 0;
}
