#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "shiproute/core/genetic_config.h"
#include "shiproute/core/route.h"
#include "shiproute/util/rng.h"

namespace shiproute {

using RoutePair = std::pair<Route, Route>;

// Two parents in, two children out.
class Crossover {
 public:
  static constexpr int kParents = 2;
  static constexpr int kOffsprings = 2;

  explicit Crossover(double probability = 1.0) : probability_(probability) {}
  virtual ~Crossover() = default;

  virtual RoutePair crossover(const Route& parent1, const Route& parent2, util::Rng& rng) const = 0;

  // One child pair per mating. With probability 1 - probability() a mating
  // passes its parents through unchanged. A mating whose splice throws an
  // Error is logged and passes through as well.
  std::vector<RoutePair> apply(const std::vector<RoutePair>& matings, util::Rng& rng) const;

  double probability() const { return probability_; }

 private:
  double probability_;
};

class GeneticCrossover : public Crossover {
 public:
  explicit GeneticCrossover(const GeneticConfig& cfg = {});

  // Dispatches on the configured strategy (two_point unless configured otherwise).
  RoutePair crossover(const Route& parent1, const Route& parent2, util::Rng& rng) const override;

  // Two-point splice with a synthesized connector.
  //
  // Cut indices c1, c2 are drawn independently in [1, min(len1, len2) - 2].
  //   child1 = parent1[0..=c1] ++ connector(parent1[c1], parent2[c2]) ++ parent2[c2..]
  //   child2 = parent2[0..=c1] ++ connector(parent2[c1], parent1[c2]) ++ parent1[c2..]
  // Both children take c1 for the head and c2 for the tail.
  // Throws InvalidRouteError if either parent has fewer than 3 waypoints.
  RoutePair crossover_noint(const Route& parent1, const Route& parent2, util::Rng& rng) const;

  // Splice at a waypoint both parents share (exact match), chosen at random.
  // Parents without a shared waypoint are returned unchanged.
  RoutePair cross_over(const Route& parent1, const Route& parent2, util::Rng& rng) const;

  // Points strictly between `start` and `end`, linearly interpolated in
  // lat/lon at fractions k/n, n = round(distance / spacing). Empty for n <= 1.
  Route connection(const LatLon& start, const LatLon& end) const;

  const GeneticConfig& config() const { return cfg_; }

 private:
  GeneticConfig cfg_;
};

std::unique_ptr<Crossover> make_crossover(const GeneticConfig& cfg = {});

} // namespace shiproute
