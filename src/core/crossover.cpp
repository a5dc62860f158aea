#include "shiproute/core/crossover.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>

#include "shiproute/core/errors.h"
#include "shiproute/core/geo.h"
#include "shiproute/util/log.h"

namespace shiproute {
namespace {

std::size_t first_index_of(const Route& route, const LatLon& p) {
  return static_cast<std::size_t>(std::find(route.begin(), route.end(), p) - route.begin());
}

} // namespace

std::vector<RoutePair> Crossover::apply(const std::vector<RoutePair>& matings, util::Rng& rng) const {
  std::vector<RoutePair> out;
  out.reserve(matings.size());
  for (std::size_t i = 0; i < matings.size(); ++i) {
    const RoutePair& m = matings[i];
    if (!rng.chance(probability_)) {
      out.push_back(m);
      continue;
    }
    try {
      out.push_back(crossover(m.first, m.second, rng));
    } catch (const Error& e) {
      log::warn("genetic: crossover of mating " + std::to_string(i) + " skipped, parents kept: " + e.what());
      out.push_back(m);
    }
  }
  return out;
}

GeneticCrossover::GeneticCrossover(const GeneticConfig& cfg) : Crossover(cfg.crossover_probability), cfg_(cfg) {
  validate_genetic_config(cfg_);
}

RoutePair GeneticCrossover::crossover(const Route& parent1, const Route& parent2, util::Rng& rng) const {
  switch (cfg_.crossover_strategy) {
    case CrossoverStrategy::Intersection: return cross_over(parent1, parent2, rng);
    case CrossoverStrategy::TwoPoint: break;
  }
  return crossover_noint(parent1, parent2, rng);
}

RoutePair GeneticCrossover::crossover_noint(const Route& parent1, const Route& parent2, util::Rng& rng) const {
  validate_route(parent1, 3, "crossover (first parent)");
  validate_route(parent2, 3, "crossover (second parent)");

  const int min_len = static_cast<int>(std::min(parent1.size(), parent2.size()));
  const auto c1 = static_cast<std::size_t>(rng.uniform_int(1, min_len - 2));
  const auto c2 = static_cast<std::size_t>(rng.uniform_int(1, min_len - 2));

  const Route connect1 = connection(parent1[c1], parent2[c2]);
  const Route connect2 = connection(parent2[c1], parent1[c2]);

  Route child1(parent1.begin(), parent1.begin() + static_cast<std::ptrdiff_t>(c1 + 1));
  child1.insert(child1.end(), connect1.begin(), connect1.end());
  child1.insert(child1.end(), parent2.begin() + static_cast<std::ptrdiff_t>(c2), parent2.end());

  Route child2(parent2.begin(), parent2.begin() + static_cast<std::ptrdiff_t>(c1 + 1));
  child2.insert(child2.end(), connect2.begin(), connect2.end());
  child2.insert(child2.end(), parent1.begin() + static_cast<std::ptrdiff_t>(c2), parent1.end());

  if (log::level() <= log::Level::Debug) {
    log::debug("genetic: crossover cut at " + std::to_string(c1) + "/" + std::to_string(c2) + ", connectors " +
               std::to_string(connect1.size()) + "/" + std::to_string(connect2.size()) + " points");
  }
  return {std::move(child1), std::move(child2)};
}

RoutePair GeneticCrossover::cross_over(const Route& parent1, const Route& parent2, util::Rng& rng) const {
  Route shared;
  for (const auto& p : parent1) {
    if (std::find(parent2.begin(), parent2.end(), p) != parent2.end()) shared.push_back(p);
  }
  if (shared.empty()) return {parent1, parent2};

  const LatLon& pivot = shared[rng.index(shared.size())];
  const auto i1 = static_cast<std::ptrdiff_t>(first_index_of(parent1, pivot));
  const auto i2 = static_cast<std::ptrdiff_t>(first_index_of(parent2, pivot));

  Route child1(parent1.begin(), parent1.begin() + i1);
  child1.insert(child1.end(), parent2.begin() + i2, parent2.end());
  Route child2(parent2.begin(), parent2.begin() + i2);
  child2.insert(child2.end(), parent1.begin() + i1, parent1.end());
  return {std::move(child1), std::move(child2)};
}

Route GeneticCrossover::connection(const LatLon& start, const LatLon& end) const {
  const double d = geo::distance_m(start, end);
  const auto n = static_cast<long long>(std::llround(d / cfg_.connector_spacing_m));
  Route line;
  if (n <= 1) return line;

  const double dlat = (end.lat - start.lat) / static_cast<double>(n);
  const double dlon = (end.lon - start.lon) / static_cast<double>(n);
  line.reserve(static_cast<std::size_t>(n - 1));
  for (long long k = 1; k < n; ++k) {
    line.emplace_back(start.lat + dlat * static_cast<double>(k), start.lon + dlon * static_cast<double>(k));
  }
  return line;
}

std::unique_ptr<Crossover> make_crossover(const GeneticConfig& cfg) { return std::make_unique<GeneticCrossover>(cfg); }

} // namespace shiproute
