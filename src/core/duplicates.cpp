#include "shiproute/core/duplicates.h"

#include <algorithm>

namespace shiproute {

bool is_duplicate(const Route& a, const Route& b) { return a == b; }

std::vector<Individual> RouteDuplicateElimination::eliminate(const std::vector<Individual>& population) const {
  return eliminate(population, {});
}

std::vector<Individual> RouteDuplicateElimination::eliminate(const std::vector<Individual>& population,
                                                             const std::vector<Individual>& existing) const {
  const auto seen_in = [this](const std::vector<Individual>& pool, const Individual& ind) {
    return std::any_of(pool.begin(), pool.end(), [&](const Individual& other) { return is_equal(ind, other); });
  };

  std::vector<Individual> kept;
  kept.reserve(population.size());
  for (const auto& ind : population) {
    if (seen_in(existing, ind) || seen_in(kept, ind)) continue;
    kept.push_back(ind);
  }
  return kept;
}

} // namespace shiproute
