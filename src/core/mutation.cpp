#include "shiproute/core/mutation.h"

#include <cstddef>
#include <string>
#include <utility>

#include "shiproute/core/errors.h"
#include "shiproute/util/log.h"

namespace shiproute {
namespace {

struct Segment {
  std::size_t start{0};
  std::size_t end{0};
};

// start in [1, n-2], end in [start, n-2]; never touches the endpoints.
Segment pick_segment(const Route& route, util::Rng& rng) {
  const int last_inner = static_cast<int>(route.size()) - 2;
  Segment s;
  s.start = static_cast<std::size_t>(rng.uniform_int(1, last_inner));
  s.end = static_cast<std::size_t>(rng.uniform_int(static_cast<int>(s.start), last_inner));
  return s;
}

} // namespace

Route Mutation::mutate(const Route& route, double probability, util::Rng& rng) const {
  if (!rng.chance(probability)) return route;
  return perturb(route, rng);
}

std::vector<Route> Mutation::apply(const std::vector<Route>& population, util::Rng& rng) const {
  std::vector<Route> out;
  out.reserve(population.size());
  for (std::size_t i = 0; i < population.size(); ++i) {
    try {
      out.push_back(mutate(population[i], probability_, rng));
    } catch (const Error& e) {
      log::warn("genetic: mutation of individual " + std::to_string(i) + " skipped, route kept: " + e.what());
      out.push_back(population[i]);
    }
  }
  return out;
}

GridBasedMutation::GridBasedMutation(GridAccess grid, std::shared_ptr<const ConstraintList> constraints,
                                     const GeneticConfig& cfg)
    : Mutation(cfg.mutation_probability), grid_(std::move(grid)), constraints_(std::move(constraints)), cfg_(cfg) {
  validate_genetic_config(cfg_);
  if (cfg_.mutation_strategy == MutationStrategy::DeleteAndRepath && !grid_.has_grid()) {
    throw ConfigurationError("For mutation strategy 'delete_and_repath', a grid has to be provided!");
  }
}

Route GridBasedMutation::perturb(const Route& route, util::Rng& rng) const {
  if (cfg_.mutation_strategy == MutationStrategy::DeleteAndRepath) return mutate_delete(route, rng);

  const int attempts = (cfg_.mutation_reject_unsafe && constraints_) ? cfg_.mutation_max_attempts : 1;
  Route out = mutate_move(route, rng);
  for (int a = 1; a < attempts && touches_unsafe(out); ++a) out = mutate_move(route, rng);
  return out;
}

Route GridBasedMutation::mutate_move(const Route& route, util::Rng& rng) const {
  validate_route(route, 3, "segment shift mutation");

  const Segment seg = pick_segment(route, rng);
  const double max_offset = cfg_.mutation_max_offset_deg;
  double offset = rng.uniform(-max_offset, max_offset);
  while (offset == 0.0 && max_offset > 0.0) offset = rng.uniform(-max_offset, max_offset);

  Route out = route;
  for (std::size_t i = seg.start; i <= seg.end; ++i) {
    out[i].lat += offset;
    out[i].lon += offset;
  }
  return out;
}

Route GridBasedMutation::mutate_delete(const Route& route, util::Rng& rng) const {
  validate_route(route, 3, "delete-and-repath mutation");

  const Segment seg = pick_segment(route, rng);
  const Route subpath = grid_.route_between(route[seg.start], route[seg.end], rng);

  Route out(route.begin(), route.begin() + static_cast<std::ptrdiff_t>(seg.start));
  out.insert(out.end(), subpath.begin(), subpath.end());
  out.insert(out.end(), route.begin() + static_cast<std::ptrdiff_t>(seg.end + 1), route.end());
  return out;
}

bool GridBasedMutation::touches_unsafe(const Route& route) const {
  if (!constraints_) return false;
  std::vector<double> lats;
  std::vector<double> lons;
  lats.reserve(route.size());
  lons.reserve(route.size());
  for (const auto& p : route) {
    lats.push_back(p.lat);
    lons.push_back(p.lon);
  }
  const std::vector<bool> flags = constraints_->is_unsafe(lats, lons, std::nullopt);
  for (const bool f : flags) {
    if (f) return true;
  }
  return false;
}

std::unique_ptr<Mutation> make_mutation(MutationKind kind, std::shared_ptr<const ConstraintList> constraints,
                                        std::shared_ptr<const CostGrid> grid, const GeneticConfig& cfg,
                                        std::shared_ptr<const CostGridPathfinder> pathfinder) {
  switch (kind) {
    case MutationKind::GridBased:
      return std::make_unique<GridBasedMutation>(GridAccess(std::move(grid), std::move(pathfinder), cfg.cost_jitter),
                                                 std::move(constraints), cfg);
  }
  throw ConfigurationError("Mutation type is invalid!");
}

std::unique_ptr<Mutation> make_mutation(const std::string& kind, std::shared_ptr<const ConstraintList> constraints,
                                        std::shared_ptr<const CostGrid> grid, const GeneticConfig& cfg,
                                        std::shared_ptr<const CostGridPathfinder> pathfinder) {
  MutationKind k{};
  try {
    k = mutation_kind_from_string(kind);
  } catch (const ConfigurationError& e) {
    log::error(std::string("genetic: ") + e.what());
    throw;
  }
  return make_mutation(k, std::move(constraints), std::move(grid), cfg, std::move(pathfinder));
}

std::unique_ptr<Mutation> make_mutation(const GeneticConfig& cfg, std::shared_ptr<const ConstraintList> constraints,
                                        std::shared_ptr<const CostGrid> grid,
                                        std::shared_ptr<const CostGridPathfinder> pathfinder) {
  return make_mutation(cfg.mutation_type, std::move(constraints), std::move(grid), cfg, std::move(pathfinder));
}

} // namespace shiproute
