#pragma once

#include <memory>
#include <string>
#include <vector>

#include "shiproute/core/genetic_config.h"
#include "shiproute/core/grid_access.h"
#include "shiproute/core/route.h"
#include "shiproute/core/ship_model.h"
#include "shiproute/util/rng.h"

namespace shiproute {

class Mutation {
 public:
  explicit Mutation(double probability) : probability_(probability) {}
  virtual ~Mutation() = default;

  // Unconditional perturbation. Never moves front() or back().
  virtual Route perturb(const Route& route, util::Rng& rng) const = 0;

  // Perturbs with probability `probability`; otherwise returns an unchanged copy.
  Route mutate(const Route& route, double probability, util::Rng& rng) const;

  // mutate() with the configured probability, once per individual. An
  // individual whose mutation throws an Error is logged and kept as is.
  std::vector<Route> apply(const std::vector<Route>& population, util::Rng& rng) const;

  double probability() const { return probability_; }

 private:
  double probability_;
};

class GridBasedMutation : public Mutation {
 public:
  // `grid` may be empty unless the configured strategy is delete_and_repath
  // (ConfigurationError otherwise). `constraints` may be null.
  GridBasedMutation(GridAccess grid, std::shared_ptr<const ConstraintList> constraints, const GeneticConfig& cfg = {});

  Route perturb(const Route& route, util::Rng& rng) const override;

  // Shift route[start..=end] diagonally by one random offset in
  // [-max_offset, max_offset] degrees (same offset on lat and lon).
  // Throws InvalidRouteError for routes shorter than 3 waypoints.
  Route mutate_move(const Route& route, util::Rng& rng) const;

  // Replace route[start..=end] with a pathfinder subpath between the cells of
  // route[start] and route[end] over a newly jittered grid.
  // Throws InvalidRouteError for routes shorter than 3 waypoints and
  // ConfigurationError when no grid is attached.
  Route mutate_delete(const Route& route, util::Rng& rng) const;

  const GeneticConfig& config() const { return cfg_; }

 private:
  // True if any waypoint is flagged by the constraint checker.
  bool touches_unsafe(const Route& route) const;

  GridAccess grid_;
  std::shared_ptr<const ConstraintList> constraints_;
  GeneticConfig cfg_;
};

// Builds a mutation operator by kind. Unknown kinds throw ConfigurationError.
std::unique_ptr<Mutation> make_mutation(MutationKind kind, std::shared_ptr<const ConstraintList> constraints,
                                        std::shared_ptr<const CostGrid> grid = nullptr,
                                        const GeneticConfig& cfg = {},
                                        std::shared_ptr<const CostGridPathfinder> pathfinder = nullptr);

std::unique_ptr<Mutation> make_mutation(const std::string& kind, std::shared_ptr<const ConstraintList> constraints,
                                        std::shared_ptr<const CostGrid> grid = nullptr,
                                        const GeneticConfig& cfg = {},
                                        std::shared_ptr<const CostGridPathfinder> pathfinder = nullptr);

// Builds the operator named by cfg.mutation_type.
std::unique_ptr<Mutation> make_mutation(const GeneticConfig& cfg, std::shared_ptr<const ConstraintList> constraints,
                                        std::shared_ptr<const CostGrid> grid = nullptr,
                                        std::shared_ptr<const CostGridPathfinder> pathfinder = nullptr);

} // namespace shiproute
