#pragma once

#include <memory>

#include "shiproute/core/cost_grid.h"
#include "shiproute/core/pathfinder.h"
#include "shiproute/core/route.h"
#include "shiproute/util/rng.h"

namespace shiproute {

// Grid capability shared by operators that route over the cost grid.
//
// Operators hold one of these by value. It only keeps const pointers, so copies
// are cheap and safe to use from several threads at once.
class GridAccess {
 public:
  GridAccess() = default;

  // A null pathfinder selects DijkstraPathfinder.
  explicit GridAccess(std::shared_ptr<const CostGrid> grid,
                      std::shared_ptr<const CostGridPathfinder> pathfinder = nullptr, double jitter = 1.0);

  bool has_grid() const { return grid_ != nullptr; }

  // Throws ConfigurationError when no grid is attached.
  const CostGrid& grid() const;

  double jitter() const { return jitter_; }

  // Least-cost cell path between the cells nearest to `from` and `to` over a
  // freshly jittered surface (8-connected, unit-step weighting), returned as
  // cell-centre coordinates.
  Route route_between(const LatLon& from, const LatLon& to, util::Rng& rng) const;

 private:
  std::shared_ptr<const CostGrid> grid_;
  std::shared_ptr<const CostGridPathfinder> pathfinder_;
  double jitter_{1.0};
};

} // namespace shiproute
