#include "shiproute/core/grid_access.h"

#include <utility>

#include "shiproute/core/errors.h"

namespace shiproute {

GridAccess::GridAccess(std::shared_ptr<const CostGrid> grid, std::shared_ptr<const CostGridPathfinder> pathfinder,
                       double jitter)
    : grid_(std::move(grid)), pathfinder_(std::move(pathfinder)), jitter_(jitter) {
  if (!pathfinder_) pathfinder_ = std::make_shared<DijkstraPathfinder>();
}

const CostGrid& GridAccess::grid() const {
  if (!grid_) throw ConfigurationError("grid access: no cost grid attached");
  return *grid_;
}

Route GridAccess::route_between(const LatLon& from, const LatLon& to, util::Rng& rng) const {
  const CostGrid& g = grid();
  const GridCell start = g.nearest_cell(from);
  const GridCell end = g.nearest_cell(to);

  const CostSurface surface = g.shuffled_cost(rng, jitter_);
  PathfinderOptions opt;
  opt.fully_connected = true;
  opt.geometric = false;
  return g.to_coordinates(pathfinder_->find_path(surface, start, end, opt));
}

} // namespace shiproute
