#pragma once

#include <vector>

#include "shiproute/core/cost_grid.h"

namespace shiproute {

struct PathfinderOptions {
  // 8-connectivity when true, 4-connectivity otherwise.
  bool fully_connected{true};

  // false: every step costs the value of the cell entered (hop-count weighting
  //        on a uniform surface).
  // true:  a step costs the mean of both cells times the step length
  //        (1 orthogonal, sqrt(2) diagonal).
  bool geometric{false};
};

// Least-cost path search over a cost surface.
class CostGridPathfinder {
 public:
  virtual ~CostGridPathfinder() = default;

  // Returns the cell sequence from `start` to `end`, both inclusive.
  // Throws PathNotFoundError if either endpoint is outside the surface or
  // impassable, or if `end` cannot be reached.
  virtual std::vector<GridCell> find_path(const CostSurface& surface, const GridCell& start, const GridCell& end,
                                          const PathfinderOptions& opt = {}) const = 0;
};

// Dijkstra over the grid graph. Ties are broken by cell index so results are
// reproducible for a given surface.
class DijkstraPathfinder : public CostGridPathfinder {
 public:
  std::vector<GridCell> find_path(const CostSurface& surface, const GridCell& start, const GridCell& end,
                                  const PathfinderOptions& opt = {}) const override;
};

} // namespace shiproute
