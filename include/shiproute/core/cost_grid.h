#pragma once

#include <cstddef>
#include <vector>

#include "shiproute/core/route.h"
#include "shiproute/util/rng.h"

namespace shiproute {

// Discrete (row, column) address into a CostGrid. Rows follow latitude,
// columns follow longitude.
struct GridCell {
  int row{0};
  int col{0};

  GridCell() = default;
  GridCell(int r, int c) : row(r), col(c) {}

  bool operator==(const GridCell& rhs) const { return row == rhs.row && col == rhs.col; }
  bool operator!=(const GridCell& rhs) const { return !(*this == rhs); }
};

// Row-major traversal cost values.
//
// Cells with a negative or non-finite cost are impassable.
struct CostSurface {
  int rows{0};
  int cols{0};
  std::vector<double> values;

  bool contains(const GridCell& c) const { return c.row >= 0 && c.row < rows && c.col >= 0 && c.col < cols; }
  double at(const GridCell& c) const { return values[static_cast<std::size_t>(c.row) * cols + c.col]; }
  double at(int row, int col) const { return values[static_cast<std::size_t>(row) * cols + col]; }
  bool passable(const GridCell& c) const;
};

// Immutable cost surface over a latitude/longitude lattice, plus the codec
// between geographic coordinates and cell indices.
//
// Shared read-only by every operator that needs it; nothing here mutates after
// construction, so concurrent use needs no locking.
class CostGrid {
 public:
  // `lats` (rows) and `lons` (columns) must each be strictly monotonic and
  // non-empty; `costs` holds lats.size() * lons.size() values, row-major.
  // Throws ConfigurationError otherwise.
  CostGrid(std::vector<double> lats, std::vector<double> lons, std::vector<double> costs);

  // Regular lattice starting at (lat0, lon0) with the given spacing.
  static CostGrid regular(double lat0, double lon0, double step_deg, int rows, int cols, double cost = 1.0);

  int rows() const { return static_cast<int>(lats_.size()); }
  int cols() const { return static_cast<int>(lons_.size()); }
  const std::vector<double>& lats() const { return lats_; }
  const std::vector<double>& lons() const { return lons_; }
  const CostSurface& base() const { return base_; }

  // Nearest cell to a point (clamped to the grid edge).
  GridCell nearest_cell(const LatLon& p) const;
  LatLon coordinate(const GridCell& c) const;

  std::vector<GridCell> to_cells(const Route& points) const;
  Route to_coordinates(const std::vector<GridCell>& cells) const;

  // Fresh randomized copy of the base surface: every passable cell gets
  // `amplitude * U[0,1)` added, impassable cells stay impassable. Each call
  // draws from `rng` only, so calls on separate streams are independent.
  CostSurface shuffled_cost(util::Rng& rng, double amplitude = 1.0) const;

 private:
  std::vector<double> lats_;
  std::vector<double> lons_;
  CostSurface base_;
};

} // namespace shiproute
