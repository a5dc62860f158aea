#include "shiproute/core/cost_grid.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "shiproute/core/errors.h"

namespace shiproute {
namespace {

bool strictly_monotonic(const std::vector<double>& axis) {
  if (axis.size() < 2) return true;
  const bool ascending = axis[1] > axis[0];
  for (std::size_t i = 1; i < axis.size(); ++i) {
    if (ascending ? !(axis[i] > axis[i - 1]) : !(axis[i] < axis[i - 1])) return false;
  }
  return true;
}

// Index of the axis value closest to v. Ties go to the lower index.
int nearest_index(const std::vector<double>& axis, double v) {
  int best = 0;
  double best_d = std::fabs(axis[0] - v);
  for (std::size_t i = 1; i < axis.size(); ++i) {
    const double d = std::fabs(axis[i] - v);
    if (d < best_d) {
      best_d = d;
      best = static_cast<int>(i);
    }
  }
  return best;
}

} // namespace

bool CostSurface::passable(const GridCell& c) const {
  if (!contains(c)) return false;
  const double v = at(c);
  return std::isfinite(v) && v >= 0.0;
}

CostGrid::CostGrid(std::vector<double> lats, std::vector<double> lons, std::vector<double> costs)
    : lats_(std::move(lats)), lons_(std::move(lons)) {
  if (lats_.empty() || lons_.empty()) {
    throw ConfigurationError("CostGrid: latitude and longitude axes must be non-empty");
  }
  if (!strictly_monotonic(lats_)) throw ConfigurationError("CostGrid: latitude axis must be strictly monotonic");
  if (!strictly_monotonic(lons_)) throw ConfigurationError("CostGrid: longitude axis must be strictly monotonic");
  if (costs.size() != lats_.size() * lons_.size()) {
    throw ConfigurationError("CostGrid: expected " + std::to_string(lats_.size() * lons_.size()) +
                             " cost values, got " + std::to_string(costs.size()));
  }
  base_.rows = static_cast<int>(lats_.size());
  base_.cols = static_cast<int>(lons_.size());
  base_.values = std::move(costs);
}

CostGrid CostGrid::regular(double lat0, double lon0, double step_deg, int rows, int cols, double cost) {
  if (rows <= 0 || cols <= 0 || !(step_deg > 0.0)) {
    throw ConfigurationError("CostGrid::regular: rows, cols and step must be positive");
  }
  std::vector<double> lats(static_cast<std::size_t>(rows));
  std::vector<double> lons(static_cast<std::size_t>(cols));
  for (int r = 0; r < rows; ++r) lats[static_cast<std::size_t>(r)] = lat0 + step_deg * r;
  for (int c = 0; c < cols; ++c) lons[static_cast<std::size_t>(c)] = lon0 + step_deg * c;
  std::vector<double> costs(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols), cost);
  return CostGrid(std::move(lats), std::move(lons), std::move(costs));
}

GridCell CostGrid::nearest_cell(const LatLon& p) const {
  return GridCell{nearest_index(lats_, p.lat), nearest_index(lons_, p.lon)};
}

LatLon CostGrid::coordinate(const GridCell& c) const {
  if (!base_.contains(c)) {
    throw InvalidRouteError("CostGrid: cell (" + std::to_string(c.row) + ", " + std::to_string(c.col) +
                            ") outside grid");
  }
  return LatLon{lats_[static_cast<std::size_t>(c.row)], lons_[static_cast<std::size_t>(c.col)]};
}

std::vector<GridCell> CostGrid::to_cells(const Route& points) const {
  std::vector<GridCell> out;
  out.reserve(points.size());
  for (const auto& p : points) out.push_back(nearest_cell(p));
  return out;
}

Route CostGrid::to_coordinates(const std::vector<GridCell>& cells) const {
  Route out;
  out.reserve(cells.size());
  for (const auto& c : cells) out.push_back(coordinate(c));
  return out;
}

CostSurface CostGrid::shuffled_cost(util::Rng& rng, double amplitude) const {
  CostSurface out = base_;
  for (double& v : out.values) {
    if (!std::isfinite(v) || v < 0.0) continue;
    v += amplitude * rng.next_u01();
  }
  return out;
}

} // namespace shiproute
