#include "shiproute/core/pathfinder.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <queue>
#include <string>

#include "shiproute/core/errors.h"

namespace shiproute {
namespace {

struct QueueItem {
  double cost{0.0};
  std::size_t index{0};
};

struct QueueComp {
  bool operator()(const QueueItem& a, const QueueItem& b) const {
    // priority_queue is a max-heap; return true if a should come after b.
    if (a.cost != b.cost) return a.cost > b.cost;
    return a.index > b.index;
  }
};

std::string cell_str(const GridCell& c) {
  return "(" + std::to_string(c.row) + ", " + std::to_string(c.col) + ")";
}

} // namespace

std::vector<GridCell> DijkstraPathfinder::find_path(const CostSurface& surface, const GridCell& start,
                                                    const GridCell& end, const PathfinderOptions& opt) const {
  if (!surface.passable(start)) {
    throw PathNotFoundError("pathfinder: start cell " + cell_str(start) + " is not traversable");
  }
  if (!surface.passable(end)) throw PathNotFoundError("pathfinder: end cell " + cell_str(end) + " is not traversable");

  const std::size_t n = static_cast<std::size_t>(surface.rows) * static_cast<std::size_t>(surface.cols);
  const auto idx = [&](const GridCell& c) { return static_cast<std::size_t>(c.row) * surface.cols + c.col; };
  const auto cell = [&](std::size_t i) {
    return GridCell{static_cast<int>(i / surface.cols), static_cast<int>(i % surface.cols)};
  };

  constexpr double kInf = std::numeric_limits<double>::infinity();
  constexpr std::size_t kNone = std::numeric_limits<std::size_t>::max();
  std::vector<double> dist(n, kInf);
  std::vector<std::size_t> prev(n, kNone);

  static const int kDr[8] = {-1, 1, 0, 0, -1, -1, 1, 1};
  static const int kDc[8] = {0, 0, -1, 1, -1, 1, -1, 1};
  const int neighbours = opt.fully_connected ? 8 : 4;

  const std::size_t s = idx(start);
  const std::size_t goal = idx(end);
  // The start cell's own cost is part of the path cost.
  dist[s] = opt.geometric ? 0.0 : surface.at(start);

  std::priority_queue<QueueItem, std::vector<QueueItem>, QueueComp> pq;
  pq.push(QueueItem{dist[s], s});

  while (!pq.empty()) {
    const QueueItem cur = pq.top();
    pq.pop();
    if (cur.cost > dist[cur.index]) continue;  // stale
    if (cur.index == goal) break;

    const GridCell here = cell(cur.index);
    const double here_cost = surface.at(here);
    for (int k = 0; k < neighbours; ++k) {
      const GridCell nb{here.row + kDr[k], here.col + kDc[k]};
      if (!surface.passable(nb)) continue;

      double step = surface.at(nb);
      if (opt.geometric) {
        const double len = (k < 4) ? 1.0 : std::sqrt(2.0);
        step = 0.5 * (here_cost + step) * len;
      }
      const double cand = cur.cost + step;
      const std::size_t ni = idx(nb);
      if (cand < dist[ni]) {
        dist[ni] = cand;
        prev[ni] = cur.index;
        pq.push(QueueItem{cand, ni});
      }
    }
  }

  if (!std::isfinite(dist[goal])) {
    throw PathNotFoundError("pathfinder: no traversable path from " + cell_str(start) + " to " + cell_str(end));
  }

  std::vector<GridCell> path;
  for (std::size_t at = goal; at != kNone; at = prev[at]) {
    path.push_back(cell(at));
    if (at == s) break;
  }
  std::reverse(path.begin(), path.end());
  return path;
}

} // namespace shiproute
