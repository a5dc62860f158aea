#pragma once

#include <vector>

#include "shiproute/core/route.h"

namespace shiproute {

// Exact element-wise equality: same length, same coordinates, same order.
bool is_duplicate(const Route& a, const Route& b);

class RouteDuplicateElimination {
 public:
  bool is_equal(const Individual& a, const Individual& b) const { return is_duplicate(a.route, b.route); }

  // Keeps the first individual of every group of equal routes, preserving order.
  std::vector<Individual> eliminate(const std::vector<Individual>& population) const;

  // As above, and also drops individuals equal to any member of `existing`.
  std::vector<Individual> eliminate(const std::vector<Individual>& population,
                                    const std::vector<Individual>& existing) const;
};

} // namespace shiproute
