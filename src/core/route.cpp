#include "shiproute/core/route.h"

#include <cmath>

#include "shiproute/core/errors.h"
#include "shiproute/util/strings.h"

namespace shiproute {

void validate_route(const Route& route, std::size_t min_size, const std::string& what) {
  if (route.size() >= min_size) return;
  throw InvalidRouteError(what + ": route has " + std::to_string(route.size()) +
                          " waypoints, at least " + std::to_string(min_size) + " required");
}

bool has_endpoints(const Route& route, const LatLon& source, const LatLon& destination, double tol) {
  if (route.size() < 2) return false;
  const auto close = [tol](const LatLon& a, const LatLon& b) {
    return std::fabs(a.lat - b.lat) <= tol && std::fabs(a.lon - b.lon) <= tol;
  };
  return close(route.front(), source) && close(route.back(), destination);
}

std::string format_point(const LatLon& p) {
  return "(" + format_fixed(p.lat) + ", " + format_fixed(p.lon) + ")";
}

} // namespace shiproute
