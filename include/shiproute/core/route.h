#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace shiproute {

// Geographic position in degrees.
struct LatLon {
  double lat{0.0};
  double lon{0.0};

  LatLon() = default;
  LatLon(double lat_, double lon_) : lat(lat_), lon(lon_) {}

  // Exact equality. Routes are compared waypoint by waypoint without tolerance.
  bool operator==(const LatLon& rhs) const { return lat == rhs.lat && lon == rhs.lon; }
  bool operator!=(const LatLon& rhs) const { return !(*this == rhs); }
};

// Ordered waypoints from source to destination.
//
// Invariant once handed back to the optimizer: size() >= 2, front() is the
// problem source and back() the destination.
using Route = std::vector<LatLon>;

// A route together with its evaluation, as tracked by the optimizer.
struct Individual {
  Route route;

  // Total fuel (kg) over the whole voyage. Meaningful only when evaluated.
  double fuel{0.0};

  // Number of waypoints inside forbidden/unsafe areas. Feasible iff <= 0.
  int constraint_violations{0};

  bool evaluated{false};

  Individual() = default;
  explicit Individual(Route r) : route(std::move(r)) {}

  bool feasible() const { return evaluated && constraint_violations <= 0; }
};

// Throws InvalidRouteError when `route` has fewer than `min_size` waypoints.
// `what` names the operation in the message.
void validate_route(const Route& route, std::size_t min_size, const std::string& what);

// True if front()/back() match the given endpoints within `tol` degrees.
bool has_endpoints(const Route& route, const LatLon& source, const LatLon& destination, double tol = 0.0);

std::string format_point(const LatLon& p);

} // namespace shiproute
