#include "shiproute/core/geo.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace shiproute::geo {
namespace {

// Central angle between two points (radians).
double central_angle(const LatLon& a, const LatLon& b) {
  const double p1 = deg2rad(a.lat);
  const double p2 = deg2rad(b.lat);
  const double dp = p2 - p1;
  const double dl = deg2rad(b.lon - a.lon);
  const double h = std::sin(dp / 2) * std::sin(dp / 2) +
                   std::cos(p1) * std::cos(p2) * std::sin(dl / 2) * std::sin(dl / 2);
  return 2.0 * std::atan2(std::sqrt(h), std::sqrt(std::max(0.0, 1.0 - h)));
}

double unroll(double lon, double ref) {
  while (lon - ref > 180.0) lon -= 360.0;
  while (lon - ref < -180.0) lon += 360.0;
  return lon;
}

// Into [-180, 180).
double wrap_lon(double lon) {
  double w = std::fmod(lon + 180.0, 360.0);
  if (w < 0.0) w += 360.0;
  return w - 180.0;
}

} // namespace

double distance_m(const LatLon& a, const LatLon& b) { return kEarthRadiusM * central_angle(a, b); }

double initial_course_deg(const LatLon& a, const LatLon& b) {
  if (a == b) return 0.0;
  const double p1 = deg2rad(a.lat);
  const double p2 = deg2rad(b.lat);
  const double dl = deg2rad(b.lon - a.lon);
  const double y = std::sin(dl) * std::cos(p2);
  const double x = std::cos(p1) * std::sin(p2) - std::sin(p1) * std::cos(p2) * std::cos(dl);
  const double c = std::fmod(rad2deg(std::atan2(y, x)) + 360.0, 360.0);
  return c >= 360.0 ? 0.0 : c;
}

LatLon interpolate(const LatLon& a, const LatLon& b, double fraction) {
  if (fraction <= 0.0) return a;
  if (fraction >= 1.0) return b;
  const double delta = central_angle(a, b);
  if (delta < 1e-15) return a;

  const double p1 = deg2rad(a.lat);
  const double l1 = deg2rad(a.lon);
  const double p2 = deg2rad(b.lat);
  const double l2 = deg2rad(b.lon);

  const double wa = std::sin((1.0 - fraction) * delta) / std::sin(delta);
  const double wb = std::sin(fraction * delta) / std::sin(delta);
  const double x = wa * std::cos(p1) * std::cos(l1) + wb * std::cos(p2) * std::cos(l2);
  const double y = wa * std::cos(p1) * std::sin(l1) + wb * std::cos(p2) * std::sin(l2);
  const double z = wa * std::sin(p1) + wb * std::sin(p2);

  const double lat = rad2deg(std::atan2(z, std::sqrt(x * x + y * y)));
  const double lon = rad2deg(std::atan2(y, x));
  return LatLon{lat, unroll(lon, a.lon)};
}

Route great_circle_route(const LatLon& source, const LatLon& destination, double step_m) {
  if (!(step_m > 0.0)) throw std::invalid_argument("great_circle_route: step must be positive");

  const double total = distance_m(source, destination);
  if (total <= 0.0) return Route{source, destination};

  const auto steps = static_cast<std::size_t>(std::ceil(total / step_m));
  Route route;
  route.reserve(steps + 1);
  for (std::size_t i = 0; i <= steps; ++i) {
    const double s = std::min(step_m * static_cast<double>(i), total);
    if (i == 0) {
      route.push_back(source);
    } else if (s >= total) {
      route.push_back(destination);
    } else {
      const LatLon p = interpolate(source, destination, s / total);
      route.emplace_back(p.lat, wrap_lon(p.lon));
    }
  }
  return route;
}

} // namespace shiproute::geo
