#pragma once

#include "shiproute/core/route.h"

namespace shiproute::geo {

// Spherical earth (IUGG mean radius). Accurate to ~0.5% against WGS84, which
// is plenty for seeding and splicing candidate routes.
constexpr double kEarthRadiusM = 6371008.8;
constexpr double kPi = 3.14159265358979323846;

inline double deg2rad(double d) { return d * kPi / 180.0; }
inline double rad2deg(double r) { return r * 180.0 / kPi; }

// Great-circle (haversine) distance in metres.
double distance_m(const LatLon& a, const LatLon& b);

// Initial course from a towards b, degrees clockwise from north in [0, 360).
// Returns 0 for coincident points.
double initial_course_deg(const LatLon& a, const LatLon& b);

// Point at `fraction` (0..1) of the great-circle arc from a to b.
// The longitude is unrolled to stay within 180 degrees of a.lon.
LatLon interpolate(const LatLon& a, const LatLon& b, double fraction);

// Equidistant waypoints along the great circle from source to destination.
//
// Steps are `step_m` long; the last one is clipped so it ends exactly on the
// destination. Coincident endpoints yield {source, destination}. Interior
// longitudes are wrapped into [-180, 180), like the endpoints they join.
Route great_circle_route(const LatLon& source, const LatLon& destination, double step_m);

} // namespace shiproute::geo
