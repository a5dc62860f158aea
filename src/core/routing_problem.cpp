#include "shiproute/core/routing_problem.h"

#include <cmath>
#include <string>

#include "shiproute/core/errors.h"
#include "shiproute/core/geo.h"
#include "shiproute/util/log.h"
#include "shiproute/util/strings.h"

namespace shiproute {

VoyageLegs per_waypoint_legs(const Route& route, TimePoint departure, double speed_m_s) {
  validate_route(route, 2, "voyage legs");
  if (!(speed_m_s > 0.0) || !std::isfinite(speed_m_s)) {
    throw ConfigurationError("voyage legs: boat speed must be positive, got " + format_fixed(speed_m_s));
  }

  const std::size_t n = route.size() - 1;
  VoyageLegs legs;
  legs.courses.reserve(n);
  legs.start_lats.reserve(n);
  legs.start_lons.reserve(n);
  legs.start_times.reserve(n);
  legs.distances.reserve(n);
  legs.travel_times.reserve(n);

  TimePoint t = departure;
  for (std::size_t i = 0; i < n; ++i) {
    const LatLon& a = route[i];
    const LatLon& b = route[i + 1];
    const double dist = geo::distance_m(a, b);
    const double dt = dist / speed_m_s;

    legs.courses.push_back(geo::initial_course_deg(a, b));
    legs.start_lats.push_back(a.lat);
    legs.start_lons.push_back(a.lon);
    legs.start_times.push_back(t);
    legs.distances.push_back(dist);
    legs.travel_times.push_back(dt);
    t = advance_seconds(t, dt);
  }
  return legs;
}

RoutingProblem::RoutingProblem(TimePoint departure_time, std::shared_ptr<const Boat> boat,
                               std::shared_ptr<const ConstraintList> constraints)
    : departure_time_(departure_time), boat_(std::move(boat)), constraints_(std::move(constraints)) {
  if (!boat_) throw ConfigurationError("routing problem: a boat model has to be provided");
  if (!constraints_) throw ConfigurationError("routing problem: a constraint list has to be provided");
}

Evaluation RoutingProblem::evaluate(const Route& route) const {
  Evaluation ev;
  ev.fuel = get_power(route).first;
  ev.constraint_violations = get_constraints(route);
  return ev;
}

void RoutingProblem::evaluate(Individual& ind) const {
  const Evaluation ev = evaluate(ind.route);
  ind.fuel = ev.fuel;
  ind.constraint_violations = ev.constraint_violations;
  ind.evaluated = true;
}

std::pair<double, ShipParams> RoutingProblem::get_power(const Route& route) const {
  const VoyageLegs legs = per_waypoint_legs(route, departure_time_, boat_->boat_speed());
  ShipParams params = boat_->ship_parameters(legs.courses, legs.start_lats, legs.start_lons, legs.start_times);
  if (params.fuel_rate.size() != legs.size()) {
    throw InvalidRouteError("routing problem: boat returned " + std::to_string(params.fuel_rate.size()) +
                            " fuel rates for " + std::to_string(legs.size()) + " legs");
  }

  double fuel = 0.0;
  for (std::size_t i = 0; i < legs.size(); ++i) fuel += (params.fuel_rate[i] / 3600.0) * legs.travel_times[i];

  if (log::level() <= log::Level::Debug) {
    log::debug("genetic: route with " + std::to_string(route.size()) + " waypoints departing " +
               format_utc(departure_time_) + " burns " + format_fixed(fuel, 1) + " kg");
  }
  return {fuel, std::move(params)};
}

int RoutingProblem::get_constraints(const Route& route) const {
  // TODO: pass the waypoint ETA once time-dependent constraints are supported.
  int count = 0;
  for (const auto& p : route) {
    const std::vector<bool> flags = constraints_->is_unsafe({p.lat}, {p.lon}, std::nullopt);
    if (flags.size() != 1) {
      throw InvalidRouteError("routing problem: constraint check returned " + std::to_string(flags.size()) +
                              " flags for 1 waypoint");
    }
    if (flags.front()) ++count;
  }
  return count;
}

} // namespace shiproute
