#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "shiproute/core/route.h"
#include "shiproute/core/ship_model.h"
#include "shiproute/util/time.h"

namespace shiproute {

// Per-leg voyage parameters for a route sailed at constant speed.
// Leg i runs from waypoint i to waypoint i+1.
struct VoyageLegs {
  std::vector<double> courses;       // deg, [0, 360)
  std::vector<double> start_lats;
  std::vector<double> start_lons;
  std::vector<TimePoint> start_times;
  std::vector<double> distances;     // m
  std::vector<double> travel_times;  // s

  std::size_t size() const { return courses.size(); }
};

// Throws InvalidRouteError for routes shorter than 2 waypoints and
// ConfigurationError for a non-positive speed.
VoyageLegs per_waypoint_legs(const Route& route, TimePoint departure, double speed_m_s);

struct Evaluation {
  double fuel{0.0};               // kg, minimized
  int constraint_violations{0};   // feasible iff <= 0

  bool feasible() const { return constraint_violations <= 0; }
};

// Single-objective, single-constraint evaluation of a route: total fuel and
// the number of waypoints flagged unsafe.
//
// Holds only const collaborators, so one instance may evaluate many routes
// concurrently.
class RoutingProblem {
 public:
  static constexpr int kObjectives = 1;
  static constexpr int kConstraints = 1;

  // Throws ConfigurationError if `boat` or `constraints` is null.
  RoutingProblem(TimePoint departure_time, std::shared_ptr<const Boat> boat,
                 std::shared_ptr<const ConstraintList> constraints);

  Evaluation evaluate(const Route& route) const;

  // Evaluates and stores the result on the individual.
  void evaluate(Individual& ind) const;

  // Total fuel (kg) and the boat's per-leg parameters.
  // Fuel per leg is (rate [kg/h] / 3600) * travel time [s].
  std::pair<double, ShipParams> get_power(const Route& route) const;

  // Number of waypoints the constraint checker flags. Each waypoint is checked
  // on its own and without a time. A checker that does not answer with exactly
  // one flag per waypoint raises InvalidRouteError.
  int get_constraints(const Route& route) const;

  TimePoint departure_time() const { return departure_time_; }

 private:
  TimePoint departure_time_;
  std::shared_ptr<const Boat> boat_;
  std::shared_ptr<const ConstraintList> constraints_;
};

} // namespace shiproute
