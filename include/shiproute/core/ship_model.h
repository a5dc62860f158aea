#pragma once

#include <optional>
#include <vector>

#include "shiproute/util/time.h"

namespace shiproute {

// Per-leg output of a boat performance model. Only fuel_rate is required; the
// other vectors are filled by models that compute them.
struct ShipParams {
  // Fuel consumption rate per leg (kg/h).
  std::vector<double> fuel_rate;

  // Engine power per leg (W).
  std::vector<double> power;

  // Speed through water per leg (m/s).
  std::vector<double> speed;
};

// Ship performance model.
class Boat {
 public:
  virtual ~Boat() = default;

  // Nominal speed used to time the voyage (m/s).
  virtual double boat_speed() const = 0;

  // One entry per leg in every returned vector that the model fills.
  virtual ShipParams ship_parameters(const std::vector<double>& courses_deg, const std::vector<double>& lats,
                                     const std::vector<double>& lons,
                                     const std::vector<TimePoint>& times) const = 0;
};

// Forbidden/unsafe area check (land, depth, traffic separation, ...).
class ConstraintList {
 public:
  virtual ~ConstraintList() = default;

  // One flag per point; true marks the point unsafe. `time` may be absent.
  virtual std::vector<bool> is_unsafe(const std::vector<double>& lats, const std::vector<double>& lons,
                                      const std::optional<TimePoint>& time) const = 0;
};

} // namespace shiproute
