#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "shiproute/core/genetic_config.h"
#include "shiproute/core/grid_access.h"
#include "shiproute/core/route.h"
#include "shiproute/util/rng.h"

namespace shiproute {

// Diagnostic hook invoked once an initial population is complete.
//
// Implementations may throw; the initializer logs the failure and carries on.
class PopulationObserver {
 public:
  virtual ~PopulationObserver() = default;
  virtual void on_initial_population(const LatLon& source, const LatLon& destination,
                                     const std::vector<Route>& routes) = 0;
};

// Logs a one-line summary per route at debug level.
class LogPopulationObserver : public PopulationObserver {
 public:
  void on_initial_population(const LatLon& source, const LatLon& destination,
                             const std::vector<Route>& routes) override;
};

// Writes each route as route_<i>.json into `dir`. The folder can later seed a
// from_geojson initializer.
class GeoJsonPopulationWriter : public PopulationObserver {
 public:
  explicit GeoJsonPopulationWriter(std::string dir);
  void on_initial_population(const LatLon& source, const LatLon& destination,
                             const std::vector<Route>& routes) override;

 private:
  std::string dir_;
};

// Produces the initial set of candidate routes.
class Initializer {
 public:
  Initializer(const LatLon& source, const LatLon& destination);
  virtual ~Initializer() = default;

  // Exactly `n_samples` routes, each running from source() to destination().
  // The observer is notified afterwards; its failures never propagate.
  std::vector<Route> initialize(std::size_t n_samples, util::Rng& rng) const;

  // Replaces the default LogPopulationObserver. Null disables notification.
  void set_observer(std::shared_ptr<PopulationObserver> observer) { observer_ = std::move(observer); }

  const LatLon& source() const { return source_; }
  const LatLon& destination() const { return destination_; }

  virtual InitializerKind kind() const = 0;

 protected:
  // Route for sample `index` (0-based).
  virtual Route sample(std::size_t index, util::Rng& rng) const = 0;

 private:
  void notify(const std::vector<Route>& routes) const;

  LatLon source_;
  LatLon destination_;
  std::shared_ptr<PopulationObserver> observer_;
};

// Seeds routes by running the pathfinder over a freshly jittered copy of the
// cost grid for every sample. The jitter is what makes samples differ.
class GridBasedPopulation : public Initializer {
 public:
  // Throws ConfigurationError if `grid` carries no cost grid.
  GridBasedPopulation(const LatLon& source, const LatLon& destination, GridAccess grid);

  InitializerKind kind() const override { return InitializerKind::GridBased; }

 protected:
  Route sample(std::size_t index, util::Rng& rng) const override;

 private:
  GridAccess grid_;
};

// Seeds routes from route_<i>.json files (e.g. the output of an isofuel run),
// falling back to the great-circle route for every missing file.
class FromGeojsonPopulation : public Initializer {
 public:
  // Throws ConfigurationError if `route_folder` is empty, missing, not a
  // directory or unreadable.
  FromGeojsonPopulation(const LatLon& source, const LatLon& destination, std::string route_folder,
                        double great_circle_step_m = 100000.0);

  InitializerKind kind() const override { return InitializerKind::FromGeojson; }

  const std::string& route_folder() const { return route_folder_; }

  Route great_circle_route() const;

 protected:
  Route sample(std::size_t index, util::Rng& rng) const override;

 private:
  std::string route_folder_;
  double great_circle_step_m_;
};

// Builds an initializer by kind.
//
// grid_based needs `grid`; from_geojson needs a readable `route_folder`.
// Anything missing or an unknown kind throws ConfigurationError.
std::unique_ptr<Initializer> make_initializer(InitializerKind kind, const LatLon& source, const LatLon& destination,
                                              const std::string& route_folder,
                                              std::shared_ptr<const CostGrid> grid, const GeneticConfig& cfg = {},
                                              std::shared_ptr<const CostGridPathfinder> pathfinder = nullptr);

std::unique_ptr<Initializer> make_initializer(const std::string& kind, const LatLon& source,
                                              const LatLon& destination, const std::string& route_folder,
                                              std::shared_ptr<const CostGrid> grid, const GeneticConfig& cfg = {},
                                              std::shared_ptr<const CostGridPathfinder> pathfinder = nullptr);

// Builds the initializer named by cfg.population_type, reading the route
// folder from cfg.route_folder, and applies cfg.log_level to the process log.
std::unique_ptr<Initializer> make_initializer(const GeneticConfig& cfg, const LatLon& source,
                                              const LatLon& destination, std::shared_ptr<const CostGrid> grid,
                                              std::shared_ptr<const CostGridPathfinder> pathfinder = nullptr);

} // namespace shiproute
