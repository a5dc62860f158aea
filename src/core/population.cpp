#include "shiproute/core/population.h"

#include <exception>
#include <stdexcept>

#include "shiproute/core/errors.h"
#include "shiproute/core/geo.h"
#include "shiproute/core/route_io.h"
#include "shiproute/util/file_io.h"
#include "shiproute/util/log.h"
#include "shiproute/util/strings.h"

namespace shiproute {

void LogPopulationObserver::on_initial_population(const LatLon& source, const LatLon& destination,
                                                  const std::vector<Route>& routes) {
  if (log::level() > log::Level::Debug) return;
  log::debug("genetic: initial population of " + std::to_string(routes.size()) + " routes from " +
             format_point(source) + " to " + format_point(destination));
  for (std::size_t i = 0; i < routes.size(); ++i) {
    double length_m = 0.0;
    for (std::size_t k = 1; k < routes[i].size(); ++k) length_m += geo::distance_m(routes[i][k - 1], routes[i][k]);
    log::debug("genetic:   route " + std::to_string(i + 1) + ": " + std::to_string(routes[i].size()) +
               " waypoints, " + format_fixed(length_m / 1000.0, 1) + " km");
  }
}

GeoJsonPopulationWriter::GeoJsonPopulationWriter(std::string dir) : dir_(std::move(dir)) {}

void GeoJsonPopulationWriter::on_initial_population(const LatLon&, const LatLon&,
                                                    const std::vector<Route>& routes) {
  try {
    ensure_dir(dir_);
    for (std::size_t i = 0; i < routes.size(); ++i) {
      write_route_file(join_path(dir_, route_file_name(i + 1)), routes[i]);
    }
  } catch (const std::runtime_error& e) {
    throw DiagnosticError("cannot write initial population to '" + dir_ + "': " + e.what());
  }
}

Initializer::Initializer(const LatLon& source, const LatLon& destination)
    : source_(source), destination_(destination), observer_(std::make_shared<LogPopulationObserver>()) {}

std::vector<Route> Initializer::initialize(std::size_t n_samples, util::Rng& rng) const {
  std::vector<Route> routes;
  routes.reserve(n_samples);
  for (std::size_t i = 0; i < n_samples; ++i) routes.push_back(sample(i, rng));
  notify(routes);
  return routes;
}

void Initializer::notify(const std::vector<Route>& routes) const {
  if (!observer_) return;
  try {
    observer_->on_initial_population(source_, destination_, routes);
  } catch (const std::exception& e) {
    log::warn(std::string("genetic: initial population diagnostics failed: ") + e.what());
  }
}

GridBasedPopulation::GridBasedPopulation(const LatLon& source, const LatLon& destination, GridAccess grid)
    : Initializer(source, destination), grid_(std::move(grid)) {
  if (!grid_.has_grid()) {
    throw ConfigurationError("For population type 'grid_based', a grid has to be provided!");
  }
}

Route GridBasedPopulation::sample(std::size_t, util::Rng& rng) const {
  Route route = grid_.route_between(source(), destination(), rng);
  // Cell centres snap the endpoints; put the exact ones back.
  if (route.size() < 2) return Route{source(), destination()};
  route.front() = source();
  route.back() = destination();
  return route;
}

FromGeojsonPopulation::FromGeojsonPopulation(const LatLon& source, const LatLon& destination,
                                             std::string route_folder, double great_circle_step_m)
    : Initializer(source, destination),
      route_folder_(std::move(route_folder)),
      great_circle_step_m_(great_circle_step_m) {
  if (!is_readable_dir(route_folder_)) {
    throw ConfigurationError("For population type 'from_geojson', a valid route path has to be provided! Got '" +
                             route_folder_ + "'.");
  }
  if (!(great_circle_step_m_ > 0.0)) {
    throw ConfigurationError("For population type 'from_geojson', the great circle step must be positive.");
  }
}

Route FromGeojsonPopulation::great_circle_route() const {
  return geo::great_circle_route(source(), destination(), great_circle_step_m_);
}

Route FromGeojsonPopulation::sample(std::size_t index, util::Rng&) const {
  const std::string path = join_path(route_folder_, route_file_name(index + 1));
  try {
    return read_route_file(path);
  } catch (const MissingArtifactError&) {
    log::warn("genetic: sample " + std::to_string(index + 1) + ": file '" + path +
              "' couldn't be found. Using great circle route (" + format_fixed(great_circle_step_m_ / 1000.0, 1) +
              " km steps) instead.");
    return great_circle_route();
  }
}

std::unique_ptr<Initializer> make_initializer(InitializerKind kind, const LatLon& source, const LatLon& destination,
                                              const std::string& route_folder,
                                              std::shared_ptr<const CostGrid> grid, const GeneticConfig& cfg,
                                              std::shared_ptr<const CostGridPathfinder> pathfinder) {
  try {
    switch (kind) {
      case InitializerKind::GridBased:
        if (!grid) throw ConfigurationError("For population type 'grid_based', a grid has to be provided!");
        return std::make_unique<GridBasedPopulation>(
            source, destination, GridAccess(std::move(grid), std::move(pathfinder), cfg.cost_jitter));
      case InitializerKind::FromGeojson:
        return std::make_unique<FromGeojsonPopulation>(source, destination, route_folder, cfg.great_circle_step_m);
    }
  } catch (const ConfigurationError& e) {
    log::error(std::string("genetic: ") + e.what());
    throw;
  }
  throw ConfigurationError("Population type is invalid!");
}

std::unique_ptr<Initializer> make_initializer(const std::string& kind, const LatLon& source,
                                              const LatLon& destination, const std::string& route_folder,
                                              std::shared_ptr<const CostGrid> grid, const GeneticConfig& cfg,
                                              std::shared_ptr<const CostGridPathfinder> pathfinder) {
  InitializerKind k{};
  try {
    k = initializer_kind_from_string(kind);
  } catch (const ConfigurationError& e) {
    log::error(std::string("genetic: ") + e.what());
    throw;
  }
  return make_initializer(k, source, destination, route_folder, std::move(grid), cfg, std::move(pathfinder));
}

std::unique_ptr<Initializer> make_initializer(const GeneticConfig& cfg, const LatLon& source,
                                              const LatLon& destination, std::shared_ptr<const CostGrid> grid,
                                              std::shared_ptr<const CostGridPathfinder> pathfinder) {
  log::set_level(cfg.log_level);
  return make_initializer(cfg.population_type, source, destination, cfg.route_folder, std::move(grid), cfg,
                          std::move(pathfinder));
}

} // namespace shiproute
