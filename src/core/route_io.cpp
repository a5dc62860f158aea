#include "shiproute/core/route_io.h"

#include <stdexcept>

#include "shiproute/core/errors.h"
#include "shiproute/util/file_io.h"

namespace shiproute {

std::string route_file_name(std::size_t index_1based) { return "route_" + std::to_string(index_1based) + ".json"; }

Route route_from_geojson(const json::Value& doc, const std::string& origin) {
  const auto bad = [&](const std::string& why) { return InvalidRouteError(origin + ": " + why); };

  const json::Value* features = doc.find("features");
  if (!features || !features->is_array()) throw bad("expected a FeatureCollection with a 'features' array");

  Route route;
  route.reserve(features->array().size());
  std::size_t n = 0;
  for (const auto& feature : features->array()) {
    const json::Value* geometry = feature.find("geometry");
    const json::Value* coords = geometry ? geometry->find("coordinates") : nullptr;
    const json::Array* pair = coords ? coords->as_array() : nullptr;
    if (!pair || pair->size() < 2 || !(*pair)[0].is_number() || !(*pair)[1].is_number()) {
      throw bad("feature " + std::to_string(n) + " has no [lon, lat] point geometry");
    }
    route.emplace_back((*pair)[1].number_value(), (*pair)[0].number_value());
    ++n;
  }
  validate_route(route, 2, origin);
  return route;
}

json::Value route_to_geojson(const Route& route) {
  json::Array features;
  features.reserve(route.size());
  for (std::size_t i = 0; i < route.size(); ++i) {
    json::Object geometry;
    geometry["type"] = std::string("Point");
    geometry["coordinates"] = json::Array{route[i].lon, route[i].lat};

    json::Object feature;
    feature["type"] = std::string("Feature");
    feature["id"] = static_cast<double>(i);
    feature["geometry"] = std::move(geometry);
    feature["properties"] = json::Object{};
    features.push_back(std::move(feature));
  }

  json::Object doc;
  doc["type"] = std::string("FeatureCollection");
  doc["features"] = std::move(features);
  return doc;
}

Route read_route_file(const std::string& path) {
  if (!file_exists(path)) throw MissingArtifactError("route file not found: " + path, path);

  json::Value doc;
  try {
    doc = json::parse(read_text_file(path));
  } catch (const std::runtime_error& e) {
    throw InvalidRouteError(path + ": " + e.what());
  }
  return route_from_geojson(doc, path);
}

void write_route_file(const std::string& path, const Route& route) {
  write_text_file(path, json::stringify(route_to_geojson(route)) + "\n");
}

} // namespace shiproute
