#pragma once

#include <cstddef>
#include <string>

#include "shiproute/core/route.h"
#include "shiproute/util/json.h"

namespace shiproute {

// Route files are GeoJSON FeatureCollections with one Point feature per
// waypoint. Coordinates are stored GeoJSON style as [longitude, latitude];
// any per-feature "properties" are ignored on read.

// File name for the i-th (1-indexed) route in a route folder: "route_<i>.json".
std::string route_file_name(std::size_t index_1based);

// Throws InvalidRouteError when the document is not a feature collection of
// points or holds fewer than two waypoints.
Route route_from_geojson(const json::Value& doc, const std::string& origin = "<memory>");

json::Value route_to_geojson(const Route& route);

// Throws MissingArtifactError if the file does not exist, InvalidRouteError if
// it cannot be parsed into a route.
Route read_route_file(const std::string& path);

void write_route_file(const std::string& path, const Route& route);

} // namespace shiproute
