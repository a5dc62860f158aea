#include <iostream>
#include <string>

#include "shiproute/core/errors.h"
#include "shiproute/core/route_io.h"
#include "shiproute/util/file_io.h"
#include "test_fakes.h"

#define SR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_route_io() {
  using namespace shiproute;

  SR_ASSERT(route_file_name(1) == "route_1.json");
  SR_ASSERT(route_file_name(12) == "route_12.json");

  testing::ScratchDir dir("route_io");

  // Write then read back exactly.
  {
    const Route r{{53.55, 8.57}, {54.123456789012345, 7.000000000000001}, {57.0, -3.25}};
    const std::string path = dir.file(route_file_name(1));
    write_route_file(path, r);
    SR_ASSERT(read_route_file(path) == r);

    // GeoJSON order: [lon, lat].
    const json::Value doc = json::parse(read_text_file(path));
    SR_ASSERT(doc.at("type").string_value() == "FeatureCollection");
    SR_ASSERT(doc.at("features").at(2).at("geometry").at("coordinates").at(0).number_value() == -3.25);
  }

  // Extra per-feature properties are ignored.
  {
    const std::string text =
        "{\"type\":\"FeatureCollection\",\"features\":["
        "{\"type\":\"Feature\",\"geometry\":{\"type\":\"Point\",\"coordinates\":[8.5,53.5]},"
        "\"properties\":{\"time\":\"2025-04-01 12:00:00\",\"fuel_consumption\":{\"value\":1.2,\"unit\":\"t\"}}},"
        "{\"type\":\"Feature\",\"geometry\":{\"type\":\"Point\",\"coordinates\":[9.5,54.5]},\"properties\":{}}]}";
    const std::string path = dir.file(route_file_name(2));
    write_text_file(path, text);
    const Route r = read_route_file(path);
    SR_ASSERT(r.size() == 2);
    SR_ASSERT(r[0] == LatLon(53.5, 8.5));
    SR_ASSERT(r[1] == LatLon(54.5, 9.5));
  }

  {
    bool threw = false;
    const std::string path = dir.file(route_file_name(9));
    try {
      (void)read_route_file(path);
    } catch (const MissingArtifactError& e) {
      threw = e.path() == path;
    }
    SR_ASSERT(threw);
  }

  // Malformed files are not silently replaced.
  {
    int errors = 0;
    const std::string broken = dir.file("broken.json");
    write_text_file(broken, "{\"type\":\"FeatureCollection\",\"features\":[");
    try {
      (void)read_route_file(broken);
    } catch (const InvalidRouteError&) {
      ++errors;
    }

    const std::string single = dir.file("single.json");
    write_route_file(single, Route{{1.0, 2.0}});
    try {
      (void)read_route_file(single);
    } catch (const InvalidRouteError&) {
      ++errors;
    }

    const std::string line = dir.file("line.json");
    write_text_file(line, "{\"type\":\"FeatureCollection\",\"features\":[{\"type\":\"Feature\",\"geometry\":"
                          "{\"type\":\"LineString\",\"coordinates\":[[1,2],[3,4]]}}]}");
    try {
      (void)read_route_file(line);
    } catch (const InvalidRouteError&) {
      ++errors;
    }
    SR_ASSERT(errors == 3);
  }

  return 0;
}
