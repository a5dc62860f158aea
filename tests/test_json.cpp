#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

#include "shiproute/util/json.h"

#define SR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

static std::string parse_error_message(const std::string& text) {
  try {
    (void)shiproute::json::parse(text);
  } catch (const shiproute::json::ParseError& e) {
    return std::string(e.what());
  }
  return {};
}

int test_json() {
  using namespace shiproute;

  // Shape of a route file written by an isofuel run.
  const std::string doc_text =
      "\xEF\xBB\xBF{\n"
      "  \"type\": \"FeatureCollection\",\n"
      "  \"features\": [\n"
      "    {\"type\": \"Feature\", \"geometry\": {\"type\": \"Point\", \"coordinates\": [7.5, 54.25]},\n"
      "     \"properties\": {\"time\": \"2025-04-01 12:00:00\", \"speed\": {\"value\": 6.0, \"unit\": \"m/s\"}}},\n"
      "    {\"type\": \"Feature\", \"geometry\": {\"type\": \"Point\", \"coordinates\": [-1e-2, 5.5E1]}}\n"
      "  ]\n"
      "}\n";
  const json::Value doc = json::parse(doc_text);
  SR_ASSERT(doc.is_object());
  SR_ASSERT(doc.at("type").string_value() == "FeatureCollection");
  const json::Array& features = doc.at("features").array();
  SR_ASSERT(features.size() == 2);
  SR_ASSERT(features[0].at("geometry").at("coordinates").at(0).number_value() == 7.5);
  SR_ASSERT(features[1].at("geometry").at("coordinates").at(0).number_value() == -0.01);
  SR_ASSERT(features[1].at("geometry").at("coordinates").at(1).number_value() == 55.0);
  SR_ASSERT(features[1].find("properties") == nullptr);
  SR_ASSERT(features[0].at("properties").at("speed").at("unit").string_value() == "m/s");

  // Escapes, including a surrogate pair.
  const json::Value s = json::parse("\"a\\n\\u00e9\\ud83d\\ude00\"");
  SR_ASSERT(*s.as_string() == "a\n\xC3\xA9\xF0\x9F\x98\x80");

  // Full double precision survives stringify -> parse.
  json::Object o;
  o["lat"] = 53.123456789012345;
  o["n"] = 3.0;
  o["flag"] = true;
  const std::string text = json::stringify(o, 0);
  SR_ASSERT(text.find("\"n\":3") != std::string::npos);
  const json::Value back = json::parse(text);
  SR_ASSERT(back.at("lat").number_value() == 53.123456789012345);
  SR_ASSERT(back.at("flag").bool_value() == true);

  // Errors carry line/col and a caret.
  {
    const std::string msg = parse_error_message("[\n  1,\n  ,\n  2\n]\n");
    SR_ASSERT(msg.find("line 3, col 3") != std::string::npos);
    SR_ASSERT(msg.find("unexpected") != std::string::npos);
    SR_ASSERT(msg.find("^") != std::string::npos);
  }
  {
    const std::string msg = parse_error_message("[\r\n  1,\r\n  ,\r\n  2\r\n]\r\n");
    SR_ASSERT(msg.find("line 3, col 3") != std::string::npos);
  }
  {
    const std::string msg = parse_error_message("{\n  \"a\": 1,\n  \"b\": 2");
    SR_ASSERT(msg.find("line 3, col 9") != std::string::npos);
    SR_ASSERT(msg.find("expected") != std::string::npos);
  }
  SR_ASSERT(!parse_error_message("{} x").empty());

  bool threw = false;
  try {
    (void)doc.at("missing");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  SR_ASSERT(threw);

  return 0;
}
