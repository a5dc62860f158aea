#include "shiproute/core/genetic_config.h"

#include <cmath>
#include <set>
#include <stdexcept>

#include "shiproute/core/errors.h"
#include "shiproute/util/file_io.h"
#include "shiproute/util/strings.h"

namespace shiproute {
namespace {

std::string key_of(const std::string& s) { return to_lower(trim(s)); }

double number_field(const json::Value& doc, const char* key, double def) {
  const json::Value* v = doc.find(key);
  if (!v) return def;
  if (!v->is_number()) throw ConfigurationError(std::string("config: '") + key + "' must be a number");
  return v->number_value();
}

std::string string_field(const json::Value& doc, const char* key, const std::string& def) {
  const json::Value* v = doc.find(key);
  if (!v) return def;
  if (!v->is_string()) throw ConfigurationError(std::string("config: '") + key + "' must be a string");
  return v->string_value();
}

bool bool_field(const json::Value& doc, const char* key, bool def) {
  const json::Value* v = doc.find(key);
  if (!v) return def;
  if (!v->is_bool()) throw ConfigurationError(std::string("config: '") + key + "' must be true or false");
  return v->bool_value();
}

void require_probability(double p, const char* name) {
  if (!(p >= 0.0 && p <= 1.0)) {
    throw ConfigurationError(std::string("config: ") + name + " must be within [0, 1], got " + format_fixed(p));
  }
}

void require_positive(double v, const char* name) {
  if (!(v > 0.0) || !std::isfinite(v)) {
    throw ConfigurationError(std::string("config: ") + name + " must be positive, got " + format_fixed(v));
  }
}

void require_non_negative(double v, const char* name) {
  if (!(v >= 0.0) || !std::isfinite(v)) {
    throw ConfigurationError(std::string("config: ") + name + " must not be negative, got " + format_fixed(v));
  }
}

} // namespace

std::string initializer_kind_to_string(InitializerKind k) {
  switch (k) {
    case InitializerKind::GridBased: return "grid_based";
    case InitializerKind::FromGeojson: return "from_geojson";
  }
  return "grid_based";
}

InitializerKind initializer_kind_from_string(const std::string& s) {
  const std::string k = key_of(s);
  if (k == "grid_based") return InitializerKind::GridBased;
  if (k == "from_geojson") return InitializerKind::FromGeojson;
  throw ConfigurationError("Population type '" + s + "' is invalid! Expected grid_based or from_geojson.");
}

std::string mutation_kind_to_string(MutationKind k) {
  switch (k) {
    case MutationKind::GridBased: return "grid_based";
  }
  return "grid_based";
}

MutationKind mutation_kind_from_string(const std::string& s) {
  if (key_of(s) == "grid_based") return MutationKind::GridBased;
  throw ConfigurationError("Mutation type '" + s + "' is invalid! Expected grid_based.");
}

std::string crossover_strategy_to_string(CrossoverStrategy s) {
  switch (s) {
    case CrossoverStrategy::TwoPoint: return "two_point";
    case CrossoverStrategy::Intersection: return "intersection";
  }
  return "two_point";
}

CrossoverStrategy crossover_strategy_from_string(const std::string& s) {
  const std::string k = key_of(s);
  if (k == "two_point") return CrossoverStrategy::TwoPoint;
  if (k == "intersection") return CrossoverStrategy::Intersection;
  throw ConfigurationError("Crossover strategy '" + s + "' is invalid! Expected two_point or intersection.");
}

std::string mutation_strategy_to_string(MutationStrategy s) {
  switch (s) {
    case MutationStrategy::Move: return "move";
    case MutationStrategy::DeleteAndRepath: return "delete_and_repath";
  }
  return "move";
}

MutationStrategy mutation_strategy_from_string(const std::string& s) {
  const std::string k = key_of(s);
  if (k == "move") return MutationStrategy::Move;
  if (k == "delete_and_repath") return MutationStrategy::DeleteAndRepath;
  throw ConfigurationError("Mutation strategy '" + s + "' is invalid! Expected move or delete_and_repath.");
}

void validate_genetic_config(const GeneticConfig& cfg) {
  require_probability(cfg.mutation_probability, "mutation_probability");
  require_probability(cfg.crossover_probability, "crossover_probability");
  require_positive(cfg.connector_spacing_m, "connector_spacing_m");
  require_positive(cfg.great_circle_step_m, "great_circle_step_m");
  require_positive(cfg.mutation_max_offset_deg, "mutation_max_offset_deg");
  require_non_negative(cfg.cost_jitter, "cost_jitter");
  if (cfg.mutation_max_attempts < 1) {
    throw ConfigurationError("config: mutation_max_attempts must be at least 1, got " +
                             std::to_string(cfg.mutation_max_attempts));
  }
}

GeneticConfig genetic_config_from_json(const json::Value& doc) {
  if (!doc.is_object()) throw ConfigurationError("config: top-level JSON value must be an object");

  static const std::set<std::string> kKnown = {
      "population_type",       "mutation_type",          "crossover_strategy",     "mutation_strategy",
      "route_folder",          "mutation_probability",   "crossover_probability",  "connector_spacing_m",
      "great_circle_step_m",   "mutation_max_offset_deg", "cost_jitter",           "mutation_reject_unsafe",
      "mutation_max_attempts", "log_level"};
  for (const auto& kv : doc.object()) {
    if (!kKnown.count(kv.first)) log::warn("genetic: ignoring unknown config key '" + kv.first + "'");
  }

  GeneticConfig cfg;
  if (doc.find("population_type")) {
    cfg.population_type = initializer_kind_from_string(string_field(doc, "population_type", ""));
  }
  if (doc.find("mutation_type")) {
    cfg.mutation_type = mutation_kind_from_string(string_field(doc, "mutation_type", ""));
  }
  if (doc.find("crossover_strategy")) {
    cfg.crossover_strategy = crossover_strategy_from_string(string_field(doc, "crossover_strategy", ""));
  }
  if (doc.find("mutation_strategy")) {
    cfg.mutation_strategy = mutation_strategy_from_string(string_field(doc, "mutation_strategy", ""));
  }
  cfg.route_folder = string_field(doc, "route_folder", cfg.route_folder);
  cfg.mutation_probability = number_field(doc, "mutation_probability", cfg.mutation_probability);
  cfg.crossover_probability = number_field(doc, "crossover_probability", cfg.crossover_probability);
  cfg.connector_spacing_m = number_field(doc, "connector_spacing_m", cfg.connector_spacing_m);
  cfg.great_circle_step_m = number_field(doc, "great_circle_step_m", cfg.great_circle_step_m);
  cfg.mutation_max_offset_deg = number_field(doc, "mutation_max_offset_deg", cfg.mutation_max_offset_deg);
  cfg.cost_jitter = number_field(doc, "cost_jitter", cfg.cost_jitter);
  cfg.mutation_reject_unsafe = bool_field(doc, "mutation_reject_unsafe", cfg.mutation_reject_unsafe);
  cfg.mutation_max_attempts =
      static_cast<int>(number_field(doc, "mutation_max_attempts", cfg.mutation_max_attempts));
  if (doc.find("log_level")) {
    try {
      cfg.log_level = log::level_from_string(string_field(doc, "log_level", ""));
    } catch (const std::invalid_argument& e) {
      throw ConfigurationError(std::string("config: ") + e.what());
    }
  }

  validate_genetic_config(cfg);
  return cfg;
}

GeneticConfig load_genetic_config(const std::string& path) {
  json::Value doc;
  try {
    doc = json::parse(read_text_file(path));
  } catch (const std::runtime_error& e) {
    throw ConfigurationError("config: cannot load '" + path + "': " + e.what());
  }
  return genetic_config_from_json(doc);
}

json::Value genetic_config_to_json(const GeneticConfig& cfg) {
  json::Object o;
  o["population_type"] = initializer_kind_to_string(cfg.population_type);
  o["mutation_type"] = mutation_kind_to_string(cfg.mutation_type);
  o["crossover_strategy"] = crossover_strategy_to_string(cfg.crossover_strategy);
  o["mutation_strategy"] = mutation_strategy_to_string(cfg.mutation_strategy);
  o["route_folder"] = cfg.route_folder;
  o["mutation_probability"] = cfg.mutation_probability;
  o["crossover_probability"] = cfg.crossover_probability;
  o["connector_spacing_m"] = cfg.connector_spacing_m;
  o["great_circle_step_m"] = cfg.great_circle_step_m;
  o["mutation_max_offset_deg"] = cfg.mutation_max_offset_deg;
  o["cost_jitter"] = cfg.cost_jitter;
  o["mutation_reject_unsafe"] = cfg.mutation_reject_unsafe;
  o["mutation_max_attempts"] = static_cast<double>(cfg.mutation_max_attempts);
  o["log_level"] = to_lower(log::level_label(cfg.log_level));
  return o;
}

} // namespace shiproute
