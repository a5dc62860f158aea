#include <iostream>
#include <string>

#include "shiproute/core/errors.h"
#include "shiproute/core/genetic_config.h"
#include "shiproute/util/file_io.h"
#include "test_fakes.h"

#define SR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool rejects(const std::string& text) {
  try {
    (void)shiproute::genetic_config_from_json(shiproute::json::parse(text));
  } catch (const shiproute::ConfigurationError&) {
    return true;
  }
  return false;
}

} // namespace

int test_genetic_config() {
  using namespace shiproute;

  {
    const GeneticConfig d;
    SR_ASSERT(d.population_type == InitializerKind::GridBased);
    SR_ASSERT(d.mutation_type == MutationKind::GridBased);
    SR_ASSERT(d.crossover_strategy == CrossoverStrategy::TwoPoint);
    SR_ASSERT(d.mutation_strategy == MutationStrategy::Move);
    SR_ASSERT(d.mutation_probability == 0.7);
    SR_ASSERT(d.crossover_probability == 1.0);
    SR_ASSERT(d.connector_spacing_m == 50000.0);
    SR_ASSERT(d.great_circle_step_m == 100000.0);
    SR_ASSERT(d.mutation_max_offset_deg == 1.0);
    SR_ASSERT(!d.mutation_reject_unsafe);
    SR_ASSERT(d.mutation_max_attempts == 1);
    validate_genetic_config(d);
  }

  SR_ASSERT(initializer_kind_from_string("FROM_GEOJSON") == InitializerKind::FromGeojson);
  SR_ASSERT(crossover_strategy_from_string(" intersection") == CrossoverStrategy::Intersection);
  SR_ASSERT(mutation_strategy_from_string("Delete_And_Repath") == MutationStrategy::DeleteAndRepath);
  SR_ASSERT(mutation_kind_to_string(MutationKind::GridBased) == "grid_based");
  {
    bool threw = false;
    try {
      (void)initializer_kind_from_string("isofuel");
    } catch (const ConfigurationError& e) {
      threw = std::string(e.what()).find("isofuel") != std::string::npos;
    }
    SR_ASSERT(threw);
  }

  // Partial documents keep defaults; unknown keys only warn.
  {
    testing::LogCapture cap(log::Level::Warn);
    const GeneticConfig cfg = genetic_config_from_json(json::parse(
        "{\"population_type\": \"from_geojson\", \"route_folder\": \"/data/isofuel\","
        " \"mutation_probability\": 0.4, \"mutation_strategy\": \"delete_and_repath\","
        " \"log_level\": \"debug\", \"n_generations\": 20}"));
    SR_ASSERT(cfg.population_type == InitializerKind::FromGeojson);
    SR_ASSERT(cfg.route_folder == "/data/isofuel");
    SR_ASSERT(cfg.mutation_probability == 0.4);
    SR_ASSERT(cfg.mutation_strategy == MutationStrategy::DeleteAndRepath);
    SR_ASSERT(cfg.log_level == log::Level::Debug);
    SR_ASSERT(cfg.crossover_probability == 1.0);
    SR_ASSERT(cap.count(log::Level::Warn, "n_generations") == 1);
  }

  SR_ASSERT(rejects("[]"));
  SR_ASSERT(rejects("{\"mutation_probability\": 1.2}"));
  SR_ASSERT(rejects("{\"crossover_probability\": -0.1}"));
  SR_ASSERT(rejects("{\"connector_spacing_m\": 0}"));
  SR_ASSERT(rejects("{\"great_circle_step_m\": -5}"));
  SR_ASSERT(rejects("{\"cost_jitter\": -1}"));
  SR_ASSERT(rejects("{\"mutation_max_offset_deg\": 0}"));
  SR_ASSERT(rejects("{\"mutation_max_attempts\": 0}"));
  SR_ASSERT(rejects("{\"mutation_probability\": \"high\"}"));
  SR_ASSERT(rejects("{\"mutation_reject_unsafe\": 1}"));
  SR_ASSERT(rejects("{\"population_type\": \"isofuel\"}"));
  SR_ASSERT(rejects("{\"log_level\": \"chatty\"}"));

  // Save and load through a file.
  {
    GeneticConfig cfg;
    cfg.population_type = InitializerKind::FromGeojson;
    cfg.crossover_strategy = CrossoverStrategy::Intersection;
    cfg.route_folder = "routes";
    cfg.connector_spacing_m = 25000.0;
    cfg.cost_jitter = 0.25;
    cfg.mutation_reject_unsafe = true;
    cfg.mutation_max_attempts = 8;
    cfg.log_level = log::Level::Warn;

    testing::ScratchDir dir("genetic_config");
    const std::string path = dir.file("genetic.json");
    write_text_file(path, json::stringify(genetic_config_to_json(cfg)));
    const GeneticConfig back = load_genetic_config(path);
    SR_ASSERT(back.population_type == cfg.population_type);
    SR_ASSERT(back.crossover_strategy == cfg.crossover_strategy);
    SR_ASSERT(back.route_folder == "routes");
    SR_ASSERT(back.connector_spacing_m == 25000.0);
    SR_ASSERT(back.cost_jitter == 0.25);
    SR_ASSERT(back.mutation_reject_unsafe);
    SR_ASSERT(back.mutation_max_attempts == 8);
    SR_ASSERT(back.log_level == log::Level::Warn);

    bool threw = false;
    try {
      (void)load_genetic_config(dir.file("absent.json"));
    } catch (const ConfigurationError&) {
      threw = true;
    }
    SR_ASSERT(threw);
  }

  return 0;
}
