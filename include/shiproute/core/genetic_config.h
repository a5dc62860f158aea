#pragma once

#include <string>

#include "shiproute/util/json.h"
#include "shiproute/util/log.h"

namespace shiproute {

enum class InitializerKind { GridBased, FromGeojson };
enum class MutationKind { GridBased };

// Which splice the crossover operator uses.
enum class CrossoverStrategy { TwoPoint, Intersection };

// Which perturbation GridBasedMutation applies.
enum class MutationStrategy { Move, DeleteAndRepath };

// Settings for the genetic route operators.
//
// Defaults reproduce the behaviour the operators were tuned with; a JSON config
// file only needs to list the keys it changes.
struct GeneticConfig {
  InitializerKind population_type{InitializerKind::GridBased};
  MutationKind mutation_type{MutationKind::GridBased};
  CrossoverStrategy crossover_strategy{CrossoverStrategy::TwoPoint};
  MutationStrategy mutation_strategy{MutationStrategy::Move};

  // Folder holding route_<i>.json files for the from_geojson initializer.
  std::string route_folder;

  // Per-individual probability that mutation perturbs a route.
  double mutation_probability{0.7};

  // Per-mating probability that crossover splices (otherwise parents pass through).
  double crossover_probability{1.0};

  // Spacing of the interpolated points bridging two crossover cut points (m).
  double connector_spacing_m{50000.0};

  // Step length of the great-circle fallback route (m).
  double great_circle_step_m{100000.0};

  // Largest diagonal shift applied by the segment-shift mutation (degrees, > 0).
  double mutation_max_offset_deg{1.0};

  // Amplitude of the uniform noise added to grid costs for every pathfinder run.
  double cost_jitter{1.0};

  // When true and a constraint checker is attached, segment-shift mutation
  // redraws (up to mutation_max_attempts times) until no waypoint is unsafe.
  bool mutation_reject_unsafe{false};
  int mutation_max_attempts{1};

  log::Level log_level{log::Level::Info};
};

// Name <-> enum helpers. Parsing trims and ignores case; unknown names throw
// ConfigurationError listing the accepted values.
std::string initializer_kind_to_string(InitializerKind k);
InitializerKind initializer_kind_from_string(const std::string& s);
std::string mutation_kind_to_string(MutationKind k);
MutationKind mutation_kind_from_string(const std::string& s);
std::string crossover_strategy_to_string(CrossoverStrategy s);
CrossoverStrategy crossover_strategy_from_string(const std::string& s);
std::string mutation_strategy_to_string(MutationStrategy s);
MutationStrategy mutation_strategy_from_string(const std::string& s);

// Throws ConfigurationError naming the first offending field.
void validate_genetic_config(const GeneticConfig& cfg);

// Missing keys keep their defaults. Unknown keys are logged and ignored.
// The result is validated.
GeneticConfig genetic_config_from_json(const json::Value& doc);
GeneticConfig load_genetic_config(const std::string& path);

json::Value genetic_config_to_json(const GeneticConfig& cfg);

} // namespace shiproute
