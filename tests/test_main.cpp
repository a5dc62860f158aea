#include <iostream>

int test_log();
int test_json();
int test_file_io();
int test_rng();
int test_geo();
int test_cost_grid();
int test_pathfinder();
int test_route_io();
int test_genetic_config();
int test_population();
int test_crossover();
int test_mutation();
int test_routing_problem();
int test_duplicates();

int main() {
  int fails = 0;
  fails += test_log();
  fails += test_json();
  fails += test_file_io();
  fails += test_rng();
  fails += test_geo();
  fails += test_cost_grid();
  fails += test_pathfinder();
  fails += test_route_io();
  fails += test_genetic_config();
  fails += test_population();
  fails += test_crossover();
  fails += test_mutation();
  fails += test_routing_problem();
  fails += test_duplicates();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
