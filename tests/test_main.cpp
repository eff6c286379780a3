#include <iostream>

int test_hex_grid();
int test_pathfinder();
int test_combat();
int test_board_index();
int test_actions();
int test_turn_engine();
int test_end_turn();
int test_city_capture();
int test_stores();
int test_serialization();
int test_state_validation();
int test_digest();
int test_config();
int test_file_io();
int test_json_errors();

int main() {
  int fails = 0;
  fails += test_hex_grid();
  fails += test_pathfinder();
  fails += test_combat();
  fails += test_board_index();
  fails += test_actions();
  fails += test_turn_engine();
  fails += test_end_turn();
  fails += test_city_capture();
  fails += test_stores();
  fails += test_serialization();
  fails += test_state_validation();
  fails += test_digest();
  fails += test_config();
  fails += test_file_io();
  fails += test_json_errors();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
