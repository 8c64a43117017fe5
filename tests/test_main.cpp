#include "test.h"

int main() {
  int fails = 0;
  fails += test_calendar();
  fails += test_json();
  fails += test_file_io();
  fails += test_rules_config();
  fails += test_map_graph();
  fails += test_rolls();
  fails += test_orders();
  fails += test_scheduler();
  fails += test_movement();
  fails += test_supply();
  fails += test_siege();
  fails += test_messaging();
  fails += test_naval();
  fails += test_operations();
  fails += test_recruitment();
  fails += test_state_validation();
  fails += test_audit_export();
  fails += test_engine();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
