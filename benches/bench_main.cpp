#include <iostream>

void run_hook_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "shellgate benchmarks\n";
  run_hook_benchmark();
  run_config_benchmark();
  return 0;
}
