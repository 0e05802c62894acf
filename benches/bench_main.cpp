#include <iostream>

void run_cache_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "semcache benchmarks\n";
  run_cache_benchmark();
  run_config_benchmark();
  return 0;
}
