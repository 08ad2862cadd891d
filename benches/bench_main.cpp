#include <iostream>

void run_config_benchmark();
void run_graph_benchmarks();
void run_similarity_benchmarks();

int main() {
  std::cout << "notegraph Benchmarks\n";
  run_config_benchmark();
  run_graph_benchmarks();
  run_similarity_benchmarks();
  return 0;
}
