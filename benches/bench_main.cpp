#include <iostream>

void run_config_benchmark();
void run_chunking_benchmark();
void run_embedding_benchmark();
void run_index_benchmarks();

int main() {
  std::cout << "ragvix benchmarks\n";
  run_config_benchmark();
  run_chunking_benchmark();
  run_embedding_benchmark();
  run_index_benchmarks();
  return 0;
}
