#include <iostream>

void run_schedule_benchmark();
void run_protocol_benchmark();
void run_store_benchmark();

int main() {
  std::cout << "runclaw benchmarks\n";
  run_schedule_benchmark();
  run_protocol_benchmark();
  run_store_benchmark();
  return 0;
}
