#include <iostream>

void run_buffer_benchmark();
void run_flush_benchmark();
void run_codec_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "Selfspy Benchmarks\n";
  run_buffer_benchmark();
  run_flush_benchmark();
  run_codec_benchmark();
  run_config_benchmark();
  return 0;
}
