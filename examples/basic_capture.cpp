// Build: c++ -std=c++17 -O2 -g -pthread -rdynamic -I. examples/basic_capture.cpp -o ex_basic
#include "heapline.hpp"

#include <cstdlib>
#include <vector>

static void* load_block(size_t n) {
  void* p = std::malloc(n);
  HEAPLINE_ALLOC(p, n);
  return p;
}

static void drop_block(void* p) {
  HEAPLINE_FREE(p);
  std::free(p);
}

int main() {
  heapline::set_log_level(heapline::LogLevel::Info);

  HEAPLINE_THREAD_INIT_AT("ex_basic", heapline::SamplingConfig::high_precision());

  std::vector<void*> blocks;
  for (int i = 0; i < 200; ++i) blocks.push_back(load_block(64 + (size_t)(i % 8) * 512));
  for (int i = 0; i < 150; ++i) drop_block(blocks[(size_t)i]);
  (void)load_block(1 << 20);   // stays live: shows up as a leak

  HEAPLINE_THREAD_FINALIZE();
  HEAPLINE_REPORT("ex_basic");   // ex_basic/heapline-report.{json,html}

  for (size_t i = 150; i < blocks.size(); ++i) std::free(blocks[i]);
  return 0;
}
