// Build: c++ -std=c++17 -O2 -g -pthread -rdynamic -I. \
//        -DHEAPLINE_DEFINE_HEAP_HOOKS=1 \
//        examples/heap_hooks_report.cpp -o ex_hooks
#include "heapline.hpp"

#include <string>
#include <vector>

static std::vector<std::string> build_names(int n) {
  std::vector<std::string> v;
  for (int i = 0; i < n; ++i) v.push_back(std::string(200 + (size_t)i, 'n'));
  return v;
}

int main() {
  const char* dir = "ex_hooks";
  heapline::SamplingConfig cfg;
  cfg.medium_sample_rate = 1.0;            // attribute every medium allocation in this window

  HEAPLINE_THREAD_INIT_AT(dir, cfg);       // global new/delete now record on this thread

  std::vector<char*> hold;
  for (int i = 0; i < 120; ++i) hold.push_back(new char[1 << 14]);   // retained
  std::vector<std::string> names = build_names(64);
  (void)new char[2048];                    // intentional leak

  HEAPLINE_THREAD_FINALIZE();              // hooks go quiet again

  heapline::AggregationOutcome out = heapline::aggregate_all_threads(dir);
  for (const heapline::HotCallStack& h : out.analysis.hottest_call_stacks) {
    std::printf("%10llu bytes  %6llu allocs  %s\n", (unsigned long long)h.total_size,
                (unsigned long long)h.total_frequency,
                h.frames.empty() ? "?" : heapline::describe_frame(h.frames[0]).c_str());
  }
  HEAPLINE_REPORT(dir);

  for (char* p : hold) delete[] p;
  return 0;
}
