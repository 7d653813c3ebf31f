// Build: c++ -std=c++17 -O2 -g -pthread -rdynamic -I. examples/multithreaded_queue.cpp -o ex_mtq
#include "heapline.hpp"

#include <thread>
#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <cstdlib>
#include <cstring>

struct Message { char* body; size_t len; };

int main() {
  const char* dir = "ex_mtq";
  heapline::SamplingConfig cfg = heapline::SamplingConfig::leak_detection();

  std::queue<Message> q;
  std::mutex m;
  std::condition_variable cv;
  bool done = false;

  // producer allocates, consumers free: the global peak is lower than the per-thread view
  std::thread prod([&]{
    HEAPLINE_THREAD_INIT_AT(dir, cfg);
    for (int i = 0; i < 400; ++i) {
      size_t len = 128 + (size_t)(i % 16) * 256;
      char* body = (char*)std::malloc(len);
      HEAPLINE_ALLOC(body, len);
      std::memset(body, 'x', len);
      { std::lock_guard<std::mutex> lk(m); q.push(Message{ body, len }); }
      cv.notify_one();
    }
    { std::lock_guard<std::mutex> lk(m); done = true; }
    cv.notify_all();
    HEAPLINE_THREAD_FINALIZE();
  });

  auto consumer = [&]{
    HEAPLINE_THREAD_INIT_AT(dir, cfg);
    while (true) {
      Message msg{};
      {
        std::unique_lock<std::mutex> lk(m);
        cv.wait(lk, [&]{ return done || !q.empty(); });
        if (q.empty()) break;
        msg = q.front(); q.pop();
      }
      HEAPLINE_FREE(msg.body);
      std::free(msg.body);
    }
    // not finalized here: the thread's recorder seals its files at thread exit
  };
  std::thread consA(consumer), consB(consumer);

  prod.join(); consA.join(); consB.join();

  heapline::AggregationOptions opt;
  opt.metrics = heapline::BinaryExportConfig::debug_comprehensive();
  heapline::AggregationOutcome out = heapline::aggregate_all_threads(dir, opt);
  std::printf("threads=%llu allocations=%llu peak=%llu (sum of thread peaks %llu)\n",
              (unsigned long long)out.analysis.summary.total_threads,
              (unsigned long long)out.analysis.summary.total_allocations,
              (unsigned long long)out.analysis.summary.peak_memory_usage,
              (unsigned long long)out.analysis.summary.sum_of_thread_peaks);
  heapline::Status s = heapline::write_reports(dir, out, opt.metrics);
  if (!s.ok()) { std::fprintf(stderr, "reports: %s\n", s.message.c_str()); return 1; }
  return 0;
}
