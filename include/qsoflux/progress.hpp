#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>

namespace qsoflux {

// Thread-safe throughput reporter. Workers call Add(); a status line is
// written to the sink at most once per interval, and always on Finish().
class ProgressTracker {
 public:
  ProgressTracker(std::uint64_t total_chunks, std::string label, std::uint64_t interval_ms,
                  std::ostream& sink = std::cerr);

  void Add(std::uint64_t chunks, std::uint64_t records);
  void Finish();

  [[nodiscard]] std::uint64_t DoneChunks() const { return done_chunks_.load(std::memory_order_relaxed); }
  [[nodiscard]] std::uint64_t DoneRecords() const { return done_records_.load(std::memory_order_relaxed); }

 private:
  void MaybePrint(bool force);

  std::string label_;
  std::uint64_t total_ = 0;
  std::uint64_t interval_ms_ = 1000;
  std::ostream& sink_;
  std::atomic<std::uint64_t> done_chunks_{0};
  std::atomic<std::uint64_t> done_records_{0};
  std::chrono::steady_clock::time_point start_;
  std::chrono::steady_clock::time_point last_print_;
  std::mutex print_mu_;
};

}  // namespace qsoflux
