#include "qsoflux/progress.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace qsoflux {

namespace {
std::string FormatDuration(double seconds) {
  const int sec = static_cast<int>(seconds + 0.5);
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << sec / 3600 << ":" << std::setw(2) << (sec % 3600) / 60 << ":"
      << std::setw(2) << sec % 60;
  return oss.str();
}
}  // namespace

ProgressTracker::ProgressTracker(std::uint64_t total_chunks, std::string label, std::uint64_t interval_ms,
                                 std::ostream& sink)
    : label_(std::move(label)), total_(total_chunks), interval_ms_(interval_ms), sink_(sink) {
  start_ = std::chrono::steady_clock::now();
  last_print_ = start_;
}

void ProgressTracker::Add(std::uint64_t chunks, std::uint64_t records) {
  done_chunks_.fetch_add(chunks, std::memory_order_relaxed);
  done_records_.fetch_add(records, std::memory_order_relaxed);
  MaybePrint(false);
}

void ProgressTracker::Finish() { MaybePrint(true); }

void ProgressTracker::MaybePrint(bool force) {
  std::lock_guard<std::mutex> lock(print_mu_);
  auto now = std::chrono::steady_clock::now();
  if (!force) {
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_print_).count();
    if (delta < static_cast<long long>(interval_ms_)) {
      return;
    }
  }
  last_print_ = now;

  const std::uint64_t done_chunks = done_chunks_.load(std::memory_order_relaxed);
  const std::uint64_t done_records = done_records_.load(std::memory_order_relaxed);
  const double elapsed = std::chrono::duration<double>(now - start_).count();
  const double chunk_rate = elapsed > 0.0 ? static_cast<double>(done_chunks) / elapsed : 0.0;
  const double record_rate = elapsed > 0.0 ? static_cast<double>(done_records) / elapsed : 0.0;
  const double eta = (chunk_rate > 0.0 && total_ > done_chunks)
                         ? static_cast<double>(total_ - done_chunks) / chunk_rate
                         : 0.0;

  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss << "[" << label_ << "] chunks " << done_chunks;
  if (total_ > 0) {
    oss << "/" << total_ << " (" << std::setprecision(1)
        << 100.0 * static_cast<double>(done_chunks) / static_cast<double>(total_) << "%)";
  }
  oss << " records " << done_records;
  if (record_rate > 0.0) {
    oss << " rate " << std::setprecision(2) << record_rate / 1000.0 << " krec/s";
  }
  oss << " elapsed " << FormatDuration(elapsed);
  if (eta > 0.0) {
    oss << " ETA " << FormatDuration(eta);
  }
  oss << "\n";
  sink_ << oss.str();
}

}  // namespace qsoflux
