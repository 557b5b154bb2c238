#include "stepfrag/progress.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace stepfrag {

std::string FormatDuration(double seconds) {
  int sec = static_cast<int>(seconds + 0.5);
  int h = sec / 3600;
  int m = (sec % 3600) / 60;
  int s = sec % 60;
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << h << ":" << std::setw(2) << m << ":" << std::setw(2) << s;
  return oss.str();
}

ProgressTracker::ProgressTracker(std::ostream& out, std::string label, std::uint64_t total_bytes,
                                 std::uint64_t interval_ms)
    : out_(out), label_(std::move(label)), total_(total_bytes), interval_ms_(interval_ms) {
  start_ = std::chrono::steady_clock::now();
  last_print_ = start_;
}

void ProgressTracker::Update(std::uint64_t done_bytes) {
  done_ = done_bytes;
  MaybePrint(false);
}

void ProgressTracker::Finish() {
  MaybePrint(true);
}

void ProgressTracker::MaybePrint(bool force) {
  auto now = std::chrono::steady_clock::now();
  if (!force) {
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_print_).count();
    if (delta < static_cast<long long>(interval_ms_)) {
      return;
    }
  }
  last_print_ = now;
  double elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - start_).count();
  double rate = elapsed > 0.0 ? static_cast<double>(done_) / elapsed : 0.0;
  constexpr double kMb = 1024.0 * 1024.0;

  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss << "[" << label_ << "] read " << std::setprecision(2) << static_cast<double>(done_) / kMb;
  if (total_ > 0) {
    // Two-pass consumers read more than the file size; pct is per file size.
    double pct = 100.0 * static_cast<double>(done_) / static_cast<double>(total_);
    oss << "/" << static_cast<double>(total_) / kMb << " MB (" << std::setprecision(1) << pct << "%)";
  } else {
    oss << " MB";
  }
  if (rate > 0.0) {
    oss << " rate " << std::setprecision(2) << rate / kMb << " MB/s";
  }
  oss << " elapsed " << FormatDuration(elapsed) << "\n";
  out_ << oss.str();
  ++lines_printed_;
}

}  // namespace stepfrag
