#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace stepfrag {

// Throttled "[label] read x/y MB (p%)" lines. Single-threaded.
class ProgressTracker {
 public:
  ProgressTracker(std::ostream& out, std::string label, std::uint64_t total_bytes, std::uint64_t interval_ms);

  void Update(std::uint64_t done_bytes);
  void Finish();

  [[nodiscard]] std::uint64_t lines_printed() const noexcept { return lines_printed_; }

 private:
  void MaybePrint(bool force);

  std::ostream& out_;
  std::string label_;
  std::uint64_t total_ = 0;
  std::uint64_t done_ = 0;
  std::uint64_t interval_ms_ = 1000;
  std::uint64_t lines_printed_ = 0;
  std::chrono::steady_clock::time_point start_;
  std::chrono::steady_clock::time_point last_print_;
};

[[nodiscard]] std::string FormatDuration(double seconds);

}  // namespace stepfrag
