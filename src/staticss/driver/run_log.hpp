#pragma once

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

#include "staticss/lowering/lower.hpp"

namespace staticss::driver {

// Per-file progress of a dump or check run, written to stderr so that dump
// output on stdout stays clean. `-v 1` reports each file with its phase
// times; the totals are kept at every level for --stats.
class RunLog {
 public:
  explicit RunLog(int level, FILE* sink = stderr)
      : level_(level), sink_(sink) {
  }

  void BeginFile(std::string_view path);
  void RecordPhase(std::string_view phase, double millis);
  void EndFile(const lowering::FileResult& result);

  // One line: file count, component outcomes, time spent per phase.
  void PrintStats(FILE* sink = stderr) const;

 private:
  [[nodiscard]] auto Verbose() const -> bool {
    return level_ >= 1;
  }

  int level_;
  FILE* sink_;
  std::string file_;
  std::string file_phases_;

  size_t files_ = 0;
  size_t components_ = 0;
  size_t bailed_ = 0;
  double scan_millis_ = 0.0;
  double lower_millis_ = 0.0;
};

// Records the time from construction to destruction as one phase of the
// current file.
class ScopedPhase {
 public:
  ScopedPhase(RunLog& log, std::string_view phase)
      : log_(log), phase_(phase), start_(std::chrono::steady_clock::now()) {
  }
  ~ScopedPhase();

  ScopedPhase(const ScopedPhase&) = delete;
  ScopedPhase& operator=(const ScopedPhase&) = delete;
  ScopedPhase(ScopedPhase&&) = delete;
  ScopedPhase& operator=(ScopedPhase&&) = delete;

 private:
  RunLog& log_;
  std::string_view phase_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace staticss::driver
