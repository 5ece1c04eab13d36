#include "run_log.hpp"

#include <algorithm>
#include <chrono>

#include <fmt/core.h>

namespace staticss::driver {

void RunLog::BeginFile(std::string_view path) {
  file_ = std::string(path);
  file_phases_.clear();
  ++files_;
}

void RunLog::RecordPhase(std::string_view phase, double millis) {
  if (phase == "scan") {
    scan_millis_ += millis;
  } else {
    lower_millis_ += millis;
  }
  if (Verbose()) {
    file_phases_ += fmt::format(" {}={:.1f}ms", phase, millis);
  }
}

void RunLog::EndFile(const lowering::FileResult& result) {
  auto bailed = static_cast<size_t>(std::count_if(
      result.components.begin(), result.components.end(),
      [](const lowering::StyledDecl& decl) { return decl.bailed; }));
  components_ += result.components.size();
  bailed_ += bailed;
  if (!Verbose()) {
    return;
  }
  fmt::print(
      sink_, "[staticss] {}: {} component(s), {} bailed, {} warning(s){}\n",
      file_, result.components.size(), bailed, result.warnings.size(),
      file_phases_);
  std::fflush(sink_);
}

void RunLog::PrintStats(FILE* sink) const {
  fmt::print(
      sink,
      "[staticss][stats] files={} components={} bailed={} scan={:.2f}s "
      "lower={:.2f}s\n",
      files_, components_, bailed_, scan_millis_ / 1000.0,
      lower_millis_ / 1000.0);
  std::fflush(sink);
}

ScopedPhase::~ScopedPhase() {
  std::chrono::duration<double, std::milli> elapsed =
      std::chrono::steady_clock::now() - start_;
  log_.RecordPhase(phase_, elapsed.count());
}

}  // namespace staticss::driver
