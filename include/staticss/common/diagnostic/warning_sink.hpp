#pragma once

#include <utility>
#include <vector>

#include "staticss/common/diagnostic/warning.hpp"

namespace staticss {

// Collects warnings for one file. Not thread-safe.
// Warnings are stored in order of reporting; callers may rely on this.
class WarningSink {
 public:
  void Report(Warning warning) {
    if (warning.severity == Severity::kError) {
      has_errors_ = true;
    }
    warnings_.push_back(std::move(warning));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  [[nodiscard]] auto GetWarnings() const -> const std::vector<Warning>& {
    return warnings_;
  }

  auto TakeWarnings() -> std::vector<Warning> {
    has_errors_ = false;
    return std::exchange(warnings_, {});
  }

 private:
  std::vector<Warning> warnings_;
  bool has_errors_ = false;
};

}  // namespace staticss
