#include <string_view>

#include "staticss/common/diagnostic/warning.hpp"

namespace staticss {

auto ToString(Severity severity) -> std::string_view {
  switch (severity) {
    case Severity::kWarning:
      return "warning";
    case Severity::kError:
      return "error";
  }
  return "warning";
}

auto ToString(WarningKind kind) -> std::string_view {
  switch (kind) {
    case WarningKind::kUnsupportedFeature:
      return "unsupported-feature";
    case WarningKind::kDynamicNode:
      return "dynamic-node";
  }
  return "unsupported-feature";
}

}  // namespace staticss
