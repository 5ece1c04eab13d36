#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "staticss/common/source_span.hpp"

namespace staticss {

enum class Severity : uint8_t {
  kWarning,
  kError,
};

enum class WarningKind : uint8_t {
  kUnsupportedFeature,
  kDynamicNode,
};

// Stable category strings, suitable for summaries and test assertions.
namespace category {
inline constexpr std::string_view kDynamicCss = "dynamic-css";
inline constexpr std::string_view kUnparseableExpression =
    "unparseable-expression";
inline constexpr std::string_view kHeterogeneousBackground =
    "heterogeneous-background";
inline constexpr std::string_view kUnsupportedSelector = "unsupported-selector";
inline constexpr std::string_view kParseError = "parse-error";
}  // namespace category

struct Warning {
  Severity severity = Severity::kWarning;
  WarningKind kind = WarningKind::kUnsupportedFeature;
  std::string category;
  std::string message;
  std::optional<Location> location;
  std::vector<std::pair<std::string, std::string>> context;

  auto operator==(const Warning&) const -> bool = default;

  static auto Unsupported(std::string_view cat, std::string msg) -> Warning {
    return Warning{
        .severity = Severity::kWarning,
        .kind = WarningKind::kUnsupportedFeature,
        .category = std::string(cat),
        .message = std::move(msg),
        .location = std::nullopt,
        .context = {},
    };
  }

  static auto DynamicNode(std::string_view cat, std::string msg) -> Warning {
    return Warning{
        .severity = Severity::kWarning,
        .kind = WarningKind::kDynamicNode,
        .category = std::string(cat),
        .message = std::move(msg),
        .location = std::nullopt,
        .context = {},
    };
  }

  auto WithLocation(std::optional<Location> loc) && -> Warning {
    location = loc;
    return std::move(*this);
  }

  auto WithContext(std::string key, std::string value) && -> Warning {
    context.emplace_back(std::move(key), std::move(value));
    return std::move(*this);
  }

  auto AsError() && -> Warning {
    severity = Severity::kError;
    return std::move(*this);
  }
};

auto ToString(Severity severity) -> std::string_view;
auto ToString(WarningKind kind) -> std::string_view;

}  // namespace staticss
