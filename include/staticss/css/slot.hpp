#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "staticss/js/fwd.hpp"

namespace staticss::css {

// One interpolation point of a template. The expression is absent when the
// interpolated source could not be parsed.
struct Slot {
  uint32_t id = 0;
  std::string placeholder;
  std::optional<js::ExprId> expression;

  auto operator==(const Slot&) const -> bool = default;
};

}  // namespace staticss::css
