#pragma once

#include <cstdint>

namespace staticss::js {

struct ExprId {
  uint32_t value = 0;

  auto operator==(const ExprId&) const -> bool = default;
  auto operator<=>(const ExprId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }
};

constexpr ExprId kInvalidExprId{UINT32_MAX};

class Arena;

}  // namespace staticss::js
