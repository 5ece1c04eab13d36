#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "staticss/common/internal_error.hpp"
#include "staticss/common/source_span.hpp"
#include "staticss/js/expression.hpp"
#include "staticss/js/fwd.hpp"

namespace staticss::js {

// Owns parsed expressions and the source buffers their spans point into.
class Arena final {
 public:
  Arena() = default;
  ~Arena() = default;

  Arena(const Arena&) = delete;
  auto operator=(const Arena&) -> Arena& = delete;

  Arena(Arena&&) = default;
  auto operator=(Arena&&) -> Arena& = default;

  auto AddBuffer(std::string text) -> BufferId {
    BufferId id{static_cast<uint32_t>(buffers_.size())};
    buffers_.push_back(std::move(text));
    return id;
  }

  auto AddExpression(Expression expr) -> ExprId {
    ExprId id{static_cast<uint32_t>(expressions_.size())};
    expressions_.push_back(std::move(expr));
    return id;
  }

  [[nodiscard]] auto operator[](ExprId id) const -> const Expression& {
    if (!id || id.value >= expressions_.size()) {
      common::ThrowInternalError("js::Arena", "expression id out of range");
    }
    return expressions_[id.value];
  }

  [[nodiscard]] auto Buffer(BufferId id) const -> std::string_view {
    if (!id || id.value >= buffers_.size()) {
      common::ThrowInternalError("js::Arena", "buffer id out of range");
    }
    return buffers_[id.value];
  }

  // Source text an expression was parsed from.
  [[nodiscard]] auto Text(ExprId id) const -> std::string_view {
    const auto& span = (*this)[id].span;
    return Buffer(span.buffer).substr(span.begin, span.end - span.begin);
  }

  [[nodiscard]] auto ExpressionCount() const -> size_t {
    return expressions_.size();
  }

 private:
  std::vector<Expression> expressions_;
  std::vector<std::string> buffers_;
};

}  // namespace staticss::js
