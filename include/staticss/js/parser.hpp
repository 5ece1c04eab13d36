#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "staticss/common/diagnostic/diagnostic.hpp"
#include "staticss/common/source_span.hpp"
#include "staticss/js/arena.hpp"
#include "staticss/js/fwd.hpp"

namespace staticss::js {

// Parses the expression in [begin, end) of a buffer already owned by the
// arena. The whole range must be consumed.
auto ParseExpression(
    Arena& arena, BufferId buffer, uint32_t begin, uint32_t end)
    -> Result<ExprId>;

// Convenience overload: stores `text` as a new arena buffer first.
auto ParseExpression(Arena& arena, std::string text) -> Result<ExprId>;

// True if `text` parses as a complete expression.
auto IsParseableExpression(std::string_view text) -> bool;

}  // namespace staticss::js
