#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "staticss/js/arena.hpp"
#include "staticss/js/fwd.hpp"

namespace staticss::js {

// Parameter bindings of an arrow function's first parameter.
//   `props => ...`          props_name = "props"
//   `({ $on, theme }) => ...` locals = {$on: $on, theme: theme}
struct ParamBindings {
  std::optional<std::string> props_name;
  std::vector<std::pair<std::string, std::string>> locals;  // local -> key

  [[nodiscard]] auto KeyForLocal(std::string_view local) const
      -> std::optional<std::string>;
};

auto GetArrowBindings(const Arena& arena, ExprId id)
    -> std::optional<ParamBindings>;

// Body of an arrow function.
auto GetArrowBody(const Arena& arena, ExprId id) -> std::optional<ExprId>;

// `a.b.c` -> root "a", segments {"b", "c"}. Computed members and calls are
// rejected.
struct MemberPath {
  std::string root;
  std::vector<std::string> segments;

  auto operator==(const MemberPath&) const -> bool = default;

  [[nodiscard]] auto Dotted() const -> std::string;
};

auto GetMemberPath(const Arena& arena, ExprId id) -> std::optional<MemberPath>;

// Resolves an expression to a prop path through the bindings:
//   props.$on        -> {"$on"}
//   props.user.role  -> {"user", "role"}
//   $on (destructured) -> {"$on"}
auto GetPropPath(const Arena& arena, ExprId id, const ParamBindings& bindings)
    -> std::optional<std::vector<std::string>>;

// Source text of `id` with every reference to the arrow parameter rewritten
// into prop namespace: `props.$n > 3` -> `$n > 3`, `size === max` with
// `({ size, max })` -> `size === max`. Returns nullopt when a bound name is
// used in a way that has no prop path (`props[key]`, `props` alone, nested
// arrows).
auto RewriteToPropNamespace(
    const Arena& arena, ExprId id, const ParamBindings& bindings)
    -> std::optional<std::string>;

enum class LiteralKind : uint8_t {
  kString,
  kNumber,
  kBoolean,
  kNull,
  kUndefined,
};

struct StaticLiteral {
  LiteralKind kind;
  // Cooked string, raw number, "true"/"false", "null" or "undefined".
  std::string text;

  auto operator==(const StaticLiteral&) const -> bool = default;
};

// String, number (including negated), boolean, null and `undefined`
// literals, and template literals without interpolations.
auto GetStaticLiteral(const Arena& arena, ExprId id)
    -> std::optional<StaticLiteral>;

// Falsy literals that produce no CSS: false, null, undefined, "".
auto IsEmptyStyleLiteral(const StaticLiteral& literal) -> bool;

}  // namespace staticss::js
