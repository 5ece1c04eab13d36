#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "staticss/js/fwd.hpp"
#include "staticss/js/pattern.hpp"

namespace staticss::lowering {

enum class ConditionKind : uint8_t {
  kProp,      // $primary, user.role
  kNot,       // !X
  kAnd,       // X && Y
  kOr,        // X || Y
  kEquality,  // size === "large"
  kOpaque,    // any other test, kept as source text
};

enum class EqualityOp : uint8_t {
  kStrictEqual,
  kStrictNotEqual,
  kEqual,
  kNotEqual,
};

enum class OperandKind : uint8_t {
  kString,
  kNumber,
  kBoolean,
  kNull,
  kUndefined,
  kPath,   // Role.admin, a module-scope constant
  kProp,   // another prop of the component
  kOther,  // source text in prop namespace
};

struct Operand {
  OperandKind kind = OperandKind::kOther;
  std::string text;

  auto operator==(const Operand&) const -> bool = default;
};

// Boolean condition a variant bucket is gated on. Built once from the
// classified expression and rendered to a "when" string for keys and output.
struct Condition {
  ConditionKind kind = ConditionKind::kProp;
  // kProp/kEquality: dotted prop path. kOpaque: source text.
  std::string path;
  EqualityOp op = EqualityOp::kStrictEqual;
  Operand rhs;
  // kNot: exactly one; kAnd/kOr: two or more.
  std::vector<Condition> operands;

  auto operator==(const Condition&) const -> bool = default;

  static auto Prop(std::string path) -> Condition;
  static auto Not(Condition operand) -> Condition;
  static auto And(std::vector<Condition> operands) -> Condition;
  static auto Or(std::vector<Condition> operands) -> Condition;
  static auto Equality(std::string path, EqualityOp op, Operand rhs)
      -> Condition;
  static auto Opaque(std::string source) -> Condition;
};

// Renders the when-string, e.g. `!(size === "large")`.
auto ToString(const Condition& condition) -> std::string;

// Logical negation; `!!X` collapses to `X`.
auto Negate(const Condition& condition) -> Condition;

// Strips whitespace and one layer of enclosing parens.
auto NormalizeWhen(std::string_view when) -> std::string;

// True for `X` / `!X` pairs (either order) after normalization.
auto AreComplementary(const Condition& a, const Condition& b) -> bool;

// Builds a condition from a test expression inside an arrow function whose
// parameters are `bindings`. Props, negation, && / || and equality against
// a literal, a dotted constant or another prop are recognized. References to
// the parameter are rewritten into prop namespace; nullopt when they cannot
// be.
auto ConditionFromExpression(
    const js::Arena& arena, js::ExprId id, const js::ParamBindings& bindings)
    -> std::optional<Condition>;

// Parses a when-string where every free identifier is a prop.
auto ParseCondition(std::string_view when) -> std::optional<Condition>;

}  // namespace staticss::lowering
