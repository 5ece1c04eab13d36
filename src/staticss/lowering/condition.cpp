#include "staticss/lowering/condition.hpp"

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "staticss/common/string_utils.hpp"
#include "staticss/js/arena.hpp"
#include "staticss/js/expression.hpp"
#include "staticss/js/parser.hpp"
#include "staticss/js/pattern.hpp"

namespace staticss::lowering {

namespace {

auto ToString(EqualityOp op) -> std::string_view {
  switch (op) {
    case EqualityOp::kStrictEqual:
      return "===";
    case EqualityOp::kStrictNotEqual:
      return "!==";
    case EqualityOp::kEqual:
      return "==";
    case EqualityOp::kNotEqual:
      return "!=";
  }
  return "===";
}

auto ToEqualityOp(js::BinaryOp op) -> std::optional<EqualityOp> {
  switch (op) {
    case js::BinaryOp::kStrictEqual:
      return EqualityOp::kStrictEqual;
    case js::BinaryOp::kStrictNotEqual:
      return EqualityOp::kStrictNotEqual;
    case js::BinaryOp::kEqual:
      return EqualityOp::kEqual;
    case js::BinaryOp::kNotEqual:
      return EqualityOp::kNotEqual;
    default:
      return std::nullopt;
  }
}

auto OperandToString(const Operand& operand) -> std::string {
  if (operand.kind == OperandKind::kString) {
    return fmt::format("\"{}\"", common::EscapeForJsString(operand.text));
  }
  return operand.text;
}

// Operands of && / || that need parens when nested under `parent`.
auto NeedsParens(const Condition& child, ConditionKind parent) -> bool {
  switch (parent) {
    case ConditionKind::kNot:
      return child.kind != ConditionKind::kProp &&
             child.kind != ConditionKind::kNot;
    case ConditionKind::kAnd:
      return child.kind == ConditionKind::kOr ||
             child.kind == ConditionKind::kOpaque;
    case ConditionKind::kOr:
      return child.kind == ConditionKind::kOpaque;
    default:
      return false;
  }
}

auto JoinOperands(const Condition& condition, std::string_view sep)
    -> std::string {
  std::string out;
  for (const auto& operand : condition.operands) {
    if (!out.empty()) {
      out += sep;
    }
    auto text = ToString(operand);
    out += NeedsParens(operand, condition.kind) ? fmt::format("({})", text)
                                                : text;
  }
  return out;
}

auto LiteralOperand(const js::Arena& arena, js::ExprId id)
    -> std::optional<Operand> {
  auto literal = js::GetStaticLiteral(arena, id);
  if (!literal) {
    return std::nullopt;
  }
  switch (literal->kind) {
    case js::LiteralKind::kString:
      return Operand{.kind = OperandKind::kString, .text = literal->text};
    case js::LiteralKind::kNumber:
      return Operand{.kind = OperandKind::kNumber, .text = literal->text};
    case js::LiteralKind::kBoolean:
      return Operand{.kind = OperandKind::kBoolean, .text = literal->text};
    case js::LiteralKind::kNull:
      return Operand{.kind = OperandKind::kNull, .text = literal->text};
    case js::LiteralKind::kUndefined:
      return Operand{.kind = OperandKind::kUndefined, .text = literal->text};
  }
  return std::nullopt;
}

auto JoinPath(const std::vector<std::string>& segments) -> std::string {
  std::string out;
  for (const auto& segment : segments) {
    if (!out.empty()) {
      out += ".";
    }
    out += segment;
  }
  return out;
}

// `resolve` maps an expression to a dotted prop path, or nullopt; `operand`
// maps the other side of a comparison to an Operand, or nullopt.
template <typename ResolveProp, typename ResolveOperand>
auto Build(
    const js::Arena& arena, js::ExprId id, const ResolveProp& resolve,
    const ResolveOperand& operand) -> std::optional<Condition> {
  if (auto path = resolve(id)) {
    return Condition::Prop(std::move(*path));
  }
  const js::Expression& expr = arena[id];
  if (const auto* unary = std::get_if<js::UnaryExpressionData>(&expr.data)) {
    if (unary->op != js::UnaryOp::kNot) {
      return std::nullopt;
    }
    auto inner = Build(arena, unary->operand, resolve, operand);
    if (!inner) {
      return std::nullopt;
    }
    return Negate(*inner);
  }
  if (const auto* logical =
          std::get_if<js::LogicalExpressionData>(&expr.data)) {
    if (logical->op == js::LogicalOp::kNullish) {
      return std::nullopt;
    }
    auto lhs = Build(arena, logical->lhs, resolve, operand);
    auto rhs = Build(arena, logical->rhs, resolve, operand);
    if (!lhs || !rhs) {
      return std::nullopt;
    }
    auto kind = logical->op == js::LogicalOp::kAnd ? ConditionKind::kAnd
                                                   : ConditionKind::kOr;
    std::vector<Condition> operands;
    for (auto* side : {&*lhs, &*rhs}) {
      if (side->kind == kind) {
        for (auto& nested : side->operands) {
          operands.push_back(std::move(nested));
        }
      } else {
        operands.push_back(std::move(*side));
      }
    }
    return kind == ConditionKind::kAnd ? Condition::And(std::move(operands))
                                       : Condition::Or(std::move(operands));
  }
  if (const auto* binary = std::get_if<js::BinaryExpressionData>(&expr.data)) {
    auto op = ToEqualityOp(binary->op);
    if (!op) {
      return std::nullopt;
    }
    if (auto lhs = resolve(binary->lhs)) {
      auto rhs = operand(binary->rhs);
      if (!rhs) {
        return std::nullopt;
      }
      return Condition::Equality(std::move(*lhs), *op, std::move(*rhs));
    }
    // `"large" === props.size`
    if (auto rhs = resolve(binary->rhs)) {
      if (auto literal = LiteralOperand(arena, binary->lhs)) {
        return Condition::Equality(std::move(*rhs), *op, std::move(*literal));
      }
    }
  }
  return std::nullopt;
}

}  // namespace

auto Condition::Prop(std::string path) -> Condition {
  return Condition{
      .kind = ConditionKind::kProp,
      .path = std::move(path),
      .op = EqualityOp::kStrictEqual,
      .rhs = {},
      .operands = {}};
}

auto Condition::Not(Condition operand) -> Condition {
  return Condition{
      .kind = ConditionKind::kNot,
      .path = {},
      .op = EqualityOp::kStrictEqual,
      .rhs = {},
      .operands = {std::move(operand)}};
}

auto Condition::And(std::vector<Condition> operands) -> Condition {
  return Condition{
      .kind = ConditionKind::kAnd,
      .path = {},
      .op = EqualityOp::kStrictEqual,
      .rhs = {},
      .operands = std::move(operands)};
}

auto Condition::Or(std::vector<Condition> operands) -> Condition {
  return Condition{
      .kind = ConditionKind::kOr,
      .path = {},
      .op = EqualityOp::kStrictEqual,
      .rhs = {},
      .operands = std::move(operands)};
}

auto Condition::Equality(std::string path, EqualityOp op, Operand rhs)
    -> Condition {
  return Condition{
      .kind = ConditionKind::kEquality,
      .path = std::move(path),
      .op = op,
      .rhs = std::move(rhs),
      .operands = {}};
}

auto Condition::Opaque(std::string source) -> Condition {
  return Condition{
      .kind = ConditionKind::kOpaque,
      .path = std::move(source),
      .op = EqualityOp::kStrictEqual,
      .rhs = {},
      .operands = {}};
}

auto ToString(const Condition& condition) -> std::string {
  switch (condition.kind) {
    case ConditionKind::kProp:
    case ConditionKind::kOpaque:
      return condition.path;
    case ConditionKind::kNot:
      return fmt::format("!{}", JoinOperands(condition, ""));
    case ConditionKind::kAnd:
      return JoinOperands(condition, " && ");
    case ConditionKind::kOr:
      return JoinOperands(condition, " || ");
    case ConditionKind::kEquality:
      return fmt::format(
          "{} {} {}", condition.path, ToString(condition.op),
          OperandToString(condition.rhs));
  }
  return condition.path;
}

auto Negate(const Condition& condition) -> Condition {
  if (condition.kind == ConditionKind::kNot) {
    return condition.operands.front();
  }
  return Condition::Not(condition);
}

auto NormalizeWhen(std::string_view when) -> std::string {
  std::string compact;
  compact.reserve(when.size());
  for (char c : when) {
    if (std::isspace(static_cast<unsigned char>(c)) == 0) {
      compact += c;
    }
  }
  if (compact.size() >= 2 && compact.front() == '(' && compact.back() == ')') {
    // Only strip when the parens enclose the whole expression.
    int depth = 0;
    bool encloses = true;
    for (size_t i = 0; i < compact.size(); ++i) {
      if (compact[i] == '(') {
        ++depth;
      } else if (compact[i] == ')') {
        --depth;
        if (depth == 0 && i + 1 < compact.size()) {
          encloses = false;
          break;
        }
      }
    }
    if (encloses) {
      compact = compact.substr(1, compact.size() - 2);
    }
  }
  return compact;
}

auto AreComplementary(const Condition& a, const Condition& b) -> bool {
  auto is_negation_of = [](const std::string& negated,
                           const std::string& positive) {
    return negated.starts_with('!') &&
           NormalizeWhen(negated.substr(1)) == positive;
  };
  auto na = NormalizeWhen(ToString(a));
  auto nb = NormalizeWhen(ToString(b));
  return is_negation_of(na, nb) || is_negation_of(nb, na);
}

auto ConditionFromExpression(
    const js::Arena& arena, js::ExprId id, const js::ParamBindings& bindings)
    -> std::optional<Condition> {
  auto resolve = [&](js::ExprId expr) -> std::optional<std::string> {
    auto path = js::GetPropPath(arena, expr, bindings);
    if (!path) {
      return std::nullopt;
    }
    return JoinPath(*path);
  };
  auto operand = [&](js::ExprId expr) -> std::optional<Operand> {
    if (auto literal = LiteralOperand(arena, expr)) {
      return literal;
    }
    if (auto prop = resolve(expr)) {
      return Operand{.kind = OperandKind::kProp, .text = std::move(*prop)};
    }
    // Paths rooted outside the parameter are module constants.
    if (auto path = js::GetMemberPath(arena, expr);
        path && path->root != bindings.props_name &&
        !bindings.KeyForLocal(path->root)) {
      return Operand{.kind = OperandKind::kPath, .text = path->Dotted()};
    }
    auto text = js::RewriteToPropNamespace(arena, expr, bindings);
    if (!text) {
      return std::nullopt;
    }
    return Operand{.kind = OperandKind::kOther, .text = std::move(*text)};
  };
  return Build(arena, id, resolve, operand);
}

auto ParseCondition(std::string_view when) -> std::optional<Condition> {
  js::Arena scratch;
  auto id = js::ParseExpression(scratch, std::string(when));
  if (!id) {
    return std::nullopt;
  }
  auto resolve = [&](js::ExprId expr) -> std::optional<std::string> {
    auto path = js::GetMemberPath(scratch, expr);
    if (!path || path->root == "undefined") {
      return std::nullopt;
    }
    return path->Dotted();
  };
  auto operand = [&](js::ExprId expr) -> std::optional<Operand> {
    if (auto literal = LiteralOperand(scratch, expr)) {
      return literal;
    }
    if (auto path = js::GetMemberPath(scratch, expr)) {
      return Operand{.kind = OperandKind::kPath, .text = path->Dotted()};
    }
    return Operand{
        .kind = OperandKind::kOther, .text = std::string(scratch.Text(expr))};
  };
  return Build(scratch, *id, resolve, operand);
}

}  // namespace staticss::lowering
