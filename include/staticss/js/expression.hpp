#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "staticss/common/source_span.hpp"
#include "staticss/js/fwd.hpp"

namespace staticss::js {

enum class ExpressionKind : uint8_t {
  kIdentifier,
  kStringLiteral,
  kNumberLiteral,
  kBooleanLiteral,
  kNullLiteral,
  kTemplateLiteral,
  kMember,
  kUnary,
  kBinary,
  kLogical,
  kConditional,
  kCall,
  kArrowFunction,
  kTaggedTemplate,
};

enum class UnaryOp : uint8_t {
  kNot,
  kMinus,
  kPlus,
  kTypeof,
};

enum class BinaryOp : uint8_t {
  kStrictEqual,
  kStrictNotEqual,
  kEqual,
  kNotEqual,
  kLess,
  kGreater,
  kLessEqual,
  kGreaterEqual,
  kAdd,
  kSubtract,
  kMultiply,
  kDivide,
  kModulo,
};

enum class LogicalOp : uint8_t {
  kAnd,
  kOr,
  kNullish,
};

auto ToString(UnaryOp op) -> const char*;
auto ToString(BinaryOp op) -> const char*;
auto ToString(LogicalOp op) -> const char*;

inline auto IsEqualityOp(BinaryOp op) -> bool {
  return op == BinaryOp::kStrictEqual || op == BinaryOp::kStrictNotEqual ||
         op == BinaryOp::kEqual || op == BinaryOp::kNotEqual;
}

inline auto IsNegatedEqualityOp(BinaryOp op) -> bool {
  return op == BinaryOp::kStrictNotEqual || op == BinaryOp::kNotEqual;
}

// `undefined` is parsed as an identifier, as in JS.
struct IdentifierExpressionData {
  std::string name;

  auto operator==(const IdentifierExpressionData&) const -> bool = default;
};

// Value with escapes resolved.
struct StringLiteralExpressionData {
  std::string value;

  auto operator==(const StringLiteralExpressionData&) const -> bool = default;
};

struct NumberLiteralExpressionData {
  double value = 0;
  std::string raw;

  auto operator==(const NumberLiteralExpressionData&) const -> bool = default;
};

struct BooleanLiteralExpressionData {
  bool value = false;

  auto operator==(const BooleanLiteralExpressionData&) const -> bool = default;
};

struct NullLiteralExpressionData {
  auto operator==(const NullLiteralExpressionData&) const -> bool = default;
};

// quasis.size() == expressions.size() + 1
struct TemplateLiteralExpressionData {
  std::vector<std::string> quasis;
  std::vector<ExprId> expressions;

  auto operator==(const TemplateLiteralExpressionData&) const -> bool = default;
};

// `object.property`, `object?.property` or `object[computed]`.
struct MemberExpressionData {
  ExprId object;
  std::string property;
  std::optional<ExprId> computed;
  bool optional = false;

  auto operator==(const MemberExpressionData&) const -> bool = default;
};

struct UnaryExpressionData {
  UnaryOp op;
  ExprId operand;

  auto operator==(const UnaryExpressionData&) const -> bool = default;
};

struct BinaryExpressionData {
  BinaryOp op;
  ExprId lhs;
  ExprId rhs;

  auto operator==(const BinaryExpressionData&) const -> bool = default;
};

struct LogicalExpressionData {
  LogicalOp op;
  ExprId lhs;
  ExprId rhs;

  auto operator==(const LogicalExpressionData&) const -> bool = default;
};

struct ConditionalExpressionData {
  ExprId test;
  ExprId consequent;
  ExprId alternate;

  auto operator==(const ConditionalExpressionData&) const -> bool = default;
};

struct CallExpressionData {
  ExprId callee;
  std::vector<ExprId> arguments;

  auto operator==(const CallExpressionData&) const -> bool = default;
};

// One entry of an object destructuring pattern: `{ key: local = default }`.
struct PatternProperty {
  std::string key;
  std::string local;
  std::optional<ExprId> default_value;

  auto operator==(const PatternProperty&) const -> bool = default;
};

enum class ParamKind : uint8_t {
  kIdentifier,
  kObjectPattern,
};

struct Param {
  ParamKind kind = ParamKind::kIdentifier;
  std::string name;
  std::vector<PatternProperty> properties;

  auto operator==(const Param&) const -> bool = default;
};

// Expression-bodied arrow function.
struct ArrowFunctionExpressionData {
  std::vector<Param> params;
  ExprId body;

  auto operator==(const ArrowFunctionExpressionData&) const -> bool = default;
};

struct TaggedTemplateExpressionData {
  ExprId tag;
  ExprId quasi;

  auto operator==(const TaggedTemplateExpressionData&) const -> bool = default;
};

using ExpressionData = std::variant<
    IdentifierExpressionData, StringLiteralExpressionData,
    NumberLiteralExpressionData, BooleanLiteralExpressionData,
    NullLiteralExpressionData, TemplateLiteralExpressionData,
    MemberExpressionData, UnaryExpressionData, BinaryExpressionData,
    LogicalExpressionData, ConditionalExpressionData, CallExpressionData,
    ArrowFunctionExpressionData, TaggedTemplateExpressionData>;

struct Expression {
  ExpressionKind kind;
  SourceSpan span;
  ExpressionData data;

  auto operator==(const Expression&) const -> bool = default;
};

}  // namespace staticss::js
