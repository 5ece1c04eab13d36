#include "staticss/js/pattern.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "staticss/common/overloaded.hpp"
#include "staticss/common/source_span.hpp"
#include "staticss/js/arena.hpp"
#include "staticss/js/expression.hpp"

namespace staticss::js {

namespace {

using Rewrite = std::pair<SourceSpan, std::string>;

auto IsBoundName(const ParamBindings& bindings, std::string_view name)
    -> bool {
  return (bindings.props_name && *bindings.props_name == name) ||
         bindings.KeyForLocal(name).has_value();
}

// Appends one rewrite per prop reference under `id`. False when a bound name
// appears outside a rewritable member path.
auto CollectPropRewrites(
    const Arena& arena, ExprId id, const ParamBindings& bindings,
    std::vector<Rewrite>& out) -> bool {
  if (auto path = GetPropPath(arena, id, bindings)) {
    std::string dotted;
    for (const auto& segment : *path) {
      dotted += dotted.empty() ? segment : "." + segment;
    }
    out.emplace_back(arena[id].span, std::move(dotted));
    return true;
  }
  auto visit = [&](ExprId child) {
    return CollectPropRewrites(arena, child, bindings, out);
  };
  auto visit_all = [&](const std::vector<ExprId>& children) {
    return std::ranges::all_of(children, visit);
  };
  return std::visit(
      Overloaded{
          [&](const IdentifierExpressionData& d) {
            return !IsBoundName(bindings, d.name);
          },
          [&](const TemplateLiteralExpressionData& d) {
            return visit_all(d.expressions);
          },
          [&](const MemberExpressionData& d) {
            return visit(d.object) && (!d.computed || visit(*d.computed));
          },
          [&](const UnaryExpressionData& d) { return visit(d.operand); },
          [&](const BinaryExpressionData& d) {
            return visit(d.lhs) && visit(d.rhs);
          },
          [&](const LogicalExpressionData& d) {
            return visit(d.lhs) && visit(d.rhs);
          },
          [&](const ConditionalExpressionData& d) {
            return visit(d.test) && visit(d.consequent) && visit(d.alternate);
          },
          [&](const CallExpressionData& d) {
            return visit(d.callee) && visit_all(d.arguments);
          },
          [&](const TaggedTemplateExpressionData& d) {
            return visit(d.tag) && visit(d.quasi);
          },
          [](const ArrowFunctionExpressionData&) { return false; },
          [](const auto&) { return true; },
      },
      arena[id].data);
}

}  // namespace

auto ParamBindings::KeyForLocal(std::string_view local) const
    -> std::optional<std::string> {
  for (const auto& [name, key] : locals) {
    if (name == local) {
      return key;
    }
  }
  return std::nullopt;
}

auto GetArrowBindings(const Arena& arena, ExprId id)
    -> std::optional<ParamBindings> {
  const auto* arrow =
      std::get_if<ArrowFunctionExpressionData>(&arena[id].data);
  if (arrow == nullptr || arrow->params.empty()) {
    return std::nullopt;
  }
  const Param& param = arrow->params.front();
  ParamBindings bindings;
  if (param.kind == ParamKind::kIdentifier) {
    bindings.props_name = param.name;
    return bindings;
  }
  for (const auto& property : param.properties) {
    if (property.key.starts_with("...")) {
      bindings.props_name = property.local;
      continue;
    }
    bindings.locals.emplace_back(property.local, property.key);
  }
  return bindings;
}

auto GetArrowBody(const Arena& arena, ExprId id) -> std::optional<ExprId> {
  const auto* arrow =
      std::get_if<ArrowFunctionExpressionData>(&arena[id].data);
  if (arrow == nullptr) {
    return std::nullopt;
  }
  return arrow->body;
}

auto MemberPath::Dotted() const -> std::string {
  std::string result = root;
  for (const auto& segment : segments) {
    result += ".";
    result += segment;
  }
  return result;
}

auto GetMemberPath(const Arena& arena, ExprId id) -> std::optional<MemberPath> {
  const Expression& expr = arena[id];
  if (const auto* ident = std::get_if<IdentifierExpressionData>(&expr.data)) {
    return MemberPath{.root = ident->name, .segments = {}};
  }
  const auto* member = std::get_if<MemberExpressionData>(&expr.data);
  if (member == nullptr || member->computed) {
    return std::nullopt;
  }
  auto path = GetMemberPath(arena, member->object);
  if (!path) {
    return std::nullopt;
  }
  path->segments.push_back(member->property);
  return path;
}

auto GetPropPath(const Arena& arena, ExprId id, const ParamBindings& bindings)
    -> std::optional<std::vector<std::string>> {
  auto path = GetMemberPath(arena, id);
  if (!path) {
    return std::nullopt;
  }
  if (bindings.props_name && path->root == *bindings.props_name) {
    if (path->segments.empty()) {
      return std::nullopt;
    }
    return path->segments;
  }
  if (auto key = bindings.KeyForLocal(path->root)) {
    std::vector<std::string> segments{*key};
    segments.insert(
        segments.end(), path->segments.begin(), path->segments.end());
    return segments;
  }
  return std::nullopt;
}

auto RewriteToPropNamespace(
    const Arena& arena, ExprId id, const ParamBindings& bindings)
    -> std::optional<std::string> {
  std::vector<Rewrite> rewrites;
  if (!CollectPropRewrites(arena, id, bindings, rewrites)) {
    return std::nullopt;
  }
  std::ranges::sort(rewrites, [](const Rewrite& a, const Rewrite& b) {
    return a.first.begin < b.first.begin;
  });
  const SourceSpan& span = arena[id].span;
  std::string_view buffer = arena.Buffer(span.buffer);
  std::string out;
  uint32_t cursor = span.begin;
  for (const auto& [at, text] : rewrites) {
    out += buffer.substr(cursor, at.begin - cursor);
    out += text;
    cursor = at.end;
  }
  out += buffer.substr(cursor, span.end - cursor);
  return out;
}

auto GetStaticLiteral(const Arena& arena, ExprId id)
    -> std::optional<StaticLiteral> {
  const Expression& expr = arena[id];
  switch (expr.kind) {
    case ExpressionKind::kStringLiteral:
      return StaticLiteral{
          .kind = LiteralKind::kString,
          .text = std::get<StringLiteralExpressionData>(expr.data).value};
    case ExpressionKind::kNumberLiteral:
      return StaticLiteral{
          .kind = LiteralKind::kNumber,
          .text = std::get<NumberLiteralExpressionData>(expr.data).raw};
    case ExpressionKind::kBooleanLiteral:
      return StaticLiteral{
          .kind = LiteralKind::kBoolean,
          .text = std::get<BooleanLiteralExpressionData>(expr.data).value
                      ? "true"
                      : "false"};
    case ExpressionKind::kNullLiteral:
      return StaticLiteral{.kind = LiteralKind::kNull, .text = "null"};
    case ExpressionKind::kIdentifier:
      if (std::get<IdentifierExpressionData>(expr.data).name == "undefined") {
        return StaticLiteral{
            .kind = LiteralKind::kUndefined, .text = "undefined"};
      }
      return std::nullopt;
    case ExpressionKind::kTemplateLiteral: {
      const auto& tmpl = std::get<TemplateLiteralExpressionData>(expr.data);
      if (!tmpl.expressions.empty()) {
        return std::nullopt;
      }
      return StaticLiteral{
          .kind = LiteralKind::kString, .text = tmpl.quasis.front()};
    }
    case ExpressionKind::kUnary: {
      const auto& unary = std::get<UnaryExpressionData>(expr.data);
      if (unary.op != UnaryOp::kMinus) {
        return std::nullopt;
      }
      auto operand = GetStaticLiteral(arena, unary.operand);
      if (!operand || operand->kind != LiteralKind::kNumber) {
        return std::nullopt;
      }
      return StaticLiteral{
          .kind = LiteralKind::kNumber, .text = "-" + operand->text};
    }
    default:
      return std::nullopt;
  }
}

auto IsEmptyStyleLiteral(const StaticLiteral& literal) -> bool {
  switch (literal.kind) {
    case LiteralKind::kNull:
    case LiteralKind::kUndefined:
      return true;
    case LiteralKind::kBoolean:
      return literal.text == "false";
    case LiteralKind::kString:
      return literal.text.empty();
    case LiteralKind::kNumber:
      return false;
  }
  return false;
}

}  // namespace staticss::js
