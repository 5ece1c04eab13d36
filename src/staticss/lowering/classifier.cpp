#include "staticss/lowering/classifier.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "staticss/css/declaration_block.hpp"
#include "staticss/css/shorthand.hpp"
#include "staticss/js/arena.hpp"
#include "staticss/js/expression.hpp"
#include "staticss/js/parser.hpp"
#include "staticss/js/pattern.hpp"
#include "staticss/lowering/condition.hpp"
#include "staticss/lowering/decision.hpp"
#include "staticss/lowering/style_value.hpp"

namespace staticss::lowering {

namespace {

struct MatchInput {
  const ClassifierEnv& env;
  js::ExprId expr;
  const DynamicContext& context;

  [[nodiscard]] auto Arena() const -> const js::Arena& {
    return *env.arena;
  }
  [[nodiscard]] auto Expr(js::ExprId id) const -> const js::Expression& {
    return (*env.arena)[id];
  }
  [[nodiscard]] auto Text(js::ExprId id) const -> std::string {
    return std::string(env.arena->Text(id));
  }
  [[nodiscard]] auto IsStandalone() const -> bool {
    return context.kind == DynamicKind::kDeclarationValue &&
           context.property.empty();
  }
  [[nodiscard]] auto IsPropertyValue() const -> bool {
    return context.kind == DynamicKind::kDeclarationValue &&
           !context.property.empty();
  }
};

using MatchResult = std::optional<LoweringDecision>;
using Matcher = auto (*)(const MatchInput&) -> MatchResult;

// An arrow function's parameter bindings and body.
struct ArrowShape {
  js::ParamBindings bindings;
  js::ExprId body;
};

auto GetArrow(const MatchInput& in) -> std::optional<ArrowShape> {
  auto bindings = js::GetArrowBindings(in.Arena(), in.expr);
  auto body = js::GetArrowBody(in.Arena(), in.expr);
  if (!bindings || !body) {
    return std::nullopt;
  }
  return ArrowShape{.bindings = std::move(*bindings), .body = *body};
}

auto JoinPath(const std::vector<std::string>& segments, size_t from = 0)
    -> std::string {
  std::string out;
  for (size_t i = from; i < segments.size(); ++i) {
    if (!out.empty()) {
      out += ".";
    }
    out += segments[i];
  }
  return out;
}

auto IsKeyframes(const MatchInput& in, std::string_view name) -> bool {
  return in.env.keyframes != nullptr &&
         in.env.keyframes->contains(std::string(name));
}

// Wraps an expression with the static text around the slot.
auto WithAffixes(const DynamicContext& context, const std::string& expr)
    -> std::string {
  if (context.value_prefix.empty() && context.value_suffix.empty()) {
    return expr;
  }
  return fmt::format(
      "`{}${{{}}}{}`", context.value_prefix, expr, context.value_suffix);
}

// Resolves a theme path through the adapter and validates the result.
auto ResolveTheme(const MatchInput& in, const std::string& path)
    -> std::optional<std::expected<ResolveResult, std::string>> {
  if (in.env.adapter == nullptr) {
    return std::nullopt;
  }
  auto result = in.env.adapter->ResolveValue(
      ResolveValueContext{
          .kind = ResolveKind::kTheme, .path = path, .fallback = std::nullopt});
  if (!result) {
    return std::nullopt;
  }
  if (!js::IsParseableExpression(result->expr)) {
    return std::unexpected(fmt::format(
        "adapter resolved theme path '{}' to an unparseable expression '{}'",
        path, result->expr));
  }
  return *result;
}

// Theme path of `props.theme.a.b` or a destructured `theme.a.b`.
auto GetThemePath(
    const js::Arena& arena, js::ExprId id, const js::ParamBindings& bindings)
    -> std::optional<std::string> {
  auto path = js::GetPropPath(arena, id, bindings);
  if (!path || path->size() < 2 || path->front() != "theme") {
    return std::nullopt;
  }
  return JoinPath(*path, 1);
}

enum class BranchFailure : uint8_t {
  kNoMatch,
  kInvalidBlock,
};

auto StyleFromBlock(std::string_view text)
    -> std::expected<StyleObject, BranchFailure> {
  auto props = css::ParseDeclarationBlock(text);
  if (!props) {
    return std::unexpected(BranchFailure::kInvalidBlock);
  }
  StyleObject style;
  for (const auto& prop : *props) {
    for (auto& [name, value] : css::ToStyleProps(prop.name, prop.value)) {
      style.Set(name, StyleValue::String(std::move(value)));
    }
  }
  return style;
}

auto StyleFromValue(const DynamicContext& context, const js::StaticLiteral& lit)
    -> StyleObject {
  StyleObject style;
  if (js::IsEmptyStyleLiteral(lit)) {
    return style;
  }
  bool bare = context.value_prefix.empty() && context.value_suffix.empty();
  auto text = context.value_prefix + lit.text + context.value_suffix;
  auto expanded = css::ToStyleProps(context.property, text);
  bool single = expanded.size() == 1;
  for (auto& [name, value] : expanded) {
    style.Set(
        name, single && bare && lit.kind == js::LiteralKind::kNumber
                  ? StyleValue::Number(value)
                  : StyleValue::String(value));
  }
  return style;
}

auto StyleFromExpression(const DynamicContext& context, const std::string& expr)
    -> StyleObject {
  StyleObject style;
  auto name = css::NormalizePropertyName(context.property);
  if (name == "background") {
    name = "backgroundColor";
  }
  style.Set(name, StyleValue::Expression(WithAffixes(context, expr)));
  return style;
}

// Style fragment for one branch of a conditional.
auto BranchStyle(const MatchInput& in, js::ExprId branch,
                 const js::ParamBindings& bindings)
    -> std::expected<StyleObject, BranchFailure> {
  const auto& arena = in.Arena();
  if (in.IsStandalone()) {
    auto literal = js::GetStaticLiteral(arena, branch);
    if (literal && js::IsEmptyStyleLiteral(*literal)) {
      return StyleObject{};
    }
    if (literal && literal->kind == js::LiteralKind::kString) {
      return StyleFromBlock(literal->text);
    }
    if (const auto* tagged = std::get_if<js::TaggedTemplateExpressionData>(
            &in.Expr(branch).data)) {
      auto quasi = js::GetStaticLiteral(arena, tagged->quasi);
      if (quasi && in.Text(tagged->tag) == "css") {
        return StyleFromBlock(quasi->text);
      }
    }
    return std::unexpected(BranchFailure::kNoMatch);
  }

  if (auto literal = js::GetStaticLiteral(arena, branch)) {
    return StyleFromValue(in.context, *literal);
  }
  if (auto theme = GetThemePath(arena, branch, bindings)) {
    auto resolved = ResolveTheme(in, *theme);
    if (resolved && *resolved) {
      return StyleFromExpression(in.context, (*resolved)->expr);
    }
    return std::unexpected(BranchFailure::kNoMatch);
  }
  // Constants from module scope.
  if (auto path = js::GetMemberPath(arena, branch);
      path && !js::GetPropPath(arena, branch, bindings)) {
    return StyleFromExpression(in.context, path->Dotted());
  }
  return std::unexpected(BranchFailure::kNoMatch);
}

auto InvalidBlockBail() -> LoweringDecision {
  return Bail(
      "conditional CSS block is not a flat list of `prop: value;` pairs");
}

auto IsBackgroundProperty(const DynamicContext& context) -> bool {
  return css::NormalizePropertyName(context.property) == "background";
}

// ---------------------------------------------------------------------------
// Matchers, in priority order
// ---------------------------------------------------------------------------

// 1. Literals and module-scope references.
auto MatchStaticReference(const MatchInput& in) -> MatchResult {
  if (in.context.kind == DynamicKind::kSelector) {
    return std::nullopt;
  }
  const auto& expr = in.Expr(in.expr);
  if (auto literal = js::GetStaticLiteral(in.Arena(), in.expr)) {
    std::string css_text =
        js::IsEmptyStyleLiteral(*literal) ? std::string() : literal->text;
    return ConvertDecision{
        .expr = in.Text(in.expr),
        .imports = {},
        .static_text = std::move(css_text),
        .keyframes_reference = false};
  }
  if (expr.kind == js::ExpressionKind::kTemplateLiteral) {
    return ConvertDecision{
        .expr = in.Text(in.expr),
        .imports = {},
        .static_text = std::nullopt,
        .keyframes_reference = false};
  }
  if (expr.kind == js::ExpressionKind::kIdentifier ||
      expr.kind == js::ExpressionKind::kMember) {
    auto path = js::GetMemberPath(in.Arena(), in.expr);
    if (!path || IsKeyframes(in, path->Dotted())) {
      return std::nullopt;
    }
    return ConvertDecision{
        .expr = path->Dotted(),
        .imports = {},
        .static_text = std::nullopt,
        .keyframes_reference = false};
  }
  return std::nullopt;
}

// 2. Reference to a keyframes declaration in the same file.
auto MatchKeyframesReference(const MatchInput& in) -> MatchResult {
  if (in.context.kind != DynamicKind::kDeclarationValue) {
    return std::nullopt;
  }
  const auto* ident =
      std::get_if<js::IdentifierExpressionData>(&in.Expr(in.expr).data);
  if (ident == nullptr || !IsKeyframes(in, ident->name)) {
    return std::nullopt;
  }
  return ConvertDecision{
      .expr = ident->name,
      .imports = {},
      .static_text = std::nullopt,
      .keyframes_reference = true};
}

// 3. `props => props.theme.a.b`, resolved by the adapter.
auto MatchThemeAccess(const MatchInput& in) -> MatchResult {
  auto arrow = GetArrow(in);
  if (!arrow) {
    return std::nullopt;
  }
  auto path = GetThemePath(in.Arena(), arrow->body, arrow->bindings);
  if (!path) {
    return std::nullopt;
  }
  auto resolved = ResolveTheme(in, *path);
  if (!resolved) {
    return std::nullopt;
  }
  if (!*resolved) {
    return Bail(resolved->error(), BailKind::kUnparseable);
  }
  return ConvertDecision{
      .expr = (*resolved)->expr,
      .imports = (*resolved)->imports,
      .static_text = std::nullopt,
      .keyframes_reference = false};
}

// Same-prop equality chain: `p.s === "a" ? A : p.s === "b" ? B : C`.
auto MatchEqualityChain(
    const MatchInput& in, const ArrowShape& arrow,
    const js::ConditionalExpressionData& top) -> MatchResult {
  std::vector<std::pair<Condition, js::ExprId>> cases;
  const js::ConditionalExpressionData* node = &top;
  js::ExprId fallback = top.alternate;
  while (node != nullptr) {
    auto cond =
        ConditionFromExpression(in.Arena(), node->test, arrow.bindings);
    if (!cond || cond->kind != ConditionKind::kEquality ||
        cond->op != EqualityOp::kStrictEqual ||
        (!cases.empty() && cases.front().first.path != cond->path)) {
      return std::nullopt;
    }
    cases.emplace_back(std::move(*cond), node->consequent);
    fallback = node->alternate;
    node = std::get_if<js::ConditionalExpressionData>(
        &in.Expr(node->alternate).data);
  }
  if (cases.size() < 2) {
    return std::nullopt;
  }

  SplitVariantsDecision decision{
      .branches = {}, .opaque_test = {}, .multi_branch = true};
  std::vector<Condition> all;
  for (const auto& [cond, _] : cases) {
    all.push_back(cond);
  }
  auto default_style = BranchStyle(in, fallback, arrow.bindings);
  if (!default_style) {
    return default_style.error() == BranchFailure::kInvalidBlock
               ? MatchResult(InvalidBlockBail())
               : std::nullopt;
  }
  decision.branches.push_back(
      VariantBranch{
          .name_hint = "default",
          .when = Condition::Not(Condition::Or(std::move(all))),
          .style = std::move(*default_style)});
  for (auto& [cond, branch] : cases) {
    auto style = BranchStyle(in, branch, arrow.bindings);
    if (!style) {
      return style.error() == BranchFailure::kInvalidBlock
                 ? MatchResult(InvalidBlockBail())
                 : std::nullopt;
    }
    decision.branches.push_back(
        VariantBranch{
            .name_hint = cond.rhs.text,
            .when = std::move(cond),
            .style = std::move(*style)});
  }
  return decision;
}

// `p.a ? A : p.b ? B : C` with two different boolean props.
auto MatchMultiProp(
    const MatchInput& in, const ArrowShape& arrow,
    const js::ConditionalExpressionData& top) -> MatchResult {
  const auto* inner =
      std::get_if<js::ConditionalExpressionData>(&in.Expr(top.alternate).data);
  if (inner == nullptr) {
    return std::nullopt;
  }
  auto outer_path = js::GetPropPath(in.Arena(), top.test, arrow.bindings);
  auto inner_path = js::GetPropPath(in.Arena(), inner->test, arrow.bindings);
  if (!outer_path || !inner_path || *outer_path == *inner_path) {
    return std::nullopt;
  }
  auto outer_true = BranchStyle(in, top.consequent, arrow.bindings);
  auto inner_true = BranchStyle(in, inner->consequent, arrow.bindings);
  auto inner_false = BranchStyle(in, inner->alternate, arrow.bindings);
  for (const auto* style : {&outer_true, &inner_true, &inner_false}) {
    if (!*style) {
      return style->error() == BranchFailure::kInvalidBlock
                 ? MatchResult(InvalidBlockBail())
                 : std::nullopt;
    }
  }
  return SplitMultiPropVariantsDecision{
      .outer_prop = JoinPath(*outer_path),
      .inner_prop = JoinPath(*inner_path),
      .outer_true = std::move(*outer_true),
      .inner_true = std::move(*inner_true),
      .inner_false = std::move(*inner_false)};
}

// 4. Ternaries on a boolean prop or an equality test.
auto MatchTernary(const MatchInput& in) -> MatchResult {
  if (in.context.kind != DynamicKind::kDeclarationValue) {
    return std::nullopt;
  }
  auto arrow = GetArrow(in);
  if (!arrow) {
    return std::nullopt;
  }
  const auto* cond_expr =
      std::get_if<js::ConditionalExpressionData>(&in.Expr(arrow->body).data);
  if (cond_expr == nullptr) {
    return std::nullopt;
  }

  if (auto chain = MatchEqualityChain(in, *arrow, *cond_expr)) {
    return chain;
  }
  if (auto multi = MatchMultiProp(in, *arrow, *cond_expr)) {
    return multi;
  }

  if (IsBackgroundProperty(in.context)) {
    auto cons = js::GetStaticLiteral(in.Arena(), cond_expr->consequent);
    auto alt = js::GetStaticLiteral(in.Arena(), cond_expr->alternate);
    if (cons && alt && !js::IsEmptyStyleLiteral(*cons) &&
        !js::IsEmptyStyleLiteral(*alt) &&
        css::IsBackgroundImageValue(cons->text) !=
            css::IsBackgroundImageValue(alt->text)) {
      return Bail(
          "conditional background mixes image and color values",
          BailKind::kHeterogeneous);
    }
  }

  auto consequent = BranchStyle(in, cond_expr->consequent, arrow->bindings);
  auto alternate = BranchStyle(in, cond_expr->alternate, arrow->bindings);
  for (const auto* style : {&consequent, &alternate}) {
    if (!*style) {
      return style->error() == BranchFailure::kInvalidBlock
                 ? MatchResult(InvalidBlockBail())
                 : std::nullopt;
    }
  }

  auto cond =
      ConditionFromExpression(in.Arena(), cond_expr->test, arrow->bindings);
  SplitVariantsDecision decision{
      .branches = {}, .opaque_test = {}, .multi_branch = false};
  if (!cond) {
    auto test = js::RewriteToPropNamespace(
        in.Arena(), cond_expr->test, arrow->bindings);
    if (!test) {
      return Bail(fmt::format(
          "condition '{}' uses the props parameter without a prop path",
          in.Text(cond_expr->test)));
    }
    decision.opaque_test = std::move(*test);
    decision.branches.push_back(
        VariantBranch{
            .name_hint = "truthy",
            .when = std::nullopt,
            .style = std::move(*consequent)});
    decision.branches.push_back(
        VariantBranch{
            .name_hint = "falsy",
            .when = std::nullopt,
            .style = std::move(*alternate)});
    return decision;
  }
  if (cond->kind == ConditionKind::kEquality) {
    // Negated condition is the default; the equality case overrides it.
    decision.branches.push_back(
        VariantBranch{
            .name_hint = "default",
            .when = Negate(*cond),
            .style = std::move(*alternate)});
    decision.branches.push_back(
        VariantBranch{
            .name_hint = "match",
            .when = std::move(*cond),
            .style = std::move(*consequent)});
    return decision;
  }
  auto negated = Negate(*cond);
  decision.branches.push_back(
      VariantBranch{
          .name_hint = "truthy",
          .when = std::move(*cond),
          .style = std::move(*consequent)});
  decision.branches.push_back(
      VariantBranch{
          .name_hint = "falsy",
          .when = std::move(negated),
          .style = std::move(*alternate)});
  return decision;
}

// 5. `prop && "css text"` / `prop && "value"`.
auto MatchLogicalAnd(const MatchInput& in) -> MatchResult {
  if (in.context.kind != DynamicKind::kDeclarationValue) {
    return std::nullopt;
  }
  auto arrow = GetArrow(in);
  if (!arrow) {
    return std::nullopt;
  }
  const auto* logical =
      std::get_if<js::LogicalExpressionData>(&in.Expr(arrow->body).data);
  if (logical == nullptr || logical->op != js::LogicalOp::kAnd) {
    return std::nullopt;
  }
  auto cond =
      ConditionFromExpression(in.Arena(), logical->lhs, arrow->bindings);
  if (!cond) {
    return std::nullopt;
  }
  auto style = BranchStyle(in, logical->rhs, arrow->bindings);
  if (!style) {
    if (style.error() == BranchFailure::kInvalidBlock) {
      return InvalidBlockBail();
    }
    return std::nullopt;
  }
  if (in.IsStandalone()) {
    SplitVariantsDecision decision{
        .branches = {}, .opaque_test = {}, .multi_branch = false};
    decision.branches.push_back(
        VariantBranch{
            .name_hint = "truthy",
            .when = std::move(*cond),
            .style = std::move(*style)});
    return decision;
  }
  auto prop_name = ToString(*cond);
  return VariantDecision{
      .prop_name = std::move(prop_name),
      .when = std::move(*cond),
      .style = std::move(*style)};
}

// 6. `prop || fallback` / `prop ?? fallback`.
auto MatchLogicalOr(const MatchInput& in) -> MatchResult {
  if (!in.IsPropertyValue()) {
    return std::nullopt;
  }
  auto arrow = GetArrow(in);
  if (!arrow) {
    return std::nullopt;
  }
  const auto* logical =
      std::get_if<js::LogicalExpressionData>(&in.Expr(arrow->body).data);
  if (logical == nullptr || logical->op == js::LogicalOp::kAnd) {
    return std::nullopt;
  }
  auto path = js::GetPropPath(in.Arena(), logical->lhs, arrow->bindings);
  auto fallback = js::GetStaticLiteral(in.Arena(), logical->rhs);
  if (!path || !fallback) {
    return std::nullopt;
  }
  return DynamicStyleFunctionDecision{
      .param_name = JoinPath(*path),
      .fallback = fallback->text,
      .original_prop_name = in.context.property,
      .value_prefix = {},
      .value_suffix = {}};
}

// 7. Plain `props.$x` / `props.x`.
auto MatchPropAccess(const MatchInput& in) -> MatchResult {
  if (!in.IsPropertyValue()) {
    return std::nullopt;
  }
  auto arrow = GetArrow(in);
  if (!arrow) {
    return std::nullopt;
  }
  auto path = js::GetPropPath(in.Arena(), arrow->body, arrow->bindings);
  if (!path) {
    return std::nullopt;
  }
  return DynamicStyleFunctionDecision{
      .param_name = JoinPath(*path),
      .fallback = std::nullopt,
      .original_prop_name = in.context.property,
      .value_prefix = {},
      .value_suffix = {}};
}

// Marks where the i-th expression of a template literal body sat.
auto ArgMarker(size_t index) -> std::string {
  return fmt::format("__STATICSS_ARG_{}__", index);
}

// Style function for one declaration of a template literal body; nullopt
// for a static declaration.
auto FunctionFromDeclaration(
    const css::StyleProp& prop, const std::vector<std::string>& params)
    -> std::expected<std::optional<DynamicStyleFunctionDecision>, std::string> {
  std::optional<DynamicStyleFunctionDecision> found;
  for (size_t i = 0; i < params.size(); ++i) {
    auto marker = ArgMarker(i);
    auto at = prop.value.find(marker);
    if (at == std::string::npos) {
      continue;
    }
    if (found) {
      return std::unexpected(fmt::format(
          "declaration '{}' reads more than one prop", prop.name));
    }
    found = DynamicStyleFunctionDecision{
        .param_name = params[i],
        .fallback = std::nullopt,
        .original_prop_name = prop.name,
        .value_prefix = prop.value.substr(0, at),
        .value_suffix = prop.value.substr(at + marker.size())};
  }
  return found;
}

// 8. Arrow whose body is a template literal over prop reads:
// `p => `${p.$w}px`` as a value, `p => `width: ${p.$w};`` as a block.
auto MatchTemplateLiteralBody(const MatchInput& in) -> MatchResult {
  if (in.context.kind != DynamicKind::kDeclarationValue) {
    return std::nullopt;
  }
  auto arrow = GetArrow(in);
  if (!arrow) {
    return std::nullopt;
  }
  const auto* tpl = std::get_if<js::TemplateLiteralExpressionData>(
      &in.Expr(arrow->body).data);
  if (tpl == nullptr || tpl->expressions.empty()) {
    return std::nullopt;
  }
  std::vector<std::string> params;
  for (auto id : tpl->expressions) {
    auto path = js::GetPropPath(in.Arena(), id, arrow->bindings);
    if (!path) {
      return std::nullopt;
    }
    params.push_back(JoinPath(*path));
  }

  if (in.IsPropertyValue()) {
    if (params.size() != 1) {
      return std::nullopt;
    }
    return DynamicStyleFunctionDecision{
        .param_name = std::move(params.front()),
        .fallback = std::nullopt,
        .original_prop_name = in.context.property,
        .value_prefix = tpl->quasis[0],
        .value_suffix = tpl->quasis[1]};
  }

  std::string text = tpl->quasis[0];
  for (size_t i = 0; i < params.size(); ++i) {
    text += ArgMarker(i) + tpl->quasis[i + 1];
  }
  auto props = css::ParseDeclarationBlock(text);
  if (!props) {
    return InvalidBlockBail();
  }
  StyleFunctionBlockDecision block;
  for (const auto& prop : *props) {
    auto function = FunctionFromDeclaration(prop, params);
    if (!function) {
      return Bail(std::move(function.error()));
    }
    if (*function) {
      block.functions.push_back(std::move(**function));
      continue;
    }
    for (auto& [name, value] : css::ToStyleProps(prop.name, prop.value)) {
      block.static_style.Set(name, StyleValue::String(std::move(value)));
    }
  }
  return block;
}

// 9. `props => helper(props.$x)` where helper is a ternary over literals.
auto MatchHelperCall(const MatchInput& in) -> MatchResult {
  if (in.context.kind != DynamicKind::kDeclarationValue ||
      in.env.helpers == nullptr) {
    return std::nullopt;
  }
  auto arrow = GetArrow(in);
  if (!arrow) {
    return std::nullopt;
  }
  const auto* call =
      std::get_if<js::CallExpressionData>(&in.Expr(arrow->body).data);
  if (call == nullptr || call->arguments.size() != 1) {
    return std::nullopt;
  }
  const auto* callee =
      std::get_if<js::IdentifierExpressionData>(&in.Expr(call->callee).data);
  if (callee == nullptr) {
    return std::nullopt;
  }
  const TernaryHelper* helper = nullptr;
  for (const auto& candidate : *in.env.helpers) {
    if (candidate.name == callee->name) {
      helper = &candidate;
      break;
    }
  }
  auto path =
      js::GetPropPath(in.Arena(), call->arguments.front(), arrow->bindings);
  if (helper == nullptr || !path) {
    return std::nullopt;
  }

  auto style_for = [&](const js::StaticLiteral& literal)
      -> std::expected<StyleObject, BranchFailure> {
    if (!in.IsStandalone()) {
      return StyleFromValue(in.context, literal);
    }
    if (js::IsEmptyStyleLiteral(literal)) {
      return StyleObject{};
    }
    return StyleFromBlock(literal.text);
  };
  auto truthy = style_for(helper->truthy);
  auto falsy = style_for(helper->falsy);
  if (!truthy || !falsy) {
    return InvalidBlockBail();
  }
  auto cond = Condition::Prop(JoinPath(*path));
  auto negated = Negate(cond);
  SplitVariantsDecision decision{
      .branches = {}, .opaque_test = {}, .multi_branch = false};
  decision.branches.push_back(
      VariantBranch{
          .name_hint = "truthy",
          .when = std::move(cond),
          .style = std::move(*truthy)});
  decision.branches.push_back(
      VariantBranch{
          .name_hint = "falsy",
          .when = std::move(negated),
          .style = std::move(*falsy)});
  return decision;
}

auto ToCallArg(const MatchInput& in, js::ExprId arg) -> CallArg {
  if (auto literal = js::GetStaticLiteral(in.Arena(), arg)) {
    return CallArg{.kind = CallArgKind::kLiteral, .text = literal->text};
  }
  if (auto path = js::GetMemberPath(in.Arena(), arg);
      path && path->root == "theme" && !path->segments.empty()) {
    return CallArg{
        .kind = CallArgKind::kTheme, .text = JoinPath(path->segments)};
  }
  return CallArg{.kind = CallArgKind::kUnknown, .text = in.Text(arg)};
}

// 10. Other calls and css`` templates pass through verbatim.
auto MatchCallOrCssTemplate(const MatchInput& in) -> MatchResult {
  if (in.context.kind == DynamicKind::kSelector) {
    return std::nullopt;
  }
  const auto& expr = in.Expr(in.expr);
  if (const auto* tagged =
          std::get_if<js::TaggedTemplateExpressionData>(&expr.data)) {
    if (in.Text(tagged->tag) != "css") {
      return std::nullopt;
    }
    return ConvertDecision{
        .expr = in.Text(in.expr),
        .imports = {},
        .static_text = std::nullopt,
        .keyframes_reference = false};
  }
  const auto* call = std::get_if<js::CallExpressionData>(&expr.data);
  if (call == nullptr) {
    return std::nullopt;
  }

  if (in.env.adapter != nullptr) {
    ResolveCallContext request{
        .callee_name = in.Text(call->callee), .callee_source = {}, .args = {}};
    if (auto root = js::GetMemberPath(in.Arena(), call->callee);
        root && in.env.imports != nullptr) {
      if (auto it = in.env.imports->find(root->root);
          it != in.env.imports->end()) {
        request.callee_source = it->second;
      }
    }
    for (auto arg : call->arguments) {
      request.args.push_back(ToCallArg(in, arg));
    }
    if (auto result = in.env.adapter->ResolveCall(request)) {
      if (!js::IsParseableExpression(result->expr)) {
        return Bail(
            fmt::format(
                "adapter resolved call '{}' to an unparseable expression '{}'",
                request.callee_name, result->expr),
            BailKind::kUnparseable);
      }
      return ConvertDecision{
          .expr = result->expr,
          .imports = result->imports,
          .static_text = std::nullopt,
          .keyframes_reference = false};
    }
  }
  return ConvertDecision{
      .expr = in.Text(in.expr),
      .imports = {},
      .static_text = std::nullopt,
      .keyframes_reference = false};
}

// 11. A component referenced inside a selector.
auto MatchSelectorComponent(const MatchInput& in) -> MatchResult {
  if (in.context.kind != DynamicKind::kSelector) {
    return std::nullopt;
  }
  auto path = js::GetMemberPath(in.Arena(), in.expr);
  if (!path) {
    return std::nullopt;
  }
  return Bail(fmt::format(
      "component '{}' used as a selector in '{}' cannot be lowered",
      path->Dotted(), in.context.selector));
}

struct NamedMatcher {
  std::string_view name;
  Matcher fn;
};

constexpr std::array<NamedMatcher, 11> kMatchers = {{
    {"static-reference", &MatchStaticReference},
    {"keyframes-reference", &MatchKeyframesReference},
    {"theme-access", &MatchThemeAccess},
    {"ternary", &MatchTernary},
    {"logical-and", &MatchLogicalAnd},
    {"logical-or", &MatchLogicalOr},
    {"prop-access", &MatchPropAccess},
    {"template-literal-body", &MatchTemplateLiteralBody},
    {"helper-call", &MatchHelperCall},
    {"call-or-css-template", &MatchCallOrCssTemplate},
    {"selector-component", &MatchSelectorComponent},
}};

}  // namespace

auto Classifier::Classify(
    std::optional<js::ExprId> expr, const DynamicContext& context) const
    -> LoweringDecision {
  if (!expr) {
    return Bail("interpolation could not be parsed", BailKind::kParseError);
  }
  MatchInput input{.env = env_, .expr = *expr, .context = context};
  for (const auto& matcher : kMatchers) {
    if (auto decision = matcher.fn(input)) {
      spdlog::debug(
          "classifier: '{}' matched by {} -> {}", env_.arena->Text(*expr),
          matcher.name, DescribeDecision(*decision));
      return std::move(*decision);
    }
  }
  spdlog::debug("classifier: no matcher for '{}'", env_.arena->Text(*expr));
  return Bail("unsupported interpolation");
}

auto Classifier::MatcherNames() -> std::vector<std::string_view> {
  std::vector<std::string_view> names;
  for (const auto& matcher : kMatchers) {
    names.push_back(matcher.name);
  }
  return names;
}

auto DescribeDecision(const LoweringDecision& decision) -> std::string {
  return std::visit(
      [](const auto& d) -> std::string {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, ConvertDecision>) {
          return fmt::format("Convert({})", d.expr);
        } else if constexpr (std::is_same_v<T, VariantDecision>) {
          return fmt::format("Variant({})", d.prop_name);
        } else if constexpr (std::is_same_v<T, SplitVariantsDecision>) {
          return fmt::format("SplitVariants({} branches)", d.branches.size());
        } else if constexpr (std::is_same_v<
                                 T, SplitMultiPropVariantsDecision>) {
          return fmt::format(
              "SplitMultiPropVariants({}, {})", d.outer_prop, d.inner_prop);
        } else if constexpr (std::is_same_v<
                                 T, DynamicStyleFunctionDecision>) {
          return fmt::format("DynamicStyleFunction({})", d.param_name);
        } else if constexpr (std::is_same_v<T, StyleFunctionBlockDecision>) {
          return fmt::format(
              "StyleFunctionBlock({} functions)", d.functions.size());
        } else {
          return fmt::format("Bail({})", d.reason);
        }
      },
      decision);
}

}  // namespace staticss::lowering
