#include "staticss/lowering/assembler.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "staticss/common/diagnostic/warning.hpp"
#include "staticss/common/internal_error.hpp"
#include "staticss/common/overloaded.hpp"
#include "staticss/common/string_utils.hpp"
#include "staticss/css/declaration_block.hpp"
#include "staticss/css/ir.hpp"
#include "staticss/js/parser.hpp"
#include "staticss/lowering/naming.hpp"

namespace staticss::lowering {

namespace {

constexpr std::string_view kValueToken = "__STATICSS_VALUE__";

auto SlotToken(uint32_t slot_id) -> std::string {
  return fmt::format("__STATICSS_SLOT_{}__", slot_id);
}

// Declaration value with non-static slots replaced by tokens.
struct ComposedValue {
  std::string text;
  std::vector<std::pair<std::string, std::string>> tokens;  // token -> expr
};

auto EscapeTemplateText(std::string_view text) -> std::string {
  std::string out;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '\\' || c == '`' ||
        (c == '$' && i + 1 < text.size() && text[i + 1] == '{')) {
      out += '\\';
    }
    out += c;
  }
  return out;
}

// Turns a longhand value back into a style value: a lone token becomes the
// expression, a value containing tokens becomes a template literal.
auto Materialize(
    const std::string& value,
    const std::vector<std::pair<std::string, std::string>>& tokens)
    -> StyleValue {
  for (const auto& [token, expr] : tokens) {
    if (value == token) {
      return StyleValue::Expression(expr);
    }
  }
  std::string out;
  bool templated = false;
  size_t pos = 0;
  while (pos < value.size()) {
    size_t best = std::string::npos;
    const std::pair<std::string, std::string>* best_token = nullptr;
    for (const auto& entry : tokens) {
      auto found = value.find(entry.first, pos);
      if (found < best) {
        best = found;
        best_token = &entry;
      }
    }
    if (best_token == nullptr) {
      out += EscapeTemplateText(std::string_view(value).substr(pos));
      break;
    }
    out += EscapeTemplateText(std::string_view(value).substr(pos, best - pos));
    out += fmt::format("${{{}}}", best_token->second);
    pos = best + best_token->first.size();
    templated = true;
  }
  if (!templated) {
    return StyleValue::String(value);
  }
  return StyleValue::Expression(fmt::format("`{}`", out));
}

auto ValueParts(const css::CssDeclaration& decl)
    -> std::vector<css::CssValuePart> {
  return std::visit(
      Overloaded{
          [](const css::StaticValue& v) -> std::vector<css::CssValuePart> {
            return {css::StaticPart{.text = v.text}};
          },
          [](const css::InterpolatedValue& v) { return v.parts; },
      },
      decl.value);
}

// Static text before and after the first slot of a single-slot value.
auto StaticAffixes(const css::CssDeclaration& decl)
    -> std::pair<std::string, std::string> {
  std::string prefix;
  std::string suffix;
  bool seen_slot = false;
  for (const auto& part : ValueParts(decl)) {
    if (const auto* text = std::get_if<css::StaticPart>(&part)) {
      (seen_slot ? suffix : prefix) += text->text;
    } else {
      seen_slot = true;
    }
  }
  return {prefix, suffix};
}

auto IsBaseBranch(std::string_view hint) -> bool {
  return hint == "falsy" || hint == "default";
}

auto Nest(
    const StyleValue* existing, std::span<const std::string> path,
    StyleValue value) -> StyleValue {
  if (path.empty()) {
    return value;
  }
  StyleObject map;
  if (existing != nullptr && existing->IsObject()) {
    map = existing->object;
  } else {
    map.Set("default", existing != nullptr ? *existing : StyleValue::Null());
  }
  auto nested = Nest(map.Find(path.front()), path.subspan(1), std::move(value));
  map.Set(path.front(), std::move(nested));
  return StyleValue::Object(std::move(map));
}

auto PropertyFor(const css::CssDeclaration& decl) -> std::string {
  return std::string(common::Trim(decl.property));
}

}  // namespace

auto BailCategory(BailKind kind) -> std::string_view {
  switch (kind) {
    case BailKind::kUnsupported:
      return category::kDynamicCss;
    case BailKind::kUnparseable:
      return category::kUnparseableExpression;
    case BailKind::kHeterogeneous:
      return category::kHeterogeneousBackground;
    case BailKind::kParseError:
      return category::kParseError;
  }
  return category::kDynamicCss;
}

void WriteScoped(
    StyleObject& target, const StyleScope& scope, const std::string& prop,
    StyleValue value) {
  StyleObject* object = &target;
  if (scope.pseudo_element) {
    StyleValue* element = target.Find(*scope.pseudo_element);
    if (element == nullptr || !element->IsObject()) {
      target.Set(*scope.pseudo_element, StyleValue::Object({}));
      element = target.Find(*scope.pseudo_element);
    }
    object = &element->object;
  }

  if (scope.pseudos.empty() && scope.at_rules.empty()) {
    StyleValue* existing = object->Find(prop);
    // A later base value replaces the default of a conditional map.
    if (existing != nullptr && existing->IsObject()) {
      if (StyleValue* fallback = existing->object.Find("default")) {
        *fallback = std::move(value);
        return;
      }
    }
    object->Set(prop, std::move(value));
    return;
  }

  std::vector<std::vector<std::string>> paths;
  if (scope.pseudos.empty()) {
    paths.push_back(scope.at_rules);
  }
  for (const auto& pseudo : scope.pseudos) {
    std::vector<std::string> path{pseudo};
    path.insert(path.end(), scope.at_rules.begin(), scope.at_rules.end());
    paths.push_back(std::move(path));
  }
  for (const auto& path : paths) {
    auto nested = Nest(object->Find(prop), path, value);
    object->Set(prop, std::move(nested));
  }
}

Assembler::Assembler(StyledDecl* decl, Adapter* adapter, WarningSink* sink)
    : decl_(decl), adapter_(adapter), sink_(sink) {
}

void Assembler::ApplyStatic(
    const StyleScope& scope, const css::CssDeclaration& decl) {
  BeginStep();
  const auto* value = std::get_if<css::StaticValue>(&decl.value);
  if (value == nullptr || decl.IsStandaloneBlock()) {
    return;
  }
  if (decl.important) {
    spdlog::debug(
        "{}: dropping !important on '{}'", decl_->local_name, decl.property);
  }
  auto property = PropertyFor(decl);

  if (auto resolved = ResolveCssVariable(value->text)) {
    if (!js::IsParseableExpression(resolved->expr)) {
      Bail(
          BailDecision{
              .kind = BailKind::kUnparseable,
              .reason = fmt::format(
                  "adapter resolved '{}' to an unparseable expression '{}'",
                  value->text, resolved->expr)});
      return;
    }
    AddImports(resolved->imports);
    for (const auto& prop : css::ToStyleProps(property, kValueToken)) {
      WriteBase(scope, prop.name, StyleValue::Expression(resolved->expr));
    }
    return;
  }

  for (auto& prop : css::ToStyleProps(property, value->text)) {
    WriteBase(scope, prop.name, StyleValue::String(std::move(prop.value)));
  }
}

void Assembler::Apply(
    const StyleScope& scope, const css::CssDeclaration& decl,
    uint32_t slot_id, const LoweringDecision& decision) {
  if (const auto* convert = std::get_if<ConvertDecision>(&decision)) {
    ApplyConverted(scope, decl, {{slot_id, *convert}});
    return;
  }
  BeginStep();
  std::visit(
      Overloaded{
          [](const ConvertDecision&) {},
          [&](const VariantDecision& d) { ApplyVariant(scope, d); },
          [&](const SplitVariantsDecision& d) {
            ApplySplitVariants(scope, decl, d);
          },
          [&](const SplitMultiPropVariantsDecision& d) {
            ApplyMultiProp(scope, d);
          },
          [&](const DynamicStyleFunctionDecision& d) {
            ApplyStyleFunction(scope, decl, slot_id, d);
          },
          [&](const StyleFunctionBlockDecision& d) {
            ApplyStyleFunctionBlock(scope, d);
          },
          [&](const BailDecision& d) { Bail(d); },
      },
      decision);
}

void Assembler::ApplyConverted(
    const StyleScope& scope, const css::CssDeclaration& decl,
    const std::vector<std::pair<uint32_t, ConvertDecision>>& converts) {
  BeginStep();
  auto find = [&](uint32_t slot_id) -> const ConvertDecision* {
    for (const auto& [id, convert] : converts) {
      if (id == slot_id) {
        return &convert;
      }
    }
    return nullptr;
  };

  ComposedValue composed;
  for (const auto& part : ValueParts(decl)) {
    if (const auto* text = std::get_if<css::StaticPart>(&part)) {
      composed.text += text->text;
      continue;
    }
    uint32_t slot_id = std::get<css::SlotPart>(part).slot_id;
    const ConvertDecision* convert = find(slot_id);
    if (convert == nullptr) {
      common::ThrowInternalError(
          "Assembler::ApplyConverted",
          fmt::format("no decision for slot {}", slot_id));
    }
    AddImports(convert->imports);
    if (convert->static_text) {
      composed.text += *convert->static_text;
      continue;
    }
    auto token = SlotToken(slot_id);
    composed.text += token;
    composed.tokens.emplace_back(std::move(token), convert->expr);
  }

  if (decl.IsStandaloneBlock()) {
    auto text = common::Trim(composed.text);
    if (composed.tokens.empty()) {
      if (text.empty()) {
        return;
      }
      auto props = css::ParseDeclarationBlock(text);
      if (!props) {
        Bail(
            BailDecision{
                .kind = BailKind::kUnsupported,
                .reason = fmt::format(
                    "interpolated CSS block '{}' is not a flat list of "
                    "declarations",
                    text)});
        return;
      }
      for (const auto& prop : *props) {
        for (auto& out : css::ToStyleProps(prop.name, prop.value)) {
          WriteBase(
              scope, out.name, StyleValue::String(std::move(out.value)));
        }
      }
      return;
    }
    if (!scope.IsBase()) {
      Bail(
          BailDecision{
              .kind = BailKind::kUnsupported,
              .reason = "style mixins cannot be applied under nested "
                        "selectors or at-rules"});
      return;
    }
    for (const auto& [token, expr] : composed.tokens) {
      decl_->mixins.push_back(expr);
    }
    return;
  }

  auto props = css::ToStyleProps(PropertyFor(decl), composed.text);
  for (const auto& prop : props) {
    WriteBase(scope, prop.name, Materialize(prop.value, composed.tokens));
  }
}

void Assembler::Bail(std::string_view category, std::string message) {
  auto warning = Warning::Unsupported(category, std::move(message))
                     .WithLocation(decl_->location)
                     .WithContext("component", decl_->local_name);
  decl_->warnings.push_back(warning);
  sink_->Report(std::move(warning));
  if (!decl_->bailed) {
    spdlog::debug("{}: bailed", decl_->local_name);
  }
  decl_->bailed = true;
}

void Assembler::Bail(const BailDecision& decision) {
  auto warning =
      Warning::Unsupported(BailCategory(decision.kind), decision.reason)
          .WithLocation(decl_->location)
          .WithContext("component", decl_->local_name);
  if (decision.kind == BailKind::kUnparseable) {
    warning = std::move(warning).AsError();
  }
  decl_->warnings.push_back(warning);
  sink_->Report(std::move(warning));
  if (!decl_->bailed) {
    spdlog::debug("{}: bailed: {}", decl_->local_name, decision.reason);
  }
  decl_->bailed = true;
}

auto Assembler::SkipAfterBail(std::string_view what) const -> bool {
  if (decl_->bailed) {
    spdlog::debug("{}: skipping {} after bail", decl_->local_name, what);
    return true;
  }
  return false;
}

void Assembler::ApplyVariant(
    const StyleScope& scope, const VariantDecision& decision) {
  if (SkipAfterBail("variant")) {
    return;
  }
  if (auto key = AddToBucket(scope, decision.when, {}, false, decision.style)) {
    PushGuardedEntry(decision.when, *key);
  }
}

void Assembler::ApplySplitVariants(
    const StyleScope& scope, const css::CssDeclaration& decl,
    const SplitVariantsDecision& decision) {
  if (SkipAfterBail("split variants")) {
    return;
  }
  bool standalone = decl.IsStandaloneBlock();
  for (const auto& branch : decision.branches) {
    Condition when = branch.when.value_or(
        branch.name_hint == "falsy"
            ? Condition::Not(Condition::Opaque(decision.opaque_test))
            : Condition::Opaque(decision.opaque_test));
    // For a single property the default branch is the base value.
    if (!standalone && IsBaseBranch(branch.name_hint)) {
      WriteBaseStyle(scope, branch.style);
      continue;
    }
    auto key = AddToBucket(
        scope, when, branch.name_hint, decision.multi_branch, branch.style);
    if (key) {
      PushGuardedEntry(when, *key);
    }
  }
}

void Assembler::ApplyMultiProp(
    const StyleScope& scope, const SplitMultiPropVariantsDecision& decision) {
  if (SkipAfterBail("compound variant")) {
    return;
  }
  auto outer = Condition::Prop(decision.outer_prop);
  auto inner = Condition::Prop(decision.inner_prop);
  auto inner_true_when = Condition::And({Negate(outer), inner});
  auto inner_false_when = Condition::And({Negate(outer), Negate(inner)});

  auto bucket = [&](const Condition& when, const std::string& key,
                    const StyleObject& style) {
    auto rendered = ToString(when);
    VariantBucket* existing = decl_->FindBucket(rendered);
    if (existing == nullptr) {
      decl_->variant_buckets.push_back(
          VariantBucket{.when = rendered, .condition = when, .style = {}});
      decl_->variant_style_keys.push_back(
          VariantStyleKey{.when = rendered, .key = key});
      existing = &decl_->variant_buckets.back();
    }
    for (const auto& entry : style.Entries()) {
      WriteScoped(existing->style, scope, entry.key, entry.value);
    }
    return decl_->KeyFor(rendered).value_or(key);
  };

  auto inner_suffix = ToSuffix(inner);
  CompoundVariant compound{
      .outer_prop = decision.outer_prop,
      .inner_prop = decision.inner_prop,
      .outer_key = bucket(
          outer, UniqueKey(decl_->style_key + ToSuffix(outer)),
          decision.outer_true),
      .inner_true_key = bucket(
          inner_true_when,
          UniqueKey(fmt::format("{}{}True", decl_->style_key, inner_suffix)),
          decision.inner_true),
      .inner_false_key = bucket(
          inner_false_when,
          UniqueKey(fmt::format("{}{}False", decl_->style_key, inner_suffix)),
          decision.inner_false),
  };
  // A repeated pair only adds its styles to the existing buckets.
  auto same_pair = [&](const CompoundVariant& existing) {
    return existing.outer_prop == compound.outer_prop &&
           existing.inner_prop == compound.inner_prop;
  };
  if (std::any_of(
          decl_->compound_variants.begin(), decl_->compound_variants.end(),
          same_pair)) {
    return;
  }
  decl_->variant_entries.push_back(
      VariantEntry{
          .kind = VariantEntryKind::kCompound,
          .when = ToString(outer),
          .key = compound.outer_key,
          .false_key = fmt::format(
              "{} ? {} : {}", ToString(inner), compound.inner_true_key,
              compound.inner_false_key),
          .created_at = step_});
  spdlog::debug(
      "{}: compound variant {} / {}", decl_->local_name, decision.outer_prop,
      decision.inner_prop);
  decl_->compound_variants.push_back(std::move(compound));
}

void Assembler::ApplyStyleFunction(
    const StyleScope& scope, const css::CssDeclaration& decl,
    uint32_t slot_id, const DynamicStyleFunctionDecision& decision) {
  if (SkipAfterBail("style function")) {
    return;
  }
  if (decl.SlotIds().size() != 1) {
    common::ThrowInternalError(
        "Assembler::ApplyStyleFunction",
        fmt::format("slot {} is not the declaration's only slot", slot_id));
  }
  auto [prefix, suffix] = StaticAffixes(decl);
  AddStyleFunction(scope, decision, prefix, suffix);
}

void Assembler::ApplyStyleFunctionBlock(
    const StyleScope& scope, const StyleFunctionBlockDecision& decision) {
  WriteBaseStyle(scope, decision.static_style);
  if (SkipAfterBail("style function block")) {
    return;
  }
  for (const auto& function : decision.functions) {
    AddStyleFunction(scope, function, "", "");
  }
}

void Assembler::AddStyleFunction(
    const StyleScope& scope, const DynamicStyleFunctionDecision& decision,
    std::string_view prefix, std::string_view suffix) {
  auto props = css::ToStyleProps(
      decision.original_prop_name,
      fmt::format(
          "{}{}{}{}{}", prefix, decision.value_prefix, kValueToken,
          decision.value_suffix, suffix));
  for (const auto& prop : props) {
    auto at = prop.value.find(kValueToken);
    // Longhands the prop does not reach keep their static value.
    if (at == std::string::npos) {
      WriteBase(scope, prop.name, StyleValue::String(prop.value));
      continue;
    }
    auto name = decl_->style_key + ToSuffixFromProp(prop.name);
    if (decl_->FindStyleFn(name) == nullptr) {
      std::string value_template = prop.value;
      value_template.replace(at, kValueToken.size(), "${value}");
      decl_->style_fn_specs.push_back(
          StyleFnSpec{
              .name = name,
              .param_name = decision.param_name,
              .fallback = decision.fallback,
              .css_property = decision.original_prop_name,
              .style_prop = prop.name,
              .value_template = std::move(value_template),
              .scope = scope});
    }
    decl_->variant_entries.push_back(
        VariantEntry{
            .kind = VariantEntryKind::kStyleFunction,
            .when = decision.param_name,
            .key = std::move(name),
            .false_key = {},
            .created_at = step_});
  }
}

void Assembler::WriteBase(
    const StyleScope& scope, const std::string& prop, StyleValue value) {
  WriteScoped(decl_->style_obj, scope, prop, std::move(value));
}

void Assembler::WriteBaseStyle(
    const StyleScope& scope, const StyleObject& style) {
  for (const auto& entry : style.Entries()) {
    WriteBase(scope, entry.key, entry.value);
  }
}

auto Assembler::AddToBucket(
    const StyleScope& scope, const Condition& when, std::string_view hint,
    bool use_hint, const StyleObject& style) -> std::optional<std::string> {
  if (style.Empty()) {
    return std::nullopt;
  }
  auto rendered = ToString(when);
  VariantBucket* bucket = decl_->FindBucket(rendered);
  if (bucket == nullptr) {
    auto suffix = use_hint && !IsGenericNameHint(hint)
                      ? NameHintToSuffix(hint)
                      : ToSuffix(when);
    auto key = UniqueKey(decl_->style_key + suffix);
    spdlog::debug(
        "{}: new bucket '{}' -> {}", decl_->local_name, rendered, key);
    decl_->variant_buckets.push_back(
        VariantBucket{.when = rendered, .condition = when, .style = {}});
    decl_->variant_style_keys.push_back(
        VariantStyleKey{.when = rendered, .key = key});
    bucket = &decl_->variant_buckets.back();
  }
  for (const auto& entry : style.Entries()) {
    WriteScoped(bucket->style, scope, entry.key, entry.value);
  }
  return decl_->KeyFor(rendered);
}

void Assembler::PushGuardedEntry(
    const Condition& when, const std::string& key) {
  auto rendered = ToString(when);
  for (const auto& entry : decl_->variant_entries) {
    if (entry.key == key || entry.false_key == key) {
      return;
    }
  }
  if (!decl_->variant_entries.empty()) {
    VariantEntry& last = decl_->variant_entries.back();
    const VariantBucket* last_bucket = decl_->FindBucket(last.when);
    bool adjacent = last.kind == VariantEntryKind::kGuarded &&
                    last.created_at + 1 >= step_;
    if (adjacent && last_bucket != nullptr &&
        AreComplementary(last_bucket->condition, when)) {
      bool last_is_positive =
          last_bucket->condition.kind != ConditionKind::kNot;
      spdlog::debug(
          "{}: merging '{}' and '{}' into a ternary", decl_->local_name,
          last.when, rendered);
      if (last_is_positive) {
        last.false_key = key;
      } else {
        last.when = rendered;
        last.false_key = std::exchange(last.key, key);
      }
      last.kind = VariantEntryKind::kTernary;
      return;
    }
  }
  decl_->variant_entries.push_back(
      VariantEntry{
          .kind = VariantEntryKind::kGuarded,
          .when = rendered,
          .key = key,
          .false_key = {},
          .created_at = step_});
}

auto Assembler::UniqueKey(const std::string& base) const -> std::string {
  if (!decl_->HasKey(base)) {
    return base;
  }
  for (int n = 2;; ++n) {
    auto candidate = fmt::format("{}{}", base, n);
    if (!decl_->HasKey(candidate)) {
      return candidate;
    }
  }
}

void Assembler::AddImports(const std::vector<ImportSpec>& imports) {
  for (const auto& spec : imports) {
    auto it = std::find_if(
        decl_->imports.begin(), decl_->imports.end(),
        [&](const ImportSpec& existing) { return existing.from == spec.from; });
    if (it == decl_->imports.end()) {
      decl_->imports.push_back(spec);
      continue;
    }
    for (const auto& name : spec.names) {
      if (std::find(it->names.begin(), it->names.end(), name) ==
          it->names.end()) {
        it->names.push_back(name);
      }
    }
  }
}

auto Assembler::ResolveCssVariable(std::string_view value)
    -> std::optional<ResolveResult> {
  auto text = common::Trim(value);
  if (adapter_ == nullptr || !text.starts_with("var(") ||
      !text.ends_with(")")) {
    return std::nullopt;
  }
  auto inner = common::Trim(text.substr(4, text.size() - 5));
  std::optional<std::string> fallback;
  auto comma = inner.find(',');
  auto name = common::Trim(inner.substr(0, comma));
  if (comma != std::string_view::npos) {
    fallback = std::string(common::Trim(inner.substr(comma + 1)));
  }
  if (!name.starts_with("--") ||
      name.find_first_of("() ") != std::string_view::npos) {
    return std::nullopt;
  }
  return adapter_->ResolveValue(
      ResolveValueContext{
          .kind = ResolveKind::kCssVariable,
          .path = std::string(name),
          .fallback = std::move(fallback)});
}

}  // namespace staticss::lowering
