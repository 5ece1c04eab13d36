#include "staticss/lowering/lower.hpp"

#include <cstdint>
#include <expected>
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
#include "staticss/common/diagnostic/warning_sink.hpp"
#include "staticss/common/internal_error.hpp"
#include "staticss/common/string_utils.hpp"
#include "staticss/css/ir.hpp"
#include "staticss/css/ir_builder.hpp"
#include "staticss/css/placeholder.hpp"
#include "staticss/css/template_parser.hpp"
#include "staticss/lowering/assembler.hpp"
#include "staticss/lowering/classifier.hpp"
#include "staticss/lowering/decision.hpp"
#include "staticss/lowering/naming.hpp"

namespace staticss::lowering {

namespace {

// Per-component state shared by the helpers below.
struct Context {
  const source::StyledComponent* component;
  const Classifier* classifier;
  Assembler* assembler;
};

auto SlotExpression(const Context& ctx, uint32_t slot_id)
    -> std::optional<js::ExprId> {
  const auto& slots = ctx.component->slots;
  if (slot_id >= slots.size()) {
    common::ThrowInternalError(
        "LowerComponent", fmt::format("unknown slot {}", slot_id));
  }
  return slots[slot_id].expression;
}

// Combinators, classes, attributes and ids outside of `:not(...)` style
// arguments.
auto HasComplexSelectorPart(std::string_view text) -> bool {
  int depth = 0;
  for (char c : text) {
    if (c == '(') {
      ++depth;
    } else if (c == ')') {
      --depth;
    } else if (depth == 0 && std::string_view(" >+~.[#&").find(c) !=
                                 std::string_view::npos) {
      return true;
    }
  }
  return false;
}

auto IsSupportedAtRule(std::string_view at_rule) -> bool {
  return at_rule.starts_with("@media") || at_rule.starts_with("@supports") ||
         at_rule.starts_with("@container");
}

// Substitutes converted slots in a selector or at-rule prelude. Returns the
// rewritten text and whether any slot was replaced, or nullopt after a bail.
auto ResolveSlotsInText(
    const Context& ctx, std::string_view text, DynamicKind kind,
    const std::string& selector, const std::vector<std::string>& stack)
    -> std::optional<std::pair<std::string, bool>> {
  std::string out;
  bool replaced = false;
  size_t pos = 0;
  while (auto match = css::FindPlaceholder(text, pos)) {
    out += text.substr(pos, match->begin - pos);
    DynamicContext context{
        .kind = kind,
        .property = {},
        .selector = selector,
        .at_rule_stack = stack,
        .is_full_value = false,
        .value_prefix = {},
        .value_suffix = {},
    };
    auto decision =
        ctx.classifier->Classify(SlotExpression(ctx, match->id), context);
    if (const auto* bail = std::get_if<BailDecision>(&decision)) {
      ctx.assembler->Bail(*bail);
      return std::nullopt;
    }
    const auto* convert = std::get_if<ConvertDecision>(&decision);
    if (convert == nullptr || kind == DynamicKind::kSelector) {
      ctx.assembler->Bail(
          category::kUnsupportedSelector,
          fmt::format("interpolated selector '{}' cannot be lowered", text));
      return std::nullopt;
    }
    out += convert->static_text ? *convert->static_text
                                : fmt::format("${{{}}}", convert->expr);
    replaced = replaced || !convert->static_text;
    pos = match->begin + match->length;
  }
  out += text.substr(pos);
  return std::pair{std::move(out), replaced};
}

void LowerDeclaration(
    const Context& ctx, const css::CssRule& rule, const StyleScope& scope,
    const css::CssDeclaration& decl) {
  auto slot_ids = decl.SlotIds();
  if (slot_ids.empty()) {
    ctx.assembler->ApplyStatic(scope, decl);
    return;
  }

  auto make_context = [&](bool single) {
    DynamicContext context{
        .kind = DynamicKind::kDeclarationValue,
        .property = decl.property,
        .selector = rule.selector,
        .at_rule_stack = rule.at_rule_stack,
        .is_full_value = decl.FullValueSlot().has_value(),
        .value_prefix = {},
        .value_suffix = {},
    };
    if (!single) {
      return context;
    }
    const auto& parts = std::get<css::InterpolatedValue>(decl.value).parts;
    bool seen_slot = false;
    for (const auto& part : parts) {
      if (const auto* text = std::get_if<css::StaticPart>(&part)) {
        (seen_slot ? context.value_suffix : context.value_prefix) +=
            text->text;
      } else {
        seen_slot = true;
      }
    }
    return context;
  };

  if (slot_ids.size() == 1) {
    auto decision = ctx.classifier->Classify(
        SlotExpression(ctx, slot_ids.front()), make_context(true));
    ctx.assembler->Apply(scope, decl, slot_ids.front(), decision);
    return;
  }

  std::vector<std::pair<uint32_t, ConvertDecision>> converts;
  auto context = make_context(false);
  for (auto slot_id : slot_ids) {
    auto decision =
        ctx.classifier->Classify(SlotExpression(ctx, slot_id), context);
    if (auto* convert = std::get_if<ConvertDecision>(&decision)) {
      converts.emplace_back(slot_id, std::move(*convert));
      continue;
    }
    if (const auto* bail = std::get_if<BailDecision>(&decision)) {
      ctx.assembler->Bail(*bail);
      return;
    }
    ctx.assembler->Bail(
        BailDecision{
            .kind = BailKind::kUnsupported,
            .reason = fmt::format(
                "declaration '{}' combines several interpolations that are "
                "not all static",
                decl.property)});
    return;
  }
  ctx.assembler->ApplyConverted(scope, decl, converts);
}

void LowerRule(const Context& ctx, const css::CssRule& rule) {
  auto selector = ResolveSlotsInText(
      ctx, rule.selector, DynamicKind::kSelector, rule.selector,
      rule.at_rule_stack);
  if (!selector) {
    return;
  }
  std::vector<std::string> at_rules;
  for (const auto& at_rule : rule.at_rule_stack) {
    auto resolved = ResolveSlotsInText(
        ctx, at_rule, DynamicKind::kAtRuleParams, rule.selector,
        rule.at_rule_stack);
    if (!resolved) {
      return;
    }
    auto [text, computed] = std::move(*resolved);
    if (!IsSupportedAtRule(text)) {
      if (!rule.declarations.empty()) {
        ctx.assembler->Bail(
            category::kUnsupportedSelector,
            fmt::format("at-rule '{}' cannot be lowered", text));
      }
      return;
    }
    at_rules.push_back(computed ? fmt::format("[`{}`]", text) : text);
  }

  auto scope = MapSelectorScope(selector->first);
  if (!scope) {
    if (!rule.declarations.empty()) {
      ctx.assembler->Bail(
          category::kUnsupportedSelector,
          fmt::format("selector '{}' cannot be lowered", selector->first));
    }
    return;
  }
  scope->at_rules = std::move(at_rules);
  for (const auto& decl : rule.declarations) {
    LowerDeclaration(ctx, rule, *scope, decl);
  }
}

auto LowerComponent(
    const source::StyledComponent& component, const Classifier& classifier,
    Adapter& adapter, WarningSink& sink) -> StyledDecl {
  StyledDecl decl{
      .local_name = component.local_name,
      .tag = component.tag,
      .wraps_component = component.wraps_component,
      .style_key = ToStyleKey(component.local_name),
      .location = component.location,
  };
  Assembler assembler(&decl, &adapter, &sink);
  Context ctx{
      .component = &component,
      .classifier = &classifier,
      .assembler = &assembler,
  };

  auto tree = css::ParseTemplate(component.css);
  if (!tree) {
    assembler.Bail(
        category::kParseError,
        fmt::format(
            "could not parse template: {}", tree.error().primary.message));
    return decl;
  }
  auto rules = css::BuildIr(*tree, component.slots, component.css);
  for (const auto& rule : rules) {
    LowerRule(ctx, rule);
  }
  spdlog::debug(
      "lowered {}: {} bucket(s), {} style function(s){}", decl.local_name,
      decl.variant_buckets.size(), decl.style_fn_specs.size(),
      decl.bailed ? ", bailed" : "");
  return decl;
}

}  // namespace

auto FileResult::Find(std::string_view local_name) const -> const StyledDecl* {
  for (const auto& component : components) {
    if (component.local_name == local_name) {
      return &component;
    }
  }
  return nullptr;
}

auto FileResult::AnyBailed() const -> bool {
  for (const auto& component : components) {
    if (component.bailed) {
      return true;
    }
  }
  return false;
}

auto MapSelectorScope(std::string_view selector)
    -> std::optional<StyleScope> {
  StyleScope scope;
  bool first = true;
  for (const auto& piece : common::SplitTopLevel(selector, ',')) {
    std::string_view rest = piece;
    if (rest.starts_with('&')) {
      rest.remove_prefix(1);
    }
    if (rest.empty()) {
      // `&` alone: the base style; only valid as the whole selector.
      if (!first || selector.find(',') != std::string_view::npos) {
        return std::nullopt;
      }
      return scope;
    }
    if (!rest.starts_with(':') || HasComplexSelectorPart(rest)) {
      return std::nullopt;
    }
    std::optional<std::string> element;
    std::string pseudo;
    auto element_at = rest.find("::");
    if (element_at != std::string_view::npos) {
      element = std::string(rest.substr(element_at));
      pseudo = std::string(rest.substr(0, element_at));
    } else {
      pseudo = std::string(rest);
    }
    if (!first && scope.pseudo_element != element) {
      return std::nullopt;
    }
    scope.pseudo_element = std::move(element);
    if (!pseudo.empty()) {
      scope.pseudos.push_back(std::move(pseudo));
    } else if (!scope.pseudos.empty()) {
      return std::nullopt;
    }
    first = false;
  }
  if (first) {
    return std::nullopt;
  }
  return scope;
}

auto LowerFile(const source::ScannedFile& file, Adapter& adapter)
    -> FileResult {
  ClassifierEnv env{
      .arena = &file.arena,
      .adapter = &adapter,
      .helpers = &file.helpers,
      .keyframes = &file.keyframes,
      .imports = &file.imports,
  };
  Classifier classifier(env);
  WarningSink sink;
  FileResult result;
  for (const auto& component : file.components) {
    result.components.push_back(
        LowerComponent(component, classifier, adapter, sink));
  }
  result.warnings = sink.TakeWarnings();
  return result;
}

auto LowerSource(std::string source, Adapter& adapter) -> Result<FileResult> {
  auto file = source::ScanSource(std::move(source));
  if (!file) {
    return std::unexpected(file.error());
  }
  return LowerFile(*file, adapter);
}

}  // namespace staticss::lowering
