#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "staticss/common/diagnostic/warning.hpp"
#include "staticss/common/diagnostic/warning_sink.hpp"
#include "staticss/css/ir.hpp"
#include "staticss/lowering/adapter.hpp"
#include "staticss/lowering/assembler.hpp"
#include "staticss/lowering/condition.hpp"
#include "staticss/lowering/decision.hpp"
#include "staticss/lowering/style_value.hpp"
#include "staticss/lowering/styled_decl.hpp"

namespace staticss::lowering {
namespace {

// Maps custom properties to `vars.<name>`.
class VarsAdapter final : public Adapter {
 public:
  auto ResolveValue(const ResolveValueContext& context)
      -> std::optional<ResolveResult> override {
    if (context.kind != ResolveKind::kCssVariable) {
      return std::nullopt;
    }
    return ResolveResult{
        .expr = "vars." + context.path.substr(2),
        .imports = {ImportSpec{.from = "./tokens.stylex", .names = {"vars"}}}};
  }
  auto ResolveCall(const ResolveCallContext& /*context*/)
      -> std::optional<ResolveResult> override {
    return std::nullopt;
  }
};

class AssemblerTest : public ::testing::Test {
 protected:
  AssemblerTest() {
    decl_.local_name = "Button";
    decl_.tag = "button";
    decl_.style_key = "button";
  }

  static auto Static(std::string property, std::string value)
      -> css::CssDeclaration {
    css::CssDeclaration decl;
    decl.property = std::move(property);
    decl.raw_value = value;
    decl.value = css::StaticValue{.text = std::move(value)};
    return decl;
  }

  static auto Interpolated(
      std::string property, std::vector<css::CssValuePart> parts)
      -> css::CssDeclaration {
    css::CssDeclaration decl;
    decl.property = std::move(property);
    decl.value = css::InterpolatedValue{.parts = std::move(parts)};
    return decl;
  }

  static auto Slot(uint32_t id) -> css::CssValuePart {
    return css::SlotPart{.slot_id = id};
  }

  static auto Text(std::string text) -> css::CssValuePart {
    return css::StaticPart{.text = std::move(text)};
  }

  static auto Style(std::string key, StyleValue value) -> StyleObject {
    StyleObject style;
    style.Set(key, std::move(value));
    return style;
  }

  static auto Convert(std::string expr) -> ConvertDecision {
    return ConvertDecision{
        .expr = std::move(expr),
        .imports = {},
        .static_text = std::nullopt,
        .keyframes_reference = false};
  }

  static auto Hover() -> StyleScope {
    return StyleScope{
        .pseudos = {":hover"}, .pseudo_element = std::nullopt, .at_rules = {}};
  }

  // `$on ? <color: on> : <color: off>` in a standalone block.
  static auto OnOffSplit(std::string on, std::string off)
      -> SplitVariantsDecision {
    auto when = Condition::Prop("$on");
    SplitVariantsDecision split{
        .branches = {}, .opaque_test = {}, .multi_branch = false};
    split.branches.push_back(
        VariantBranch{
            .name_hint = "truthy",
            .when = when,
            .style = Style("color", StyleValue::String(std::move(on)))});
    split.branches.push_back(
        VariantBranch{
            .name_hint = "falsy",
            .when = Negate(when),
            .style = Style("color", StyleValue::String(std::move(off)))});
    return split;
  }

  auto MakeAssembler() -> Assembler {
    return Assembler(&decl_, adapter_, &sink_);
  }

  StyledDecl decl_;
  StyleScope base_;
  NullAdapter null_adapter_;
  Adapter* adapter_ = &null_adapter_;
  WarningSink sink_;
};

// =============================================================================
// Static declarations and scopes
// =============================================================================

TEST_F(AssemblerTest, StaticDeclarationsWriteBase) {
  auto assembler = MakeAssembler();
  assembler.ApplyStatic(base_, Static("color", "red"));
  assembler.ApplyStatic(base_, Static("font-size", "12px"));

  EXPECT_EQ(
      decl_.style_obj.Keys(), (std::vector<std::string>{"color", "fontSize"}));
  EXPECT_EQ(*decl_.style_obj.Find("color"), StyleValue::String("red"));
}

TEST_F(AssemblerTest, PseudoWrapsPriorValueAsDefault) {
  auto assembler = MakeAssembler();
  assembler.ApplyStatic(base_, Static("color", "red"));
  assembler.ApplyStatic(Hover(), Static("color", "blue"));

  const auto* color = decl_.style_obj.Find("color");
  ASSERT_NE(color, nullptr);
  ASSERT_TRUE(color->IsObject());
  EXPECT_EQ(ToString(*color), "{ default: \"red\", \":hover\": \"blue\" }");
}

TEST_F(AssemblerTest, LaterBaseReplacesDefault) {
  auto assembler = MakeAssembler();
  assembler.ApplyStatic(Hover(), Static("color", "blue"));
  assembler.ApplyStatic(base_, Static("color", "red"));

  EXPECT_EQ(
      ToString(*decl_.style_obj.Find("color")),
      "{ default: \"red\", \":hover\": \"blue\" }");
}

TEST_F(AssemblerTest, PseudoWithMediaNests) {
  StyleScope scope{
      .pseudos = {":hover"},
      .pseudo_element = std::nullopt,
      .at_rules = {"@media (min-width: 600px)"}};
  auto assembler = MakeAssembler();
  assembler.ApplyStatic(scope, Static("color", "blue"));

  EXPECT_EQ(
      ToString(*decl_.style_obj.Find("color")),
      "{ default: null, \":hover\": { default: null, "
      "\"@media (min-width: 600px)\": \"blue\" } }");
}

TEST_F(AssemblerTest, PseudoElementGetsOwnObject) {
  StyleScope scope{
      .pseudos = {}, .pseudo_element = "::before", .at_rules = {}};
  auto assembler = MakeAssembler();
  assembler.ApplyStatic(scope, Static("content", "\"\""));

  const auto* before = decl_.style_obj.Find("::before");
  ASSERT_NE(before, nullptr);
  ASSERT_TRUE(before->IsObject());
  EXPECT_EQ(before->object.Keys(), (std::vector<std::string>{"content"}));
}

TEST_F(AssemblerTest, CssVariableResolvedByAdapter) {
  VarsAdapter vars;
  adapter_ = &vars;
  auto assembler = MakeAssembler();
  assembler.ApplyStatic(base_, Static("color", "var(--brand, red)"));

  EXPECT_EQ(
      *decl_.style_obj.Find("color"), StyleValue::Expression("vars.brand"));
  ASSERT_EQ(decl_.imports.size(), 1U);
  EXPECT_EQ(decl_.imports.front().from, "./tokens.stylex");
}

// =============================================================================
// Converted slots
// =============================================================================

TEST_F(AssemblerTest, FullValueConvertIsExpression) {
  auto assembler = MakeAssembler();
  assembler.Apply(
      base_, Interpolated("color", {Slot(0)}), 0, Convert("vars.primary"));
  EXPECT_EQ(
      *decl_.style_obj.Find("color"), StyleValue::Expression("vars.primary"));
}

TEST_F(AssemblerTest, PartialConvertIsTemplate) {
  auto assembler = MakeAssembler();
  assembler.Apply(
      base_, Interpolated("width", {Slot(0), Text("px")}), 0,
      Convert("size"));
  EXPECT_EQ(
      *decl_.style_obj.Find("width"), StyleValue::Expression("`${size}px`"));
}

TEST_F(AssemblerTest, StaticTextIsInlined) {
  auto convert = Convert("16");
  convert.static_text = "16";
  auto assembler = MakeAssembler();
  assembler.Apply(
      base_, Interpolated("width", {Slot(0), Text("px")}), 0, convert);
  EXPECT_EQ(*decl_.style_obj.Find("width"), StyleValue::String("16px"));
}

TEST_F(AssemblerTest, StandaloneConvertBecomesMixin) {
  auto assembler = MakeAssembler();
  assembler.Apply(base_, Interpolated("", {Slot(0)}), 0, Convert("truncate"));
  EXPECT_EQ(decl_.mixins, (std::vector<std::string>{"truncate"}));
  EXPECT_FALSE(decl_.bailed);
}

TEST_F(AssemblerTest, MixinUnderPseudoBails) {
  auto assembler = MakeAssembler();
  assembler.Apply(
      Hover(), Interpolated("", {Slot(0)}), 0, Convert("truncate"));
  EXPECT_TRUE(decl_.mixins.empty());
  EXPECT_TRUE(decl_.bailed);
}

// =============================================================================
// Variants
// =============================================================================

TEST_F(AssemblerTest, PropertyTernaryDefaultGoesToBase) {
  auto assembler = MakeAssembler();
  assembler.Apply(
      base_, Interpolated("color", {Slot(0)}), 0, OnOffSplit("red", "blue"));

  EXPECT_EQ(*decl_.style_obj.Find("color"), StyleValue::String("blue"));
  ASSERT_EQ(decl_.variant_buckets.size(), 1U);
  EXPECT_EQ(decl_.variant_buckets[0].when, "$on");
  EXPECT_EQ(decl_.KeyFor("$on"), "buttonOn");
  ASSERT_EQ(decl_.variant_entries.size(), 1U);
  EXPECT_EQ(decl_.variant_entries[0].kind, VariantEntryKind::kGuarded);
}

TEST_F(AssemblerTest, StandaloneTernaryMergesComplements) {
  auto assembler = MakeAssembler();
  assembler.Apply(
      base_, Interpolated("", {Slot(0)}), 0, OnOffSplit("red", "blue"));

  ASSERT_EQ(decl_.variant_buckets.size(), 2U);
  EXPECT_EQ(decl_.KeyFor("!$on"), "buttonNotOn");
  ASSERT_EQ(decl_.variant_entries.size(), 1U);
  const auto& entry = decl_.variant_entries[0];
  EXPECT_EQ(entry.kind, VariantEntryKind::kTernary);
  EXPECT_EQ(entry.when, "$on");
  EXPECT_EQ(entry.key, "buttonOn");
  EXPECT_EQ(entry.false_key, "buttonNotOn");
}

TEST_F(AssemblerTest, ConsecutiveStepsMerge) {
  auto on = Condition::Prop("$on");
  auto assembler = MakeAssembler();
  assembler.Apply(
      base_, Interpolated("", {Slot(0)}), 0,
      VariantDecision{
          .prop_name = "$on",
          .when = Negate(on),
          .style = Style("color", StyleValue::String("blue"))});
  assembler.Apply(
      base_, Interpolated("", {Slot(1)}), 1,
      VariantDecision{
          .prop_name = "$on",
          .when = on,
          .style = Style("color", StyleValue::String("red"))});

  ASSERT_EQ(decl_.variant_entries.size(), 1U);
  const auto& entry = decl_.variant_entries[0];
  EXPECT_EQ(entry.kind, VariantEntryKind::kTernary);
  EXPECT_EQ(entry.when, "$on");
  EXPECT_EQ(entry.key, "buttonOn");
  EXPECT_EQ(entry.false_key, "buttonNotOn");
}

TEST_F(AssemblerTest, DistantComplementsStaySeparate) {
  auto on = Condition::Prop("$on");
  auto assembler = MakeAssembler();
  assembler.Apply(
      base_, Interpolated("", {Slot(0)}), 0,
      VariantDecision{
          .prop_name = "$on",
          .when = on,
          .style = Style("color", StyleValue::String("red"))});
  assembler.ApplyStatic(base_, Static("margin", "0"));
  assembler.ApplyStatic(base_, Static("opacity", "1"));
  assembler.Apply(
      base_, Interpolated("", {Slot(1)}), 1,
      VariantDecision{
          .prop_name = "$on",
          .when = Negate(on),
          .style = Style("color", StyleValue::String("blue"))});

  ASSERT_EQ(decl_.variant_entries.size(), 2U);
  EXPECT_EQ(decl_.variant_entries[0].kind, VariantEntryKind::kGuarded);
  EXPECT_EQ(decl_.variant_entries[1].kind, VariantEntryKind::kGuarded);
}

TEST_F(AssemblerTest, SameConditionSharesBucket) {
  auto on = Condition::Prop("$on");
  auto assembler = MakeAssembler();
  for (uint32_t slot = 0; slot < 2; ++slot) {
    assembler.Apply(
        base_, Interpolated("", {Slot(slot)}), slot,
        VariantDecision{
            .prop_name = "$on",
            .when = on,
            .style = Style(
                slot == 0 ? "color" : "opacity", StyleValue::String("1"))});
  }
  ASSERT_EQ(decl_.variant_buckets.size(), 1U);
  EXPECT_EQ(
      decl_.variant_buckets[0].style.Keys(),
      (std::vector<std::string>{"color", "opacity"}));
  EXPECT_EQ(decl_.variant_entries.size(), 1U);
}

TEST_F(AssemblerTest, EqualityChainUsesCaseNames) {
  SplitVariantsDecision split{
      .branches = {}, .opaque_test = {}, .multi_branch = true};
  split.branches.push_back(
      VariantBranch{
          .name_hint = "sm",
          .when = Condition::Equality(
              "size", EqualityOp::kStrictEqual,
              {.kind = OperandKind::kString, .text = "sm"}),
          .style = Style("padding", StyleValue::String("2px"))});
  auto assembler = MakeAssembler();
  assembler.Apply(base_, Interpolated("", {Slot(0)}), 0, split);

  EXPECT_EQ(decl_.KeyFor("size === \"sm\""), "buttonSm");
}

TEST_F(AssemblerTest, CompoundVariant) {
  auto assembler = MakeAssembler();
  assembler.Apply(
      base_, Interpolated("color", {Slot(0)}), 0,
      SplitMultiPropVariantsDecision{
          .outer_prop = "$a",
          .inner_prop = "$b",
          .outer_true = Style("color", StyleValue::String("red")),
          .inner_true = Style("color", StyleValue::String("blue")),
          .inner_false = Style("color", StyleValue::String("green"))});

  ASSERT_EQ(decl_.compound_variants.size(), 1U);
  const auto& compound = decl_.compound_variants[0];
  EXPECT_EQ(compound.outer_key, "buttonA");
  EXPECT_EQ(compound.inner_true_key, "buttonBTrue");
  EXPECT_EQ(compound.inner_false_key, "buttonBFalse");
  ASSERT_EQ(decl_.variant_entries.size(), 1U);
  EXPECT_EQ(decl_.variant_entries[0].kind, VariantEntryKind::kCompound);
}

TEST_F(AssemblerTest, RepeatedCompoundVariantMergesIntoFirst) {
  auto assembler = MakeAssembler();
  auto compound = [](const std::string& property) {
    return SplitMultiPropVariantsDecision{
        .outer_prop = "$a",
        .inner_prop = "$b",
        .outer_true = Style(property, StyleValue::String("red")),
        .inner_true = Style(property, StyleValue::String("blue")),
        .inner_false = Style(property, StyleValue::String("green"))};
  };
  assembler.Apply(
      base_, Interpolated("color", {Slot(0)}), 0, compound("color"));
  assembler.Apply(
      base_, Interpolated("background", {Slot(1)}), 1,
      compound("backgroundColor"));

  ASSERT_EQ(decl_.compound_variants.size(), 1U);
  EXPECT_EQ(decl_.compound_variants[0].inner_true_key, "buttonBTrue");
  ASSERT_EQ(decl_.variant_entries.size(), 1U);
  ASSERT_EQ(decl_.variant_buckets.size(), 3U);
  const auto* outer = decl_.FindBucket("$a");
  ASSERT_NE(outer, nullptr);
  EXPECT_EQ(
      outer->style.Keys(),
      (std::vector<std::string>{"color", "backgroundColor"}));
}

TEST_F(AssemblerTest, StyleFunctionKeepsStaticAffixes) {
  auto assembler = MakeAssembler();
  assembler.Apply(
      base_, Interpolated("width", {Slot(0), Text("px")}), 0,
      DynamicStyleFunctionDecision{
          .param_name = "$w",
          .fallback = std::nullopt,
          .original_prop_name = "width",
          .value_prefix = {},
          .value_suffix = {}});

  ASSERT_EQ(decl_.style_fn_specs.size(), 1U);
  const auto& spec = decl_.style_fn_specs[0];
  EXPECT_EQ(spec.name, "buttonWidth");
  EXPECT_EQ(spec.param_name, "$w");
  EXPECT_EQ(spec.style_prop, "width");
  EXPECT_EQ(spec.value_template, "${value}px");
  ASSERT_EQ(decl_.variant_entries.size(), 1U);
  EXPECT_EQ(decl_.variant_entries[0].kind, VariantEntryKind::kStyleFunction);
}

TEST_F(AssemblerTest, StyleFunctionOnlyForLonghandsTheSlotReaches) {
  auto assembler = MakeAssembler();
  assembler.Apply(
      base_, Interpolated("border", {Text("1px solid "), Slot(0)}), 0,
      DynamicStyleFunctionDecision{
          .param_name = "$c",
          .fallback = std::nullopt,
          .original_prop_name = "border",
          .value_prefix = {},
          .value_suffix = {}});

  EXPECT_EQ(
      ToString(decl_.style_obj),
      "{ borderWidth: \"1px\", borderStyle: \"solid\" }");
  ASSERT_EQ(decl_.style_fn_specs.size(), 1U);
  EXPECT_EQ(decl_.style_fn_specs[0].name, "buttonBorderColor");
  EXPECT_EQ(decl_.style_fn_specs[0].style_prop, "borderColor");
  EXPECT_EQ(decl_.style_fn_specs[0].value_template, "${value}");
  ASSERT_EQ(decl_.variant_entries.size(), 1U);
  EXPECT_EQ(ToString(decl_.variant_entries[0]), "buttonBorderColor($c)");
}

TEST_F(AssemblerTest, StyleFunctionWrapsTemplateAffixes) {
  auto assembler = MakeAssembler();
  assembler.Apply(
      base_, Interpolated("width", {Slot(0)}), 0,
      DynamicStyleFunctionDecision{
          .param_name = "$w",
          .fallback = std::nullopt,
          .original_prop_name = "width",
          .value_prefix = "calc(",
          .value_suffix = "px + 1em)"});

  ASSERT_EQ(decl_.style_fn_specs.size(), 1U);
  EXPECT_EQ(decl_.style_fn_specs[0].value_template, "calc(${value}px + 1em)");
}

TEST_F(AssemblerTest, StyleFunctionBlock) {
  auto assembler = MakeAssembler();
  StyleFunctionBlockDecision block{
      .static_style = Style("color", StyleValue::String("red")),
      .functions = {}};
  for (const auto* prop : {"width", "height"}) {
    block.functions.push_back(
        DynamicStyleFunctionDecision{
            .param_name = std::string("$") + prop,
            .fallback = std::nullopt,
            .original_prop_name = prop,
            .value_prefix = {},
            .value_suffix = {}});
  }
  assembler.Apply(base_, Interpolated("", {Slot(0)}), 0, block);

  EXPECT_EQ(*decl_.style_obj.Find("color"), StyleValue::String("red"));
  ASSERT_EQ(decl_.style_fn_specs.size(), 2U);
  EXPECT_EQ(decl_.style_fn_specs[0].name, "buttonWidth");
  EXPECT_EQ(decl_.style_fn_specs[1].name, "buttonHeight");
  ASSERT_EQ(decl_.variant_entries.size(), 2U);
  EXPECT_EQ(ToString(decl_.variant_entries[1]), "buttonHeight($height)");
}

// =============================================================================
// Bails
// =============================================================================

TEST_F(AssemblerTest, BailStopsVariantsButNotConverts) {
  auto assembler = MakeAssembler();
  assembler.Apply(
      base_, Interpolated("color", {Slot(0)}), 0,
      Bail("unsupported interpolation"));
  assembler.Apply(
      base_, Interpolated("", {Slot(1)}), 1, OnOffSplit("red", "blue"));
  assembler.Apply(
      base_, Interpolated("width", {Slot(2)}), 2, Convert("size"));

  EXPECT_TRUE(decl_.bailed);
  EXPECT_TRUE(decl_.variant_buckets.empty());
  EXPECT_TRUE(decl_.variant_entries.empty());
  EXPECT_EQ(*decl_.style_obj.Find("width"), StyleValue::Expression("size"));

  ASSERT_EQ(decl_.warnings.size(), 1U);
  EXPECT_EQ(decl_.warnings[0].category, category::kDynamicCss);
  EXPECT_EQ(decl_.warnings[0].severity, Severity::kWarning);
  ASSERT_FALSE(decl_.warnings[0].context.empty());
  EXPECT_EQ(decl_.warnings[0].context[0].second, "Button");
  EXPECT_EQ(sink_.GetWarnings().size(), 1U);
}

TEST_F(AssemblerTest, UnparseableBailIsError) {
  auto assembler = MakeAssembler();
  assembler.Bail(
      BailDecision{.kind = BailKind::kUnparseable, .reason = "bad adapter"});
  ASSERT_EQ(decl_.warnings.size(), 1U);
  EXPECT_EQ(decl_.warnings[0].severity, Severity::kError);
  EXPECT_TRUE(sink_.HasErrors());
}

TEST_F(AssemblerTest, BailCategories) {
  EXPECT_EQ(BailCategory(BailKind::kUnsupported), category::kDynamicCss);
  EXPECT_EQ(
      BailCategory(BailKind::kHeterogeneous),
      category::kHeterogeneousBackground);
  EXPECT_EQ(BailCategory(BailKind::kParseError), category::kParseError);
}

}  // namespace
}  // namespace staticss::lowering
