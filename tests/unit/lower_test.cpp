#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "staticss/common/diagnostic/warning.hpp"
#include "staticss/lowering/adapter.hpp"
#include "staticss/lowering/lower.hpp"
#include "staticss/lowering/style_value.hpp"
#include "staticss/lowering/styled_decl.hpp"

namespace staticss::lowering {
namespace {

class LowerTest : public ::testing::Test {
 protected:
  auto Lower(std::string source) -> FileResult {
    auto result = LowerSource(std::move(source), adapter_);
    EXPECT_TRUE(result.has_value());
    if (!result) {
      return FileResult{};
    }
    return std::move(*result);
  }

  NullAdapter adapter_;
};

// =============================================================================
// Selector scopes
// =============================================================================

TEST_F(LowerTest, RootSelectorIsBase) {
  auto scope = MapSelectorScope("&");
  ASSERT_TRUE(scope.has_value());
  EXPECT_TRUE(scope->IsBase());
}

TEST_F(LowerTest, PseudoClassesAndElements) {
  auto hover = MapSelectorScope("&:hover");
  ASSERT_TRUE(hover.has_value());
  EXPECT_EQ(hover->pseudos, (std::vector<std::string>{":hover"}));

  auto before = MapSelectorScope("&::before");
  ASSERT_TRUE(before.has_value());
  EXPECT_TRUE(before->pseudos.empty());
  EXPECT_EQ(before->pseudo_element, "::before");

  auto both = MapSelectorScope("&:hover::after");
  ASSERT_TRUE(both.has_value());
  EXPECT_EQ(both->pseudos, (std::vector<std::string>{":hover"}));
  EXPECT_EQ(both->pseudo_element, "::after");

  auto negated = MapSelectorScope("&:not(.active)");
  ASSERT_TRUE(negated.has_value());
  EXPECT_EQ(negated->pseudos, (std::vector<std::string>{":not(.active)"}));
}

TEST_F(LowerTest, SelectorListOfPseudos) {
  auto scope = MapSelectorScope("&:hover, &:focus-visible");
  ASSERT_TRUE(scope.has_value());
  EXPECT_EQ(
      scope->pseudos, (std::vector<std::string>{":hover", ":focus-visible"}));
}

TEST_F(LowerTest, UnmappableSelectors) {
  EXPECT_FALSE(MapSelectorScope("& span").has_value());
  EXPECT_FALSE(MapSelectorScope("&.active").has_value());
  EXPECT_FALSE(MapSelectorScope("& > li").has_value());
  EXPECT_FALSE(MapSelectorScope("&[disabled]").has_value());
  EXPECT_FALSE(MapSelectorScope("&, &:hover").has_value());
  EXPECT_FALSE(MapSelectorScope("&::before, &:hover").has_value());
}

// =============================================================================
// Components
// =============================================================================

TEST_F(LowerTest, StaticStylesWithHover) {
  auto result = Lower(
      "import styled from \"styled-components\";\n"
      "const Button = styled.button`\n"
      "  color: red;\n"
      "  opacity: 0.5;\n"
      "  &:hover {\n"
      "    color: blue;\n"
      "  }\n"
      "`;\n");
  const auto* button = result.Find("Button");
  ASSERT_NE(button, nullptr);
  EXPECT_EQ(button->style_key, "button");
  EXPECT_FALSE(button->bailed);
  EXPECT_EQ(
      ToString(button->style_obj),
      "{ color: { default: \"red\", \":hover\": \"blue\" }, "
      "opacity: \"0.5\" }");
  EXPECT_TRUE(result.warnings.empty());
}

TEST_F(LowerTest, BooleanTernaryProperty) {
  auto result = Lower(
      "const Box = styled.div`\n"
      "  color: ${p => p.$on ? \"red\" : \"blue\"};\n"
      "`;\n");
  const auto* box = result.Find("Box");
  ASSERT_NE(box, nullptr);
  EXPECT_EQ(*box->style_obj.Find("color"), StyleValue::String("blue"));
  EXPECT_EQ(box->KeyFor("$on"), "boxOn");
  ASSERT_EQ(box->variant_entries.size(), 1U);
  EXPECT_EQ(ToString(box->variant_entries[0]), "$on && boxOn");
}

TEST_F(LowerTest, PropComparisonUsesPropNamespace) {
  auto result = Lower(
      "const Box = styled.div`\n"
      "  color: ${(p) => p.$a === p.$b ? \"red\" : \"blue\"};\n"
      "`;\n");
  const auto* box = result.Find("Box");
  ASSERT_NE(box, nullptr);
  ASSERT_NE(box->FindBucket("$a === $b"), nullptr);
  EXPECT_EQ(box->KeyFor("$a === $b"), "boxCondTruthy");
  ASSERT_EQ(box->variant_entries.size(), 1U);
  EXPECT_EQ(ToString(box->variant_entries[0]), "$a === $b && boxCondTruthy");
}

TEST_F(LowerTest, OpaqueTestUsesPropNamespace) {
  auto result = Lower(
      "const Bar = styled.div`\n"
      "  width: ${(props) => props.$n > 3 ? \"1px\" : \"2px\"};\n"
      "`;\n");
  const auto* bar = result.Find("Bar");
  ASSERT_NE(bar, nullptr);
  EXPECT_EQ(*bar->style_obj.Find("width"), StyleValue::String("2px"));
  ASSERT_EQ(bar->variant_entries.size(), 1U);
  EXPECT_EQ(ToString(bar->variant_entries[0]), "$n > 3 && barCondTruthy");
}

TEST_F(LowerTest, StandaloneConditionalBlock) {
  auto result = Lower(
      "const Box = styled.div`\n"
      "  ${p => p.$on && \"color: red;\"}\n"
      "`;\n");
  const auto* box = result.Find("Box");
  ASSERT_NE(box, nullptr);
  ASSERT_EQ(box->variant_buckets.size(), 1U);
  EXPECT_EQ(
      ToString(box->variant_buckets[0].style), "{ color: \"red\" }");
  EXPECT_TRUE(box->style_obj.Empty());
}

TEST_F(LowerTest, PropValueBecomesStyleFunction) {
  auto result = Lower(
      "const Bar = styled.div`\n"
      "  width: ${p => p.$w}px;\n"
      "`;\n");
  const auto* bar = result.Find("Bar");
  ASSERT_NE(bar, nullptr);
  ASSERT_EQ(bar->style_fn_specs.size(), 1U);
  EXPECT_EQ(bar->style_fn_specs[0].name, "barWidth");
  EXPECT_EQ(bar->style_fn_specs[0].value_template, "${value}px");
}

TEST_F(LowerTest, SeveralStaticSlotsFormTemplate) {
  auto result = Lower(
      "const Fade = styled.div`\n"
      "  transition: ${duration} ${easing};\n"
      "`;\n");
  const auto* fade = result.Find("Fade");
  ASSERT_NE(fade, nullptr);
  EXPECT_EQ(
      *fade->style_obj.Find("transition"),
      StyleValue::Expression("`${duration} ${easing}`"));
}

TEST_F(LowerTest, BailIsPerComponent) {
  auto result = Lower(
      "const List = styled.ul`\n"
      "  & li { color: red; }\n"
      "`;\n"
      "const Item = styled.li`\n"
      "  color: blue;\n"
      "`;\n");
  ASSERT_EQ(result.components.size(), 2U);
  EXPECT_TRUE(result.AnyBailed());
  EXPECT_TRUE(result.Find("List")->bailed);
  EXPECT_FALSE(result.Find("Item")->bailed);
  ASSERT_EQ(result.warnings.size(), 1U);
  EXPECT_EQ(result.warnings[0].category, category::kUnsupportedSelector);
  ASSERT_TRUE(result.warnings[0].location.has_value());
  EXPECT_EQ(result.warnings[0].location->line, 1U);
}

TEST_F(LowerTest, ComponentSelectorBails) {
  auto result = Lower(
      "const Card = styled.div`\n"
      "  ${Link}:hover & { color: red; }\n"
      "`;\n");
  const auto* card = result.Find("Card");
  ASSERT_NE(card, nullptr);
  EXPECT_TRUE(card->bailed);
  ASSERT_FALSE(card->warnings.empty());
  EXPECT_EQ(card->warnings[0].category, category::kDynamicCss);
}

TEST_F(LowerTest, UnparsedSlotBails) {
  auto result = Lower("const Box = styled.div`color: ${p => };`;\n");
  const auto* box = result.Find("Box");
  ASSERT_NE(box, nullptr);
  EXPECT_TRUE(box->bailed);
  EXPECT_EQ(box->warnings[0].category, category::kParseError);
}

TEST_F(LowerTest, ScanFailureIsReported) {
  auto result = LowerSource("const Box = styled.div`color: red;", adapter_);
  EXPECT_FALSE(result.has_value());
}

}  // namespace
}  // namespace staticss::lowering
