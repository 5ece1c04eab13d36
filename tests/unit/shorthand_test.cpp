#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "staticss/css/shorthand.hpp"

namespace staticss::css {
namespace {

class ShorthandTest : public ::testing::Test {
 protected:
  static auto ExpandOrDie(std::string_view property, std::string_view value)
      -> LonghandMap {
    auto result = Expand(property, value);
    EXPECT_TRUE(result.has_value()) << property << ": " << value;
    return result.value_or(LonghandMap{});
  }
};

// =============================================================================
// Table lookup
// =============================================================================

TEST_F(ShorthandTest, KnownShorthandsInEitherCase) {
  EXPECT_TRUE(IsShorthand("margin"));
  EXPECT_TRUE(IsShorthand("border-radius"));
  EXPECT_TRUE(IsShorthand("borderRadius"));
  EXPECT_FALSE(IsShorthand("color"));
  EXPECT_FALSE(IsShorthand("marginTop"));
}

TEST_F(ShorthandTest, LonghandsOf) {
  auto longhands = LonghandsOf("gap");
  ASSERT_TRUE(longhands.has_value());
  EXPECT_EQ(*longhands, (std::vector<std::string>{"rowGap", "columnGap"}));
  EXPECT_FALSE(LonghandsOf("color").has_value());
}

TEST_F(ShorthandTest, NormalizePropertyName) {
  EXPECT_EQ(NormalizePropertyName("background-color"), "backgroundColor");
  EXPECT_EQ(NormalizePropertyName("-webkit-line-clamp"), "webkitLineClamp");
  EXPECT_EQ(NormalizePropertyName("-ms-flex"), "msFlex");
  EXPECT_EQ(NormalizePropertyName("--brand-color"), "--brand-color");
}

// =============================================================================
// Box model
// =============================================================================

TEST_F(ShorthandTest, MarginSingleValue) {
  auto result = ExpandOrDie("margin", "4px");
  EXPECT_EQ(
      result, (LonghandMap{
                  {"marginTop", "4px"},
                  {"marginRight", "4px"},
                  {"marginBottom", "4px"},
                  {"marginLeft", "4px"},
              }));
}

TEST_F(ShorthandTest, MarginFourValuesInSourceOrder) {
  auto result = ExpandOrDie("margin", "1px 2px 3px 4px");
  EXPECT_EQ(
      result, (LonghandMap{
                  {"marginTop", "1px"},
                  {"marginRight", "2px"},
                  {"marginBottom", "3px"},
                  {"marginLeft", "4px"},
              }));
}

TEST_F(ShorthandTest, PaddingTwoAndThreeValues) {
  auto two = ExpandOrDie("padding", "1px 2px");
  EXPECT_EQ(two[0].second, "1px");
  EXPECT_EQ(two[1].second, "2px");
  EXPECT_EQ(two[2].second, "1px");
  EXPECT_EQ(two[3].second, "2px");

  auto three = ExpandOrDie("padding", "1px 2px 3px");
  EXPECT_EQ(three[0].second, "1px");
  EXPECT_EQ(three[1].second, "2px");
  EXPECT_EQ(three[2].second, "3px");
  EXPECT_EQ(three[3].second, "2px");
}

TEST_F(ShorthandTest, BoxWithTooManyValuesIsNotExpanded) {
  EXPECT_FALSE(Expand("margin", "1px 2px 3px 4px 5px").has_value());
}

TEST_F(ShorthandTest, BorderRadiusIgnoresVerticalRadii) {
  auto result = ExpandOrDie("borderRadius", "4px 8px / 2px");
  EXPECT_EQ(
      result, (LonghandMap{
                  {"borderTopLeftRadius", "4px"},
                  {"borderTopRightRadius", "8px"},
                  {"borderBottomRightRadius", "4px"},
                  {"borderBottomLeftRadius", "8px"},
              }));
}

// =============================================================================
// Border
// =============================================================================

TEST_F(ShorthandTest, BorderTriplet) {
  auto result = ExpandOrDie("border", "1px solid red");
  EXPECT_EQ(
      result, (LonghandMap{
                  {"borderWidth", "1px"},
                  {"borderStyle", "solid"},
                  {"borderColor", "red"},
              }));
}

TEST_F(ShorthandTest, BorderLastTokenWinsPerCategory) {
  auto result = ExpandOrDie("border", "thin 2px dashed");
  EXPECT_EQ(
      result, (LonghandMap{
                  {"borderWidth", "2px"},
                  {"borderStyle", "dashed"},
              }));
}

TEST_F(ShorthandTest, DirectionalBorder) {
  auto result = ExpandOrDie("border-top", "2px dotted rgb(0, 0, 0)");
  EXPECT_EQ(
      result, (LonghandMap{
                  {"borderTopWidth", "2px"},
                  {"borderTopStyle", "dotted"},
                  {"borderTopColor", "rgb(0, 0, 0)"},
              }));
}

// =============================================================================
// Flex
// =============================================================================

TEST_F(ShorthandTest, FlexThreeTokens) {
  auto result = ExpandOrDie("flex", "1 0 auto");
  EXPECT_EQ(
      result, (LonghandMap{
                  {"flexGrow", "1"},
                  {"flexShrink", "0"},
                  {"flexBasis", "auto"},
              }));
}

TEST_F(ShorthandTest, FlexKeywords) {
  EXPECT_EQ(ExpandOrDie("flex", "none")[0].second, "0");
  EXPECT_EQ(ExpandOrDie("flex", "auto")[1].second, "1");
  auto initial = ExpandOrDie("flex", "initial");
  EXPECT_EQ(initial[0].second, "0");
  EXPECT_EQ(initial[1].second, "1");
  EXPECT_EQ(initial[2].second, "auto");
}

TEST_F(ShorthandTest, FlexSingleNumberIsGrowSingleLengthIsBasis) {
  auto grow = ExpandOrDie("flex", "2");
  EXPECT_EQ(grow[0].second, "2");
  auto basis = ExpandOrDie("flex", "30px");
  EXPECT_EQ(basis[2].second, "30px");
}

TEST_F(ShorthandTest, FlexTwoTokens) {
  auto shrink = ExpandOrDie("flex", "2 3");
  EXPECT_EQ(shrink[1].second, "3");
  auto basis = ExpandOrDie("flex", "2 10%");
  EXPECT_EQ(basis[1].second, "1");
  EXPECT_EQ(basis[2].second, "10%");
}

// =============================================================================
// Animation
// =============================================================================

TEST_F(ShorthandTest, AnimationKeywordClassification) {
  auto result = ExpandOrDie("animation", "fade 2s ease-in 1s infinite");
  EXPECT_EQ(
      result, (LonghandMap{
                  {"animationName", "fade"},
                  {"animationDuration", "2s"},
                  {"animationTimingFunction", "ease-in"},
                  {"animationDelay", "1s"},
                  {"animationIterationCount", "infinite"},
              }));
}

TEST_F(ShorthandTest, AnimationLaterKeywordsWin) {
  auto result = ExpandOrDie("animation", "fade 1s 2s 3s ease linear spin");
  EXPECT_EQ(
      result, (LonghandMap{
                  {"animationName", "fade"},
                  {"animationDuration", "1s"},
                  {"animationTimingFunction", "linear"},
                  {"animationDelay", "2s"},
              }));
}

TEST_F(ShorthandTest, AnimationListJoinsPerLonghand) {
  auto result = ExpandOrDie("animation", "fade 1s, spin 2s linear");
  ASSERT_GE(result.size(), 3U);
  EXPECT_EQ(result[0], (std::pair<std::string, std::string>{
                           "animationName", "fade, spin"}));
  EXPECT_EQ(result[1], (std::pair<std::string, std::string>{
                           "animationDuration", "1s, 2s"}));
  EXPECT_EQ(result[2], (std::pair<std::string, std::string>{
                           "animationTimingFunction", "ease, linear"}));
}

// =============================================================================
// Two-axis and background
// =============================================================================

TEST_F(ShorthandTest, GapAndOverflow) {
  EXPECT_EQ(
      ExpandOrDie("gap", "4px"),
      (LonghandMap{{"rowGap", "4px"}, {"columnGap", "4px"}}));
  EXPECT_EQ(
      ExpandOrDie("overflow", "hidden auto"),
      (LonghandMap{{"overflowX", "hidden"}, {"overflowY", "auto"}}));
}

TEST_F(ShorthandTest, BackgroundColorOnly) {
  EXPECT_EQ(
      ExpandOrDie("background", "red"),
      (LonghandMap{{"backgroundColor", "red"}}));
  EXPECT_FALSE(Expand("background", "url(a.png) no-repeat").has_value());
  EXPECT_FALSE(
      Expand("background", "linear-gradient(red, blue)").has_value());
}

TEST_F(ShorthandTest, ResolveBackgroundProperty) {
  EXPECT_EQ(ResolveBackgroundProperty("url(x.png)"), "backgroundImage");
  EXPECT_EQ(ResolveBackgroundProperty("#fff"), "backgroundColor");
}

TEST_F(ShorthandTest, UnexpandedKnownShorthands) {
  EXPECT_TRUE(IsShorthand("transition"));
  EXPECT_FALSE(Expand("transition", "all 1s").has_value());
  EXPECT_FALSE(Expand("font", "bold 12px serif").has_value());
}

}  // namespace
}  // namespace staticss::css
