#include <gtest/gtest.h>

#include <vector>

#include "staticss/css/declaration_block.hpp"

namespace staticss::css {
namespace {

class DeclarationBlockTest : public ::testing::Test {};

TEST_F(DeclarationBlockTest, FlatPairs) {
  auto props = ParseDeclarationBlock("color: red; transform: rotate(180deg);");
  ASSERT_TRUE(props.has_value());
  EXPECT_EQ(
      *props, (std::vector<StyleProp>{
                  {.name = "color", .value = "red"},
                  {.name = "transform", .value = "rotate(180deg)"},
              }));
}

TEST_F(DeclarationBlockTest, SemicolonInsideParensIsNotASeparator) {
  auto props = ParseDeclarationBlock("background: url('a;b.png')");
  ASSERT_TRUE(props.has_value());
  ASSERT_EQ(props->size(), 1U);
  EXPECT_EQ((*props)[0].value, "url('a;b.png')");
}

TEST_F(DeclarationBlockTest, EmptyBlockIsValid) {
  auto props = ParseDeclarationBlock("  ");
  ASSERT_TRUE(props.has_value());
  EXPECT_TRUE(props->empty());
}

TEST_F(DeclarationBlockTest, RejectsNestedRules) {
  EXPECT_FALSE(ParseDeclarationBlock("&:hover { color: red; }").has_value());
}

TEST_F(DeclarationBlockTest, RejectsBareWords) {
  EXPECT_FALSE(ParseDeclarationBlock("color: red; bogus").has_value());
  EXPECT_FALSE(ParseDeclarationBlock("color:;").has_value());
}

TEST_F(DeclarationBlockTest, ToStylePropsNormalizesAndExpands) {
  EXPECT_EQ(
      ToStyleProps("background-color", " red "),
      (std::vector<StyleProp>{{.name = "backgroundColor", .value = "red"}}));
  auto margin = ToStyleProps("margin", "0 auto");
  ASSERT_EQ(margin.size(), 4U);
  EXPECT_EQ(margin[1], (StyleProp{.name = "marginRight", .value = "auto"}));
}

TEST_F(DeclarationBlockTest, ToStylePropsBackgroundImage) {
  EXPECT_EQ(
      ToStyleProps("background", "url(a.png) center"),
      (std::vector<StyleProp>{
          {.name = "backgroundImage", .value = "url(a.png) center"}}));
}

TEST_F(DeclarationBlockTest, ToStylePropsKeepsUnexpandableShorthand) {
  EXPECT_EQ(
      ToStyleProps("transition", "opacity 1s"),
      (std::vector<StyleProp>{{.name = "transition", .value = "opacity 1s"}}));
}

}  // namespace
}  // namespace staticss::css
