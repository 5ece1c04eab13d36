#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "staticss/common/string_utils.hpp"

namespace staticss::common {
namespace {

class StringUtilsTest : public ::testing::Test {};

// =============================================================================
// Identifiers and numbers
// =============================================================================

TEST_F(StringUtilsTest, IdentifierAcceptsDollarAndUnderscore) {
  EXPECT_TRUE(IsIdentifier("$active"));
  EXPECT_TRUE(IsIdentifier("_x1"));
  EXPECT_FALSE(IsIdentifier("1x"));
  EXPECT_FALSE(IsIdentifier("a-b"));
  EXPECT_FALSE(IsIdentifier(""));
}

TEST_F(StringUtilsTest, Numeric) {
  EXPECT_TRUE(IsNumeric("0"));
  EXPECT_TRUE(IsNumeric("-1.5"));
  EXPECT_TRUE(IsNumeric(".5"));
  EXPECT_FALSE(IsNumeric("1.2.3"));
  EXPECT_FALSE(IsNumeric("4px"));
  EXPECT_FALSE(IsNumeric("-"));
}

// =============================================================================
// Case conversion
// =============================================================================

TEST_F(StringUtilsTest, KebabToCamel) {
  EXPECT_EQ(KebabToCamel("border-top-width"), "borderTopWidth");
  EXPECT_EQ(KebabToCamel("color"), "color");
  EXPECT_EQ(KebabToCamel("--component-width"), "componentWidth");
}

TEST_F(StringUtilsTest, CapitalizeAndLowerFirst) {
  EXPECT_EQ(Capitalize("primary"), "Primary");
  EXPECT_EQ(LowerFirst("Button"), "button");
  EXPECT_EQ(Capitalize(""), "");
}

TEST_F(StringUtilsTest, ContainsIgnoreCase) {
  EXPECT_TRUE(ContainsIgnoreCase("Linear-Gradient(red, blue)", "gradient"));
  EXPECT_FALSE(ContainsIgnoreCase("red", "url"));
}

// =============================================================================
// Splitting
// =============================================================================

TEST_F(StringUtilsTest, SplitTopLevelIgnoresNestedSeparators) {
  auto pieces = SplitTopLevel("fade 1s, rgba(0, 0, 0, 0.5) 2s", ',');
  ASSERT_EQ(pieces.size(), 2U);
  EXPECT_EQ(pieces[0], "fade 1s");
  EXPECT_EQ(pieces[1], "rgba(0, 0, 0, 0.5) 2s");
}

TEST_F(StringUtilsTest, SplitTopLevelDropsEmptyPieces) {
  auto pieces = SplitTopLevel("a;; b ;", ';');
  EXPECT_EQ(pieces, (std::vector<std::string>{"a", "b"}));
}

TEST_F(StringUtilsTest, SplitTokensKeepsQuotedAndParenthesized) {
  auto tokens = SplitTokens("1px  solid rgb(1, 2, 3) 'a b'");
  EXPECT_EQ(
      tokens,
      (std::vector<std::string>{"1px", "solid", "rgb(1, 2, 3)", "'a b'"}));
}

TEST_F(StringUtilsTest, CollapseWhitespace) {
  EXPECT_EQ(CollapseWhitespace("  a \n\t b  "), "a b");
  EXPECT_EQ(Trim("  x  "), "x");
}

TEST_F(StringUtilsTest, EscapeForJsString) {
  EXPECT_EQ(EscapeForJsString("a\"b\\c\n"), "a\\\"b\\\\c\\n");
}

}  // namespace
}  // namespace staticss::common
