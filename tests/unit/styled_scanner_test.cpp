#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "staticss/common/source_span.hpp"
#include "staticss/js/pattern.hpp"
#include "staticss/source/styled_scanner.hpp"

namespace staticss::source {
namespace {

class StyledScannerTest : public ::testing::Test {
 protected:
  static auto Scan(std::string text) -> ScannedFile {
    auto file = ScanSource(std::move(text));
    EXPECT_TRUE(file.has_value());
    if (!file) {
      return ScannedFile{};
    }
    return std::move(*file);
  }
};

// =============================================================================
// Styled declarations
// =============================================================================

TEST_F(StyledScannerTest, IntrinsicTag) {
  auto file = Scan(
      "import styled from \"styled-components\";\n"
      "const Button = styled.button`\n"
      "  color: ${p => p.color};\n"
      "`;\n");
  ASSERT_EQ(file.components.size(), 1U);
  const auto& button = file.components[0];
  EXPECT_EQ(button.local_name, "Button");
  EXPECT_EQ(button.tag, "button");
  EXPECT_FALSE(button.wraps_component);
  EXPECT_EQ(button.location, (Location{.line = 2, .column = 1}));
  EXPECT_EQ(button.css, "\n  color: __SC_EXPR_0__;\n");
  ASSERT_EQ(button.slots.size(), 1U);
  EXPECT_EQ(button.slots[0].placeholder, "__SC_EXPR_0__");
  EXPECT_TRUE(button.slots[0].expression.has_value());
}

TEST_F(StyledScannerTest, WrappedComponentAndStringTag) {
  auto file = Scan(
      "const Fancy = styled(Link)`color: red;`;\n"
      "const Label = styled('span')`color: blue;`;\n");
  ASSERT_EQ(file.components.size(), 2U);
  EXPECT_EQ(file.components[0].tag, "Link");
  EXPECT_TRUE(file.components[0].wraps_component);
  EXPECT_EQ(file.components[1].tag, "span");
  EXPECT_FALSE(file.components[1].wraps_component);
}

TEST_F(StyledScannerTest, AttrsAndTypeArguments) {
  auto file = Scan(
      "export const Title: Styled = styled.h1.attrs({ role: \"heading\" })"
      "<{ $big?: boolean }>`\n"
      "  font-size: ${p => p.$big ? \"2em\" : \"1em\"};\n"
      "`;\n");
  ASSERT_EQ(file.components.size(), 1U);
  EXPECT_EQ(file.components[0].local_name, "Title");
  EXPECT_EQ(file.components[0].tag, "h1");
  EXPECT_EQ(file.components[0].slots.size(), 1U);
}

TEST_F(StyledScannerTest, IgnoresCommentsAndStrings) {
  auto file = Scan(
      "// const A = styled.div`color: red;`;\n"
      "/* const B = styled.div`color: red;` */\n"
      "const text = \"const C = styled.div`x`\";\n");
  EXPECT_TRUE(file.components.empty());
}

TEST_F(StyledScannerTest, UnparseableSlotHasNoExpression) {
  auto file = Scan("const Box = styled.div`color: ${p => };`;\n");
  ASSERT_EQ(file.components.size(), 1U);
  ASSERT_EQ(file.components[0].slots.size(), 1U);
  EXPECT_FALSE(file.components[0].slots[0].expression.has_value());
}

TEST_F(StyledScannerTest, UnterminatedTemplateFails) {
  auto file = ScanSource("const Box = styled.div`color: red;\n");
  ASSERT_FALSE(file.has_value());
  EXPECT_EQ(file.error().primary.message, "unterminated template literal");
}

// =============================================================================
// File-level facts
// =============================================================================

TEST_F(StyledScannerTest, KeyframesAndCssHelpers) {
  auto file = Scan(
      "const fade = keyframes`from { opacity: 0; }`;\n"
      "const truncate = css`overflow: hidden;`;\n");
  EXPECT_TRUE(file.keyframes.contains("fade"));
  EXPECT_TRUE(file.css_helpers.contains("truncate"));
  EXPECT_TRUE(file.components.empty());
}

TEST_F(StyledScannerTest, TernaryHelper) {
  auto file = Scan(
      "const pick = (on) => on ? \"red\" : \"blue\";\n"
      "const other = (on) => on.x ? \"red\" : \"blue\";\n");
  ASSERT_EQ(file.helpers.size(), 1U);
  EXPECT_EQ(file.helpers[0].name, "pick");
  EXPECT_EQ(file.helpers[0].truthy.text, "red");
  EXPECT_EQ(file.helpers[0].falsy.kind, js::LiteralKind::kString);
}

TEST_F(StyledScannerTest, Imports) {
  auto file = Scan(
      "import styled, { css as styledCss } from 'styled-components';\n"
      "import { type Theme, darken } from \"./theme\";\n"
      "import * as tokens from \"./tokens\";\n");
  EXPECT_EQ(file.imports.at("styled"), "styled-components");
  EXPECT_EQ(file.imports.at("styledCss"), "styled-components");
  EXPECT_FALSE(file.imports.contains("css"));
  EXPECT_EQ(file.imports.at("darken"), "./theme");
  EXPECT_EQ(file.imports.at("Theme"), "./theme");
  EXPECT_EQ(file.imports.at("tokens"), "./tokens");
}

}  // namespace
}  // namespace staticss::source
