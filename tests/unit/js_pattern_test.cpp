#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "staticss/js/arena.hpp"
#include "staticss/js/parser.hpp"
#include "staticss/js/pattern.hpp"

namespace staticss::js {
namespace {

class JsPatternTest : public ::testing::Test {
 protected:
  auto Parse(std::string text) -> ExprId {
    auto result = ParseExpression(arena_, std::move(text));
    EXPECT_TRUE(result.has_value());
    return result.value_or(kInvalidExprId);
  }

  // Prop path of an arrow function's body.
  auto BodyPropPath(std::string text)
      -> std::optional<std::vector<std::string>> {
    auto arrow = Parse(std::move(text));
    auto bindings = GetArrowBindings(arena_, arrow);
    auto body = GetArrowBody(arena_, arrow);
    if (!bindings || !body) {
      return std::nullopt;
    }
    return GetPropPath(arena_, *body, *bindings);
  }

  Arena arena_;
};

// =============================================================================
// Bindings
// =============================================================================

TEST_F(JsPatternTest, IdentifierParamBindsProps) {
  auto bindings = GetArrowBindings(arena_, Parse("p => p.x"));
  ASSERT_TRUE(bindings.has_value());
  EXPECT_EQ(bindings->props_name, "p");
  EXPECT_TRUE(bindings->locals.empty());
}

TEST_F(JsPatternTest, DestructuredParamBindsLocals) {
  auto bindings =
      GetArrowBindings(arena_, Parse("({ $on: on, size, ...rest }) => on"));
  ASSERT_TRUE(bindings.has_value());
  EXPECT_EQ(bindings->props_name, "rest");
  EXPECT_EQ(bindings->KeyForLocal("on"), "$on");
  EXPECT_EQ(bindings->KeyForLocal("size"), "size");
  EXPECT_FALSE(bindings->KeyForLocal("$on").has_value());
}

TEST_F(JsPatternTest, NonArrowHasNoBindings) {
  EXPECT_FALSE(GetArrowBindings(arena_, Parse("a.b")).has_value());
  EXPECT_FALSE(GetArrowBody(arena_, Parse("a.b")).has_value());
}

// =============================================================================
// Paths
// =============================================================================

TEST_F(JsPatternTest, MemberPath) {
  auto path = GetMemberPath(arena_, Parse("props.theme.colors.primary"));
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->root, "props");
  EXPECT_EQ(
      path->segments,
      (std::vector<std::string>{"theme", "colors", "primary"}));
  EXPECT_EQ(path->Dotted(), "props.theme.colors.primary");
}

TEST_F(JsPatternTest, MemberPathRejectsComputedAndCalls) {
  EXPECT_FALSE(GetMemberPath(arena_, Parse("a[b].c")).has_value());
  EXPECT_FALSE(GetMemberPath(arena_, Parse("a().c")).has_value());
}

TEST_F(JsPatternTest, PropPathThroughProps) {
  EXPECT_EQ(
      BodyPropPath("props => props.user.role"),
      (std::vector<std::string>{"user", "role"}));
  EXPECT_FALSE(BodyPropPath("props => props").has_value());
  EXPECT_FALSE(BodyPropPath("props => other.x").has_value());
}

TEST_F(JsPatternTest, PropPathThroughDestructuring) {
  EXPECT_EQ(
      BodyPropPath("({ $on }) => $on"), (std::vector<std::string>{"$on"}));
  EXPECT_EQ(
      BodyPropPath("({ user: u }) => u.name"),
      (std::vector<std::string>{"user", "name"}));
}

// =============================================================================
// Prop namespace rewriting
// =============================================================================

TEST_F(JsPatternTest, RewritesPropsMembers) {
  auto arrow = Parse("props => props.$n > 3 && props.user.age < max");
  auto bindings = GetArrowBindings(arena_, arrow);
  auto body = GetArrowBody(arena_, arrow);
  ASSERT_TRUE(bindings && body);
  EXPECT_EQ(
      RewriteToPropNamespace(arena_, *body, *bindings),
      "$n > 3 && user.age < max");
}

TEST_F(JsPatternTest, RewritesDestructuredLocals) {
  auto arrow = Parse("({ $count: count, limit }) => count * 2 > limit");
  auto bindings = GetArrowBindings(arena_, arrow);
  auto body = GetArrowBody(arena_, arrow);
  ASSERT_TRUE(bindings && body);
  EXPECT_EQ(
      RewriteToPropNamespace(arena_, *body, *bindings), "$count * 2 > limit");
}

TEST_F(JsPatternTest, RewriteRejectsBareParameter) {
  for (const char* text :
       {"p => p[key] > 1", "p => size(p) > 1", "p => list.some(x => p.a)"}) {
    auto arrow = Parse(text);
    auto bindings = GetArrowBindings(arena_, arrow);
    auto body = GetArrowBody(arena_, arrow);
    ASSERT_TRUE(bindings && body) << text;
    EXPECT_FALSE(RewriteToPropNamespace(arena_, *body, *bindings).has_value())
        << text;
  }
}

// =============================================================================
// Literals
// =============================================================================

TEST_F(JsPatternTest, StaticLiterals) {
  EXPECT_EQ(
      GetStaticLiteral(arena_, Parse("'red'")),
      (StaticLiteral{.kind = LiteralKind::kString, .text = "red"}));
  EXPECT_EQ(
      GetStaticLiteral(arena_, Parse("-2")),
      (StaticLiteral{.kind = LiteralKind::kNumber, .text = "-2"}));
  EXPECT_EQ(
      GetStaticLiteral(arena_, Parse("`plain`")),
      (StaticLiteral{.kind = LiteralKind::kString, .text = "plain"}));
  EXPECT_EQ(
      GetStaticLiteral(arena_, Parse("undefined")),
      (StaticLiteral{.kind = LiteralKind::kUndefined, .text = "undefined"}));
  EXPECT_FALSE(GetStaticLiteral(arena_, Parse("`a${b}`")).has_value());
  EXPECT_FALSE(GetStaticLiteral(arena_, Parse("x")).has_value());
}

TEST_F(JsPatternTest, EmptyStyleLiterals) {
  EXPECT_TRUE(IsEmptyStyleLiteral(
      StaticLiteral{.kind = LiteralKind::kBoolean, .text = "false"}));
  EXPECT_TRUE(IsEmptyStyleLiteral(
      StaticLiteral{.kind = LiteralKind::kString, .text = ""}));
  EXPECT_FALSE(IsEmptyStyleLiteral(
      StaticLiteral{.kind = LiteralKind::kNumber, .text = "0"}));
  EXPECT_FALSE(IsEmptyStyleLiteral(
      StaticLiteral{.kind = LiteralKind::kBoolean, .text = "true"}));
}

}  // namespace
}  // namespace staticss::js
