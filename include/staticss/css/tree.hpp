#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace staticss::css {

enum class CssNodeKind : uint8_t {
  kRule,
  kDeclaration,
  kComment,
  kAtRule,
};

// Generic CSS parse tree node.
//   kRule:        value = selector, children = body
//   kDeclaration: value = "prop:value;" text
//   kComment:     value = "/* ... */" text
//   kAtRule:      value = prelude ("@media (min-width: 10px)"), children = body
struct CssNode {
  CssNodeKind kind;
  std::string value;
  std::vector<CssNode> children;

  auto operator==(const CssNode&) const -> bool = default;

  static auto Rule(std::string selector, std::vector<CssNode> children)
      -> CssNode {
    return CssNode{
        .kind = CssNodeKind::kRule,
        .value = std::move(selector),
        .children = std::move(children)};
  }

  static auto Declaration(std::string text) -> CssNode {
    return CssNode{.kind = CssNodeKind::kDeclaration, .value = std::move(text)};
  }

  static auto Comment(std::string text) -> CssNode {
    return CssNode{.kind = CssNodeKind::kComment, .value = std::move(text)};
  }

  static auto AtRule(std::string prelude, std::vector<CssNode> children)
      -> CssNode {
    return CssNode{
        .kind = CssNodeKind::kAtRule,
        .value = std::move(prelude),
        .children = std::move(children)};
  }
};

using CssTree = std::vector<CssNode>;

}  // namespace staticss::css
