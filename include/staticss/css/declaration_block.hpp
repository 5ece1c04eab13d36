#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace staticss::css {

struct StyleProp {
  std::string name;
  std::string value;

  auto operator==(const StyleProp&) const -> bool = default;
};

// Parses a flat "prop: value; prop: value" block. Returns nullopt if any
// non-empty chunk is not a `prop: value` pair (nested rules, bare words).
// Property names are returned as written.
auto ParseDeclarationBlock(std::string_view text)
    -> std::optional<std::vector<StyleProp>>;

// Maps one CSS declaration onto style properties: normalizes the name and
// expands shorthands the table knows how to expand. Background values that
// stay unexpanded map to backgroundImage.
auto ToStyleProps(std::string_view css_property, std::string_view value)
    -> std::vector<StyleProp>;

}  // namespace staticss::css
