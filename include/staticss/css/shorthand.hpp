#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace staticss::css {

// Ordered longhand property -> value pairs.
using LonghandMap = std::vector<std::pair<std::string, std::string>>;

// Property names are accepted in CSS (kebab) or style (camel) form.
auto IsShorthand(std::string_view property) -> bool;

auto LonghandsOf(std::string_view property)
    -> std::optional<std::vector<std::string>>;

// Expands a shorthand value into its longhands. Returns nullopt when the
// property is not expandable or the value shape is not recognized; callers
// decide how to treat the unexpanded shorthand.
auto Expand(std::string_view property, std::string_view raw_value)
    -> std::optional<LonghandMap>;

// kebab-case -> camelCase; "-webkit-x" -> "webkitX"; custom properties
// ("--x") are returned unchanged.
auto NormalizePropertyName(std::string_view property) -> std::string;

// "backgroundImage" for url()/gradient values, else "backgroundColor".
auto ResolveBackgroundProperty(std::string_view value) -> std::string;

auto IsBackgroundImageValue(std::string_view value) -> bool;

}  // namespace staticss::css
