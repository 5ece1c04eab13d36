#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace staticss::common {

auto Trim(std::string_view s) -> std::string_view;

auto IsIdentifierStart(char c) -> bool;
auto IsIdentifierChar(char c) -> bool;
// JS identifier over the ASCII subset ($ and _ allowed).
auto IsIdentifier(std::string_view s) -> bool;
auto IsNumeric(std::string_view s) -> bool;

auto Capitalize(std::string_view s) -> std::string;
auto LowerFirst(std::string_view s) -> std::string;
auto ToLowerAscii(std::string_view s) -> std::string;
auto ContainsIgnoreCase(std::string_view haystack, std::string_view needle)
    -> bool;

// "border-top-width" -> "borderTopWidth"
auto KebabToCamel(std::string_view s) -> std::string;

// Splits on `sep` outside parentheses and quotes. Pieces are trimmed, empty
// pieces dropped.
auto SplitTopLevel(std::string_view s, char sep) -> std::vector<std::string>;

// Splits on runs of whitespace outside parentheses and quotes.
auto SplitTokens(std::string_view s) -> std::vector<std::string>;

// Replaces every whitespace run with a single space and trims.
auto CollapseWhitespace(std::string_view s) -> std::string;

// Escape a string for use inside a double-quoted JS string literal.
auto EscapeForJsString(std::string_view s) -> std::string;

}  // namespace staticss::common
