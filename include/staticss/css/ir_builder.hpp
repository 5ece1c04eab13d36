#pragma once

#include <span>
#include <string_view>
#include <vector>

#include "staticss/css/ir.hpp"
#include "staticss/css/slot.hpp"
#include "staticss/css/tree.hpp"

namespace staticss::css {

// Builds the ordered rule list for one template. Runs the tree walk first and
// then the raw-text recovery pass, which restores lone top-level placeholders
// the CSS parser may have dropped.
auto BuildIr(
    const CssTree& tree, std::span<const Slot> slots, std::string_view raw_text)
    -> std::vector<CssRule>;

// Parses a value, splitting it into static text and slot references.
auto ParseCssValue(std::string_view text) -> CssValue;

// Parses one declaration node's text. Yields zero declarations for malformed
// text and two when a placeholder is glued in front of a declaration.
auto ParseDeclarationText(std::string_view text) -> std::vector<CssDeclaration>;

}  // namespace staticss::css
