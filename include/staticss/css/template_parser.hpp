#pragma once

#include <string_view>

#include "staticss/common/diagnostic/diagnostic.hpp"
#include "staticss/css/tree.hpp"

namespace staticss::css {

// Parses template CSS (placeholders already substituted) into a generic tree.
//
// Behaves like the stylis compiler styled-components uses:
//   - `// x` line comments become `/* x*/` comment nodes
//   - declarations are emitted as compact "prop:value;" text
//   - nested selectors are resolved against their parent rule
//   - statements without a colon are dropped, except a lone placeholder
auto ParseTemplate(std::string_view text) -> Result<CssTree>;

// Resolves a nested selector against its parent ("&" substitution or
// descendant join). An empty parent leaves the selector unchanged.
auto ResolveSelector(std::string_view parent, std::string_view selector)
    -> std::string;

}  // namespace staticss::css
