#include "staticss/css/declaration_block.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "staticss/common/string_utils.hpp"
#include "staticss/css/shorthand.hpp"

namespace staticss::css {

auto ParseDeclarationBlock(std::string_view text)
    -> std::optional<std::vector<StyleProp>> {
  std::vector<StyleProp> props;
  for (const auto& chunk : common::SplitTopLevel(text, ';')) {
    size_t colon = chunk.find(':');
    if (colon == std::string::npos || chunk.find('{') != std::string::npos ||
        chunk.find('}') != std::string::npos) {
      return std::nullopt;
    }
    auto name = common::Trim(std::string_view(chunk).substr(0, colon));
    auto value = common::Trim(std::string_view(chunk).substr(colon + 1));
    if (name.empty() || value.empty()) {
      return std::nullopt;
    }
    props.push_back(
        StyleProp{.name = std::string(name), .value = std::string(value)});
  }
  return props;
}

auto ToStyleProps(std::string_view css_property, std::string_view value)
    -> std::vector<StyleProp> {
  auto name = NormalizePropertyName(css_property);
  std::string trimmed(common::Trim(value));
  if (auto longhands = Expand(name, trimmed)) {
    std::vector<StyleProp> props;
    props.reserve(longhands->size());
    for (auto& [longhand, longhand_value] : *longhands) {
      props.push_back(
          StyleProp{
              .name = std::move(longhand),
              .value = std::move(longhand_value),
          });
    }
    return props;
  }
  if (name == "background") {
    return {StyleProp{.name = "backgroundImage", .value = trimmed}};
  }
  return {StyleProp{.name = std::move(name), .value = std::move(trimmed)}};
}

}  // namespace staticss::css
