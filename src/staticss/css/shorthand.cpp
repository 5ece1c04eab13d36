#include "staticss/css/shorthand.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "staticss/common/string_utils.hpp"

namespace staticss::css {

namespace {

struct ShorthandEntry {
  std::string_view name;
  std::vector<std::string_view> longhands;
};

auto ShorthandTable() -> const std::vector<ShorthandEntry>& {
  static const std::vector<ShorthandEntry> kTable = {
      {"background",
       {"backgroundColor", "backgroundImage", "backgroundPosition",
        "backgroundSize", "backgroundRepeat"}},
      {"border", {"borderWidth", "borderStyle", "borderColor"}},
      {"borderTop", {"borderTopWidth", "borderTopStyle", "borderTopColor"}},
      {"borderRight",
       {"borderRightWidth", "borderRightStyle", "borderRightColor"}},
      {"borderBottom",
       {"borderBottomWidth", "borderBottomStyle", "borderBottomColor"}},
      {"borderLeft", {"borderLeftWidth", "borderLeftStyle", "borderLeftColor"}},
      {"borderWidth",
       {"borderTopWidth", "borderRightWidth", "borderBottomWidth",
        "borderLeftWidth"}},
      {"borderStyle",
       {"borderTopStyle", "borderRightStyle", "borderBottomStyle",
        "borderLeftStyle"}},
      {"borderColor",
       {"borderTopColor", "borderRightColor", "borderBottomColor",
        "borderLeftColor"}},
      {"borderRadius",
       {"borderTopLeftRadius", "borderTopRightRadius",
        "borderBottomRightRadius", "borderBottomLeftRadius"}},
      {"margin", {"marginTop", "marginRight", "marginBottom", "marginLeft"}},
      {"padding",
       {"paddingTop", "paddingRight", "paddingBottom", "paddingLeft"}},
      {"inset", {"top", "right", "bottom", "left"}},
      {"flex", {"flexGrow", "flexShrink", "flexBasis"}},
      {"font",
       {"fontStyle", "fontVariant", "fontWeight", "fontSize", "lineHeight",
        "fontFamily"}},
      {"animation",
       {"animationName", "animationDuration", "animationTimingFunction",
        "animationDelay", "animationIterationCount", "animationDirection",
        "animationFillMode", "animationPlayState"}},
      {"transition",
       {"transitionProperty", "transitionDuration", "transitionTimingFunction",
        "transitionDelay"}},
      {"outline", {"outlineWidth", "outlineStyle", "outlineColor"}},
      {"listStyle", {"listStyleType", "listStylePosition", "listStyleImage"}},
      {"gap", {"rowGap", "columnGap"}},
      {"overflow", {"overflowX", "overflowY"}},
      {"placeContent", {"alignContent", "justifyContent"}},
      {"placeItems", {"alignItems", "justifyItems"}},
      {"placeSelf", {"alignSelf", "justifySelf"}},
  };
  return kTable;
}

auto FindEntry(std::string_view property) -> const ShorthandEntry* {
  auto name = NormalizePropertyName(property);
  for (const auto& entry : ShorthandTable()) {
    if (entry.name == name) {
      return &entry;
    }
  }
  return nullptr;
}

auto Contains(std::span<const std::string_view> set, std::string_view token)
    -> bool {
  return std::find(set.begin(), set.end(), token) != set.end();
}

auto StartsWithDigit(std::string_view token) -> bool {
  return !token.empty() &&
         (std::isdigit(static_cast<unsigned char>(token.front())) != 0 ||
          token.front() == '.');
}

// 1/2/3/4-value positional form in (top, right, bottom, left) order.
auto ExpandBox(
    const std::vector<std::string_view>& longhands, std::string_view value)
    -> std::optional<LonghandMap> {
  auto tokens = common::SplitTokens(value);
  std::array<std::string, 4> sides = {"0", "0", "0", "0"};
  switch (tokens.size()) {
    case 0:
      break;
    case 1:
      sides = {tokens[0], tokens[0], tokens[0], tokens[0]};
      break;
    case 2:
      sides = {tokens[0], tokens[1], tokens[0], tokens[1]};
      break;
    case 3:
      sides = {tokens[0], tokens[1], tokens[2], tokens[1]};
      break;
    case 4:
      sides = {tokens[0], tokens[1], tokens[2], tokens[3]};
      break;
    default:
      return std::nullopt;
  }
  LonghandMap result;
  for (size_t i = 0; i < 4; ++i) {
    result.emplace_back(std::string(longhands[i]), sides[i]);
  }
  return result;
}

auto ExpandBorder(
    const std::vector<std::string_view>& longhands, std::string_view value)
    -> std::optional<LonghandMap> {
  static constexpr std::array<std::string_view, 3> kWidthKeywords = {
      "thin", "medium", "thick"};
  static constexpr std::array<std::string_view, 10> kStyleKeywords = {
      "none",   "hidden", "dotted", "dashed", "solid",
      "double", "groove", "ridge",  "inset",  "outset"};

  auto tokens = common::SplitTokens(value);
  if (tokens.empty()) {
    return std::nullopt;
  }
  std::optional<std::string> width;
  std::optional<std::string> style;
  std::optional<std::string> color;
  for (auto& token : tokens) {
    if (StartsWithDigit(token) || Contains(kWidthKeywords, token)) {
      width = token;
    } else if (Contains(kStyleKeywords, token)) {
      style = token;
    } else {
      color = token;
    }
  }
  LonghandMap result;
  if (width) {
    result.emplace_back(std::string(longhands[0]), *width);
  }
  if (style) {
    result.emplace_back(std::string(longhands[1]), *style);
  }
  if (color) {
    result.emplace_back(std::string(longhands[2]), *color);
  }
  return result;
}

auto ExpandPair(
    const std::vector<std::string_view>& longhands, std::string_view value)
    -> std::optional<LonghandMap> {
  auto tokens = common::SplitTokens(value);
  if (tokens.empty() || tokens.size() > 2) {
    return std::nullopt;
  }
  const auto& second = tokens.size() == 2 ? tokens[1] : tokens[0];
  return LonghandMap{
      {std::string(longhands[0]), tokens[0]},
      {std::string(longhands[1]), second},
  };
}

auto ExpandFlex(std::string_view value) -> std::optional<LonghandMap> {
  auto tokens = common::SplitTokens(value);
  auto make = [](std::string grow, std::string shrink, std::string basis) {
    return LonghandMap{
        {"flexGrow", std::move(grow)},
        {"flexShrink", std::move(shrink)},
        {"flexBasis", std::move(basis)},
    };
  };
  switch (tokens.size()) {
    case 1: {
      const auto& token = tokens[0];
      if (token == "none") {
        return make("0", "0", "auto");
      }
      if (token == "auto") {
        return make("1", "1", "auto");
      }
      if (token == "initial") {
        return make("0", "1", "auto");
      }
      if (common::IsNumeric(token)) {
        return make(token, "1", "0");
      }
      return make("1", "1", token);
    }
    case 2:
      if (common::IsNumeric(tokens[1])) {
        return make(tokens[0], tokens[1], "0");
      }
      return make(tokens[0], "1", tokens[1]);
    case 3:
      return make(tokens[0], tokens[1], tokens[2]);
    default:
      return std::nullopt;
  }
}

// Indexes into the animation longhand list.
enum AnimationField : uint8_t {
  kName,
  kDuration,
  kTimingFunction,
  kDelay,
  kIterationCount,
  kDirection,
  kFillMode,
  kPlayState,
  kAnimationFieldCount,
};

using AnimationFields =
    std::array<std::optional<std::string>, kAnimationFieldCount>;

auto ClassifyAnimation(std::string_view segment) -> AnimationFields {
  static constexpr std::array<std::string_view, 7> kTimingFunctions = {
      "linear",      "ease",       "ease-in", "ease-out",
      "ease-in-out", "step-start", "step-end"};
  static constexpr std::array<std::string_view, 4> kDirections = {
      "normal", "reverse", "alternate", "alternate-reverse"};
  static constexpr std::array<std::string_view, 4> kFillModes = {
      "none", "forwards", "backwards", "both"};
  static constexpr std::array<std::string_view, 2> kPlayStates = {
      "running", "paused"};

  // Later keywords replace earlier ones. The name keeps the first identifier
  // and only the first two times count.
  AnimationFields fields;
  for (const auto& token : common::SplitTokens(segment)) {
    if (StartsWithDigit(token) && token.ends_with('s')) {
      if (!fields[kDuration]) {
        fields[kDuration] = token;
      } else if (!fields[kDelay]) {
        fields[kDelay] = token;
      }
    } else if (
        Contains(kTimingFunctions, token) ||
        token.starts_with("cubic-bezier") || token.starts_with("steps")) {
      fields[kTimingFunction] = token;
    } else if (token == "infinite" || common::IsNumeric(token)) {
      fields[kIterationCount] = token;
    } else if (Contains(kDirections, token)) {
      fields[kDirection] = token;
    } else if (Contains(kFillModes, token)) {
      fields[kFillMode] = token;
    } else if (Contains(kPlayStates, token)) {
      fields[kPlayState] = token;
    } else if (!fields[kName]) {
      fields[kName] = token;
    }
  }
  return fields;
}

auto ExpandAnimation(
    const std::vector<std::string_view>& longhands, std::string_view value)
    -> std::optional<LonghandMap> {
  static constexpr std::array<std::string_view, kAnimationFieldCount>
      kInitialValues = {"none", "0s",     "ease", "0s",
                        "1",    "normal", "none", "running"};

  auto segments = common::SplitTopLevel(value, ',');
  if (segments.empty()) {
    return std::nullopt;
  }
  std::vector<AnimationFields> parsed;
  parsed.reserve(segments.size());
  for (const auto& segment : segments) {
    parsed.push_back(ClassifyAnimation(segment));
  }

  LonghandMap result;
  for (size_t field = 0; field < kAnimationFieldCount; ++field) {
    bool present = std::any_of(
        parsed.begin(), parsed.end(),
        [&](const AnimationFields& f) { return f[field].has_value(); });
    if (!present) {
      continue;
    }
    std::string joined;
    for (const auto& fields : parsed) {
      if (!joined.empty()) {
        joined += ", ";
      }
      joined += fields[field].value_or(std::string(kInitialValues[field]));
    }
    result.emplace_back(std::string(longhands[field]), std::move(joined));
  }
  if (result.empty()) {
    return std::nullopt;
  }
  return result;
}

}  // namespace

auto NormalizePropertyName(std::string_view property) -> std::string {
  auto trimmed = common::Trim(property);
  if (trimmed.starts_with("--")) {
    return std::string(trimmed);
  }
  return common::KebabToCamel(trimmed);
}

auto IsBackgroundImageValue(std::string_view value) -> bool {
  auto lower = common::ToLowerAscii(value);
  return lower.find("url") != std::string::npos ||
         lower.find("gradient") != std::string::npos;
}

auto ResolveBackgroundProperty(std::string_view value) -> std::string {
  return IsBackgroundImageValue(value) ? "backgroundImage" : "backgroundColor";
}

auto IsShorthand(std::string_view property) -> bool {
  return FindEntry(property) != nullptr;
}

auto LonghandsOf(std::string_view property)
    -> std::optional<std::vector<std::string>> {
  const auto* entry = FindEntry(property);
  if (entry == nullptr) {
    return std::nullopt;
  }
  return std::vector<std::string>(
      entry->longhands.begin(), entry->longhands.end());
}

auto Expand(std::string_view property, std::string_view raw_value)
    -> std::optional<LonghandMap> {
  const auto* entry = FindEntry(property);
  if (entry == nullptr) {
    return std::nullopt;
  }
  auto value = common::Trim(raw_value);
  std::string_view name = entry->name;

  if (name == "margin" || name == "padding" || name == "inset" ||
      name == "borderWidth" || name == "borderStyle" ||
      name == "borderColor") {
    return ExpandBox(entry->longhands, value);
  }
  if (name == "border" || name == "borderTop" || name == "borderRight" ||
      name == "borderBottom" || name == "borderLeft") {
    return ExpandBorder(entry->longhands, value);
  }
  if (name == "borderRadius") {
    // Vertical radii after '/' are not expanded.
    auto horizontal = common::SplitTopLevel(value, '/');
    if (horizontal.empty()) {
      return std::nullopt;
    }
    return ExpandBox(entry->longhands, horizontal.front());
  }
  if (name == "flex") {
    return ExpandFlex(value);
  }
  if (name == "animation") {
    return ExpandAnimation(entry->longhands, value);
  }
  if (name == "gap" || name == "overflow" || name == "placeContent" ||
      name == "placeItems" || name == "placeSelf") {
    return ExpandPair(entry->longhands, value);
  }
  if (name == "background") {
    if (value.empty() || IsBackgroundImageValue(value)) {
      return std::nullopt;
    }
    return LonghandMap{{"backgroundColor", std::string(value)}};
  }
  return std::nullopt;
}

}  // namespace staticss::css
