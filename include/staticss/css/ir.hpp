#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace staticss::css {

struct StaticPart {
  std::string text;

  auto operator==(const StaticPart&) const -> bool = default;
};

struct SlotPart {
  uint32_t slot_id = 0;

  auto operator==(const SlotPart&) const -> bool = default;
};

using CssValuePart = std::variant<StaticPart, SlotPart>;

struct StaticValue {
  std::string text;

  auto operator==(const StaticValue&) const -> bool = default;
};

// Adjacent static parts are coalesced; always holds at least one SlotPart.
struct InterpolatedValue {
  std::vector<CssValuePart> parts;

  auto operator==(const InterpolatedValue&) const -> bool = default;
};

using CssValue = std::variant<StaticValue, InterpolatedValue>;

struct CssDeclaration {
  // Empty for standalone blocks.
  std::string property;
  CssValue value;
  bool important = false;
  std::string raw_value;
  std::optional<std::string> leading_comment;
  std::optional<std::string> trailing_line_comment;

  auto operator==(const CssDeclaration&) const -> bool = default;

  [[nodiscard]] auto IsStandaloneBlock() const -> bool {
    return property.empty();
  }

  [[nodiscard]] auto IsInterpolated() const -> bool {
    return std::holds_alternative<InterpolatedValue>(value);
  }

  // Slot ids in value order.
  [[nodiscard]] auto SlotIds() const -> std::vector<uint32_t>;

  // The slot id when the value is exactly one slot with no static text.
  [[nodiscard]] auto FullValueSlot() const -> std::optional<uint32_t>;
};

struct CssRule {
  std::string selector;
  std::vector<std::string> at_rule_stack;
  std::vector<CssDeclaration> declarations;

  auto operator==(const CssRule&) const -> bool = default;
};

}  // namespace staticss::css
