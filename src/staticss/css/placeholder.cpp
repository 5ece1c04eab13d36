#include "staticss/css/placeholder.hpp"

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace staticss::css {

auto MakePlaceholder(uint32_t id) -> std::string {
  return fmt::format("{}{}{}", kPlaceholderPrefix, id, kPlaceholderSuffix);
}

auto FindPlaceholder(std::string_view text, size_t from)
    -> std::optional<PlaceholderMatch> {
  size_t pos = text.find(kPlaceholderPrefix, from);
  while (pos != std::string_view::npos) {
    size_t digits_begin = pos + kPlaceholderPrefix.size();
    size_t cursor = digits_begin;
    uint32_t id = 0;
    while (cursor < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[cursor])) != 0) {
      id = (id * 10) + static_cast<uint32_t>(text[cursor] - '0');
      ++cursor;
    }
    if (cursor > digits_begin &&
        text.substr(cursor, kPlaceholderSuffix.size()) == kPlaceholderSuffix) {
      return PlaceholderMatch{
          .begin = pos,
          .length = cursor + kPlaceholderSuffix.size() - pos,
          .id = id};
    }
    pos = text.find(kPlaceholderPrefix, pos + 1);
  }
  return std::nullopt;
}

auto ParsePlaceholder(std::string_view text) -> std::optional<uint32_t> {
  auto match = FindPlaceholder(text);
  if (!match || match->begin != 0 || match->length != text.size()) {
    return std::nullopt;
  }
  return match->id;
}

}  // namespace staticss::css
