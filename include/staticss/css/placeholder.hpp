#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace staticss::css {

inline constexpr std::string_view kPlaceholderPrefix = "__SC_EXPR_";
inline constexpr std::string_view kPlaceholderSuffix = "__";

// "__SC_EXPR_<id>__"
auto MakePlaceholder(uint32_t id) -> std::string;

// Returns the slot id if `text` is exactly one placeholder.
auto ParsePlaceholder(std::string_view text) -> std::optional<uint32_t>;

struct PlaceholderMatch {
  size_t begin = 0;
  size_t length = 0;
  uint32_t id = 0;
};

// Finds the first placeholder at or after `from`.
auto FindPlaceholder(std::string_view text, size_t from = 0)
    -> std::optional<PlaceholderMatch>;

}  // namespace staticss::css
