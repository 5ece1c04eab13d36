#include "staticss/common/source_span.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace staticss {

LineIndex::LineIndex(std::string_view text) {
  line_starts_.push_back(0);
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      line_starts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

auto LineIndex::Locate(uint32_t offset) const -> Location {
  auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  auto line = static_cast<uint32_t>(it - line_starts_.begin());
  uint32_t line_start = line_starts_[line - 1];
  return Location{.line = line, .column = offset - line_start + 1};
}

auto FormatLocation(const std::string& path, Location loc) -> std::string {
  return fmt::format("{}:{}:{}", path, loc.line, loc.column);
}

}  // namespace staticss
