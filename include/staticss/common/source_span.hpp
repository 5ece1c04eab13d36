#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace staticss {

struct BufferId {
  uint32_t value = 0;

  explicit operator bool() const {
    return value != UINT32_MAX;
  }
  auto operator==(const BufferId&) const -> bool = default;
};

inline constexpr BufferId kInvalidBufferId{UINT32_MAX};

struct SourceSpan {
  BufferId buffer = kInvalidBufferId;
  uint32_t begin = 0;
  uint32_t end = 0;

  auto operator==(const SourceSpan&) const -> bool = default;
};

// 1-based line and column.
struct Location {
  uint32_t line = 1;
  uint32_t column = 1;

  auto operator==(const Location&) const -> bool = default;
};

// Maps byte offsets of one text buffer to line/column pairs.
class LineIndex {
 public:
  explicit LineIndex(std::string_view text);

  [[nodiscard]] auto Locate(uint32_t offset) const -> Location;
  [[nodiscard]] auto LineCount() const -> size_t {
    return line_starts_.size();
  }

 private:
  std::vector<uint32_t> line_starts_;
};

auto FormatLocation(const std::string& path, Location loc) -> std::string;

}  // namespace staticss
