#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "staticss/common/diagnostic/diagnostic.hpp"
#include "staticss/common/source_span.hpp"

namespace staticss::js {

enum class TokenKind : uint8_t {
  kIdentifier,
  kNumber,
  kString,
  kTemplate,
  kPunctuator,
  kEnd,
};

struct Token {
  TokenKind kind = TokenKind::kEnd;
  uint32_t begin = 0;
  uint32_t end = 0;
  // Identifier name, punctuator, raw number, or cooked string value.
  std::string text;

  [[nodiscard]] auto Is(std::string_view punct) const -> bool {
    return kind == TokenKind::kPunctuator && text == punct;
  }
};

// Result of scanning a template literal starting at a backtick.
struct TemplateScan {
  // Offset just past the closing backtick.
  size_t end = 0;
  // Raw text between interpolations; one more than `expressions`.
  std::vector<std::string> quasis;
  // [begin, end) of each `${...}` body.
  std::vector<std::pair<size_t, size_t>> expressions;
};

auto ScanTemplate(std::string_view text, size_t open)
    -> std::optional<TemplateScan>;

// Offset just past the closing quote of a string starting at `open`.
auto SkipStringLiteral(std::string_view text, size_t open)
    -> std::optional<size_t>;

// Offset of the bracket closing the one at `open` ('(', '[' or '{'),
// skipping strings, templates and comments.
auto FindMatchingBracket(std::string_view text, size_t open)
    -> std::optional<size_t>;

// Tokenizes text[begin, end) of `buffer`. Token offsets are buffer offsets.
auto Tokenize(
    std::string_view buffer, BufferId buffer_id, uint32_t begin, uint32_t end)
    -> Result<std::vector<Token>>;

}  // namespace staticss::js
