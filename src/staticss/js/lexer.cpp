#include "staticss/js/lexer.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "staticss/common/diagnostic/diagnostic.hpp"
#include "staticss/common/string_utils.hpp"

namespace staticss::js {

namespace {

constexpr std::array<std::string_view, 13> kMultiCharPunctuators = {
    "===", "!==", "...", "?.", "??", "=>", "==",
    "!=",  "<=",  ">=",  "&&", "||", "**"};

constexpr std::string_view kSingleCharPunctuators = "()[]{},:?.!+-*/%<>=;|&";

auto IsDigit(char c) -> bool {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

auto IsSpace(char c) -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Skips a comment at `pos` if there is one. Returns the offset after it.
auto SkipComment(std::string_view text, size_t pos) -> std::optional<size_t> {
  if (text.substr(pos, 2) == "//") {
    size_t eol = text.find('\n', pos);
    return eol == std::string_view::npos ? text.size() : eol;
  }
  if (text.substr(pos, 2) == "/*") {
    size_t close = text.find("*/", pos + 2);
    return close == std::string_view::npos ? text.size() : close + 2;
  }
  return std::nullopt;
}

auto CookString(std::string_view raw) -> std::string {
  std::string result;
  result.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 1 >= raw.size()) {
      result += raw[i];
      continue;
    }
    char next = raw[++i];
    switch (next) {
      case 'n':
        result += '\n';
        break;
      case 't':
        result += '\t';
        break;
      case 'r':
        result += '\r';
        break;
      default:
        result += next;
        break;
    }
  }
  return result;
}

}  // namespace

auto SkipStringLiteral(std::string_view text, size_t open)
    -> std::optional<size_t> {
  char quote = text[open];
  for (size_t i = open + 1; i < text.size(); ++i) {
    if (text[i] == '\\') {
      ++i;
      continue;
    }
    if (text[i] == quote) {
      return i + 1;
    }
    if (text[i] == '\n') {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

auto FindMatchingBracket(std::string_view text, size_t open)
    -> std::optional<size_t> {
  std::vector<char> stack;
  size_t i = open;
  while (i < text.size()) {
    char c = text[i];
    if (auto after = SkipComment(text, i)) {
      i = *after;
      continue;
    }
    if (c == '"' || c == '\'') {
      auto after = SkipStringLiteral(text, i);
      if (!after) {
        return std::nullopt;
      }
      i = *after;
      continue;
    }
    if (c == '`') {
      auto scan = ScanTemplate(text, i);
      if (!scan) {
        return std::nullopt;
      }
      i = scan->end;
      continue;
    }
    if (c == '(' || c == '[' || c == '{') {
      stack.push_back(c == '(' ? ')' : c == '[' ? ']' : '}');
    } else if (c == ')' || c == ']' || c == '}') {
      if (stack.empty() || stack.back() != c) {
        return std::nullopt;
      }
      stack.pop_back();
      if (stack.empty()) {
        return i;
      }
    }
    ++i;
  }
  return std::nullopt;
}

auto ScanTemplate(std::string_view text, size_t open)
    -> std::optional<TemplateScan> {
  TemplateScan scan;
  std::string quasi;
  size_t i = open + 1;
  while (i < text.size()) {
    char c = text[i];
    if (c == '\\' && i + 1 < text.size()) {
      quasi += text.substr(i, 2);
      i += 2;
      continue;
    }
    if (c == '`') {
      scan.quasis.push_back(std::move(quasi));
      scan.end = i + 1;
      return scan;
    }
    if (c == '$' && i + 1 < text.size() && text[i + 1] == '{') {
      auto close = FindMatchingBracket(text, i + 1);
      if (!close) {
        return std::nullopt;
      }
      scan.quasis.push_back(std::exchange(quasi, {}));
      scan.expressions.emplace_back(i + 2, *close);
      i = *close + 1;
      continue;
    }
    quasi += c;
    ++i;
  }
  return std::nullopt;
}

auto Tokenize(
    std::string_view buffer, BufferId buffer_id, uint32_t begin, uint32_t end)
    -> Result<std::vector<Token>> {
  auto error = [&](size_t at, std::string msg) {
    return std::unexpected(Diagnostic::Error(
        SourceSpan{
            .buffer = buffer_id,
            .begin = static_cast<uint32_t>(at),
            .end = static_cast<uint32_t>(at)},
        std::move(msg)));
  };

  std::string_view text = buffer.substr(0, end);
  std::vector<Token> tokens;
  size_t i = begin;
  while (i < text.size()) {
    char c = text[i];
    if (IsSpace(c)) {
      ++i;
      continue;
    }
    if (auto after = SkipComment(text, i)) {
      i = *after;
      continue;
    }
    auto start = static_cast<uint32_t>(i);

    if (common::IsIdentifierStart(c)) {
      while (i < text.size() && common::IsIdentifierChar(text[i])) {
        ++i;
      }
      tokens.push_back(
          Token{
              .kind = TokenKind::kIdentifier,
              .begin = start,
              .end = static_cast<uint32_t>(i),
              .text = std::string(text.substr(start, i - start))});
      continue;
    }

    if (IsDigit(c) ||
        (c == '.' && i + 1 < text.size() && IsDigit(text[i + 1]))) {
      while (i < text.size() &&
             (common::IsIdentifierChar(text[i]) || text[i] == '.')) {
        ++i;
      }
      tokens.push_back(
          Token{
              .kind = TokenKind::kNumber,
              .begin = start,
              .end = static_cast<uint32_t>(i),
              .text = std::string(text.substr(start, i - start))});
      continue;
    }

    if (c == '"' || c == '\'') {
      auto after = SkipStringLiteral(text, i);
      if (!after) {
        return error(i, "unterminated string literal");
      }
      tokens.push_back(
          Token{
              .kind = TokenKind::kString,
              .begin = start,
              .end = static_cast<uint32_t>(*after),
              .text = CookString(text.substr(i + 1, *after - i - 2))});
      i = *after;
      continue;
    }

    if (c == '`') {
      auto scan = ScanTemplate(text, i);
      if (!scan) {
        return error(i, "unterminated template literal");
      }
      tokens.push_back(
          Token{
              .kind = TokenKind::kTemplate,
              .begin = start,
              .end = static_cast<uint32_t>(scan->end),
              .text = {}});
      i = scan->end;
      continue;
    }

    std::string_view punct;
    for (auto candidate : kMultiCharPunctuators) {
      if (text.substr(i, candidate.size()) == candidate) {
        punct = candidate;
        break;
      }
    }
    // `a?.5:b` is a conditional, not optional chaining.
    if (punct == "?." && i + 2 < text.size() && IsDigit(text[i + 2])) {
      punct = "?";
    }
    if (punct.empty() &&
        kSingleCharPunctuators.find(c) != std::string_view::npos) {
      punct = text.substr(i, 1);
    }
    if (punct.empty()) {
      return error(i, fmt::format("unexpected character '{}'", c));
    }
    i += punct.size();
    tokens.push_back(
        Token{
            .kind = TokenKind::kPunctuator,
            .begin = start,
            .end = static_cast<uint32_t>(i),
            .text = std::string(punct)});
  }
  tokens.push_back(
      Token{
          .kind = TokenKind::kEnd,
          .begin = end,
          .end = end,
          .text = {}});
  return tokens;
}

}  // namespace staticss::js
