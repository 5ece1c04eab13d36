#include "staticss/common/string_utils.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace staticss::common {

namespace {

auto IsSpace(char c) -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto LowerAscii(char c) -> char {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// Tracks paren depth and quote state while scanning a CSS value.
class NestingState {
 public:
  // Returns true if `c` is outside any parens or quotes after consuming it.
  auto Consume(char c) -> bool {
    if (quote_ != 0) {
      if (c == quote_) {
        quote_ = 0;
      }
      return false;
    }
    if (c == '"' || c == '\'') {
      quote_ = c;
      return false;
    }
    if (c == '(') {
      ++depth_;
      return false;
    }
    if (c == ')') {
      if (depth_ > 0) {
        --depth_;
      }
      return false;
    }
    return depth_ == 0;
  }

 private:
  int depth_ = 0;
  char quote_ = 0;
};

}  // namespace

auto Trim(std::string_view s) -> std::string_view {
  size_t begin = 0;
  while (begin < s.size() && IsSpace(s[begin])) {
    ++begin;
  }
  size_t end = s.size();
  while (end > begin && IsSpace(s[end - 1])) {
    --end;
  }
  return s.substr(begin, end - begin);
}

auto IsIdentifierStart(char c) -> bool {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_' ||
         c == '$';
}

auto IsIdentifierChar(char c) -> bool {
  return IsIdentifierStart(c) || std::isdigit(static_cast<unsigned char>(c));
}

auto IsIdentifier(std::string_view s) -> bool {
  if (s.empty() || !IsIdentifierStart(s.front())) {
    return false;
  }
  for (char c : s) {
    if (!IsIdentifierChar(c)) {
      return false;
    }
  }
  return true;
}

auto IsNumeric(std::string_view s) -> bool {
  if (!s.empty() && s.front() == '-') {
    s.remove_prefix(1);
  }
  if (s.empty()) {
    return false;
  }
  bool seen_dot = false;
  bool seen_digit = false;
  for (char c : s) {
    if (c == '.') {
      if (seen_dot) {
        return false;
      }
      seen_dot = true;
    } else if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
      seen_digit = true;
    } else {
      return false;
    }
  }
  return seen_digit;
}

auto Capitalize(std::string_view s) -> std::string {
  std::string result(s);
  if (!result.empty()) {
    result[0] =
        static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
  }
  return result;
}

auto LowerFirst(std::string_view s) -> std::string {
  std::string result(s);
  if (!result.empty()) {
    result[0] = LowerAscii(result[0]);
  }
  return result;
}

auto ToLowerAscii(std::string_view s) -> std::string {
  std::string result;
  result.reserve(s.size());
  for (char c : s) {
    result += LowerAscii(c);
  }
  return result;
}

auto ContainsIgnoreCase(std::string_view haystack, std::string_view needle)
    -> bool {
  return ToLowerAscii(haystack).find(ToLowerAscii(needle)) != std::string::npos;
}

auto KebabToCamel(std::string_view s) -> std::string {
  std::string result;
  result.reserve(s.size());
  bool upper_next = false;
  for (char c : s) {
    if (c == '-') {
      upper_next = !result.empty();
      continue;
    }
    if (upper_next) {
      result +=
          static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      upper_next = false;
    } else {
      result += c;
    }
  }
  return result;
}

auto SplitTopLevel(std::string_view s, char sep) -> std::vector<std::string> {
  std::vector<std::string> pieces;
  NestingState state;
  size_t start = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    bool top = state.Consume(s[i]);
    if (top && s[i] == sep) {
      auto piece = Trim(s.substr(start, i - start));
      if (!piece.empty()) {
        pieces.emplace_back(piece);
      }
      start = i + 1;
    }
  }
  auto piece = Trim(s.substr(start));
  if (!piece.empty()) {
    pieces.emplace_back(piece);
  }
  return pieces;
}

auto SplitTokens(std::string_view s) -> std::vector<std::string> {
  std::vector<std::string> tokens;
  NestingState state;
  std::string current;
  for (char c : s) {
    bool top = state.Consume(c);
    if (top && IsSpace(c)) {
      if (!current.empty()) {
        tokens.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current += c;
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

auto CollapseWhitespace(std::string_view s) -> std::string {
  std::string result;
  result.reserve(s.size());
  bool pending_space = false;
  for (char c : Trim(s)) {
    if (IsSpace(c)) {
      pending_space = true;
      continue;
    }
    if (pending_space) {
      result += ' ';
      pending_space = false;
    }
    result += c;
  }
  return result;
}

auto EscapeForJsString(std::string_view s) -> std::string {
  std::string result;
  result.reserve(s.size() + (s.size() / 10));
  for (char c : s) {
    switch (c) {
      case '\\':
        result += "\\\\";
        break;
      case '"':
        result += "\\\"";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        result += c;
        break;
    }
  }
  return result;
}

}  // namespace staticss::common
