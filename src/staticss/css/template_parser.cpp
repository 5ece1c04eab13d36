#include "staticss/css/template_parser.hpp"

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
#include "staticss/css/placeholder.hpp"
#include "staticss/css/tree.hpp"

namespace staticss::css {

namespace {

auto IsSpace(char c) -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Position of the first ':' outside parens and quotes, or npos.
auto FindTopLevelColon(std::string_view s) -> size_t {
  int depth = 0;
  char quote = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (quote != 0) {
      if (c == quote) {
        quote = 0;
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '(') {
      ++depth;
    } else if (c == ')') {
      depth = depth > 0 ? depth - 1 : 0;
    } else if (c == ':' && depth == 0) {
      return i;
    }
  }
  return std::string_view::npos;
}

class TemplateParser {
 public:
  explicit TemplateParser(std::string_view text) : text_(text) {
  }

  auto Parse() -> Result<CssTree> {
    return ParseBlock("", true);
  }

 private:
  auto Error(std::string msg) const -> Diagnostic {
    return Diagnostic::Error(
        SourceSpan{
            .buffer = kInvalidBufferId,
            .begin = static_cast<uint32_t>(pos_),
            .end = static_cast<uint32_t>(pos_)},
        std::move(msg));
  }

  [[nodiscard]] auto AtEnd() const -> bool {
    return pos_ >= text_.size();
  }

  [[nodiscard]] auto LooksAt(std::string_view s) const -> bool {
    return text_.substr(pos_, s.size()) == s;
  }

  void SkipWhitespace() {
    while (!AtEnd() && IsSpace(text_[pos_])) {
      ++pos_;
    }
  }

  auto ParseBlockComment() -> Result<CssNode> {
    size_t close = text_.find("*/", pos_ + 2);
    if (close == std::string_view::npos) {
      return std::unexpected(Error("unterminated comment"));
    }
    std::string body(text_.substr(pos_, close + 2 - pos_));
    pos_ = close + 2;
    return CssNode::Comment(std::move(body));
  }

  auto ParseLineComment() -> CssNode {
    size_t eol = text_.find('\n', pos_);
    if (eol == std::string_view::npos) {
      eol = text_.size();
    }
    auto body = text_.substr(pos_ + 2, eol - pos_ - 2);
    while (!body.empty() && IsSpace(body.back())) {
      body.remove_suffix(1);
    }
    pos_ = eol;
    return CssNode::Comment(fmt::format("/*{}*/", body));
  }

  // Reads up to (not including) the statement terminator.
  auto ReadStatement() -> std::string_view {
    size_t start = pos_;
    int depth = 0;
    char quote = 0;
    while (!AtEnd()) {
      char c = text_[pos_];
      if (quote != 0) {
        if (c == '\\') {
          ++pos_;
        } else if (c == quote) {
          quote = 0;
        }
        ++pos_;
        continue;
      }
      if (c == '"' || c == '\'') {
        quote = c;
      } else if (c == '(') {
        ++depth;
      } else if (c == ')') {
        depth = depth > 0 ? depth - 1 : 0;
      } else if (depth == 0 && (c == ';' || c == '{' || c == '}')) {
        break;
      } else if (
          depth == 0 && LooksAt("//") && pos_ > start &&
          IsSpace(text_[pos_ - 1])) {
        break;
      }
      ++pos_;
    }
    return text_.substr(start, pos_ - start);
  }

  static auto MakeDeclaration(std::string_view statement)
      -> std::optional<CssNode> {
    auto trimmed = common::Trim(statement);
    if (trimmed.empty() || trimmed.front() == '@') {
      return std::nullopt;
    }
    size_t colon = FindTopLevelColon(trimmed);
    if (colon == std::string_view::npos) {
      if (ParsePlaceholder(trimmed)) {
        return CssNode::Declaration(std::string(trimmed));
      }
      return std::nullopt;
    }
    auto property = common::CollapseWhitespace(trimmed.substr(0, colon));
    auto value = common::CollapseWhitespace(trimmed.substr(colon + 1));
    return CssNode::Declaration(fmt::format("{}:{};", property, value));
  }

  auto ParseBlock(const std::string& parent, bool top) -> Result<CssTree> {
    CssTree nodes;
    while (true) {
      SkipWhitespace();
      if (AtEnd()) {
        if (!top) {
          return std::unexpected(Error("unclosed block"));
        }
        return nodes;
      }
      if (text_[pos_] == '}') {
        if (top) {
          return std::unexpected(Error("unexpected '}'"));
        }
        ++pos_;
        return nodes;
      }
      if (text_[pos_] == ';') {
        ++pos_;
        continue;
      }
      if (LooksAt("/*")) {
        auto comment = ParseBlockComment();
        if (!comment) {
          return std::unexpected(comment.error());
        }
        nodes.push_back(std::move(*comment));
        continue;
      }
      if (LooksAt("//")) {
        nodes.push_back(ParseLineComment());
        continue;
      }

      auto statement = ReadStatement();
      if (!AtEnd() && text_[pos_] == '{') {
        ++pos_;
        auto prelude = common::CollapseWhitespace(statement);
        if (!prelude.empty() && prelude.front() == '@') {
          auto body = ParseBlock(parent, false);
          if (!body) {
            return std::unexpected(body.error());
          }
          nodes.push_back(CssNode::AtRule(prelude, std::move(*body)));
        } else {
          auto selector = ResolveSelector(parent, prelude);
          auto body = ParseBlock(selector, false);
          if (!body) {
            return std::unexpected(body.error());
          }
          nodes.push_back(CssNode::Rule(selector, std::move(*body)));
        }
        continue;
      }
      if (!AtEnd() && text_[pos_] == ';') {
        ++pos_;
      }
      if (auto decl = MakeDeclaration(statement)) {
        nodes.push_back(std::move(*decl));
      }
    }
  }

  std::string_view text_;
  size_t pos_ = 0;
};

}  // namespace

auto ResolveSelector(std::string_view parent, std::string_view selector)
    -> std::string {
  if (parent.empty()) {
    return common::CollapseWhitespace(selector);
  }
  std::string resolved;
  for (const auto& part : common::SplitTopLevel(selector, ',')) {
    std::string piece;
    if (part.find('&') != std::string::npos) {
      for (char c : part) {
        if (c == '&') {
          piece += parent;
        } else {
          piece += c;
        }
      }
    } else {
      piece = fmt::format("{} {}", parent, part);
    }
    if (!resolved.empty()) {
      resolved += ",";
    }
    resolved += common::CollapseWhitespace(piece);
  }
  return resolved;
}

auto ParseTemplate(std::string_view text) -> Result<CssTree> {
  return TemplateParser(text).Parse();
}

}  // namespace staticss::css
