#include "staticss/source/styled_scanner.hpp"

#include <cctype>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "staticss/common/diagnostic/diagnostic.hpp"
#include "staticss/common/string_utils.hpp"
#include "staticss/css/placeholder.hpp"
#include "staticss/js/expression.hpp"
#include "staticss/js/lexer.hpp"
#include "staticss/js/parser.hpp"
#include "staticss/js/pattern.hpp"

namespace staticss::source {

namespace {

class Scanner {
 public:
  Scanner(ScannedFile* file, std::string_view text)
      : file_(file), text_(text), lines_(text) {
  }

  auto Run() -> Result<void> {
    size_t i = 0;
    while (i < text_.size()) {
      char c = text_[i];
      if (auto after = SkipTrivia(i)) {
        i = *after;
        continue;
      }
      if (c == '"' || c == '\'') {
        i = js::SkipStringLiteral(text_, i).value_or(i + 1);
        continue;
      }
      if (c == '`') {
        auto scan = js::ScanTemplate(text_, i);
        i = scan ? scan->end : i + 1;
        continue;
      }
      if (!common::IsIdentifierStart(c) ||
          (i > 0 && (common::IsIdentifierChar(text_[i - 1]) ||
                     text_[i - 1] == '.'))) {
        ++i;
        continue;
      }
      size_t word_end = IdentifierEnd(i);
      auto word = text_.substr(i, word_end - i);
      if (word == "import") {
        i = ScanImport(word_end);
      } else if (word == "const" || word == "let" || word == "var") {
        auto next = ScanDeclaration(i, word_end);
        if (!next) {
          return std::unexpected(next.error());
        }
        i = *next;
      } else {
        i = word_end;
      }
    }
    return {};
  }

 private:
  auto SkipTrivia(size_t pos) const -> std::optional<size_t> {
    if (text_.substr(pos, 2) == "//") {
      size_t eol = text_.find('\n', pos);
      return eol == std::string_view::npos ? text_.size() : eol;
    }
    if (text_.substr(pos, 2) == "/*") {
      size_t close = text_.find("*/", pos + 2);
      return close == std::string_view::npos ? text_.size() : close + 2;
    }
    return std::nullopt;
  }

  auto SkipSpace(size_t pos) const -> size_t {
    while (pos < text_.size()) {
      if (auto after = SkipTrivia(pos)) {
        pos = *after;
      } else if (std::isspace(static_cast<unsigned char>(text_[pos])) != 0) {
        ++pos;
      } else {
        break;
      }
    }
    return pos;
  }

  auto IdentifierEnd(size_t pos) const -> size_t {
    while (pos < text_.size() && common::IsIdentifierChar(text_[pos])) {
      ++pos;
    }
    return pos;
  }

  auto ReadIdentifier(size_t& pos) const -> std::optional<std::string_view> {
    pos = SkipSpace(pos);
    if (pos >= text_.size() || !common::IsIdentifierStart(text_[pos])) {
      return std::nullopt;
    }
    size_t end = IdentifierEnd(pos);
    auto name = text_.substr(pos, end - pos);
    pos = end;
    return name;
  }

  auto Peek(size_t pos) const -> char {
    pos = SkipSpace(pos);
    return pos < text_.size() ? text_[pos] : '\0';
  }

  // import a, { b, c as d }, * as ns from "module";
  auto ScanImport(size_t pos) -> size_t {
    size_t from = text_.find("from", pos);
    size_t stop = text_.find(';', pos);
    if (from == std::string_view::npos ||
        (stop != std::string_view::npos && stop < from)) {
      return pos;
    }
    size_t quote = SkipSpace(from + 4);
    if (quote >= text_.size() ||
        (text_[quote] != '"' && text_[quote] != '\'')) {
      return pos;
    }
    auto close = js::SkipStringLiteral(text_, quote);
    if (!close) {
      return pos;
    }
    std::string module(text_.substr(quote + 1, *close - quote - 2));
    auto clause = text_.substr(pos, from - pos);
    std::string names;
    for (char c : clause) {
      names += (c == '{' || c == '}' || c == ',') ? ' ' : c;
    }
    auto tokens = common::SplitTokens(names);
    for (size_t t = 0; t < tokens.size(); ++t) {
      if (tokens[t] == "type") {
        continue;
      }
      if (tokens[t] == "as" && t + 1 < tokens.size()) {
        file_->imports[tokens[t + 1]] = module;
        ++t;
        continue;
      }
      if (tokens[t] == "*") {
        continue;
      }
      if (t + 1 < tokens.size() && tokens[t + 1] == "as") {
        continue;
      }
      file_->imports[tokens[t]] = module;
    }
    return *close;
  }

  // const Name[: Type] = <initializer>
  auto ScanDeclaration(size_t keyword, size_t pos) -> Result<size_t> {
    auto name = ReadIdentifier(pos);
    if (!name) {
      return pos;
    }
    pos = SkipSpace(pos);
    if (pos < text_.size() && text_[pos] == ':') {
      // Type annotation up to the initializer.
      while (pos < text_.size()) {
        if (text_[pos] == '=' && text_.substr(pos, 2) != "=>" &&
            text_.substr(pos, 2) != "==") {
          break;
        }
        if (text_[pos] == ';' || text_[pos] == '\n') {
          return pos;
        }
        ++pos;
      }
    }
    if (pos >= text_.size() || text_[pos] != '=' ||
        text_.substr(pos, 2) == "==" || text_.substr(pos, 2) == "=>") {
      return pos;
    }
    size_t init = SkipSpace(pos + 1);
    return ScanInitializer(std::string(*name), keyword, init);
  }

  auto ScanInitializer(std::string name, size_t keyword, size_t init)
      -> Result<size_t> {
    size_t pos = init;
    auto callee = ReadIdentifier(pos);
    if (callee == "styled") {
      return ScanStyled(std::move(name), keyword, pos);
    }
    if ((callee == "keyframes" || callee == "css") && Peek(pos) == '`') {
      size_t open = SkipSpace(pos);
      auto scan = js::ScanTemplate(text_, open);
      if (!scan) {
        return UnterminatedTemplate(open);
      }
      if (callee == "keyframes") {
        file_->keyframes.insert(name);
      } else {
        file_->css_helpers.insert(name);
      }
      return scan->end;
    }
    if (init < text_.size() &&
        (text_[init] == '(' || (callee && Peek(pos) == '='))) {
      ScanHelper(std::move(name), init);
    }
    return init;
  }

  // styled.tag`...`, styled(Component)`...`, styled("tag")`...`, optionally
  // followed by .attrs(...) / .withConfig(...) and type arguments.
  auto ScanStyled(std::string name, size_t keyword, size_t pos)
      -> Result<size_t> {
    std::string tag;
    bool wraps_component = false;
    pos = SkipSpace(pos);
    if (pos < text_.size() && text_[pos] == '.') {
      auto ident = ReadIdentifier(++pos);
      if (!ident) {
        return pos;
      }
      tag = std::string(*ident);
    } else if (pos < text_.size() && text_[pos] == '(') {
      auto close = js::FindMatchingBracket(text_, pos);
      if (!close) {
        return pos + 1;
      }
      auto arg = common::Trim(text_.substr(pos + 1, *close - pos - 1));
      if (!arg.empty() && (arg.front() == '"' || arg.front() == '\'')) {
        tag = std::string(arg.substr(1, arg.size() - 2));
      } else {
        tag = std::string(arg);
        wraps_component = true;
      }
      pos = *close + 1;
    } else {
      return pos;
    }

    while (true) {
      pos = SkipSpace(pos);
      if (pos >= text_.size()) {
        return pos;
      }
      if (text_[pos] == '.') {
        size_t after = pos + 1;
        auto method = ReadIdentifier(after);
        if (!method || (*method != "attrs" && *method != "withConfig") ||
            Peek(after) != '(') {
          return pos;
        }
        auto close = js::FindMatchingBracket(text_, SkipSpace(after));
        if (!close) {
          return after;
        }
        pos = *close + 1;
        continue;
      }
      if (text_[pos] == '<') {
        auto close = SkipTypeArguments(pos);
        if (!close) {
          return pos + 1;
        }
        pos = *close;
        continue;
      }
      break;
    }
    if (text_[pos] != '`') {
      return pos;
    }
    auto scan = js::ScanTemplate(text_, pos);
    if (!scan) {
      return UnterminatedTemplate(pos);
    }

    StyledComponent component{
        .local_name = std::move(name),
        .tag = std::move(tag),
        .wraps_component = wraps_component,
        .location = lines_.Locate(static_cast<uint32_t>(keyword)),
        .css = {},
        .slots = {},
    };
    for (size_t n = 0; n < scan->quasis.size(); ++n) {
      component.css += scan->quasis[n];
      if (n >= scan->expressions.size()) {
        continue;
      }
      auto id = static_cast<uint32_t>(n);
      auto [begin, end] = scan->expressions[n];
      auto expr = js::ParseExpression(
          file_->arena, file_->buffer, static_cast<uint32_t>(begin),
          static_cast<uint32_t>(end));
      if (!expr) {
        spdlog::debug(
            "{}: slot {} did not parse: {}", component.local_name, id,
            expr.error().primary.message);
      }
      component.slots.push_back(
          css::Slot{
              .id = id,
              .placeholder = css::MakePlaceholder(id),
              .expression =
                  expr ? std::optional<js::ExprId>(*expr) : std::nullopt,
          });
      component.css += component.slots.back().placeholder;
    }
    spdlog::debug(
        "found styled component {} ({} slots)", component.local_name,
        component.slots.size());
    file_->components.push_back(std::move(component));
    return scan->end;
  }

  auto SkipTypeArguments(size_t open) const -> std::optional<size_t> {
    int depth = 0;
    for (size_t i = open; i < text_.size(); ++i) {
      if (text_[i] == '<') {
        ++depth;
      } else if (text_[i] == '>' && text_[i - 1] != '=') {
        if (--depth == 0) {
          return i + 1;
        }
      } else if (text_[i] == '`' || text_[i] == ';') {
        return std::nullopt;
      }
    }
    return std::nullopt;
  }

  // const helper = (v) => v ? "a" : "b"
  void ScanHelper(std::string name, size_t init) {
    size_t end = init;
    while (end < text_.size() && text_[end] != ';' && text_[end] != '\n') {
      if (text_[end] == '(' || text_[end] == '{' || text_[end] == '[') {
        auto close = js::FindMatchingBracket(text_, end);
        if (!close) {
          return;
        }
        end = *close + 1;
        continue;
      }
      if (text_[end] == '"' || text_[end] == '\'') {
        auto close = js::SkipStringLiteral(text_, end);
        if (!close) {
          return;
        }
        end = *close;
        continue;
      }
      ++end;
    }
    auto parsed = js::ParseExpression(
        file_->arena, file_->buffer, static_cast<uint32_t>(init),
        static_cast<uint32_t>(end));
    if (!parsed) {
      return;
    }
    const auto& arena = file_->arena;
    auto bindings = js::GetArrowBindings(arena, *parsed);
    auto body = js::GetArrowBody(arena, *parsed);
    if (!bindings || !bindings->props_name || !body) {
      return;
    }
    const auto* conditional =
        std::get_if<js::ConditionalExpressionData>(&arena[*body].data);
    if (conditional == nullptr) {
      return;
    }
    auto test = js::GetMemberPath(arena, conditional->test);
    auto truthy = js::GetStaticLiteral(arena, conditional->consequent);
    auto falsy = js::GetStaticLiteral(arena, conditional->alternate);
    if (!test || !test->segments.empty() ||
        test->root != *bindings->props_name || !truthy || !falsy) {
      return;
    }
    spdlog::debug("found ternary helper {}", name);
    file_->helpers.push_back(
        lowering::TernaryHelper{
            .name = std::move(name),
            .truthy = std::move(*truthy),
            .falsy = std::move(*falsy)});
  }

  auto UnterminatedTemplate(size_t open) const -> Result<size_t> {
    return std::unexpected(Diagnostic::Error(
        SourceSpan{
            .buffer = file_->buffer,
            .begin = static_cast<uint32_t>(open),
            .end = static_cast<uint32_t>(open + 1)},
        "unterminated template literal"));
  }

  ScannedFile* file_;
  std::string_view text_;
  LineIndex lines_;
};

}  // namespace

auto ScanSource(std::string source) -> Result<ScannedFile> {
  ScannedFile file;
  file.buffer = file.arena.AddBuffer(std::move(source));
  Scanner scanner(&file, file.arena.Buffer(file.buffer));
  if (auto result = scanner.Run(); !result) {
    return std::unexpected(result.error());
  }
  return file;
}

}  // namespace staticss::source
