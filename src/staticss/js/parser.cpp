#include "staticss/js/parser.hpp"

#include <cstdint>
#include <cstdlib>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "staticss/common/diagnostic/diagnostic.hpp"
#include "staticss/js/arena.hpp"
#include "staticss/js/expression.hpp"
#include "staticss/js/lexer.hpp"

namespace staticss::js {

namespace {

struct BinaryInfo {
  int precedence = 0;
  bool logical = false;
  BinaryOp binary_op = BinaryOp::kAdd;
  LogicalOp logical_op = LogicalOp::kAnd;
};

auto LookupBinary(const Token& token) -> std::optional<BinaryInfo> {
  if (token.kind != TokenKind::kPunctuator) {
    return std::nullopt;
  }
  const auto& t = token.text;
  auto logical = [](int prec, LogicalOp op) {
    return BinaryInfo{.precedence = prec, .logical = true, .logical_op = op};
  };
  auto binary = [](int prec, BinaryOp op) {
    return BinaryInfo{.precedence = prec, .logical = false, .binary_op = op};
  };
  if (t == "??") {
    return logical(1, LogicalOp::kNullish);
  }
  if (t == "||") {
    return logical(2, LogicalOp::kOr);
  }
  if (t == "&&") {
    return logical(3, LogicalOp::kAnd);
  }
  if (t == "===") {
    return binary(4, BinaryOp::kStrictEqual);
  }
  if (t == "!==") {
    return binary(4, BinaryOp::kStrictNotEqual);
  }
  if (t == "==") {
    return binary(4, BinaryOp::kEqual);
  }
  if (t == "!=") {
    return binary(4, BinaryOp::kNotEqual);
  }
  if (t == "<") {
    return binary(5, BinaryOp::kLess);
  }
  if (t == ">") {
    return binary(5, BinaryOp::kGreater);
  }
  if (t == "<=") {
    return binary(5, BinaryOp::kLessEqual);
  }
  if (t == ">=") {
    return binary(5, BinaryOp::kGreaterEqual);
  }
  if (t == "+") {
    return binary(6, BinaryOp::kAdd);
  }
  if (t == "-") {
    return binary(6, BinaryOp::kSubtract);
  }
  if (t == "*") {
    return binary(7, BinaryOp::kMultiply);
  }
  if (t == "/") {
    return binary(7, BinaryOp::kDivide);
  }
  if (t == "%") {
    return binary(7, BinaryOp::kModulo);
  }
  return std::nullopt;
}

class Parser {
 public:
  Parser(Arena& arena, BufferId buffer, std::vector<Token> tokens)
      : arena_(arena), buffer_(buffer), tokens_(std::move(tokens)) {
  }

  auto ParseComplete() -> Result<ExprId> {
    auto expr = ParseAssignment();
    if (!expr) {
      return expr;
    }
    if (Peek().kind != TokenKind::kEnd) {
      return Fail(fmt::format("unexpected token '{}'", Source(Peek())));
    }
    return expr;
  }

 private:
  [[nodiscard]] auto Peek(size_t ahead = 0) const -> const Token& {
    size_t index = pos_ + ahead;
    if (index >= tokens_.size()) {
      return tokens_.back();
    }
    return tokens_[index];
  }

  auto Advance() -> const Token& {
    const Token& token = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) {
      ++pos_;
    }
    return token;
  }

  auto Accept(std::string_view punct) -> bool {
    if (Peek().Is(punct)) {
      Advance();
      return true;
    }
    return false;
  }

  [[nodiscard]] auto Source(const Token& token) const -> std::string_view {
    return arena_.Buffer(buffer_).substr(
        token.begin, token.end - token.begin);
  }

  [[nodiscard]] auto Fail(std::string msg) const -> Result<ExprId> {
    const Token& at = Peek();
    return std::unexpected(Diagnostic::Error(
        SourceSpan{.buffer = buffer_, .begin = at.begin, .end = at.end},
        std::move(msg)));
  }

  auto Expect(std::string_view punct) -> std::optional<Diagnostic> {
    if (Accept(punct)) {
      return std::nullopt;
    }
    return Fail(fmt::format("expected '{}'", punct)).error();
  }

  auto Make(
      ExpressionKind kind, uint32_t begin, uint32_t end, ExpressionData data)
      -> ExprId {
    return arena_.AddExpression(
        Expression{
            .kind = kind,
            .span = SourceSpan{.buffer = buffer_, .begin = begin, .end = end},
            .data = std::move(data)});
  }

  [[nodiscard]] auto Begin(ExprId id) const -> uint32_t {
    return arena_[id].span.begin;
  }

  [[nodiscard]] auto End(ExprId id) const -> uint32_t {
    return arena_[id].span.end;
  }

  [[nodiscard]] auto PreviousEnd() const -> uint32_t {
    return pos_ == 0 ? Peek().begin : tokens_[pos_ - 1].end;
  }

  // True if the tokens at the cursor start an arrow function.
  [[nodiscard]] auto AtArrow() const -> bool {
    if (Peek().kind == TokenKind::kIdentifier && Peek(1).Is("=>")) {
      return true;
    }
    if (!Peek().Is("(")) {
      return false;
    }
    int depth = 0;
    for (size_t i = pos_; i < tokens_.size(); ++i) {
      const Token& token = tokens_[i];
      if (token.Is("(") || token.Is("[") || token.Is("{")) {
        ++depth;
      } else if (token.Is(")") || token.Is("]") || token.Is("}")) {
        if (--depth == 0) {
          return i + 1 < tokens_.size() && tokens_[i + 1].Is("=>");
        }
      } else if (token.kind == TokenKind::kEnd) {
        return false;
      }
    }
    return false;
  }

  // Skips a TypeScript annotation up to the next top-level ',' or ')'.
  void SkipTypeAnnotation() {
    int depth = 0;
    while (Peek().kind != TokenKind::kEnd) {
      const Token& token = Peek();
      if (depth == 0 && (token.Is(",") || token.Is(")"))) {
        return;
      }
      if (token.Is("(") || token.Is("[") || token.Is("{") || token.Is("<")) {
        ++depth;
      } else if (
          token.Is(")") || token.Is("]") || token.Is("}") || token.Is(">")) {
        --depth;
      }
      Advance();
    }
  }

  auto ParseObjectPattern() -> std::expected<Param, Diagnostic> {
    Param param{
        .kind = ParamKind::kObjectPattern, .name = {}, .properties = {}};
    if (auto err = Expect("{")) {
      return std::unexpected(*err);
    }
    while (!Peek().Is("}")) {
      bool rest = Accept("...");
      if (Peek().kind != TokenKind::kIdentifier) {
        return std::unexpected(
            Fail("expected identifier in destructuring pattern").error());
      }
      PatternProperty property{
          .key = Advance().text, .local = {}, .default_value = std::nullopt};
      property.local = property.key;
      if (rest) {
        property.key = "..." + property.key;
      } else if (Accept(":")) {
        if (Peek().kind != TokenKind::kIdentifier) {
          return std::unexpected(
              Fail("nested destructuring is not supported").error());
        }
        property.local = Advance().text;
      }
      if (Accept("=")) {
        auto value = ParseAssignment();
        if (!value) {
          return std::unexpected(value.error());
        }
        property.default_value = *value;
      }
      param.properties.push_back(std::move(property));
      if (!Accept(",")) {
        break;
      }
    }
    if (auto err = Expect("}")) {
      return std::unexpected(*err);
    }
    return param;
  }

  auto ParseParam() -> std::expected<Param, Diagnostic> {
    Param param;
    if (Peek().Is("{")) {
      auto pattern = ParseObjectPattern();
      if (!pattern) {
        return pattern;
      }
      param = std::move(*pattern);
    } else if (Peek().kind == TokenKind::kIdentifier) {
      param = Param{
          .kind = ParamKind::kIdentifier,
          .name = Advance().text,
          .properties = {}};
    } else {
      return std::unexpected(Fail("unsupported parameter").error());
    }
    if (Accept(":")) {
      SkipTypeAnnotation();
    }
    if (Accept("=")) {
      auto ignored_default = ParseAssignment();
      if (!ignored_default) {
        return std::unexpected(ignored_default.error());
      }
    }
    return param;
  }

  auto ParseArrow() -> Result<ExprId> {
    uint32_t begin = Peek().begin;
    std::vector<Param> params;
    if (Peek().kind == TokenKind::kIdentifier) {
      params.push_back(
          Param{
              .kind = ParamKind::kIdentifier,
              .name = Advance().text,
              .properties = {}});
    } else {
      Advance();  // (
      while (!Peek().Is(")")) {
        auto param = ParseParam();
        if (!param) {
          return std::unexpected(param.error());
        }
        params.push_back(std::move(*param));
        if (!Accept(",")) {
          break;
        }
      }
      if (auto err = Expect(")")) {
        return std::unexpected(*err);
      }
    }
    if (auto err = Expect("=>")) {
      return std::unexpected(*err);
    }

    Result<ExprId> body;
    if (Accept("{")) {
      // Only `{ return expr; }` bodies.
      if (Peek().kind != TokenKind::kIdentifier || Peek().text != "return") {
        return Fail("only `return` block bodies are supported");
      }
      Advance();
      body = ParseAssignment();
      if (!body) {
        return body;
      }
      Accept(";");
      if (auto err = Expect("}")) {
        return std::unexpected(*err);
      }
    } else {
      body = ParseAssignment();
      if (!body) {
        return body;
      }
    }
    return Make(
        ExpressionKind::kArrowFunction, begin, PreviousEnd(),
        ArrowFunctionExpressionData{
            .params = std::move(params), .body = *body});
  }

  auto ParseAssignment() -> Result<ExprId> {
    if (AtArrow()) {
      return ParseArrow();
    }
    return ParseConditional();
  }

  auto ParseConditional() -> Result<ExprId> {
    auto test = ParseBinary(0);
    if (!test || !Peek().Is("?")) {
      return test;
    }
    Advance();
    auto consequent = ParseAssignment();
    if (!consequent) {
      return consequent;
    }
    if (auto err = Expect(":")) {
      return std::unexpected(*err);
    }
    auto alternate = ParseAssignment();
    if (!alternate) {
      return alternate;
    }
    return Make(
        ExpressionKind::kConditional, Begin(*test), End(*alternate),
        ConditionalExpressionData{
            .test = *test, .consequent = *consequent, .alternate = *alternate});
  }

  auto ParseBinary(int min_precedence) -> Result<ExprId> {
    auto lhs = ParseUnary();
    if (!lhs) {
      return lhs;
    }
    while (true) {
      auto info = LookupBinary(Peek());
      if (!info || info->precedence <= min_precedence) {
        return lhs;
      }
      Advance();
      auto rhs = ParseBinary(info->precedence);
      if (!rhs) {
        return rhs;
      }
      if (info->logical) {
        lhs = Make(
            ExpressionKind::kLogical, Begin(*lhs), End(*rhs),
            LogicalExpressionData{
                .op = info->logical_op, .lhs = *lhs, .rhs = *rhs});
      } else {
        lhs = Make(
            ExpressionKind::kBinary, Begin(*lhs), End(*rhs),
            BinaryExpressionData{
                .op = info->binary_op, .lhs = *lhs, .rhs = *rhs});
      }
    }
  }

  auto ParseUnary() -> Result<ExprId> {
    const Token& token = Peek();
    std::optional<UnaryOp> op;
    if (token.Is("!")) {
      op = UnaryOp::kNot;
    } else if (token.Is("-")) {
      op = UnaryOp::kMinus;
    } else if (token.Is("+")) {
      op = UnaryOp::kPlus;
    } else if (token.kind == TokenKind::kIdentifier && token.text == "typeof") {
      op = UnaryOp::kTypeof;
    }
    if (!op) {
      return ParsePostfix();
    }
    uint32_t begin = Advance().begin;
    auto operand = ParseUnary();
    if (!operand) {
      return operand;
    }
    return Make(
        ExpressionKind::kUnary, begin, End(*operand),
        UnaryExpressionData{.op = *op, .operand = *operand});
  }

  auto ParseArguments() -> std::expected<std::vector<ExprId>, Diagnostic> {
    std::vector<ExprId> args;
    while (!Peek().Is(")")) {
      auto arg = ParseAssignment();
      if (!arg) {
        return std::unexpected(arg.error());
      }
      args.push_back(*arg);
      if (!Accept(",")) {
        break;
      }
    }
    if (auto err = Expect(")")) {
      return std::unexpected(*err);
    }
    return args;
  }

  auto ParsePostfix() -> Result<ExprId> {
    auto expr = ParsePrimary();
    if (!expr) {
      return expr;
    }
    while (true) {
      uint32_t begin = Begin(*expr);
      bool optional = Accept("?.");
      if (Accept(".") || (optional && Peek().kind == TokenKind::kIdentifier)) {
        if (Peek().kind != TokenKind::kIdentifier) {
          return Fail("expected property name");
        }
        std::string property = Advance().text;
        expr = Make(
            ExpressionKind::kMember, begin, PreviousEnd(),
            MemberExpressionData{
                .object = *expr,
                .property = std::move(property),
                .computed = std::nullopt,
                .optional = optional});
      } else if (Accept("[")) {
        auto index = ParseAssignment();
        if (!index) {
          return index;
        }
        if (auto err = Expect("]")) {
          return std::unexpected(*err);
        }
        expr = Make(
            ExpressionKind::kMember, begin, PreviousEnd(),
            MemberExpressionData{
                .object = *expr,
                .property = {},
                .computed = *index,
                .optional = optional});
      } else if (Accept("(")) {
        auto args = ParseArguments();
        if (!args) {
          return std::unexpected(args.error());
        }
        expr = Make(
            ExpressionKind::kCall, begin, PreviousEnd(),
            CallExpressionData{.callee = *expr, .arguments = std::move(*args)});
      } else if (!optional && Peek().kind == TokenKind::kTemplate) {
        auto quasi = ParseTemplate(Advance());
        if (!quasi) {
          return quasi;
        }
        expr = Make(
            ExpressionKind::kTaggedTemplate, begin, End(*quasi),
            TaggedTemplateExpressionData{.tag = *expr, .quasi = *quasi});
      } else if (optional) {
        return Fail("unexpected token after '?.'");
      } else {
        return expr;
      }
    }
  }

  auto ParseTemplate(const Token& token) -> Result<ExprId> {
    std::string_view buffer = arena_.Buffer(buffer_);
    auto scan = ScanTemplate(buffer, token.begin);
    if (!scan) {
      return Fail("malformed template literal");
    }
    std::vector<ExprId> expressions;
    for (auto [begin, end] : scan->expressions) {
      auto inner = ParseExpression(
          arena_, buffer_, static_cast<uint32_t>(begin),
          static_cast<uint32_t>(end));
      if (!inner) {
        return inner;
      }
      expressions.push_back(*inner);
    }
    return Make(
        ExpressionKind::kTemplateLiteral, token.begin, token.end,
        TemplateLiteralExpressionData{
            .quasis = std::move(scan->quasis),
            .expressions = std::move(expressions)});
  }

  auto ParsePrimary() -> Result<ExprId> {
    const Token& token = Peek();
    switch (token.kind) {
      case TokenKind::kIdentifier: {
        Advance();
        if (token.text == "true" || token.text == "false") {
          return Make(
              ExpressionKind::kBooleanLiteral, token.begin, token.end,
              BooleanLiteralExpressionData{.value = token.text == "true"});
        }
        if (token.text == "null") {
          return Make(
              ExpressionKind::kNullLiteral, token.begin, token.end,
              NullLiteralExpressionData{});
        }
        return Make(
            ExpressionKind::kIdentifier, token.begin, token.end,
            IdentifierExpressionData{.name = token.text});
      }
      case TokenKind::kNumber: {
        Advance();
        char* parse_end = nullptr;
        double value = std::strtod(token.text.c_str(), &parse_end);
        if (parse_end == token.text.c_str()) {
          return Fail(fmt::format("malformed number '{}'", token.text));
        }
        return Make(
            ExpressionKind::kNumberLiteral, token.begin, token.end,
            NumberLiteralExpressionData{.value = value, .raw = token.text});
      }
      case TokenKind::kString:
        Advance();
        return Make(
            ExpressionKind::kStringLiteral, token.begin, token.end,
            StringLiteralExpressionData{.value = token.text});
      case TokenKind::kTemplate:
        return ParseTemplate(Advance());
      case TokenKind::kPunctuator:
        if (token.Is("(")) {
          Advance();
          auto inner = ParseAssignment();
          if (!inner) {
            return inner;
          }
          if (auto err = Expect(")")) {
            return std::unexpected(*err);
          }
          return inner;
        }
        return Fail(fmt::format("unexpected token '{}'", Source(token)));
      case TokenKind::kEnd:
        return Fail("unexpected end of expression");
    }
    return Fail("unexpected token");
  }

  Arena& arena_;
  BufferId buffer_;
  std::vector<Token> tokens_;
  size_t pos_ = 0;
};

}  // namespace

auto ToString(UnaryOp op) -> const char* {
  switch (op) {
    case UnaryOp::kNot:
      return "!";
    case UnaryOp::kMinus:
      return "-";
    case UnaryOp::kPlus:
      return "+";
    case UnaryOp::kTypeof:
      return "typeof ";
  }
  return "?";
}

auto ToString(BinaryOp op) -> const char* {
  switch (op) {
    case BinaryOp::kStrictEqual:
      return "===";
    case BinaryOp::kStrictNotEqual:
      return "!==";
    case BinaryOp::kEqual:
      return "==";
    case BinaryOp::kNotEqual:
      return "!=";
    case BinaryOp::kLess:
      return "<";
    case BinaryOp::kGreater:
      return ">";
    case BinaryOp::kLessEqual:
      return "<=";
    case BinaryOp::kGreaterEqual:
      return ">=";
    case BinaryOp::kAdd:
      return "+";
    case BinaryOp::kSubtract:
      return "-";
    case BinaryOp::kMultiply:
      return "*";
    case BinaryOp::kDivide:
      return "/";
    case BinaryOp::kModulo:
      return "%";
  }
  return "?";
}

auto ToString(LogicalOp op) -> const char* {
  switch (op) {
    case LogicalOp::kAnd:
      return "&&";
    case LogicalOp::kOr:
      return "||";
    case LogicalOp::kNullish:
      return "??";
  }
  return "?";
}

auto ParseExpression(
    Arena& arena, BufferId buffer, uint32_t begin, uint32_t end)
    -> Result<ExprId> {
  auto tokens = Tokenize(arena.Buffer(buffer), buffer, begin, end);
  if (!tokens) {
    return std::unexpected(tokens.error());
  }
  return Parser(arena, buffer, std::move(*tokens)).ParseComplete();
}

auto ParseExpression(Arena& arena, std::string text) -> Result<ExprId> {
  auto end = static_cast<uint32_t>(text.size());
  BufferId buffer = arena.AddBuffer(std::move(text));
  return ParseExpression(arena, buffer, 0, end);
}

auto IsParseableExpression(std::string_view text) -> bool {
  Arena scratch;
  return ParseExpression(scratch, std::string(text)).has_value();
}

}  // namespace staticss::js
