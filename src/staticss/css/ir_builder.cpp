#include "staticss/css/ir_builder.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "staticss/common/string_utils.hpp"
#include "staticss/css/ir.hpp"
#include "staticss/css/placeholder.hpp"
#include "staticss/css/slot.hpp"
#include "staticss/css/tree.hpp"

namespace staticss::css {

namespace {

constexpr std::string_view kRootSelector = "&";

auto IsBlank(char c) -> bool {
  return c == ' ' || c == '\t';
}

auto StripBlockComment(std::string_view text) -> std::string {
  if (text.starts_with("/*")) {
    text.remove_prefix(2);
  }
  if (text.ends_with("*/")) {
    text.remove_suffix(2);
  }
  return std::string(common::Trim(text));
}

// The CSS parser turns `// x` into `/* x*/`: a block comment without a space
// before the closer.
auto IsConvertedLineComment(std::string_view text) -> bool {
  return text.starts_with("/*") && text.ends_with("*/") &&
         !text.ends_with(" */");
}

// Position of the first ':' not preceded by a backslash.
auto FindUnescapedColon(std::string_view text) -> size_t {
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == ':' && (i == 0 || text[i - 1] != '\\')) {
      return i;
    }
  }
  return std::string_view::npos;
}

// Strips a trailing "!important" (any case). Returns true if one was found.
auto StripImportant(std::string_view& value) -> bool {
  constexpr std::string_view kImportant = "!important";
  auto trimmed = common::Trim(value);
  if (trimmed.size() < kImportant.size()) {
    return false;
  }
  auto tail = trimmed.substr(trimmed.size() - kImportant.size());
  if (common::ToLowerAscii(tail) != kImportant) {
    return false;
  }
  value = common::Trim(trimmed.substr(0, trimmed.size() - kImportant.size()));
  return true;
}

auto StandaloneBlock(uint32_t slot_id, std::string_view raw) -> CssDeclaration {
  return CssDeclaration{
      .property = "",
      .value = InterpolatedValue{.parts = {SlotPart{.slot_id = slot_id}}},
      .important = false,
      .raw_value = std::string(raw),
      .leading_comment = std::nullopt,
      .trailing_line_comment = std::nullopt,
  };
}

class IrBuilder {
 public:
  IrBuilder(std::span<const Slot> slots, std::string_view raw_text)
      : raw_text_(raw_text) {
    for (const auto& slot : slots) {
      known_slots_.insert(slot.id);
    }
  }

  auto Build(const CssTree& tree) -> std::vector<CssRule> {
    for (const auto& node : tree) {
      Visit(node, kRootSelector);
    }
    RecoverStandalonePlaceholders();
    return std::move(rules_);
  }

 private:
  struct DeclRef {
    size_t rule = 0;
    size_t decl = 0;
  };

  auto EnsureRule(
      std::string_view selector, const std::vector<std::string>& stack)
      -> size_t {
    for (size_t i = 0; i < rules_.size(); ++i) {
      if (rules_[i].selector == selector && rules_[i].at_rule_stack == stack) {
        return i;
      }
    }
    rules_.push_back(
        CssRule{
            .selector = std::string(selector),
            .at_rule_stack = stack,
            .declarations = {}});
    return rules_.size() - 1;
  }

  void Visit(const CssNode& node, std::string_view selector) {
    switch (node.kind) {
      case CssNodeKind::kDeclaration:
        VisitDeclaration(node, selector);
        break;
      case CssNodeKind::kComment:
        VisitComment(node.value);
        break;
      case CssNodeKind::kRule:
        VisitRule(node);
        break;
      case CssNodeKind::kAtRule:
        at_rule_stack_.push_back(node.value);
        for (const auto& child : node.children) {
          Visit(child, selector);
        }
        at_rule_stack_.pop_back();
        break;
    }
  }

  void VisitDeclaration(const CssNode& node, std::string_view selector) {
    auto decls = ParseDeclarationText(node.value);
    if (decls.empty()) {
      return;
    }
    if (pending_comment_) {
      decls.front().leading_comment = std::move(pending_comment_);
      pending_comment_.reset();
    }
    size_t rule_index = EnsureRule(selector, at_rule_stack_);
    auto& target = rules_[rule_index].declarations;
    for (auto& decl : decls) {
      target.push_back(std::move(decl));
    }
    last_decl_ = DeclRef{.rule = rule_index, .decl = target.size() - 1};
  }

  void VisitRule(const CssNode& node) {
    std::string selector;
    for (char c : node.value) {
      if (c != '\f') {
        selector += c;
      }
    }
    EnsureRule(selector, at_rule_stack_);

    auto saved_pending = std::exchange(pending_comment_, std::nullopt);
    auto saved_last = std::exchange(last_decl_, std::nullopt);
    for (const auto& child : node.children) {
      Visit(child, selector);
    }
    pending_comment_ = std::move(saved_pending);
    last_decl_ = saved_last;
  }

  void VisitComment(const std::string& text) {
    bool trailing = IsConvertedLineComment(text) || IsInlineTrailing(text);
    auto body = StripBlockComment(text);
    if (trailing && last_decl_) {
      rules_[last_decl_->rule].declarations[last_decl_->decl]
          .trailing_line_comment = std::move(body);
      return;
    }
    pending_comment_ = std::move(body);
  }

  // A block comment directly after a ';' on the same line of the raw text.
  auto IsInlineTrailing(std::string_view comment) -> bool {
    size_t pos = raw_text_.find(comment, comment_cursor_);
    if (pos == std::string_view::npos) {
      return false;
    }
    comment_cursor_ = pos + comment.size();
    while (pos > 0) {
      char c = raw_text_[pos - 1];
      if (IsBlank(c)) {
        --pos;
        continue;
      }
      return c == ';';
    }
    return false;
  }

  [[nodiscard]] auto HasRootStandalone(uint32_t slot_id) const -> bool {
    for (const auto& rule : rules_) {
      if (rule.selector != kRootSelector || !rule.at_rule_stack.empty()) {
        continue;
      }
      for (const auto& decl : rule.declarations) {
        if (decl.IsStandaloneBlock() && decl.FullValueSlot() == slot_id) {
          return true;
        }
      }
    }
    return false;
  }

  void RecoverStandalonePlaceholders() {
    int depth = 0;
    size_t start = 0;
    while (start <= raw_text_.size()) {
      size_t end = raw_text_.find('\n', start);
      if (end == std::string_view::npos) {
        end = raw_text_.size();
      }
      auto line = raw_text_.substr(start, end - start);
      if (depth == 0) {
        auto candidate = common::Trim(line);
        if (candidate.ends_with(';')) {
          candidate = common::Trim(candidate.substr(0, candidate.size() - 1));
        }
        auto id = ParsePlaceholder(candidate);
        if (id && known_slots_.contains(*id) && !HasRootStandalone(*id)) {
          size_t root = EnsureRule(kRootSelector, {});
          rules_[root].declarations.push_back(StandaloneBlock(*id, candidate));
        }
      }
      for (char c : line) {
        if (c == '{') {
          ++depth;
        } else if (c == '}') {
          depth = std::max(0, depth - 1);
        }
      }
      start = end + 1;
    }
  }

  std::string_view raw_text_;
  std::unordered_set<uint32_t> known_slots_;
  std::vector<CssRule> rules_;
  std::vector<std::string> at_rule_stack_;
  std::optional<std::string> pending_comment_;
  std::optional<DeclRef> last_decl_;
  size_t comment_cursor_ = 0;
};

}  // namespace

auto CssDeclaration::SlotIds() const -> std::vector<uint32_t> {
  std::vector<uint32_t> ids;
  if (const auto* interp = std::get_if<InterpolatedValue>(&value)) {
    for (const auto& part : interp->parts) {
      if (const auto* slot = std::get_if<SlotPart>(&part)) {
        ids.push_back(slot->slot_id);
      }
    }
  }
  return ids;
}

auto CssDeclaration::FullValueSlot() const -> std::optional<uint32_t> {
  const auto* interp = std::get_if<InterpolatedValue>(&value);
  if (interp == nullptr || interp->parts.size() != 1) {
    return std::nullopt;
  }
  if (const auto* slot = std::get_if<SlotPart>(&interp->parts.front())) {
    return slot->slot_id;
  }
  return std::nullopt;
}

auto ParseCssValue(std::string_view text) -> CssValue {
  std::vector<CssValuePart> parts;
  bool has_slot = false;
  auto push_static = [&](std::string_view s) {
    if (s.empty()) {
      return;
    }
    if (!parts.empty()) {
      if (auto* last = std::get_if<StaticPart>(&parts.back())) {
        last->text += s;
        return;
      }
    }
    parts.emplace_back(StaticPart{.text = std::string(s)});
  };

  size_t cursor = 0;
  while (auto match = FindPlaceholder(text, cursor)) {
    push_static(text.substr(cursor, match->begin - cursor));
    parts.emplace_back(SlotPart{.slot_id = match->id});
    has_slot = true;
    cursor = match->begin + match->length;
  }
  if (!has_slot) {
    return StaticValue{.text = std::string(text)};
  }
  push_static(text.substr(cursor));
  return InterpolatedValue{.parts = std::move(parts)};
}

auto ParseDeclarationText(std::string_view text)
    -> std::vector<CssDeclaration> {
  auto trimmed = common::Trim(text);
  if (trimmed.ends_with(';')) {
    trimmed = common::Trim(trimmed.substr(0, trimmed.size() - 1));
  }
  if (trimmed.empty()) {
    return {};
  }

  if (auto id = ParsePlaceholder(trimmed)) {
    return {StandaloneBlock(*id, trimmed)};
  }

  // "<placeholder> <rest>": the parser glued a standalone interpolation onto
  // the following declaration.
  if (auto match = FindPlaceholder(trimmed);
      match && match->begin == 0 && match->length < trimmed.size() &&
      std::isspace(static_cast<unsigned char>(trimmed[match->length])) != 0) {
    auto rest = common::Trim(trimmed.substr(match->length));
    std::vector<CssDeclaration> decls;
    decls.push_back(
        StandaloneBlock(match->id, trimmed.substr(0, match->length)));
    for (auto& decl : ParseDeclarationText(rest)) {
      decls.push_back(std::move(decl));
    }
    return decls;
  }

  size_t colon = FindUnescapedColon(trimmed);
  if (colon == std::string_view::npos) {
    return {};
  }
  auto property = common::Trim(trimmed.substr(0, colon));
  if (property.empty()) {
    return {};
  }
  auto value = common::Trim(trimmed.substr(colon + 1));
  bool important = StripImportant(value);
  return {CssDeclaration{
      .property = std::string(property),
      .value = ParseCssValue(value),
      .important = important,
      .raw_value = std::string(value),
      .leading_comment = std::nullopt,
      .trailing_line_comment = std::nullopt,
  }};
}

auto BuildIr(
    const CssTree& tree, std::span<const Slot> slots, std::string_view raw_text)
    -> std::vector<CssRule> {
  return IrBuilder(slots, raw_text).Build(tree);
}

}  // namespace staticss::css
