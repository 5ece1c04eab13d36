#include "staticss/lowering/naming.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "staticss/common/string_utils.hpp"
#include "staticss/lowering/condition.hpp"

namespace staticss::lowering {

namespace {

auto IsUpper(char c) -> bool {
  return std::isupper(static_cast<unsigned char>(c)) != 0;
}

auto StripDollar(std::string_view s) -> std::string_view {
  if (s.starts_with('$')) {
    s.remove_prefix(1);
  }
  return s;
}

// "config.enabled" -> "ConfigEnabled"; undotted text is returned as is.
auto DottedToPascal(std::string_view s) -> std::string {
  if (s.find('.') == std::string_view::npos) {
    return std::string(s);
  }
  std::string out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t dot = s.find('.', start);
    if (dot == std::string_view::npos) {
      dot = s.size();
    }
    out += common::Capitalize(s.substr(start, dot - start));
    start = dot + 1;
  }
  return out;
}

auto PropSuffix(std::string_view path) -> std::string {
  auto raw = StripDollar(path);
  if (raw.empty()) {
    return "Variant";
  }
  auto pascal = DottedToPascal(raw);
  if (pascal.size() > 2 && pascal.starts_with("is") && IsUpper(pascal[2])) {
    return pascal.substr(2);
  }
  return common::Capitalize(pascal);
}

auto IsSimpleRhs(std::string_view rhs) -> bool {
  return common::IsIdentifier(rhs) || common::IsNumeric(rhs);
}

auto EqualitySuffix(const Condition& condition) -> std::string {
  bool negated = condition.op == EqualityOp::kStrictNotEqual ||
                 condition.op == EqualityOp::kNotEqual;
  std::string rhs;
  switch (condition.rhs.kind) {
    case OperandKind::kProp:
      return std::string(kCondTruthySuffix);
    case OperandKind::kPath:
      rhs = DottedToPascal(condition.rhs.text);
      break;
    case OperandKind::kOther: {
      auto text = common::Trim(condition.rhs.text);
      if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'')) {
        text = text.substr(1, text.size() - 2);
      }
      rhs = std::string(text);
      break;
    }
    default:
      rhs = condition.rhs.text;
      break;
  }
  if (!rhs.empty() && !IsSimpleRhs(rhs)) {
    return std::string(kCondTruthySuffix);
  }
  if (rhs.empty()) {
    rhs = negated ? "NotMatch" : "Match";
  }
  if (condition.rhs.kind == OperandKind::kNumber) {
    std::string identifier;
    for (char c : rhs) {
      identifier += c == '-' ? std::string("Neg")
                  : c == '.' ? std::string("_")
                             : std::string(1, c);
    }
    rhs = std::move(identifier);
  }
  auto lhs = common::Capitalize(DottedToPascal(StripDollar(condition.path)));
  if (lhs.empty()) {
    lhs = "Variant";
  }
  auto combined = negated ? lhs + "Not" + common::Capitalize(rhs)
                          : lhs + common::Capitalize(rhs);
  return DedupeWords(combined);
}

}  // namespace

auto DedupeWords(std::string_view pascal) -> std::string {
  std::vector<std::string_view> words;
  size_t start = 0;
  for (size_t i = 1; i <= pascal.size(); ++i) {
    if (i == pascal.size() || IsUpper(pascal[i])) {
      words.push_back(pascal.substr(start, i - start));
      start = i;
    }
  }
  std::string out;
  std::string_view last;
  for (auto word : words) {
    if (word.empty()) {
      continue;
    }
    if (!last.empty() &&
        common::ToLowerAscii(last) == common::ToLowerAscii(word)) {
      continue;
    }
    out += word;
    last = word;
  }
  return out;
}

auto ToSuffix(const Condition& condition) -> std::string {
  switch (condition.kind) {
    case ConditionKind::kProp:
      return PropSuffix(condition.path);
    case ConditionKind::kNot:
      return "Not" + ToSuffix(condition.operands.front());
    case ConditionKind::kAnd:
    case ConditionKind::kOr: {
      std::string out;
      for (const auto& operand : condition.operands) {
        auto part = ToSuffix(operand);
        if (part == kCondTruthySuffix) {
          return std::string(kCondTruthySuffix);
        }
        if (!out.empty() && condition.kind == ConditionKind::kOr) {
          out += "Or";
        }
        out += part;
      }
      return out;
    }
    case ConditionKind::kEquality:
      return EqualitySuffix(condition);
    case ConditionKind::kOpaque:
      return std::string(kCondTruthySuffix);
  }
  return std::string(kCondTruthySuffix);
}

auto ToSuffixFromProp(std::string_view prop) -> std::string {
  auto raw = StripDollar(common::Trim(prop));
  if (raw.empty()) {
    return "Variant";
  }
  if (raw.starts_with("--")) {
    std::string out;
    for (const auto& part : common::SplitTopLevel(raw.substr(2), '-')) {
      out += common::Capitalize(part);
    }
    return out.empty() ? "Var" : out;
  }
  if (auto condition = ParseCondition(raw)) {
    return ToSuffix(*condition);
  }
  return std::string(kCondTruthySuffix);
}

auto IsGenericNameHint(std::string_view hint) -> bool {
  return hint.empty() || hint == "truthy" || hint == "falsy" ||
         hint == "default" || hint == "match";
}

auto NameHintToSuffix(std::string_view hint) -> std::string {
  std::string out;
  bool upper_next = true;
  for (char c : hint) {
    if (!common::IsIdentifierChar(c) || c == '$' || c == '_') {
      upper_next = true;
      continue;
    }
    out += upper_next ? static_cast<char>(
                            std::toupper(static_cast<unsigned char>(c)))
                      : c;
    upper_next = false;
  }
  if (out.empty()) {
    return "Variant";
  }
  if (std::isdigit(static_cast<unsigned char>(out.front())) != 0) {
    return "Size" + out;
  }
  return out;
}

auto ToStyleKey(std::string_view component_name) -> std::string {
  auto key = common::LowerFirst(StripDollar(component_name));
  return key.empty() ? "root" : key;
}

}  // namespace staticss::lowering
