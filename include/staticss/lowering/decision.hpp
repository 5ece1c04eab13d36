#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "staticss/lowering/adapter.hpp"
#include "staticss/lowering/condition.hpp"
#include "staticss/lowering/style_value.hpp"

namespace staticss::lowering {

enum class DynamicKind : uint8_t {
  kDeclarationValue,
  kSelector,
  kAtRuleParams,
};

// Placement of one slot, derived per classification.
struct DynamicContext {
  DynamicKind kind = DynamicKind::kDeclarationValue;
  // CSS property as written; empty for standalone blocks.
  std::string property;
  std::string selector;
  std::vector<std::string> at_rule_stack;
  bool is_full_value = false;
  // Static text around the slot when it is the declaration's only slot.
  std::string value_prefix;
  std::string value_suffix;
};

// The slot is replaced by `expr` inline.
struct ConvertDecision {
  std::string expr;
  std::vector<ImportSpec> imports;
  // Set when the expression is a literal whose CSS text is known.
  std::optional<std::string> static_text;
  bool keyframes_reference = false;

  auto operator==(const ConvertDecision&) const -> bool = default;
};

// Single boolean-gated fragment.
struct VariantDecision {
  std::string prop_name;
  Condition when;
  StyleObject style;

  auto operator==(const VariantDecision&) const -> bool = default;
};

struct VariantBranch {
  std::string name_hint;
  // Absent when the test had no recognizable shape; the assembler then
  // falls back to the opaque test source.
  std::optional<Condition> when;
  StyleObject style;

  auto operator==(const VariantBranch&) const -> bool = default;
};

struct SplitVariantsDecision {
  std::vector<VariantBranch> branches;
  // Test, rewritten into prop namespace, for branches without a `when`.
  std::string opaque_test;
  // Branches came from a same-prop ternary chain.
  bool multi_branch = false;

  auto operator==(const SplitVariantsDecision&) const -> bool = default;
};

// `outer ? A : inner ? B : C`
struct SplitMultiPropVariantsDecision {
  std::string outer_prop;
  std::string inner_prop;
  StyleObject outer_true;
  StyleObject inner_true;
  StyleObject inner_false;

  auto operator==(const SplitMultiPropVariantsDecision&) const -> bool =
      default;
};

// Value is computed at runtime from a prop.
struct DynamicStyleFunctionDecision {
  std::string param_name;
  std::optional<std::string> fallback;
  // CSS property the function sets.
  std::string original_prop_name;
  // Static text around the prop inside a template literal body:
  // `${p.$w}px` gives value_suffix "px".
  std::string value_prefix;
  std::string value_suffix;

  auto operator==(const DynamicStyleFunctionDecision&) const -> bool =
      default;
};

// `${p => `width: ${p.$w}; color: red;`}` in standalone position: one style
// function per declaration that reads a prop, the rest goes to the base.
struct StyleFunctionBlockDecision {
  StyleObject static_style;
  std::vector<DynamicStyleFunctionDecision> functions;

  auto operator==(const StyleFunctionBlockDecision&) const -> bool = default;
};

enum class BailKind : uint8_t {
  kUnsupported,
  kUnparseable,
  kHeterogeneous,
  kParseError,
};

struct BailDecision {
  BailKind kind = BailKind::kUnsupported;
  std::string reason;

  auto operator==(const BailDecision&) const -> bool = default;
};

using LoweringDecision = std::variant<
    ConvertDecision, VariantDecision, SplitVariantsDecision,
    SplitMultiPropVariantsDecision, DynamicStyleFunctionDecision,
    StyleFunctionBlockDecision, BailDecision>;

inline auto Bail(std::string reason, BailKind kind = BailKind::kUnsupported)
    -> LoweringDecision {
  return BailDecision{.kind = kind, .reason = std::move(reason)};
}

auto DescribeDecision(const LoweringDecision& decision) -> std::string;

}  // namespace staticss::lowering
