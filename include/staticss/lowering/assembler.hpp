#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "staticss/common/diagnostic/warning_sink.hpp"
#include "staticss/css/ir.hpp"
#include "staticss/lowering/adapter.hpp"
#include "staticss/lowering/condition.hpp"
#include "staticss/lowering/decision.hpp"
#include "staticss/lowering/style_value.hpp"
#include "staticss/lowering/styled_decl.hpp"

namespace staticss::lowering {

// Folds declarations and their decisions into a StyledDecl, in source order.
//
// Every Apply* call counts as one step; complementary guarded entries are
// only merged into a ternary when they were created in the same step or in
// two consecutive steps.
class Assembler {
 public:
  Assembler(StyledDecl* decl, Adapter* adapter, WarningSink* sink);

  // Declaration without interpolations.
  void ApplyStatic(const StyleScope& scope, const css::CssDeclaration& decl);

  // Declaration with one interpolated slot.
  void Apply(
      const StyleScope& scope, const css::CssDeclaration& decl,
      uint32_t slot_id, const LoweringDecision& decision);

  // Declaration whose slots all converted, one (slot id, decision) pair per
  // slot.
  void ApplyConverted(
      const StyleScope& scope, const css::CssDeclaration& decl,
      const std::vector<std::pair<uint32_t, ConvertDecision>>& converts);

  // Records a bail warning and moves the component to the bailed state.
  void Bail(const BailDecision& decision);
  // Bail not produced by the classifier (selectors, parse failures).
  void Bail(std::string_view category, std::string message);

  [[nodiscard]] auto Decl() const -> const StyledDecl& {
    return *decl_;
  }

 private:
  void BeginStep() {
    ++step_;
  }

  void ApplyVariant(const StyleScope& scope, const VariantDecision& decision);
  void ApplySplitVariants(
      const StyleScope& scope, const css::CssDeclaration& decl,
      const SplitVariantsDecision& decision);
  void ApplyMultiProp(
      const StyleScope& scope, const SplitMultiPropVariantsDecision& decision);
  void ApplyStyleFunction(
      const StyleScope& scope, const css::CssDeclaration& decl,
      uint32_t slot_id, const DynamicStyleFunctionDecision& decision);
  void ApplyStyleFunctionBlock(
      const StyleScope& scope, const StyleFunctionBlockDecision& decision);
  // One spec per longhand the prop reaches; other longhands go to the base.
  void AddStyleFunction(
      const StyleScope& scope, const DynamicStyleFunctionDecision& decision,
      std::string_view prefix, std::string_view suffix);

  void WriteBase(
      const StyleScope& scope, const std::string& prop, StyleValue value);
  void WriteBaseStyle(const StyleScope& scope, const StyleObject& style);

  // Merges `style` into the bucket for `when`, creating the bucket and its
  // key on first use. Returns the key, or nullopt if nothing was written.
  auto AddToBucket(
      const StyleScope& scope, const Condition& when, std::string_view hint,
      bool use_hint, const StyleObject& style) -> std::optional<std::string>;

  // Appends a guarded entry, or turns the previous entry into a ternary when
  // the two conditions are complementary.
  void PushGuardedEntry(const Condition& when, const std::string& key);

  auto UniqueKey(const std::string& base) const -> std::string;
  void AddImports(const std::vector<ImportSpec>& imports);
  auto ResolveCssVariable(std::string_view value)
      -> std::optional<ResolveResult>;
  auto SkipAfterBail(std::string_view what) const -> bool;

  StyledDecl* decl_;
  Adapter* adapter_;
  WarningSink* sink_;
  uint32_t step_ = 0;
};

// Warning category of a bail.
auto BailCategory(BailKind kind) -> std::string_view;

// Writes `value` for `prop` into `target` under `scope`:
//   base                -> target[prop] = value
//   :hover              -> target[prop] = { default: <prior>, ":hover": value }
//   ::before            -> target["::before"][prop] = value
//   :hover + @media (x) -> target[prop][":hover"]["@media (x)"] = value
void WriteScoped(
    StyleObject& target, const StyleScope& scope, const std::string& prop,
    StyleValue value);

}  // namespace staticss::lowering
