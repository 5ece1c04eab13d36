#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "staticss/common/diagnostic/warning.hpp"
#include "staticss/common/source_span.hpp"
#include "staticss/lowering/adapter.hpp"
#include "staticss/lowering/condition.hpp"
#include "staticss/lowering/style_value.hpp"

namespace staticss::lowering {

// Where a declaration lands inside the style object. `&:hover { ... }`
// gives pseudos {":hover"}; `@media (x) { ... }` gives at_rules {"@media (x)"}.
struct StyleScope {
  std::vector<std::string> pseudos;
  std::optional<std::string> pseudo_element;
  std::vector<std::string> at_rules;

  auto operator==(const StyleScope&) const -> bool = default;

  [[nodiscard]] auto IsBase() const -> bool {
    return pseudos.empty() && !pseudo_element && at_rules.empty();
  }
};

// Conditionally applied style fragment, keyed by its rendered condition.
struct VariantBucket {
  std::string when;
  Condition condition;
  StyleObject style;

  auto operator==(const VariantBucket&) const -> bool = default;
};

struct VariantStyleKey {
  std::string when;
  std::string key;

  auto operator==(const VariantStyleKey&) const -> bool = default;
};

// `outer ? A : inner ? B : C` over two independent props.
struct CompoundVariant {
  std::string outer_prop;
  std::string inner_prop;
  std::string outer_key;
  std::string inner_true_key;
  std::string inner_false_key;

  auto operator==(const CompoundVariant&) const -> bool = default;
};

// Style function computed from a prop at runtime:
//   buttonWidth: (width) => ({ width: `${width}px` })
struct StyleFnSpec {
  std::string name;
  std::string param_name;
  std::optional<std::string> fallback;
  std::string css_property;
  std::string style_prop;
  // "${value}" unless the declaration had static text around the slot.
  std::string value_template;
  StyleScope scope;

  auto operator==(const StyleFnSpec&) const -> bool = default;
};

enum class VariantEntryKind : uint8_t {
  kGuarded,   // when && styles.key
  kTernary,   // when ? styles.key : styles.false_key
  kCompound,  // outer ? outer_key : inner ? true_key : false_key
  kStyleFunction,
};

// One emitted conditional style reference, in emission order.
struct VariantEntry {
  VariantEntryKind kind = VariantEntryKind::kGuarded;
  std::string when;
  std::string key;
  std::string false_key;
  // Index of the apply call that created the entry.
  uint32_t created_at = 0;

  auto operator==(const VariantEntry&) const -> bool = default;
};

auto ToString(const VariantEntry& entry) -> std::string;

// Lowering state of one styled component. Mutated by the Assembler in
// source order; read-only afterwards.
struct StyledDecl {
  std::string local_name;
  // Intrinsic tag ("button") or wrapped component ("Link").
  std::string tag;
  bool wraps_component = false;
  std::string style_key;
  std::optional<Location> location;

  StyleObject style_obj;
  std::vector<VariantBucket> variant_buckets;
  std::vector<VariantStyleKey> variant_style_keys;
  std::vector<CompoundVariant> compound_variants;
  std::vector<StyleFnSpec> style_fn_specs;
  std::vector<VariantEntry> variant_entries;
  // Standalone expressions spread into the style list (css`` helpers).
  std::vector<std::string> mixins;
  std::vector<ImportSpec> imports;
  std::vector<Warning> warnings;
  bool bailed = false;

  [[nodiscard]] auto FindBucket(std::string_view when) const
      -> const VariantBucket*;
  auto FindBucket(std::string_view when) -> VariantBucket*;
  [[nodiscard]] auto KeyFor(std::string_view when) const
      -> std::optional<std::string>;
  [[nodiscard]] auto HasKey(std::string_view key) const -> bool;
  [[nodiscard]] auto FindStyleFn(std::string_view name) const
      -> const StyleFnSpec*;
};

}  // namespace staticss::lowering
