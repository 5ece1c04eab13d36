#include "staticss/lowering/styled_decl.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace staticss::lowering {

auto ToString(const VariantEntry& entry) -> std::string {
  switch (entry.kind) {
    case VariantEntryKind::kGuarded:
      return fmt::format("{} && {}", entry.when, entry.key);
    case VariantEntryKind::kTernary:
    case VariantEntryKind::kCompound:
      return fmt::format(
          "{} ? {} : {}", entry.when, entry.key, entry.false_key);
    case VariantEntryKind::kStyleFunction:
      return fmt::format("{}({})", entry.key, entry.when);
  }
  return {};
}

auto StyledDecl::FindBucket(std::string_view when) const
    -> const VariantBucket* {
  for (const auto& bucket : variant_buckets) {
    if (bucket.when == when) {
      return &bucket;
    }
  }
  return nullptr;
}

auto StyledDecl::FindBucket(std::string_view when) -> VariantBucket* {
  for (auto& bucket : variant_buckets) {
    if (bucket.when == when) {
      return &bucket;
    }
  }
  return nullptr;
}

auto StyledDecl::KeyFor(std::string_view when) const
    -> std::optional<std::string> {
  for (const auto& entry : variant_style_keys) {
    if (entry.when == when) {
      return entry.key;
    }
  }
  return std::nullopt;
}

auto StyledDecl::HasKey(std::string_view key) const -> bool {
  if (key == style_key) {
    return true;
  }
  for (const auto& entry : variant_style_keys) {
    if (entry.key == key) {
      return true;
    }
  }
  for (const auto& spec : style_fn_specs) {
    if (spec.name == key) {
      return true;
    }
  }
  return false;
}

auto StyledDecl::FindStyleFn(std::string_view name) const
    -> const StyleFnSpec* {
  for (const auto& spec : style_fn_specs) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

}  // namespace staticss::lowering
