#include "tests/framework/assertions.hpp"

#include <algorithm>
#include <cstddef>
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

#include "staticss/common/diagnostic/warning.hpp"
#include "staticss/lowering/style_value.hpp"
#include "staticss/lowering/styled_decl.hpp"
#include "tests/framework/fixture_case.hpp"

namespace staticss::test {
namespace {

// Maximum characters to show in error messages to avoid CI log explosion
constexpr size_t kMaxOutputDisplay = 2048;

// Truncate string for display, showing first/last portions if too long
auto TruncateForDisplay(const std::string& str) -> std::string {
  if (str.size() <= kMaxOutputDisplay) {
    return str;
  }
  constexpr size_t kHalfSize = (kMaxOutputDisplay / 2) - 20;
  return str.substr(0, kHalfSize) + "\n... [" +
         std::to_string(str.size() - kMaxOutputDisplay) +
         " bytes truncated] ...\n" + str.substr(str.size() - kHalfSize);
}

auto Join(const std::vector<std::string>& items) -> std::string {
  std::string out = "[";
  for (const auto& item : items) {
    out += out.size() > 1 ? ", " + item : item;
  }
  return out + "]";
}

void AssertList(
    const std::vector<std::string>& actual,
    const std::vector<std::string>& expected, std::string_view context) {
  EXPECT_EQ(actual, expected)
      << context << "\nActual: " << Join(actual)
      << "\nExpected: " << Join(expected);
}

}  // namespace

auto NormalizeNewlines(std::string input) -> std::string {
  std::erase(input, '\r');
  return input;
}

void AssertOutput(const std::string& actual, const ExpectedOutput& expected) {
  if (expected.IsExact()) {
    EXPECT_EQ(actual, NormalizeNewlines(expected.exact.value()));
  } else {
    for (const auto& substring : expected.contains) {
      EXPECT_TRUE(actual.find(substring) != std::string::npos)
          << "Output should contain: \"" << substring << "\"\n"
          << "Actual (" << actual.size() << " bytes): \""
          << TruncateForDisplay(actual) << "\"";
    }
  }
  for (const auto& substring : expected.not_contains) {
    EXPECT_TRUE(actual.find(substring) == std::string::npos)
        << "Output should NOT contain: \"" << substring << "\"\n"
        << "Actual (" << actual.size() << " bytes): \""
        << TruncateForDisplay(actual) << "\"";
  }
}

void AssertComponent(
    const lowering::StyledDecl& actual, const ExpectedComponent& expected) {
  const std::string& name = actual.local_name;
  if (expected.bailed) {
    EXPECT_EQ(actual.bailed, *expected.bailed) << name << ": bailed";
  }
  if (expected.tag) {
    EXPECT_EQ(actual.tag, *expected.tag) << name << ": tag";
  }
  if (expected.base) {
    EXPECT_EQ(lowering::ToString(actual.style_obj), *expected.base)
        << name << ": base style";
  }
  for (const auto& [when, style] : expected.buckets) {
    const auto* bucket = actual.FindBucket(when);
    if (bucket == nullptr) {
      ADD_FAILURE() << name << ": no bucket for '" << when << "'";
      continue;
    }
    EXPECT_EQ(lowering::ToString(bucket->style), style)
        << name << ": bucket '" << when << "'";
  }
  for (const auto& [when, key] : expected.keys) {
    EXPECT_EQ(actual.KeyFor(when).value_or("<none>"), key)
        << name << ": key for '" << when << "'";
  }
  if (expected.entries) {
    std::vector<std::string> entries;
    for (const auto& entry : actual.variant_entries) {
      entries.push_back(lowering::ToString(entry));
    }
    AssertList(entries, *expected.entries, name + ": entries");
  }
  if (expected.style_functions) {
    std::vector<std::string> functions;
    for (const auto& spec : actual.style_fn_specs) {
      functions.push_back(
          spec.name + "(" + spec.param_name + ") -> " + spec.style_prop +
          ": `" + spec.value_template + "`");
    }
    AssertList(functions, *expected.style_functions, name + ": functions");
  }
  if (expected.mixins) {
    AssertList(actual.mixins, *expected.mixins, name + ": mixins");
  }
  if (expected.imports) {
    std::vector<std::string> imports;
    for (const auto& spec : actual.imports) {
      for (const auto& imported : spec.names) {
        imports.push_back(imported + " from " + spec.from);
      }
    }
    AssertList(imports, *expected.imports, name + ": imports");
  }
  if (expected.warnings) {
    AssertWarningCategories(actual.warnings, *expected.warnings, name);
  }
}

void AssertWarningCategories(
    const std::vector<Warning>& actual, const std::vector<std::string>& expected,
    const std::string& context) {
  std::vector<std::string> categories;
  categories.reserve(actual.size());
  for (const auto& warning : actual) {
    categories.push_back(warning.category);
  }
  AssertList(categories, expected, context + ": warnings");
}

}  // namespace staticss::test
