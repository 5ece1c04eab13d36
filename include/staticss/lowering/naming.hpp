#pragma once

#include <string>
#include <string_view>

#include "staticss/lowering/condition.hpp"

namespace staticss::lowering {

inline constexpr std::string_view kCondTruthySuffix = "CondTruthy";

// PascalCase style-key suffix for a condition:
//   $isActive                 -> Active
//   user.settings.darkMode    -> UserSettingsDarkMode
//   size === "large"          -> SizeLarge
//   variant !== "primary"     -> VariantNotPrimary
//   user.role === Role.admin  -> UserRoleAdmin
//   isMobile || isTablet      -> MobileOrTablet
//   !isActive                 -> NotActive
// Comparisons against anything but a simple literal or dotted constant
// collapse to CondTruthy.
auto ToSuffix(const Condition& condition) -> std::string;

// Same rules over a prop name or when-string. Also accepts CSS custom
// property names (`--component-width` -> ComponentWidth).
auto ToSuffixFromProp(std::string_view prop) -> std::string;

// Removes consecutive duplicate PascalCase words, case-insensitively.
auto DedupeWords(std::string_view pascal) -> std::string;

// Name hints produced by the classifier that never name a key on their own.
auto IsGenericNameHint(std::string_view hint) -> bool;

// "x-large" -> "XLarge", "2xl" -> "Size2xl".
auto NameHintToSuffix(std::string_view hint) -> std::string;

// Base style key for a component: "PrimaryButton" -> "primaryButton".
auto ToStyleKey(std::string_view component_name) -> std::string;

}  // namespace staticss::lowering
