#include "staticss/lowering/style_value.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "staticss/common/string_utils.hpp"

namespace staticss::lowering {

namespace {

auto FormatKey(std::string_view key) -> std::string {
  if (common::IsIdentifier(key)) {
    return std::string(key);
  }
  return fmt::format("\"{}\"", common::EscapeForJsString(key));
}

}  // namespace

auto StyleObject::Find(std::string_view key) const -> const StyleValue* {
  for (const auto& entry : entries_) {
    if (entry.key == key) {
      return &entry.value;
    }
  }
  return nullptr;
}

auto StyleObject::Find(std::string_view key) -> StyleValue* {
  for (auto& entry : entries_) {
    if (entry.key == key) {
      return &entry.value;
    }
  }
  return nullptr;
}

void StyleObject::Set(std::string_view key, StyleValue value) {
  if (auto* existing = Find(key)) {
    *existing = std::move(value);
    return;
  }
  entries_.push_back(
      StyleEntry{.key = std::string(key), .value = std::move(value)});
}

auto StyleObject::Erase(std::string_view key) -> bool {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const auto& e) {
    return e.key == key;
  });
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

void StyleObject::Merge(const StyleObject& other) {
  for (const auto& entry : other.entries_) {
    auto* existing = Find(entry.key);
    if (existing != nullptr && existing->IsObject() && entry.value.IsObject()) {
      existing->object.Merge(entry.value.object);
      continue;
    }
    Set(entry.key, entry.value);
  }
}

auto StyleObject::Keys() const -> std::vector<std::string> {
  std::vector<std::string> keys;
  keys.reserve(entries_.size());
  for (const auto& entry : entries_) {
    keys.push_back(entry.key);
  }
  return keys;
}

auto StyleObject::operator==(const StyleObject& other) const -> bool {
  return entries_ == other.entries_;
}

auto StyleValue::Null() -> StyleValue {
  return StyleValue{};
}

auto StyleValue::String(std::string text) -> StyleValue {
  return StyleValue{
      .kind = StyleValueKind::kString, .text = std::move(text), .object = {}};
}

auto StyleValue::Number(std::string raw) -> StyleValue {
  return StyleValue{
      .kind = StyleValueKind::kNumber, .text = std::move(raw), .object = {}};
}

auto StyleValue::Expression(std::string source) -> StyleValue {
  return StyleValue{
      .kind = StyleValueKind::kExpression,
      .text = std::move(source),
      .object = {}};
}

auto StyleValue::Object(StyleObject object) -> StyleValue {
  return StyleValue{
      .kind = StyleValueKind::kObject, .text = {}, .object = std::move(object)};
}

auto StyleValue::operator==(const StyleValue& other) const -> bool {
  return kind == other.kind && text == other.text && object == other.object;
}

auto StyleEntry::operator==(const StyleEntry& other) const -> bool {
  return key == other.key && value == other.value;
}

auto ToString(const StyleValue& value) -> std::string {
  switch (value.kind) {
    case StyleValueKind::kNull:
      return "null";
    case StyleValueKind::kString:
      return fmt::format("\"{}\"", common::EscapeForJsString(value.text));
    case StyleValueKind::kNumber:
    case StyleValueKind::kExpression:
      return value.text;
    case StyleValueKind::kObject:
      return ToString(value.object);
  }
  return "null";
}

auto ToString(const StyleObject& object) -> std::string {
  if (object.Empty()) {
    return "{}";
  }
  std::string out = "{ ";
  bool first = true;
  for (const auto& entry : object.Entries()) {
    if (!first) {
      out += ", ";
    }
    first = false;
    out += fmt::format("{}: {}", FormatKey(entry.key), ToString(entry.value));
  }
  out += " }";
  return out;
}

}  // namespace staticss::lowering
