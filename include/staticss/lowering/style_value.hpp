#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace staticss::lowering {

struct StyleEntry;
struct StyleValue;

// Insertion-ordered property -> value map. Overwriting a key keeps its
// original position.
class StyleObject {
 public:
  [[nodiscard]] auto Find(std::string_view key) const -> const StyleValue*;
  auto Find(std::string_view key) -> StyleValue*;

  void Set(std::string_view key, StyleValue value);
  auto Erase(std::string_view key) -> bool;

  // Copies every entry of `other` into this map. Nested objects merge
  // recursively; anything else overwrites.
  void Merge(const StyleObject& other);

  [[nodiscard]] auto Entries() const -> const std::vector<StyleEntry>& {
    return entries_;
  }
  [[nodiscard]] auto Keys() const -> std::vector<std::string>;
  [[nodiscard]] auto Empty() const -> bool {
    return entries_.empty();
  }
  [[nodiscard]] auto Size() const -> size_t {
    return entries_.size();
  }

  auto operator==(const StyleObject& other) const -> bool;

 private:
  std::vector<StyleEntry> entries_;
};

enum class StyleValueKind : uint8_t {
  kNull,
  kString,
  kNumber,
  kExpression,
  kObject,
};

struct StyleValue {
  StyleValueKind kind = StyleValueKind::kNull;
  // kString: CSS text; kNumber: raw number; kExpression: JS source.
  std::string text;
  StyleObject object;

  static auto Null() -> StyleValue;
  static auto String(std::string text) -> StyleValue;
  static auto Number(std::string raw) -> StyleValue;
  static auto Expression(std::string source) -> StyleValue;
  static auto Object(StyleObject object) -> StyleValue;

  [[nodiscard]] auto IsObject() const -> bool {
    return kind == StyleValueKind::kObject;
  }

  auto operator==(const StyleValue& other) const -> bool;
};

struct StyleEntry {
  std::string key;
  StyleValue value;

  auto operator==(const StyleEntry& other) const -> bool;
};

// JS-like rendering: strings quoted, objects as `{ a: "x", ":hover": 1 }`.
auto ToString(const StyleValue& value) -> std::string;
auto ToString(const StyleObject& object) -> std::string;

}  // namespace staticss::lowering
