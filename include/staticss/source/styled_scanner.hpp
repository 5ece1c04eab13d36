#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "staticss/common/diagnostic/diagnostic.hpp"
#include "staticss/common/source_span.hpp"
#include "staticss/css/slot.hpp"
#include "staticss/js/arena.hpp"
#include "staticss/lowering/classifier.hpp"

namespace staticss::source {

// A `styled.x\`...\`` declaration with its template turned into CSS text.
struct StyledComponent {
  std::string local_name;
  std::string tag;
  bool wraps_component = false;
  Location location;
  // Template CSS with every `${...}` replaced by a placeholder.
  std::string css;
  std::vector<css::Slot> slots;
};

// Everything the lowering pass needs from one JS/TS source file.
struct ScannedFile {
  js::Arena arena;
  BufferId buffer = kInvalidBufferId;
  std::vector<StyledComponent> components;
  std::unordered_set<std::string> keyframes;
  std::unordered_set<std::string> css_helpers;
  std::vector<lowering::TernaryHelper> helpers;
  // Imported local name -> module source.
  std::unordered_map<std::string, std::string> imports;
};

// Scans `source` for styled components, keyframes, css helpers, ternary
// helpers and imports. Slot expressions are parsed into the file's arena; a
// slot whose expression does not parse keeps a null handle.
//
// Fails only if a styled template is not terminated.
auto ScanSource(std::string source) -> Result<ScannedFile>;

}  // namespace staticss::source
