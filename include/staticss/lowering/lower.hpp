#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "staticss/common/diagnostic/diagnostic.hpp"
#include "staticss/common/diagnostic/warning.hpp"
#include "staticss/lowering/adapter.hpp"
#include "staticss/lowering/styled_decl.hpp"
#include "staticss/source/styled_scanner.hpp"

namespace staticss::lowering {

struct FileResult {
  std::vector<StyledDecl> components;
  // Every warning of the file, in reporting order.
  std::vector<Warning> warnings;

  [[nodiscard]] auto Find(std::string_view local_name) const
      -> const StyledDecl*;
  [[nodiscard]] auto AnyBailed() const -> bool;
};

// Maps a resolved rule selector onto a style scope. Returns nullopt for
// selectors with no static equivalent (descendants, siblings, attributes).
auto MapSelectorScope(std::string_view selector)
    -> std::optional<StyleScope>;

// Lowers every styled component of a scanned file. Components are
// independent; a bail in one never affects another.
auto LowerFile(const source::ScannedFile& file, Adapter& adapter)
    -> FileResult;

// Scans and lowers `source`.
auto LowerSource(std::string source, Adapter& adapter) -> Result<FileResult>;

}  // namespace staticss::lowering
