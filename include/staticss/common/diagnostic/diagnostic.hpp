#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "staticss/common/source_span.hpp"

namespace staticss {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Malformed input (template, expression)
  kHostError,  // I/O, malformed configuration
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

struct DiagItem {
  DiagKind kind;
  std::optional<SourceSpan> span;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Host-level failure returned from parsers and config loading. Lowering
// outcomes are reported as Warnings instead.
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto Error(SourceSpan span, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError, .span = span, .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = std::nullopt,
             .message = std::move(msg)},
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = std::nullopt,
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace staticss
