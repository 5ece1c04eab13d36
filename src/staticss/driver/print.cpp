#include "print.hpp"

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "staticss/common/diagnostic/diagnostic.hpp"
#include "staticss/common/diagnostic/warning.hpp"
#include "staticss/common/source_span.hpp"

namespace staticss::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

auto SeverityStyle(Severity severity) -> fmt::text_style {
  if (severity == Severity::kError) {
    return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
}

void PrintDiagItem(
    const DiagItem& item, const std::string& path, std::string_view text) {
  std::string prefix = path.empty() ? "staticss" : path;
  if (item.span && !path.empty() && !text.empty()) {
    prefix = FormatLocation(path, LineIndex(text).Locate(item.span->begin));
  }
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled(prefix, kToolStyle),
      fmt::styled(DiagKindToString(item.kind), DiagKindToStyle(item.kind)),
      fmt::styled(item.message, fmt::emphasis::bold));
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("staticss", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("staticss", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(
    const Diagnostic& diag, const std::string& path, std::string_view text) {
  PrintDiagItem(diag.primary, path, text);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, path, text);
  }
}

void PrintWarnings(
    const std::string& path, const std::vector<Warning>& warnings) {
  for (const auto& warning : warnings) {
    std::string where = warning.location
                            ? FormatLocation(path, *warning.location)
                            : path;
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled(where, kToolStyle),
        fmt::styled(
            fmt::format(
                "{}[{}]:", ToString(warning.severity), warning.category),
            SeverityStyle(warning.severity)),
        fmt::styled(warning.message, fmt::emphasis::bold));
    for (const auto& [key, value] : warning.context) {
      fmt::print(
          stderr, "  {} {}: {}\n",
          fmt::styled("note:", DiagKindToStyle(DiagKind::kNote)), key, value);
    }
  }
}

void PrintSummary(size_t warning_count, size_t error_count) {
  if (warning_count == 0 && error_count == 0) {
    return;
  }
  fmt::print(
      stderr, "{} warning{} and {} error{} generated.\n", warning_count,
      warning_count == 1 ? "" : "s", error_count, error_count == 1 ? "" : "s");
}

}  // namespace staticss::driver
