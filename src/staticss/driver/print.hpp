#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "staticss/common/diagnostic/diagnostic.hpp"
#include "staticss/common/diagnostic/warning.hpp"

namespace staticss::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
// `text` is the buffer the diagnostic's span points into, if any.
void PrintDiagnostic(
    const Diagnostic& diag, const std::string& path = "",
    std::string_view text = {});

// Prints `path:line:col: severity[category]: message` per warning.
void PrintWarnings(
    const std::string& path, const std::vector<Warning>& warnings);

// "N warnings and M errors generated." Nothing when both are zero.
void PrintSummary(size_t warning_count, size_t error_count);

}  // namespace staticss::driver
