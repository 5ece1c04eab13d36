#pragma once

#include <memory>
#include <string>

#include "input.hpp"
#include "staticss/common/diagnostic/diagnostic.hpp"
#include "staticss/lowering/adapter.hpp"
#include "staticss/lowering/lower.hpp"
#include "run_log.hpp"

namespace staticss::driver {

// ConfigAdapter when a config is loaded, otherwise
// an adapter that declines everything.
auto MakeAdapter(const LoweringInput& input)
    -> std::unique_ptr<lowering::Adapter>;

// Maps the verbosity level onto the spdlog level.
void ConfigureLogging(int verbose);

// Scan and lower one source text, timing each phase.
auto LowerText(
    std::string text, lowering::Adapter& adapter, RunLog& run_log)
    -> Result<lowering::FileResult>;

}  // namespace staticss::driver
