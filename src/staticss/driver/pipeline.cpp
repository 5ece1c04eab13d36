#include "pipeline.hpp"

#include <expected>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "staticss/config/config_adapter.hpp"
#include "staticss/lowering/adapter.hpp"
#include "staticss/lowering/lower.hpp"
#include "staticss/source/styled_scanner.hpp"
#include "run_log.hpp"

namespace staticss::driver {

auto MakeAdapter(const LoweringInput& input)
    -> std::unique_ptr<lowering::Adapter> {
  if (input.config) {
    return std::make_unique<config::ConfigAdapter>(input.config->adapter);
  }
  return std::make_unique<lowering::NullAdapter>();
}

void ConfigureLogging(int verbose) {
  switch (verbose) {
    case 0:
    case 1:
      spdlog::set_level(spdlog::level::warn);
      break;
    case 2:
      spdlog::set_level(spdlog::level::debug);
      break;
    default:
      spdlog::set_level(spdlog::level::trace);
      break;
  }
}

auto LowerText(
    std::string text, lowering::Adapter& adapter, RunLog& run_log)
    -> Result<lowering::FileResult> {
  auto scanned = [&] {
    ScopedPhase phase(run_log, "scan");
    return source::ScanSource(std::move(text));
  }();
  if (!scanned) {
    return std::unexpected(scanned.error());
  }

  ScopedPhase phase(run_log, "lower");
  return lowering::LowerFile(*scanned, adapter);
}

}  // namespace staticss::driver
