#pragma once

#include <argparse/argparse.hpp>
#include <optional>
#include <string>
#include <vector>

#include "staticss/common/diagnostic/diagnostic.hpp"
#include "staticss/config/project_config.hpp"

namespace staticss::driver {

struct LoweringInput {
  std::vector<std::string> files;
  std::optional<config::ProjectConfig> config;
  int verbose = 0;  // Verbosity level (0-3)
  bool stats = false;
};

// Add --config, --no-project, -v and --stats to a subcommand.
void AddLoweringFlags(argparse::ArgumentParser& cmd);

// staticss.toml from --config, else the nearest one above the working
// directory. nullopt with --no-project or when none exists.
auto LoadOptionalConfig(const argparse::ArgumentParser& cmd)
    -> Result<std::optional<config::ProjectConfig>>;

// Merge CLI arguments and optional config into a LoweringInput.
auto BuildInput(
    const argparse::ArgumentParser& cmd,
    std::optional<config::ProjectConfig> config) -> Result<LoweringInput>;

// Whole file contents, or a host error naming the path.
auto ReadSourceFile(const std::string& path) -> Result<std::string>;

}  // namespace staticss::driver
