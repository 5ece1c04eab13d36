#include "input.hpp"

#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "argparse/argparse.hpp"
#include "staticss/common/diagnostic/diagnostic.hpp"
#include "staticss/config/project_config.hpp"

namespace staticss::driver {

namespace fs = std::filesystem;

void AddLoweringFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--config")
      .metavar("PATH")
      .help("Configuration file (default: nearest staticss.toml)");
  cmd.add_argument("--no-project")
      .default_value(false)
      .implicit_value(true)
      .help("Ignore staticss.toml");
  cmd.add_argument("-v", "--verbose")
      .default_value(0)
      .scan<'i', int>()
      .metavar("LEVEL")
      .help("Verbosity level (0-3)");
  cmd.add_argument("--stats")
      .default_value(false)
      .implicit_value(true)
      .help("Print phase timings");
}

auto LoadOptionalConfig(const argparse::ArgumentParser& cmd)
    -> Result<std::optional<config::ProjectConfig>> {
  if (cmd.get<bool>("--no-project")) {
    return std::optional<config::ProjectConfig>{};
  }

  std::optional<fs::path> config_path;
  if (auto explicit_path = cmd.present<std::string>("--config")) {
    config_path = fs::path(*explicit_path);
    if (!fs::exists(*config_path)) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format("config file '{}' not found", *explicit_path)));
    }
  } else {
    config_path = config::FindConfig();
  }
  if (!config_path) {
    return std::optional<config::ProjectConfig>{};
  }

  auto loaded = config::LoadConfig(*config_path);
  if (!loaded) {
    return std::unexpected(loaded.error());
  }
  return std::optional<config::ProjectConfig>{std::move(*loaded)};
}

auto BuildInput(
    const argparse::ArgumentParser& cmd,
    std::optional<config::ProjectConfig> config) -> Result<LoweringInput> {
  LoweringInput input;

  // Files: CLI replaces config entirely
  if (auto files = cmd.present<std::vector<std::string>>("files")) {
    input.files = *files;
  } else if (config) {
    input.files = config->files;
  }
  if (input.files.empty()) {
    return std::unexpected(
        Diagnostic::HostError("no input files")
            .WithNote("pass files or list them under [sources] in "
                      "staticss.toml"));
  }

  input.verbose = cmd.get<int>("--verbose");
  if (input.verbose < 0 || input.verbose > 3) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "invalid verbosity level: {}, use 0-3", input.verbose)));
  }
  input.stats = cmd.get<bool>("--stats");
  input.config = std::move(config);
  return input;
}

auto ReadSourceFile(const std::string& path) -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("cannot open file '{}'", path)));
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

}  // namespace staticss::driver
