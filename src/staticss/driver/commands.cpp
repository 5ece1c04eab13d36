#include "commands.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "argparse/argparse.hpp"
#include "input.hpp"
#include "pipeline.hpp"
#include "print.hpp"
#include "staticss/common/diagnostic/warning.hpp"
#include "staticss/config/project_config.hpp"
#include "staticss/lowering/dumper.hpp"
#include "run_log.hpp"

namespace staticss::driver {
namespace {

namespace fs = std::filesystem;

auto PrepareInput(const argparse::ArgumentParser& cmd)
    -> Result<LoweringInput> {
  auto config = LoadOptionalConfig(cmd);
  if (!config) {
    return std::unexpected(config.error());
  }
  return BuildInput(cmd, std::move(*config));
}

}  // namespace

auto DumpCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }
  ConfigureLogging(input->verbose);

  RunLog run_log(input->verbose);
  auto adapter = MakeAdapter(*input);
  lowering::Dumper dumper(&std::cout);

  int exit_code = 0;
  for (const auto& path : input->files) {
    run_log.BeginFile(path);
    auto text = ReadSourceFile(path);
    if (!text) {
      PrintDiagnostic(text.error());
      exit_code = 1;
      continue;
    }
    auto result = LowerText(*text, *adapter, run_log);
    if (!result) {
      PrintDiagnostic(result.error(), path, *text);
      exit_code = 1;
      continue;
    }
    run_log.EndFile(*result);
    if (input->files.size() > 1) {
      std::cout << fmt::format("// {}\n", path);
    }
    dumper.Dump(*result);
  }

  if (input->stats) {
    run_log.PrintStats();
  }
  return exit_code;
}

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }
  ConfigureLogging(input->verbose);

  RunLog run_log(input->verbose);
  auto adapter = MakeAdapter(*input);

  size_t warning_count = 0;
  size_t error_count = 0;
  bool any_bailed = false;
  for (const auto& path : input->files) {
    run_log.BeginFile(path);
    auto text = ReadSourceFile(path);
    if (!text) {
      PrintDiagnostic(text.error());
      ++error_count;
      continue;
    }
    auto result = LowerText(*text, *adapter, run_log);
    if (!result) {
      PrintDiagnostic(result.error(), path, *text);
      ++error_count;
      continue;
    }
    run_log.EndFile(*result);
    PrintWarnings(path, result->warnings);
    for (const auto& warning : result->warnings) {
      if (warning.severity == Severity::kError) {
        ++error_count;
      } else {
        ++warning_count;
      }
    }
    any_bailed = any_bailed || result->AnyBailed();
  }

  PrintSummary(warning_count, error_count);
  if (input->stats) {
    run_log.PrintStats();
  }
  return (any_bailed || error_count > 0) ? 1 : 0;
}

auto InitCommand(const argparse::ArgumentParser& cmd) -> int {
  bool force = cmd.get<bool>("--force");

  fs::path project_dir = fs::current_path();
  if (auto dir = cmd.present<std::string>("dir")) {
    project_dir = fs::path(*dir);
    if (project_dir.is_relative()) {
      project_dir = fs::current_path() / project_dir;
    }
  }
  std::string project_name = project_dir.filename().string();

  fs::path config_path = project_dir / config::kConfigFileName;
  if (fs::exists(config_path) && !force) {
    PrintError(
        fmt::format(
            "{} already exists (use --force to overwrite)",
            config::kConfigFileName));
    return 1;
  }

  std::error_code ec;
  fs::create_directories(project_dir, ec);
  if (ec) {
    PrintError(
        fmt::format(
            "cannot create directory '{}': {}", project_dir.string(),
            ec.message()));
    return 1;
  }

  std::ofstream toml_file(config_path);
  if (!toml_file) {
    PrintError(fmt::format("cannot write '{}'", config_path.string()));
    return 1;
  }
  toml_file << config::TemplateConfig(project_name);

  std::cout << fmt::format("Created {}\n", config_path.string());
  return 0;
}

}  // namespace staticss::driver
