#include <argparse/argparse.hpp>
#include <exception>
#include <iostream>

#include "commands.hpp"
#include "input.hpp"
#include "print.hpp"

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("staticss", "0.1.0");
  program.add_description(
      "Lower styled-components templates to static style objects");

  // Subcommand: dump
  argparse::ArgumentParser dump_cmd("dump");
  dump_cmd.add_description("Print the lowered form of every component");
  staticss::driver::AddLoweringFlags(dump_cmd);
  dump_cmd.add_argument("files").remaining().help(
      "Source files (uses staticss.toml if not specified)");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description(
      "Report warnings; fails when any component cannot be lowered");
  staticss::driver::AddLoweringFlags(check_cmd);
  check_cmd.add_argument("files").remaining().help(
      "Source files (uses staticss.toml if not specified)");

  // Subcommand: init
  argparse::ArgumentParser init_cmd("init");
  init_cmd.add_description("Write a template staticss.toml");
  init_cmd.add_argument("dir").nargs(0, 1).help(
      "Project directory (default: current directory)");
  init_cmd.add_argument("--force", "-f")
      .default_value(false)
      .implicit_value(true)
      .help("Overwrite existing staticss.toml");

  program.add_subparser(dump_cmd);
  program.add_subparser(check_cmd);
  program.add_subparser(init_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    staticss::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  if (program.is_subcommand_used("dump")) {
    return staticss::driver::DumpCommand(dump_cmd);
  }

  if (program.is_subcommand_used("check")) {
    return staticss::driver::CheckCommand(check_cmd);
  }

  if (program.is_subcommand_used("init")) {
    return staticss::driver::InitCommand(init_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
