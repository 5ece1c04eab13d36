#pragma once

#include <argparse/argparse.hpp>

namespace staticss::driver {

auto DumpCommand(const argparse::ArgumentParser& cmd) -> int;
auto CheckCommand(const argparse::ArgumentParser& cmd) -> int;
auto InitCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace staticss::driver
