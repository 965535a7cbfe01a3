#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <span>
#include <cstddef>
#include <string>
#include <system_error>

#include "commands.hpp"
#include "input.hpp"
#include "logging.hpp"
#include "print.hpp"
#include "weft/common/internal_error.hpp"

namespace fs = std::filesystem;

auto main(int argc, char* argv[]) -> int {
  auto args = weft::driver::PreprocessArgs(
      std::span<char*>(argv, static_cast<size_t>(argc)));
  int verbosity = 0;

  argparse::ArgumentParser program("weft", "0.1.0");
  program.add_description(
      "Inject change-notification calls into property setters of compiled "
      "modules");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: weave
  argparse::ArgumentParser weave_cmd("weave");
  weave_cmd.add_description("Weave a module image in place");
  weft::driver::AddModuleFlags(weave_cmd, verbosity);
  weft::driver::AddDebugFlag(weave_cmd);

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description(
      "Report what would be woven without writing anything");
  weft::driver::AddModuleFlags(check_cmd, verbosity);
  weft::driver::AddDebugFlag(check_cmd);

  // Subcommand: dump
  argparse::ArgumentParser dump_cmd("dump");
  dump_cmd.add_description("Print a module listing (for debugging)");
  weft::driver::AddModuleFlags(dump_cmd, verbosity);
  weft::driver::AddDebugFlag(dump_cmd);

  program.add_subparser(weave_cmd);
  program.add_subparser(check_cmd);
  program.add_subparser(dump_cmd);

  try {
    program.parse_args(args);
  } catch (const std::exception& err) {
    weft::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      weft::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  weft::driver::SetupLogging(verbosity);

  try {
    if (program.is_subcommand_used("weave")) {
      return weft::driver::WeaveCommand(weave_cmd);
    }

    if (program.is_subcommand_used("check")) {
      return weft::driver::CheckCommand(check_cmd);
    }

    if (program.is_subcommand_used("dump")) {
      return weft::driver::DumpCommand(dump_cmd);
    }
  } catch (const weft::common::InternalError& e) {
    weft::driver::PrintError(e.what());
    return 1;
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
