#pragma once

#include <argparse/argparse.hpp>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/config/project_config.hpp"
#include "weft/weaver/notification_weaver.hpp"

namespace weft::driver {

// Everything a command needs to run one weaving pass.
struct WeaveInput {
  std::filesystem::path module_path;
  weaver::WeaveOptions options;
};

// Split attached flag forms: -Ldir -> -L dir
auto PreprocessArgs(std::span<char*> argv) -> std::vector<std::string>;

// Add <module>, -L and -v to a subcommand. `verbosity` counts every -v.
void AddModuleFlags(argparse::ArgumentParser& cmd, int& verbosity);

// Add -g/--debug to a subcommand. Every subcommand that calls BuildInput
// must have it.
void AddDebugFlag(argparse::ArgumentParser& cmd);

// Load weft.toml if one is found from the current directory upward.
auto LoadOptionalConfig() -> Result<std::optional<config::ProjectConfig>>;

// Directory of the running executable, empty if it cannot be determined.
auto ToolDirectory() -> std::filesystem::path;

// Merge CLI arguments and optional config into a WeaveInput.
// Scalars: CLI overrides config. Search paths: config first, then CLI.
auto BuildInput(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config) -> Result<WeaveInput>;

}  // namespace weft::driver
