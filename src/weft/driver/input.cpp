#include "input.hpp"

#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "argparse/argparse.hpp"
#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/config/project_config.hpp"
#include "weft/image/module_image.hpp"

namespace weft::driver {

namespace fs = std::filesystem;

auto PreprocessArgs(std::span<char*> argv) -> std::vector<std::string> {
  std::vector<std::string> result;
  for (char* raw_arg : argv) {
    std::string_view arg = raw_arg;
    if (arg.size() > 2 && arg.starts_with("-L")) {
      result.emplace_back(arg.substr(0, 2));
      result.emplace_back(arg.substr(2));
    } else {
      result.emplace_back(arg);
    }
  }
  return result;
}

void AddModuleFlags(argparse::ArgumentParser& cmd, int& verbosity) {
  cmd.add_argument("module").help(
      std::format("Module image to process (*{})", image::kModuleExtension));
  cmd.add_argument("-L", "--search-path")
      .append()
      .help("Extra directory to search for referenced modules (repeatable)");
  cmd.add_argument("-v", "--verbose")
      .action([&verbosity](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Increase log verbosity (-v debug, -vv trace)");
}

void AddDebugFlag(argparse::ArgumentParser& cmd) {
  cmd.add_argument("-g", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Read and rewrite the companion symbol file");
}

auto LoadOptionalConfig() -> Result<std::optional<config::ProjectConfig>> {
  auto config_path = config::FindConfig();
  if (!config_path) {
    return std::nullopt;
  }
  spdlog::debug("using {}", config_path->string());
  auto config = config::LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(config.error());
  }
  return std::optional<config::ProjectConfig>(std::move(*config));
}

auto ToolDirectory() -> fs::path {
  std::error_code ec;
  fs::path exe_path = fs::read_symlink("/proc/self/exe", ec);
  if (ec) {
    spdlog::debug(
        "/proc/self/exe ({}); tool directory not searched", ec.message());
    return {};
  }
  return exe_path.parent_path();
}

auto BuildInput(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config) -> Result<WeaveInput> {
  WeaveInput input;
  input.module_path = fs::absolute(cmd.get<std::string>("module"));
  if (!fs::is_regular_file(input.module_path)) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "cannot open module '{}'", input.module_path.string())));
  }

  auto& options = input.options;
  options.tool_dir = ToolDirectory();

  if (config) {
    options.debug = config->debug;
    options.markers = config->markers;
    options.extra_search_paths = config->search_paths;
  }

  if (cmd.get<bool>("--debug")) {
    options.debug = true;
  }

  if (auto vals = cmd.present<std::vector<std::string>>("-L")) {
    for (const auto& dir : *vals) {
      options.extra_search_paths.push_back(fs::absolute(dir));
    }
  }

  return input;
}

}  // namespace weft::driver
