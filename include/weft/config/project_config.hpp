#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/weaver/markers.hpp"

namespace weft::config {

inline constexpr const char* kConfigFileName = "weft.toml";

struct ProjectConfig {
  bool debug = false;
  // Absolute, resolved against root_dir.
  std::vector<std::filesystem::path> search_paths;
  weaver::MarkerNames markers;

  // Directory where weft.toml was found
  std::filesystem::path root_dir;
};

// Search for weft.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse weft.toml. Every key is optional; wrongly typed values are errors.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

}  // namespace weft::config
