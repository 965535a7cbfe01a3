#include "weft/config/project_config.hpp"

#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>

#include "weft/common/diagnostic/diagnostic.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace weft::config {

namespace fs = std::filesystem;

namespace {

auto WrongType(const fs::path& config_path, const char* key, const char* want)
    -> Diagnostic {
  return Diagnostic::HostError(
      std::format("{}: '{}' must be {}", config_path.string(), key, want));
}

// Reads an optional string key into `out`. Returns an error on a non-string.
auto ReadString(
    const toml::table& section, const char* key, const char* qualified,
    const fs::path& config_path, std::string& out) -> Result<void> {
  const toml::node* node = section.get(key);
  if (node == nullptr) {
    return {};
  }
  auto value = node->value<std::string>();
  if (!value || value->empty()) {
    return std::unexpected(
        WrongType(config_path, qualified, "a non-empty string"));
  }
  out = *value;
  return {};
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = fs::absolute(config_path).parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [weave] section
  if (const toml::table* weave = tbl["weave"].as_table()) {
    if (const toml::node* debug = weave->get("debug")) {
      auto value = debug->value<bool>();
      if (!value) {
        return std::unexpected(
            WrongType(config_path, "weave.debug", "a boolean"));
      }
      config.debug = *value;
    }

    if (const toml::node* paths = weave->get("search_paths")) {
      const toml::array* arr = paths->as_array();
      if (arr == nullptr) {
        return std::unexpected(
            WrongType(config_path, "weave.search_paths", "an array"));
      }
      for (const auto& elem : *arr) {
        auto str = elem.value<std::string>();
        if (!str) {
          return std::unexpected(
              WrongType(
                  config_path, "weave.search_paths", "an array of strings"));
        }
        // Resolve relative paths against config directory
        fs::path dir = *str;
        if (dir.is_relative()) {
          dir = config.root_dir / dir;
        }
        config.search_paths.push_back(dir.lexically_normal());
      }
    }
  } else if (tbl.contains("weave")) {
    return std::unexpected(WrongType(config_path, "weave", "a table"));
  }

  // [markers] section
  if (const toml::table* markers = tbl["markers"].as_table()) {
    auto& names = config.markers;
    for (auto result :
         {ReadString(
              *markers, "notifier", "markers.notifier", config_path,
              names.notifier),
          ReadString(
              *markers, "notify_target", "markers.notify_target", config_path,
              names.notify_target),
          ReadString(
              *markers, "notify", "markers.notify", config_path, names.notify),
          ReadString(
              *markers, "suppress", "markers.suppress", config_path,
              names.suppress)}) {
      if (!result) {
        return std::unexpected(result.error());
      }
    }
  } else if (tbl.contains("markers")) {
    return std::unexpected(WrongType(config_path, "markers", "a table"));
  }

  return config;
}

}  // namespace weft::config
