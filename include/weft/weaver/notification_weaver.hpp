#pragma once

#include <filesystem>
#include <vector>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/image/search_path_resolver.hpp"
#include "weft/weaver/marker_scanner.hpp"
#include "weft/weaver/markers.hpp"

namespace weft::weaver {

struct WeaveOptions {
  // Read the companion symbol file and rewrite it along with the image.
  bool debug = false;
  // Directory of the running tool; searched first when non-empty.
  std::filesystem::path tool_dir;
  // Searched after the tool and module directories.
  std::vector<std::filesystem::path> extra_search_paths;
  MarkerNames markers;
};

struct WeaveReport {
  bool modified = false;
  WeaveStats stats;
};

// Loads one module image, weaves it and writes it back when anything
// changed. A fatal condition leaves the file on disk untouched.
class NotificationWeaver {
 public:
  NotificationWeaver(std::filesystem::path module_path, WeaveOptions options);

  // Weave and persist.
  auto InsertNotifications() -> Result<WeaveReport>;

  // Weave in memory only; nothing is written. `modified` reports whether a
  // write would have happened.
  auto Analyze() -> Result<WeaveReport>;

  [[nodiscard]] auto SearchDirectories() const
      -> const std::vector<std::filesystem::path>& {
    return resolver_.SearchDirectories();
  }

 private:
  auto Run(bool persist) -> Result<WeaveReport>;

  std::filesystem::path module_path_;
  WeaveOptions options_;
  image::SearchPathResolver resolver_;
};

}  // namespace weft::weaver
