#include "weft/weaver/notification_weaver.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/common/phase_timer.hpp"
#include "weft/image/module_image.hpp"
#include "weft/weaver/marker_scanner.hpp"

namespace weft::weaver {

namespace fs = std::filesystem;

NotificationWeaver::NotificationWeaver(
    fs::path module_path, WeaveOptions options)
    : module_path_(std::move(module_path)), options_(std::move(options)) {
  resolver_.AddSearchDirectory(options_.tool_dir);
  fs::path module_dir = fs::absolute(module_path_).parent_path();
  resolver_.AddSearchDirectory(module_dir);
  for (const auto& dir : options_.extra_search_paths) {
    resolver_.AddSearchDirectory(dir);
  }
}

auto NotificationWeaver::InsertNotifications() -> Result<WeaveReport> {
  return Run(true);
}

auto NotificationWeaver::Analyze() -> Result<WeaveReport> {
  return Run(false);
}

auto NotificationWeaver::Run(bool persist) -> Result<WeaveReport> {
  Result<std::unique_ptr<ir::Module>> module;
  {
    common::PhaseTimer timer("load");
    module = image::ReadModule(module_path_, options_.debug);
  }
  if (!module) {
    return std::unexpected(module.error());
  }

  WeaveReport report;
  try {
    common::PhaseTimer timer("weave");
    report.stats = WeaveModule(**module, resolver_, options_.markers);
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  }
  report.modified = report.stats.properties_woven > 0;

  if (!report.modified) {
    spdlog::info("{}: nothing to weave", module_path_.string());
    return report;
  }
  if (!persist) {
    return report;
  }

  Result<void> written;
  {
    common::PhaseTimer timer("write");
    written = image::WriteModule(**module, module_path_, options_.debug);
  }
  if (!written) {
    return std::unexpected(written.error());
  }
  spdlog::info(
      "{}: wove {} propert{} ({} call{})", module_path_.string(),
      report.stats.properties_woven,
      report.stats.properties_woven == 1 ? "y" : "ies",
      report.stats.calls_injected,
      report.stats.calls_injected == 1 ? "" : "s");
  return report;
}

}  // namespace weft::weaver
