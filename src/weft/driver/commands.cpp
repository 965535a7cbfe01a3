#include "commands.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <iostream>
#include <string>
#include <utility>

#include "argparse/argparse.hpp"
#include "input.hpp"
#include "print.hpp"
#include "weft/common/diagnostic/diagnostic_sink.hpp"
#include "weft/image/module_image.hpp"
#include "weft/ir/dumper.hpp"
#include "weft/weaver/notification_weaver.hpp"

namespace weft::driver {
namespace {

auto FormatCounts(uint64_t properties, uint64_t calls) -> std::string {
  return std::format(
      "{} propert{}, {} call{}", properties, properties == 1 ? "y" : "ies",
      calls, calls == 1 ? "" : "s");
}

auto Fail(Diagnostic diag) -> int {
  DiagnosticSink sink;
  sink.Report(std::move(diag));
  PrintDiagnostics(sink);
  return 1;
}

auto PrepareInput(const argparse::ArgumentParser& cmd) -> Result<WeaveInput> {
  auto config = LoadOptionalConfig();
  if (!config) {
    return std::unexpected(config.error());
  }
  return BuildInput(cmd, *config);
}

}  // namespace

auto WeaveCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd);
  if (!input) {
    return Fail(input.error());
  }

  weaver::NotificationWeaver weaver(input->module_path, input->options);
  auto report = weaver.InsertNotifications();
  if (!report) {
    return Fail(report.error());
  }

  if (!report->modified) {
    std::cout << "unchanged\n";
    return 0;
  }
  std::cout << std::format(
      "woven: {}\n", FormatCounts(
                         report->stats.properties_woven,
                         report->stats.calls_injected));
  return 0;
}

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd);
  if (!input) {
    return Fail(input.error());
  }

  weaver::NotificationWeaver weaver(input->module_path, input->options);
  auto report = weaver.Analyze();
  if (!report) {
    return Fail(report.error());
  }

  const auto& stats = report->stats;
  for (const auto& property : stats.woven_properties) {
    std::cout << std::format("  {}\n", property);
  }
  if (!report->modified) {
    std::cout << "unchanged\n";
    return 0;
  }
  std::cout << std::format(
      "would weave: {} ({} of {} types are notifiers)\n",
      FormatCounts(stats.properties_woven, stats.calls_injected),
      stats.notifier_types, stats.types_scanned);
  return 0;
}

auto DumpCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd);
  if (!input) {
    return Fail(input.error());
  }

  auto module = image::ReadModule(input->module_path, input->options.debug);
  if (!module) {
    return Fail(module.error());
  }

  ir::Dumper dumper(&std::cout);
  dumper.Dump(**module);
  return 0;
}

}  // namespace weft::driver
