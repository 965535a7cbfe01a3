#include "print.hpp"

#include <cstdint>
#include <string>
#include <variant>

#include <fmt/color.h>
#include <fmt/core.h>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/common/diagnostic/diagnostic_sink.hpp"
#include "weft/common/overloaded.hpp"

namespace weft::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

// Notes are indented under their primary item.
void PrintDiagItem(const DiagItem& item, bool is_primary) {
  const char* kind_str = DiagKindToString(item.kind);
  fmt::text_style kind_style = DiagKindToStyle(item.kind);
  auto message_style = is_primary ? fmt::emphasis::bold : fmt::text_style{};
  const char* indent = is_primary ? "" : "  ";

  std::visit(
      common::Overloaded{
          [&](const DeclSpan& span) {
            fmt::print(
                stderr, "{}{}: {}: {} {}\n", indent,
                fmt::styled("weft", kToolStyle),
                fmt::styled(span.decl, fmt::emphasis::bold),
                fmt::styled(kind_str, kind_style),
                fmt::styled(item.message, message_style));
          },
          [&](UnknownSpan) {
            fmt::print(
                stderr, "{}{}: {} {}\n", indent,
                fmt::styled("weft", kToolStyle),
                fmt::styled(kind_str, kind_style),
                fmt::styled(item.message, message_style));
          },
      },
      item.span);
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("weft", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintDiagItem(diag.primary, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, false);
  }
}

void PrintDiagnostics(const DiagnosticSink& sink) {
  uint32_t error_count = 0;
  for (const auto& diag : sink.GetDiagnostics()) {
    if (diag.primary.kind != DiagKind::kNote) {
      ++error_count;
    }
    PrintDiagnostic(diag);
  }

  if (error_count > 0) {
    fmt::print(
        stderr, "{} error{} generated.\n", error_count,
        error_count == 1 ? "" : "s");
  }
}

}  // namespace weft::driver
