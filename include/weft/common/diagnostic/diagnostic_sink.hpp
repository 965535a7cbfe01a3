#pragma once

#include <utility>
#include <vector>

#include "weft/common/diagnostic/diagnostic.hpp"

namespace weft {

// Collects diagnostics during a run. Not thread-safe.
// Diagnostics are stored in order of reporting; callers may rely on this.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    diagnostics_.push_back(std::move(diag));
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace weft
