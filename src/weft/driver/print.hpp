#pragma once

#include <string>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/common/diagnostic/diagnostic_sink.hpp"

namespace weft::driver {

void PrintError(const std::string& message);

void PrintDiagnostic(const Diagnostic& diag);

// Prints every diagnostic followed by a "N errors generated." summary.
void PrintDiagnostics(const DiagnosticSink& sink);

}  // namespace weft::driver
