#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "weft/ir/module.hpp"

namespace weft::weaver {

// One name reported to the notify target; nullopt is passed as null.
using NotifyName = std::optional<std::string>;

// Names to report when `property` changes, from its notify marker:
//
//   no marker                    -> {}
//   marker without arguments     -> {Name}
//   marker(null)                 -> {null}
//   marker(empty list)           -> {Name}
//   marker(["A", "B", "A"])      -> {"A", "B", "A"}
//   marker("A")                  -> {"A"}
//   marker("A", "B")             -> {"A", "B"}
//
// The implicit-mode fallback is decided by the caller.
// Throws DiagnosticException on argument types other than string/null.
auto ResolvePropertyNames(
    const ir::PropertyDef& property, std::string_view notify_marker)
    -> std::vector<NotifyName>;

}  // namespace weft::weaver
