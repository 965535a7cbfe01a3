#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "weft/ir/module.hpp"
#include "weft/ir/resolver.hpp"
#include "weft/weaver/markers.hpp"
#include "weft/weaver/target_resolver.hpp"

namespace weft::weaver {

// Counters of one weaving pass (for the driver summary and `check`).
struct WeaveStats {
  uint64_t types_scanned = 0;
  uint64_t notifier_types = 0;
  uint64_t properties_woven = 0;
  uint64_t calls_injected = 0;
  // Full names of woven properties, in weaving order.
  std::vector<std::string> woven_properties;
};

// Walks a type tree, weaving notify calls into the setters of every
// notifier type it finds.
class MarkerScanner {
 public:
  MarkerScanner(
      ir::Module& module, ir::TypeResolver& resolver,
      const MarkerNames& markers);

  // Weave `type` and recurse into its nested types. Returns whether a
  // property of `type` itself was woven; nested types only show up in
  // Stats().
  // Throws DiagnosticException on any fatal marker misuse.
  auto ProcessType(ir::TypeDef& type) -> bool;

  [[nodiscard]] auto Stats() const -> const WeaveStats& {
    return stats_;
  }

 private:
  auto ReadMode(const ir::TypeDef& type, const ir::Annotation& marker) const
      -> NotificationMode;
  auto WeaveProperty(
      ir::PropertyDef& property, const ir::MethodRef& target,
      NotificationMode mode) -> bool;

  TargetResolver targets_;
  const MarkerNames& markers_;
  WeaveStats stats_;
};

// Weave every type of `module`. Throws DiagnosticException on the first fatal
// condition, in which case the module may be partially rewritten and must not
// be persisted.
auto WeaveModule(
    ir::Module& module, ir::TypeResolver& resolver, const MarkerNames& markers)
    -> WeaveStats;

}  // namespace weft::weaver
