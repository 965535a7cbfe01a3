#pragma once

#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "weft/ir/module.hpp"
#include "weft/ir/reference.hpp"
#include "weft/ir/resolver.hpp"
#include "weft/weaver/markers.hpp"

namespace weft::weaver {

// Finds the notify target of a type: the first method carrying the
// notify-target marker, searching the type itself and then its base chain.
// The first level that declares one wins; levels are never merged.
class TargetResolver {
 public:
  TargetResolver(
      ir::Module& module, ir::TypeResolver& resolver,
      const MarkerNames& markers);

  // Reference to the target, usable from the module being woven, or nullopt
  // when nothing up to the inheritance root declares one.
  // Throws DiagnosticException when a marked method has the wrong shape or a
  // base type cannot be resolved.
  auto Resolve(const ir::TypeDef& type) -> std::optional<ir::MethodRef>;

 private:
  auto FindDefinition(const ir::TypeDef& type) -> const ir::MethodDef*;

  ir::Module& module_;
  ir::TypeResolver& resolver_;
  const MarkerNames& markers_;
  // Per-pass memo of the definition found for each visited type.
  std::unordered_map<const ir::TypeDef*, const ir::MethodDef*> found_;
  std::unordered_set<const ir::TypeDef*> visiting_;
};

// True when `method` is an instance method accepting exactly one parameter
// of string type.
auto IsNotifyTargetShape(const ir::MethodDef& method) -> bool;

}  // namespace weft::weaver
