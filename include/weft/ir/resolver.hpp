#pragma once

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/ir/module.hpp"
#include "weft/ir/reference.hpp"

namespace weft::ir {

// Turns a type reference into its definition, loading other modules as
// needed. Injected into the weaver so cross-module lookups stay explicit.
class TypeResolver {
 public:
  TypeResolver() = default;
  virtual ~TypeResolver() = default;

  TypeResolver(const TypeResolver&) = delete;
  auto operator=(const TypeResolver&) -> TypeResolver& = delete;
  TypeResolver(TypeResolver&&) = delete;
  auto operator=(TypeResolver&&) -> TypeResolver& = delete;

  // Resolve `ref` as written inside module `from`; an empty scope means
  // `from` itself. Returned definitions stay valid for the resolver's
  // lifetime (or the lifetime of `from` for local types).
  virtual auto Resolve(const Module& from, const TypeRef& ref)
      -> Result<const TypeDef*> = 0;
};

}  // namespace weft::ir
