#pragma once

#include <cstddef>
#include <span>

#include "weft/ir/body.hpp"
#include "weft/ir/reference.hpp"
#include "weft/weaver/property_names.hpp"

namespace weft::weaver {

// Rewrites a setter body so that it reports each name to `target` right
// before returning. For a body
//
//   ldarg.0; ldarg.1; stfld <field>; ret
//
// and names {"A", "B"} the result is
//
//   nop
//   ldarg.0; ldarg.1; stfld <field>
//   ldarg.0; ldstr "A"; call <target>; nop
//   ldarg.0; ldstr "B"; call <target>; nop
//   ret
//
// A target returning a value gets a `pop` after each call. Null names load
// null. Every block goes before the current last instruction, so running the
// rewriter twice stacks a second set of blocks.
//
// Preconditions (checked, InternalError): body non-empty, names non-empty.
// Returns the number of calls inserted.
auto RewriteSetter(
    ir::MethodBody& body, const ir::MethodRef& target,
    std::span<const NotifyName> names) -> size_t;

}  // namespace weft::weaver
