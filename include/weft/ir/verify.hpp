#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "weft/ir/module.hpp"

namespace weft::ir {

// Check method body invariants; returns a description of the first
// violation, or nullopt when the body is well-formed (or absent).
//
// Invariants checked:
// - The body is non-empty and its last instruction is `ret`
// - `ret` appears nowhere else (bodies are straight-line)
// - Every operand matches the shape its opcode requires
// - Argument loads are within the method's argument count
// - The evaluation stack never underflows
// - At `ret` the stack holds exactly the return value (0 for void)
auto CheckMethodBody(const MethodDef& method) -> std::optional<std::string>;

// Same checks for code the weaver produced. Throws InternalError on failure.
// label: descriptive name for error messages (e.g. "App.Person::set_Name").
void VerifyMethodBody(const MethodDef& method, std::string_view label);

// VerifyMethodBody over every method of `type` and its nested types.
void VerifyType(const TypeDef& type);

}  // namespace weft::ir
