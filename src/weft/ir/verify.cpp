#include "weft/ir/verify.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "weft/common/internal_error.hpp"
#include "weft/ir/instruction.hpp"

namespace weft::ir {

namespace {

auto ArgumentCount(const MethodDef& method) -> int32_t {
  auto count = static_cast<int32_t>(method.params.size());
  return method.is_static ? count : count + 1;
}

auto ArgumentIndex(const Instruction& instr) -> std::optional<int32_t> {
  switch (instr.opcode) {
    case Opcode::kLdarg0:
      return 0;
    case Opcode::kLdarg1:
      return 1;
    case Opcode::kLdarg:
      return std::get<int32_t>(instr.operand);
    default:
      return std::nullopt;
  }
}

// Stack effect as (pops, pushes).
auto StackEffect(const Instruction& instr, const MethodDef& method)
    -> std::pair<int32_t, int32_t> {
  switch (instr.opcode) {
    case Opcode::kNop:
      return {0, 0};
    case Opcode::kLdarg0:
    case Opcode::kLdarg1:
    case Opcode::kLdarg:
    case Opcode::kLdnull:
    case Opcode::kLdstr:
    case Opcode::kLdcI4:
      return {0, 1};
    case Opcode::kLdfld:
      return {1, 1};
    case Opcode::kStfld:
      return {2, 0};
    case Opcode::kCall:
    case Opcode::kCallvirt: {
      const auto& callee = std::get<MethodRef>(instr.operand);
      auto pops = static_cast<int32_t>(callee.param_types.size()) +
                  (callee.has_this ? 1 : 0);
      return {pops, callee.ReturnsValue() ? 1 : 0};
    }
    case Opcode::kPop:
      return {1, 0};
    case Opcode::kDup:
      return {1, 2};
    case Opcode::kRet:
      return {method.return_type != kVoidTypeName ? 1 : 0, 0};
  }
  return {0, 0};
}

}  // namespace

auto CheckMethodBody(const MethodDef& method) -> std::optional<std::string> {
  if (!method.body) {
    return std::nullopt;
  }
  const auto& instructions = method.body->instructions;
  if (instructions.empty()) {
    return "method body is empty";
  }
  if (instructions.back().opcode != Opcode::kRet) {
    return std::format(
        "body ends in '{}', expected 'ret'",
        ToString(instructions.back().opcode));
  }

  int32_t depth = 0;
  size_t offset = 0;
  for (const auto& instr : instructions) {
    if (ExpectedOperand(instr.opcode) != OperandKindOf(instr.operand)) {
      return std::format(
          "IL_{:04}: operand of '{}' has the wrong kind", offset,
          ToString(instr.opcode));
    }

    if (auto index = ArgumentIndex(instr)) {
      if (*index < 0 || *index >= ArgumentCount(method)) {
        return std::format(
            "IL_{:04}: argument index {} out of range ({} arguments)", offset,
            *index, ArgumentCount(method));
      }
    }

    if (instr.opcode == Opcode::kRet && offset + 1 != instructions.size()) {
      return std::format("IL_{:04}: 'ret' before end of body", offset);
    }

    auto [pops, pushes] = StackEffect(instr, method);
    if (depth < pops) {
      return std::format(
          "IL_{:04}: '{}' pops {} value(s) but the stack holds {}", offset,
          ToString(instr.opcode), pops, depth);
    }
    depth = depth - pops + pushes;
    ++offset;
  }

  if (depth != 0) {
    return std::format("{} value(s) left on the stack at 'ret'", depth);
  }
  return std::nullopt;
}

void VerifyMethodBody(const MethodDef& method, std::string_view label) {
  if (auto problem = CheckMethodBody(method)) {
    throw common::InternalError(
        "IR verify", std::format("{}: {}", label, *problem));
  }
}

void VerifyType(const TypeDef& type) {
  for (const auto& method : type.methods) {
    VerifyMethodBody(*method, method->FullName());
  }
  for (const auto& nested : type.nested_types) {
    VerifyType(*nested);
  }
}

}  // namespace weft::ir
