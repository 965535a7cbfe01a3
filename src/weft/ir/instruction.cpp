#include "weft/ir/instruction.hpp"

#include <array>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "weft/common/overloaded.hpp"

namespace weft::ir {

namespace {

struct OpcodeInfo {
  Opcode op;
  std::string_view name;
  OperandKind operand;
};

constexpr std::array<OpcodeInfo, 14> kOpcodeTable = {{
    {Opcode::kNop, "nop", OperandKind::kNone},
    {Opcode::kLdarg0, "ldarg.0", OperandKind::kNone},
    {Opcode::kLdarg1, "ldarg.1", OperandKind::kNone},
    {Opcode::kLdarg, "ldarg", OperandKind::kInt32},
    {Opcode::kLdnull, "ldnull", OperandKind::kNone},
    {Opcode::kLdstr, "ldstr", OperandKind::kString},
    {Opcode::kLdcI4, "ldc.i4", OperandKind::kInt32},
    {Opcode::kLdfld, "ldfld", OperandKind::kField},
    {Opcode::kStfld, "stfld", OperandKind::kField},
    {Opcode::kCall, "call", OperandKind::kMethod},
    {Opcode::kCallvirt, "callvirt", OperandKind::kMethod},
    {Opcode::kPop, "pop", OperandKind::kNone},
    {Opcode::kDup, "dup", OperandKind::kNone},
    {Opcode::kRet, "ret", OperandKind::kNone},
}};

auto Lookup(Opcode op) -> const OpcodeInfo& {
  return kOpcodeTable[static_cast<size_t>(op)];
}

}  // namespace

auto ToString(Opcode op) -> std::string_view {
  return Lookup(op).name;
}

auto ParseOpcode(std::string_view text) -> std::optional<Opcode> {
  for (const auto& info : kOpcodeTable) {
    if (info.name == text) {
      return info.op;
    }
  }
  return std::nullopt;
}

auto ExpectedOperand(Opcode op) -> OperandKind {
  return Lookup(op).operand;
}

auto OperandKindOf(const Operand& operand) -> OperandKind {
  return std::visit(
      common::Overloaded{
          [](std::monostate) { return OperandKind::kNone; },
          [](const std::string&) { return OperandKind::kString; },
          [](int32_t) { return OperandKind::kInt32; },
          [](const FieldRef&) { return OperandKind::kField; },
          [](const MethodRef&) { return OperandKind::kMethod; },
      },
      operand);
}

auto MethodRef::ToString() const -> std::string {
  std::string params;
  for (size_t i = 0; i < param_types.size(); ++i) {
    if (i > 0) {
      params += ", ";
    }
    params += param_types[i];
  }
  return std::format(
      "{}{} {}::{}({})", has_this ? "instance " : "", return_type,
      declaring_type.ToString(), name, params);
}

auto Instruction::ToString() const -> std::string {
  std::string_view mnemonic = ir::ToString(opcode);
  return std::visit(
      common::Overloaded{
          [&](std::monostate) { return std::string(mnemonic); },
          [&](const std::string& s) {
            return std::format("{} \"{}\"", mnemonic, s);
          },
          [&](int32_t i) { return std::format("{} {}", mnemonic, i); },
          [&](const FieldRef& f) {
            return std::format(
                "{} {} {}::{}", mnemonic, f.type, f.declaring_type.ToString(),
                f.name);
          },
          [&](const MethodRef& m) {
            return std::format("{} {}", mnemonic, m.ToString());
          },
      },
      operand);
}

}  // namespace weft::ir
