#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "weft/ir/reference.hpp"

namespace weft::ir {

enum class Opcode : uint8_t {
  kNop,
  kLdarg0,    // load `this` (or first argument of a static method)
  kLdarg1,    // load first declared parameter of an instance method
  kLdarg,     // load argument by index (int32 operand)
  kLdnull,
  kLdstr,     // string operand
  kLdcI4,     // int32 operand
  kLdfld,     // field operand
  kStfld,     // field operand
  kCall,      // method operand
  kCallvirt,  // method operand
  kPop,
  kDup,
  kRet,
};

enum class OperandKind : uint8_t { kNone, kString, kInt32, kField, kMethod };

using Operand =
    std::variant<std::monostate, std::string, int32_t, FieldRef, MethodRef>;

// Debug location attached by the symbol reader; woven code carries none.
struct SequencePoint {
  std::string file;
  uint32_t line = 0;

  auto operator==(const SequencePoint&) const -> bool = default;
};

struct Instruction {
  Opcode opcode = Opcode::kNop;
  Operand operand;
  std::optional<SequencePoint> sequence_point;

  static auto Create(Opcode op) -> Instruction {
    return Instruction{.opcode = op, .operand = {}, .sequence_point = {}};
  }
  static auto Create(Opcode op, std::string str) -> Instruction {
    return Instruction{
        .opcode = op, .operand = std::move(str), .sequence_point = {}};
  }
  static auto Create(Opcode op, int32_t value) -> Instruction {
    return Instruction{.opcode = op, .operand = value, .sequence_point = {}};
  }
  static auto Create(Opcode op, FieldRef field) -> Instruction {
    return Instruction{
        .opcode = op, .operand = std::move(field), .sequence_point = {}};
  }
  static auto Create(Opcode op, MethodRef method) -> Instruction {
    return Instruction{
        .opcode = op, .operand = std::move(method), .sequence_point = {}};
  }

  [[nodiscard]] auto ToString() const -> std::string;
};

auto ToString(Opcode op) -> std::string_view;
auto ParseOpcode(std::string_view text) -> std::optional<Opcode>;

// Operand shape an opcode requires.
auto ExpectedOperand(Opcode op) -> OperandKind;
auto OperandKindOf(const Operand& operand) -> OperandKind;

}  // namespace weft::ir
