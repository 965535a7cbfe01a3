#include "weft/weaver/setter_rewriter.hpp"

#include <cstddef>
#include <span>

#include "weft/common/internal_error.hpp"
#include "weft/ir/instruction.hpp"

namespace weft::weaver {

namespace {

auto LoadName(const NotifyName& name) -> ir::Instruction {
  if (!name) {
    return ir::Instruction::Create(ir::Opcode::kLdnull);
  }
  return ir::Instruction::Create(ir::Opcode::kLdstr, *name);
}

}  // namespace

auto RewriteSetter(
    ir::MethodBody& body, const ir::MethodRef& target,
    std::span<const NotifyName> names) -> size_t {
  if (body.instructions.empty()) {
    common::ThrowInternalError("RewriteSetter", "setter body is empty");
  }
  if (names.empty()) {
    common::ThrowInternalError("RewriteSetter", "no names to report");
  }

  ir::BodyEditor editor(body);

  // Landmark ahead of the original code.
  editor.InsertBefore(editor.First(), ir::Instruction::Create(ir::Opcode::kNop));

  for (const auto& name : names) {
    auto pos = editor.InsertBefore(
        editor.Last(), ir::Instruction::Create(ir::Opcode::kLdarg0));
    pos = editor.InsertAfter(pos, LoadName(name));
    pos = editor.InsertAfter(
        pos, ir::Instruction::Create(ir::Opcode::kCall, target));
    if (target.ReturnsValue()) {
      pos = editor.InsertAfter(pos, ir::Instruction::Create(ir::Opcode::kPop));
    }
    editor.InsertAfter(pos, ir::Instruction::Create(ir::Opcode::kNop));
  }
  return names.size();
}

}  // namespace weft::weaver
