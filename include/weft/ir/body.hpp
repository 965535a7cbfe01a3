#pragma once

#include <list>

#include "weft/ir/instruction.hpp"

namespace weft::ir {

// Linked so that insertion at an arbitrary position is O(1) and iterators
// stay valid across edits.
using InstructionList = std::list<Instruction>;

struct MethodBody {
  InstructionList instructions;
};

// In-place editor for a method body. All positions are iterators into the
// body's instruction list.
class BodyEditor {
 public:
  using Iterator = InstructionList::iterator;

  explicit BodyEditor(MethodBody& body) : body_(&body) {
  }

  // Body must be non-empty for First()/Last().
  [[nodiscard]] auto First() -> Iterator;
  [[nodiscard]] auto Last() -> Iterator;

  auto InsertBefore(Iterator pos, Instruction instr) -> Iterator;
  auto InsertAfter(Iterator pos, Instruction instr) -> Iterator;

 private:
  MethodBody* body_;
};

}  // namespace weft::ir
