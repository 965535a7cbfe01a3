#include "weft/ir/body.hpp"

#include <iterator>
#include <utility>

#include "weft/common/internal_error.hpp"

namespace weft::ir {

auto BodyEditor::First() -> Iterator {
  if (body_->instructions.empty()) {
    common::ThrowInternalError("BodyEditor", "First() on an empty body");
  }
  return body_->instructions.begin();
}

auto BodyEditor::Last() -> Iterator {
  if (body_->instructions.empty()) {
    common::ThrowInternalError("BodyEditor", "Last() on an empty body");
  }
  return std::prev(body_->instructions.end());
}

auto BodyEditor::InsertBefore(Iterator pos, Instruction instr) -> Iterator {
  return body_->instructions.insert(pos, std::move(instr));
}

auto BodyEditor::InsertAfter(Iterator pos, Instruction instr) -> Iterator {
  return body_->instructions.insert(std::next(pos), std::move(instr));
}

}  // namespace weft::ir
