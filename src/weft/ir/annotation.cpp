#include "weft/ir/annotation.hpp"

#include <format>
#include <string>
#include <variant>

#include "weft/common/overloaded.hpp"

namespace weft::ir {

auto FormatAnnotationArg(const AnnotationArg& arg) -> std::string {
  return std::visit(
      common::Overloaded{
          [](std::monostate) -> std::string { return "null"; },
          [](bool b) -> std::string { return b ? "true" : "false"; },
          [](int64_t i) -> std::string { return std::to_string(i); },
          [](const std::string& s) -> std::string {
            return std::format("\"{}\"", s);
          },
          [](const AnnotationList& items) -> std::string {
            std::string out = "[";
            for (size_t i = 0; i < items.size(); ++i) {
              if (i > 0) {
                out += ", ";
              }
              out += FormatAnnotationArg(items[i]);
            }
            out += "]";
            return out;
          },
      },
      arg.value);
}

}  // namespace weft::ir
