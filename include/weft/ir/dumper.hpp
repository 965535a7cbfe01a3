#pragma once

#include <ostream>
#include <string>

#include "weft/ir/module.hpp"

namespace weft::ir {

// Human-readable listing of a module: types, markers, members and method
// bodies with instruction offsets.
class Dumper {
 public:
  explicit Dumper(std::ostream* out);

  void Dump(const Module& module);
  void Dump(const TypeDef& type);
  void Dump(const MethodDef& method);
  void Dump(const PropertyDef& property);

 private:
  void PrintIndent();
  void Indent();
  void Dedent();

  void DumpAnnotations(const AnnotationSet& annotations);
  [[nodiscard]] static auto FormatSignature(const MethodDef& method)
      -> std::string;

  std::ostream* out_;
  int indent_ = 0;
};

}  // namespace weft::ir
