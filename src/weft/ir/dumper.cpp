#include "weft/ir/dumper.hpp"

#include <cstddef>
#include <format>
#include <ostream>
#include <string>

#include "weft/ir/annotation.hpp"
#include "weft/ir/instruction.hpp"

namespace weft::ir {

Dumper::Dumper(std::ostream* out) : out_(out) {
}

void Dumper::PrintIndent() {
  for (int i = 0; i < indent_; ++i) {
    *out_ << "  ";
  }
}

void Dumper::Indent() {
  ++indent_;
}

void Dumper::Dedent() {
  --indent_;
}

void Dumper::Dump(const Module& module) {
  PrintIndent();
  *out_ << "module " << module.Name() << "\n";
  Indent();
  for (const auto& reference : module.References()) {
    PrintIndent();
    *out_ << "reference " << reference << "\n";
  }
  for (const auto& type : module.Types()) {
    Dump(*type);
  }
  Dedent();
}

void Dumper::Dump(const TypeDef& type) {
  PrintIndent();
  *out_ << std::format("type {} {}", ToString(type.visibility), type.FullName());
  if (type.base) {
    *out_ << " : " << type.base->ToString();
  }
  *out_ << "\n";

  Indent();
  DumpAnnotations(type.annotations);
  for (const auto& field : type.fields) {
    PrintIndent();
    *out_ << std::format(
        "field {}{} {} {}\n", ToString(field.visibility),
        field.is_static ? " static" : "", field.type, field.name);
  }
  for (const auto& property : type.properties) {
    Dump(*property);
  }
  for (const auto& method : type.methods) {
    Dump(*method);
  }
  for (const auto& nested : type.nested_types) {
    Dump(*nested);
  }
  Dedent();
}

void Dumper::Dump(const PropertyDef& property) {
  PrintIndent();
  *out_ << std::format("property {} {} {{", property.type, property.name);
  if (property.getter != nullptr) {
    *out_ << " get: " << property.getter->name << ";";
  }
  if (property.setter != nullptr) {
    *out_ << " set: " << property.setter->name << ";";
  }
  *out_ << " }\n";
  Indent();
  DumpAnnotations(property.annotations);
  Dedent();
}

void Dumper::Dump(const MethodDef& method) {
  PrintIndent();
  *out_ << "method " << FormatSignature(method);
  if (!method.body) {
    *out_ << " (no body)\n";
  } else {
    *out_ << "\n";
  }

  Indent();
  DumpAnnotations(method.annotations);
  if (method.body) {
    size_t offset = 0;
    for (const auto& instr : method.body->instructions) {
      PrintIndent();
      *out_ << std::format("IL_{:04}: {}", offset, instr.ToString());
      if (instr.sequence_point) {
        *out_ << std::format(
            "  // {}:{}", instr.sequence_point->file,
            instr.sequence_point->line);
      }
      *out_ << "\n";
      ++offset;
    }
  }
  Dedent();
}

void Dumper::DumpAnnotations(const AnnotationSet& annotations) {
  for (const auto& annotation : annotations) {
    PrintIndent();
    *out_ << "@" << annotation.type_name;
    if (annotation.HasArgs()) {
      *out_ << "(";
      for (size_t i = 0; i < annotation.args.size(); ++i) {
        if (i > 0) {
          *out_ << ", ";
        }
        *out_ << FormatAnnotationArg(annotation.args[i]);
      }
      *out_ << ")";
    }
    *out_ << "\n";
  }
}

auto Dumper::FormatSignature(const MethodDef& method) -> std::string {
  std::string out = std::string(ToString(method.visibility));
  if (method.is_static) {
    out += " static";
  }
  if (method.is_virtual) {
    out += " virtual";
  }
  if (method.is_abstract) {
    out += " abstract";
  }
  if (method.is_extern) {
    out += " extern";
  }
  out += std::format(" {} {}(", method.return_type, method.name);
  for (size_t i = 0; i < method.params.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += method.params[i].type + " " + method.params[i].name;
  }
  out += ")";
  return out;
}

}  // namespace weft::ir
