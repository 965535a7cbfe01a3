#include "weft/image/codec.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/common/overloaded.hpp"
#include "weft/ir/annotation.hpp"
#include "weft/ir/instruction.hpp"

namespace weft::image {

namespace {

using nlohmann::json;

[[noreturn]] void Malformed(std::string_view where, std::string_view what) {
  throw DiagnosticException(
      Diagnostic::HostError(
          std::format("malformed module image: {}: {}", where, what)));
}

auto RequireObject(const json& doc, std::string_view where) -> const json& {
  if (!doc.is_object()) {
    Malformed(where, "expected an object");
  }
  return doc;
}

auto RequireString(
    const json& obj, const char* key, std::string_view where) -> std::string {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    Malformed(where, std::format("missing string field '{}'", key));
  }
  return it->get<std::string>();
}

auto OptionalString(const json& obj, const char* key, std::string fallback)
    -> std::string {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return fallback;
  }
  return it->is_string() ? it->get<std::string>() : fallback;
}

auto OptionalBool(const json& obj, const char* key) -> bool {
  auto it = obj.find(key);
  return it != obj.end() && it->is_boolean() && it->get<bool>();
}

auto OptionalArray(const json& obj, const char* key, std::string_view where)
    -> const json& {
  static const json kEmpty = json::array();
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return kEmpty;
  }
  if (!it->is_array()) {
    Malformed(where, std::format("field '{}' must be an array", key));
  }
  return *it;
}

auto ReadVisibility(const json& obj, std::string_view where,
                    ir::Visibility fallback) -> ir::Visibility {
  auto it = obj.find("visibility");
  if (it == obj.end()) {
    return fallback;
  }
  if (!it->is_string()) {
    Malformed(where, "visibility must be a string");
  }
  auto vis = ir::ParseVisibility(it->get<std::string>());
  if (!vis) {
    Malformed(
        where, std::format("unknown visibility '{}'", it->get<std::string>()));
  }
  return *vis;
}

// --- references --------------------------------------------------------

auto EncodeTypeRef(const ir::TypeRef& ref) -> json {
  json out = {{"name", ref.full_name}};
  if (!ref.scope.empty()) {
    out["scope"] = ref.scope;
  }
  return out;
}

auto DecodeTypeRef(const json& doc, std::string_view where) -> ir::TypeRef {
  RequireObject(doc, where);
  return ir::TypeRef{
      .scope = OptionalString(doc, "scope", ""),
      .full_name = RequireString(doc, "name", where),
  };
}

auto EncodeMethodRef(const ir::MethodRef& ref) -> json {
  return {
      {"declaring", EncodeTypeRef(ref.declaring_type)},
      {"name", ref.name},
      {"returns", ref.return_type},
      {"params", ref.param_types},
      {"instance", ref.has_this},
  };
}

auto DecodeMethodRef(const json& doc, std::string_view where)
    -> ir::MethodRef {
  RequireObject(doc, where);
  ir::MethodRef ref;
  ref.declaring_type = DecodeTypeRef(doc.value("declaring", json()), where);
  ref.name = RequireString(doc, "name", where);
  ref.return_type = OptionalString(doc, "returns", "void");
  for (const auto& param : OptionalArray(doc, "params", where)) {
    if (!param.is_string()) {
      Malformed(where, "method reference params must be type names");
    }
    ref.param_types.push_back(param.get<std::string>());
  }
  ref.has_this = doc.value("instance", true);
  return ref;
}

auto EncodeFieldRef(const ir::FieldRef& ref) -> json {
  return {
      {"declaring", EncodeTypeRef(ref.declaring_type)},
      {"name", ref.name},
      {"type", ref.type},
  };
}

auto DecodeFieldRef(const json& doc, std::string_view where) -> ir::FieldRef {
  RequireObject(doc, where);
  return ir::FieldRef{
      .declaring_type = DecodeTypeRef(doc.value("declaring", json()), where),
      .name = RequireString(doc, "name", where),
      .type = RequireString(doc, "type", where),
  };
}

// --- annotations ---------------------------------------------------------

auto EncodeArg(const ir::AnnotationArg& arg) -> json {
  return std::visit(
      common::Overloaded{
          [](std::monostate) -> json { return nullptr; },
          [](bool b) -> json { return b; },
          [](int64_t i) -> json { return i; },
          [](const std::string& s) -> json { return s; },
          [](const ir::AnnotationList& items) -> json {
            json out = json::array();
            for (const auto& item : items) {
              out.push_back(EncodeArg(item));
            }
            return out;
          },
      },
      arg.value);
}

auto DecodeArg(const json& doc, std::string_view where) -> ir::AnnotationArg {
  if (doc.is_null()) {
    return ir::AnnotationArg::Null();
  }
  if (doc.is_boolean()) {
    return ir::AnnotationArg::Bool(doc.get<bool>());
  }
  if (doc.is_number_integer()) {
    return ir::AnnotationArg::Int(doc.get<int64_t>());
  }
  if (doc.is_string()) {
    return ir::AnnotationArg::String(doc.get<std::string>());
  }
  if (doc.is_array()) {
    ir::AnnotationList items;
    for (const auto& item : doc) {
      items.push_back(DecodeArg(item, where));
    }
    return ir::AnnotationArg::List(std::move(items));
  }
  Malformed(where, "unsupported annotation argument");
}

auto EncodeAnnotations(const ir::AnnotationSet& annotations) -> json {
  json out = json::array();
  for (const auto& annotation : annotations) {
    json args = json::array();
    for (const auto& arg : annotation.args) {
      args.push_back(EncodeArg(arg));
    }
    out.push_back({{"type", annotation.type_name}, {"args", std::move(args)}});
  }
  return out;
}

auto DecodeAnnotations(const json& owner, std::string_view where)
    -> ir::AnnotationSet {
  ir::AnnotationSet set;
  for (const auto& doc : OptionalArray(owner, "annotations", where)) {
    RequireObject(doc, where);
    ir::Annotation annotation{.type_name = RequireString(doc, "type", where),
                              .args = {}};
    for (const auto& arg : OptionalArray(doc, "args", where)) {
      annotation.args.push_back(DecodeArg(arg, where));
    }
    set.Add(std::move(annotation));
  }
  return set;
}

// --- instructions --------------------------------------------------------

auto EncodeInstruction(const ir::Instruction& instr) -> json {
  json out = {{"op", std::string(ir::ToString(instr.opcode))}};
  std::visit(
      common::Overloaded{
          [](std::monostate) {},
          [&](const std::string& s) { out["value"] = s; },
          [&](int32_t i) { out["value"] = i; },
          [&](const ir::FieldRef& f) { out["field"] = EncodeFieldRef(f); },
          [&](const ir::MethodRef& m) { out["method"] = EncodeMethodRef(m); },
      },
      instr.operand);
  return out;
}

auto DecodeInstruction(const json& doc, std::string_view where)
    -> ir::Instruction {
  RequireObject(doc, where);
  std::string mnemonic = RequireString(doc, "op", where);
  auto op = ir::ParseOpcode(mnemonic);
  if (!op) {
    Malformed(where, std::format("unknown opcode '{}'", mnemonic));
  }

  switch (ir::ExpectedOperand(*op)) {
    case ir::OperandKind::kNone:
      return ir::Instruction::Create(*op);
    case ir::OperandKind::kString:
      return ir::Instruction::Create(*op, RequireString(doc, "value", where));
    case ir::OperandKind::kInt32: {
      auto it = doc.find("value");
      if (it == doc.end() || !it->is_number_integer()) {
        Malformed(where, std::format("'{}' needs an integer value", mnemonic));
      }
      return ir::Instruction::Create(*op, it->get<int32_t>());
    }
    case ir::OperandKind::kField:
      return ir::Instruction::Create(
          *op, DecodeFieldRef(doc.value("field", json()), where));
    case ir::OperandKind::kMethod:
      return ir::Instruction::Create(
          *op, DecodeMethodRef(doc.value("method", json()), where));
  }
  Malformed(where, "unreachable operand kind");
}

// --- members -------------------------------------------------------------

auto EncodeMethod(const ir::MethodDef& method) -> json {
  json params = json::array();
  for (const auto& param : method.params) {
    params.push_back({{"name", param.name}, {"type", param.type}});
  }
  json out = {
      {"name", method.name},
      {"visibility", std::string(ir::ToString(method.visibility))},
      {"static", method.is_static},
      {"virtual", method.is_virtual},
      {"abstract", method.is_abstract},
      {"extern", method.is_extern},
      {"returns", method.return_type},
      {"params", std::move(params)},
      {"annotations", EncodeAnnotations(method.annotations)},
  };
  if (method.body) {
    json body = json::array();
    for (const auto& instr : method.body->instructions) {
      body.push_back(EncodeInstruction(instr));
    }
    out["body"] = std::move(body);
  }
  return out;
}

auto DecodeMethod(const json& doc, const std::string& type_name)
    -> ir::MethodDef {
  RequireObject(doc, type_name);
  ir::MethodDef method;
  method.name = RequireString(doc, "name", type_name);
  std::string where = type_name + "::" + method.name;
  method.visibility =
      ReadVisibility(doc, where, ir::Visibility::kPrivate);
  method.is_static = OptionalBool(doc, "static");
  method.is_virtual = OptionalBool(doc, "virtual");
  method.is_abstract = OptionalBool(doc, "abstract");
  method.is_extern = OptionalBool(doc, "extern");
  method.return_type = OptionalString(doc, "returns", "void");
  for (const auto& param : OptionalArray(doc, "params", where)) {
    RequireObject(param, where);
    method.params.push_back(
        ir::Parameter{
            .name = OptionalString(param, "name", ""),
            .type = RequireString(param, "type", where),
        });
  }
  method.annotations = DecodeAnnotations(doc, where);

  auto body = doc.find("body");
  if (body != doc.end() && !body->is_null()) {
    if (method.is_abstract || method.is_extern) {
      Malformed(where, "abstract or extern method has a body");
    }
    if (!body->is_array()) {
      Malformed(where, "body must be an array of instructions");
    }
    ir::MethodBody decoded;
    for (const auto& instr : *body) {
      decoded.instructions.push_back(DecodeInstruction(instr, where));
    }
    method.body = std::move(decoded);
  }
  return method;
}

auto EncodeType(const ir::TypeDef& type) -> json {
  json fields = json::array();
  for (const auto& field : type.fields) {
    fields.push_back({
        {"name", field.name},
        {"type", field.type},
        {"visibility", std::string(ir::ToString(field.visibility))},
        {"static", field.is_static},
    });
  }

  json methods = json::array();
  for (const auto& method : type.methods) {
    methods.push_back(EncodeMethod(*method));
  }

  json properties = json::array();
  for (const auto& property : type.properties) {
    properties.push_back({
        {"name", property->name},
        {"type", property->type},
        {"get", property->getter != nullptr ? json(property->getter->name)
                                            : json(nullptr)},
        {"set", property->setter != nullptr ? json(property->setter->name)
                                            : json(nullptr)},
        {"annotations", EncodeAnnotations(property->annotations)},
    });
  }

  json nested = json::array();
  for (const auto& inner : type.nested_types) {
    nested.push_back(EncodeType(*inner));
  }

  json out = {
      {"name", type.name},
      {"visibility", std::string(ir::ToString(type.visibility))},
      {"annotations", EncodeAnnotations(type.annotations)},
      {"fields", std::move(fields)},
      {"methods", std::move(methods)},
      {"properties", std::move(properties)},
      {"nested", std::move(nested)},
  };
  if (!type.ns.empty()) {
    out["namespace"] = type.ns;
  }
  if (type.base) {
    out["base"] = EncodeTypeRef(*type.base);
  }
  return out;
}

auto DecodeType(const json& doc, std::string_view where)
    -> std::unique_ptr<ir::TypeDef> {
  RequireObject(doc, where);
  auto type = std::make_unique<ir::TypeDef>();
  type->ns = OptionalString(doc, "namespace", "");
  type->name = RequireString(doc, "name", where);
  std::string type_name = std::string(where) + "/" + type->name;
  if (where.empty()) {
    type_name = type->ns.empty() ? type->name : type->ns + "." + type->name;
  }
  type->visibility = ReadVisibility(doc, type_name, ir::Visibility::kPublic);
  type->annotations = DecodeAnnotations(doc, type_name);

  auto base = doc.find("base");
  if (base != doc.end() && !base->is_null()) {
    type->base = DecodeTypeRef(*base, type_name);
  }

  for (const auto& field : OptionalArray(doc, "fields", type_name)) {
    RequireObject(field, type_name);
    type->fields.push_back(
        ir::FieldDef{
            .name = RequireString(field, "name", type_name),
            .type = RequireString(field, "type", type_name),
            .visibility =
                ReadVisibility(field, type_name, ir::Visibility::kPrivate),
            .is_static = OptionalBool(field, "static"),
        });
  }

  for (const auto& method : OptionalArray(doc, "methods", type_name)) {
    type->AddMethod(DecodeMethod(method, type_name));
  }

  // Accessors name sibling methods, so properties come after methods.
  for (const auto& prop : OptionalArray(doc, "properties", type_name)) {
    RequireObject(prop, type_name);
    ir::PropertyDef property;
    property.name = RequireString(prop, "name", type_name);
    property.type = OptionalString(prop, "type", "");
    std::string where_prop = type_name + "::" + property.name;
    property.annotations = DecodeAnnotations(prop, where_prop);

    auto accessor = [&](const char* key) -> ir::MethodDef* {
      std::string name = OptionalString(prop, key, "");
      if (name.empty()) {
        return nullptr;
      }
      ir::MethodDef* method = type->FindMethod(name);
      if (method == nullptr) {
        Malformed(
            where_prop,
            std::format("{} accessor '{}' is not a method of the type", key,
                        name));
      }
      return method;
    };
    property.getter = accessor("get");
    property.setter = accessor("set");
    type->AddProperty(std::move(property));
  }

  for (const auto& inner : OptionalArray(doc, "nested", type_name)) {
    type->AddNestedType(DecodeType(inner, type_name));
  }
  return type;
}

// --- symbols -------------------------------------------------------------

void CollectSymbols(const ir::TypeDef& type, json& out) {
  for (size_t index = 0; index < type.methods.size(); ++index) {
    const auto& method = *type.methods[index];
    if (!method.body) {
      continue;
    }
    json points = json::array();
    size_t offset = 0;
    for (const auto& instr : method.body->instructions) {
      if (instr.sequence_point) {
        points.push_back({
            {"offset", offset},
            {"file", instr.sequence_point->file},
            {"line", instr.sequence_point->line},
        });
      }
      ++offset;
    }
    if (!points.empty()) {
      out.push_back({
          {"type", type.FullName()},
          {"method", method.name},
          {"index", index},
          {"points", std::move(points)},
      });
    }
  }
  for (const auto& nested : type.nested_types) {
    CollectSymbols(*nested, out);
  }
}

}  // namespace

auto EncodeModule(const ir::Module& module) -> nlohmann::json {
  json types = json::array();
  for (const auto& type : module.Types()) {
    types.push_back(EncodeType(*type));
  }
  return {
      {"format", kModuleFormatTag},
      {"version", kImageVersion},
      {"name", module.Name()},
      {"references", module.References()},
      {"types", std::move(types)},
  };
}

auto DecodeModule(const nlohmann::json& doc) -> std::unique_ptr<ir::Module> {
  RequireObject(doc, "<root>");
  if (OptionalString(doc, "format", "") != kModuleFormatTag) {
    Malformed("<root>", "not a weft module image");
  }
  if (doc.value("version", 0) != kImageVersion) {
    Malformed(
        "<root>", std::format("unsupported image version (expected {})",
                              kImageVersion));
  }

  auto module = std::make_unique<ir::Module>(RequireString(doc, "name", "<root>"));
  for (const auto& reference : OptionalArray(doc, "references", "<root>")) {
    if (!reference.is_string()) {
      Malformed("<root>", "references must be module names");
    }
    module->AddReference(reference.get<std::string>());
  }
  for (const auto& type : OptionalArray(doc, "types", "<root>")) {
    module->AddType(DecodeType(type, ""));
  }
  return module;
}

auto EncodeSymbols(const ir::Module& module) -> nlohmann::json {
  json methods = json::array();
  for (const auto& type : module.Types()) {
    CollectSymbols(*type, methods);
  }
  return {
      {"format", kSymbolFormatTag},
      {"version", kImageVersion},
      {"module", module.Name()},
      {"methods", std::move(methods)},
  };
}

void ApplySymbols(ir::Module& module, const nlohmann::json& doc) {
  RequireObject(doc, "<symbols>");
  if (OptionalString(doc, "format", "") != kSymbolFormatTag) {
    Malformed("<symbols>", "not a weft symbol file");
  }
  if (OptionalString(doc, "module", "") != module.Name()) {
    Malformed(
        "<symbols>",
        std::format("symbols do not belong to module '{}'", module.Name()));
  }

  for (const auto& entry : OptionalArray(doc, "methods", "<symbols>")) {
    RequireObject(entry, "<symbols>");
    std::string type_name = RequireString(entry, "type", "<symbols>");
    std::string method_name = RequireString(entry, "method", type_name);
    std::string where = type_name + "::" + method_name;

    ir::TypeDef* type = module.FindType(type_name);
    if (type == nullptr) {
      Malformed("<symbols>", std::format("unknown type '{}'", type_name));
    }
    auto index = entry.value("index", static_cast<size_t>(0));
    if (index >= type->methods.size() ||
        type->methods[index]->name != method_name) {
      Malformed(where, "method index does not match the image");
    }
    ir::MethodDef& method = *type->methods[index];
    if (!method.body) {
      Malformed(where, "symbols recorded for a method without body");
    }

    auto& instructions = method.body->instructions;
    for (const auto& point : OptionalArray(entry, "points", where)) {
      RequireObject(point, where);
      auto offset = point.value("offset", instructions.size());
      if (offset >= instructions.size()) {
        Malformed(where, std::format("sequence point offset {} out of range",
                                     offset));
      }
      auto it = std::next(
          instructions.begin(), static_cast<std::ptrdiff_t>(offset));
      it->sequence_point = ir::SequencePoint{
          .file = OptionalString(point, "file", ""),
          .line = point.value("line", 0U),
      };
    }
  }
}

}  // namespace weft::image
