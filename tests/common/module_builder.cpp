#include "tests/common/module_builder.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include "weft/ir/annotation.hpp"
#include "weft/ir/body.hpp"
#include "weft/ir/instruction.hpp"
#include "weft/ir/module.hpp"

namespace weft::test {

namespace {

auto BackingFieldName(const std::string& property) -> std::string {
  return "<" + property + ">k__BackingField";
}

auto RandomSuffix() -> std::string {
  static std::random_device rd;
  static std::mt19937 gen(rd());
  static std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

}  // namespace

ModuleBuilder::ModuleBuilder(
    std::string module_name, weaver::MarkerNames markers)
    : module_(std::make_unique<ir::Module>(std::move(module_name))),
      markers_(std::move(markers)) {
}

auto ModuleBuilder::Release() -> std::unique_ptr<ir::Module> {
  return std::move(module_);
}

auto ModuleBuilder::AddType(std::string ns, std::string name) -> ir::TypeDef& {
  auto type = std::make_unique<ir::TypeDef>();
  type->ns = std::move(ns);
  type->name = std::move(name);
  return module_->AddType(std::move(type));
}

auto ModuleBuilder::AddNestedType(ir::TypeDef& outer, std::string name)
    -> ir::TypeDef& {
  auto type = std::make_unique<ir::TypeDef>();
  type->name = std::move(name);
  return outer.AddNestedType(std::move(type));
}

void ModuleBuilder::MarkNotifier(ir::TypeDef& type) {
  type.annotations.Add({.type_name = markers_.notifier, .args = {}});
}

void ModuleBuilder::MarkNotifier(ir::TypeDef& type, ir::AnnotationArg mode) {
  type.annotations.Add(
      {.type_name = markers_.notifier, .args = {std::move(mode)}});
}

auto ModuleBuilder::AddMethod(ir::TypeDef& type, std::string name)
    -> ir::MethodDef& {
  ir::MethodDef method;
  method.name = std::move(name);
  method.visibility = ir::Visibility::kFamily;
  method.is_virtual = true;
  method.params.push_back({.name = "propertyName", .type = "string"});
  method.body = ir::MethodBody{};
  method.body->instructions.push_back(
      ir::Instruction::Create(ir::Opcode::kRet));
  return type.AddMethod(std::move(method));
}

auto ModuleBuilder::AddNotifyTarget(ir::TypeDef& type, std::string name)
    -> ir::MethodDef& {
  ir::MethodDef& method = AddMethod(type, std::move(name));
  method.annotations.Add({.type_name = markers_.notify_target, .args = {}});
  return method;
}

auto ModuleBuilder::AddAutoProperty(
    ir::TypeDef& type, std::string name, ir::Visibility setter_visibility)
    -> ir::PropertyDef& {
  ir::FieldRef field{
      .declaring_type = ir::MakeTypeRef(type, *module_),
      .name = BackingFieldName(name),
      .type = "string",
  };
  type.fields.push_back(
      {.name = field.name,
       .type = "string",
       .visibility = ir::Visibility::kPrivate,
       .is_static = false});

  ir::MethodDef getter;
  getter.name = "get_" + name;
  getter.visibility = ir::Visibility::kPublic;
  getter.return_type = "string";
  getter.body = ir::MethodBody{};
  getter.body->instructions = {
      ir::Instruction::Create(ir::Opcode::kLdarg0),
      ir::Instruction::Create(ir::Opcode::kLdfld, field),
      ir::Instruction::Create(ir::Opcode::kRet),
  };

  ir::MethodDef setter;
  setter.name = "set_" + name;
  setter.visibility = setter_visibility;
  setter.params.push_back({.name = "value", .type = "string"});
  setter.body = ir::MethodBody{};
  setter.body->instructions = {
      ir::Instruction::Create(ir::Opcode::kLdarg0),
      ir::Instruction::Create(ir::Opcode::kLdarg1),
      ir::Instruction::Create(ir::Opcode::kStfld, field),
      ir::Instruction::Create(ir::Opcode::kRet),
  };

  ir::MethodDef& get = type.AddMethod(std::move(getter));
  ir::MethodDef& set = type.AddMethod(std::move(setter));

  ir::PropertyDef property;
  property.name = std::move(name);
  property.type = "string";
  property.getter = &get;
  property.setter = &set;
  return type.AddProperty(std::move(property));
}

auto ModuleBuilder::AddReadOnlyProperty(ir::TypeDef& type, std::string name)
    -> ir::PropertyDef& {
  ir::MethodDef getter;
  getter.name = "get_" + name;
  getter.visibility = ir::Visibility::kPublic;
  getter.return_type = "string";
  getter.body = ir::MethodBody{};
  getter.body->instructions = {
      ir::Instruction::Create(ir::Opcode::kLdstr, std::string("constant")),
      ir::Instruction::Create(ir::Opcode::kRet),
  };

  ir::PropertyDef property;
  property.name = std::move(name);
  property.type = "string";
  property.getter = &type.AddMethod(std::move(getter));
  return type.AddProperty(std::move(property));
}

auto ModuleBuilder::AddAbstractProperty(ir::TypeDef& type, std::string name)
    -> ir::PropertyDef& {
  ir::MethodDef getter;
  getter.name = "get_" + name;
  getter.visibility = ir::Visibility::kPublic;
  getter.is_virtual = true;
  getter.is_abstract = true;
  getter.return_type = "string";

  ir::MethodDef setter;
  setter.name = "set_" + name;
  setter.visibility = ir::Visibility::kPublic;
  setter.is_virtual = true;
  setter.is_abstract = true;
  setter.params.push_back({.name = "value", .type = "string"});

  ir::PropertyDef property;
  property.name = std::move(name);
  property.type = "string";
  property.getter = &type.AddMethod(std::move(getter));
  property.setter = &type.AddMethod(std::move(setter));
  return type.AddProperty(std::move(property));
}

void ModuleBuilder::MarkNotify(ir::PropertyDef& property) {
  property.annotations.Add({.type_name = markers_.notify, .args = {}});
}

void ModuleBuilder::MarkNotify(
    ir::PropertyDef& property, std::vector<ir::AnnotationArg> args) {
  property.annotations.Add(
      {.type_name = markers_.notify, .args = std::move(args)});
}

void ModuleBuilder::MarkSuppress(ir::PropertyDef& property) {
  property.annotations.Add({.type_name = markers_.suppress, .args = {}});
}

auto ExternalType(std::string scope, std::string full_name) -> ir::TypeRef {
  return ir::TypeRef{.scope = std::move(scope), .full_name = std::move(full_name)};
}

auto NameList(const std::vector<std::string>& names) -> ir::AnnotationArg {
  ir::AnnotationList items;
  for (const auto& name : names) {
    items.push_back(ir::AnnotationArg::String(name));
  }
  return ir::AnnotationArg::List(std::move(items));
}

auto Opcodes(const ir::MethodBody& body) -> std::vector<ir::Opcode> {
  std::vector<ir::Opcode> ops;
  for (const auto& instr : body.instructions) {
    ops.push_back(instr.opcode);
  }
  return ops;
}

auto LoadedStrings(const ir::MethodBody& body) -> std::vector<std::string> {
  std::vector<std::string> strings;
  for (const auto& instr : body.instructions) {
    if (instr.opcode == ir::Opcode::kLdstr) {
      strings.push_back(std::get<std::string>(instr.operand));
    }
  }
  return strings;
}

auto CountOpcode(const ir::MethodBody& body, ir::Opcode op) -> int64_t {
  return std::ranges::count_if(
      body.instructions,
      [op](const ir::Instruction& instr) { return instr.opcode == op; });
}

TempDir::TempDir(const std::string& prefix) {
  auto tmp = std::filesystem::temp_directory_path();
  do {
    path_ = tmp / (prefix + RandomSuffix());
  } while (std::filesystem::exists(path_));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

auto ReadFileBytes(const std::filesystem::path& path) -> std::string {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to read file: " + path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace weft::test
