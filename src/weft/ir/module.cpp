#include "weft/ir/module.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace weft::ir {

namespace {

constexpr std::array<std::pair<Visibility, std::string_view>, 4>
    kVisibilityNames = {{
        {Visibility::kPrivate, "private"},
        {Visibility::kAssembly, "assembly"},
        {Visibility::kFamily, "family"},
        {Visibility::kPublic, "public"},
    }};

auto FindNested(const TypeDef& type, std::string_view path) -> TypeDef* {
  auto slash = path.find('/');
  std::string_view head = path.substr(0, slash);
  TypeDef* nested = type.FindNestedType(head);
  if (nested == nullptr || slash == std::string_view::npos) {
    return nested;
  }
  return FindNested(*nested, path.substr(slash + 1));
}

}  // namespace

auto ToString(Visibility visibility) -> std::string_view {
  for (const auto& [vis, name] : kVisibilityNames) {
    if (vis == visibility) {
      return name;
    }
  }
  return "private";
}

auto ParseVisibility(std::string_view text) -> std::optional<Visibility> {
  for (const auto& [vis, name] : kVisibilityNames) {
    if (name == text) {
      return vis;
    }
  }
  return std::nullopt;
}

auto MethodDef::FullName() const -> std::string {
  if (declaring_type == nullptr) {
    return name;
  }
  return declaring_type->FullName() + "::" + name;
}

auto PropertyDef::FullName() const -> std::string {
  if (declaring_type == nullptr) {
    return name;
  }
  return declaring_type->FullName() + "::" + name;
}

auto TypeDef::FullName() const -> std::string {
  if (declaring_type != nullptr) {
    return declaring_type->FullName() + "/" + name;
  }
  if (ns.empty()) {
    return name;
  }
  return ns + "." + name;
}

auto TypeDef::FindMethod(std::string_view method_name) const -> MethodDef* {
  for (const auto& method : methods) {
    if (method->name == method_name) {
      return method.get();
    }
  }
  return nullptr;
}

auto TypeDef::FindProperty(std::string_view property_name) const
    -> PropertyDef* {
  for (const auto& property : properties) {
    if (property->name == property_name) {
      return property.get();
    }
  }
  return nullptr;
}

auto TypeDef::FindNestedType(std::string_view type_name) const -> TypeDef* {
  for (const auto& nested : nested_types) {
    if (nested->name == type_name) {
      return nested.get();
    }
  }
  return nullptr;
}

auto TypeDef::AddMethod(MethodDef method) -> MethodDef& {
  auto owned = std::make_unique<MethodDef>(std::move(method));
  owned->declaring_type = this;
  methods.push_back(std::move(owned));
  return *methods.back();
}

auto TypeDef::AddProperty(PropertyDef property) -> PropertyDef& {
  auto owned = std::make_unique<PropertyDef>(std::move(property));
  owned->declaring_type = this;
  properties.push_back(std::move(owned));
  return *properties.back();
}

auto TypeDef::AddNestedType(std::unique_ptr<TypeDef> nested) -> TypeDef& {
  nested->declaring_type = this;
  nested->AttachTo(module);
  nested_types.push_back(std::move(nested));
  return *nested_types.back();
}

void TypeDef::AttachTo(Module* owner) {
  module = owner;
  for (auto& method : methods) {
    method->declaring_type = this;
  }
  for (auto& property : properties) {
    property->declaring_type = this;
  }
  for (auto& nested : nested_types) {
    nested->declaring_type = this;
    nested->AttachTo(owner);
  }
}

auto Module::AddType(std::unique_ptr<TypeDef> type) -> TypeDef& {
  type->declaring_type = nullptr;
  type->AttachTo(this);
  types_.push_back(std::move(type));
  return *types_.back();
}

auto Module::FindType(std::string_view full_name) const -> TypeDef* {
  auto slash = full_name.find('/');
  std::string_view outer = full_name.substr(0, slash);
  for (const auto& type : types_) {
    if (type->FullName() != outer) {
      continue;
    }
    if (slash == std::string_view::npos) {
      return type.get();
    }
    return FindNested(*type, full_name.substr(slash + 1));
  }
  return nullptr;
}

void Module::AddReference(const std::string& module_name) {
  if (module_name.empty() || module_name == name_) {
    return;
  }
  if (std::ranges::find(references_, module_name) != references_.end()) {
    return;
  }
  references_.push_back(module_name);
}

auto MakeTypeRef(const TypeDef& type, const Module& from) -> TypeRef {
  std::string scope;
  if (type.module != nullptr && type.module != &from &&
      type.module->Name() != from.Name()) {
    scope = type.module->Name();
  }
  return TypeRef{.scope = std::move(scope), .full_name = type.FullName()};
}

auto ImportMethod(Module& into, const MethodDef& method) -> MethodRef {
  MethodRef ref;
  ref.declaring_type = MakeTypeRef(*method.declaring_type, into);
  ref.name = method.name;
  ref.return_type = method.return_type;
  ref.has_this = !method.is_static;
  for (const auto& param : method.params) {
    ref.param_types.push_back(param.type);
  }
  into.AddReference(ref.declaring_type.scope);
  return ref;
}

}  // namespace weft::ir
