#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "weft/ir/annotation.hpp"
#include "weft/ir/body.hpp"
#include "weft/ir/reference.hpp"

namespace weft::ir {

class Module;
struct TypeDef;

// Primitive name used for the semantic string type in signatures.
inline constexpr std::string_view kStringTypeName = "string";
inline constexpr std::string_view kVoidTypeName = "void";

enum class Visibility : uint8_t { kPrivate, kAssembly, kFamily, kPublic };

auto ToString(Visibility visibility) -> std::string_view;
auto ParseVisibility(std::string_view text) -> std::optional<Visibility>;

struct Parameter {
  std::string name;
  std::string type;
};

struct FieldDef {
  std::string name;
  std::string type;
  Visibility visibility = Visibility::kPrivate;
  bool is_static = false;
};

struct MethodDef {
  std::string name;
  TypeDef* declaring_type = nullptr;
  Visibility visibility = Visibility::kPrivate;
  bool is_static = false;
  bool is_virtual = false;
  bool is_abstract = false;
  bool is_extern = false;
  std::string return_type = "void";
  std::vector<Parameter> params;
  AnnotationSet annotations;
  // Absent for abstract and extern methods.
  std::optional<MethodBody> body;

  [[nodiscard]] auto HasBody() const -> bool {
    return body.has_value();
  }
  [[nodiscard]] auto IsPublic() const -> bool {
    return visibility == Visibility::kPublic;
  }

  // "App.Person::set_Name"
  [[nodiscard]] auto FullName() const -> std::string;
};

struct PropertyDef {
  std::string name;
  std::string type;
  TypeDef* declaring_type = nullptr;
  // Accessors are sibling methods owned by the declaring type.
  MethodDef* getter = nullptr;
  MethodDef* setter = nullptr;
  AnnotationSet annotations;

  // "App.Person::Name"
  [[nodiscard]] auto FullName() const -> std::string;
};

struct TypeDef {
  std::string ns;
  std::string name;
  Visibility visibility = Visibility::kPublic;
  std::optional<TypeRef> base;
  AnnotationSet annotations;
  std::vector<FieldDef> fields;
  std::vector<std::unique_ptr<MethodDef>> methods;
  std::vector<std::unique_ptr<PropertyDef>> properties;
  std::vector<std::unique_ptr<TypeDef>> nested_types;

  // Back links, maintained by Module::AddType and AddNestedType.
  Module* module = nullptr;
  TypeDef* declaring_type = nullptr;

  // "Ns.Name" for top-level types, "Ns.Outer/Inner" for nested ones.
  [[nodiscard]] auto FullName() const -> std::string;

  [[nodiscard]] auto FindMethod(std::string_view method_name) const
      -> MethodDef*;
  [[nodiscard]] auto FindProperty(std::string_view property_name) const
      -> PropertyDef*;
  [[nodiscard]] auto FindNestedType(std::string_view type_name) const
      -> TypeDef*;

  auto AddMethod(MethodDef method) -> MethodDef&;
  auto AddProperty(PropertyDef property) -> PropertyDef&;
  auto AddNestedType(std::unique_ptr<TypeDef> nested) -> TypeDef&;

  // Re-point module back links of this type and everything nested in it.
  void AttachTo(Module* owner);
};

enum class ImageFormat : uint8_t { kCbor, kJson };

// A compiled module: the unit that is loaded, woven and written back.
// Types hold back pointers into the module, so it is neither copyable nor
// movable; pass it around by reference or unique_ptr.
class Module {
 public:
  explicit Module(std::string name) : name_(std::move(name)) {
  }

  Module(const Module&) = delete;
  auto operator=(const Module&) -> Module& = delete;
  Module(Module&&) = delete;
  auto operator=(Module&&) -> Module& = delete;
  ~Module() = default;

  [[nodiscard]] auto Name() const -> const std::string& {
    return name_;
  }

  [[nodiscard]] auto Types() const
      -> const std::vector<std::unique_ptr<TypeDef>>& {
    return types_;
  }

  auto AddType(std::unique_ptr<TypeDef> type) -> TypeDef&;

  // Look up a type by full name, including nested types ("Ns.Outer/Inner").
  [[nodiscard]] auto FindType(std::string_view full_name) const -> TypeDef*;

  [[nodiscard]] auto References() const -> const std::vector<std::string>& {
    return references_;
  }
  // Adds a module reference unless already present or naming this module.
  void AddReference(const std::string& module_name);

  [[nodiscard]] auto Format() const -> ImageFormat {
    return format_;
  }
  void SetFormat(ImageFormat format) {
    format_ = format;
  }

  // Format of the symbol file the module was read with; the image format
  // when no symbol file was read.
  [[nodiscard]] auto SymbolFormat() const -> ImageFormat {
    return symbol_format_.value_or(format_);
  }
  void SetSymbolFormat(ImageFormat format) {
    symbol_format_ = format;
  }

 private:
  std::string name_;
  std::vector<std::string> references_;
  std::vector<std::unique_ptr<TypeDef>> types_;
  ImageFormat format_ = ImageFormat::kCbor;
  std::optional<ImageFormat> symbol_format_;
};

// Reference to `type` as written from inside `from`.
auto MakeTypeRef(const TypeDef& type, const Module& from) -> TypeRef;

// Build a call-site reference to `method` usable from module `into`. When the
// method lives in another module, its module is registered as a reference of
// `into`.
auto ImportMethod(Module& into, const MethodDef& method) -> MethodRef;

}  // namespace weft::ir
