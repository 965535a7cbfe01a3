#pragma once

#include <string>
#include <vector>

namespace weft::ir {

// Reference to a type, possibly in another module.
// scope: name of the defining module; empty means "the referencing module".
struct TypeRef {
  std::string scope;
  std::string full_name;

  [[nodiscard]] auto ToString() const -> std::string {
    if (scope.empty()) {
      return full_name;
    }
    return "[" + scope + "]" + full_name;
  }

  auto operator==(const TypeRef&) const -> bool = default;
};

struct FieldRef {
  TypeRef declaring_type;
  std::string name;
  std::string type;

  auto operator==(const FieldRef&) const -> bool = default;
};

// Call-site view of a method: enough to emit and verify a call without
// having the definition at hand.
struct MethodRef {
  TypeRef declaring_type;
  std::string name;
  std::string return_type = "void";
  std::vector<std::string> param_types;
  bool has_this = true;

  [[nodiscard]] auto ReturnsValue() const -> bool {
    return return_type != "void";
  }

  // e.g. "void [Core]Core.ViewModel::OnChanged(string)"
  [[nodiscard]] auto ToString() const -> std::string;

  auto operator==(const MethodRef&) const -> bool = default;
};

}  // namespace weft::ir
