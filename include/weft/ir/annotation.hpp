#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace weft::ir {

struct AnnotationArg;

using AnnotationList = std::vector<AnnotationArg>;

// Constructor argument recorded on an annotation. Mirrors what a compiler can
// bake into metadata: null, scalars, strings and (possibly nested) arrays.
struct AnnotationArg {
  std::variant<std::monostate, bool, int64_t, std::string, AnnotationList>
      value;

  static auto Null() -> AnnotationArg {
    return AnnotationArg{.value = std::monostate{}};
  }
  static auto Bool(bool b) -> AnnotationArg {
    return AnnotationArg{.value = b};
  }
  static auto Int(int64_t i) -> AnnotationArg {
    return AnnotationArg{.value = i};
  }
  static auto String(std::string s) -> AnnotationArg {
    return AnnotationArg{.value = std::move(s)};
  }
  static auto List(AnnotationList items) -> AnnotationArg {
    return AnnotationArg{.value = std::move(items)};
  }

  [[nodiscard]] auto IsNull() const -> bool {
    return std::holds_alternative<std::monostate>(value);
  }
  [[nodiscard]] auto AsString() const -> const std::string* {
    return std::get_if<std::string>(&value);
  }
  [[nodiscard]] auto AsInt() const -> const int64_t* {
    return std::get_if<int64_t>(&value);
  }
  [[nodiscard]] auto AsList() const -> const AnnotationList* {
    return std::get_if<AnnotationList>(&value);
  }

  auto operator==(const AnnotationArg&) const -> bool = default;
};

// A declarative marker attached to a type, method or property.
struct Annotation {
  std::string type_name;
  std::vector<AnnotationArg> args;

  [[nodiscard]] auto HasArgs() const -> bool {
    return !args.empty();
  }
};

// Ordered marker registry of one IR node.
class AnnotationSet {
 public:
  void Add(Annotation annotation) {
    items_.push_back(std::move(annotation));
  }

  // First annotation of the given type, or nullptr.
  [[nodiscard]] auto Find(std::string_view type_name) const
      -> const Annotation* {
    for (const auto& item : items_) {
      if (item.type_name == type_name) {
        return &item;
      }
    }
    return nullptr;
  }

  [[nodiscard]] auto Has(std::string_view type_name) const -> bool {
    return Find(type_name) != nullptr;
  }

  [[nodiscard]] auto begin() const {
    return items_.begin();
  }
  [[nodiscard]] auto end() const {
    return items_.end();
  }

 private:
  std::vector<Annotation> items_;
};

// Render an argument the way it would read in source, e.g. ["A", null].
auto FormatAnnotationArg(const AnnotationArg& arg) -> std::string;

}  // namespace weft::ir
