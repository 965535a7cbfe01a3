#include "weft/weaver/property_names.hpp"

#include <format>
#include <string_view>
#include <vector>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/ir/annotation.hpp"

namespace weft::weaver {

namespace {

[[noreturn]] void ThrowBadArgument(
    const ir::PropertyDef& property, const ir::AnnotationArg& arg) {
  throw DiagnosticException(
      Diagnostic::Error(
          DeclSpan{.decl = property.FullName()},
          std::format(
              "notify marker on property '{}' expects property names, got {}",
              property.name, ir::FormatAnnotationArg(arg))));
}

auto ToName(const ir::PropertyDef& property, const ir::AnnotationArg& arg)
    -> NotifyName {
  if (arg.IsNull()) {
    return std::nullopt;
  }
  if (const auto* str = arg.AsString()) {
    return *str;
  }
  ThrowBadArgument(property, arg);
}

}  // namespace

auto ResolvePropertyNames(
    const ir::PropertyDef& property, std::string_view notify_marker)
    -> std::vector<NotifyName> {
  const ir::Annotation* marker = property.annotations.Find(notify_marker);
  if (marker == nullptr) {
    return {};
  }
  if (!marker->HasArgs()) {
    return {property.name};
  }

  // Several positional arguments read as one flattened list.
  if (marker->args.size() > 1) {
    std::vector<NotifyName> names;
    names.reserve(marker->args.size());
    for (const auto& item : marker->args) {
      names.push_back(ToName(property, item));
    }
    return names;
  }

  const ir::AnnotationArg& arg = marker->args.front();
  if (arg.IsNull()) {
    return {std::nullopt};
  }
  if (const auto* str = arg.AsString()) {
    return {*str};
  }
  const auto* list = arg.AsList();
  if (list == nullptr) {
    ThrowBadArgument(property, arg);
  }
  if (list->empty()) {
    return {property.name};
  }

  std::vector<NotifyName> names;
  names.reserve(list->size());
  for (const auto& item : *list) {
    names.push_back(ToName(property, item));
  }
  return names;
}

}  // namespace weft::weaver
