#include "weft/weaver/marker_scanner.hpp"

#include <format>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/ir/annotation.hpp"
#include "weft/ir/verify.hpp"
#include "weft/weaver/property_names.hpp"
#include "weft/weaver/setter_rewriter.hpp"

namespace weft::weaver {

auto ToString(NotificationMode mode) -> std::string_view {
  switch (mode) {
    case NotificationMode::kExplicit:
      return "Explicit";
    case NotificationMode::kImplicit:
      return "Implicit";
  }
  return "Explicit";
}

MarkerScanner::MarkerScanner(
    ir::Module& module, ir::TypeResolver& resolver, const MarkerNames& markers)
    : targets_(module, resolver, markers), markers_(markers) {
}

auto MarkerScanner::ReadMode(
    const ir::TypeDef& type, const ir::Annotation& marker) const
    -> NotificationMode {
  if (!marker.HasArgs()) {
    return NotificationMode::kExplicit;
  }
  const ir::AnnotationArg& arg = marker.args.front();
  if (const auto* value = arg.AsInt()) {
    if (*value == 0) {
      return NotificationMode::kExplicit;
    }
    if (*value == 1) {
      return NotificationMode::kImplicit;
    }
  } else if (const auto* name = arg.AsString()) {
    if (*name == ToString(NotificationMode::kExplicit)) {
      return NotificationMode::kExplicit;
    }
    if (*name == ToString(NotificationMode::kImplicit)) {
      return NotificationMode::kImplicit;
    }
  }
  throw DiagnosticException(
      Diagnostic::Error(
          DeclSpan{.decl = type.FullName()},
          std::format(
              "invalid notification mode {} on type {}",
              ir::FormatAnnotationArg(arg), type.FullName()))
          .WithNote("expected Explicit (0) or Implicit (1)"));
}

auto MarkerScanner::ProcessType(ir::TypeDef& type) -> bool {
  ++stats_.types_scanned;
  bool woven = false;

  if (const ir::Annotation* notifier =
          type.annotations.Find(markers_.notifier)) {
    ++stats_.notifier_types;
    NotificationMode mode = ReadMode(type, *notifier);

    auto target = targets_.Resolve(type);
    if (!target) {
      throw DiagnosticException(
          Diagnostic::Error(
              DeclSpan{.decl = type.FullName()},
              std::format(
                  "cannot locate notify target for type {}", type.FullName()))
              .WithNote(
                  std::format(
                      "declare a method taking one string parameter marked "
                      "with {} on the type or one of its base types",
                      markers_.notify_target)));
    }
    spdlog::debug(
        "weaving {} in {} mode", type.FullName(), ToString(mode));

    for (auto& property : type.properties) {
      if (property->annotations.Has(markers_.suppress)) {
        spdlog::trace("{}: suppressed", property->FullName());
        continue;
      }
      woven |= WeaveProperty(*property, *target, mode);
    }
  }

  for (auto& nested : type.nested_types) {
    ProcessType(*nested);
  }
  return woven;
}

auto MarkerScanner::WeaveProperty(
    ir::PropertyDef& property, const ir::MethodRef& target,
    NotificationMode mode) -> bool {
  std::vector<NotifyName> names =
      ResolvePropertyNames(property, markers_.notify);

  if (names.empty() && mode == NotificationMode::kImplicit &&
      property.setter != nullptr && property.setter->IsPublic() &&
      !property.setter->is_static) {
    names.emplace_back(property.name);
  }
  if (names.empty()) {
    return false;
  }

  if (property.setter == nullptr) {
    // Read-only property: nothing to weave into.
    spdlog::trace("{}: no setter, skipped", property.FullName());
    return false;
  }
  ir::MethodDef& setter = *property.setter;
  if (setter.is_static) {
    // The woven call loads argument 0 as the instance.
    throw DiagnosticException(
        Diagnostic::Error(
            DeclSpan{.decl = setter.FullName()},
            std::format(
                "cannot weave notifications into static property {}",
                property.FullName()))
            .WithNote(
                std::format(
                    "remove the {} marker or make the property an instance "
                    "property",
                    markers_.notify)));
  }
  if (!setter.HasBody()) {
    throw DiagnosticException(
        Diagnostic::Error(
            DeclSpan{.decl = setter.FullName()},
            std::format(
                "cannot weave notifications into property {}: its setter "
                "has no body",
                property.FullName()))
            .WithNote("abstract and extern properties are not supported"));
  }
  if (auto problem = ir::CheckMethodBody(setter)) {
    throw DiagnosticException(
        Diagnostic::Error(
            DeclSpan{.decl = setter.FullName()},
            std::format(
                "cannot weave notifications into property {}: malformed "
                "setter body",
                property.FullName()))
            .WithNote(*problem));
  }

  auto calls = RewriteSetter(*setter.body, target, names);
  ir::VerifyMethodBody(setter, setter.FullName());

  ++stats_.properties_woven;
  stats_.calls_injected += calls;
  stats_.woven_properties.push_back(property.FullName());
  spdlog::trace("{}: {} call(s) injected", property.FullName(), calls);
  return true;
}

auto WeaveModule(
    ir::Module& module, ir::TypeResolver& resolver, const MarkerNames& markers)
    -> WeaveStats {
  MarkerScanner scanner(module, resolver, markers);
  for (const auto& type : module.Types()) {
    scanner.ProcessType(*type);
  }
  return scanner.Stats();
}

}  // namespace weft::weaver
