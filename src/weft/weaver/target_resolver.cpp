#include "weft/weaver/target_resolver.hpp"

#include <format>
#include <optional>

#include <spdlog/spdlog.h>

#include "weft/common/diagnostic/diagnostic.hpp"

namespace weft::weaver {

TargetResolver::TargetResolver(
    ir::Module& module, ir::TypeResolver& resolver, const MarkerNames& markers)
    : module_(module), resolver_(resolver), markers_(markers) {
}

auto IsNotifyTargetShape(const ir::MethodDef& method) -> bool {
  return !method.is_static && method.params.size() == 1 &&
         method.params.front().type == ir::kStringTypeName;
}

auto TargetResolver::Resolve(const ir::TypeDef& type)
    -> std::optional<ir::MethodRef> {
  const ir::MethodDef* definition = FindDefinition(type);
  if (definition == nullptr) {
    return std::nullopt;
  }
  ir::MethodRef ref = ir::ImportMethod(module_, *definition);
  spdlog::debug(
      "notify target of {}: {}", type.FullName(), ref.ToString());
  return ref;
}

auto TargetResolver::FindDefinition(const ir::TypeDef& type)
    -> const ir::MethodDef* {
  if (auto it = found_.find(&type); it != found_.end()) {
    return it->second;
  }

  const ir::MethodDef* result = nullptr;
  for (const auto& method : type.methods) {
    if (!method->annotations.Has(markers_.notify_target)) {
      continue;
    }
    if (!IsNotifyTargetShape(*method)) {
      throw DiagnosticException(
          Diagnostic::Error(
              DeclSpan{.decl = method->FullName()},
              std::format(
                  "notify target {} must be an instance method taking exactly "
                  "one string parameter",
                  method->FullName())));
    }
    result = method.get();
    break;
  }

  if (result == nullptr && type.base) {
    if (!visiting_.insert(&type).second) {
      throw DiagnosticException(
          Diagnostic::Error(
              DeclSpan{.decl = type.FullName()},
              std::format("circular base type chain at {}", type.FullName())));
    }
    const ir::Module& declaring_module =
        type.module != nullptr ? *type.module : module_;
    auto base = resolver_.Resolve(declaring_module, *type.base);
    if (!base) {
      throw DiagnosticException(
          Diagnostic(base.error())
              .WithNote(
                  DeclSpan{.decl = type.FullName()},
                  std::format(
                      "while resolving base type {} of {}",
                      type.base->ToString(), type.FullName())));
    }
    result = FindDefinition(**base);
    visiting_.erase(&type);
  }

  found_.emplace(&type, result);
  return result;
}

}  // namespace weft::weaver
