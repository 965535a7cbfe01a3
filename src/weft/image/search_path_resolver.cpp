#include "weft/image/search_path_resolver.hpp"

#include <algorithm>
#include <expected>
#include <filesystem>
#include <format>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "weft/image/module_image.hpp"

namespace weft::image {

namespace fs = std::filesystem;

void SearchPathResolver::AddSearchDirectory(fs::path dir) {
  if (dir.empty()) {
    return;
  }
  if (std::ranges::find(search_dirs_, dir) != search_dirs_.end()) {
    return;
  }
  search_dirs_.push_back(std::move(dir));
}

auto SearchPathResolver::LoadModule(const std::string& name)
    -> Result<const ir::Module*> {
  if (auto it = cache_.find(name); it != cache_.end()) {
    return it->second.get();
  }

  std::string file_name = name + std::string(kModuleExtension);
  for (const auto& dir : search_dirs_) {
    fs::path candidate = dir / file_name;
    if (!fs::exists(candidate)) {
      continue;
    }
    auto module = ReadModule(candidate, false);
    if (!module) {
      return std::unexpected(module.error());
    }
    if ((*module)->Name() != name) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "'{}' contains module '{}', expected '{}'",
                  candidate.string(), (*module)->Name(), name)));
    }
    spdlog::debug("resolved module '{}' to '{}'", name, candidate.string());
    const ir::Module* loaded = module->get();
    cache_.emplace(name, std::move(*module));
    return loaded;
  }

  std::string searched;
  for (const auto& dir : search_dirs_) {
    if (!searched.empty()) {
      searched += ", ";
    }
    searched += dir.string();
  }
  return std::unexpected(
      Diagnostic::HostError(
          std::format("cannot locate module '{}'", name))
          .WithNote(
              std::format(
                  "searched: {}", searched.empty() ? "<nothing>" : searched)));
}

auto SearchPathResolver::Resolve(
    const ir::Module& from, const ir::TypeRef& ref)
    -> Result<const ir::TypeDef*> {
  const ir::Module* target = &from;
  if (!ref.scope.empty() && ref.scope != from.Name()) {
    auto loaded = LoadModule(ref.scope);
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
    target = *loaded;
  }

  const ir::TypeDef* type = target->FindType(ref.full_name);
  if (type == nullptr) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "type '{}' not found in module '{}'", ref.full_name,
                target->Name())));
  }
  return type;
}

}  // namespace weft::image
