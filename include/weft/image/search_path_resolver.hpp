#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/ir/module.hpp"
#include "weft/ir/resolver.hpp"

namespace weft::image {

// Resolves types of referenced modules by loading "<scope>.wmod" from a list
// of search directories. Each referenced module is loaded at most once per
// resolver; lookups are in registration order.
class SearchPathResolver final : public ir::TypeResolver {
 public:
  SearchPathResolver() = default;

  void AddSearchDirectory(std::filesystem::path dir);

  [[nodiscard]] auto SearchDirectories() const
      -> const std::vector<std::filesystem::path>& {
    return search_dirs_;
  }

  auto Resolve(const ir::Module& from, const ir::TypeRef& ref)
      -> Result<const ir::TypeDef*> override;

  // Loaded module by name, loading it on first use.
  auto LoadModule(const std::string& name) -> Result<const ir::Module*>;

 private:
  std::vector<std::filesystem::path> search_dirs_;
  std::map<std::string, std::unique_ptr<ir::Module>, std::less<>> cache_;
};

}  // namespace weft::image
