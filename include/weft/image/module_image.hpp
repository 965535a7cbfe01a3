#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/ir/module.hpp"

namespace weft::image {

inline constexpr std::string_view kModuleExtension = ".wmod";
inline constexpr std::string_view kSymbolExtension = ".wsym";

// Companion symbol file of an image: same stem, ".wsym" extension.
auto SymbolPathFor(const std::filesystem::path& image_path)
    -> std::filesystem::path;

// Load a module image. CBOR and JSON text are both accepted; the detected
// format is recorded on the module so WriteModule can preserve it.
// With read_symbols, the companion symbol file is applied when present.
auto ReadModule(const std::filesystem::path& path, bool read_symbols)
    -> Result<std::unique_ptr<ir::Module>>;

// Persist a module image (and its symbols when write_symbols is set).
// Both files are written to temporary siblings first and only renamed into
// place once every write succeeded; on failure the originals are untouched.
// Symbols keep the format they were read in.
auto WriteModule(
    const ir::Module& module, const std::filesystem::path& path,
    bool write_symbols) -> Result<void>;

}  // namespace weft::image
