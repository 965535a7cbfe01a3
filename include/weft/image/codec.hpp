#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "weft/ir/module.hpp"

namespace weft::image {

inline constexpr int kImageVersion = 1;
inline constexpr const char* kModuleFormatTag = "weft-module";
inline constexpr const char* kSymbolFormatTag = "weft-symbols";

// Document <-> IR conversion. The document is the same whether it ends up
// as CBOR or JSON text on disk.
//
// Decoding throws DiagnosticException (host error) on malformed input; the
// message names the offending element.
auto EncodeModule(const ir::Module& module) -> nlohmann::json;
auto DecodeModule(const nlohmann::json& doc) -> std::unique_ptr<ir::Module>;

// Sequence points of every method body, keyed by type full name and method
// position so overloads stay distinct.
auto EncodeSymbols(const ir::Module& module) -> nlohmann::json;
void ApplySymbols(ir::Module& module, const nlohmann::json& doc);

}  // namespace weft::image
