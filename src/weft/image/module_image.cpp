#include "weft/image/module_image.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/image/codec.hpp"

namespace weft::image {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

auto ReadBytes(const fs::path& path) -> Result<std::vector<uint8_t>> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot open '{}' for reading", path.string())));
  }
  std::vector<uint8_t> bytes(
      (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("error while reading '{}'", path.string())));
  }
  return bytes;
}

auto LooksLikeJsonText(const std::vector<uint8_t>& bytes) -> bool {
  for (uint8_t byte : bytes) {
    if (byte == ' ' || byte == '\t' || byte == '\n' || byte == '\r') {
      continue;
    }
    return byte == '{';
  }
  return false;
}

auto ParseDocument(const fs::path& path, ir::ImageFormat& format)
    -> Result<json> {
  auto bytes = ReadBytes(path);
  if (!bytes) {
    return std::unexpected(bytes.error());
  }
  if (bytes->empty()) {
    return std::unexpected(
        Diagnostic::HostError(std::format("'{}' is empty", path.string())));
  }

  try {
    if (LooksLikeJsonText(*bytes)) {
      format = ir::ImageFormat::kJson;
      return json::parse(bytes->begin(), bytes->end());
    }
    format = ir::ImageFormat::kCbor;
    return json::from_cbor(*bytes);
  } catch (const json::exception& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot decode '{}': {}", path.string(), e.what())));
  }
}

auto Serialize(const json& doc, ir::ImageFormat format) -> std::string {
  if (format == ir::ImageFormat::kJson) {
    return doc.dump(2) + "\n";
  }
  std::vector<uint8_t> cbor = json::to_cbor(doc);
  return std::string(cbor.begin(), cbor.end());
}

auto TempPathFor(const fs::path& path) -> fs::path {
  fs::path tmp = path;
  tmp += ".tmp";
  return tmp;
}

void RemoveQuietly(const fs::path& path) {
  std::error_code ignored;
  fs::remove(path, ignored);
}

// Writes the temporary sibling of `path`; nothing is renamed yet.
auto WriteTemp(const fs::path& path, const std::string& content)
    -> Result<void> {
  fs::path tmp = TempPathFor(path);
  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot open '{}' for writing", tmp.string())));
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  if (!out) {
    out.close();
    RemoveQuietly(tmp);
    return std::unexpected(
        Diagnostic::HostError(
            std::format("error while writing '{}'", tmp.string())));
  }
  return {};
}

auto Commit(const fs::path& path) -> Result<void> {
  fs::path tmp = TempPathFor(path);
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    RemoveQuietly(tmp);
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "cannot replace '{}': {}", path.string(), ec.message())));
  }
  return {};
}

}  // namespace

auto SymbolPathFor(const fs::path& image_path) -> fs::path {
  fs::path symbols = image_path;
  symbols.replace_extension(kSymbolExtension);
  return symbols;
}

auto ReadModule(const fs::path& path, bool read_symbols)
    -> Result<std::unique_ptr<ir::Module>> {
  ir::ImageFormat format = ir::ImageFormat::kCbor;
  auto doc = ParseDocument(path, format);
  if (!doc) {
    return std::unexpected(doc.error());
  }

  std::unique_ptr<ir::Module> module;
  try {
    module = DecodeModule(*doc);
  } catch (const DiagnosticException& e) {
    return std::unexpected(
        Diagnostic(e.GetDiagnostic()).WithNote(
            std::format("while reading '{}'", path.string())));
  } catch (const json::type_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("malformed module image '{}': {}", path.string(),
                        e.what())));
  }
  module->SetFormat(format);

  if (!read_symbols) {
    return module;
  }

  fs::path symbol_path = SymbolPathFor(path);
  if (!fs::exists(symbol_path)) {
    spdlog::warn(
        "no symbol file '{}' next to '{}', continuing without symbols",
        symbol_path.string(), path.string());
    return module;
  }

  ir::ImageFormat symbol_format = ir::ImageFormat::kCbor;
  auto symbols = ParseDocument(symbol_path, symbol_format);
  if (!symbols) {
    return std::unexpected(symbols.error());
  }
  try {
    ApplySymbols(*module, *symbols);
  } catch (const DiagnosticException& e) {
    return std::unexpected(
        Diagnostic(e.GetDiagnostic()).WithNote(
            std::format("while reading '{}'", symbol_path.string())));
  } catch (const json::type_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("malformed symbol file '{}': {}",
                        symbol_path.string(), e.what())));
  }
  module->SetSymbolFormat(symbol_format);
  spdlog::debug("applied symbols from '{}'", symbol_path.string());
  return module;
}

auto WriteModule(
    const ir::Module& module, const fs::path& path, bool write_symbols)
    -> Result<void> {
  std::vector<fs::path> targets = {path};
  if (write_symbols) {
    targets.push_back(SymbolPathFor(path));
  }

  auto discard = [&](size_t from) {
    for (size_t i = from; i < targets.size(); ++i) {
      RemoveQuietly(TempPathFor(targets[i]));
    }
  };

  // Every temporary is complete before any target is replaced.
  auto written =
      WriteTemp(path, Serialize(EncodeModule(module), module.Format()));
  if (written && write_symbols) {
    written = WriteTemp(
        targets[1],
        Serialize(EncodeSymbols(module), module.SymbolFormat()));
  }
  if (!written) {
    discard(0);
    return written;
  }

  for (size_t i = 0; i < targets.size(); ++i) {
    if (auto committed = Commit(targets[i]); !committed) {
      discard(i + 1);
      return committed;
    }
  }
  return {};
}

}  // namespace weft::image
