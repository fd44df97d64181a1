// codetrace/instrument/language_registry.hpp - File extension to backend lookup
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "codetrace/instrument/language_backend.hpp"

namespace codetrace
{

/**
 * Owns the language backends and maps file extensions to them.
 *
 * Registering a backend for an extension that is already taken replaces
 * the previous mapping.
 */
class LanguageRegistry
{
public:
  LanguageRegistry() = default;

  LanguageRegistry(const LanguageRegistry &) = delete;
  LanguageRegistry & operator=(const LanguageRegistry &) = delete;
  LanguageRegistry(LanguageRegistry &&) = default;
  LanguageRegistry & operator=(LanguageRegistry &&) = default;

  /// Registry with the C and Python backends
  [[nodiscard]] static LanguageRegistry with_builtin_backends();

  void register_backend(std::unique_ptr<LanguageBackend> backend);

  /**
   * Backend for an extension (with or without the leading dot, case-insensitive).
   *
   * @return nullptr if the extension is not supported
   */
  [[nodiscard]] const LanguageBackend * find(std::string_view extension) const;

  /// Backend for a file path, by its extension; nullptr if unsupported
  [[nodiscard]] const LanguageBackend * find_for_path(const std::filesystem::path & path) const;

  /// Sorted list of supported extensions
  [[nodiscard]] std::vector<std::string> supported_extensions() const;

  [[nodiscard]] std::vector<const LanguageBackend *> backends() const;

private:
  std::vector<std::unique_ptr<LanguageBackend>> backends_;
  std::unordered_map<std::string, const LanguageBackend *> by_extension_;
};

}  // namespace codetrace
