// codetrace/instrument/language_registry.cpp - Language registry implementation
#include "codetrace/instrument/language_registry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#include "codetrace/lang/c/c_backend.hpp"
#include "codetrace/lang/python/python_backend.hpp"

namespace codetrace
{

namespace
{

std::string normalize_extension(std::string_view extension)
{
  std::string out;
  out.reserve(extension.size() + 1);
  if (extension.empty() || extension.front() != '.') {
    out += '.';
  }
  for (const char c : extension) {
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

}  // namespace

LanguageRegistry LanguageRegistry::with_builtin_backends()
{
  LanguageRegistry registry;
  registry.register_backend(std::make_unique<CBackend>());
  registry.register_backend(std::make_unique<PythonBackend>());
  return registry;
}

void LanguageRegistry::register_backend(std::unique_ptr<LanguageBackend> backend)
{
  if (!backend) {
    return;
  }
  for (const auto & ext : backend->extensions()) {
    auto key = normalize_extension(ext);
    if (const auto it = by_extension_.find(key); it != by_extension_.end()) {
      spdlog::debug(
        "extension '{}' moves from backend '{}' to '{}'", key, it->second->name(),
        backend->name());
    }
    by_extension_[std::move(key)] = backend.get();
  }
  backends_.push_back(std::move(backend));
}

const LanguageBackend * LanguageRegistry::find(std::string_view extension) const
{
  if (extension.empty()) {
    return nullptr;
  }
  const auto it = by_extension_.find(normalize_extension(extension));
  return it == by_extension_.end() ? nullptr : it->second;
}

const LanguageBackend * LanguageRegistry::find_for_path(const std::filesystem::path & path) const
{
  return find(path.extension().string());
}

std::vector<std::string> LanguageRegistry::supported_extensions() const
{
  std::vector<std::string> out;
  out.reserve(by_extension_.size());
  for (const auto & [ext, backend] : by_extension_) {
    out.push_back(ext);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<const LanguageBackend *> LanguageRegistry::backends() const
{
  std::vector<const LanguageBackend *> out;
  out.reserve(backends_.size());
  for (const auto & b : backends_) {
    // Only backends still reachable through at least one extension.
    const bool reachable = std::any_of(
      by_extension_.begin(), by_extension_.end(),
      [&](const auto & entry) { return entry.second == b.get(); });
    if (reachable) {
      out.push_back(b.get());
    }
  }
  return out;
}

}  // namespace codetrace
