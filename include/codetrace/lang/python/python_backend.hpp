// codetrace/lang/python/python_backend.hpp - Python language backend
#pragma once

#include <memory>

#include "codetrace/instrument/language_backend.hpp"
#include "codetrace/instrument/node_dispatcher.hpp"

namespace codetrace
{

class PythonInstrumentPass;

/**
 * Instruments Python modules with print-based trace statements.
 *
 * The call depth lives in a module-level `_codetrace_depth` variable that
 * every traced function declares `global`.
 */
class PythonBackend final : public LanguageBackend
{
public:
  PythonBackend();
  ~PythonBackend() override;

  PythonBackend(const PythonBackend &) = delete;
  PythonBackend & operator=(const PythonBackend &) = delete;

  [[nodiscard]] std::string_view name() const noexcept override { return "python"; }
  [[nodiscard]] std::string_view display_name() const noexcept override { return "Python"; }
  [[nodiscard]] std::vector<std::string> extensions() const override { return {".py"}; }
  [[nodiscard]] const TSLanguage * language() const override;

  [[nodiscard]] SymbolTable analyze_types(std::string_view source) const override;

  [[nodiscard]] Metadata collect_metadata(
    std::string_view source, const std::filesystem::path & path) const override;

  [[nodiscard]] std::string instrument(
    std::string_view source, const SymbolTable & symbols, const Metadata & metadata) const override;

private:
  std::unique_ptr<const NodeDispatcher<PythonInstrumentPass>> handlers_;
};

}  // namespace codetrace
