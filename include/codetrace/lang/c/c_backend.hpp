// codetrace/lang/c/c_backend.hpp - C language backend
#pragma once

#include <memory>

#include "codetrace/instrument/language_backend.hpp"
#include "codetrace/instrument/node_dispatcher.hpp"

namespace codetrace
{

class CInstrumentPass;

/**
 * Instruments C translation units with printf-based trace statements.
 *
 * The instrumented program keeps its call depth in a global
 * `__codetrace_depth` counter and disables stdout buffering in `main`.
 */
class CBackend final : public LanguageBackend
{
public:
  CBackend();
  ~CBackend() override;

  CBackend(const CBackend &) = delete;
  CBackend & operator=(const CBackend &) = delete;

  [[nodiscard]] std::string_view name() const noexcept override { return "c"; }
  [[nodiscard]] std::string_view display_name() const noexcept override { return "C"; }
  [[nodiscard]] std::vector<std::string> extensions() const override { return {".c", ".h"}; }
  [[nodiscard]] const TSLanguage * language() const override;

  [[nodiscard]] SymbolTable analyze_types(std::string_view source) const override;

  [[nodiscard]] Metadata collect_metadata(
    std::string_view source, const std::filesystem::path & path) const override;

  [[nodiscard]] std::string instrument(
    std::string_view source, const SymbolTable & symbols, const Metadata & metadata) const override;

private:
  std::unique_ptr<const NodeDispatcher<CInstrumentPass>> handlers_;
};

}  // namespace codetrace
