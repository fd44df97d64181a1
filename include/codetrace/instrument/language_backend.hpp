// codetrace/instrument/language_backend.hpp - Per-language instrumentation contract
#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "codetrace/instrument/metadata.hpp"
#include "codetrace/instrument/symbol_table.hpp"
#include "codetrace/syntax/ts_ll.hpp"

namespace codetrace
{

/**
 * Hard failure while analyzing or instrumenting a file.
 *
 * Uninterpretable CST nodes never raise this; they are skipped.
 */
class InstrumentError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * A source language that can be instrumented.
 *
 * Implementations are stateless after construction, so one instance may
 * serve any number of files.
 */
class LanguageBackend
{
public:
  virtual ~LanguageBackend() = default;

  /// Short language identifier ("c", "python"); also the toolchain key
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  /// Display name stored in metadata ("C", "Python")
  [[nodiscard]] virtual std::string_view display_name() const noexcept = 0;

  /// File extensions handled by this backend, including the dot
  [[nodiscard]] virtual std::vector<std::string> extensions() const = 0;

  /// Tree-sitter grammar for this language
  [[nodiscard]] virtual const TSLanguage * language() const = 0;

  /**
   * Collect the declared type of every variable and parameter.
   */
  [[nodiscard]] virtual SymbolTable analyze_types(std::string_view source) const = 0;

  /**
   * Collect file attributes and structural counts.
   *
   * @param source File content
   * @param path Path of the file on disk (stat'ed for size, mode and times)
   * @throws InstrumentError if the file cannot be stat'ed
   */
  [[nodiscard]] virtual Metadata collect_metadata(
    std::string_view source, const std::filesystem::path & path) const = 0;

  /**
   * Produce the instrumented program text.
   *
   * @param source File content
   * @param symbols Result of analyze_types() for the same content
   * @param metadata Result of collect_metadata() for the same content
   */
  [[nodiscard]] virtual std::string instrument(
    std::string_view source, const SymbolTable & symbols, const Metadata & metadata) const = 0;
};

}  // namespace codetrace
