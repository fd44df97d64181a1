// codetrace/basic/diagnostic.hpp - Warnings and errors raised while tracing a file
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "codetrace/basic/source_file.hpp"

namespace codetrace
{

enum class Severity : uint8_t {
  Error,
  Warning,
};

/**
 * One warning or error.
 *
 * Syntax diagnostics point into the traced source through `range`; decoder
 * diagnostics point at a line of the raw trace through `trace_line`. Stage
 * failures carry neither.
 */
struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // "syntax", "normalize", or a stage name
  std::string message;

  SourceRange range;
  std::string note;  // printed beside the caret, or on its own line without a range

  /// 1-based line of the raw trace output
  std::optional<uint32_t> trace_line;

  std::optional<std::string> help;

  [[nodiscard]] bool has_source_range() const noexcept { return range.is_valid(); }
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fills in a diagnostic and hands it to its bag when it goes out of scope.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_help(std::string help);
  DiagnosticBuilder & at_trace_line(uint32_t line);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(SourceRange range, std::string message, std::string note = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string note = "");

  void add(Diagnostic diag);

  /// Append everything from `other`, leaving it empty
  void merge(DiagnosticBag && other);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) != 0; }
  [[nodiscard]] bool has_warnings() const { return count(Severity::Warning) != 0; }

  [[nodiscard]] std::vector<Diagnostic> with_severity(Severity severity) const;

  /**
   * Source diagnostics by position, then trace diagnostics by trace line,
   * then the rest in report order.
   */
  [[nodiscard]] std::vector<Diagnostic> sorted() const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace codetrace
