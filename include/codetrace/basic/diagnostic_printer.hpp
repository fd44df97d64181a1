// codetrace/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
//
// Source diagnostics print a caret under the offending text; trace
// diagnostics name the raw trace line instead.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "codetrace/basic/diagnostic.hpp"
#include "codetrace/basic/source_file.hpp"

namespace codetrace
{

/**
 * Prints diagnostics in Rust-style format:
 *
 *   warning[syntax]: syntax error
 *     --> samples/loop.c:5:12
 *      |
 *    5 |   while (i < 3 {
 *      |            ^ not understood by the parser
 *      |
 *
 *   warning[normalize]: malformed DECL record on line 4: DECL expects 5 fields, got 2
 *     --> raw trace, line 4
 *
 *   error[runtime]: Program timed out (30s limit)
 *      = help: raise runner.timeout_seconds in codetrace.yaml
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print one diagnostic.
   *
   * @param source Traced source the range refers to, or nullptr
   */
  void print(const Diagnostic & diag, const SourceFile * source = nullptr);

  /// Print a bag in DiagnosticBag::sorted() order
  void print_all(const DiagnosticBag & diags, const SourceFile * source = nullptr);

private:
  void print_header(const Diagnostic & diag);
  void print_snippet(const Diagnostic & diag, const SourceFile & source);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter(std::string_view text) const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace codetrace
