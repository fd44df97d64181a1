// codetrace/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "codetrace/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>

namespace codetrace
{

namespace
{

std::string display_path(const std::filesystem::path & path)
{
  if (path.empty()) {
    return "<input>";
  }
  std::error_code ec;
  const auto rel = std::filesystem::relative(path, std::filesystem::current_path(), ec);
  return (ec || rel.empty()) ? path.string() : rel.string();
}

/// Tabs widened to 4 columns so the caret lines up
std::string expand_tabs(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r') {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile * source)
{
  print_header(diag);

  if (source != nullptr && diag.has_source_range()) {
    print_snippet(diag, *source);
  } else {
    if (diag.trace_line) {
      fmt::print(os_, "{} raw trace, line {}\n", gutter("  -->"), *diag.trace_line);
    }
    if (!diag.note.empty()) {
      print_trailer("note", diag.note);
    }
  }

  if (diag.help) {
    print_trailer("help", *diag.help);
  }
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceFile * source)
{
  for (const auto & d : diags.sorted()) {
    print(d, source);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const std::string_view name = diag.severity == Severity::Error ? "error" : "warning";
  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);

  if (!use_color_) {
    fmt::print(os_, "{}{}: {}\n", name, code, diag.message);
    return;
  }
  const rang::fg color = diag.severity == Severity::Error ? rang::fg::red : rang::fg::yellow;
  os_ << rang::style::bold << color << name << code << rang::fg::reset << ": " << diag.message
      << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_snippet(const Diagnostic & diag, const SourceFile & source)
{
  const FullSourceRange fr = source.get_full_range(diag.range);
  if (!fr.is_valid()) {
    return;
  }

  fmt::print(
    os_, "{} {}:{}:{}\n", gutter("  -->"), display_path(source.path()), fr.start_line,
    fr.start_column);
  fmt::print(os_, "{}\n", gutter("      |"));

  const std::string_view line = source.get_line(fr.start_line - 1);
  if (use_color_) {
    os_ << rang::fg::cyan << fmt::format(" {:>4} ", fr.start_line) << rang::fg::reset
        << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", fr.start_line);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  // Multi-line ranges are marked at their first column only
  const uint32_t width = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                           ? fr.end_column - fr.start_column
                           : 1;
  const std::string prefix =
    expand_tabs(line.substr(0, std::min<size_t>(fr.start_column - 1, line.size())));

  fmt::print(os_, "{} {}", gutter("      |"), std::string(prefix.size(), ' '));
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(width, '^'));
  if (!diag.note.empty()) {
    fmt::print(os_, " {}", diag.note);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n{}\n", gutter("      |"));
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{} {}: {}\n", gutter("   ="), kind, message);
}

std::string DiagnosticPrinter::gutter(std::string_view text) const
{
  if (use_color_) {
    return fmt::format("\033[1;36m{}\033[0m", text);
  }
  return std::string(text);
}

}  // namespace codetrace
