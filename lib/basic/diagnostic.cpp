// codetrace/basic/diagnostic.cpp - DiagnosticBag and its builder
#include "codetrace/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>

namespace codetrace
{

namespace
{

/// Sort key: source diagnostics, then trace diagnostics, then the rest
std::tuple<int, uint32_t> position_key(const Diagnostic & d)
{
  if (d.has_source_range()) {
    return {0, d.range.get_begin().offset()};
  }
  if (d.trace_line) {
    return {1, *d.trace_line};
  }
  return {2, 0};
}

}  // namespace

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help)
{
  diagnostic_.help = std::move(help);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::at_trace_line(uint32_t line)
{
  diagnostic_.trace_line = line;
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(
  SourceRange range, std::string message, std::string note)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.message = std::move(message);
  d.range = range;
  d.note = std::move(note);
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  SourceRange range, std::string message, std::string note)
{
  Diagnostic d;
  d.severity = Severity::Warning;
  d.message = std::move(message);
  d.range = range;
  d.note = std::move(note);
  return {*this, std::move(d)};
}

void DiagnosticBag::add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

std::vector<Diagnostic> DiagnosticBag::with_severity(Severity severity) const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [severity](const Diagnostic & d) { return d.severity == severity; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::sorted() const
{
  std::vector<Diagnostic> result = diagnostics_;
  std::stable_sort(result.begin(), result.end(), [](const Diagnostic & a, const Diagnostic & b) {
    return position_key(a) < position_key(b);
  });
  return result;
}

}  // namespace codetrace
