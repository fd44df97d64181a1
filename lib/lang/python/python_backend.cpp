// codetrace/lang/python/python_backend.cpp - Python backend entry points and shared helpers
#include "codetrace/lang/python/python_backend.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <array>

#include "python_passes.hpp"

namespace codetrace
{

namespace
{

constexpr std::array<std::string_view, 36> k_reserved{
  "print",  "return",   "if",    "elif",  "else",   "while",  "for",    "in",
  "def",    "class",    "import", "from", "as",     "with",   "try",    "except",
  "finally", "raise",   "pass",  "break", "continue", "and",  "or",     "not",
  "is",     "None",     "True",  "False", "lambda", "yield",  "global", "nonlocal",
  "assert", "del",      "self",  k_python_depth_counter,
};

ParsedSource parse_python(std::string_view source)
{
  ParsedSource parsed = parse_source(tree_sitter_python(), std::string(source));
  if (!parsed.ok()) {
    throw InstrumentError("tree-sitter failed to parse Python source");
  }
  if (!parsed.diags.empty()) {
    spdlog::debug("Python source has {} syntax diagnostic(s); continuing", parsed.diags.size());
  }
  return parsed;
}

}  // namespace

// ============================================================================
// Shared helpers
// ============================================================================

std::string python_string_literal(std::string_view text)
{
  std::string out;
  out.reserve(text.size() + 2);
  out += '\'';
  for (const char c : text) {
    switch (c) {
      case '\'':
        out += "\\'";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
          out += fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
        } else {
          out += c;
        }
        break;
    }
  }
  out += '\'';
  return out;
}

std::string render_python_statement(const TraceStatement & stmt, std::string_view indent)
{
  std::string out(indent);
  out += "print(";
  for (const auto & field : stmt.fields()) {
    out += field.kind == TraceField::Kind::Literal ? python_string_literal(field.text) : field.text;
    out += ", ";
  }
  out += "sep='\\0')";
  return out;
}

std::string python_parameter_name(ts_ll::Node parameter, const SourceFile & source)
{
  const std::string_view kind = parameter.kind();
  if (kind == "identifier") {
    return std::string(parameter.text(source));
  }
  if (const ts_ll::Node name = parameter.child_by_field("name"); !name.is_null()) {
    return python_parameter_name(name, source);
  }
  // typed_parameter and splat patterns carry the identifier as a plain child
  if (is_one_of(kind, {"typed_parameter", "list_splat_pattern", "dictionary_splat_pattern"})) {
    const ts_ll::Node id = find_child(parameter, "identifier");
    if (!id.is_null()) {
      return std::string(id.text(source));
    }
    for (uint32_t i = 0; i < parameter.named_child_count(); ++i) {
      std::string name = python_parameter_name(parameter.named_child(i), source);
      if (!name.empty()) {
        return name;
      }
    }
  }
  return {};
}

bool is_python_reserved(std::string_view name)
{
  for (const auto & r : k_reserved) {
    if (r == name) {
      return true;
    }
  }
  return false;
}

// ============================================================================
// PythonBackend
// ============================================================================

PythonBackend::PythonBackend()
{
  auto handlers = std::make_unique<NodeDispatcher<PythonInstrumentPass>>();
  PythonInstrumentPass::register_handlers(*handlers);
  handlers_ = std::move(handlers);
}

PythonBackend::~PythonBackend() = default;

const TSLanguage * PythonBackend::language() const { return tree_sitter_python(); }

SymbolTable PythonBackend::analyze_types(std::string_view source) const
{
  return analyze_python_types(parse_python(source));
}

Metadata PythonBackend::collect_metadata(
  std::string_view source, const std::filesystem::path & path) const
{
  return collect_python_metadata(parse_python(source), path);
}

std::string PythonBackend::instrument(
  std::string_view source, const SymbolTable & symbols, const Metadata & metadata) const
{
  const ParsedSource parsed = parse_python(source);
  PythonInstrumentPass pass(parsed.source, symbols, metadata);
  handlers_->walk(pass, parsed.root());
  return pass.finish();
}

}  // namespace codetrace
