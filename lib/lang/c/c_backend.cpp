// codetrace/lang/c/c_backend.cpp - C backend entry points and shared helpers
#include "codetrace/lang/c/c_backend.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <array>

#include "c_passes.hpp"

namespace codetrace
{

namespace
{

constexpr std::array<std::string_view, 19> k_reserved{
  "printf", "main",  "return", "if",      "while",  "for",  "else",
  "switch", "case",  "break",  "continue", "sizeof", "typedef", "struct",
  "enum",   "union", "goto",   "do",      k_c_depth_counter,
};

ParsedSource parse_c(std::string_view source)
{
  ParsedSource parsed = parse_source(tree_sitter_c(), std::string(source));
  if (!parsed.ok()) {
    throw InstrumentError("tree-sitter failed to parse C source");
  }
  if (!parsed.diags.empty()) {
    spdlog::debug("C source has {} syntax diagnostic(s); continuing", parsed.diags.size());
  }
  return parsed;
}

}  // namespace

// ============================================================================
// Shared helpers
// ============================================================================

std::string_view c_format_specifier(std::string_view type_tag)
{
  switch (classify_type(type_tag)) {
    case TypeCategory::Integer:
      return "%d";
    case TypeCategory::Float:
      return "%f";
    case TypeCategory::Double:
      return "%lf";
    case TypeCategory::Char:
      return "%c";
    case TypeCategory::String:
      return "%s";
    case TypeCategory::Pointer:
      return "%p";
    case TypeCategory::Long:
      return "%ld";
    case TypeCategory::Generic:
      break;
  }
  return "%d";
}

std::string c_string_literal(std::string_view text)
{
  std::string out;
  out.reserve(text.size() + 2);
  out += '"';
  for (const char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
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
        if (static_cast<unsigned char>(c) < 0x20) {
          out += fmt::format("\\{:03o}", static_cast<unsigned char>(c));
        } else {
          out += c;
        }
        break;
    }
  }
  out += '"';
  return out;
}

std::string render_c_statement(const TraceStatement & stmt)
{
  std::string out = "    ";
  bool first = true;
  for (const auto & field : stmt.fields()) {
    if (!first) {
      out += "putchar(0); ";
    }
    first = false;
    if (field.kind == TraceField::Kind::Literal) {
      out += fmt::format("printf(\"%s\", {}); ", c_string_literal(field.text));
    } else {
      const std::string_view spec = field.format.empty() ? "%d" : field.format;
      out += fmt::format("printf(\"{}\", {}); ", spec, field.text);
    }
  }
  out += "putchar('\\n');";
  return out;
}

std::string c_declarator_name(ts_ll::Node declarator, const SourceFile & source)
{
  if (declarator.is_null()) {
    return {};
  }
  if (declarator.kind() == "identifier") {
    return std::string(declarator.text(source));
  }
  if (const ts_ll::Node inner = declarator.child_by_field("declarator"); !inner.is_null()) {
    return c_declarator_name(inner, source);
  }
  for (uint32_t i = 0; i < declarator.named_child_count(); ++i) {
    std::string name = c_declarator_name(declarator.named_child(i), source);
    if (!name.empty()) {
      return name;
    }
  }
  return {};
}

std::string c_base_type(ts_ll::Node declaration, const SourceFile & source)
{
  if (const ts_ll::Node type = declaration.child_by_field("type"); !type.is_null()) {
    return std::string(type.text(source));
  }
  for (uint32_t i = 0; i < declaration.child_count(); ++i) {
    const ts_ll::Node c = declaration.child(i);
    const std::string_view kind = c.kind();
    if (ends_with(kind, "_type") || kind == "type_identifier" || kind == "primitive_type") {
      return std::string(c.text(source));
    }
  }
  return "int";
}

std::string c_full_type(std::string base_type, ts_ll::Node declarator)
{
  if (declarator.kind() == "init_declarator") {
    declarator = declarator.child_by_field("declarator");
  }
  while (declarator.kind() == "pointer_declarator" || declarator.kind() == "array_declarator") {
    base_type += " *";
    declarator = declarator.child_by_field("declarator");
  }
  return base_type;
}

ts_ll::Node c_function_declarator(ts_ll::Node function_definition)
{
  ts_ll::Node d = function_definition.child_by_field("declarator");
  while (!d.is_null() && d.kind() != "function_declarator") {
    const ts_ll::Node inner = d.child_by_field("declarator");
    d = inner.is_null() ? d.named_child(0) : inner;
  }
  return d;
}

bool is_c_reserved(std::string_view name)
{
  for (const auto & r : k_reserved) {
    if (r == name) {
      return true;
    }
  }
  return false;
}

// ============================================================================
// CBackend
// ============================================================================

CBackend::CBackend()
{
  auto handlers = std::make_unique<NodeDispatcher<CInstrumentPass>>();
  CInstrumentPass::register_handlers(*handlers);
  handlers_ = std::move(handlers);
}

CBackend::~CBackend() = default;

const TSLanguage * CBackend::language() const { return tree_sitter_c(); }

SymbolTable CBackend::analyze_types(std::string_view source) const
{
  return analyze_c_types(parse_c(source));
}

Metadata CBackend::collect_metadata(
  std::string_view source, const std::filesystem::path & path) const
{
  return collect_c_metadata(parse_c(source), path);
}

std::string CBackend::instrument(
  std::string_view source, const SymbolTable & symbols, const Metadata & metadata) const
{
  const ParsedSource parsed = parse_c(source);
  CInstrumentPass pass(parsed.source, symbols, metadata);
  handlers_->walk(pass, parsed.root());
  return pass.finish();
}

}  // namespace codetrace
