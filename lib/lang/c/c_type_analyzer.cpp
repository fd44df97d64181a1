// codetrace/lang/c/c_type_analyzer.cpp - Declared types of C variables and parameters
#include "c_passes.hpp"

namespace codetrace
{

namespace
{

void define_declarators(
  ts_ll::Node declaration, const std::string & base_type, const SourceFile & source,
  SymbolTable & table)
{
  ts_ll::Cursor cursor(declaration);
  if (!cursor.goto_first_child()) {
    return;
  }
  do {
    if (cursor.current_field_name() != "declarator") {
      continue;
    }
    const ts_ll::Node declarator = cursor.current_node();
    // Prototypes declare functions, not variables.
    if (declarator.kind() == "function_declarator") {
      continue;
    }
    std::string name = c_declarator_name(declarator, source);
    if (!name.empty()) {
      table.define(std::move(name), c_full_type(base_type, declarator));
    }
  } while (cursor.goto_next_sibling());
}

void collect(ts_ll::Node node, const SourceFile & source, SymbolTable & table)
{
  const std::string_view kind = node.kind();
  if (kind == "declaration" || kind == "parameter_declaration") {
    define_declarators(node, c_base_type(node, source), source, table);
  }

  for (uint32_t i = 0; i < node.named_child_count(); ++i) {
    collect(node.named_child(i), source, table);
  }
}

}  // namespace

SymbolTable analyze_c_types(const ParsedSource & parsed)
{
  SymbolTable table;
  collect(parsed.root(), parsed.source, table);
  return table;
}

}  // namespace codetrace
