// codetrace/lang/python/python_type_analyzer.cpp - Names bound by a Python module
#include "python_passes.hpp"

namespace codetrace
{

namespace
{

void define_target(ts_ll::Node target, const SourceFile & source, SymbolTable & table)
{
  if (target.kind() == "identifier") {
    table.define(std::string(target.text(source)), std::string(k_python_object_type));
    return;
  }
  if (is_one_of(target.kind(), {"pattern_list", "tuple_pattern", "list_pattern"})) {
    for (uint32_t i = 0; i < target.named_child_count(); ++i) {
      define_target(target.named_child(i), source, table);
    }
  }
}

void collect(ts_ll::Node node, const SourceFile & source, SymbolTable & table)
{
  const std::string_view kind = node.kind();
  if (kind == "assignment" || kind == "augmented_assignment" || kind == "for_statement") {
    define_target(node.child_by_field("left"), source, table);
  } else if (kind == "function_definition") {
    const ts_ll::Node params = node.child_by_field("parameters");
    for (uint32_t i = 0; i < params.named_child_count(); ++i) {
      std::string name = python_parameter_name(params.named_child(i), source);
      if (!name.empty()) {
        table.define(std::move(name), std::string(k_python_object_type));
      }
    }
  }

  for (uint32_t i = 0; i < node.named_child_count(); ++i) {
    collect(node.named_child(i), source, table);
  }
}

}  // namespace

SymbolTable analyze_python_types(const ParsedSource & parsed)
{
  SymbolTable table;
  collect(parsed.root(), parsed.source, table);
  return table;
}

}  // namespace codetrace
