// codetrace/lang/c/c_metadata.cpp - Structural counts of a C translation unit
#include <algorithm>
#include <set>

#include "c_passes.hpp"

namespace codetrace
{

namespace
{

struct CCounts
{
  size_t includes = 0;
  size_t comments = 0;
  size_t functions = 0;
  size_t variables = 0;
  size_t assignments = 0;
  size_t calls = 0;
  size_t returns = 0;
  size_t loops = 0;
  size_t branches = 0;
  size_t max_depth = 0;
  std::vector<std::string> function_names;
  std::vector<std::string> include_paths;
  std::set<std::string> defined_functions;
};

std::string strip_include_delimiters(std::string_view path)
{
  while (!path.empty() && (path.front() == '"' || path.front() == '<')) path.remove_prefix(1);
  while (!path.empty() && (path.back() == '"' || path.back() == '>')) path.remove_suffix(1);
  return std::string(path);
}

void walk(ts_ll::Node node, size_t depth, const SourceFile & source, CCounts & counts)
{
  const std::string_view kind = node.kind();

  if (kind == "function_definition") {
    ++counts.functions;
    const ts_ll::Node declarator = c_function_declarator(node);
    std::string name = declarator.is_null()
                         ? std::string()
                         : c_declarator_name(declarator.child_by_field("declarator"), source);
    if (!name.empty()) {
      counts.defined_functions.insert(name);
      counts.function_names.push_back(std::move(name));
    }
  } else if (kind == "declaration") {
    for (uint32_t i = 0; i < node.named_child_count(); ++i) {
      if (node.named_child(i).kind() == "init_declarator") {
        ++counts.variables;
      }
    }
  } else if (kind == "parameter_declaration") {
    ++counts.variables;
  } else if (is_one_of(kind, {"while_statement", "for_statement", "do_statement"})) {
    ++counts.loops;
  } else if (kind == "if_statement" || kind == "switch_statement") {
    ++counts.branches;
  } else if (kind == "return_statement") {
    ++counts.returns;
  } else if (kind == "assignment_expression" || kind == "update_expression") {
    ++counts.assignments;
  } else if (kind == "call_expression") {
    ++counts.calls;
  } else if (kind == "comment") {
    ++counts.comments;
  } else if (kind == "preproc_include") {
    const ts_ll::Node path = node.child_by_field("path");
    if (!path.is_null()) {
      counts.include_paths.push_back(strip_include_delimiters(path.text(source)));
    }
  }

  if (kind == "compound_statement") {
    ++depth;
    counts.max_depth = std::max(counts.max_depth, depth);
  }

  for (uint32_t i = 0; i < node.child_count(); ++i) {
    walk(node.child(i), depth, source, counts);
  }
}

}  // namespace

Metadata collect_c_metadata(const ParsedSource & parsed, const std::filesystem::path & path)
{
  const FileAttributes attrs = read_file_attributes(path);

  CCounts counts;
  walk(parsed.root(), 0, parsed.source, counts);

  // Directive lines are counted textually so that includes inside
  // unparsable regions still count.
  for (const auto line : parsed.source.split_lines()) {
    const auto first = line.find_first_not_of(" \t");
    if (first != std::string_view::npos && line.substr(first, 8) == "#include") {
      ++counts.includes;
    }
  }

  Metadata metadata;
  append_file_attributes(metadata, attrs);
  metadata.set("language", "C");
  append_line_counts(metadata, parsed.source.content());
  metadata.set_count("num_includes", counts.includes);
  metadata.set_count("num_comments", counts.comments);
  metadata.set_count("num_functions", counts.functions);
  metadata.set("function_names", join_names(counts.function_names));
  metadata.set_count("num_variables", counts.variables);
  metadata.set_count("num_assignments", counts.assignments);
  metadata.set_count("num_calls", counts.calls);
  metadata.set_count("num_returns", counts.returns);
  metadata.set_count("num_loops", counts.loops);
  metadata.set_count("num_branches", counts.branches);
  metadata.set_count("max_nesting_depth", counts.max_depth);
  metadata.set("includes", join_names(counts.include_paths));
  metadata.set(
    "defined_functions",
    join_names(std::vector<std::string>(
      counts.defined_functions.begin(), counts.defined_functions.end())));
  return metadata;
}

}  // namespace codetrace
