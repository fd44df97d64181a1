// codetrace/lang/python/python_metadata.cpp - Structural counts of a Python module
#include <algorithm>
#include <set>

#include "python_passes.hpp"

namespace codetrace
{

namespace
{

struct PythonCounts
{
  size_t imports = 0;
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
  std::vector<std::string> import_names;
  std::set<std::string> defined_functions;
};

void record_imports(ts_ll::Node node, const SourceFile & source, PythonCounts & counts)
{
  if (node.kind() == "import_from_statement") {
    const ts_ll::Node module = node.child_by_field("module_name");
    if (!module.is_null()) {
      counts.import_names.emplace_back(module.text(source));
    }
    return;
  }
  for (uint32_t i = 0; i < node.named_child_count(); ++i) {
    const ts_ll::Node c = node.named_child(i);
    if (c.kind() == "dotted_name" || c.kind() == "identifier") {
      counts.import_names.emplace_back(c.text(source));
    } else if (c.kind() == "aliased_import") {
      const ts_ll::Node name = c.child_by_field("name");
      if (!name.is_null()) {
        counts.import_names.emplace_back(name.text(source));
      }
    }
  }
}

void walk(ts_ll::Node node, size_t depth, const SourceFile & source, PythonCounts & counts)
{
  const std::string_view kind = node.kind();

  if (kind == "function_definition") {
    ++counts.functions;
    const ts_ll::Node name = node.child_by_field("name");
    if (!name.is_null()) {
      std::string func(name.text(source));
      counts.defined_functions.insert(func);
      counts.function_names.push_back(std::move(func));
    }
  } else if (kind == "assignment") {
    ++counts.variables;
    ++counts.assignments;
  } else if (kind == "augmented_assignment") {
    ++counts.assignments;
  } else if (kind == "while_statement" || kind == "for_statement") {
    ++counts.loops;
  } else if (kind == "if_statement") {
    ++counts.branches;
  } else if (kind == "return_statement") {
    ++counts.returns;
  } else if (kind == "call") {
    ++counts.calls;
  } else if (kind == "comment") {
    ++counts.comments;
  } else if (kind == "import_statement" || kind == "import_from_statement") {
    ++counts.imports;
    record_imports(node, source, counts);
  }

  if (kind == "block") {
    ++depth;
    counts.max_depth = std::max(counts.max_depth, depth);
  }

  for (uint32_t i = 0; i < node.child_count(); ++i) {
    walk(node.child(i), depth, source, counts);
  }
}

}  // namespace

Metadata collect_python_metadata(const ParsedSource & parsed, const std::filesystem::path & path)
{
  const FileAttributes attrs = read_file_attributes(path);

  PythonCounts counts;
  walk(parsed.root(), 0, parsed.source, counts);

  Metadata metadata;
  append_file_attributes(metadata, attrs);
  metadata.set("language", "Python");
  append_line_counts(metadata, parsed.source.content());
  metadata.set_count("num_imports", counts.imports);
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
  metadata.set("imports", join_names(counts.import_names));
  metadata.set(
    "defined_functions",
    join_names(std::vector<std::string>(
      counts.defined_functions.begin(), counts.defined_functions.end())));
  return metadata;
}

}  // namespace codetrace
