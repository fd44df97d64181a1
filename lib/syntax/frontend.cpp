// codetrace/syntax/frontend.cpp - Parse entry point and CST helpers
#include "codetrace/syntax/frontend.hpp"

#include <algorithm>

namespace codetrace
{

namespace
{

void collect_syntax_diagnostics(const ts_ll::Node n, DiagnosticBag & diags, size_t & count)
{
  constexpr size_t max_syntax_diags = 64;
  if (count >= max_syntax_diags) return;
  if (n.is_null()) return;

  if (n.is_error()) {
    diags.report_warning(n.range(), "syntax error", "not understood by the parser")
      .with_code("syntax");
    ++count;
  } else if (n.is_missing()) {
    diags.report_warning(n.range(), "missing token", std::string("expected '") +
                                                       std::string(n.kind()) + "'")
      .with_code("syntax");
    ++count;
  }

  if (count >= max_syntax_diags) return;

  for (uint32_t i = 0; i < n.child_count(); ++i) {
    collect_syntax_diagnostics(n.child(i), diags, count);
    if (count >= max_syntax_diags) return;
  }
}

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v'; }

}  // namespace

ParsedSource parse_source(const TSLanguage * language, std::string text, std::filesystem::path path)
{
  ParsedSource parsed;
  parsed.source = SourceFile(std::move(path), std::move(text));

  const ts_ll::Parser parser(language);
  parsed.tree.reset(parser.parse_string(parsed.source.content()));

  if (parsed.tree.is_null()) {
    parsed.diags.report_error({}, "tree-sitter parse failed (null tree)").with_code("syntax");
    return parsed;
  }

  const ts_ll::Node root = parsed.root();
  if (root.has_error()) {
    size_t count = 0;
    collect_syntax_diagnostics(root, parsed.diags, count);
  }

  return parsed;
}

bool is_one_of(std::string_view kind, std::initializer_list<std::string_view> kinds)
{
  return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

bool ends_with(std::string_view s, std::string_view suffix) noexcept
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

ts_ll::Node find_child(ts_ll::Node node, std::string_view kind)
{
  for (uint32_t i = 0; i < node.child_count(); ++i) {
    const ts_ll::Node c = node.child(i);
    if (c.kind() == kind) {
      return c;
    }
  }
  return {};
}

ts_ll::Node find_ancestor(ts_ll::Node node, std::initializer_list<std::string_view> kinds)
{
  for (ts_ll::Node p = node.parent(); !p.is_null(); p = p.parent()) {
    if (is_one_of(p.kind(), kinds)) {
      return p;
    }
  }
  return {};
}

ts_ll::Node first_statement(ts_ll::Node block)
{
  for (uint32_t i = 0; i < block.named_child_count(); ++i) {
    const ts_ll::Node c = block.named_child(i);
    if (c.kind() != "comment") {
      return c;
    }
  }
  return {};
}

ts_ll::Node last_statement(ts_ll::Node block)
{
  for (uint32_t i = block.named_child_count(); i > 0; --i) {
    const ts_ll::Node c = block.named_child(i - 1);
    if (c.kind() != "comment") {
      return c;
    }
  }
  return {};
}

bool starts_line(ts_ll::Node node, const SourceFile & source)
{
  const uint32_t row = node.start_row();
  const uint32_t line_start = source.line_offset(row);
  const std::string_view before =
    source.content().substr(line_start, node.start_byte() - line_start);
  return std::all_of(before.begin(), before.end(), is_space);
}

bool ends_line(ts_ll::Node node, const SourceFile & source)
{
  const std::string_view line = source.get_line(node.end_row());
  const uint32_t column = node.end_point().column;
  std::string_view rest = column < line.size() ? line.substr(column) : std::string_view();
  while (!rest.empty() && is_space(rest.front())) {
    rest.remove_prefix(1);
  }
  return rest.empty() || rest.substr(0, 2) == "//" || rest.substr(0, 2) == "/*" ||
         rest.front() == '#';
}

std::string_view leading_whitespace(const SourceFile & source, uint32_t row)
{
  const std::string_view line = source.get_line(row);
  size_t n = 0;
  while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) {
    ++n;
  }
  return line.substr(0, n);
}

bool contains_kind(ts_ll::Node node, std::initializer_list<std::string_view> kinds)
{
  if (node.is_null()) {
    return false;
  }
  if (is_one_of(node.kind(), kinds)) {
    return true;
  }
  for (uint32_t i = 0; i < node.child_count(); ++i) {
    if (contains_kind(node.child(i), kinds)) {
      return true;
    }
  }
  return false;
}

std::string single_line(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  bool in_space = false;
  for (const char c : text) {
    if (is_space(c) || c == '\n') {
      in_space = true;
      continue;
    }
    if (in_space && !out.empty()) {
      out += ' ';
    }
    in_space = false;
    out += c;
  }
  return out;
}

}  // namespace codetrace
