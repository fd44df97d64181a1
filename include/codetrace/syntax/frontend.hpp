// codetrace/syntax/frontend.hpp - Parse entry point and CST helpers
#pragma once

#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>

#include "codetrace/basic/diagnostic.hpp"
#include "codetrace/basic/source_file.hpp"
#include "codetrace/syntax/ts_ll.hpp"

namespace codetrace
{

/**
 * A parsed input file: source text, its CST and any syntax diagnostics.
 *
 * Tree-sitter recovers from syntax errors, so the tree is usable even when
 * diagnostics are present.
 */
struct ParsedSource
{
  SourceFile source;
  ts_ll::Tree tree;
  DiagnosticBag diags;

  [[nodiscard]] ts_ll::Node root() const noexcept { return tree.root_node(); }
  [[nodiscard]] bool ok() const noexcept { return !tree.is_null(); }
};

/**
 * Parse source text with the given grammar.
 *
 * ERROR and MISSING nodes are reported as warnings (at most 64).
 *
 * @throws std::runtime_error if the grammar cannot be loaded
 */
[[nodiscard]] ParsedSource parse_source(
  const TSLanguage * language, std::string text, std::filesystem::path path = {});

// ============================================================================
// CST helpers shared by the language backends
// ============================================================================

[[nodiscard]] bool is_one_of(std::string_view kind, std::initializer_list<std::string_view> kinds);

[[nodiscard]] bool ends_with(std::string_view s, std::string_view suffix) noexcept;

/// First direct child (named or not) of the given kind, or a null node
[[nodiscard]] ts_ll::Node find_child(ts_ll::Node node, std::string_view kind);

/// Nearest strict ancestor whose kind is one of `kinds`, or a null node
[[nodiscard]] ts_ll::Node find_ancestor(
  ts_ll::Node node, std::initializer_list<std::string_view> kinds);

/// First named child that is not a comment, or a null node
[[nodiscard]] ts_ll::Node first_statement(ts_ll::Node block);

/// Last named child that is not a comment, or a null node
[[nodiscard]] ts_ll::Node last_statement(ts_ll::Node block);

/// True if only whitespace precedes the node on its first line
[[nodiscard]] bool starts_line(ts_ll::Node node, const SourceFile & source);

/// True if only whitespace or a comment follows the node on its last line
[[nodiscard]] bool ends_line(ts_ll::Node node, const SourceFile & source);

/// Leading whitespace of a 0-based line
[[nodiscard]] std::string_view leading_whitespace(const SourceFile & source, uint32_t row);

/// True if the node or any descendant has one of the given kinds
[[nodiscard]] bool contains_kind(ts_ll::Node node, std::initializer_list<std::string_view> kinds);

/// Collapse every whitespace run (newlines included) into a single space
[[nodiscard]] std::string single_line(std::string_view text);

}  // namespace codetrace
