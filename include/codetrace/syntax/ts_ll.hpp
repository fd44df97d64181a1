// codetrace/syntax/ts_ll.hpp - Low-level Tree-sitter wrapper (CST access)
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <string_view>

#include "codetrace/basic/source_file.hpp"

// Grammar entry points provided by the installed tree-sitter-c and
// tree-sitter-python libraries (see CMakeLists.txt).
extern "C" const TSLanguage * tree_sitter_c(void);
extern "C" const TSLanguage * tree_sitter_python(void);

namespace codetrace::ts_ll
{

/// 0-based row/column of a node boundary (column counted in bytes)
struct Point
{
  uint32_t row = 0;
  uint32_t column = 0;
};

//------------------------------------------------------------------------------
// Node - thin wrapper around TSNode
//------------------------------------------------------------------------------
///
/// Every accessor is safe on a null node: queries return empty values and
/// navigation returns a null node.
class Node
{
public:
  Node() : node_{} {}
  explicit Node(TSNode n) : node_(n) {}

  [[nodiscard]] bool is_null() const noexcept { return ts_node_is_null(node_); }
  [[nodiscard]] bool is_named() const noexcept { return !is_null() && ts_node_is_named(node_); }
  [[nodiscard]] bool has_error() const noexcept { return !is_null() && ts_node_has_error(node_); }
  [[nodiscard]] bool is_error() const noexcept { return !is_null() && ts_node_is_error(node_); }
  [[nodiscard]] bool is_missing() const noexcept
  {
    return !is_null() && ts_node_is_missing(node_);
  }

  [[nodiscard]] std::string_view kind() const noexcept
  {
    if (is_null()) {
      return {};
    }
    const char * t = ts_node_type(node_);
    return t ? std::string_view(t) : std::string_view();
  }

  [[nodiscard]] uint32_t start_byte() const noexcept { return ts_node_start_byte(node_); }
  [[nodiscard]] uint32_t end_byte() const noexcept { return ts_node_end_byte(node_); }

  [[nodiscard]] Point start_point() const noexcept
  {
    const TSPoint p = ts_node_start_point(node_);
    return {p.row, p.column};
  }
  [[nodiscard]] Point end_point() const noexcept
  {
    const TSPoint p = ts_node_end_point(node_);
    return {p.row, p.column};
  }

  [[nodiscard]] uint32_t start_row() const noexcept { return start_point().row; }
  [[nodiscard]] uint32_t end_row() const noexcept { return end_point().row; }

  [[nodiscard]] SourceRange range() const noexcept { return {start_byte(), end_byte()}; }

  [[nodiscard]] std::string_view text(const SourceFile & source) const noexcept
  {
    return source.get_slice(range());
  }

  [[nodiscard]] uint32_t child_count() const noexcept
  {
    return is_null() ? 0 : ts_node_child_count(node_);
  }
  [[nodiscard]] uint32_t named_child_count() const noexcept
  {
    return is_null() ? 0 : ts_node_named_child_count(node_);
  }

  [[nodiscard]] Node child(uint32_t i) const noexcept
  {
    return i < child_count() ? Node(ts_node_child(node_, i)) : Node();
  }
  [[nodiscard]] Node named_child(uint32_t i) const noexcept
  {
    return i < named_child_count() ? Node(ts_node_named_child(node_, i)) : Node();
  }

  [[nodiscard]] Node child_by_field(std::string_view field) const noexcept
  {
    if (is_null()) {
      return {};
    }
    return Node(
      ts_node_child_by_field_name(node_, field.data(), static_cast<uint32_t>(field.size())));
  }

  [[nodiscard]] Node parent() const noexcept
  {
    return is_null() ? Node() : Node(ts_node_parent(node_));
  }

  [[nodiscard]] Node next_named_sibling() const noexcept
  {
    return is_null() ? Node() : Node(ts_node_next_named_sibling(node_));
  }

  [[nodiscard]] bool operator==(const Node & other) const noexcept
  {
    return ts_node_eq(node_, other.node_);
  }
  [[nodiscard]] bool operator!=(const Node & other) const noexcept { return !(*this == other); }

  [[nodiscard]] TSNode raw() const noexcept { return node_; }

private:
  TSNode node_;
};

//------------------------------------------------------------------------------
// Parser/Tree - RAII wrappers
//------------------------------------------------------------------------------
class Parser
{
public:
  /// @throws std::runtime_error if the grammar cannot be loaded
  explicit Parser(const TSLanguage * language);
  Parser(const Parser &) = delete;
  Parser & operator=(const Parser &) = delete;
  ~Parser();

  [[nodiscard]] TSTree * parse_string(std::string_view source) const;

private:
  TSParser * parser_ = nullptr;
};

class Tree
{
public:
  explicit Tree(TSTree * t = nullptr) : tree_(t) {}
  Tree(const Tree &) = delete;
  Tree & operator=(const Tree &) = delete;

  Tree(Tree && other) noexcept : tree_(other.tree_) { other.tree_ = nullptr; }
  Tree & operator=(Tree && other) noexcept
  {
    if (this != &other) {
      reset();
      tree_ = other.tree_;
      other.tree_ = nullptr;
    }
    return *this;
  }

  ~Tree() { reset(); }

  void reset(TSTree * t = nullptr)
  {
    if (tree_) ts_tree_delete(tree_);
    tree_ = t;
  }

  [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr; }

  [[nodiscard]] Node root_node() const noexcept
  {
    return tree_ ? Node(ts_tree_root_node(tree_)) : Node();
  }

private:
  TSTree * tree_ = nullptr;
};

}  // namespace codetrace::ts_ll
