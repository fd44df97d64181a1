// lib/lang/python/python_passes.hpp - Internal passes of the Python backend
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "codetrace/instrument/insertion_plan.hpp"
#include "codetrace/instrument/metadata.hpp"
#include "codetrace/instrument/node_dispatcher.hpp"
#include "codetrace/instrument/symbol_table.hpp"
#include "codetrace/instrument/trace_statement.hpp"
#include "codetrace/syntax/frontend.hpp"

namespace codetrace
{

/// Module-level call-depth counter injected into every instrumented module
inline constexpr std::string_view k_python_depth_counter = "_codetrace_depth";

/// Type tag recorded for every Python name
inline constexpr std::string_view k_python_object_type = "object";

// ============================================================================
// Shared helpers (python_backend.cpp)
// ============================================================================

/// Single-quoted Python string literal printing `text` verbatim
[[nodiscard]] std::string python_string_literal(std::string_view text);

/// `print(..., sep='\0')` call emitting one trace record
[[nodiscard]] std::string render_python_statement(
  const TraceStatement & stmt, std::string_view indent);

/// Names of a parameter node (identifier, typed, default or splat parameter)
[[nodiscard]] std::string python_parameter_name(ts_ll::Node parameter, const SourceFile & source);

/// Keywords, builtins and injected names that are never traced
[[nodiscard]] bool is_python_reserved(std::string_view name);

// ============================================================================
// Passes
// ============================================================================

[[nodiscard]] SymbolTable analyze_python_types(const ParsedSource & parsed);

[[nodiscard]] Metadata collect_python_metadata(
  const ParsedSource & parsed, const std::filesystem::path & path);

/**
 * Traversal state of one Python instrumentation run.
 *
 * Trace statements are inserted as whole lines indented like the statement
 * they accompany, so an anchor must be a statement of a block or the module
 * that starts its own line. Reads only consider names bound earlier in the
 * current scope, an enclosing function or the module. A return sharing its
 * line with a header is prefixed in place.
 */
class PythonInstrumentPass
{
public:
  PythonInstrumentPass(
    const SourceFile & source, const SymbolTable & symbols, const Metadata & metadata);

  static void register_handlers(NodeDispatcher<PythonInstrumentPass> & dispatcher);

  /// Instrumented text; the depth counter initialization comes first
  [[nodiscard]] std::string finish();

  void enter_function_definition(ts_ll::Node node);
  void leave_function_definition(ts_ll::Node node);
  void enter_class_definition(ts_ll::Node node);
  void leave_class_definition(ts_ll::Node node);
  void enter_assignment(ts_ll::Node node);
  void enter_augmented_assignment(ts_ll::Node node);
  void enter_if_statement(ts_ll::Node node);
  void enter_for_statement(ts_ll::Node node);
  void enter_while_statement(ts_ll::Node node);
  void enter_conditional_expression(ts_ll::Node node);
  void enter_return_statement(ts_ll::Node node);
  void enter_call(ts_ll::Node node);
  void enter_scope_declaration(ts_ll::Node node);

private:
  struct Scope
  {
    ts_ll::Node body;
    bool function = false;
    bool traced = true;
    std::unordered_set<std::string> bound;
    std::unordered_set<std::string> globals;
    std::unordered_set<std::string> nonlocals;
  };

  [[nodiscard]] bool tracing() const noexcept { return !scopes_.empty() && scopes_.back().traced; }
  [[nodiscard]] std::string text(ts_ll::Node n) const { return std::string(n.text(source_)); }
  [[nodiscard]] bool is_bound(std::string_view name) const;
  void bind(const std::string & name);
  /// Scope a write to `name` lands in, after `global`/`nonlocal`
  [[nodiscard]] Scope & binding_scope(const std::string & name);

  [[nodiscard]] std::optional<ts_ll::Node> statement_anchor(ts_ll::Node node) const;
  [[nodiscard]] std::string indent_of(ts_ll::Node stmt) const;

  void emit_before(ts_ll::Node anchor, const TraceStatement & stmt);
  void emit_after(ts_ll::Node anchor, const TraceStatement & stmt);
  /// First statement of a block when it starts its own line
  [[nodiscard]] std::optional<ts_ll::Node> block_entry(ts_ll::Node block) const;
  /// Schedule unindented lines before `first`, indented like it
  void emit_block_entry(ts_ll::Node first, const std::vector<TraceStatement> & stmts);
  void emit_line_before(ts_ll::Node anchor, std::string_view line);

  [[nodiscard]] std::vector<std::string> collect_reads(ts_ll::Node expr) const;
  [[nodiscard]] std::vector<std::string> target_names(ts_ll::Node target) const;
  void emit_reads(const std::vector<std::string> & names, ts_ll::Node anchor, uint32_t row);
  void emit_writes(const std::vector<std::string> & names, ts_ll::Node anchor, uint32_t row);
  /// True if evaluating `node` early could fail where the program would not
  [[nodiscard]] bool is_guarded(ts_ll::Node node, ts_ll::Node anchor) const;

  [[nodiscard]] TraceStatement variable_record(
    RecordKind kind, const std::string & name, uint32_t row) const;
  [[nodiscard]] TraceStatement & with_depth(TraceStatement & stmt) const;

  /// Printable condition text and a `bool(...)` re-evaluation, empty when
  /// re-evaluating could change the program's behavior
  [[nodiscard]] std::pair<std::string, std::string> condition_of(ts_ll::Node condition) const;

  const SourceFile & source_;
  const SymbolTable & symbols_;
  InsertionPlan plan_;
  Metadata metadata_;
  std::unordered_set<std::string> defined_functions_;
  std::vector<Scope> scopes_;
};

}  // namespace codetrace
