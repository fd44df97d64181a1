// lib/lang/c/c_passes.hpp - Internal passes of the C backend
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
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

/// Global call-depth counter injected into every instrumented C program
inline constexpr std::string_view k_c_depth_counter = "__codetrace_depth";

// ============================================================================
// Shared helpers (c_backend.cpp)
// ============================================================================

/// printf conversion for a C type tag
[[nodiscard]] std::string_view c_format_specifier(std::string_view type_tag);

/// C string literal (with quotes) printing `text` verbatim
[[nodiscard]] std::string c_string_literal(std::string_view text);

/// printf/putchar statement sequence emitting one trace record
[[nodiscard]] std::string render_c_statement(const TraceStatement & stmt);

/// Declared variable name of a (possibly nested) declarator
[[nodiscard]] std::string c_declarator_name(ts_ll::Node declarator, const SourceFile & source);

/// Base type of a declaration or parameter_declaration ("int" when absent)
[[nodiscard]] std::string c_base_type(ts_ll::Node declaration, const SourceFile & source);

/// Base type plus " *" per pointer or array declarator level
[[nodiscard]] std::string c_full_type(std::string base_type, ts_ll::Node declarator);

/// function_declarator of a function_definition, looking through pointer returns
[[nodiscard]] ts_ll::Node c_function_declarator(ts_ll::Node function_definition);

/// Names reserved by the language or the C runtime that are never traced
[[nodiscard]] bool is_c_reserved(std::string_view name);

// ============================================================================
// Passes
// ============================================================================

[[nodiscard]] SymbolTable analyze_c_types(const ParsedSource & parsed);

[[nodiscard]] Metadata collect_c_metadata(
  const ParsedSource & parsed, const std::filesystem::path & path);

/**
 * Traversal state of one C instrumentation run.
 *
 * Handlers schedule trace statements into the insertion plan. A fragment
 * is only inserted where a statement may legally appear: its anchor must be
 * a statement of a compound block or case body that starts its own line.
 * Braceless bodies of if/else/loops are wrapped in braces so that their
 * records stay inside the branch they describe. Returns and `else if`
 * branches that share a line with other code are braced in place.
 */
class CInstrumentPass
{
public:
  CInstrumentPass(
    const SourceFile & source, const SymbolTable & symbols, const Metadata & metadata);

  static void register_handlers(NodeDispatcher<CInstrumentPass> & dispatcher);

  /// Instrumented text; the depth counter and stdio prelude come first
  [[nodiscard]] std::string finish();

  void enter_function_definition(ts_ll::Node node);
  void leave_function_definition(ts_ll::Node node);
  void enter_declaration(ts_ll::Node node);
  void enter_assignment_expression(ts_ll::Node node);
  void enter_update_expression(ts_ll::Node node);
  void enter_if_statement(ts_ll::Node node);
  void leave_if_statement(ts_ll::Node node);
  void enter_loop_statement(ts_ll::Node node);
  void leave_loop_statement(ts_ll::Node node);
  void enter_switch_statement(ts_ll::Node node);
  void enter_case_statement(ts_ll::Node node);
  void enter_conditional_expression(ts_ll::Node node);
  void enter_return_statement(ts_ll::Node node);
  void enter_call_expression(ts_ll::Node node);

private:
  struct FunctionScope
  {
    std::string name;
    ts_ll::Node body;
    bool traced = false;
  };

  [[nodiscard]] bool tracing() const noexcept { return function_ && function_->traced; }
  [[nodiscard]] std::string text(ts_ll::Node n) const { return std::string(n.text(source_)); }
  [[nodiscard]] std::string type_of(std::string_view name) const;
  [[nodiscard]] bool is_declared(std::string_view name) const;

  [[nodiscard]] bool is_control_body(ts_ll::Node stmt) const;
  [[nodiscard]] bool is_wrapped_body(ts_ll::Node stmt) const;
  [[nodiscard]] bool is_else_if(ts_ll::Node stmt) const;
  [[nodiscard]] bool is_block_level(ts_ll::Node stmt) const;
  [[nodiscard]] std::optional<ts_ll::Node> statement_anchor(ts_ll::Node node) const;
  [[nodiscard]] bool is_simple_statement(ts_ll::Node stmt) const;

  void emit_before(ts_ll::Node anchor, const TraceStatement & stmt);
  void emit_after(ts_ll::Node anchor, const TraceStatement & stmt);
  /// Splice `{ records code` before `stmt` and ` }` after it
  void emit_braced_inline(
    ts_ll::Node stmt, const std::vector<TraceStatement> & records, std::string_view code = {});
  void emit_block_entry(ts_ll::Node body, const std::vector<TraceStatement> & stmts);
  void close_block_entry(ts_ll::Node body);

  [[nodiscard]] std::vector<std::string> collect_reads(ts_ll::Node expr) const;
  void emit_reads(const std::vector<std::string> & names, ts_ll::Node anchor, uint32_t row);

  [[nodiscard]] TraceStatement variable_record(
    RecordKind kind, const std::string & name, uint32_t row) const;
  [[nodiscard]] TraceStatement & with_depth(TraceStatement & stmt) const;

  [[nodiscard]] ts_ll::Node else_body(ts_ll::Node if_statement) const;
  /// Printable condition text and the expression to re-evaluate, empty when
  /// re-evaluating it could change the program's behavior
  [[nodiscard]] std::pair<std::string, std::string> condition_of(ts_ll::Node node) const;
  [[nodiscard]] std::string reevaluable(ts_ll::Node expr) const;
  /// reevaluable() collapsed to 0 or 1 so it always prints as an int
  [[nodiscard]] std::string truth_value(ts_ll::Node expr) const;

  const SourceFile & source_;
  const SymbolTable & symbols_;
  InsertionPlan plan_;
  Metadata metadata_;
  std::unordered_set<std::string> defined_functions_;
  std::unordered_set<std::string> declared_;
  std::unordered_map<std::string, std::string> local_types_;
  std::optional<FunctionScope> function_;
};

}  // namespace codetrace
