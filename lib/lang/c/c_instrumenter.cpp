// codetrace/lang/c/c_instrumenter.cpp - Trace statement insertion for C
#include <fmt/core.h>

#include "c_passes.hpp"

namespace codetrace
{

using ts_ll::Node;

namespace
{

/// Identifiers under these parents are names being declared or written
bool is_non_read_parent(std::string_view kind)
{
  return is_one_of(
    kind, {"declaration", "init_declarator", "function_declarator", "assignment_expression",
           "parameter_declaration", "function_definition", "update_expression"});
}

bool is_statement_kind(std::string_view kind)
{
  return ends_with(kind, "_statement") || kind == "declaration";
}

Node strip_parentheses(Node expr)
{
  while (!expr.is_null() && expr.kind() == "parenthesized_expression" &&
         expr.named_child_count() == 1) {
    expr = expr.named_child(0);
  }
  return expr;
}

}  // namespace

CInstrumentPass::CInstrumentPass(
  const SourceFile & source, const SymbolTable & symbols, const Metadata & metadata)
: source_(source), symbols_(symbols), metadata_(metadata)
{
  if (const auto defined = metadata_.get("defined_functions")) {
    for (auto & name : split_names(*defined)) {
      defined_functions_.insert(std::move(name));
    }
  }
  plan_.add_prelude("#include <stdio.h>");
  plan_.add_prelude(fmt::format("int {} = 0;", k_c_depth_counter));
}

void CInstrumentPass::register_handlers(NodeDispatcher<CInstrumentPass> & dispatcher)
{
  dispatcher.on_enter("function_definition", &CInstrumentPass::enter_function_definition);
  dispatcher.on_leave("function_definition", &CInstrumentPass::leave_function_definition);
  dispatcher.on_enter("declaration", &CInstrumentPass::enter_declaration);
  dispatcher.on_enter("assignment_expression", &CInstrumentPass::enter_assignment_expression);
  dispatcher.on_enter("update_expression", &CInstrumentPass::enter_update_expression);
  dispatcher.on_enter("if_statement", &CInstrumentPass::enter_if_statement);
  dispatcher.on_leave("if_statement", &CInstrumentPass::leave_if_statement);
  for (const std::string_view kind : {"while_statement", "for_statement", "do_statement"}) {
    dispatcher.on_enter(kind, &CInstrumentPass::enter_loop_statement);
    dispatcher.on_leave(kind, &CInstrumentPass::leave_loop_statement);
  }
  dispatcher.on_enter("switch_statement", &CInstrumentPass::enter_switch_statement);
  dispatcher.on_enter("case_statement", &CInstrumentPass::enter_case_statement);
  dispatcher.on_enter("conditional_expression", &CInstrumentPass::enter_conditional_expression);
  dispatcher.on_enter("return_statement", &CInstrumentPass::enter_return_statement);
  dispatcher.on_enter("call_expression", &CInstrumentPass::enter_call_expression);
}

std::string CInstrumentPass::finish() { return plan_.apply(source_); }

// ============================================================================
// Queries
// ============================================================================

std::string CInstrumentPass::type_of(std::string_view name) const
{
  if (const auto it = local_types_.find(std::string(name)); it != local_types_.end()) {
    return it->second;
  }
  return symbols_.type_of(name, "int");
}

bool CInstrumentPass::is_declared(std::string_view name) const
{
  return declared_.count(std::string(name)) != 0;
}

bool CInstrumentPass::is_control_body(Node stmt) const
{
  const Node parent = stmt.parent();
  const std::string_view kind = parent.kind();
  if (kind == "else_clause") {
    return true;
  }
  if (kind == "if_statement") {
    return stmt == parent.child_by_field("consequence") ||
           stmt == parent.child_by_field("alternative");
  }
  if (is_one_of(kind, {"while_statement", "for_statement", "do_statement"})) {
    return stmt == parent.child_by_field("body");
  }
  return false;
}

bool CInstrumentPass::is_wrapped_body(Node stmt) const
{
  if (stmt.kind() == "compound_statement" || !is_control_body(stmt)) {
    return false;
  }
  // `else if` chains keep their shape; the nested if is not a block.
  if (is_else_if(stmt)) {
    return false;
  }
  return starts_line(stmt, source_) && ends_line(stmt, source_);
}

bool CInstrumentPass::is_else_if(Node stmt) const
{
  if (stmt.kind() != "if_statement") {
    return false;
  }
  const Node parent = stmt.parent();
  return parent.kind() == "else_clause" ||
         (parent.kind() == "if_statement" && stmt == parent.child_by_field("alternative"));
}

bool CInstrumentPass::is_block_level(Node stmt) const
{
  const std::string_view parent = stmt.parent().kind();
  return parent == "compound_statement" || parent == "case_statement" || is_wrapped_body(stmt);
}

std::optional<Node> CInstrumentPass::statement_anchor(Node node) const
{
  Node stmt = node;
  while (!stmt.is_null() && !is_statement_kind(stmt.kind())) {
    if (stmt.kind() == "function_definition" || stmt.kind() == "translation_unit") {
      return std::nullopt;
    }
    stmt = stmt.parent();
  }
  if (stmt.is_null() || !is_block_level(stmt) || !starts_line(stmt, source_)) {
    return std::nullopt;
  }
  return stmt;
}

bool CInstrumentPass::is_simple_statement(Node stmt) const
{
  return (stmt.kind() == "expression_statement" || stmt.kind() == "declaration") &&
         ends_line(stmt, source_);
}

// ============================================================================
// Emission
// ============================================================================

void CInstrumentPass::emit_before(Node anchor, const TraceStatement & stmt)
{
  plan_.add_before(anchor.start_row(), render_c_statement(stmt));
}

void CInstrumentPass::emit_after(Node anchor, const TraceStatement & stmt)
{
  plan_.add_after(anchor.end_row(), render_c_statement(stmt));
}

void CInstrumentPass::emit_braced_inline(
  Node stmt, const std::vector<TraceStatement> & records, std::string_view code)
{
  std::string lead = "{ ";
  for (const auto & record : records) {
    const std::string rendered = render_c_statement(record);
    lead += rendered.substr(rendered.find_first_not_of(' ')) + " ";
  }
  if (!code.empty()) {
    lead += std::string(code) + " ";
  }
  plan_.add_inline(stmt.start_point().row, stmt.start_point().column, std::move(lead));
  plan_.add_inline(stmt.end_point().row, stmt.end_point().column, " }");
}

void CInstrumentPass::emit_block_entry(Node body, const std::vector<TraceStatement> & stmts)
{
  if (body.kind() == "compound_statement") {
    if (body.start_row() == body.end_row()) {
      return;
    }
    for (const auto & stmt : stmts) {
      plan_.add_after(body.start_row(), render_c_statement(stmt));
    }
    return;
  }
  if (!is_wrapped_body(body)) {
    return;
  }
  plan_.add_before(body.start_row(), "    {");
  for (const auto & stmt : stmts) {
    plan_.add_before(body.start_row(), render_c_statement(stmt));
  }
}

void CInstrumentPass::close_block_entry(Node body)
{
  if (!body.is_null() && is_wrapped_body(body)) {
    plan_.add_after(body.end_row(), "    }");
  }
}

std::vector<std::string> CInstrumentPass::collect_reads(Node expr) const
{
  std::vector<std::string> names;
  if (expr.is_null()) {
    return names;
  }

  const auto accept = [&](Node id) {
    std::string name = text(id);
    if (is_declared(name) && !is_c_reserved(name)) {
      names.push_back(std::move(name));
    }
  };

  if (expr.kind() == "identifier") {
    accept(expr);
    return names;
  }

  const auto visit = [&](const auto & self, Node n) -> void {
    if (n.kind() == "identifier") {
      const Node parent = n.parent();
      const bool callee =
        parent.kind() == "call_expression" && n == parent.child_by_field("function");
      if (!callee && !is_non_read_parent(parent.kind())) {
        accept(n);
      }
      return;
    }
    for (uint32_t i = 0; i < n.named_child_count(); ++i) {
      self(self, n.named_child(i));
    }
  };
  visit(visit, expr);
  return names;
}

void CInstrumentPass::emit_reads(const std::vector<std::string> & names, Node anchor, uint32_t row)
{
  for (const auto & name : names) {
    emit_before(anchor, variable_record(RecordKind::Read, name, row));
  }
}

TraceStatement CInstrumentPass::variable_record(
  RecordKind kind, const std::string & name, uint32_t row) const
{
  TraceStatement stmt(kind);
  stmt.literal(name)
    .value(name, std::string(c_format_specifier(type_of(name))))
    .value("&" + name, "%p")
    .line(row);
  return std::move(with_depth(stmt));
}

TraceStatement & CInstrumentPass::with_depth(TraceStatement & stmt) const
{
  return stmt.value(std::string(k_c_depth_counter), "%d");
}

Node CInstrumentPass::else_body(Node if_statement) const
{
  const Node alternative = if_statement.child_by_field("alternative");
  if (alternative.is_null()) {
    return {};
  }
  if (alternative.kind() == "else_clause") {
    return first_statement(alternative);
  }
  return alternative;
}

std::string CInstrumentPass::reevaluable(Node expr) const
{
  if (
    expr.is_null() ||
    contains_kind(expr, {"call_expression", "assignment_expression", "update_expression",
                         "comment"})) {
    return {};
  }
  return "(" + text(expr) + ")";
}

std::string CInstrumentPass::truth_value(Node expr) const
{
  std::string value = reevaluable(expr);
  return value.empty() ? value : "!!" + value;
}

std::pair<std::string, std::string> CInstrumentPass::condition_of(Node node) const
{
  const Node condition = node.child_by_field("condition");
  if (condition.is_null()) {
    return {};
  }
  const Node inner = strip_parentheses(condition);
  return {single_line(text(inner)), truth_value(inner)};
}

// ============================================================================
// Functions
// ============================================================================

void CInstrumentPass::enter_function_definition(Node node)
{
  function_.reset();
  const Node declarator = c_function_declarator(node);
  const Node body = node.child_by_field("body");
  if (declarator.is_null() || body.is_null()) {
    return;
  }
  std::string name = c_declarator_name(declarator.child_by_field("declarator"), source_);
  if (name.empty()) {
    return;
  }

  function_ = FunctionScope{name, body, body.start_row() != body.end_row()};
  if (!function_->traced) {
    return;
  }

  const uint32_t row = body.start_row();
  if (name == "main") {
    plan_.add_after(row, "    setbuf(stdout, NULL);");
    for (const auto & [key, value] : metadata_) {
      plan_.add_after(
        row, render_c_statement(TraceStatement(RecordKind::Meta).literal(key).literal(value)));
    }
  }
  plan_.add_after(row, fmt::format("    {}++;", k_c_depth_counter));

  struct Param
  {
    std::string name;
    std::string type;
    uint32_t row;
  };
  std::vector<Param> params;
  const Node list = declarator.child_by_field("parameters");
  for (uint32_t i = 0; i < list.named_child_count(); ++i) {
    const Node p = list.named_child(i);
    if (p.kind() != "parameter_declaration") {
      continue;
    }
    const Node d = p.child_by_field("declarator");
    std::string param_name = c_declarator_name(d, source_);
    if (param_name.empty()) {
      continue;
    }
    params.push_back({param_name, c_full_type(c_base_type(p, source_), d), p.start_row()});
    declared_.insert(param_name);
    local_types_[param_name] = params.back().type;
  }

  TraceStatement call(RecordKind::Call);
  call.literal(name);
  for (const auto & p : params) {
    call.value(p.name, std::string(c_format_specifier(p.type)));
  }
  plan_.add_after(row, render_c_statement(with_depth(call)));

  for (const auto & p : params) {
    TraceStatement param(RecordKind::Param);
    param.literal(p.name).value(p.name, std::string(c_format_specifier(p.type))).line(p.row);
    plan_.add_after(row, render_c_statement(param));
  }
}

void CInstrumentPass::leave_function_definition(Node)
{
  if (tracing()) {
    const Node body = function_->body;
    const Node last = last_statement(body);
    const Node closing = body.child(body.child_count() - 1);
    const bool returns = !last.is_null() && last.kind() == "return_statement";
    if (!returns && closing.kind() == "}" && starts_line(closing, source_)) {
      plan_.add_before(closing.start_row(), fmt::format("    {}--;", k_c_depth_counter));
    }
  }
  function_.reset();
}

// ============================================================================
// Declarations and assignments
// ============================================================================

void CInstrumentPass::enter_declaration(Node node)
{
  const bool loop_header = node.parent().kind() == "for_statement";
  const std::optional<Node> anchor =
    tracing() && !loop_header ? statement_anchor(node) : std::nullopt;
  const bool emit = anchor && is_simple_statement(*anchor);
  const std::string base = c_base_type(node, source_);

  ts_ll::Cursor cursor(node);
  if (!cursor.goto_first_child()) {
    return;
  }
  do {
    if (cursor.current_field_name() != "declarator") {
      continue;
    }
    const Node declarator = cursor.current_node();
    if (declarator.kind() == "function_declarator") {
      continue;
    }
    std::string name = c_declarator_name(declarator, source_);
    if (name.empty()) {
      continue;
    }

    const Node value = declarator.kind() == "init_declarator"
                         ? declarator.child_by_field("value")
                         : Node();
    const std::vector<std::string> reads = emit ? collect_reads(value) : std::vector<std::string>{};
    declared_.insert(name);
    local_types_[name] = c_full_type(base, declarator);

    if (emit && !value.is_null()) {
      emit_reads(reads, *anchor, node.start_row());
      emit_after(*anchor, variable_record(RecordKind::Decl, name, node.start_row()));
    }
  } while (cursor.goto_next_sibling());
}

void CInstrumentPass::enter_assignment_expression(Node node)
{
  if (!tracing()) {
    return;
  }
  const Node left = node.child_by_field("left");
  if (left.kind() != "identifier") {
    return;
  }
  std::string name = text(left);
  if (is_c_reserved(name)) {
    return;
  }
  const std::optional<Node> anchor = statement_anchor(node);
  if (!anchor || !is_simple_statement(*anchor)) {
    return;
  }

  const Node op = node.child_by_field("operator");
  const bool compound = !op.is_null() && op.text(source_) != "=";

  std::vector<std::string> reads = collect_reads(node.child_by_field("right"));
  if (compound) {
    reads.insert(reads.begin(), name);
  }
  const uint32_t row = node.start_row();
  emit_reads(reads, *anchor, row);
  emit_after(*anchor, variable_record(RecordKind::Assign, name, row));
}

void CInstrumentPass::enter_update_expression(Node node)
{
  if (!tracing()) {
    return;
  }
  const Node argument = node.child_by_field("argument");
  if (argument.kind() != "identifier") {
    return;
  }
  std::string name = text(argument);
  if (is_c_reserved(name)) {
    return;
  }
  // Loop headers are covered by the LOOP record.
  const std::optional<Node> anchor = statement_anchor(node);
  if (!anchor || !is_simple_statement(*anchor)) {
    return;
  }

  const bool increment = text(node).find("++") != std::string::npos;
  TraceStatement stmt(RecordKind::Update);
  stmt.literal(name)
    .literal(increment ? "++" : "--")
    .value(name, std::string(c_format_specifier(type_of(name))))
    .value("&" + name, "%p")
    .line(node.start_row());
  emit_after(*anchor, with_depth(stmt));
}

// ============================================================================
// Control flow
// ============================================================================

void CInstrumentPass::enter_if_statement(Node node)
{
  if (!tracing()) {
    return;
  }
  const auto [cond_text, cond_expr] = condition_of(node);
  const bool chained = is_else_if(node);

  if (!cond_expr.empty()) {
    TraceStatement condition(RecordKind::Condition);
    condition.literal(cond_text).value(cond_expr, "%d").line(node.start_row());
    if (chained) {
      emit_braced_inline(node, {with_depth(condition)});
    } else if (const auto anchor = statement_anchor(node); anchor && *anchor == node) {
      emit_before(node, with_depth(condition));
    }
  }

  const Node consequence = node.child_by_field("consequence");
  if (!consequence.is_null()) {
    TraceStatement branch(RecordKind::Branch);
    branch.literal(chained ? "elif" : "if").literal(cond_text).line(consequence.start_row());
    emit_block_entry(consequence, {with_depth(branch)});
  }

  const Node alternative = else_body(node);
  if (!alternative.is_null() && alternative.kind() != "if_statement") {
    TraceStatement branch(RecordKind::Branch);
    branch.literal("else").literal(cond_text).line(alternative.start_row());
    emit_block_entry(alternative, {with_depth(branch)});
  }
}

void CInstrumentPass::leave_if_statement(Node node)
{
  if (!tracing()) {
    return;
  }
  close_block_entry(node.child_by_field("consequence"));
  const Node alternative = else_body(node);
  if (!alternative.is_null() && alternative.kind() != "if_statement") {
    close_block_entry(alternative);
  }
}

void CInstrumentPass::enter_loop_statement(Node node)
{
  if (!tracing()) {
    return;
  }
  const Node body = node.child_by_field("body");
  if (body.is_null()) {
    return;
  }

  const std::string_view kind = node.kind();
  const char * label = kind == "for_statement" ? "for"
                       : kind == "do_statement" ? "do-while"
                                                : "while";
  const auto [cond_text, cond_expr] = condition_of(node);

  std::vector<TraceStatement> entry;
  TraceStatement loop(RecordKind::Loop);
  loop.literal(label);
  if (cond_text.empty()) {
    loop.literal("").literal("1");
  } else if (cond_expr.empty() || kind == "do_statement") {
    // A do-while condition has not been evaluated yet on first entry.
    loop.literal(cond_text).literal("");
  } else {
    loop.literal(cond_text).value(cond_expr, "%d");
  }
  loop.line(node.start_row());
  entry.push_back(std::move(with_depth(loop)));

  if (kind == "for_statement") {
    Node init = node.child_by_field("initializer");
    if (init.is_null()) {
      init = find_child(node, "declaration");
    }
    if (init.kind() == "declaration") {
      const std::string base = c_base_type(init, source_);
      for (uint32_t i = 0; i < init.named_child_count(); ++i) {
        const Node d = init.named_child(i);
        if (d.kind() != "init_declarator") {
          continue;
        }
        std::string name = c_declarator_name(d, source_);
        if (name.empty()) {
          continue;
        }
        declared_.insert(name);
        local_types_[name] = c_full_type(base, d);
        entry.push_back(variable_record(RecordKind::Decl, name, node.start_row()));
      }
    } else if (init.kind() == "assignment_expression") {
      const Node left = init.child_by_field("left");
      if (left.kind() == "identifier" && !is_c_reserved(left.text(source_))) {
        entry.push_back(variable_record(RecordKind::Decl, text(left), node.start_row()));
      }
    }
  }

  emit_block_entry(body, entry);
}

void CInstrumentPass::leave_loop_statement(Node node)
{
  if (tracing()) {
    close_block_entry(node.child_by_field("body"));
  }
}

void CInstrumentPass::enter_switch_statement(Node node)
{
  if (!tracing()) {
    return;
  }
  const auto anchor = statement_anchor(node);
  const Node condition = strip_parentheses(node.child_by_field("condition"));
  const std::string value = reevaluable(condition);
  if (!anchor || *anchor != node || value.empty()) {
    return;
  }
  TraceStatement stmt(RecordKind::Switch);
  stmt.literal(single_line(text(condition))).value(value, "%d").line(node.start_row());
  emit_before(node, with_depth(stmt));
}

void CInstrumentPass::enter_case_statement(Node node)
{
  if (!tracing() || !starts_line(node, source_)) {
    return;
  }
  // The record goes right after the label, so the label must end its line.
  const Node colon = find_child(node, ":");
  if (colon.is_null() || !ends_line(colon, source_)) {
    return;
  }
  const Node value = node.child_by_field("value");
  TraceStatement stmt(RecordKind::Case);
  stmt.literal(value.is_null() ? std::string("default") : single_line(text(value)))
    .line(node.start_row());
  plan_.add_after(colon.end_row(), render_c_statement(with_depth(stmt)));
}

void CInstrumentPass::enter_conditional_expression(Node node)
{
  if (!tracing()) {
    return;
  }
  const Node condition = strip_parentheses(node.child_by_field("condition"));
  const std::string expr = truth_value(condition);
  const auto anchor = statement_anchor(node);
  if (!anchor || expr.empty()) {
    return;
  }
  // Operands of && || and ?: may only be valid once their guard holds.
  for (Node p = node.parent(); !p.is_null() && p != *anchor; p = p.parent()) {
    if (p.kind() == "conditional_expression") {
      return;
    }
    if (p.kind() == "binary_expression") {
      const std::string_view op = p.child_by_field("operator").kind();
      if (op == "&&" || op == "||") {
        return;
      }
    }
  }
  TraceStatement stmt(RecordKind::Ternary);
  stmt.literal(single_line(text(condition))).value(expr, "%d").line(node.start_row());
  emit_before(*anchor, with_depth(stmt));
}

void CInstrumentPass::enter_return_statement(Node node)
{
  if (!tracing()) {
    return;
  }

  const uint32_t row = node.start_row();
  std::optional<TraceStatement> record;
  const Node expr = strip_parentheses(first_statement(node));
  if (!expr.is_null()) {
    const std::string_view kind = expr.kind();
    if (kind == "identifier" && !is_c_reserved(expr.text(source_))) {
      const std::string name = text(expr);
      record.emplace(RecordKind::Return);
      record->literal(name)
        .value(name, std::string(c_format_specifier(type_of(name))))
        .value("&" + name, "%p")
        .line(row);
    } else if (is_one_of(
                 kind, {"number_literal", "string_literal", "char_literal", "true", "false",
                        "null"})) {
      record.emplace(RecordKind::Return);
      record->literal("literal").literal(single_line(text(expr))).literal("0").line(row);
    }
  }

  const std::string decrement = fmt::format("{}--;", k_c_depth_counter);
  if (statement_anchor(node)) {
    if (record) {
      emit_before(node, with_depth(*record));
    }
    plan_.add_before(row, "    " + decrement);
    return;
  }

  // Shares its line with a guard or label: brace it in place.
  std::vector<TraceStatement> records;
  if (record) {
    records.push_back(std::move(with_depth(*record)));
  }
  emit_braced_inline(node, records, decrement);
}

void CInstrumentPass::enter_call_expression(Node node)
{
  if (!tracing()) {
    return;
  }
  const Node callee = node.child_by_field("function");
  if (callee.kind() != "identifier") {
    return;
  }
  std::string name = text(callee);
  if (is_c_reserved(name) || defined_functions_.count(name) != 0) {
    return;
  }
  if (const auto anchor = statement_anchor(node)) {
    TraceStatement stmt(RecordKind::ExternalCall);
    stmt.literal(std::move(name)).line(node.start_row());
    emit_before(*anchor, with_depth(stmt));
  }
}

}  // namespace codetrace
