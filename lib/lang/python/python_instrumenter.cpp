// codetrace/lang/python/python_instrumenter.cpp - Trace statement insertion for Python
#include <fmt/core.h>

#include <iterator>

#include "python_passes.hpp"

namespace codetrace
{

using ts_ll::Node;

namespace
{

bool is_statement_kind(std::string_view kind)
{
  return ends_with(kind, "_statement") || ends_with(kind, "_definition");
}

/// Nodes whose names are bound by the construct itself
bool is_binding_scope(std::string_view kind)
{
  return is_one_of(
    kind, {"lambda", "list_comprehension", "set_comprehension", "dictionary_comprehension",
           "generator_expression"});
}

}  // namespace

PythonInstrumentPass::PythonInstrumentPass(
  const SourceFile & source, const SymbolTable & symbols, const Metadata & metadata)
: source_(source), symbols_(symbols), metadata_(metadata)
{
  if (const auto defined = metadata_.get("defined_functions")) {
    for (auto & name : split_names(*defined)) {
      defined_functions_.insert(std::move(name));
    }
  }
  scopes_.push_back(Scope{});
  plan_.add_prelude(fmt::format("{} = 0", k_python_depth_counter));
}

void PythonInstrumentPass::register_handlers(NodeDispatcher<PythonInstrumentPass> & dispatcher)
{
  using P = PythonInstrumentPass;
  dispatcher.on_enter("function_definition", &P::enter_function_definition);
  dispatcher.on_leave("function_definition", &P::leave_function_definition);
  dispatcher.on_enter("class_definition", &P::enter_class_definition);
  dispatcher.on_leave("class_definition", &P::leave_class_definition);
  dispatcher.on_enter("assignment", &P::enter_assignment);
  dispatcher.on_enter("augmented_assignment", &P::enter_augmented_assignment);
  dispatcher.on_enter("if_statement", &P::enter_if_statement);
  dispatcher.on_enter("for_statement", &P::enter_for_statement);
  dispatcher.on_enter("while_statement", &P::enter_while_statement);
  dispatcher.on_enter("conditional_expression", &P::enter_conditional_expression);
  dispatcher.on_enter("return_statement", &P::enter_return_statement);
  dispatcher.on_enter("call", &P::enter_call);
  dispatcher.on_enter("global_statement", &P::enter_scope_declaration);
  dispatcher.on_enter("nonlocal_statement", &P::enter_scope_declaration);
}

std::string PythonInstrumentPass::finish() { return plan_.apply(source_); }

// ============================================================================
// Scopes and placement
// ============================================================================

bool PythonInstrumentPass::is_bound(std::string_view name) const
{
  if (scopes_.empty() || !symbols_.contains(name)) {
    return false;
  }
  const std::string key(name);
  const Scope & current = scopes_.back();
  if (current.globals.count(key) != 0) {
    return scopes_.front().bound.count(key) != 0;
  }
  if (current.bound.count(key) != 0) {
    return true;
  }
  // Enclosing functions, then the module; class bodies do not enclose.
  for (auto it = std::next(scopes_.rbegin()); it != scopes_.rend(); ++it) {
    const bool visible = it->function || std::next(it) == scopes_.rend();
    if (visible && it->bound.count(key) != 0) {
      return true;
    }
  }
  return false;
}

PythonInstrumentPass::Scope & PythonInstrumentPass::binding_scope(const std::string & name)
{
  Scope & current = scopes_.back();
  if (current.globals.count(name) != 0) {
    return scopes_.front();
  }
  if (current.nonlocals.count(name) != 0) {
    for (auto it = std::next(scopes_.rbegin()); it != scopes_.rend(); ++it) {
      if (it->function && it->bound.count(name) != 0) {
        return *it;
      }
    }
  }
  return current;
}

void PythonInstrumentPass::bind(const std::string & name)
{
  if (!scopes_.empty()) {
    binding_scope(name).bound.insert(name);
  }
}

std::optional<Node> PythonInstrumentPass::statement_anchor(Node node) const
{
  Node stmt = node;
  while (!stmt.is_null() && !is_statement_kind(stmt.kind())) {
    stmt = stmt.parent();
  }
  if (stmt.is_null()) {
    return std::nullopt;
  }
  const std::string_view parent = stmt.parent().kind();
  if ((parent != "block" && parent != "module") || !starts_line(stmt, source_)) {
    return std::nullopt;
  }
  return stmt;
}

std::string PythonInstrumentPass::indent_of(Node stmt) const
{
  return std::string(leading_whitespace(source_, stmt.start_row()));
}

bool PythonInstrumentPass::is_guarded(Node node, Node anchor) const
{
  for (Node p = node.parent(); !p.is_null() && p != anchor; p = p.parent()) {
    const std::string_view kind = p.kind();
    if (kind == "conditional_expression" || kind == "boolean_operator" || is_binding_scope(kind)) {
      return true;
    }
  }
  return false;
}

// ============================================================================
// Emission
// ============================================================================

void PythonInstrumentPass::emit_before(Node anchor, const TraceStatement & stmt)
{
  plan_.add_before(anchor.start_row(), render_python_statement(stmt, indent_of(anchor)));
}

void PythonInstrumentPass::emit_after(Node anchor, const TraceStatement & stmt)
{
  plan_.add_after(anchor.end_row(), render_python_statement(stmt, indent_of(anchor)));
}

void PythonInstrumentPass::emit_line_before(Node anchor, std::string_view line)
{
  plan_.add_before(anchor.start_row(), indent_of(anchor) + std::string(line));
}

std::optional<Node> PythonInstrumentPass::block_entry(Node block) const
{
  const Node first = first_statement(block);
  if (first.is_null() || !starts_line(first, source_)) {
    return std::nullopt;
  }
  return first;
}

void PythonInstrumentPass::emit_block_entry(Node first, const std::vector<TraceStatement> & stmts)
{
  for (const auto & stmt : stmts) {
    emit_before(first, stmt);
  }
}

std::vector<std::string> PythonInstrumentPass::collect_reads(Node expr) const
{
  std::vector<std::string> names;
  if (expr.is_null()) {
    return names;
  }

  const auto visit = [&](const auto & self, Node n) -> void {
    const std::string_view kind = n.kind();
    if (is_binding_scope(kind)) {
      return;
    }
    if (kind == "identifier") {
      const Node parent = n.parent();
      const std::string_view pk = parent.kind();
      const bool skipped =
        (pk == "call" && n == parent.child_by_field("function")) ||
        (pk == "attribute" && n == parent.child_by_field("attribute")) ||
        (pk == "keyword_argument" && n == parent.child_by_field("name")) ||
        ((pk == "assignment" || pk == "augmented_assignment") &&
         n == parent.child_by_field("left"));
      std::string name = text(n);
      if (!skipped && is_bound(name) && !is_python_reserved(name)) {
        names.push_back(std::move(name));
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

std::vector<std::string> PythonInstrumentPass::target_names(Node target) const
{
  std::vector<std::string> names;
  if (target.kind() == "identifier") {
    std::string name = text(target);
    if (!is_python_reserved(name)) {
      names.push_back(std::move(name));
    }
  } else if (is_one_of(target.kind(), {"pattern_list", "tuple_pattern", "list_pattern"})) {
    for (uint32_t i = 0; i < target.named_child_count(); ++i) {
      for (auto & name : target_names(target.named_child(i))) {
        names.push_back(std::move(name));
      }
    }
  }
  return names;
}

void PythonInstrumentPass::emit_reads(
  const std::vector<std::string> & names, Node anchor, uint32_t row)
{
  for (const auto & name : names) {
    emit_before(anchor, variable_record(RecordKind::Read, name, row));
  }
}

void PythonInstrumentPass::emit_writes(
  const std::vector<std::string> & names, Node anchor, uint32_t row)
{
  for (const auto & name : names) {
    const RecordKind kind =
      binding_scope(name).bound.count(name) != 0 ? RecordKind::Assign : RecordKind::Decl;
    bind(name);
    emit_after(anchor, variable_record(kind, name, row));
  }
}

TraceStatement PythonInstrumentPass::variable_record(
  RecordKind kind, const std::string & name, uint32_t row) const
{
  TraceStatement stmt(kind);
  stmt.literal(name).value(name).value("format(id(" + name + "), 'x')").line(row);
  return std::move(with_depth(stmt));
}

TraceStatement & PythonInstrumentPass::with_depth(TraceStatement & stmt) const
{
  return stmt.value(std::string(k_python_depth_counter));
}

std::pair<std::string, std::string> PythonInstrumentPass::condition_of(Node condition) const
{
  if (condition.is_null()) {
    return {};
  }
  std::string display = single_line(text(condition));
  if (contains_kind(condition, {"call", "named_expression", "await", "yield", "comment"})) {
    return {std::move(display), {}};
  }
  return {std::move(display), "bool(" + text(condition) + ")"};
}

// ============================================================================
// Functions and classes
// ============================================================================

void PythonInstrumentPass::enter_function_definition(Node node)
{
  const Node body = node.child_by_field("body");
  const std::optional<Node> first = block_entry(body);

  Scope scope;
  scope.body = body;
  scope.function = true;
  scope.traced = first.has_value() && first->start_row() > node.start_row();

  struct Param
  {
    std::string name;
    uint32_t row;
  };
  std::vector<Param> params;
  const Node list = node.child_by_field("parameters");
  for (uint32_t i = 0; i < list.named_child_count(); ++i) {
    const Node p = list.named_child(i);
    std::string name = python_parameter_name(p, source_);
    if (name.empty() || is_python_reserved(name)) {
      continue;
    }
    scope.bound.insert(name);
    params.push_back({std::move(name), p.start_row()});
  }

  const bool traced = scope.traced;
  scopes_.push_back(std::move(scope));
  const Node name_node = node.child_by_field("name");
  if (!traced || name_node.is_null()) {
    return;
  }

  const std::string name = text(name_node);
  if (name == "main") {
    for (const auto & [key, value] : metadata_) {
      emit_before(*first, TraceStatement(RecordKind::Meta).literal(key).literal(value));
    }
  }
  emit_line_before(*first, fmt::format("global {}", k_python_depth_counter));
  emit_line_before(*first, fmt::format("{} += 1", k_python_depth_counter));

  TraceStatement call(RecordKind::Call);
  call.literal(name);
  for (const auto & p : params) {
    call.value(p.name);
  }
  emit_before(*first, with_depth(call));

  for (const auto & p : params) {
    TraceStatement param(RecordKind::Param);
    param.literal(p.name).value(p.name).line(p.row);
    emit_before(*first, param);
  }
}

void PythonInstrumentPass::leave_function_definition(Node)
{
  if (scopes_.size() <= 1) {
    return;
  }
  const Scope & scope = scopes_.back();
  if (scope.traced) {
    const Node last = last_statement(scope.body);
    if (!last.is_null() && last.kind() != "return_statement" && starts_line(last, source_)) {
      plan_.add_after(
        last.end_row(), indent_of(last) + fmt::format("{} -= 1", k_python_depth_counter));
    }
  }
  scopes_.pop_back();
}

void PythonInstrumentPass::enter_scope_declaration(Node node)
{
  if (scopes_.size() <= 1) {
    return;
  }
  auto & names =
    node.kind() == "global_statement" ? scopes_.back().globals : scopes_.back().nonlocals;
  for (uint32_t i = 0; i < node.named_child_count(); ++i) {
    const Node name = node.named_child(i);
    if (name.kind() == "identifier") {
      names.insert(text(name));
    }
  }
}

void PythonInstrumentPass::enter_class_definition(Node node)
{
  Scope scope;
  scope.body = node.child_by_field("body");
  scope.traced = tracing();
  scopes_.push_back(std::move(scope));
}

void PythonInstrumentPass::leave_class_definition(Node)
{
  if (scopes_.size() > 1) {
    scopes_.pop_back();
  }
}

// ============================================================================
// Assignments
// ============================================================================

void PythonInstrumentPass::enter_assignment(Node node)
{
  if (!tracing()) {
    return;
  }
  const Node right = node.child_by_field("right");
  const std::optional<Node> anchor = statement_anchor(node);
  // Bare annotations (`x: int`) bind nothing at run time.
  if (right.is_null() || !anchor || anchor->kind() != "expression_statement") {
    return;
  }
  const std::vector<std::string> targets = target_names(node.child_by_field("left"));
  if (targets.empty()) {
    return;
  }
  const uint32_t row = node.start_row();
  emit_reads(collect_reads(right), *anchor, row);
  emit_writes(targets, *anchor, row);
}

void PythonInstrumentPass::enter_augmented_assignment(Node node)
{
  if (!tracing()) {
    return;
  }
  const Node left = node.child_by_field("left");
  const std::optional<Node> anchor = statement_anchor(node);
  if (left.kind() != "identifier" || !anchor || anchor->kind() != "expression_statement") {
    return;
  }
  const std::string name = text(left);
  if (is_python_reserved(name)) {
    return;
  }
  std::vector<std::string> reads = collect_reads(node.child_by_field("right"));
  reads.insert(reads.begin(), name);

  const uint32_t row = node.start_row();
  emit_reads(reads, *anchor, row);
  bind(name);
  emit_after(*anchor, variable_record(RecordKind::Assign, name, row));
}

// ============================================================================
// Control flow
// ============================================================================

void PythonInstrumentPass::enter_if_statement(Node node)
{
  if (!tracing()) {
    return;
  }
  const auto [cond_text, cond_expr] = condition_of(node.child_by_field("condition"));

  if (const auto anchor = statement_anchor(node); anchor && *anchor == node && !cond_expr.empty()) {
    TraceStatement condition(RecordKind::Condition);
    condition.literal(cond_text).value(cond_expr).line(node.start_row());
    emit_before(node, with_depth(condition));
  }

  const auto branch = [&](const char * kind, const std::string & text_of_cond, Node block) {
    if (const auto first = block_entry(block)) {
      TraceStatement stmt(RecordKind::Branch);
      stmt.literal(kind).literal(text_of_cond).line(first->start_row());
      emit_block_entry(*first, {with_depth(stmt)});
    }
  };

  branch("if", cond_text, node.child_by_field("consequence"));

  std::string previous = cond_text;
  for (uint32_t i = 0; i < node.named_child_count(); ++i) {
    const Node clause = node.named_child(i);
    if (clause.kind() == "elif_clause") {
      previous = single_line(text(clause.child_by_field("condition")));
      branch("elif", previous, clause.child_by_field("consequence"));
    } else if (clause.kind() == "else_clause") {
      branch("else", previous, clause.child_by_field("body"));
    }
  }
}

void PythonInstrumentPass::enter_for_statement(Node node)
{
  if (!tracing()) {
    return;
  }
  const std::vector<std::string> targets = target_names(node.child_by_field("left"));
  for (const auto & name : targets) {
    bind(name);
  }

  const auto first = block_entry(node.child_by_field("body"));
  if (!first) {
    return;
  }
  const uint32_t row = node.start_row();
  std::vector<TraceStatement> entry;
  TraceStatement loop(RecordKind::Loop);
  loop.literal("for")
    .literal(single_line(text(node.child_by_field("right"))))
    .literal("1")
    .line(row);
  entry.push_back(std::move(with_depth(loop)));
  for (const auto & name : targets) {
    entry.push_back(variable_record(RecordKind::Decl, name, row));
  }
  emit_block_entry(*first, entry);
}

void PythonInstrumentPass::enter_while_statement(Node node)
{
  if (!tracing()) {
    return;
  }
  const auto first = block_entry(node.child_by_field("body"));
  if (!first) {
    return;
  }
  const auto [cond_text, cond_expr] = condition_of(node.child_by_field("condition"));
  TraceStatement loop(RecordKind::Loop);
  loop.literal("while").literal(cond_text);
  if (cond_expr.empty()) {
    loop.literal("");
  } else {
    loop.value(cond_expr);
  }
  loop.line(node.start_row());
  emit_block_entry(*first, {with_depth(loop)});
}

void PythonInstrumentPass::enter_conditional_expression(Node node)
{
  if (!tracing()) {
    return;
  }
  const auto anchor = statement_anchor(node);
  if (!anchor || is_guarded(node, *anchor)) {
    return;
  }
  // `body if condition else alternative`
  const auto [cond_text, cond_expr] = condition_of(node.named_child(1));
  if (cond_expr.empty()) {
    return;
  }
  TraceStatement stmt(RecordKind::Ternary);
  stmt.literal(cond_text).value(cond_expr).line(node.start_row());
  emit_before(*anchor, with_depth(stmt));
}

void PythonInstrumentPass::enter_return_statement(Node node)
{
  if (!tracing() || !scopes_.back().function) {
    return;
  }

  const uint32_t row = node.start_row();
  std::optional<TraceStatement> record;
  const Node expr = first_statement(node);
  if (!expr.is_null()) {
    record.emplace(RecordKind::Return);
    const std::string value = text(expr);
    if (expr.kind() == "identifier" && !is_python_reserved(value)) {
      record->literal(value).value(value).value("format(id(" + value + "), 'x')");
    } else {
      record->literal("literal").literal(single_line(value)).literal("0");
    }
    record->line(row);
  }

  const std::string decrement = fmt::format("{} -= 1", k_python_depth_counter);
  if (statement_anchor(node)) {
    if (record) {
      emit_before(node, with_depth(*record));
    }
    emit_line_before(node, decrement);
    return;
  }
  if (node.parent().kind() != "block") {
    return;
  }

  // `if done: return x` keeps its one-line suite; the record joins it.
  std::string lead;
  if (record) {
    lead = render_python_statement(with_depth(*record), "") + "; ";
  }
  lead += decrement + "; ";
  plan_.add_inline(node.start_point().row, node.start_point().column, std::move(lead));
}

void PythonInstrumentPass::enter_call(Node node)
{
  if (!tracing()) {
    return;
  }
  const Node callee = node.child_by_field("function");
  std::string name;
  if (callee.kind() == "identifier") {
    name = text(callee);
  } else if (callee.kind() == "attribute") {
    name = text(callee.child_by_field("attribute"));
  }
  if (name.empty() || is_python_reserved(name) || defined_functions_.count(name) != 0) {
    return;
  }
  if (const auto anchor = statement_anchor(node)) {
    TraceStatement stmt(RecordKind::ExternalCall);
    stmt.literal(std::move(name)).line(node.start_row());
    emit_before(*anchor, with_depth(stmt));
  }
}

}  // namespace codetrace
