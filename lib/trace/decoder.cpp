// codetrace/trace/decoder.cpp - Raw trace output to typed records
#include "codetrace/trace/decoder.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <charconv>

namespace codetrace
{

namespace
{

using Fields = gsl::span<const std::string_view>;

std::optional<int64_t> parse_int(std::string_view text)
{
  int64_t value = 0;
  const char * end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (text.empty() || ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

/// Evaluation results: integers, or Python booleans
std::optional<int64_t> parse_truth(std::string_view text)
{
  if (text == "True") {
    return 1;
  }
  if (text == "False") {
    return 0;
  }
  return parse_int(text);
}

/**
 * Positional reader over the fields of one record.
 *
 * The first conversion failure is remembered; later reads are no-ops.
 */
class FieldReader
{
public:
  FieldReader(RecordKind kind, Fields fields) : kind_(kind), fields_(fields) {}

  [[nodiscard]] bool expect(size_t count)
  {
    if (fields_.size() != count) {
      fail(fmt::format(
        "{} expects {} fields, got {}", tag_name(kind_), count, fields_.size()));
    }
    return ok();
  }

  [[nodiscard]] std::string text(size_t i) const { return std::string(fields_[i]); }

  int64_t integer(size_t i, std::string_view what)
  {
    return convert(i, what, parse_int);
  }

  int64_t truth(size_t i, std::string_view what) { return convert(i, what, parse_truth); }

  [[nodiscard]] bool ok() const noexcept { return error_.empty(); }
  [[nodiscard]] const std::string & error() const noexcept { return error_; }

  template <typename Event>
  RecordParseResult finish(Event && event) const
  {
    if (!ok()) {
      return RecordParseResult::fail(error_);
    }
    return RecordParseResult::ok(std::forward<Event>(event));
  }

private:
  template <typename Parse>
  int64_t convert(size_t i, std::string_view what, Parse parse)
  {
    if (!ok()) {
      return 0;
    }
    const auto value = parse(fields_[i]);
    if (!value) {
      fail(fmt::format("invalid {} '{}'", what, fields_[i]));
      return 0;
    }
    return *value;
  }

  void fail(std::string msg)
  {
    if (error_.empty()) {
      error_ = std::move(msg);
    }
  }

  RecordKind kind_;
  Fields fields_;
  std::string error_;
};

RecordParseResult parse_variable(FieldReader & r)
{
  if (!r.expect(5)) {
    return RecordParseResult::fail(r.error());
  }
  VariableEvent ev;
  ev.subject = r.text(0);
  ev.value = r.text(1);
  ev.address = r.text(2);
  ev.line_number = r.integer(3, "line number");
  ev.stack_depth = r.integer(4, "stack depth");
  return r.finish(std::move(ev));
}

RecordParseResult parse_call(FieldReader & r, Fields fields)
{
  if (fields.size() < 2) {
    return RecordParseResult::fail(
      fmt::format("CALL expects at least 2 fields, got {}", fields.size()));
  }
  CallEvent ev;
  ev.subject = r.text(0);
  for (size_t i = 1; i + 1 < fields.size(); ++i) {
    ev.args.push_back(r.text(i));
  }
  ev.stack_depth = r.integer(fields.size() - 1, "stack depth");
  return r.finish(std::move(ev));
}

RecordParseResult parse_external_call(FieldReader & r)
{
  if (!r.expect(3)) {
    return RecordParseResult::fail(r.error());
  }
  ExternalCallEvent ev;
  ev.subject = r.text(0);
  ev.line_number = r.integer(1, "line number");
  ev.stack_depth = r.integer(2, "stack depth");
  return r.finish(std::move(ev));
}

RecordParseResult parse_param(FieldReader & r)
{
  if (!r.expect(3)) {
    return RecordParseResult::fail(r.error());
  }
  ParamEvent ev;
  ev.subject = r.text(0);
  ev.value = r.text(1);
  ev.line_number = r.integer(2, "line number");
  return r.finish(std::move(ev));
}

RecordParseResult parse_update(FieldReader & r)
{
  if (!r.expect(6)) {
    return RecordParseResult::fail(r.error());
  }
  UpdateEvent ev;
  ev.subject = r.text(0);
  ev.op = r.text(1);
  ev.value = r.text(2);
  ev.address = r.text(3);
  ev.line_number = r.integer(4, "line number");
  ev.stack_depth = r.integer(5, "stack depth");
  return r.finish(std::move(ev));
}

RecordParseResult parse_return(FieldReader & r)
{
  if (!r.expect(5)) {
    return RecordParseResult::fail(r.error());
  }
  ReturnEvent ev;
  ev.subtype = r.text(0);
  ev.value = r.text(1);
  if (std::string address = r.text(2); !address.empty() && address != "0") {
    ev.address = std::move(address);
  }
  ev.line_number = r.integer(3, "line number");
  ev.stack_depth = r.integer(4, "stack depth");
  return r.finish(std::move(ev));
}

RecordParseResult parse_loop(FieldReader & r, Fields fields)
{
  if (!r.expect(5)) {
    return RecordParseResult::fail(r.error());
  }
  LoopEvent ev;
  ev.subtype = r.text(0);
  if (!fields[1].empty()) {
    ev.condition = r.text(1);
  }
  if (!fields[2].empty()) {
    ev.condition_result = r.truth(2, "condition result");
  }
  ev.line_number = r.integer(3, "line number");
  ev.stack_depth = r.integer(4, "stack depth");
  return r.finish(std::move(ev));
}

RecordParseResult parse_branch(FieldReader & r)
{
  if (!r.expect(4)) {
    return RecordParseResult::fail(r.error());
  }
  BranchEvent ev;
  ev.subtype = r.text(0);
  ev.condition = r.text(1);
  ev.line_number = r.integer(2, "line number");
  ev.stack_depth = r.integer(3, "stack depth");
  return r.finish(std::move(ev));
}

RecordParseResult parse_condition(FieldReader & r)
{
  if (!r.expect(4)) {
    return RecordParseResult::fail(r.error());
  }
  ConditionEvent ev;
  ev.subject = r.text(0);
  ev.condition_result = r.truth(1, "condition result");
  ev.line_number = r.integer(2, "line number");
  ev.stack_depth = r.integer(3, "stack depth");
  return r.finish(std::move(ev));
}

RecordParseResult parse_switch(FieldReader & r)
{
  if (!r.expect(4)) {
    return RecordParseResult::fail(r.error());
  }
  SwitchEvent ev;
  ev.subject = r.text(0);
  ev.value = r.text(1);
  ev.line_number = r.integer(2, "line number");
  ev.stack_depth = r.integer(3, "stack depth");
  return r.finish(std::move(ev));
}

RecordParseResult parse_case(FieldReader & r)
{
  if (!r.expect(3)) {
    return RecordParseResult::fail(r.error());
  }
  CaseEvent ev;
  ev.subject = r.text(0);
  ev.line_number = r.integer(1, "line number");
  ev.stack_depth = r.integer(2, "stack depth");
  return r.finish(std::move(ev));
}

std::vector<std::string_view> split_fields(std::string_view line)
{
  std::vector<std::string_view> fields;
  size_t start = 0;
  while (true) {
    const size_t pos = line.find(k_field_delimiter, start);
    if (pos == std::string_view::npos) {
      fields.push_back(line.substr(start));
      return fields;
    }
    fields.push_back(line.substr(start, pos - start));
    start = pos + 1;
  }
}

std::string normalize_line_endings(std::string_view raw)
{
  std::string text;
  text.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] == '\r' && (i + 1 == raw.size() || raw[i + 1] == '\n')) {
      continue;
    }
    text += raw[i];
  }
  return text;
}

}  // namespace

RecordParseResult parse_record(RecordKind kind, gsl::span<const std::string_view> fields)
{
  FieldReader reader(kind, fields);
  switch (kind) {
    case RecordKind::Decl:
    case RecordKind::Assign:
    case RecordKind::Read:
      return parse_variable(reader);
    case RecordKind::Call:
      return parse_call(reader, fields);
    case RecordKind::ExternalCall:
      return parse_external_call(reader);
    case RecordKind::Param:
      return parse_param(reader);
    case RecordKind::Update:
      return parse_update(reader);
    case RecordKind::Return:
      return parse_return(reader);
    case RecordKind::Loop:
      return parse_loop(reader, fields);
    case RecordKind::Branch:
      return parse_branch(reader);
    case RecordKind::Condition:
    case RecordKind::Ternary:
      return parse_condition(reader);
    case RecordKind::Switch:
      return parse_switch(reader);
    case RecordKind::Case:
      return parse_case(reader);
    case RecordKind::Meta:
    case RecordKind::Unknown:
      break;
  }
  return RecordParseResult::fail(fmt::format("{} is not a trace event", tag_name(kind)));
}

DecodeResult decode_trace(std::string_view raw)
{
  DecodeResult result;
  const std::string text = normalize_line_endings(raw);
  const std::string_view view(text);

  const auto malformed = [&](size_t line_no, std::string_view tag, const std::string & why) {
    spdlog::warn("trace line {}: malformed {} record: {}", line_no, tag, why);
    result.diagnostics
      .report_warning({}, fmt::format("malformed {} record on line {}: {}", tag, line_no, why))
      .with_code("normalize")
      .at_trace_line(static_cast<uint32_t>(line_no));
  };

  size_t offset = 0;
  size_t line_no = 0;
  while (offset < view.size()) {
    size_t end = view.find('\n', offset);
    if (end == std::string_view::npos) {
      end = view.size();
    }
    const std::string_view line = view.substr(offset, end - offset);
    offset = end + 1;
    ++line_no;

    if (line.find_first_not_of(" \t") == std::string_view::npos) {
      continue;
    }

    const std::vector<std::string_view> fields = split_fields(line);
    const std::string_view tag = fields.front();

    if (tag == tag_name(RecordKind::Meta)) {
      if (fields.size() != 3) {
        malformed(line_no, tag, fmt::format("META expects 2 fields, got {}", fields.size() - 1));
        continue;
      }
      result.metadata.set(std::string(fields[1]), std::string(fields[2]));
      continue;
    }

    TraceRecord record;
    record.id = result.traces.size();
    const auto kind = kind_from_tag(tag);
    if (!kind) {
      record.kind = RecordKind::Unknown;
      record.event = UnknownEvent{std::vector<std::string>(fields.begin(), fields.end())};
      result.traces.push_back(std::move(record));
      continue;
    }

    const gsl::span<const std::string_view> all(fields.data(), fields.size());
    RecordParseResult parsed = parse_record(*kind, all.subspan(1));
    if (!parsed.success) {
      malformed(line_no, tag, parsed.error);
      continue;
    }
    record.kind = *kind;
    record.event = std::move(parsed.event);
    result.traces.push_back(std::move(record));
  }

  return result;
}

}  // namespace codetrace
