#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "codetrace/test_support/test_helpers.hpp"
#include "codetrace/trace/decoder.hpp"
#include "codetrace/trace/record_json.hpp"

using codetrace::RecordKind;
using codetrace::test_support::wire_line;

namespace
{

std::string trace_of(std::initializer_list<std::string> lines, std::string_view eol = "\n")
{
  std::string out;
  for (const auto & line : lines) {
    out += line;
    out.append(eol.data(), eol.size());
  }
  return out;
}

}  // namespace

// ============================================================================
// Field parsing
// ============================================================================

TEST(DecoderTest, DecodesVariableRecords)
{
  const auto result = codetrace::decode_trace(
    trace_of({wire_line({"DECL", "x", "5", "0x7ffd", "3", "1"}),
              wire_line({"ASSIGN", "x", "6", "0x7ffd", "4", "1"}),
              wire_line({"READ", "x", "6", "0x7ffd", "5", "1"})}));

  ASSERT_EQ(result.traces.size(), 3U);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_EQ(result.traces[0].kind, RecordKind::Decl);
  EXPECT_EQ(result.traces[1].kind, RecordKind::Assign);
  EXPECT_EQ(result.traces[2].kind, RecordKind::Read);

  const auto * decl = result.traces[0].as<codetrace::VariableEvent>();
  ASSERT_NE(decl, nullptr);
  EXPECT_EQ(decl->subject, "x");
  EXPECT_EQ(decl->value, "5");
  EXPECT_EQ(decl->address, "0x7ffd");
  EXPECT_EQ(decl->line_number, 3);
  EXPECT_EQ(decl->stack_depth, 1);
}

TEST(DecoderTest, CallKeepsArgumentsInOrder)
{
  const auto result = codetrace::decode_trace(
    trace_of({wire_line({"CALL", "add", "1", "2", "1"}), wire_line({"CALL", "main", "1"})}));

  ASSERT_EQ(result.traces.size(), 2U);
  const auto * add = result.traces[0].as<codetrace::CallEvent>();
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->subject, "add");
  EXPECT_EQ(add->args, (std::vector<std::string>{"1", "2"}));
  EXPECT_EQ(add->stack_depth, 1);

  const auto * main_call = result.traces[1].as<codetrace::CallEvent>();
  ASSERT_NE(main_call, nullptr);
  EXPECT_TRUE(main_call->args.empty());
}

TEST(DecoderTest, ParamHasNoDepth)
{
  const auto result = codetrace::decode_trace(wire_line({"PARAM", "n", "3", "7"}));
  ASSERT_EQ(result.traces.size(), 1U);
  const auto * param = result.traces[0].as<codetrace::ParamEvent>();
  ASSERT_NE(param, nullptr);
  EXPECT_EQ(param->subject, "n");
  EXPECT_EQ(param->value, "3");
  EXPECT_EQ(param->line_number, 7);
}

TEST(DecoderTest, LiteralReturnsHaveNoAddress)
{
  const auto result = codetrace::decode_trace(
    trace_of({wire_line({"RETURN", "literal", "0", "0", "9", "1"}),
              wire_line({"RETURN", "x", "5", "0x10", "4", "2"})}));

  ASSERT_EQ(result.traces.size(), 2U);
  const auto * literal = result.traces[0].as<codetrace::ReturnEvent>();
  ASSERT_NE(literal, nullptr);
  EXPECT_EQ(literal->subtype, "literal");
  EXPECT_FALSE(literal->address.has_value());

  const auto * named = result.traces[1].as<codetrace::ReturnEvent>();
  ASSERT_NE(named, nullptr);
  EXPECT_EQ(named->address, "0x10");
  EXPECT_EQ(named->stack_depth, 2);
}

TEST(DecoderTest, LoopConditionIsOptional)
{
  const auto result = codetrace::decode_trace(
    trace_of({wire_line({"LOOP", "while", "i < 3", "1", "5", "1"}),
              wire_line({"LOOP", "do-while", "i < 3", "", "8", "1"}),
              wire_line({"LOOP", "for", "", "1", "11", "1"})}));

  ASSERT_EQ(result.traces.size(), 3U);
  const auto * with_result = result.traces[0].as<codetrace::LoopEvent>();
  ASSERT_NE(with_result, nullptr);
  EXPECT_EQ(with_result->condition, "i < 3");
  EXPECT_EQ(with_result->condition_result, 1);

  const auto * unevaluated = result.traces[1].as<codetrace::LoopEvent>();
  ASSERT_NE(unevaluated, nullptr);
  EXPECT_EQ(unevaluated->subtype, "do-while");
  EXPECT_FALSE(unevaluated->condition_result.has_value());

  const auto * bare = result.traces[2].as<codetrace::LoopEvent>();
  ASSERT_NE(bare, nullptr);
  EXPECT_FALSE(bare->condition.has_value());

  const auto j = codetrace::to_json(result.traces[1]);
  EXPECT_FALSE(j.contains("condition_result"));
  EXPECT_EQ(j["condition"], "i < 3");
}

TEST(DecoderTest, PythonBooleansAreEvaluationResults)
{
  const auto result = codetrace::decode_trace(
    trace_of({wire_line({"CONDITION", "x > 1", "True", "3", "1"}),
              wire_line({"TERNARY", "flag", "False", "4", "1"})}));

  ASSERT_EQ(result.traces.size(), 2U);
  EXPECT_EQ(result.traces[0].as<codetrace::ConditionEvent>()->condition_result, 1);
  EXPECT_EQ(result.traces[1].kind, RecordKind::Ternary);
  EXPECT_EQ(result.traces[1].as<codetrace::ConditionEvent>()->condition_result, 0);
}

TEST(DecoderTest, ControlFlowRecords)
{
  const auto result = codetrace::decode_trace(
    trace_of({wire_line({"BRANCH", "else", "x > 1", "6", "1"}),
              wire_line({"SWITCH", "k", "2", "8", "1"}), wire_line({"CASE", "default", "9", "1"}),
              wire_line({"UPDATE", "c", "++", "1", "0xab", "10", "1"}),
              wire_line({"EXTERNAL_CALL", "abs", "12", "1"})}));

  ASSERT_EQ(result.traces.size(), 5U);
  EXPECT_EQ(result.traces[0].as<codetrace::BranchEvent>()->subtype, "else");
  EXPECT_EQ(result.traces[1].as<codetrace::SwitchEvent>()->value, "2");
  EXPECT_EQ(result.traces[2].as<codetrace::CaseEvent>()->subject, "default");
  EXPECT_EQ(result.traces[3].as<codetrace::UpdateEvent>()->op, "++");
  EXPECT_EQ(result.traces[4].as<codetrace::ExternalCallEvent>()->line_number, 12);
}

TEST(DecoderTest, ParseRecordRejectsBadIntegers)
{
  const std::vector<std::string_view> fields{"x", "5", "0x1", "three", "1"};
  const auto parsed = codetrace::parse_record(RecordKind::Decl, fields);
  EXPECT_FALSE(parsed.success);
  EXPECT_NE(parsed.error.find("invalid line number 'three'"), std::string::npos);
}

TEST(DecoderTest, ParseRecordRejectsMetaAndUnknown)
{
  const std::vector<std::string_view> fields{"key", "value"};
  EXPECT_FALSE(codetrace::parse_record(RecordKind::Meta, fields).success);
  EXPECT_FALSE(codetrace::parse_record(RecordKind::Unknown, fields).success);
}

// ============================================================================
// Stream handling
// ============================================================================

TEST(DecoderTest, MetaLinesFillMetadata)
{
  const auto result = codetrace::decode_trace(
    trace_of({wire_line({"META", "language", "C"}), wire_line({"CALL", "main", "1"}),
              wire_line({"META", "file_name", "a.c"}), wire_line({"META", "language", "C99"})}));

  ASSERT_EQ(result.traces.size(), 1U);
  ASSERT_EQ(result.metadata.size(), 2U);
  EXPECT_EQ(result.metadata.entries()[0].first, "language");
  EXPECT_EQ(result.metadata.get("language"), "C99");
  EXPECT_EQ(result.metadata.get("file_name"), "a.c");
}

TEST(DecoderTest, IdsFollowDecodeOrder)
{
  const auto result = codetrace::decode_trace(
    trace_of({wire_line({"CALL", "main", "1"}), wire_line({"META", "k", "v"}), "",
              wire_line({"EXTERNAL_CALL", "puts", "3", "1"}),
              wire_line({"RETURN", "literal", "0", "0", "4", "1"})}));

  ASSERT_EQ(result.traces.size(), 3U);
  for (size_t i = 0; i < result.traces.size(); ++i) {
    EXPECT_EQ(result.traces[i].id, i);
  }
}

TEST(DecoderTest, CrlfAndBlankLinesAreIgnored)
{
  const std::string call = wire_line({"CALL", "main", "1"});
  const std::string read = wire_line({"READ", "x", "1", "0x1", "2", "1"});
  const auto lf = codetrace::decode_trace(trace_of({call, "", "   ", read}));
  const auto crlf = codetrace::decode_trace(trace_of({call, "", "   ", read}, "\r\n"));

  ASSERT_EQ(lf.traces.size(), 2U);
  EXPECT_EQ(codetrace::to_json(lf).dump(), codetrace::to_json(crlf).dump());
  EXPECT_TRUE(crlf.diagnostics.empty());
}

TEST(DecoderTest, MissingTrailingNewlineIsAccepted)
{
  const auto result = codetrace::decode_trace(wire_line({"CASE", "1", "5", "2"}));
  ASSERT_EQ(result.traces.size(), 1U);
  EXPECT_EQ(result.traces[0].as<codetrace::CaseEvent>()->stack_depth, 2);
}

TEST(DecoderTest, UnknownTagsKeepAllFields)
{
  const auto result = codetrace::decode_trace(
    trace_of({wire_line({"PROBE", "a", "b"}), wire_line({"CALL", "main", "1"})}));

  ASSERT_EQ(result.traces.size(), 2U);
  EXPECT_EQ(result.traces[0].kind, RecordKind::Unknown);
  const auto * unknown = result.traces[0].as<codetrace::UnknownEvent>();
  ASSERT_NE(unknown, nullptr);
  EXPECT_EQ(unknown->args, (std::vector<std::string>{"PROBE", "a", "b"}));
  EXPECT_EQ(result.traces[1].kind, RecordKind::Call);
  EXPECT_TRUE(result.diagnostics.empty());

  const auto j = codetrace::to_json(result.traces[0]);
  EXPECT_EQ(j["type"], "UNKNOWN");
}

TEST(DecoderTest, MalformedLinesAreDroppedWithWarning)
{
  const auto result = codetrace::decode_trace(
    trace_of({wire_line({"CALL", "main", "1"}), wire_line({"DECL", "x", "5"}),
              wire_line({"CONDITION", "x", "maybe", "3", "1"}), wire_line({"META", "only-key"}),
              wire_line({"READ", "x", "5", "0x1", "6", "1"})}));

  ASSERT_EQ(result.traces.size(), 2U);
  EXPECT_EQ(result.traces[1].kind, RecordKind::Read);
  EXPECT_EQ(result.traces[1].id, 1U);

  ASSERT_EQ(result.diagnostics.size(), 3U);
  EXPECT_FALSE(result.diagnostics.has_errors());
  const auto & first = result.diagnostics.all()[0];
  EXPECT_EQ(first.code, "normalize");
  EXPECT_EQ(first.trace_line, 2U);
  EXPECT_FALSE(first.has_source_range());
  EXPECT_NE(first.message.find("line 2"), std::string::npos);
  EXPECT_NE(first.message.find("DECL expects 5 fields, got 2"), std::string::npos);
  EXPECT_NE(result.diagnostics.all()[1].message.find("line 3"), std::string::npos);
  EXPECT_NE(result.diagnostics.all()[2].message.find("line 4"), std::string::npos);
}

TEST(DecoderTest, EmptyInputDecodesToNothing)
{
  const auto result = codetrace::decode_trace("");
  EXPECT_TRUE(result.traces.empty());
  EXPECT_TRUE(result.metadata.empty());
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST(DecoderTest, DecodingIsDeterministic)
{
  const std::string raw = trace_of(
    {wire_line({"META", "language", "Python"}), wire_line({"CALL", "f", "2", "1"}),
     wire_line({"PARAM", "n", "2", "1"}), wire_line({"LOOP", "for", "range(n)", "1", "2", "1"}),
     wire_line({"RETURN", "n", "2", "7f00", "3", "1"})});

  EXPECT_EQ(
    codetrace::to_json(codetrace::decode_trace(raw)).dump(),
    codetrace::to_json(codetrace::decode_trace(raw)).dump());
}
