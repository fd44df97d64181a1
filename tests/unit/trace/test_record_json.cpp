#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "codetrace/trace/record_json.hpp"

namespace
{

std::vector<std::string> keys_of(const nlohmann::ordered_json & j)
{
  std::vector<std::string> keys;
  for (auto it = j.begin(); it != j.end(); ++it) {
    keys.push_back(it.key());
  }
  return keys;
}

}  // namespace

TEST(RecordJsonTest, VariableRecordLayout)
{
  codetrace::TraceRecord record;
  record.kind = codetrace::RecordKind::Assign;
  record.id = 4;
  record.event = codetrace::VariableEvent{"x", "6", "0x7ffd", 12, 2};

  const auto j = codetrace::to_json(record);
  EXPECT_EQ(
    keys_of(j), (std::vector<std::string>{
                  "type", "subject", "value", "address", "line_number", "stack_depth", "id"}));
  EXPECT_EQ(j.dump(),
            R"({"type":"ASSIGN","subject":"x","value":"6","address":"0x7ffd",)"
            R"("line_number":12,"stack_depth":2,"id":4})");
}

TEST(RecordJsonTest, UpdateUsesOperatorKey)
{
  codetrace::TraceRecord record;
  record.kind = codetrace::RecordKind::Update;
  record.event = codetrace::UpdateEvent{"i", "++", "3", "0x1", 5, 1};

  const auto j = codetrace::to_json(record);
  EXPECT_EQ(j["operator"], "++");
  EXPECT_FALSE(j.contains("op"));
}

TEST(RecordJsonTest, OptionalFieldsAreOmitted)
{
  codetrace::ReturnEvent ret;
  ret.subtype = "literal";
  ret.value = "0";
  ret.line_number = 9;
  ret.stack_depth = 1;

  codetrace::TraceRecord record;
  record.kind = codetrace::RecordKind::Return;
  record.event = ret;

  const auto j = codetrace::to_json(record);
  EXPECT_FALSE(j.contains("address"));
  EXPECT_EQ(j["subtype"], "literal");
}

TEST(RecordJsonTest, CallArgumentsAreAnArray)
{
  codetrace::TraceRecord record;
  record.kind = codetrace::RecordKind::Call;
  record.event = codetrace::CallEvent{"add", {"1", "2"}, 1};

  const auto j = codetrace::to_json(record);
  ASSERT_TRUE(j["args"].is_array());
  EXPECT_EQ(j["args"].size(), 2U);
  EXPECT_EQ(j["args"][1], "2");
  EXPECT_FALSE(j.contains("line_number"));
}

TEST(RecordJsonTest, MetadataKeepsInsertionOrder)
{
  codetrace::Metadata md;
  md.set("zeta", "1");
  md.set("alpha", "2");
  md.set_count("count", 3);

  const auto j = codetrace::to_json(md);
  EXPECT_EQ(keys_of(j), (std::vector<std::string>{"zeta", "alpha", "count"}));
  EXPECT_EQ(j["count"], "3");
}

TEST(RecordJsonTest, DecodeResultShape)
{
  codetrace::DecodeResult result;
  result.metadata.set("language", "C");
  codetrace::TraceRecord record;
  record.kind = codetrace::RecordKind::Case;
  record.event = codetrace::CaseEvent{"default", 8, 1};
  result.traces.push_back(record);

  const auto j = codetrace::to_json(result);
  EXPECT_EQ(keys_of(j), (std::vector<std::string>{"metadata", "traces"}));
  EXPECT_EQ(j["metadata"]["language"], "C");
  ASSERT_EQ(j["traces"].size(), 1U);
  EXPECT_EQ(j["traces"][0]["type"], "CASE");
}

TEST(RecordJsonTest, EmptyResultIsStillAnObject)
{
  const auto j = codetrace::to_json(codetrace::DecodeResult{});
  EXPECT_EQ(j.dump(), R"({"metadata":{},"traces":[]})");
}
