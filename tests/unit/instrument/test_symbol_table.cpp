#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "codetrace/instrument/metadata.hpp"
#include "codetrace/instrument/symbol_table.hpp"
#include "codetrace/trace/wire_format.hpp"

using codetrace::TypeCategory;
using codetrace::classify_type;

TEST(SymbolTable, LaterDefinitionOverwrites)
{
  codetrace::SymbolTable table;
  table.define("x", "int");
  table.define("x", "double");

  EXPECT_EQ(table.size(), 1U);
  ASSERT_TRUE(table.lookup("x").has_value());
  EXPECT_EQ(*table.lookup("x"), "double");
  EXPECT_EQ(table.type_of("missing", "int"), "int");
  EXPECT_FALSE(table.contains("missing"));
}

TEST(SymbolTable, ClassifiesScalarTypes)
{
  EXPECT_EQ(classify_type("int"), TypeCategory::Integer);
  EXPECT_EQ(classify_type("unsigned int"), TypeCategory::Integer);
  EXPECT_EQ(classify_type("float"), TypeCategory::Float);
  EXPECT_EQ(classify_type("double"), TypeCategory::Double);
  EXPECT_EQ(classify_type("char"), TypeCategory::Char);
  EXPECT_EQ(classify_type("long"), TypeCategory::Long);
  EXPECT_EQ(classify_type("object"), TypeCategory::Generic);
  EXPECT_EQ(classify_type("struct point"), TypeCategory::Generic);
}

TEST(SymbolTable, ClassifiesIndirection)
{
  EXPECT_EQ(classify_type("char *"), TypeCategory::String);
  EXPECT_EQ(classify_type("const char *"), TypeCategory::String);
  EXPECT_EQ(classify_type("char[16]"), TypeCategory::String);
  EXPECT_EQ(classify_type("char * *"), TypeCategory::Pointer);
  EXPECT_EQ(classify_type("int *"), TypeCategory::Pointer);
}

TEST(Metadata, KeepsInsertionOrderAndReplacesInPlace)
{
  codetrace::Metadata metadata;
  metadata.set("b", "1");
  metadata.set("a", "2");
  metadata.set_count("b", 3);

  ASSERT_EQ(metadata.size(), 2U);
  EXPECT_EQ(metadata.entries()[0].first, "b");
  EXPECT_EQ(metadata.entries()[0].second, "3");
  EXPECT_EQ(metadata.entries()[1].first, "a");
  EXPECT_EQ(*metadata.get("a"), "2");
  EXPECT_FALSE(metadata.get("c").has_value());
}

TEST(Metadata, NameListsRoundTrip)
{
  const std::vector<std::string> names{"main", "add", "helper"};
  EXPECT_EQ(codetrace::join_names(names), "main,add,helper");
  EXPECT_EQ(codetrace::split_names("main,add,helper"), names);
  EXPECT_TRUE(codetrace::split_names("").empty());
  EXPECT_EQ(codetrace::split_names(",main,,add,").size(), 2U);
}

TEST(Metadata, LineCounts)
{
  codetrace::Metadata metadata;
  codetrace::append_line_counts(metadata, "int a;\n\n  \nint b;\n");
  EXPECT_EQ(*metadata.get("total_lines"), "5");
  EXPECT_EQ(*metadata.get("non_blank_lines"), "2");
}

TEST(WireFormat, TagsRoundTrip)
{
  using codetrace::RecordKind;
  for (const auto kind :
       {RecordKind::Meta, RecordKind::Assign, RecordKind::Decl, RecordKind::Read, RecordKind::Call,
        RecordKind::ExternalCall, RecordKind::Param, RecordKind::Return, RecordKind::Loop,
        RecordKind::Branch, RecordKind::Condition, RecordKind::Switch, RecordKind::Case,
        RecordKind::Update, RecordKind::Ternary}) {
    const auto back = codetrace::kind_from_tag(codetrace::tag_name(kind));
    ASSERT_TRUE(back.has_value()) << codetrace::tag_name(kind);
    EXPECT_EQ(*back, kind);
  }
  EXPECT_EQ(codetrace::tag_name(RecordKind::ExternalCall), "EXTERNAL_CALL");
  EXPECT_FALSE(codetrace::kind_from_tag("BOGUS").has_value());
  EXPECT_FALSE(codetrace::kind_from_tag("UNKNOWN").has_value());
}
