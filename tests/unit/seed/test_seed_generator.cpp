#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "codetrace/seed/seed_generator.hpp"
#include "codetrace/test_support/test_helpers.hpp"

using codetrace::test_support::TempDir;

namespace
{

codetrace::Metadata sample_metadata()
{
  codetrace::Metadata md;
  md.set("file_name", "prog.c");
  md.set("language", "C");
  md.set("total_lines", "20");
  return md;
}

bool all_digits(const std::string & s)
{
  return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace

TEST(SeedGeneratorTest, CanonicalJsonSortsKeys)
{
  codetrace::Metadata md;
  md.set("b", "2");
  md.set("a", "1");
  EXPECT_EQ(codetrace::canonical_metadata_json(md), R"({"a":"1","b":"2"})");
}

TEST(SeedGeneratorTest, SeedIsDeterministic)
{
  const auto md = sample_metadata();
  EXPECT_EQ(codetrace::derive_seed(md), codetrace::derive_seed(md));
}

TEST(SeedGeneratorTest, InsertionOrderDoesNotMatter)
{
  codetrace::Metadata reversed;
  reversed.set("total_lines", "20");
  reversed.set("language", "C");
  reversed.set("file_name", "prog.c");
  EXPECT_EQ(codetrace::derive_seed(sample_metadata()), codetrace::derive_seed(reversed));
}

TEST(SeedGeneratorTest, SeedHasNineteenOrTwentyDigits)
{
  for (int i = 0; i < 50; ++i) {
    codetrace::Metadata md = sample_metadata();
    md.set_count("variant", i);
    const std::string seed = codetrace::derive_seed(md);
    EXPECT_GE(seed.size(), codetrace::k_min_seed_digits) << seed;
    EXPECT_LE(seed.size(), codetrace::k_max_seed_digits) << seed;
    EXPECT_TRUE(all_digits(seed)) << seed;
    EXPECT_NE(seed.front(), '0') << seed;
    EXPECT_TRUE(codetrace::is_valid_seed_override(seed)) << seed;
  }
}

TEST(SeedGeneratorTest, DifferentMetadataGivesDifferentSeed)
{
  codetrace::Metadata other = sample_metadata();
  other.set("total_lines", "21");
  EXPECT_NE(codetrace::derive_seed(sample_metadata()), codetrace::derive_seed(other));
}

TEST(SeedGeneratorTest, EmptyMetadataStillYieldsSeed)
{
  const std::string seed = codetrace::derive_seed(codetrace::Metadata{});
  EXPECT_TRUE(codetrace::is_valid_seed_override(seed)) << seed;
}

TEST(SeedGeneratorTest, OverrideValidation)
{
  EXPECT_TRUE(codetrace::is_valid_seed_override("1234567890123456789"));
  EXPECT_TRUE(codetrace::is_valid_seed_override("12345678901234567890"));
  EXPECT_FALSE(codetrace::is_valid_seed_override("123456789012345678"));
  EXPECT_FALSE(codetrace::is_valid_seed_override("123456789012345678901"));
  EXPECT_FALSE(codetrace::is_valid_seed_override("12345678901234567a9"));
  EXPECT_FALSE(codetrace::is_valid_seed_override("-1"));
  EXPECT_FALSE(codetrace::is_valid_seed_override(""));
}

// ============================================================================
// Previous results
// ============================================================================

TEST(SeedGeneratorTest, ReadsNumericAndStringSeeds)
{
  TempDir dir;
  const auto numeric = dir.write("a.json", R"({"success":true,"seed":12345678901234567890})");
  const auto text = dir.write("b.json", R"({"success":true,"seed":"98765432109876543210"})");

  EXPECT_EQ(codetrace::read_previous_seed(numeric), "12345678901234567890");
  EXPECT_EQ(codetrace::read_previous_seed(text), "98765432109876543210");
}

TEST(SeedGeneratorTest, UnusablePreviousSeedIsIgnored)
{
  TempDir dir;
  const auto short_seed = dir.write("short.json", R"({"seed":42})");
  const auto no_seed = dir.write("none.json", R"({"success":false})");
  const auto broken = dir.write("broken.json", "{not json");
  const auto array = dir.write("array.json", "[1, 2]");

  EXPECT_FALSE(codetrace::read_previous_seed(short_seed).has_value());
  EXPECT_FALSE(codetrace::read_previous_seed(no_seed).has_value());
  EXPECT_FALSE(codetrace::read_previous_seed(broken).has_value());
  EXPECT_FALSE(codetrace::read_previous_seed(array).has_value());
  EXPECT_FALSE(codetrace::read_previous_seed(dir.path() / "missing.json").has_value());
}

TEST(SeedGeneratorTest, ReadsResultMetadata)
{
  TempDir dir;
  const auto path = dir.write(
    "prog.json", R"({"success":true,"metadata":{"language":"C","total_lines":20},"traces":[]})");

  const auto md = codetrace::read_result_metadata(path);
  ASSERT_TRUE(md.has_value());
  EXPECT_EQ(md->get("language"), "C");
  EXPECT_EQ(md->get("total_lines"), "20");

  const auto no_metadata = dir.write("x.json", R"({"traces":[]})");
  EXPECT_FALSE(codetrace::read_result_metadata(no_metadata).has_value());
}

TEST(SeedGeneratorTest, SeedFromStoredMetadataMatchesDerivedSeed)
{
  TempDir dir;
  const auto path = dir.write(
    "prog.json",
    R"({"metadata":{"file_name":"prog.c","language":"C","total_lines":"20"}})");

  const auto md = codetrace::read_result_metadata(path);
  ASSERT_TRUE(md.has_value());
  EXPECT_EQ(codetrace::derive_seed(*md), codetrace::derive_seed(sample_metadata()));
}
