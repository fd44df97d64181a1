#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "codetrace/basic/diagnostic.hpp"
#include "codetrace/basic/diagnostic_printer.hpp"

using codetrace::DiagnosticBag;
using codetrace::Severity;
using codetrace::SourceRange;

TEST(DiagnosticBagTest, BuilderAddsOnDestruction)
{
  DiagnosticBag bag;
  bag.report_warning(SourceRange(4, 9), "syntax error", "not understood by the parser")
    .with_code("syntax")
    .with_help("instrumentation continues");

  ASSERT_EQ(bag.size(), 1U);
  const auto & d = bag.all().front();
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, "syntax");
  EXPECT_EQ(d.message, "syntax error");
  EXPECT_EQ(d.note, "not understood by the parser");
  ASSERT_TRUE(d.help.has_value());
  EXPECT_EQ(*d.help, "instrumentation continues");
  EXPECT_TRUE(d.has_source_range());
  EXPECT_EQ(d.range.get_begin().offset(), 4U);
  EXPECT_FALSE(d.trace_line.has_value());
}

TEST(DiagnosticBagTest, TraceDiagnosticHasNoSourceRange)
{
  DiagnosticBag bag;
  bag.report_warning({}, "malformed READ record").with_code("normalize").at_trace_line(7);

  ASSERT_EQ(bag.size(), 1U);
  EXPECT_FALSE(bag.all().front().has_source_range());
  ASSERT_TRUE(bag.all().front().trace_line.has_value());
  EXPECT_EQ(*bag.all().front().trace_line, 7U);
}

TEST(DiagnosticBagTest, CountsBySeverity)
{
  DiagnosticBag bag;
  bag.report_error({}, "a");
  bag.report_warning({}, "b");
  bag.report_warning({}, "c");

  EXPECT_TRUE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_EQ(bag.count(Severity::Error), 1U);
  EXPECT_EQ(bag.count(Severity::Warning), 2U);
  EXPECT_EQ(bag.with_severity(Severity::Warning).size(), 2U);
}

TEST(DiagnosticBagTest, MergeMovesEverything)
{
  DiagnosticBag first;
  first.report_warning({}, "one");
  DiagnosticBag second;
  second.report_warning({}, "two");
  second.report_warning({}, "three");

  first.merge(std::move(second));

  ASSERT_EQ(first.size(), 3U);
  EXPECT_EQ(first.all()[0].message, "one");
  EXPECT_EQ(first.all()[2].message, "three");
  EXPECT_FALSE(first.has_errors());
}

TEST(DiagnosticBagTest, SortedPutsSourceBeforeTraceBeforeRangeless)
{
  DiagnosticBag bag;
  bag.report_error({}, "stage");
  bag.report_warning({}, "trace 9").at_trace_line(9);
  bag.report_warning(SourceRange(20, 21), "late");
  bag.report_warning({}, "trace 2").at_trace_line(2);
  bag.report_warning(SourceRange(3, 4), "early");

  const auto sorted = bag.sorted();
  ASSERT_EQ(sorted.size(), 5U);
  EXPECT_EQ(sorted[0].message, "early");
  EXPECT_EQ(sorted[1].message, "late");
  EXPECT_EQ(sorted[2].message, "trace 2");
  EXPECT_EQ(sorted[3].message, "trace 9");
  EXPECT_EQ(sorted[4].message, "stage");
}

// ============================================================================
// DiagnosticPrinter
// ============================================================================

TEST(DiagnosticPrinterTest, PrintsSourceSnippetWithCaret)
{
  const codetrace::SourceFile source("loop.c", "int main() {\n  while (i < 3 {\n}\n");
  DiagnosticBag bag;
  // the '{' on line 2
  bag.report_warning(SourceRange(28, 29), "syntax error", "unexpected token").with_code("syntax");

  std::ostringstream os;
  codetrace::DiagnosticPrinter printer(os, false);
  printer.print(bag.all().front(), &source);

  const std::string expected = "warning[syntax]: syntax error\n"
                               "  --> loop.c:2:16\n"
                               "      |\n"
                               "    2 |   while (i < 3 {\n"
                               "      | " +
                               std::string(15, ' ') +
                               "^ unexpected token\n"
                               "      |\n";
  EXPECT_EQ(os.str(), expected);
}

TEST(DiagnosticPrinterTest, PrintsTraceLineWithoutSource)
{
  DiagnosticBag bag;
  bag.report_warning({}, "malformed DECL record on line 4: DECL expects 5 fields, got 2")
    .with_code("normalize")
    .at_trace_line(4);

  std::ostringstream os;
  codetrace::DiagnosticPrinter printer(os, false);
  printer.print_all(bag);

  EXPECT_EQ(
    os.str(),
    "warning[normalize]: malformed DECL record on line 4: DECL expects 5 fields, got 2\n"
    "  --> raw trace, line 4\n");
}

TEST(DiagnosticPrinterTest, StageErrorPrintsHeaderAndHelp)
{
  DiagnosticBag bag;
  bag.report_error({}, "Program timed out (1s limit)").with_code("runtime").with_help("raise it");

  std::ostringstream os;
  codetrace::DiagnosticPrinter printer(os, false);
  printer.print_all(bag);

  EXPECT_EQ(os.str(), "error[runtime]: Program timed out (1s limit)\n   = help: raise it\n");
}

TEST(DiagnosticPrinterTest, NoteWithoutRangePrintsOnItsOwnLine)
{
  DiagnosticBag bag;
  bag.report_error({}, "compiler exited with status 1", "see compiler output above");

  std::ostringstream os;
  codetrace::DiagnosticPrinter printer(os, false);
  printer.print_all(bag);

  EXPECT_EQ(
    os.str(), "error: compiler exited with status 1\n   = note: see compiler output above\n");
}
