#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "codetrace/lang/python/python_backend.hpp"
#include "codetrace/test_support/test_helpers.hpp"

using codetrace::test_support::count_occurrences;
using codetrace::test_support::TempDir;

namespace
{

constexpr const char * k_program =
  "import math\n"
  "\n"
  "\n"
  "def scale(v, factor=2):\n"
  "    result = v * factor\n"
  "    return result\n"
  "\n"
  "\n"
  "def main():\n"
  "    total = 0\n"
  "    for i in range(3):\n"
  "        total += scale(i)\n"
  "    if total > 4:\n"
  "        print(math.sqrt(total))\n"
  "    else:\n"
  "        total = 1\n"
  "    label = 'big' if total > 4 else 'small'\n"
  "\n"
  "\n"
  "main()\n";

std::vector<std::string> lines_of(const std::string & text)
{
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

size_t index_of(const std::vector<std::string> & lines, const std::string & line)
{
  return static_cast<size_t>(std::find(lines.begin(), lines.end(), line) - lines.begin());
}

bool contains(const std::string & text, const std::string & needle)
{
  return text.find(needle) != std::string::npos;
}

class PythonBackendTest : public ::testing::Test
{
protected:
  codetrace::test_support::InstrumentedUnit run(const std::string & src)
  {
    return codetrace::test_support::instrument(backend_, dir_, "prog.py", src);
  }

  codetrace::PythonBackend backend_;
  TempDir dir_;
};

}  // namespace

TEST_F(PythonBackendTest, EveryBoundNameIsAnObject)
{
  const auto symbols = backend_.analyze_types(k_program);

  for (const char * name : {"v", "factor", "result", "total", "i", "label"}) {
    EXPECT_EQ(symbols.lookup(name), "object") << name;
  }
  EXPECT_FALSE(symbols.contains("math"));
}

TEST_F(PythonBackendTest, TupleTargetsBindEachName)
{
  const auto symbols = backend_.analyze_types("a, (b, c) = 1, (2, 3)\n");
  EXPECT_TRUE(symbols.contains("a"));
  EXPECT_TRUE(symbols.contains("b"));
  EXPECT_TRUE(symbols.contains("c"));
}

TEST_F(PythonBackendTest, MetadataCountsStructure)
{
  const auto unit = run(k_program);
  const auto & md = unit.metadata;

  EXPECT_EQ(md.get("language"), "Python");
  EXPECT_EQ(md.get("num_functions"), "2");
  EXPECT_EQ(md.get("function_names"), "scale,main");
  EXPECT_EQ(md.get("defined_functions"), "main,scale");
  EXPECT_EQ(md.get("num_imports"), "1");
  EXPECT_EQ(md.get("imports"), "math");
  EXPECT_EQ(md.get("num_loops"), "1");
  EXPECT_EQ(md.get("num_branches"), "1");
  EXPECT_EQ(md.get("total_lines"), "21");
}

TEST_F(PythonBackendTest, DepthCounterIsInitializedFirst)
{
  const auto unit = run(k_program);
  const auto lines = lines_of(unit.text);
  ASSERT_FALSE(lines.empty());
  EXPECT_EQ(lines[0], "_codetrace_depth = 0");
}

TEST_F(PythonBackendTest, FunctionEntryDeclaresGlobalCounter)
{
  const auto unit = run(k_program);
  const auto lines = lines_of(unit.text);

  EXPECT_EQ(count_occurrences(unit.text, "    global _codetrace_depth\n"), 2U);
  EXPECT_EQ(count_occurrences(unit.text, "    _codetrace_depth += 1\n"), 2U);

  const size_t def = index_of(lines, "def scale(v, factor=2):");
  ASSERT_LT(def + 4, lines.size());
  EXPECT_EQ(lines[def + 1], "    global _codetrace_depth");
  EXPECT_EQ(lines[def + 2], "    _codetrace_depth += 1");
  EXPECT_EQ(lines[def + 3], "    print('CALL', 'scale', v, factor, _codetrace_depth, sep='\\0')");
  EXPECT_EQ(lines[def + 4], "    print('PARAM', 'v', v, '4', sep='\\0')");
}

TEST_F(PythonBackendTest, MainEmitsMetadataBeforeTheCounter)
{
  const auto unit = run(k_program);
  const auto lines = lines_of(unit.text);

  const size_t def = index_of(lines, "def main():");
  ASSERT_LT(def + 1, lines.size());
  EXPECT_EQ(lines[def + 1].rfind("    print('META', ", 0), 0U);
  EXPECT_EQ(count_occurrences(unit.text, "print('META', "), unit.metadata.size());
  EXPECT_TRUE(contains(unit.text, "print('META', 'language', 'Python', sep='\\0')"));
}

TEST_F(PythonBackendTest, AssignmentsReadThenWrite)
{
  const auto unit = run(k_program);
  const auto lines = lines_of(unit.text);

  const size_t stmt = index_of(lines, "    result = v * factor");
  ASSERT_LT(stmt + 1, lines.size());
  EXPECT_EQ(
    lines[stmt - 2],
    "    print('READ', 'v', v, format(id(v), 'x'), '5', _codetrace_depth, sep='\\0')");
  EXPECT_EQ(
    lines[stmt - 1],
    "    print('READ', 'factor', factor, format(id(factor), 'x'), '5', _codetrace_depth, "
    "sep='\\0')");
  EXPECT_EQ(
    lines[stmt + 1],
    "    print('DECL', 'result', result, format(id(result), 'x'), '5', _codetrace_depth, "
    "sep='\\0')");
}

TEST_F(PythonBackendTest, FunctionsReadModuleConstants)
{
  const auto unit = run(
    "LIMIT = 10\n"
    "\n"
    "\n"
    "def scale(x):\n"
    "    y = x * LIMIT\n"
    "    return y\n");
  const auto lines = lines_of(unit.text);

  const size_t stmt = index_of(lines, "    y = x * LIMIT");
  ASSERT_LT(stmt, lines.size());
  EXPECT_EQ(
    lines[stmt - 1],
    "    print('READ', 'LIMIT', LIMIT, format(id(LIMIT), 'x'), '5', _codetrace_depth, "
    "sep='\\0')");
  EXPECT_TRUE(contains(lines[stmt - 2], "print('READ', 'x', x"));
}

TEST_F(PythonBackendTest, GlobalDeclarationsWriteTheModuleName)
{
  const auto unit = run(
    "count = 0\n"
    "\n"
    "\n"
    "def bump():\n"
    "    global count\n"
    "    count = count + 1\n"
    "    return count\n"
    "\n"
    "\n"
    "def shadow():\n"
    "    count = 5\n"
    "    return count\n");

  const std::string fields = "'count', count, format(id(count), 'x'), ";
  EXPECT_TRUE(contains(unit.text, "    print('READ', " + fields + "'6'"));
  EXPECT_TRUE(contains(unit.text, "    print('ASSIGN', " + fields + "'6'"));
  EXPECT_TRUE(contains(unit.text, "    print('DECL', " + fields + "'11'"));
}

TEST_F(PythonBackendTest, AugmentedAssignmentReadsItsTarget)
{
  const auto unit = run(k_program);
  const auto lines = lines_of(unit.text);

  const size_t stmt = index_of(lines, "        total += scale(i)");
  ASSERT_LT(stmt + 1, lines.size());
  EXPECT_TRUE(contains(lines[stmt - 2], "print('READ', 'total', total"));
  EXPECT_TRUE(contains(lines[stmt - 1], "print('READ', 'i', i"));
  EXPECT_TRUE(contains(lines[stmt + 1], "print('ASSIGN', 'total', total"));
}

TEST_F(PythonBackendTest, ReturnRecordsValueAndLeavesFunction)
{
  const auto unit = run(k_program);
  const auto lines = lines_of(unit.text);

  const size_t ret = index_of(lines, "    return result");
  ASSERT_LT(ret, lines.size());
  EXPECT_EQ(lines[ret - 1], "    _codetrace_depth -= 1");
  EXPECT_EQ(
    lines[ret - 2],
    "    print('RETURN', 'result', result, format(id(result), 'x'), '6', _codetrace_depth, "
    "sep='\\0')");

  // main falls off its end
  EXPECT_EQ(count_occurrences(unit.text, "_codetrace_depth -= 1"), 2U);
  const size_t last = index_of(lines, "    label = 'big' if total > 4 else 'small'");
  ASSERT_LT(last + 2, lines.size());
  EXPECT_TRUE(contains(lines[last + 1], "print('DECL', 'label', label"));
  EXPECT_EQ(lines[last + 2], "    _codetrace_depth -= 1");
}

TEST_F(PythonBackendTest, ControlFlowRecords)
{
  const auto unit = run(k_program);

  EXPECT_TRUE(contains(
    unit.text, "        print('LOOP', 'for', 'range(3)', '1', '11', _codetrace_depth, sep='\\0')"));
  EXPECT_TRUE(contains(unit.text, "        print('DECL', 'i', i, format(id(i), 'x'), '11'"));
  EXPECT_TRUE(contains(
    unit.text,
    "    print('CONDITION', 'total > 4', bool(total > 4), '13', _codetrace_depth, sep='\\0')"));
  EXPECT_TRUE(contains(
    unit.text, "        print('BRANCH', 'if', 'total > 4', '14', _codetrace_depth, sep='\\0')"));
  EXPECT_TRUE(contains(
    unit.text, "        print('BRANCH', 'else', 'total > 4', '16', _codetrace_depth, sep='\\0')"));
  EXPECT_TRUE(contains(
    unit.text,
    "    print('TERNARY', 'total > 4', bool(total > 4), '17', _codetrace_depth, sep='\\0')"));
}

TEST_F(PythonBackendTest, ElifBranchRecordsItsOwnCondition)
{
  const auto unit = run(
    "def sign(n):\n"
    "    if n > 0:\n"
    "        s = 1\n"
    "    elif n < 0:\n"
    "        s = -1\n"
    "    else:\n"
    "        s = 0\n"
    "    return s\n");

  EXPECT_TRUE(contains(
    unit.text, "        print('BRANCH', 'elif', 'n < 0', '5', _codetrace_depth, sep='\\0')"));
  EXPECT_TRUE(contains(
    unit.text, "        print('BRANCH', 'else', 'n < 0', '7', _codetrace_depth, sep='\\0')"));
  EXPECT_EQ(count_occurrences(unit.text, "print('BRANCH', "), 3U);
}

TEST_F(PythonBackendTest, LocalCallsAreNotExternal)
{
  const auto unit = run(
    "def helper(v):\n"
    "    return v\n"
    "\n"
    "\n"
    "def main():\n"
    "    r = helper(2)\n"
    "    return r\n");

  EXPECT_EQ(count_occurrences(unit.text, "'EXTERNAL_CALL'"), 0U);
  EXPECT_TRUE(contains(unit.text, "print('CALL', 'helper', v, _codetrace_depth, sep='\\0')"));
}

TEST_F(PythonBackendTest, OneLineSuiteReturnKeepsItsRecord)
{
  const auto unit = run(
    "def fib(n):\n"
    "    if n < 2: return n\n"
    "    r = fib(n - 1) + fib(n - 2)\n"
    "    return r\n");
  const auto lines = lines_of(unit.text);

  EXPECT_LT(
    index_of(
      lines,
      "    if n < 2: print('RETURN', 'n', n, format(id(n), 'x'), '2', _codetrace_depth, "
      "sep='\\0'); _codetrace_depth -= 1; return n"),
    lines.size());
  EXPECT_EQ(count_occurrences(unit.text, "_codetrace_depth -= 1"), 2U);
  EXPECT_EQ(count_occurrences(unit.text, "print('RETURN', "), 2U);
}

TEST_F(PythonBackendTest, OnlyUndefinedCallsAreExternal)
{
  const auto unit = run(k_program);

  EXPECT_EQ(count_occurrences(unit.text, "print('EXTERNAL_CALL', "), 2U);
  EXPECT_TRUE(contains(unit.text, "print('EXTERNAL_CALL', 'range', '11'"));
  EXPECT_TRUE(contains(unit.text, "print('EXTERNAL_CALL', 'sqrt', '14'"));
}

TEST_F(PythonBackendTest, WhileConditionIsReevaluated)
{
  const auto unit = run(
    "def count():\n"
    "    n = 0\n"
    "    while n < 3:\n"
    "        n += 1\n"
    "    return n\n");

  EXPECT_TRUE(contains(
    unit.text, "        print('LOOP', 'while', 'n < 3', bool(n < 3), '3', _codetrace_depth, "
               "sep='\\0')"));
}

TEST_F(PythonBackendTest, CallsInConditionsAreNotReevaluated)
{
  const auto unit = run(
    "def poll(queue):\n"
    "    while queue.pop():\n"
    "        pass\n"
    "    if ready():\n"
    "        return 1\n"
    "    return 0\n");

  EXPECT_EQ(count_occurrences(unit.text, "'CONDITION'"), 0U);
  EXPECT_TRUE(contains(unit.text, "print('LOOP', 'while', 'queue.pop()', '', '2'"));
}

TEST_F(PythonBackendTest, QuotesInConditionsAreEscaped)
{
  const auto unit = run(
    "def check(name):\n"
    "    if name == 'x':\n"
    "        return True\n"
    "    return False\n");

  EXPECT_TRUE(contains(unit.text, "print('CONDITION', 'name == \\'x\\'', bool(name == 'x'), '2'"));
  EXPECT_TRUE(contains(unit.text, "print('RETURN', 'literal', 'True', '0', '3'"));
}

TEST_F(PythonBackendTest, OneLineFunctionsAreLeftAlone)
{
  const auto unit = run(
    "def one(): return 1\n"
    "\n"
    "def main():\n"
    "    x = one()\n");

  EXPECT_TRUE(contains(unit.text, "def one(): return 1\n"));
  EXPECT_EQ(count_occurrences(unit.text, "print('CALL', 'one'"), 0U);
  EXPECT_EQ(count_occurrences(unit.text, "'EXTERNAL_CALL'"), 0U);
}
