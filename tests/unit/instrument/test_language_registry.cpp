#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "codetrace/instrument/language_registry.hpp"

namespace
{

/// Minimal backend that claims one extension and emits its input unchanged
class EchoBackend final : public codetrace::LanguageBackend
{
public:
  explicit EchoBackend(std::string ext) : ext_(std::move(ext)) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "echo"; }
  [[nodiscard]] std::string_view display_name() const noexcept override { return "Echo"; }
  [[nodiscard]] std::vector<std::string> extensions() const override { return {ext_}; }
  [[nodiscard]] const TSLanguage * language() const override { return tree_sitter_c(); }

  [[nodiscard]] codetrace::SymbolTable analyze_types(std::string_view) const override
  {
    return {};
  }

  [[nodiscard]] codetrace::Metadata collect_metadata(
    std::string_view, const std::filesystem::path &) const override
  {
    return {};
  }

  [[nodiscard]] std::string instrument(
    std::string_view source, const codetrace::SymbolTable &,
    const codetrace::Metadata &) const override
  {
    return std::string(source);
  }

private:
  std::string ext_;
};

}  // namespace

TEST(LanguageRegistry, BuiltinBackendsCoverCAndPython)
{
  const auto registry = codetrace::LanguageRegistry::with_builtin_backends();

  const auto * c = registry.find(".c");
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->name(), "c");
  EXPECT_EQ(c->display_name(), "C");

  const auto * py = registry.find_for_path("scripts/tool.py");
  ASSERT_NE(py, nullptr);
  EXPECT_EQ(py->name(), "python");

  EXPECT_EQ(registry.backends().size(), 2U);
  EXPECT_EQ(registry.supported_extensions(), (std::vector<std::string>{".c", ".py"}));
}

TEST(LanguageRegistry, LookupIgnoresDotAndCase)
{
  const auto registry = codetrace::LanguageRegistry::with_builtin_backends();
  EXPECT_EQ(registry.find("c"), registry.find(".C"));
  EXPECT_NE(registry.find("PY"), nullptr);
}

TEST(LanguageRegistry, UnknownExtensionIsNull)
{
  const auto registry = codetrace::LanguageRegistry::with_builtin_backends();
  EXPECT_EQ(registry.find(".rs"), nullptr);
  EXPECT_EQ(registry.find(""), nullptr);
  EXPECT_EQ(registry.find_for_path("Makefile"), nullptr);
}

TEST(LanguageRegistry, NewBackendsNeedNoCallerChanges)
{
  auto registry = codetrace::LanguageRegistry::with_builtin_backends();
  registry.register_backend(std::make_unique<EchoBackend>(".echo"));

  const auto * echo = registry.find_for_path("hello.echo");
  ASSERT_NE(echo, nullptr);
  EXPECT_EQ(echo->instrument("abc", {}, {}), "abc");
}

TEST(LanguageRegistry, LaterRegistrationTakesOverAnExtension)
{
  auto registry = codetrace::LanguageRegistry::with_builtin_backends();
  registry.register_backend(std::make_unique<EchoBackend>(".c"));

  const auto * c = registry.find(".c");
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->name(), "echo");
}
