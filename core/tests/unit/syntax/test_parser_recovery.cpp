#include <gtest/gtest.h>

#include <string>

#include "cwcheck/ast/ast.hpp"
#include "cwcheck/test_support/parse_helpers.hpp"

using namespace cwcheck;

namespace
{

bool has_message(const DiagnosticBag & diags, const std::string & needle)
{
  for (const auto & d : diags.all()) {
    if (d.message.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

TEST(SyntaxParserRecovery, MissingValueKeepsFollowingEntries)
{
  auto unit = test_support::parse("a =\nb = 2\nc = 3\n");

  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.all()[0].message, "missing value after 'a'");
  EXPECT_EQ(unit.diags.all()[0].rule, RuleCode::SyntaxError);

  ASSERT_EQ(unit.root.entries.size(), 2U);
  EXPECT_EQ(unit.root.entries[0].key.str(), "b");
  EXPECT_EQ(unit.root.entries[1].key.str(), "c");
}

TEST(SyntaxParserRecovery, MissingValueAtBlockEnd)
{
  auto unit = test_support::parse("outer = { inner = }\nafter = yes\n");
  EXPECT_TRUE(has_message(unit.diags, "missing value after 'inner'"));
  ASSERT_EQ(unit.root.entries.size(), 2U);
  EXPECT_EQ(unit.root.entries[1].key.str(), "after");
}

TEST(SyntaxParserRecovery, UnmatchedCloseBrace)
{
  auto unit = test_support::parse("a = 1\n}\nb = 2\n");
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.all()[0].message, "unmatched '}'");
  EXPECT_EQ(unit.slice(unit.diags.all()[0].primary_range()), "}");
  EXPECT_EQ(unit.root.entries.size(), 2U);
}

TEST(SyntaxParserRecovery, UnclosedBlockReportsOpening)
{
  auto unit = test_support::parse("event = {\n  id = x.1\n");
  ASSERT_EQ(unit.diags.size(), 1U);
  const Diagnostic & d = unit.diags.all()[0];
  EXPECT_EQ(d.message, "unclosed '{'");
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(unit.slice(d.labels[1].range), "{");

  ASSERT_EQ(unit.root.entries.size(), 1U);
  const Block * ev = as_block(unit.root.entries[0].value);
  ASSERT_NE(ev, nullptr);
  EXPECT_EQ(ev->entries.size(), 1U);
}

TEST(SyntaxParserRecovery, OperatorWithoutKey)
{
  auto unit = test_support::parse("= 5\nb = 2\n");
  EXPECT_TRUE(has_message(unit.diags, "expected a key before '='"));
  ASSERT_EQ(unit.root.entries.size(), 1U);
  EXPECT_EQ(unit.root.entries[0].key.str(), "b");
}

TEST(SyntaxParserRecovery, InvalidInputSkipped)
{
  auto unit = test_support::parse("\"never closed\nb = 2\n");
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.all()[0].message, "unexpected input '\"never closed'");
  ASSERT_EQ(unit.root.entries.size(), 1U);
  EXPECT_EQ(unit.root.entries[0].key.str(), "b");
}

TEST(SyntaxParserRecovery, UnterminatedStringAsValue)
{
  auto unit = test_support::parse("a = \"never closed\nb = 2\n");
  ASSERT_EQ(unit.diags.size(), 1U);
  const Diagnostic & d = unit.diags.all()[0];
  EXPECT_EQ(d.message, "missing value after 'a'");
  ASSERT_FALSE(d.labels.empty());
  EXPECT_EQ(d.labels[0].message, "expected a value, found '\"never closed'");
  ASSERT_EQ(unit.root.entries.size(), 1U);
  EXPECT_EQ(unit.root.entries[0].key.str(), "b");
}

TEST(SyntaxParserRecovery, UnclosedConditional)
{
  auto unit = test_support::parse("effect = { [[FLAG] a = b }\n");
  EXPECT_TRUE(has_message(unit.diags, "unclosed conditional block"));
  const Block * effect = as_block(unit.root.entries[0].value);
  ASSERT_NE(effect, nullptr);
  ASSERT_EQ(effect->entries.size(), 1U);
  ASSERT_TRUE(effect->entries[0].condition.has_value());
}

TEST(SyntaxParserRecovery, DeepNestingIsBounded)
{
  std::string src = "root = ";
  for (int i = 0; i < 300; ++i) {
    src += "{ a = ";
  }
  src += "1";
  for (int i = 0; i < 300; ++i) {
    src += " }";
  }

  auto unit = test_support::parse(src);
  EXPECT_TRUE(has_message(unit.diags, "blocks are nested too deeply"));
  ASSERT_EQ(unit.root.entries.size(), 1U);
}

TEST(SyntaxParserRecovery, EveryDiagnosticIsSyntaxError)
{
  auto unit = test_support::parse("a = \n } = { b");
  ASSERT_FALSE(unit.diags.empty());
  for (const auto & d : unit.diags.all()) {
    EXPECT_EQ(d.rule, RuleCode::SyntaxError) << d.message;
    EXPECT_EQ(d.severity, Severity::Error);
  }
}
