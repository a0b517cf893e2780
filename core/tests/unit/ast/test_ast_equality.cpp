#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "cwcheck/ast/ast.hpp"
#include "cwcheck/ast/json_visitor.hpp"
#include "cwcheck/test_support/parse_helpers.hpp"

using namespace cwcheck;

namespace
{

bool same(const std::string & a, const std::string & b)
{
  auto ua = test_support::parse(a);
  auto ub = test_support::parse(b);
  EXPECT_TRUE(ua.diags.empty());
  EXPECT_TRUE(ub.diags.empty());
  return structurally_equal(ua.root, ub.root);
}

}  // namespace

TEST(AstEquality, IgnoresLayoutAndComments)
{
  EXPECT_TRUE(same("a = { b = 1 c = 2 }", "a = {\n  b = 1 # one\n  c = 2\n}\n"));
}

TEST(AstEquality, IgnoresQuotingAndKeyCase)
{
  EXPECT_TRUE(same("Name = \"value\"", "name = value"));
  EXPECT_TRUE(same("\"key\" = 1", "KEY = 1"));
}

TEST(AstEquality, ScalarValuesCompareExactly)
{
  EXPECT_FALSE(same("a = Yes", "a = yes"));
  EXPECT_FALSE(same("a = 1", "a = 1.0"));
}

TEST(AstEquality, OperatorAndOrderMatter)
{
  EXPECT_FALSE(same("a > 1", "a >= 1"));
  EXPECT_FALSE(same("a = 1 b = 2", "b = 2 a = 1"));
}

TEST(AstEquality, ValueKindsMustMatch)
{
  EXPECT_FALSE(same("a = { 1 2 }", "a = { x = 1 }"));
  EXPECT_FALSE(same("a = @x", "a = x"));
  EXPECT_TRUE(same("c = rgb { 1 2 3 }", "c = RGB { 1 2 3 }"));
  EXPECT_FALSE(same("c = rgb { 1 2 3 }", "c = hsv { 1 2 3 }"));
}

TEST(AstEquality, ConditionsMatter)
{
  EXPECT_TRUE(same("[[P] a = 1 ]", "[[P] a = 1 ]"));
  EXPECT_FALSE(same("[[P] a = 1 ]", "[[!P] a = 1 ]"));
  EXPECT_FALSE(same("[[P] a = 1 ]", "a = 1"));
}

TEST(AstRender, CompactSingleLine)
{
  auto unit = test_support::parse("a = 1\nb = { 1 2 }\nc = { }\nd = \"q s\"\ne = @x\nf = @[ x * 2 ]\ng >= 3");
  ASSERT_TRUE(unit.diags.empty());
  EXPECT_EQ(
    render(unit.root), "{ a = 1 b = { 1 2 } c = {} d = \"q s\" e = @x f = @[ x * 2 ] g >= 3 }");
  EXPECT_EQ(render(unit.root.entries[2].value), "{}");
}

TEST(AstRender, TaggedValues)
{
  auto unit = test_support::parse("color = rgb { 10 20 30 }");
  ASSERT_TRUE(unit.diags.empty());
  EXPECT_EQ(render(unit.root.entries[0].value), "rgb { 10 20 30 }");
}

TEST(AstNodeCount, CountsEntriesAndValuesRecursively)
{
  auto unit = test_support::parse("a = 1\nb = { c = 2 d = { 1 2 } }");
  ASSERT_TRUE(unit.diags.empty());
  // a, b, c, d, 1, 2
  EXPECT_EQ(node_count(unit.root), 6U);
}

TEST(AstJson, BlockShape)
{
  using json = nlohmann::json;

  auto unit = test_support::parse("\"k\" = { [[P] x = @v ] 1 }");
  ASSERT_TRUE(unit.diags.empty());
  const json j = to_json(unit.root);

  EXPECT_EQ(j["type"], "Block");
  ASSERT_EQ(j["entries"].size(), 1U);
  const json & k = j["entries"][0];
  EXPECT_EQ(k["key"], "k");
  EXPECT_EQ(k["op"], "=");
  EXPECT_TRUE(k["quotedKey"].get<bool>());

  const json & inner = k["value"];
  EXPECT_EQ(inner["type"], "Block");
  ASSERT_EQ(inner["entries"].size(), 1U);
  EXPECT_EQ(inner["entries"][0]["condition"]["param"], "P");
  EXPECT_EQ(inner["entries"][0]["value"]["type"], "Reference");
  EXPECT_EQ(inner["entries"][0]["value"]["kind"], "variable");
  ASSERT_EQ(inner["items"].size(), 1U);
  EXPECT_EQ(inner["items"][0]["text"], "1");
  EXPECT_FALSE(inner["items"][0]["quoted"].get<bool>());
}

TEST(AstBlock, FindIsCaseInsensitive)
{
  auto unit = test_support::parse("Option = 1\noption = 2\nother = 3");
  ASSERT_TRUE(unit.diags.empty());
  const Entry * e = unit.root.find("OPTION");
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(as_scalar(e->value)->str(), "1");
  EXPECT_EQ(unit.root.find_all("option").size(), 2U);
  EXPECT_EQ(unit.root.find("missing"), nullptr);
}
