#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "cwcheck/analysis/completion.hpp"
#include "cwcheck/sema/symbol_extractor.hpp"
#include "cwcheck/test_support/parse_helpers.hpp"

using namespace cwcheck;
using namespace cwcheck::analysis;

namespace
{

const char * k_schema =
  "types = {\n"
  "  type[event] = { path = \"game/events\" }\n"
  "  type[trait] = { path = \"game/traits\" }\n"
  "}\n"
  "enums = { enum[weekday] = { monday tuesday } }\n"
  "alias[effect:add_gold] = int\n"
  "alias[effect:add_trait] = <trait>\n"
  "event = {\n"
  "  ## cardinality = 0..1\n"
  "  day = enum[weekday]\n"
  "  ## cardinality = 0..1\n"
  "  hidden = bool\n"
  "  ## cardinality = 0..inf\n"
  "  option = {\n"
  "    ## cardinality = 0..inf\n"
  "    alias_name[effect] = alias_match_left[effect]\n"
  "  }\n"
  "  ## cardinality = 0..1\n"
  "  target = scope[any]\n"
  "}\n"
  "trait = { }\n";

class CompletionTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    schema_ = test_support::load_schema(k_schema);
    ASSERT_TRUE(schema_->ok());
    traits_ = test_support::parse("calm = { }\nbrave = { }\n", "traits/t.txt");
    const sema::SymbolExtractor extractor(schema_->snap());
    (void)index_.replace_document_symbols(traits_.file_id, extractor.extract(traits_.root, "traits/t.txt"));
  }

  /// Complete at the first `|` in `src`, which is removed first.
  std::vector<CompletionItem> complete_at(std::string src, const std::string & path = "events/a.txt")
  {
    const auto cursor = src.find('|');
    src.erase(cursor, 1);
    auto unit = test_support::parse(src, path);
    return complete(unit.root, src, path, static_cast<uint32_t>(cursor), schema_->snap(), index_);
  }

  static std::vector<std::string> labels(const std::vector<CompletionItem> & items)
  {
    std::vector<std::string> out;
    for (const auto & item : items) {
      out.push_back(item.label);
    }
    return out;
  }

  std::unique_ptr<test_support::TestSchema> schema_;
  test_support::TestParseUnit traits_;
  sema::SymbolIndex index_;
};

}  // namespace

TEST_F(CompletionTest, KeysOfTheEntityBlock)
{
  const auto items = complete_at("ev = {\n  |\n}\n");
  EXPECT_EQ(labels(items), (std::vector<std::string>{"day", "hidden", "option", "target"}));
  EXPECT_EQ(items[0].kind, CompletionKind::Key);
  EXPECT_EQ(items[0].detail, "enum[weekday]");
}

TEST_F(CompletionTest, ExhaustedKeysAreSkipped)
{
  const auto items = complete_at("ev = { hidden = yes | }\n");
  EXPECT_EQ(labels(items), (std::vector<std::string>{"day", "option", "target"}));
}

TEST_F(CompletionTest, EnumValues)
{
  const auto items = complete_at("ev = { day = | }\n");
  EXPECT_EQ(labels(items), (std::vector<std::string>{"monday", "tuesday"}));
  EXPECT_EQ(items[0].kind, CompletionKind::EnumMember);
  EXPECT_EQ(items[0].detail, "weekday");
}

TEST_F(CompletionTest, PartialWordStillCompletesTheValue)
{
  const auto items = complete_at("ev = { day = mo| }\n");
  EXPECT_EQ(labels(items), (std::vector<std::string>{"monday", "tuesday"}));
}

TEST_F(CompletionTest, BoolValues)
{
  const auto items = complete_at("ev = { hidden = | }\n");
  EXPECT_EQ(labels(items), (std::vector<std::string>{"yes", "no"}));
  EXPECT_EQ(items[0].kind, CompletionKind::Keyword);
}

TEST_F(CompletionTest, AliasMembersInNestedBlocks)
{
  const auto items = complete_at("ev = { option = { | } }\n");
  EXPECT_EQ(labels(items), (std::vector<std::string>{"add_gold", "add_trait"}));
  EXPECT_EQ(items[0].detail, "alias_name[effect]");
}

TEST_F(CompletionTest, TypeInstancesFromTheIndex)
{
  const auto items = complete_at("ev = { option = { add_trait = | } }\n");
  EXPECT_EQ(labels(items), (std::vector<std::string>{"brave", "calm"}));
  EXPECT_EQ(items[0].kind, CompletionKind::Reference);
  EXPECT_EQ(items[0].detail, "trait");
}

TEST_F(CompletionTest, ScopeKeywords)
{
  const auto items = complete_at("ev = { target = | }\n");
  EXPECT_EQ(labels(items), (std::vector<std::string>{"this", "root", "prev", "from"}));
}

TEST_F(CompletionTest, NothingOutsideEntities)
{
  EXPECT_TRUE(complete_at("ev = { | }\n", "common/a.txt").empty());
  EXPECT_TRUE(complete_at("| ev = { }\n").empty());
}
