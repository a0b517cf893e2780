#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cwcheck/basic/diagnostic.hpp"
#include "cwcheck/schema/schema_registry.hpp"
#include "cwcheck/test_support/parse_helpers.hpp"

using namespace cwcheck;
using namespace cwcheck::schema;

namespace
{

bool has_message(const std::vector<Diagnostic> & diags, const std::string & needle)
{
  for (const auto & d : diags) {
    if (d.message.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

TEST(SchemaRegistry, LoadInstallsSnapshot)
{
  auto schema = test_support::load_schema(
    "types = { type[event] = { path = \"game/events\" } }\n"
    "event = { id = scalar }\n");
  ASSERT_TRUE(schema->ok());
  EXPECT_EQ(schema->registry.generation(), 1U);
  EXPECT_EQ(schema->snap().generation(), 1U);
  EXPECT_EQ(schema->registry.snapshot().get(), schema->result.snapshot.get());

  const SchemaType * event = schema->snap().find_type(intern("Event"));
  ASSERT_NE(event, nullptr);
  EXPECT_TRUE(event->has_shape);
  EXPECT_EQ(event->shape.rules.size(), 1U);
}

TEST(SchemaRegistry, FailedLoadKeepsPreviousSnapshot)
{
  auto schema = test_support::load_schema("types = { type[event] = { path = \"game/events\" } }\n");
  ASSERT_TRUE(schema->ok());
  const auto before = schema->registry.snapshot();

  const SchemaLoadResult bad =
    schema->registry.load(schema->sources, {SchemaSource{"broken.cwt", "types = {\n"}});
  EXPECT_FALSE(bad.success);
  EXPECT_EQ(bad.snapshot, nullptr);
  ASSERT_FALSE(bad.diagnostics.empty());
  EXPECT_EQ(bad.diagnostics.front().rule, RuleCode::SchemaError);

  EXPECT_EQ(schema->registry.generation(), 1U);
  EXPECT_EQ(schema->registry.snapshot().get(), before.get());
}

TEST(SchemaRegistry, MergeAcrossFiles)
{
  SourceRegistry sources;
  SchemaRegistry registry;
  const auto result = registry.load(
    sources, {
               SchemaSource{"types.cwt", "types = { type[event] = { path = \"game/events\" } }\n"
                                         "enums = { enum[weekday] = { monday } }\n"},
               SchemaSource{"event.cwt", "event = { id = scalar }\n"
                                         "enums = { enum[weekday] = { tuesday monday } }\n"},
             });
  ASSERT_TRUE(result.success);
  const SchemaSnapshot & snap = *result.snapshot;

  const SchemaType * event = snap.find_type(intern("event"));
  ASSERT_NE(event, nullptr);
  EXPECT_TRUE(event->has_shape);

  const EnumDef * weekday = snap.find_enum(intern("weekday"));
  ASSERT_NE(weekday, nullptr);
  EXPECT_EQ(weekday->values.size(), 2U);
  EXPECT_TRUE(weekday->contains(intern("tuesday")));
  EXPECT_FALSE(weekday->contains(intern("Tuesday")));
}

TEST(SchemaRegistry, DuplicateTypeAndStrayShapeWarn)
{
  auto schema = test_support::load_schema(
    "types = {\n"
    "  type[event] = { path = \"game/events\" }\n"
    "  type[Event] = { path = \"game/other\" }\n"
    "}\n"
    "ghost = { a = int }\n");
  ASSERT_TRUE(schema->ok());
  EXPECT_TRUE(has_message(schema->result.diagnostics, "type 'Event' is declared more than once"));
  EXPECT_TRUE(has_message(schema->result.diagnostics, "rules given for undeclared type 'ghost'"));
  EXPECT_EQ(schema->snap().types().size(), 1U);
}

TEST(SchemaRegistry, UndefinedReferencesWarnOnce)
{
  auto schema = test_support::load_schema(
    "types = { type[event] = { path = \"game/events\" } }\n"
    "event = {\n"
    "  a = <missing>\n"
    "  b = <missing>\n"
    "  c = enum[nothing]\n"
    "  d = alias_match_left[nogroup]\n"
    "  e = single_alias_right[nosingle]\n"
    "}\n");
  ASSERT_TRUE(schema->ok());
  const auto & diags = schema->result.diagnostics;
  EXPECT_TRUE(has_message(diags, "undefined type 'missing'"));
  EXPECT_TRUE(has_message(diags, "undefined enum 'nothing'"));
  EXPECT_TRUE(has_message(diags, "undefined alias group 'nogroup'"));
  EXPECT_TRUE(has_message(diags, "undefined single alias 'nosingle'"));

  size_t missing = 0;
  for (const auto & d : diags) {
    EXPECT_EQ(d.severity, Severity::Warning);
    if (d.message == "undefined type 'missing'") {
      ++missing;
    }
  }
  EXPECT_EQ(missing, 1U);
}

TEST(SchemaRegistry, UnproductiveAliasGroupFailsLoad)
{
  auto schema = test_support::load_schema(
    "alias[loop:again] = { alias_name[loop] = alias_match_left[loop] }\n");
  EXPECT_FALSE(schema->ok());
  EXPECT_TRUE(has_message(schema->result.diagnostics, "alias group 'loop' can never terminate"));
  EXPECT_EQ(schema->registry.generation(), 0U);
}

TEST(SchemaRegistry, RecursiveAliasWithExitIsProductive)
{
  auto schema = test_support::load_schema(
    "alias[effect:if] = { alias_name[effect] = alias_match_left[effect] }\n"
    "alias[effect:add_gold] = int\n"
    "single_alias[clause] = { alias_name[effect] = alias_match_left[effect] }\n");
  ASSERT_TRUE(schema->ok());
  EXPECT_TRUE(schema->result.diagnostics.empty());
}

TEST(SchemaRegistry, OptionalRecursionIsProductive)
{
  auto schema = test_support::load_schema(
    "alias[tree:node] = {\n"
    "  ## cardinality = 0..inf\n"
    "  alias_name[tree] = alias_match_left[tree]\n"
    "}\n");
  EXPECT_TRUE(schema->ok());
}

TEST(SchemaRegistry, SingleAliasCycleFailsLoad)
{
  auto schema = test_support::load_schema(
    "single_alias[a] = single_alias_right[b]\n"
    "single_alias[b] = single_alias_right[a]\n");
  EXPECT_FALSE(schema->ok());
  EXPECT_TRUE(has_message(schema->result.diagnostics, "single alias 'a' can never terminate"));
}

TEST(SchemaRegistry, ResolveSingleAliasChain)
{
  auto schema = test_support::load_schema(
    "single_alias[outer] = single_alias_right[inner]\n"
    "single_alias[inner] = { x = int }\n");
  ASSERT_TRUE(schema->ok());
  const SchemaRule * rule = schema->snap().resolve_single_alias(intern("outer"));
  ASSERT_NE(rule, nullptr);
  EXPECT_EQ(rule->key_text.str(), "inner");
  EXPECT_EQ(schema->snap().resolve_single_alias(intern("unknown")), nullptr);
}

TEST(SchemaRegistry, ExpandAliasPrefersLiteralMembersAndMemoises)
{
  auto schema = test_support::load_schema(
    "types = { type[event] = { path = \"game/events\" } }\n"
    "alias[effect:add_gold] = int\n"
    "alias[effect:Add_Prestige] = int\n"
    "alias[effect:<event>] = yes\n");
  ASSERT_TRUE(schema->ok());
  const SchemaSnapshot & snap = schema->snap();
  const Symbol effect = intern("effect");

  const auto & gold = snap.expand_alias(effect, 7, intern("add_gold"));
  ASSERT_EQ(gold.size(), 1U);
  EXPECT_EQ(gold[0]->key_text.str(), "add_gold");

  const auto & prestige = snap.expand_alias(effect, 7, intern("add_prestige"));
  ASSERT_EQ(prestige.size(), 1U);

  const auto & other = snap.expand_alias(effect, 7, intern("my_event"));
  ASSERT_EQ(other.size(), 1U);
  EXPECT_TRUE(std::holds_alternative<TypeRefKey>(*other[0]->key));

  EXPECT_EQ(snap.expansion_cache_size(), 3U);
  const auto & again = snap.expand_alias(effect, 7, intern("add_gold"));
  EXPECT_EQ(&again, &gold);
  EXPECT_EQ(snap.expansion_cache_size(), 3U);

  EXPECT_TRUE(snap.expand_alias(intern("nogroup"), 7, intern("x")).empty());
}

TEST(SchemaRegistry, ScopeCanonicalisation)
{
  auto schema = test_support::load_schema(
    "scopes = {\n"
    "  Country = { aliases = { country nation } }\n"
    "  Planet = { }\n"
    "}\n"
    "links = { owner = { input_scopes = { planet } output_scope = country } }\n");
  ASSERT_TRUE(schema->ok());
  const SchemaSnapshot & snap = schema->snap();

  EXPECT_TRUE(snap.has_scopes());
  EXPECT_EQ(snap.canonical_scope(intern("Country")), intern("country"));
  EXPECT_EQ(snap.canonical_scope(intern("NATION")), intern("country"));
  EXPECT_EQ(snap.canonical_scope(intern("planet")), intern("planet"));
  EXPECT_EQ(snap.canonical_scope(intern("any")), intern("any"));
  EXPECT_TRUE(snap.canonical_scope(intern("pop")).empty());

  const LinkDef * owner = snap.find_link(intern("owner"));
  ASSERT_NE(owner, nullptr);
  EXPECT_EQ(owner->output_scope, intern("country"));
}

TEST(SchemaRegistry, TypesForPath)
{
  auto schema = test_support::load_schema(
    "types = {\n"
    "  type[event] = { path = \"game/events\" }\n"
    "  type[decision] = { path = \"game/common/decisions\" }\n"
    "}\n");
  ASSERT_TRUE(schema->ok());
  const auto matches = schema->snap().types_for_path("events/my_events.txt");
  ASSERT_EQ(matches.size(), 1U);
  EXPECT_EQ(matches[0]->name.str(), "event");
  EXPECT_TRUE(schema->snap().types_for_path("common/other/x.txt").empty());
}

TEST(SchemaRegistry, ReloadBumpsGeneration)
{
  auto schema = test_support::load_schema("types = { type[a] = { path = \"game/a\" } }\n");
  ASSERT_TRUE(schema->ok());
  const auto second = schema->registry.load(
    schema->sources, {SchemaSource{"<test>.cwt", "types = { type[b] = { path = \"game/b\" } }\n"}});
  ASSERT_TRUE(second.success);
  EXPECT_EQ(second.snapshot->generation(), 2U);
  EXPECT_EQ(schema->registry.generation(), 2U);
  EXPECT_EQ(second.snapshot->find_type(intern("a")), nullptr);
  EXPECT_NE(second.snapshot->find_type(intern("b")), nullptr);
}
