#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "cwcheck/sema/symbol_extractor.hpp"
#include "cwcheck/test_support/parse_helpers.hpp"

using namespace cwcheck;

namespace
{

const char * k_ship_schema =
  "types = {\n"
  "  type[ship] = {\n"
  "    path = \"game/ships\"\n"
  "    subtype[big] = { size = large }\n"
  "    ## starts_with = flag_\n"
  "    subtype[flagship] = { }\n"
  "    ## type_key_filter <> carrier\n"
  "    subtype[not_carrier] = { }\n"
  "    localisation = {\n"
  "      ## required\n"
  "      name = \"$\"\n"
  "      subtype[big] = {\n"
  "        ## required\n"
  "        desc = \"$_big_desc\"\n"
  "      }\n"
  "      subtype[!big] = { tooltip = \"$_tt\" }\n"
  "    }\n"
  "  }\n"
  "}\n"
  "ship = {\n"
  "  size = scalar\n"
  "  ## cardinality = 0..1\n"
  "  gun = scalar\n"
  "  subtype[big] = {\n"
  "    ## cardinality = 0..3\n"
  "    gun = scalar\n"
  "    hangar = int\n"
  "  }\n"
  "  subtype[!big] = {\n"
  "    ## cardinality = 0..1\n"
  "    sail = scalar\n"
  "  }\n"
  "}\n";

std::unique_ptr<test_support::TestSchema> ship_schema()
{
  auto schema = test_support::load_schema(k_ship_schema);
  EXPECT_TRUE(schema->ok());
  return schema;
}

bool has_subtype(const std::vector<Symbol> & subtypes, std::string_view name)
{
  return std::find(subtypes.begin(), subtypes.end(), intern(name)) != subtypes.end();
}

}  // namespace

TEST(ValidatorSubtypes, MatchSubtypes)
{
  auto schema = ship_schema();
  const schema::SchemaType * ship = schema->snap().find_type(intern("ship"));
  ASSERT_NE(ship, nullptr);
  ASSERT_EQ(ship->subtypes.size(), 3U);

  auto big = test_support::parse("size = large");
  const auto a = sema::match_subtypes(*ship, intern("hms_a"), big.root);
  EXPECT_TRUE(has_subtype(a, "big"));
  EXPECT_FALSE(has_subtype(a, "flagship"));
  EXPECT_TRUE(has_subtype(a, "not_carrier"));

  auto small = test_support::parse("size = tiny");
  const auto b = sema::match_subtypes(*ship, intern("flag_victory"), small.root);
  EXPECT_FALSE(has_subtype(b, "big"));
  EXPECT_TRUE(has_subtype(b, "flagship"));

  const auto c = sema::match_subtypes(*ship, intern("Carrier"), small.root);
  EXPECT_FALSE(has_subtype(c, "not_carrier"));
}

TEST(ValidatorSubtypes, LaterApplicableBlockDecidesCardinality)
{
  auto schema = ship_schema();
  auto big = test_support::validate(
    *schema, "hms_a = { size = large gun = a gun = b gun = c hangar = 2 }\n", "ships/a.txt");
  EXPECT_TRUE(big->diagnostics.empty());

  auto small = test_support::validate(*schema, "hms_b = { size = tiny gun = a gun = b }\n", "ships/b.txt");
  ASSERT_EQ(small->diagnostics.size(), 1U);
  EXPECT_EQ(small->diagnostics[0].rule, RuleCode::CardinalityViolation);
  EXPECT_EQ(small->diagnostics[0].message, "'gun' occurs 2 times, expected 0..1");
}

TEST(ValidatorSubtypes, GuardedRulesOnlyApplyToMatchingEntities)
{
  auto schema = ship_schema();

  auto missing = test_support::validate(*schema, "hms_a = { size = large }\n", "ships/a.txt");
  ASSERT_EQ(missing->diagnostics.size(), 1U);
  EXPECT_EQ(missing->diagnostics[0].message, "missing required key 'hangar'");

  auto small_with_hangar =
    test_support::validate(*schema, "hms_b = { size = tiny hangar = 1 }\n", "ships/b.txt");
  ASSERT_EQ(small_with_hangar->diagnostics.size(), 1U);
  EXPECT_EQ(small_with_hangar->diagnostics[0].rule, RuleCode::UnexpectedKey);
  EXPECT_EQ(small_with_hangar->diagnostics[0].message, "unexpected key 'hangar'");

  auto big_with_sail =
    test_support::validate(*schema, "hms_c = { size = large hangar = 1 sail = white }\n", "ships/c.txt");
  ASSERT_EQ(big_with_sail->diagnostics.size(), 1U);
  EXPECT_EQ(big_with_sail->diagnostics[0].message, "unexpected key 'sail'");

  auto small_with_sail = test_support::validate(*schema, "hms_d = { size = tiny sail = white }\n", "ships/d.txt");
  EXPECT_TRUE(small_with_sail->diagnostics.empty());
}

TEST(ValidatorSubtypes, LocalisationRequirementsFollowSubtypes)
{
  auto schema = ship_schema();
  const sema::SetLocalisationOracle oracle{"hms_a", "hms_b"};

  auto big = test_support::validate(
    *schema, "hms_a = { size = large hangar = 1 }\n", "ships/a.txt", {}, &oracle);
  ASSERT_EQ(big->count(RuleCode::MissingLocalisationKey), 1U);
  const Diagnostic * d = big->first(RuleCode::MissingLocalisationKey);
  EXPECT_EQ(d->severity, Severity::Error);
  EXPECT_EQ(d->message, "missing localisation key 'hms_a_big_desc' for ship 'hms_a'");
  ASSERT_NE(d->primary_label(), nullptr);
  EXPECT_EQ(d->primary_label()->message, "desc localisation");
  EXPECT_EQ(big->slice(d->primary_range()), "hms_a");

  // Optional keys are never demanded.
  auto small = test_support::validate(*schema, "hms_b = { size = tiny }\n", "ships/b.txt", {}, &oracle);
  EXPECT_EQ(small->count(RuleCode::MissingLocalisationKey), 0U);

  auto unnamed = test_support::validate(*schema, "hms_c = { size = tiny }\n", "ships/c.txt", {}, &oracle);
  ASSERT_EQ(unnamed->count(RuleCode::MissingLocalisationKey), 1U);
  EXPECT_EQ(
    unnamed->first(RuleCode::MissingLocalisationKey)->message,
    "missing localisation key 'hms_c' for ship 'hms_c'");
}

TEST(ValidatorSubtypes, LocalisationCheckCanBeDisabled)
{
  auto schema = ship_schema();
  sema::SetLocalisationOracle oracle;
  sema::ValidationOptions opts;
  opts.check_localisation = false;
  auto v = test_support::validate(*schema, "hms_a = { size = tiny }\n", "ships/a.txt", opts, &oracle);
  EXPECT_EQ(v->count(RuleCode::MissingLocalisationKey), 0U);

  auto no_oracle = test_support::validate(*schema, "hms_a = { size = tiny }\n", "ships/a.txt");
  EXPECT_EQ(no_oracle->count(RuleCode::MissingLocalisationKey), 0U);
}

TEST(ValidatorSubtypes, ExtractedDeclarationsCarrySubtypes)
{
  auto schema = ship_schema();
  auto unit = test_support::parse("flag_one = { size = large hangar = 1 }\n");
  const sema::SymbolExtractor extractor(schema->snap());
  const auto decls = extractor.extract(unit.root, "ships/a.txt");
  ASSERT_EQ(decls.size(), 1U);
  EXPECT_EQ(decls[0].kind, sema::SymbolKind::TypeInstance);
  EXPECT_EQ(decls[0].name.str(), "flag_one");
  EXPECT_TRUE(has_subtype(decls[0].subtypes, "big"));
  EXPECT_TRUE(has_subtype(decls[0].subtypes, "flagship"));
}
