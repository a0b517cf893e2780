#include <gtest/gtest.h>

#include <limits>
#include <vector>

#include "cwcheck/schema/directive.hpp"

using namespace cwcheck;
using namespace cwcheck::schema;

TEST(SchemaDirective, CardinalityForms)
{
  const auto exact = parse_cardinality("0..1");
  ASSERT_TRUE(exact.has_value());
  EXPECT_EQ(exact->min, 0U);
  EXPECT_EQ(exact->max, 1U);
  EXPECT_FALSE(exact->soft);

  const auto soft = parse_cardinality("~1..2");
  ASSERT_TRUE(soft.has_value());
  EXPECT_TRUE(soft->soft);
  EXPECT_EQ(soft->min, 1U);
  EXPECT_EQ(soft->max, 2U);

  const auto unbounded = parse_cardinality("1..inf");
  ASSERT_TRUE(unbounded.has_value());
  EXPECT_FALSE(unbounded->max.has_value());
  EXPECT_TRUE(unbounded->allows(1000));
  EXPECT_FALSE(unbounded->allows(0));
  EXPECT_EQ(unbounded->to_string(), "1..inf");
  EXPECT_EQ(soft->to_string(), "~1..2");
}

TEST(SchemaDirective, CardinalityErrors)
{
  const auto no_dots = parse_cardinality("3");
  ASSERT_FALSE(no_dots.has_value());
  EXPECT_EQ(no_dots.error(), "invalid cardinality '3': expected min..max");

  const auto inverted = parse_cardinality("2..1");
  ASSERT_FALSE(inverted.has_value());
  EXPECT_EQ(inverted.error(), "cardinality maximum 1 is below minimum 2");

  const auto bad_min = parse_cardinality("x..1");
  ASSERT_FALSE(bad_min.has_value());
  EXPECT_EQ(bad_min.error(), "invalid cardinality minimum 'x'");
}

TEST(SchemaDirective, DefaultCardinalityIsExactlyOne)
{
  const RuleOptions options;
  EXPECT_EQ(options.effective_cardinality(), (Cardinality{1, 1, false}));
}

TEST(SchemaDirective, NumericRanges)
{
  const auto r = parse_numeric_range("-5..10");
  ASSERT_TRUE(r.has_value());
  EXPECT_DOUBLE_EQ(r->min, -5.0);
  EXPECT_DOUBLE_EQ(r->max, 10.0);

  const auto triple = parse_numeric_range("0.0...1.5");
  ASSERT_TRUE(triple.has_value());
  EXPECT_DOUBLE_EQ(triple->min, 0.0);
  EXPECT_DOUBLE_EQ(triple->max, 1.5);

  const auto open = parse_numeric_range("-inf..inf");
  ASSERT_TRUE(open.has_value());
  EXPECT_EQ(open->min, std::numeric_limits<double>::lowest());
  EXPECT_EQ(open->max, std::numeric_limits<double>::max());

  const auto empty = parse_numeric_range("10..1");
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), "range '10..1' is empty");

  EXPECT_FALSE(parse_numeric_range("abc").has_value());
}

TEST(SchemaDirective, FlagsAndCardinality)
{
  RuleOptions options;
  ASSERT_TRUE(apply_directive("required", options).has_value());
  ASSERT_TRUE(apply_directive("primary", options).has_value());
  ASSERT_TRUE(apply_directive("cardinality = 0..inf", options).has_value());

  EXPECT_TRUE(options.required);
  EXPECT_TRUE(options.primary);
  ASSERT_TRUE(options.cardinality.has_value());
  EXPECT_EQ(options.cardinality->min, 0U);
  EXPECT_FALSE(options.cardinality->max.has_value());
}

TEST(SchemaDirective, ScopesAreFolded)
{
  RuleOptions options;
  ASSERT_TRUE(apply_directive("scope = Country", options).has_value());
  ASSERT_EQ(options.scope.size(), 1U);
  EXPECT_EQ(options.scope[0], intern("country"));

  ASSERT_TRUE(apply_directive("scope = { country Planet }", options).has_value());
  ASSERT_EQ(options.scope.size(), 2U);
  EXPECT_EQ(options.scope[1], intern("planet"));

  ASSERT_TRUE(apply_directive("push_scope = Ship", options).has_value());
  EXPECT_EQ(options.push_scope, intern("ship"));
}

TEST(SchemaDirective, ReplaceScope)
{
  RuleOptions options;
  ASSERT_TRUE(apply_directive("replace_scope = { this = country root = planet }", options).has_value());
  ASSERT_EQ(options.replace_scope.size(), 2U);
  EXPECT_EQ(options.replace_scope[0].first, intern("this"));
  EXPECT_EQ(options.replace_scope[0].second, intern("country"));
  EXPECT_EQ(options.replace_scope[1].first, intern("root"));
  EXPECT_EQ(options.replace_scope[1].second, intern("planet"));

  const auto bad = apply_directive("replace_scope = country", options);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), "'replace_scope' expects { binding = scope ... }");
}

TEST(SchemaDirective, Severity)
{
  RuleOptions options;
  ASSERT_TRUE(apply_directive("severity = warning", options).has_value());
  EXPECT_EQ(options.severity, Severity::Warning);

  const auto bad = apply_directive("severity = loud", options);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), "'severity' expects error, warning, info or hint");
}

TEST(SchemaDirective, TypeKeyFilterAndStartsWith)
{
  RuleOptions options;
  ASSERT_TRUE(apply_directive("type_key_filter = country_event", options).has_value());
  EXPECT_FALSE(options.type_key_filter_negated);
  ASSERT_EQ(options.type_key_filter.size(), 1U);

  ASSERT_TRUE(apply_directive("type_key_filter <> { namespace Other }", options).has_value());
  EXPECT_TRUE(options.type_key_filter_negated);
  ASSERT_EQ(options.type_key_filter.size(), 2U);
  EXPECT_EQ(options.type_key_filter[1], intern("other"));

  ASSERT_TRUE(apply_directive("starts_with = ev_", options).has_value());
  EXPECT_EQ(options.starts_with, "ev_");
}

TEST(SchemaDirective, UnknownDirectivesIgnored)
{
  RuleOptions options;
  EXPECT_TRUE(apply_directive("display_name = \"Event\"", options).has_value());
  EXPECT_TRUE(apply_directive("graph_related_types = { a b }", options).has_value());
  EXPECT_TRUE(apply_directive("", options).has_value());
  EXPECT_FALSE(options.required);
  EXPECT_FALSE(options.cardinality.has_value());
}

TEST(SchemaDirective, MalformedDirective)
{
  RuleOptions options;
  const auto r = apply_directive("cardinality = ", options);
  ASSERT_FALSE(r.has_value());
  EXPECT_NE(r.error().find("malformed directive"), std::string::npos) << r.error();
}

TEST(SchemaDirective, ParseDirectivesAccumulatesDocs)
{
  const std::vector<Annotation> notes = {
    {Annotation::Kind::Doc, "First line", {}},
    {Annotation::Kind::Directive, "cardinality = 0..1", {}},
    {Annotation::Kind::Doc, "Second line", {}},
  };
  const auto options = parse_directives(notes);
  ASSERT_TRUE(options.has_value());
  EXPECT_EQ(options->doc, "First line\nSecond line");
  ASSERT_TRUE(options->cardinality.has_value());
  EXPECT_EQ(options->cardinality->max, 1U);

  const std::vector<Annotation> bad = {{Annotation::Kind::Directive, "cardinality = 5", {}}};
  const auto failed = parse_directives(bad);
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(failed.error(), "invalid cardinality '5': expected min..max");
}
