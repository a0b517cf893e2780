// cwcheck/schema/schema.hpp - CWT schema model
//
// Rules are a closed set of tagged variants. The model is immutable once a
// snapshot is installed in the registry.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "cwcheck/ast/ast.hpp"
#include "cwcheck/basic/diagnostic.hpp"
#include "cwcheck/basic/interner.hpp"

namespace cwcheck::schema
{

// ============================================================================
// Cardinality / Options
// ============================================================================

struct Cardinality
{
  uint32_t min = 1;
  std::optional<uint32_t> max = 1;  ///< nullopt = inf
  bool soft = false;                ///< `~min..max`: violations are warnings

  [[nodiscard]] bool allows(uint32_t count) const noexcept
  {
    return count >= min && (!max || count <= *max);
  }

  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] bool operator==(const Cardinality &) const = default;
};

struct RuleOptions
{
  std::optional<Cardinality> cardinality;  ///< explicit `## cardinality`, if any
  std::vector<Symbol> scope;               ///< `## scope` restriction (folded)
  std::optional<Symbol> push_scope;
  std::vector<std::pair<Symbol, Symbol>> replace_scope;  ///< (binding, scope), folded
  std::optional<Severity> severity;
  bool required = false;
  bool primary = false;
  std::vector<Symbol> type_key_filter;  ///< folded
  bool type_key_filter_negated = false;
  std::string starts_with;
  std::string doc;

  /// Declared cardinality, or the implicit 1..1.
  [[nodiscard]] Cardinality effective_cardinality() const { return cardinality.value_or(Cardinality{}); }
};

// ============================================================================
// Simple value types
// ============================================================================

enum class SimpleType : uint8_t {
  Bool,
  Int,
  Float,
  Scalar,
  PercentageField,
  Localisation,
  LocalisationSynced,
  LocalisationInline,
  DateField,
  VariableField,
  IntVariableField,
  ValueField,
  IntValueField,
  ScopeField,
  Filepath,
  Icon,
};

[[nodiscard]] std::string_view to_string(SimpleType t) noexcept;
[[nodiscard]] std::optional<SimpleType> parse_simple_type(std::string_view name) noexcept;

struct NumericRange
{
  double min = 0.0;
  double max = 0.0;

  [[nodiscard]] bool operator==(const NumericRange &) const = default;
};

// ============================================================================
// Key matchers
// ============================================================================

struct LiteralKey
{
  Symbol text;  ///< as written; compared folded
};

/// `<type>` or `prefix_<type>_suffix`
struct TypeRefKey
{
  Symbol type;
  std::string prefix;
  std::string suffix;
};

struct EnumKey
{
  Symbol name;
};

/// `value_set[x]` as a key: declares a value-set member.
struct ValueSetKey
{
  Symbol name;
};

/// `value[x]` as a key: references a value-set member.
struct ValueKey
{
  Symbol name;
};

struct SimpleKey
{
  SimpleType type = SimpleType::Scalar;
};

struct ScopeKey
{
  Symbol scope;  ///< folded; `any` accepts every scope
};

/// `alias_name[group]`: any member name of the group.
struct AliasNameKey
{
  Symbol group;
};

using RuleKey =
  std::variant<LiteralKey, TypeRefKey, EnumKey, ValueSetKey, ValueKey, SimpleKey, ScopeKey, AliasNameKey>;

// ============================================================================
// Value matchers
// ============================================================================

struct SimpleValue
{
  SimpleType type = SimpleType::Scalar;
  std::optional<NumericRange> range;
  std::string argument;  ///< icon[path] / filepath[path] argument
};

struct LiteralValue
{
  Symbol text;
};

struct TypeRefValue
{
  Symbol type;
  std::string prefix;
  std::string suffix;
};

struct EnumValue
{
  Symbol name;
};

/// `value_set[x]`: the value declares a member of set x.
struct ValueSetValue
{
  Symbol name;
};

/// `value[x]`: the value must be a member of set x.
struct ValueRefValue
{
  Symbol name;
};

/// `scope[x]` / `scope_group[x]`
struct ScopeValue
{
  Symbol scope;  ///< folded; `any` accepts every scope
  bool group = false;
};

struct AliasMatchLeftValue
{
  Symbol group;
};

struct SingleAliasValue
{
  Symbol name;
};

struct AliasKeysFieldValue
{
  Symbol group;
};

struct ColourValue
{
  Symbol format;  ///< rgb / hsv / ...
};

struct RuleBlock;

using RuleValue = std::variant<
  SimpleValue, LiteralValue, TypeRefValue, EnumValue, ValueSetValue, ValueRefValue, ScopeValue,
  AliasMatchLeftValue, SingleAliasValue, AliasKeysFieldValue, ColourValue, Box<RuleBlock>>;

// ============================================================================
// Rules
// ============================================================================

struct SchemaRule
{
  uint32_t id = 0;                ///< unique within a snapshot
  std::optional<RuleKey> key;     ///< nullopt for bare-value rules (`{ <type> }`)
  Symbol key_text;                ///< key as written, for messages
  Operator op = Operator::Eq;
  RuleValue value;
  RuleOptions options;
  SourceRange range;
};

/// Rules guarded by `subtype[name] = { ... }` / `subtype[!name] = { ... }`.
struct SubtypeBlock
{
  Symbol name;  ///< folded
  bool negated = false;
  Box<RuleBlock> block;
};

struct RuleBlock
{
  std::vector<SchemaRule> rules;
  std::vector<SubtypeBlock> subtype_blocks;

  /// True when some rule accepts any member of an alias group.
  [[nodiscard]] bool has_alias_slot() const;
};

[[nodiscard]] const RuleBlock * as_rule_block(const RuleValue & v);

// ============================================================================
// Types
// ============================================================================

struct SubtypeDef
{
  Symbol name;  ///< folded
  RuleBlock predicate;
  RuleOptions options;  ///< type_key_filter / starts_with / push_scope
};

struct LocalisationRequirement
{
  Symbol key;           ///< e.g. `name`, `desc`
  std::string pattern;  ///< `$` is replaced by the entity name
  bool required = false;
  bool primary = false;
  std::optional<Symbol> subtype;  ///< folded guard
  bool subtype_negated = false;

  [[nodiscard]] std::string expand(std::string_view entity_name) const;
};

struct SchemaType
{
  Symbol name;
  std::vector<std::string> paths;  ///< normalised, without leading `game/`
  bool path_strict = false;
  std::string path_file;
  std::string path_extension;
  std::optional<Symbol> name_field;
  bool unique = false;
  bool type_per_file = false;
  std::optional<std::string> skip_root_key;  ///< `any` skips whatever key is there
  std::optional<Severity> severity;
  std::vector<SubtypeDef> subtypes;
  std::vector<LocalisationRequirement> localisation;
  RuleOptions options;  ///< type-level directives: type_key_filter, starts_with, scopes
  RuleBlock shape;
  bool has_shape = false;
  SourceRange range;

  /// Whether a file at `relative_path` (forward slashes) belongs to this type.
  [[nodiscard]] bool matches_path(std::string_view relative_path) const;

  /// Whether a top-level key can declare an instance of this type.
  [[nodiscard]] bool accepts_key(std::string_view key) const;

  [[nodiscard]] const SubtypeDef * find_subtype(Symbol folded_name) const;
};

// ============================================================================
// Enums / aliases / scopes / links
// ============================================================================

struct EnumDef
{
  Symbol name;
  std::vector<Symbol> values;  ///< as written
  SourceRange range;

  [[nodiscard]] bool contains(Symbol value) const;
};

/// `complex_enum[x] = { path = ... name = { ... } start_from_root = yes }`
struct ComplexEnumDef
{
  Symbol name;
  std::vector<std::string> paths;
  bool start_from_root = false;
  Block name_template;
  SourceRange range;
};

struct AliasGroup
{
  Symbol name;                       ///< folded
  std::vector<SchemaRule> members;   ///< key = member name matcher
};

struct ScopeDef
{
  Symbol name;                  ///< display name, e.g. `Country`
  std::vector<Symbol> aliases;  ///< folded, e.g. `country`
};

/// `scope_groups = { celestial = { planet star } }`
struct ScopeGroupDef
{
  Symbol name;                  ///< as written
  std::vector<Symbol> members;  ///< folded scope names or aliases
  SourceRange range;
};

struct LinkDef
{
  Symbol name;                       ///< folded
  std::vector<Symbol> input_scopes;  ///< folded; empty or `any` = any scope
  Symbol output_scope;               ///< folded; empty or `any` = unknown
  std::string prefix;
  bool from_data = false;
};

// ============================================================================
// Fragment - result of parsing one schema file
// ============================================================================

struct SchemaFragment
{
  std::vector<SchemaType> types;
  std::vector<std::pair<Symbol, RuleBlock>> shapes;  ///< top-level `name = { ... }`
  std::vector<std::pair<Symbol, RuleOptions>> shape_options;
  std::vector<EnumDef> enums;
  std::vector<ComplexEnumDef> complex_enums;
  std::vector<std::pair<Symbol, SchemaRule>> aliases;  ///< (group folded, member)
  std::vector<std::pair<Symbol, SchemaRule>> single_aliases;
  std::vector<ScopeDef> scopes;
  std::vector<ScopeGroupDef> scope_groups;
  std::vector<LinkDef> links;
  std::vector<EnumDef> value_sets;  ///< predefined `values = { value[x] = { ... } }`
};

// ============================================================================
// Rule naming helpers
// ============================================================================

[[nodiscard]] std::string describe(const RuleKey & key);
[[nodiscard]] std::string describe(const RuleValue & value);

/// Visit every rule in a block, including subtype-guarded and nested blocks.
template <typename Fn>
void for_each_rule(const RuleBlock & block, Fn && fn)
{
  for (const auto & rule : block.rules) {
    fn(rule);
    if (const auto * nested = as_rule_block(rule.value)) {
      for_each_rule(*nested, fn);
    }
  }
  for (const auto & sb : block.subtype_blocks) {
    for_each_rule(*sb.block, fn);
  }
}

}  // namespace cwcheck::schema
