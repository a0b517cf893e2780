// cwcheck/schema/schema.cpp - CWT schema model helpers
#include "cwcheck/schema/schema.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <type_traits>
#include <utility>

namespace cwcheck::schema
{

namespace
{

constexpr std::array<std::pair<std::string_view, SimpleType>, 17> k_simple_types = {{
  {"bool", SimpleType::Bool},
  {"int", SimpleType::Int},
  {"float", SimpleType::Float},
  {"scalar", SimpleType::Scalar},
  {"percentage_field", SimpleType::PercentageField},
  {"localisation", SimpleType::Localisation},
  {"localisation_synced", SimpleType::LocalisationSynced},
  {"localisation_inline", SimpleType::LocalisationInline},
  {"date_field", SimpleType::DateField},
  {"variable_field", SimpleType::VariableField},
  {"variable_field_32", SimpleType::VariableField},
  {"int_variable_field", SimpleType::IntVariableField},
  {"value_field", SimpleType::ValueField},
  {"int_value_field", SimpleType::IntValueField},
  {"scope_field", SimpleType::ScopeField},
  {"filepath", SimpleType::Filepath},
  {"icon", SimpleType::Icon},
}};

bool istarts_with(std::string_view text, std::string_view prefix)
{
  return text.size() >= prefix.size() && iequals(text.substr(0, prefix.size()), prefix);
}

std::string_view strip_game_prefix(std::string_view path)
{
  if (istarts_with(path, "game/")) {
    path.remove_prefix(5);
  }
  return path;
}

std::string type_ref_text(Symbol type, const std::string & prefix, const std::string & suffix)
{
  return fmt::format("{}<{}>{}", prefix, type.str(), suffix);
}

}  // namespace

// ============================================================================
// Cardinality
// ============================================================================

std::string Cardinality::to_string() const
{
  return fmt::format(
    "{}{}..{}", soft ? "~" : "", min, max ? fmt::to_string(*max) : std::string("inf"));
}

// ============================================================================
// SimpleType
// ============================================================================

std::string_view to_string(SimpleType t) noexcept
{
  for (const auto & [name, type] : k_simple_types) {
    if (type == t) {
      return name;
    }
  }
  return "scalar";
}

std::optional<SimpleType> parse_simple_type(std::string_view name) noexcept
{
  for (const auto & [text, type] : k_simple_types) {
    if (text == name) {
      return type;
    }
  }
  return std::nullopt;
}

// ============================================================================
// RuleBlock
// ============================================================================

bool RuleBlock::has_alias_slot() const
{
  const auto is_slot = [](const SchemaRule & r) {
    return r.key && std::holds_alternative<AliasNameKey>(*r.key);
  };
  if (std::any_of(rules.begin(), rules.end(), is_slot)) {
    return true;
  }
  return std::any_of(subtype_blocks.begin(), subtype_blocks.end(), [](const SubtypeBlock & sb) {
    return sb.block->has_alias_slot();
  });
}

const RuleBlock * as_rule_block(const RuleValue & v)
{
  const auto * b = std::get_if<Box<RuleBlock>>(&v);
  return b ? b->get() : nullptr;
}

// ============================================================================
// SchemaType
// ============================================================================

std::string LocalisationRequirement::expand(std::string_view entity_name) const
{
  std::string out;
  out.reserve(pattern.size() + entity_name.size());
  for (const char c : pattern) {
    if (c == '$') {
      out.append(entity_name);
    } else {
      out.push_back(c);
    }
  }
  return out;
}

bool SchemaType::matches_path(std::string_view relative_path) const
{
  relative_path = strip_game_prefix(relative_path);

  const auto slash = relative_path.rfind('/');
  const std::string_view dir =
    slash == std::string_view::npos ? std::string_view{} : relative_path.substr(0, slash);
  const std::string_view file =
    slash == std::string_view::npos ? relative_path : relative_path.substr(slash + 1);

  if (!path_file.empty() && !iequals(file, path_file)) {
    return false;
  }
  if (!path_extension.empty()) {
    const auto dot = file.rfind('.');
    const std::string_view ext =
      dot == std::string_view::npos ? std::string_view{} : file.substr(dot + 1);
    std::string_view want = path_extension;
    if (want.front() == '.') {
      want.remove_prefix(1);
    }
    if (!iequals(ext, want)) {
      return false;
    }
  }

  for (const auto & p : paths) {
    if (path_strict) {
      if (iequals(dir, p)) {
        return true;
      }
      continue;
    }
    if (iequals(dir, p) || (istarts_with(dir, p) && dir.size() > p.size() && dir[p.size()] == '/')) {
      return true;
    }
  }
  return false;
}

bool SchemaType::accepts_key(std::string_view key) const
{
  if (!options.type_key_filter.empty()) {
    const Symbol folded = intern(key).folded();
    const bool listed = std::find(options.type_key_filter.begin(), options.type_key_filter.end(),
                                  folded) != options.type_key_filter.end();
    if (listed == options.type_key_filter_negated) {
      return false;
    }
  }
  if (!options.starts_with.empty() && !istarts_with(key, options.starts_with)) {
    return false;
  }
  return true;
}

const SubtypeDef * SchemaType::find_subtype(Symbol folded_name) const
{
  for (const auto & st : subtypes) {
    if (st.name == folded_name) {
      return &st;
    }
  }
  return nullptr;
}

bool EnumDef::contains(Symbol value) const
{
  return std::find(values.begin(), values.end(), value) != values.end();
}

// ============================================================================
// describe
// ============================================================================

std::string describe(const RuleKey & key)
{
  return std::visit(
    [](const auto & k) -> std::string {
      using T = std::decay_t<decltype(k)>;
      if constexpr (std::is_same_v<T, LiteralKey>) {
        return std::string(k.text.str());
      } else if constexpr (std::is_same_v<T, TypeRefKey>) {
        return type_ref_text(k.type, k.prefix, k.suffix);
      } else if constexpr (std::is_same_v<T, EnumKey>) {
        return fmt::format("enum[{}]", k.name.str());
      } else if constexpr (std::is_same_v<T, ValueSetKey>) {
        return fmt::format("value_set[{}]", k.name.str());
      } else if constexpr (std::is_same_v<T, ValueKey>) {
        return fmt::format("value[{}]", k.name.str());
      } else if constexpr (std::is_same_v<T, SimpleKey>) {
        return std::string(to_string(k.type));
      } else if constexpr (std::is_same_v<T, ScopeKey>) {
        return fmt::format("scope[{}]", k.scope.str());
      } else {
        return fmt::format("alias_name[{}]", k.group.str());
      }
    },
    key);
}

std::string describe(const RuleValue & value)
{
  return std::visit(
    [](const auto & v) -> std::string {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, SimpleValue>) {
        if (v.range) {
          return fmt::format("{}[{}..{}]", to_string(v.type), v.range->min, v.range->max);
        }
        if (!v.argument.empty()) {
          return fmt::format("{}[{}]", to_string(v.type), v.argument);
        }
        return std::string(to_string(v.type));
      } else if constexpr (std::is_same_v<T, LiteralValue>) {
        return std::string(v.text.str());
      } else if constexpr (std::is_same_v<T, TypeRefValue>) {
        return type_ref_text(v.type, v.prefix, v.suffix);
      } else if constexpr (std::is_same_v<T, EnumValue>) {
        return fmt::format("enum[{}]", v.name.str());
      } else if constexpr (std::is_same_v<T, ValueSetValue>) {
        return fmt::format("value_set[{}]", v.name.str());
      } else if constexpr (std::is_same_v<T, ValueRefValue>) {
        return fmt::format("value[{}]", v.name.str());
      } else if constexpr (std::is_same_v<T, ScopeValue>) {
        return fmt::format("{}[{}]", v.group ? "scope_group" : "scope", v.scope.str());
      } else if constexpr (std::is_same_v<T, AliasMatchLeftValue>) {
        return fmt::format("alias_match_left[{}]", v.group.str());
      } else if constexpr (std::is_same_v<T, SingleAliasValue>) {
        return fmt::format("single_alias_right[{}]", v.name.str());
      } else if constexpr (std::is_same_v<T, AliasKeysFieldValue>) {
        return fmt::format("alias_keys_field[{}]", v.group.str());
      } else if constexpr (std::is_same_v<T, ColourValue>) {
        return fmt::format("colour[{}]", v.format.str());
      } else {
        return "{ ... }";
      }
    },
    value);
}

}  // namespace cwcheck::schema
