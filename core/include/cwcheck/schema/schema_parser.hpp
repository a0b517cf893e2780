// cwcheck/schema/schema_parser.hpp - CWT text -> SchemaFragment
#pragma once

#include <cstdint>
#include <string_view>

#include "cwcheck/ast/ast.hpp"
#include "cwcheck/basic/diagnostic.hpp"
#include "cwcheck/schema/schema.hpp"

namespace cwcheck::schema
{

/// Key matcher for a rule key as written (`<type>`, `enum[x]`, `scalar`, ...).
[[nodiscard]] RuleKey parse_rule_key(std::string_view text, bool quoted);

/**
 * Lowers a parsed CWT tree into schema structures.
 *
 * Rule ids are drawn from a caller-owned counter so that fragments parsed
 * separately stay unique once merged.
 */
class SchemaParser
{
public:
  SchemaParser(DiagnosticBag & diags, uint32_t & next_rule_id);

  [[nodiscard]] SchemaFragment lower(const Block & root);

private:
  void lower_types(const Block & block, SchemaFragment & out);
  void lower_type(Symbol name, const Entry & entry, SchemaFragment & out);
  void lower_subtype(const Entry & entry, Symbol name, SchemaType & type);
  void lower_localisation(const Block & block, SchemaType & type);
  void lower_enums(const Block & block, SchemaFragment & out);
  void lower_values(const Block & block, SchemaFragment & out);
  void lower_scopes(const Block & block, SchemaFragment & out);
  void lower_scope_groups(const Block & block, SchemaFragment & out);
  void lower_links(const Block & block, SchemaFragment & out);

  [[nodiscard]] RuleBlock lower_rule_block(const Block & block);
  [[nodiscard]] RuleBlock lower_rule_items(const std::vector<Value> & items);
  [[nodiscard]] SchemaRule lower_rule(const Entry & entry);
  [[nodiscard]] SchemaRule lower_item(const Value & item);
  [[nodiscard]] RuleValue lower_value(const Value & value);
  [[nodiscard]] RuleValue lower_scalar_value(const Scalar & scalar);
  [[nodiscard]] RuleOptions lower_options(const Entry & entry);

  void error(SourceRange range, std::string message);
  void warning(SourceRange range, std::string message);

  DiagnosticBag & diags_;
  uint32_t & next_rule_id_;
};

/**
 * Parse CWT text (already registered as `file_id`) into a fragment.
 *
 * Syntax problems and malformed directives are reported as SchemaError.
 */
[[nodiscard]] SchemaFragment parse_schema(
  FileId file_id, std::string_view text, DiagnosticBag & diags, uint32_t & next_rule_id);

}  // namespace cwcheck::schema
