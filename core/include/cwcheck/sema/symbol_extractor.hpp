// cwcheck/sema/symbol_extractor.hpp - Declaration discovery
//
// Finds type instances, value-set members and complex-enum members in a
// parsed document. Runs independently of validation.
//
#pragma once

#include <string_view>
#include <vector>

#include "cwcheck/ast/ast.hpp"
#include "cwcheck/schema/schema.hpp"
#include "cwcheck/schema/schema_registry.hpp"
#include "cwcheck/sema/symbol_index.hpp"

namespace cwcheck::sema
{

/**
 * One top-level instance of a schema type inside a document.
 */
struct Entity
{
  const schema::SchemaType * type = nullptr;
  const Entry * entry = nullptr;  ///< nullptr for type_per_file entities
  const Block * body = nullptr;   ///< entity block (the file root for type_per_file)
  Symbol name;
  SourceRange name_range;
};

/**
 * Locate the entities of every type whose path matches `relative_path`.
 *
 * A top-level key belongs to the first matching type that accepts it
 * (type_key_filter / starts_with). Keys accepted by no type are not
 * entities.
 */
[[nodiscard]] std::vector<Entity> find_entities(
  const Block & root, std::string_view relative_path, const schema::SchemaSnapshot & snap);

/// Subtypes of `type` whose predicate matches `body` (folded names).
[[nodiscard]] std::vector<Symbol> match_subtypes(
  const schema::SchemaType & type, Symbol entity_key, const Block & body);

class SymbolExtractor
{
public:
  explicit SymbolExtractor(const schema::SchemaSnapshot & snap) : snap_(snap) {}

  [[nodiscard]] std::vector<SymbolDecl> extract(const Block & root, std::string_view relative_path) const;

private:
  void collect_value_sets(
    const Block & body, const schema::RuleBlock & rules, std::vector<SymbolDecl> & out,
    uint32_t depth) const;
  void collect_complex_enum(
    const Block & tpl, const Block & body, Symbol name, std::vector<SymbolDecl> & out) const;

  const schema::SchemaSnapshot & snap_;
};

}  // namespace cwcheck::sema
