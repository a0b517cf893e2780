// cwcheck/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Returns nlohmann::json objects for a parsed script tree.
//
#pragma once

#include <nlohmann/json.hpp>

#include "cwcheck/ast/ast.hpp"

namespace cwcheck
{

/**
 * Serialize a value (scalar, reference, block or array) to JSON.
 */
[[nodiscard]] nlohmann::json to_json(const Value & value);

/**
 * Serialize a block including all its entries and bare items.
 *
 * @param block The block to serialize (typically the file root)
 * @return JSON object `{ "type": "Block", "range": ..., "entries": [...], "items": [...] }`
 */
[[nodiscard]] nlohmann::json to_json(const Block & block);

}  // namespace cwcheck
