// cwcheck/diff/diff_engine.hpp - Structural diff between two script trees
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cwcheck/ast/ast.hpp"
#include "cwcheck/basic/diagnostic.hpp"
#include "cwcheck/basic/source_manager.hpp"
#include "cwcheck/schema/schema.hpp"

namespace cwcheck::diff
{

enum class ChangeKind : uint8_t {
  Added,
  Removed,
  Changed,
};

[[nodiscard]] constexpr std::string_view to_string(ChangeKind k) noexcept
{
  switch (k) {
    case ChangeKind::Added:
      return "Added";
    case ChangeKind::Removed:
      return "Removed";
    case ChangeKind::Changed:
      return "Changed";
  }
  return "";
}

/**
 * One difference between A and B.
 *
 * `path` holds one segment per nesting level: the key as written in A (or B
 * for additions), suffixed with `[i]` when the key repeats or `[name]` when
 * the entity was matched by its name field. Bare values use `[i]` alone.
 */
struct Change
{
  ChangeKind kind = ChangeKind::Changed;
  std::vector<std::string> path;

  std::optional<Value> old_value;  ///< unset for Added
  std::optional<Value> new_value;  ///< unset for Removed
  Operator old_op = Operator::Eq;
  Operator new_op = Operator::Eq;
  std::optional<Condition> old_condition;  ///< `[[PARAM] ...]` guard of the old entry
  std::optional<Condition> new_condition;

  SourceRange old_range;
  SourceRange new_range;

  /// Path segments joined with '/'.
  [[nodiscard]] std::string path_string() const;
};

using Changeset = std::vector<Change>;

/**
 * Diff two blocks.
 *
 * Entries are grouped by case-folded key in order of first appearance (A
 * first, then keys new in B) and paired by occurrence index within a group.
 * Paired blocks recurse, paired arrays compare element by element, anything
 * else compares structurally. When `type` declares a name field, top-level
 * entities are paired by that field's value instead of by position.
 *
 * Swapping A and B mirrors every Added/Removed; structurally equal inputs
 * give an empty changeset.
 */
[[nodiscard]] Changeset diff(const Block & a, const Block & b, const schema::SchemaType * type = nullptr);

struct DiffResult
{
  Changeset changes;
  std::vector<Diagnostic> diagnostics;  ///< parse diagnostics of both inputs

  [[nodiscard]] bool has_errors() const;
};

/**
 * Parse two texts into `sources` and diff them. Parse errors do not stop the
 * diff; the recovered trees are compared and the diagnostics are returned
 * alongside.
 */
[[nodiscard]] DiffResult diff_documents(
  SourceRegistry & sources, const std::filesystem::path & path_a, std::string text_a,
  const std::filesystem::path & path_b, std::string text_b, const schema::SchemaType * type = nullptr);

/// Same as above with a private registry; diagnostic ranges are not resolvable afterwards.
[[nodiscard]] DiffResult diff_documents(
  std::string text_a, std::string text_b, const schema::SchemaType * type = nullptr);

}  // namespace cwcheck::diff
