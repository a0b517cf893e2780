// cwcheck/analysis/completion.hpp - Schema-driven completion candidates
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "cwcheck/ast/ast.hpp"
#include "cwcheck/schema/schema_registry.hpp"
#include "cwcheck/sema/symbol_index.hpp"

namespace cwcheck::analysis
{

enum class CompletionKind : uint8_t {
  Key,
  EnumMember,
  Reference,
  Keyword,
};

[[nodiscard]] constexpr std::string_view to_string(CompletionKind k) noexcept
{
  switch (k) {
    case CompletionKind::Key:
      return "Property";
    case CompletionKind::EnumMember:
      return "EnumMember";
    case CompletionKind::Reference:
      return "Reference";
    case CompletionKind::Keyword:
      return "Keyword";
  }
  return "";
}

struct CompletionItem
{
  std::string label;
  CompletionKind kind = CompletionKind::Key;
  std::string detail;

  [[nodiscard]] bool operator==(const CompletionItem &) const = default;
};

/**
 * Completion candidates at `offset` (UTF-8 byte offset into `text`).
 *
 * The block enclosing the cursor is mapped to its rule block by following
 * entry keys from the entity root. In key position the candidates are the
 * keys that rule block accepts; after an operator they are the values the
 * key's rule accepts.
 */
[[nodiscard]] std::vector<CompletionItem> complete(
  const Block & root, std::string_view text, std::string_view relative_path, uint32_t offset,
  const schema::SchemaSnapshot & snap, const sema::SymbolIndex & index);

}  // namespace cwcheck::analysis
