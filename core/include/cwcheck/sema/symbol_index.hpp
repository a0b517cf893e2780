// cwcheck/sema/symbol_index.hpp - Concurrent (type, name) -> locations index
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "cwcheck/basic/interner.hpp"
#include "cwcheck/basic/source_manager.hpp"

namespace cwcheck::sema
{

// ============================================================================
// Symbol Types
// ============================================================================

enum class SymbolKind : uint8_t {
  TypeInstance,       ///< group = type name
  ValueSetMember,     ///< group = value set name
  ComplexEnumMember,  ///< group = complex enum name
};

[[nodiscard]] constexpr std::string_view to_string(SymbolKind k) noexcept
{
  switch (k) {
    case SymbolKind::TypeInstance:
      return "type";
    case SymbolKind::ValueSetMember:
      return "value_set";
    case SymbolKind::ComplexEnumMember:
      return "complex_enum";
  }
  return "";
}

/// (kind, folded group). Identifies one namespace of names.
struct SymbolGroup
{
  SymbolKind kind = SymbolKind::TypeInstance;
  Symbol group;

  [[nodiscard]] bool operator==(const SymbolGroup &) const = default;
  [[nodiscard]] bool operator<(const SymbolGroup & o) const noexcept
  {
    return kind != o.kind ? kind < o.kind : group < o.group;
  }
};

struct SymbolGroupHash
{
  size_t operator()(const SymbolGroup & g) const noexcept
  {
    return std::hash<uint32_t>{}(g.group.id) * 31 + static_cast<size_t>(g.kind);
  }
};

/// A declaration found in one document.
struct SymbolDecl
{
  SymbolKind kind = SymbolKind::TypeInstance;
  Symbol group;  ///< as written; folded on insertion
  Symbol name;   ///< as written
  SourceRange range;
  std::vector<Symbol> subtypes;  ///< folded; type instances only

  [[nodiscard]] SymbolGroup group_key() const { return {kind, group.folded()}; }
};

struct SymbolLocation
{
  FileId file;
  Symbol name;  ///< as written
  SourceRange range;
};

// ============================================================================
// SymbolIndex
// ============================================================================

/**
 * Sharded, thread-safe symbol index. Each shard owns a subset of groups
 * (hashed by group) and its own shared_mutex, so writers for different
 * types do not contend.
 */
class SymbolIndex
{
public:
  static constexpr size_t k_default_shards = 16;

  explicit SymbolIndex(size_t shard_count = k_default_shards);

  SymbolIndex(const SymbolIndex &) = delete;
  SymbolIndex & operator=(const SymbolIndex &) = delete;

  /**
   * Replace the declarations contributed by `file`.
   *
   * @return Groups whose set of names changed (sorted, unique)
   */
  std::vector<SymbolGroup> replace_document_symbols(FileId file, std::vector<SymbolDecl> decls);

  /// Drop every declaration of `file`; returns the groups that changed.
  std::vector<SymbolGroup> remove_document(FileId file);

  /// Drop everything (schema reload).
  void clear();

  [[nodiscard]] bool contains(SymbolKind kind, Symbol group, Symbol name) const;
  [[nodiscard]] std::vector<SymbolLocation> lookup(SymbolKind kind, Symbol group, Symbol name) const;

  /// Distinct names in a group, as first written, sorted case-insensitively.
  [[nodiscard]] std::vector<Symbol> names(SymbolKind kind, Symbol group) const;

  /// Declarations currently held for `file`.
  [[nodiscard]] std::vector<SymbolDecl> document_symbols(FileId file) const;

  [[nodiscard]] size_t size() const;

private:
  using NameMap = std::unordered_map<Symbol, std::vector<SymbolLocation>>;

  struct Shard
  {
    mutable std::shared_mutex mutex;
    std::unordered_map<SymbolGroup, NameMap, SymbolGroupHash> groups;
  };

  [[nodiscard]] Shard & shard_for(const SymbolGroup & g) const;

  void insert(FileId file, const SymbolDecl & decl);
  /// @return true when the last location of the name went away
  bool erase(FileId file, const SymbolDecl & decl);

  std::vector<std::unique_ptr<Shard>> shards_;

  mutable std::mutex documents_mutex_;
  std::unordered_map<uint32_t, std::vector<SymbolDecl>> documents_;
};

}  // namespace cwcheck::sema
