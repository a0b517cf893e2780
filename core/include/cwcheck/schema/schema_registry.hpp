// cwcheck/schema/schema_registry.hpp - Immutable schema snapshots
//
// A SchemaSnapshot is the merged, checked result of loading a set of CWT
// files. The registry swaps snapshots wholesale; readers hold the shared_ptr
// for the length of a validation pass.
//
#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cwcheck/basic/diagnostic.hpp"
#include "cwcheck/basic/source_manager.hpp"
#include "cwcheck/schema/schema.hpp"

namespace cwcheck::schema
{

struct SchemaSource
{
  std::filesystem::path path;
  std::string text;
};

// ============================================================================
// SchemaSnapshot
// ============================================================================

class SchemaSnapshot
{
public:
  /// Guards single-alias chains.
  static constexpr uint32_t k_max_expansion_depth = 64;

  SchemaSnapshot() = default;
  SchemaSnapshot(SchemaFragment merged, uint64_t generation);

  SchemaSnapshot(const SchemaSnapshot &) = delete;
  SchemaSnapshot & operator=(const SchemaSnapshot &) = delete;

  [[nodiscard]] uint64_t generation() const noexcept { return generation_; }
  [[nodiscard]] bool empty() const noexcept { return types_.empty() && aliases_.empty(); }

  // Types
  [[nodiscard]] const std::vector<SchemaType> & types() const noexcept { return types_; }
  [[nodiscard]] const SchemaType * find_type(Symbol name) const;
  [[nodiscard]] std::vector<const SchemaType *> types_for_path(std::string_view relative_path) const;

  // Enums / value sets
  [[nodiscard]] const EnumDef * find_enum(Symbol name) const;
  [[nodiscard]] const ComplexEnumDef * find_complex_enum(Symbol name) const;
  [[nodiscard]] const std::vector<ComplexEnumDef> & complex_enums() const noexcept
  {
    return complex_enums_;
  }
  [[nodiscard]] const EnumDef * find_value_set(Symbol name) const;

  // Aliases
  [[nodiscard]] const std::vector<AliasGroup> & alias_groups() const noexcept { return aliases_; }
  [[nodiscard]] const std::vector<std::pair<Symbol, SchemaRule>> & single_aliases() const noexcept
  {
    return single_aliases_;
  }
  [[nodiscard]] const AliasGroup * find_alias_group(Symbol folded_group) const;
  [[nodiscard]] const SchemaRule * find_single_alias(Symbol folded_name) const;

  /**
   * Follow `single_alias_right[x]` until a non-alias rule is reached.
   *
   * @throws EngineError when the chain exceeds k_max_expansion_depth
   */
  [[nodiscard]] const SchemaRule * resolve_single_alias(Symbol folded_name) const;

  /**
   * Members of `group` that may match a key, memoised per
   * (group, invocation-site rule id, folded key).
   *
   * Literal members whose name equals the key come first. When none match
   * literally, the pattern members (`<type>`, `enum[x]`, `scalar`) are
   * returned for the caller to test.
   */
  [[nodiscard]] const std::vector<const SchemaRule *> & expand_alias(
    Symbol folded_group, uint32_t site_rule_id, Symbol folded_key) const;

  [[nodiscard]] size_t expansion_cache_size() const;

  // Scopes / links
  [[nodiscard]] bool has_scopes() const noexcept { return !scopes_.empty(); }
  [[nodiscard]] const std::vector<ScopeDef> & scopes() const noexcept { return scopes_; }

  /// Canonical (folded) id of a scope name or alias; empty when unknown.
  [[nodiscard]] Symbol canonical_scope(Symbol name) const;
  [[nodiscard]] const ScopeGroupDef * find_scope_group(Symbol name) const;
  [[nodiscard]] const LinkDef * find_link(Symbol folded_name) const;
  [[nodiscard]] const std::vector<LinkDef> & links() const noexcept { return links_; }

private:
  struct ExpansionKey
  {
    Symbol group;
    uint32_t site = 0;
    Symbol key;

    [[nodiscard]] bool operator==(const ExpansionKey &) const = default;
  };

  struct ExpansionKeyHash
  {
    size_t operator()(const ExpansionKey & k) const noexcept
    {
      size_t h = std::hash<uint32_t>{}(k.group.id);
      h ^= std::hash<uint32_t>{}(k.site) + 0x9e3779b9 + (h << 6) + (h >> 2);
      h ^= std::hash<uint32_t>{}(k.key.id) + 0x9e3779b9 + (h << 6) + (h >> 2);
      return h;
    }
  };

  uint64_t generation_ = 0;
  std::vector<SchemaType> types_;
  std::vector<EnumDef> enums_;
  std::vector<ComplexEnumDef> complex_enums_;
  std::vector<EnumDef> value_sets_;
  std::vector<AliasGroup> aliases_;
  std::vector<std::pair<Symbol, SchemaRule>> single_aliases_;
  std::vector<ScopeDef> scopes_;
  std::vector<ScopeGroupDef> scope_groups_;
  std::vector<LinkDef> links_;

  std::unordered_map<Symbol, size_t> type_index_;
  std::unordered_map<Symbol, size_t> enum_index_;
  std::unordered_map<Symbol, size_t> complex_enum_index_;
  std::unordered_map<Symbol, size_t> value_set_index_;
  std::unordered_map<Symbol, size_t> alias_index_;
  std::unordered_map<Symbol, size_t> single_alias_index_;
  std::unordered_map<Symbol, Symbol> scope_index_;
  std::unordered_map<Symbol, size_t> scope_group_index_;
  std::unordered_map<Symbol, size_t> link_index_;

  mutable std::mutex expansion_mutex_;
  mutable std::unordered_map<ExpansionKey, std::vector<const SchemaRule *>, ExpansionKeyHash>
    expansions_;
};

// ============================================================================
// SchemaLoadResult
// ============================================================================

struct SchemaLoadResult
{
  bool success = false;
  std::shared_ptr<const SchemaSnapshot> snapshot;
  std::vector<Diagnostic> diagnostics;  ///< warnings on success, errors on failure

  static SchemaLoadResult ok(std::shared_ptr<const SchemaSnapshot> snap, std::vector<Diagnostic> diags)
  {
    return {true, std::move(snap), std::move(diags)};
  }
  static SchemaLoadResult fail(std::vector<Diagnostic> diags) { return {false, nullptr, std::move(diags)}; }
};

// ============================================================================
// Checks (exposed for tests)
// ============================================================================

/// Report undefined types, enums, alias groups and single aliases as warnings.
void check_references(const SchemaSnapshot & snapshot, DiagnosticBag & diags);

/**
 * Least-fixpoint productivity over alias groups and single aliases.
 *
 * A member is productive when every alias it requires (through rules with a
 * minimum count of at least one) is productive. Unproductive groups are
 * reported as errors.
 */
void check_alias_productivity(const SchemaSnapshot & snapshot, DiagnosticBag & diags);

// ============================================================================
// SchemaRegistry
// ============================================================================

class SchemaRegistry
{
public:
  SchemaRegistry();

  /**
   * Parse and merge every source. On success the new snapshot replaces the
   * current one; on failure the current snapshot is kept.
   */
  SchemaLoadResult load(SourceRegistry & sources, const std::vector<SchemaSource> & files);

  [[nodiscard]] std::shared_ptr<const SchemaSnapshot> snapshot() const;

  [[nodiscard]] uint64_t generation() const noexcept
  {
    return generation_.load(std::memory_order_acquire);
  }

private:
  mutable std::shared_mutex mutex_;
  std::shared_ptr<const SchemaSnapshot> current_;
  std::atomic<uint64_t> generation_{0};
};

/// Merge fragments in order. Shapes attach to the type of the same name.
[[nodiscard]] SchemaFragment merge_fragments(std::vector<SchemaFragment> fragments, DiagnosticBag & diags);

}  // namespace cwcheck::schema
