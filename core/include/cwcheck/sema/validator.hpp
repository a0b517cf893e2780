// cwcheck/sema/validator.hpp - Schema-directed AST validation
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cwcheck/ast/ast.hpp"
#include "cwcheck/basic/diagnostic.hpp"
#include "cwcheck/schema/schema.hpp"
#include "cwcheck/schema/schema_registry.hpp"
#include "cwcheck/sema/localisation.hpp"
#include "cwcheck/sema/scope.hpp"
#include "cwcheck/sema/symbol_index.hpp"

namespace cwcheck::sema
{

// ============================================================================
// Options
// ============================================================================

enum class UnexpectedKeyPolicy : uint8_t {
  Error,
  Warning,
  Ignore,
};

[[nodiscard]] constexpr std::string_view to_string(UnexpectedKeyPolicy p) noexcept
{
  switch (p) {
    case UnexpectedKeyPolicy::Error:
      return "error";
    case UnexpectedKeyPolicy::Warning:
      return "warning";
    case UnexpectedKeyPolicy::Ignore:
      return "ignore";
  }
  return "";
}

struct ValidationOptions
{
  UnexpectedKeyPolicy unexpected_keys = UnexpectedKeyPolicy::Error;
  bool check_localisation = true;
  size_t max_diagnostics = 0;  ///< per document; 0 = unlimited
};

/**
 * Cooperative cancellation: a run is cancelled once the live revision moves
 * past the revision it was started for.
 */
class CancellationCheck
{
public:
  CancellationCheck() = default;
  CancellationCheck(const std::atomic<uint64_t> * live_revision, uint64_t expected) noexcept
  : live_(live_revision), expected_(expected)
  {
  }

  [[nodiscard]] bool cancelled() const noexcept
  {
    return live_ != nullptr && live_->load(std::memory_order_acquire) != expected_;
  }

private:
  const std::atomic<uint64_t> * live_ = nullptr;
  uint64_t expected_ = 0;
};

struct ValidationContext
{
  const schema::SchemaSnapshot * schema = nullptr;
  const SymbolIndex * symbols = nullptr;             ///< optional
  const LocalisationOracle * localisation = nullptr;  ///< optional
  ValidationOptions options;
  CancellationCheck cancel;
};

// ============================================================================
// Validator
// ============================================================================

/**
 * Walks script blocks alongside schema rule blocks.
 *
 * One Validator runs one validation pass; it is not shared between threads.
 * Both validate functions return nullopt when the pass was cancelled.
 *
 * @throws EngineError when a single-alias chain exceeds its bound
 */
class Validator
{
public:
  explicit Validator(ValidationContext ctx);

  /**
   * Validate one entity body against `type`.
   *
   * @param body         The entity block
   * @param type         Its schema type
   * @param initial      Scope bindings at the entity root
   * @param entity_key   Key the entity was declared under (subtype filters)
   * @param entity_name  Name used for localisation patterns
   * @param name_range   Where entity-level problems are reported
   */
  [[nodiscard]] std::optional<std::vector<Diagnostic>> validate(
    const Block & body, const schema::SchemaType & type, ScopeContext initial, Symbol entity_key = {},
    Symbol entity_name = {}, SourceRange name_range = {});

  /// Validate every entity found in a document at `relative_path`.
  [[nodiscard]] std::optional<std::vector<Diagnostic>> validate_document(
    const Block & root, std::string_view relative_path);

  /// Symbol groups looked up during the pass (type, value-set and complex-enum names).
  [[nodiscard]] const std::set<SymbolGroup> & referenced_groups() const noexcept { return referenced_; }

  /// Initial scope bindings for an entity of `type`.
  [[nodiscard]] static ScopeContext initial_scope(
    const schema::SchemaType & type, const schema::SchemaSnapshot & snap);

private:
  struct RuleGroup
  {
    std::string id;
    std::vector<const schema::SchemaRule *> rules;
    schema::Cardinality cardinality;
    bool explicit_cardinality = false;
    int decided_by = -1;  ///< index of the applicable block that set the cardinality
    uint32_t count = 0;
    std::vector<SourceRange> occurrences;
  };

  struct MergedRules
  {
    std::vector<RuleGroup> groups;
    std::unordered_map<Symbol, size_t> literal;  ///< folded key -> group
    std::vector<size_t> patterns;                ///< non-literal groups, declaration order
    std::vector<const schema::SchemaRule *> item_rules;
    bool alias_slot = false;
  };

  struct KeyMatch
  {
    size_t group = 0;
    std::vector<const schema::SchemaRule *> candidates;
  };

  [[nodiscard]] MergedRules merge_rules(const schema::RuleBlock & rules) const;
  void collect_applicable(
    const schema::RuleBlock & rules, std::vector<const schema::RuleBlock *> & out) const;

  /// @return false when cancelled
  bool check_block(const Block & block, const schema::RuleBlock & rules, SourceRange owner, DiagnosticBag & diags);

  [[nodiscard]] std::optional<KeyMatch> match_key(const Entry & e, MergedRules & merged);
  [[nodiscard]] bool key_matches(const schema::RuleKey & key, const Key & k);

  void check_entry(const Entry & e, const std::vector<const schema::SchemaRule *> & candidates, DiagnosticBag & diags);
  void check_item(const Value & item, const MergedRules & merged, DiagnosticBag & diags);
  void check_rule(const schema::SchemaRule & rule, const Entry * e, const Value & value, DiagnosticBag & diags);
  void check_value(
    const schema::SchemaRule & rule, const Value & value, SourceRange owner, DiagnosticBag & diags);
  void check_scalar(const schema::SchemaRule & rule, const Scalar & s, DiagnosticBag & diags);
  void check_scope_restriction(const schema::SchemaRule & rule, SourceRange where, DiagnosticBag & diags);
  void report_cardinality(const RuleGroup & group, SourceRange owner, DiagnosticBag & diags);
  void report_unexpected(const Entry & e, const MergedRules & merged, DiagnosticBag & diags);
  void check_localisation(
    const schema::SchemaType & type, Symbol entity_name, SourceRange where, DiagnosticBag & diags);
  void check_unique(const schema::SchemaType & type, Symbol name, SourceRange where, DiagnosticBag & diags);

  [[nodiscard]] static bool shape_compatible(const schema::SchemaRule & rule, const Value & value);
  [[nodiscard]] Symbol canonical(Symbol scope) const;
  [[nodiscard]] std::optional<bool> enum_contains(Symbol name, std::string_view text);
  [[nodiscard]] bool value_known(Symbol set, std::string_view text);
  [[nodiscard]] bool type_instance_known(
    Symbol type, std::string_view prefix, std::string_view suffix, std::string_view text);

  ValidationContext ctx_;
  const schema::SchemaSnapshot & schema_;
  ScopeStack scopes_;
  std::vector<Symbol> subtypes_;
  std::set<SymbolGroup> referenced_;
  bool cancelled_ = false;
};

}  // namespace cwcheck::sema
