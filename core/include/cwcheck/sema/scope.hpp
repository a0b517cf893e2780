// cwcheck/sema/scope.hpp - Scope stack and link resolution
//
// Scopes are tracked as canonical folded names (see
// SchemaSnapshot::canonical_scope). An empty Symbol means "unknown", which
// satisfies every restriction.
//
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cwcheck/basic/interner.hpp"
#include "cwcheck/schema/schema.hpp"
#include "cwcheck/schema/schema_registry.hpp"

namespace cwcheck::sema
{

// ============================================================================
// ScopeContext
// ============================================================================

/**
 * Bindings visible at one point of the walk.
 */
struct ScopeContext
{
  Symbol this_scope;
  Symbol root;
  std::vector<Symbol> prev;  ///< prev, prevprev, ...
  std::vector<Symbol> from;  ///< from, fromfrom, ...

  /// Resolve `this`, `root`, `prev`, `prevprev`, `from`, `fromfrom`, ...
  /// Returns false when `keyword` is not a binding name.
  [[nodiscard]] bool resolve_keyword(std::string_view keyword, Symbol & out) const;

  /// Rebind one name. Unknown names are ignored.
  void bind(std::string_view keyword, Symbol scope);
};

/// `required` is satisfied by `actual` (`any` and unknown always match).
[[nodiscard]] bool scope_satisfies(Symbol actual, Symbol required);

[[nodiscard]] bool scope_satisfies_any(Symbol actual, const std::vector<Symbol> & required);

// ============================================================================
// ScopeStack
// ============================================================================

/**
 * Stack of scope contexts following the traversal path.
 *
 * `enter` applies a rule's replace_scope / push_scope and returns a guard
 * that restores the previous context when it goes out of scope.
 */
class ScopeStack
{
public:
  explicit ScopeStack(ScopeContext initial = {});

  [[nodiscard]] const ScopeContext & current() const { return frames_.back(); }
  [[nodiscard]] size_t depth() const noexcept { return frames_.size(); }

  class Guard
  {
  public:
    explicit Guard(ScopeStack & stack) : stack_(&stack) {}
    Guard(const Guard &) = delete;
    Guard & operator=(const Guard &) = delete;
    Guard(Guard && other) noexcept : stack_(std::exchange(other.stack_, nullptr)) {}
    Guard & operator=(Guard &&) = delete;
    ~Guard()
    {
      if (stack_ != nullptr) {
        stack_->pop();
      }
    }

  private:
    ScopeStack * stack_;
  };

  /// Push a frame with `options` applied. Scope names go through `snap`.
  [[nodiscard]] Guard enter(const schema::RuleOptions & options, const schema::SchemaSnapshot & snap);

  /// Push a frame whose `this` is `scope` (link traversal, scope-typed keys).
  [[nodiscard]] Guard enter_scope(Symbol scope);

private:
  void pop();

  std::vector<ScopeContext> frames_;
};

// ============================================================================
// Link resolution
// ============================================================================

struct ScopeResolution
{
  bool ok = false;
  Symbol scope;       ///< resulting scope; empty = unknown
  std::string error;  ///< set when !ok
};

/**
 * Resolve a scope expression such as `owner`, `root.capital_scope`,
 * `event_target:my_target` or `parameter:p` starting from `ctx`.
 *
 * Each `.`-separated step is a binding keyword, a link declared in the schema
 * (checked against its input scopes), or a prefixed link.
 */
[[nodiscard]] ScopeResolution resolve_scope_path(
  std::string_view text, const ScopeContext & ctx, const schema::SchemaSnapshot & snap);

}  // namespace cwcheck::sema
