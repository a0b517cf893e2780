// cwcheck/sema/scope.cpp - Scope stack and link resolution
#include "cwcheck/sema/scope.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace cwcheck::sema
{

namespace
{

/// Count how many times `unit` repeats to form `text` exactly (0 if not).
size_t repeat_count(std::string_view text, std::string_view unit)
{
  if (text.empty() || text.size() % unit.size() != 0) {
    return 0;
  }
  for (size_t i = 0; i < text.size(); i += unit.size()) {
    if (!iequals(text.substr(i, unit.size()), unit)) {
      return 0;
    }
  }
  return text.size() / unit.size();
}

bool link_accepts(const schema::LinkDef & link, Symbol scope, const schema::SchemaSnapshot & snap)
{
  if (link.input_scopes.empty()) {
    return true;
  }
  return std::any_of(link.input_scopes.begin(), link.input_scopes.end(), [&](Symbol in) {
    return scope_satisfies(scope, snap.canonical_scope(in));
  });
}

Symbol at_or_unknown(const std::vector<Symbol> & chain, size_t index)
{
  return index < chain.size() ? chain[index] : Symbol{};
}

}  // namespace

// ============================================================================
// ScopeContext
// ============================================================================

bool ScopeContext::resolve_keyword(std::string_view keyword, Symbol & out) const
{
  if (iequals(keyword, "this")) {
    out = this_scope;
    return true;
  }
  if (iequals(keyword, "root")) {
    out = root;
    return true;
  }
  if (const size_t n = repeat_count(keyword, "prev")) {
    out = at_or_unknown(prev, n - 1);
    return true;
  }
  if (const size_t n = repeat_count(keyword, "from")) {
    out = at_or_unknown(from, n - 1);
    return true;
  }
  return false;
}

void ScopeContext::bind(std::string_view keyword, Symbol scope)
{
  if (iequals(keyword, "this")) {
    this_scope = scope;
  } else if (iequals(keyword, "root")) {
    root = scope;
  } else if (const size_t n = repeat_count(keyword, "prev")) {
    if (prev.size() < n) prev.resize(n);
    prev[n - 1] = scope;
  } else if (const size_t n = repeat_count(keyword, "from")) {
    if (from.size() < n) from.resize(n);
    from[n - 1] = scope;
  }
}

bool scope_satisfies(Symbol actual, Symbol required)
{
  static const Symbol any = intern("any");
  if (actual.empty() || required.empty() || required == any || actual == any) {
    return true;
  }
  return actual == required;
}

bool scope_satisfies_any(Symbol actual, const std::vector<Symbol> & required)
{
  if (required.empty()) {
    return true;
  }
  return std::any_of(required.begin(), required.end(), [&](Symbol r) {
    return scope_satisfies(actual, r);
  });
}

// ============================================================================
// ScopeStack
// ============================================================================

ScopeStack::ScopeStack(ScopeContext initial) { frames_.push_back(std::move(initial)); }

ScopeStack::Guard ScopeStack::enter(
  const schema::RuleOptions & options, const schema::SchemaSnapshot & snap)
{
  ScopeContext next = frames_.back();
  for (const auto & [binding, scope] : options.replace_scope) {
    next.bind(binding.str(), snap.canonical_scope(scope));
  }
  if (options.push_scope) {
    next.prev.insert(next.prev.begin(), next.this_scope);
    next.this_scope = snap.canonical_scope(*options.push_scope);
  }
  frames_.push_back(std::move(next));
  return Guard(*this);
}

ScopeStack::Guard ScopeStack::enter_scope(Symbol scope)
{
  ScopeContext next = frames_.back();
  next.prev.insert(next.prev.begin(), next.this_scope);
  next.this_scope = scope;
  frames_.push_back(std::move(next));
  return Guard(*this);
}

void ScopeStack::pop()
{
  if (frames_.size() > 1) {
    frames_.pop_back();
  }
}

// ============================================================================
// Link resolution
// ============================================================================

ScopeResolution resolve_scope_path(
  std::string_view text, const ScopeContext & ctx, const schema::SchemaSnapshot & snap)
{
  ScopeResolution res;
  res.ok = true;
  res.scope = ctx.this_scope;
  if (text.empty()) {
    res.ok = false;
    res.error = "empty scope expression";
    return res;
  }

  size_t start = 0;
  while (start <= text.size()) {
    const size_t dot = text.find('.', start);
    const std::string_view step =
      text.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    start = dot == std::string_view::npos ? text.size() + 1 : dot + 1;

    Symbol bound;
    if (ctx.resolve_keyword(step, bound)) {
      res.scope = bound;
      continue;
    }

    const auto colon = step.find(':');
    if (colon != std::string_view::npos) {
      const std::string_view prefix = step.substr(0, colon + 1);
      if (iequals(prefix, "event_target:") || iequals(prefix, "parameter:")) {
        res.scope = {};
        continue;
      }
      const auto link = std::find_if(snap.links().begin(), snap.links().end(), [&](const auto & l) {
        return !l.prefix.empty() && iequals(l.prefix, prefix);
      });
      if (link != snap.links().end()) {
        if (!link_accepts(*link, res.scope, snap)) {
          return {false, {}, fmt::format("link '{}' cannot be used from scope '{}'", prefix, res.scope.str())};
        }
        res.scope = snap.canonical_scope(link->output_scope);
        continue;
      }
      return {false, {}, fmt::format("unknown scope prefix '{}'", prefix)};
    }

    const schema::LinkDef * link = snap.find_link(intern(step).folded());
    if (link == nullptr) {
      return {false, {}, fmt::format("'{}' is not a scope keyword or link", step)};
    }
    if (!link_accepts(*link, res.scope, snap)) {
      return {
        false, {},
        fmt::format("link '{}' cannot be used from scope '{}'", step, res.scope.str())};
    }
    res.scope = link->output_scope.empty() ? Symbol{} : snap.canonical_scope(link->output_scope);
  }
  return res;
}

}  // namespace cwcheck::sema
