// cwcheck/sema/validator.cpp - Schema-directed AST validation
#include "cwcheck/sema/validator.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <utility>

#include "cwcheck/sema/symbol_extractor.hpp"
#include "cwcheck/sema/value_checker.hpp"

namespace cwcheck::sema
{

namespace
{

std::string group_id(const schema::RuleKey & key)
{
  if (const auto * lit = std::get_if<schema::LiteralKey>(&key)) {
    return fmt::format("={}", lit->text.folded().str());
  }
  return ascii_lower(schema::describe(key));
}

std::string display_key(const schema::SchemaRule & rule)
{
  if (!rule.key_text.empty()) {
    return std::string(rule.key_text.str());
  }
  return rule.key ? schema::describe(*rule.key) : std::string("<value>");
}

/// Minimum of the mins, maximum of the maxes.
schema::Cardinality most_permissive(const schema::Cardinality & a, const schema::Cardinality & b)
{
  schema::Cardinality out;
  out.min = std::min(a.min, b.min);
  if (a.max && b.max) {
    out.max = std::max(*a.max, *b.max);
  } else {
    out.max = std::nullopt;
  }
  out.soft = a.soft || b.soft;
  return out;
}

bool is_numeric(schema::SimpleType t)
{
  switch (t) {
    case schema::SimpleType::Int:
    case schema::SimpleType::Float:
    case schema::SimpleType::PercentageField:
    case schema::SimpleType::VariableField:
    case schema::SimpleType::IntVariableField:
    case schema::SimpleType::ValueField:
    case schema::SimpleType::IntValueField:
      return true;
    default:
      return false;
  }
}

bool is_localisation(schema::SimpleType t)
{
  return t == schema::SimpleType::Localisation || t == schema::SimpleType::LocalisationSynced ||
         t == schema::SimpleType::LocalisationInline;
}

/// `prefix_<t>_suffix` -> the `<t>` part, matched case-insensitively.
std::optional<std::string_view> strip_affixes(
  std::string_view text, std::string_view prefix, std::string_view suffix)
{
  if (text.size() <= prefix.size() + suffix.size()) {
    return std::nullopt;
  }
  if (!iequals(text.substr(0, prefix.size()), prefix) ||
      !iequals(text.substr(text.size() - suffix.size()), suffix)) {
    return std::nullopt;
  }
  return text.substr(prefix.size(), text.size() - prefix.size() - suffix.size());
}

/// Existing symbol for `text` in any case; empty when it was never interned.
Symbol find_symbol(std::string_view text)
{
  const Symbol sym = Interner::global().find(text);
  if (!sym.empty()) {
    return sym;
  }
  return Interner::global().find(ascii_lower(text));
}

std::string join(const std::vector<std::string> & parts, std::string_view sep)
{
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += sep;
    }
    out += parts[i];
  }
  return out;
}

std::string scope_name(Symbol scope) { return scope.empty() ? std::string("unknown") : std::string(scope.str()); }

std::string found_text(const Value & value)
{
  if (const auto * s = as_scalar(value)) {
    return fmt::format("'{}'", s->str());
  }
  if (as_block(value) != nullptr) {
    return "a block";
  }
  if (as_array(value) != nullptr) {
    return "a list";
  }
  return fmt::format("'{}'", render(value));
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

Validator::Validator(ValidationContext ctx)
: ctx_(ctx),
  schema_(ctx.schema != nullptr ? *ctx.schema
                                : throw EngineError("validator requires a schema snapshot"))
{
}

ScopeContext Validator::initial_scope(const schema::SchemaType & type, const schema::SchemaSnapshot & snap)
{
  ScopeContext ctx;
  if (type.options.push_scope) {
    ctx.this_scope = snap.canonical_scope(*type.options.push_scope);
    ctx.root = ctx.this_scope;
  }
  for (const auto & [binding, scope] : type.options.replace_scope) {
    ctx.bind(binding.str(), snap.canonical_scope(scope));
  }
  return ctx;
}

// ============================================================================
// Entry points
// ============================================================================

std::optional<std::vector<Diagnostic>> Validator::validate(
  const Block & body, const schema::SchemaType & type, ScopeContext initial, Symbol entity_key,
  Symbol entity_name, SourceRange name_range)
{
  scopes_ = ScopeStack(std::move(initial));
  subtypes_ = match_subtypes(type, entity_key, body);
  cancelled_ = false;

  const SourceRange owner = name_range.is_valid() ? name_range : body.range;
  DiagnosticBag diags;
  if (type.has_shape && !check_block(body, type.shape, owner, diags)) {
    return std::nullopt;
  }
  if (ctx_.options.check_localisation && ctx_.localisation != nullptr && !entity_name.empty()) {
    check_localisation(type, entity_name, owner, diags);
  }

  auto out = diags.take();
  if (type.severity) {
    for (auto & d : out) {
      d.severity = *type.severity;
    }
  }
  return out;
}

std::optional<std::vector<Diagnostic>> Validator::validate_document(
  const Block & root, std::string_view relative_path)
{
  DiagnosticBag all;
  for (const auto & ent : find_entities(root, relative_path, schema_)) {
    if (ctx_.cancel.cancelled()) {
      return std::nullopt;
    }
    if (ent.type->unique) {
      check_unique(*ent.type, ent.name, ent.name_range, all);
    }
    if (ent.body == nullptr) {
      if (ent.type->has_shape && ent.entry != nullptr) {
        all
          .report_error(
            get_range(ent.entry->value),
            fmt::format("{} '{}' must be a block", ent.type->name.str(), ent.name.str()),
            fmt::format("found {}", found_text(ent.entry->value)))
          .with_code(RuleCode::TypeMismatch);
      }
      continue;
    }
    const Symbol key = ent.entry != nullptr ? ent.entry->key.text : ent.name;
    auto result = validate(
      *ent.body, *ent.type, initial_scope(*ent.type, schema_), key, ent.name, ent.name_range);
    if (!result) {
      return std::nullopt;
    }
    for (auto & d : *result) {
      all.add(std::move(d));
    }
  }
  if (ctx_.options.max_diagnostics > 0) {
    all.truncate(ctx_.options.max_diagnostics);
  }
  return all.take();
}

// ============================================================================
// Rule merging
// ============================================================================

void Validator::collect_applicable(
  const schema::RuleBlock & rules, std::vector<const schema::RuleBlock *> & out) const
{
  out.push_back(&rules);
  for (const auto & sb : rules.subtype_blocks) {
    const bool matched = std::find(subtypes_.begin(), subtypes_.end(), sb.name) != subtypes_.end();
    if (matched != sb.negated) {
      collect_applicable(*sb.block, out);
    }
  }
}

Validator::MergedRules Validator::merge_rules(const schema::RuleBlock & rules) const
{
  MergedRules merged;
  std::vector<const schema::RuleBlock *> blocks;
  collect_applicable(rules, blocks);

  std::unordered_map<std::string, size_t> by_id;
  for (size_t bi = 0; bi < blocks.size(); ++bi) {
    for (const auto & rule : blocks[bi]->rules) {
      if (!rule.key) {
        merged.item_rules.push_back(&rule);
        continue;
      }
      if (std::holds_alternative<schema::AliasNameKey>(*rule.key)) {
        merged.alias_slot = true;
      }
      auto [it, inserted] = by_id.try_emplace(group_id(*rule.key), merged.groups.size());
      if (inserted) {
        RuleGroup group;
        group.id = it->first;
        merged.groups.push_back(std::move(group));
        if (const auto * lit = std::get_if<schema::LiteralKey>(&*rule.key)) {
          merged.literal.emplace(lit->text.folded(), it->second);
        } else {
          merged.patterns.push_back(it->second);
        }
      }

      RuleGroup & group = merged.groups[it->second];
      group.rules.push_back(&rule);
      const schema::Cardinality card = rule.options.effective_cardinality();
      const int block_index = static_cast<int>(bi);
      if (group.decided_by != block_index) {
        group.cardinality = card;
        group.explicit_cardinality = rule.options.cardinality.has_value();
        group.decided_by = block_index;
      } else {
        group.cardinality = most_permissive(group.cardinality, card);
        group.explicit_cardinality = group.explicit_cardinality || rule.options.cardinality.has_value();
      }
    }
  }
  return merged;
}

// ============================================================================
// Block walk
// ============================================================================

bool Validator::check_block(
  const Block & block, const schema::RuleBlock & rules, SourceRange owner, DiagnosticBag & diags)
{
  if (ctx_.cancel.cancelled()) {
    cancelled_ = true;
    return false;
  }

  MergedRules merged = merge_rules(rules);

  for (const auto & e : block.entries) {
    auto match = match_key(e, merged);
    if (!match) {
      report_unexpected(e, merged, diags);
      continue;
    }
    RuleGroup & group = merged.groups[match->group];
    if (!e.condition) {
      ++group.count;
      group.occurrences.push_back(e.key.range);
    }
    check_entry(e, match->candidates, diags);
    if (cancelled_) {
      return false;
    }
  }

  for (const auto & item : block.items) {
    check_item(item, merged, diags);
    if (cancelled_) {
      return false;
    }
  }

  for (const auto & group : merged.groups) {
    report_cardinality(group, owner, diags);
  }
  return true;
}

std::optional<Validator::KeyMatch> Validator::match_key(const Entry & e, MergedRules & merged)
{
  const Symbol key = e.key.folded();
  if (const auto it = merged.literal.find(key); it != merged.literal.end()) {
    return KeyMatch{it->second, merged.groups[it->second].rules};
  }

  for (const size_t index : merged.patterns) {
    const RuleGroup & group = merged.groups[index];
    std::vector<const schema::SchemaRule *> hits;
    for (const auto * rule : group.rules) {
      if (const auto * slot = std::get_if<schema::AliasNameKey>(&*rule->key)) {
        const auto & members = schema_.expand_alias(slot->group.folded(), rule->id, key);
        for (const auto * member : members) {
          if (member->key && key_matches(*member->key, e.key)) {
            hits.push_back(member);
          }
        }
      } else if (key_matches(*rule->key, e.key)) {
        hits.push_back(rule);
      }
    }
    if (!hits.empty()) {
      return KeyMatch{index, std::move(hits)};
    }
  }
  return std::nullopt;
}

bool Validator::key_matches(const schema::RuleKey & key, const Key & k)
{
  if (const auto * lit = std::get_if<schema::LiteralKey>(&key)) {
    return lit->text.folded() == k.folded();
  }
  if (const auto * ref = std::get_if<schema::TypeRefKey>(&key)) {
    return type_instance_known(ref->type, ref->prefix, ref->suffix, k.str());
  }
  if (const auto * en = std::get_if<schema::EnumKey>(&key)) {
    return enum_contains(en->name, k.str()).value_or(false);
  }
  if (std::holds_alternative<schema::ValueSetKey>(key)) {
    return true;
  }
  if (const auto * vk = std::get_if<schema::ValueKey>(&key)) {
    return value_known(vk->name, k.str());
  }
  if (const auto * simple = std::get_if<schema::SimpleKey>(&key)) {
    if (simple->type == schema::SimpleType::Scalar) {
      return true;
    }
    return check_simple(k.str(), schema::SimpleValue{simple->type, std::nullopt, {}}).ok();
  }
  if (const auto * sk = std::get_if<schema::ScopeKey>(&key)) {
    const ScopeResolution res = resolve_scope_path(k.str(), scopes_.current(), schema_);
    return res.ok && scope_satisfies(res.scope, canonical(sk->scope));
  }
  return false;
}

// ============================================================================
// Entries and values
// ============================================================================

bool Validator::shape_compatible(const schema::SchemaRule & rule, const Value & value)
{
  const bool nested = as_block(value) != nullptr || as_array(value) != nullptr;
  if (schema::as_rule_block(rule.value) != nullptr || std::holds_alternative<schema::ColourValue>(rule.value)) {
    return nested;
  }
  if (std::holds_alternative<schema::SingleAliasValue>(rule.value)) {
    return true;
  }
  return !nested;
}

void Validator::check_entry(
  const Entry & e, const std::vector<const schema::SchemaRule *> & candidates, DiagnosticBag & diags)
{
  std::vector<const schema::SchemaRule *> fitting;
  for (const auto * rule : candidates) {
    if (shape_compatible(*rule, e.value)) {
      fitting.push_back(rule);
    }
  }
  if (fitting.empty()) {
    check_rule(*candidates.front(), &e, e.value, diags);
    return;
  }
  if (fitting.size() == 1) {
    check_rule(*fitting.front(), &e, e.value, diags);
    return;
  }

  // Several declarations accept this shape: the first one without errors wins.
  std::optional<DiagnosticBag> first;
  for (const auto * rule : fitting) {
    DiagnosticBag trial;
    check_rule(*rule, &e, e.value, trial);
    if (!trial.has_errors()) {
      diags.merge(std::move(trial));
      return;
    }
    if (!first) {
      first = std::move(trial);
    }
  }
  diags.merge(std::move(*first));
}

void Validator::check_item(const Value & item, const MergedRules & merged, DiagnosticBag & diags)
{
  const SourceRange where = get_range(item);
  if (merged.item_rules.empty()) {
    if (ctx_.options.unexpected_keys == UnexpectedKeyPolicy::Ignore) {
      return;
    }
    const Severity sev =
      ctx_.options.unexpected_keys == UnexpectedKeyPolicy::Warning ? Severity::Warning : Severity::Error;
    diags.report(sev, where, fmt::format("unexpected value {}", found_text(item)))
      .with_code(RuleCode::UnexpectedKey);
    return;
  }

  std::optional<DiagnosticBag> first;
  for (const auto * rule : merged.item_rules) {
    if (!shape_compatible(*rule, item)) {
      continue;
    }
    DiagnosticBag trial;
    check_rule(*rule, nullptr, item, trial);
    if (!trial.has_errors()) {
      diags.merge(std::move(trial));
      return;
    }
    if (!first) {
      first = std::move(trial);
    }
  }
  if (first) {
    diags.merge(std::move(*first));
    return;
  }
  diags
    .report_error(
      where, fmt::format("unexpected value {}", found_text(item)),
      fmt::format("expected {}", schema::describe(merged.item_rules.front()->value)))
    .with_code(RuleCode::TypeMismatch);
}

void Validator::check_rule(
  const schema::SchemaRule & rule, const Entry * e, const Value & value, DiagnosticBag & diags)
{
  const SourceRange where = e != nullptr ? e->key.range : get_range(value);
  check_scope_restriction(rule, where, diags);

  std::optional<ScopeStack::Guard> key_scope;
  if (e != nullptr && rule.key && std::holds_alternative<schema::ScopeKey>(*rule.key)) {
    const ScopeResolution res = resolve_scope_path(e->key.str(), scopes_.current(), schema_);
    if (res.ok) {
      key_scope.emplace(scopes_.enter_scope(res.scope));
    }
  }
  const auto guard = scopes_.enter(rule.options, schema_);
  check_value(rule, value, where, diags);
}

void Validator::check_value(
  const schema::SchemaRule & rule, const Value & value, SourceRange owner, DiagnosticBag & diags)
{
  if (const auto * single = std::get_if<schema::SingleAliasValue>(&rule.value)) {
    const schema::SchemaRule * target = schema_.resolve_single_alias(single->name.folded());
    if (target == nullptr) {
      return;
    }
    check_scope_restriction(*target, owner, diags);
    const auto guard = scopes_.enter(target->options, schema_);
    check_value(*target, value, owner, diags);
    return;
  }

  if (const auto * nested = schema::as_rule_block(rule.value)) {
    if (const auto * b = as_block(value)) {
      check_block(*b, *nested, owner, diags);
      return;
    }
    if (const auto * a = as_array(value)) {
      Block items;
      items.items = a->items;
      items.range = a->range;
      check_block(items, *nested, owner, diags);
      return;
    }
    diags
      .report_error(
        get_range(value), fmt::format("'{}' must be a block", display_key(rule)),
        fmt::format("found {}", found_text(value)))
      .with_code(RuleCode::TypeMismatch);
    return;
  }

  if (std::holds_alternative<schema::ColourValue>(rule.value)) {
    const std::vector<Value> * items = nullptr;
    if (const auto * b = as_block(value); b != nullptr && b->entries.empty()) {
      items = &b->items;
    } else if (const auto * a = as_array(value)) {
      items = &a->items;
    }
    const bool ok = items != nullptr && (items->size() == 3 || items->size() == 4) &&
                    std::all_of(items->begin(), items->end(), [](const Value & v) {
                      const auto * s = as_scalar(v);
                      return (s != nullptr && is_number(s->str())) || as_reference(v) != nullptr;
                    });
    if (!ok) {
      diags
        .report_error(
          get_range(value), fmt::format("'{}' must be a colour", display_key(rule)),
          "expected three or four numbers")
        .with_code(RuleCode::TypeMismatch);
    }
    return;
  }

  if (const auto * ref = as_reference(value)) {
    if (ref->kind == ReferenceKind::Parameter) {
      return;
    }
    const auto * simple = std::get_if<schema::SimpleValue>(&rule.value);
    if (simple != nullptr && (is_numeric(simple->type) || simple->type == schema::SimpleType::Scalar)) {
      return;
    }
    diags
      .report_error(
        ref->range, fmt::format("{} reference is not allowed here", to_string(ref->kind)),
        fmt::format("expected {}", schema::describe(rule.value)))
      .with_code(RuleCode::TypeMismatch);
    return;
  }

  const auto * s = as_scalar(value);
  if (s == nullptr) {
    diags
      .report_error(
        get_range(value), fmt::format("'{}' must be a single value", display_key(rule)),
        fmt::format("expected {}, found {}", schema::describe(rule.value), found_text(value)))
      .with_code(RuleCode::TypeMismatch);
    return;
  }
  check_scalar(rule, *s, diags);
}

void Validator::check_scalar(const schema::SchemaRule & rule, const Scalar & s, DiagnosticBag & diags)
{
  const Severity sev = rule.options.severity.value_or(Severity::Error);
  const std::string_view text = s.str();

  if (const auto * simple = std::get_if<schema::SimpleValue>(&rule.value)) {
    if (is_localisation(simple->type)) {
      if (simple->type == schema::SimpleType::LocalisationInline && s.quoted) {
        return;
      }
      if (ctx_.options.check_localisation && ctx_.localisation != nullptr &&
          !ctx_.localisation->contains(text)) {
        diags
          .report_warning(s.range, fmt::format("localisation key '{}' is not defined", text))
          .with_code(RuleCode::MissingLocalisationKey);
      }
      return;
    }
    if (simple->type == schema::SimpleType::ScopeField) {
      const ScopeResolution res = resolve_scope_path(text, scopes_.current(), schema_);
      if (!res.ok) {
        diags.report(sev, s.range, res.error).with_code(RuleCode::ScopeMismatch);
      }
      return;
    }
    const ValueCheckResult res = check_simple(text, *simple);
    if (!res.ok()) {
      const RuleCode code =
        res.status == ValueCheck::OutOfRange ? RuleCode::ValueOutOfRange : RuleCode::TypeMismatch;
      diags.report(sev, s.range, res.message).with_code(code);
    }
    return;
  }

  if (const auto * lit = std::get_if<schema::LiteralValue>(&rule.value)) {
    if (!iequals(text, lit->text.str())) {
      diags
        .report(sev, s.range, fmt::format("expected '{}', found '{}'", lit->text.str(), text))
        .with_code(RuleCode::TypeMismatch);
    }
    return;
  }

  if (const auto * ref = std::get_if<schema::TypeRefValue>(&rule.value)) {
    if (ctx_.symbols != nullptr && !type_instance_known(ref->type, ref->prefix, ref->suffix, text)) {
      diags
        .report(sev, s.range, fmt::format("undefined {} '{}'", ref->type.str(), text))
        .with_code(RuleCode::UndefinedReference);
    }
    return;
  }

  if (const auto * en = std::get_if<schema::EnumValue>(&rule.value)) {
    if (!enum_contains(en->name, text).value_or(true)) {
      auto builder = diags.report(
        sev, s.range, fmt::format("'{}' is not a value of enum '{}'", text, en->name.str()));
      builder.with_code(RuleCode::UnknownEnumValue);
      if (const auto * def = schema_.find_enum(en->name); def != nullptr && !def->values.empty()) {
        std::vector<std::string> values;
        for (const auto v : def->values) {
          if (values.size() == 8) {
            values.emplace_back("...");
            break;
          }
          values.emplace_back(v.str());
        }
        builder.with_help(fmt::format("expected one of: {}", join(values, ", ")));
      }
    }
    return;
  }

  if (const auto * vref = std::get_if<schema::ValueRefValue>(&rule.value)) {
    const bool checkable = ctx_.symbols != nullptr || schema_.find_value_set(vref->name) != nullptr;
    if (checkable && !value_known(vref->name, text)) {
      diags
        .report(sev, s.range, fmt::format("'{}' is not defined in value set '{}'", text, vref->name.str()))
        .with_code(RuleCode::UndefinedReference);
    }
    return;
  }

  if (const auto * sv = std::get_if<schema::ScopeValue>(&rule.value)) {
    const ScopeResolution res = resolve_scope_path(text, scopes_.current(), schema_);
    if (!res.ok) {
      diags.report(sev, s.range, res.error).with_code(RuleCode::ScopeMismatch);
    } else if (sv->group) {
      // An undeclared group only checks that the path resolves.
      const schema::ScopeGroupDef * group = schema_.find_scope_group(sv->scope);
      if (group == nullptr) {
        return;
      }
      std::vector<Symbol> members;
      for (const Symbol m : group->members) {
        if (const Symbol c = canonical(m); !c.empty()) {
          members.push_back(c);
        }
      }
      if (!scope_satisfies_any(res.scope, members)) {
        std::vector<std::string> names;
        for (const Symbol m : group->members) {
          names.emplace_back(m.str());
        }
        diags
          .report(
            sev, s.range,
            fmt::format(
              "expected a scope from group '{}' ({}), found {}", group->name.str(),
              fmt::join(names, ", "), scope_name(res.scope)))
          .with_code(RuleCode::ScopeMismatch);
      }
    } else if (!scope_satisfies(res.scope, canonical(sv->scope))) {
      diags
        .report(
          sev, s.range,
          fmt::format("expected a {} scope, found {}", sv->scope.str(), scope_name(res.scope)))
        .with_code(RuleCode::ScopeMismatch);
    }
    return;
  }

  if (const auto * keys = std::get_if<schema::AliasKeysFieldValue>(&rule.value)) {
    const schema::AliasGroup * group = schema_.find_alias_group(keys->group.folded());
    if (group == nullptr) {
      return;
    }
    const bool known = std::any_of(group->members.begin(), group->members.end(), [&](const auto & m) {
      const auto * lit = m.key ? std::get_if<schema::LiteralKey>(&*m.key) : nullptr;
      return lit != nullptr && iequals(lit->text.str(), text);
    });
    if (!known) {
      diags
        .report(sev, s.range, fmt::format("'{}' is not a known {} alias", text, keys->group.str()))
        .with_code(RuleCode::UnresolvedAlias);
    }
    return;
  }

  // value_set[x] declarations and alias_match_left values accept any scalar.
}

// ============================================================================
// Reporting
// ============================================================================

void Validator::check_scope_restriction(
  const schema::SchemaRule & rule, SourceRange where, DiagnosticBag & diags)
{
  if (rule.options.scope.empty()) {
    return;
  }
  std::vector<Symbol> required;
  std::vector<std::string> names;
  for (const auto scope : rule.options.scope) {
    required.push_back(canonical(scope));
    names.emplace_back(scope.str());
  }
  const Symbol actual = scopes_.current().this_scope;
  if (scope_satisfies_any(actual, required)) {
    return;
  }
  diags
    .report(
      rule.options.severity.value_or(Severity::Error), where,
      fmt::format("'{}' is not valid in {} scope", display_key(rule), scope_name(actual)),
      fmt::format("expected {}", join(names, " or ")))
    .with_code(RuleCode::ScopeMismatch);
}

void Validator::report_cardinality(const RuleGroup & group, SourceRange owner, DiagnosticBag & diags)
{
  const schema::Cardinality & card = group.cardinality;
  if (card.allows(group.count)) {
    return;
  }
  const schema::SchemaRule & rule = *group.rules.front();
  const std::string name = display_key(rule);
  const Severity sev = card.soft ? Severity::Warning : rule.options.severity.value_or(Severity::Error);

  if (group.count == 0 && !group.explicit_cardinality) {
    diags.report(sev, owner, fmt::format("missing required key '{}'", name), "required here")
      .with_code(RuleCode::MissingRequiredKey);
    return;
  }

  SourceRange where = owner;
  if (card.max && group.count > *card.max) {
    where = group.occurrences[*card.max];
  }
  diags
    .report(
      sev, where,
      fmt::format(
        "'{}' occurs {} time{}, expected {}", name, group.count, group.count == 1 ? "" : "s",
        card.to_string()))
    .with_code(RuleCode::CardinalityViolation)
    .with_cardinality(CardinalityDetail{group.count, card.min, card.max});
}

void Validator::report_unexpected(const Entry & e, const MergedRules & merged, DiagnosticBag & diags)
{
  if (ctx_.options.unexpected_keys == UnexpectedKeyPolicy::Ignore) {
    return;
  }
  const Severity sev =
    ctx_.options.unexpected_keys == UnexpectedKeyPolicy::Warning ? Severity::Warning : Severity::Error;

  if (merged.alias_slot) {
    std::vector<std::string> groups;
    for (const auto & group : merged.groups) {
      for (const auto * rule : group.rules) {
        if (const auto * slot = std::get_if<schema::AliasNameKey>(&*rule->key)) {
          const std::string g(slot->group.str());
          if (std::find(groups.begin(), groups.end(), g) == groups.end()) {
            groups.push_back(g);
          }
        }
      }
    }
    diags
      .report(sev, e.key.range, fmt::format("'{}' is not a known {} alias", e.key.str(), join(groups, " or ")))
      .with_code(RuleCode::UnresolvedAlias);
    return;
  }

  auto builder = diags.report(sev, e.key.range, fmt::format("unexpected key '{}'", e.key.str()));
  builder.with_code(RuleCode::UnexpectedKey);
  if (!merged.literal.empty() && merged.literal.size() <= 8) {
    std::vector<std::string> keys;
    for (const auto & group : merged.groups) {
      const auto * rule = group.rules.front();
      if (std::holds_alternative<schema::LiteralKey>(*rule->key)) {
        keys.push_back(display_key(*rule));
      }
    }
    builder.with_help(fmt::format("expected one of: {}", join(keys, ", ")));
  }
}

void Validator::check_localisation(
  const schema::SchemaType & type, Symbol entity_name, SourceRange where, DiagnosticBag & diags)
{
  for (const auto & req : type.localisation) {
    if (!req.required) {
      continue;
    }
    if (req.subtype) {
      const bool matched = std::find(subtypes_.begin(), subtypes_.end(), *req.subtype) != subtypes_.end();
      if (matched == req.subtype_negated) {
        continue;
      }
    }
    const std::string key = req.expand(entity_name.str());
    if (!ctx_.localisation->contains(key)) {
      diags
        .report_error(
          where,
          fmt::format("missing localisation key '{}' for {} '{}'", key, type.name.str(), entity_name.str()),
          fmt::format("{} localisation", req.key.str()))
        .with_code(RuleCode::MissingLocalisationKey);
    }
  }
}

// ============================================================================
// Lookups
// ============================================================================

Symbol Validator::canonical(Symbol scope) const { return schema_.canonical_scope(scope); }

std::optional<bool> Validator::enum_contains(Symbol name, std::string_view text)
{
  if (const auto * def = schema_.find_enum(name)) {
    return std::any_of(def->values.begin(), def->values.end(), [&](Symbol v) { return v.str() == text; });
  }
  if (schema_.find_complex_enum(name) != nullptr) {
    referenced_.insert(SymbolGroup{SymbolKind::ComplexEnumMember, name.folded()});
    if (ctx_.symbols == nullptr) {
      return std::nullopt;
    }
    const Symbol sym = find_symbol(text);
    return !sym.empty() && ctx_.symbols->contains(SymbolKind::ComplexEnumMember, name, sym);
  }
  return std::nullopt;
}

bool Validator::value_known(Symbol set, std::string_view text)
{
  if (const auto * predefined = schema_.find_value_set(set)) {
    if (std::any_of(predefined->values.begin(), predefined->values.end(), [&](Symbol v) {
          return iequals(v.str(), text);
        })) {
      return true;
    }
  }
  referenced_.insert(SymbolGroup{SymbolKind::ValueSetMember, set.folded()});
  if (ctx_.symbols == nullptr) {
    return false;
  }
  const Symbol sym = find_symbol(text);
  return !sym.empty() && ctx_.symbols->contains(SymbolKind::ValueSetMember, set, sym);
}

void Validator::check_unique(
  const schema::SchemaType & type, Symbol name, SourceRange where, DiagnosticBag & diags)
{
  referenced_.insert(SymbolGroup{SymbolKind::TypeInstance, type.name.folded()});
  if (ctx_.symbols == nullptr || name.empty()) {
    return;
  }
  const auto locations = ctx_.symbols->lookup(SymbolKind::TypeInstance, type.name, name);
  const auto other = std::find_if(locations.begin(), locations.end(), [&](const SymbolLocation & loc) {
    return loc.range != where;
  });
  if (other == locations.end()) {
    return;
  }
  diags
    .report_error(where, fmt::format("duplicate {} '{}'", type.name.str(), name.str()), "defined here")
    .with_code(RuleCode::DuplicateDefinition)
    .with_secondary_label(other->range, "also defined here");
}

bool Validator::type_instance_known(
  Symbol type, std::string_view prefix, std::string_view suffix, std::string_view text)
{
  referenced_.insert(SymbolGroup{SymbolKind::TypeInstance, type.folded()});
  if (ctx_.symbols == nullptr) {
    return false;
  }
  const auto name = strip_affixes(text, prefix, suffix);
  if (!name) {
    return false;
  }
  const Symbol sym = find_symbol(*name);
  return !sym.empty() && ctx_.symbols->contains(SymbolKind::TypeInstance, type, sym);
}

}  // namespace cwcheck::sema
