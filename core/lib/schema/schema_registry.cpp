// cwcheck/schema/schema_registry.cpp - Immutable schema snapshots
#include "cwcheck/schema/schema_registry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <set>
#include <type_traits>
#include <unordered_set>

#include "cwcheck/basic/log.hpp"
#include "cwcheck/schema/schema_parser.hpp"

namespace cwcheck::schema
{

namespace
{

const std::vector<const SchemaRule *> k_no_members;

template <typename T>
const T * lookup(const std::vector<T> & items, const std::unordered_map<Symbol, size_t> & index, Symbol key)
{
  const auto it = index.find(key);
  return it == index.end() ? nullptr : &items[it->second];
}

bool is_any(Symbol s) { return s == intern("any"); }

}  // namespace

// ============================================================================
// merge_fragments
// ============================================================================

SchemaFragment merge_fragments(std::vector<SchemaFragment> fragments, DiagnosticBag & diags)
{
  SchemaFragment out;
  std::unordered_map<Symbol, size_t> type_at;
  std::unordered_map<Symbol, size_t> enum_at;

  const auto move_into = [](auto & dst, auto & src) {
    dst.insert(dst.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
  };

  for (auto & frag : fragments) {
    for (auto & type : frag.types) {
      const Symbol key = type.name.folded();
      if (type_at.contains(key)) {
        diags.report_warning(type.range, fmt::format("type '{}' is declared more than once", type.name.str()))
          .with_code(RuleCode::SchemaError)
          .with_secondary_label(out.types[type_at[key]].range, "first declared here");
        continue;
      }
      type_at.emplace(key, out.types.size());
      out.types.push_back(std::move(type));
    }
    for (auto & def : frag.enums) {
      const Symbol key = def.name.folded();
      if (const auto it = enum_at.find(key); it != enum_at.end()) {
        auto & values = out.enums[it->second].values;
        for (const Symbol v : def.values) {
          if (std::find(values.begin(), values.end(), v) == values.end()) {
            values.push_back(v);
          }
        }
        continue;
      }
      enum_at.emplace(key, out.enums.size());
      out.enums.push_back(std::move(def));
    }
    move_into(out.shapes, frag.shapes);
    move_into(out.shape_options, frag.shape_options);
    move_into(out.complex_enums, frag.complex_enums);
    move_into(out.aliases, frag.aliases);
    move_into(out.single_aliases, frag.single_aliases);
    move_into(out.scopes, frag.scopes);
    move_into(out.scope_groups, frag.scope_groups);
    move_into(out.links, frag.links);
    move_into(out.value_sets, frag.value_sets);
  }

  for (auto & [name, block] : out.shapes) {
    const auto it = type_at.find(name);
    if (it == type_at.end()) {
      const SourceRange where = block.rules.empty() ? SourceRange{} : block.rules.front().range;
      diags.report_warning(where, fmt::format("rules given for undeclared type '{}'", name.str()))
        .with_code(RuleCode::SchemaError);
      continue;
    }
    SchemaType & type = out.types[it->second];
    if (!type.has_shape) {
      type.shape = std::move(block);
      type.has_shape = true;
      continue;
    }
    move_into(type.shape.rules, block.rules);
    move_into(type.shape.subtype_blocks, block.subtype_blocks);
  }
  out.shapes.clear();

  for (auto & [name, options] : out.shape_options) {
    const auto it = type_at.find(name);
    if (it == type_at.end()) {
      continue;
    }
    RuleOptions & target = out.types[it->second].options;
    if (options.push_scope) {
      target.push_scope = options.push_scope;
    }
    if (!options.replace_scope.empty()) {
      target.replace_scope = std::move(options.replace_scope);
    }
    if (!options.scope.empty()) {
      target.scope = std::move(options.scope);
    }
  }
  out.shape_options.clear();
  return out;
}

// ============================================================================
// SchemaSnapshot
// ============================================================================

SchemaSnapshot::SchemaSnapshot(SchemaFragment merged, uint64_t generation)
: generation_(generation),
  types_(std::move(merged.types)),
  enums_(std::move(merged.enums)),
  complex_enums_(std::move(merged.complex_enums)),
  value_sets_(std::move(merged.value_sets)),
  single_aliases_(std::move(merged.single_aliases)),
  scopes_(std::move(merged.scopes)),
  scope_groups_(std::move(merged.scope_groups)),
  links_(std::move(merged.links))
{
  for (size_t i = 0; i < types_.size(); ++i) {
    type_index_.emplace(types_[i].name.folded(), i);
  }
  for (size_t i = 0; i < enums_.size(); ++i) {
    enum_index_.emplace(enums_[i].name.folded(), i);
  }
  for (size_t i = 0; i < complex_enums_.size(); ++i) {
    complex_enum_index_.emplace(complex_enums_[i].name.folded(), i);
  }
  for (size_t i = 0; i < value_sets_.size(); ++i) {
    value_set_index_.emplace(value_sets_[i].name.folded(), i);
  }
  for (size_t i = 0; i < single_aliases_.size(); ++i) {
    single_alias_index_.emplace(single_aliases_[i].first, i);
  }
  for (auto & [group, member] : merged.aliases) {
    auto [it, inserted] = alias_index_.emplace(group, aliases_.size());
    if (inserted) {
      aliases_.push_back(AliasGroup{group, {}});
    }
    aliases_[it->second].members.push_back(std::move(member));
  }
  for (const auto & scope : scopes_) {
    const Symbol canonical = scope.aliases.empty() ? scope.name.folded() : scope.aliases.front();
    scope_index_.emplace(scope.name.folded(), canonical);
    for (const Symbol alias : scope.aliases) {
      scope_index_.emplace(alias, canonical);
    }
  }
  for (size_t i = 0; i < scope_groups_.size(); ++i) {
    scope_group_index_.emplace(scope_groups_[i].name.folded(), i);
  }
  for (size_t i = 0; i < links_.size(); ++i) {
    link_index_.emplace(links_[i].name, i);
  }
}

const SchemaType * SchemaSnapshot::find_type(Symbol name) const
{
  return lookup(types_, type_index_, name.folded());
}

std::vector<const SchemaType *> SchemaSnapshot::types_for_path(std::string_view relative_path) const
{
  std::vector<const SchemaType *> out;
  for (const auto & type : types_) {
    if (type.matches_path(relative_path)) {
      out.push_back(&type);
    }
  }
  return out;
}

const EnumDef * SchemaSnapshot::find_enum(Symbol name) const
{
  return lookup(enums_, enum_index_, name.folded());
}

const ComplexEnumDef * SchemaSnapshot::find_complex_enum(Symbol name) const
{
  return lookup(complex_enums_, complex_enum_index_, name.folded());
}

const EnumDef * SchemaSnapshot::find_value_set(Symbol name) const
{
  return lookup(value_sets_, value_set_index_, name.folded());
}

const AliasGroup * SchemaSnapshot::find_alias_group(Symbol folded_group) const
{
  return lookup(aliases_, alias_index_, folded_group);
}

const SchemaRule * SchemaSnapshot::find_single_alias(Symbol folded_name) const
{
  const auto it = single_alias_index_.find(folded_name);
  return it == single_alias_index_.end() ? nullptr : &single_aliases_[it->second].second;
}

const SchemaRule * SchemaSnapshot::resolve_single_alias(Symbol folded_name) const
{
  Symbol name = folded_name;
  for (uint32_t depth = 0; depth < k_max_expansion_depth; ++depth) {
    const SchemaRule * rule = find_single_alias(name);
    if (rule == nullptr) {
      return nullptr;
    }
    const auto * next = std::get_if<SingleAliasValue>(&rule->value);
    if (next == nullptr) {
      return rule;
    }
    name = next->name;
  }
  throw EngineError(fmt::format(
    "single alias '{}' exceeds the expansion bound of {}", folded_name.str(), k_max_expansion_depth));
}

const std::vector<const SchemaRule *> & SchemaSnapshot::expand_alias(
  Symbol folded_group, uint32_t site_rule_id, Symbol folded_key) const
{
  const AliasGroup * group = find_alias_group(folded_group);
  if (group == nullptr) {
    return k_no_members;
  }

  const ExpansionKey key{folded_group, site_rule_id, folded_key};
  std::lock_guard lock(expansion_mutex_);
  if (const auto it = expansions_.find(key); it != expansions_.end()) {
    return it->second;
  }

  std::vector<const SchemaRule *> literal;
  std::vector<const SchemaRule *> pattern;
  for (const auto & member : group->members) {
    if (const auto * lit = std::get_if<LiteralKey>(&*member.key)) {
      if (lit->text.folded() == folded_key) {
        literal.push_back(&member);
      }
    } else {
      pattern.push_back(&member);
    }
  }
  auto & slot = expansions_[key];
  slot = literal.empty() ? std::move(pattern) : std::move(literal);
  return slot;
}

size_t SchemaSnapshot::expansion_cache_size() const
{
  std::lock_guard lock(expansion_mutex_);
  return expansions_.size();
}

Symbol SchemaSnapshot::canonical_scope(Symbol name) const
{
  const Symbol folded = name.folded();
  if (scopes_.empty() || is_any(folded)) {
    return folded;
  }
  const auto it = scope_index_.find(folded);
  return it == scope_index_.end() ? Symbol{} : it->second;
}

const ScopeGroupDef * SchemaSnapshot::find_scope_group(Symbol name) const
{
  return lookup(scope_groups_, scope_group_index_, name.folded());
}

const LinkDef * SchemaSnapshot::find_link(Symbol folded_name) const
{
  return lookup(links_, link_index_, folded_name);
}

// ============================================================================
// Checks
// ============================================================================

namespace
{

class ReferenceChecker
{
public:
  ReferenceChecker(const SchemaSnapshot & snap, DiagnosticBag & diags) : snap_(snap), diags_(diags) {}

  void check(const SchemaRule & rule)
  {
    if (rule.key) {
      std::visit([&](const auto & k) { check_key(k, rule.range); }, *rule.key);
    }
    std::visit([&](const auto & v) { check_value(v, rule.range); }, rule.value);
  }

private:
  void warn_once(SourceRange range, std::string kind, Symbol name)
  {
    const std::string id = kind + ":" + ascii_lower(name.str());
    if (!reported_.insert(id).second) {
      return;
    }
    diags_.report_warning(range, fmt::format("undefined {} '{}'", kind, name.str()))
      .with_code(RuleCode::SchemaError);
  }

  void type_ref(Symbol type, SourceRange range)
  {
    if (snap_.find_type(type) == nullptr) warn_once(range, "type", type);
  }
  void enum_ref(Symbol name, SourceRange range)
  {
    if (snap_.find_enum(name) == nullptr && snap_.find_complex_enum(name) == nullptr) {
      warn_once(range, "enum", name);
    }
  }
  void group_ref(Symbol group, SourceRange range)
  {
    if (snap_.find_alias_group(group) == nullptr) warn_once(range, "alias group", group);
  }

  void check_key(const TypeRefKey & k, SourceRange r) { type_ref(k.type, r); }
  void check_key(const EnumKey & k, SourceRange r) { enum_ref(k.name, r); }
  void check_key(const AliasNameKey & k, SourceRange r) { group_ref(k.group, r); }
  template <typename K>
  void check_key(const K &, SourceRange)
  {
  }

  void check_value(const TypeRefValue & v, SourceRange r) { type_ref(v.type, r); }
  void check_value(const EnumValue & v, SourceRange r) { enum_ref(v.name, r); }
  void check_value(const AliasMatchLeftValue & v, SourceRange r) { group_ref(v.group, r); }
  void check_value(const AliasKeysFieldValue & v, SourceRange r) { group_ref(v.group, r); }
  void check_value(const SingleAliasValue & v, SourceRange r)
  {
    if (snap_.find_single_alias(v.name) == nullptr) warn_once(r, "single alias", v.name);
  }
  template <typename V>
  void check_value(const V &, SourceRange)
  {
  }

  const SchemaSnapshot & snap_;
  DiagnosticBag & diags_;
  std::unordered_set<std::string> reported_;
};

// Node ids for the productivity graph: alias groups and single aliases.
struct AliasNode
{
  bool single = false;
  Symbol name;

  [[nodiscard]] auto operator<=>(const AliasNode &) const = default;
};

class Productivity
{
public:
  explicit Productivity(const SchemaSnapshot & snap) : snap_(snap) {}

  /// Aliases a member needs in order to produce a finite match.
  void member_requirements(const SchemaRule & member, std::set<AliasNode> & out) const
  {
    value_requirements(member.value, out);
  }

  bool defined(const AliasNode & n) const
  {
    return n.single ? snap_.find_single_alias(n.name) != nullptr
                    : snap_.find_alias_group(n.name) != nullptr;
  }

private:
  void value_requirements(const RuleValue & value, std::set<AliasNode> & out) const
  {
    if (const auto * m = std::get_if<AliasMatchLeftValue>(&value)) {
      out.insert({false, m->group});
    } else if (const auto * s = std::get_if<SingleAliasValue>(&value)) {
      out.insert({true, s->name});
    } else if (const auto * b = as_rule_block(value)) {
      for (const auto & rule : b->rules) {
        if (rule.options.effective_cardinality().min >= 1) {
          value_requirements(rule.value, out);
        }
      }
    }
  }

  const SchemaSnapshot & snap_;
};

}  // namespace

void check_references(const SchemaSnapshot & snapshot, DiagnosticBag & diags)
{
  ReferenceChecker checker(snapshot, diags);
  const auto visit = [&](const SchemaRule & r) { checker.check(r); };
  const auto visit_tree = [&](const SchemaRule & r) {
    visit(r);
    if (const auto * b = as_rule_block(r.value)) {
      for_each_rule(*b, visit);
    }
  };
  for (const auto & type : snapshot.types()) {
    for_each_rule(type.shape, visit);
    for (const auto & st : type.subtypes) {
      for_each_rule(st.predicate, visit);
    }
  }
  for (const auto & group : snapshot.alias_groups()) {
    for (const auto & member : group.members) {
      visit_tree(member);
    }
  }
  for (const auto & [name, rule] : snapshot.single_aliases()) {
    visit_tree(rule);
  }
}

void check_alias_productivity(const SchemaSnapshot & snapshot, DiagnosticBag & diags)
{
  const Productivity prod(snapshot);

  struct Candidate
  {
    AliasNode node;
    const SchemaRule * rule;
    std::set<AliasNode> needs;
  };

  std::vector<Candidate> candidates;
  std::vector<AliasNode> nodes;

  const auto add = [&](AliasNode node, const SchemaRule & rule) {
    Candidate c{node, &rule, {}};
    prod.member_requirements(rule, c.needs);
    // Undefined aliases are reported separately and never block productivity.
    std::erase_if(c.needs, [&](const AliasNode & n) { return !prod.defined(n); });
    candidates.push_back(std::move(c));
  };

  for (const auto & group : snapshot.alias_groups()) {
    nodes.push_back({false, group.name});
    for (const auto & member : group.members) {
      add({false, group.name}, member);
    }
  }
  for (const auto & [name, rule] : snapshot.single_aliases()) {
    nodes.push_back({true, name});
    add({true, name}, rule);
  }

  std::set<AliasNode> productive;
  bool changed = true;
  while (changed) {
    changed = false;
    for (const auto & c : candidates) {
      if (productive.contains(c.node)) {
        continue;
      }
      const bool ready = std::all_of(c.needs.begin(), c.needs.end(), [&](const AliasNode & n) {
        return productive.contains(n);
      });
      if (ready) {
        productive.insert(c.node);
        changed = true;
      }
    }
  }

  for (const auto & node : nodes) {
    if (productive.contains(node)) {
      continue;
    }
    const auto first = std::find_if(candidates.begin(), candidates.end(), [&](const Candidate & c) {
      return c.node == node;
    });
    const SourceRange where = first == candidates.end() ? SourceRange{} : first->rule->range;
    diags
      .report_error(
        where,
        fmt::format(
          "{} '{}' can never terminate: every member requires an alias with no terminating branch",
          node.single ? "single alias" : "alias group", node.name.str()))
      .with_code(RuleCode::SchemaError)
      .with_help("add a member that does not require this alias, or make the recursive rule optional");
  }
}

// ============================================================================
// SchemaRegistry
// ============================================================================

SchemaRegistry::SchemaRegistry() : current_(std::make_shared<const SchemaSnapshot>()) {}

SchemaLoadResult SchemaRegistry::load(SourceRegistry & sources, const std::vector<SchemaSource> & files)
{
  DiagnosticBag diags;
  std::vector<SchemaFragment> fragments;
  fragments.reserve(files.size());

  uint32_t next_rule_id = 1;
  for (const auto & file : files) {
    FileId id;
    if (const auto existing = sources.find_by_path(file.path)) {
      sources.update_content(*existing, file.text);
      id = *existing;
    } else {
      id = sources.register_file(file.path, file.text);
    }
    const SourceFile * source = sources.get_file(id);
    fragments.push_back(parse_schema(id, source->content(), diags, next_rule_id));
  }

  SchemaFragment merged = merge_fragments(std::move(fragments), diags);
  const uint64_t generation = generation_.load(std::memory_order_acquire) + 1;
  auto snap = std::make_shared<const SchemaSnapshot>(std::move(merged), generation);

  check_references(*snap, diags);
  check_alias_productivity(*snap, diags);

  if (diags.has_errors()) {
    log::warn(
      "schema load failed: {} errors in {} files; keeping generation {}", diags.errors().size(),
      files.size(), generation - 1);
    return SchemaLoadResult::fail(diags.take());
  }

  {
    std::unique_lock lock(mutex_);
    current_ = snap;
    generation_.store(generation, std::memory_order_release);
  }
  log::info(
    "schema generation {} installed: {} types, {} files", generation, snap->types().size(),
    files.size());
  return SchemaLoadResult::ok(std::move(snap), diags.take());
}

std::shared_ptr<const SchemaSnapshot> SchemaRegistry::snapshot() const
{
  std::shared_lock lock(mutex_);
  return current_;
}

}  // namespace cwcheck::schema
