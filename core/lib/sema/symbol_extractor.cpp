// cwcheck/sema/symbol_extractor.cpp - Declaration discovery
#include "cwcheck/sema/symbol_extractor.hpp"

#include <algorithm>

#include "cwcheck/sema/value_checker.hpp"

namespace cwcheck::sema
{

namespace
{

constexpr uint32_t k_max_walk_depth = 128;

bool under_any(std::string_view relative_path, const std::vector<std::string> & dirs)
{
  if (relative_path.size() >= 5 && iequals(relative_path.substr(0, 5), "game/")) {
    relative_path.remove_prefix(5);
  }
  return std::any_of(dirs.begin(), dirs.end(), [&](const std::string & d) {
    return relative_path.size() > d.size() && iequals(relative_path.substr(0, d.size()), d) &&
           relative_path[d.size()] == '/';
  });
}

std::string_view file_stem(std::string_view relative_path)
{
  const auto slash = relative_path.rfind('/');
  std::string_view file = slash == std::string_view::npos ? relative_path : relative_path.substr(slash + 1);
  const auto dot = file.rfind('.');
  return dot == std::string_view::npos ? file : file.substr(0, dot);
}

/// Rules of a block plus every subtype-guarded block, flattened.
void flatten(const schema::RuleBlock & block, std::vector<const schema::SchemaRule *> & out)
{
  for (const auto & r : block.rules) {
    out.push_back(&r);
  }
  for (const auto & sb : block.subtype_blocks) {
    flatten(*sb.block, out);
  }
}

bool literal_key_matches(const schema::SchemaRule & rule, Symbol folded_key)
{
  const auto * lit = rule.key ? std::get_if<schema::LiteralKey>(&*rule.key) : nullptr;
  return lit != nullptr && lit->text.folded() == folded_key;
}

bool predicate_holds(const schema::SchemaRule & rule, const Block & body)
{
  const auto * lit = rule.key ? std::get_if<schema::LiteralKey>(&*rule.key) : nullptr;
  if (lit == nullptr) {
    return true;
  }
  const schema::Cardinality card = rule.options.effective_cardinality();
  const auto value_matches = [&](const Entry & e) {
    const auto * s = as_scalar(e.value);
    if (const auto * want = std::get_if<schema::LiteralValue>(&rule.value)) {
      return s != nullptr && iequals(s->str(), want->text.str());
    }
    if (const auto * simple = std::get_if<schema::SimpleValue>(&rule.value)) {
      return s != nullptr && check_simple(s->str(), *simple).ok();
    }
    return true;
  };

  uint32_t count = 0;
  for (const auto & e : body.entries) {
    if (e.key.folded() == lit->text.folded() && value_matches(e)) {
      ++count;
    }
  }
  if (card.max && *card.max == 0) {
    return count == 0;
  }
  return card.min == 0 || count >= 1;
}

}  // namespace

// ============================================================================
// Entities
// ============================================================================

std::vector<Symbol> match_subtypes(const schema::SchemaType & type, Symbol entity_key, const Block & body)
{
  std::vector<Symbol> out;
  for (const auto & st : type.subtypes) {
    const auto & opts = st.options;
    if (!opts.type_key_filter.empty()) {
      const bool listed = std::find(opts.type_key_filter.begin(), opts.type_key_filter.end(),
                                    entity_key.folded()) != opts.type_key_filter.end();
      if (listed == opts.type_key_filter_negated) {
        continue;
      }
    }
    if (!opts.starts_with.empty()) {
      const std::string_view key = entity_key.str();
      if (key.size() < opts.starts_with.size() ||
          !iequals(key.substr(0, opts.starts_with.size()), opts.starts_with)) {
        continue;
      }
    }
    const bool holds = std::all_of(st.predicate.rules.begin(), st.predicate.rules.end(), [&](const auto & r) {
      return predicate_holds(r, body);
    });
    if (holds) {
      out.push_back(st.name);
    }
  }
  return out;
}

std::vector<Entity> find_entities(
  const Block & root, std::string_view relative_path, const schema::SchemaSnapshot & snap)
{
  std::vector<Entity> out;
  const auto types = snap.types_for_path(relative_path);
  if (types.empty()) {
    return out;
  }

  for (const auto * type : types) {
    if (type->type_per_file) {
      const std::string_view stem = file_stem(relative_path);
      out.push_back(Entity{type, nullptr, &root, intern(stem), root.range});
    }
  }

  const auto entity_from = [&](const Entry & e) -> std::optional<Entity> {
    const Block * body = as_block(e.value);
    for (const auto * type : types) {
      if (type->type_per_file || !type->accepts_key(e.key.str())) {
        continue;
      }
      Entity ent{type, &e, body, e.key.text, e.key.range};
      if (type->name_field) {
        const Entry * field = body ? body->find(type->name_field->str()) : nullptr;
        const Scalar * s = field ? as_scalar(field->value) : nullptr;
        if (s == nullptr) {
          continue;
        }
        ent.name = s->text;
        ent.name_range = s->range;
      }
      return ent;
    }
    return std::nullopt;
  };

  for (const auto & e : root.entries) {
    const schema::SchemaType * skipping = nullptr;
    for (const auto * type : types) {
      if (type->skip_root_key &&
          (iequals(*type->skip_root_key, "any") || iequals(*type->skip_root_key, e.key.str()))) {
        skipping = type;
        break;
      }
    }
    if (skipping != nullptr) {
      if (const auto * inner = as_block(e.value)) {
        for (const auto & ie : inner->entries) {
          if (auto ent = entity_from(ie)) {
            out.push_back(*ent);
          }
        }
      }
      continue;
    }
    if (auto ent = entity_from(e)) {
      out.push_back(*ent);
    }
  }
  return out;
}

// ============================================================================
// SymbolExtractor
// ============================================================================

std::vector<SymbolDecl> SymbolExtractor::extract(const Block & root, std::string_view relative_path) const
{
  std::vector<SymbolDecl> out;

  for (const auto & ent : find_entities(root, relative_path, snap_)) {
    SymbolDecl decl;
    decl.kind = SymbolKind::TypeInstance;
    decl.group = ent.type->name;
    decl.name = ent.name;
    decl.range = ent.name_range;
    if (ent.body != nullptr) {
      const Symbol key = ent.entry ? ent.entry->key.text : ent.name;
      decl.subtypes = match_subtypes(*ent.type, key, *ent.body);
      collect_value_sets(*ent.body, ent.type->shape, out, 0);
    }
    out.push_back(std::move(decl));
  }

  for (const auto & ce : snap_.complex_enums()) {
    if (!under_any(relative_path, ce.paths)) {
      continue;
    }
    if (ce.start_from_root) {
      collect_complex_enum(ce.name_template, root, ce.name, out);
      continue;
    }
    for (const auto & e : root.entries) {
      if (const auto * b = as_block(e.value)) {
        collect_complex_enum(ce.name_template, *b, ce.name, out);
      }
    }
  }
  return out;
}

void SymbolExtractor::collect_value_sets(
  const Block & body, const schema::RuleBlock & rules, std::vector<SymbolDecl> & out,
  uint32_t depth) const
{
  if (depth > k_max_walk_depth) {
    return;
  }
  std::vector<const schema::SchemaRule *> flat;
  flatten(rules, flat);

  const auto declare = [&](Symbol set, const Scalar & s) {
    out.push_back(SymbolDecl{SymbolKind::ValueSetMember, set, s.text, s.range, {}});
  };

  const auto descend = [&](const schema::SchemaRule & rule, const Entry & e) {
    if (const auto * vs = std::get_if<schema::ValueSetValue>(&rule.value)) {
      if (const auto * s = as_scalar(e.value)) {
        declare(vs->name, *s);
      }
    } else if (const auto * nested = schema::as_rule_block(rule.value)) {
      if (const auto * b = as_block(e.value)) {
        collect_value_sets(*b, *nested, out, depth + 1);
      } else if (const auto * a = as_array(e.value)) {
        Block items;
        items.items = a->items;
        collect_value_sets(items, *nested, out, depth + 1);
      }
    } else if (const auto * single = std::get_if<schema::SingleAliasValue>(&rule.value)) {
      if (const auto * target = snap_.resolve_single_alias(single->name)) {
        if (const auto * nested_alias = schema::as_rule_block(target->value)) {
          if (const auto * b = as_block(e.value)) {
            collect_value_sets(*b, *nested_alias, out, depth + 1);
          }
        }
      }
    }
  };

  for (const auto & e : body.entries) {
    const Symbol key = e.key.folded();
    bool literal_hit = false;
    for (const auto * rule : flat) {
      if (literal_key_matches(*rule, key)) {
        literal_hit = true;
        descend(*rule, e);
      }
    }
    if (literal_hit) {
      continue;
    }
    for (const auto * rule : flat) {
      if (!rule->key || std::holds_alternative<schema::LiteralKey>(*rule->key)) {
        continue;
      }
      if (const auto * vk = std::get_if<schema::ValueSetKey>(&*rule->key)) {
        out.push_back(SymbolDecl{SymbolKind::ValueSetMember, vk->name, e.key.text, e.key.range, {}});
        descend(*rule, e);
        continue;
      }
      if (const auto * ak = std::get_if<schema::AliasNameKey>(&*rule->key)) {
        const schema::AliasGroup * group = snap_.find_alias_group(ak->group);
        if (group == nullptr) {
          continue;
        }
        for (const auto & member : group->members) {
          if (literal_key_matches(member, key)) {
            descend(member, e);
          }
        }
        continue;
      }
      descend(*rule, e);
    }
  }

  for (const auto & item : body.items) {
    const auto * s = as_scalar(item);
    if (s == nullptr) {
      continue;
    }
    for (const auto * rule : flat) {
      if (rule->key) {
        continue;
      }
      if (const auto * vs = std::get_if<schema::ValueSetValue>(&rule->value)) {
        declare(vs->name, *s);
      }
    }
  }
}

void SymbolExtractor::collect_complex_enum(
  const Block & tpl, const Block & body, Symbol name, std::vector<SymbolDecl> & out) const
{
  static const Symbol enum_name = intern("enum_name");
  static const Symbol any_key = intern("scalar");

  const auto add = [&](Symbol text, SourceRange range) {
    out.push_back(SymbolDecl{SymbolKind::ComplexEnumMember, name, text, range, {}});
  };

  for (const auto & t : tpl.entries) {
    const Symbol tkey = t.key.folded();
    if (tkey == enum_name) {
      const Block * inner_tpl = as_block(t.value);
      for (const auto & e : body.entries) {
        add(e.key.text, e.key.range);
        if (inner_tpl != nullptr && !inner_tpl->entries.empty()) {
          if (const auto * b = as_block(e.value)) {
            collect_complex_enum(*inner_tpl, *b, name, out);
          }
        }
      }
      continue;
    }
    for (const auto & e : body.entries) {
      if (tkey != any_key && e.key.folded() != tkey) {
        continue;
      }
      if (const auto * tv = as_scalar(t.value); tv != nullptr && tv->text.folded() == enum_name) {
        if (const auto * s = as_scalar(e.value)) {
          add(s->text, s->range);
        }
      } else if (const auto * tb = as_block(t.value)) {
        if (const auto * b = as_block(e.value)) {
          collect_complex_enum(*tb, *b, name, out);
        }
      } else if (const auto * ta = as_array(t.value)) {
        Block wrapper;
        wrapper.items = ta->items;
        if (const auto * b = as_block(e.value)) {
          collect_complex_enum(wrapper, *b, name, out);
        } else if (const auto * a = as_array(e.value)) {
          Block items;
          items.items = a->items;
          collect_complex_enum(wrapper, items, name, out);
        }
      }
    }
  }

  for (const auto & item : tpl.items) {
    const auto * ts = as_scalar(item);
    if (ts == nullptr || ts->text.folded() != enum_name) {
      continue;
    }
    for (const auto & v : body.items) {
      if (const auto * s = as_scalar(v)) {
        add(s->text, s->range);
      }
    }
  }
}

}  // namespace cwcheck::sema
