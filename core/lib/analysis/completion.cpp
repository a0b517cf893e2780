// cwcheck/analysis/completion.cpp - Schema-driven completion candidates
#include "cwcheck/analysis/completion.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <utility>

#include "cwcheck/sema/symbol_extractor.hpp"

namespace cwcheck::analysis
{

namespace
{

bool is_word_char(unsigned char c)
{
  return std::isalnum(c) != 0 || c == '_' || c == '.' || c == ':' || c == '@' || c == '-';
}

bool strictly_inside(SourceRange r, uint32_t offset)
{
  return r.is_valid() && r.begin_offset() < offset && offset < r.end_offset();
}

class Collector
{
public:
  Collector(const schema::SchemaSnapshot & snap, const sema::SymbolIndex & index, std::vector<Symbol> subtypes)
  : snap_(snap), index_(index), subtypes_(std::move(subtypes))
  {
  }

  void applicable(const schema::RuleBlock & rules, std::vector<const schema::SchemaRule *> & out) const
  {
    for (const auto & r : rules.rules) {
      out.push_back(&r);
    }
    for (const auto & sb : rules.subtype_blocks) {
      const bool matched = std::find(subtypes_.begin(), subtypes_.end(), sb.name) != subtypes_.end();
      if (matched != sb.negated) {
        applicable(*sb.block, out);
      }
    }
  }

  /// Rules that could govern `key` inside `rules`.
  [[nodiscard]] std::vector<const schema::SchemaRule *> rules_for(const schema::RuleBlock & rules, Symbol key) const
  {
    std::vector<const schema::SchemaRule *> flat;
    applicable(rules, flat);

    std::vector<const schema::SchemaRule *> literal;
    std::vector<const schema::SchemaRule *> pattern;
    for (const auto * rule : flat) {
      if (!rule->key) {
        continue;
      }
      if (const auto * lit = std::get_if<schema::LiteralKey>(&*rule->key)) {
        if (lit->text.folded() == key.folded()) {
          literal.push_back(rule);
        }
      } else if (const auto * slot = std::get_if<schema::AliasNameKey>(&*rule->key)) {
        if (const auto * group = snap_.find_alias_group(slot->group.folded())) {
          for (const auto & member : group->members) {
            const auto * mk = std::get_if<schema::LiteralKey>(&*member.key);
            if (mk != nullptr && mk->text.folded() == key.folded()) {
              literal.push_back(&member);
            }
          }
        }
      } else {
        pattern.push_back(rule);
      }
    }
    return literal.empty() ? pattern : literal;
  }

  [[nodiscard]] const schema::RuleBlock * nested_block(const schema::SchemaRule & rule) const
  {
    if (const auto * single = std::get_if<schema::SingleAliasValue>(&rule.value)) {
      const auto * target = snap_.resolve_single_alias(single->name.folded());
      return target ? schema::as_rule_block(target->value) : nullptr;
    }
    return schema::as_rule_block(rule.value);
  }

  void add(std::string label, CompletionKind kind, std::string detail)
  {
    if (label.empty() || !seen_.insert(ascii_lower(label)).second) {
      return;
    }
    items_.push_back(CompletionItem{std::move(label), kind, std::move(detail)});
  }

  void add_names(sema::SymbolKind kind, Symbol group, std::string_view prefix, std::string_view suffix)
  {
    for (const auto name : index_.names(kind, group)) {
      add(fmt_affix(prefix, name.str(), suffix), CompletionKind::Reference, std::string(group.str()));
    }
  }

  void keys(const schema::RuleBlock & rules, const Block & block)
  {
    std::vector<const schema::SchemaRule *> flat;
    applicable(rules, flat);
    for (const auto * rule : flat) {
      if (!rule->key) {
        continue;
      }
      if (const auto * lit = std::get_if<schema::LiteralKey>(&*rule->key)) {
        const auto card = rule->options.effective_cardinality();
        const auto present = block.find_all(lit->text.str()).size();
        if (card.max && present >= *card.max) {
          continue;
        }
        add(std::string(lit->text.str()), CompletionKind::Key, schema::describe(rule->value));
      } else if (const auto * slot = std::get_if<schema::AliasNameKey>(&*rule->key)) {
        if (const auto * group = snap_.find_alias_group(slot->group.folded())) {
          for (const auto & member : group->members) {
            if (const auto * mk = std::get_if<schema::LiteralKey>(&*member.key)) {
              add(std::string(mk->text.str()), CompletionKind::Key, fmt_alias(slot->group));
            }
          }
        }
      } else if (const auto * ref = std::get_if<schema::TypeRefKey>(&*rule->key)) {
        add_names(sema::SymbolKind::TypeInstance, ref->type, ref->prefix, ref->suffix);
      } else if (const auto * en = std::get_if<schema::EnumKey>(&*rule->key)) {
        enum_values(en->name);
      }
    }
  }

  void values(const schema::SchemaRule & rule)
  {
    const schema::RuleValue & v = rule.value;
    if (const auto * lit = std::get_if<schema::LiteralValue>(&v)) {
      add(std::string(lit->text.str()), CompletionKind::EnumMember, {});
    } else if (const auto * simple = std::get_if<schema::SimpleValue>(&v)) {
      if (simple->type == schema::SimpleType::Bool) {
        add("yes", CompletionKind::Keyword, "bool");
        add("no", CompletionKind::Keyword, "bool");
      } else if (simple->type == schema::SimpleType::ScopeField) {
        scope_keywords();
      }
    } else if (const auto * en = std::get_if<schema::EnumValue>(&v)) {
      enum_values(en->name);
    } else if (const auto * ref = std::get_if<schema::TypeRefValue>(&v)) {
      add_names(sema::SymbolKind::TypeInstance, ref->type, ref->prefix, ref->suffix);
    } else if (const auto * vref = std::get_if<schema::ValueRefValue>(&v)) {
      if (const auto * predefined = snap_.find_value_set(vref->name)) {
        for (const auto value : predefined->values) {
          add(std::string(value.str()), CompletionKind::EnumMember, std::string(vref->name.str()));
        }
      }
      add_names(sema::SymbolKind::ValueSetMember, vref->name, {}, {});
    } else if (std::holds_alternative<schema::ScopeValue>(v)) {
      scope_keywords();
    } else if (const auto * keys_field = std::get_if<schema::AliasKeysFieldValue>(&v)) {
      if (const auto * group = snap_.find_alias_group(keys_field->group.folded())) {
        for (const auto & member : group->members) {
          if (const auto * mk = std::get_if<schema::LiteralKey>(&*member.key)) {
            add(std::string(mk->text.str()), CompletionKind::Reference, fmt_alias(keys_field->group));
          }
        }
      }
    } else if (const auto * single = std::get_if<schema::SingleAliasValue>(&v)) {
      if (const auto * target = snap_.resolve_single_alias(single->name.folded())) {
        values(*target);
      }
    }
  }

  [[nodiscard]] std::vector<CompletionItem> take() { return std::move(items_); }

private:
  static std::string fmt_affix(std::string_view prefix, std::string_view name, std::string_view suffix)
  {
    std::string out(prefix);
    out += name;
    out += suffix;
    return out;
  }

  static std::string fmt_alias(Symbol group) { return "alias_name[" + std::string(group.str()) + "]"; }

  void enum_values(Symbol name)
  {
    if (const auto * def = snap_.find_enum(name)) {
      for (const auto value : def->values) {
        add(std::string(value.str()), CompletionKind::EnumMember, std::string(name.str()));
      }
      return;
    }
    add_names(sema::SymbolKind::ComplexEnumMember, name, {}, {});
  }

  void scope_keywords()
  {
    for (const char * kw : {"this", "root", "prev", "from"}) {
      add(kw, CompletionKind::Keyword, "scope");
    }
    for (const auto & link : snap_.links()) {
      if (link.prefix.empty()) {
        add(std::string(link.name.str()), CompletionKind::Keyword, "link");
      }
    }
  }

  const schema::SchemaSnapshot & snap_;
  const sema::SymbolIndex & index_;
  std::vector<Symbol> subtypes_;
  std::vector<CompletionItem> items_;
  std::unordered_set<std::string> seen_;
};

}  // namespace

std::vector<CompletionItem> complete(
  const Block & root, std::string_view text, std::string_view relative_path, uint32_t offset,
  const schema::SchemaSnapshot & snap, const sema::SymbolIndex & index)
{
  offset = std::min<uint32_t>(offset, static_cast<uint32_t>(text.size()));

  const sema::Entity * entity = nullptr;
  const auto entities = sema::find_entities(root, relative_path, snap);
  for (const auto & ent : entities) {
    if (ent.body == nullptr) {
      continue;
    }
    if (ent.entry == nullptr || strictly_inside(ent.body->range, offset)) {
      entity = &ent;
      if (ent.entry != nullptr) {
        break;
      }
    }
  }
  if (entity == nullptr || !entity->type->has_shape) {
    return {};
  }

  const Symbol entity_key = entity->entry ? entity->entry->key.text : entity->name;
  Collector collector(snap, index, sema::match_subtypes(*entity->type, entity_key, *entity->body));

  // Descend to the innermost block around the cursor.
  const schema::RuleBlock * rules = &entity->type->shape;
  const Block * block = entity->body;
  for (;;) {
    const Entry * inner = nullptr;
    for (const auto & e : block->entries) {
      const Block * b = as_block(e.value);
      if (b != nullptr && strictly_inside(b->range, offset)) {
        inner = &e;
        break;
      }
    }
    if (inner == nullptr) {
      break;
    }
    const schema::RuleBlock * next = nullptr;
    for (const auto * rule : collector.rules_for(*rules, inner->key.text)) {
      if ((next = collector.nested_block(*rule)) != nullptr) {
        break;
      }
    }
    if (next == nullptr) {
      return {};
    }
    rules = next;
    block = as_block(inner->value);
  }

  // Key or value position: look behind the word under the cursor.
  uint32_t word_start = offset;
  while (word_start > 0 && is_word_char(static_cast<unsigned char>(text[word_start - 1]))) {
    --word_start;
  }
  uint32_t p = word_start;
  while (p > 0 && (text[p - 1] == ' ' || text[p - 1] == '\t')) {
    --p;
  }
  const bool value_position = p > 0 && (text[p - 1] == '=' || text[p - 1] == '<' || text[p - 1] == '>');

  if (!value_position) {
    collector.keys(*rules, *block);
    return collector.take();
  }

  // The key is the word in front of the operator; the entry itself may not
  // have survived parsing yet.
  uint32_t key_end = p - 1;
  while (key_end > 0 && (text[key_end - 1] == '<' || text[key_end - 1] == '>' || text[key_end - 1] == '!' ||
                         text[key_end - 1] == ' ' || text[key_end - 1] == '\t')) {
    --key_end;
  }
  uint32_t key_start = key_end;
  while (key_start > 0 && is_word_char(static_cast<unsigned char>(text[key_start - 1]))) {
    --key_start;
  }
  if (key_start == key_end) {
    return {};
  }
  const Symbol key = intern(text.substr(key_start, key_end - key_start));
  for (const auto * rule : collector.rules_for(*rules, key)) {
    collector.values(*rule);
  }
  return collector.take();
}

}  // namespace cwcheck::analysis
