// cwcheck/schema/schema_parser.cpp - CWT text -> SchemaFragment
#include "cwcheck/schema/schema_parser.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <utility>

#include "cwcheck/schema/directive.hpp"
#include "cwcheck/syntax/lexer.hpp"
#include "cwcheck/syntax/parser.hpp"

namespace cwcheck::schema
{

namespace
{

struct Bracketed
{
  std::string_view head;
  std::string_view arg;
};

/// `head[arg]` -> {head, arg}
std::optional<Bracketed> split_bracket(std::string_view text)
{
  if (text.size() < 3 || text.back() != ']') {
    return std::nullopt;
  }
  const auto open = text.find('[');
  if (open == std::string_view::npos || open == 0) {
    return std::nullopt;
  }
  return Bracketed{text.substr(0, open), text.substr(open + 1, text.size() - open - 2)};
}

struct TypeRefParts
{
  std::string prefix;
  Symbol type;
  std::string suffix;
};

/// `prefix_<type>_suffix`
std::optional<TypeRefParts> split_type_ref(std::string_view text)
{
  const auto lt = text.find('<');
  const auto gt = text.find('>');
  if (lt == std::string_view::npos || gt == std::string_view::npos || gt < lt + 2) {
    return std::nullopt;
  }
  return TypeRefParts{
    std::string(text.substr(0, lt)), intern(text.substr(lt + 1, gt - lt - 1)),
    std::string(text.substr(gt + 1))};
}

std::string normalise_path(std::string_view text)
{
  std::string out(text);
  std::replace(out.begin(), out.end(), '\\', '/');
  std::string_view view = out;
  if (view.size() >= 5 && iequals(view.substr(0, 5), "game/")) {
    view.remove_prefix(5);
  }
  while (!view.empty() && view.back() == '/') {
    view.remove_suffix(1);
  }
  return std::string(view);
}

bool is_yes(const Value & v)
{
  const auto * s = as_scalar(v);
  return s != nullptr && iequals(s->str(), "yes");
}

std::vector<Symbol> scalar_items(const Value & v)
{
  std::vector<Symbol> out;
  if (const auto * s = as_scalar(v)) {
    out.push_back(s->text);
  } else if (const auto * a = as_array(v)) {
    for (const auto & item : a->items) {
      if (const auto * s = as_scalar(item)) {
        out.push_back(s->text);
      }
    }
  } else if (const auto * b = as_block(v)) {
    for (const auto & item : b->items) {
      if (const auto * s = as_scalar(item)) {
        out.push_back(s->text);
      }
    }
  }
  return out;
}

std::vector<Symbol> folded_items(const Value & v)
{
  auto out = scalar_items(v);
  for (auto & s : out) {
    s = s.folded();
  }
  return out;
}

}  // namespace

// ============================================================================
// Key matchers
// ============================================================================

RuleKey parse_rule_key(std::string_view text, bool quoted)
{
  // Quoted matchers (`"alias_name[trigger]"`) still classify.
  if (quoted && text.find_first_of("[<") == std::string_view::npos) {
    return LiteralKey{intern(text)};
  }
  if (auto br = split_bracket(text)) {
    const Symbol arg = intern(br->arg);
    if (br->head == "alias_name") {
      return AliasNameKey{arg.folded()};
    }
    if (br->head == "enum") {
      return EnumKey{arg};
    }
    if (br->head == "value") {
      return ValueKey{arg};
    }
    if (br->head == "value_set") {
      return ValueSetKey{arg};
    }
    if (br->head == "scope") {
      return ScopeKey{arg.folded()};
    }
    if (const auto simple = parse_simple_type(br->head)) {
      return SimpleKey{*simple};
    }
  }
  if (auto ref = split_type_ref(text)) {
    return TypeRefKey{ref->type, std::move(ref->prefix), std::move(ref->suffix)};
  }
  if (const auto simple = parse_simple_type(text)) {
    return SimpleKey{*simple};
  }
  return LiteralKey{intern(text)};
}

// ============================================================================
// SchemaParser
// ============================================================================

SchemaParser::SchemaParser(DiagnosticBag & diags, uint32_t & next_rule_id)
: diags_(diags), next_rule_id_(next_rule_id)
{
}

void SchemaParser::error(SourceRange range, std::string message)
{
  diags_.report_error(range, std::move(message)).with_code(RuleCode::SchemaError);
}

void SchemaParser::warning(SourceRange range, std::string message)
{
  diags_.report_warning(range, std::move(message)).with_code(RuleCode::SchemaError);
}

SchemaFragment SchemaParser::lower(const Block & root)
{
  SchemaFragment out;

  for (const auto & item : root.items) {
    error(get_range(item), "unexpected bare value at schema top level");
  }

  for (const auto & e : root.entries) {
    const std::string_view key = e.key.str();
    const Block * body = as_block(e.value);

    if (iequals(key, "types")) {
      if (body) lower_types(*body, out);
      continue;
    }
    if (iequals(key, "enums")) {
      if (body) lower_enums(*body, out);
      continue;
    }
    if (iequals(key, "values")) {
      if (body) lower_values(*body, out);
      continue;
    }
    if (iequals(key, "scopes")) {
      if (body) lower_scopes(*body, out);
      continue;
    }
    if (iequals(key, "scope_groups")) {
      if (body) lower_scope_groups(*body, out);
      continue;
    }
    if (iequals(key, "links")) {
      if (body) lower_links(*body, out);
      continue;
    }

    if (auto br = split_bracket(key)) {
      if (br->head == "alias") {
        const auto colon = br->arg.find(':');
        if (colon == std::string_view::npos || colon == 0 || colon + 1 == br->arg.size()) {
          error(e.key.range, fmt::format("alias '{}' must be written alias[group:name]", key));
          continue;
        }
        const std::string_view member = br->arg.substr(colon + 1);
        SchemaRule rule = lower_rule(e);
        rule.key = parse_rule_key(member, false);
        rule.key_text = intern(member);
        out.aliases.emplace_back(intern(br->arg.substr(0, colon)).folded(), std::move(rule));
        continue;
      }
      if (br->head == "single_alias") {
        SchemaRule rule = lower_rule(e);
        rule.key.reset();
        rule.key_text = intern(br->arg);
        out.single_aliases.emplace_back(intern(br->arg).folded(), std::move(rule));
        continue;
      }
      if (br->head == "enum" || br->head == "complex_enum") {
        Block wrapper;
        wrapper.entries.push_back(e);
        lower_enums(wrapper, out);
        continue;
      }
      if (br->head == "type") {
        lower_type(intern(br->arg), e, out);
        continue;
      }
    }

    if (body == nullptr) {
      error(e.range, fmt::format("expected a rule block for '{}'", key));
      continue;
    }
    out.shape_options.emplace_back(intern(key).folded(), lower_options(e));
    out.shapes.emplace_back(intern(key).folded(), lower_rule_block(*body));
  }
  return out;
}

// ============================================================================
// types = { ... }
// ============================================================================

void SchemaParser::lower_types(const Block & block, SchemaFragment & out)
{
  for (const auto & e : block.entries) {
    const auto br = split_bracket(e.key.str());
    if (!br || br->head != "type") {
      error(e.key.range, fmt::format("expected type[name], found '{}'", e.key.str()));
      continue;
    }
    lower_type(intern(br->arg), e, out);
  }
}

void SchemaParser::lower_type(Symbol name, const Entry & entry, SchemaFragment & out)
{
  const Block * body = as_block(entry.value);
  if (body == nullptr) {
    error(entry.range, fmt::format("type '{}' must be a block", name.str()));
    return;
  }

  SchemaType type;
  type.name = name;
  type.range = entry.range;
  type.options = lower_options(entry);
  type.severity = type.options.severity;

  for (const auto & e : body->entries) {
    const std::string_view key = e.key.str();
    const auto * s = as_scalar(e.value);

    if (iequals(key, "path")) {
      if (s) type.paths.push_back(normalise_path(s->str()));
    } else if (iequals(key, "path_strict")) {
      type.path_strict = is_yes(e.value);
    } else if (iequals(key, "path_file")) {
      if (s) type.path_file = std::string(s->str());
    } else if (iequals(key, "path_extension")) {
      if (s) type.path_extension = std::string(s->str());
    } else if (iequals(key, "name_field")) {
      if (s) type.name_field = s->text;
    } else if (iequals(key, "unique")) {
      type.unique = is_yes(e.value);
    } else if (iequals(key, "type_per_file")) {
      type.type_per_file = is_yes(e.value);
    } else if (iequals(key, "skip_root_key")) {
      if (s) {
        type.skip_root_key = std::string(s->str());
      } else if (const auto keys = scalar_items(e.value); !keys.empty()) {
        type.skip_root_key = std::string(keys.front().str());
      }
    } else if (iequals(key, "starts_with")) {
      if (s) type.options.starts_with = std::string(s->str());
    } else if (iequals(key, "type_key_filter")) {
      type.options.type_key_filter = folded_items(e.value);
      type.options.type_key_filter_negated = e.op == Operator::Ne;
    } else if (iequals(key, "severity")) {
      if (s) {
        RuleOptions parsed;
        if (auto applied = apply_directive(fmt::format("severity = {}", s->str()), parsed); !applied) {
          error(e.range, applied.error());
        } else {
          type.severity = parsed.severity;
        }
      }
    } else if (iequals(key, "localisation")) {
      if (const auto * loc = as_block(e.value)) {
        lower_localisation(*loc, type);
      }
    } else if (auto br = split_bracket(key); br && br->head == "subtype") {
      lower_subtype(e, intern(br->arg).folded(), type);
    }
    // modifiers, display_name, graph_related_types: not interpreted
  }

  if (type.paths.empty() && type.path_file.empty()) {
    warning(entry.key.range, fmt::format("type '{}' declares no path", name.str()));
  }
  out.types.push_back(std::move(type));
}

void SchemaParser::lower_subtype(const Entry & entry, Symbol name, SchemaType & type)
{
  SubtypeDef def;
  def.name = name;
  def.options = lower_options(entry);
  if (const auto * body = as_block(entry.value)) {
    def.predicate = lower_rule_block(*body);
  } else if (as_array(entry.value) == nullptr) {
    error(entry.range, fmt::format("subtype '{}' must be a block", name.str()));
    return;
  }
  type.subtypes.push_back(std::move(def));
}

void SchemaParser::lower_localisation(const Block & block, SchemaType & type)
{
  const auto lower_entries = [&](const Block & b, std::optional<Symbol> subtype, bool negated) {
    for (const auto & e : b.entries) {
      const auto * s = as_scalar(e.value);
      if (s == nullptr) {
        error(e.range, fmt::format("localisation '{}' expects a pattern string", e.key.str()));
        continue;
      }
      const RuleOptions opts = lower_options(e);
      LocalisationRequirement req;
      req.key = e.key.text;
      req.pattern = std::string(s->str());
      req.required = opts.required;
      req.primary = opts.primary;
      req.subtype = subtype;
      req.subtype_negated = negated;
      type.localisation.push_back(std::move(req));
    }
  };

  Block plain;
  for (const auto & e : block.entries) {
    const auto br = split_bracket(e.key.str());
    if (br && br->head == "subtype") {
      std::string_view name = br->arg;
      const bool negated = !name.empty() && name.front() == '!';
      if (negated) {
        name.remove_prefix(1);
      }
      if (const auto * inner = as_block(e.value)) {
        lower_entries(*inner, intern(name).folded(), negated);
      }
      continue;
    }
    plain.entries.push_back(e);
  }
  lower_entries(plain, std::nullopt, false);
}

// ============================================================================
// enums / values / scopes / links
// ============================================================================

void SchemaParser::lower_enums(const Block & block, SchemaFragment & out)
{
  for (const auto & e : block.entries) {
    const auto br = split_bracket(e.key.str());
    if (br && br->head == "enum") {
      EnumDef def;
      def.name = intern(br->arg);
      def.values = scalar_items(e.value);
      def.range = e.range;
      out.enums.push_back(std::move(def));
      continue;
    }
    if (br && br->head == "complex_enum") {
      const Block * body = as_block(e.value);
      if (body == nullptr) {
        error(e.range, fmt::format("complex_enum '{}' must be a block", br->arg));
        continue;
      }
      ComplexEnumDef def;
      def.name = intern(br->arg);
      def.range = e.range;
      for (const auto * p : body->find_all("path")) {
        if (const auto * s = as_scalar(p->value)) {
          def.paths.push_back(normalise_path(s->str()));
        }
      }
      if (const auto * sfr = body->find("start_from_root")) {
        def.start_from_root = is_yes(sfr->value);
      }
      if (const auto * name = body->find("name")) {
        if (const auto * tpl = as_block(name->value)) {
          def.name_template = *tpl;
        } else if (const auto * arr = as_array(name->value)) {
          def.name_template.items = arr->items;
        }
      } else {
        error(e.range, fmt::format("complex_enum '{}' has no name template", br->arg));
        continue;
      }
      out.complex_enums.push_back(std::move(def));
      continue;
    }
    error(e.key.range, fmt::format("expected enum[name] or complex_enum[name], found '{}'", e.key.str()));
  }
}

void SchemaParser::lower_values(const Block & block, SchemaFragment & out)
{
  for (const auto & e : block.entries) {
    const auto br = split_bracket(e.key.str());
    if (!br || br->head != "value") {
      error(e.key.range, fmt::format("expected value[name], found '{}'", e.key.str()));
      continue;
    }
    EnumDef def;
    def.name = intern(br->arg);
    def.values = scalar_items(e.value);
    def.range = e.range;
    out.value_sets.push_back(std::move(def));
  }
}

void SchemaParser::lower_scopes(const Block & block, SchemaFragment & out)
{
  for (const auto & e : block.entries) {
    ScopeDef def;
    def.name = e.key.text;
    if (const auto * body = as_block(e.value)) {
      if (const auto * aliases = body->find("aliases")) {
        def.aliases = folded_items(aliases->value);
      }
    }
    if (def.aliases.empty()) {
      def.aliases.push_back(e.key.folded());
    }
    out.scopes.push_back(std::move(def));
  }
}

void SchemaParser::lower_scope_groups(const Block & block, SchemaFragment & out)
{
  for (const auto & e : block.entries) {
    if (as_block(e.value) == nullptr) {
      error(e.range, fmt::format("scope group '{}' must be a block", e.key.str()));
      continue;
    }
    out.scope_groups.push_back(ScopeGroupDef{e.key.text, folded_items(e.value), e.range});
  }
}

void SchemaParser::lower_links(const Block & block, SchemaFragment & out)
{
  for (const auto & e : block.entries) {
    const Block * body = as_block(e.value);
    if (body == nullptr) {
      error(e.range, fmt::format("link '{}' must be a block", e.key.str()));
      continue;
    }
    LinkDef def;
    def.name = e.key.folded();
    if (const auto * in = body->find("input_scopes")) {
      def.input_scopes = folded_items(in->value);
    }
    if (const auto * o = body->find("output_scope")) {
      if (const auto * s = as_scalar(o->value)) {
        def.output_scope = s->text.folded();
      }
    }
    if (const auto * p = body->find("prefix")) {
      if (const auto * s = as_scalar(p->value)) {
        def.prefix = std::string(s->str());
      }
    }
    if (const auto * fd = body->find("from_data")) {
      def.from_data = is_yes(fd->value);
    }
    out.links.push_back(std::move(def));
  }
}

// ============================================================================
// Rules
// ============================================================================

RuleOptions SchemaParser::lower_options(const Entry & entry)
{
  RuleOptions options;
  for (const auto & note : entry.annotations) {
    if (note.kind == Annotation::Kind::Doc) {
      if (!options.doc.empty()) {
        options.doc.push_back('\n');
      }
      options.doc += note.text;
      continue;
    }
    if (auto applied = apply_directive(note.text, options); !applied) {
      error(note.range, applied.error());
    }
  }
  return options;
}

RuleBlock SchemaParser::lower_rule_block(const Block & block)
{
  RuleBlock out = lower_rule_items(block.items);
  for (const auto & e : block.entries) {
    const auto br = split_bracket(e.key.str());
    if (br && br->head == "subtype" && !e.key.quoted) {
      std::string_view name = br->arg;
      SubtypeBlock sb;
      sb.negated = !name.empty() && name.front() == '!';
      if (sb.negated) {
        name.remove_prefix(1);
      }
      sb.name = intern(name).folded();
      if (const auto * body = as_block(e.value)) {
        sb.block = Box<RuleBlock>(lower_rule_block(*body));
      } else if (const auto * arr = as_array(e.value)) {
        sb.block = Box<RuleBlock>(lower_rule_items(arr->items));
      } else {
        error(e.range, fmt::format("subtype guard '{}' must be a block", e.key.str()));
        continue;
      }
      out.subtype_blocks.push_back(std::move(sb));
      continue;
    }
    out.rules.push_back(lower_rule(e));
  }
  return out;
}

RuleBlock SchemaParser::lower_rule_items(const std::vector<Value> & items)
{
  RuleBlock out;
  for (const auto & item : items) {
    out.rules.push_back(lower_item(item));
  }
  return out;
}

SchemaRule SchemaParser::lower_rule(const Entry & entry)
{
  SchemaRule rule;
  rule.id = next_rule_id_++;
  rule.key = parse_rule_key(entry.key.str(), entry.key.quoted);
  rule.key_text = entry.key.text;
  rule.op = entry.op;
  rule.options = lower_options(entry);
  rule.value = lower_value(entry.value);
  rule.range = entry.range;
  return rule;
}

SchemaRule SchemaParser::lower_item(const Value & item)
{
  SchemaRule rule;
  rule.id = next_rule_id_++;
  rule.value = lower_value(item);
  rule.range = get_range(item);
  // Bare values are flags: any number may appear.
  rule.options.cardinality = Cardinality{0, std::nullopt, false};
  return rule;
}

RuleValue SchemaParser::lower_value(const Value & value)
{
  if (const auto * s = as_scalar(value)) {
    return lower_scalar_value(*s);
  }
  if (const auto * b = as_block(value)) {
    return Box<RuleBlock>(lower_rule_block(*b));
  }
  if (const auto * a = as_array(value)) {
    return Box<RuleBlock>(lower_rule_items(a->items));
  }
  const auto * r = as_reference(value);
  return LiteralValue{r ? r->name : Symbol{}};
}

RuleValue SchemaParser::lower_scalar_value(const Scalar & scalar)
{
  const std::string_view text = scalar.str();
  if (scalar.quoted) {
    return LiteralValue{scalar.text};
  }
  if (const auto simple = parse_simple_type(text)) {
    return SimpleValue{*simple, std::nullopt, {}};
  }

  if (auto br = split_bracket(text)) {
    const Symbol arg = intern(br->arg);
    if (br->head == "enum") return EnumValue{arg};
    if (br->head == "value_set") return ValueSetValue{arg};
    if (br->head == "value") return ValueRefValue{arg};
    if (br->head == "scope") return ScopeValue{arg.folded(), false};
    if (br->head == "scope_group") return ScopeValue{arg.folded(), true};
    if (br->head == "alias_match_left") return AliasMatchLeftValue{arg.folded()};
    if (br->head == "single_alias_right") return SingleAliasValue{arg.folded()};
    if (br->head == "alias_keys_field") return AliasKeysFieldValue{arg.folded()};
    if (br->head == "colour" || br->head == "color") return ColourValue{arg.folded()};

    if (const auto simple = parse_simple_type(br->head)) {
      SimpleValue sv{*simple, std::nullopt, {}};
      if (*simple == SimpleType::Icon || *simple == SimpleType::Filepath) {
        sv.argument = std::string(br->arg);
        return sv;
      }
      auto range = parse_numeric_range(br->arg);
      if (!range) {
        error(scalar.range, range.error());
        return sv;
      }
      sv.range = *range;
      return sv;
    }
  }

  if (auto ref = split_type_ref(text)) {
    return TypeRefValue{ref->type, std::move(ref->prefix), std::move(ref->suffix)};
  }
  return LiteralValue{scalar.text};
}

// ============================================================================
// Entry point
// ============================================================================

SchemaFragment parse_schema(
  FileId file_id, std::string_view text, DiagnosticBag & diags, uint32_t & next_rule_id)
{
  DiagnosticBag syntax_diags;
  syntax::Lexer lexer(file_id, text, syntax::LexMode::Schema);
  const std::vector<syntax::Token> tokens = lexer.lex_all();
  syntax::Parser parser(file_id, tokens, syntax_diags, syntax::LexMode::Schema);
  const Block root = parser.parse_file(static_cast<uint32_t>(text.size()));

  for (Diagnostic d : syntax_diags.take()) {
    d.rule = RuleCode::SchemaError;
    diags.add(std::move(d));
  }

  SchemaParser lowering(diags, next_rule_id);
  return lowering.lower(root);
}

}  // namespace cwcheck::schema
