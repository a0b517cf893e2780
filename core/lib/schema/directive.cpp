// cwcheck/schema/directive.cpp - `##` directive parsing
#include "cwcheck/schema/directive.hpp"

#include <fmt/format.h>

#include <charconv>
#include <limits>

#include "cwcheck/syntax/lexer.hpp"
#include "cwcheck/syntax/parser.hpp"

namespace cwcheck::schema
{

namespace
{

std::string_view trim(std::string_view s) noexcept
{
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
    s.remove_suffix(1);
  }
  return s;
}

std::optional<uint32_t> parse_uint(std::string_view text)
{
  uint32_t out = 0;
  const auto * end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, out);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return out;
}

std::optional<double> parse_bound(std::string_view text)
{
  if (iequals(text, "inf") || iequals(text, "+inf")) {
    return std::numeric_limits<double>::max();
  }
  if (iequals(text, "-inf")) {
    return std::numeric_limits<double>::lowest();
  }
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  double out = 0.0;
  const auto * end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, out);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return out;
}

/// Words of a `x` or `{ x y }` directive value.
std::expected<std::vector<Symbol>, std::string> word_list(const Value & value, std::string_view name)
{
  std::vector<Symbol> out;
  if (const auto * s = as_scalar(value)) {
    out.push_back(s->text.folded());
    return out;
  }
  if (const auto * a = as_array(value)) {
    for (const auto & item : a->items) {
      const auto * s = as_scalar(item);
      if (s == nullptr) {
        return std::unexpected(fmt::format("'{}' expects a list of names", name));
      }
      out.push_back(s->text.folded());
    }
    return out;
  }
  if (const auto * b = as_block(value); b != nullptr && b->entries.empty() && b->items.empty()) {
    return out;
  }
  return std::unexpected(fmt::format("'{}' expects a name or a list of names", name));
}

std::expected<Symbol, std::string> single_word(const Value & value, std::string_view name)
{
  if (const auto * s = as_scalar(value)) {
    return s->text.folded();
  }
  return std::unexpected(fmt::format("'{}' expects a single name", name));
}

std::optional<Severity> parse_severity(std::string_view text)
{
  if (iequals(text, "error")) return Severity::Error;
  if (iequals(text, "warning")) return Severity::Warning;
  if (iequals(text, "info") || iequals(text, "information")) return Severity::Info;
  if (iequals(text, "hint")) return Severity::Hint;
  return std::nullopt;
}

std::expected<void, std::string> apply_entry(const Entry & e, RuleOptions & options)
{
  const std::string_view key = e.key.str();
  const Symbol folded = e.key.folded();

  if (folded == intern("cardinality")) {
    const auto * s = as_scalar(e.value);
    if (s == nullptr) {
      return std::unexpected(std::string("'cardinality' expects min..max"));
    }
    auto card = parse_cardinality(s->str());
    if (!card) {
      return std::unexpected(card.error());
    }
    options.cardinality = *card;
    return {};
  }
  if (folded == intern("scope")) {
    auto scopes = word_list(e.value, key);
    if (!scopes) {
      return std::unexpected(scopes.error());
    }
    options.scope = std::move(*scopes);
    return {};
  }
  if (folded == intern("push_scope")) {
    auto scope = single_word(e.value, key);
    if (!scope) {
      return std::unexpected(scope.error());
    }
    options.push_scope = *scope;
    return {};
  }
  if (folded == intern("replace_scope") || folded == intern("replace_scopes")) {
    const auto * b = as_block(e.value);
    if (b == nullptr || !b->items.empty()) {
      return std::unexpected(std::string("'replace_scope' expects { binding = scope ... }"));
    }
    options.replace_scope.clear();
    for (const auto & binding : b->entries) {
      const auto * s = as_scalar(binding.value);
      if (s == nullptr) {
        return std::unexpected(
          fmt::format("replace_scope binding '{}' expects a scope name", binding.key.str()));
      }
      options.replace_scope.emplace_back(binding.key.folded(), s->text.folded());
    }
    return {};
  }
  if (folded == intern("severity")) {
    const auto * s = as_scalar(e.value);
    const auto sev = s ? parse_severity(s->str()) : std::nullopt;
    if (!sev) {
      return std::unexpected(std::string("'severity' expects error, warning, info or hint"));
    }
    options.severity = *sev;
    return {};
  }
  if (folded == intern("type_key_filter")) {
    auto keys = word_list(e.value, key);
    if (!keys) {
      return std::unexpected(keys.error());
    }
    options.type_key_filter = std::move(*keys);
    options.type_key_filter_negated = e.op == Operator::Ne;
    return {};
  }
  if (folded == intern("starts_with")) {
    const auto * s = as_scalar(e.value);
    if (s == nullptr) {
      return std::unexpected(std::string("'starts_with' expects a prefix"));
    }
    options.starts_with = std::string(s->str());
    return {};
  }
  // display_name, abbreviation, graph_related_types, ...
  return {};
}

}  // namespace

std::expected<Cardinality, std::string> parse_cardinality(std::string_view text)
{
  Cardinality card;
  text = trim(text);
  if (!text.empty() && text.front() == '~') {
    card.soft = true;
    text.remove_prefix(1);
  }
  const auto dots = text.find("..");
  if (dots == std::string_view::npos) {
    return std::unexpected(fmt::format("invalid cardinality '{}': expected min..max", text));
  }
  const auto min = parse_uint(text.substr(0, dots));
  if (!min) {
    return std::unexpected(fmt::format("invalid cardinality minimum '{}'", text.substr(0, dots)));
  }
  card.min = *min;

  const std::string_view max_text = text.substr(dots + 2);
  if (iequals(max_text, "inf")) {
    card.max = std::nullopt;
  } else {
    const auto max = parse_uint(max_text);
    if (!max) {
      return std::unexpected(fmt::format("invalid cardinality maximum '{}'", max_text));
    }
    if (*max < card.min) {
      return std::unexpected(fmt::format("cardinality maximum {} is below minimum {}", *max, card.min));
    }
    card.max = *max;
  }
  return card;
}

std::expected<NumericRange, std::string> parse_numeric_range(std::string_view text)
{
  text = trim(text);
  const auto dots = text.find("..", text.empty() || text.front() != '.' ? 0 : 1);
  if (dots == std::string_view::npos) {
    return std::unexpected(fmt::format("invalid range '{}': expected min..max", text));
  }
  size_t rest = dots + 2;
  if (rest < text.size() && text[rest] == '.') {
    ++rest;
  }
  const auto min = parse_bound(text.substr(0, dots));
  const auto max = parse_bound(text.substr(rest));
  if (!min || !max) {
    return std::unexpected(fmt::format("invalid range '{}'", text));
  }
  if (*max < *min) {
    return std::unexpected(fmt::format("range '{}' is empty", text));
  }
  return NumericRange{*min, *max};
}

std::expected<void, std::string> apply_directive(std::string_view text, RuleOptions & options)
{
  text = trim(text);
  if (text.empty()) {
    return {};
  }

  syntax::Lexer lexer(FileId::invalid(), text, syntax::LexMode::Schema);
  const std::vector<syntax::Token> tokens = lexer.lex_all();
  DiagnosticBag diags;
  syntax::Parser parser(FileId::invalid(), tokens, diags, syntax::LexMode::Schema);
  const Block parsed = parser.parse_file(static_cast<uint32_t>(text.size()));
  if (diags.has_errors()) {
    return std::unexpected(fmt::format("malformed directive '{}': {}", text, diags.all().front().message));
  }

  for (const auto & item : parsed.items) {
    const auto * s = as_scalar(item);
    if (s == nullptr) {
      return std::unexpected(fmt::format("malformed directive '{}'", text));
    }
    if (iequals(s->str(), "required")) {
      options.required = true;
    } else if (iequals(s->str(), "primary")) {
      options.primary = true;
    }
  }
  for (const auto & e : parsed.entries) {
    if (auto applied = apply_entry(e, options); !applied) {
      return applied;
    }
  }
  return {};
}

std::expected<RuleOptions, std::string> parse_directives(const std::vector<Annotation> & annotations)
{
  RuleOptions options;
  for (const auto & note : annotations) {
    if (note.kind == Annotation::Kind::Doc) {
      if (!options.doc.empty()) {
        options.doc.push_back('\n');
      }
      options.doc.append(trim(note.text));
      continue;
    }
    if (auto applied = apply_directive(note.text, options); !applied) {
      return std::unexpected(applied.error());
    }
  }
  return options;
}

}  // namespace cwcheck::schema
