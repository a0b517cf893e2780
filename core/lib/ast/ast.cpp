// cwcheck/ast/ast.cpp - AST helpers
#include "cwcheck/ast/ast.hpp"

#include <fmt/core.h>

#include <type_traits>

namespace cwcheck
{

namespace
{

[[nodiscard]] bool same_tag(const std::optional<Symbol> & a, const std::optional<Symbol> & b)
{
  if (a.has_value() != b.has_value()) {
    return false;
  }
  return !a || a->folded() == b->folded();
}

[[nodiscard]] bool same_condition(
  const std::optional<Condition> & a, const std::optional<Condition> & b)
{
  if (a.has_value() != b.has_value()) {
    return false;
  }
  return !a || (a->param == b->param && a->negated == b->negated);
}

[[nodiscard]] bool same_items(const std::vector<Value> & a, const std::vector<Value> & b)
{
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (!structurally_equal(a[i], b[i])) {
      return false;
    }
  }
  return true;
}

void render_items(std::string & out, const std::vector<Value> & items)
{
  for (const auto & item : items) {
    out += ' ';
    out += render(item);
  }
}

void render_block_into(std::string & out, const Block & block)
{
  if (block.tag) {
    out += block.tag->str();
    out += ' ';
  }
  out += '{';
  for (const auto & e : block.entries) {
    out += ' ';
    if (e.key.quoted) {
      out += fmt::format("\"{}\"", e.key.str());
    } else {
      out += e.key.str();
    }
    out += fmt::format(" {} ", to_string(e.op));
    out += render(e.value);
  }
  render_items(out, block.items);
  out += (block.entries.empty() && block.items.empty()) ? "}" : " }";
}

size_t value_node_count(const Value & v)
{
  if (const auto * b = as_block(v)) {
    return 1 + node_count(*b);
  }
  if (const auto * a = as_array(v)) {
    size_t n = 1;
    for (const auto & item : a->items) {
      n += value_node_count(item);
    }
    return n;
  }
  return 1;
}

}  // namespace

const Entry * Block::find(std::string_view key) const
{
  for (const auto & e : entries) {
    if (iequals(e.key.str(), key)) {
      return &e;
    }
  }
  return nullptr;
}

std::vector<const Entry *> Block::find_all(std::string_view key) const
{
  std::vector<const Entry *> out;
  for (const auto & e : entries) {
    if (iequals(e.key.str(), key)) {
      out.push_back(&e);
    }
  }
  return out;
}

SourceRange get_range(const Value & value)
{
  return std::visit(
    [](const auto & v) -> SourceRange {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Scalar> || std::is_same_v<T, Reference>) {
        return v.range;
      } else {
        return v->range;
      }
    },
    value);
}

bool structurally_equal(const Value & a, const Value & b)
{
  if (a.index() != b.index()) {
    return false;
  }
  return std::visit(
    [&b](const auto & lhs) -> bool {
      using T = std::decay_t<decltype(lhs)>;
      const auto & rhs = std::get<T>(b);
      if constexpr (std::is_same_v<T, Scalar>) {
        return lhs.text == rhs.text;
      } else if constexpr (std::is_same_v<T, Reference>) {
        return lhs.kind == rhs.kind && lhs.name == rhs.name;
      } else if constexpr (std::is_same_v<T, Box<Block>>) {
        return structurally_equal(*lhs, *rhs);
      } else {
        return same_tag(lhs->tag, rhs->tag) && same_items(lhs->items, rhs->items);
      }
    },
    a);
}

bool structurally_equal(const Entry & a, const Entry & b)
{
  return a.key.folded() == b.key.folded() && a.op == b.op &&
         same_condition(a.condition, b.condition) && structurally_equal(a.value, b.value);
}

bool structurally_equal(const Block & a, const Block & b)
{
  if (a.entries.size() != b.entries.size() || !same_tag(a.tag, b.tag)) {
    return false;
  }
  for (size_t i = 0; i < a.entries.size(); ++i) {
    if (!structurally_equal(a.entries[i], b.entries[i])) {
      return false;
    }
  }
  return same_items(a.items, b.items);
}

std::string render(const Value & value)
{
  return std::visit(
    [](const auto & v) -> std::string {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Scalar>) {
        return v.quoted ? fmt::format("\"{}\"", v.str()) : std::string(v.str());
      } else if constexpr (std::is_same_v<T, Reference>) {
        switch (v.kind) {
          case ReferenceKind::Variable:
            return fmt::format("@{}", v.name.str());
          case ReferenceKind::Maths:
            return fmt::format("@[ {} ]", v.name.str());
          case ReferenceKind::Parameter:
            break;
        }
        return std::string(v.name.str());
      } else if constexpr (std::is_same_v<T, Box<Block>>) {
        std::string out;
        render_block_into(out, *v);
        return out;
      } else {
        std::string out;
        if (v->tag) {
          out += v->tag->str();
          out += ' ';
        }
        out += '{';
        render_items(out, v->items);
        out += v->items.empty() ? "}" : " }";
        return out;
      }
    },
    value);
}

std::string render(const Block & block)
{
  std::string out;
  render_block_into(out, block);
  return out;
}

size_t node_count(const Block & block)
{
  size_t n = 0;
  for (const auto & e : block.entries) {
    n += value_node_count(e.value);
  }
  for (const auto & item : block.items) {
    n += value_node_count(item);
  }
  return n;
}

}  // namespace cwcheck
