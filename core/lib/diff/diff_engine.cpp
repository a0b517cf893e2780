// cwcheck/diff/diff_engine.cpp - Structural diff between two script trees
#include "cwcheck/diff/diff_engine.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <unordered_map>
#include <utility>

#include "cwcheck/basic/log.hpp"
#include "cwcheck/syntax/frontend.hpp"

namespace cwcheck::diff
{

std::string Change::path_string() const
{
  std::string out;
  for (const auto & seg : path) {
    if (!out.empty()) {
      out += '/';
    }
    out += seg;
  }
  return out;
}

bool DiffResult::has_errors() const
{
  return std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

namespace
{

bool same_condition(const std::optional<Condition> & a, const std::optional<Condition> & b)
{
  if (a.has_value() != b.has_value()) {
    return false;
  }
  return !a || (a->param == b->param && a->negated == b->negated);
}

/// Entries sharing one identity, in source order.
struct Group
{
  std::string label;
  std::vector<const Entry *> a;
  std::vector<const Entry *> b;
};

class Differ
{
public:
  explicit Differ(const schema::SchemaType * type) : type_(type) {}

  void block(std::vector<std::string> & path, const Block & a, const Block & b, bool top_level)
  {
    std::vector<std::string> order;
    std::unordered_map<std::string, Group> groups;

    const auto collect = [&](const Block & blk, bool left) {
      for (const auto & e : blk.entries) {
        auto [id, label] = identity(e, top_level);
        auto it = groups.find(id);
        if (it == groups.end()) {
          order.push_back(id);
          it = groups.emplace(id, Group{std::move(label), {}, {}}).first;
        }
        (left ? it->second.a : it->second.b).push_back(&e);
      }
    };
    collect(a, true);
    collect(b, false);

    for (const auto & id : order) {
      const Group & g = groups.at(id);
      const size_t n = std::max(g.a.size(), g.b.size());
      for (size_t i = 0; i < n; ++i) {
        path.push_back(n > 1 ? fmt::format("{}[{}]", g.label, i) : g.label);
        const Entry * ea = i < g.a.size() ? g.a[i] : nullptr;
        const Entry * eb = i < g.b.size() ? g.b[i] : nullptr;
        if (ea != nullptr && eb != nullptr) {
          entry(path, *ea, *eb);
        } else if (ea != nullptr) {
          removed(path, ea->value, ea->op, ea->range, ea->condition);
        } else {
          added(path, eb->value, eb->op, eb->range, eb->condition);
        }
        path.pop_back();
      }
    }

    items(path, a.items, b.items);
  }

  [[nodiscard]] Changeset take() { return std::move(changes_); }

private:
  /// (grouping id, path label) of an entry.
  [[nodiscard]] std::pair<std::string, std::string> identity(const Entry & e, bool top_level) const
  {
    std::string id(e.key.folded().str());
    std::string label(e.key.str());
    if (!top_level || type_ == nullptr || !type_->name_field) {
      return {std::move(id), std::move(label)};
    }
    const Block * body = as_block(e.value);
    const Entry * name_entry = body ? body->find(type_->name_field->str()) : nullptr;
    const Scalar * name = name_entry ? as_scalar(name_entry->value) : nullptr;
    if (name == nullptr) {
      return {std::move(id), std::move(label)};
    }
    id += '\x1f';
    id += ascii_lower(name->str());
    label = fmt::format("{}[{}]", label, name->str());
    return {std::move(id), std::move(label)};
  }

  void entry(std::vector<std::string> & path, const Entry & a, const Entry & b)
  {
    if (a.op != b.op || !same_condition(a.condition, b.condition)) {
      changed(path, a, b);
      return;
    }
    value(path, a.value, b.value, a.op);
  }

  void value(std::vector<std::string> & path, const Value & a, const Value & b, Operator op)
  {
    const Block * ba = as_block(a);
    const Block * bb = as_block(b);
    if (ba != nullptr && bb != nullptr && ba->tag == bb->tag) {
      block(path, *ba, *bb, false);
      return;
    }
    const Array * aa = as_array(a);
    const Array * ab = as_array(b);
    if (aa != nullptr && ab != nullptr && aa->tag == ab->tag) {
      items(path, aa->items, ab->items);
      return;
    }
    if (!structurally_equal(a, b)) {
      Change c;
      c.kind = ChangeKind::Changed;
      c.path = path;
      c.old_value = a;
      c.new_value = b;
      c.old_op = op;
      c.new_op = op;
      c.old_range = get_range(a);
      c.new_range = get_range(b);
      changes_.push_back(std::move(c));
    }
  }

  void items(std::vector<std::string> & path, const std::vector<Value> & a, const std::vector<Value> & b)
  {
    const size_t n = std::max(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
      path.push_back(fmt::format("[{}]", i));
      if (i < a.size() && i < b.size()) {
        value(path, a[i], b[i], Operator::Eq);
      } else if (i < a.size()) {
        removed(path, a[i], Operator::Eq, get_range(a[i]), std::nullopt);
      } else {
        added(path, b[i], Operator::Eq, get_range(b[i]), std::nullopt);
      }
      path.pop_back();
    }
  }

  void changed(const std::vector<std::string> & path, const Entry & a, const Entry & b)
  {
    Change c;
    c.kind = ChangeKind::Changed;
    c.path = path;
    c.old_value = a.value;
    c.new_value = b.value;
    c.old_op = a.op;
    c.new_op = b.op;
    c.old_range = a.range;
    c.new_range = b.range;
    c.old_condition = a.condition;
    c.new_condition = b.condition;
    changes_.push_back(std::move(c));
  }

  void added(
    const std::vector<std::string> & path, const Value & v, Operator op, SourceRange range,
    const std::optional<Condition> & condition)
  {
    Change c;
    c.kind = ChangeKind::Added;
    c.path = path;
    c.new_value = v;
    c.new_op = op;
    c.new_range = range;
    c.new_condition = condition;
    changes_.push_back(std::move(c));
  }

  void removed(
    const std::vector<std::string> & path, const Value & v, Operator op, SourceRange range,
    const std::optional<Condition> & condition)
  {
    Change c;
    c.kind = ChangeKind::Removed;
    c.path = path;
    c.old_value = v;
    c.old_op = op;
    c.old_range = range;
    c.old_condition = condition;
    changes_.push_back(std::move(c));
  }

  const schema::SchemaType * type_;
  Changeset changes_;
};

}  // namespace

Changeset diff(const Block & a, const Block & b, const schema::SchemaType * type)
{
  Differ differ(type);
  std::vector<std::string> path;
  differ.block(path, a, b, true);
  return differ.take();
}

DiffResult diff_documents(
  SourceRegistry & sources, const std::filesystem::path & path_a, std::string text_a,
  const std::filesystem::path & path_b, std::string text_b, const schema::SchemaType * type)
{
  DiagnosticBag diags;
  const ParseOutput a = parse_source(sources, path_a, std::move(text_a), diags);
  const ParseOutput b = parse_source(sources, path_b, std::move(text_b), diags);

  DiffResult result;
  result.changes = diff(a.root, b.root, type);
  result.diagnostics = diags.take();
  log::debug(
    "diff {} -> {}: {} change(s), {} diagnostic(s)", path_a.generic_string(),
    path_b.generic_string(), result.changes.size(), result.diagnostics.size());
  return result;
}

DiffResult diff_documents(std::string text_a, std::string text_b, const schema::SchemaType * type)
{
  SourceRegistry sources;
  return diff_documents(sources, "a", std::move(text_a), "b", std::move(text_b), type);
}

}  // namespace cwcheck::diff
