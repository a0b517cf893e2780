// cwcheck/diff/changeset_printer.cpp - Changeset text and JSON rendering
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "cwcheck/diff/changeset_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>

#include "cwcheck/basic/diagnostic_printer.hpp"

namespace cwcheck::diff
{

namespace
{

char marker(ChangeKind kind)
{
  switch (kind) {
    case ChangeKind::Added:
      return '+';
    case ChangeKind::Removed:
      return '-';
    case ChangeKind::Changed:
      return '~';
  }
  return '?';
}

std::string guard(const std::optional<Condition> & condition)
{
  if (!condition) {
    return {};
  }
  return fmt::format("{}{}", condition->negated ? "!" : "", condition->param.str());
}

std::string side(const std::optional<Value> & value, Operator op, const std::optional<Condition> & condition)
{
  if (!value) {
    return {};
  }
  std::string out = op == Operator::Eq ? render(*value) : fmt::format("{} {}", to_string(op), render(*value));
  if (condition) {
    out = fmt::format("[[{}]] {}", guard(condition), out);
  }
  return out;
}

std::string body(const Change & c)
{
  switch (c.kind) {
    case ChangeKind::Added:
      return side(c.new_value, c.new_op, c.new_condition);
    case ChangeKind::Removed:
      return side(c.old_value, c.old_op, c.old_condition);
    case ChangeKind::Changed:
      return fmt::format(
        "{} -> {}", side(c.old_value, c.old_op, c.old_condition), side(c.new_value, c.new_op, c.new_condition));
  }
  return {};
}

}  // namespace

void print_changeset(std::ostream & os, const Changeset & changes, bool use_color)
{
  if (!use_color) {
    rang::setControlMode(rang::control::Off);
  }

  size_t added = 0;
  size_t removed = 0;
  size_t changed = 0;
  for (const auto & c : changes) {
    switch (c.kind) {
      case ChangeKind::Added:
        os << rang::fg::green;
        ++added;
        break;
      case ChangeKind::Removed:
        os << rang::fg::red;
        ++removed;
        break;
      case ChangeKind::Changed:
        os << rang::fg::yellow;
        ++changed;
        break;
    }
    fmt::print(os, "{} ", marker(c.kind));
    os << rang::style::bold;
    fmt::print(os, "{}", c.path_string());
    os << rang::style::reset << rang::fg::reset;
    fmt::print(os, ": {}\n", body(c));
  }

  if (changes.empty()) {
    fmt::print(os, "no changes\n");
    return;
  }
  os << rang::style::bold;
  fmt::print(os, "{} added, {} removed, {} changed\n", added, removed, changed);
  os << rang::style::reset;
}

void print_diff_result(std::ostream & os, const DiffResult & result, const SourceRegistry & sources, bool use_color)
{
  if (!result.diagnostics.empty()) {
    DiagnosticPrinter printer(os, DiagnosticPrintOptions{use_color, Severity::Warning});
    printer.print_all(result.diagnostics, sources);
    fmt::print(os, "\n");
  }
  print_changeset(os, result.changes, use_color);
}

std::string format_changeset(const Changeset & changes)
{
  std::string out;
  for (const auto & c : changes) {
    out += fmt::format("{} {}: {}\n", marker(c.kind), c.path_string(), body(c));
  }
  return out;
}

nlohmann::json changeset_to_json(const Changeset & changes)
{
  nlohmann::json out = nlohmann::json::array();
  for (const auto & c : changes) {
    nlohmann::json item;
    item["kind"] = std::string(to_string(c.kind));
    item["path"] = c.path_string();
    item["segments"] = c.path;
    if (c.old_value) {
      item["old"] = render(*c.old_value);
      item["oldOp"] = std::string(to_string(c.old_op));
      if (c.old_condition) {
        item["oldCondition"] = guard(c.old_condition);
      }
    }
    if (c.new_value) {
      item["new"] = render(*c.new_value);
      item["newOp"] = std::string(to_string(c.new_op));
      if (c.new_condition) {
        item["newCondition"] = guard(c.new_condition);
      }
    }
    out.push_back(std::move(item));
  }
  return out;
}

}  // namespace cwcheck::diff
