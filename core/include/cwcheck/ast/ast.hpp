// cwcheck/ast/ast.hpp - AST definitions for Clausewitz script
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "cwcheck/basic/interner.hpp"
#include "cwcheck/basic/source_manager.hpp"

namespace cwcheck
{

// ============================================================================
// Utility Types
// ============================================================================

/**
 * Wrapper for recursive types in std::variant.
 * Provides pointer semantics with value-like construction.
 */
template <typename T>
class Box
{
public:
  Box() : ptr_(std::make_unique<T>()) {}
  Box(T value) : ptr_(std::make_unique<T>(std::move(value))) {}
  Box(const Box & other) : ptr_(std::make_unique<T>(*other.ptr_)) {}
  Box(Box &&) noexcept = default;

  Box & operator=(const Box & other)
  {
    if (this != &other) {
      ptr_ = std::make_unique<T>(*other.ptr_);
    }
    return *this;
  }
  Box & operator=(Box &&) noexcept = default;

  T & operator*() { return *ptr_; }
  const T & operator*() const { return *ptr_; }
  T * operator->() { return ptr_.get(); }
  const T * operator->() const { return ptr_.get(); }
  T * get() { return ptr_.get(); }
  [[nodiscard]] const T * get() const { return ptr_.get(); }

private:
  std::unique_ptr<T> ptr_;
};

// ============================================================================
// Enums
// ============================================================================

/**
 * Assignment / comparison operator between a key and its value.
 */
enum class Operator : uint8_t {
  Eq,          // =
  EqEq,        // ==
  Ne,          // != / <>
  Lt,          // <
  Le,          // <=
  Gt,          // >
  Ge,          // >=
  PlusEq,      // +=
  MinusEq,     // -=
  MulEq,       // *=
  QuestionEq,  // ?=
};

[[nodiscard]] constexpr std::string_view to_string(Operator op) noexcept
{
  switch (op) {
    case Operator::Eq:
      return "=";
    case Operator::EqEq:
      return "==";
    case Operator::Ne:
      return "!=";
    case Operator::Lt:
      return "<";
    case Operator::Le:
      return "<=";
    case Operator::Gt:
      return ">";
    case Operator::Ge:
      return ">=";
    case Operator::PlusEq:
      return "+=";
    case Operator::MinusEq:
      return "-=";
    case Operator::MulEq:
      return "*=";
    case Operator::QuestionEq:
      return "?=";
  }
  return "=";
}

/**
 * Kind of a non-literal value.
 */
enum class ReferenceKind : uint8_t {
  Variable,   // @name
  Parameter,  // $NAME$ (possibly embedded, e.g. prefix_$NAME$)
  Maths,      // @[ expression ]
};

[[nodiscard]] constexpr std::string_view to_string(ReferenceKind k) noexcept
{
  switch (k) {
    case ReferenceKind::Variable:
      return "variable";
    case ReferenceKind::Parameter:
      return "parameter";
    case ReferenceKind::Maths:
      return "maths";
  }
  return "";
}

// ============================================================================
// Values
// ============================================================================

/**
 * Untyped scalar. Numbers, dates, yes/no and identifiers all land here;
 * the validator decides what they mean.
 */
struct Scalar
{
  Symbol text;
  bool quoted = false;
  SourceRange range;

  [[nodiscard]] std::string_view str() const { return text.str(); }
};

struct Reference
{
  ReferenceKind kind = ReferenceKind::Variable;
  Symbol name;  ///< without the leading '@' for variables
  SourceRange range;
};

struct Block;
struct Array;

using Value = std::variant<Scalar, Reference, Box<Block>, Box<Array>>;

struct Key
{
  Symbol text;
  bool quoted = false;
  SourceRange range;

  [[nodiscard]] std::string_view str() const { return text.str(); }
  [[nodiscard]] Symbol folded() const { return text.folded(); }
};

/// `[[PARAM] ...]` / `[[!PARAM] ...]` guard flattened onto its entries.
struct Condition
{
  Symbol param;
  bool negated = false;
  SourceRange range;
};

/// `##` / `###` comment text attached to the following entry (schema files).
struct Annotation
{
  enum class Kind : uint8_t { Directive, Doc };

  Kind kind = Kind::Directive;
  std::string text;
  SourceRange range;
};

struct Entry
{
  Key key;
  Operator op = Operator::Eq;
  Value value;
  SourceRange range;
  std::optional<Condition> condition;
  std::vector<Annotation> annotations;
};

/**
 * `{ ... }` with at least one `key op value` entry, or empty.
 *
 * Bare values mixed in with entries are kept in `items`.
 */
struct Block
{
  std::vector<Entry> entries;
  std::vector<Value> items;
  std::optional<Symbol> tag;  ///< rgb / hsv prefix
  SourceRange range;

  /// First entry whose key matches case-insensitively.
  [[nodiscard]] const Entry * find(std::string_view key) const;
  [[nodiscard]] std::vector<const Entry *> find_all(std::string_view key) const;
};

/**
 * `{ a b c }` containing only bare values.
 */
struct Array
{
  std::vector<Value> items;
  std::optional<Symbol> tag;
  SourceRange range;
};

// ============================================================================
// Helpers
// ============================================================================

[[nodiscard]] SourceRange get_range(const Value & value);

[[nodiscard]] inline const Scalar * as_scalar(const Value & v) { return std::get_if<Scalar>(&v); }

[[nodiscard]] inline const Block * as_block(const Value & v)
{
  const auto * b = std::get_if<Box<Block>>(&v);
  return b ? b->get() : nullptr;
}

[[nodiscard]] inline const Array * as_array(const Value & v)
{
  const auto * a = std::get_if<Box<Array>>(&v);
  return a ? a->get() : nullptr;
}

[[nodiscard]] inline const Reference * as_reference(const Value & v)
{
  return std::get_if<Reference>(&v);
}

/**
 * Structural equality: ignores spans, quoting and annotations. Keys compare
 * case-insensitively, scalar values exactly.
 */
[[nodiscard]] bool structurally_equal(const Value & a, const Value & b);
[[nodiscard]] bool structurally_equal(const Entry & a, const Entry & b);
[[nodiscard]] bool structurally_equal(const Block & a, const Block & b);

/// Compact single-line rendering, e.g. `{ a = 1 b = { 1 2 } }`.
[[nodiscard]] std::string render(const Value & value);
[[nodiscard]] std::string render(const Block & block);

/// Number of entries and values, recursively.
[[nodiscard]] size_t node_count(const Block & block);

}  // namespace cwcheck
