// cwcheck/basic/diagnostic.hpp - Diagnostic types for parsing/schema/validation
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "cwcheck/basic/source_manager.hpp"

namespace cwcheck
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

/**
 * Machine-checkable rule code attached to every diagnostic.
 */
enum class RuleCode : uint8_t {
  None,
  SyntaxError,
  SchemaError,
  MissingRequiredKey,
  UnexpectedKey,
  CardinalityViolation,
  TypeMismatch,
  ValueOutOfRange,
  UnknownEnumValue,
  UndefinedReference,
  MissingLocalisationKey,
  UnresolvedAlias,
  ScopeMismatch,
  DuplicateDefinition,
};

[[nodiscard]] constexpr std::string_view to_string(RuleCode c) noexcept
{
  switch (c) {
    case RuleCode::None:
      return "";
    case RuleCode::SyntaxError:
      return "syntax-error";
    case RuleCode::SchemaError:
      return "schema-error";
    case RuleCode::MissingRequiredKey:
      return "missing-required-key";
    case RuleCode::UnexpectedKey:
      return "unexpected-key";
    case RuleCode::CardinalityViolation:
      return "cardinality-violation";
    case RuleCode::TypeMismatch:
      return "type-mismatch";
    case RuleCode::ValueOutOfRange:
      return "value-out-of-range";
    case RuleCode::UnknownEnumValue:
      return "unknown-enum-value";
    case RuleCode::UndefinedReference:
      return "undefined-reference";
    case RuleCode::MissingLocalisationKey:
      return "missing-localisation-key";
    case RuleCode::UnresolvedAlias:
      return "unresolved-alias";
    case RuleCode::ScopeMismatch:
      return "scope-mismatch";
    case RuleCode::DuplicateDefinition:
      return "duplicate-definition";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(Severity s) noexcept
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "";
}

enum class LabelStyle : uint8_t {
  Primary,    // direct cause
  Secondary,  // related context
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;

  [[nodiscard]] bool operator==(const Label &) const = default;
};

/// Occurrence count detail carried by cardinality diagnostics.
struct CardinalityDetail
{
  uint32_t count = 0;
  uint32_t min = 0;
  std::optional<uint32_t> max;  ///< nullopt = unbounded

  [[nodiscard]] bool operator==(const CardinalityDetail &) const = default;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  RuleCode rule = RuleCode::None;
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;
  std::optional<CardinalityDetail> cardinality;

  [[nodiscard]] std::string_view code() const noexcept { return to_string(rule); }
  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;

  [[nodiscard]] bool operator==(const Diagnostic &) const = default;
};

// ============================================================================
// EngineError
// ============================================================================

/**
 * Internal invariant violation. Never used for user-facing problems, which are
 * always reported as Diagnostics.
 */
class EngineError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and hands it to the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(RuleCode code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

  DiagnosticBuilder & with_cardinality(CardinalityDetail detail);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_info(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_hint(
    SourceRange range, std::string message, std::string label_message = "");

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] std::vector<Diagnostic> with_rule(RuleCode rule) const;
  [[nodiscard]] size_t count(RuleCode rule) const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);
  void truncate(size_t max_size);
  [[nodiscard]] std::vector<Diagnostic> take() { return std::move(diagnostics_); }

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace cwcheck
