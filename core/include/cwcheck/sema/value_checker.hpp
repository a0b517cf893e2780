// cwcheck/sema/value_checker.hpp - Scalar checks against simple types
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "cwcheck/schema/schema.hpp"

namespace cwcheck::sema
{

enum class ValueCheck : uint8_t {
  Ok,
  TypeMismatch,
  OutOfRange,
};

struct ValueCheckResult
{
  ValueCheck status = ValueCheck::Ok;
  std::string message;

  [[nodiscard]] bool ok() const noexcept { return status == ValueCheck::Ok; }

  static ValueCheckResult success() { return {}; }
  static ValueCheckResult mismatch(std::string msg) { return {ValueCheck::TypeMismatch, std::move(msg)}; }
  static ValueCheckResult out_of_range(std::string msg)
  {
    return {ValueCheck::OutOfRange, std::move(msg)};
  }
};

[[nodiscard]] bool is_bool(std::string_view text) noexcept;
[[nodiscard]] bool is_int(std::string_view text) noexcept;
[[nodiscard]] bool is_number(std::string_view text) noexcept;

/// `y.m.d` with an optional `.h` hour component.
[[nodiscard]] bool is_date(std::string_view text) noexcept;

[[nodiscard]] std::optional<double> parse_number(std::string_view text) noexcept;

/**
 * Check one unquoted or quoted scalar against a simple-type rule.
 *
 * Scope fields, localisation keys, file paths and icons only require a
 * scalar here; the validator resolves them separately.
 */
[[nodiscard]] ValueCheckResult check_simple(std::string_view text, const schema::SimpleValue & rule);

}  // namespace cwcheck::sema
