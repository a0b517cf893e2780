// cwcheck/sema/value_checker.cpp - Scalar checks against simple types
#include "cwcheck/sema/value_checker.hpp"

#include <fmt/format.h>

#include <charconv>
#include <limits>

namespace cwcheck::sema
{

namespace
{

bool all_digits(std::string_view s) noexcept
{
  if (s.empty()) {
    return false;
  }
  for (const char c : s) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

std::string format_bound(double v)
{
  if (v >= std::numeric_limits<double>::max()) return "inf";
  if (v <= std::numeric_limits<double>::lowest()) return "-inf";
  return fmt::format("{}", v);
}

ValueCheckResult check_range(double value, const std::optional<schema::NumericRange> & range)
{
  if (!range || (value >= range->min && value <= range->max)) {
    return ValueCheckResult::success();
  }
  return ValueCheckResult::out_of_range(fmt::format(
    "value {} is outside the allowed range {}..{}", value, format_bound(range->min),
    format_bound(range->max)));
}

}  // namespace

bool is_bool(std::string_view text) noexcept { return iequals(text, "yes") || iequals(text, "no"); }

bool is_int(std::string_view text) noexcept
{
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    text.remove_prefix(1);
  }
  return all_digits(text);
}

bool is_number(std::string_view text) noexcept { return parse_number(text).has_value(); }

std::optional<double> parse_number(std::string_view text) noexcept
{
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }
  double out = 0.0;
  const auto * end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, out, std::chars_format::fixed);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return out;
}

bool is_date(std::string_view text) noexcept
{
  int parts[4] = {0, 0, 0, 0};
  int count = 0;
  size_t start = 0;
  while (start <= text.size()) {
    const auto dot = text.find('.', start);
    const std::string_view part =
      text.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    if (!all_digits(part) || count == 4) {
      return false;
    }
    std::from_chars(part.data(), part.data() + part.size(), parts[count]);
    ++count;
    if (dot == std::string_view::npos) {
      break;
    }
    start = dot + 1;
  }
  if (count < 3) {
    return false;
  }
  return parts[1] >= 1 && parts[1] <= 12 && parts[2] >= 1 && parts[2] <= 31 &&
         (count < 4 || parts[3] <= 24);
}

ValueCheckResult check_simple(std::string_view text, const schema::SimpleValue & rule)
{
  using schema::SimpleType;

  switch (rule.type) {
    case SimpleType::Bool:
      if (is_bool(text)) {
        return ValueCheckResult::success();
      }
      return ValueCheckResult::mismatch(fmt::format("expected yes or no, found '{}'", text));

    case SimpleType::Int:
      if (!is_int(text)) {
        return ValueCheckResult::mismatch(fmt::format("expected an integer, found '{}'", text));
      }
      return check_range(*parse_number(text), rule.range);

    case SimpleType::Float: {
      const auto v = parse_number(text);
      if (!v) {
        return ValueCheckResult::mismatch(fmt::format("expected a number, found '{}'", text));
      }
      return check_range(*v, rule.range);
    }

    case SimpleType::PercentageField: {
      std::string_view digits = text;
      if (!digits.empty() && digits.back() == '%') {
        digits.remove_suffix(1);
      }
      if (!is_number(digits)) {
        return ValueCheckResult::mismatch(fmt::format("expected a percentage, found '{}'", text));
      }
      return ValueCheckResult::success();
    }

    case SimpleType::DateField:
      if (is_date(text)) {
        return ValueCheckResult::success();
      }
      return ValueCheckResult::mismatch(fmt::format("expected a date (y.m.d), found '{}'", text));

    case SimpleType::IntVariableField:
    case SimpleType::IntValueField:
      // Identifiers name variables or script values; numbers must be whole.
      if (is_number(text) && !is_int(text)) {
        return ValueCheckResult::mismatch(fmt::format("expected an integer, found '{}'", text));
      }
      if (is_int(text)) {
        return check_range(*parse_number(text), rule.range);
      }
      return ValueCheckResult::success();

    case SimpleType::VariableField:
    case SimpleType::ValueField:
      if (const auto v = parse_number(text)) {
        return check_range(*v, rule.range);
      }
      return ValueCheckResult::success();

    case SimpleType::Scalar:
    case SimpleType::Localisation:
    case SimpleType::LocalisationSynced:
    case SimpleType::LocalisationInline:
    case SimpleType::ScopeField:
    case SimpleType::Filepath:
    case SimpleType::Icon:
      return ValueCheckResult::success();
  }
  return ValueCheckResult::success();
}

}  // namespace cwcheck::sema
