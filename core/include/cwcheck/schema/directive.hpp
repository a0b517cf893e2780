// cwcheck/schema/directive.hpp - `##` directive parsing
#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "cwcheck/ast/ast.hpp"
#include "cwcheck/schema/schema.hpp"

namespace cwcheck::schema
{

/// `a..b`, `~a..b`, `a..inf`.
[[nodiscard]] std::expected<Cardinality, std::string> parse_cardinality(std::string_view text);

/// Numeric range as written inside `int[...]` / `float[...]`: `a..b` or `a...b`.
/// `inf` / `-inf` bounds map to the extremes of double.
[[nodiscard]] std::expected<NumericRange, std::string> parse_numeric_range(std::string_view text);

/**
 * Apply one `##` directive (payload without the markers) to `options`.
 *
 * Directives that the engine does not interpret (display_name, graph hints)
 * are accepted and ignored. A recognised directive with a bad value is an
 * error.
 */
[[nodiscard]] std::expected<void, std::string> apply_directive(std::string_view text, RuleOptions & options);

/**
 * Fold every annotation attached to an entry into RuleOptions. `###` doc
 * comments accumulate into `doc`, one line each.
 *
 * @return The options, or the message of the first malformed directive
 */
[[nodiscard]] std::expected<RuleOptions, std::string> parse_directives(
  const std::vector<Annotation> & annotations);

}  // namespace cwcheck::schema
