// cwcheck/diff/changeset_printer.hpp
//
// Renders changesets as terminal text or JSON.
//
#pragma once

#include <iosfwd>
#include <string>

#include <nlohmann/json.hpp>

#include "cwcheck/diff/diff_engine.hpp"

namespace cwcheck::diff
{

/**
 * Print one line per change:
 *
 *   + events/foo[bar]/hidden: yes
 *   - events/foo[bar]/trigger/has_flag: x
 *   ~ events/foo[bar]/mean_time_to_happen/days: 10 -> 20
 *
 * followed by a summary line. Non-`=` operators are printed before the value,
 * and a `[[PARAM]]` guard before both.
 */
void print_changeset(std::ostream & os, const Changeset & changes, bool use_color = true);

/**
 * Parse problems of either input (errors and warnings, with source context
 * from `sources`), then the changeset. The changeset of an input that failed
 * to parse covers only what the parser recovered.
 */
void print_diff_result(
  std::ostream & os, const DiffResult & result, const SourceRegistry & sources, bool use_color = true);

/// Uncoloured text, same layout as print_changeset without the summary.
[[nodiscard]] std::string format_changeset(const Changeset & changes);

/**
 * `[{ "kind": "Changed", "path": "a/b", "old": "1", "new": "2",
 *     "oldOp": "=", "newOp": "=" }, ...]`
 *
 * `old` / `oldOp` are omitted for Added, `new` / `newOp` for Removed.
 * `oldCondition` / `newCondition` (`"PARAM"` or `"!PARAM"`) appear for guarded entries.
 */
[[nodiscard]] nlohmann::json changeset_to_json(const Changeset & changes);

}  // namespace cwcheck::diff
