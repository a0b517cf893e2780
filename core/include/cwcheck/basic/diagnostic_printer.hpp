// cwcheck/basic/diagnostic_printer.hpp
//
// Terminal rendering of script and schema diagnostics.
//
#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "cwcheck/basic/diagnostic.hpp"
#include "cwcheck/basic/source_manager.hpp"

namespace cwcheck
{

struct DiagnosticPrintOptions
{
  bool use_color = true;
  /// Diagnostics less severe than this are skipped (and counted as hidden).
  Severity min_severity = Severity::Hint;
};

struct DiagnosticCounts
{
  size_t errors = 0;
  size_t warnings = 0;
  size_t other = 0;
  size_t hidden = 0;
};

/**
 * Prints diagnostics in the style of rustc:
 *
 *   error[cardinality-violation]: 'hidden' occurs 2 times, expected at most 1
 *    --> events/my_events.txt:5:3
 *     |
 *   5 |   hidden = yes
 *     |   ^^^^^^ second occurrence
 *     |
 *     = note: 2 occurrences, allowed 0..1
 *
 * A label in another file than the one before it gets its own `:::` location
 * line. A label spanning several lines (a whole block, usually) marks its
 * first and last line with `...` in between.
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);
  DiagnosticPrinter(std::ostream & os, DiagnosticPrintOptions options);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print sorted by file then position, then a summary line (if anything was printed).
  DiagnosticCounts print_all(const std::vector<Diagnostic> & diags, const SourceRegistry & sources);
  DiagnosticCounts print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_header(const Diagnostic & diag);
  void print_location(std::string_view arrow, SourceRange range, const SourceRegistry & sources);
  void print_label(const Label & label, const SourceFile & source);
  void print_code_line(const SourceFile & source, uint32_t line);
  void print_marker(
    const SourceFile & source, uint32_t line, uint32_t from_col, uint32_t to_col, LabelStyle style,
    std::string_view message);
  void print_trailer(std::string_view kind, std::string_view message);
  void print_summary(const DiagnosticCounts & counts);

  void gutter();

  std::ostream & os_;
  DiagnosticPrintOptions options_;
  size_t gutter_width_ = 1;
};

/// Uncoloured rendering of `diags`, sorted, without the summary line.
[[nodiscard]] std::string render_diagnostics(
  const std::vector<Diagnostic> & diags, const SourceRegistry & sources);

/// `path` relative to the working directory when it is absolute.
[[nodiscard]] std::string display_path(const fs::path & path);

}  // namespace cwcheck
