// cwcheck/basic/diagnostic_printer.cpp - rustc-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "cwcheck/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

namespace cwcheck
{

namespace
{

constexpr uint32_t k_tab_width = 4;

uint32_t visual_width(std::string_view text)
{
  uint32_t width = 0;
  for (const char c : text) {
    width += c == '\t' ? k_tab_width : 1;
  }
  return width;
}

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out.append(k_tab_width, ' ');
    } else {
      out += c;
    }
  }
  return out;
}

/// Byte slice of `line` between two 1-based columns, clamped to the line.
std::string_view columns(std::string_view line, uint32_t from_col, uint32_t to_col)
{
  const size_t from = std::min<size_t>(from_col > 0 ? from_col - 1 : 0, line.size());
  const size_t to = std::min<size_t>(to_col > 0 ? to_col - 1 : 0, line.size());
  return to > from ? line.substr(from, to - from) : std::string_view{};
}

rang::fg severity_color(Severity s)
{
  switch (s) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Info:
      return rang::fg::cyan;
    case Severity::Hint:
      return rang::fg::green;
  }
  return rang::fg::reset;
}

bool shown(const Diagnostic & d, Severity min_severity)
{
  return static_cast<int>(d.severity) <= static_cast<int>(min_severity);
}

std::vector<const Diagnostic *> in_print_order(
  const std::vector<Diagnostic> & diags, const SourceRegistry & sources)
{
  std::vector<const Diagnostic *> out;
  out.reserve(diags.size());
  for (const auto & d : diags) {
    out.push_back(&d);
  }
  const auto key = [&sources](const Diagnostic * d) {
    const SourceRange r = d->primary_range();
    const std::string path = r.is_valid() ? sources.get_path(r.file_id()).generic_string() : std::string();
    return std::make_tuple(path, r.begin_offset());
  };
  std::stable_sort(out.begin(), out.end(), [&key](const Diagnostic * a, const Diagnostic * b) {
    return key(a) < key(b);
  });
  return out;
}

}  // namespace

std::string display_path(const fs::path & path)
{
  if (!path.is_absolute()) {
    return path.generic_string();
  }
  std::error_code ec;
  const fs::path base = fs::current_path(ec);
  if (ec) {
    return path.generic_string();
  }
  const fs::path rel = fs::relative(path, base, ec);
  return ec || rel.empty() ? path.generic_string() : rel.generic_string();
}

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: DiagnosticPrinter(os, DiagnosticPrintOptions{use_color, Severity::Hint})
{
}

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, DiagnosticPrintOptions options)
: os_(os), options_(options)
{
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  uint32_t last_line = 1;
  for (const auto & label : diag.labels) {
    const FullSourceRange fr = sources.get_full_range(label.range);
    if (fr.is_valid()) {
      last_line = std::max(last_line, std::max(fr.start_line, fr.end_line));
    }
  }
  gutter_width_ = std::to_string(last_line).size();

  print_header(diag);

  const SourceRange primary = diag.primary_range();
  print_location("-->", primary, sources);
  gutter();

  FileId current = primary.file_id();
  for (const auto & label : diag.labels) {
    const SourceFile * source =
      label.range.is_valid() ? sources.get_file(label.range.file_id()) : nullptr;
    if (source == nullptr) {
      if (!label.message.empty()) {
        print_trailer("note", label.message);
      }
      continue;
    }
    if (label.range.file_id() != current) {
      print_location(":::", label.range, sources);
      gutter();
      current = label.range.file_id();
    }
    print_label(label, *source);
  }

  if (diag.cardinality) {
    const auto & c = *diag.cardinality;
    const std::string max = c.max ? std::to_string(*c.max) : std::string("inf");
    print_trailer(
      "note", fmt::format("{} occurrence{}, allowed {}..{}", c.count, c.count == 1 ? "" : "s", c.min, max));
  }
  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }
  fmt::print(os_, "\n");
}

DiagnosticCounts DiagnosticPrinter::print_all(
  const std::vector<Diagnostic> & diags, const SourceRegistry & sources)
{
  DiagnosticCounts counts;
  for (const auto * d : in_print_order(diags, sources)) {
    if (!shown(*d, options_.min_severity)) {
      ++counts.hidden;
      continue;
    }
    print(*d, sources);
    switch (d->severity) {
      case Severity::Error:
        ++counts.errors;
        break;
      case Severity::Warning:
        ++counts.warnings;
        break;
      case Severity::Info:
      case Severity::Hint:
        ++counts.other;
        break;
    }
  }
  print_summary(counts);
  return counts;
}

DiagnosticCounts DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  return print_all(diags.all(), sources);
}

// ============================================================================
// Pieces
// ============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  std::string head(to_string(diag.severity));
  if (!diag.code().empty()) {
    head = fmt::format("{}[{}]", head, diag.code());
  }
  if (!options_.use_color) {
    fmt::print(os_, "{}: {}\n", head, diag.message);
    return;
  }
  os_ << rang::style::bold << severity_color(diag.severity) << head << rang::fg::reset << ": "
      << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_location(
  std::string_view arrow, SourceRange range, const SourceRegistry & sources)
{
  std::string where = "<unknown>";
  if (range.is_valid() && sources.get_file(range.file_id()) != nullptr) {
    where = display_path(sources.get_path(range.file_id()));
    const FullSourceRange fr = sources.get_full_range(range);
    if (fr.is_valid()) {
      where = fmt::format("{}:{}:{}", where, fr.start_line, fr.start_column);
    }
  }
  const std::string pad(gutter_width_, ' ');
  if (options_.use_color) {
    os_ << pad << rang::fg::cyan << rang::style::bold << arrow << rang::style::reset << rang::fg::reset;
    fmt::print(os_, " {}\n", where);
  } else {
    fmt::print(os_, "{}{} {}\n", pad, arrow, where);
  }
}

void DiagnosticPrinter::print_label(const Label & label, const SourceFile & source)
{
  const FullSourceRange fr = source.get_full_range(label.range);
  if (!fr.is_valid()) {
    return;
  }

  if (fr.end_line <= fr.start_line) {
    print_code_line(source, fr.start_line);
    print_marker(source, fr.start_line, fr.start_column, fr.end_column, label.style, label.message);
    return;
  }

  // Multi-line span: mark the rest of the first line and the head of the last.
  const std::string_view first = source.get_line(fr.start_line - 1);
  print_code_line(source, fr.start_line);
  print_marker(
    source, fr.start_line, fr.start_column, static_cast<uint32_t>(first.size()) + 1, label.style, {});
  if (fr.end_line > fr.start_line + 1) {
    fmt::print(os_, "...\n");
  }
  const std::string_view last = source.get_line(fr.end_line - 1);
  const auto indent = last.find_first_not_of(" \t");
  const uint32_t from = indent == std::string_view::npos ? 1 : static_cast<uint32_t>(indent) + 1;
  print_code_line(source, fr.end_line);
  print_marker(source, fr.end_line, from, fr.end_column, label.style, label.message);
}

void DiagnosticPrinter::print_code_line(const SourceFile & source, uint32_t line)
{
  const std::string text = expand_tabs(source.get_line(line - 1));
  const std::string number = fmt::format("{:>{}}", line, gutter_width_);
  if (options_.use_color) {
    os_ << rang::fg::cyan << rang::style::bold << number << " |" << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{} |", number);
  }
  if (!text.empty()) {
    fmt::print(os_, " {}", text);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_marker(
  const SourceFile & source, uint32_t line, uint32_t from_col, uint32_t to_col, LabelStyle style,
  std::string_view message)
{
  const std::string_view text = source.get_line(line - 1);
  const uint32_t offset = visual_width(columns(text, 1, from_col));
  const uint32_t length = std::max<uint32_t>(1, visual_width(columns(text, from_col, to_col)));
  const char mark = style == LabelStyle::Primary ? '^' : '-';

  std::string body = std::string(offset, ' ') + std::string(length, mark);
  if (!message.empty()) {
    body = fmt::format("{} {}", body, message);
  }

  const std::string pad(gutter_width_, ' ');
  if (!options_.use_color) {
    fmt::print(os_, "{} | {}\n", pad, body);
    return;
  }
  os_ << pad << rang::fg::cyan << rang::style::bold << " | " << rang::style::reset << rang::fg::reset;
  if (style == LabelStyle::Primary) {
    os_ << rang::fg::red << rang::style::bold;
  } else {
    os_ << rang::fg::cyan;
  }
  os_ << body << rang::style::reset << rang::fg::reset << "\n";
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  gutter();
  const std::string pad(gutter_width_, ' ');
  if (options_.use_color) {
    os_ << pad << rang::fg::cyan << rang::style::bold << " = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
  } else {
    fmt::print(os_, "{} = {}: {}\n", pad, kind, message);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticCounts & counts)
{
  if (counts.errors == 0 && counts.warnings == 0 && counts.other == 0 && counts.hidden == 0) {
    return;
  }
  std::string line = fmt::format(
    "{} error{}, {} warning{} emitted", counts.errors, counts.errors == 1 ? "" : "s",
    counts.warnings, counts.warnings == 1 ? "" : "s");
  if (counts.hidden > 0) {
    line = fmt::format("{} ({} hidden)", line, counts.hidden);
  }
  if (options_.use_color) {
    os_ << rang::style::bold << line << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", line);
  }
}

void DiagnosticPrinter::gutter()
{
  const std::string pad(gutter_width_, ' ');
  if (options_.use_color) {
    os_ << pad << rang::fg::cyan << rang::style::bold << " |" << rang::style::reset << rang::fg::reset << "\n";
  } else {
    fmt::print(os_, "{} |\n", pad);
  }
}

std::string render_diagnostics(const std::vector<Diagnostic> & diags, const SourceRegistry & sources)
{
  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  for (const auto * d : in_print_order(diags, sources)) {
    printer.print(*d, sources);
  }
  return os.str();
}

}  // namespace cwcheck
