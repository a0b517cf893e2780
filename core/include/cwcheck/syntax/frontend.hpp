// cwcheck/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "cwcheck/ast/ast.hpp"
#include "cwcheck/basic/diagnostic.hpp"
#include "cwcheck/basic/source_manager.hpp"
#include "cwcheck/syntax/lexer.hpp"

namespace cwcheck
{

/**
 * Result of parsing one source buffer. Immutable once built; shared between
 * the analysis store, validation workers and query callers.
 */
struct ParsedScript
{
  FileId file_id = FileId::invalid();
  std::shared_ptr<const SourceFile> source;
  Block root;
  std::vector<Diagnostic> diagnostics;  ///< parse-level only
};

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  Block root;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  DiagnosticBag & diags, syntax::LexMode mode = syntax::LexMode::Script);

/// Parse an already-registered immutable source file.
[[nodiscard]] std::shared_ptr<const ParsedScript> parse_script(
  FileId file_id, std::shared_ptr<const SourceFile> source,
  syntax::LexMode mode = syntax::LexMode::Script);

}  // namespace cwcheck
