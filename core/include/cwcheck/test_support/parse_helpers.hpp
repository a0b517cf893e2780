// cwcheck/test_support/parse_helpers.hpp - helpers for unit tests
//
// Lightweight single-file pipelines: parse a script, load a schema from text,
// validate a script against it. Ownership stays explicit (SourceRegistry,
// SchemaRegistry, SymbolIndex) behind small wrappers.
//
#pragma once

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "cwcheck/basic/diagnostic.hpp"
#include "cwcheck/basic/source_manager.hpp"
#include "cwcheck/schema/schema_registry.hpp"
#include "cwcheck/sema/localisation.hpp"
#include "cwcheck/sema/symbol_extractor.hpp"
#include "cwcheck/sema/symbol_index.hpp"
#include "cwcheck/sema/validator.hpp"
#include "cwcheck/syntax/frontend.hpp"

namespace cwcheck::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  Block root;
  DiagnosticBag diags;

  [[nodiscard]] const SourceFile * source_file() const noexcept { return sources.get_file(file_id); }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept { return sources.get_slice(r); }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return sources.get_full_range(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.txt")
{
  TestParseUnit out;
  ParseOutput parsed = parse_source(out.sources, virtual_path, std::move(src), out.diags);
  out.file_id = parsed.file_id;
  out.root = std::move(parsed.root);
  return out;
}

struct TestSchema
{
  SourceRegistry sources;
  schema::SchemaRegistry registry;
  schema::SchemaLoadResult result;

  [[nodiscard]] bool ok() const noexcept { return result.success; }
  [[nodiscard]] const schema::SchemaSnapshot & snap() const { return *result.snapshot; }
};

/// Load one CWT text; a heap object because SchemaRegistry is not movable.
[[nodiscard]] inline std::unique_ptr<TestSchema> load_schema(
  std::string cwt, const std::filesystem::path & virtual_path = "<test>.cwt")
{
  auto out = std::make_unique<TestSchema>();
  out->result = out->registry.load(out->sources, {schema::SchemaSource{virtual_path, std::move(cwt)}});
  return out;
}

/**
 * Parse `script`, index its symbols and validate it as a document at
 * `relative_path`. Symbols of `extra` scripts (path, text) are indexed first
 * so cross-file references resolve. All files share one registry.
 */
struct TestValidation
{
  SourceRegistry sources;
  DiagnosticBag parse_diags;
  FileId file_id = FileId::invalid();
  Block root;
  std::vector<Block> extra_roots;
  sema::SymbolIndex index;
  std::vector<Diagnostic> diagnostics;

  [[nodiscard]] size_t count(RuleCode rule) const
  {
    return static_cast<size_t>(std::count_if(
      diagnostics.begin(), diagnostics.end(), [rule](const Diagnostic & d) { return d.rule == rule; }));
  }

  [[nodiscard]] const Diagnostic * first(RuleCode rule) const
  {
    const auto it = std::find_if(
      diagnostics.begin(), diagnostics.end(), [rule](const Diagnostic & d) { return d.rule == rule; });
    return it == diagnostics.end() ? nullptr : &*it;
  }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept { return sources.get_slice(r); }
};

[[nodiscard]] inline std::unique_ptr<TestValidation> validate(
  const TestSchema & schema, std::string script, const std::string & relative_path,
  sema::ValidationOptions options = {}, const sema::LocalisationOracle * localisation = nullptr,
  std::vector<std::pair<std::string, std::string>> extra = {})
{
  auto out = std::make_unique<TestValidation>();
  const sema::SymbolExtractor extractor(schema.snap());

  for (auto & [path, text] : extra) {
    ParseOutput parsed = parse_source(out->sources, path, std::move(text), out->parse_diags);
    (void)out->index.replace_document_symbols(parsed.file_id, extractor.extract(parsed.root, path));
    out->extra_roots.push_back(std::move(parsed.root));
  }

  ParseOutput parsed = parse_source(out->sources, relative_path, std::move(script), out->parse_diags);
  out->file_id = parsed.file_id;
  out->root = std::move(parsed.root);
  (void)out->index.replace_document_symbols(out->file_id, extractor.extract(out->root, relative_path));

  sema::ValidationContext ctx;
  ctx.schema = &schema.snap();
  ctx.symbols = &out->index;
  ctx.localisation = localisation;
  ctx.options = options;
  sema::Validator validator(ctx);
  auto diags = validator.validate_document(out->root, relative_path);
  if (diags) {
    out->diagnostics = std::move(*diags);
  }
  return out;
}

}  // namespace cwcheck::test_support
