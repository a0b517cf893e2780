// cwcheck/syntax/frontend.cpp - High-level parse pipeline
#include "cwcheck/syntax/frontend.hpp"

#include "cwcheck/syntax/parser.hpp"

namespace cwcheck
{

namespace
{

Block parse_text(FileId file_id, std::string_view text, syntax::LexMode mode, DiagnosticBag & diags)
{
  syntax::Lexer lexer(file_id, text, mode);
  const std::vector<syntax::Token> tokens = lexer.lex_all();
  syntax::Parser parser(file_id, tokens, diags, mode);
  return parser.parse_file(static_cast<uint32_t>(text.size()));
}

}  // namespace

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  DiagnosticBag & diags, syntax::LexMode mode)
{
  ParseOutput out;
  const auto existing = sources.find_by_path(path);
  if (existing) {
    sources.update_content(*existing, std::move(source_text));
    out.file_id = *existing;
  } else {
    out.file_id = sources.register_file(path, std::move(source_text));
  }

  const SourceFile * file = sources.get_file(out.file_id);
  if (file == nullptr) {
    diags.report_error({}, "failed to register source file: " + path.generic_string())
      .with_code(RuleCode::SyntaxError);
    return out;
  }

  out.root = parse_text(out.file_id, file->content(), mode, diags);
  return out;
}

std::shared_ptr<const ParsedScript> parse_script(
  FileId file_id, std::shared_ptr<const SourceFile> source, syntax::LexMode mode)
{
  auto parsed = std::make_shared<ParsedScript>();
  parsed->file_id = file_id;
  parsed->source = std::move(source);

  DiagnosticBag diags;
  if (parsed->source != nullptr) {
    parsed->root = parse_text(file_id, parsed->source->content(), mode, diags);
  }
  parsed->diagnostics = diags.take();
  return parsed;
}

}  // namespace cwcheck
