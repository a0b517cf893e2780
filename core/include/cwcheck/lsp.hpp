// cwcheck/lsp.hpp - LSP-like language service APIs (serverless)
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cwcheck
{
struct EngineConfig;
}

namespace cwcheck::lsp
{

/// (uri, text)
using TextFile = std::pair<std::string, std::string>;

/**
 * Serverless language service for mod scripts.
 *
 * Provides diagnostics, completion, go-to-definition and symbol listings on
 * top of the incremental AnalysisStore without implementing an LSP server.
 * Every query returns a JSON string for the host.
 *
 * Positions are UTF-8 byte offsets. `file://` URIs are mapped to
 * workspace-relative paths by stripping the configured workspace roots, so
 * schema path filters (`path = "game/events"`) see the path they expect.
 */
class Workspace
{
public:
  Workspace();
  explicit Workspace(const EngineConfig & config);
  ~Workspace();

  Workspace(const Workspace &) = delete;
  Workspace & operator=(const Workspace &) = delete;

  Workspace(Workspace && other) noexcept;
  Workspace & operator=(Workspace && other) noexcept;

  // Schema
  //
  // Returns `{ "success": bool, "generation": n, "items": [diagnostic...] }`.
  // A failed load keeps the previous schema.
  std::string load_schema_text(const std::vector<TextFile> & files);
  std::string load_schema_files(const std::vector<std::filesystem::path> & paths);

  // Localisation keys known to the host; replaces the previous set.
  void set_localisation_keys(const std::vector<std::string> & keys);

  // Documents
  void set_document(std::string uri, std::string text);
  void set_documents(std::vector<TextFile> documents);
  void remove_document(std::string_view uri);
  [[nodiscard]] bool has_document(std::string_view uri) const;

  // Diagnostics (parse + validation) of the current revision
  std::string diagnostics_json(std::string_view uri);
  // Same diagnostics rendered for a terminal
  std::string diagnostics_text(std::string_view uri);

  // Completion
  std::string completion_json(std::string_view uri, uint32_t byte_offset);

  // Go-to-definition of the type instance named under the cursor
  std::string definition_json(std::string_view uri, uint32_t byte_offset);

  // Every instance of one schema type across the workspace
  std::string symbols_json(std::string_view type);

  // Declarations of one document (outline)
  std::string document_symbols_json(std::string_view uri);

  // Structural changeset between two open documents
  std::string diff_json(std::string_view uri_a, std::string_view uri_b);

  // Parsed tree of the current revision (`"ast": null` when unknown)
  std::string ast_json(std::string_view uri);

private:
  struct Impl;
  Impl * impl_;
};

}  // namespace cwcheck::lsp
