// cwcheck/analysis/analysis_store.hpp - Incremental per-document analysis cache
#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cwcheck/analysis/completion.hpp"
#include "cwcheck/analysis/document.hpp"
#include "cwcheck/analysis/worker_pool.hpp"
#include "cwcheck/basic/diagnostic.hpp"
#include "cwcheck/basic/source_manager.hpp"
#include "cwcheck/schema/schema_registry.hpp"
#include "cwcheck/sema/localisation.hpp"
#include "cwcheck/sema/symbol_index.hpp"
#include "cwcheck/sema/validator.hpp"

namespace cwcheck::analysis
{

struct StoreOptions
{
  sema::ValidationOptions validation;
  size_t workers = 0;  ///< 0 = hardware concurrency
};

/// One file handed to open_many: (workspace-relative path, text).
using SourceText = std::pair<std::string, std::string>;

/**
 * Caches AST, symbols and diagnostics per document and revalidates on the
 * worker pool.
 *
 * Every public member is thread-safe. At most one validation per document is
 * in flight; an edit during validation cancels the stale run and schedules a
 * rerun, so the published diagnostics always belong to the current revision.
 */
class AnalysisStore
{
public:
  explicit AnalysisStore(StoreOptions options = {});
  ~AnalysisStore();

  AnalysisStore(const AnalysisStore &) = delete;
  AnalysisStore & operator=(const AnalysisStore &) = delete;

  // ---------------------------------------------------------------------------
  // Inputs
  // ---------------------------------------------------------------------------

  /**
   * Replace the schema. On success every document's symbols are re-extracted
   * and every document is revalidated; on failure nothing changes.
   */
  schema::SchemaLoadResult load_schema(const std::vector<schema::SchemaSource> & sources);

  void set_localisation(std::shared_ptr<const sema::LocalisationOracle> oracle);

  void open(std::string path, std::string text);
  void change(std::string_view path, std::string text);
  void close(std::string_view path);

  /// Bulk scan: parse and extract in parallel, then validate in parallel.
  void open_many(std::vector<SourceText> files);

  // ---------------------------------------------------------------------------
  // Queries
  // ---------------------------------------------------------------------------

  /// Diagnostics of the current revision; waits for an in-flight validation.
  [[nodiscard]] std::vector<Diagnostic> diagnostics(std::string_view path);

  /// diagnostics(path) rendered for a terminal, without colors.
  [[nodiscard]] std::string diagnostics_text(std::string_view path);

  /// Every instance of `type` in the workspace.
  [[nodiscard]] std::vector<sema::SymbolLocation> symbols(std::string_view type) const;

  /// Declarations contributed by one document.
  [[nodiscard]] std::vector<sema::SymbolDecl> document_symbols(std::string_view path) const;

  [[nodiscard]] std::vector<sema::SymbolLocation> definition(std::string_view type, std::string_view name) const;

  [[nodiscard]] std::vector<CompletionItem> completion(std::string_view path, uint32_t offset) const;

  [[nodiscard]] std::shared_ptr<const ParsedScript> parsed(std::string_view path) const;

  /// Current revision; 0 for unknown paths.
  [[nodiscard]] uint64_t revision(std::string_view path) const;

  [[nodiscard]] bool has_document(std::string_view path) const;
  [[nodiscard]] std::vector<std::string> document_paths() const;

  /// Block until no validation is queued or running.
  void wait_idle();

  /// Engine defects caught at the task boundary, as "path: message".
  [[nodiscard]] std::vector<std::string> engine_errors() const;

  [[nodiscard]] std::shared_ptr<const schema::SchemaSnapshot> schema() const { return registry_.snapshot(); }
  [[nodiscard]] const sema::SymbolIndex & index() const noexcept { return index_; }

  // Source mapping for hosts
  [[nodiscard]] std::string path_of(FileId file) const;
  [[nodiscard]] FullSourceRange full_range(SourceRange range) const;

private:
  using DocumentPtr = std::shared_ptr<Document>;

  struct Prepared
  {
    DocumentPtr doc;
    uint64_t revision = 0;
    FileId file_id = FileId::invalid();
    std::shared_ptr<const SourceFile> source;
    std::shared_ptr<const ParsedScript> parsed;
    std::vector<sema::SymbolDecl> symbols;
    uint64_t generation = 0;  ///< schema generation the symbols were extracted with
  };

  [[nodiscard]] static std::string normalize(std::string_view path);
  /// Lock held.
  [[nodiscard]] DocumentPtr find(std::string_view path) const;

  /// Register the text and bump the revision (lock held).
  Prepared begin_update(const std::string & path, std::string text);
  void parse_and_extract(Prepared & p, const schema::SchemaSnapshot & snap) const;
  void extract(Prepared & p, const schema::SchemaSnapshot & snap) const;
  /// Install a prepared document if it is still current (lock held).
  void install(Prepared & p);

  /// Lock held.
  void schedule(const DocumentPtr & doc);
  void schedule_dependents(const std::vector<sema::SymbolGroup> & changed, const Document * except);
  void run_validation(const DocumentPtr & doc);

  StoreOptions options_;
  schema::SchemaRegistry registry_;
  sema::SymbolIndex index_;

  mutable std::mutex mutex_;
  std::condition_variable published_cv_;
  SourceRegistry sources_;
  std::unordered_map<std::string, DocumentPtr> docs_;
  std::shared_ptr<const sema::LocalisationOracle> localisation_;
  std::vector<std::string> engine_errors_;

  WorkerPool pool_;
};

}  // namespace cwcheck::analysis
