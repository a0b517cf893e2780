// cwcheck/analysis/analysis_store.cpp - Incremental per-document analysis cache
#include "cwcheck/analysis/analysis_store.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <fmt/format.h>
#include <iterator>
#include <optional>

#include "cwcheck/basic/diagnostic_printer.hpp"
#include "cwcheck/basic/log.hpp"
#include "cwcheck/sema/symbol_extractor.hpp"

namespace cwcheck::analysis
{

AnalysisStore::AnalysisStore(StoreOptions options) : options_(options), pool_(options.workers) {}

AnalysisStore::~AnalysisStore()
{
  {
    std::lock_guard lock(mutex_);
    for (auto & [path, doc] : docs_) {
      doc->closed = true;
      doc->epoch.fetch_add(1, std::memory_order_release);
    }
  }
  pool_.wait_idle();
}

// ============================================================================
// Helpers
// ============================================================================

std::string AnalysisStore::normalize(std::string_view path)
{
  std::string out(path);
  std::replace(out.begin(), out.end(), '\\', '/');
  while (out.size() >= 2 && out[0] == '.' && out[1] == '/') {
    out.erase(0, 2);
  }
  return out;
}

AnalysisStore::DocumentPtr AnalysisStore::find(std::string_view path) const
{
  const auto it = docs_.find(normalize(path));
  return it == docs_.end() ? nullptr : it->second;
}

AnalysisStore::Prepared AnalysisStore::begin_update(const std::string & path, std::string text)
{
  auto & slot = docs_[path];
  if (!slot) {
    slot = std::make_shared<Document>();
    slot->path = path;
  }
  Document & doc = *slot;

  if (const auto existing = sources_.find_by_path(path)) {
    doc.file_id = *existing;
    sources_.update_content(doc.file_id, std::move(text));
  } else {
    doc.file_id = sources_.register_file(path, std::move(text));
  }
  ++doc.revision;
  doc.pending = true;

  Prepared p;
  p.doc = slot;
  p.revision = doc.revision;
  p.file_id = doc.file_id;
  p.source = sources_.share_file(doc.file_id);
  return p;
}

void AnalysisStore::parse_and_extract(Prepared & p, const schema::SchemaSnapshot & snap) const
{
  p.parsed = parse_script(p.file_id, p.source);
  extract(p, snap);
}

void AnalysisStore::extract(Prepared & p, const schema::SchemaSnapshot & snap) const
{
  p.symbols = sema::SymbolExtractor(snap).extract(p.parsed->root, p.doc->path);
  p.generation = snap.generation();
}

void AnalysisStore::install(Prepared & p)
{
  Document & doc = *p.doc;
  if (doc.closed || doc.revision != p.revision) {
    return;
  }
  // The schema may have been replaced while parsing.
  if (const auto snap = registry_.snapshot(); snap->generation() != p.generation) {
    extract(p, *snap);
  }
  doc.parsed = p.parsed;
  const auto changed = index_.replace_document_symbols(doc.file_id, std::move(p.symbols));
  schedule(p.doc);
  schedule_dependents(changed, &doc);
}

void AnalysisStore::schedule(const DocumentPtr & doc)
{
  doc->epoch.fetch_add(1, std::memory_order_release);
  doc->pending = true;
  if (doc->in_flight) {
    return;
  }
  doc->in_flight = true;
  pool_.submit([this, doc] { run_validation(doc); });
}

void AnalysisStore::schedule_dependents(const std::vector<sema::SymbolGroup> & changed, const Document * except)
{
  if (changed.empty()) {
    return;
  }
  for (auto & [path, doc] : docs_) {
    if (doc.get() == except || doc->parsed == nullptr) {
      continue;
    }
    // A run in flight may already have read the index before this change.
    const bool depends = doc->in_flight ||
                         std::any_of(changed.begin(), changed.end(), [&](const sema::SymbolGroup & g) {
                           return doc->referenced.contains(g);
                         });
    if (depends) {
      log::debug("revalidating '{}' after symbol changes", path);
      schedule(doc);
    }
  }
}

// ============================================================================
// Validation task
// ============================================================================

void AnalysisStore::run_validation(const DocumentPtr & doc)
{
  std::shared_ptr<const ParsedScript> parsed;
  std::shared_ptr<const sema::LocalisationOracle> oracle;
  uint64_t epoch = 0;
  {
    std::lock_guard lock(mutex_);
    if (doc->closed) {
      doc->in_flight = false;
      published_cv_.notify_all();
      return;
    }
    parsed = doc->parsed;
    oracle = localisation_;
    epoch = doc->epoch.load(std::memory_order_acquire);
  }

  const auto snap = registry_.snapshot();
  sema::ValidationContext ctx;
  ctx.schema = snap.get();
  ctx.symbols = &index_;
  ctx.localisation = oracle.get();
  ctx.options = options_.validation;
  ctx.cancel = sema::CancellationCheck(&doc->epoch, epoch);

  std::optional<std::vector<Diagnostic>> result;
  std::set<sema::SymbolGroup> referenced;
  std::optional<std::string> failure;
  try {
    sema::Validator validator(ctx);
    result = validator.validate_document(parsed->root, doc->path);
    referenced = validator.referenced_groups();
  } catch (const EngineError & e) {
    failure = e.what();
  } catch (const std::exception & e) {
    // Anything else escaping the validator must still release the document.
    failure = fmt::format("unexpected exception: {}", e.what());
  }

  std::lock_guard lock(mutex_);
  if (failure) {
    log::error("engine error while validating '{}': {}", doc->path, *failure);
    engine_errors_.push_back(fmt::format("{}: {}", doc->path, *failure));
  }

  const bool current = !doc->closed && doc->epoch.load(std::memory_order_acquire) == epoch;
  if (current && (result || failure)) {
    std::vector<Diagnostic> out = parsed->diagnostics;
    if (result) {
      out.insert(out.end(), std::make_move_iterator(result->begin()), std::make_move_iterator(result->end()));
      doc->referenced = std::move(referenced);
    }
    const size_t max = options_.validation.max_diagnostics;
    if (max > 0 && out.size() > max) {
      out.resize(max);
    }
    doc->diagnostics = std::move(out);
    doc->published_revision = doc->revision;
    doc->pending = false;
    doc->in_flight = false;
    log::trace(
      "published {} diagnostics for '{}' at revision {}", doc->diagnostics.size(), doc->path, doc->revision);
  } else if (!doc->closed) {
    // Superseded while running: validate the newer state.
    pool_.submit([this, doc] { run_validation(doc); });
  } else {
    doc->in_flight = false;
  }
  published_cv_.notify_all();
}

// ============================================================================
// Inputs
// ============================================================================

schema::SchemaLoadResult AnalysisStore::load_schema(const std::vector<schema::SchemaSource> & sources)
{
  schema::SchemaLoadResult result;
  {
    std::lock_guard lock(mutex_);
    result = registry_.load(sources_, sources);
  }
  if (!result.success) {
    return result;
  }

  // Full rebuild: the old symbols were extracted with the old schema.
  std::vector<Prepared> prepared;
  {
    std::lock_guard lock(mutex_);
    index_.clear();
    for (const auto & [path, doc] : docs_) {
      if (doc->parsed == nullptr) {
        continue;
      }
      Prepared p;
      p.doc = doc;
      p.revision = doc->revision;
      p.file_id = doc->file_id;
      p.parsed = doc->parsed;
      prepared.push_back(std::move(p));
    }
  }

  std::vector<WorkerPool::Task> tasks;
  tasks.reserve(prepared.size());
  for (auto & p : prepared) {
    tasks.emplace_back([this, &p, &result] { extract(p, *result.snapshot); });
  }
  pool_.run_batch(std::move(tasks));

  std::lock_guard lock(mutex_);
  for (auto & p : prepared) {
    if (p.doc->closed) {
      continue;
    }
    if (p.doc->revision == p.revision) {
      (void)index_.replace_document_symbols(p.doc->file_id, std::move(p.symbols));
    }
  }
  for (const auto & [path, doc] : docs_) {
    if (doc->parsed != nullptr) {
      schedule(doc);
    }
  }
  log::info("schema generation {}: revalidating {} documents", result.snapshot->generation(), docs_.size());
  return result;
}

void AnalysisStore::set_localisation(std::shared_ptr<const sema::LocalisationOracle> oracle)
{
  std::lock_guard lock(mutex_);
  localisation_ = std::move(oracle);
  for (const auto & [path, doc] : docs_) {
    if (doc->parsed != nullptr) {
      schedule(doc);
    }
  }
}

void AnalysisStore::open(std::string path, std::string text)
{
  const std::string key = normalize(path);
  const auto snap = registry_.snapshot();
  Prepared p;
  {
    std::lock_guard lock(mutex_);
    p = begin_update(key, std::move(text));
  }
  parse_and_extract(p, *snap);
  std::lock_guard lock(mutex_);
  install(p);
}

void AnalysisStore::change(std::string_view path, std::string text)
{
  {
    std::lock_guard lock(mutex_);
    if (find(path) == nullptr) {
      log::debug("change for unopened document '{}'; opening it", path);
    }
  }
  open(std::string(path), std::move(text));
}

void AnalysisStore::close(std::string_view path)
{
  std::lock_guard lock(mutex_);
  const auto it = docs_.find(normalize(path));
  if (it == docs_.end()) {
    return;
  }
  const DocumentPtr doc = it->second;
  docs_.erase(it);
  doc->closed = true;
  doc->pending = false;
  doc->epoch.fetch_add(1, std::memory_order_release);

  const auto changed = index_.remove_document(doc->file_id);
  sources_.release(doc->file_id);
  schedule_dependents(changed, nullptr);
  published_cv_.notify_all();
}

void AnalysisStore::open_many(std::vector<SourceText> files)
{
  const auto start = std::chrono::steady_clock::now();
  const auto snap = registry_.snapshot();

  std::vector<Prepared> prepared;
  prepared.reserve(files.size());
  {
    std::lock_guard lock(mutex_);
    for (auto & [path, text] : files) {
      prepared.push_back(begin_update(normalize(path), std::move(text)));
    }
  }

  std::vector<WorkerPool::Task> tasks;
  tasks.reserve(prepared.size());
  for (auto & p : prepared) {
    tasks.emplace_back([this, &p, &snap] { parse_and_extract(p, *snap); });
  }
  pool_.run_batch(std::move(tasks));

  {
    std::lock_guard lock(mutex_);
    for (auto & p : prepared) {
      install(p);
    }
  }

  const auto elapsed =
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
  log::info("scanned {} documents in {} ms", prepared.size(), elapsed.count());
}

// ============================================================================
// Queries
// ============================================================================

std::vector<Diagnostic> AnalysisStore::diagnostics(std::string_view path)
{
  std::unique_lock lock(mutex_);
  const DocumentPtr doc = find(path);
  if (doc == nullptr) {
    return {};
  }
  published_cv_.wait(lock, [&] { return doc->closed || !doc->pending; });
  if (doc->closed) {
    return {};
  }
  return doc->diagnostics;
}

std::vector<sema::SymbolLocation> AnalysisStore::symbols(std::string_view type) const
{
  const Symbol group = intern(type);
  std::vector<sema::SymbolLocation> out;
  for (const auto name : index_.names(sema::SymbolKind::TypeInstance, group)) {
    auto locations = index_.lookup(sema::SymbolKind::TypeInstance, group, name);
    out.insert(out.end(), locations.begin(), locations.end());
  }
  return out;
}

std::vector<sema::SymbolDecl> AnalysisStore::document_symbols(std::string_view path) const
{
  FileId file = FileId::invalid();
  {
    std::lock_guard lock(mutex_);
    const DocumentPtr doc = find(path);
    if (doc == nullptr) {
      return {};
    }
    file = doc->file_id;
  }
  return index_.document_symbols(file);
}

std::vector<sema::SymbolLocation> AnalysisStore::definition(std::string_view type, std::string_view name) const
{
  return index_.lookup(sema::SymbolKind::TypeInstance, intern(type), intern(name));
}

std::vector<CompletionItem> AnalysisStore::completion(std::string_view path, uint32_t offset) const
{
  std::shared_ptr<const ParsedScript> script;
  std::string key;
  {
    std::lock_guard lock(mutex_);
    const DocumentPtr doc = find(path);
    if (doc == nullptr || doc->parsed == nullptr) {
      return {};
    }
    script = doc->parsed;
    key = doc->path;
  }
  const auto snap = registry_.snapshot();
  return complete(script->root, script->source->content(), key, offset, *snap, index_);
}

std::shared_ptr<const ParsedScript> AnalysisStore::parsed(std::string_view path) const
{
  std::lock_guard lock(mutex_);
  const DocumentPtr doc = find(path);
  return doc ? doc->parsed : nullptr;
}

uint64_t AnalysisStore::revision(std::string_view path) const
{
  std::lock_guard lock(mutex_);
  const DocumentPtr doc = find(path);
  return doc ? doc->revision : 0;
}

bool AnalysisStore::has_document(std::string_view path) const
{
  std::lock_guard lock(mutex_);
  return find(path) != nullptr;
}

std::vector<std::string> AnalysisStore::document_paths() const
{
  std::lock_guard lock(mutex_);
  std::vector<std::string> out;
  out.reserve(docs_.size());
  for (const auto & [path, doc] : docs_) {
    out.push_back(path);
  }
  std::sort(out.begin(), out.end());
  return out;
}

void AnalysisStore::wait_idle() { pool_.wait_idle(); }

std::vector<std::string> AnalysisStore::engine_errors() const
{
  std::lock_guard lock(mutex_);
  return engine_errors_;
}

std::string AnalysisStore::diagnostics_text(std::string_view path)
{
  const auto diags = diagnostics(path);
  std::lock_guard lock(mutex_);
  return render_diagnostics(diags, sources_);
}

std::string AnalysisStore::path_of(FileId file) const
{
  std::lock_guard lock(mutex_);
  return sources_.get_path(file).generic_string();
}

FullSourceRange AnalysisStore::full_range(SourceRange range) const
{
  std::lock_guard lock(mutex_);
  return sources_.get_full_range(range);
}

}  // namespace cwcheck::analysis
