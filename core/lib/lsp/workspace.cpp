#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cwcheck/analysis/analysis_store.hpp"
#include "cwcheck/ast/json_visitor.hpp"
#include "cwcheck/basic/log.hpp"
#include "cwcheck/diff/changeset_printer.hpp"
#include "cwcheck/diff/diff_engine.hpp"
#include "cwcheck/lsp.hpp"
#include "cwcheck/project/engine_config.hpp"
#include "cwcheck/sema/localisation.hpp"

namespace cwcheck::lsp
{
namespace
{

using json = nlohmann::json;
namespace fs = std::filesystem;

// -----------------------------
// Range helpers
// -----------------------------

uint32_t clamp_byte_offset(uint32_t off, size_t text_size)
{
  if (off > text_size) {
    return static_cast<uint32_t>(text_size);
  }
  return off;
}

// Script identifiers: event ids (`my_mod.1`), scripted values (`@x`),
// prefixed links (`event_target:foo`).
bool is_ident_char(unsigned char c)
{
  return std::isalnum(c) != 0 || c == '_' || c == '.' || c == ':' || c == '@' || c == '-';
}

struct ByteRange
{
  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

ByteRange word_range_at(std::string_view text, uint32_t byte_offset)
{
  ByteRange r;
  const auto size = static_cast<uint32_t>(text.size());
  if (size == 0) {
    return r;
  }

  byte_offset = clamp_byte_offset(byte_offset, size);
  uint32_t pos = byte_offset;

  if (
    pos > 0 && (pos == size || !is_ident_char(static_cast<unsigned char>(text[pos]))) &&
    is_ident_char(static_cast<unsigned char>(text[pos - 1]))) {
    pos -= 1;
  }

  if (pos >= size || !is_ident_char(static_cast<unsigned char>(text[pos]))) {
    r.startByte = r.endByte = byte_offset;
    return r;
  }

  uint32_t start = pos;
  while (start > 0 && is_ident_char(static_cast<unsigned char>(text[start - 1]))) {
    start -= 1;
  }

  uint32_t end = pos + 1;
  while (end < size && is_ident_char(static_cast<unsigned char>(text[end]))) {
    end += 1;
  }

  r.startByte = start;
  r.endByte = end;
  return r;
}

ByteRange completion_replace_range_at(std::string_view text, uint32_t byte_offset)
{
  byte_offset = clamp_byte_offset(byte_offset, text.size());

  // Replace only the part of the word in front of the cursor.
  ByteRange r;
  r.startByte = r.endByte = byte_offset;
  while (r.startByte > 0 && is_ident_char(static_cast<unsigned char>(text[r.startByte - 1]))) {
    r.startByte -= 1;
  }
  return r;
}

std::optional<std::string> word_at(std::string_view text, uint32_t byte_offset)
{
  const auto r = word_range_at(text, byte_offset);
  if (r.endByte <= r.startByte || r.endByte > text.size()) {
    return std::nullopt;
  }
  std::string_view word = text.substr(r.startByte, r.endByte - r.startByte);
  // Trailing scope-chain dot
  while (!word.empty() && word.back() == '.') {
    word.remove_suffix(1);
  }
  if (word.empty()) {
    return std::nullopt;
  }
  return std::string(word);
}

json range_to_json(const FullSourceRange & r)
{
  return json{
    {"startByte", r.start_byte},     {"endByte", r.end_byte}, {"startLine", r.start_line},
    {"startColumn", r.start_column}, {"endLine", r.end_line}, {"endColumn", r.end_column},
  };
}

json byte_range_to_json(const ByteRange & r)
{
  return json{{"startByte", r.startByte}, {"endByte", r.endByte}};
}

std::string_view severity_to_string(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "Error";
    case Severity::Warning:
      return "Warning";
    case Severity::Info:
      return "Info";
    case Severity::Hint:
      return "Hint";
  }
  return "Error";
}

std::string_view diagnostic_source(RuleCode code)
{
  switch (code) {
    case RuleCode::SyntaxError:
      return "parser";
    case RuleCode::SchemaError:
      return "schema";
    default:
      return "validator";
  }
}

// -----------------------------
// URI mapping
// -----------------------------

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

std::optional<fs::path> file_uri_to_path(std::string_view uri)
{
  if (!starts_with(uri, "file://")) {
    return std::nullopt;
  }

  const std::string_view rest = uri.substr(std::string_view("file://").size());
  if (!starts_with(rest, "/")) {
    return std::nullopt;
  }

  // Percent-decoding is left to the host.
  return fs::path(std::string(rest));
}

std::string normalize_path(std::string path)
{
  std::replace(path.begin(), path.end(), '\\', '/');
  while (path.size() >= 2 && path[0] == '.' && path[1] == '/') {
    path.erase(0, 2);
  }
  return path;
}

}  // namespace

// ============================================================================
// Workspace::Impl
// ============================================================================

struct Workspace::Impl
{
  explicit Impl(const EngineConfig & config)
  : store(analysis::StoreOptions{config.validation_options(), config.analysis.workers})
  {
    for (const auto & root : config.workspace_roots()) {
      std::string r = root.generic_string();
      if (!r.empty() && r.back() != '/') {
        r += '/';
      }
      roots.push_back(std::move(r));
    }
    // Longest root wins for nested roots.
    std::sort(roots.begin(), roots.end(), [](const std::string & a, const std::string & b) {
      return a.size() > b.size();
    });
  }

  analysis::AnalysisStore store;
  std::vector<std::string> roots;

  std::unordered_map<std::string, std::string> path_by_uri;
  std::unordered_map<std::string, std::string> uri_by_path;

  std::string to_store_path(std::string_view uri) const
  {
    const std::string path = normalize_path(
      file_uri_to_path(uri).value_or(fs::path(std::string(uri))).generic_string());
    for (const auto & root : roots) {
      if (starts_with(path, root)) {
        return path.substr(root.size());
      }
    }
    return path;
  }

  const std::string * store_path(std::string_view uri) const
  {
    auto it = path_by_uri.find(std::string(uri));
    return it == path_by_uri.end() ? nullptr : &it->second;
  }

  std::string uri_for_file(FileId file) const
  {
    const std::string path = normalize_path(store.path_of(file));
    auto it = uri_by_path.find(path);
    return it == uri_by_path.end() ? path : it->second;
  }

  std::string remember(std::string uri)
  {
    std::string path = to_store_path(uri);
    if (auto it = path_by_uri.find(uri); it != path_by_uri.end() && it->second != path) {
      uri_by_path.erase(it->second);
    }
    uri_by_path[path] = uri;
    path_by_uri[std::move(uri)] = path;
    return path;
  }

  json diagnostic_to_json(const Diagnostic & d) const
  {
    json item;
    item["source"] = std::string(diagnostic_source(d.rule));
    item["message"] = d.message;
    item["severity"] = std::string(severity_to_string(d.severity));
    if (d.rule != RuleCode::None) {
      item["code"] = std::string(d.code());
    }
    if (d.help_message) {
      item["help"] = *d.help_message;
    }
    if (d.cardinality) {
      json c;
      c["count"] = d.cardinality->count;
      c["min"] = d.cardinality->min;
      c["max"] = d.cardinality->max ? json(*d.cardinality->max) : json(nullptr);
      item["cardinality"] = std::move(c);
    }
    const SourceRange primary = d.primary_range();
    item["range"] = range_to_json(store.full_range(primary));
    if (primary.is_valid()) {
      item["uri"] = uri_for_file(primary.file_id());
    }
    return item;
  }

  json schema_result_to_json(const schema::SchemaLoadResult & result) const
  {
    json out;
    out["success"] = result.success;
    out["generation"] = result.snapshot ? result.snapshot->generation() : 0;
    out["items"] = json::array();
    for (const auto & d : result.diagnostics) {
      out["items"].push_back(diagnostic_to_json(d));
    }
    return out;
  }

  json location_to_json(const sema::SymbolLocation & loc) const
  {
    json l;
    l["uri"] = uri_for_file(loc.file);
    l["name"] = std::string(loc.name.str());
    l["range"] = range_to_json(store.full_range(loc.range));
    return l;
  }

  // -----------------------------
  // Queries
  // -----------------------------

  json diagnostics_json_impl(std::string_view uri)
  {
    json out;
    out["uri"] = std::string(uri);
    out["items"] = json::array();

    const auto * path = store_path(uri);
    if (path == nullptr) {
      return out;
    }
    for (const auto & d : store.diagnostics(*path)) {
      out["items"].push_back(diagnostic_to_json(d));
    }
    return out;
  }

  json completion_json_impl(std::string_view uri, uint32_t byte_offset)
  {
    json out;
    out["uri"] = std::string(uri);
    out["isIncomplete"] = false;
    out["items"] = json::array();

    const auto * path = store_path(uri);
    if (path == nullptr) {
      return out;
    }
    const auto script = store.parsed(*path);
    if (script == nullptr) {
      return out;
    }
    const std::string_view text = script->source->content();
    byte_offset = clamp_byte_offset(byte_offset, text.size());
    const ByteRange replace = completion_replace_range_at(text, byte_offset);
    const std::string_view typed = text.substr(replace.startByte, replace.endByte - replace.startByte);

    for (const auto & c : store.completion(*path, byte_offset)) {
      if (!typed.empty() && !starts_with(ascii_lower(c.label), ascii_lower(typed))) {
        continue;
      }
      json item;
      item["label"] = c.label;
      item["kind"] = std::string(analysis::to_string(c.kind));
      if (!c.detail.empty()) {
        item["detail"] = c.detail;
      }
      item["insertText"] = c.label;
      item["replaceRange"] = byte_range_to_json(replace);
      out["items"].push_back(std::move(item));
    }
    return out;
  }

  json definition_json_impl(std::string_view uri, uint32_t byte_offset)
  {
    json out;
    out["uri"] = std::string(uri);
    out["locations"] = json::array();

    const auto * path = store_path(uri);
    if (path == nullptr) {
      return out;
    }
    const auto script = store.parsed(*path);
    const auto snap = store.schema();
    if (script == nullptr || snap == nullptr) {
      return out;
    }
    const auto word = word_at(script->source->content(), byte_offset);
    if (!word) {
      return out;
    }

    const Symbol name = intern(*word);
    const auto & index = store.index();
    for (const auto & type : snap->types()) {
      for (const auto & loc : index.lookup(sema::SymbolKind::TypeInstance, type.name, name)) {
        json l = location_to_json(loc);
        l["type"] = std::string(type.name.str());
        out["locations"].push_back(std::move(l));
      }
    }
    for (const auto & ce : snap->complex_enums()) {
      for (const auto & loc : index.lookup(sema::SymbolKind::ComplexEnumMember, ce.name, name)) {
        json l = location_to_json(loc);
        l["type"] = "enum[" + std::string(ce.name.str()) + "]";
        out["locations"].push_back(std::move(l));
      }
    }
    return out;
  }

  json symbols_json_impl(std::string_view type)
  {
    json out;
    out["type"] = std::string(type);
    out["symbols"] = json::array();
    for (const auto & loc : store.symbols(type)) {
      out["symbols"].push_back(location_to_json(loc));
    }
    return out;
  }

  json document_symbols_json_impl(std::string_view uri)
  {
    json out;
    out["uri"] = std::string(uri);
    out["symbols"] = json::array();

    const auto * path = store_path(uri);
    if (path == nullptr) {
      return out;
    }

    for (const auto & decl : store.document_symbols(*path)) {
      json s;
      s["name"] = std::string(decl.name.str());
      s["kind"] = std::string(sema::to_string(decl.kind));
      s["detail"] = std::string(decl.group.str());
      s["range"] = range_to_json(store.full_range(decl.range));
      s["selectionRange"] = range_to_json(store.full_range(decl.range));
      out["symbols"].push_back(std::move(s));
    }
    return out;
  }

  json diff_json_impl(std::string_view uri_a, std::string_view uri_b)
  {
    json out;
    out["uriA"] = std::string(uri_a);
    out["uriB"] = std::string(uri_b);
    out["changes"] = json::array();

    const auto * path_a = store_path(uri_a);
    const auto * path_b = store_path(uri_b);
    if (path_a == nullptr || path_b == nullptr) {
      return out;
    }
    const auto a = store.parsed(*path_a);
    const auto b = store.parsed(*path_b);
    if (a == nullptr || b == nullptr) {
      return out;
    }

    // Pair entities by name when the file holds a single named type.
    const auto snap = store.schema();
    const schema::SchemaType * type = nullptr;
    if (snap != nullptr) {
      const auto types = snap->types_for_path(*path_a);
      if (types.size() == 1 && types.front()->name_field) {
        type = types.front();
      }
    }
    out["changes"] = diff::changeset_to_json(diff::diff(a->root, b->root, type));
    return out;
  }

  json ast_json_impl(std::string_view uri)
  {
    json out;
    out["uri"] = std::string(uri);
    out["ast"] = nullptr;

    const auto * path = store_path(uri);
    if (path == nullptr) {
      return out;
    }
    if (const auto script = store.parsed(*path)) {
      out["ast"] = cwcheck::to_json(script->root);
    }
    return out;
  }
};

// ============================================================================
// Workspace
// ============================================================================

Workspace::Workspace() : impl_(new Impl(EngineConfig{})) {}

Workspace::Workspace(const EngineConfig & config) : impl_(new Impl(config)) {}

Workspace::~Workspace() { delete impl_; }

Workspace::Workspace(Workspace && other) noexcept : impl_(other.impl_) { other.impl_ = nullptr; }

Workspace & Workspace::operator=(Workspace && other) noexcept
{
  if (this == &other) {
    return *this;
  }
  delete impl_;
  impl_ = other.impl_;
  other.impl_ = nullptr;
  return *this;
}

std::string Workspace::load_schema_text(const std::vector<TextFile> & files)
{
  std::vector<schema::SchemaSource> sources;
  sources.reserve(files.size());
  for (const auto & [uri, text] : files) {
    const std::string path = normalize_path(file_uri_to_path(uri).value_or(fs::path(uri)).generic_string());
    impl_->uri_by_path[path] = uri;
    sources.push_back(schema::SchemaSource{path, text});
  }
  const auto result = impl_->store.load_schema(sources);
  if (!result.success) {
    log::warn("schema load failed with {} diagnostic(s)", result.diagnostics.size());
  }
  return impl_->schema_result_to_json(result).dump();
}

std::string Workspace::load_schema_files(const std::vector<fs::path> & paths)
{
  std::vector<TextFile> files;
  json unreadable = json::array();
  for (const auto & path : paths) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      json item;
      item["source"] = "schema";
      item["message"] = "cannot read schema file: " + path.generic_string();
      item["severity"] = "Error";
      item["uri"] = path.generic_string();
      unreadable.push_back(std::move(item));
      continue;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    files.emplace_back(path.generic_string(), ss.str());
  }
  if (!unreadable.empty()) {
    json out;
    out["success"] = false;
    out["generation"] = 0;
    out["items"] = std::move(unreadable);
    return out.dump();
  }
  return load_schema_text(files);
}

void Workspace::set_localisation_keys(const std::vector<std::string> & keys)
{
  auto oracle = std::make_shared<sema::SetLocalisationOracle>();
  for (const auto & k : keys) {
    oracle->add(k);
  }
  impl_->store.set_localisation(std::move(oracle));
}

void Workspace::set_document(std::string uri, std::string text)
{
  std::string path = impl_->remember(std::move(uri));
  impl_->store.change(path, std::move(text));
}

void Workspace::set_documents(std::vector<TextFile> documents)
{
  std::vector<analysis::SourceText> files;
  files.reserve(documents.size());
  for (auto & [uri, text] : documents) {
    files.emplace_back(impl_->remember(std::move(uri)), std::move(text));
  }
  impl_->store.open_many(std::move(files));
}

void Workspace::remove_document(std::string_view uri)
{
  auto it = impl_->path_by_uri.find(std::string(uri));
  if (it == impl_->path_by_uri.end()) {
    return;
  }
  impl_->store.close(it->second);
  impl_->uri_by_path.erase(it->second);
  impl_->path_by_uri.erase(it);
}

bool Workspace::has_document(std::string_view uri) const
{
  const auto * path = impl_->store_path(uri);
  return path != nullptr && impl_->store.has_document(*path);
}

std::string Workspace::diagnostics_json(std::string_view uri)
{
  const json j = impl_->diagnostics_json_impl(uri);
  return j.dump();
}

std::string Workspace::diagnostics_text(std::string_view uri)
{
  const auto * path = impl_->store_path(uri);
  return path == nullptr ? std::string() : impl_->store.diagnostics_text(*path);
}

std::string Workspace::completion_json(std::string_view uri, uint32_t byte_offset)
{
  const json j = impl_->completion_json_impl(uri, byte_offset);
  return j.dump();
}

std::string Workspace::definition_json(std::string_view uri, uint32_t byte_offset)
{
  const json j = impl_->definition_json_impl(uri, byte_offset);
  return j.dump();
}

std::string Workspace::symbols_json(std::string_view type)
{
  const json j = impl_->symbols_json_impl(type);
  return j.dump();
}

std::string Workspace::document_symbols_json(std::string_view uri)
{
  const json j = impl_->document_symbols_json_impl(uri);
  return j.dump();
}

std::string Workspace::diff_json(std::string_view uri_a, std::string_view uri_b)
{
  const json j = impl_->diff_json_impl(uri_a, uri_b);
  return j.dump();
}

std::string Workspace::ast_json(std::string_view uri)
{
  const json j = impl_->ast_json_impl(uri);
  return j.dump();
}

}  // namespace cwcheck::lsp
