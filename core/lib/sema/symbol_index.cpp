// cwcheck/sema/symbol_index.cpp - Concurrent (type, name) -> locations index
#include "cwcheck/sema/symbol_index.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

namespace cwcheck::sema
{

SymbolIndex::SymbolIndex(size_t shard_count)
{
  shards_.reserve(std::max<size_t>(shard_count, 1));
  for (size_t i = 0; i < std::max<size_t>(shard_count, 1); ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

SymbolIndex::Shard & SymbolIndex::shard_for(const SymbolGroup & g) const
{
  return *shards_[SymbolGroupHash{}(g) % shards_.size()];
}

void SymbolIndex::insert(FileId file, const SymbolDecl & decl)
{
  const SymbolGroup key = decl.group_key();
  Shard & shard = shard_for(key);
  std::unique_lock lock(shard.mutex);
  shard.groups[key][decl.name.folded()].push_back(SymbolLocation{file, decl.name, decl.range});
}

bool SymbolIndex::erase(FileId file, const SymbolDecl & decl)
{
  const SymbolGroup key = decl.group_key();
  Shard & shard = shard_for(key);
  std::unique_lock lock(shard.mutex);
  const auto g = shard.groups.find(key);
  if (g == shard.groups.end()) {
    return false;
  }
  const auto n = g->second.find(decl.name.folded());
  if (n == g->second.end()) {
    return false;
  }
  auto & locs = n->second;
  const auto it = std::find_if(locs.begin(), locs.end(), [&](const SymbolLocation & l) {
    return l.file == file && l.range == decl.range;
  });
  if (it != locs.end()) {
    locs.erase(it);
  }
  if (!locs.empty()) {
    return false;
  }
  g->second.erase(n);
  if (g->second.empty()) {
    shard.groups.erase(g);
  }
  return true;
}

std::vector<SymbolGroup> SymbolIndex::replace_document_symbols(FileId file, std::vector<SymbolDecl> decls)
{
  std::vector<SymbolDecl> old;
  {
    std::lock_guard lock(documents_mutex_);
    auto & slot = documents_[file.value];
    old = std::exchange(slot, decls);
  }

  const auto names_of = [](const std::vector<SymbolDecl> & v) {
    std::set<std::pair<SymbolGroup, Symbol>> out;
    for (const auto & d : v) {
      out.emplace(d.group_key(), d.name.folded());
    }
    return out;
  };
  const auto before = names_of(old);
  const auto after = names_of(decls);

  for (const auto & d : old) {
    erase(file, d);
  }
  for (const auto & d : decls) {
    insert(file, d);
  }

  std::set<SymbolGroup> changed;
  std::vector<std::pair<SymbolGroup, Symbol>> diff;
  std::set_symmetric_difference(
    before.begin(), before.end(), after.begin(), after.end(), std::back_inserter(diff));
  for (const auto & [group, name] : diff) {
    changed.insert(group);
  }
  return {changed.begin(), changed.end()};
}

std::vector<SymbolGroup> SymbolIndex::remove_document(FileId file)
{
  std::vector<SymbolDecl> old;
  {
    std::lock_guard lock(documents_mutex_);
    const auto it = documents_.find(file.value);
    if (it == documents_.end()) {
      return {};
    }
    old = std::move(it->second);
    documents_.erase(it);
  }
  std::set<SymbolGroup> changed;
  for (const auto & d : old) {
    erase(file, d);
    changed.insert(d.group_key());
  }
  return {changed.begin(), changed.end()};
}

void SymbolIndex::clear()
{
  std::lock_guard lock(documents_mutex_);
  documents_.clear();
  for (auto & shard : shards_) {
    std::unique_lock shard_lock(shard->mutex);
    shard->groups.clear();
  }
}

bool SymbolIndex::contains(SymbolKind kind, Symbol group, Symbol name) const
{
  const SymbolGroup key{kind, group.folded()};
  const Shard & shard = shard_for(key);
  std::shared_lock lock(shard.mutex);
  const auto g = shard.groups.find(key);
  return g != shard.groups.end() && g->second.contains(name.folded());
}

std::vector<SymbolLocation> SymbolIndex::lookup(SymbolKind kind, Symbol group, Symbol name) const
{
  const SymbolGroup key{kind, group.folded()};
  const Shard & shard = shard_for(key);
  std::shared_lock lock(shard.mutex);
  const auto g = shard.groups.find(key);
  if (g == shard.groups.end()) {
    return {};
  }
  const auto n = g->second.find(name.folded());
  return n == g->second.end() ? std::vector<SymbolLocation>{} : n->second;
}

std::vector<Symbol> SymbolIndex::names(SymbolKind kind, Symbol group) const
{
  const SymbolGroup key{kind, group.folded()};
  std::vector<Symbol> out;
  {
    const Shard & shard = shard_for(key);
    std::shared_lock lock(shard.mutex);
    const auto g = shard.groups.find(key);
    if (g == shard.groups.end()) {
      return out;
    }
    out.reserve(g->second.size());
    for (const auto & [folded, locs] : g->second) {
      out.push_back(locs.empty() ? folded : locs.front().name);
    }
  }
  std::sort(out.begin(), out.end(), [](Symbol a, Symbol b) {
    return a.folded().str() < b.folded().str();
  });
  return out;
}

std::vector<SymbolDecl> SymbolIndex::document_symbols(FileId file) const
{
  std::lock_guard lock(documents_mutex_);
  const auto it = documents_.find(file.value);
  return it == documents_.end() ? std::vector<SymbolDecl>{} : it->second;
}

size_t SymbolIndex::size() const
{
  size_t n = 0;
  for (const auto & shard : shards_) {
    std::shared_lock lock(shard->mutex);
    for (const auto & [key, names] : shard->groups) {
      n += names.size();
    }
  }
  return n;
}

}  // namespace cwcheck::sema
