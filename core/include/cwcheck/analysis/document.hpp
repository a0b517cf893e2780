// cwcheck/analysis/document.hpp - Per-document analysis state
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "cwcheck/basic/diagnostic.hpp"
#include "cwcheck/basic/source_manager.hpp"
#include "cwcheck/sema/symbol_index.hpp"
#include "cwcheck/syntax/frontend.hpp"

namespace cwcheck::analysis
{

/**
 * One open document. Owned by the AnalysisStore and mutated only under its
 * lock; `epoch` is also read lock-free by the validation run as its
 * cancellation token.
 */
struct Document
{
  std::string path;  ///< workspace-relative, forward slashes
  FileId file_id = FileId::invalid();

  uint64_t revision = 0;             ///< bumped by every open/change
  std::atomic<uint64_t> epoch{0};    ///< bumped by every (re)validation request
  std::shared_ptr<const ParsedScript> parsed;

  std::vector<Diagnostic> diagnostics;  ///< last published result
  uint64_t published_revision = 0;
  std::set<sema::SymbolGroup> referenced;  ///< groups the last validation looked up

  bool in_flight = false;  ///< a validation task is queued or running
  bool pending = false;    ///< the published result is not current
  bool closed = false;
};

}  // namespace cwcheck::analysis
