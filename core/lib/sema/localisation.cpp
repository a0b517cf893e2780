// cwcheck/sema/localisation.cpp - Localisation key lookup
#include "cwcheck/sema/localisation.hpp"

#include <mutex>

namespace cwcheck::sema
{

SetLocalisationOracle::SetLocalisationOracle(std::initializer_list<std::string_view> keys)
{
  for (const auto key : keys) {
    keys_.insert(intern(key).folded());
  }
}

void SetLocalisationOracle::add(std::string_view key)
{
  const Symbol folded = intern(key).folded();
  std::unique_lock lock(mutex_);
  keys_.insert(folded);
}

void SetLocalisationOracle::remove(std::string_view key)
{
  const Symbol folded = intern(key).folded();
  std::unique_lock lock(mutex_);
  keys_.erase(folded);
}

void SetLocalisationOracle::clear()
{
  std::unique_lock lock(mutex_);
  keys_.clear();
}

bool SetLocalisationOracle::contains(std::string_view key) const
{
  const Symbol sym = Interner::global().find(key);
  if (sym.empty() && !key.empty()) {
    // Never interned in any case: look for a folded twin.
    const Symbol folded = Interner::global().find(ascii_lower(key));
    if (folded.empty()) {
      return false;
    }
    std::shared_lock lock(mutex_);
    return keys_.contains(folded);
  }
  std::shared_lock lock(mutex_);
  return keys_.contains(sym.folded());
}

size_t SetLocalisationOracle::size() const
{
  std::shared_lock lock(mutex_);
  return keys_.size();
}

}  // namespace cwcheck::sema
