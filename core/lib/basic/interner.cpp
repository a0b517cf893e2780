// cwcheck/basic/interner.cpp - Interner implementation
#include "cwcheck/basic/interner.hpp"

#include <algorithm>
#include <mutex>

namespace cwcheck
{

namespace
{

[[nodiscard]] char lower_ascii(char c) noexcept
{
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

}  // namespace

std::string ascii_lower(std::string_view text)
{
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), lower_ascii);
  return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (lower_ascii(a[i]) != lower_ascii(b[i])) {
      return false;
    }
  }
  return true;
}

// ============================================================================
// Symbol
// ============================================================================

std::string_view Symbol::str() const { return Interner::global().str(*this); }

Symbol Symbol::folded() const { return Interner::global().fold(*this); }

// ============================================================================
// Interner
// ============================================================================

Interner::Interner()
{
  strings_.emplace_back();
  folded_.push_back(0);
  index_.emplace(std::string_view(strings_.back()), 0U);
}

Interner & Interner::global()
{
  static Interner instance;
  return instance;
}

Symbol Interner::intern(std::string_view text)
{
  {
    const std::shared_lock lock(mutex_);
    if (const auto it = index_.find(text); it != index_.end()) {
      return Symbol{it->second};
    }
  }
  const std::unique_lock lock(mutex_);
  return Symbol{intern_locked(text)};
}

uint32_t Interner::intern_locked(std::string_view text)
{
  if (const auto it = index_.find(text); it != index_.end()) {
    return it->second;
  }

  const auto id = static_cast<uint32_t>(strings_.size());
  strings_.emplace_back(text);
  folded_.push_back(id);
  index_.emplace(std::string_view(strings_.back()), id);

  const std::string lower = ascii_lower(text);
  if (lower != text) {
    const uint32_t folded_id = intern_locked(lower);
    folded_[id] = folded_id;
  }
  return id;
}

Symbol Interner::find(std::string_view text) const
{
  const std::shared_lock lock(mutex_);
  if (const auto it = index_.find(text); it != index_.end()) {
    return Symbol{it->second};
  }
  return Symbol{};
}

std::string_view Interner::str(Symbol sym) const
{
  const std::shared_lock lock(mutex_);
  if (sym.id >= strings_.size()) {
    return {};
  }
  return strings_[sym.id];
}

Symbol Interner::fold(Symbol sym) const
{
  const std::shared_lock lock(mutex_);
  if (sym.id >= folded_.size()) {
    return Symbol{};
  }
  return Symbol{folded_[sym.id]};
}

size_t Interner::size() const
{
  const std::shared_lock lock(mutex_);
  return strings_.size();
}

}  // namespace cwcheck
