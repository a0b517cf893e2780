// cwcheck/sema/localisation.hpp - Localisation key lookup
#pragma once

#include <initializer_list>
#include <shared_mutex>
#include <string_view>
#include <unordered_set>

#include "cwcheck/basic/interner.hpp"

namespace cwcheck::sema
{

/**
 * Answers whether a localisation key exists. Loading localisation files is
 * the caller's business.
 */
class LocalisationOracle
{
public:
  virtual ~LocalisationOracle() = default;

  [[nodiscard]] virtual bool contains(std::string_view key) const = 0;
};

/**
 * Thread-safe set-backed oracle. Keys compare case-insensitively.
 */
class SetLocalisationOracle : public LocalisationOracle
{
public:
  SetLocalisationOracle() = default;
  SetLocalisationOracle(std::initializer_list<std::string_view> keys);

  void add(std::string_view key);
  void remove(std::string_view key);
  void clear();

  [[nodiscard]] bool contains(std::string_view key) const override;
  [[nodiscard]] size_t size() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_set<Symbol> keys_;
};

}  // namespace cwcheck::sema
