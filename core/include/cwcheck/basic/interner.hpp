// cwcheck/basic/interner.hpp - Process-wide string interner
#pragma once

#include <compare>
#include <cstdint>
#include <deque>
#include <functional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cwcheck
{

/**
 * Handle to an interned string. Equality is integer equality.
 *
 * Id 0 is always the empty string.
 */
struct Symbol
{
  uint32_t id = 0;

  [[nodiscard]] constexpr bool empty() const noexcept { return id == 0; }
  [[nodiscard]] constexpr bool operator==(const Symbol &) const noexcept = default;
  [[nodiscard]] constexpr auto operator<=>(const Symbol &) const noexcept = default;

  /// Text of the symbol (via the global interner).
  [[nodiscard]] std::string_view str() const;

  /// ASCII-lowercased twin used for case-insensitive key matching.
  [[nodiscard]] Symbol folded() const;
};

/**
 * Thread-safe string interner.
 *
 * Strings live in a deque so views handed out stay valid while other threads
 * insert. Entries are never evicted.
 */
class Interner
{
public:
  Interner();

  Interner(const Interner &) = delete;
  Interner & operator=(const Interner &) = delete;

  static Interner & global();

  Symbol intern(std::string_view text);

  /// Look up without inserting; returns the empty symbol when unknown.
  [[nodiscard]] Symbol find(std::string_view text) const;

  [[nodiscard]] std::string_view str(Symbol sym) const;
  [[nodiscard]] Symbol fold(Symbol sym) const;
  [[nodiscard]] size_t size() const;

private:
  uint32_t intern_locked(std::string_view text);

  mutable std::shared_mutex mutex_;
  std::deque<std::string> strings_;
  std::vector<uint32_t> folded_;
  std::unordered_map<std::string_view, uint32_t> index_;
};

/// Shorthand for Interner::global().intern(text).
[[nodiscard]] inline Symbol intern(std::string_view text)
{
  return Interner::global().intern(text);
}

/// ASCII case-insensitive comparison.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

[[nodiscard]] std::string ascii_lower(std::string_view text);

}  // namespace cwcheck

template <>
struct std::hash<cwcheck::Symbol>
{
  size_t operator()(const cwcheck::Symbol & s) const noexcept { return std::hash<uint32_t>{}(s.id); }
};
