// cwcheck/basic/log.hpp - Leveled stderr logging on top of fmt
#pragma once

#include <fmt/core.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace cwcheck::log
{

enum class Level : uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

[[nodiscard]] std::string_view to_string(Level level) noexcept;

/// Parse "trace" / "debug" / "info" / "warn" / "error" / "off" (case-insensitive).
[[nodiscard]] std::optional<Level> parse_level(std::string_view text) noexcept;

class Logger
{
public:
  static Logger & instance();

  void set_level(Level level) noexcept { level_.store(level, std::memory_order_relaxed); }
  [[nodiscard]] Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

  [[nodiscard]] bool enabled(Level level) const noexcept
  {
    return level != Level::Off && level >= this->level();
  }

  /// Redirect output (tests). nullptr restores stderr.
  void set_sink(std::FILE * sink) noexcept;

  void write(Level level, std::string_view message);

private:
  Logger() = default;

  std::atomic<Level> level_{Level::Warn};
  std::mutex mutex_;
  std::FILE * sink_ = nullptr;
};

template <typename... Args>
void emit(Level level, fmt::format_string<Args...> format, Args &&... args)
{
  auto & logger = Logger::instance();
  if (!logger.enabled(level)) {
    return;
  }
  logger.write(level, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(fmt::format_string<Args...> format, Args &&... args)
{
  emit<Args...>(Level::Trace, format, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args &&... args)
{
  emit<Args...>(Level::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args &&... args)
{
  emit<Args...>(Level::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args &&... args)
{
  emit<Args...>(Level::Warn, format, std::forward<Args>(args)...);
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args &&... args)
{
  emit<Args...>(Level::Error, format, std::forward<Args>(args)...);
}

}  // namespace cwcheck::log
