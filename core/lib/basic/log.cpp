// cwcheck/basic/log.cpp - Logger implementation
#include "cwcheck/basic/log.hpp"

#include <chrono>

#include "cwcheck/basic/interner.hpp"

namespace cwcheck::log
{

std::string_view to_string(Level level) noexcept
{
  switch (level) {
    case Level::Trace:
      return "trace";
    case Level::Debug:
      return "debug";
    case Level::Info:
      return "info";
    case Level::Warn:
      return "warn";
    case Level::Error:
      return "error";
    case Level::Off:
      return "off";
  }
  return "";
}

std::optional<Level> parse_level(std::string_view text) noexcept
{
  static constexpr Level k_levels[] = {Level::Trace, Level::Debug, Level::Info,
                                       Level::Warn,  Level::Error, Level::Off};
  for (const Level l : k_levels) {
    if (iequals(text, to_string(l))) {
      return l;
    }
  }
  if (iequals(text, "warning")) {
    return Level::Warn;
  }
  return std::nullopt;
}

Logger & Logger::instance()
{
  static Logger logger;
  return logger;
}

void Logger::set_sink(std::FILE * sink) noexcept
{
  const std::lock_guard lock(mutex_);
  sink_ = sink;
}

void Logger::write(Level level, std::string_view message)
{
  using clock = std::chrono::steady_clock;
  static const auto k_start = clock::now();
  const auto elapsed_ms =
    std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - k_start).count();

  const std::lock_guard lock(mutex_);
  std::FILE * out = sink_ != nullptr ? sink_ : stderr;
  fmt::print(out, "[{:>8}ms] [cwcheck] [{}] {}\n", elapsed_ms, to_string(level), message);
  std::fflush(out);
}

}  // namespace cwcheck::log
