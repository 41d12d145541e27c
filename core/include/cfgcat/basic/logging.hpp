// cfgcat/basic/logging.hpp - Named, leveled loggers
//
// Lines are written as "$prio: $msg" (e.g. "WARNING: web1: unknown variable").
// A logger may be shared between concurrent compilations.
//
#pragma once

#include <fmt/core.h>

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace cfgcat
{

enum class LogLevel : uint8_t {
  Debug,
  Info,
  Notice,
  Warning,
  Error,
};

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

/// Accepts "debug", "info", "notice", "warning", "error" (case-insensitive)
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

class Logger
{
public:
  /**
   * @param name Logger name, e.g. "cfgcat.daemon"
   * @param level Messages below this level are discarded
   * @param os Output stream; std::cerr when null
   */
  explicit Logger(std::string name, LogLevel level = LogLevel::Warning, std::ostream * os = nullptr);

  Logger(const Logger &) = delete;
  Logger & operator=(const Logger &) = delete;

  [[nodiscard]] const std::string & name() const noexcept { return name_; }

  void set_level(LogLevel level) noexcept { level_.store(level); }
  [[nodiscard]] LogLevel level() const noexcept { return level_.load(); }
  [[nodiscard]] bool enabled(LogLevel level) const noexcept { return level >= level_.load(); }

  void log(LogLevel level, std::string_view message);

  template <typename... Args>
  void debug(fmt::format_string<Args...> format, Args &&... args)
  {
    emit(LogLevel::Debug, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> format, Args &&... args)
  {
    emit(LogLevel::Info, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void notice(fmt::format_string<Args...> format, Args &&... args)
  {
    emit(LogLevel::Notice, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warning(fmt::format_string<Args...> format, Args &&... args)
  {
    emit(LogLevel::Warning, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> format, Args &&... args)
  {
    emit(LogLevel::Error, format, std::forward<Args>(args)...);
  }

private:
  template <typename... Args>
  void emit(LogLevel level, fmt::format_string<Args...> format, Args &&... args)
  {
    if (!enabled(level)) {
      return;
    }
    log(level, fmt::format(format, std::forward<Args>(args)...));
  }

  std::string name_;
  std::atomic<LogLevel> level_;
  std::ostream * os_;
  std::mutex mutex_;
};

using LoggerPtr = std::shared_ptr<Logger>;

/// Logger names used across the project
inline constexpr const char * k_daemon_logger_name = "cfgcat.daemon";
inline constexpr const char * k_interpreter_logger_name = "cfgcat.interpreter";

}  // namespace cfgcat
