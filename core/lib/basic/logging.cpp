// cfgcat/basic/logging.cpp - Logger implementation
#include "cfgcat/basic/logging.hpp"

#include <fmt/ostream.h>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace cfgcat
{

std::string_view to_string(LogLevel level) noexcept
{
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Notice:
      return "NOTICE";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
  }
  return "ERROR";
}

std::optional<LogLevel> parse_log_level(std::string_view text)
{
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (lower == "debug") return LogLevel::Debug;
  if (lower == "info") return LogLevel::Info;
  if (lower == "notice") return LogLevel::Notice;
  if (lower == "warning" || lower == "warn") return LogLevel::Warning;
  if (lower == "error") return LogLevel::Error;
  return std::nullopt;
}

Logger::Logger(std::string name, LogLevel level, std::ostream * os)
: name_(std::move(name)), level_(level), os_(os != nullptr ? os : &std::cerr)
{
}

void Logger::log(LogLevel level, std::string_view message)
{
  if (!enabled(level)) {
    return;
  }
  const std::lock_guard<std::mutex> lock(mutex_);
  fmt::print(*os_, "{}: {}\n", to_string(level), message);
}

}  // namespace cfgcat
