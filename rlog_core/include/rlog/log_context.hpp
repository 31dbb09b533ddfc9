#pragma once
#include <exception>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "log_level.hpp"
#include "log_record.hpp"
#include "memory_usage.hpp"

namespace rlog
{

class Logger;

// A module-labelled view of a Logger. Holds no state besides the label and a
// non-owning pointer; it must not be used after its Logger is destroyed.
// Template members are defined in logger.hpp.
class LoggerContext
{
 public:
  LoggerContext(Logger& logger, std::string module);

  const std::string& Module() const { return module_; }
  Logger& GetLogger() const { return *logger_; }

  void Open();
  void Close();
  void SetFile(const std::string& path);
  void SetLevel(std::string_view name);

  template <typename... Args>
  void Error(fmt::format_string<Args...> fmt, Args&&... args);
  template <typename... Args>
  void Warning(fmt::format_string<Args...> fmt, Args&&... args);
  template <typename... Args>
  void Info(fmt::format_string<Args...> fmt, Args&&... args);
  template <typename... Args>
  void Debug(fmt::format_string<Args...> fmt, Args&&... args);
  template <typename... Args>
  void Spam(fmt::format_string<Args...> fmt, Args&&... args);

  void Error(const ErrorPayload& err);
  void Warning(const ErrorPayload& err);
  void Info(const ErrorPayload& err);
  void Debug(const ErrorPayload& err);
  void Spam(const ErrorPayload& err);

  void Error(const std::exception& e);
  void Warning(const std::exception& e);
  void Info(const std::exception& e);
  void Debug(const std::exception& e);
  void Spam(const std::exception& e);

  // Bypasses nothing: the Logger's level still applies.
  void Log(LogLevel level, const LogPayload& payload);

  // A new, uncached context on the same Logger.
  LoggerContext Context(std::string module) const;

  MemoryUsage GetMemoryUsage() const;
  void Memory();

 private:
  Logger* logger_;
  std::string module_;

  template <typename... Args>
  void LogFormatted(LogLevel level, fmt::format_string<Args...> fmt, Args&&... args);
};

}  // namespace rlog
