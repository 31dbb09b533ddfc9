#pragma once
#include <cstdint>
#include <string_view>

namespace rlog
{

// 数值越大越详细；消息级别 <= 阈值时输出
enum class LogLevel : uint8_t
{
  None = 0,
  Error = 1,
  Warning = 2,
  Info = 3,
  Debug = 4,
  Spam = 5
};

constexpr std::string_view ToString(LogLevel level)
{
  switch (level)
  {
    case LogLevel::None:
      return "none";
    case LogLevel::Error:
      return "error";
    case LogLevel::Warning:
      return "warning";
    case LogLevel::Info:
      return "info";
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Spam:
      return "spam";
  }
  return "unknown";
}

constexpr char ToShortChar(LogLevel level)
{
  switch (level)
  {
    case LogLevel::None:
      return 'N';
    case LogLevel::Error:
      return 'E';
    case LogLevel::Warning:
      return 'W';
    case LogLevel::Info:
      return 'I';
    case LogLevel::Debug:
      return 'D';
    case LogLevel::Spam:
      return 'S';
  }
  return '?';
}

// CSI SGR parameters used for the console level tag
constexpr std::string_view ToColorCode(LogLevel level)
{
  switch (level)
  {
    case LogLevel::None:
      return "0";
    case LogLevel::Error:
      return "1;31";
    case LogLevel::Warning:
      return "1;33";
    case LogLevel::Info:
      return "94";
    case LogLevel::Debug:
      return "90";
    case LogLevel::Spam:
      return "90";
  }
  return "0";
}

constexpr bool IsEnabled(LogLevel threshold, LogLevel level)
{
  return static_cast<uint8_t>(level) <= static_cast<uint8_t>(threshold);
}

// Case-insensitive. Throws InvalidConfigurationError on an unknown name.
LogLevel ParseLogLevel(std::string_view name);

// 编译期最高活跃级别（通过 CMake -DRLOG_ACTIVE_LEVEL=3 注入），仅作用于 RLOG_* 宏
#ifndef RLOG_ACTIVE_LEVEL
    #ifdef NDEBUG
        #define RLOG_ACTIVE_LEVEL 4  // Debug
    #else
        #define RLOG_ACTIVE_LEVEL 5  // Spam
    #endif
#endif

}  // namespace rlog
