#include "rlog/log_level.hpp"

#include <fmt/format.h>

#include <cctype>

#include "rlog/errors.hpp"

namespace rlog
{

namespace
{

bool EqualsIgnoreCase(std::string_view a, std::string_view b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
  {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i])))
    {
      return false;
    }
  }
  return true;
}

}  // namespace

LogLevel ParseLogLevel(std::string_view name)
{
  for (auto level : {LogLevel::None, LogLevel::Error, LogLevel::Warning, LogLevel::Info,
                     LogLevel::Debug, LogLevel::Spam})
  {
    if (EqualsIgnoreCase(name, ToString(level)))
    {
      return level;
    }
  }
  throw InvalidConfigurationError(fmt::format("Invalid log level: '{}'", name));
}

}  // namespace rlog
