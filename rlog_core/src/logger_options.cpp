#include "rlog/logger_options.hpp"

#include <fmt/format.h>

#include <limits>

#include "rlog/errors.hpp"
#include "rlog/log_level.hpp"

namespace rlog
{

namespace
{

bool ParseBool(const std::string& key, const std::string& value)
{
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  throw InvalidConfigurationError(
      fmt::format("Option '{}' expects a boolean, got '{}'", key, value));
}

uint64_t ParseUnsigned(const std::string& key, const std::string& value, uint64_t max)
{
  if (value.empty())
  {
    throw InvalidConfigurationError(fmt::format("Option '{}' is empty", key));
  }

  uint64_t result = 0;
  for (char c : value)
  {
    if (c < '0' || c > '9')
    {
      throw InvalidConfigurationError(fmt::format(
          "Option '{}' expects a non-negative integer, got '{}'", key, value));
    }
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (result > (max - digit) / 10)
    {
      throw InvalidConfigurationError(
          fmt::format("Option '{}' is out of range: '{}'", key, value));
    }
    result = result * 10 + digit;
  }
  return result;
}

}  // namespace

LoggerOptions LoggerOptions::Parse(const std::map<std::string, std::string>& values)
{
  LoggerOptions options;
  for (const auto& [key, value] : values)
  {
    if (key == "level")
    {
      ParseLogLevel(value);  // throws on an unknown name
      options.level = value;
    }
    else if (key == "colors")
    {
      options.colors = ParseBool(key, value);
    }
    else if (key == "timestamps")
    {
      options.timestamps = ParseBool(key, value);
    }
    else if (key == "console")
    {
      options.console = ParseBool(key, value);
    }
    else if (key == "filename")
    {
      if (value.empty())
      {
        throw InvalidConfigurationError("Bad file.");
      }
      options.filename = value;
    }
    else if (key == "maxFileSize")
    {
      options.max_file_size =
          ParseUnsigned(key, value, std::numeric_limits<uint64_t>::max());
    }
    else if (key == "maxFiles")
    {
      options.max_files = static_cast<uint32_t>(
          ParseUnsigned(key, value, std::numeric_limits<uint32_t>::max()));
    }
  }
  return options;
}

}  // namespace rlog
