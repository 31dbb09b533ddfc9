#pragma once
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <variant>

#include "log_level.hpp"

namespace rlog
{

// An error value handed to a leveled log call instead of format arguments.
struct ErrorPayload
{
  std::string kind = "Error";
  std::string message;
  std::string trace;  // one frame per line, may be empty

  static ErrorPayload FromException(const std::exception& e);
};

// Already formatted argument list.
struct ArgsPayload
{
  std::string text;
};

using LogPayload = std::variant<ErrorPayload, ArgsPayload>;

// Renders a payload to the message text emitted at `level`.
// Error payloads lose a leading "<kind>: ", get it back as a prefix unless the
// level is Error, and carry their trace for Error and Warning.
std::string RenderPayload(LogLevel level, const LogPayload& payload);

struct LogRecord
{
  uint64_t wall_clock_ns;
  LogLevel level;
  std::string_view module;  // empty for the root logger
  std::string_view message;
};

}  // namespace rlog
