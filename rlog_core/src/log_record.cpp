#include "rlog/log_record.hpp"

namespace rlog
{

ErrorPayload ErrorPayload::FromException(const std::exception& e)
{
  ErrorPayload payload;
  payload.message = e.what();
  return payload;
}

namespace
{

std::string RenderError(LogLevel level, const ErrorPayload& err)
{
  std::string_view msg = err.message;

  // strip " *<kind>: *"
  size_t pos = msg.find_first_not_of(' ');
  if (pos != std::string_view::npos && !err.kind.empty() &&
      msg.compare(pos, err.kind.size(), err.kind) == 0 &&
      msg.size() > pos + err.kind.size() && msg[pos + err.kind.size()] == ':')
  {
    msg.remove_prefix(pos + err.kind.size() + 1);
    size_t rest = msg.find_first_not_of(' ');
    msg.remove_prefix(rest == std::string_view::npos ? msg.size() : rest);
  }

  std::string out;
  if (level != LogLevel::Error)
  {
    out += err.kind;
    out += ": ";
  }
  out += msg;

  if ((level == LogLevel::Error || level == LogLevel::Warning) && !err.trace.empty())
  {
    out += '\n';
    out += err.trace;
  }
  return out;
}

}  // namespace

std::string RenderPayload(LogLevel level, const LogPayload& payload)
{
  if (const auto* err = std::get_if<ErrorPayload>(&payload))
  {
    return RenderError(level, *err);
  }
  return std::get<ArgsPayload>(payload).text;
}

}  // namespace rlog
