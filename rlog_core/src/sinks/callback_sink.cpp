#include "rlog/sinks/callback_sink.hpp"

namespace rlog
{

CallbackSink::CallbackSink(Callback cb) : callback_(std::move(cb)) {}

void CallbackSink::Write(const LogRecord& record)
{
  if (!ShouldLog(record.level))
  {
    return;
  }
  if (callback_)
  {
    callback_(record);
  }
}

void CallbackSink::Flush() {}

}  // namespace rlog
