#pragma once
#include <functional>

#include "sink_interface.hpp"

namespace rlog
{

// The record's views are only valid for the duration of the callback.
class CallbackSink : public ILogSink
{
 public:
  using Callback = std::function<void(const LogRecord&)>;

  explicit CallbackSink(Callback cb);

  void Write(const LogRecord& record) override;
  void Flush() override;

 private:
  Callback callback_;
};

}  // namespace rlog
