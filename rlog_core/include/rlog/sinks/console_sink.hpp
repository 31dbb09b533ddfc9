#pragma once
#include <cstdio>
#include <optional>

#include "sink_interface.hpp"

namespace rlog
{

// Error records go to `err`, everything else to `out`.
class ConsoleSink : public ILogSink
{
 public:
  explicit ConsoleSink(std::optional<bool> force_color = std::nullopt,
                       bool timestamps = true, FILE* out = stdout, FILE* err = stderr);

  void Write(const LogRecord& record) override;
  void Flush() override;

  // Color is only honored when one of the targets is a terminal.
  void SetColors(bool enable);
  void SetTimestamps(bool enable);

  bool UseColor() const { return use_color_; }
  bool Timestamps() const { return timestamps_; }

 private:
  FILE* out_;
  FILE* err_;
  bool use_color_;
  bool timestamps_;
  bool out_is_tty_;
  bool err_is_tty_;

  void ResetFormatter();
};

}  // namespace rlog
