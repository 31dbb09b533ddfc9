#include "rlog/sinks/console_sink.hpp"

#include "rlog/formatters/pattern_formatter.hpp"
#include "rlog/platform.hpp"

#if defined(RLOG_PLATFORM_LINUX) || defined(RLOG_PLATFORM_MACOS)
#include <unistd.h>
#elif defined(RLOG_PLATFORM_WINDOWS)
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#endif

namespace rlog
{

ConsoleSink::ConsoleSink(std::optional<bool> force_color, bool timestamps, FILE* out,
                         FILE* err)
    : out_(out), err_(err), timestamps_(timestamps)
{
  out_is_tty_ = out_ != nullptr && ::isatty(fileno(out_)) != 0;
  err_is_tty_ = err_ != nullptr && ::isatty(fileno(err_)) != 0;

  if (force_color.has_value())
  {
    use_color_ = force_color.value();
  }
  else
  {
    use_color_ = out_is_tty_ || err_is_tty_;
  }
  ResetFormatter();
}

void ConsoleSink::SetColors(bool enable)
{
  if (enable && !out_is_tty_ && !err_is_tty_)
  {
    return;
  }
  use_color_ = enable;
  ResetFormatter();
}

void ConsoleSink::SetTimestamps(bool enable)
{
  timestamps_ = enable;
  ResetFormatter();
}

void ConsoleSink::ResetFormatter()
{
  formatter_ = std::make_unique<PatternFormatter>(
      timestamps_ ? PatternFormatter::kConsolePattern
                  : PatternFormatter::kConsolePatternNoTime,
      use_color_);
}

void ConsoleSink::Write(const LogRecord& record)
{
  if (!ShouldLog(record.level))
  {
    return;
  }

  size_t len = DoFormat(record);
  FILE* target = (record.level == LogLevel::Error) ? err_ : out_;
  if (len == 0 || target == nullptr)
  {
    return;
  }

  format_buf_ += '\n';
  std::fwrite(format_buf_.data(), 1, format_buf_.size(), target);
}

void ConsoleSink::Flush()
{
  if (out_) std::fflush(out_);
  if (err_) std::fflush(err_);
}

}  // namespace rlog
