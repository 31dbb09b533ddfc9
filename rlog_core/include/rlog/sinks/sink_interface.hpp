#pragma once
#include <memory>
#include <string>

#include "../formatters/formatter_interface.hpp"
#include "../log_level.hpp"
#include "../log_record.hpp"

namespace rlog
{

class ILogSink
{
 public:
  virtual ~ILogSink() = default;

  // 写入一条日志（由 Logger 在调用线程上调用，不得抛出）
  virtual void Write(const LogRecord& record) = 0;

  // 刷新缓冲区
  virtual void Flush() = 0;

  // 设置该 Sink 的格式化器
  void SetFormatter(std::unique_ptr<IFormatter> formatter)
  {
    formatter_ = std::move(formatter);
  }

  // 设置该 Sink 的最高输出级别（独立于 Logger 级别）
  void SetLevel(LogLevel level) { max_level_ = level; }

  LogLevel Level() const { return max_level_; }

  // Sink 级别过滤
  bool ShouldLog(LogLevel record_level) const
  {
    return IsEnabled(max_level_, record_level);
  }

 protected:
  std::unique_ptr<IFormatter> formatter_;
  LogLevel max_level_ = LogLevel::Spam;
  std::string format_buf_;

  // 通用格式化，结果在 format_buf_ 中，返回长度
  size_t DoFormat(const LogRecord& record)
  {
    format_buf_.clear();
    if (formatter_)
    {
      formatter_->Format(record, format_buf_);
    }
    return format_buf_.size();
  }
};

}  // namespace rlog
