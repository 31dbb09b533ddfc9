#include "rlog/logger.hpp"

#include <cstdio>

#include "rlog/errors.hpp"
#include "rlog/timestamp.hpp"

namespace rlog
{

Logger::Logger(const LoggerOptions& options, LoggerRuntime runtime)
{
  console_ = std::make_unique<ConsoleSink>(std::nullopt, true, runtime.console_out,
                                           runtime.console_err);
  file_sink_ = std::make_unique<RotatingFileSink>(backend_, std::move(runtime.file_system),
                                                  runtime.retry_delay,
                                                  runtime.max_pending_writes);
  Set(options);
  backend_.Start();
}

Logger::~Logger()
{
  try
  {
    Close();
  }
  catch (const LogError& e)
  {
    std::fprintf(stderr, "Logger: %s\n", e.what());
  }
  backend_.Stop();
}

void Logger::Set(const LoggerOptions& options)
{
  LogLevel level = options.level ? ParseLogLevel(*options.level) : Level();

  if (options.filename)
  {
    file_sink_->SetPath(*options.filename);
  }
  if (options.level)
  {
    SetLevel(level);
  }
  if (options.colors || options.timestamps)
  {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    if (options.colors)
    {
      console_->SetColors(*options.colors);
    }
    if (options.timestamps)
    {
      console_->SetTimestamps(*options.timestamps);
    }
  }
  if (options.console)
  {
    console_enabled_.store(*options.console, std::memory_order_relaxed);
  }
  if (options.max_file_size)
  {
    file_sink_->SetMaxFileSize(*options.max_file_size);
  }
  if (options.max_files)
  {
    file_sink_->SetMaxFiles(*options.max_files);
  }
}

void Logger::Set(std::string_view level) { SetLevel(level); }

void Logger::SetLevel(std::string_view name) { SetLevel(ParseLogLevel(name)); }

void Logger::SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }

LogLevel Logger::Level() const { return level_.load(std::memory_order_relaxed); }

bool Logger::Enabled(LogLevel level) const { return IsEnabled(Level(), level); }

void Logger::SetFile(const std::string& path) { file_sink_->SetPath(path); }

void Logger::AddSink(std::unique_ptr<ILogSink> sink)
{
  std::lock_guard<std::mutex> lock(sinks_mutex_);
  sinks_.push_back(std::move(sink));
}

void Logger::Open()
{
  if (open_.load(std::memory_order_acquire))
  {
    return;
  }
  file_sink_->Open();
  open_.store(true, std::memory_order_release);
}

void Logger::Close()
{
  open_.store(false, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    console_->Flush();
    for (auto& sink : sinks_)
    {
      sink->Flush();
    }
  }
  file_sink_->Close();
}

bool Logger::IsOpen() const { return open_.load(std::memory_order_acquire); }

std::future<std::optional<std::string>> Logger::Rotate() { return file_sink_->Rotate(); }

void Logger::Flush()
{
  {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    console_->Flush();
    for (auto& sink : sinks_)
    {
      sink->Flush();
    }
  }
  file_sink_->Flush();
}

size_t Logger::Drain(size_t max_tasks) { return backend_.Drain(max_tasks); }

void Logger::Log(LogLevel level, std::string_view module, const LogPayload& payload)
{
  if (!Enabled(level) || !open_.load(std::memory_order_acquire))
  {
    return;
  }
  Emit(level, module, RenderPayload(level, payload));
}

void Logger::Emit(LogLevel level, std::string_view module, std::string_view message)
{
  LogRecord record{};
  record.wall_clock_ns = wall_clock_now_ns();
  record.level = level;
  record.module = module;
  record.message = message;

  {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    if (console_enabled_.load(std::memory_order_relaxed))
    {
      console_->Write(record);
    }
    for (auto& sink : sinks_)
    {
      sink->Write(record);
    }
  }
  file_sink_->Write(record);
}

LoggerContext& Logger::Context(const std::string& module)
{
  std::lock_guard<std::mutex> lock(contexts_mutex_);
  auto it = contexts_.find(module);
  if (it == contexts_.end())
  {
    it = contexts_.emplace(module, std::make_unique<LoggerContext>(*this, module)).first;
  }
  return *it->second;
}

MemoryUsage Logger::GetMemoryUsage() const { return SampleMemoryUsage(); }

void Logger::Memory(std::string_view module)
{
  if (!Enabled(LogLevel::Debug) || !open_.load(std::memory_order_acquire))
  {
    return;
  }
  MemoryUsage mem = GetMemoryUsage();
  LogFormatted(LogLevel::Debug, module, "Memory: rss={}mb, heap={}/{}mb mapped={}mb",
               mem.total, mem.heap, mem.heap_total, mem.mapped);
}

uint64_t Logger::DropCount() const { return file_sink_->DropCount(); }

}  // namespace rlog
