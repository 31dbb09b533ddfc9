#include "rlog/sinks/rotating_file_sink.hpp"

#include <cstdio>
#include <exception>

#include "rlog/errors.hpp"
#include "rlog/formatters/pattern_formatter.hpp"
#include "rlog/timestamp.hpp"

namespace rlog
{

RotatingFileSink::RotatingFileSink(LoggerBackend& backend, std::shared_ptr<IFileSystem> fs,
                                   std::chrono::milliseconds retry_delay,
                                   size_t max_pending_writes)
    : backend_(backend),
      streams_(std::move(fs)),
      pruner_(streams_.FileSystem()),
      retry_delay_(retry_delay),
      pending_(max_pending_writes)
{
  formatter_ = std::make_unique<PatternFormatter>(PatternFormatter::kFilePattern, false);
}

RotatingFileSink::~RotatingFileSink()
{
  try
  {
    Close();
  }
  catch (const LogError& e)
  {
    std::fprintf(stderr, "RotatingFileSink: %s\n", e.what());
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    CancelRetryLocked();
  }
  // queued prune and reopen tasks hold `this`
  backend_.WaitIdle();
}

void RotatingFileSink::SetPath(const std::string& path)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (handle_)
  {
    throw InvalidStateError("Log stream has already been created.");
  }
  path_ = path;
}

std::string RotatingFileSink::Path() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return path_;
}

void RotatingFileSink::SetMaxFileSize(uint64_t bytes)
{
  std::lock_guard<std::mutex> lock(mutex_);
  max_file_size_ = bytes;
}

void RotatingFileSink::SetMaxFiles(size_t count)
{
  std::lock_guard<std::mutex> lock(mutex_);
  max_files_ = count;
}

uint64_t RotatingFileSink::MaxFileSize() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return max_file_size_;
}

size_t RotatingFileSink::MaxFiles() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return max_files_;
}

bool RotatingFileSink::FileOutputLocked() const
{
  return !path_.empty() && streams_.Supported();
}

void RotatingFileSink::Open()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (open_)
  {
    return;
  }

  if (FileOutputLocked() && !handle_)
  {
    uint64_t size = streams_.ExistingSize(path_);
    handle_ = streams_.Open(path_);
    current_size_ = size;
  }
  open_ = true;
}

void RotatingFileSink::Close()
{
  std::unique_ptr<IFileHandle> handle;
  std::string path;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    // a rotation that fails to reopen while we wait must not arm a new retry
    closing_ = true;

    // lines buffered by an in-flight rotation land in the new file first
    WaitForRotationLocked(lock);
    CancelRetryLocked();

    open_ = false;
    closing_ = false;
    handle = std::move(handle_);
    current_size_ = 0;
    path = path_;
  }
  streams_.Close(std::move(handle), path);
}

void RotatingFileSink::CancelRetryLocked()
{
  if (retry_timer_ != LoggerBackend::kNoTimer)
  {
    backend_.Cancel(retry_timer_);
    retry_timer_ = LoggerBackend::kNoTimer;
  }
}

void RotatingFileSink::WaitForRotationLocked(std::unique_lock<std::mutex>& lock)
{
  while (rotating_)
  {
    if (backend_.Running())
    {
      rotation_cv_.wait(lock);
    }
    else
    {
      lock.unlock();
      backend_.Drain();
      lock.lock();
    }
  }
}

void RotatingFileSink::Write(const LogRecord& record)
{
  if (!ShouldLog(record.level))
  {
    return;
  }

  std::string line;
  if (formatter_)
  {
    formatter_->Format(record, line);
  }
  line += '\n';
  WriteLine(std::move(line));
}

void RotatingFileSink::WriteLine(std::string line)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_)
  {
    return;
  }

  if (rotating_)
  {
    pending_.Push(std::move(line));
    return;
  }

  if (!handle_)
  {
    // waiting for the stream to be reopened
    if (retry_timer_ != LoggerBackend::kNoTimer)
    {
      ++drop_count_;
    }
    return;
  }

  WriteLocked(line);
}

void RotatingFileSink::WriteLocked(const std::string& line)
{
  std::error_code ec;
  handle_->Write(line.data(), line.size(), ec);
  if (ec)
  {
    ++drop_count_;
    HandleStreamErrorLocked(ec);
    return;
  }

  current_size_ += line.size();
  if (!rotating_ && max_file_size_ > 0 && current_size_ >= max_file_size_)
  {
    StartRotationLocked(nullptr);
  }
}

std::future<RotatingFileSink::RotateResult> RotatingFileSink::Rotate()
{
  auto promise = std::make_shared<std::promise<RotateResult>>();
  auto future = promise->get_future();

  std::lock_guard<std::mutex> lock(mutex_);
  if (rotating_ || !open_ || !FileOutputLocked())
  {
    promise->set_value(std::nullopt);
    return future;
  }
  StartRotationLocked(std::move(promise));
  return future;
}

void RotatingFileSink::StartRotationLocked(PromisePtr promise)
{
  rotating_ = true;
  backend_.Post([this, promise] { RunRotation(promise); });
}

std::string RotatingFileSink::NextArchivePathLocked(const LogPathParts& parts)
{
  uint64_t ms = wall_clock_now_ns() / 1'000'000ULL;
  if (ms <= last_archive_ms_)
  {
    ms = last_archive_ms_ + 1;
  }

  // never overwrite an archive left by an earlier run
  for (;;)
  {
    char stamp[32];
    size_t n = format_archive_stamp(ms * 1'000'000ULL, stamp, sizeof(stamp));
    std::string archive = MakeArchivePath(parts, std::string(stamp, n));

    std::error_code ec;
    streams_.FileSystem().FileSize(archive, ec);
    if (ec)
    {
      last_archive_ms_ = ms;
      return archive;
    }
    ++ms;
  }
}

void RotatingFileSink::RunRotation(const PromisePtr& promise)
{
  std::unique_ptr<IFileHandle> old_handle;
  std::string path;
  std::string archive;
  LogPathParts parts;
  size_t max_files = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    old_handle = std::move(handle_);
    current_size_ = 0;
    path = path_;
    parts = SplitLogPath(path);
    archive = NextArchivePathLocked(parts);
    max_files = max_files_;
  }

  // a failed close must not stop us from starting a fresh file
  streams_.CloseQuietly(std::move(old_handle));

  RotateResult result;
  std::exception_ptr error;

  std::error_code ec;
  streams_.FileSystem().Rename(path, archive, ec);
  if (ec)
  {
    RotationRenameError err(path, archive, ec.value());
    std::fprintf(stderr, "RotatingFileSink: %s\n", err.what());
    error = std::make_exception_ptr(err);
  }
  else
  {
    result = archive;
  }

  std::unique_ptr<IFileHandle> fresh;
  uint64_t size = 0;
  try
  {
    size = streams_.ExistingSize(path);
    fresh = streams_.Open(path);
  }
  catch (const StreamOpenError& e)
  {
    std::fprintf(stderr, "RotatingFileSink: %s\n", e.what());
    if (!error)
    {
      error = std::current_exception();
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fresh)
    {
      handle_ = std::move(fresh);
      // the old file is still in place after a failed rename; count from zero
      // so the next attempt waits for another max_file_size bytes
      current_size_ = result ? size : 0;
      pending_.Drain(
          [this](const std::string& line)
          {
            if (!handle_)
            {
              ++drop_count_;
              return;
            }
            WriteLocked(line);
          });
    }
    else
    {
      drop_count_ += pending_.Size();
      pending_.Clear();
      ScheduleRetryLocked();
    }

    rotating_ = false;

    if (result)
    {
      ++rotation_count_;
      backend_.Post([this, parts, max_files]
                    { pruner_.Prune(parts.dir, parts.base, parts.ext, max_files); });

      if (handle_ && max_file_size_ > 0 && current_size_ >= max_file_size_)
      {
        StartRotationLocked(nullptr);
      }
    }
  }
  rotation_cv_.notify_all();

  if (promise)
  {
    if (error)
    {
      promise->set_exception(error);
    }
    else
    {
      promise->set_value(result);
    }
  }
}

void RotatingFileSink::HandleStreamError(const std::error_code& ec)
{
  std::lock_guard<std::mutex> lock(mutex_);
  HandleStreamErrorLocked(ec);
}

void RotatingFileSink::HandleStreamErrorLocked(const std::error_code& ec)
{
  std::fprintf(stderr, "RotatingFileSink: stream error on '%s': %s\n", path_.c_str(),
               ec.message().c_str());
  streams_.CloseQuietly(std::move(handle_));
  current_size_ = 0;
  ScheduleRetryLocked();
}

void RotatingFileSink::ScheduleRetryLocked()
{
  if (retry_timer_ != LoggerBackend::kNoTimer || !open_ || closing_ || !FileOutputLocked())
  {
    return;
  }
  retry_timer_ = backend_.PostDelayed(retry_delay_, [this] { Reopen(); });
}

void RotatingFileSink::Reopen()
{
  std::string path;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    retry_timer_ = LoggerBackend::kNoTimer;
    if (!open_ || handle_ || rotating_ || !FileOutputLocked())
    {
      return;
    }
    path = path_;
  }

  std::unique_ptr<IFileHandle> fresh;
  uint64_t size = 0;
  try
  {
    size = streams_.ExistingSize(path);
    fresh = streams_.Open(path);
  }
  catch (const StreamOpenError&)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ScheduleRetryLocked();
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_ || handle_ || rotating_ || path != path_)
  {
    streams_.CloseQuietly(std::move(fresh));
    return;
  }
  handle_ = std::move(fresh);
  current_size_ = size;
}

void RotatingFileSink::Flush()
{
  {
    std::unique_lock<std::mutex> lock(mutex_);
    WaitForRotationLocked(lock);
  }
  backend_.WaitIdle();

  std::lock_guard<std::mutex> lock(mutex_);
  if (handle_)
  {
    std::error_code ec;
    handle_->Sync(ec);
    if (ec)
    {
      HandleStreamErrorLocked(ec);
    }
  }
}

bool RotatingFileSink::IsOpen() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

bool RotatingFileSink::IsRotating() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return rotating_;
}

bool RotatingFileSink::HasHandle() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return handle_ != nullptr;
}

bool RotatingFileSink::RetryPending() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return retry_timer_ != LoggerBackend::kNoTimer;
}

uint64_t RotatingFileSink::CurrentSize() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return current_size_;
}

size_t RotatingFileSink::PendingWrites() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.Size();
}

uint64_t RotatingFileSink::DropCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return drop_count_ + pending_.DropCount();
}

uint64_t RotatingFileSink::RotationCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return rotation_count_;
}

}  // namespace rlog
