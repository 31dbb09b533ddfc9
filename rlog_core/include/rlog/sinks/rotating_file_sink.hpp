#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

#include "../backend.hpp"
#include "../retention_pruner.hpp"
#include "../stream_controller.hpp"
#include "../write_buffer.hpp"
#include "sink_interface.hpp"

namespace rlog
{

// Size-bounded, auto-rotating log file.
//
// A write that takes the file to max_file_size or beyond raises the rotating
// flag and posts the rotation to the backend. Until the rotation has renamed
// the file to "<base>_<stamp><ext>" and reopened a fresh one, lines are held
// in a WriteBuffer and replayed in order afterwards. Archives beyond max_files
// are pruned once the rotation has finished.
//
// A failed write closes the handle and schedules a reopen after retry_delay;
// failed reopens reschedule until one succeeds or Close() is called.
class RotatingFileSink : public ILogSink
{
 public:
  using RotateResult = std::optional<std::string>;

  RotatingFileSink(LoggerBackend& backend, std::shared_ptr<IFileSystem> fs,
                   std::chrono::milliseconds retry_delay =
                       std::chrono::milliseconds(RLOG_RETRY_DELAY_MS),
                   size_t max_pending_writes = RLOG_MAX_PENDING_WRITES);
  ~RotatingFileSink() override;

  RotatingFileSink(const RotatingFileSink&) = delete;
  RotatingFileSink& operator=(const RotatingFileSink&) = delete;

  // Throws InvalidStateError while a file handle is open.
  void SetPath(const std::string& path);
  std::string Path() const;
  void SetMaxFileSize(uint64_t bytes);  // 0 disables rotation
  void SetMaxFiles(size_t count);
  uint64_t MaxFileSize() const;
  size_t MaxFiles() const;

  // No file is opened without a path or when the file system is unsupported.
  // Throws StreamOpenError.
  void Open();
  // Waits for an in-flight rotation, cancels a pending reopen (including one
  // armed by that rotation), releases the handle. Throws StreamCloseError
  // after releasing it.
  void Close();

  // Resolves to the archive path, or std::nullopt when no rotation was
  // started (already rotating, closed, no path, unsupported file system).
  // Rotation failures are delivered as RotationRenameError / StreamOpenError.
  std::future<RotateResult> Rotate();

  void Write(const LogRecord& record) override;
  void WriteLine(std::string line);
  // Waits for rotation and background work, then syncs the file.
  void Flush() override;

  // Stream error event from the current handle.
  void HandleStreamError(const std::error_code& ec);

  bool IsOpen() const;
  bool IsRotating() const;
  bool HasHandle() const;
  bool RetryPending() const;
  uint64_t CurrentSize() const;
  size_t PendingWrites() const;
  uint64_t DropCount() const;
  uint64_t RotationCount() const;

 private:
  using PromisePtr = std::shared_ptr<std::promise<RotateResult>>;

  LoggerBackend& backend_;
  StreamController streams_;
  RetentionPruner pruner_;
  std::chrono::milliseconds retry_delay_;

  mutable std::mutex mutex_;
  std::condition_variable rotation_cv_;

  std::string path_;
  uint64_t max_file_size_ = RLOG_DEFAULT_MAX_FILE_SIZE;
  size_t max_files_ = RLOG_DEFAULT_MAX_FILES;

  bool open_ = false;
  bool rotating_ = false;
  bool closing_ = false;
  uint64_t current_size_ = 0;
  std::unique_ptr<IFileHandle> handle_;
  WriteBuffer pending_;
  LoggerBackend::TimerId retry_timer_ = LoggerBackend::kNoTimer;

  uint64_t last_archive_ms_ = 0;
  uint64_t drop_count_ = 0;
  uint64_t rotation_count_ = 0;

  bool FileOutputLocked() const;
  void WriteLocked(const std::string& line);
  void StartRotationLocked(PromisePtr promise);
  void RunRotation(const PromisePtr& promise);
  std::string NextArchivePathLocked(const LogPathParts& parts);
  void HandleStreamErrorLocked(const std::error_code& ec);
  void ScheduleRetryLocked();
  void CancelRetryLocked();
  void Reopen();
  void WaitForRotationLocked(std::unique_lock<std::mutex>& lock);
};

}  // namespace rlog
