#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include "file_system.hpp"

namespace rlog
{

// Opens and closes the append-only log file handle.
class StreamController
{
 public:
  explicit StreamController(std::shared_ptr<IFileSystem> fs);

  bool Supported() const { return fs_->Supported(); }
  IFileSystem& FileSystem() { return *fs_; }

  // Throws StreamOpenError.
  std::unique_ptr<IFileHandle> Open(const std::string& path);

  // Always releases the handle. Throws StreamCloseError if the OS reported a
  // failure while doing so.
  void Close(std::unique_ptr<IFileHandle> handle, const std::string& path);

  // Close() that reports nothing; used on the rotation and recovery paths.
  void CloseQuietly(std::unique_ptr<IFileHandle> handle);

  // Current size of `path`, 0 if it does not exist. Throws StreamOpenError on
  // any other failure.
  uint64_t ExistingSize(const std::string& path);

 private:
  std::shared_ptr<IFileSystem> fs_;
};

}  // namespace rlog
