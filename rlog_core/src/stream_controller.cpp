#include "rlog/stream_controller.hpp"

#include <cerrno>

#include "rlog/errors.hpp"

namespace rlog
{

StreamController::StreamController(std::shared_ptr<IFileSystem> fs)
    : fs_(fs ? std::move(fs) : DefaultFileSystem())
{
}

std::unique_ptr<IFileHandle> StreamController::Open(const std::string& path)
{
  std::error_code ec;
  auto handle = fs_->OpenAppend(path, ec);
  if (ec || !handle)
  {
    throw StreamOpenError(path, ec ? ec.value() : EIO);
  }
  return handle;
}

void StreamController::Close(std::unique_ptr<IFileHandle> handle, const std::string& path)
{
  if (!handle)
  {
    return;
  }
  std::error_code ec;
  handle->Close(ec);
  handle.reset();
  if (ec)
  {
    throw StreamCloseError(path, ec.value());
  }
}

void StreamController::CloseQuietly(std::unique_ptr<IFileHandle> handle)
{
  if (!handle)
  {
    return;
  }
  std::error_code ignored;
  handle->Close(ignored);
}

uint64_t StreamController::ExistingSize(const std::string& path)
{
  std::error_code ec;
  uint64_t size = fs_->FileSize(path, ec);
  if (ec == std::errc::no_such_file_or_directory)
  {
    return 0;
  }
  if (ec)
  {
    throw StreamOpenError(path, ec.value());
  }
  return size;
}

}  // namespace rlog
