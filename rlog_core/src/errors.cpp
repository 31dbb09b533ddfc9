#include "rlog/errors.hpp"

#include <fmt/format.h>

#include <cstring>

namespace rlog
{

namespace
{

std::string DescribeIo(const char* action, const std::string& path, int err)
{
  if (err == 0)
  {
    return fmt::format("{} '{}'", action, path);
  }
  return fmt::format("{} '{}': {}", action, path, std::strerror(err));
}

}  // namespace

std::string_view ToString(ErrorCode code)
{
  switch (code)
  {
    case ErrorCode::StreamOpen:
      return "StreamOpenError";
    case ErrorCode::StreamClose:
      return "StreamCloseError";
    case ErrorCode::RotationRename:
      return "RotationRenameError";
    case ErrorCode::PruneDelete:
      return "PruneDeleteError";
    case ErrorCode::InvalidConfiguration:
      return "InvalidConfigurationError";
    case ErrorCode::InvalidState:
      return "InvalidStateError";
  }
  return "LogError";
}

StreamOpenError::StreamOpenError(std::string path, int err)
    : IoError(ErrorCode::StreamOpen, DescribeIo("failed to open", path, err), path, err)
{
}

StreamCloseError::StreamCloseError(std::string path, int err)
    : IoError(ErrorCode::StreamClose, DescribeIo("failed to close", path, err), path,
              err)
{
}

RotationRenameError::RotationRenameError(const std::string& from, std::string to,
                                         int err)
    : IoError(ErrorCode::RotationRename,
              DescribeIo(fmt::format("failed to rename '{}' to", from).c_str(), to, err),
              to, err)
{
}

PruneDeleteError::PruneDeleteError(std::string path, int err)
    : IoError(ErrorCode::PruneDelete, DescribeIo("failed to delete", path, err), path,
              err)
{
}

}  // namespace rlog
