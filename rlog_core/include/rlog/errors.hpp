#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace rlog
{

enum class ErrorCode : uint8_t
{
  StreamOpen,
  StreamClose,
  RotationRename,
  PruneDelete,
  InvalidConfiguration,
  InvalidState
};

std::string_view ToString(ErrorCode code);

class LogError : public std::runtime_error
{
 public:
  LogError(ErrorCode code, const std::string& what)
      : std::runtime_error(what), code_(code)
  {
  }

  ErrorCode Code() const { return code_; }

 private:
  ErrorCode code_;
};

// I/O errors carry the path and the OS error number (0 if not applicable)
class IoError : public LogError
{
 public:
  IoError(ErrorCode code, const std::string& what, std::string path, int err)
      : LogError(code, what), path_(std::move(path)), errno_(err)
  {
  }

  const std::string& Path() const { return path_; }
  int Errno() const { return errno_; }

 private:
  std::string path_;
  int errno_;
};

class StreamOpenError : public IoError
{
 public:
  StreamOpenError(std::string path, int err);
};

class StreamCloseError : public IoError
{
 public:
  StreamCloseError(std::string path, int err);
};

class RotationRenameError : public IoError
{
 public:
  RotationRenameError(const std::string& from, std::string to, int err);
};

class PruneDeleteError : public IoError
{
 public:
  PruneDeleteError(std::string path, int err);
};

class InvalidConfigurationError : public LogError
{
 public:
  explicit InvalidConfigurationError(const std::string& what)
      : LogError(ErrorCode::InvalidConfiguration, what)
  {
  }
};

class InvalidStateError : public LogError
{
 public:
  explicit InvalidStateError(const std::string& what)
      : LogError(ErrorCode::InvalidState, what)
  {
  }
};

}  // namespace rlog
