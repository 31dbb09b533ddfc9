#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace rlog
{

// An open append-only file.
class IFileHandle
{
 public:
  virtual ~IFileHandle() = default;

  // Writes all of `data` or reports the failure in `ec`.
  virtual void Write(const char* data, size_t len, std::error_code& ec) = 0;
  virtual void Sync(std::error_code& ec) = 0;
  // Releases the descriptor even when reporting an error.
  virtual void Close(std::error_code& ec) = 0;
};

class IFileSystem
{
 public:
  virtual ~IFileSystem() = default;

  // False when file I/O is unavailable in this environment.
  virtual bool Supported() const = 0;

  virtual std::unique_ptr<IFileHandle> OpenAppend(const std::string& path,
                                                  std::error_code& ec) = 0;
  // Size in bytes; ENOENT is reported through `ec`.
  virtual uint64_t FileSize(const std::string& path, std::error_code& ec) = 0;
  virtual void Rename(const std::string& from, const std::string& to,
                      std::error_code& ec) = 0;
  virtual void Remove(const std::string& path, std::error_code& ec) = 0;
  // Entry names (not paths), without "." and "..".
  virtual std::vector<std::string> ListDir(const std::string& dir,
                                           std::error_code& ec) = 0;
};

class PosixFileSystem : public IFileSystem
{
 public:
  bool Supported() const override { return true; }

  std::unique_ptr<IFileHandle> OpenAppend(const std::string& path,
                                          std::error_code& ec) override;
  uint64_t FileSize(const std::string& path, std::error_code& ec) override;
  void Rename(const std::string& from, const std::string& to,
              std::error_code& ec) override;
  void Remove(const std::string& path, std::error_code& ec) override;
  std::vector<std::string> ListDir(const std::string& dir, std::error_code& ec) override;
};

// Every operation fails with ENOSYS; Supported() is false.
class UnsupportedFileSystem : public IFileSystem
{
 public:
  bool Supported() const override { return false; }

  std::unique_ptr<IFileHandle> OpenAppend(const std::string& path,
                                          std::error_code& ec) override;
  uint64_t FileSize(const std::string& path, std::error_code& ec) override;
  void Rename(const std::string& from, const std::string& to,
              std::error_code& ec) override;
  void Remove(const std::string& path, std::error_code& ec) override;
  std::vector<std::string> ListDir(const std::string& dir, std::error_code& ec) override;
};

// PosixFileSystem when RLOG_FILE_IO is enabled, UnsupportedFileSystem otherwise.
std::shared_ptr<IFileSystem> DefaultFileSystem();

}  // namespace rlog
