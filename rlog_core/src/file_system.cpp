#include "rlog/file_system.hpp"

#include <cerrno>

#include "rlog/platform.hpp"

#if RLOG_FILE_IO
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#endif

namespace rlog
{

namespace
{

std::error_code Unsupported()
{
  return std::make_error_code(std::errc::function_not_supported);
}

#if RLOG_FILE_IO

std::error_code LastError() { return std::error_code(errno, std::generic_category()); }

class PosixFileHandle : public IFileHandle
{
 public:
  explicit PosixFileHandle(int fd) : fd_(fd) {}

  ~PosixFileHandle() override
  {
    if (fd_ >= 0)
    {
      ::close(fd_);
      fd_ = -1;
    }
  }

  PosixFileHandle(const PosixFileHandle&) = delete;
  PosixFileHandle& operator=(const PosixFileHandle&) = delete;

  void Write(const char* data, size_t len, std::error_code& ec) override
  {
    ec.clear();
    if (fd_ < 0)
    {
      ec = std::make_error_code(std::errc::bad_file_descriptor);
      return;
    }
    while (len > 0)
    {
      ssize_t written = ::write(fd_, data, len);
      if (written < 0)
      {
        if (errno == EINTR) continue;
        ec = LastError();
        return;
      }
      data += written;
      len -= static_cast<size_t>(written);
    }
  }

  void Sync(std::error_code& ec) override
  {
    ec.clear();
#if defined(RLOG_PLATFORM_LINUX)
    if (fd_ >= 0 && ::fdatasync(fd_) != 0)
#else
    if (fd_ >= 0 && ::fsync(fd_) != 0)
#endif
    {
      ec = LastError();
    }
  }

  void Close(std::error_code& ec) override
  {
    ec.clear();
    if (fd_ < 0)
    {
      return;
    }
    int rc = ::close(fd_);
    fd_ = -1;
    if (rc != 0)
    {
      ec = LastError();
    }
  }

 private:
  int fd_;
};

#endif

}  // namespace

#if RLOG_FILE_IO

std::unique_ptr<IFileHandle> PosixFileSystem::OpenAppend(const std::string& path,
                                                         std::error_code& ec)
{
  ec.clear();
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0)
  {
    ec = LastError();
    return nullptr;
  }
  return std::make_unique<PosixFileHandle>(fd);
}

uint64_t PosixFileSystem::FileSize(const std::string& path, std::error_code& ec)
{
  ec.clear();
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0)
  {
    ec = LastError();
    return 0;
  }
  return static_cast<uint64_t>(st.st_size);
}

void PosixFileSystem::Rename(const std::string& from, const std::string& to,
                             std::error_code& ec)
{
  ec.clear();
  if (std::rename(from.c_str(), to.c_str()) != 0)
  {
    ec = LastError();
  }
}

void PosixFileSystem::Remove(const std::string& path, std::error_code& ec)
{
  ec.clear();
  if (::unlink(path.c_str()) != 0)
  {
    ec = LastError();
  }
}

std::vector<std::string> PosixFileSystem::ListDir(const std::string& dir,
                                                  std::error_code& ec)
{
  ec.clear();
  std::vector<std::string> names;
  DIR* d = ::opendir(dir.c_str());
  if (!d)
  {
    ec = LastError();
    return names;
  }

  struct dirent* ent;
  while ((ent = ::readdir(d)) != nullptr)
  {
    std::string name(ent->d_name);
    if (name == "." || name == "..") continue;
    names.push_back(std::move(name));
  }
  ::closedir(d);
  return names;
}

#else

std::unique_ptr<IFileHandle> PosixFileSystem::OpenAppend(const std::string&,
                                                         std::error_code& ec)
{
  ec = Unsupported();
  return nullptr;
}

uint64_t PosixFileSystem::FileSize(const std::string&, std::error_code& ec)
{
  ec = Unsupported();
  return 0;
}

void PosixFileSystem::Rename(const std::string&, const std::string&, std::error_code& ec)
{
  ec = Unsupported();
}

void PosixFileSystem::Remove(const std::string&, std::error_code& ec)
{
  ec = Unsupported();
}

std::vector<std::string> PosixFileSystem::ListDir(const std::string&, std::error_code& ec)
{
  ec = Unsupported();
  return {};
}

#endif

std::unique_ptr<IFileHandle> UnsupportedFileSystem::OpenAppend(const std::string&,
                                                               std::error_code& ec)
{
  ec = Unsupported();
  return nullptr;
}

uint64_t UnsupportedFileSystem::FileSize(const std::string&, std::error_code& ec)
{
  ec = Unsupported();
  return 0;
}

void UnsupportedFileSystem::Rename(const std::string&, const std::string&,
                                   std::error_code& ec)
{
  ec = Unsupported();
}

void UnsupportedFileSystem::Remove(const std::string&, std::error_code& ec)
{
  ec = Unsupported();
}

std::vector<std::string> UnsupportedFileSystem::ListDir(const std::string&,
                                                        std::error_code& ec)
{
  ec = Unsupported();
  return {};
}

std::shared_ptr<IFileSystem> DefaultFileSystem()
{
#if RLOG_FILE_IO
  return std::make_shared<PosixFileSystem>();
#else
  return std::make_shared<UnsupportedFileSystem>();
#endif
}

}  // namespace rlog
