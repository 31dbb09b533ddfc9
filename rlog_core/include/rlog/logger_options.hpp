#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "file_system.hpp"
#include "platform.hpp"

namespace rlog
{

// User-facing options. Unset fields keep the logger's current value.
struct LoggerOptions
{
  std::optional<std::string> level;  // none|error|warning|info|debug|spam
  std::optional<bool> colors;        // only honored on a terminal
  std::optional<bool> timestamps;
  std::optional<bool> console;
  std::optional<std::string> filename;
  std::optional<uint64_t> max_file_size;  // bytes, 0 disables rotation
  std::optional<uint32_t> max_files;      // archives kept

  // Keys: level, colors, timestamps, console, filename, maxFileSize, maxFiles.
  // Unknown keys are ignored. Throws InvalidConfigurationError.
  static LoggerOptions Parse(const std::map<std::string, std::string>& values);
};

// System parameters fixed at construction.
struct LoggerRuntime
{
  std::shared_ptr<IFileSystem> file_system;  // nullptr: DefaultFileSystem()
  std::chrono::milliseconds retry_delay{RLOG_RETRY_DELAY_MS};
  size_t max_pending_writes = RLOG_MAX_PENDING_WRITES;
  FILE* console_out = stdout;
  FILE* console_err = stderr;
};

}  // namespace rlog
