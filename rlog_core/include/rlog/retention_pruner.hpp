#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "file_system.hpp"

namespace rlog
{

class PruneDeleteError;

// "/var/log/app.log" -> {"/var/log", "app", ".log"}
struct LogPathParts
{
  std::string dir;
  std::string base;
  std::string ext;
};

LogPathParts SplitLogPath(const std::string& path);

// <dir>/<base>_<stamp><ext>
std::string MakeArchivePath(const LogPathParts& parts, const std::string& stamp);

// Deletes the oldest rotated archives `<base>_*<ext>` in a directory so that
// at most `max_files` remain. Archive stamps sort chronologically, so plain
// lexicographic order is oldest first.
class RetentionPruner
{
 public:
  using ErrorReporter = std::function<void(const PruneDeleteError&)>;

  explicit RetentionPruner(IFileSystem& fs);

  // Called for every archive that could not be deleted; pruning continues.
  void SetErrorReporter(ErrorReporter reporter) { reporter_ = std::move(reporter); }

  // Archive names for `base`/`ext` in `dir`, oldest first.
  std::vector<std::string> ListArchives(const std::string& dir, const std::string& base,
                                        const std::string& ext) const;

  // Returns the number of archives removed.
  size_t Prune(const std::string& dir, const std::string& base, const std::string& ext,
               size_t max_files);

  static bool IsArchiveName(const std::string& name, const std::string& base,
                            const std::string& ext);

 private:
  IFileSystem& fs_;
  ErrorReporter reporter_;
};

}  // namespace rlog
