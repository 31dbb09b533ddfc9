#include "rlog/retention_pruner.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdio>

#include "rlog/errors.hpp"

namespace rlog
{

namespace
{

std::string JoinPath(const std::string& dir, const std::string& name)
{
  if (dir.empty()) return name;
  std::string full = dir;
  if (full.back() != '/') full += '/';
  full += name;
  return full;
}

}  // namespace

LogPathParts SplitLogPath(const std::string& path)
{
  LogPathParts parts;
  std::string name = path;
  size_t slash = path.find_last_of('/');
  if (slash != std::string::npos)
  {
    parts.dir = path.substr(0, slash == 0 ? 1 : slash);
    name = path.substr(slash + 1);
  }

  // a leading dot is part of the name, not an extension
  size_t dot = name.find_last_of('.');
  if (dot != std::string::npos && dot > 0)
  {
    parts.base = name.substr(0, dot);
    parts.ext = name.substr(dot);
  }
  else
  {
    parts.base = name;
  }
  return parts;
}

std::string MakeArchivePath(const LogPathParts& parts, const std::string& stamp)
{
  return JoinPath(parts.dir, parts.base + "_" + stamp + parts.ext);
}

RetentionPruner::RetentionPruner(IFileSystem& fs) : fs_(fs) {}

bool RetentionPruner::IsArchiveName(const std::string& name, const std::string& base,
                                    const std::string& ext)
{
  std::string prefix = base + "_";
  if (name.size() < prefix.size() + ext.size()) return false;
  if (name.compare(0, prefix.size(), prefix) != 0) return false;
  if (name.compare(name.size() - ext.size(), ext.size(), ext) != 0) return false;

  // the stamp part only holds digits and separators, so "app_worker.log" is
  // not an archive of "app.log"
  size_t stamp_len = name.size() - prefix.size() - ext.size();
  if (stamp_len == 0) return false;
  return std::all_of(name.begin() + static_cast<std::ptrdiff_t>(prefix.size()),
                     name.begin() + static_cast<std::ptrdiff_t>(prefix.size() + stamp_len),
                     [](char c) { return (c >= '0' && c <= '9') || c == '-' || c == '_'; });
}

std::vector<std::string> RetentionPruner::ListArchives(const std::string& dir,
                                                       const std::string& base,
                                                       const std::string& ext) const
{
  std::error_code ec;
  std::vector<std::string> names = fs_.ListDir(dir.empty() ? "." : dir, ec);
  if (ec)
  {
    return {};
  }

  names.erase(std::remove_if(names.begin(), names.end(),
                             [&](const std::string& n)
                             { return !IsArchiveName(n, base, ext); }),
              names.end());
  std::sort(names.begin(), names.end());
  return names;
}

size_t RetentionPruner::Prune(const std::string& dir, const std::string& base,
                              const std::string& ext, size_t max_files)
{
  std::vector<std::string> archives = ListArchives(dir, base, ext);
  if (archives.size() <= max_files)
  {
    return 0;
  }

  size_t excess = archives.size() - max_files;
  size_t removed = 0;
  for (size_t i = 0; i < excess; ++i)
  {
    std::string full_path = JoinPath(dir, archives[i]);
    std::error_code ec;
    fs_.Remove(full_path, ec);
    if (ec)
    {
      PruneDeleteError err(full_path, ec.value());
      if (reporter_)
      {
        reporter_(err);
      }
      else
      {
        std::fprintf(stderr, "RetentionPruner: %s\n", err.what());
      }
      continue;
    }
    ++removed;
  }
  return removed;
}

}  // namespace rlog
