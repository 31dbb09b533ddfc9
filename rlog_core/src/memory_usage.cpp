#include "rlog/memory_usage.hpp"

#include <cstdio>

#include "rlog/platform.hpp"

#if defined(RLOG_PLATFORM_LINUX)
#include <malloc.h>
#include <unistd.h>
#endif

namespace rlog
{

namespace
{

uint64_t ToMiB(uint64_t bytes) { return bytes / (1u << 20); }

}  // namespace

MemoryUsage SampleMemoryUsage()
{
  MemoryUsage mem;
#if defined(RLOG_PLATFORM_LINUX)
  // statm: size resident shared text lib data dt (pages)
  if (FILE* f = std::fopen("/proc/self/statm", "r"))
  {
    unsigned long size = 0;
    unsigned long resident = 0;
    if (std::fscanf(f, "%lu %lu", &size, &resident) == 2)
    {
      long page = ::sysconf(_SC_PAGESIZE);
      mem.total = ToMiB(static_cast<uint64_t>(resident) *
                        static_cast<uint64_t>(page > 0 ? page : 4096));
    }
    std::fclose(f);
  }

#if defined(__GLIBC__) && (__GLIBC__ > 2 || (__GLIBC__ == 2 && __GLIBC_MINOR__ >= 33))
  struct mallinfo2 mi = ::mallinfo2();
  mem.heap = ToMiB(mi.uordblks);
  mem.heap_total = ToMiB(mi.arena);
  mem.mapped = ToMiB(mi.hblkhd);
#endif
#endif
  return mem;
}

}  // namespace rlog
