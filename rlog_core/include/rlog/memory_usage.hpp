#pragma once
#include <cstdint>

namespace rlog
{

// Process memory snapshot, in MiB (rounded down). Zero where the platform
// offers no source.
struct MemoryUsage
{
  uint64_t total = 0;       // resident set size
  uint64_t heap = 0;        // allocated by malloc
  uint64_t heap_total = 0;  // reserved by malloc
  uint64_t mapped = 0;      // mmap-backed allocations
};

MemoryUsage SampleMemoryUsage();

}  // namespace rlog
