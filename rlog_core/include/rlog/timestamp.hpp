#pragma once
#include <cstddef>
#include <cstdint>

namespace rlog
{

uint64_t wall_clock_now_ns();

// 2019-10-28T19:02:45.122Z (UTC)
size_t format_iso8601_ms(uint64_t wall_ns, char* buf, size_t buf_size);
// 2019-10-28T19:02:45Z (UTC)
size_t format_iso8601(uint64_t wall_ns, char* buf, size_t buf_size);
// 2019-10-28_19-02-45-122 (UTC), safe inside a file name
size_t format_archive_stamp(uint64_t wall_ns, char* buf, size_t buf_size);

}  // namespace rlog
