#include "rlog/timestamp.hpp"
#include "rlog/platform.hpp"
#include <cstdio>
#include <ctime>

#if RLOG_EMBEDDED

extern "C" __attribute__((weak)) uint64_t rlog_wall_clock_ns() { return 0; }

namespace rlog {

uint64_t wall_clock_now_ns() { return rlog_wall_clock_ns(); }

} // namespace rlog

#elif defined(RLOG_PLATFORM_LINUX) || defined(RLOG_PLATFORM_MACOS)

#include <time.h>

namespace rlog {

uint64_t wall_clock_now_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL
         + static_cast<uint64_t>(ts.tv_nsec);
}

} // namespace rlog

#elif defined(RLOG_PLATFORM_WINDOWS)

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

namespace rlog {

uint64_t wall_clock_now_ns() {
    FILETIME ft;
    GetSystemTimePreciseAsFileTime(&ft);
    uint64_t ticks = (static_cast<uint64_t>(ft.dwHighDateTime) << 32)
                   | static_cast<uint64_t>(ft.dwLowDateTime);
    // FILETIME epoch: 1601-01-01, Unix epoch offset: 11644473600 seconds
    constexpr uint64_t epoch_offset = 11644473600ULL * 10'000'000ULL;
    return (ticks - epoch_offset) * 100ULL;
}

} // namespace rlog

#endif

namespace rlog {

static void decompose_wall_ns(uint64_t wall_ns, struct tm& tm_out, uint32_t& ms_out) {
    time_t sec = static_cast<time_t>(wall_ns / 1'000'000'000ULL);
    ms_out = static_cast<uint32_t>((wall_ns % 1'000'000'000ULL) / 1'000'000ULL);
#if defined(RLOG_PLATFORM_WINDOWS)
    gmtime_s(&tm_out, &sec);
#else
    gmtime_r(&sec, &tm_out);
#endif
}

static size_t clamp_written(int n, size_t buf_size) {
    return (n > 0 && static_cast<size_t>(n) < buf_size)
         ? static_cast<size_t>(n) : (buf_size - 1);
}

size_t format_iso8601_ms(uint64_t wall_ns, char* buf, size_t buf_size) {
    if (buf_size == 0) return 0;
    struct tm tm_val{};
    uint32_t ms;
    decompose_wall_ns(wall_ns, tm_val, ms);
    int n = snprintf(buf, buf_size, "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                     tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                     tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec, ms);
    return clamp_written(n, buf_size);
}

size_t format_iso8601(uint64_t wall_ns, char* buf, size_t buf_size) {
    if (buf_size == 0) return 0;
    struct tm tm_val{};
    uint32_t ms;
    decompose_wall_ns(wall_ns, tm_val, ms);
    int n = snprintf(buf, buf_size, "%04d-%02d-%02dT%02d:%02d:%02dZ",
                     tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                     tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec);
    return clamp_written(n, buf_size);
}

size_t format_archive_stamp(uint64_t wall_ns, char* buf, size_t buf_size) {
    if (buf_size == 0) return 0;
    struct tm tm_val{};
    uint32_t ms;
    decompose_wall_ns(wall_ns, tm_val, ms);
    int n = snprintf(buf, buf_size, "%04d-%02d-%02d_%02d-%02d-%02d-%03u",
                     tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                     tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec, ms);
    return clamp_written(n, buf_size);
}

} // namespace rlog
