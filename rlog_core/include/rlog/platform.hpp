#pragma once

// ===== 平台检测 =====
#if defined(__linux__)
    #define RLOG_PLATFORM_LINUX 1
#elif defined(_WIN32)
    #define RLOG_PLATFORM_WINDOWS 1
#elif defined(__APPLE__)
    #define RLOG_PLATFORM_MACOS 1
#endif

// ===== 编译模式 =====
#ifndef RLOG_EMBEDDED
    #define RLOG_EMBEDDED 0
#endif

#ifndef RLOG_HAS_THREAD
    #if RLOG_EMBEDDED
        #define RLOG_HAS_THREAD 0
    #else
        #define RLOG_HAS_THREAD 1
    #endif
#endif

// ===== 文件 I/O 支持（不支持时日志退化为仅控制台） =====
#ifndef RLOG_FILE_IO
    #if RLOG_EMBEDDED || !(defined(RLOG_PLATFORM_LINUX) || defined(RLOG_PLATFORM_MACOS))
        #define RLOG_FILE_IO 0
    #else
        #define RLOG_FILE_IO 1
    #endif
#endif

// ===== 滚动文件默认值 =====
#ifndef RLOG_DEFAULT_MAX_FILE_SIZE
    #define RLOG_DEFAULT_MAX_FILE_SIZE (20u << 20)
#endif
#ifndef RLOG_DEFAULT_MAX_FILES
    #define RLOG_DEFAULT_MAX_FILES 10
#endif

// ===== 写流出错后重新打开的间隔 =====
#ifndef RLOG_RETRY_DELAY_MS
    #define RLOG_RETRY_DELAY_MS 10000
#endif

// ===== 滚动期间缓存的最大行数 =====
#ifndef RLOG_MAX_PENDING_WRITES
    #if RLOG_EMBEDDED
        #define RLOG_MAX_PENDING_WRITES 256
    #else
        #define RLOG_MAX_PENDING_WRITES 8192
    #endif
#endif

// ===== 编译信息注入（CMake 设置） =====
#ifndef RLOG_GIT_HASH
    #define RLOG_GIT_HASH "unknown"
#endif
#ifndef RLOG_BUILD_TYPE
    #define RLOG_BUILD_TYPE "unknown"
#endif
