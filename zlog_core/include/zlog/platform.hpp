#pragma once

// ===== 平台检测 =====
#if defined(__linux__)
    #define ZLOG_PLATFORM_LINUX 1
#elif defined(__APPLE__)
    #define ZLOG_PLATFORM_MACOS 1
#endif

#if !defined(ZLOG_PLATFORM_LINUX) && !defined(ZLOG_PLATFORM_MACOS)
    #error "zlog requires a POSIX platform (flock, O_APPEND)"
#endif

// ===== 时区偏移（默认 UTC+8） =====
#ifndef ZLOG_UTC_OFFSET_SECONDS
    #define ZLOG_UTC_OFFSET_SECONDS (8 * 3600)
#endif

// ===== 跨进程轮转锁 =====
#ifndef ZLOG_LOCK_TIMEOUT_MS
    #define ZLOG_LOCK_TIMEOUT_MS 5000
#endif
#ifndef ZLOG_LOCK_POLL_INTERVAL_MS
    #define ZLOG_LOCK_POLL_INTERVAL_MS 10
#endif

// ===== 日志消息最大长度（snprintf 回退路径） =====
#ifndef ZLOG_MAX_MSG_LEN
    #define ZLOG_MAX_MSG_LEN 4096
#endif

// ===== 新建日志文件权限 =====
#ifndef ZLOG_FILE_MODE
    #define ZLOG_FILE_MODE 0644
#endif
#ifndef ZLOG_DIR_MODE
    #define ZLOG_DIR_MODE 0755
#endif
