#pragma once

// ===== 平台检测 =====
#if defined(__linux__)
    #define SEGLOG_PLATFORM_LINUX 1
#elif defined(__APPLE__)
    #define SEGLOG_PLATFORM_MACOS 1
#else
    #error "seglog requires a POSIX platform (Linux or macOS)"
#endif

// ===== 日志消息最大长度 =====
#ifndef SEGLOG_MAX_MSG_LEN
    #define SEGLOG_MAX_MSG_LEN 384
#endif

#ifndef SEGLOG_MAX_THREAD_NAME_LEN
    #define SEGLOG_MAX_THREAD_NAME_LEN 32
#endif

// ===== Segment 文件 =====
// Size at which a segment is rotated.
#ifndef SEGLOG_MAX_FILE_SIZE
    #define SEGLOG_MAX_FILE_SIZE (1024ULL * 1024ULL * 1800ULL)
#endif

// Upper bound on the body of one stored record.
#ifndef SEGLOG_MAX_RECORD_LEN
    #define SEGLOG_MAX_RECORD_LEN (1u << 20)
#endif

#ifndef SEGLOG_FILE_MODE
    #define SEGLOG_FILE_MODE 0664
#endif

// ===== Fetch =====
// Number of entries after which a fetch stops opening older segments.
#ifndef SEGLOG_ENTRIES_CUTOFF
    #define SEGLOG_ENTRIES_CUTOFF 100000
#endif

// ===== 配置 =====
#ifndef SEGLOG_LOG_DIR_ENV
    #define SEGLOG_LOG_DIR_ENV "SEGLOG_LOG_DIR"
#endif
