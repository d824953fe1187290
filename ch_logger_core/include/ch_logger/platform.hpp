#pragma once

// ===== 平台检测 =====
#if defined(__linux__)
    #define CH_LOG_PLATFORM_LINUX 1
#elif defined(__APPLE__)
    #define CH_LOG_PLATFORM_MACOS 1
#endif

// ===== 写线程队列大小（必须是 2 的幂） =====
#ifndef CH_LOG_RING_SIZE
    #define CH_LOG_RING_SIZE 8192
#endif

// ===== 刷盘策略 =====
#ifndef CH_LOG_BUFFER_THRESHOLD
    #define CH_LOG_BUFFER_THRESHOLD 25
#endif
#ifndef CH_LOG_FLUSH_INTERVAL_MS
    #define CH_LOG_FLUSH_INTERVAL_MS 5000
#endif

// ===== 文件轮转 =====
#ifndef CH_LOG_MAX_FILE_SIZE
    #define CH_LOG_MAX_FILE_SIZE (5u * 1024u * 1024u)
#endif
#ifndef CH_LOG_MAX_FILES
    #define CH_LOG_MAX_FILES 3
#endif

// ===== 调用栈 =====
#ifndef CH_LOG_STACK_MAX_FRAMES
    #define CH_LOG_STACK_MAX_FRAMES 10
#endif
#ifndef CH_LOG_STACK_SKIP_FRAMES
    #define CH_LOG_STACK_SKIP_FRAMES 3
#endif

// ===== 默认最低级别（0 = Debug, 1 = Info） =====
#ifndef CH_LOG_DEFAULT_LEVEL
    #ifdef NDEBUG
        #define CH_LOG_DEFAULT_LEVEL 1
    #else
        #define CH_LOG_DEFAULT_LEVEL 0
    #endif
#endif

// ===== cacheline 大小 =====
#ifndef CH_LOG_CACHELINE_SIZE
    #define CH_LOG_CACHELINE_SIZE 64
#endif
