#pragma once

#include <cstdio>

#ifndef INKPAD_ENABLE_LOGGING
#define INKPAD_ENABLE_LOGGING 0
#endif

#if INKPAD_ENABLE_LOGGING
#define INKPAD_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[inkpad] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define INKPAD_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[inkpad] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define INKPAD_LOG_ERROR(...) \
    do { \
        std::fprintf(stderr, "[inkpad] error: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define INKPAD_LOG_DEBUG(...) do { } while (0)
#define INKPAD_LOG_WARN(...) do { } while (0)
#define INKPAD_LOG_ERROR(...) do { } while (0)
#endif
