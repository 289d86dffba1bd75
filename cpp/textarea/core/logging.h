#pragma once

#include <cstdio>

#ifndef TEXTAREA_ENABLE_LOGGING
#define TEXTAREA_ENABLE_LOGGING 0
#endif

#if TEXTAREA_ENABLE_LOGGING
#define TEXTAREA_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[textarea] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define TEXTAREA_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[textarea] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define TEXTAREA_LOG_DEBUG(...) do { } while (0)
#define TEXTAREA_LOG_WARN(...) do { } while (0)
#endif
