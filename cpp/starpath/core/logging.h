#pragma once

#include <cstdio>

#ifndef STARPATH_ENABLE_LOGGING
#define STARPATH_ENABLE_LOGGING 0
#endif

#if STARPATH_ENABLE_LOGGING
#define STARPATH_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[starpath] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define STARPATH_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[starpath][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define STARPATH_LOG_DEBUG(...) do { } while (0)
#define STARPATH_LOG_WARN(...) do { } while (0)
#endif
