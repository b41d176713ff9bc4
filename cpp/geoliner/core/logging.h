#pragma once

#include <cstdio>

#ifndef GEOLINER_ENABLE_LOGGING
#define GEOLINER_ENABLE_LOGGING 0
#endif

#if GEOLINER_ENABLE_LOGGING
#define GEOLINER_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[geoliner] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define GEOLINER_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[geoliner][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define GEOLINER_LOG_DEBUG(...) do { } while (0)
#define GEOLINER_LOG_WARN(...) do { } while (0)
#endif
