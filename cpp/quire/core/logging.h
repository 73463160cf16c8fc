#pragma once

#include <cstdio>

#ifndef QUIRE_ENABLE_LOGGING
#define QUIRE_ENABLE_LOGGING 0
#endif

#if QUIRE_ENABLE_LOGGING
#define QUIRE_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[quire] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define QUIRE_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[quire][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define QUIRE_LOG_DEBUG(...) do { } while (0)
#define QUIRE_LOG_WARN(...) do { } while (0)
#endif
