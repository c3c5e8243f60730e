#pragma once
#include <cstdio>
#include "config.h"
#include "clock.h"

#if DEBUG_LEVEL >= DEBUG_LEVEL_ERROR
#define LOG_ERROR(tag, fmt, ...) fprintf(stderr, "[%lu] [" tag "] " fmt "\n", cozyhub::millis(), ##__VA_ARGS__)
#else
#define LOG_ERROR(tag, fmt, ...)
#endif

#if DEBUG_LEVEL >= DEBUG_LEVEL_INFO
#define LOG_INFO(tag, fmt, ...) fprintf(stderr, "[%lu] [" tag "] " fmt "\n", cozyhub::millis(), ##__VA_ARGS__)
#else
#define LOG_INFO(tag, fmt, ...)
#endif

#if DEBUG_LEVEL >= DEBUG_LEVEL_DEBUG
#define LOG_DEBUG(tag, fmt, ...) fprintf(stderr, "[%lu] [" tag "] " fmt "\n", cozyhub::millis(), ##__VA_ARGS__)
#else
#define LOG_DEBUG(tag, fmt, ...)
#endif

#if DEBUG_LEVEL >= DEBUG_LEVEL_TRACE
#define LOG_TRACE(tag, fmt, ...) fprintf(stderr, "[%lu] [" tag "] " fmt "\n", cozyhub::millis(), ##__VA_ARGS__)
#else
#define LOG_TRACE(tag, fmt, ...)
#endif
