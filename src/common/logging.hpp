#pragma once
#include <cstdio>

/**
 * Minimal printf-style logging used across the project. Each translation unit
 * defines its own `TAG` (e.g. `#define TAG "session"`) and passes it as the
 * first argument of the macros below. Messages are written to stderr in the
 * form `[LEVEL] tag: message`.
 *
 * The minimum level is picked at compile time using `LOG_LEVEL`. Macros for
 * levels below the threshold expand to nothing.
 */
#define LOG_LEVEL_TRACE 0
#define LOG_LEVEL_DEBUG 1
#define LOG_LEVEL_INFO 2
#define LOG_LEVEL_WARN 3
#define LOG_LEVEL_ERROR 4

#ifndef LOG_LEVEL
#define LOG_LEVEL LOG_LEVEL_INFO
#endif

#define LOG_WITH_LEVEL(level_name, tag, format, ...)                           \
        fprintf(stderr, "[" level_name "] %s: " format "\n", tag,              \
                ##__VA_ARGS__)

#if LOG_LEVEL <= LOG_LEVEL_TRACE
#define LOG_TRACE(tag, format, ...)                                            \
        LOG_WITH_LEVEL("TRACE", tag, format, ##__VA_ARGS__)
#else
#define LOG_TRACE(tag, format, ...)
#endif

#if LOG_LEVEL <= LOG_LEVEL_DEBUG
#define LOG_DEBUG(tag, format, ...)                                            \
        LOG_WITH_LEVEL("DEBUG", tag, format, ##__VA_ARGS__)
#else
#define LOG_DEBUG(tag, format, ...)
#endif

#if LOG_LEVEL <= LOG_LEVEL_INFO
#define LOG_INFO(tag, format, ...)                                             \
        LOG_WITH_LEVEL("INFO", tag, format, ##__VA_ARGS__)
#else
#define LOG_INFO(tag, format, ...)
#endif

#if LOG_LEVEL <= LOG_LEVEL_WARN
#define LOG_WARN(tag, format, ...)                                             \
        LOG_WITH_LEVEL("WARN", tag, format, ##__VA_ARGS__)
#else
#define LOG_WARN(tag, format, ...)
#endif

#define LOG_ERROR(tag, format, ...)                                            \
        LOG_WITH_LEVEL("ERROR", tag, format, ##__VA_ARGS__)
