#pragma once
#include "config.h"

#ifdef ARDUINO
#include <Arduino.h>
#define LOG_PRINT(tag, fmt, ...) Serial.printf("[%lu] [" tag "] " fmt "\n", (unsigned long)millis(), ##__VA_ARGS__)
#else
#include <cstdio>
#include "platform/platform.h"
#define LOG_PRINT(tag, fmt, ...) fprintf(stderr, "[%lu] [" tag "] " fmt "\n", tvscout::monotonicMs(), ##__VA_ARGS__)
#endif

#if DEBUG_LEVEL >= DEBUG_LEVEL_ERROR
#define LOG_ERROR(tag, fmt, ...) LOG_PRINT(tag, fmt, ##__VA_ARGS__)
#else
#define LOG_ERROR(tag, fmt, ...)
#endif

#if DEBUG_LEVEL >= DEBUG_LEVEL_INFO
#define LOG_INFO(tag, fmt, ...) LOG_PRINT(tag, fmt, ##__VA_ARGS__)
#else
#define LOG_INFO(tag, fmt, ...)
#endif

#if DEBUG_LEVEL >= DEBUG_LEVEL_DEBUG
#define LOG_DEBUG(tag, fmt, ...) LOG_PRINT(tag, fmt, ##__VA_ARGS__)
#else
#define LOG_DEBUG(tag, fmt, ...)
#endif

#if DEBUG_LEVEL >= DEBUG_LEVEL_TRACE
#define LOG_TRACE(tag, fmt, ...) LOG_PRINT(tag, fmt, ##__VA_ARGS__)
#else
#define LOG_TRACE(tag, fmt, ...)
#endif
