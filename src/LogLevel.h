/**
 * @file LogLevel.h
 * @brief Centralized log level system for stationplay
 *
 * Provides 4 log levels (ERROR, WARN, INFO, DEBUG) with runtime filtering
 * via g_logLevel. Lines from different threads (command loop, loader,
 * prefetch workers, audio thread) are serialized by g_logMutex so they
 * never interleave mid-line.
 *
 * Usage:
 *   LOG_ERROR("something failed: " << reason);
 *   LOG_WARN("retrying in " << ms << "ms");
 *   LOG_INFO("Playback started");
 *   LOG_DEBUG("[Component] detailed message");
 */

#ifndef STATIONPLAY_LOGLEVEL_H
#define STATIONPLAY_LOGLEVEL_H

#include <iostream>
#include <mutex>

enum class LogLevel { ERROR = 0, WARN = 1, INFO = 2, DEBUG = 3 };

extern LogLevel g_logLevel;
extern std::mutex g_logMutex;

#define LOG_ERROR(x) do { \
    if (g_logLevel >= LogLevel::ERROR) { \
        std::lock_guard<std::mutex> logLock_(g_logMutex); \
        std::cerr << "[ERROR] " << x << std::endl; \
    } \
} while(0)
#define LOG_WARN(x) do { \
    if (g_logLevel >= LogLevel::WARN) { \
        std::lock_guard<std::mutex> logLock_(g_logMutex); \
        std::cerr << "[WARN] " << x << std::endl; \
    } \
} while(0)
#define LOG_INFO(x) do { \
    if (g_logLevel >= LogLevel::INFO) { \
        std::lock_guard<std::mutex> logLock_(g_logMutex); \
        std::cout << x << std::endl; \
    } \
} while(0)
#define LOG_DEBUG(x) do { \
    if (g_logLevel >= LogLevel::DEBUG) { \
        std::lock_guard<std::mutex> logLock_(g_logMutex); \
        std::cout << x << std::endl; \
    } \
} while(0)

#endif // STATIONPLAY_LOGLEVEL_H
