/**
 * @file LogLevel.cpp
 * @brief Global log level and output lock
 */

#include "LogLevel.h"

LogLevel g_logLevel = LogLevel::INFO;
std::mutex g_logMutex;
