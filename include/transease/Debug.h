/**
 * @file Debug.h
 * @brief Process-wide log stream and logging macros
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#pragma once

#include "LogBridge.h"
#include <chrono>
#include <sstream>
#include <string>

namespace TransEase {

/**
 * @brief Format a point in time as "YYYY-MM-DD HH:MM:SS,mmm" (local time)
 */
std::string formatTimestamp(std::chrono::system_clock::time_point time);

namespace Log {

/**
 * @brief Route the process-wide stream into a bridge
 *
 * Called by the LogBridge constructor. A later attach replaces the
 * previous bridge.
 */
void attach(LogBridge* bridge);

/**
 * @brief Stop routing into a bridge (no-op if another bridge is attached)
 *
 * Waits for in-flight writes to the bridge to finish.
 */
void detach(LogBridge* bridge);

/**
 * @brief True if a record of this level would be published
 *
 * Without an attached bridge every level is enabled.
 */
bool enabled(LogLevel level);

/**
 * @brief Publish a record on the process-wide stream
 *
 * Goes to the attached bridge, or to std::cerr with a timestamp when no
 * bridge is attached. Safe to call from any thread.
 */
void write(LogLevel level, const std::string& message);

}  // namespace Log
}  // namespace TransEase

#define TE_LOG(level, msg) \
    do { \
        if (TransEase::Log::enabled(level)) { \
            std::ostringstream te_log_oss_; \
            te_log_oss_ << msg; \
            TransEase::Log::write(level, te_log_oss_.str()); \
        } \
    } while(0)

#define LOG_DEBUG(msg) TE_LOG(TransEase::LogLevel::Debug, msg)
#define LOG_INFO(msg) TE_LOG(TransEase::LogLevel::Info, msg)
#define LOG_WARNING(msg) TE_LOG(TransEase::LogLevel::Warning, msg)
#define LOG_ERROR(msg) TE_LOG(TransEase::LogLevel::Error, msg)
#define LOG_CRITICAL(msg) TE_LOG(TransEase::LogLevel::Critical, msg)
