/**
 * @file LogBridge.cpp
 * @brief Process-wide log stream, LogBridge routing and record formatting
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#include "transease/LogBridge.h"
#include "transease/Debug.h"
#include "transease/EventBus.h"
#include "transease/FileLogSink.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <shared_mutex>

namespace TransEase {

//=============================================================================
// Process-wide stream
//=============================================================================

namespace {
    // Writers hold the shared lock while inside the bridge, so detach()
    // cannot return while a record is being published.
    std::shared_mutex g_streamMutex;
    LogBridge* g_bridge = nullptr;

    std::mutex g_stderrMutex;
} // anonymous namespace

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    const auto time_t = std::chrono::system_clock::to_time_t(time);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t);
#else
    localtime_r(&time_t, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << ',' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

namespace Log {

void attach(LogBridge* bridge) {
    std::unique_lock<std::shared_mutex> lock(g_streamMutex);
    g_bridge = bridge;
}

void detach(LogBridge* bridge) {
    std::unique_lock<std::shared_mutex> lock(g_streamMutex);
    if (g_bridge == bridge) {
        g_bridge = nullptr;
    }
}

bool enabled(LogLevel level) {
    std::shared_lock<std::shared_mutex> lock(g_streamMutex);
    return g_bridge == nullptr || g_bridge->accepts(level);
}

void write(LogLevel level, const std::string& message) {
    LogRecord record;
    record.level = level;
    record.time = std::chrono::system_clock::now();
    record.message = message;

    {
        std::shared_lock<std::shared_mutex> lock(g_streamMutex);
        if (g_bridge) {
            g_bridge->publish(record);
            return;
        }
    }

    std::lock_guard<std::mutex> lock(g_stderrMutex);
    std::cerr << LogBridge::format(record) << std::endl;
}

}  // namespace Log

//=============================================================================
// Level names
//=============================================================================

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "INFO";
    }
}

bool parseLogLevel(const std::string& name, LogLevel& outLevel) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    static const LogLevel kLevels[] = {
        LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error, LogLevel::Critical
    };
    for (LogLevel level : kLevels) {
        if (upper == logLevelToString(level)) {
            outLevel = level;
            return true;
        }
    }
    return false;
}

//=============================================================================
// LogBridge
//=============================================================================

LogBridge::LogBridge(EventBus& bus, LogLevel level)
    : m_bus(bus)
    , m_level(static_cast<int>(level))
{
    Log::attach(this);
}

LogBridge::~LogBridge() {
    Log::detach(this);

    std::shared_ptr<FileLogSink> fileSink;
    {
        std::lock_guard<std::mutex> lock(m_sinksMutex);
        fileSink.swap(m_fileSink);
        m_sinks.clear();
    }
    // Dropping the last reference drains and closes the file.
}

void LogBridge::reconfigure(LogLevel level, bool saveLog, const std::filesystem::path& logFile) {
    m_level.store(static_cast<int>(level));

    std::shared_ptr<FileLogSink> retired;
    {
        std::lock_guard<std::mutex> lock(m_sinksMutex);
        if (!saveLog) {
            retired.swap(m_fileSink);
        } else if (!m_fileSink || m_fileSink->path() != logFile) {
            retired.swap(m_fileSink);
            m_fileSink = std::make_shared<FileLogSink>(logFile);
        }
    }
    // retired is closed here, outside the lock.
}

void LogBridge::addSink(std::shared_ptr<LogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_sinksMutex);
    m_sinks.push_back(std::move(sink));
}

bool LogBridge::isFileLoggingEnabled() const {
    std::lock_guard<std::mutex> lock(m_sinksMutex);
    return m_fileSink != nullptr;
}

std::filesystem::path LogBridge::logFilePath() const {
    std::lock_guard<std::mutex> lock(m_sinksMutex);
    return m_fileSink ? m_fileSink->path() : std::filesystem::path();
}

void LogBridge::publish(const LogRecord& record) {
    if (!accepts(record.level)) {
        return;
    }

    const std::string formatted = format(record);

    // The event goes out first; nothing a sink does can hold it back.
    m_bus.publish(Event::logLine(formatted));

    std::vector<std::shared_ptr<LogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(m_sinksMutex);
        sinks = m_sinks;
        if (m_fileSink) {
            sinks.push_back(m_fileSink);
        }
    }

    for (const auto& sink : sinks) {
        try {
            sink->write(record, formatted);
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(g_stderrMutex);
            std::cerr << "[LogBridge] Sink failed: " << e.what() << std::endl;
        }
    }
}

std::string LogBridge::format(const LogRecord& record) {
    std::string out = formatTimestamp(record.time);
    out += " - ";
    out += logLevelToString(record.level);
    out += " - ";
    out += record.message;
    return out;
}

}  // namespace TransEase
