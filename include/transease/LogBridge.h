/**
 * @file LogBridge.h
 * @brief Routes process-wide log records into LogLine events and durable sinks
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace TransEase {

class EventBus;
class FileLogSink;

/**
 * @brief Severity of a log record, ordered from least to most severe
 */
enum class LogLevel : int {
    Debug = 10,
    Info = 20,
    Warning = 30,
    Error = 40,
    Critical = 50
};

/**
 * @brief Convert level to its configuration name (DEBUG, INFO, ...)
 */
const char* logLevelToString(LogLevel level);

/**
 * @brief Parse a configuration level name (case-insensitive)
 * @return false if the name is not one of DEBUG, INFO, WARNING, ERROR, CRITICAL
 */
bool parseLogLevel(const std::string& name, LogLevel& outLevel);

/**
 * @brief One record of the process-wide log stream
 */
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::chrono::system_clock::time_point time = std::chrono::system_clock::now();
    std::string message;
};

/**
 * @brief Destination for formatted log records
 *
 * write() is called on the thread that logged; implementations must not
 * block on slow I/O.
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record, const std::string& formatted) = 0;
};

/**
 * @class LogBridge
 * @brief Owned replacement for a global logger configuration
 *
 * One LogBridge is constructed per application. While it exists it is
 * attached to the process-wide stream used by the LOG_* macros
 * (Debug.h). Each record at or above the configured level is formatted
 * and:
 * 1. emitted on the EventBus as a LogLine event
 * 2. written to every injected sink
 * 3. appended to the durable log file when file logging is enabled
 *
 * Settings changes go through reconfigure(); the bridge itself is never
 * replaced.
 *
 * Thread Safety: all methods may be called from any thread.
 */
class LogBridge {
public:
    explicit LogBridge(EventBus& bus, LogLevel level = LogLevel::Info);

    /**
     * @brief Detaches from the process-wide stream and closes the log file
     */
    ~LogBridge();

    LogBridge(const LogBridge&) = delete;
    LogBridge& operator=(const LogBridge&) = delete;

    /**
     * @brief Apply new logging settings
     * @param level Minimum level that is published
     * @param saveLog Whether records are also appended to logFile
     * @param logFile Durable log file path (ignored when saveLog is false)
     *
     * Reopens the file sink only when the path changes.
     */
    void reconfigure(LogLevel level, bool saveLog, const std::filesystem::path& logFile);

    /**
     * @brief Add an extra destination for formatted records
     */
    void addSink(std::shared_ptr<LogSink> sink);

    /**
     * @brief Publish one record (called by the process-wide stream)
     */
    void publish(const LogRecord& record);

    bool accepts(LogLevel level) const { return static_cast<int>(level) >= m_level.load(); }

    LogLevel level() const { return static_cast<LogLevel>(m_level.load()); }

    bool isFileLoggingEnabled() const;

    std::filesystem::path logFilePath() const;

    /**
     * @brief Format a record as "YYYY-MM-DD HH:MM:SS,mmm - LEVEL - message"
     */
    static std::string format(const LogRecord& record);

private:
    EventBus& m_bus;
    std::atomic<int> m_level;

    mutable std::mutex m_sinksMutex;  ///< Protects m_sinks and m_fileSink
    std::vector<std::shared_ptr<LogSink>> m_sinks;
    std::shared_ptr<FileLogSink> m_fileSink;
};

}  // namespace TransEase
