/**
 * @file FileLogSink.h
 * @brief Append-only log file written from a background thread
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"
#include "LogBridge.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>

namespace TransEase {

/**
 * @brief Durable log destination for LogBridge
 *
 * write() only queues the line; a dedicated writer thread appends queued
 * lines to the file, so logging threads never wait on disk I/O.
 *
 * When the file grows past the rotation size it is renamed to
 * "<name>.1" (replacing any previous backup) and a new file is started.
 *
 * Write failures never propagate: they are counted, and the first one is
 * reported on std::cerr.
 */
class FileLogSink : public LogSink {
public:
    explicit FileLogSink(const std::filesystem::path& path,
                         uint64_t rotateBytes = LOG_ROTATE_BYTES);

    /**
     * @brief Writes the remaining queued lines, then stops the writer thread
     */
    ~FileLogSink() override;

    FileLogSink(const FileLogSink&) = delete;
    FileLogSink& operator=(const FileLogSink&) = delete;

    void write(const LogRecord& record, const std::string& formatted) override;

    /**
     * @brief Block until every line queued so far has been written
     */
    void flush();

    const std::filesystem::path& path() const { return m_path; }

    uint64_t failureCount() const { return m_failures.load(); }

private:
    void writerThreadFunc();
    void appendLines(const std::deque<std::string>& lines);
    void rotateIfNeeded();

    const std::filesystem::path m_path;
    const uint64_t m_rotateBytes;

    std::mutex m_mutex;               ///< Protects the queue and flags below
    std::condition_variable m_cv;     ///< Wakes the writer
    std::condition_variable m_idleCv; ///< Signals flush() waiters
    std::deque<std::string> m_pending;
    bool m_stopRequested;
    bool m_writing;

    std::atomic<uint64_t> m_failures;
    std::thread m_writerThread;
};

}  // namespace TransEase
