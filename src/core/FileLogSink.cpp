/**
 * @file FileLogSink.cpp
 * @brief Append-only log file written from a background thread
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#include "transease/FileLogSink.h"
#include <fstream>
#include <iostream>
#include <system_error>

namespace TransEase {

FileLogSink::FileLogSink(const std::filesystem::path& path, uint64_t rotateBytes)
    : m_path(path)
    , m_rotateBytes(rotateBytes)
    , m_stopRequested(false)
    , m_writing(false)
    , m_failures(0)
{
    m_writerThread = std::thread(&FileLogSink::writerThreadFunc, this);
}

FileLogSink::~FileLogSink() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_cv.notify_all();

    if (m_writerThread.joinable()) {
        m_writerThread.join();
    }
}

void FileLogSink::write(const LogRecord& record, const std::string& formatted) {
    (void)record;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopRequested) {
            return;
        }
        m_pending.push_back(formatted);
    }
    m_cv.notify_one();
}

void FileLogSink::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this]() { return m_pending.empty() && !m_writing; });
}

//=============================================================================
// Writer thread
//=============================================================================

void FileLogSink::writerThreadFunc() {
    std::deque<std::string> batch;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_stopRequested || !m_pending.empty(); });

            if (m_pending.empty() && m_stopRequested) {
                break;
            }

            batch.swap(m_pending);
            m_writing = true;
        }

        appendLines(batch);
        batch.clear();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_writing = false;
        }
        m_idleCv.notify_all();
    }

    m_idleCv.notify_all();
}

void FileLogSink::appendLines(const std::deque<std::string>& lines) {
    rotateIfNeeded();

    // std::filesystem::path keeps non-ASCII directory names intact.
    std::ofstream file(m_path, std::ios::app | std::ios::binary);
    if (file.is_open()) {
        for (const std::string& line : lines) {
            file << line << "\n";
        }
        file.flush();
        if (file.good()) {
            return;
        }
    }

    if (m_failures.fetch_add(1) == 0) {
        std::cerr << "[FileLogSink] Cannot write log file: " << m_path.string() << "\n";
    }
}

void FileLogSink::rotateIfNeeded() {
    if (m_rotateBytes == 0) {
        return;
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(m_path, ec);
    if (ec || size < m_rotateBytes) {
        return;
    }

    std::filesystem::path backup = m_path;
    backup += ".1";
    std::filesystem::remove(backup, ec);
    std::filesystem::rename(m_path, backup, ec);
    if (ec && m_failures.fetch_add(1) == 0) {
        std::cerr << "[FileLogSink] Log rotation failed: " << ec.message() << "\n";
    }
}

}  // namespace TransEase
