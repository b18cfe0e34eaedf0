/**
 * @file Event.h
 * @brief Immutable notifications emitted by the control plane
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace TransEase {

/**
 * @brief Kind of notification carried by an Event
 */
enum class EventType : uint8_t {
    LogLine = 0,          ///< Formatted log record
    Status = 1,           ///< Human-readable status message
    ConnectionCount = 2,  ///< Number of active client connections changed
    Started = 3,          ///< Server is listening
    Stopped = 4,          ///< Server has terminated
    Error = 5             ///< Failure description (always human-readable)
};

/**
 * @brief Convert event type to display string
 */
const char* eventTypeToString(EventType type);

/**
 * @class Event
 * @brief Tagged notification {LogLine, Status, ConnectionCount, Started, Stopped, Error}
 *
 * Events are values: they are created through the factory functions,
 * copied into every subscriber queue and never modified afterwards.
 * The sequence number is assigned by the EventBus at emission.
 */
class Event {
public:
    static Event logLine(std::string text) { return Event(EventType::LogLine, std::move(text), 0); }
    static Event status(std::string text) { return Event(EventType::Status, std::move(text), 0); }
    static Event connectionCount(size_t count) { return Event(EventType::ConnectionCount, {}, count); }
    static Event started() { return Event(EventType::Started, {}, 0); }
    static Event stopped() { return Event(EventType::Stopped, {}, 0); }
    static Event error(std::string text) { return Event(EventType::Error, std::move(text), 0); }

    EventType type() const { return m_type; }

    /// Payload of LogLine, Status and Error; empty otherwise.
    const std::string& text() const { return m_text; }

    /// Payload of ConnectionCount; 0 otherwise.
    size_t count() const { return m_count; }

    uint64_t sequence() const { return m_sequence; }

    /// True for events that describe server state rather than log output.
    bool isStateEvent() const { return m_type != EventType::LogLine; }

private:
    friend class EventBus;

    Event(EventType type, std::string text, size_t count)
        : m_type(type), m_text(std::move(text)), m_count(count), m_sequence(0) {}

    EventType m_type;
    std::string m_text;
    size_t m_count;
    uint64_t m_sequence;
};

}  // namespace TransEase
