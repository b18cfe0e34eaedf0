/**
 * @file EventBus.cpp
 * @brief Multi-producer, multi-consumer typed event channel
 */

#include "transease/EventBus.h"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <vector>

namespace TransEase {

const char* eventTypeToString(EventType type) {
    switch (type) {
        case EventType::LogLine:         return "LogLine";
        case EventType::Status:          return "Status";
        case EventType::ConnectionCount: return "ConnectionCount";
        case EventType::Started:         return "Started";
        case EventType::Stopped:         return "Stopped";
        case EventType::Error:           return "Error";
        default:                         return "Unknown";
    }
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

EventBus::EventBus(size_t queueCapacity)
    : m_queueCapacity(queueCapacity == 0 ? 1 : queueCapacity)
    , m_nextId(1)
    , m_nextSequence(1)
    , m_dropped(0)
{
}

EventBus::~EventBus() {
    std::unordered_map<SubscriptionId, std::unique_ptr<Subscription>> subscribers;
    {
        std::lock_guard<std::mutex> lock(m_subscribersMutex);
        subscribers.swap(m_subscribers);
    }

    for (auto& pair : subscribers) {
        shutdownSubscription(*pair.second);
    }
}

//=============================================================================
// Subscription Management
//=============================================================================

SubscriptionId EventBus::subscribe(EventCallback callback) {
    auto sub = std::make_unique<Subscription>();
    sub->callback = std::move(callback);
    Subscription* raw = sub.get();

    std::lock_guard<std::mutex> lock(m_subscribersMutex);
    const SubscriptionId id = m_nextId++;
    raw->thread = std::thread(&EventBus::dispatchLoop, this, raw);
    m_subscribers.emplace(id, std::move(sub));
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::unique_ptr<Subscription> sub;
    {
        std::lock_guard<std::mutex> lock(m_subscribersMutex);
        auto it = m_subscribers.find(id);
        if (it == m_subscribers.end()) {
            return false;
        }
        sub = std::move(it->second);
        m_subscribers.erase(it);
    }

    // Joined outside m_subscribersMutex so a callback that emits cannot deadlock us.
    shutdownSubscription(*sub);
    return true;
}

size_t EventBus::subscriberCount() const {
    std::lock_guard<std::mutex> lock(m_subscribersMutex);
    return m_subscribers.size();
}

void EventBus::shutdownSubscription(Subscription& sub) {
    {
        std::lock_guard<std::mutex> lock(sub.mutex);
        sub.stopping = true;
    }
    sub.cv.notify_all();

    if (sub.thread.joinable()) {
        sub.thread.join();
    }
}

//=============================================================================
// Emission
//=============================================================================

void EventBus::publish(Event event) {
    std::lock_guard<std::mutex> lock(m_subscribersMutex);

    // Numbered under the lock so every queue sees sequence order.
    event.m_sequence = m_nextSequence.fetch_add(1);
    for (auto& pair : m_subscribers) {
        push(*pair.second, event);
    }
}

void EventBus::push(Subscription& sub, const Event& event) {
    {
        std::lock_guard<std::mutex> lock(sub.mutex);
        if (sub.stopping) {
            return;
        }

        if (sub.queue.size() >= m_queueCapacity) {
            // Make room by discarding log output, never state changes.
            auto oldestLog = std::find_if(sub.queue.begin(), sub.queue.end(),
                [](const Event& e) { return e.type() == EventType::LogLine; });
            if (oldestLog != sub.queue.end()) {
                sub.queue.erase(oldestLog);
                m_dropped.fetch_add(1);
            } else if (event.type() == EventType::LogLine) {
                m_dropped.fetch_add(1);
                return;
            }
        }

        sub.queue.push_back(event);
    }
    sub.cv.notify_one();
}

//=============================================================================
// Dispatch
//=============================================================================

void EventBus::dispatchLoop(Subscription* sub) {
    std::vector<Event> batch;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(sub->mutex);
            sub->cv.wait(lock, [sub]() { return sub->stopping || !sub->queue.empty(); });

            if (sub->queue.empty() && sub->stopping) {
                return;
            }

            batch.assign(std::make_move_iterator(sub->queue.begin()),
                         std::make_move_iterator(sub->queue.end()));
            sub->queue.clear();
        }

        for (const Event& event : batch) {
            try {
                sub->callback(event);
            } catch (const std::exception& e) {
                // A failing observer must not take the dispatcher down with it.
                std::cerr << "[EventBus] Observer threw on "
                          << eventTypeToString(event.type()) << ": " << e.what() << "\n";
            } catch (...) {
                std::cerr << "[EventBus] Observer threw a non-standard exception on "
                          << eventTypeToString(event.type()) << "\n";
            }
        }
        batch.clear();
    }
}

}  // namespace TransEase
