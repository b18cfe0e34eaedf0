/**
 * @file EventBus.h
 * @brief Multi-producer, multi-consumer typed event channel
 */

#pragma once

#include "config.h"
#include "Event.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace TransEase {

//=============================================================================
// Callback Types
//=============================================================================

/**
 * @brief Observer callback
 *
 * Invoked on the subscription's dispatcher thread, never on the producer's.
 */
using EventCallback = std::function<void(const Event& event)>;

using SubscriptionId = uint64_t;

//=============================================================================
// EventBus Class
//=============================================================================

/**
 * @class EventBus
 * @brief Delivers Events from producers to observers asynchronously
 *
 * Architecture:
 * - One FIFO queue and one dispatcher thread per subscription
 * - publish() copies the event into every queue and returns immediately
 * - A slow observer only delays its own queue
 *
 * Guarantees:
 * - Events emitted by one thread reach each observer in emission order
 * - No ordering guarantee between different producers
 * - At-most-once delivery per observer; when a queue holds
 *   EVENT_QUEUE_CAPACITY events the oldest pending LogLine is dropped
 *   (state events are never dropped)
 *
 * Thread Safety:
 * - publish(), subscribe() and unsubscribe() may be called from any thread
 * - unsubscribe() must not be called from inside that subscription's callback
 *
 * Usage:
 * @code
 * EventBus bus;
 * SubscriptionId id = bus.subscribe([](const Event& e) {
 *     std::cout << eventTypeToString(e.type()) << " " << e.text() << "\n";
 * });
 * bus.publish(Event::status("ready"));
 * bus.unsubscribe(id);
 * @endcode
 */
class EventBus {
public:
    explicit EventBus(size_t queueCapacity = EVENT_QUEUE_CAPACITY);

    /**
     * @brief Destructor
     *
     * Stops all dispatcher threads. Pending events are delivered first.
     */
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    /**
     * @brief Register an observer
     * @param callback Function invoked for every event emitted after this call
     * @return Handle for unsubscribe()
     */
    SubscriptionId subscribe(EventCallback callback);

    /**
     * @brief Remove an observer
     * @return true if the subscription existed
     *
     * Delivers the events already queued for this observer, then joins
     * its dispatcher thread.
     */
    bool unsubscribe(SubscriptionId id);

    /**
     * @brief Publish an event to every current observer
     *
     * Never blocks on observers. Safe to call from any thread.
     */
    void publish(Event event);

    /**
     * @brief Number of LogLine events dropped because a queue was full
     */
    uint64_t droppedCount() const { return m_dropped.load(); }

    size_t subscriberCount() const;

private:
    struct Subscription {
        EventCallback callback;
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<Event> queue;
        bool stopping = false;
        std::thread thread;
    };

    void dispatchLoop(Subscription* sub);
    void push(Subscription& sub, const Event& event);
    static void shutdownSubscription(Subscription& sub);

    const size_t m_queueCapacity;

    mutable std::mutex m_subscribersMutex;  ///< Protects m_subscribers
    std::unordered_map<SubscriptionId, std::unique_ptr<Subscription>> m_subscribers;
    SubscriptionId m_nextId;

    std::atomic<uint64_t> m_nextSequence;
    std::atomic<uint64_t> m_dropped;
};

}  // namespace TransEase
