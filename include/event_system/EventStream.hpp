/*
 * Copyright (c) 2025-present
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * The NDTwin Authors and Contributors:
 *     Prof. Shie-Yuan Wang <National Yang Ming Chiao Tung University; CITI, Academia Sinica>
 *     Ms. Xiang-Ling Lin <CITI, Academia Sinica>
 *     Mr. Po-Yu Juan <CITI, Academia Sinica>
 */

#pragma once

#include "event_system/EventTypes.hpp" // for Event, EventFilter, EventPtr
#include <atomic>                      // for atomic
#include <chrono>                      // for milliseconds, seconds
#include <condition_variable>          // for condition_variable
#include <cstddef>                     // for size_t
#include <deque>                       // for deque
#include <functional>                  // for function
#include <memory>                      // for shared_ptr
#include <mutex>                       // for mutex
#include <nlohmann/json.hpp>           // for json
#include <optional>                    // for optional
#include <string>                      // for string
#include <thread>                      // for thread
#include <unordered_map>               // for unordered_map
#include <vector>                      // for vector

struct EventStreamConfig
{
    size_t maxQueueSize = 10000;
    size_t maxHistorySize = 1000;
    std::chrono::milliseconds dequeueTimeout{1000};
    std::chrono::seconds cleanupInterval{300};
    bool autoDeactivateFailedSubscribers = true;
};

// Read-only view of one subscriber's bookkeeping
struct SubscriberSnapshot
{
    std::string subscriberId;
    std::chrono::system_clock::time_point createdAt;
    uint64_t eventCount = 0;
    std::optional<uint64_t> lastSequenceNumber;
    bool active = true;
};

/**
 * @brief Centralized event stream: bounded queue, history ring and filtered fan-out.
 *
 * Producers call publish() from any thread. A single consumer thread dequeues events in
 * sequence order, updates the aggregate counters, appends them to the history ring and
 * hands them synchronously to every active subscriber whose filter matches.
 *
 * Backpressure:
 *  - When the queue holds maxQueueSize events, publish() drops the oldest queued event and
 *    counts it in dropped_events. The newest event is always kept.
 *
 * Failure isolation:
 *  - A callback that throws is logged and, with autoDeactivateFailedSubscribers, flipped
 *    inactive. The cleanup thread removes inactive subscribers every cleanupInterval.
 *
 * Lifetime:
 *  - stop() (also called by the destructor) joins both threads. Events still queued at
 *    that point stay queued and are delivered after a later start().
 */
class EventStream
{
  public:
    using Callback = std::function<void(const Event&)>;

    explicit EventStream(EventStreamConfig config = EventStreamConfig{});
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /// Start the consumer and cleanup threads.
    void start();

    /// Request shutdown and join both threads.
    void stop();

    bool isRunning() const
    {
        return m_running.load();
    }

    /**
     * @brief Enqueue a new event.
     *
     * @return The sequence number assigned to the event.
     */
    uint64_t publish(const std::string& eventType,
                     const std::string& sourceController,
                     const std::string& sourceType,
                     nlohmann::json data,
                     EventPriority priority = EventPriority::Low,
                     nlohmann::json metadata = nlohmann::json::object());

    /**
     * @brief Register a subscriber.
     *
     * @return false (and a warning) if subscriberId is already registered.
     */
    bool subscribe(const std::string& subscriberId,
                   Callback callback,
                   EventFilter filter = EventFilter{});

    /// Remove a subscriber. Returns false if it was not registered.
    bool unsubscribe(const std::string& subscriberId);

    /**
     * @brief Up to count most recent processed events, oldest first.
     *
     * Reads the history ring only; the queue is not consumed. count == 0 returns the
     * whole (filtered) history.
     */
    std::vector<EventPtr> recent(size_t count,
                                 const std::optional<EventFilter>& filter = std::nullopt) const;

    nlohmann::json stats() const;

    std::optional<SubscriberSnapshot> subscriber(const std::string& subscriberId) const;

    /// Drop every inactive subscriber from the registry. Returns how many were removed.
    size_t removeInactiveSubscribers();

    /**
     * @brief Block until the queue is empty and no event is being delivered.
     *
     * @return false if the timeout expired first.
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

  private:
    struct Subscriber
    {
        std::string subscriberId;
        Callback callback;
        EventFilter filter;
        std::chrono::system_clock::time_point createdAt;
        std::atomic<uint64_t> eventCount{0};
        std::atomic<uint64_t> lastSequenceNumber{0};
        std::atomic<bool> active{true};
    };

    void processLoop();
    void cleanupLoop();
    void dispatch(const EventPtr& event);
    void updateStats(const Event& event);

    EventStreamConfig m_config;

    std::atomic<bool> m_running{false};
    std::thread m_processorThread;
    std::thread m_cleanupThread;
    std::chrono::steady_clock::time_point m_startTime; // stats baseline, set at construction

    // Bounded queue
    mutable std::mutex m_queueMutex;
    std::condition_variable m_queueCv;
    std::condition_variable m_idleCv;
    std::deque<EventPtr> m_queue;
    bool m_inFlight = false;
    std::atomic<uint64_t> m_droppedEvents{0};

    // History ring
    mutable std::mutex m_historyMutex;
    std::deque<EventPtr> m_history;

    // Aggregate counters
    mutable std::mutex m_statsMutex;
    uint64_t m_totalEvents = 0;
    std::unordered_map<std::string, uint64_t> m_eventsByType;
    std::unordered_map<std::string, uint64_t> m_eventsByController;
    std::unordered_map<std::string, uint64_t> m_eventsBySourceType;

    // Subscriber registry
    mutable std::mutex m_subscribersMutex;
    std::unordered_map<std::string, std::shared_ptr<Subscriber>> m_subscribers;

    // Wakes the cleanup thread on stop()
    std::mutex m_cleanupMutex;
    std::condition_variable m_cleanupCv;
};
