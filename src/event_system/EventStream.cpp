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
#include "event_system/EventStream.hpp"
#include "spdlog/spdlog.h"  // for SPDLOG_LOGGER_*
#include "utils/Logger.hpp" // for Logger
#include <algorithm>        // for max
#include <exception>        // for exception
#include <utility>          // for move

// Process-wide sequence counter; only advanced while holding a queue lock so that queue
// order always equals sequence order.
static std::atomic<uint64_t> gSequenceCounter{0};

EventStream::EventStream(EventStreamConfig config)
    : m_config(std::move(config)),
      m_startTime(std::chrono::steady_clock::now())
{
    m_config.maxQueueSize = std::max<size_t>(m_config.maxQueueSize, 1);
}

EventStream::~EventStream()
{
    stop();
}

void
EventStream::start()
{
    if (m_running.exchange(true))
    {
        SPDLOG_LOGGER_WARN(Logger::instance(), "Event stream already running");
        return;
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "Starting event stream processor");
    m_processorThread = std::thread(&EventStream::processLoop, this);
    m_cleanupThread = std::thread(&EventStream::cleanupLoop, this);
}

void
EventStream::stop()
{
    if (m_running.exchange(false))
    {
        SPDLOG_LOGGER_INFO(Logger::instance(), "Stopping event stream processor");
    }

    // Take each lock once so a waiter cannot miss the flag change
    {
        std::lock_guard<std::mutex> lk(m_queueMutex);
    }
    m_queueCv.notify_all();
    m_idleCv.notify_all();
    {
        std::lock_guard<std::mutex> lk(m_cleanupMutex);
    }
    m_cleanupCv.notify_all();

    if (m_processorThread.joinable())
    {
        m_processorThread.join();
    }
    if (m_cleanupThread.joinable())
    {
        m_cleanupThread.join();
        SPDLOG_LOGGER_INFO(Logger::instance(), "Event stream stopped");
    }
}

uint64_t
EventStream::publish(const std::string& eventType,
                     const std::string& sourceController,
                     const std::string& sourceType,
                     nlohmann::json data,
                     EventPriority priority,
                     nlohmann::json metadata)
{
    auto event = std::make_shared<Event>();
    event->eventType = eventType;
    event->sourceController = sourceController;
    event->sourceType = sourceType;
    event->data = std::move(data);
    event->timestamp = std::chrono::system_clock::now();
    event->priority = priority;
    event->metadata = metadata.is_null() ? nlohmann::json::object() : std::move(metadata);

    uint64_t sequenceNumber = 0;
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lk(m_queueMutex);
        sequenceNumber = ++gSequenceCounter;
        event->sequenceNumber = sequenceNumber;

        if (m_queue.size() >= m_config.maxQueueSize)
        {
            // Drop the oldest queued event, never the newest
            m_queue.pop_front();
            m_droppedEvents.fetch_add(1);
            dropped = true;
        }
        m_queue.push_back(std::move(event));
    }
    m_queueCv.notify_one();

    if (dropped)
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "Event queue full ({}), dropped oldest event",
                            m_config.maxQueueSize);
    }
    return sequenceNumber;
}

bool
EventStream::subscribe(const std::string& subscriberId, Callback callback, EventFilter filter)
{
    std::lock_guard<std::mutex> lk(m_subscribersMutex);
    if (m_subscribers.count(subscriberId) != 0)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(), "Subscriber {} already exists", subscriberId);
        return false;
    }

    auto subscriber = std::make_shared<Subscriber>();
    subscriber->subscriberId = subscriberId;
    subscriber->callback = std::move(callback);
    subscriber->filter = std::move(filter);
    subscriber->createdAt = std::chrono::system_clock::now();
    m_subscribers.emplace(subscriberId, std::move(subscriber));

    SPDLOG_LOGGER_INFO(Logger::instance(), "Added subscriber: {}", subscriberId);
    return true;
}

bool
EventStream::unsubscribe(const std::string& subscriberId)
{
    std::lock_guard<std::mutex> lk(m_subscribersMutex);
    auto it = m_subscribers.find(subscriberId);
    if (it == m_subscribers.end())
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "Subscriber {} not found", subscriberId);
        return false;
    }
    m_subscribers.erase(it);
    SPDLOG_LOGGER_INFO(Logger::instance(), "Removed subscriber: {}", subscriberId);
    return true;
}

std::vector<EventPtr>
EventStream::recent(size_t count, const std::optional<EventFilter>& filter) const
{
    std::vector<EventPtr> events;
    {
        std::lock_guard<std::mutex> lk(m_historyMutex);
        events.reserve(m_history.size());
        for (const auto& event : m_history)
        {
            if (!filter || filter->matches(*event))
            {
                events.push_back(event);
            }
        }
    }

    if (count > 0 && events.size() > count)
    {
        events.erase(events.begin(), events.end() - static_cast<std::ptrdiff_t>(count));
    }
    return events;
}

nlohmann::json
EventStream::stats() const
{
    const double uptime =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - m_startTime).count();

    nlohmann::json j;
    j["running"] = m_running.load();
    j["uptime_seconds"] = uptime;
    {
        std::lock_guard<std::mutex> lk(m_queueMutex);
        j["queue_size"] = m_queue.size();
    }
    {
        std::lock_guard<std::mutex> lk(m_historyMutex);
        j["history_size"] = m_history.size();
    }

    uint64_t totalEvents = 0;
    {
        std::lock_guard<std::mutex> lk(m_statsMutex);
        totalEvents = m_totalEvents;
        j["total_events"] = m_totalEvents;
        j["events_by_type"] = m_eventsByType;
        j["events_by_controller"] = m_eventsByController;
        j["events_by_source_type"] = m_eventsBySourceType;
    }
    j["dropped_events"] = m_droppedEvents.load();
    {
        std::lock_guard<std::mutex> lk(m_subscribersMutex);
        j["subscriber_count"] = m_subscribers.size();
    }
    j["events_per_second"] = static_cast<double>(totalEvents) / std::max(uptime, 1.0);
    return j;
}

std::optional<SubscriberSnapshot>
EventStream::subscriber(const std::string& subscriberId) const
{
    std::lock_guard<std::mutex> lk(m_subscribersMutex);
    auto it = m_subscribers.find(subscriberId);
    if (it == m_subscribers.end())
    {
        return std::nullopt;
    }

    const auto& sub = *it->second;
    SubscriberSnapshot snapshot;
    snapshot.subscriberId = sub.subscriberId;
    snapshot.createdAt = sub.createdAt;
    snapshot.eventCount = sub.eventCount.load();
    if (snapshot.eventCount > 0)
    {
        snapshot.lastSequenceNumber = sub.lastSequenceNumber.load();
    }
    snapshot.active = sub.active.load();
    return snapshot;
}

size_t
EventStream::removeInactiveSubscribers()
{
    std::lock_guard<std::mutex> lk(m_subscribersMutex);
    size_t removed = 0;
    for (auto it = m_subscribers.begin(); it != m_subscribers.end();)
    {
        if (!it->second->active.load())
        {
            SPDLOG_LOGGER_INFO(Logger::instance(), "Removed inactive subscriber: {}", it->first);
            it = m_subscribers.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

bool
EventStream::waitUntilIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(m_queueMutex);
    return m_idleCv.wait_for(lk, timeout, [this] { return m_queue.empty() && !m_inFlight; });
}

void
EventStream::processLoop()
{
    SPDLOG_LOGGER_INFO(Logger::instance(), "Event processor started");

    while (m_running.load())
    {
        EventPtr event;
        {
            std::unique_lock<std::mutex> lk(m_queueMutex);
            m_queueCv.wait_for(lk, m_config.dequeueTimeout, [this] {
                return !m_running.load() || !m_queue.empty();
            });
            if (!m_running.load())
            {
                break;
            }
            if (m_queue.empty())
            {
                // Timed out with nothing to do
                continue;
            }
            event = std::move(m_queue.front());
            m_queue.pop_front();
            m_inFlight = true;
        }

        updateStats(*event);
        {
            std::lock_guard<std::mutex> lk(m_historyMutex);
            m_history.push_back(event);
            while (m_history.size() > m_config.maxHistorySize)
            {
                m_history.pop_front();
            }
        }
        dispatch(event);

        {
            std::lock_guard<std::mutex> lk(m_queueMutex);
            m_inFlight = false;
        }
        m_idleCv.notify_all();
    }

    m_idleCv.notify_all();
    SPDLOG_LOGGER_INFO(Logger::instance(), "Event processor exited");
}

void
EventStream::cleanupLoop()
{
    while (m_running.load())
    {
        {
            std::unique_lock<std::mutex> lk(m_cleanupMutex);
            if (m_cleanupCv.wait_for(lk, m_config.cleanupInterval, [this] {
                    return !m_running.load();
                }))
            {
                break;
            }
        }
        removeInactiveSubscribers();
    }
}

void
EventStream::dispatch(const EventPtr& event)
{
    std::vector<std::shared_ptr<Subscriber>> subscribers;
    {
        std::lock_guard<std::mutex> lk(m_subscribersMutex);
        subscribers.reserve(m_subscribers.size());
        for (const auto& [id, sub] : m_subscribers)
        {
            subscribers.push_back(sub);
        }
    }

    for (const auto& sub : subscribers)
    {
        if (!sub->active.load())
        {
            continue;
        }

        std::string failure;
        try
        {
            if (!sub->filter.matches(*event))
            {
                continue;
            }
            sub->callback(*event);
            sub->eventCount.fetch_add(1);
            sub->lastSequenceNumber.store(event->sequenceNumber);
            continue;
        }
        catch (const std::exception& e)
        {
            failure = e.what();
        }
        catch (...)
        {
            failure = "unknown exception";
        }

        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Error calling subscriber {} for event #{} ({}): {}",
                            sub->subscriberId,
                            event->sequenceNumber,
                            event->eventType,
                            failure);
        if (m_config.autoDeactivateFailedSubscribers)
        {
            sub->active.store(false);
            SPDLOG_LOGGER_WARN(Logger::instance(), "Deactivated subscriber {}", sub->subscriberId);
        }
    }

    SPDLOG_LOGGER_TRACE(Logger::instance(),
                        "Delivered event #{} ({}) from {}",
                        event->sequenceNumber,
                        event->eventType,
                        event->sourceController);
}

void
EventStream::updateStats(const Event& event)
{
    std::lock_guard<std::mutex> lk(m_statsMutex);
    ++m_totalEvents;
    ++m_eventsByType[event.eventType];
    ++m_eventsByController[event.sourceController];
    ++m_eventsBySourceType[event.sourceType];
}
