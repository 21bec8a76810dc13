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
#include "orch_core/backend/ControllerBackend.hpp"
#include "spdlog/spdlog.h"  // for SPDLOG_LOGGER_*
#include "utils/Logger.hpp" // for Logger
#include "utils/Utils.hpp"  // for secondsBetween
#include <exception>        // for exception
#include <utility>          // for move

using json = nlohmann::json;

ControllerBackend::ControllerBackend(ControllerConfig config)
    : m_config(std::move(config)),
      m_startTime(std::chrono::steady_clock::now())
{
}

ControllerBackend::~ControllerBackend()
{
    // Derived classes already waited; this only catches a ping started after that
    awaitOutstandingPing();
}

uint64_t
ControllerBackend::subscribePacketIn(PacketInHandler handler)
{
    std::lock_guard<std::mutex> lk(m_handlersMutex);
    const uint64_t token = m_nextHandlerToken++;
    m_packetInHandlers.emplace(token, std::move(handler));
    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "[{}] packet-in handler {} subscribed",
                        m_config.controllerId,
                        token);
    return token;
}

bool
ControllerBackend::unsubscribePacketIn(uint64_t token)
{
    std::lock_guard<std::mutex> lk(m_handlersMutex);
    return m_packetInHandlers.erase(token) > 0;
}

size_t
ControllerBackend::packetInHandlerCount() const
{
    std::lock_guard<std::mutex> lk(m_handlersMutex);
    return m_packetInHandlers.size();
}

ControllerHealth
ControllerBackend::healthCheck(std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> checkLock(m_healthCheckMutex);
    const auto started = std::chrono::steady_clock::now();

    bool pingOk = false;
    std::optional<std::string> failure;

    if (m_pendingPing.valid() &&
        m_pendingPing.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
    {
        // The previous ping is still hanging; do not stack another thread on it
        failure = "Previous ping still outstanding";
    }
    else
    {
        if (m_pendingPing.valid())
        {
            try
            {
                m_pendingPing.get(); // result of a ping that already timed out
            }
            catch (const std::exception& e)
            {
                SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                    "[{}] late ping failed: {}",
                                    m_config.controllerId,
                                    e.what());
            }
        }

        try
        {
            m_pendingPing = std::async(std::launch::async, [this] { return ping(); });
            if (m_pendingPing.wait_for(timeout) == std::future_status::ready)
            {
                pingOk = m_pendingPing.get();
            }
            else
            {
                failure = "Ping timed out after " + std::to_string(timeout.count()) + " ms";
            }
        }
        catch (const std::exception& e)
        {
            failure = e.what();
        }
    }

    const auto finished = std::chrono::steady_clock::now();
    const bool healthy = pingOk && isConnected();

    std::lock_guard<std::mutex> lk(m_healthMutex);
    m_health.lastCheck = std::chrono::system_clock::now();
    m_health.responseTimeMs = utils::secondsBetween(started, finished) * 1000.0;
    m_health.uptimeSeconds = utils::secondsBetween(m_startTime, finished);
    if (healthy)
    {
        m_health.isHealthy = true;
        m_health.lastError.reset();
    }
    else
    {
        m_health.isHealthy = false;
        m_health.errorCount++;
        m_health.lastError = failure.value_or("Ping failed or not connected");
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "[{}] health check failed: {}",
                            m_config.controllerId,
                            *m_health.lastError);
    }
    m_health.details = healthDetails();
    return m_health;
}

ControllerHealth
ControllerBackend::healthStatus() const
{
    std::lock_guard<std::mutex> lk(m_healthMutex);
    return m_health;
}

void
ControllerBackend::resetErrorCount()
{
    std::lock_guard<std::mutex> lk(m_healthMutex);
    m_health.errorCount = 0;
    m_health.lastError.reset();
}

void
ControllerBackend::awaitOutstandingPing()
{
    std::lock_guard<std::mutex> checkLock(m_healthCheckMutex);
    if (!m_pendingPing.valid())
    {
        return;
    }
    try
    {
        m_pendingPing.get();
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "[{}] outstanding ping failed: {}",
                            m_config.controllerId,
                            e.what());
    }
}

std::optional<SystemTimePoint>
ControllerBackend::lastActivity() const
{
    std::lock_guard<std::mutex> lk(m_healthMutex);
    return m_lastActivity;
}

json
ControllerBackend::controllerInfo() const
{
    json info;
    info["controller_id"] = m_config.controllerId;
    info["controller_type"] = to_string(m_config.controllerType);
    info["switch_type"] = to_string(switchType());
    info["connected"] = isConnected();

    std::lock_guard<std::mutex> lk(m_healthMutex);
    info["health"] = {{"is_healthy", m_health.isHealthy},
                      {"last_check", timeToJson(m_health.lastCheck)},
                      {"response_time_ms", m_health.responseTimeMs},
                      {"error_count", m_health.errorCount},
                      {"last_error", m_health.lastError ? json(*m_health.lastError) : nullptr},
                      {"uptime_seconds", m_health.uptimeSeconds}};
    info["statistics"] = {{"switch_count", m_switchCount.load()},
                          {"packet_count", m_packetCount.load()},
                          {"flow_count", m_flowCount.load()},
                          {"event_count", m_eventCount.load()},
                          {"last_activity", timeToJson(m_lastActivity)}};
    return info;
}

void
ControllerBackend::notifyPacketIn(const PacketData& packet)
{
    m_packetCount.fetch_add(1);
    updateActivity();

    std::vector<std::pair<uint64_t, PacketInHandler>> handlers;
    {
        std::lock_guard<std::mutex> lk(m_handlersMutex);
        handlers.assign(m_packetInHandlers.begin(), m_packetInHandlers.end());
    }

    for (const auto& [token, handler] : handlers)
    {
        try
        {
            handler(packet);
        }
        catch (const std::exception& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(),
                                "[{}] packet-in handler {} threw: {}",
                                m_config.controllerId,
                                token,
                                e.what());
        }
    }
}

void
ControllerBackend::setConnected(bool connected)
{
    m_connected.store(connected);
}

void
ControllerBackend::updateActivity()
{
    m_eventCount.fetch_add(1);
    std::lock_guard<std::mutex> lk(m_healthMutex);
    m_lastActivity = std::chrono::system_clock::now();
}

void
ControllerBackend::incrementFlowCount()
{
    m_flowCount.fetch_add(1);
    updateActivity();
}

void
ControllerBackend::recordError(const std::string& error)
{
    SPDLOG_LOGGER_WARN(Logger::instance(), "[{}] {}", m_config.controllerId, error);
    std::lock_guard<std::mutex> lk(m_healthMutex);
    m_health.errorCount++;
    m_health.lastError = error;
}

void
ControllerBackend::setKnownSwitchCount(uint64_t count)
{
    m_switchCount.store(count);
}

// Caller holds m_healthMutex
json
ControllerBackend::healthDetails() const
{
    return json{{"connected", isConnected()},
                {"switch_count", m_switchCount.load()},
                {"packet_count", m_packetCount.load()},
                {"flow_count", m_flowCount.load()},
                {"event_count", m_eventCount.load()},
                {"last_activity", timeToJson(m_lastActivity)},
                {"controller_id", m_config.controllerId},
                {"controller_type", to_string(m_config.controllerType)}};
}
