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

// orch_core/backend/ControllerBackend.hpp
#pragma once

#include "common_types/BackendTypes.hpp"    // for FlowData, PacketData, SwitchInfo, Contro...
#include "common_types/ControllerTypes.hpp" // for ControllerConfig
#include "common_types/OrchResult.hpp"      // for OrchResult
#include <atomic>                           // for atomic
#include <chrono>                           // for milliseconds, steady_clock
#include <cstdint>                          // for uint64_t
#include <functional>                       // for function
#include <future>                           // for future
#include <map>                              // for map
#include <mutex>                            // for mutex
#include <nlohmann/json.hpp>                // for json
#include <optional>                         // for optional
#include <string>                           // for string
#include <vector>                           // for vector

/**
 * @brief Capability contract every southbound controller backend satisfies.
 *
 * Protocol backends (Ryu/OpenFlow, P4Runtime, custom) implement the pure virtual
 * operations. The base class owns the parts that are the same for every protocol:
 *  - packet-in handler registry (token based) and isolated notification,
 *  - connected flag, activity/flow/packet/event counters,
 *  - health bookkeeping, including the timed ping behind healthCheck().
 *
 * Flow/stats/packet-out operations report failures through OrchResult. listSwitches()
 * and getSwitchInfo() may throw std::runtime_error when the controller is unreachable.
 *
 * Lifetime:
 *  - healthCheck() runs ping() on a helper thread so a hung controller cannot stall the
 *    caller past the timeout. A ping that outlives its timeout stays outstanding and is
 *    awaited by awaitOutstandingPing(). Derived classes call awaitOutstandingPing() from
 *    their destructor, and owners call it before releasing the backend.
 */
class ControllerBackend
{
  public:
    using PacketInHandler = std::function<void(const PacketData&)>;

    explicit ControllerBackend(ControllerConfig config);
    virtual ~ControllerBackend();

    ControllerBackend(const ControllerBackend&) = delete;
    ControllerBackend& operator=(const ControllerBackend&) = delete;

    /// Connect to the controller. Returns false (and records the error) on failure.
    virtual bool initialize() = 0;
    virtual void shutdown() = 0;

    virtual OrchResult installFlow(const FlowData& flow) = 0;
    virtual OrchResult deleteFlow(const FlowData& flow) = 0;
    virtual OrchResult modifyFlow(const FlowData& flow) = 0;

    virtual OrchResult getFlowStats(const std::string& switchId,
                                    std::optional<int> tableId = std::nullopt) = 0;
    virtual OrchResult getPortStats(const std::string& switchId,
                                    std::optional<std::string> portId = std::nullopt) = 0;

    virtual OrchResult sendPacketOut(const PacketData& packet) = 0;

    virtual std::optional<SwitchInfo> getSwitchInfo(const std::string& switchId) = 0;
    virtual std::vector<SwitchInfo> listSwitches() = 0;

    /// Cheap liveness check of the remote controller.
    virtual bool ping() = 0;

    virtual SwitchType switchType() const = 0;

    /**
     * @brief Register a packet-in handler.
     *
     * @return Token to pass to unsubscribePacketIn().
     */
    uint64_t subscribePacketIn(PacketInHandler handler);
    bool unsubscribePacketIn(uint64_t token);
    size_t packetInHandlerCount() const;

    /**
     * @brief Time ping() (bounded by timeout) and fold the result into the health record.
     *
     * Healthy iff the ping succeeded and the backend is connected. Unhealthy results
     * increment the backend error counter and set lastError.
     */
    ControllerHealth healthCheck(std::chrono::milliseconds timeout);

    /// Health record of the most recent check, without probing.
    ControllerHealth healthStatus() const;

    void resetErrorCount();

    /// Block until a ping left behind by a timed-out health check has returned.
    void awaitOutstandingPing();

    bool
    isConnected() const
    {
        return m_connected.load();
    }

    const std::string&
    controllerId() const
    {
        return m_config.controllerId;
    }

    const ControllerConfig&
    config() const
    {
        return m_config;
    }

    uint64_t
    packetCount() const
    {
        return m_packetCount.load();
    }

    uint64_t
    flowCount() const
    {
        return m_flowCount.load();
    }

    uint64_t
    eventCount() const
    {
        return m_eventCount.load();
    }

    uint64_t
    knownSwitchCount() const
    {
        return m_switchCount.load();
    }

    std::optional<SystemTimePoint> lastActivity() const;

    /// JSON snapshot: identity, connection, health and counters.
    nlohmann::json controllerInfo() const;

  protected:
    /// Deliver a packet-in to every handler; a throwing handler is logged and skipped.
    void notifyPacketIn(const PacketData& packet);

    void setConnected(bool connected);
    void updateActivity();
    void incrementFlowCount();
    void recordError(const std::string& error);
    void setKnownSwitchCount(uint64_t count);

    ControllerConfig m_config;

  private:
    nlohmann::json healthDetails() const;

    std::atomic<bool> m_connected{false};
    const std::chrono::steady_clock::time_point m_startTime;

    std::atomic<uint64_t> m_packetCount{0};
    std::atomic<uint64_t> m_flowCount{0};
    std::atomic<uint64_t> m_eventCount{0};
    std::atomic<uint64_t> m_switchCount{0};

    mutable std::mutex m_handlersMutex;
    std::map<uint64_t, PacketInHandler> m_packetInHandlers;
    uint64_t m_nextHandlerToken = 1;

    // Health record and last activity
    mutable std::mutex m_healthMutex;
    ControllerHealth m_health;
    std::optional<SystemTimePoint> m_lastActivity;

    // Serializes health checks; guards m_pendingPing
    std::mutex m_healthCheckMutex;
    std::future<bool> m_pendingPing;
};
