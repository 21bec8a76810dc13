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

// orch_core/controller_management/ControllerManager.hpp
#pragma once

#include "common_types/BackendTypes.hpp"    // for PacketData
#include "common_types/ControllerTypes.hpp" // for ControllerConfig, ControllerInfo, SwitchMa...
#include "common_types/OrchResult.hpp"      // for OrchResult
#include <atomic>                           // for atomic
#include <chrono>                           // for seconds
#include <condition_variable>               // for condition_variable
#include <cstddef>                          // for size_t
#include <cstdint>                          // for uint64_t
#include <map>                              // for map
#include <memory>                           // for shared_ptr
#include <mutex>                            // for mutex
#include <nlohmann/json.hpp>                // for json
#include <optional>                         // for optional
#include <string>                           // for string
#include <thread>                           // for thread
#include <unordered_map>                    // for unordered_map
#include <vector>                           // for vector

class BackendFactory;
class ControllerBackend;
class EventStream;

struct ControllerManagerConfig
{
    std::chrono::seconds healthCheckInterval{30};
    int maxHealthFailures = 3;
};

/**
 * @brief Controller registry, health monitor and switch-to-controller mapping table.
 *
 * Owns one backend per registered controller (built through the BackendFactory) and the
 * mapping of every switch to a primary controller, ordered backups and the controller
 * currently in charge.
 *
 * Health and failover:
 *  - A background thread calls runHealthChecks() every healthCheckInterval. Every
 *    controller except those in maintenance is checked; a stopped one reports unhealthy.
 *  - Each check resets error_count on success and increments it on failure. Once it reaches
 *    maxHealthFailures, every switch currently on that controller fails over to the first
 *    healthy backup in list order. Without one, the switch stays where it is and is retried
 *    on the next round. A successful check clears the failure count but leaves an
 *    `error` status in place until the controller is restarted or deregistered.
 *
 * Locking:
 *  - m_controllerMutex guards the registry, m_mappingMutex the mapping table. The two are
 *    never held together, and backend I/O happens with neither held.
 *
 * All public operations return OrchResult (or a plain snapshot) and never throw.
 */
class ControllerManager
{
  public:
    ControllerManager(std::shared_ptr<EventStream> eventStream,
                      std::shared_ptr<BackendFactory> factory,
                      ControllerManagerConfig config = ControllerManagerConfig{});
    ~ControllerManager();

    ControllerManager(const ControllerManager&) = delete;
    ControllerManager& operator=(const ControllerManager&) = delete;

    /// Start the health monitor thread.
    void start();

    /// Stop the health monitor and shut every controller down.
    void stop();

    bool
    isRunning() const
    {
        return m_running.load();
    }

    OrchResult registerController(ControllerConfig config, bool autoStart = true);
    OrchResult deregisterController(const std::string& controllerId);

    /// Initialize the backend and attach the packet-in forwarder.
    OrchResult startController(const std::string& controllerId);

    /// Detach packet-in and shut the backend down.
    OrchResult stopController(const std::string& controllerId);

    /// Enter (on = true) or leave maintenance. Only connected controllers may enter.
    OrchResult setMaintenance(const std::string& controllerId, bool on);

    /**
     * @brief Create or overwrite the mapping of a switch, with the primary as current.
     *
     * Duplicate backups and the primary itself are dropped from the backup list.
     * Overwriting keeps the failover_count and created_at of the previous mapping.
     */
    OrchResult mapSwitch(const std::string& switchId,
                         const std::string& primaryController,
                         const std::vector<std::string>& backupControllers = {});

    /**
     * @brief Move a switch to target, or to the first healthy backup when none is given.
     *
     * A target outside {primary} U backups is appended to the backups.
     */
    OrchResult manualFailover(const std::string& switchId,
                              const std::optional<std::string>& targetController = std::nullopt);

    /**
     * @brief One round of health checks over every controller not in maintenance.
     *
     * All controllers are checked before any failover runs, so the candidates' health
     * reflects this round regardless of iteration order.
     *
     * @return Number of controllers checked.
     */
    size_t runHealthChecks();

    OrchResult listControllers() const;
    OrchResult listSwitchMappings() const;

    /// Backend of the controller currently in charge of a switch, or nullptr.
    std::shared_ptr<ControllerBackend> controllerForSwitch(const std::string& switchId) const;
    std::shared_ptr<ControllerBackend> backend(const std::string& controllerId) const;

    std::optional<ControllerInfo> controllerInfo(const std::string& controllerId) const;
    std::optional<SwitchMapping> switchMapping(const std::string& switchId) const;

    nlohmann::json stats() const;

  private:
    struct ControllerEntry
    {
        std::shared_ptr<ControllerBackend> backend;
        ControllerInfo info;
        std::optional<uint64_t> packetInToken;
    };

    void healthLoop();
    void shutdownAllControllers();

    void handleControllerFailure(const std::string& failedControllerId);
    bool failoverSwitch(const std::string& switchId, const std::string& failedControllerId);

    /// Drop mappings whose primary or current is controllerId; prune it from the rest.
    size_t removeControllerMappings(const std::string& controllerId);

    bool isHealthyCandidate(const std::string& controllerId) const;
    void onPacketIn(const std::string& controllerId, const PacketData& packet);

    std::map<std::string, std::vector<std::string>> assignedSwitchesByController() const;
    void fillRuntimeFields(ControllerInfo& info,
                           const ControllerBackend& backend,
                           const std::map<std::string, std::vector<std::string>>& assigned) const;

    std::shared_ptr<EventStream> m_eventStream;
    std::shared_ptr<BackendFactory> m_factory;
    ControllerManagerConfig m_config;

    mutable std::mutex m_controllerMutex;
    std::unordered_map<std::string, ControllerEntry> m_controllers;

    mutable std::mutex m_mappingMutex;
    std::map<std::string, SwitchMapping> m_mappings;

    // Health monitor
    std::atomic<bool> m_running{false};
    std::thread m_healthThread;
    std::mutex m_loopMutex;
    std::condition_variable m_loopCv;

    // Statistics
    const SystemTimePoint m_startTime;
    std::atomic<uint64_t> m_failedControllers{0};
    std::atomic<uint64_t> m_failoverCount{0};
    std::atomic<uint64_t> m_healthChecksPerformed{0};
};
