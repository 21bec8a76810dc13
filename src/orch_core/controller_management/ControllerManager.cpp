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
#include "orch_core/controller_management/ControllerManager.hpp"
#include "event_system/EventStream.hpp"            // for EventStream
#include "event_system/EventTypes.hpp"             // for event_names, EventPriority
#include "orch_core/backend/BackendFactory.hpp"    // for BackendFactory
#include "orch_core/backend/ControllerBackend.hpp" // for ControllerBackend
#include "spdlog/spdlog.h"                         // for SPDLOG_LOGGER_*
#include "utils/Logger.hpp"                        // for Logger
#include "utils/Utils.hpp"                         // for trimCopy
#include <algorithm>                               // for find
#include <exception>                               // for exception
#include <utility>                                 // for move

using json = nlohmann::json;

namespace
{
const std::string SOURCE_CONTROLLER = "controller_manager";
const std::string SOURCE_TYPE = "system";
} // namespace

ControllerManager::ControllerManager(std::shared_ptr<EventStream> eventStream,
                                     std::shared_ptr<BackendFactory> factory,
                                     ControllerManagerConfig config)
    : m_eventStream(std::move(eventStream)),
      m_factory(std::move(factory)),
      m_config(config),
      m_startTime(std::chrono::system_clock::now())
{
}

ControllerManager::~ControllerManager()
{
    stop();
}

void
ControllerManager::start()
{
    if (m_running.exchange(true))
    {
        SPDLOG_LOGGER_WARN(Logger::instance(), "Controller manager already running");
        return;
    }
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Starting controller manager (health check every {}s, failover after {} "
                       "failures)",
                       m_config.healthCheckInterval.count(),
                       m_config.maxHealthFailures);
    m_healthThread = std::thread(&ControllerManager::healthLoop, this);
}

void
ControllerManager::stop()
{
    const bool wasRunning = m_running.exchange(false);
    {
        std::lock_guard<std::mutex> lk(m_loopMutex);
    }
    m_loopCv.notify_all();
    if (m_healthThread.joinable())
    {
        m_healthThread.join();
    }

    shutdownAllControllers();
    if (wasRunning)
    {
        SPDLOG_LOGGER_INFO(Logger::instance(), "Controller manager stopped");
    }
}

OrchResult
ControllerManager::registerController(ControllerConfig config, bool autoStart)
{
    config.controllerId = utils::trimCopy(config.controllerId);
    if (auto error = validateControllerConfig(config))
    {
        return OrchResult::error(ErrorCode::ValidationError, *error);
    }
    const std::string controllerId = config.controllerId;

    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        if (m_controllers.count(controllerId) != 0)
        {
            return OrchResult::error(ErrorCode::ControllerExists,
                                     "Controller " + controllerId + " already exists");
        }
    }

    // Backend construction happens outside the registry lock
    std::shared_ptr<ControllerBackend> backend = m_factory->create(config);
    if (!backend)
    {
        return OrchResult::error(ErrorCode::ControllerCreationFailed,
                                 "Failed to create controller instance for " + controllerId);
    }

    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        if (m_controllers.count(controllerId) != 0)
        {
            return OrchResult::error(ErrorCode::ControllerExists,
                                     "Controller " + controllerId + " already exists");
        }
        ControllerEntry entry;
        entry.backend = backend;
        entry.info.config = config;
        entry.info.status = ControllerStatus::Initializing;
        entry.info.createdAt = std::chrono::system_clock::now();
        m_controllers.emplace(controllerId, std::move(entry));
    }

    if (autoStart)
    {
        startController(controllerId);
    }

    m_eventStream->publish(event_names::CONTROLLER_REGISTERED,
                           SOURCE_CONTROLLER,
                           SOURCE_TYPE,
                           {{"controller_id", controllerId},
                            {"controller_type", to_string(config.controllerType)},
                            {"auto_start", autoStart}});

    SPDLOG_LOGGER_INFO(Logger::instance(), "Controller {} registered", controllerId);

    auto info = controllerInfo(controllerId);
    return OrchResult::success({{"controller_id", controllerId},
                                {"status", "registered"},
                                {"auto_start", autoStart},
                                {"controller_info", info ? json(*info) : json(nullptr)}},
                               "Controller " + controllerId + " registered successfully");
}

OrchResult
ControllerManager::deregisterController(const std::string& controllerId)
{
    ControllerStatus status;
    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        auto it = m_controllers.find(controllerId);
        if (it == m_controllers.end())
        {
            return OrchResult::error(ErrorCode::ControllerNotFound,
                                     "Controller " + controllerId + " not found");
        }
        status = it->second.info.status;
    }

    if (status != ControllerStatus::Disconnected)
    {
        stopController(controllerId);
    }

    removeControllerMappings(controllerId);

    std::shared_ptr<ControllerBackend> backend;
    std::optional<uint64_t> token;
    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        auto it = m_controllers.find(controllerId);
        if (it != m_controllers.end())
        {
            backend = std::move(it->second.backend);
            token = it->second.packetInToken;
            m_controllers.erase(it);
        }
    }
    if (backend)
    {
        // The backend may outlive this manager
        if (token)
        {
            backend->unsubscribePacketIn(*token);
        }
        backend->awaitOutstandingPing();
    }

    // A concurrent mapSwitch may have validated against the entry just erased
    removeControllerMappings(controllerId);

    m_eventStream->publish(event_names::CONTROLLER_DEREGISTERED,
                           SOURCE_CONTROLLER,
                           SOURCE_TYPE,
                           {{"controller_id", controllerId}});

    SPDLOG_LOGGER_INFO(Logger::instance(), "Controller {} deregistered", controllerId);
    return OrchResult::success({{"controller_id", controllerId}, {"status", "deregistered"}},
                               "Controller " + controllerId + " deregistered successfully");
}

OrchResult
ControllerManager::startController(const std::string& controllerId)
{
    std::shared_ptr<ControllerBackend> backend;
    std::optional<uint64_t> staleToken;
    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        auto it = m_controllers.find(controllerId);
        if (it == m_controllers.end())
        {
            return OrchResult::error(ErrorCode::ControllerNotFound,
                                     "Controller " + controllerId + " not found");
        }
        backend = it->second.backend;
        staleToken = it->second.packetInToken;
        it->second.packetInToken.reset();
        it->second.info.status = ControllerStatus::Initializing;
    }
    if (staleToken)
    {
        backend->unsubscribePacketIn(*staleToken);
    }

    bool initialized = false;
    std::string error;
    try
    {
        initialized = backend->initialize();
    }
    catch (const std::exception& e)
    {
        error = e.what();
    }

    if (!initialized)
    {
        if (error.empty())
        {
            error = backend->healthStatus().lastError.value_or("Failed to initialize");
        }
        {
            std::lock_guard<std::mutex> lk(m_controllerMutex);
            auto it = m_controllers.find(controllerId);
            if (it != m_controllers.end())
            {
                it->second.info.status = ControllerStatus::Error;
                it->second.info.lastError = error;
            }
        }
        m_failedControllers.fetch_add(1);
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Failed to start controller {}: {}",
                            controllerId,
                            error);
        return OrchResult::error(ErrorCode::BackendNotAvailable,
                                 "Failed to start controller " + controllerId + ": " + error);
    }

    const uint64_t token = backend->subscribePacketIn(
        [this, controllerId](const PacketData& packet) { onPacketIn(controllerId, packet); });
    backend->resetErrorCount();

    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        auto it = m_controllers.find(controllerId);
        if (it == m_controllers.end())
        {
            // Deregistered while initializing
            backend->unsubscribePacketIn(token);
            return OrchResult::error(ErrorCode::ControllerNotFound,
                                     "Controller " + controllerId + " not found");
        }
        auto& info = it->second.info;
        it->second.packetInToken = token;
        info.status = ControllerStatus::Connected;
        info.lastSeen = std::chrono::system_clock::now();
        info.lastError.reset();
        info.errorCount = 0;
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "Controller {} started", controllerId);
    return OrchResult::success({{"controller_id", controllerId}, {"status", "connected"}});
}

OrchResult
ControllerManager::stopController(const std::string& controllerId)
{
    std::shared_ptr<ControllerBackend> backend;
    std::optional<uint64_t> token;
    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        auto it = m_controllers.find(controllerId);
        if (it == m_controllers.end())
        {
            return OrchResult::error(ErrorCode::ControllerNotFound,
                                     "Controller " + controllerId + " not found");
        }
        backend = it->second.backend;
        token = it->second.packetInToken;
        it->second.packetInToken.reset();
    }

    if (token)
    {
        backend->unsubscribePacketIn(*token);
    }
    try
    {
        backend->shutdown();
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Error stopping controller {}: {}",
                            controllerId,
                            e.what());
    }

    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        auto it = m_controllers.find(controllerId);
        if (it != m_controllers.end())
        {
            it->second.info.status = ControllerStatus::Disconnected;
        }
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "Controller {} stopped", controllerId);
    return OrchResult::success({{"controller_id", controllerId}, {"status", "disconnected"}});
}

OrchResult
ControllerManager::setMaintenance(const std::string& controllerId, bool on)
{
    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        auto it = m_controllers.find(controllerId);
        if (it == m_controllers.end())
        {
            return OrchResult::error(ErrorCode::ControllerNotFound,
                                     "Controller " + controllerId + " not found");
        }

        auto& info = it->second.info;
        const ControllerStatus required =
            on ? ControllerStatus::Connected : ControllerStatus::Maintenance;
        if (info.status != required)
        {
            return OrchResult::error(ErrorCode::ValidationError,
                                     "Controller " + controllerId + " is " +
                                         to_string(info.status) + ", expected " +
                                         to_string(required));
        }
        info.status = on ? ControllerStatus::Maintenance : ControllerStatus::Connected;
    }

    m_eventStream->publish(event_names::CONTROLLER_MAINTENANCE,
                           SOURCE_CONTROLLER,
                           SOURCE_TYPE,
                           {{"controller_id", controllerId}, {"maintenance", on}},
                           EventPriority::Medium);

    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Controller {} {} maintenance",
                       controllerId,
                       on ? "entered" : "left");
    return OrchResult::success(
        {{"controller_id", controllerId},
         {"status", to_string(on ? ControllerStatus::Maintenance : ControllerStatus::Connected)}});
}

OrchResult
ControllerManager::mapSwitch(const std::string& switchId,
                             const std::string& primaryController,
                             const std::vector<std::string>& backupControllers)
{
    const std::string id = utils::trimCopy(switchId);
    if (id.empty())
    {
        return OrchResult::error(ErrorCode::ValidationError, "Switch ID cannot be empty");
    }

    std::vector<std::string> backups;
    for (const auto& backup : backupControllers)
    {
        if (backup != primaryController &&
            std::find(backups.begin(), backups.end(), backup) == backups.end())
        {
            backups.push_back(backup);
        }
    }

    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        if (m_controllers.count(primaryController) == 0)
        {
            return OrchResult::error(ErrorCode::ControllerNotFound,
                                     "Primary controller " + primaryController + " not found");
        }
        for (const auto& backup : backups)
        {
            if (m_controllers.count(backup) == 0)
            {
                return OrchResult::error(ErrorCode::ControllerNotFound,
                                         "Backup controller " + backup + " not found");
            }
        }
    }

    SwitchMapping mapping;
    mapping.switchId = id;
    mapping.primaryController = primaryController;
    mapping.backupControllers = backups;
    mapping.currentController = primaryController;
    mapping.createdAt = std::chrono::system_clock::now();
    mapping.lastUpdated = mapping.createdAt;
    {
        std::lock_guard<std::mutex> lk(m_mappingMutex);
        auto it = m_mappings.find(id);
        if (it != m_mappings.end())
        {
            mapping.createdAt = it->second.createdAt;
            mapping.failoverCount = it->second.failoverCount;
        }
        m_mappings[id] = mapping;
    }

    std::optional<std::string> vanished;
    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        if (m_controllers.count(primaryController) == 0)
        {
            vanished = primaryController;
        }
        for (const auto& backup : backups)
        {
            if (!vanished && m_controllers.count(backup) == 0)
            {
                vanished = backup;
            }
        }
    }
    if (vanished)
    {
        // Deregistered between validation and insert
        {
            std::lock_guard<std::mutex> lk(m_mappingMutex);
            auto it = m_mappings.find(id);
            if (it != m_mappings.end() && it->second.lastUpdated == mapping.lastUpdated &&
                it->second.primaryController == primaryController)
            {
                m_mappings.erase(it);
            }
        }
        removeControllerMappings(*vanished);
        return OrchResult::error(ErrorCode::ControllerNotFound,
                                 "Controller " + *vanished + " not found");
    }

    m_eventStream->publish(event_names::SWITCH_MAPPED,
                           SOURCE_CONTROLLER,
                           SOURCE_TYPE,
                           {{"switch_id", id},
                            {"primary_controller", primaryController},
                            {"backup_controllers", backups}});

    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Switch {} mapped to {} ({} backup(s))",
                       id,
                       primaryController,
                       backups.size());
    return OrchResult::success({{"switch_id", id}, {"mapping", mapping}},
                               "Switch " + id + " mapped successfully");
}

OrchResult
ControllerManager::manualFailover(const std::string& switchId,
                                  const std::optional<std::string>& targetController)
{
    SwitchMapping mapping;
    {
        std::lock_guard<std::mutex> lk(m_mappingMutex);
        auto it = m_mappings.find(switchId);
        if (it == m_mappings.end())
        {
            return OrchResult::error(ErrorCode::MappingNotFound,
                                     "Switch " + switchId + " not mapped to any controller");
        }
        mapping = it->second;
    }

    std::string target;
    if (targetController)
    {
        {
            std::lock_guard<std::mutex> lk(m_controllerMutex);
            if (m_controllers.count(*targetController) == 0)
            {
                return OrchResult::error(ErrorCode::ControllerNotFound,
                                         "Target controller " + *targetController +
                                             " not found");
            }
        }
        if (!isHealthyCandidate(*targetController))
        {
            return OrchResult::error(ErrorCode::ControllerUnhealthy,
                                     "Target controller " + *targetController +
                                         " is not healthy");
        }
        target = *targetController;
    }
    else
    {
        for (const auto& backup : mapping.backupControllers)
        {
            if (backup != mapping.currentController && isHealthyCandidate(backup))
            {
                target = backup;
                break;
            }
        }
        if (target.empty())
        {
            return OrchResult::error(ErrorCode::NoBackupAvailable,
                                     "No healthy backup controller available for switch " +
                                         switchId);
        }
    }

    std::string oldController;
    uint64_t failoverCount = 0;
    {
        std::lock_guard<std::mutex> lk(m_mappingMutex);
        auto it = m_mappings.find(switchId);
        if (it == m_mappings.end())
        {
            return OrchResult::error(ErrorCode::MappingNotFound,
                                     "Switch " + switchId + " not mapped to any controller");
        }
        auto& current = it->second;
        oldController = current.currentController;
        if (!current.isCandidate(target))
        {
            current.backupControllers.push_back(target);
        }
        current.currentController = target;
        current.failoverCount++;
        current.lastUpdated = std::chrono::system_clock::now();
        failoverCount = current.failoverCount;
    }
    m_failoverCount.fetch_add(1);

    m_eventStream->publish(event_names::MANUAL_FAILOVER,
                           SOURCE_CONTROLLER,
                           SOURCE_TYPE,
                           {{"switch_id", switchId},
                            {"old_controller", oldController},
                            {"new_controller", target},
                            {"failover_count", failoverCount},
                            {"manual", true}},
                           EventPriority::High);

    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Switch {} manually failed over from {} to {}",
                       switchId,
                       oldController,
                       target);
    return OrchResult::success({{"switch_id", switchId},
                                {"old_controller", oldController},
                                {"new_controller", target},
                                {"failover_count", failoverCount}},
                               "Switch " + switchId + " failed over successfully");
}

size_t
ControllerManager::runHealthChecks()
{
    std::vector<std::pair<std::string, std::shared_ptr<ControllerBackend>>> targets;
    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        for (const auto& [id, entry] : m_controllers)
        {
            // Administratively parked controllers are not monitored
            if (entry.info.status == ControllerStatus::Maintenance)
            {
                continue;
            }
            targets.emplace_back(id, entry.backend);
        }
    }

    std::vector<std::string> failed;
    for (const auto& [controllerId, backend] : targets)
    {
        ControllerHealth health;
        try
        {
            std::chrono::milliseconds timeout = backend->config().healthCheckTimeout;
            health = backend->healthCheck(timeout);
        }
        catch (const std::exception& e)
        {
            health.isHealthy = false;
            health.lastError = e.what();
        }
        m_healthChecksPerformed.fetch_add(1);

        std::lock_guard<std::mutex> lk(m_controllerMutex);
        auto it = m_controllers.find(controllerId);
        if (it == m_controllers.end())
        {
            continue;
        }

        auto& info = it->second.info;
        const auto now = std::chrono::system_clock::now();
        info.lastHealthCheck = now;
        if (health.isHealthy)
        {
            info.healthStatus = HealthStatus::Healthy;
            info.lastSeen = now;
            info.errorCount = 0;
            continue;
        }

        info.healthStatus = HealthStatus::Unhealthy;
        info.errorCount++;
        info.lastError = health.lastError.value_or("Health check failed");
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Health check failed for controller {} ({}/{}): {}",
                           controllerId,
                           info.errorCount,
                           m_config.maxHealthFailures,
                           *info.lastError);

        if (info.errorCount >= m_config.maxHealthFailures)
        {
            // A stopped controller stays disconnected
            if (info.errorCount == m_config.maxHealthFailures &&
                info.status != ControllerStatus::Disconnected &&
                info.status != ControllerStatus::Error)
            {
                info.status = ControllerStatus::Error;
                m_failedControllers.fetch_add(1);
            }
            failed.push_back(controllerId);
        }
    }

    for (const auto& controllerId : failed)
    {
        handleControllerFailure(controllerId);
    }
    return targets.size();
}

OrchResult
ControllerManager::listControllers() const
{
    const auto assigned = assignedSwitchesByController();

    std::vector<std::pair<ControllerInfo, std::shared_ptr<ControllerBackend>>> snapshot;
    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        snapshot.reserve(m_controllers.size());
        for (const auto& [id, entry] : m_controllers)
        {
            snapshot.emplace_back(entry.info, entry.backend);
        }
    }

    json controllers = json::object();
    size_t healthyCount = 0;
    size_t connectedCount = 0;
    for (auto& [info, backend] : snapshot)
    {
        fillRuntimeFields(info, *backend, assigned);
        if (info.healthStatus == HealthStatus::Healthy)
        {
            ++healthyCount;
        }
        if (info.status == ControllerStatus::Connected)
        {
            ++connectedCount;
        }
        controllers[info.config.controllerId] = info;
    }

    return OrchResult::success({{"controllers", controllers},
                                {"total_count", snapshot.size()},
                                {"healthy_count", healthyCount},
                                {"connected_count", connectedCount},
                                {"stats", stats()}});
}

OrchResult
ControllerManager::listSwitchMappings() const
{
    json mappings = json::object();
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lk(m_mappingMutex);
        for (const auto& [switchId, mapping] : m_mappings)
        {
            mappings[switchId] = mapping;
        }
        count = m_mappings.size();
    }
    return OrchResult::success({{"mappings", mappings}, {"total_count", count}});
}

std::shared_ptr<ControllerBackend>
ControllerManager::controllerForSwitch(const std::string& switchId) const
{
    std::string current;
    {
        std::lock_guard<std::mutex> lk(m_mappingMutex);
        auto it = m_mappings.find(switchId);
        if (it == m_mappings.end())
        {
            return nullptr;
        }
        current = it->second.currentController;
    }
    return backend(current);
}

std::shared_ptr<ControllerBackend>
ControllerManager::backend(const std::string& controllerId) const
{
    std::lock_guard<std::mutex> lk(m_controllerMutex);
    auto it = m_controllers.find(controllerId);
    if (it == m_controllers.end())
    {
        return nullptr;
    }
    return it->second.backend;
}

std::optional<ControllerInfo>
ControllerManager::controllerInfo(const std::string& controllerId) const
{
    const auto assigned = assignedSwitchesByController();

    ControllerInfo info;
    std::shared_ptr<ControllerBackend> backend;
    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        auto it = m_controllers.find(controllerId);
        if (it == m_controllers.end())
        {
            return std::nullopt;
        }
        info = it->second.info;
        backend = it->second.backend;
    }
    fillRuntimeFields(info, *backend, assigned);
    return info;
}

std::optional<SwitchMapping>
ControllerManager::switchMapping(const std::string& switchId) const
{
    std::lock_guard<std::mutex> lk(m_mappingMutex);
    auto it = m_mappings.find(switchId);
    if (it == m_mappings.end())
    {
        return std::nullopt;
    }
    return it->second;
}

json
ControllerManager::stats() const
{
    size_t totalControllers = 0;
    size_t activeControllers = 0;
    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        totalControllers = m_controllers.size();
        for (const auto& [id, entry] : m_controllers)
        {
            if (entry.info.status == ControllerStatus::Connected)
            {
                ++activeControllers;
            }
        }
    }
    size_t totalSwitches = 0;
    {
        std::lock_guard<std::mutex> lk(m_mappingMutex);
        totalSwitches = m_mappings.size();
    }

    return json{{"total_controllers", totalControllers},
                {"active_controllers", activeControllers},
                {"failed_controllers", m_failedControllers.load()},
                {"total_switches", totalSwitches},
                {"failover_count", m_failoverCount.load()},
                {"health_checks_performed", m_healthChecksPerformed.load()},
                {"start_time", utils::toIsoUtc(m_startTime)}};
}

void
ControllerManager::healthLoop()
{
    SPDLOG_LOGGER_INFO(Logger::instance(), "Health monitor started");
    while (m_running.load())
    {
        {
            std::unique_lock<std::mutex> lk(m_loopMutex);
            if (m_loopCv.wait_for(lk, m_config.healthCheckInterval, [this] {
                    return !m_running.load();
                }))
            {
                break;
            }
        }

        try
        {
            runHealthChecks();
        }
        catch (const std::exception& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(), "Error in health monitor: {}", e.what());
        }
    }
    SPDLOG_LOGGER_INFO(Logger::instance(), "Health monitor exited");
}

void
ControllerManager::shutdownAllControllers()
{
    std::vector<std::string> running;
    std::vector<std::shared_ptr<ControllerBackend>> backends;
    {
        std::lock_guard<std::mutex> lk(m_controllerMutex);
        for (const auto& [id, entry] : m_controllers)
        {
            if (entry.info.status != ControllerStatus::Disconnected || entry.packetInToken)
            {
                running.push_back(id);
            }
            backends.push_back(entry.backend);
        }
    }

    for (const auto& id : running)
    {
        stopController(id);
    }
    for (const auto& backend : backends)
    {
        backend->awaitOutstandingPing();
    }
}

void
ControllerManager::handleControllerFailure(const std::string& failedControllerId)
{
    std::vector<std::string> switches;
    {
        std::lock_guard<std::mutex> lk(m_mappingMutex);
        for (const auto& [switchId, mapping] : m_mappings)
        {
            if (mapping.currentController == failedControllerId)
            {
                switches.push_back(switchId);
            }
        }
    }
    if (switches.empty())
    {
        return;
    }

    SPDLOG_LOGGER_WARN(Logger::instance(),
                       "Controller {} has failed, failing over {} switch(es)",
                       failedControllerId,
                       switches.size());
    for (const auto& switchId : switches)
    {
        failoverSwitch(switchId, failedControllerId);
    }
}

bool
ControllerManager::failoverSwitch(const std::string& switchId,
                                  const std::string& failedControllerId)
{
    std::vector<std::string> backups;
    {
        std::lock_guard<std::mutex> lk(m_mappingMutex);
        auto it = m_mappings.find(switchId);
        if (it == m_mappings.end() || it->second.currentController != failedControllerId)
        {
            return false;
        }
        backups = it->second.backupControllers;
    }

    std::string target;
    for (const auto& backup : backups)
    {
        if (backup != failedControllerId && isHealthyCandidate(backup))
        {
            target = backup;
            break;
        }
    }
    if (target.empty())
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "No healthy backup controller available for switch {}",
                            switchId);
        return false;
    }

    uint64_t failoverCount = 0;
    {
        std::lock_guard<std::mutex> lk(m_mappingMutex);
        auto it = m_mappings.find(switchId);
        if (it == m_mappings.end() || it->second.currentController != failedControllerId)
        {
            // Remapped or failed over by someone else in the meantime
            return false;
        }
        auto& mapping = it->second;
        mapping.currentController = target;
        mapping.failoverCount++;
        mapping.lastUpdated = std::chrono::system_clock::now();
        failoverCount = mapping.failoverCount;
    }
    m_failoverCount.fetch_add(1);

    m_eventStream->publish(event_names::SWITCH_FAILOVER,
                           SOURCE_CONTROLLER,
                           SOURCE_TYPE,
                           {{"switch_id", switchId},
                            {"failed_controller", failedControllerId},
                            {"new_controller", target},
                            {"failover_count", failoverCount}},
                           EventPriority::High);

    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Switch {} failed over from {} to {}",
                       switchId,
                       failedControllerId,
                       target);
    return true;
}

size_t
ControllerManager::removeControllerMappings(const std::string& controllerId)
{
    std::lock_guard<std::mutex> lk(m_mappingMutex);
    size_t removed = 0;
    for (auto it = m_mappings.begin(); it != m_mappings.end();)
    {
        auto& mapping = it->second;
        if (mapping.primaryController == controllerId ||
            mapping.currentController == controllerId)
        {
            SPDLOG_LOGGER_INFO(Logger::instance(), "Removed mapping for switch {}", it->first);
            it = m_mappings.erase(it);
            ++removed;
            continue;
        }

        auto& backups = mapping.backupControllers;
        auto pos = std::find(backups.begin(), backups.end(), controllerId);
        if (pos != backups.end())
        {
            backups.erase(pos);
            mapping.lastUpdated = std::chrono::system_clock::now();
        }
        ++it;
    }
    return removed;
}

bool
ControllerManager::isHealthyCandidate(const std::string& controllerId) const
{
    std::lock_guard<std::mutex> lk(m_controllerMutex);
    auto it = m_controllers.find(controllerId);
    if (it == m_controllers.end())
    {
        return false;
    }
    const auto& info = it->second.info;
    return info.healthStatus == HealthStatus::Healthy &&
           info.status != ControllerStatus::Maintenance &&
           info.status != ControllerStatus::Disconnected;
}

void
ControllerManager::onPacketIn(const std::string& controllerId, const PacketData& packet)
{
    m_eventStream->publish(event_names::PACKET_IN,
                           controllerId,
                           to_string(packet.switchType),
                           {{"switch_id", packet.switchId},
                            {"packet_size", packet.payload.size()},
                            {"metadata", packet.metadata}});
}

std::map<std::string, std::vector<std::string>>
ControllerManager::assignedSwitchesByController() const
{
    std::map<std::string, std::vector<std::string>> assigned;
    std::lock_guard<std::mutex> lk(m_mappingMutex);
    for (const auto& [switchId, mapping] : m_mappings)
    {
        assigned[mapping.currentController].push_back(switchId);
    }
    return assigned;
}

void
ControllerManager::fillRuntimeFields(
    ControllerInfo& info,
    const ControllerBackend& backend,
    const std::map<std::string, std::vector<std::string>>& assigned) const
{
    const ControllerHealth health = backend.healthStatus();
    auto& metrics = info.metrics;
    metrics.uptimeSeconds =
        std::chrono::duration<double>(std::chrono::system_clock::now() - info.createdAt).count();
    metrics.totalSwitches = backend.knownSwitchCount();
    metrics.activeFlows = backend.flowCount();
    metrics.packetsProcessed = backend.packetCount();
    metrics.eventsGenerated = backend.eventCount();
    metrics.lastActivity = backend.lastActivity();
    metrics.responseTimeMs = health.responseTimeMs;
    metrics.errorCount = health.errorCount;

    auto it = assigned.find(info.config.controllerId);
    info.assignedSwitches = it != assigned.end() ? it->second : std::vector<std::string>{};
}
