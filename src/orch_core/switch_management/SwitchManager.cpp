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
#include "orch_core/switch_management/SwitchManager.hpp"
#include "orch_core/backend/ControllerBackend.hpp" // for ControllerBackend
#include "spdlog/spdlog.h"                         // for SPDLOG_LOGGER_*
#include "utils/Logger.hpp"                        // for Logger
#include "utils/Utils.hpp"                         // for isDpidLike
#include <exception>                               // for exception
#include <utility>                                 // for move
#include <vector>                                  // for vector

using json = nlohmann::json;

void
SwitchManager::registerBackend(SwitchType type, std::shared_ptr<ControllerBackend> backend)
{
    std::lock_guard<std::mutex> lk(m_mutex);
    m_backends[type] = std::move(backend);
    SPDLOG_LOGGER_INFO(Logger::instance(), "Registered backend for {}", to_string(type));
}

void
SwitchManager::unregisterBackend(SwitchType type)
{
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_backends.erase(type) > 0)
    {
        SPDLOG_LOGGER_INFO(Logger::instance(), "Unregistered backend for {}", to_string(type));
    }
}

void
SwitchManager::registerSwitch(const std::string& switchId, SwitchType type, json config)
{
    std::lock_guard<std::mutex> lk(m_mutex);
    m_switchRegistry[switchId] = type;
    m_switchConfigs[switchId] = std::move(config);
    SPDLOG_LOGGER_DEBUG(Logger::instance(), "Switch {} pinned to {}", switchId, to_string(type));
}

bool
SwitchManager::unregisterSwitch(const std::string& switchId)
{
    std::lock_guard<std::mutex> lk(m_mutex);
    m_switchConfigs.erase(switchId);
    return m_switchRegistry.erase(switchId) > 0;
}

std::optional<json>
SwitchManager::switchConfig(const std::string& switchId) const
{
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_switchConfigs.find(switchId);
    if (it == m_switchConfigs.end())
    {
        return std::nullopt;
    }
    return it->second;
}

SwitchType
SwitchManager::detectSwitchType(const std::string& switchId, const FlowData* flowHint) const
{
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        auto it = m_switchRegistry.find(switchId);
        if (it != m_switchRegistry.end())
        {
            return it->second;
        }
    }

    if (utils::isDpidLike(switchId))
    {
        return SwitchType::OpenFlow;
    }
    if (flowHint && flowHint->hasP4Fields())
    {
        return SwitchType::P4Runtime;
    }
    return SwitchType::OpenFlow;
}

std::shared_ptr<ControllerBackend>
SwitchManager::backend(SwitchType type) const
{
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_backends.find(type);
    return it != m_backends.end() ? it->second : nullptr;
}

std::shared_ptr<ControllerBackend>
SwitchManager::backendForSwitch(const std::string& switchId, const FlowData* flowHint) const
{
    return backend(detectSwitchType(switchId, flowHint));
}

bool
SwitchManager::initialize()
{
    std::vector<std::shared_ptr<ControllerBackend>> backends;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (const auto& [type, b] : m_backends)
        {
            backends.push_back(b);
        }
    }

    bool anyUp = false;
    for (const auto& b : backends)
    {
        bool ok = false;
        try
        {
            ok = b->initialize();
        }
        catch (const std::exception& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(),
                                "Failed to initialize backend {}: {}",
                                to_string(b->switchType()),
                                e.what());
        }
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Backend {} initialized: {}",
                           to_string(b->switchType()),
                           ok);
        anyUp = anyUp || ok;
    }

    m_initialized.store(anyUp);
    return anyUp;
}

void
SwitchManager::shutdown()
{
    std::vector<std::shared_ptr<ControllerBackend>> backends;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (const auto& [type, b] : m_backends)
        {
            backends.push_back(b);
        }
    }

    for (const auto& b : backends)
    {
        try
        {
            b->shutdown();
            SPDLOG_LOGGER_INFO(Logger::instance(),
                               "Backend {} shutdown",
                               to_string(b->switchType()));
        }
        catch (const std::exception& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(),
                                "Failed to shutdown backend {}: {}",
                                to_string(b->switchType()),
                                e.what());
        }
    }
    m_initialized.store(false);
}

OrchResult
SwitchManager::installFlow(FlowData flow)
{
    return dispatchFlow(FlowOp::Install, std::move(flow));
}

OrchResult
SwitchManager::deleteFlow(FlowData flow)
{
    return dispatchFlow(FlowOp::Delete, std::move(flow));
}

OrchResult
SwitchManager::modifyFlow(FlowData flow)
{
    return dispatchFlow(FlowOp::Modify, std::move(flow));
}

OrchResult
SwitchManager::getFlowStats(const std::string& switchId, std::optional<int> tableId)
{
    try
    {
        auto b = backendForSwitch(switchId);
        if (!b)
        {
            return OrchResult::error(ErrorCode::BackendNotAvailable,
                                     "No backend available for switch " + switchId);
        }
        return b->getFlowStats(switchId, tableId);
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Failed to get flow stats: {}", e.what());
        return OrchResult::error(ErrorCode::FlowStatsError, e.what());
    }
}

OrchResult
SwitchManager::getPortStats(const std::string& switchId, std::optional<std::string> portId)
{
    try
    {
        auto b = backendForSwitch(switchId);
        if (!b)
        {
            return OrchResult::error(ErrorCode::BackendNotAvailable,
                                     "No backend available for switch " + switchId);
        }
        return b->getPortStats(switchId, std::move(portId));
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Failed to get port stats: {}", e.what());
        return OrchResult::error(ErrorCode::PortStatsError, e.what());
    }
}

OrchResult
SwitchManager::listAllSwitches()
{
    std::vector<std::shared_ptr<ControllerBackend>> backends;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (const auto& [type, b] : m_backends)
        {
            backends.push_back(b);
        }
    }

    json switches = json::array();
    for (const auto& b : backends)
    {
        try
        {
            for (const auto& sw : b->listSwitches())
            {
                switches.push_back(json(sw));
            }
        }
        catch (const std::exception& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(),
                                "Failed to list switches from {} backend: {}",
                                to_string(b->switchType()),
                                e.what());
        }
    }

    const size_t total = switches.size();
    return OrchResult::success({{"switches", std::move(switches)}, {"total_count", total}});
}

OrchResult
SwitchManager::dispatchFlow(FlowOp op, FlowData flow)
{
    ErrorCode failureCode = ErrorCode::FlowInstallError;
    if (op == FlowOp::Delete)
    {
        failureCode = ErrorCode::FlowDeleteError;
    }
    else if (op == FlowOp::Modify)
    {
        failureCode = ErrorCode::FlowModifyError;
    }

    try
    {
        auto b = backendForSwitch(flow.switchId, &flow);
        if (!b)
        {
            return OrchResult::error(ErrorCode::BackendNotAvailable,
                                     "No backend available for switch " + flow.switchId);
        }

        flow.switchType = b->switchType();
        switch (op)
        {
        case FlowOp::Install:
            return b->installFlow(flow);
        case FlowOp::Modify:
            return b->modifyFlow(flow);
        case FlowOp::Delete:
            return b->deleteFlow(flow);
        }
        return OrchResult::error(failureCode, "Unknown flow operation");
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Flow operation on {} failed: {}",
                            flow.switchId,
                            e.what());
        return OrchResult::error(failureCode, e.what());
    }
}
