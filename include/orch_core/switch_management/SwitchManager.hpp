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

// orch_core/switch_management/SwitchManager.hpp
#pragma once

#include "common_types/BackendTypes.hpp" // for SwitchType, FlowData
#include "common_types/OrchResult.hpp"   // for OrchResult
#include <atomic>                        // for atomic
#include <cstdint>                       // for uint8_t
#include <map>                           // for map
#include <memory>                        // for shared_ptr
#include <mutex>                         // for mutex
#include <nlohmann/json.hpp>             // for json
#include <optional>                      // for optional
#include <string>                        // for string
#include <unordered_map>                 // for unordered_map

class ControllerBackend;

/**
 * @brief Routes switch-level operations to the backend that speaks the switch's protocol.
 *
 * One backend per SwitchType. The protocol of a switch comes from the explicit registry
 * (registerSwitch) when present, otherwise from detectSwitchType() heuristics.
 */
class SwitchManager
{
  public:
    SwitchManager() = default;

    SwitchManager(const SwitchManager&) = delete;
    SwitchManager& operator=(const SwitchManager&) = delete;

    /// Register (or replace) the backend for a switch type.
    void registerBackend(SwitchType type, std::shared_ptr<ControllerBackend> backend);
    void unregisterBackend(SwitchType type);

    /// Pin a switch to a protocol, with optional per-switch configuration.
    void registerSwitch(const std::string& switchId,
                        SwitchType type,
                        nlohmann::json config = nlohmann::json::object());
    bool unregisterSwitch(const std::string& switchId);
    std::optional<nlohmann::json> switchConfig(const std::string& switchId) const;

    /**
     * @brief Resolve the protocol of a switch.
     *
     * Order: explicit registry, datapath-id shaped id (OpenFlow), P4 table/action name in
     * the flow hint (P4Runtime), OpenFlow.
     */
    SwitchType detectSwitchType(const std::string& switchId,
                                const FlowData* flowHint = nullptr) const;

    std::shared_ptr<ControllerBackend> backend(SwitchType type) const;
    std::shared_ptr<ControllerBackend> backendForSwitch(const std::string& switchId,
                                                        const FlowData* flowHint = nullptr) const;

    /// Initialize every registered backend. True if at least one came up.
    bool initialize();
    void shutdown();

    bool
    isInitialized() const
    {
        return m_initialized.load();
    }

    OrchResult installFlow(FlowData flow);
    OrchResult deleteFlow(FlowData flow);
    OrchResult modifyFlow(FlowData flow);
    OrchResult getFlowStats(const std::string& switchId, std::optional<int> tableId = std::nullopt);
    OrchResult getPortStats(const std::string& switchId,
                            std::optional<std::string> portId = std::nullopt);

    /// Switches of every backend; a backend that fails is logged and left out.
    OrchResult listAllSwitches();

  private:
    enum class FlowOp : uint8_t
    {
        Install,
        Modify,
        Delete
    };

    OrchResult dispatchFlow(FlowOp op, FlowData flow);

    mutable std::mutex m_mutex;
    std::map<SwitchType, std::shared_ptr<ControllerBackend>> m_backends;
    std::unordered_map<std::string, SwitchType> m_switchRegistry;
    std::unordered_map<std::string, nlohmann::json> m_switchConfigs;

    std::atomic<bool> m_initialized{false};
};
