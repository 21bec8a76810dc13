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

// orch_core/backend/RyuRestBackend.hpp
#pragma once

#include "orch_core/backend/ControllerBackend.hpp" // for ControllerBackend
#include <nlohmann/json.hpp>                       // for json
#include <optional>                                // for optional
#include <string>                                  // for string

/**
 * @brief OpenFlow backend that drives a Ryu instance through ofctl_rest and rest_topology.
 *
 * Every call is a curl request against protocol://host:port, bounded by the controller's
 * health check timeout. Ryu answers 404 for a datapath it does not know, which is reported
 * as SWITCH_NOT_CONNECTED.
 *
 * Endpoints used:
 *  - GET  /stats/switches                      initialize(), ping()
 *  - POST /stats/flowentry/{add,modify,delete} flow operations
 *  - GET  /stats/flow/<dpid>, POST with table_id filter
 *  - GET  /stats/port/<dpid>[/<port>]
 *  - GET  /v1.0/topology/switches[/<dpid>]
 */
class RyuRestBackend : public ControllerBackend
{
  public:
    explicit RyuRestBackend(ControllerConfig config);
    ~RyuRestBackend() override;

    bool initialize() override;
    void shutdown() override;

    OrchResult installFlow(const FlowData& flow) override;
    OrchResult deleteFlow(const FlowData& flow) override;
    OrchResult modifyFlow(const FlowData& flow) override;

    OrchResult getFlowStats(const std::string& switchId, std::optional<int> tableId) override;
    OrchResult getPortStats(const std::string& switchId,
                            std::optional<std::string> portId) override;

    /// ofctl_rest has no packet-out endpoint; always UNSUPPORTED_OPERATION.
    OrchResult sendPacketOut(const PacketData& packet) override;

    std::optional<SwitchInfo> getSwitchInfo(const std::string& switchId) override;
    std::vector<SwitchInfo> listSwitches() override;

    bool ping() override;

    SwitchType
    switchType() const override
    {
        return SwitchType::OpenFlow;
    }

    /// Hand a packet-in relayed from the Ryu side to the registered handlers.
    void handlePacketIn(PacketData packet);

    const std::string&
    baseUrl() const
    {
        return m_baseUrl;
    }

  private:
    struct HttpResponse
    {
        int status = 0; // 0: no HTTP answer (connection refused, timeout)
        std::string body;
    };

    HttpResponse request(const std::string& method,
                         const std::string& path,
                         const std::optional<nlohmann::json>& body = std::nullopt) const;

    OrchResult sendFlowEntry(const std::string& command,
                             const FlowData& flow,
                             ErrorCode failureCode);

    nlohmann::json toFlowEntry(const FlowData& flow, uint64_t dpid) const;
    SwitchInfo toSwitchInfo(const nlohmann::json& topologySwitch) const;

    std::string m_baseUrl;
};
