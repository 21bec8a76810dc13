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

#include "common_types/ControllerTypes.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Southbound protocol a switch speaks.
 */
enum class SwitchType
{
    OpenFlow,
    P4Runtime,
    Unknown
};

inline std::string
to_string(SwitchType t)
{
    switch (t)
    {
    case SwitchType::OpenFlow:
        return "openflow";
    case SwitchType::P4Runtime:
        return "p4runtime";
    case SwitchType::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline SwitchType
switchTypeFor(ControllerType t)
{
    switch (t)
    {
    case ControllerType::RyuOpenflow:
        return SwitchType::OpenFlow;
    case ControllerType::P4Runtime:
        return SwitchType::P4Runtime;
    case ControllerType::Custom:
        return SwitchType::Unknown;
    }
    return SwitchType::Unknown;
}

/**
 * @brief Protocol-neutral flow rule.
 *
 * Common fields are used by every backend; the OpenFlow block is read by OpenFlow
 * backends and the P4 block (table/action names) by P4Runtime backends. A set P4 table
 * or action name is also what marks a flow as P4-bound during switch type detection.
 */
struct FlowData
{
    std::string switchId;
    SwitchType switchType = SwitchType::Unknown;
    int priority = 1000;
    std::optional<int> tableId;
    nlohmann::json matchFields = nlohmann::json::object();
    nlohmann::json actions = nlohmann::json::array();
    nlohmann::json metadata = nlohmann::json::object();

    // OpenFlow
    std::optional<uint64_t> cookie;
    int idleTimeout = 0;
    int hardTimeout = 0;

    // P4Runtime
    std::optional<std::string> tableName;
    std::optional<std::string> actionName;
    nlohmann::json actionParams = nlohmann::json::object();

    bool
    hasP4Fields() const
    {
        return (tableName && !tableName->empty()) || (actionName && !actionName->empty());
    }
};

/**
 * @brief Protocol-neutral packet record used for packet-in and packet-out.
 */
struct PacketData
{
    std::string switchId;
    SwitchType switchType = SwitchType::Unknown;
    std::vector<uint8_t> payload;
    nlohmann::json metadata = nlohmann::json::object();

    // OpenFlow
    std::optional<uint32_t> inPort;
    std::optional<uint32_t> bufferId;

    // P4Runtime
    std::optional<std::string> ingressPort;
    std::optional<std::string> egressPort;
    nlohmann::json packetMetadata = nlohmann::json::object();
};

struct SwitchInfo
{
    std::string switchId;
    SwitchType switchType = SwitchType::Unknown;
    std::string address;
    int port = 0;
    bool connected = false;
    nlohmann::json capabilities = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Result of the most recent backend health check.
 */
struct ControllerHealth
{
    bool isHealthy = true;
    std::optional<SystemTimePoint> lastCheck;
    double responseTimeMs = 0.0;
    uint64_t errorCount = 0;
    std::optional<std::string> lastError;
    double uptimeSeconds = 0.0;
    nlohmann::json details = nlohmann::json::object();
};

inline void
to_json(nlohmann::json& j, const FlowData& f)
{
    j = nlohmann::json{{"switch_id", f.switchId},
                       {"switch_type", to_string(f.switchType)},
                       {"priority", f.priority},
                       {"table_id", f.tableId ? nlohmann::json(*f.tableId) : nullptr},
                       {"match_fields", f.matchFields},
                       {"actions", f.actions},
                       {"metadata", f.metadata},
                       {"cookie", f.cookie ? nlohmann::json(*f.cookie) : nullptr},
                       {"idle_timeout", f.idleTimeout},
                       {"hard_timeout", f.hardTimeout},
                       {"table_name", f.tableName ? nlohmann::json(*f.tableName) : nullptr},
                       {"action_name", f.actionName ? nlohmann::json(*f.actionName) : nullptr},
                       {"action_params", f.actionParams}};
}

inline void
to_json(nlohmann::json& j, const SwitchInfo& s)
{
    j = nlohmann::json{{"switch_id", s.switchId},
                       {"switch_type", to_string(s.switchType)},
                       {"address", s.address},
                       {"port", s.port},
                       {"connected", s.connected},
                       {"capabilities", s.capabilities},
                       {"metadata", s.metadata}};
}

inline void
to_json(nlohmann::json& j, const ControllerHealth& h)
{
    j = nlohmann::json{{"is_healthy", h.isHealthy},
                       {"last_check", timeToJson(h.lastCheck)},
                       {"response_time_ms", h.responseTimeMs},
                       {"error_count", h.errorCount},
                       {"last_error", h.lastError ? nlohmann::json(*h.lastError) : nullptr},
                       {"uptime_seconds", h.uptimeSeconds},
                       {"details", h.details}};
}
