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

#include "utils/Utils.hpp"   // for toIsoUtc
#include <chrono>            // for system_clock
#include <cstdint>           // for uint64_t
#include <functional>        // for function
#include <memory>            // for shared_ptr
#include <nlohmann/json.hpp> // for json
#include <set>               // for set
#include <string>            // for string

// Event type names published by the engine itself
namespace event_names
{
static constexpr const char* CONTROLLER_REGISTERED = "controller_registered";
static constexpr const char* CONTROLLER_DEREGISTERED = "controller_deregistered";
static constexpr const char* CONTROLLER_MAINTENANCE = "controller_maintenance";
static constexpr const char* SWITCH_MAPPED = "switch_mapped";
static constexpr const char* SWITCH_FAILOVER = "switch_failover";
static constexpr const char* MANUAL_FAILOVER = "manual_failover";
static constexpr const char* PACKET_IN = "packet_in";
} // namespace event_names

enum class EventPriority : int
{
    Low = 1,
    Medium = 2,
    High = 3
};

// Event record shared (read-only) between the queue, the history ring and subscribers
struct Event
{
    std::string eventType;
    std::string sourceController;
    std::string sourceType; // "openflow", "p4runtime", "system", ...
    nlohmann::json data;
    std::chrono::system_clock::time_point timestamp;
    uint64_t sequenceNumber = 0;
    EventPriority priority = EventPriority::Low;
    nlohmann::json metadata;
};

using EventPtr = std::shared_ptr<const Event>;

inline void
to_json(nlohmann::json& j, const Event& e)
{
    j = nlohmann::json{{"event_type", e.eventType},
                       {"source_controller", e.sourceController},
                       {"source_type", e.sourceType},
                       {"data", e.data},
                       {"timestamp", utils::toIsoUtc(e.timestamp)},
                       {"sequence_number", e.sequenceNumber},
                       {"priority", static_cast<int>(e.priority)},
                       {"metadata", e.metadata}};
}

/**
 * @brief Conjunction of optional constraints on an event.
 *
 * An empty set matches everything for that field. minPriority defaults to Low, so a
 * default-constructed filter is a wildcard.
 */
struct EventFilter
{
    std::set<std::string> eventTypes;
    std::set<std::string> controllerIds;
    std::set<std::string> sourceTypes;
    EventPriority minPriority = EventPriority::Low;
    std::function<bool(const Event&)> customFilter;

    bool
    matches(const Event& event) const
    {
        if (!eventTypes.empty() && eventTypes.count(event.eventType) == 0)
        {
            return false;
        }
        if (!controllerIds.empty() && controllerIds.count(event.sourceController) == 0)
        {
            return false;
        }
        if (!sourceTypes.empty() && sourceTypes.count(event.sourceType) == 0)
        {
            return false;
        }
        if (static_cast<int>(event.priority) < static_cast<int>(minPriority))
        {
            return false;
        }
        if (customFilter && !customFilter(event))
        {
            return false;
        }
        return true;
    }
};
