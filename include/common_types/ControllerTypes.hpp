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

#include "utils/Utils.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using SystemTimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Kind of controller backend to instantiate for a registration.
 */
enum class ControllerType
{
    RyuOpenflow,
    P4Runtime,
    Custom
};

/**
 * @brief Lifecycle state of a registered controller.
 *
 * Initializing -> Connected -> {Disconnected, Error}. Connected <-> Maintenance is an
 * administrative transition only.
 */
enum class ControllerStatus
{
    Initializing,
    Connected,
    Disconnected,
    Error,
    Maintenance
};

enum class HealthStatus
{
    Unknown,
    Healthy,
    Degraded,
    Unhealthy
};

inline std::string
to_string(ControllerType t)
{
    switch (t)
    {
    case ControllerType::RyuOpenflow:
        return "ryu_openflow";
    case ControllerType::P4Runtime:
        return "p4runtime";
    case ControllerType::Custom:
        return "custom";
    }
    return "unknown";
}

inline ControllerType
controllerTypeFromString(const std::string& s)
{
    if (s == "ryu_openflow" || s == "openflow")
    {
        return ControllerType::RyuOpenflow;
    }
    if (s == "p4runtime")
    {
        return ControllerType::P4Runtime;
    }
    if (s == "custom")
    {
        return ControllerType::Custom;
    }
    throw std::invalid_argument("Unknown controller type " + s);
}

inline std::string
to_string(ControllerStatus s)
{
    switch (s)
    {
    case ControllerStatus::Initializing:
        return "initializing";
    case ControllerStatus::Connected:
        return "connected";
    case ControllerStatus::Disconnected:
        return "disconnected";
    case ControllerStatus::Error:
        return "error";
    case ControllerStatus::Maintenance:
        return "maintenance";
    }
    return "unknown";
}

inline std::string
to_string(HealthStatus h)
{
    switch (h)
    {
    case HealthStatus::Unknown:
        return "unknown";
    case HealthStatus::Healthy:
        return "healthy";
    case HealthStatus::Degraded:
        return "degraded";
    case HealthStatus::Unhealthy:
        return "unhealthy";
    }
    return "unknown";
}

/**
 * @brief Static registration data for one controller.
 *
 * Validated once by validateControllerConfig() before the registry is touched and
 * never mutated afterwards (re-registration replaces it wholesale).
 */
struct ControllerConfig
{
    std::string controllerId;
    ControllerType controllerType = ControllerType::RyuOpenflow;
    std::string name;
    std::string description;

    // Connection
    std::string host = "localhost";
    int port = 0;
    std::string protocol = "http";

    // Authentication (if required)
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> apiKey;

    // Health monitoring
    std::chrono::seconds healthCheckInterval{30};
    std::chrono::seconds healthCheckTimeout{5};
    int maxRetries = 3;

    // Failover
    std::vector<std::string> backupControllers;
    int priority = 100;

    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Check a controller configuration against its field constraints.
 *
 * @return Error description, or std::nullopt if the configuration is valid.
 */
inline std::optional<std::string>
validateControllerConfig(const ControllerConfig& config)
{
    if (utils::trimCopy(config.controllerId).empty())
    {
        return std::string("Controller ID cannot be empty");
    }
    if (config.port < 1 || config.port > 65535)
    {
        return "Port must be between 1 and 65535 (got " + std::to_string(config.port) + ")";
    }
    if (config.host.empty())
    {
        return std::string("Host cannot be empty");
    }
    if (config.healthCheckInterval.count() <= 0)
    {
        return std::string("Health check interval must be positive");
    }
    if (config.healthCheckTimeout.count() <= 0)
    {
        return std::string("Health check timeout must be positive");
    }
    if (config.maxRetries < 0)
    {
        return std::string("Max retries cannot be negative");
    }
    if (!config.metadata.is_object())
    {
        return std::string("Metadata must be a JSON object");
    }
    return std::nullopt;
}

struct ControllerMetrics
{
    double uptimeSeconds = 0.0;
    uint64_t totalSwitches = 0;
    uint64_t activeFlows = 0;
    uint64_t packetsProcessed = 0;
    uint64_t eventsGenerated = 0;
    std::optional<SystemTimePoint> lastActivity;
    double responseTimeMs = 0.0;
    uint64_t errorCount = 0;
};

/**
 * @brief Registration data plus mutable runtime state of a controller.
 *
 * errorCount counts consecutive failed health checks and drives failover.
 * assignedSwitches lists the switches whose current controller is this one.
 */
struct ControllerInfo
{
    ControllerConfig config;
    ControllerStatus status = ControllerStatus::Initializing;
    HealthStatus healthStatus = HealthStatus::Unknown;

    SystemTimePoint createdAt = std::chrono::system_clock::now();
    std::optional<SystemTimePoint> lastSeen;
    std::optional<SystemTimePoint> lastHealthCheck;

    ControllerMetrics metrics;
    std::vector<std::string> assignedSwitches;

    std::optional<std::string> lastError;
    int errorCount = 0;
};

/**
 * @brief Assignment of a switch to a primary, ordered backups and the active controller.
 */
struct SwitchMapping
{
    std::string switchId;
    std::string primaryController;
    std::vector<std::string> backupControllers;
    std::string currentController;

    SystemTimePoint createdAt = std::chrono::system_clock::now();
    SystemTimePoint lastUpdated = createdAt;
    uint64_t failoverCount = 0;

    bool
    isCandidate(const std::string& controllerId) const
    {
        return controllerId == primaryController ||
               std::find(backupControllers.begin(), backupControllers.end(), controllerId) !=
                   backupControllers.end();
    }

    // current controller must be the primary or one of the backups
    bool
    isConsistent() const
    {
        return isCandidate(currentController);
    }
};

inline nlohmann::json
timeToJson(const std::optional<SystemTimePoint>& tp)
{
    if (!tp)
    {
        return nullptr;
    }
    return utils::toIsoUtc(*tp);
}

inline void
to_json(nlohmann::json& j, const ControllerConfig& c)
{
    // Credentials are reported as present/absent only
    j = nlohmann::json{{"controller_id", c.controllerId},
                       {"controller_type", to_string(c.controllerType)},
                       {"name", c.name},
                       {"description", c.description},
                       {"host", c.host},
                       {"port", c.port},
                       {"protocol", c.protocol},
                       {"has_credentials", c.username.has_value() || c.apiKey.has_value()},
                       {"health_check_interval", c.healthCheckInterval.count()},
                       {"health_check_timeout", c.healthCheckTimeout.count()},
                       {"max_retries", c.maxRetries},
                       {"backup_controllers", c.backupControllers},
                       {"priority", c.priority},
                       {"metadata", c.metadata}};
}

inline void
to_json(nlohmann::json& j, const ControllerMetrics& m)
{
    j = nlohmann::json{{"uptime_seconds", m.uptimeSeconds},
                       {"total_switches", m.totalSwitches},
                       {"active_flows", m.activeFlows},
                       {"packets_processed", m.packetsProcessed},
                       {"events_generated", m.eventsGenerated},
                       {"last_activity", timeToJson(m.lastActivity)},
                       {"response_time_ms", m.responseTimeMs},
                       {"error_count", m.errorCount}};
}

inline void
to_json(nlohmann::json& j, const ControllerInfo& info)
{
    j = nlohmann::json{{"config", info.config},
                       {"status", to_string(info.status)},
                       {"health_status", to_string(info.healthStatus)},
                       {"created_at", utils::toIsoUtc(info.createdAt)},
                       {"last_seen", timeToJson(info.lastSeen)},
                       {"last_health_check", timeToJson(info.lastHealthCheck)},
                       {"metrics", info.metrics},
                       {"assigned_switches", info.assignedSwitches},
                       {"last_error", info.lastError ? nlohmann::json(*info.lastError) : nullptr},
                       {"error_count", info.errorCount}};
}

inline void
to_json(nlohmann::json& j, const SwitchMapping& m)
{
    j = nlohmann::json{{"switch_id", m.switchId},
                       {"primary_controller", m.primaryController},
                       {"backup_controllers", m.backupControllers},
                       {"current_controller", m.currentController},
                       {"created_at", utils::toIsoUtc(m.createdAt)},
                       {"last_updated", utils::toIsoUtc(m.lastUpdated)},
                       {"failover_count", m.failoverCount}};
}
