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
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

/**
 * @brief Error codes surfaced to adapters (REST/WebSocket) by every engine operation.
 */
enum class ErrorCode
{
    None,
    ValidationError,
    ControllerExists,
    ControllerCreationFailed,
    ControllerNotFound,
    MappingNotFound,
    ControllerUnhealthy,
    NoBackupAvailable,
    BackendNotAvailable,
    SwitchNotConnected,
    UnsupportedOperation,
    FlowInstallError,
    FlowModifyError,
    FlowDeleteError,
    FlowStatsError,
    PortStatsError,
    PacketOutError,
    ListSwitchesError
};

inline std::string
errorCodeToString(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::None:
        return "NONE";
    case ErrorCode::ValidationError:
        return "VALIDATION_ERROR";
    case ErrorCode::ControllerExists:
        return "CONTROLLER_EXISTS";
    case ErrorCode::ControllerCreationFailed:
        return "CONTROLLER_CREATION_FAILED";
    case ErrorCode::ControllerNotFound:
        return "CONTROLLER_NOT_FOUND";
    case ErrorCode::MappingNotFound:
        return "MAPPING_NOT_FOUND";
    case ErrorCode::ControllerUnhealthy:
        return "CONTROLLER_UNHEALTHY";
    case ErrorCode::NoBackupAvailable:
        return "NO_BACKUP_AVAILABLE";
    case ErrorCode::BackendNotAvailable:
        return "BACKEND_NOT_AVAILABLE";
    case ErrorCode::SwitchNotConnected:
        return "SWITCH_NOT_CONNECTED";
    case ErrorCode::UnsupportedOperation:
        return "UNSUPPORTED_OPERATION";
    case ErrorCode::FlowInstallError:
        return "FLOW_INSTALL_ERROR";
    case ErrorCode::FlowModifyError:
        return "FLOW_MODIFY_ERROR";
    case ErrorCode::FlowDeleteError:
        return "FLOW_DELETE_ERROR";
    case ErrorCode::FlowStatsError:
        return "FLOW_STATS_ERROR";
    case ErrorCode::PortStatsError:
        return "PORT_STATS_ERROR";
    case ErrorCode::PacketOutError:
        return "PACKET_OUT_ERROR";
    case ErrorCode::ListSwitchesError:
        return "LIST_SWITCHES_ERROR";
    }
    return "UNKNOWN_ERROR";
}

/**
 * @brief Tagged success/error result returned across the engine boundary.
 *
 * Engine entry points never let exceptions escape; they return an OrchResult instead.
 * toJson() renders the envelope the adapters send to clients:
 *  - success: {"status": "success", "message": ..., "data": ..., "timestamp": ...}
 *  - error:   {"status": "error", "message": ..., "error_code": ..., "timestamp": ...}
 */
struct OrchResult
{
    bool ok = true;
    ErrorCode errorCode = ErrorCode::None;
    std::string message;
    nlohmann::json data = nlohmann::json::object();

    static OrchResult
    success(nlohmann::json data, std::string message = "Success")
    {
        OrchResult r;
        r.ok = true;
        r.message = std::move(message);
        r.data = std::move(data);
        return r;
    }

    static OrchResult
    error(ErrorCode code, std::string message)
    {
        OrchResult r;
        r.ok = false;
        r.errorCode = code;
        r.message = std::move(message);
        return r;
    }

    std::string
    errorCodeString() const
    {
        return errorCodeToString(errorCode);
    }

    nlohmann::json
    toJson() const
    {
        nlohmann::json j;
        j["status"] = ok ? "success" : "error";
        j["message"] = message;
        j["timestamp"] = utils::getCurrentTimeMillisSystemClock() / 1000.0;
        if (ok)
        {
            j["data"] = data;
        }
        else
        {
            j["error_code"] = errorCodeString();
            if (!data.empty())
            {
                j["details"] = data;
            }
        }
        return j;
    }
};
