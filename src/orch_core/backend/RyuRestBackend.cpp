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
#include "orch_core/backend/RyuRestBackend.hpp"
#include "spdlog/spdlog.h"  // for SPDLOG_LOGGER_*
#include "utils/Logger.hpp" // for Logger
#include "utils/Utils.hpp"  // for execCommand, shellQuote, parseDpid, formatDpid
#include <exception>        // for exception
#include <sstream>          // for ostringstream
#include <stdexcept>        // for runtime_error
#include <utility>          // for move

using json = nlohmann::json;

RyuRestBackend::RyuRestBackend(ControllerConfig config)
    : ControllerBackend(std::move(config))
{
    m_baseUrl = m_config.protocol + "://" + m_config.host + ":" + std::to_string(m_config.port);
}

RyuRestBackend::~RyuRestBackend()
{
    awaitOutstandingPing();
}

bool
RyuRestBackend::initialize()
{
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "[{}] connecting to Ryu REST API at {}",
                       controllerId(),
                       m_baseUrl);
    try
    {
        HttpResponse resp = request("GET", "/stats/switches");
        if (resp.status != 200)
        {
            setConnected(false);
            recordError("Ryu REST API at " + m_baseUrl + " unreachable (HTTP " +
                        std::to_string(resp.status) + ")");
            return false;
        }

        json dpids = json::parse(resp.body);
        setKnownSwitchCount(dpids.is_array() ? dpids.size() : 0);
        setConnected(true);
        updateActivity();
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "[{}] connected, {} switch(es) attached",
                           controllerId(),
                           knownSwitchCount());
        return true;
    }
    catch (const std::exception& e)
    {
        setConnected(false);
        recordError(std::string("Failed to initialize: ") + e.what());
        return false;
    }
}

void
RyuRestBackend::shutdown()
{
    setConnected(false);
    SPDLOG_LOGGER_INFO(Logger::instance(), "[{}] backend shut down", controllerId());
}

OrchResult
RyuRestBackend::installFlow(const FlowData& flow)
{
    return sendFlowEntry("add", flow, ErrorCode::FlowInstallError);
}

OrchResult
RyuRestBackend::deleteFlow(const FlowData& flow)
{
    return sendFlowEntry("delete", flow, ErrorCode::FlowDeleteError);
}

OrchResult
RyuRestBackend::modifyFlow(const FlowData& flow)
{
    return sendFlowEntry("modify", flow, ErrorCode::FlowModifyError);
}

OrchResult
RyuRestBackend::getFlowStats(const std::string& switchId, std::optional<int> tableId)
{
    try
    {
        const uint64_t dpid = utils::parseDpid(switchId);
        HttpResponse resp;
        if (tableId)
        {
            resp = request("POST",
                           "/stats/flow/" + std::to_string(dpid),
                           json{{"table_id", *tableId}});
        }
        else
        {
            resp = request("GET", "/stats/flow/" + std::to_string(dpid));
        }

        if (resp.status == 404)
        {
            return OrchResult::error(ErrorCode::SwitchNotConnected,
                                     "Switch " + switchId + " not connected");
        }
        if (resp.status != 200)
        {
            return OrchResult::error(ErrorCode::FlowStatsError,
                                     "Flow stats request failed (HTTP " +
                                         std::to_string(resp.status) + ")");
        }

        json body = json::parse(resp.body);
        json flows = body.value(std::to_string(dpid), json::array());
        updateActivity();
        return OrchResult::success(
            {{"dpid", utils::formatDpid(dpid)}, {"flows", flows}, {"flow_count", flows.size()}});
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "[{}] failed to get flow stats for {}: {}",
                            controllerId(),
                            switchId,
                            e.what());
        return OrchResult::error(ErrorCode::FlowStatsError, e.what());
    }
}

OrchResult
RyuRestBackend::getPortStats(const std::string& switchId, std::optional<std::string> portId)
{
    try
    {
        const uint64_t dpid = utils::parseDpid(switchId);
        std::string path = "/stats/port/" + std::to_string(dpid);
        if (portId && !portId->empty())
        {
            path += "/" + *portId;
        }

        HttpResponse resp = request("GET", path);
        if (resp.status == 404)
        {
            return OrchResult::error(ErrorCode::SwitchNotConnected,
                                     "Switch " + switchId + " not connected");
        }
        if (resp.status != 200)
        {
            return OrchResult::error(ErrorCode::PortStatsError,
                                     "Port stats request failed (HTTP " +
                                         std::to_string(resp.status) + ")");
        }

        json body = json::parse(resp.body);
        json ports = body.value(std::to_string(dpid), json::array());
        updateActivity();
        return OrchResult::success(
            {{"dpid", utils::formatDpid(dpid)}, {"ports", ports}, {"port_count", ports.size()}});
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "[{}] failed to get port stats for {}: {}",
                            controllerId(),
                            switchId,
                            e.what());
        return OrchResult::error(ErrorCode::PortStatsError, e.what());
    }
}

OrchResult
RyuRestBackend::sendPacketOut(const PacketData& packet)
{
    SPDLOG_LOGGER_WARN(Logger::instance(),
                       "[{}] packet-out to {} requested, not supported over ofctl_rest",
                       controllerId(),
                       packet.switchId);
    return OrchResult::error(ErrorCode::UnsupportedOperation,
                             "Packet-out is not supported by the Ryu REST backend");
}

std::optional<SwitchInfo>
RyuRestBackend::getSwitchInfo(const std::string& switchId)
{
    const uint64_t dpid = utils::parseDpid(switchId);
    HttpResponse resp = request("GET", "/v1.0/topology/switches/" + utils::formatDpid(dpid));
    if (resp.status != 200)
    {
        throw std::runtime_error("Topology request failed (HTTP " + std::to_string(resp.status) +
                                 ")");
    }

    json switches = json::parse(resp.body);
    if (!switches.is_array() || switches.empty())
    {
        return std::nullopt;
    }
    return toSwitchInfo(switches.front());
}

std::vector<SwitchInfo>
RyuRestBackend::listSwitches()
{
    HttpResponse resp = request("GET", "/v1.0/topology/switches");
    if (resp.status != 200)
    {
        throw std::runtime_error("Topology request failed (HTTP " + std::to_string(resp.status) +
                                 ")");
    }

    std::vector<SwitchInfo> result;
    json switches = json::parse(resp.body);
    if (switches.is_array())
    {
        for (const auto& sw : switches)
        {
            result.push_back(toSwitchInfo(sw));
        }
    }
    setKnownSwitchCount(result.size());
    return result;
}

bool
RyuRestBackend::ping()
{
    try
    {
        HttpResponse resp = request("GET", "/stats/switches");
        if (resp.status != 200)
        {
            return false;
        }
        json dpids = json::parse(resp.body);
        setKnownSwitchCount(dpids.is_array() ? dpids.size() : 0);
        return true;
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "[{}] ping failed: {}", controllerId(), e.what());
        return false;
    }
}

void
RyuRestBackend::handlePacketIn(PacketData packet)
{
    packet.switchType = SwitchType::OpenFlow;
    notifyPacketIn(packet);
}

RyuRestBackend::HttpResponse
RyuRestBackend::request(const std::string& method,
                        const std::string& path,
                        const std::optional<json>& body) const
{
    std::ostringstream cmd;
    cmd << "curl -s -X " << method << " --max-time " << m_config.healthCheckTimeout.count()
        << " -w '\\n%{http_code}' ";
    if (m_config.username && m_config.password)
    {
        cmd << "-u " << utils::shellQuote(*m_config.username + ":" + *m_config.password) << " ";
    }
    if (m_config.apiKey)
    {
        cmd << "-H " << utils::shellQuote("Authorization: Bearer " + *m_config.apiKey) << " ";
    }
    if (body)
    {
        cmd << "-H \"Content-Type: application/json\" -d " << utils::shellQuote(body->dump())
            << " ";
    }
    cmd << utils::shellQuote(m_baseUrl + path);

    SPDLOG_LOGGER_TRACE(Logger::instance(), "execCommand: {} {}", method, m_baseUrl + path);
    const std::string raw = utils::execCommand(cmd.str());

    // Last line carries the status code written by -w
    HttpResponse resp;
    const auto pos = raw.rfind('\n');
    const std::string statusText = utils::trimCopy(pos == std::string::npos ? raw
                                                                            : raw.substr(pos + 1));
    resp.body = pos == std::string::npos ? std::string() : raw.substr(0, pos);
    try
    {
        resp.status = std::stoi(statusText);
    }
    catch (const std::exception&)
    {
        resp.status = 0;
    }
    return resp;
}

OrchResult
RyuRestBackend::sendFlowEntry(const std::string& command,
                              const FlowData& flow,
                              ErrorCode failureCode)
{
    try
    {
        const uint64_t dpid = utils::parseDpid(flow.switchId);
        json entry = toFlowEntry(flow, dpid);

        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "[{}] flowentry/{}: {}",
                           controllerId(),
                           command,
                           entry.dump());
        HttpResponse resp = request("POST", "/stats/flowentry/" + command, entry);
        if (resp.status == 404)
        {
            return OrchResult::error(ErrorCode::SwitchNotConnected,
                                     "Switch " + flow.switchId + " not connected");
        }
        if (resp.status != 200)
        {
            const std::string error = "Ryu rejected flowentry/" + command + " (HTTP " +
                                      std::to_string(resp.status) + "): " + resp.body;
            recordError(error);
            return OrchResult::error(failureCode, error);
        }

        if (command == "add")
        {
            incrementFlowCount();
        }
        else
        {
            updateActivity();
        }

        const std::string verb =
            command == "add" ? "installed" : (command == "delete" ? "deleted" : "modified");
        return OrchResult::success(
            {{"dpid", utils::formatDpid(dpid)}, {"action", verb}, {"flow_spec", entry}},
            "Flow rule " + verb + " successfully");
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "[{}] flowentry/{} on {} failed: {}",
                            controllerId(),
                            command,
                            flow.switchId,
                            e.what());
        return OrchResult::error(failureCode, e.what());
    }
}

json
RyuRestBackend::toFlowEntry(const FlowData& flow, uint64_t dpid) const
{
    json entry;
    entry["dpid"] = dpid;
    entry["priority"] = flow.priority;
    entry["match"] = flow.matchFields;
    entry["actions"] = flow.actions;
    if (flow.tableId)
    {
        entry["table_id"] = *flow.tableId;
    }
    if (flow.cookie)
    {
        entry["cookie"] = *flow.cookie;
    }
    if (flow.idleTimeout != 0)
    {
        entry["idle_timeout"] = flow.idleTimeout;
    }
    if (flow.hardTimeout != 0)
    {
        entry["hard_timeout"] = flow.hardTimeout;
    }
    return entry;
}

SwitchInfo
RyuRestBackend::toSwitchInfo(const json& topologySwitch) const
{
    SwitchInfo info;
    info.switchId = topologySwitch.value("dpid", std::string());
    info.switchType = SwitchType::OpenFlow;
    info.connected = true;
    info.address = m_config.host;
    info.port = m_config.port;
    info.capabilities = {{"ports", topologySwitch.value("ports", json::array())}};
    info.metadata = {{"controller_id", controllerId()}};
    return info;
}
