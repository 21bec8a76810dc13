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
#include "common_types/ControllerTypes.hpp"
#include "event_system/EventStream.hpp"
#include "orch_core/backend/BackendFactory.hpp"
#include "orch_core/backend/ControllerBackend.hpp"
#include "orch_core/controller_management/ControllerManager.hpp"
#include "orch_core/switch_management/SwitchManager.hpp"
#include "spdlog/spdlog.h"
#include "utils/AppConfig.hpp"
#include "utils/Logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

static std::atomic<bool> gShutdownRequested{false};

void
handleSigint(int)
{
    gShutdownRequested.store(true);
}

struct DaemonOptions
{
    std::string ryuHost;
    int ryuPort = 0;
    std::chrono::seconds healthInterval{AppConfig::HEALTH_CHECK_INTERVAL_SECONDS};
};

static void
splitHostPort(const std::string& hostPort, DaemonOptions& opts)
{
    const auto colon = hostPort.rfind(':');
    if (colon == std::string::npos)
    {
        throw std::invalid_argument("Expected host:port, got " + hostPort);
    }
    opts.ryuHost = hostPort.substr(0, colon);
    opts.ryuPort = std::stoi(hostPort.substr(colon + 1));
}

// --log-level / --log-file are consumed by Logger::parse_cli_args
DaemonOptions
parseDaemonArgs(int argc, char* argv[])
{
    DaemonOptions opts;
    splitHostPort(AppConfig::RYU_IP_AND_PORT, opts);
    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--ryu") == 0 && i + 1 < argc)
        {
            splitHostPort(argv[++i], opts);
        }
        else if (std::strcmp(argv[i], "--health-interval") == 0 && i + 1 < argc)
        {
            opts.healthInterval = std::chrono::seconds(std::stoi(argv[++i]));
        }
    }
    return opts;
}

int
main(int argc, char* argv[])
{
    auto cfg = Logger::parse_cli_args(argc, argv);
    Logger::init(cfg);
    SPDLOG_LOGGER_INFO(Logger::instance(), "Logger Loads Successfully! level");

    DaemonOptions opts;
    try
    {
        opts = parseDaemonArgs(argc, argv);
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_CRITICAL(Logger::instance(), "Invalid arguments: {}", e.what());
        return 1;
    }

    std::signal(SIGINT, handleSigint);
    std::signal(SIGTERM, handleSigint);

    auto eventStream = std::make_shared<EventStream>();
    auto factory = BackendFactory::withDefaults();

    ControllerManagerConfig managerConfig;
    managerConfig.healthCheckInterval = opts.healthInterval;
    managerConfig.maxHealthFailures = AppConfig::MAX_HEALTH_FAILURES;
    auto controllerManager = std::make_shared<ControllerManager>(eventStream, factory, managerConfig);

    auto switchManager = std::make_shared<SwitchManager>();

    eventStream->subscribe("daemon_log", [](const Event& event) {
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "event #{} {} from {}: {}",
                            event.sequenceNumber,
                            event.eventType,
                            event.sourceController,
                            event.data.dump());
    });

    EventFilter failoverFilter;
    failoverFilter.minPriority = EventPriority::High;
    eventStream->subscribe(
        "daemon_failover_log",
        [](const Event& event) {
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "{}: {}",
                               event.eventType,
                               event.data.dump());
        },
        failoverFilter);

    eventStream->start();
    controllerManager->start();

    ControllerConfig ryuConfig;
    ryuConfig.controllerId = AppConfig::DEFAULT_RYU_CONTROLLER_ID;
    ryuConfig.controllerType = ControllerType::RyuOpenflow;
    ryuConfig.name = "Ryu";
    ryuConfig.description = "Ryu ofctl_rest at " + opts.ryuHost;
    ryuConfig.host = opts.ryuHost;
    ryuConfig.port = opts.ryuPort;
    ryuConfig.healthCheckInterval = opts.healthInterval;
    ryuConfig.healthCheckTimeout = std::chrono::seconds(AppConfig::HEALTH_CHECK_TIMEOUT_SECONDS);

    OrchResult registered = controllerManager->registerController(ryuConfig);
    if (!registered.ok)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Failed to register {}: [{}] {}",
                            ryuConfig.controllerId,
                            registered.errorCodeString(),
                            registered.message);
    }
    else
    {
        switchManager->registerBackend(SwitchType::OpenFlow,
                                       controllerManager->backend(ryuConfig.controllerId));

        // Put every switch Ryu already knows under its management
        OrchResult listed = switchManager->listAllSwitches();
        if (listed.ok)
        {
            for (const auto& sw : listed.data["switches"])
            {
                const std::string switchId = sw.value("switch_id", std::string());
                if (!switchId.empty())
                {
                    controllerManager->mapSwitch(switchId, ryuConfig.controllerId);
                }
            }
        }
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Controllers: {}",
                           controllerManager->listControllers().toJson().dump());
    }

    while (!gShutdownRequested.load())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    SPDLOG_LOGGER_INFO(Logger::instance(), "Shutdown requested. Cleaning up...");

    controllerManager->stop();
    switchManager->shutdown();
    eventStream->stop();

    SPDLOG_LOGGER_INFO(Logger::instance(), "Event stream stats: {}", eventStream->stats().dump());
    SPDLOG_LOGGER_INFO(Logger::instance(), "All subsystems stopped. Exiting.");

    return 0;
}
