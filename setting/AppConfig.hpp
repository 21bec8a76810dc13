#pragma once
#include <string>

namespace AppConfig {
    static const std::string RYU_IP_AND_PORT = "127.0.0.1:8080";
    static const std::string DEFAULT_RYU_CONTROLLER_ID = "ryu-primary";
    static const std::string LOG_FILE = "logs/sdn_orchestrator.log";
    static constexpr int HEALTH_CHECK_INTERVAL_SECONDS = 30;
    static constexpr int HEALTH_CHECK_TIMEOUT_SECONDS = 5;
    static constexpr int MAX_HEALTH_FAILURES = 3;
}
