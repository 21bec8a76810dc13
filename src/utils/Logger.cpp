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
#include "utils/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h> // for rotating_file_sink_mt
#include <spdlog/sinks/stdout_color_sinks.h> // for stdout_color_sink_mt
#include <atomic>                            // for atomic_load, atomic_store
#include <cstring>                           // for strcmp
#include <vector>                            // for vector

static constexpr const char* LOGGER_NAME = "sdn_orchestrator";
static constexpr size_t LOG_FILE_MAX_BYTES = 10 * 1024 * 1024;
static constexpr size_t LOG_FILE_MAX_FILES = 5;

std::shared_ptr<spdlog::logger> Logger::m_logger;

spdlog::level::level_enum
Logger::parse_level(const std::string& name)
{
    if (name == "trace")
    {
        return spdlog::level::trace;
    }
    if (name == "debug")
    {
        return spdlog::level::debug;
    }
    if (name == "info")
    {
        return spdlog::level::info;
    }
    if (name == "warn" || name == "warning")
    {
        return spdlog::level::warn;
    }
    if (name == "err" || name == "error")
    {
        return spdlog::level::err;
    }
    if (name == "critical")
    {
        return spdlog::level::critical;
    }
    if (name == "off")
    {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogConfig
Logger::parse_cli_args(int argc, char* argv[])
{
    LogConfig cfg;
    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc)
        {
            cfg.level = parse_level(argv[++i]);
        }
        else if (std::strcmp(argv[i], "--log-file") == 0)
        {
            cfg.enableFile = true;
            // Optional path argument
            if (i + 1 < argc && argv[i + 1][0] != '-')
            {
                cfg.filePath = argv[++i];
            }
        }
    }
    return cfg;
}

void
Logger::init(const LogConfig& cfg)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (cfg.enableFile)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.filePath,
                                                                              LOG_FILE_MAX_BYTES,
                                                                              LOG_FILE_MAX_FILES));
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] [%s:%#] %v");
    logger->set_level(cfg.level);
    logger->flush_on(spdlog::level::warn);

    std::atomic_store(&m_logger, logger);
}

std::shared_ptr<spdlog::logger>
Logger::instance()
{
    auto logger = std::atomic_load(&m_logger);
    if (logger)
    {
        return logger;
    }

    // Not initialized yet: install a console logger with default settings
    auto fallback = std::make_shared<spdlog::logger>(
        LOGGER_NAME,
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    fallback->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] [%s:%#] %v");
    std::shared_ptr<spdlog::logger> expected;
    if (std::atomic_compare_exchange_strong(&m_logger, &expected, fallback))
    {
        return fallback;
    }
    return expected;
}
