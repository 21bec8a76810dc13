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
#include "orch_core/backend/BackendFactory.hpp"
#include "orch_core/backend/ControllerBackend.hpp" // for ControllerBackend
#include "orch_core/backend/RyuRestBackend.hpp"    // for RyuRestBackend
#include "spdlog/spdlog.h"                         // for SPDLOG_LOGGER_*
#include "utils/Logger.hpp"                        // for Logger
#include <exception>                               // for exception
#include <utility>                                 // for move

void
BackendFactory::registerCreator(ControllerType type, Creator creator)
{
    std::lock_guard<std::mutex> lk(m_mutex);
    m_creators[type] = std::move(creator);
    SPDLOG_LOGGER_DEBUG(Logger::instance(), "Registered backend creator for {}", to_string(type));
}

bool
BackendFactory::hasCreator(ControllerType type) const
{
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_creators.count(type) != 0;
}

std::shared_ptr<ControllerBackend>
BackendFactory::create(const ControllerConfig& config) const
{
    Creator creator;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        auto it = m_creators.find(config.controllerType);
        if (it == m_creators.end())
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(),
                                "Unsupported controller type: {}",
                                to_string(config.controllerType));
            return nullptr;
        }
        creator = it->second;
    }

    try
    {
        return creator(config);
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Failed to create backend for {}: {}",
                            config.controllerId,
                            e.what());
        return nullptr;
    }
}

std::shared_ptr<BackendFactory>
BackendFactory::withDefaults()
{
    auto factory = std::make_shared<BackendFactory>();
    factory->registerCreator(ControllerType::RyuOpenflow, [](const ControllerConfig& config) {
        return std::make_shared<RyuRestBackend>(config);
    });
    return factory;
}
