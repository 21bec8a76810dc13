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

// orch_core/backend/BackendFactory.hpp
#pragma once

#include "common_types/ControllerTypes.hpp" // for ControllerConfig, ControllerType
#include <functional>                       // for function
#include <map>                              // for map
#include <memory>                           // for shared_ptr
#include <mutex>                            // for mutex

class ControllerBackend;

/**
 * @brief Maps a controller type to the constructor of its backend.
 *
 * create() never throws: an unregistered type or a constructor that throws yields nullptr
 * (logged), which the Controller Manager reports as CONTROLLER_CREATION_FAILED.
 */
class BackendFactory
{
  public:
    using Creator = std::function<std::shared_ptr<ControllerBackend>(const ControllerConfig&)>;

    /// Register (or replace) the constructor for a controller type.
    void registerCreator(ControllerType type, Creator creator);
    bool hasCreator(ControllerType type) const;

    std::shared_ptr<ControllerBackend> create(const ControllerConfig& config) const;

    /// Factory with the built-in backends registered (Ryu REST for ryu_openflow).
    static std::shared_ptr<BackendFactory> withDefaults();

  private:
    mutable std::mutex m_mutex;
    std::map<ControllerType, Creator> m_creators;
};
