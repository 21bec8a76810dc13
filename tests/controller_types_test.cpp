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

#define BOOST_TEST_MODULE Controller types and helpers

#include <stdexcept>
#include <string>

#include <boost/test/unit_test.hpp>

#include "common_types/BackendTypes.hpp"
#include "common_types/ControllerTypes.hpp"
#include "common_types/OrchResult.hpp"
#include "utils/Utils.hpp"

namespace
{
ControllerConfig
validConfig()
{
    ControllerConfig config;
    config.controllerId = "ryu-1";
    config.port = 8080;
    return config;
}
} // namespace

BOOST_AUTO_TEST_SUITE(controller_config_tests)

BOOST_AUTO_TEST_CASE(valid_config_passes)
{
    BOOST_CHECK(!validateControllerConfig(validConfig()).has_value());
}

BOOST_AUTO_TEST_CASE(invalid_fields_are_rejected)
{
    auto config = validConfig();
    config.controllerId = "   ";
    BOOST_CHECK(validateControllerConfig(config).has_value());

    config = validConfig();
    config.port = 0;
    BOOST_CHECK(validateControllerConfig(config).has_value());

    config.port = 65536;
    BOOST_CHECK(validateControllerConfig(config).has_value());

    config = validConfig();
    config.host.clear();
    BOOST_CHECK(validateControllerConfig(config).has_value());

    config = validConfig();
    config.healthCheckTimeout = std::chrono::seconds(0);
    BOOST_CHECK(validateControllerConfig(config).has_value());

    config = validConfig();
    config.maxRetries = -1;
    BOOST_CHECK(validateControllerConfig(config).has_value());

    config = validConfig();
    config.metadata = nlohmann::json::array();
    BOOST_CHECK(validateControllerConfig(config).has_value());
}

BOOST_AUTO_TEST_CASE(controller_type_names)
{
    BOOST_CHECK(controllerTypeFromString("ryu_openflow") == ControllerType::RyuOpenflow);
    BOOST_CHECK(controllerTypeFromString("p4runtime") == ControllerType::P4Runtime);
    BOOST_CHECK(controllerTypeFromString("custom") == ControllerType::Custom);
    BOOST_CHECK_EQUAL(to_string(ControllerType::RyuOpenflow), "ryu_openflow");
    BOOST_CHECK_THROW(controllerTypeFromString("onos"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(config_json_hides_credentials)
{
    auto config = validConfig();
    config.username = "admin";
    config.password = "secret";

    nlohmann::json j = config;
    BOOST_CHECK_EQUAL(j["has_credentials"].get<bool>(), true);
    BOOST_CHECK(!j.contains("password"));
    BOOST_CHECK(j.dump().find("secret") == std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(switch_mapping_tests)

BOOST_AUTO_TEST_CASE(current_must_be_primary_or_backup)
{
    SwitchMapping mapping;
    mapping.switchId = "1";
    mapping.primaryController = "a";
    mapping.backupControllers = {"b", "c"};

    mapping.currentController = "a";
    BOOST_CHECK(mapping.isConsistent());
    mapping.currentController = "c";
    BOOST_CHECK(mapping.isConsistent());
    mapping.currentController = "z";
    BOOST_CHECK(!mapping.isConsistent());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(datapath_id_tests)

BOOST_AUTO_TEST_CASE(dpid_shape)
{
    BOOST_CHECK(utils::isDpidLike("1"));
    BOOST_CHECK(utils::isDpidLike("0000000000000001"));
    BOOST_CHECK(utils::isDpidLike("0x1a"));
    BOOST_CHECK(utils::isDpidLike("0x00000000000000ff"));   // 18 chars
    BOOST_CHECK(!utils::isDpidLike("0x000000000000000ff")); // 19 chars
    BOOST_CHECK(!utils::isDpidLike("leaf-1"));
    BOOST_CHECK(!utils::isDpidLike(""));
}

BOOST_AUTO_TEST_CASE(dpid_parse_and_format)
{
    BOOST_CHECK_EQUAL(utils::parseDpid("26"), 26u);
    BOOST_CHECK_EQUAL(utils::parseDpid("0x1a"), 26u);
    BOOST_CHECK_EQUAL(utils::parseDpid("000000000000001a"), 26u);
    BOOST_CHECK_EQUAL(utils::formatDpid(26), "000000000000001a");
    BOOST_CHECK_THROW(utils::parseDpid("leaf-1"), std::invalid_argument);
    BOOST_CHECK_THROW(utils::parseDpid("0x"), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(orch_result_tests)

BOOST_AUTO_TEST_CASE(success_envelope)
{
    auto result = OrchResult::success({{"switch_id", "1"}}, "done");
    auto j = result.toJson();
    BOOST_CHECK_EQUAL(j["status"].get<std::string>(), "success");
    BOOST_CHECK_EQUAL(j["message"].get<std::string>(), "done");
    BOOST_CHECK_EQUAL(j["data"]["switch_id"].get<std::string>(), "1");
    BOOST_CHECK(j.contains("timestamp"));
    BOOST_CHECK(!j.contains("error_code"));
}

BOOST_AUTO_TEST_CASE(error_envelope)
{
    auto result = OrchResult::error(ErrorCode::NoBackupAvailable, "nothing healthy");
    BOOST_CHECK(!result.ok);
    auto j = result.toJson();
    BOOST_CHECK_EQUAL(j["status"].get<std::string>(), "error");
    BOOST_CHECK_EQUAL(j["error_code"].get<std::string>(), "NO_BACKUP_AVAILABLE");
    BOOST_CHECK(!j.contains("data"));
}

BOOST_AUTO_TEST_CASE(flow_data_p4_marker)
{
    FlowData flow;
    BOOST_CHECK(!flow.hasP4Fields());
    flow.tableName = "";
    BOOST_CHECK(!flow.hasP4Fields());
    flow.actionName = "ingress.forward";
    BOOST_CHECK(flow.hasP4Fields());
}

BOOST_AUTO_TEST_SUITE_END()
