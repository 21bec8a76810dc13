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

#define BOOST_TEST_MODULE Controller backend testcases

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/test/unit_test.hpp>

#include "MockBackend.hpp"
#include "orch_core/backend/BackendFactory.hpp"
#include "orch_core/backend/RyuRestBackend.hpp"

using namespace std::chrono_literals;

BOOST_AUTO_TEST_SUITE(health_check_tests)

BOOST_AUTO_TEST_CASE(connected_backend_is_healthy)
{
    MockBackend backend(mockControllerConfig("c1"));
    BOOST_REQUIRE(backend.initialize());

    auto health = backend.healthCheck(1000ms);
    BOOST_CHECK(health.isHealthy);
    BOOST_CHECK_EQUAL(health.errorCount, 0u);
    BOOST_CHECK(!health.lastError.has_value());
    BOOST_CHECK(health.lastCheck.has_value());
    BOOST_CHECK_EQUAL(health.details["controller_id"].get<std::string>(), "c1");
    BOOST_CHECK_EQUAL(health.details["connected"].get<bool>(), true);
}

BOOST_AUTO_TEST_CASE(disconnected_backend_is_unhealthy)
{
    MockBackend backend(mockControllerConfig("c1"));

    // Ping succeeds but initialize() never ran
    auto health = backend.healthCheck(1000ms);
    BOOST_CHECK(!health.isHealthy);
    BOOST_CHECK_EQUAL(health.errorCount, 1u);
    BOOST_REQUIRE(health.lastError.has_value());
    BOOST_CHECK_EQUAL(*health.lastError, "Ping failed or not connected");

    backend.healthCheck(1000ms);
    BOOST_CHECK_EQUAL(backend.healthStatus().errorCount, 2u);
}

BOOST_AUTO_TEST_CASE(failed_ping_is_unhealthy)
{
    MockBackend backend(mockControllerConfig("c1"));
    BOOST_REQUIRE(backend.initialize());
    backend.pingResult = false;

    auto health = backend.healthCheck(1000ms);
    BOOST_CHECK(!health.isHealthy);
    BOOST_CHECK_EQUAL(health.errorCount, 1u);

    backend.resetErrorCount();
    BOOST_CHECK_EQUAL(backend.healthStatus().errorCount, 0u);
    BOOST_CHECK(!backend.healthStatus().lastError.has_value());
}

BOOST_AUTO_TEST_CASE(slow_ping_times_out_without_stacking)
{
    MockBackend backend(mockControllerConfig("c1"));
    BOOST_REQUIRE(backend.initialize());
    backend.pingDelayMs = 600;

    const auto started = std::chrono::steady_clock::now();
    auto health = backend.healthCheck(100ms);
    BOOST_CHECK(std::chrono::steady_clock::now() - started < 500ms);
    BOOST_CHECK(!health.isHealthy);
    BOOST_REQUIRE(health.lastError.has_value());
    BOOST_CHECK_EQUAL(*health.lastError, "Ping timed out after 100 ms");

    // First ping is still sleeping
    health = backend.healthCheck(100ms);
    BOOST_CHECK(!health.isHealthy);
    BOOST_REQUIRE(health.lastError.has_value());
    BOOST_CHECK_EQUAL(*health.lastError, "Previous ping still outstanding");
    BOOST_CHECK_EQUAL(health.errorCount, 2u);

    backend.pingDelayMs = 0;
    backend.awaitOutstandingPing();

    health = backend.healthCheck(1000ms);
    BOOST_CHECK(health.isHealthy);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(packet_in_tests)

BOOST_AUTO_TEST_CASE(throwing_handler_does_not_block_others)
{
    MockBackend backend(mockControllerConfig("c1"));
    int delivered = 0;

    backend.subscribePacketIn([](const PacketData&) { throw std::runtime_error("handler bug"); });
    const uint64_t token = backend.subscribePacketIn([&delivered](const PacketData& packet) {
        BOOST_CHECK_EQUAL(packet.switchId, "0000000000000001");
        BOOST_CHECK(packet.switchType == SwitchType::OpenFlow);
        delivered++;
    });

    PacketData packet;
    packet.switchId = "0000000000000001";
    packet.payload = {0xde, 0xad};
    backend.injectPacketIn(packet);

    BOOST_CHECK_EQUAL(delivered, 1);
    BOOST_CHECK_EQUAL(backend.packetCount(), 1u);
    BOOST_CHECK(backend.lastActivity().has_value());

    BOOST_CHECK_EQUAL(backend.packetInHandlerCount(), 2u);
    BOOST_CHECK(backend.unsubscribePacketIn(token));
    BOOST_CHECK(!backend.unsubscribePacketIn(token));
    BOOST_CHECK_EQUAL(backend.packetInHandlerCount(), 1u);
    backend.injectPacketIn(packet);
    BOOST_CHECK_EQUAL(delivered, 1);
    BOOST_CHECK_EQUAL(backend.packetCount(), 2u);
}

BOOST_AUTO_TEST_CASE(controller_info_snapshot)
{
    MockBackend backend(mockControllerConfig("c1"));
    BOOST_REQUIRE(backend.initialize());

    FlowData flow;
    flow.switchId = "1";
    BOOST_CHECK(backend.installFlow(flow).ok);

    auto info = backend.controllerInfo();
    BOOST_CHECK_EQUAL(info["controller_id"].get<std::string>(), "c1");
    BOOST_CHECK_EQUAL(info["controller_type"].get<std::string>(), "custom");
    BOOST_CHECK_EQUAL(info["switch_type"].get<std::string>(), "openflow");
    BOOST_CHECK_EQUAL(info["connected"].get<bool>(), true);
    BOOST_CHECK(info["health"].contains("is_healthy"));
    BOOST_CHECK_EQUAL(info["statistics"]["flow_count"].get<uint64_t>(), 1u);
    BOOST_CHECK(!info["statistics"]["last_activity"].is_null());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ryu_backend_tests)

BOOST_AUTO_TEST_CASE(base_url_from_config)
{
    ControllerConfig config;
    config.controllerId = "ryu";
    config.host = "10.10.10.1";
    config.port = 8080;
    RyuRestBackend backend(config);

    BOOST_CHECK_EQUAL(backend.baseUrl(), "http://10.10.10.1:8080");
    BOOST_CHECK(backend.switchType() == SwitchType::OpenFlow);
    BOOST_CHECK(!backend.isConnected());
}

BOOST_AUTO_TEST_CASE(packet_out_is_unsupported)
{
    ControllerConfig config;
    config.controllerId = "ryu";
    config.port = 8080;
    RyuRestBackend backend(config);

    PacketData packet;
    packet.switchId = "1";
    auto result = backend.sendPacketOut(packet);
    BOOST_CHECK(!result.ok);
    BOOST_CHECK(result.errorCode == ErrorCode::UnsupportedOperation);
}

BOOST_AUTO_TEST_CASE(invalid_dpid_rejected_before_any_request)
{
    ControllerConfig config;
    config.controllerId = "ryu";
    config.port = 8080;
    RyuRestBackend backend(config);

    FlowData flow;
    flow.switchId = "leaf-1";
    auto installed = backend.installFlow(flow);
    BOOST_CHECK(!installed.ok);
    BOOST_CHECK(installed.errorCode == ErrorCode::FlowInstallError);

    auto deleted = backend.deleteFlow(flow);
    BOOST_CHECK(deleted.errorCode == ErrorCode::FlowDeleteError);

    auto modified = backend.modifyFlow(flow);
    BOOST_CHECK(modified.errorCode == ErrorCode::FlowModifyError);
}

BOOST_AUTO_TEST_CASE(relayed_packet_in_is_tagged_openflow)
{
    ControllerConfig config;
    config.controllerId = "ryu";
    config.port = 8080;
    RyuRestBackend backend(config);

    SwitchType seen = SwitchType::Unknown;
    backend.subscribePacketIn([&seen](const PacketData& packet) { seen = packet.switchType; });

    PacketData packet;
    packet.switchId = "1";
    packet.switchType = SwitchType::P4Runtime;
    backend.handlePacketIn(packet);
    BOOST_CHECK(seen == SwitchType::OpenFlow);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(backend_factory_tests)

BOOST_AUTO_TEST_CASE(defaults_build_ryu_backend)
{
    auto factory = BackendFactory::withDefaults();
    BOOST_CHECK(factory->hasCreator(ControllerType::RyuOpenflow));
    BOOST_CHECK(!factory->hasCreator(ControllerType::P4Runtime));

    ControllerConfig config;
    config.controllerId = "ryu";
    config.port = 8080;
    auto backend = factory->create(config);
    BOOST_REQUIRE(backend);
    BOOST_CHECK(std::dynamic_pointer_cast<RyuRestBackend>(backend) != nullptr);
    BOOST_CHECK_EQUAL(backend->controllerId(), "ryu");
}

BOOST_AUTO_TEST_CASE(unknown_type_yields_null)
{
    auto factory = BackendFactory::withDefaults();
    ControllerConfig config;
    config.controllerId = "p4";
    config.controllerType = ControllerType::P4Runtime;
    config.port = 9559;
    BOOST_CHECK(factory->create(config) == nullptr);
}

BOOST_AUTO_TEST_CASE(throwing_creator_yields_null)
{
    BackendFactory factory;
    factory.registerCreator(ControllerType::Custom,
                            [](const ControllerConfig&) -> std::shared_ptr<ControllerBackend> {
                                throw std::runtime_error("cannot build");
                            });
    BOOST_CHECK(factory.create(mockControllerConfig("c1")) == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()
