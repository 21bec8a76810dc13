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

#define BOOST_TEST_MODULE Controller manager testcases

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "MockBackend.hpp"
#include "event_system/EventStream.hpp"
#include "orch_core/controller_management/ControllerManager.hpp"

using namespace std::chrono_literals;

namespace
{
struct Collector
{
    std::mutex mutex;
    std::vector<Event> events;

    EventStream::Callback
    callback()
    {
        return [this](const Event& e) {
            std::lock_guard<std::mutex> lk(mutex);
            events.push_back(e);
        };
    }

    std::vector<Event>
    snapshot()
    {
        std::lock_guard<std::mutex> lk(mutex);
        return events;
    }
};

// Started event stream + manager over mock backends
struct Harness
{
    explicit Harness(int maxHealthFailures = 3)
        : registry(std::make_shared<MockRegistry>())
    {
        EventStreamConfig streamConfig;
        streamConfig.dequeueTimeout = 50ms;
        stream = std::make_shared<EventStream>(streamConfig);
        stream->start();

        ControllerManagerConfig config;
        config.healthCheckInterval = 1s;
        config.maxHealthFailures = maxHealthFailures;
        manager = std::make_shared<ControllerManager>(stream, makeMockFactory(registry), config);
    }

    ~Harness()
    {
        manager->stop();
        stream->stop();
    }

    void
    addControllers(const std::vector<std::string>& ids)
    {
        int port = 6653;
        for (const auto& id : ids)
        {
            BOOST_REQUIRE(manager->registerController(mockControllerConfig(id, port++)).ok);
        }
    }

    std::shared_ptr<MockBackend>
    mock(const std::string& id) const
    {
        auto backend = registry->get(id);
        BOOST_REQUIRE(backend);
        return backend;
    }

    void
    drain()
    {
        BOOST_REQUIRE_MESSAGE(stream->waitUntilIdle(5s), "event stream did not drain");
    }

    std::shared_ptr<MockRegistry> registry;
    std::shared_ptr<EventStream> stream;
    std::shared_ptr<ControllerManager> manager;
};

EventFilter
typeFilter(const std::string& eventType)
{
    EventFilter filter;
    filter.eventTypes = {eventType};
    return filter;
}
} // namespace

BOOST_AUTO_TEST_SUITE(registration_tests)

BOOST_AUTO_TEST_CASE(register_starts_controller)
{
    Collector registered;
    Harness h;
    h.stream->subscribe("registered",
                        registered.callback(),
                        typeFilter(event_names::CONTROLLER_REGISTERED));

    auto result = h.manager->registerController(mockControllerConfig("c1"));
    BOOST_REQUIRE(result.ok);
    BOOST_CHECK_EQUAL(result.data["controller_id"].get<std::string>(), "c1");
    BOOST_CHECK_EQUAL(result.data["status"].get<std::string>(), "registered");
    BOOST_CHECK_EQUAL(result.data["controller_info"]["status"].get<std::string>(), "connected");
    BOOST_CHECK_EQUAL(h.mock("c1")->initializeCalls.load(), 1);

    h.drain();
    auto events = registered.snapshot();
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK_EQUAL(events[0].sourceController, "controller_manager");
    BOOST_CHECK_EQUAL(events[0].sourceType, "system");
    BOOST_CHECK_EQUAL(events[0].data["controller_id"].get<std::string>(), "c1");
}

BOOST_AUTO_TEST_CASE(duplicate_ids_are_rejected)
{
    Harness h;
    BOOST_REQUIRE(h.manager->registerController(mockControllerConfig("c1")).ok);

    auto dup = h.manager->registerController(mockControllerConfig("c1", 7000));
    BOOST_CHECK(dup.errorCode == ErrorCode::ControllerExists);

    auto padded = h.manager->registerController(mockControllerConfig("  c1 ", 7001));
    BOOST_CHECK(padded.errorCode == ErrorCode::ControllerExists);

    BOOST_CHECK_EQUAL(h.manager->stats()["total_controllers"].get<size_t>(), 1u);
}

BOOST_AUTO_TEST_CASE(invalid_config_is_rejected)
{
    Harness h;
    auto config = mockControllerConfig("c1");
    config.port = 0;
    auto result = h.manager->registerController(config);
    BOOST_CHECK(!result.ok);
    BOOST_CHECK(result.errorCode == ErrorCode::ValidationError);
    BOOST_CHECK(!h.manager->controllerInfo("c1").has_value());
}

BOOST_AUTO_TEST_CASE(unsupported_type_fails_creation)
{
    Harness h;
    auto config = mockControllerConfig("p4");
    config.controllerType = ControllerType::P4Runtime;
    auto result = h.manager->registerController(config);
    BOOST_CHECK(result.errorCode == ErrorCode::ControllerCreationFailed);
    BOOST_CHECK(!h.manager->controllerInfo("p4").has_value());
}

BOOST_AUTO_TEST_CASE(failed_start_keeps_registration)
{
    Harness h;
    BOOST_REQUIRE(h.manager->registerController(mockControllerConfig("c1"), false).ok);

    auto info = h.manager->controllerInfo("c1");
    BOOST_REQUIRE(info);
    BOOST_CHECK(info->status == ControllerStatus::Initializing);

    h.mock("c1")->initializeResult = false;
    auto started = h.manager->startController("c1");
    BOOST_CHECK(started.errorCode == ErrorCode::BackendNotAvailable);

    info = h.manager->controllerInfo("c1");
    BOOST_REQUIRE(info);
    BOOST_CHECK(info->status == ControllerStatus::Error);
    BOOST_REQUIRE(info->lastError.has_value());
    BOOST_CHECK_EQUAL(*info->lastError, "scripted initialize failure");
    BOOST_CHECK_EQUAL(h.manager->stats()["failed_controllers"].get<uint64_t>(), 1u);

    h.mock("c1")->initializeResult = true;
    BOOST_CHECK(h.manager->startController("c1").ok);
    BOOST_CHECK(h.manager->controllerInfo("c1")->status == ControllerStatus::Connected);
}

BOOST_AUTO_TEST_CASE(unknown_controller_operations)
{
    Harness h;
    BOOST_CHECK(h.manager->startController("ghost").errorCode == ErrorCode::ControllerNotFound);
    BOOST_CHECK(h.manager->stopController("ghost").errorCode == ErrorCode::ControllerNotFound);
    BOOST_CHECK(h.manager->deregisterController("ghost").errorCode ==
                ErrorCode::ControllerNotFound);
    BOOST_CHECK(h.manager->setMaintenance("ghost", true).errorCode ==
                ErrorCode::ControllerNotFound);
    BOOST_CHECK(h.manager->backend("ghost") == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(mapping_tests)

BOOST_AUTO_TEST_CASE(map_switch_validation)
{
    Harness h;
    h.addControllers({"a", "b"});

    BOOST_CHECK(h.manager->mapSwitch("  ", "a").errorCode == ErrorCode::ValidationError);
    BOOST_CHECK(h.manager->mapSwitch("s1", "ghost").errorCode == ErrorCode::ControllerNotFound);
    BOOST_CHECK(h.manager->mapSwitch("s1", "a", {"b", "ghost"}).errorCode ==
                ErrorCode::ControllerNotFound);
    BOOST_CHECK(!h.manager->switchMapping("s1").has_value());
}

BOOST_AUTO_TEST_CASE(map_switch_assigns_primary)
{
    Collector mapped;
    Harness h;
    h.stream->subscribe("mapped", mapped.callback(), typeFilter(event_names::SWITCH_MAPPED));
    h.addControllers({"a", "b"});

    auto result = h.manager->mapSwitch("s1", "a", {"b", "a", "b"});
    BOOST_REQUIRE(result.ok);
    BOOST_CHECK_EQUAL(result.data["mapping"]["current_controller"].get<std::string>(), "a");

    auto mapping = h.manager->switchMapping("s1");
    BOOST_REQUIRE(mapping);
    BOOST_CHECK_EQUAL(mapping->currentController, "a");
    BOOST_REQUIRE_EQUAL(mapping->backupControllers.size(), 1u);
    BOOST_CHECK_EQUAL(mapping->backupControllers[0], "b");
    BOOST_CHECK(mapping->isConsistent());

    BOOST_CHECK(h.manager->controllerForSwitch("s1") == h.manager->backend("a"));
    BOOST_CHECK(h.manager->controllerForSwitch("s9") == nullptr);

    auto info = h.manager->controllerInfo("a");
    BOOST_REQUIRE(info);
    BOOST_REQUIRE_EQUAL(info->assignedSwitches.size(), 1u);
    BOOST_CHECK_EQUAL(info->assignedSwitches[0], "s1");
    BOOST_CHECK(h.manager->controllerInfo("b")->assignedSwitches.empty());

    h.drain();
    auto events = mapped.snapshot();
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK_EQUAL(events[0].data["primary_controller"].get<std::string>(), "a");
    BOOST_CHECK_EQUAL(events[0].data["backup_controllers"].size(), 1u);

    auto listed = h.manager->listSwitchMappings();
    BOOST_CHECK_EQUAL(listed.data["total_count"].get<size_t>(), 1u);
    BOOST_CHECK(listed.data["mappings"].contains("s1"));
}

BOOST_AUTO_TEST_CASE(deregistration_cleans_mappings)
{
    Collector deregistered;
    Harness h;
    h.stream->subscribe("deregistered",
                        deregistered.callback(),
                        typeFilter(event_names::CONTROLLER_DEREGISTERED));
    h.addControllers({"a", "b", "c"});
    h.manager->runHealthChecks();

    BOOST_REQUIRE(h.manager->mapSwitch("s1", "a", {"b", "c"}).ok);
    BOOST_REQUIRE(h.manager->mapSwitch("s2", "b", {"a"}).ok);
    BOOST_REQUIRE(h.manager->mapSwitch("s3", "c", {"b"}).ok);
    BOOST_REQUIRE(h.manager->manualFailover("s3", std::string("b")).ok);

    auto mockB = h.mock("b");
    BOOST_REQUIRE(h.manager->deregisterController("b").ok);
    BOOST_CHECK_EQUAL(mockB->shutdownCalls.load(), 1);

    BOOST_CHECK(!h.manager->controllerInfo("b").has_value());
    BOOST_CHECK(!h.manager->switchMapping("s2").has_value()); // primary was b
    BOOST_CHECK(!h.manager->switchMapping("s3").has_value()); // current was b

    auto s1 = h.manager->switchMapping("s1");
    BOOST_REQUIRE(s1);
    BOOST_REQUIRE_EQUAL(s1->backupControllers.size(), 1u);
    BOOST_CHECK_EQUAL(s1->backupControllers[0], "c");
    BOOST_CHECK(s1->isConsistent());

    BOOST_CHECK(h.manager->deregisterController("b").errorCode == ErrorCode::ControllerNotFound);

    h.drain();
    auto events = deregistered.snapshot();
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK_EQUAL(events[0].data["controller_id"].get<std::string>(), "b");
}

BOOST_AUTO_TEST_CASE(deregistering_failed_controller_detaches_packet_in)
{
    Collector packets;
    Harness h(1);
    h.stream->subscribe("packets", packets.callback(), typeFilter(event_names::PACKET_IN));
    h.addControllers({"a"});
    h.manager->runHealthChecks();

    auto held = h.mock("a");
    held->pingResult = false;
    h.manager->runHealthChecks();
    BOOST_REQUIRE(h.manager->controllerInfo("a")->status == ControllerStatus::Error);
    BOOST_CHECK_EQUAL(held->packetInHandlerCount(), 1u);

    BOOST_REQUIRE(h.manager->deregisterController("a").ok);
    BOOST_CHECK_EQUAL(held->shutdownCalls.load(), 1);
    BOOST_CHECK_EQUAL(held->packetInHandlerCount(), 0u);

    PacketData packet;
    packet.switchId = "0000000000000001";
    held->injectPacketIn(packet);
    h.drain();
    BOOST_CHECK(packets.snapshot().empty());
}

BOOST_AUTO_TEST_CASE(backends_outlive_destroyed_manager)
{
    auto registry = std::make_shared<MockRegistry>();
    EventStreamConfig streamConfig;
    streamConfig.dequeueTimeout = 50ms;
    auto stream = std::make_shared<EventStream>(streamConfig);
    stream->start();

    std::shared_ptr<MockBackend> deregistered;
    std::shared_ptr<MockBackend> failed;
    {
        ControllerManagerConfig config;
        config.maxHealthFailures = 1;
        ControllerManager manager(stream, makeMockFactory(registry), config);
        BOOST_REQUIRE(manager.registerController(mockControllerConfig("a", 6653)).ok);
        BOOST_REQUIRE(manager.registerController(mockControllerConfig("b", 6654)).ok);
        deregistered = registry->get("a");
        failed = registry->get("b");
        BOOST_REQUIRE(deregistered && failed);

        deregistered->pingResult = false;
        failed->pingResult = false;
        manager.runHealthChecks();
        BOOST_REQUIRE(manager.controllerInfo("b")->status == ControllerStatus::Error);
        BOOST_REQUIRE(manager.deregisterController("a").ok);
    }

    // Nothing may call back into the destroyed manager
    BOOST_CHECK_EQUAL(deregistered->packetInHandlerCount(), 0u);
    BOOST_CHECK_EQUAL(failed->packetInHandlerCount(), 0u);
    BOOST_CHECK_EQUAL(failed->shutdownCalls.load(), 1);

    PacketData packet;
    packet.switchId = "0000000000000001";
    deregistered->injectPacketIn(packet);
    failed->injectPacketIn(packet);
    BOOST_CHECK_EQUAL(failed->packetCount(), 1u);
    stream->stop();
}

BOOST_AUTO_TEST_CASE(no_mapping_outlives_its_controller)
{
    Harness h;
    h.addControllers({"a", "b"});
    BOOST_REQUIRE(h.manager->mapSwitch("s1", "a", {"b"}).ok);
    BOOST_REQUIRE(h.manager->mapSwitch("s2", "b", {"a"}).ok);

    std::thread remapper([&h] {
        for (int i = 0; i < 200; ++i)
        {
            h.manager->mapSwitch("s" + std::to_string(i % 5), "a", {"b"});
        }
    });
    BOOST_REQUIRE(h.manager->deregisterController("a").ok);
    remapper.join();

    auto listed = h.manager->listSwitchMappings();
    for (const auto& item : listed.data["mappings"].items())
    {
        const auto& mapping = item.value();
        BOOST_CHECK_NE(mapping["primary_controller"].get<std::string>(), "a");
        BOOST_CHECK_NE(mapping["current_controller"].get<std::string>(), "a");
        for (const auto& backup : mapping["backup_controllers"])
        {
            BOOST_CHECK_NE(backup.get<std::string>(), "a");
        }
    }
    BOOST_CHECK(h.manager->mapSwitch("s1", "a").errorCode == ErrorCode::ControllerNotFound);
    BOOST_CHECK(h.manager->mapSwitch("s1", "b", {"a"}).errorCode ==
                ErrorCode::ControllerNotFound);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(failover_tests)

BOOST_AUTO_TEST_CASE(failover_skips_unhealthy_backup)
{
    Collector failovers;
    Harness h(1);
    h.stream->subscribe("failovers", failovers.callback(), typeFilter(event_names::SWITCH_FAILOVER));
    h.addControllers({"a", "b", "c"});
    BOOST_CHECK_EQUAL(h.manager->runHealthChecks(), 3u);
    BOOST_REQUIRE(h.manager->mapSwitch("s1", "a", {"b", "c"}).ok);

    h.mock("a")->pingResult = false;
    h.mock("b")->pingResult = false;
    h.manager->runHealthChecks();

    auto mapping = h.manager->switchMapping("s1");
    BOOST_REQUIRE(mapping);
    BOOST_CHECK_EQUAL(mapping->currentController, "c");
    BOOST_CHECK_EQUAL(mapping->failoverCount, 1u);
    BOOST_CHECK(mapping->isConsistent());
    BOOST_CHECK(h.manager->controllerInfo("a")->status == ControllerStatus::Error);

    h.drain();
    auto events = failovers.snapshot();
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK(events[0].priority == EventPriority::High);
    BOOST_CHECK_EQUAL(events[0].data["switch_id"].get<std::string>(), "s1");
    BOOST_CHECK_EQUAL(events[0].data["failed_controller"].get<std::string>(), "a");
    BOOST_CHECK_EQUAL(events[0].data["new_controller"].get<std::string>(), "c");
    BOOST_CHECK_EQUAL(events[0].data["failover_count"].get<uint64_t>(), 1u);

    auto stats = h.manager->stats();
    BOOST_CHECK_EQUAL(stats["failover_count"].get<uint64_t>(), 1u);
    BOOST_CHECK_EQUAL(stats["failed_controllers"].get<uint64_t>(), 2u);
}

BOOST_AUTO_TEST_CASE(failover_waits_for_threshold)
{
    Harness h(3);
    h.addControllers({"a", "b"});
    h.manager->runHealthChecks();
    BOOST_REQUIRE(h.manager->mapSwitch("s1", "a", {"b"}).ok);

    h.mock("a")->pingResult = false;
    h.manager->runHealthChecks();
    h.manager->runHealthChecks();

    auto info = h.manager->controllerInfo("a");
    BOOST_REQUIRE(info);
    BOOST_CHECK_EQUAL(info->errorCount, 2);
    BOOST_CHECK(info->status == ControllerStatus::Connected);
    BOOST_CHECK(info->healthStatus == HealthStatus::Unhealthy);
    BOOST_CHECK_EQUAL(h.manager->switchMapping("s1")->currentController, "a");

    h.manager->runHealthChecks();
    BOOST_CHECK(h.manager->controllerInfo("a")->status == ControllerStatus::Error);
    BOOST_CHECK_EQUAL(h.manager->switchMapping("s1")->currentController, "b");

    // A good check clears the counters but the status waits for a restart
    h.mock("a")->pingResult = true;
    h.manager->runHealthChecks();
    info = h.manager->controllerInfo("a");
    BOOST_CHECK(info->status == ControllerStatus::Error);
    BOOST_CHECK(info->healthStatus == HealthStatus::Healthy);
    BOOST_CHECK_EQUAL(info->errorCount, 0);
    BOOST_CHECK_EQUAL(h.manager->switchMapping("s1")->currentController, "b");
}

BOOST_AUTO_TEST_CASE(stopped_controller_fails_over)
{
    Collector failovers;
    Harness h(3);
    h.stream->subscribe("failovers", failovers.callback(), typeFilter(event_names::SWITCH_FAILOVER));
    h.addControllers({"a", "b"});
    h.manager->runHealthChecks();
    BOOST_REQUIRE(h.manager->mapSwitch("s1", "a", {"b"}).ok);

    BOOST_REQUIRE(h.manager->stopController("a").ok);
    BOOST_CHECK_EQUAL(h.manager->runHealthChecks(), 2u);
    auto info = h.manager->controllerInfo("a");
    BOOST_REQUIRE(info);
    BOOST_CHECK(info->healthStatus == HealthStatus::Unhealthy);
    BOOST_CHECK_EQUAL(info->errorCount, 1);
    BOOST_CHECK_EQUAL(h.manager->switchMapping("s1")->currentController, "a");

    for (int round = 0; round < 4; ++round)
    {
        h.manager->runHealthChecks();
    }

    auto mapping = h.manager->switchMapping("s1");
    BOOST_REQUIRE(mapping);
    BOOST_CHECK_EQUAL(mapping->currentController, "b");
    BOOST_CHECK_EQUAL(mapping->failoverCount, 1u);

    info = h.manager->controllerInfo("a");
    BOOST_CHECK(info->status == ControllerStatus::Disconnected);
    BOOST_CHECK_EQUAL(info->errorCount, 5);
    BOOST_CHECK_EQUAL(h.manager->listControllers().data["healthy_count"].get<size_t>(), 1u);

    h.drain();
    auto events = failovers.snapshot();
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK_EQUAL(events[0].data["failed_controller"].get<std::string>(), "a");
}

BOOST_AUTO_TEST_CASE(controllers_that_never_connected_are_supervised)
{
    Harness h(2);
    h.addControllers({"b"});
    BOOST_REQUIRE(h.manager->registerController(mockControllerConfig("idle", 6660), false).ok);
    BOOST_REQUIRE(h.manager->registerController(mockControllerConfig("broken", 6661), false).ok);
    h.mock("broken")->initializeResult = false;
    BOOST_CHECK(h.manager->startController("broken").errorCode ==
                ErrorCode::BackendNotAvailable);

    BOOST_CHECK_EQUAL(h.manager->runHealthChecks(), 3u);
    BOOST_CHECK(h.manager->controllerInfo("idle")->healthStatus == HealthStatus::Unhealthy);
    BOOST_CHECK(h.manager->controllerInfo("broken")->healthStatus == HealthStatus::Unhealthy);
    BOOST_CHECK(h.manager->controllerInfo("b")->healthStatus == HealthStatus::Healthy);

    BOOST_REQUIRE(h.manager->mapSwitch("s1", "idle", {"b"}).ok);
    BOOST_REQUIRE(h.manager->mapSwitch("s2", "broken", {"b"}).ok);
    h.manager->runHealthChecks();

    BOOST_CHECK_EQUAL(h.manager->switchMapping("s1")->currentController, "b");
    BOOST_CHECK_EQUAL(h.manager->switchMapping("s2")->currentController, "b");
    BOOST_CHECK_EQUAL(h.manager->controllerInfo("broken")->errorCount, 2);
    BOOST_CHECK(h.manager->controllerInfo("broken")->status == ControllerStatus::Error);
    BOOST_CHECK(h.manager->controllerInfo("idle")->status == ControllerStatus::Error);
    BOOST_CHECK_EQUAL(h.manager->stats()["failed_controllers"].get<uint64_t>(), 2u);
}

BOOST_AUTO_TEST_CASE(stranded_switch_retried_each_round)
{
    Collector failovers;
    Harness h(1);
    h.stream->subscribe("failovers", failovers.callback(), typeFilter(event_names::SWITCH_FAILOVER));
    h.addControllers({"a", "b"});
    h.manager->runHealthChecks();
    BOOST_REQUIRE(h.manager->mapSwitch("s1", "a", {"b"}).ok);

    h.mock("a")->pingResult = false;
    h.mock("b")->pingResult = false;
    h.manager->runHealthChecks();
    h.manager->runHealthChecks();

    auto mapping = h.manager->switchMapping("s1");
    BOOST_REQUIRE(mapping);
    BOOST_CHECK_EQUAL(mapping->currentController, "a");
    BOOST_CHECK_EQUAL(mapping->failoverCount, 0u);

    // b recovers while a is still down
    h.mock("b")->pingResult = true;
    h.manager->runHealthChecks();
    BOOST_CHECK_EQUAL(h.manager->switchMapping("s1")->currentController, "b");

    h.drain();
    BOOST_CHECK_EQUAL(failovers.snapshot().size(), 1u);
}

BOOST_AUTO_TEST_CASE(failover_count_is_monotonic)
{
    Harness h(1);
    h.addControllers({"a", "b", "c"});
    h.manager->runHealthChecks();
    BOOST_REQUIRE(h.manager->mapSwitch("s1", "a", {"b", "c"}).ok);

    h.mock("a")->pingResult = false;
    h.manager->runHealthChecks();
    BOOST_CHECK_EQUAL(h.manager->switchMapping("s1")->failoverCount, 1u);

    // Remapping resets the current controller but keeps the count
    BOOST_REQUIRE(h.manager->mapSwitch("s1", "c", {"b"}).ok);
    auto mapping = h.manager->switchMapping("s1");
    BOOST_CHECK_EQUAL(mapping->currentController, "c");
    BOOST_CHECK_EQUAL(mapping->failoverCount, 1u);

    auto moved = h.manager->manualFailover("s1");
    BOOST_REQUIRE(moved.ok);
    BOOST_CHECK_EQUAL(moved.data["failover_count"].get<uint64_t>(), 2u);
    BOOST_CHECK_EQUAL(h.manager->switchMapping("s1")->failoverCount, 2u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(manual_failover_tests)

BOOST_AUTO_TEST_CASE(manual_failover_errors)
{
    Harness h;
    h.addControllers({"a", "b"});
    h.manager->runHealthChecks();
    BOOST_REQUIRE(h.manager->mapSwitch("s1", "a", {"b"}).ok);

    BOOST_CHECK(h.manager->manualFailover("s9").errorCode == ErrorCode::MappingNotFound);
    BOOST_CHECK(h.manager->manualFailover("s1", std::string("ghost")).errorCode ==
                ErrorCode::ControllerNotFound);

    h.mock("b")->pingResult = false;
    h.manager->runHealthChecks();
    BOOST_CHECK(h.manager->manualFailover("s1", std::string("b")).errorCode ==
                ErrorCode::ControllerUnhealthy);
    BOOST_CHECK(h.manager->manualFailover("s1").errorCode == ErrorCode::NoBackupAvailable);

    auto mapping = h.manager->switchMapping("s1");
    BOOST_CHECK_EQUAL(mapping->currentController, "a");
    BOOST_CHECK_EQUAL(mapping->failoverCount, 0u);
}

BOOST_AUTO_TEST_CASE(manual_failover_moves_switch)
{
    Collector manual;
    Harness h;
    h.stream->subscribe("manual", manual.callback(), typeFilter(event_names::MANUAL_FAILOVER));
    h.addControllers({"a", "b", "c"});
    h.manager->runHealthChecks();
    BOOST_REQUIRE(h.manager->mapSwitch("s1", "a", {"b"}).ok);

    auto moved = h.manager->manualFailover("s1");
    BOOST_REQUIRE(moved.ok);
    BOOST_CHECK_EQUAL(moved.data["old_controller"].get<std::string>(), "a");
    BOOST_CHECK_EQUAL(moved.data["new_controller"].get<std::string>(), "b");

    // c is neither primary nor backup: it joins the backups
    moved = h.manager->manualFailover("s1", std::string("c"));
    BOOST_REQUIRE(moved.ok);
    auto mapping = h.manager->switchMapping("s1");
    BOOST_CHECK_EQUAL(mapping->currentController, "c");
    BOOST_REQUIRE_EQUAL(mapping->backupControllers.size(), 2u);
    BOOST_CHECK_EQUAL(mapping->backupControllers[1], "c");
    BOOST_CHECK(mapping->isConsistent());

    // Back to the primary
    BOOST_REQUIRE(h.manager->manualFailover("s1", std::string("a")).ok);
    BOOST_CHECK_EQUAL(h.manager->switchMapping("s1")->currentController, "a");
    BOOST_CHECK_EQUAL(h.manager->switchMapping("s1")->failoverCount, 3u);

    h.drain();
    auto events = manual.snapshot();
    BOOST_REQUIRE_EQUAL(events.size(), 3u);
    BOOST_CHECK(events[0].priority == EventPriority::High);
    BOOST_CHECK_EQUAL(events[0].data["manual"].get<bool>(), true);
    BOOST_CHECK_EQUAL(events[2].data["failover_count"].get<uint64_t>(), 3u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(runtime_tests)

BOOST_AUTO_TEST_CASE(packet_in_is_forwarded_to_stream)
{
    Collector packets;
    Harness h;
    h.stream->subscribe("packets", packets.callback(), typeFilter(event_names::PACKET_IN));
    h.addControllers({"c1"});

    PacketData packet;
    packet.switchId = "0000000000000001";
    packet.payload = {0x01, 0x02, 0x03};
    packet.metadata = {{"in_port", 2}};
    h.mock("c1")->injectPacketIn(packet);

    h.drain();
    auto events = packets.snapshot();
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK_EQUAL(events[0].sourceController, "c1");
    BOOST_CHECK_EQUAL(events[0].sourceType, "openflow");
    BOOST_CHECK_EQUAL(events[0].data["switch_id"].get<std::string>(), "0000000000000001");
    BOOST_CHECK_EQUAL(events[0].data["packet_size"].get<size_t>(), 3u);
    BOOST_CHECK_EQUAL(events[0].data["metadata"]["in_port"].get<int>(), 2);

    // Detached once stopped
    BOOST_REQUIRE(h.manager->stopController("c1").ok);
    h.mock("c1")->injectPacketIn(packet);
    h.drain();
    BOOST_CHECK_EQUAL(packets.snapshot().size(), 1u);
    BOOST_CHECK(h.manager->controllerInfo("c1")->status == ControllerStatus::Disconnected);
}

BOOST_AUTO_TEST_CASE(maintenance_mode)
{
    Harness h;
    h.addControllers({"a", "b"});
    h.manager->runHealthChecks();
    BOOST_REQUIRE(h.manager->mapSwitch("s1", "a", {"b"}).ok);

    BOOST_CHECK(h.manager->setMaintenance("b", false).errorCode == ErrorCode::ValidationError);
    BOOST_REQUIRE(h.manager->setMaintenance("b", true).ok);
    BOOST_CHECK(h.manager->controllerInfo("b")->status == ControllerStatus::Maintenance);
    BOOST_CHECK(h.manager->setMaintenance("b", true).errorCode == ErrorCode::ValidationError);

    // Not monitored and not eligible as a target
    BOOST_CHECK_EQUAL(h.manager->runHealthChecks(), 1u);
    BOOST_CHECK(h.manager->manualFailover("s1", std::string("b")).errorCode ==
                ErrorCode::ControllerUnhealthy);
    BOOST_CHECK(h.manager->manualFailover("s1").errorCode == ErrorCode::NoBackupAvailable);

    BOOST_REQUIRE(h.manager->setMaintenance("b", false).ok);
    BOOST_CHECK(h.manager->controllerInfo("b")->status == ControllerStatus::Connected);
    BOOST_CHECK(h.manager->manualFailover("s1").ok);
}

BOOST_AUTO_TEST_CASE(listing_and_stats)
{
    Harness h;
    h.addControllers({"a", "b"});
    h.manager->runHealthChecks();
    BOOST_REQUIRE(h.manager->mapSwitch("s1", "a").ok);

    auto listed = h.manager->listControllers();
    BOOST_REQUIRE(listed.ok);
    BOOST_CHECK_EQUAL(listed.data["total_count"].get<size_t>(), 2u);
    BOOST_CHECK_EQUAL(listed.data["healthy_count"].get<size_t>(), 2u);
    BOOST_CHECK_EQUAL(listed.data["connected_count"].get<size_t>(), 2u);
    BOOST_CHECK(listed.data["controllers"].contains("a"));
    BOOST_CHECK_EQUAL(listed.data["controllers"]["a"]["assigned_switches"].size(), 1u);
    BOOST_CHECK(!listed.data["controllers"]["a"]["config"].contains("password"));

    auto stats = h.manager->stats();
    BOOST_CHECK_EQUAL(stats["total_controllers"].get<size_t>(), 2u);
    BOOST_CHECK_EQUAL(stats["active_controllers"].get<size_t>(), 2u);
    BOOST_CHECK_EQUAL(stats["total_switches"].get<size_t>(), 1u);
    BOOST_CHECK_EQUAL(stats["health_checks_performed"].get<uint64_t>(), 2u);
    BOOST_CHECK_EQUAL(stats["failover_count"].get<uint64_t>(), 0u);
    BOOST_CHECK(stats.contains("start_time"));
}

BOOST_AUTO_TEST_CASE(health_monitor_thread)
{
    Harness h;
    h.addControllers({"a"});

    h.manager->start();
    BOOST_CHECK(h.manager->isRunning());

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (h.manager->stats()["health_checks_performed"].get<uint64_t>() == 0 &&
           std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(50ms);
    }
    BOOST_CHECK_GE(h.manager->stats()["health_checks_performed"].get<uint64_t>(), 1u);
    BOOST_CHECK(h.manager->controllerInfo("a")->healthStatus == HealthStatus::Healthy);

    h.manager->stop();
    BOOST_CHECK(!h.manager->isRunning());
    BOOST_CHECK_EQUAL(h.mock("a")->shutdownCalls.load(), 1);
    BOOST_CHECK(h.manager->controllerInfo("a")->status == ControllerStatus::Disconnected);
}

BOOST_AUTO_TEST_SUITE_END()
