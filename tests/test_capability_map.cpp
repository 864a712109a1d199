#include <gtest/gtest.h>

#include "capsule/bindings/capability_map.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <thread>

using namespace capsule::bindings;
using capsule::testing::SampleCapabilities;
using capsule::testing::SampleTables;

TEST(CapabilityMapTest, ProjectShapeListsMethodNamesPerGroup) {
    auto shape = ProjectShape(SampleCapabilities());

    ASSERT_EQ(shape.size(), 1u);
    EXPECT_EQ(shape["core"], (std::vector<std::string>{"fail", "listTables", "readQuery"}));
}

TEST(CapabilityMapTest, ProjectShapeSkipsEmptyCallables) {
    CapabilityMap capabilities = SampleCapabilities();
    capabilities["admin"]["vacuum"] = Capability();

    auto shape = ProjectShape(capabilities);
    EXPECT_TRUE(shape["admin"].empty());
    EXPECT_EQ(shape["core"].size(), 3u);
}

TEST(CapabilityMapTest, ShapeToJsonIsGroupToNameArray) {
    BindingShape shape{{"core", {"listTables"}}, {"admin", {}}};
    auto j = ShapeToJson(shape);

    EXPECT_EQ(j["core"], nlohmann::json::array({"listTables"}));
    EXPECT_TRUE(j["admin"].is_array());
    EXPECT_TRUE(ShapeToJson({}).is_object());
}

TEST(CapabilityMapTest, MakeCapabilityCarriesExceptionsInTheFuture) {
    Capability failing = MakeCapability([](const nlohmann::json&) -> nlohmann::json {
        throw std::invalid_argument("bad table");
    });

    auto future = failing(nlohmann::json::object());
    EXPECT_THROW(future.get(), std::invalid_argument);
}

TEST(CapabilityDispatcherTest, InvokeReturnsWhatTheCallableResolvesTo) {
    auto capabilities = SampleCapabilities();
    CapabilityDispatcher dispatcher(capabilities);

    EXPECT_EQ(dispatcher.Size(), 3u);
    EXPECT_TRUE(dispatcher.Contains("core", "listTables"));
    EXPECT_EQ(dispatcher.Invoke("core", "listTables", nullptr), SampleTables());

    auto echoed = dispatcher.Invoke("core", "readQuery", {{"sql", "SELECT 1"}});
    EXPECT_EQ(echoed["params"]["sql"], "SELECT 1");
}

TEST(CapabilityDispatcherTest, RejectsNamesOutsideTheAllowList) {
    auto capabilities = SampleCapabilities();
    CapabilityDispatcher dispatcher(capabilities);

    EXPECT_FALSE(dispatcher.Contains("core", "dropDatabase"));
    try {
        dispatcher.Invoke("core", "dropDatabase", nullptr);
        FAIL() << "expected unknown capability error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Unknown capability: pg.core.dropDatabase"), std::string::npos);
    }
    EXPECT_THROW(dispatcher.Invoke("system", "listTables", nullptr), std::runtime_error);
}

TEST(CapabilityDispatcherTest, RejectsNonObjectParameters) {
    auto capabilities = SampleCapabilities();
    CapabilityDispatcher dispatcher(capabilities);

    EXPECT_THROW(dispatcher.Invoke("core", "readQuery", nlohmann::json::array({1, 2})), std::invalid_argument);
    EXPECT_THROW(dispatcher.Invoke("core", "readQuery", "SELECT 1"), std::invalid_argument);
}

TEST(CapabilityDispatcherTest, PropagatesCapabilityFailures) {
    auto capabilities = SampleCapabilities();
    CapabilityDispatcher dispatcher(capabilities);

    EXPECT_THROW(dispatcher.Invoke("core", "fail", nullptr), std::runtime_error);
}

TEST(CapabilityDispatcherTest, InvokeUntilGivesUpAtTheDeadline) {
    CapabilityMap capabilities;
    capabilities["core"]["slow"] = [](const nlohmann::json&) {
        return std::async(std::launch::async, [] {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            return nlohmann::json(1);
        });
    };
    CapabilityDispatcher dispatcher(capabilities);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(20);
    try {
        dispatcher.InvokeUntil("core", "slow", nullptr, deadline);
        FAIL() << "expected a timeout";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("timeout"), std::string::npos);
    }
}

TEST(CapabilityDispatcherTest, InvokeUntilDoesNotWaitForAbandonedTasks) {
    auto capabilities = capsule::testing::SlowCapabilities(std::chrono::seconds(3));
    CapabilityDispatcher dispatcher(capabilities);

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(dispatcher.InvokeUntil("core", "slow", nullptr,
                                        started + std::chrono::milliseconds(50)),
                 std::runtime_error);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    EXPECT_GE(PendingCapabilityStragglers(), 1u);
}

TEST(CapabilityDispatcherTest, GroupAndMethodNamesDoNotCollide) {
    CapabilityMap capabilities;
    capabilities["a.b"]["c"] = MakeCapability([](const nlohmann::json&) { return nlohmann::json("dotted group"); });
    capabilities["a"]["b.c"] = MakeCapability([](const nlohmann::json&) { return nlohmann::json("dotted method"); });
    CapabilityDispatcher dispatcher(capabilities);

    EXPECT_EQ(dispatcher.Size(), 2u);
    EXPECT_EQ(dispatcher.Invoke("a.b", "c", nullptr), "dotted group");
    EXPECT_EQ(dispatcher.Invoke("a", "b.c", nullptr), "dotted method");
    EXPECT_FALSE(dispatcher.Contains("a", "b"));
    EXPECT_THROW(dispatcher.Invoke("a.b.c", "", nullptr), std::runtime_error);
}
