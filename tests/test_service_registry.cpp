#include <gtest/gtest.h>

#include "service_registry.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace mcpgw;

namespace {

ServiceEndpoint Endpoint(int port, uint64_t generation, Health health = Health::kHealthy) {
    ServiceEndpoint ep;
    ep.port = port;
    ep.generation = generation;
    ep.health = health;
    return ep;
}

}  // namespace

class ServiceRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        token = registry.Subscribe([this](const RegistryEvent& ev) { events.push_back(ev); });
    }

    ServiceRegistry registry{3};
    std::vector<RegistryEvent> events;
    int token = 0;
};

TEST_F(ServiceRegistryTest, RegisterThenGet) {
    EXPECT_TRUE(registry.Register("files", Endpoint(8001, 1)));
    auto ep = registry.Get("files");
    ASSERT_TRUE(ep.has_value());
    EXPECT_EQ(ep->name, "files");
    EXPECT_EQ(ep->port, 8001);
    EXPECT_EQ(ep->health, Health::kHealthy);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, RegistryEventKind::kAdded);
    EXPECT_FALSE(registry.Get("missing").has_value());
}

TEST_F(ServiceRegistryTest, StaleGenerationIsIgnored) {
    ASSERT_TRUE(registry.Register("files", Endpoint(8001, 2)));
    EXPECT_FALSE(registry.Register("files", Endpoint(8002, 1)));
    EXPECT_FALSE(registry.Register("files", Endpoint(8003, 2)));
    EXPECT_EQ(registry.Get("files")->port, 8001);

    EXPECT_TRUE(registry.Register("files", Endpoint(8004, 3)));
    EXPECT_EQ(registry.Get("files")->port, 8004);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].kind, RegistryEventKind::kUpdated);
}

TEST_F(ServiceRegistryTest, SnapshotIsImmutable) {
    registry.Register("a", Endpoint(8001, 1));
    auto before = registry.Snapshot();
    registry.Register("b", Endpoint(8002, 1));
    registry.Deregister("a");
    EXPECT_EQ(before->size(), 1u);
    EXPECT_EQ(before->count("a"), 1u);
    auto after = registry.Snapshot();
    EXPECT_EQ(after->size(), 1u);
    EXPECT_EQ(after->count("b"), 1u);
}

TEST_F(ServiceRegistryTest, DeregisterEmitsRemoved) {
    registry.Register("a", Endpoint(8001, 1));
    EXPECT_TRUE(registry.Deregister("a"));
    EXPECT_FALSE(registry.Deregister("a"));
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].kind, RegistryEventKind::kRemoved);
    EXPECT_EQ(events[1].endpoint.port, 8001);
}

TEST_F(ServiceRegistryTest, ProbeMissesFlipHealthAtThreshold) {
    registry.Register("a", Endpoint(8001, 1));
    events.clear();
    registry.RecordProbe("a", false);
    registry.RecordProbe("a", false);
    EXPECT_EQ(registry.Get("a")->health, Health::kHealthy);
    EXPECT_TRUE(events.empty());

    registry.RecordProbe("a", false);
    EXPECT_EQ(registry.Get("a")->health, Health::kUnhealthy);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, RegistryEventKind::kHealthChanged);
    EXPECT_EQ(events[0].previous_health, Health::kHealthy);

    registry.RecordProbe("a", false);
    EXPECT_EQ(events.size(), 1u);

    registry.RecordProbe("a", true);
    EXPECT_EQ(registry.Get("a")->health, Health::kHealthy);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].previous_health, Health::kUnhealthy);
}

TEST_F(ServiceRegistryTest, SuccessfulProbeResetsMissCount) {
    registry.Register("a", Endpoint(8001, 1));
    registry.RecordProbe("a", false);
    registry.RecordProbe("a", false);
    registry.RecordProbe("a", true);
    registry.RecordProbe("a", false);
    registry.RecordProbe("a", false);
    EXPECT_EQ(registry.Get("a")->health, Health::kHealthy);
}

TEST_F(ServiceRegistryTest, MarkHealthOnlyEmitsOnChange) {
    registry.Register("a", Endpoint(8001, 1));
    events.clear();
    EXPECT_TRUE(registry.MarkHealth("a", Health::kHealthy));
    EXPECT_TRUE(events.empty());
    EXPECT_TRUE(registry.MarkHealth("a", Health::kStarting));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].endpoint.health, Health::kStarting);
    EXPECT_FALSE(registry.MarkHealth("missing", Health::kStopped));
}

TEST_F(ServiceRegistryTest, UnsubscribeStopsDelivery) {
    registry.Unsubscribe(token);
    registry.Register("a", Endpoint(8001, 1));
    EXPECT_TRUE(events.empty());
}

TEST_F(ServiceRegistryTest, EndpointJson) {
    registry.Register("a", Endpoint(8001, 4));
    auto j = EndpointToJson(*registry.Get("a"));
    EXPECT_EQ(j["name"], "a");
    EXPECT_EQ(j["port"], 8001);
    EXPECT_EQ(j["generation"], 4);
    EXPECT_EQ(j["health"], "healthy");
    EXPECT_EQ(j["transport"], "stdio");
}

TEST(ServiceRegistryConcurrencyTest, ReadersSeeConsistentSnapshotsDuringWrites) {
    ServiceRegistry registry;
    std::atomic<bool> done{false};
    std::atomic<int> bad{0};
    std::thread reader([&] {
        while (!done) {
            auto snap = registry.Snapshot();
            for (const auto& kv : *snap) {
                if (kv.second.port != 9000 + static_cast<int>(kv.second.generation)) bad++;
            }
        }
    });
    for (uint64_t g = 1; g <= 500; g++) {
        ServiceEndpoint ep;
        ep.port = 9000 + static_cast<int>(g);
        ep.generation = g;
        registry.Register("svc", ep);
    }
    done = true;
    reader.join();
    EXPECT_EQ(bad.load(), 0);
    EXPECT_EQ(registry.Get("svc")->generation, 500u);
}
