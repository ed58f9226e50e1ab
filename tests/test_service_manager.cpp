#include <gtest/gtest.h>

#include "management_api.hpp"
#include "process_handle.hpp"
#include "proxy_router.hpp"
#include "service_manager.hpp"

#include <httplib.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

using namespace mcpgw;
using namespace std::chrono_literals;

namespace {

BackendDescriptor MockDescriptor(const std::string& name) {
    BackendDescriptor d;
    d.name = name;
    d.command = MOCK_BACKEND_PATH;
    d.env["MOCK_MODE"] = "echo";
    d.timeout_ms = 5000;
    d.max_restarts = 3;
    d.restart_backoff_ms = 10;
    return d;
}

bool Eventually(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 10s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(20ms);
    }
    return pred();
}

}  // namespace

// Manager, registry and router wired the way main wires them, with the router on a real listener.
class ServiceManagerTest : public ::testing::Test {
protected:
    static constexpr int kGatewayPort = 18960;

    void SetUp() override {
        ManagerOptions opts;
        opts.supervisor.health_interval_ms = 60000;
        opts.supervisor.stop_grace_ms = 500;
        opts.supervisor.max_backoff_ms = 200;
        opts.bridge.keepalive_seconds = 1;
        manager = std::make_unique<ServiceManager>(&registry, &ports, opts);

        RegisterManagementRoutes(&server, manager.get());
        router.Register(&server);
        ASSERT_TRUE(server.bind_to_port("127.0.0.1", kGatewayPort));
        listener = std::thread([this] { server.listen_after_bind(); });
    }

    void TearDown() override {
        server.stop();
        if (listener.joinable()) listener.join();
        manager.reset();
    }

    httplib::Result Get(const std::string& path) {
        httplib::Client cli("127.0.0.1", kGatewayPort);
        cli.set_read_timeout(10, 0);
        return cli.Get(path);
    }

    httplib::Result Delete(const std::string& path) {
        httplib::Client cli("127.0.0.1", kGatewayPort);
        return cli.Delete(path);
    }

    httplib::Result Call(const std::string& path, const std::string& body) {
        httplib::Client cli("127.0.0.1", kGatewayPort);
        cli.set_read_timeout(10, 0);
        return cli.Post(path, body, "application/json");
    }

    bool HealthyAt(const std::string& name, uint64_t generation) {
        auto ep = registry.Get(name);
        return ep && ep->generation == generation && ep->health == Health::kHealthy;
    }

    ServiceRegistry registry;
    PortAllocator ports{PortRange{18900, 18949}};
    ProxyRouter router{&registry, RouterOptions{5, 2}};
    std::unique_ptr<ServiceManager> manager;
    httplib::Server server;
    std::thread listener;
};

TEST_F(ServiceManagerTest, NamesAreUnique) {
    GatewayError err;
    ASSERT_TRUE(manager->AddBackend(MockDescriptor("echo"), &err)) << err.ToString();
    EXPECT_FALSE(manager->AddBackend(MockDescriptor("echo"), &err));
    EXPECT_EQ(err.code, ErrorCode::kAlreadyExists);
    EXPECT_EQ(manager->Names(), std::vector<std::string>{"echo"});
}

TEST_F(ServiceManagerTest, InvalidDescriptorIsRejected) {
    auto d = MockDescriptor("bad name");
    GatewayError err;
    EXPECT_FALSE(manager->AddBackend(d, &err));
    EXPECT_EQ(err.code, ErrorCode::kInvalidArgument);
}

TEST_F(ServiceManagerTest, UnknownNameIsNotFound) {
    GatewayError err;
    EXPECT_FALSE(manager->Start("ghost", &err));
    EXPECT_EQ(err.code, ErrorCode::kNotFound);
    EXPECT_FALSE(manager->Remove("ghost", &err));
    EXPECT_EQ(err.code, ErrorCode::kNotFound);
}

TEST_F(ServiceManagerTest, StartedBackendIsRoutable) {
    GatewayError err;
    ASSERT_TRUE(manager->AddBackend(MockDescriptor("echo"), &err));
    EXPECT_EQ(manager->StartAll(), 1u);
    ASSERT_TRUE(HealthyAt("echo", 1));

    auto res = Call("/mcp/echo",
                    R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j["id"], 7);
    EXPECT_EQ(j["result"]["content"][0]["text"], "hi");

    auto status = manager->StatusJson();
    ASSERT_EQ(status.size(), 1u);
    EXPECT_EQ(status[0]["state"], "running");
    EXPECT_EQ(status[0]["health"], "healthy");
    EXPECT_EQ(status[0]["generation"], 1);
}

TEST_F(ServiceManagerTest, CrashIsRecoveredUnderNewGeneration) {
    GatewayError err;
    ASSERT_TRUE(manager->AddBackend(MockDescriptor("echo"), &err));
    ASSERT_TRUE(manager->Start("echo", &err)) << err.ToString();
    const int first_port = registry.Get("echo")->port;

    auto res = Call("/mcp/echo", R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"crash"}})");
    ASSERT_TRUE(res);
    EXPECT_NE(res->status, 200);

    ASSERT_TRUE(Eventually([&] { return HealthyAt("echo", 2); }));
    EXPECT_NE(registry.Get("echo")->port, first_port);

    auto again = Call("/mcp/echo", R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    ASSERT_TRUE(again);
    EXPECT_EQ(again->status, 200);
}

TEST_F(ServiceManagerTest, StopMakesServiceUnavailable) {
    GatewayError err;
    ASSERT_TRUE(manager->AddBackend(MockDescriptor("echo"), &err));
    ASSERT_TRUE(manager->Start("echo", &err)) << err.ToString();
    ASSERT_TRUE(manager->Stop("echo", &err));
    EXPECT_EQ(registry.Get("echo")->health, Health::kStopped);
    EXPECT_TRUE(ports.Reserved().empty());

    auto res = Call("/mcp/echo", R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 503);

    ASSERT_TRUE(manager->Restart("echo", &err)) << err.ToString();
    EXPECT_TRUE(HealthyAt("echo", 2));
}

TEST_F(ServiceManagerTest, RemoveDeregistersAndDropsRoutes) {
    GatewayError err;
    ASSERT_TRUE(manager->AddBackend(MockDescriptor("echo"), &err));
    ASSERT_TRUE(manager->Start("echo", &err)) << err.ToString();
    ASSERT_TRUE(manager->Remove("echo", &err));
    EXPECT_FALSE(registry.Get("echo").has_value());
    EXPECT_TRUE(manager->Names().empty());
    EXPECT_TRUE(router.Routes().empty());

    auto res = Call("/mcp/echo", R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(ServiceManagerTest, BackendAddedOverHttpStarts) {
    auto res = Call("/proxy/backends",
                    nlohmann::json{{"name", "echo"}, {"command", MOCK_BACKEND_PATH}, {"timeout_ms", 5000}}.dump());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 201) << res->body;
    EXPECT_TRUE(HealthyAt("echo", 1));

    auto dup = Call("/proxy/backends", nlohmann::json{{"name", "echo"}, {"command", MOCK_BACKEND_PATH}}.dump());
    ASSERT_TRUE(dup);
    EXPECT_EQ(dup->status, 409);
}

TEST_F(ServiceManagerTest, ExternalServerIsRoutedUntilUnregistered) {
    GatewayError err;
    auto port = ports.Reserve("external", std::nullopt, &err);
    ASSERT_TRUE(port) << err.ToString();
    SpawnSpec spec;
    spec.name = "ext";
    spec.command = MOCK_BACKEND_PATH;
    spec.args = {"--transport", "http", "--port", std::to_string(*port)};
    auto proc = ProcessHandle::Spawn(spec, nullptr, &err);
    ASSERT_TRUE(proc) << err.ToString();
    ASSERT_TRUE(Eventually([&] {
        httplib::Client cli("127.0.0.1", *port);
        auto r = cli.Get("/");
        return r && r->status == 200;
    }));

    const auto registration =
        nlohmann::json{{"server_name", "ext"}, {"port", *port}, {"transport", "http"}, {"pid", proc->Pid()}}.dump();
    auto reg = Call("/proxy/register", registration);
    ASSERT_TRUE(reg);
    ASSERT_EQ(reg->status, 200) << reg->body;
    auto info = nlohmann::json::parse(reg->body);
    EXPECT_EQ(info["status"], "success");
    EXPECT_EQ(info["server_info"]["generation"], 1);
    EXPECT_TRUE(manager->IsExternal("ext"));

    auto res = Call("/mcp/ext",
                    R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"add","arguments":{"a":40,"b":2}}})");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200) << res->body;
    EXPECT_EQ(nlohmann::json::parse(res->body)["result"]["content"][0]["text"], "42");

    auto mapping = Get("/proxy/mapping");
    ASSERT_TRUE(mapping);
    auto servers = nlohmann::json::parse(mapping->body)["servers"];
    EXPECT_EQ(servers["ext"]["port"], *port);
    EXPECT_EQ(servers["ext"]["managed"], false);

    auto again = Call("/proxy/register", registration);
    ASSERT_TRUE(again);
    EXPECT_EQ(nlohmann::json::parse(again->body)["server_info"]["generation"], 2);
    EXPECT_TRUE(HealthyAt("ext", 2));

    auto del = Delete("/proxy/unregister/ext");
    ASSERT_TRUE(del);
    EXPECT_EQ(del->status, 200);
    EXPECT_FALSE(registry.Get("ext").has_value());

    auto gone = Call("/mcp/ext", R"({"jsonrpc":"2.0","id":4,"method":"ping"})");
    ASSERT_TRUE(gone);
    EXPECT_EQ(gone->status, 404);

    auto twice = Delete("/proxy/unregister/ext");
    ASSERT_TRUE(twice);
    EXPECT_EQ(twice->status, 404);
}

TEST_F(ServiceManagerTest, ExternalAndSupervisedNamesDoNotMix) {
    GatewayError err;
    ASSERT_TRUE(manager->AddBackend(MockDescriptor("echo"), &err));

    auto clash = Call("/proxy/register", R"({"server_name":"echo","port":18999,"transport":"sse"})");
    ASSERT_TRUE(clash);
    EXPECT_EQ(clash->status, 409);

    auto del = Delete("/proxy/unregister/echo");
    ASSERT_TRUE(del);
    EXPECT_EQ(del->status, 400);

    ExternalEndpoint ext;
    ext.name = "outside";
    ext.port = 18998;
    ASSERT_TRUE(manager->RegisterExternal(ext, &err)) << err.ToString();
    EXPECT_FALSE(manager->AddBackend(MockDescriptor("outside"), &err));
    EXPECT_EQ(err.code, ErrorCode::kAlreadyExists);

    auto bad = Call("/proxy/register", R"({"server_name":"bad name","port":18997})");
    ASSERT_TRUE(bad);
    EXPECT_EQ(bad->status, 400);
}
