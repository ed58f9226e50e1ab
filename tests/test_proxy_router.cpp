#include <gtest/gtest.h>

#include "http_util.hpp"
#include "proxy_router.hpp"
#include "transports/sse_events.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace mcpgw;
using namespace std::chrono_literals;

namespace {

ServiceEndpoint Endpoint(int port, Health health = Health::kHealthy, uint64_t generation = 1) {
    ServiceEndpoint ep;
    ep.host = "127.0.0.1";
    ep.port = port;
    ep.generation = generation;
    ep.health = health;
    return ep;
}

// Starts an httplib server on a background thread and stops it on destruction.
class ServerThread {
public:
    explicit ServerThread(int port) : port_(port) {}
    ~ServerThread() { Stop(); }

    httplib::Server& server() { return server_; }

    bool Start() {
        if (!server_.bind_to_port("127.0.0.1", port_)) return false;
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        return true;
    }

    void Stop() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

private:
    int port_;
    httplib::Server server_;
    std::thread thread_;
};

}  // namespace

class ProxyRouteTableTest : public ::testing::Test {
protected:
    ServiceRegistry registry;
    ProxyRouter router{&registry};
};

TEST_F(ProxyRouteTableTest, RoutesFollowRegistry) {
    EXPECT_TRUE(router.Routes().empty());
    registry.Register("files", Endpoint(9001));
    EXPECT_EQ(router.Routes().size(), 3u);
    registry.Register("search", Endpoint(9002));
    EXPECT_EQ(router.Routes().size(), 6u);
    registry.Deregister("files");
    EXPECT_EQ(router.Routes().size(), 3u);
    EXPECT_EQ(router.Route("/mcp/files").status, 404);
}

TEST_F(ProxyRouteTableTest, PrefixesMapToBridgePaths) {
    registry.Register("files", Endpoint(9001));
    auto mcp = router.Route("/mcp/files");
    EXPECT_EQ(mcp.status, 200);
    EXPECT_EQ(mcp.service, "files");
    EXPECT_EQ(mcp.port, 9001);
    EXPECT_EQ(mcp.upstream_path, "/mcp");

    EXPECT_EQ(router.Route("/sse/files").upstream_path, "/sse");
    EXPECT_EQ(router.Route("/files/health").upstream_path, "/health");
    EXPECT_EQ(router.Route("/files").upstream_path, "/");
}

TEST_F(ProxyRouteTableTest, MatchesOnSegmentBoundaries) {
    registry.Register("files", Endpoint(9001));
    registry.Register("files-archive", Endpoint(9002));
    EXPECT_EQ(router.Route("/files-archive/mcp").service, "files-archive");
    EXPECT_EQ(router.Route("/files/mcp").service, "files");
    EXPECT_EQ(router.Route("/filesystem").status, 404);
    EXPECT_EQ(router.Route("/nothing/here").status, 404);
}

TEST_F(ProxyRouteTableTest, UnhealthyServiceIsUnavailable) {
    registry.Register("files", Endpoint(9001));
    registry.MarkHealth("files", Health::kUnhealthy);
    auto d = router.Route("/mcp/files");
    EXPECT_EQ(d.status, 503);
    EXPECT_NE(d.reason.find("unhealthy"), std::string::npos);
    registry.MarkHealth("files", Health::kStarting);
    EXPECT_EQ(router.Route("/mcp/files").status, 503);
}

TEST_F(ProxyRouteTableTest, ReservedNamesGetNoBarePrefix) {
    auto routes = ProxyRouter::BuildRoutes({{"proxy", Endpoint(9001)}, {"messages", Endpoint(9002)}});
    EXPECT_EQ(routes.size(), 4u);
    for (const auto& r : routes) {
        EXPECT_NE(r.path_prefix, "/proxy");
        EXPECT_NE(r.path_prefix, "/messages");
    }
}

TEST_F(ProxyRouteTableTest, LongestPrefixFirst) {
    auto routes = ProxyRouter::BuildRoutes({{"a", Endpoint(9001)}, {"abcdef", Endpoint(9002)}});
    for (size_t i = 1; i < routes.size(); i++) {
        EXPECT_GE(routes[i - 1].path_prefix.size(), routes[i].path_prefix.size());
    }
}

TEST_F(ProxyRouteTableTest, MessagesResolutionOrder) {
    registry.Register("files", Endpoint(9001));
    registry.Register("search", Endpoint(9002));

    EXPECT_EQ(router.RouteMessages("search", "files", "").service, "search");
    EXPECT_EQ(router.RouteMessages("", "files", "").service, "files");

    router.RecordSession("sess-1", "search");
    EXPECT_EQ(router.RouteMessages("", "", "sess-1").service, "search");

    auto ambiguous = router.RouteMessages("", "", "sess-unknown");
    EXPECT_EQ(ambiguous.status, 400);
    EXPECT_NE(ambiguous.reason.find("files"), std::string::npos);
    EXPECT_NE(ambiguous.reason.find("search"), std::string::npos);

    registry.Deregister("files");
    EXPECT_EQ(router.RouteMessages("", "", "").service, "search");
}

TEST_F(ProxyRouteTableTest, RemovingServiceForgetsItsSessions) {
    registry.Register("files", Endpoint(9001));
    router.RecordSession("sess-1", "files");
    ASSERT_TRUE(router.SessionService("sess-1").has_value());
    registry.Deregister("files");
    EXPECT_FALSE(router.SessionService("sess-1").has_value());
}

TEST_F(ProxyRouteTableTest, NewGenerationForgetsSessions) {
    registry.Register("files", Endpoint(9001));
    router.RecordSession("sess-1", "files");
    registry.MarkHealth("files", Health::kUnhealthy);
    EXPECT_TRUE(router.SessionService("sess-1").has_value());

    registry.Register("files", Endpoint(9005, Health::kHealthy, 2));
    EXPECT_FALSE(router.SessionService("sess-1").has_value());
    EXPECT_EQ(router.StatusJson()["sessions"], 0);
}

TEST_F(ProxyRouteTableTest, StatusAndHealthJson) {
    registry.Register("files", Endpoint(9001));
    registry.Register("search", Endpoint(9002, Health::kUnhealthy));
    auto status = router.StatusJson();
    EXPECT_EQ(status["services"].size(), 2u);
    EXPECT_EQ(status["routes"], 6);
    auto health = router.HealthJson();
    EXPECT_EQ(health["status"], "degraded");
    EXPECT_EQ(health["healthy"], 1);
    EXPECT_EQ(health["services"]["search"], "unhealthy");
    auto index = router.IndexJson();
    EXPECT_EQ(index["endpoints"].size(), 2u);
}

// Gateway listener in front of a fake bridge.
class ProxyForwardTest : public ::testing::Test {
protected:
    static constexpr int kUpstreamPort = 18870;
    static constexpr int kGatewayPort = 18871;

    void SetUp() override {
        auto& up = upstream.server();
        up.Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
            upstream_hits++;
            nlohmann::json j;
            j["path"] = req.path;
            j["body"] = nlohmann::json::parse(req.body, nullptr, false);
            j["query"] = req.get_param_value("x");
            j["forwarded_header"] = req.get_header_value("X-Test");
            res.set_header("Mcp-Session-Id", "upstream-session");
            SendJson(&res, 200, j);
        });
        up.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            SendJson(&res, 200, {{"ok", true}});
        });
        up.Get("/sse", [](const httplib::Request&, httplib::Response& res) {
            auto sent = std::make_shared<bool>(false);
            res.set_chunked_content_provider("text/event-stream", [sent](size_t, httplib::DataSink& sink) {
                if (!*sent) {
                    *sent = true;
                    const std::string ev = "event: endpoint\ndata: /messages?session_id=up-42\n\n";
                    return sink.write(ev.data(), ev.size());
                }
                std::this_thread::sleep_for(100ms);
                return sink.is_writable();
            });
        });
        // Announces a session, then ticks until the reader goes away.
        up.Get("/ticker", [](const httplib::Request&, httplib::Response& res) {
            auto sent = std::make_shared<bool>(false);
            res.set_chunked_content_provider("text/event-stream", [sent](size_t, httplib::DataSink& sink) {
                std::string ev = ": tick\n\n";
                if (!*sent) {
                    *sent = true;
                    ev = "event: endpoint\ndata: /messages?session_id=tick-7\n\n";
                }
                std::this_thread::sleep_for(50ms);
                return sink.write(ev.data(), ev.size());
            });
        });
        up.Post("/messages", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mu);
            last_message_session = req.get_param_value("session_id");
            res.status = 202;
            res.set_content("Accepted", "text/plain");
        });
        ASSERT_TRUE(upstream.Start());

        router.Register(&gateway.server());
        ASSERT_TRUE(gateway.Start());
        registry.Register("files", Endpoint(kUpstreamPort));
    }

    httplib::Client Client() {
        httplib::Client cli("127.0.0.1", kGatewayPort);
        cli.set_read_timeout(10, 0);
        return cli;
    }

    ServiceRegistry registry;
    ProxyRouter router{&registry, RouterOptions{5, 2}};
    ServerThread upstream{kUpstreamPort};
    ServerThread gateway{kGatewayPort};
    std::atomic<int> upstream_hits{0};
    std::mutex mu;
    std::string last_message_session;
};

TEST_F(ProxyForwardTest, ForwardsBodyHeadersAndQuery) {
    auto cli = Client();
    httplib::Headers headers{{"X-Test", "kept"}};
    auto res = cli.Post("/mcp/files?x=a%20b", headers, R"({"jsonrpc":"2.0","id":1,"method":"ping"})",
                        "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j["path"], "/mcp");
    EXPECT_EQ(j["body"]["method"], "ping");
    EXPECT_EQ(j["query"], "a b");
    EXPECT_EQ(j["forwarded_header"], "kept");
    EXPECT_EQ(res->get_header_value("Mcp-Session-Id"), "upstream-session");
}

TEST_F(ProxyForwardTest, BarePrefixStripsServiceName) {
    auto cli = Client();
    auto res = cli.Get("/files/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(nlohmann::json::parse(res->body)["ok"], true);
}

TEST_F(ProxyForwardTest, UnknownServiceIs404AndUnhealthyIs503) {
    auto cli = Client();
    auto missing = cli.Post("/mcp/nope", "{}", "application/json");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);

    registry.MarkHealth("files", Health::kUnhealthy);
    auto down = cli.Post("/mcp/files", "{}", "application/json");
    ASSERT_TRUE(down);
    EXPECT_EQ(down->status, 503);
    EXPECT_EQ(upstream_hits.load(), 0);
}

TEST_F(ProxyForwardTest, DeadUpstreamIs502) {
    upstream.Stop();
    auto cli = Client();
    auto res = cli.Post("/mcp/files", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 502);
}

TEST_F(ProxyForwardTest, ManagementEndpoints) {
    auto cli = Client();
    auto status = cli.Get("/proxy/status");
    ASSERT_TRUE(status);
    EXPECT_EQ(status->status, 200);
    EXPECT_EQ(nlohmann::json::parse(status->body)["services"][0]["name"], "files");

    auto health = cli.Get("/proxy/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(nlohmann::json::parse(health->body)["status"], "ok");

    auto index = cli.Get("/");
    ASSERT_TRUE(index);
    EXPECT_EQ(nlohmann::json::parse(index->body)["endpoints"][0]["mcp"], "/mcp/files");

    auto preflight = cli.Options("/mcp/files");
    ASSERT_TRUE(preflight);
    EXPECT_EQ(preflight->status, 204);
    EXPECT_EQ(preflight->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(ProxyForwardTest, SseStreamRecordsSessionForMessages) {
    registry.Register("search", Endpoint(18879));

    httplib::Client stream_cli("127.0.0.1", kGatewayPort);
    std::atomic<bool> stop{false};
    std::mutex events_mu;
    std::vector<SseEvent> events;
    std::thread reader([&] {
        SseEventParser parser;
        stream_cli.Get("/sse/files", [&](const char* data, size_t len) {
            auto got = parser.Feed(data, len);
            std::lock_guard<std::mutex> lock(events_mu);
            events.insert(events.end(), got.begin(), got.end());
            return !stop;
        });
    });

    bool have_session = false;
    for (int i = 0; i < 100 && !have_session; i++) {
        have_session = router.SessionService("up-42").has_value();
        if (!have_session) std::this_thread::sleep_for(50ms);
    }
    ASSERT_TRUE(have_session);
    EXPECT_EQ(*router.SessionService("up-42"), "files");
    {
        std::lock_guard<std::mutex> lock(events_mu);
        ASSERT_FALSE(events.empty());
        EXPECT_EQ(events[0].event, "endpoint");
        EXPECT_EQ(events[0].data, "/messages?session_id=up-42");
    }

    // Two services are registered, so only the recorded session can pick the target.
    auto cli = Client();
    auto res = cli.Post("/messages?session_id=up-42", R"({"jsonrpc":"2.0","id":1,"method":"ping"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    {
        std::lock_guard<std::mutex> lock(mu);
        EXPECT_EQ(last_message_session, "up-42");
    }

    auto ambiguous = cli.Post("/messages?session_id=other", "{}", "application/json");
    ASSERT_TRUE(ambiguous);
    EXPECT_EQ(ambiguous->status, 400);

    stop = true;
    stream_cli.stop();
    reader.join();
}

TEST_F(ProxyForwardTest, ClosedStreamForgetsItsSession) {
    httplib::Client stream_cli("127.0.0.1", kGatewayPort);
    std::atomic<bool> stop{false};
    std::thread reader([&] {
        httplib::Headers headers{{"Accept", "text/event-stream"}};
        stream_cli.Get("/files/ticker", headers, [&](const char*, size_t) { return !stop; });
    });

    bool have_session = false;
    for (int i = 0; i < 100 && !have_session; i++) {
        have_session = router.SessionService("tick-7").has_value();
        if (!have_session) std::this_thread::sleep_for(50ms);
    }
    ASSERT_TRUE(have_session);
    EXPECT_EQ(router.StatusJson()["sessions"], 1);

    stop = true;
    stream_cli.stop();
    reader.join();

    bool forgotten = false;
    for (int i = 0; i < 200 && !forgotten; i++) {
        forgotten = router.StatusJson()["sessions"] == 0;
        if (!forgotten) std::this_thread::sleep_for(50ms);
    }
    EXPECT_TRUE(forgotten);
    EXPECT_FALSE(router.SessionService("tick-7").has_value());
}
