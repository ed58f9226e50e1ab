#pragma once

#include "backend_client.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace mcpgw {

struct BridgeOptions {
  int keepalive_seconds = 15;
  int thread_count = 8;
  size_t max_log_chars = 2000;
};

class SessionHub;

// Per-backend HTTP listener. POST /mcp relays one JSON-RPC body, GET /sse plus
// POST /messages?session_id= speak the MCP SSE transport, GET /health reports the backend.
class HttpBridge {
 public:
  HttpBridge(std::string service, uint64_t generation, std::shared_ptr<BackendClient> client, BridgeOptions opts = {});
  ~HttpBridge();

  HttpBridge(const HttpBridge&) = delete;
  HttpBridge& operator=(const HttpBridge&) = delete;

  bool Start(const std::string& host, int port, GatewayError* err);
  void Stop();

  bool IsRunning() const { return running_; }
  int Port() const { return port_; }
  uint64_t Generation() const { return generation_; }
  size_t SessionCount() const;

  // Pushes a backend notification to every open SSE session.
  void Broadcast(const std::string& method, const nlohmann::json& params);

 private:
  void RegisterRoutes();
  std::optional<nlohmann::json> RelayOne(const nlohmann::json& request, GatewayError* err);

  std::string service_;
  uint64_t generation_;
  std::shared_ptr<BackendClient> client_;
  BridgeOptions opts_;
  std::shared_ptr<SessionHub> hub_;

  std::unique_ptr<httplib::Server> server_;
  std::thread listen_thread_;
  std::atomic<bool> running_{false};
  int port_ = 0;
};

}  // namespace mcpgw
