#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcpgw {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 1888;
};

struct PortRange {
  int first = 8000;
  int last = 8999;
};

enum class TransportKind { kStdio, kHttp, kSse };

const char* TransportKindName(TransportKind kind);
std::optional<TransportKind> ParseTransportKind(const std::string& s);

struct BackendDescriptor {
  std::string name;
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  std::string working_dir;
  TransportKind transport = TransportKind::kStdio;
  int timeout_ms = 30000;
  bool auto_restart = true;
  int max_restarts = 3;
  int restart_backoff_ms = 1000;
  std::optional<int> port_hint;
  std::string description;
};

// An MCP server started outside the gateway that announces itself for routing.
struct ExternalEndpoint {
  std::string name;
  std::string host = "127.0.0.1";
  int port = 0;
  TransportKind transport = TransportKind::kSse;
  int64_t pid = 0;
};

struct GatewayConfig {
  HttpListenConfig listen;
  std::string bridge_host = "127.0.0.1";
  PortRange ports;
  int health_interval_ms = 10000;
  int unhealthy_threshold = 3;
  int stop_grace_ms = 5000;
  int max_backoff_ms = 30000;
  int restart_reset_ms = 60000;
  int upstream_timeout_seconds = 30;
  int connect_timeout_seconds = 5;
  std::vector<BackendDescriptor> backends;
  std::string backends_error;
};

GatewayConfig LoadConfigFromEnv();

std::optional<BackendDescriptor> ParseBackendDescriptor(const nlohmann::json& j, std::string* err);
std::optional<std::vector<BackendDescriptor>> ParseBackendDescriptors(const std::string& json_text, std::string* err);
bool ValidateDescriptor(const BackendDescriptor& d, std::string* err);
bool IsValidServiceName(const std::string& name);

// Accepts "server_name" or "name"; "port" may be a number or a numeric string.
std::optional<ExternalEndpoint> ParseExternalEndpoint(const nlohmann::json& j, std::string* err);
nlohmann::json ExternalEndpointToJson(const ExternalEndpoint& e);

nlohmann::json DescriptorToJson(const BackendDescriptor& d);

}  // namespace mcpgw
