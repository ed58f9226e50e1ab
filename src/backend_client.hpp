#pragma once

#include "errors.hpp"
#include "transports/transport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpgw {

struct ToolSpec {
  std::string name;
  std::string title;
  std::string description;
  nlohmann::json input_schema;
};

// MCP client bound to exactly one transport. Once the transport reports ChannelClosed the client is
// permanently unusable; the supervisor builds a new one for the next attempt.
class BackendClient {
 public:
  BackendClient(std::string name, std::unique_ptr<ITransport> transport);
  ~BackendClient();

  BackendClient(const BackendClient&) = delete;
  BackendClient& operator=(const BackendClient&) = delete;

  bool Open(std::chrono::milliseconds timeout, GatewayError* err);
  bool Initialize(std::chrono::milliseconds timeout, GatewayError* err);
  std::optional<std::vector<ToolSpec>> ListTools(std::chrono::milliseconds timeout, GatewayError* err);
  std::optional<nlohmann::json> CallTool(const std::string& name, const nlohmann::json& arguments, GatewayError* err);

  // Forwards one JSON-RPC message and returns the backend's reply carrying the caller's id.
  // Notifications return a null json on success.
  std::optional<nlohmann::json> Relay(const nlohmann::json& request, GatewayError* err);

  bool Notify(const std::string& method, const nlohmann::json& params, GatewayError* err);
  void SetNotificationHandler(NotificationHandler handler);
  void SetCloseHandler(CloseHandler handler);

  std::optional<std::vector<ToolSpec>> KnownTools() const;
  void SetCallTimeout(std::chrono::milliseconds timeout);

  const std::string& Name() const { return name_; }
  TransportKind Kind() const { return transport_->Kind(); }
  bool IsClosed() const { return transport_->IsClosed(); }
  void Close();

 private:
  RpcOutcome Call(const std::string& method, const nlohmann::json& params, std::chrono::milliseconds timeout);

  std::string name_;
  std::unique_ptr<ITransport> transport_;

  mutable std::mutex mu_;
  std::chrono::milliseconds call_timeout_{30000};
  std::optional<std::vector<ToolSpec>> tools_;
};

std::vector<ToolSpec> ParseToolPage(const nlohmann::json& result);
nlohmann::json ToolSpecToJson(const ToolSpec& tool);

}  // namespace mcpgw
