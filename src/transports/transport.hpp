#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "pending_calls.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <string>

namespace mcpgw {

// Where a transport reaches its backend. Stdio uses the pipe fds, http/sse the backend port.
struct TransportTarget {
  std::string name;
  int stdin_fd = -1;
  int stdout_fd = -1;
  std::string host = "127.0.0.1";
  int port = 0;
  int connect_timeout_seconds = 5;
};

class ITransport {
 public:
  virtual ~ITransport() = default;

  virtual TransportKind Kind() const = 0;
  virtual bool Open(std::chrono::milliseconds timeout, GatewayError* err) = 0;
  virtual std::future<RpcOutcome> Call(const std::string& method,
                                       const nlohmann::json& params,
                                       std::chrono::milliseconds timeout) = 0;
  virtual bool Notify(const std::string& method, const nlohmann::json& params, GatewayError* err) = 0;

  virtual void SetNotificationHandler(NotificationHandler handler) = 0;
  virtual void SetCloseHandler(CloseHandler handler) = 0;

  virtual bool IsClosed() const = 0;
  virtual void Close() = 0;
};

std::unique_ptr<ITransport> MakeTransport(TransportKind kind, const TransportTarget& target);

}  // namespace mcpgw
