#pragma once

#include "transports/transport.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace mcpgw {

// Streamable-HTTP backend: every call is one POST to /mcp on the backend's own port.
class HttpTransport : public ITransport {
 public:
  explicit HttpTransport(TransportTarget target);

  TransportKind Kind() const override { return TransportKind::kHttp; }
  bool Open(std::chrono::milliseconds timeout, GatewayError* err) override;
  std::future<RpcOutcome> Call(const std::string& method,
                               const nlohmann::json& params,
                               std::chrono::milliseconds timeout) override;
  bool Notify(const std::string& method, const nlohmann::json& params, GatewayError* err) override;

  void SetNotificationHandler(NotificationHandler handler) override;
  void SetCloseHandler(CloseHandler handler) override;

  bool IsClosed() const override { return closed_; }
  void Close() override;

 private:
  RpcOutcome Post(const nlohmann::json& body, std::chrono::milliseconds timeout, bool expect_reply);

  TransportTarget target_;
  std::atomic<bool> closed_{false};
  std::atomic<uint64_t> next_id_{1};

  std::mutex mu_;
  std::string session_id_;
  NotificationHandler notification_handler_;
  CloseHandler close_handler_;
};

}  // namespace mcpgw
