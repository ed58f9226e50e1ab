#pragma once

#include "framed_channel.hpp"
#include "transports/transport.hpp"

namespace mcpgw {

class StdioTransport : public ITransport {
 public:
  explicit StdioTransport(const TransportTarget& target);

  TransportKind Kind() const override { return TransportKind::kStdio; }
  bool Open(std::chrono::milliseconds timeout, GatewayError* err) override;
  std::future<RpcOutcome> Call(const std::string& method,
                               const nlohmann::json& params,
                               std::chrono::milliseconds timeout) override;
  bool Notify(const std::string& method, const nlohmann::json& params, GatewayError* err) override;

  void SetNotificationHandler(NotificationHandler handler) override;
  void SetCloseHandler(CloseHandler handler) override;

  bool IsClosed() const override;
  void Close() override;

 private:
  FramedChannel channel_;
};

}  // namespace mcpgw
