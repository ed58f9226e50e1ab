#include "transports/stdio_transport.hpp"

#include <utility>

namespace mcpgw {

StdioTransport::StdioTransport(const TransportTarget& target)
    : channel_(target.name, target.stdout_fd, target.stdin_fd) {}

bool StdioTransport::Open(std::chrono::milliseconds, GatewayError* err) {
  if (channel_.IsClosed()) {
    auto reason = channel_.CloseReason();
    SetError(err, reason.code, reason.message);
    return false;
  }
  channel_.Start();
  return true;
}

std::future<RpcOutcome> StdioTransport::Call(const std::string& method,
                                             const nlohmann::json& params,
                                             std::chrono::milliseconds timeout) {
  return channel_.Send(method, params, timeout);
}

bool StdioTransport::Notify(const std::string& method, const nlohmann::json& params, GatewayError* err) {
  return channel_.Notify(method, params, err);
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) {
  channel_.OnNotification(std::move(handler));
}

void StdioTransport::SetCloseHandler(CloseHandler handler) {
  channel_.OnClose(std::move(handler));
}

bool StdioTransport::IsClosed() const {
  return channel_.IsClosed();
}

void StdioTransport::Close() {
  channel_.Close();
}

}  // namespace mcpgw
