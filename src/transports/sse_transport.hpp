#pragma once

#include "pending_calls.hpp"
#include "transports/transport.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace httplib {
class Client;
}

namespace mcpgw {

// Legacy MCP SSE backend: replies arrive on a long-lived GET /sse stream, requests are POSTed to the
// endpoint the stream announces first.
class SseTransport : public ITransport {
 public:
  explicit SseTransport(TransportTarget target);
  ~SseTransport() override;

  TransportKind Kind() const override { return TransportKind::kSse; }
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
  using Clock = std::chrono::steady_clock;

  void StreamLoop();
  void ReaperLoop();
  void HandleEvent(const std::string& event, const std::string& data);
  bool PostMessage(const nlohmann::json& msg, GatewayError* err);
  void Fail(ErrorCode code, const std::string& message, bool notify);

  TransportTarget target_;
  PendingCalls pending_;
  std::unique_ptr<httplib::Client> stream_client_;
  Clock::time_point connect_deadline_{};

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::string endpoint_;
  bool closed_ = false;
  GatewayError close_reason_;
  NotificationHandler notification_handler_;
  CloseHandler close_handler_;

  std::atomic<bool> stop_{false};
  std::thread stream_thread_;
  std::thread reaper_thread_;
};

}  // namespace mcpgw
