#include "transports/http_transport.hpp"

#include "transports/sse_events.hpp"

#include <httplib.h>

#include <iostream>
#include <memory>
#include <thread>
#include <utility>

namespace mcpgw {
namespace {

constexpr const char* kRpcPath = "/mcp";

static std::unique_ptr<httplib::Client> MakeClient(const TransportTarget& target, std::chrono::milliseconds timeout) {
  auto cli = std::make_unique<httplib::Client>(target.host, target.port);
  cli->set_connection_timeout(target.connect_timeout_seconds);
  const auto ms = timeout.count() > 0 ? timeout.count() : 1;
  cli->set_read_timeout(static_cast<time_t>(ms / 1000), static_cast<time_t>((ms % 1000) * 1000));
  cli->set_write_timeout(static_cast<time_t>(ms / 1000), static_cast<time_t>((ms % 1000) * 1000));
  return cli;
}

// Streamable-HTTP servers may answer a POST with a short event stream instead of a JSON body.
static nlohmann::json ExtractReply(const std::string& content_type, const std::string& body, const nlohmann::json& id) {
  if (content_type.find("text/event-stream") == std::string::npos) {
    return nlohmann::json::parse(body, nullptr, false);
  }
  for (const auto& ev : ParseSseBody(body)) {
    auto j = nlohmann::json::parse(ev.data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) continue;
    if (j.contains("id") && j["id"] == id) return j;
  }
  return nlohmann::json(nlohmann::json::value_t::discarded);
}

}  // namespace

HttpTransport::HttpTransport(TransportTarget target) : target_(std::move(target)) {}

bool HttpTransport::Open(std::chrono::milliseconds timeout, GatewayError* err) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!closed_) {
    auto cli = MakeClient(target_, std::chrono::milliseconds(1000));
    cli->set_connection_timeout(1);
    // Any HTTP answer means the backend is listening; 404/405 on "/" is expected.
    if (auto res = cli->Get("/")) return true;
    if (std::chrono::steady_clock::now() >= deadline) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  SetError(err, ErrorCode::kTimeout,
           target_.name + ": backend not accepting connections on port " + std::to_string(target_.port));
  return false;
}

std::future<RpcOutcome> HttpTransport::Call(const std::string& method,
                                            const nlohmann::json& params,
                                            std::chrono::milliseconds timeout) {
  if (closed_) return ReadyOutcome(MakeFailedOutcome(ErrorCode::kChannelClosed, target_.name + ": transport closed"));

  nlohmann::json req;
  req["jsonrpc"] = "2.0";
  req["id"] = std::to_string(next_id_++);
  req["method"] = method;
  req["params"] = params.is_null() ? nlohmann::json::object() : params;
  return std::async(std::launch::async, [this, req, timeout] { return Post(req, timeout, true); });
}

bool HttpTransport::Notify(const std::string& method, const nlohmann::json& params, GatewayError* err) {
  if (closed_) {
    SetError(err, ErrorCode::kChannelClosed, target_.name + ": transport closed");
    return false;
  }
  nlohmann::json msg;
  msg["jsonrpc"] = "2.0";
  msg["method"] = method;
  if (!params.is_null()) msg["params"] = params;
  auto outcome = Post(msg, std::chrono::seconds(5), false);
  if (!outcome.ok) {
    SetError(err, outcome.error.code, outcome.error.message);
    return false;
  }
  return true;
}

void HttpTransport::SetNotificationHandler(NotificationHandler handler) {
  // Plain request/response POSTs carry no server-initiated messages.
  std::lock_guard<std::mutex> lock(mu_);
  notification_handler_ = std::move(handler);
}

void HttpTransport::SetCloseHandler(CloseHandler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  close_handler_ = std::move(handler);
}

void HttpTransport::Close() {
  closed_ = true;
}

RpcOutcome HttpTransport::Post(const nlohmann::json& body, std::chrono::milliseconds timeout, bool expect_reply) {
  auto cli = MakeClient(target_, timeout);
  httplib::Headers headers{{"Accept", "application/json, text/event-stream"}};
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!session_id_.empty()) headers.emplace("Mcp-Session-Id", session_id_);
  }

  auto res = cli->Post(kRpcPath, headers, body.dump(), "application/json");
  if (!res) {
    const auto e = res.error();
    if (e == httplib::Error::Read || e == httplib::Error::Write) {
      return MakeFailedOutcome(ErrorCode::kTimeout, target_.name + ": no reply within deadline");
    }
    GatewayError reason{ErrorCode::kChannelClosed, target_.name + ": " + httplib::to_string(e)};
    CloseHandler handler;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!closed_.exchange(true)) handler = close_handler_;
    }
    if (handler) {
      std::cout << "[channel] name=" << target_.name << " closed error=" << ErrorCodeName(reason.code)
                << " reason=" << reason.message << "\n";
      handler(reason);
    }
    return MakeFailedOutcome(reason.code, reason.message);
  }

  if (res->has_header("Mcp-Session-Id")) {
    std::lock_guard<std::mutex> lock(mu_);
    session_id_ = res->get_header_value("Mcp-Session-Id");
  }
  if (res->status < 200 || res->status >= 300) {
    return MakeFailedOutcome(ErrorCode::kUpstreamError, target_.name + ": http " + std::to_string(res->status));
  }
  if (!expect_reply) {
    RpcOutcome ok;
    ok.ok = true;
    return ok;
  }

  auto reply = ExtractReply(res->get_header_value("Content-Type"), res->body, body["id"]);
  if (reply.is_discarded() || !reply.is_object()) {
    return MakeFailedOutcome(ErrorCode::kProtocolError, target_.name + ": invalid json-rpc reply");
  }
  return OutcomeFromResponse(reply);
}

}  // namespace mcpgw
