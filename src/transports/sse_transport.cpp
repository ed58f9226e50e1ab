#include "transports/sse_transport.hpp"

#include "transports/sse_events.hpp"

#include <httplib.h>

#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

namespace mcpgw {
namespace {

constexpr int kReapSliceMs = 100;

// The endpoint event may carry either a path or an absolute URL on the backend's own origin.
static std::string EndpointPath(const std::string& announced) {
  const auto scheme = announced.find("://");
  if (scheme == std::string::npos) return announced.empty() || announced[0] == '/' ? announced : "/" + announced;
  const auto slash = announced.find('/', scheme + 3);
  return slash == std::string::npos ? "/" : announced.substr(slash);
}

}  // namespace

SseTransport::SseTransport(TransportTarget target) : target_(std::move(target)) {}

SseTransport::~SseTransport() {
  Close();
}

bool SseTransport::Open(std::chrono::milliseconds timeout, GatewayError* err) {
  const auto deadline = Clock::now() + timeout;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
      SetError(err, close_reason_.code, close_reason_.message);
      return false;
    }
    stream_client_ = std::make_unique<httplib::Client>(target_.host, target_.port);
    stream_client_->set_connection_timeout(target_.connect_timeout_seconds);
    stream_client_->set_read_timeout(24 * 60 * 60, 0);
    connect_deadline_ = deadline;
  }
  stream_thread_ = std::thread([this] { StreamLoop(); });
  reaper_thread_ = std::thread([this] { ReaperLoop(); });

  std::unique_lock<std::mutex> lock(mu_);
  const bool ready = cv_.wait_until(lock, deadline, [&] { return closed_ || !endpoint_.empty(); });
  if (closed_) {
    SetError(err, close_reason_.code, close_reason_.message);
    return false;
  }
  if (!ready) {
    SetError(err, ErrorCode::kTimeout, target_.name + ": no endpoint event on /sse");
    return false;
  }
  return true;
}

std::future<RpcOutcome> SseTransport::Call(const std::string& method,
                                           const nlohmann::json& params,
                                           std::chrono::milliseconds timeout) {
  PendingCalls::Ticket ticket;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) return ReadyOutcome(MakeFailedOutcome(close_reason_.code, close_reason_.message));
    ticket = pending_.Add(method, Clock::now() + timeout);
  }

  nlohmann::json req;
  req["jsonrpc"] = "2.0";
  req["id"] = ticket.id;
  req["method"] = method;
  req["params"] = params.is_null() ? nlohmann::json::object() : params;

  GatewayError err;
  if (!PostMessage(req, &err)) pending_.Resolve(ticket.id, MakeFailedOutcome(err.code, err.message));
  return std::move(ticket.future);
}

bool SseTransport::Notify(const std::string& method, const nlohmann::json& params, GatewayError* err) {
  nlohmann::json msg;
  msg["jsonrpc"] = "2.0";
  msg["method"] = method;
  if (!params.is_null()) msg["params"] = params;
  return PostMessage(msg, err);
}

void SseTransport::SetNotificationHandler(NotificationHandler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  notification_handler_ = std::move(handler);
}

void SseTransport::SetCloseHandler(CloseHandler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  close_handler_ = std::move(handler);
}

bool SseTransport::IsClosed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

void SseTransport::Close() {
  stop_ = true;
  Fail(ErrorCode::kChannelClosed, "transport closed", false);
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stream_client_) stream_client_->stop();
  }
  if (stream_thread_.joinable() && stream_thread_.get_id() != std::this_thread::get_id()) stream_thread_.join();
  if (reaper_thread_.joinable() && reaper_thread_.get_id() != std::this_thread::get_id()) reaper_thread_.join();
}

bool SseTransport::PostMessage(const nlohmann::json& msg, GatewayError* err) {
  std::string path;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
      SetError(err, close_reason_.code, close_reason_.message);
      return false;
    }
    path = endpoint_;
  }
  if (path.empty()) {
    SetError(err, ErrorCode::kProtocolError, target_.name + ": endpoint not announced yet");
    return false;
  }

  httplib::Client cli(target_.host, target_.port);
  cli.set_connection_timeout(target_.connect_timeout_seconds);
  cli.set_read_timeout(10, 0);
  auto res = cli.Post(path, msg.dump(), "application/json");
  if (!res) {
    SetError(err, ErrorCode::kChannelClosed, target_.name + ": post failed: " + httplib::to_string(res.error()));
    return false;
  }
  if (res->status < 200 || res->status >= 300) {
    SetError(err, ErrorCode::kUpstreamError, target_.name + ": post http " + std::to_string(res->status));
    return false;
  }
  return true;
}

void SseTransport::StreamLoop() {
  SseEventParser parser;
  int status = 0;
  auto on_response = [&](const httplib::Response& r) {
    status = r.status;
    return r.status == 200;
  };
  auto on_data = [&](const char* data, size_t len) {
    for (auto& ev : parser.Feed(data, len)) {
      HandleEvent(ev.event, ev.data);
      if (IsClosed()) return false;
    }
    return !stop_;
  };

  // A freshly spawned backend may not be listening yet; retry the connect until Open's deadline.
  httplib::Error error = httplib::Error::Success;
  bool got_response = false;
  for (;;) {
    auto res = stream_client_->Get("/sse", httplib::Headers{{"Accept", "text/event-stream"}}, on_response, on_data);
    got_response = static_cast<bool>(res);
    error = res.error();
    if (got_response || status != 0 || error != httplib::Error::Connection || stop_) break;
    if (Clock::now() >= connect_deadline_) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (stop_) return;
  if (!got_response && status == 0) {
    Fail(ErrorCode::kChannelClosed, "event stream failed: " + httplib::to_string(error), true);
  } else if (status != 200) {
    Fail(ErrorCode::kProtocolError, "event stream http " + std::to_string(status), true);
  } else {
    Fail(ErrorCode::kChannelClosed, "event stream ended", true);
  }
}

void SseTransport::ReaperLoop() {
  while (!stop_ && !IsClosed()) {
    auto wait = std::chrono::milliseconds(kReapSliceMs);
    if (auto next = pending_.NextDeadline()) {
      auto until = std::chrono::duration_cast<std::chrono::milliseconds>(*next - Clock::now());
      wait = std::clamp(until, std::chrono::milliseconds(0), wait);
    }
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, wait, [&] { return closed_; });
    }
    pending_.ExpireDue(Clock::now());
  }
}

void SseTransport::HandleEvent(const std::string& event, const std::string& data) {
  if (event == "endpoint") {
    {
      std::lock_guard<std::mutex> lock(mu_);
      endpoint_ = EndpointPath(data);
    }
    cv_.notify_all();
    return;
  }
  if (event != "message") return;

  auto j = nlohmann::json::parse(data, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    Fail(ErrorCode::kProtocolError, "unparseable event data", true);
    return;
  }

  const bool has_method = j.contains("method") && j["method"].is_string();
  const bool has_id = j.contains("id") && !j["id"].is_null();
  if (has_method && has_id) {
    const auto method = j["method"].get<std::string>();
    nlohmann::json reply;
    reply["jsonrpc"] = "2.0";
    reply["id"] = j["id"];
    if (method == "ping") {
      reply["result"] = nlohmann::json::object();
    } else {
      reply["error"] = {{"code", -32601}, {"message", "method not found: " + method}};
    }
    GatewayError err;
    if (!PostMessage(reply, &err)) {
      std::cout << "[channel] name=" << target_.name << " reply dropped method=" << method
                << " error=" << err.ToString() << "\n";
    }
    return;
  }
  if (has_method) {
    NotificationHandler handler;
    {
      std::lock_guard<std::mutex> lock(mu_);
      handler = notification_handler_;
    }
    if (handler) handler(j["method"].get<std::string>(), j.value("params", nlohmann::json::object()));
    return;
  }
  if (!has_id) return;

  const auto id = JsonRpcIdToString(j["id"]);
  if (!pending_.Resolve(id, OutcomeFromResponse(j))) {
    std::cout << "[channel] name=" << target_.name << " dropped unmatched response id=" << id << "\n";
  }
}

void SseTransport::Fail(ErrorCode code, const std::string& message, bool notify) {
  CloseHandler handler;
  GatewayError reason;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) return;
    closed_ = true;
    close_reason_.code = code;
    close_reason_.message = target_.name + ": " + message;
    reason = close_reason_;
    if (notify) handler = close_handler_;
  }
  cv_.notify_all();
  if (notify) {
    std::cout << "[channel] name=" << target_.name << " closed error=" << ErrorCodeName(code)
              << " reason=" << message << "\n";
  }
  pending_.FailAll(reason);
  if (handler) handler(reason);
}

}  // namespace mcpgw
