#include "http_bridge.hpp"

#include "http_util.hpp"
#include "util.hpp"

#include <httplib.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <map>
#include <mutex>
#include <utility>

namespace mcpgw {

struct SessionStream {
  std::mutex mu;
  std::condition_variable cv;
  std::deque<std::string> events;
  bool closed = false;
};

class SessionHub {
 public:
  std::shared_ptr<SessionStream> Open(const std::string& id) {
    auto s = std::make_shared<SessionStream>();
    std::lock_guard<std::mutex> lock(mu_);
    streams_[id] = s;
    return s;
  }

  bool Push(const std::string& id, std::string event) {
    std::shared_ptr<SessionStream> s;
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto it = streams_.find(id);
      if (it == streams_.end()) return false;
      s = it->second;
    }
    Enqueue(s, std::move(event));
    return true;
  }

  size_t Broadcast(const std::string& event) {
    std::map<std::string, std::shared_ptr<SessionStream>> copy;
    {
      std::lock_guard<std::mutex> lock(mu_);
      copy = streams_;
    }
    for (auto& kv : copy) Enqueue(kv.second, event);
    return copy.size();
  }

  bool Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return streams_.count(id) > 0;
  }

  void Close(const std::string& id) {
    std::shared_ptr<SessionStream> s;
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto it = streams_.find(id);
      if (it == streams_.end()) return;
      s = it->second;
      streams_.erase(it);
    }
    Shut(s);
  }

  void CloseAll() {
    std::map<std::string, std::shared_ptr<SessionStream>> all;
    {
      std::lock_guard<std::mutex> lock(mu_);
      all.swap(streams_);
    }
    for (auto& kv : all) Shut(kv.second);
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return streams_.size();
  }

 private:
  static void Enqueue(const std::shared_ptr<SessionStream>& s, std::string event) {
    {
      std::lock_guard<std::mutex> lock(s->mu);
      if (s->closed) return;
      s->events.push_back(std::move(event));
    }
    s->cv.notify_all();
  }

  static void Shut(const std::shared_ptr<SessionStream>& s) {
    {
      std::lock_guard<std::mutex> lock(s->mu);
      s->closed = true;
    }
    s->cv.notify_all();
  }

  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<SessionStream>> streams_;
};

HttpBridge::HttpBridge(std::string service,
                       uint64_t generation,
                       std::shared_ptr<BackendClient> client,
                       BridgeOptions opts)
    : service_(std::move(service)),
      generation_(generation),
      client_(std::move(client)),
      opts_(opts),
      hub_(std::make_shared<SessionHub>()) {
  std::weak_ptr<SessionHub> weak = hub_;
  const std::string service_name = service_;
  client_->SetNotificationHandler([weak, service_name](const std::string& method, const nlohmann::json& params) {
    auto hub = weak.lock();
    if (!hub) return;
    nlohmann::json msg;
    msg["jsonrpc"] = "2.0";
    msg["method"] = method;
    msg["params"] = params;
    const auto n = hub->Broadcast(FormatSseEvent("message", msg.dump()));
    std::cout << "[bridge] name=" << service_name << " notification method=" << method << " sessions=" << n << "\n";
  });
}

HttpBridge::~HttpBridge() {
  Stop();
}

size_t HttpBridge::SessionCount() const {
  return hub_->Size();
}

void HttpBridge::Broadcast(const std::string& method, const nlohmann::json& params) {
  nlohmann::json msg;
  msg["jsonrpc"] = "2.0";
  msg["method"] = method;
  msg["params"] = params;
  hub_->Broadcast(FormatSseEvent("message", msg.dump()));
}

bool HttpBridge::Start(const std::string& host, int port, GatewayError* err) {
  if (running_) {
    SetError(err, ErrorCode::kAlreadyExists, service_ + ": bridge already running");
    return false;
  }
  server_ = std::make_unique<httplib::Server>();
  const int threads = opts_.thread_count > 0 ? opts_.thread_count : 8;
  server_->new_task_queue = [threads] { return new httplib::ThreadPool(static_cast<size_t>(threads)); };
  server_->set_keep_alive_timeout(5);
  server_->set_read_timeout(60);
  server_->set_write_timeout(60);
  InstallJsonErrorHandlers(server_.get());
  RegisterRoutes();

  if (!server_->bind_to_port(host, port)) {
    SetError(err, ErrorCode::kPortConflict, service_ + ": bridge bind failed on " + host + ":" + std::to_string(port));
    server_.reset();
    return false;
  }
  port_ = port;
  running_ = true;
  listen_thread_ = std::thread([this] {
    const bool ok = server_->listen_after_bind();
    std::cout << "[bridge] name=" << service_ << " listen returned ok=" << (ok ? 1 : 0) << "\n";
  });
  std::cout << "[bridge] name=" << service_ << " listen host=" << host << " port=" << port
            << " generation=" << generation_ << "\n";
  return true;
}

void HttpBridge::Stop() {
  hub_->CloseAll();
  if (server_) server_->stop();
  if (listen_thread_.joinable()) listen_thread_.join();
  if (running_.exchange(false)) {
    std::cout << "[bridge] name=" << service_ << " stopped port=" << port_ << "\n";
  }
  server_.reset();
}

std::optional<nlohmann::json> HttpBridge::RelayOne(const nlohmann::json& request, GatewayError* err) {
  const auto method = request.is_object() ? request.value("method", std::string()) : std::string();
  const auto id = request.is_object() && request.contains("id") ? request["id"].dump() : std::string("-");
  std::cout << "[bridge] name=" << service_ << " call method=" << method << " id=" << id
            << " request=" << TruncateForLog(SanitizeJsonForLog(request), opts_.max_log_chars) << "\n";

  GatewayError local;
  auto r = client_->Relay(request, &local);
  if (!r) {
    std::cout << "[bridge] name=" << service_ << " result method=" << method << " id=" << id
              << " ok=0 error=" << local.ToString() << "\n";
    SetError(err, local.code, local.message);
    return std::nullopt;
  }
  const bool ok = r->is_null() || !r->contains("error");
  std::cout << "[bridge] name=" << service_ << " result method=" << method << " id=" << id << " ok=" << (ok ? 1 : 0)
            << " response=" << TruncateForLog(SanitizeJsonForLog(*r), opts_.max_log_chars) << "\n";
  return r;
}

void HttpBridge::RegisterRoutes() {
  auto* server = server_.get();

  server->Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || (!body.is_object() && !body.is_array())) {
      nlohmann::json j;
      j["jsonrpc"] = "2.0";
      j["id"] = nullptr;
      j["error"] = {{"code", -32700}, {"message", "parse error"}};
      SendJson(&res, 400, j);
      return;
    }

    if (body.is_array()) {
      nlohmann::json out = nlohmann::json::array();
      for (const auto& item : body) {
        GatewayError err;
        auto r = RelayOne(item, &err);
        if (!r) {
          out.push_back(JsonRpcErrorFor(item.is_object() ? item.value("id", nlohmann::json()) : nlohmann::json(), err));
        } else if (!r->is_null()) {
          out.push_back(*r);
        }
      }
      if (out.empty()) {
        res.status = 202;
        return;
      }
      SendJson(&res, 200, out);
      return;
    }

    GatewayError err;
    auto r = RelayOne(body, &err);
    if (!r) {
      SendJson(&res, HttpStatusFor(err.code), JsonRpcErrorFor(body.value("id", nlohmann::json()), err));
      return;
    }
    if (r->is_null()) {
      res.status = 202;
      return;
    }
    SendJson(&res, 200, *r);
  });

  server->Get("/sse", [this](const httplib::Request&, httplib::Response& res) {
    const auto session_id = NewId("sess");
    auto stream = hub_->Open(session_id);
    std::cout << "[bridge] name=" << service_ << " sse open session=" << session_id << "\n";

    const auto endpoint_event = FormatSseEvent("endpoint", "/messages?session_id=" + session_id);
    const auto keepalive = std::chrono::seconds(opts_.keepalive_seconds > 0 ? opts_.keepalive_seconds : 15);
    std::weak_ptr<SessionHub> weak = hub_;
    const std::string service_name = service_;

    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");
    res.set_chunked_content_provider(
        "text/event-stream",
        [stream, endpoint_event, keepalive, sent_endpoint = false,
         last_write = std::chrono::steady_clock::now()](size_t, httplib::DataSink& sink) mutable {
          auto write_bytes = [&](const std::string& s) -> bool {
            if (sink.is_writable && !sink.is_writable()) return false;
            if (!sink.write) return false;
            if (!sink.write(s.data(), s.size())) return false;
            last_write = std::chrono::steady_clock::now();
            return true;
          };

          if (!sent_endpoint) {
            sent_endpoint = true;
            return write_bytes(endpoint_event);
          }

          std::deque<std::string> batch;
          bool closed = false;
          {
            std::unique_lock<std::mutex> lock(stream->mu);
            stream->cv.wait_for(lock, std::chrono::seconds(1), [&] { return stream->closed || !stream->events.empty(); });
            batch.swap(stream->events);
            closed = stream->closed;
          }
          for (const auto& ev : batch) {
            if (!write_bytes(ev)) return false;
          }
          if (closed) {
            sink.done();
            return true;
          }
          if (batch.empty() && std::chrono::steady_clock::now() - last_write >= keepalive) {
            return write_bytes(": keepalive\n\n");
          }
          return true;
        },
        [weak, session_id, service_name](bool) {
          if (auto hub = weak.lock()) hub->Close(session_id);
          std::cout << "[bridge] name=" << service_name << " sse closed session=" << session_id << "\n";
        });
  });

  server->Post("/messages", [this](const httplib::Request& req, httplib::Response& res) {
    const auto session_id = req.get_param_value("session_id");
    if (session_id.empty()) {
      SendJson(&res, 400, MakeError("missing session_id", "invalid_request_error"));
      return;
    }
    if (!hub_->Contains(session_id)) {
      SendJson(&res, 404, MakeError("unknown session: " + session_id, "invalid_request_error"));
      return;
    }
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
      SendJson(&res, 400, MakeError("body must be a json-rpc object", "invalid_request_error"));
      return;
    }

    GatewayError err;
    auto r = RelayOne(body, &err);
    nlohmann::json reply;
    if (!r) {
      if (err.code == ErrorCode::kInvalidArgument) {
        SendJson(&res, 400, MakeError(err.message, "invalid_request_error"));
        return;
      }
      reply = JsonRpcErrorFor(body.value("id", nlohmann::json()), err);
    } else {
      reply = *r;
    }
    if (!reply.is_null()) hub_->Push(session_id, FormatSseEvent("message", reply.dump()));
    res.status = 202;
    res.set_content("Accepted", "text/plain");
  });

  server->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
    const bool up = !client_->IsClosed();
    nlohmann::json j;
    j["ok"] = up;
    j["service"] = service_;
    j["generation"] = generation_;
    j["transport"] = TransportKindName(client_->Kind());
    j["sessions"] = hub_->Size();
    if (auto tools = client_->KnownTools()) j["tools"] = tools->size();
    SendJson(&res, up ? 200 : 503, j);
  });
}

}  // namespace mcpgw
