#include "proxy_router.hpp"

#include "http_util.hpp"
#include "util.hpp"

#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <set>
#include <thread>
#include <utility>

namespace mcpgw {
namespace {

constexpr const char* kServerNameHeader = "X-MCP-Server-Name";

static bool IsHopByHop(const std::string& name) {
  static const std::set<std::string> kHop = {"connection", "keep-alive",  "proxy-authenticate", "proxy-authorization",
                                             "te",         "trailer",     "transfer-encoding",  "upgrade",
                                             "host",       "content-length"};
  return kHop.count(ToLower(name)) > 0;
}

static std::string PercentEncode(const std::string& s) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0f]);
    }
  }
  return out;
}

static std::string QueryString(const httplib::Params& params) {
  std::string out;
  for (const auto& kv : params) {
    out += out.empty() ? "?" : "&";
    out += PercentEncode(kv.first);
    out += "=";
    out += PercentEncode(kv.second);
  }
  return out;
}

static bool PrefixMatches(const std::string& path, const std::string& prefix) {
  if (!StartsWith(path, prefix)) return false;
  return path.size() == prefix.size() || path[prefix.size()] == '/';
}

static bool WantsEventStream(const httplib::Request& req, const std::string& upstream_path) {
  if (req.method != "GET") return false;
  if (req.get_header_value("Accept").find("text/event-stream") != std::string::npos) return true;
  const std::string suffix = "/sse";
  return upstream_path.size() >= suffix.size() &&
         upstream_path.compare(upstream_path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static void SetCorsHeaders(httplib::Response& res) {
  res.set_header("Access-Control-Allow-Origin", "*");
  res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, PATCH, DELETE, OPTIONS");
  res.set_header("Access-Control-Allow-Headers", "*");
  res.set_header("Access-Control-Max-Age", "86400");
}

// Scans relayed SSE bytes for "session_id=<id>"; a short tail is carried across chunk boundaries.
class SessionSniffer {
 public:
  std::vector<std::string> Feed(const char* data, size_t len) {
    std::vector<std::string> found;
    std::string text = carry_ + std::string(data, len);
    const std::string key = "session_id=";
    size_t pos = 0;
    size_t consumed = 0;
    while ((pos = text.find(key, pos)) != std::string::npos) {
      size_t end = pos + key.size();
      while (end < text.size() && (std::isalnum(static_cast<unsigned char>(text[end])) || text[end] == '-' ||
                                   text[end] == '_')) {
        end++;
      }
      if (end == text.size()) break;
      if (end > pos + key.size()) found.push_back(text.substr(pos + key.size(), end - pos - key.size()));
      pos = end;
      consumed = end;
    }
    const size_t keep_from = std::max(consumed, text.size() > 128 ? text.size() - 128 : size_t{0});
    carry_ = text.substr(keep_from);
    return found;
  }

 private:
  std::string carry_;
};

// One upstream event stream. The upstream GET runs on its own thread and queues chunks for the
// downstream chunked provider.
struct SseRelay {
  std::mutex mu;
  std::condition_variable cv;
  std::deque<std::string> chunks;
  bool headers_received = false;
  bool finished = false;
  int status = 0;
  std::string content_type;
  std::string error;
  std::vector<std::string> session_ids;
  std::atomic<bool> cancelled{false};
  std::unique_ptr<httplib::Client> cli;
  std::thread thread;

  void Cancel() {
    cancelled = true;
    if (cli) cli->stop();
    if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) thread.join();
  }
};

}  // namespace

ProxyRouter::ProxyRouter(ServiceRegistry* registry, RouterOptions opts)
    : registry_(registry), opts_(opts), routes_(std::make_shared<const std::vector<RouteEntry>>()) {
  Rebuild();
  subscription_ = registry_->Subscribe([this](const RegistryEvent& ev) {
    // kUpdated always carries a newer generation, whose bridge has never seen the old sessions.
    if (ev.kind == RegistryEventKind::kRemoved || ev.kind == RegistryEventKind::kUpdated) {
      DropSessionsOf(ev.endpoint.name);
    }
    Rebuild();
  });
}

ProxyRouter::~ProxyRouter() {
  registry_->Unsubscribe(subscription_);
}

std::vector<RouteEntry> ProxyRouter::BuildRoutes(const ServiceRegistry::Map& endpoints) {
  std::vector<RouteEntry> out;
  for (const auto& kv : endpoints) {
    const auto& name = kv.first;
    out.push_back({"/mcp/" + name, name, "/mcp"});
    out.push_back({"/sse/" + name, name, "/sse"});
    // These names would shadow the router's own endpoints.
    if (name != "proxy" && name != "messages") out.push_back({"/" + name, name, ""});
  }
  std::stable_sort(out.begin(), out.end(), [](const RouteEntry& a, const RouteEntry& b) {
    return a.path_prefix.size() > b.path_prefix.size();
  });
  return out;
}

void ProxyRouter::Rebuild() {
  auto snap = registry_->Snapshot();
  std::shared_ptr<const std::vector<RouteEntry>> next =
      std::make_shared<const std::vector<RouteEntry>>(BuildRoutes(*snap));
  std::atomic_store(&routes_, next);
  std::cout << "[proxy] routes rebuilt count=" << next->size() << "\n";
}

std::vector<RouteEntry> ProxyRouter::Routes() const {
  return *std::atomic_load(&routes_);
}

RouteDecision ProxyRouter::Resolve(const std::string& service, const std::string& upstream_path) const {
  RouteDecision d;
  d.service = service;
  d.upstream_path = upstream_path;
  auto ep = registry_->Get(service);
  if (!ep) {
    d.status = 404;
    d.reason = "service not registered: " + service;
    return d;
  }
  d.host = ep->host;
  d.port = ep->port;
  d.generation = ep->generation;
  if (ep->health != Health::kHealthy) {
    d.status = 503;
    d.reason = "service " + service + " is " + HealthName(ep->health);
    return d;
  }
  d.status = 200;
  return d;
}

RouteDecision ProxyRouter::Route(const std::string& path) const {
  auto routes = std::atomic_load(&routes_);
  for (const auto& r : *routes) {
    if (!PrefixMatches(path, r.path_prefix)) continue;
    std::string upstream = r.upstream_prefix + path.substr(r.path_prefix.size());
    if (upstream.empty()) upstream = "/";
    return Resolve(r.service_name, upstream);
  }
  RouteDecision d;
  d.status = 404;
  d.reason = "no route for " + path;
  return d;
}

RouteDecision ProxyRouter::RouteMessages(const std::string& server_name,
                                         const std::string& header_name,
                                         const std::string& session_id) const {
  if (!server_name.empty()) return Resolve(server_name, "/messages");
  if (!header_name.empty()) return Resolve(header_name, "/messages");
  if (!session_id.empty()) {
    if (auto svc = SessionService(session_id)) return Resolve(*svc, "/messages");
  }

  auto snap = registry_->Snapshot();
  if (snap->size() == 1) return Resolve(snap->begin()->first, "/messages");

  RouteDecision d;
  d.status = 400;
  std::string names;
  for (const auto& kv : *snap) names += (names.empty() ? "" : ", ") + kv.first;
  d.reason = "cannot determine target service; pass server_name or " + std::string(kServerNameHeader) +
             " (available: " + (names.empty() ? "none" : names) + ")";
  return d;
}

void ProxyRouter::RecordSession(const std::string& session_id, const std::string& service) {
  std::lock_guard<std::mutex> lock(sessions_mu_);
  sessions_[session_id] = service;
}

std::optional<std::string> ProxyRouter::SessionService(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(sessions_mu_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return std::nullopt;
  return it->second;
}

void ProxyRouter::ForgetSessions(const std::vector<std::string>& session_ids, const std::string& service) {
  if (session_ids.empty()) return;
  std::lock_guard<std::mutex> lock(sessions_mu_);
  for (const auto& id : session_ids) {
    auto it = sessions_.find(id);
    if (it != sessions_.end() && it->second == service) sessions_.erase(it);
  }
}

void ProxyRouter::DropSessionsOf(const std::string& service) {
  std::lock_guard<std::mutex> lock(sessions_mu_);
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (it->second == service) {
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

nlohmann::json ProxyRouter::StatusJson() const {
  auto snap = registry_->Snapshot();
  auto routes = std::atomic_load(&routes_);
  nlohmann::json j;
  j["services"] = nlohmann::json::array();
  for (const auto& kv : *snap) j["services"].push_back(EndpointToJson(kv.second));
  j["routes"] = routes->size();
  j["route_table"] = nlohmann::json::array();
  for (const auto& r : *routes) {
    j["route_table"].push_back({{"prefix", r.path_prefix}, {"service", r.service_name}, {"upstream", r.upstream_prefix}});
  }
  {
    std::lock_guard<std::mutex> lock(sessions_mu_);
    j["sessions"] = sessions_.size();
  }
  return j;
}

nlohmann::json ProxyRouter::HealthJson() const {
  auto snap = registry_->Snapshot();
  nlohmann::json services = nlohmann::json::object();
  size_t healthy = 0;
  for (const auto& kv : *snap) {
    services[kv.first] = HealthName(kv.second.health);
    if (kv.second.health == Health::kHealthy) healthy++;
  }
  nlohmann::json j;
  j["status"] = healthy == snap->size() ? "ok" : "degraded";
  j["healthy"] = healthy;
  j["total"] = snap->size();
  j["services"] = services;
  return j;
}

nlohmann::json ProxyRouter::IndexJson() const {
  auto snap = registry_->Snapshot();
  nlohmann::json j;
  j["name"] = "mcp-gateway";
  j["endpoints"] = nlohmann::json::array();
  for (const auto& kv : *snap) {
    nlohmann::json e;
    e["service"] = kv.first;
    e["mcp"] = "/mcp/" + kv.first;
    e["sse"] = "/sse/" + kv.first;
    if (kv.first != "proxy" && kv.first != "messages") e["prefix"] = "/" + kv.first;
    e["health"] = HealthName(kv.second.health);
    j["endpoints"].push_back(std::move(e));
  }
  j["proxy"] = {"/proxy/status", "/proxy/health", "/messages"};
  return j;
}

void ProxyRouter::Register(httplib::Server* server) {
  server->Get("/proxy/status", [this](const httplib::Request&, httplib::Response& res) {
    SendJson(&res, 200, StatusJson());
  });
  server->Get("/proxy/health", [this](const httplib::Request&, httplib::Response& res) {
    SendJson(&res, 200, HealthJson());
  });
  server->Get("/", [this](const httplib::Request&, httplib::Response& res) { SendJson(&res, 200, IndexJson()); });
  server->Options(".*", [](const httplib::Request&, httplib::Response& res) {
    SetCorsHeaders(res);
    res.status = 204;
  });

  auto dispatch = [this](const httplib::Request& req, httplib::Response& res) { Dispatch(req, res); };
  server->Get(".*", dispatch);
  server->Post(".*", dispatch);
  server->Put(".*", dispatch);
  server->Patch(".*", dispatch);
  server->Delete(".*", dispatch);
}

void ProxyRouter::Dispatch(const httplib::Request& req, httplib::Response& res) {
  RouteDecision d;
  if (req.path == "/messages" || req.path == "/messages/") {
    d = RouteMessages(req.get_param_value("server_name"), req.get_header_value(kServerNameHeader),
                      req.get_param_value("session_id"));
    d.upstream_path = "/messages";
  } else {
    d = Route(req.path);
  }

  if (d.status != 200) {
    std::cout << "[proxy] " << req.method << " " << req.path << " status=" << d.status << " reason=" << d.reason
              << "\n";
    SendJson(&res, d.status, MakeError(d.reason, d.status == 503 ? "service_unavailable" : "invalid_request_error"));
    return;
  }
  Forward(d, req, res);
}

void ProxyRouter::Forward(const RouteDecision& d, const httplib::Request& req, httplib::Response& res) {
  const std::string target = d.upstream_path + QueryString(req.params);
  if (WantsEventStream(req, d.upstream_path)) {
    ForwardSse(d, target, req, res);
    return;
  }

  httplib::Client cli(d.host, d.port);
  cli.set_connection_timeout(opts_.connect_timeout_seconds);
  cli.set_read_timeout(opts_.upstream_timeout_seconds);
  cli.set_write_timeout(opts_.upstream_timeout_seconds);

  httplib::Request up;
  up.method = req.method;
  up.path = target;
  for (const auto& h : req.headers) {
    if (!IsHopByHop(h.first)) up.headers.emplace(h.first, h.second);
  }
  up.headers.emplace("X-Forwarded-For", req.remote_addr);
  up.body = req.body;

  const auto started = std::chrono::steady_clock::now();
  auto result = cli.send(up);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  if (!result) {
    std::cout << "[proxy] " << req.method << " " << req.path << " -> " << d.service << ":" << d.port << target
              << " status=502 error=" << httplib::to_string(result.error()) << " ms=" << ms << "\n";
    SendJson(&res, 502, MakeError("upstream " + d.service + " failed: " + httplib::to_string(result.error()),
                                  "bad_gateway"));
    return;
  }

  res.status = result->status;
  for (const auto& h : result->headers) {
    if (!IsHopByHop(h.first) && ToLower(h.first) != "content-type") res.set_header(h.first, h.second);
  }
  const auto content_type = result->get_header_value("Content-Type");
  res.set_content(result->body, content_type.empty() ? "application/octet-stream" : content_type);
  std::cout << "[proxy] " << req.method << " " << req.path << " -> " << d.service << ":" << d.port << target
            << " status=" << result->status << " ms=" << ms << "\n";
}

void ProxyRouter::ForwardSse(const RouteDecision& d,
                             const std::string& target,
                             const httplib::Request& req,
                             httplib::Response& res) {
  auto relay = std::make_shared<SseRelay>();
  relay->cli = std::make_unique<httplib::Client>(d.host, d.port);
  relay->cli->set_connection_timeout(opts_.connect_timeout_seconds);
  relay->cli->set_read_timeout(24 * 60 * 60, 0);

  httplib::Headers headers;
  for (const auto& h : req.headers) {
    if (!IsHopByHop(h.first)) headers.emplace(h.first, h.second);
  }
  headers.emplace("X-Forwarded-For", req.remote_addr);

  const std::string service = d.service;
  // Sessions announced on a stream live only as long as the stream.
  auto finish = [this, relay, service] {
    relay->Cancel();
    std::vector<std::string> ids;
    {
      std::lock_guard<std::mutex> lock(relay->mu);
      ids.swap(relay->session_ids);
    }
    ForgetSessions(ids, service);
  };
  relay->thread = std::thread([this, relay, headers, target, service] {
    SessionSniffer sniffer;
    auto result = relay->cli->Get(
        target, headers,
        [&](const httplib::Response& r) {
          {
            std::lock_guard<std::mutex> lock(relay->mu);
            relay->headers_received = true;
            relay->status = r.status;
            relay->content_type = r.get_header_value("Content-Type");
          }
          relay->cv.notify_all();
          return !relay->cancelled;
        },
        [&](const char* data, size_t len) {
          const auto ids = sniffer.Feed(data, len);
          for (const auto& id : ids) RecordSession(id, service);
          {
            std::lock_guard<std::mutex> lock(relay->mu);
            relay->session_ids.insert(relay->session_ids.end(), ids.begin(), ids.end());
            relay->chunks.emplace_back(data, len);
          }
          relay->cv.notify_all();
          return !relay->cancelled;
        });
    {
      std::lock_guard<std::mutex> lock(relay->mu);
      relay->finished = true;
      if (!result) relay->error = httplib::to_string(result.error());
    }
    relay->cv.notify_all();
  });

  bool got_headers = false;
  {
    std::unique_lock<std::mutex> lock(relay->mu);
    relay->cv.wait_for(lock, std::chrono::seconds(opts_.connect_timeout_seconds + opts_.upstream_timeout_seconds),
                       [&] { return relay->headers_received || relay->finished; });
    got_headers = relay->headers_received;
  }
  if (!got_headers) {
    std::string error;
    {
      std::lock_guard<std::mutex> lock(relay->mu);
      error = relay->error.empty() ? "no response" : relay->error;
    }
    finish();
    std::cout << "[proxy] GET " << req.path << " -> " << d.service << ":" << d.port << target
              << " sse status=502 error=" << error << "\n";
    SendJson(&res, 502, MakeError("upstream " + d.service + " stream failed: " + error, "bad_gateway"));
    return;
  }

  int status = 0;
  {
    std::lock_guard<std::mutex> lock(relay->mu);
    status = relay->status;
  }
  if (status != 200) {
    // Not a stream after all: collect the short body and answer in one piece.
    std::string body;
    std::string content_type;
    {
      std::unique_lock<std::mutex> lock(relay->mu);
      relay->cv.wait_for(lock, std::chrono::seconds(opts_.upstream_timeout_seconds), [&] { return relay->finished; });
      for (const auto& c : relay->chunks) body += c;
      content_type = relay->content_type;
    }
    finish();
    res.status = status;
    res.set_content(body, content_type.empty() ? "application/json" : content_type);
    return;
  }

  std::cout << "[proxy] GET " << req.path << " -> " << d.service << ":" << d.port << target << " sse open\n";
  res.set_header("Cache-Control", "no-cache");
  res.set_header("X-Accel-Buffering", "no");
  res.set_chunked_content_provider(
      "text/event-stream",
      [relay](size_t, httplib::DataSink& sink) {
        auto write_bytes = [&](const std::string& s) -> bool {
          if (sink.is_writable && !sink.is_writable()) return false;
          if (!sink.write) return false;
          return sink.write(s.data(), s.size());
        };

        std::deque<std::string> batch;
        bool finished = false;
        {
          std::unique_lock<std::mutex> lock(relay->mu);
          relay->cv.wait_for(lock, std::chrono::seconds(1), [&] { return relay->finished || !relay->chunks.empty(); });
          batch.swap(relay->chunks);
          finished = relay->finished;
        }
        for (const auto& c : batch) {
          if (!write_bytes(c)) return false;
        }
        if (finished) {
          sink.done();
          return true;
        }
        return true;
      },
      [finish, path = req.path, service](bool) {
        finish();
        std::cout << "[proxy] GET " << path << " -> " << service << " sse closed\n";
      });
}

}  // namespace mcpgw
