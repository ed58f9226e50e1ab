#pragma once

#include "service_registry.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace httplib {
class Server;
struct Request;
struct Response;
}  // namespace httplib

namespace mcpgw {

struct RouteEntry {
  std::string path_prefix;
  std::string service_name;
  std::string upstream_prefix;
};

struct RouteDecision {
  int status = 404;
  std::string service;
  std::string host;
  int port = 0;
  uint64_t generation = 0;
  std::string upstream_path;
  std::string reason;
};

struct RouterOptions {
  int upstream_timeout_seconds = 30;
  int connect_timeout_seconds = 5;
};

// The single external listener. Routes are derived from the registry and swapped atomically on every
// registry event; lookups never take a lock.
class ProxyRouter {
 public:
  explicit ProxyRouter(ServiceRegistry* registry, RouterOptions opts = {});
  ~ProxyRouter();

  ProxyRouter(const ProxyRouter&) = delete;
  ProxyRouter& operator=(const ProxyRouter&) = delete;

  RouteDecision Route(const std::string& path) const;

  // /messages has no service in its path; pick one from the query, a header, the recorded session or
  // the only registered service.
  RouteDecision RouteMessages(const std::string& server_name,
                              const std::string& header_name,
                              const std::string& session_id) const;

  void Register(httplib::Server* server);

  std::vector<RouteEntry> Routes() const;
  nlohmann::json StatusJson() const;
  nlohmann::json HealthJson() const;
  nlohmann::json IndexJson() const;

  void RecordSession(const std::string& session_id, const std::string& service);
  std::optional<std::string> SessionService(const std::string& session_id) const;

  static std::vector<RouteEntry> BuildRoutes(const ServiceRegistry::Map& endpoints);

 private:
  void Rebuild();
  void DropSessionsOf(const std::string& service);
  void ForgetSessions(const std::vector<std::string>& session_ids, const std::string& service);
  RouteDecision Resolve(const std::string& service, const std::string& upstream_path) const;
  void Forward(const RouteDecision& d, const httplib::Request& req, httplib::Response& res);
  void ForwardSse(const RouteDecision& d, const std::string& target, const httplib::Request& req, httplib::Response& res);
  void Dispatch(const httplib::Request& req, httplib::Response& res);

  ServiceRegistry* registry_;
  RouterOptions opts_;
  int subscription_ = 0;
  std::shared_ptr<const std::vector<RouteEntry>> routes_;

  mutable std::mutex sessions_mu_;
  std::map<std::string, std::string> sessions_;
};

}  // namespace mcpgw
