#include "management_api.hpp"

#include "config.hpp"
#include "http_util.hpp"
#include "service_manager.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

namespace mcpgw {

namespace {

void SendGatewayError(httplib::Response& res, const GatewayError& err) {
  const int status = HttpStatusFor(err.code);
  SendJson(&res, status == 200 ? 500 : status, MakeError(err.message, ErrorCodeName(err.code)));
}

bool ParseBody(const httplib::Request& req, httplib::Response& res, nlohmann::json* out) {
  *out = nlohmann::json::parse(req.body, nullptr, false);
  if (out->is_discarded()) {
    SendJson(&res, 400, MakeError("invalid json", "invalid_request_error"));
    return false;
  }
  return true;
}

void RegisterBackendRoutes(httplib::Server* server, ServiceManager* manager) {
  server->Get("/proxy/backends", [manager](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["backends"] = manager->StatusJson();
    SendJson(&res, 200, j);
  });

  server->Post("/proxy/backends", [manager](const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body;
    if (!ParseBody(req, res, &body)) return;
    std::string perr;
    auto desc = ParseBackendDescriptor(body, &perr);
    if (!desc) {
      SendJson(&res, 400, MakeError(perr, "invalid_request_error"));
      return;
    }
    GatewayError err;
    if (!manager->AddBackend(*desc, &err)) {
      SendGatewayError(res, err);
      return;
    }
    const bool start = req.get_param_value("start") != "false";
    nlohmann::json j = DescriptorToJson(*desc);
    if (start && !manager->Start(desc->name, &err)) {
      j["started"] = false;
      j["error"] = err.ToString();
      SendJson(&res, 202, j);
      return;
    }
    j["started"] = start;
    SendJson(&res, 201, j);
  });

  server->Post(R"(/proxy/backends/([A-Za-z0-9._-]+)/(start|stop|restart))",
               [manager](const httplib::Request& req, httplib::Response& res) {
                 const std::string name = req.matches[1];
                 const std::string action = req.matches[2];
                 GatewayError err;
                 bool ok = false;
                 if (action == "start") {
                   ok = manager->Start(name, &err);
                 } else if (action == "stop") {
                   ok = manager->Stop(name, &err);
                 } else {
                   ok = manager->Restart(name, &err);
                 }
                 std::cout << "[gateway] action=" << action << " name=" << name << " ok=" << (ok ? 1 : 0)
                           << " error=" << (err.ok() ? "-" : err.ToString()) << "\n";
                 if (!ok) {
                   SendGatewayError(res, err);
                   return;
                 }
                 SendJson(&res, 200, {{"name", name}, {"action", action}, {"ok", true}});
               });

  server->Delete(R"(/proxy/backends/([A-Za-z0-9._-]+))", [manager](const httplib::Request& req, httplib::Response& res) {
    const std::string name = req.matches[1];
    GatewayError err;
    if (!manager->Remove(name, &err)) {
      SendGatewayError(res, err);
      return;
    }
    SendJson(&res, 200, {{"name", name}, {"removed", true}});
  });
}

void RegisterExternalRoutes(httplib::Server* server, ServiceManager* manager) {
  server->Post("/proxy/register", [manager](const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body;
    if (!ParseBody(req, res, &body)) return;
    std::string perr;
    auto ext = ParseExternalEndpoint(body, &perr);
    if (!ext) {
      SendJson(&res, 400, MakeError(perr, "invalid_request_error"));
      return;
    }
    GatewayError err;
    auto ep = manager->RegisterExternal(*ext, &err);
    if (!ep) {
      SendGatewayError(res, err);
      return;
    }
    nlohmann::json info = ExternalEndpointToJson(*ext);
    info["generation"] = ep->generation;
    info["health"] = HealthName(ep->health);
    nlohmann::json j;
    j["status"] = "success";
    j["message"] = "registered " + ext->name;
    j["server_info"] = std::move(info);
    SendJson(&res, 200, j);
  });

  server->Delete(R"(/proxy/unregister/([A-Za-z0-9._-]+))", [manager](const httplib::Request& req, httplib::Response& res) {
    const std::string name = req.matches[1];
    GatewayError err;
    if (!manager->UnregisterExternal(name, &err)) {
      SendGatewayError(res, err);
      return;
    }
    SendJson(&res, 200, {{"status", "success"}, {"message", "unregistered " + name}});
  });

  server->Get("/proxy/mapping", [manager](const httplib::Request&, httplib::Response& res) {
    SendJson(&res, 200, {{"servers", manager->MappingJson()}});
  });
}

}  // namespace

void RegisterManagementRoutes(httplib::Server* server, ServiceManager* manager) {
  RegisterBackendRoutes(server, manager);
  RegisterExternalRoutes(server, manager);
}

}  // namespace mcpgw
