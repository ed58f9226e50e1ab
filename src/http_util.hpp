#pragma once

#include "errors.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <string>

namespace mcpgw {

void SendJson(httplib::Response* res, int status, const nlohmann::json& body);
nlohmann::json MakeError(const std::string& message, const std::string& type);

// JSON-RPC error response for a call the gateway could not complete.
nlohmann::json JsonRpcErrorFor(const nlohmann::json& id, const GatewayError& err);

// HTTP status the bridge and router surface for a failed backend call.
int HttpStatusFor(ErrorCode code);

std::string FormatSseEvent(const std::string& event, const std::string& data);

// JSON bodies for uncaught exceptions and bare error statuses.
void InstallJsonErrorHandlers(httplib::Server* server);

}  // namespace mcpgw
