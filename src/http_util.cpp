#include "http_util.hpp"

#include <exception>

namespace mcpgw {

void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(), "application/json");
}

nlohmann::json MakeError(const std::string& message, const std::string& type) {
  nlohmann::json j;
  j["error"] = {{"message", message}, {"type", type}};
  return j;
}

nlohmann::json JsonRpcErrorFor(const nlohmann::json& id, const GatewayError& err) {
  int code = -32603;
  switch (err.code) {
    case ErrorCode::kTimeout:
      code = -32001;
      break;
    case ErrorCode::kChannelClosed:
    case ErrorCode::kProtocolError:
    case ErrorCode::kSpawnFailure:
      code = -32000;
      break;
    case ErrorCode::kInvalidArgument:
      code = -32600;
      break;
    case ErrorCode::kToolNotFound:
      code = -32602;
      break;
    default:
      break;
  }
  nlohmann::json j;
  j["jsonrpc"] = "2.0";
  j["id"] = id;
  j["error"] = {{"code", code}, {"message", err.message}, {"data", {{"reason", ErrorCodeName(err.code)}}}};
  return j;
}

int HttpStatusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return 200;
    case ErrorCode::kTimeout:
      return 504;
    case ErrorCode::kInvalidArgument:
      return 400;
    case ErrorCode::kNotFound:
    case ErrorCode::kToolNotFound:
      return 404;
    case ErrorCode::kAlreadyExists:
    case ErrorCode::kPortConflict:
      return 409;
    case ErrorCode::kBackendUnrecoverable:
    case ErrorCode::kNoPortsAvailable:
      return 503;
    default:
      return 502;
  }
}

std::string FormatSseEvent(const std::string& event, const std::string& data) {
  std::string out;
  if (!event.empty()) out += "event: " + event + "\n";
  size_t start = 0;
  while (true) {
    const auto nl = data.find('\n', start);
    out += "data: " + data.substr(start, nl == std::string::npos ? std::string::npos : nl - start) + "\n";
    if (nl == std::string::npos) break;
    start = nl + 1;
  }
  out += "\n";
  return out;
}

void InstallJsonErrorHandlers(httplib::Server* server) {
  server->set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "non-standard exception";
      }
    }
    SendJson(&res, 500, MakeError(message, "server_error"));
  });

  server->set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    std::string type = "invalid_request_error";
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "upstream error";
      type = "api_error";
    } else {
      message = "bad request";
    }
    res.set_content(MakeError(message, type).dump(), "application/json");
  });
}

}  // namespace mcpgw
