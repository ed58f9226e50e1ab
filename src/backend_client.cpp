#include "backend_client.hpp"

#include <iostream>
#include <utility>

namespace mcpgw {
namespace {

constexpr int kMaxToolPages = 64;

static std::string DescribeRpcError(const nlohmann::json& e) {
  if (!e.is_object()) return "json-rpc error";
  std::string msg;
  if (e.contains("message") && e["message"].is_string()) msg = e["message"].get<std::string>();
  if (msg.empty()) msg = "json-rpc error";
  if (e.contains("code") && e["code"].is_number_integer()) msg += " (code " + std::to_string(e["code"].get<int>()) + ")";
  return msg;
}

}  // namespace

std::vector<ToolSpec> ParseToolPage(const nlohmann::json& result) {
  std::vector<ToolSpec> out;
  if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) return out;
  for (const auto& t : result["tools"]) {
    if (!t.is_object()) continue;
    ToolSpec info;
    if (t.contains("name") && t["name"].is_string()) info.name = t["name"].get<std::string>();
    if (t.contains("title") && t["title"].is_string()) info.title = t["title"].get<std::string>();
    if (t.contains("description") && t["description"].is_string()) info.description = t["description"].get<std::string>();
    if (t.contains("inputSchema") && t["inputSchema"].is_object()) info.input_schema = t["inputSchema"];
    if (!info.name.empty()) out.push_back(std::move(info));
  }
  return out;
}

nlohmann::json ToolSpecToJson(const ToolSpec& tool) {
  nlohmann::json j;
  j["name"] = tool.name;
  if (!tool.title.empty()) j["title"] = tool.title;
  if (!tool.description.empty()) j["description"] = tool.description;
  j["inputSchema"] = tool.input_schema.is_null() ? nlohmann::json{{"type", "object"}} : tool.input_schema;
  return j;
}

BackendClient::BackendClient(std::string name, std::unique_ptr<ITransport> transport)
    : name_(std::move(name)), transport_(std::move(transport)) {}

BackendClient::~BackendClient() {
  Close();
}

bool BackendClient::Open(std::chrono::milliseconds timeout, GatewayError* err) {
  return transport_->Open(timeout, err);
}

void BackendClient::SetCallTimeout(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mu_);
  if (timeout.count() > 0) call_timeout_ = timeout;
}

RpcOutcome BackendClient::Call(const std::string& method,
                               const nlohmann::json& params,
                               std::chrono::milliseconds timeout) {
  return transport_->Call(method, params, timeout).get();
}

bool BackendClient::Initialize(std::chrono::milliseconds timeout, GatewayError* err) {
  nlohmann::json params;
  params["protocolVersion"] = "2024-11-05";
  params["capabilities"] = nlohmann::json::object();
  params["clientInfo"] = {{"name", "mcp-gateway"}, {"version", "0.1.0"}};
  auto r = Call("initialize", params, timeout);
  if (!r.ok) {
    if (r.error.code != ErrorCode::kUpstreamError) {
      SetError(err, r.error.code, r.error.message);
      return false;
    }
    std::cout << "[backend] name=" << name_ << " initialize rejected error=" << DescribeRpcError(r.rpc_error)
              << " continuing\n";
  }
  return transport_->Notify("notifications/initialized", nlohmann::json(), err);
}

std::optional<std::vector<ToolSpec>> BackendClient::ListTools(std::chrono::milliseconds timeout, GatewayError* err) {
  std::vector<ToolSpec> out;
  std::string cursor;
  for (int page = 0; page < kMaxToolPages; page++) {
    nlohmann::json params = nlohmann::json::object();
    if (!cursor.empty()) params["cursor"] = cursor;
    auto r = Call("tools/list", params, timeout);
    if (!r.ok) {
      if (r.error.code == ErrorCode::kUpstreamError) {
        SetError(err, ErrorCode::kUpstreamError, name_ + ": tools/list: " + DescribeRpcError(r.rpc_error));
      } else {
        SetError(err, r.error.code, r.error.message);
      }
      return std::nullopt;
    }
    auto items = ParseToolPage(r.result);
    out.insert(out.end(), std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
    if (r.result.contains("nextCursor") && r.result["nextCursor"].is_string()) {
      cursor = r.result["nextCursor"].get<std::string>();
      if (cursor.empty()) break;
    } else {
      break;
    }
  }

  std::lock_guard<std::mutex> lock(mu_);
  tools_ = out;
  return out;
}

std::optional<std::vector<ToolSpec>> BackendClient::KnownTools() const {
  std::lock_guard<std::mutex> lock(mu_);
  return tools_;
}

std::optional<nlohmann::json> BackendClient::CallTool(const std::string& name,
                                                      const nlohmann::json& arguments,
                                                      GatewayError* err) {
  std::chrono::milliseconds timeout;
  std::optional<std::vector<ToolSpec>> known;
  {
    std::lock_guard<std::mutex> lock(mu_);
    timeout = call_timeout_;
    known = tools_;
  }
  if (!known) {
    known = ListTools(timeout, err);
    if (!known) return std::nullopt;
  }
  bool found = false;
  for (const auto& t : *known) {
    if (t.name == name) {
      found = true;
      break;
    }
  }
  if (!found) {
    SetError(err, ErrorCode::kToolNotFound, name_ + ": unknown tool " + name);
    return std::nullopt;
  }

  nlohmann::json params;
  params["name"] = name;
  params["arguments"] = arguments.is_null() ? nlohmann::json::object() : arguments;
  auto r = Call("tools/call", params, timeout);
  if (!r.ok) {
    if (r.error.code == ErrorCode::kUpstreamError) {
      SetError(err, ErrorCode::kUpstreamError, name_ + ": " + DescribeRpcError(r.rpc_error));
    } else {
      SetError(err, r.error.code, r.error.message);
    }
    return std::nullopt;
  }
  return r.result;
}

std::optional<nlohmann::json> BackendClient::Relay(const nlohmann::json& request, GatewayError* err) {
  if (!request.is_object() || !request.contains("method") || !request["method"].is_string()) {
    SetError(err, ErrorCode::kInvalidArgument, "request must be a json-rpc object with a method");
    return std::nullopt;
  }
  const auto method = request["method"].get<std::string>();
  const auto params = request.value("params", nlohmann::json::object());

  if (!request.contains("id") || request["id"].is_null()) {
    if (!transport_->Notify(method, params, err)) return std::nullopt;
    return nlohmann::json();
  }

  std::chrono::milliseconds timeout;
  {
    std::lock_guard<std::mutex> lock(mu_);
    timeout = call_timeout_;
  }
  auto r = Call(method, params, timeout);

  nlohmann::json resp;
  resp["jsonrpc"] = "2.0";
  resp["id"] = request["id"];
  if (r.ok) {
    resp["result"] = r.result;
    if (method == "tools/list" && !params.contains("cursor") && !r.result.contains("nextCursor")) {
      std::lock_guard<std::mutex> lock(mu_);
      tools_ = ParseToolPage(r.result);
    }
    return resp;
  }
  if (r.error.code == ErrorCode::kUpstreamError && !r.rpc_error.is_null()) {
    resp["error"] = r.rpc_error;
    return resp;
  }
  SetError(err, r.error.code, r.error.message);
  return std::nullopt;
}

bool BackendClient::Notify(const std::string& method, const nlohmann::json& params, GatewayError* err) {
  return transport_->Notify(method, params, err);
}

void BackendClient::SetNotificationHandler(NotificationHandler handler) {
  transport_->SetNotificationHandler(std::move(handler));
}

void BackendClient::SetCloseHandler(CloseHandler handler) {
  transport_->SetCloseHandler(std::move(handler));
}

void BackendClient::Close() {
  if (transport_) transport_->Close();
}

}  // namespace mcpgw
