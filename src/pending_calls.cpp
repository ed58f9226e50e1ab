#include "pending_calls.hpp"

#include <utility>
#include <vector>

namespace mcpgw {

RpcOutcome MakeFailedOutcome(ErrorCode code, std::string message) {
  RpcOutcome out;
  out.ok = false;
  out.error.code = code;
  out.error.message = std::move(message);
  return out;
}

RpcOutcome OutcomeFromResponse(const nlohmann::json& response) {
  RpcOutcome out;
  if (response.contains("error") && !response["error"].is_null()) {
    out.rpc_error = response["error"];
    std::string msg;
    if (out.rpc_error.is_object() && out.rpc_error.contains("message") && out.rpc_error["message"].is_string()) {
      msg = out.rpc_error["message"].get<std::string>();
    }
    if (msg.empty()) msg = "json-rpc error";
    out.error.code = ErrorCode::kUpstreamError;
    out.error.message = msg;
    return out;
  }
  if (!response.contains("result")) {
    out.error.code = ErrorCode::kProtocolError;
    out.error.message = "response has neither result nor error";
    return out;
  }
  out.ok = true;
  out.result = response["result"];
  return out;
}

std::future<RpcOutcome> ReadyOutcome(RpcOutcome outcome) {
  std::promise<RpcOutcome> p;
  p.set_value(std::move(outcome));
  return p.get_future();
}

std::string JsonRpcIdToString(const nlohmann::json& id) {
  if (id.is_string()) return id.get<std::string>();
  if (id.is_number_integer()) return std::to_string(id.get<int64_t>());
  return id.dump();
}

PendingCalls::Ticket PendingCalls::Add(const std::string& method, Clock::time_point deadline) {
  Ticket t;
  std::lock_guard<std::mutex> lock(mu_);
  // ids are never reused, so an id collision can only come from a wrapped counter
  do {
    t.id = std::to_string(next_id_++);
  } while (entries_.count(t.id) != 0);
  Entry e;
  e.method = method;
  e.deadline = deadline;
  t.future = e.promise.get_future();
  entries_.emplace(t.id, std::move(e));
  return t;
}

bool PendingCalls::Resolve(const std::string& id, RpcOutcome outcome) {
  std::promise<RpcOutcome> promise;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    promise = std::move(it->second.promise);
    entries_.erase(it);
  }
  promise.set_value(std::move(outcome));
  return true;
}

size_t PendingCalls::ExpireDue(Clock::time_point now) {
  std::vector<std::pair<std::string, Entry>> expired;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->second.deadline <= now) {
        expired.emplace_back(it->first, std::move(it->second));
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& [id, e] : expired) {
    e.promise.set_value(MakeFailedOutcome(ErrorCode::kTimeout, e.method + " timed out (id=" + id + ")"));
  }
  return expired.size();
}

void PendingCalls::FailAll(const GatewayError& reason) {
  std::unordered_map<std::string, Entry> drained;
  {
    std::lock_guard<std::mutex> lock(mu_);
    drained.swap(entries_);
  }
  for (auto& [id, e] : drained) {
    e.promise.set_value(MakeFailedOutcome(reason.code, reason.message));
  }
}

std::optional<PendingCalls::Clock::time_point> PendingCalls::NextDeadline() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::optional<Clock::time_point> out;
  for (const auto& [id, e] : entries_) {
    if (!out || e.deadline < *out) out = e.deadline;
  }
  return out;
}

size_t PendingCalls::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

}  // namespace mcpgw
