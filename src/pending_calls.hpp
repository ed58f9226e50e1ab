#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mcpgw {

// Terminal outcome of one JSON-RPC call. `rpc_error` holds the upstream error object verbatim when the
// backend answered with one (error.code is then kUpstreamError).
struct RpcOutcome {
  bool ok = false;
  nlohmann::json result;
  nlohmann::json rpc_error;
  GatewayError error;
};

using NotificationHandler = std::function<void(const std::string& method, const nlohmann::json& params)>;
using CloseHandler = std::function<void(const GatewayError& reason)>;

RpcOutcome MakeFailedOutcome(ErrorCode code, std::string message);
RpcOutcome OutcomeFromResponse(const nlohmann::json& response);
std::future<RpcOutcome> ReadyOutcome(RpcOutcome outcome);

// Correlates outstanding requests with their responses by id. Every call is removed exactly once:
// on Resolve, on deadline expiry, or on FailAll.
class PendingCalls {
 public:
  using Clock = std::chrono::steady_clock;

  struct Ticket {
    std::string id;
    std::future<RpcOutcome> future;
  };

  Ticket Add(const std::string& method, Clock::time_point deadline);
  bool Resolve(const std::string& id, RpcOutcome outcome);
  size_t ExpireDue(Clock::time_point now);
  void FailAll(const GatewayError& reason);
  std::optional<Clock::time_point> NextDeadline() const;
  size_t Size() const;

 private:
  struct Entry {
    std::string method;
    Clock::time_point deadline;
    std::promise<RpcOutcome> promise;
  };

  mutable std::mutex mu_;
  std::atomic<uint64_t> next_id_{1};
  std::unordered_map<std::string, Entry> entries_;
};

std::string JsonRpcIdToString(const nlohmann::json& id);

}  // namespace mcpgw
