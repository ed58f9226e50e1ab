#pragma once

#include "errors.hpp"
#include "pending_calls.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace mcpgw {

// Line-delimited JSON-RPC 2.0 over a pair of file descriptors.
//
// One reader thread parses inbound lines and resolves pending calls by id; one writer thread drains a
// bounded queue so concurrent senders never interleave partial lines. The descriptors are borrowed: the
// owner closes them after Close() returns.
class FramedChannel {
 public:
  FramedChannel(std::string name, int read_fd, int write_fd, size_t max_queued_writes = 256);
  ~FramedChannel();

  FramedChannel(const FramedChannel&) = delete;
  FramedChannel& operator=(const FramedChannel&) = delete;

  void Start();

  std::future<RpcOutcome> Send(const std::string& method,
                               const nlohmann::json& params,
                               std::chrono::milliseconds timeout);
  bool Notify(const std::string& method, const nlohmann::json& params, GatewayError* err);

  void OnNotification(NotificationHandler handler);
  void OnClose(CloseHandler handler);

  // Fails every outstanding call with ChannelClosed and joins both threads.
  void Close();

  bool IsClosed() const;
  GatewayError CloseReason() const;
  size_t PendingCount() const;
  const std::string& Name() const { return name_; }

 private:
  using Clock = std::chrono::steady_clock;

  void ReaderLoop();
  void WriterLoop();
  void HandleLine(const std::string& line);
  bool Enqueue(std::string line, Clock::time_point deadline, GatewayError* err);
  void Fail(ErrorCode code, const std::string& message, bool notify);
  bool WriteAll(const std::string& data, std::string* err);

  std::string name_;
  int read_fd_;
  int write_fd_;
  size_t max_queued_writes_;
  PendingCalls pending_;

  mutable std::mutex mu_;
  std::condition_variable queue_cv_;
  std::condition_variable space_cv_;
  std::deque<std::string> queue_;
  bool closed_ = false;
  bool started_ = false;
  GatewayError close_reason_;
  NotificationHandler notification_handler_;
  CloseHandler close_handler_;

  std::atomic<bool> stop_{false};
  std::thread reader_;
  std::thread writer_;
};

}  // namespace mcpgw
