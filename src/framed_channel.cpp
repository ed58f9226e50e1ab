#include "framed_channel.hpp"

#include "util.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <mutex>
#include <utility>

namespace mcpgw {
namespace {

constexpr size_t kMaxLineBytes = 16u * 1024u * 1024u;
constexpr int kPollSliceMs = 100;

static void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

FramedChannel::FramedChannel(std::string name, int read_fd, int write_fd, size_t max_queued_writes)
    : name_(std::move(name)),
      read_fd_(read_fd),
      write_fd_(write_fd),
      max_queued_writes_(max_queued_writes == 0 ? 1 : max_queued_writes) {
  IgnoreSigpipeOnce();
}

FramedChannel::~FramedChannel() {
  Close();
}

void FramedChannel::Start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (started_ || closed_) return;
  started_ = true;
  reader_ = std::thread([this] { ReaderLoop(); });
  writer_ = std::thread([this] { WriterLoop(); });
}

std::future<RpcOutcome> FramedChannel::Send(const std::string& method,
                                            const nlohmann::json& params,
                                            std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;
  PendingCalls::Ticket ticket;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) return ReadyOutcome(MakeFailedOutcome(close_reason_.code, close_reason_.message));
    ticket = pending_.Add(method, deadline);
  }

  nlohmann::json req;
  req["jsonrpc"] = "2.0";
  req["id"] = ticket.id;
  req["method"] = method;
  req["params"] = params.is_null() ? nlohmann::json::object() : params;

  GatewayError err;
  if (!Enqueue(req.dump() + "\n", deadline, &err)) {
    pending_.Resolve(ticket.id, MakeFailedOutcome(err.code, err.message));
  }
  return std::move(ticket.future);
}

bool FramedChannel::Notify(const std::string& method, const nlohmann::json& params, GatewayError* err) {
  nlohmann::json msg;
  msg["jsonrpc"] = "2.0";
  msg["method"] = method;
  if (!params.is_null()) msg["params"] = params;
  return Enqueue(msg.dump() + "\n", Clock::now() + std::chrono::seconds(5), err);
}

void FramedChannel::OnNotification(NotificationHandler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  notification_handler_ = std::move(handler);
}

void FramedChannel::OnClose(CloseHandler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  close_handler_ = std::move(handler);
}

bool FramedChannel::Enqueue(std::string line, Clock::time_point deadline, GatewayError* err) {
  std::unique_lock<std::mutex> lock(mu_);
  const bool has_space = space_cv_.wait_until(lock, deadline, [&] {
    return closed_ || queue_.size() < max_queued_writes_;
  });
  if (closed_) {
    SetError(err, close_reason_.code, close_reason_.message);
    return false;
  }
  if (!has_space) {
    SetError(err, ErrorCode::kTimeout, name_ + ": write queue full");
    return false;
  }
  queue_.push_back(std::move(line));
  queue_cv_.notify_one();
  return true;
}

void FramedChannel::Close() {
  stop_ = true;
  Fail(ErrorCode::kChannelClosed, "channel closed", false);
  if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) reader_.join();
  if (writer_.joinable() && writer_.get_id() != std::this_thread::get_id()) writer_.join();
}

bool FramedChannel::IsClosed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

GatewayError FramedChannel::CloseReason() const {
  std::lock_guard<std::mutex> lock(mu_);
  return close_reason_;
}

size_t FramedChannel::PendingCount() const {
  return pending_.Size();
}

void FramedChannel::Fail(ErrorCode code, const std::string& message, bool notify) {
  CloseHandler handler;
  GatewayError reason;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) return;
    closed_ = true;
    close_reason_.code = code;
    close_reason_.message = name_ + ": " + message;
    reason = close_reason_;
    queue_.clear();
    if (notify) handler = close_handler_;
  }
  queue_cv_.notify_all();
  space_cv_.notify_all();
  if (notify) {
    std::cout << "[channel] name=" << name_ << " closed error=" << ErrorCodeName(code) << " reason=" << message
              << " pending=" << pending_.Size() << "\n";
  }
  pending_.FailAll(reason);
  if (handler) handler(reason);
}

void FramedChannel::ReaderLoop() {
  std::string buf;
  char chunk[8192];
  while (!stop_ && !IsClosed()) {
    int timeout_ms = kPollSliceMs;
    if (auto next = pending_.NextDeadline()) {
      auto until = std::chrono::duration_cast<std::chrono::milliseconds>(*next - Clock::now()).count();
      timeout_ms = static_cast<int>(std::clamp<long long>(until, 0, kPollSliceMs));
    }

    pollfd pfd{};
    pfd.fd = read_fd_;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, timeout_ms);
    pending_.ExpireDue(Clock::now());
    if (stop_) break;
    if (rc < 0) {
      if (errno == EINTR) continue;
      Fail(ErrorCode::kChannelClosed, std::string("poll failed: ") + std::strerror(errno), true);
      break;
    }
    if (rc == 0) continue;
    if ((pfd.revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

    const ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      Fail(ErrorCode::kChannelClosed, std::string("read failed: ") + std::strerror(errno), true);
      break;
    }
    if (n == 0) {
      Fail(ErrorCode::kChannelClosed, "stream closed", true);
      break;
    }
    buf.append(chunk, static_cast<size_t>(n));

    size_t pos = 0;
    while ((pos = buf.find('\n')) != std::string::npos) {
      std::string line = buf.substr(0, pos);
      buf.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (line.find_first_not_of(" \t") == std::string::npos) continue;
      HandleLine(line);
      if (IsClosed()) return;
    }
    if (buf.size() > kMaxLineBytes) {
      Fail(ErrorCode::kProtocolError, "inbound line exceeds limit", true);
      break;
    }
  }
}

void FramedChannel::HandleLine(const std::string& line) {
  auto j = nlohmann::json::parse(line, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    Fail(ErrorCode::kProtocolError, "unparseable line: " + TruncateForLog(line, 200), true);
    return;
  }

  const bool has_method = j.contains("method") && j["method"].is_string();
  const bool has_id = j.contains("id") && !j["id"].is_null();

  if (has_method && has_id) {
    const auto method = j["method"].get<std::string>();
    nlohmann::json reply;
    reply["jsonrpc"] = "2.0";
    reply["id"] = j["id"];
    if (method == "ping") {
      reply["result"] = nlohmann::json::object();
    } else {
      reply["error"] = {{"code", -32601}, {"message", "method not found: " + method}};
    }
    GatewayError err;
    if (!Enqueue(reply.dump() + "\n", Clock::now() + std::chrono::seconds(1), &err)) {
      std::cout << "[channel] name=" << name_ << " reply dropped method=" << method << " error=" << err.ToString()
                << "\n";
    }
    return;
  }

  if (has_method) {
    NotificationHandler handler;
    {
      std::lock_guard<std::mutex> lock(mu_);
      handler = notification_handler_;
    }
    if (handler) handler(j["method"].get<std::string>(), j.value("params", nlohmann::json::object()));
    return;
  }

  if (!has_id) {
    std::cout << "[channel] name=" << name_ << " dropped message without id\n";
    return;
  }

  const auto id = JsonRpcIdToString(j["id"]);
  if (!pending_.Resolve(id, OutcomeFromResponse(j))) {
    std::cout << "[channel] name=" << name_ << " dropped unmatched response id=" << id << "\n";
  }
}

bool FramedChannel::WriteAll(const std::string& data, std::string* err) {
  size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = ::write(write_fd_, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN) {
        pollfd pfd{};
        pfd.fd = write_fd_;
        pfd.events = POLLOUT;
        ::poll(&pfd, 1, kPollSliceMs);
        if (stop_) {
          if (err) *err = "channel stopping";
          return false;
        }
        continue;
      }
      if (err) *err = std::strerror(errno);
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

void FramedChannel::WriterLoop() {
  while (true) {
    std::string line;
    {
      std::unique_lock<std::mutex> lock(mu_);
      queue_cv_.wait(lock, [&] { return stop_ || closed_ || !queue_.empty(); });
      if (stop_ || closed_) break;
      line = std::move(queue_.front());
      queue_.pop_front();
    }
    space_cv_.notify_one();

    std::string err;
    if (!WriteAll(line, &err)) {
      Fail(ErrorCode::kChannelClosed, "write failed: " + err, true);
      break;
    }
  }
}

}  // namespace mcpgw
