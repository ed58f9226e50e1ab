#pragma once

#include "errors.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcpgw {

struct SpawnSpec {
  std::string name;
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  std::string working_dir;
};

// Called once from the exit-watcher thread with the reaped pid and its exit code.
using ExitHandler = std::function<void(pid_t pid, int exit_code)>;

// One spawned child in its own process group, with piped stdin/stdout and stderr drained into the log.
// Destruction kills the group if the child is still running and reaps it.
class ProcessHandle {
 public:
  using Clock = std::chrono::steady_clock;

  static std::unique_ptr<ProcessHandle> Spawn(const SpawnSpec& spec, ExitHandler on_exit, GatewayError* err);
  ~ProcessHandle();

  ProcessHandle(const ProcessHandle&) = delete;
  ProcessHandle& operator=(const ProcessHandle&) = delete;

  pid_t Pid() const { return pid_; }
  Clock::time_point StartedAt() const { return started_at_; }
  int StdinFd() const { return stdin_fd_; }
  int StdoutFd() const { return stdout_fd_; }

  bool IsAlive() const;
  std::optional<int> ExitCode() const;

  void CloseStdin();
  bool WaitForExit(std::chrono::milliseconds timeout);
  void Terminate();
  void Kill();

 private:
  ProcessHandle(std::string name, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

  void WatchExit(ExitHandler on_exit);
  void DrainStderr();
  void Signal(int sig);

  std::string name_;
  pid_t pid_;
  Clock::time_point started_at_;
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;

  mutable std::mutex mu_;
  std::condition_variable exited_cv_;
  bool exited_ = false;
  int exit_code_ = 0;

  std::atomic<bool> stop_drain_{false};
  std::thread exit_watcher_;
  std::thread stderr_drain_;
};

}  // namespace mcpgw
