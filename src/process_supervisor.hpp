#pragma once

#include "backend_client.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "port_allocator.hpp"
#include "process_handle.hpp"

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcpgw {

enum class SupervisorState { kStopped, kStarting, kRunning, kStopping, kCrashed };

const char* SupervisorStateName(SupervisorState s);

enum class LifecycleEventKind { kStarted, kCrashed, kRestarting, kStopped, kUnrecoverable, kProbe };

const char* LifecycleEventKindName(LifecycleEventKind k);

struct LifecycleEvent {
  LifecycleEventKind kind = LifecycleEventKind::kStarted;
  std::string name;
  uint64_t generation = 0;
  int port = 0;
  pid_t pid = 0;
  std::shared_ptr<BackendClient> client;
  int restart_attempt = 0;
  std::chrono::milliseconds backoff{0};
  bool probe_ok = false;
  GatewayError error;
};

// Returning false from a `started` event rejects the attempt; the return value is ignored otherwise.
using LifecycleListener = std::function<bool(const LifecycleEvent&)>;

struct SupervisorOptions {
  std::string bridge_host = "127.0.0.1";
  int health_interval_ms = 10000;
  int stop_grace_ms = 5000;
  int max_backoff_ms = 30000;
  int restart_reset_ms = 60000;
  double jitter = 0.1;
  int connect_timeout_seconds = 5;
  int reap_timeout_ms = 5000;
};

// Owns one backend's process across attempts:
//   Stopped -> Starting -> Running -> (Stopping -> Stopped) | (Crashed -> Starting)
// Every attempt gets a fresh process, transport, client and a new generation. Crash handling, restarts and
// periodic probes run on one control thread; exits are observed on the process's own watcher thread.
class ProcessSupervisor {
 public:
  ProcessSupervisor(BackendDescriptor desc, PortAllocator* ports, SupervisorOptions opts = {});
  ~ProcessSupervisor();

  ProcessSupervisor(const ProcessSupervisor&) = delete;
  ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

  void SetListener(LifecycleListener listener);

  // Runs the first attempt synchronously. On failure the restart policy keeps retrying in the background
  // and the error of the failed attempt is returned.
  std::shared_ptr<BackendClient> Start(GatewayError* err);
  void Stop();

  SupervisorState State() const;
  uint64_t Generation() const;
  int SpawnAttempts() const;
  int RestartCount() const;
  int Port() const;
  pid_t Pid() const;
  std::shared_ptr<BackendClient> Client() const;
  const BackendDescriptor& Descriptor() const { return desc_; }

  // base * 2^attempt, capped at max_ms, plus up to `jitter` of that as random spread (unit_random in [0,1)).
  static std::chrono::milliseconds ComputeBackoff(int base_ms, int attempt, int max_ms, double jitter,
                                                  double unit_random);

 private:
  using Clock = std::chrono::steady_clock;

  struct Attempt {
    uint64_t generation = 0;
    std::unique_ptr<ProcessHandle> proc;
    std::shared_ptr<BackendClient> client;
    int service_port = 0;
    int backend_port = 0;
  };

  bool LaunchAttempt(GatewayError* err);
  void ControlLoop(bool recovering);
  bool RestartLoop();
  void HandleCrash();
  void RunProbe();

  void OnExit(uint64_t generation, pid_t pid, int code);
  void OnChannelClosed(uint64_t generation, const GatewayError& reason);

  // Ports of a child that has not been reaped stay reserved until its exit watcher sees it go.
  struct HeldPorts {
    pid_t pid = 0;
    int service_port = 0;
    int backend_port = 0;
    std::unique_ptr<ProcessHandle> proc;
  };

  void Shutdown(Attempt* a, bool graceful);
  void ReleasePorts(Attempt* a);
  void ReleaseHeld(pid_t pid);
  void CollectHeld();
  bool Emit(const LifecycleEvent& ev);
  LifecycleEvent MakeEvent(LifecycleEventKind kind, const Attempt& a) const;

  BackendDescriptor desc_;
  PortAllocator* ports_;
  SupervisorOptions opts_;

  std::mutex ops_mu_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  SupervisorState state_ = SupervisorState::kStopped;
  uint64_t generation_ = 0;
  int spawn_attempts_ = 0;
  int restart_count_ = 0;
  bool stop_requested_ = false;
  bool crash_pending_ = false;
  GatewayError crash_reason_;
  Clock::time_point running_since_{};
  Attempt current_;
  ProcessHandle* launching_ = nullptr;
  LifecycleListener listener_;

  std::mutex held_mu_;
  std::vector<HeldPorts> held_;

  std::thread control_;
};

}  // namespace mcpgw
