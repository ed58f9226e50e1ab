#include "process_supervisor.hpp"

#include "transports/transport.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <utility>

namespace mcpgw {
namespace {

static double UnitRandom() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}

}  // namespace

const char* SupervisorStateName(SupervisorState s) {
  switch (s) {
    case SupervisorState::kStopped:
      return "stopped";
    case SupervisorState::kStarting:
      return "starting";
    case SupervisorState::kRunning:
      return "running";
    case SupervisorState::kStopping:
      return "stopping";
    case SupervisorState::kCrashed:
      return "crashed";
  }
  return "unknown";
}

const char* LifecycleEventKindName(LifecycleEventKind k) {
  switch (k) {
    case LifecycleEventKind::kStarted:
      return "started";
    case LifecycleEventKind::kCrashed:
      return "crashed";
    case LifecycleEventKind::kRestarting:
      return "restarting";
    case LifecycleEventKind::kStopped:
      return "stopped";
    case LifecycleEventKind::kUnrecoverable:
      return "unrecoverable";
    case LifecycleEventKind::kProbe:
      return "probe";
  }
  return "unknown";
}

std::chrono::milliseconds ProcessSupervisor::ComputeBackoff(int base_ms,
                                                            int attempt,
                                                            int max_ms,
                                                            double jitter,
                                                            double unit_random) {
  const double cap = max_ms > 0 ? static_cast<double>(max_ms) : 0.0;
  double d = static_cast<double>(std::max(base_ms, 0)) * std::pow(2.0, std::min(std::max(attempt, 0), 30));
  if (cap > 0 && d > cap) d = cap;
  d += d * std::clamp(jitter, 0.0, 1.0) * std::clamp(unit_random, 0.0, 1.0);
  return std::chrono::milliseconds(static_cast<int64_t>(d));
}

ProcessSupervisor::ProcessSupervisor(BackendDescriptor desc, PortAllocator* ports, SupervisorOptions opts)
    : desc_(std::move(desc)), ports_(ports), opts_(std::move(opts)) {}

ProcessSupervisor::~ProcessSupervisor() {
  Stop();
  std::vector<HeldPorts> held;
  {
    std::lock_guard<std::mutex> lock(held_mu_);
    held.swap(held_);
  }
  for (auto& h : held) {
    // The handle's destructor kills and reaps the group.
    h.proc.reset();
    if (h.service_port > 0) ports_->Release(h.service_port);
    if (h.backend_port > 0) ports_->Release(h.backend_port);
  }
}

void ProcessSupervisor::SetListener(LifecycleListener listener) {
  std::lock_guard<std::mutex> lock(mu_);
  listener_ = std::move(listener);
}

SupervisorState ProcessSupervisor::State() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

uint64_t ProcessSupervisor::Generation() const {
  std::lock_guard<std::mutex> lock(mu_);
  return generation_;
}

int ProcessSupervisor::SpawnAttempts() const {
  std::lock_guard<std::mutex> lock(mu_);
  return spawn_attempts_;
}

int ProcessSupervisor::RestartCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return restart_count_;
}

int ProcessSupervisor::Port() const {
  std::lock_guard<std::mutex> lock(mu_);
  return current_.service_port;
}

pid_t ProcessSupervisor::Pid() const {
  std::lock_guard<std::mutex> lock(mu_);
  return current_.proc ? current_.proc->Pid() : 0;
}

std::shared_ptr<BackendClient> ProcessSupervisor::Client() const {
  std::lock_guard<std::mutex> lock(mu_);
  return current_.client;
}

bool ProcessSupervisor::Emit(const LifecycleEvent& ev) {
  LifecycleListener listener;
  {
    std::lock_guard<std::mutex> lock(mu_);
    listener = listener_;
  }
  if (!listener) return true;
  return listener(ev);
}

LifecycleEvent ProcessSupervisor::MakeEvent(LifecycleEventKind kind, const Attempt& a) const {
  LifecycleEvent ev;
  ev.kind = kind;
  ev.name = desc_.name;
  ev.generation = a.generation;
  ev.port = a.service_port;
  ev.pid = a.proc ? a.proc->Pid() : 0;
  ev.client = a.client;
  return ev;
}

std::shared_ptr<BackendClient> ProcessSupervisor::Start(GatewayError* err) {
  std::lock_guard<std::mutex> ops(ops_mu_);
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ == SupervisorState::kRunning) return current_.client;
    if (state_ != SupervisorState::kStopped) {
      SetError(err, ErrorCode::kAlreadyExists,
               desc_.name + ": supervisor is " + SupervisorStateName(state_));
      return nullptr;
    }
  }
  // A control thread left over from an exhausted restart budget has already returned.
  if (control_.joinable()) control_.join();
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = false;
    crash_pending_ = false;
    restart_count_ = 0;
  }

  GatewayError attempt_err;
  if (LaunchAttempt(&attempt_err)) {
    control_ = std::thread([this] { ControlLoop(false); });
    return Client();
  }

  SetError(err, attempt_err.code, attempt_err.message);
  {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = SupervisorState::kCrashed;
    crash_reason_ = attempt_err;
  }
  control_ = std::thread([this] { ControlLoop(true); });
  return nullptr;
}

bool ProcessSupervisor::LaunchAttempt(GatewayError* err) {
  Attempt a;
  {
    std::lock_guard<std::mutex> lock(mu_);
    a.generation = ++generation_;
    spawn_attempts_++;
    state_ = SupervisorState::kStarting;
  }
  std::cout << "[supervisor] name=" << desc_.name << " state=starting generation=" << a.generation
            << " transport=" << TransportKindName(desc_.transport) << "\n";

  auto fail = [&](const GatewayError& e) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      launching_ = nullptr;
    }
    std::cout << "[supervisor] name=" << desc_.name << " attempt failed generation=" << a.generation
              << " error=" << e.ToString() << "\n";
    Shutdown(&a, false);
    ReleasePorts(&a);
    SetError(err, e.code, e.message);
    return false;
  };

  GatewayError e;
  SpawnSpec spec;
  spec.name = desc_.name;
  spec.command = desc_.command;
  spec.args = desc_.args;
  spec.env = desc_.env;
  spec.working_dir = desc_.working_dir;

  if (desc_.transport != TransportKind::kStdio) {
    auto port = ports_->Reserve(desc_.name + "/backend", std::nullopt, &e);
    if (!port) return fail(e);
    a.backend_port = *port;
    spec.env["PORT"] = std::to_string(*port);
    spec.env["MCP_PORT"] = std::to_string(*port);
  }

  const uint64_t gen = a.generation;
  a.proc = ProcessHandle::Spawn(spec, [this, gen](pid_t pid, int code) { OnExit(gen, pid, code); }, &e);
  if (!a.proc) return fail(e);
  bool stopping = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping = stop_requested_;
    if (!stopping) launching_ = a.proc.get();
  }
  if (stopping) return fail({ErrorCode::kChannelClosed, desc_.name + ": stop requested during start"});

  TransportTarget target;
  target.name = desc_.name;
  target.stdin_fd = a.proc->StdinFd();
  target.stdout_fd = a.proc->StdoutFd();
  target.host = "127.0.0.1";
  target.port = a.backend_port;
  target.connect_timeout_seconds = opts_.connect_timeout_seconds;

  a.client = std::make_shared<BackendClient>(desc_.name, MakeTransport(desc_.transport, target));
  a.client->SetCallTimeout(std::chrono::milliseconds(desc_.timeout_ms));
  a.client->SetCloseHandler([this, gen](const GatewayError& reason) { OnChannelClosed(gen, reason); });

  const auto deadline = Clock::now() + std::chrono::milliseconds(desc_.timeout_ms);
  auto remaining = [&] {
    return std::max(std::chrono::milliseconds(1),
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()));
  };

  if (!a.client->Open(remaining(), &e)) return fail(e);
  if (!a.client->Initialize(remaining(), &e)) return fail(e);
  auto tools = a.client->ListTools(remaining(), &e);
  if (!tools) return fail(e);

  auto port = ports_->Reserve(desc_.name, desc_.port_hint, &e);
  if (!port) return fail(e);
  a.service_port = *port;

  GatewayError abort_reason;
  {
    std::lock_guard<std::mutex> lock(mu_);
    launching_ = nullptr;
    if (stop_requested_) {
      abort_reason = {ErrorCode::kChannelClosed, desc_.name + ": stop requested during start"};
    } else if (!a.proc->IsAlive() || a.client->IsClosed()) {
      // The exit watcher ignores exits while Starting, so a child that died in the window is caught here.
      abort_reason = {ErrorCode::kChannelClosed, desc_.name + ": backend exited during start"};
    } else {
      current_.generation = a.generation;
      current_.proc = std::move(a.proc);
      current_.client = a.client;
      current_.service_port = a.service_port;
      current_.backend_port = a.backend_port;
      state_ = SupervisorState::kRunning;
      running_since_ = Clock::now();
    }
  }
  if (!abort_reason.ok()) return fail(abort_reason);

  LifecycleEvent ev;
  {
    std::lock_guard<std::mutex> lock(mu_);
    ev = MakeEvent(LifecycleEventKind::kStarted, current_);
  }
  std::cout << "[supervisor] name=" << desc_.name << " state=running generation=" << ev.generation
            << " pid=" << ev.pid << " port=" << ev.port << " tools=" << tools->size() << "\n";

  if (!Emit(ev)) {
    Attempt rejected;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (current_.generation == gen) {
        rejected = std::move(current_);
        current_ = Attempt{};
      }
      crash_pending_ = false;
      if (!stop_requested_) state_ = SupervisorState::kCrashed;
    }
    std::cout << "[supervisor] name=" << desc_.name << " start rejected generation=" << gen << "\n";
    Shutdown(&rejected, false);
    ReleasePorts(&rejected);
    SetError(err, ErrorCode::kSpawnFailure, desc_.name + ": start rejected by listener");
    return false;
  }
  return true;
}

void ProcessSupervisor::OnExit(uint64_t generation, pid_t pid, int code) {
  ReleaseHeld(pid);
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (generation != generation_ || state_ != SupervisorState::kRunning) return;
    crash_pending_ = true;
    crash_reason_ = {ErrorCode::kChannelClosed,
                     desc_.name + ": process " + std::to_string(pid) + " exited code=" + std::to_string(code)};
  }
  cv_.notify_all();
}

void ProcessSupervisor::OnChannelClosed(uint64_t generation, const GatewayError& reason) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (generation != generation_ || state_ != SupervisorState::kRunning || crash_pending_) return;
    crash_pending_ = true;
    crash_reason_ = reason;
  }
  cv_.notify_all();
}

void ProcessSupervisor::ControlLoop(bool recovering) {
  bool need_restart = recovering;
  const auto interval = std::chrono::milliseconds(std::max(opts_.health_interval_ms, 10));
  const auto stable_after = std::chrono::milliseconds(std::max(opts_.restart_reset_ms, 0));
  auto next_probe = Clock::now() + interval;

  while (true) {
    if (need_restart) {
      if (!RestartLoop()) return;
      need_restart = false;
      next_probe = Clock::now() + interval;
    }

    std::unique_lock<std::mutex> lock(mu_);
    auto wake = next_probe;
    if (restart_count_ > 0) wake = std::min(wake, running_since_ + stable_after);
    cv_.wait_until(lock, wake, [&] { return stop_requested_ || crash_pending_; });
    if (stop_requested_) return;
    if (crash_pending_) {
      crash_pending_ = false;
      lock.unlock();
      HandleCrash();
      need_restart = true;
      continue;
    }

    const auto now = Clock::now();
    if (restart_count_ > 0 && now - running_since_ >= stable_after) {
      std::cout << "[supervisor] name=" << desc_.name << " stable for " << stable_after.count()
                << "ms, restart counter reset from " << restart_count_ << "\n";
      restart_count_ = 0;
    }
    if (now < next_probe) continue;
    lock.unlock();
    next_probe = now + interval;
    RunProbe();
  }
}

void ProcessSupervisor::HandleCrash() {
  Attempt a;
  GatewayError reason;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stop_requested_) return;
    a = std::move(current_);
    current_ = Attempt{};
    state_ = SupervisorState::kCrashed;
    reason = crash_reason_;
  }
  std::cout << "[supervisor] name=" << desc_.name << " state=crashed generation=" << a.generation
            << " error=" << reason.ToString() << "\n";

  Shutdown(&a, false);
  if (a.generation != 0) {
    auto ev = MakeEvent(LifecycleEventKind::kCrashed, a);
    ev.error = reason;
    Emit(ev);
  }
  ReleasePorts(&a);
}

bool ProcessSupervisor::RestartLoop() {
  while (true) {
    int attempt = 0;
    GatewayError last;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stop_requested_) return false;
      attempt = restart_count_;
      last = crash_reason_;
    }

    if (!desc_.auto_restart || attempt >= desc_.max_restarts) {
      {
        std::lock_guard<std::mutex> lock(mu_);
        if (stop_requested_) return false;
        state_ = SupervisorState::kStopped;
      }
      std::cout << "[supervisor] name=" << desc_.name << " state=stopped unrecoverable restarts=" << attempt
                << " last_error=" << last.ToString() << "\n";
      LifecycleEvent ev;
      ev.kind = LifecycleEventKind::kUnrecoverable;
      ev.name = desc_.name;
      ev.generation = Generation();
      ev.restart_attempt = attempt;
      ev.error = {ErrorCode::kBackendUnrecoverable,
                  desc_.name + ": restart budget exhausted after " + std::to_string(attempt) +
                      " restarts; last error: " + last.message};
      Emit(ev);
      return false;
    }

    const auto backoff =
        ComputeBackoff(desc_.restart_backoff_ms, attempt, opts_.max_backoff_ms, opts_.jitter, UnitRandom());
    {
      std::lock_guard<std::mutex> lock(mu_);
      restart_count_ = attempt + 1;
    }
    std::cout << "[supervisor] name=" << desc_.name << " restarting attempt=" << attempt + 1 << "/"
              << desc_.max_restarts << " backoff_ms=" << backoff.count() << "\n";
    LifecycleEvent ev;
    ev.kind = LifecycleEventKind::kRestarting;
    ev.name = desc_.name;
    ev.generation = Generation();
    ev.restart_attempt = attempt + 1;
    ev.backoff = backoff;
    ev.error = last;
    Emit(ev);

    {
      std::unique_lock<std::mutex> lock(mu_);
      if (cv_.wait_for(lock, backoff, [&] { return stop_requested_; })) return false;
    }

    GatewayError e;
    if (LaunchAttempt(&e)) return true;
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != SupervisorState::kStopping) state_ = SupervisorState::kCrashed;
    crash_reason_ = e;
  }
}

void ProcessSupervisor::RunProbe() {
  std::shared_ptr<BackendClient> client;
  Attempt probe_target;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != SupervisorState::kRunning || !current_.client) return;
    client = current_.client;
    probe_target.generation = current_.generation;
    probe_target.service_port = current_.service_port;
  }

  GatewayError e;
  auto tools = client->ListTools(std::chrono::milliseconds(desc_.timeout_ms), &e);
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stop_requested_ || current_.generation != probe_target.generation) return;
  }
  if (!tools) {
    std::cout << "[supervisor] name=" << desc_.name << " probe failed generation=" << probe_target.generation
              << " error=" << e.ToString() << "\n";
  }
  LifecycleEvent ev;
  ev.kind = LifecycleEventKind::kProbe;
  ev.name = desc_.name;
  ev.generation = probe_target.generation;
  ev.port = probe_target.service_port;
  ev.client = client;
  ev.probe_ok = tools.has_value();
  ev.error = e;
  Emit(ev);
}

void ProcessSupervisor::Shutdown(Attempt* a, bool graceful) {
  if (graceful) {
    // Closing the client first joins the channel threads, so stdin can be closed without racing the writer.
    if (a->client) a->client->Close();
    if (a->proc) {
      a->proc->CloseStdin();
      a->proc->Terminate();
      if (!a->proc->WaitForExit(std::chrono::milliseconds(opts_.stop_grace_ms))) {
        std::cout << "[supervisor] name=" << desc_.name << " grace expired pid=" << a->proc->Pid()
                  << " sending SIGKILL\n";
        a->proc->Kill();
      }
    }
  } else if (a->proc) {
    a->proc->Kill();
  }
  if (a->proc && !a->proc->WaitForExit(std::chrono::milliseconds(opts_.reap_timeout_ms))) {
    std::cout << "[supervisor] name=" << desc_.name << " pid=" << a->proc->Pid() << " not reaped\n";
  }
  if (a->client) a->client->Close();
}

void ProcessSupervisor::ReleasePorts(Attempt* a) {
  if (a->proc && a->proc->IsAlive()) {
    std::cout << "[supervisor] name=" << desc_.name << " pid=" << a->proc->Pid()
              << " holding ports until exit service_port=" << a->service_port << " backend_port=" << a->backend_port
              << "\n";
    {
      std::lock_guard<std::mutex> lock(held_mu_);
      HeldPorts h;
      h.pid = a->proc->Pid();
      h.service_port = a->service_port;
      h.backend_port = a->backend_port;
      h.proc = std::move(a->proc);
      held_.push_back(std::move(h));
    }
    a->service_port = 0;
    a->backend_port = 0;
    // The child may have been reaped between the liveness check and the hand-off.
    CollectHeld();
    return;
  }
  CollectHeld();
  if (a->service_port > 0) ports_->Release(a->service_port);
  if (a->backend_port > 0) ports_->Release(a->backend_port);
  a->service_port = 0;
  a->backend_port = 0;
}

void ProcessSupervisor::ReleaseHeld(pid_t pid) {
  std::lock_guard<std::mutex> lock(held_mu_);
  for (auto& h : held_) {
    if (h.pid != pid) continue;
    if (h.service_port > 0) ports_->Release(h.service_port);
    if (h.backend_port > 0) ports_->Release(h.backend_port);
    std::cout << "[supervisor] name=" << desc_.name << " pid=" << pid << " reaped, ports released\n";
    h.service_port = 0;
    h.backend_port = 0;
  }
}

void ProcessSupervisor::CollectHeld() {
  std::vector<std::unique_ptr<ProcessHandle>> done;
  {
    std::lock_guard<std::mutex> lock(held_mu_);
    for (auto it = held_.begin(); it != held_.end();) {
      if (it->proc && it->proc->IsAlive()) {
        ++it;
        continue;
      }
      if (it->service_port > 0) ports_->Release(it->service_port);
      if (it->backend_port > 0) ports_->Release(it->backend_port);
      done.push_back(std::move(it->proc));
      it = held_.erase(it);
    }
  }
  // Destroyed outside the lock: each handle joins its exit watcher, which may be waiting in ReleaseHeld.
  done.clear();
}

void ProcessSupervisor::Stop() {
  std::lock_guard<std::mutex> ops(ops_mu_);
  Attempt a;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ == SupervisorState::kStopped && !control_.joinable()) return;
    stop_requested_ = true;
    const bool was_stopped = state_ == SupervisorState::kStopped;
    state_ = SupervisorState::kStopping;
    if (was_stopped) state_ = SupervisorState::kStopped;
    a = std::move(current_);
    current_ = Attempt{};
    if (launching_) launching_->Kill();
  }
  cv_.notify_all();
  std::cout << "[supervisor] name=" << desc_.name << " state=stopping generation=" << a.generation << "\n";

  Shutdown(&a, true);
  if (control_.joinable()) control_.join();

  auto ev = MakeEvent(LifecycleEventKind::kStopped, a);
  if (ev.generation == 0) ev.generation = Generation();
  Emit(ev);
  ReleasePorts(&a);
  a.proc.reset();

  {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = SupervisorState::kStopped;
    stop_requested_ = false;
    crash_pending_ = false;
  }
  std::cout << "[supervisor] name=" << desc_.name << " state=stopped\n";
}

}  // namespace mcpgw
