#include "process_handle.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

extern char** environ;

namespace mcpgw {
namespace {

constexpr int kDrainSliceMs = 200;

static void CloseFd(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}

// Parent environment with the descriptor's entries layered on top.
static std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
  std::map<std::string, std::string> merged;
  for (char** e = environ; e && *e; ++e) {
    std::string kv(*e);
    const auto eq = kv.find('=');
    if (eq == std::string::npos) continue;
    merged[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  for (const auto& kv : overrides) merged[kv.first] = kv.second;

  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& kv : merged) out.push_back(kv.first + "=" + kv.second);
  return out;
}

static int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

}  // namespace

std::unique_ptr<ProcessHandle> ProcessHandle::Spawn(const SpawnSpec& spec, ExitHandler on_exit, GatewayError* err) {
  if (spec.command.empty()) {
    SetError(err, ErrorCode::kSpawnFailure, spec.name + ": empty command");
    return nullptr;
  }

  // Everything the child needs is built before fork; only async-signal-safe calls run after it.
  std::vector<std::string> arg_storage;
  arg_storage.push_back(spec.command);
  arg_storage.insert(arg_storage.end(), spec.args.begin(), spec.args.end());
  std::vector<char*> argv;
  for (auto& a : arg_storage) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  auto env_storage = BuildEnvironment(spec.env);
  std::vector<char*> envp;
  for (auto& e : env_storage) envp.push_back(const_cast<char*>(e.c_str()));
  envp.push_back(nullptr);

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  auto close_all = [&] {
    for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
      CloseFd(&p[0]);
      CloseFd(&p[1]);
    }
  };
  if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    SetError(err, ErrorCode::kSpawnFailure, spec.name + ": pipe failed: " + std::strerror(errno));
    close_all();
    return nullptr;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    SetError(err, ErrorCode::kSpawnFailure, spec.name + ": fork failed: " + std::strerror(errno));
    close_all();
    return nullptr;
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGPIPE, SIG_DFL);

    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);

    int child_errno = 0;
    if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
      child_errno = errno;
    } else {
      ::execvpe(argv[0], argv.data(), envp.data());
      child_errno = errno;
    }
    ssize_t ignored = ::write(exec_pipe[1], &child_errno, sizeof(child_errno));
    (void)ignored;
    ::_exit(127);
  }

  // Mirror setpgid in the parent so signalling the group cannot race the child's own call.
  ::setpgid(pid, pid);
  CloseFd(&in_pipe[0]);
  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);
  CloseFd(&exec_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(&exec_pipe[0]);

  if (n > 0) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    close_all();
    SetError(err, ErrorCode::kSpawnFailure,
             spec.name + ": exec " + spec.command + " failed: " + std::strerror(child_errno));
    return nullptr;
  }

  std::unique_ptr<ProcessHandle> handle(new ProcessHandle(spec.name, pid, in_pipe[1], out_pipe[0], err_pipe[0]));
  std::cout << "[process] name=" << spec.name << " spawned pid=" << pid << " command=" << spec.command << "\n";
  handle->exit_watcher_ = std::thread([h = handle.get(), cb = std::move(on_exit)]() mutable { h->WatchExit(std::move(cb)); });
  handle->stderr_drain_ = std::thread([h = handle.get()] { h->DrainStderr(); });
  return handle;
}

ProcessHandle::ProcessHandle(std::string name, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : name_(std::move(name)),
      pid_(pid),
      started_at_(Clock::now()),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd) {}

ProcessHandle::~ProcessHandle() {
  if (IsAlive()) Kill();
  if (exit_watcher_.joinable()) {
    if (exit_watcher_.get_id() == std::this_thread::get_id()) {
      exit_watcher_.detach();
    } else {
      exit_watcher_.join();
    }
  }
  stop_drain_ = true;
  if (stderr_drain_.joinable()) stderr_drain_.join();
  CloseFd(&stdin_fd_);
  CloseFd(&stdout_fd_);
  CloseFd(&stderr_fd_);
}

bool ProcessHandle::IsAlive() const {
  std::lock_guard<std::mutex> lock(mu_);
  return !exited_;
}

std::optional<int> ProcessHandle::ExitCode() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (!exited_) return std::nullopt;
  return exit_code_;
}

void ProcessHandle::CloseStdin() {
  std::lock_guard<std::mutex> lock(mu_);
  CloseFd(&stdin_fd_);
}

bool ProcessHandle::WaitForExit(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  return exited_cv_.wait_for(lock, timeout, [&] { return exited_; });
}

void ProcessHandle::Terminate() {
  Signal(SIGTERM);
}

void ProcessHandle::Kill() {
  Signal(SIGKILL);
}

void ProcessHandle::Signal(int sig) {
  std::lock_guard<std::mutex> lock(mu_);
  // Once reaped the pid may be recycled; never signal it again.
  if (exited_) return;
  if (::kill(-pid_, sig) != 0 && errno == ESRCH) ::kill(pid_, sig);
}

void ProcessHandle::WatchExit(ExitHandler on_exit) {
  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(pid_, &status, 0);
  } while (r < 0 && errno == EINTR);

  const int code = r == pid_ ? DecodeWaitStatus(status) : -1;
  {
    std::lock_guard<std::mutex> lock(mu_);
    exited_ = true;
    exit_code_ = code;
  }
  exited_cv_.notify_all();
  std::cout << "[process] name=" << name_ << " exited pid=" << pid_ << " code=" << code << "\n";
  if (on_exit) on_exit(pid_, code);
}

void ProcessHandle::DrainStderr() {
  std::string buf;
  char chunk[4096];
  while (!stop_drain_) {
    pollfd pfd{};
    pfd.fd = stderr_fd_;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, kDrainSliceMs);
    if (rc < 0 && errno != EINTR) break;
    if (rc <= 0) continue;
    const ssize_t n = ::read(stderr_fd_, chunk, sizeof(chunk));
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
    if (n <= 0) break;
    buf.append(chunk, static_cast<size_t>(n));
    size_t pos;
    while ((pos = buf.find('\n')) != std::string::npos) {
      std::string line = buf.substr(0, pos);
      buf.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (!line.empty()) std::cout << "[backend] name=" << name_ << " stderr=" << line << "\n";
    }
  }
  if (!buf.empty()) std::cout << "[backend] name=" << name_ << " stderr=" << buf << "\n";
}

}  // namespace mcpgw
