#include "config.hpp"
#include "http_util.hpp"
#include "management_api.hpp"
#include "port_allocator.hpp"
#include "proxy_router.hpp"
#include "service_manager.hpp"
#include "service_registry.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using mcpgw::GatewayError;

int main() {
  std::cout.setf(std::ios::unitbuf);
  std::signal(SIGPIPE, SIG_IGN);

  // Block the shutdown signals before any thread exists so only the sigwait thread sees them.
  sigset_t shutdown_signals;
  sigemptyset(&shutdown_signals);
  sigaddset(&shutdown_signals, SIGINT);
  sigaddset(&shutdown_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);

  const auto cfg = mcpgw::LoadConfigFromEnv();
  if (!cfg.backends_error.empty()) {
    std::cout << "[config] invalid GATEWAY_BACKENDS: " << cfg.backends_error << "\n";
    return 2;
  }
  std::cout << "[config] listen=" << cfg.listen.host << ":" << cfg.listen.port << " ports=" << cfg.ports.first << "-"
            << cfg.ports.last << " backends=" << cfg.backends.size() << " health_interval_ms=" << cfg.health_interval_ms
            << "\n";

  mcpgw::ServiceRegistry registry(cfg.unhealthy_threshold);
  mcpgw::PortAllocator ports(cfg.ports, cfg.bridge_host);
  mcpgw::ServiceManager manager(&registry, &ports, mcpgw::ManagerOptionsFromConfig(cfg));
  mcpgw::RouterOptions ropts;
  ropts.upstream_timeout_seconds = cfg.upstream_timeout_seconds;
  ropts.connect_timeout_seconds = cfg.connect_timeout_seconds;
  mcpgw::ProxyRouter router(&registry, ropts);

  for (const auto& d : cfg.backends) {
    GatewayError err;
    if (!manager.AddBackend(d, &err)) std::cout << "[gateway] skipping backend error=" << err.ToString() << "\n";
  }

  httplib::Server server;
  // Every relayed event stream pins one worker.
  server.new_task_queue = [] { return new httplib::ThreadPool(64); };
  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(60);
  mcpgw::InstallJsonErrorHandlers(&server);
  mcpgw::RegisterManagementRoutes(&server, &manager);
  router.Register(&server);

  if (!server.bind_to_port(cfg.listen.host, cfg.listen.port)) {
    std::cout << "[http] bind failed host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
    return 1;
  }

  std::atomic<bool> listen_done{false};
  std::thread signal_thread([&] {
    int sig = 0;
    if (sigwait(&shutdown_signals, &sig) != 0) return;
    std::cout << "[gateway] signal=" << sig << " shutting down\n";
    // stop() is a no-op until the listener is running; keep asking until it has returned.
    while (!listen_done) {
      server.stop();
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });

  manager.StartAll();

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen_after_bind();
  listen_done = true;
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";

  manager.StopAll();
  // Wake the signal thread if the listener ended for another reason.
  pthread_kill(signal_thread.native_handle(), SIGTERM);
  signal_thread.join();
  std::cout << "[gateway] bye\n";
  return ok ? 0 : 1;
}
