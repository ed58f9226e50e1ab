#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "http_bridge.hpp"
#include "port_allocator.hpp"
#include "process_supervisor.hpp"
#include "service_registry.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcpgw {

struct ManagerOptions {
  SupervisorOptions supervisor;
  BridgeOptions bridge;
};

ManagerOptions ManagerOptionsFromConfig(const GatewayConfig& cfg);

// One supervisor and at most one bridge per backend name. Supervisor lifecycle events drive the bridge
// and the registry entry for that name.
class ServiceManager {
 public:
  ServiceManager(ServiceRegistry* registry, PortAllocator* ports, ManagerOptions opts);
  ~ServiceManager();

  ServiceManager(const ServiceManager&) = delete;
  ServiceManager& operator=(const ServiceManager&) = delete;

  bool AddBackend(const BackendDescriptor& desc, GatewayError* err);
  bool Start(const std::string& name, GatewayError* err);
  bool Stop(const std::string& name, GatewayError* err);
  bool Restart(const std::string& name, GatewayError* err);
  bool Remove(const std::string& name, GatewayError* err);

  // Starts every backend concurrently and returns how many reached Running on their first attempt.
  size_t StartAll();
  void StopAll();

  std::vector<std::string> Names() const;
  ProcessSupervisor* Supervisor(const std::string& name) const;
  nlohmann::json StatusJson() const;

  // Routes to a server the gateway did not start. Each registration under a name replaces the previous one
  // with the next generation; names of supervised backends are refused.
  std::optional<ServiceEndpoint> RegisterExternal(const ExternalEndpoint& ext, GatewayError* err);
  bool UnregisterExternal(const std::string& name, GatewayError* err);
  bool IsExternal(const std::string& name) const;

  // name -> where requests for it go, for supervised and external services alike.
  nlohmann::json MappingJson() const;

 private:
  // The supervisor is declared last so it is destroyed first, while the bridge slot it reports to still exists.
  struct Entry {
    BackendDescriptor desc;
    std::mutex bridge_mu;
    std::unique_ptr<HttpBridge> bridge;
    std::unique_ptr<ProcessSupervisor> supervisor;
  };

  std::shared_ptr<Entry> Find(const std::string& name, GatewayError* err) const;
  bool OnLifecycle(Entry* entry, const LifecycleEvent& ev);
  void StopBridge(Entry* entry);

  ServiceRegistry* registry_;
  PortAllocator* ports_;
  ManagerOptions opts_;

  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<Entry>> entries_;
  std::set<std::string> externals_;
};

}  // namespace mcpgw
