#include "service_manager.hpp"

#include <future>
#include <iostream>
#include <utility>

namespace mcpgw {

ManagerOptions ManagerOptionsFromConfig(const GatewayConfig& cfg) {
  ManagerOptions o;
  o.supervisor.bridge_host = cfg.bridge_host;
  o.supervisor.health_interval_ms = cfg.health_interval_ms;
  o.supervisor.stop_grace_ms = cfg.stop_grace_ms;
  o.supervisor.max_backoff_ms = cfg.max_backoff_ms;
  o.supervisor.restart_reset_ms = cfg.restart_reset_ms;
  o.supervisor.connect_timeout_seconds = cfg.connect_timeout_seconds;
  return o;
}

ServiceManager::ServiceManager(ServiceRegistry* registry, PortAllocator* ports, ManagerOptions opts)
    : registry_(registry), ports_(ports), opts_(std::move(opts)) {}

ServiceManager::~ServiceManager() {
  StopAll();
}

bool ServiceManager::AddBackend(const BackendDescriptor& desc, GatewayError* err) {
  std::string verr;
  if (!ValidateDescriptor(desc, &verr)) {
    SetError(err, ErrorCode::kInvalidArgument, verr);
    return false;
  }
  auto entry = std::make_shared<Entry>();
  entry->desc = desc;
  entry->supervisor = std::make_unique<ProcessSupervisor>(desc, ports_, opts_.supervisor);
  Entry* raw = entry.get();
  entry->supervisor->SetListener([this, raw](const LifecycleEvent& ev) { return OnLifecycle(raw, ev); });

  std::lock_guard<std::mutex> lock(mu_);
  if (entries_.count(desc.name)) {
    SetError(err, ErrorCode::kAlreadyExists, "backend already exists: " + desc.name);
    return false;
  }
  if (externals_.count(desc.name)) {
    SetError(err, ErrorCode::kAlreadyExists, "name is registered as an external server: " + desc.name);
    return false;
  }
  entries_[desc.name] = std::move(entry);
  std::cout << "[gateway] backend added name=" << desc.name << " transport=" << TransportKindName(desc.transport)
            << " command=" << desc.command << "\n";
  return true;
}

std::shared_ptr<ServiceManager::Entry> ServiceManager::Find(const std::string& name, GatewayError* err) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    SetError(err, ErrorCode::kNotFound, "unknown backend: " + name);
    return nullptr;
  }
  return it->second;
}

ProcessSupervisor* ServiceManager::Supervisor(const std::string& name) const {
  auto entry = Find(name, nullptr);
  return entry ? entry->supervisor.get() : nullptr;
}

std::vector<std::string> ServiceManager::Names() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  for (const auto& kv : entries_) out.push_back(kv.first);
  return out;
}

bool ServiceManager::Start(const std::string& name, GatewayError* err) {
  auto entry = Find(name, err);
  if (!entry) return false;
  return entry->supervisor->Start(err) != nullptr;
}

bool ServiceManager::Stop(const std::string& name, GatewayError* err) {
  auto entry = Find(name, err);
  if (!entry) return false;
  entry->supervisor->Stop();
  return true;
}

bool ServiceManager::Restart(const std::string& name, GatewayError* err) {
  auto entry = Find(name, err);
  if (!entry) return false;
  std::cout << "[gateway] restart name=" << name << "\n";
  entry->supervisor->Stop();
  return entry->supervisor->Start(err) != nullptr;
}

bool ServiceManager::Remove(const std::string& name, GatewayError* err) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
      SetError(err, ErrorCode::kNotFound, "unknown backend: " + name);
      return false;
    }
    entry = it->second;
    entries_.erase(it);
  }
  entry->supervisor->Stop();
  StopBridge(entry.get());
  registry_->Deregister(name);
  std::cout << "[gateway] backend removed name=" << name << "\n";
  return true;
}

size_t ServiceManager::StartAll() {
  std::vector<std::shared_ptr<Entry>> all;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& kv : entries_) all.push_back(kv.second);
  }
  std::vector<std::future<bool>> starts;
  for (const auto& e : all) {
    starts.push_back(std::async(std::launch::async, [e] {
      GatewayError err;
      if (e->supervisor->Start(&err)) return true;
      std::cout << "[gateway] start failed name=" << e->desc.name << " error=" << err.ToString() << "\n";
      return false;
    }));
  }
  size_t ok = 0;
  for (auto& f : starts) {
    if (f.get()) ok++;
  }
  std::cout << "[gateway] started " << ok << "/" << all.size() << " backends\n";
  return ok;
}

void ServiceManager::StopAll() {
  std::vector<std::shared_ptr<Entry>> all;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& kv : entries_) all.push_back(kv.second);
  }
  std::vector<std::future<void>> stops;
  for (const auto& e : all) {
    stops.push_back(std::async(std::launch::async, [this, e] {
      e->supervisor->Stop();
      StopBridge(e.get());
    }));
  }
  for (auto& f : stops) f.get();
}

void ServiceManager::StopBridge(Entry* entry) {
  std::unique_ptr<HttpBridge> bridge;
  {
    std::lock_guard<std::mutex> lock(entry->bridge_mu);
    bridge = std::move(entry->bridge);
  }
  if (bridge) bridge->Stop();
}

bool ServiceManager::OnLifecycle(Entry* entry, const LifecycleEvent& ev) {
  const auto& name = ev.name;
  switch (ev.kind) {
    case LifecycleEventKind::kStarted: {
      StopBridge(entry);
      auto bridge = std::make_unique<HttpBridge>(name, ev.generation, ev.client, opts_.bridge);
      GatewayError err;
      if (!bridge->Start(opts_.supervisor.bridge_host, ev.port, &err)) {
        std::cout << "[gateway] bridge failed name=" << name << " error=" << err.ToString() << "\n";
        return false;
      }
      {
        std::lock_guard<std::mutex> lock(entry->bridge_mu);
        entry->bridge = std::move(bridge);
      }
      ServiceEndpoint ep;
      ep.host = opts_.supervisor.bridge_host == "0.0.0.0" ? "127.0.0.1" : opts_.supervisor.bridge_host;
      ep.port = ev.port;
      ep.generation = ev.generation;
      ep.health = Health::kHealthy;
      ep.transport = entry->desc.transport;
      ep.pid = ev.pid;
      if (!registry_->Register(name, ep)) {
        std::cout << "[gateway] stale registration ignored name=" << name << " generation=" << ev.generation << "\n";
      }
      return true;
    }
    case LifecycleEventKind::kCrashed:
      registry_->MarkHealth(name, Health::kStarting);
      StopBridge(entry);
      return true;
    case LifecycleEventKind::kRestarting:
      registry_->MarkHealth(name, Health::kStarting);
      return true;
    case LifecycleEventKind::kStopped:
      StopBridge(entry);
      registry_->MarkHealth(name, Health::kStopped);
      return true;
    case LifecycleEventKind::kUnrecoverable:
      StopBridge(entry);
      registry_->MarkHealth(name, Health::kStopped);
      std::cout << "[gateway] backend unrecoverable name=" << name << " error=" << ev.error.ToString() << "\n";
      return true;
    case LifecycleEventKind::kProbe:
      registry_->RecordProbe(name, ev.probe_ok);
      return true;
  }
  return true;
}

std::optional<ServiceEndpoint> ServiceManager::RegisterExternal(const ExternalEndpoint& ext, GatewayError* err) {
  if (!IsValidServiceName(ext.name)) {
    SetError(err, ErrorCode::kInvalidArgument, "invalid server name: '" + ext.name + "'");
    return std::nullopt;
  }
  if (ext.port <= 0 || ext.port > 65535) {
    SetError(err, ErrorCode::kInvalidArgument, ext.name + ": port must be in 1-65535");
    return std::nullopt;
  }
  if (ext.transport == TransportKind::kStdio) {
    SetError(err, ErrorCode::kInvalidArgument, ext.name + ": an external server must speak http or sse");
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (entries_.count(ext.name)) {
    SetError(err, ErrorCode::kAlreadyExists, "name belongs to a supervised backend: " + ext.name);
    return std::nullopt;
  }
  ServiceEndpoint ep;
  ep.name = ext.name;
  ep.host = ext.host;
  ep.port = ext.port;
  ep.transport = ext.transport;
  ep.pid = static_cast<pid_t>(ext.pid);
  ep.health = Health::kHealthy;
  const auto previous = registry_->Get(ext.name);
  ep.generation = previous ? previous->generation + 1 : 1;
  if (!registry_->Register(ext.name, ep)) {
    SetError(err, ErrorCode::kAlreadyExists, "a newer registration exists for " + ext.name);
    return std::nullopt;
  }
  externals_.insert(ext.name);
  std::cout << "[gateway] external registered name=" << ext.name << " upstream=" << ext.host << ":" << ext.port
            << " transport=" << TransportKindName(ext.transport) << " generation=" << ep.generation << "\n";
  return registry_->Get(ext.name);
}

bool ServiceManager::UnregisterExternal(const std::string& name, GatewayError* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (entries_.count(name)) {
    SetError(err, ErrorCode::kInvalidArgument, name + " is supervised; remove it through /proxy/backends");
    return false;
  }
  if (!externals_.erase(name)) {
    SetError(err, ErrorCode::kNotFound, "no external server registered as " + name);
    return false;
  }
  registry_->Deregister(name);
  std::cout << "[gateway] external unregistered name=" << name << "\n";
  return true;
}

bool ServiceManager::IsExternal(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mu_);
  return externals_.count(name) > 0;
}

nlohmann::json ServiceManager::MappingJson() const {
  std::set<std::string> externals;
  {
    std::lock_guard<std::mutex> lock(mu_);
    externals = externals_;
  }
  auto snap = registry_->Snapshot();
  nlohmann::json out = nlohmann::json::object();
  for (const auto& kv : *snap) {
    const auto& ep = kv.second;
    nlohmann::json j;
    j["host"] = ep.host;
    j["port"] = ep.port;
    j["transport"] = TransportKindName(ep.transport);
    j["generation"] = ep.generation;
    j["health"] = HealthName(ep.health);
    j["pid"] = static_cast<int64_t>(ep.pid);
    j["managed"] = externals.count(kv.first) == 0;
    out[kv.first] = std::move(j);
  }
  return out;
}

nlohmann::json ServiceManager::StatusJson() const {
  std::vector<std::shared_ptr<Entry>> all;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& kv : entries_) all.push_back(kv.second);
  }
  nlohmann::json out = nlohmann::json::array();
  for (const auto& e : all) {
    const auto* sup = e->supervisor.get();
    nlohmann::json j;
    j["name"] = e->desc.name;
    j["description"] = e->desc.description;
    j["transport"] = TransportKindName(e->desc.transport);
    j["state"] = SupervisorStateName(sup->State());
    j["generation"] = sup->Generation();
    j["spawn_attempts"] = sup->SpawnAttempts();
    j["restarts"] = sup->RestartCount();
    j["port"] = sup->Port();
    j["pid"] = static_cast<int64_t>(sup->Pid());
    if (auto ep = registry_->Get(e->desc.name)) j["health"] = HealthName(ep->health);
    if (auto client = sup->Client()) {
      if (auto tools = client->KnownTools()) j["tools"] = tools->size();
    }
    {
      std::lock_guard<std::mutex> lock(e->bridge_mu);
      j["sessions"] = e->bridge ? e->bridge->SessionCount() : 0;
    }
    out.push_back(std::move(j));
  }
  return out;
}

}  // namespace mcpgw
