#include "service_registry.hpp"

#include <iostream>
#include <utility>

namespace mcpgw {

const char* HealthName(Health h) {
  switch (h) {
    case Health::kStarting:
      return "starting";
    case Health::kHealthy:
      return "healthy";
    case Health::kUnhealthy:
      return "unhealthy";
    case Health::kStopped:
      return "stopped";
  }
  return "unknown";
}

const char* RegistryEventKindName(RegistryEventKind kind) {
  switch (kind) {
    case RegistryEventKind::kAdded:
      return "added";
    case RegistryEventKind::kUpdated:
      return "updated";
    case RegistryEventKind::kHealthChanged:
      return "health";
    case RegistryEventKind::kRemoved:
      return "removed";
  }
  return "unknown";
}

nlohmann::json EndpointToJson(const ServiceEndpoint& ep) {
  nlohmann::json j;
  j["name"] = ep.name;
  j["host"] = ep.host;
  j["port"] = ep.port;
  j["generation"] = ep.generation;
  j["health"] = HealthName(ep.health);
  j["transport"] = TransportKindName(ep.transport);
  j["pid"] = static_cast<int64_t>(ep.pid);
  j["last_heartbeat"] = std::chrono::duration_cast<std::chrono::seconds>(ep.last_heartbeat.time_since_epoch()).count();
  return j;
}

ServiceRegistry::ServiceRegistry(int unhealthy_threshold)
    : unhealthy_threshold_(unhealthy_threshold > 0 ? unhealthy_threshold : 1),
      snapshot_(std::make_shared<const Map>()) {}

ServiceRegistry::SnapshotPtr ServiceRegistry::Snapshot() const {
  return std::atomic_load(&snapshot_);
}

std::optional<ServiceEndpoint> ServiceRegistry::Get(const std::string& name) const {
  auto snap = Snapshot();
  auto it = snap->find(name);
  if (it == snap->end()) return std::nullopt;
  return it->second;
}

void ServiceRegistry::Publish(std::unique_ptr<Map> next) {
  std::shared_ptr<const Map> p(std::move(next));
  std::atomic_store(&snapshot_, p);
}

void ServiceRegistry::Emit(const RegistryEvent& ev) {
  std::cout << "[registry] event=" << RegistryEventKindName(ev.kind) << " name=" << ev.endpoint.name
            << " generation=" << ev.endpoint.generation << " health=" << HealthName(ev.endpoint.health)
            << " port=" << ev.endpoint.port << "\n";
  for (const auto& kv : subscribers_) {
    if (kv.second) kv.second(ev);
  }
}

bool ServiceRegistry::Register(const std::string& name, ServiceEndpoint endpoint) {
  std::lock_guard<std::mutex> lock(write_mu_);
  endpoint.name = name;
  auto cur = std::atomic_load(&snapshot_);
  auto it = cur->find(name);

  RegistryEvent ev;
  if (it == cur->end()) {
    ev.kind = RegistryEventKind::kAdded;
    ev.previous_health = endpoint.health;
  } else {
    if (endpoint.generation <= it->second.generation) return false;
    ev.kind = RegistryEventKind::kUpdated;
    ev.previous_health = it->second.health;
  }
  if (endpoint.health == Health::kHealthy) endpoint.last_heartbeat = std::chrono::system_clock::now();

  auto next = std::make_unique<Map>(*cur);
  (*next)[name] = endpoint;
  Publish(std::move(next));
  misses_[name] = 0;

  ev.endpoint = std::move(endpoint);
  Emit(ev);
  return true;
}

bool ServiceRegistry::Deregister(const std::string& name) {
  std::lock_guard<std::mutex> lock(write_mu_);
  auto cur = std::atomic_load(&snapshot_);
  auto it = cur->find(name);
  if (it == cur->end()) return false;

  RegistryEvent ev;
  ev.kind = RegistryEventKind::kRemoved;
  ev.endpoint = it->second;
  ev.previous_health = it->second.health;

  auto next = std::make_unique<Map>(*cur);
  next->erase(name);
  Publish(std::move(next));
  misses_.erase(name);

  Emit(ev);
  return true;
}

bool ServiceRegistry::MarkHealth(const std::string& name, Health health) {
  std::lock_guard<std::mutex> lock(write_mu_);
  auto cur = std::atomic_load(&snapshot_);
  auto it = cur->find(name);
  if (it == cur->end()) return false;
  if (it->second.health == health) return true;

  RegistryEvent ev;
  ev.kind = RegistryEventKind::kHealthChanged;
  ev.previous_health = it->second.health;

  auto next = std::make_unique<Map>(*cur);
  auto& ep = (*next)[name];
  ep.health = health;
  if (health == Health::kHealthy) ep.last_heartbeat = std::chrono::system_clock::now();
  ev.endpoint = ep;
  Publish(std::move(next));
  misses_[name] = 0;

  Emit(ev);
  return true;
}

bool ServiceRegistry::RecordProbe(const std::string& name, bool ok) {
  std::lock_guard<std::mutex> lock(write_mu_);
  auto cur = std::atomic_load(&snapshot_);
  auto it = cur->find(name);
  if (it == cur->end()) return false;

  const Health before = it->second.health;
  Health after = before;
  if (ok) {
    misses_[name] = 0;
    if (before == Health::kUnhealthy) after = Health::kHealthy;
  } else {
    const int misses = ++misses_[name];
    if (before == Health::kHealthy && misses >= unhealthy_threshold_) after = Health::kUnhealthy;
  }

  auto next = std::make_unique<Map>(*cur);
  auto& ep = (*next)[name];
  ep.health = after;
  if (ok) ep.last_heartbeat = std::chrono::system_clock::now();
  RegistryEvent ev;
  ev.kind = RegistryEventKind::kHealthChanged;
  ev.previous_health = before;
  ev.endpoint = ep;
  Publish(std::move(next));

  if (after != before) Emit(ev);
  return true;
}

int ServiceRegistry::Subscribe(Subscriber callback) {
  std::lock_guard<std::mutex> lock(write_mu_);
  const int token = next_token_++;
  subscribers_[token] = std::move(callback);
  return token;
}

void ServiceRegistry::Unsubscribe(int token) {
  std::lock_guard<std::mutex> lock(write_mu_);
  subscribers_.erase(token);
}

}  // namespace mcpgw
