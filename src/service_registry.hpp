#pragma once

#include "config.hpp"

#include <nlohmann/json.hpp>

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcpgw {

enum class Health { kStarting, kHealthy, kUnhealthy, kStopped };

const char* HealthName(Health h);

struct ServiceEndpoint {
  std::string name;
  std::string host = "127.0.0.1";
  int port = 0;
  uint64_t generation = 0;
  Health health = Health::kStarting;
  std::chrono::system_clock::time_point last_heartbeat{};
  TransportKind transport = TransportKind::kStdio;
  pid_t pid = 0;
};

nlohmann::json EndpointToJson(const ServiceEndpoint& ep);

enum class RegistryEventKind { kAdded, kUpdated, kHealthChanged, kRemoved };

const char* RegistryEventKindName(RegistryEventKind kind);

struct RegistryEvent {
  RegistryEventKind kind = RegistryEventKind::kAdded;
  ServiceEndpoint endpoint;
  Health previous_health = Health::kStarting;
};

// name -> endpoint. Writers serialize on one mutex and publish an immutable snapshot; readers only
// load the snapshot pointer. Subscribers run on the writer's thread, under the writer mutex, and must
// not call back into mutating methods.
class ServiceRegistry {
 public:
  using Map = std::map<std::string, ServiceEndpoint>;
  using SnapshotPtr = std::shared_ptr<const Map>;
  using Subscriber = std::function<void(const RegistryEvent&)>;

  explicit ServiceRegistry(int unhealthy_threshold = 3);

  // Returns false when an entry with an equal or newer generation already exists.
  bool Register(const std::string& name, ServiceEndpoint endpoint);
  bool Deregister(const std::string& name);
  bool MarkHealth(const std::string& name, Health health);
  bool RecordProbe(const std::string& name, bool ok);

  std::optional<ServiceEndpoint> Get(const std::string& name) const;
  SnapshotPtr Snapshot() const;

  int Subscribe(Subscriber callback);
  void Unsubscribe(int token);

  int UnhealthyThreshold() const { return unhealthy_threshold_; }

 private:
  void Publish(std::unique_ptr<Map> next);
  void Emit(const RegistryEvent& ev);

  int unhealthy_threshold_;

  std::mutex write_mu_;
  std::map<std::string, int> misses_;
  std::map<int, Subscriber> subscribers_;
  int next_token_ = 1;

  std::shared_ptr<const Map> snapshot_;
};

}  // namespace mcpgw
