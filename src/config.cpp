#include "config.hpp"

#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace mcpgw {
namespace {

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::optional<int> GetEnvInt(const char* key) {
  const char* v = std::getenv(key);
  if (!v || !*v) return std::nullopt;
  char* end = nullptr;
  long n = std::strtol(v, &end, 10);
  if (end == v) return std::nullopt;
  if (n > INT32_MAX) n = INT32_MAX;
  if (n < INT32_MIN) n = INT32_MIN;
  return static_cast<int>(n);
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static std::optional<PortRange> ParsePortRange(const std::string& s) {
  auto dash = s.find('-');
  if (dash == std::string::npos) return std::nullopt;
  PortRange r;
  r.first = std::atoi(s.substr(0, dash).c_str());
  r.last = std::atoi(s.substr(dash + 1).c_str());
  if (r.first <= 0 || r.last > 65535 || r.first > r.last) return std::nullopt;
  return r;
}

static bool HasPlaceholder(const std::string& s) {
  return s.find("${") != std::string::npos;
}

}  // namespace

bool IsValidServiceName(const std::string& name) {
  if (name.empty() || name.size() > 64) return false;
  for (char c : name) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
                    c == '_' || c == '.';
    if (!ok) return false;
  }
  return true;
}

const char* TransportKindName(TransportKind kind) {
  switch (kind) {
    case TransportKind::kStdio:
      return "stdio";
    case TransportKind::kHttp:
      return "http";
    case TransportKind::kSse:
      return "sse";
  }
  return "stdio";
}

std::optional<TransportKind> ParseTransportKind(const std::string& s) {
  const std::string v = ToLower(s);
  if (v.empty() || v == "stdio") return TransportKind::kStdio;
  if (v == "http" || v == "streamable-http") return TransportKind::kHttp;
  if (v == "sse") return TransportKind::kSse;
  return std::nullopt;
}

bool ValidateDescriptor(const BackendDescriptor& d, std::string* err) {
  if (!IsValidServiceName(d.name)) {
    if (err) *err = "invalid backend name: '" + d.name + "'";
    return false;
  }
  if (d.command.empty()) {
    if (err) *err = d.name + ": command is required";
    return false;
  }
  if (d.timeout_ms <= 0) {
    if (err) *err = d.name + ": timeout_ms must be positive";
    return false;
  }
  if (d.max_restarts < 0 || d.restart_backoff_ms < 0) {
    if (err) *err = d.name + ": restart settings must not be negative";
    return false;
  }
  if (d.port_hint && (*d.port_hint <= 0 || *d.port_hint > 65535)) {
    if (err) *err = d.name + ": port out of range";
    return false;
  }
  std::vector<const std::string*> fields = {&d.command, &d.working_dir};
  for (const auto& a : d.args) fields.push_back(&a);
  for (const auto& kv : d.env) fields.push_back(&kv.second);
  for (const auto* f : fields) {
    if (HasPlaceholder(*f)) {
      if (err) *err = d.name + ": unexpanded placeholder in '" + *f + "'";
      return false;
    }
  }
  return true;
}

std::optional<BackendDescriptor> ParseBackendDescriptor(const nlohmann::json& j, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "backend descriptor must be an object";
    return std::nullopt;
  }
  BackendDescriptor d;
  if (j.contains("name") && j["name"].is_string()) d.name = j["name"].get<std::string>();
  if (j.contains("command") && j["command"].is_string()) d.command = j["command"].get<std::string>();
  if (j.contains("args") && j["args"].is_array()) {
    for (const auto& a : j["args"]) {
      if (!a.is_string()) {
        if (err) *err = d.name + ": args must be strings";
        return std::nullopt;
      }
      d.args.push_back(a.get<std::string>());
    }
  }
  if (j.contains("env") && j["env"].is_object()) {
    for (auto it = j["env"].begin(); it != j["env"].end(); ++it) {
      if (it.value().is_string()) {
        d.env[it.key()] = it.value().get<std::string>();
      } else {
        d.env[it.key()] = it.value().dump();
      }
    }
  }
  if (j.contains("cwd") && j["cwd"].is_string()) d.working_dir = j["cwd"].get<std::string>();
  if (j.contains("transport") && j["transport"].is_string()) {
    auto kind = ParseTransportKind(j["transport"].get<std::string>());
    if (!kind) {
      if (err) *err = d.name + ": unknown transport '" + j["transport"].get<std::string>() + "'";
      return std::nullopt;
    }
    d.transport = *kind;
  }
  if (j.contains("timeout_ms") && j["timeout_ms"].is_number_integer()) d.timeout_ms = j["timeout_ms"].get<int>();
  if (j.contains("auto_restart") && j["auto_restart"].is_boolean()) d.auto_restart = j["auto_restart"].get<bool>();
  if (j.contains("max_restarts") && j["max_restarts"].is_number_integer()) {
    d.max_restarts = j["max_restarts"].get<int>();
  }
  if (j.contains("restart_backoff_ms") && j["restart_backoff_ms"].is_number_integer()) {
    d.restart_backoff_ms = j["restart_backoff_ms"].get<int>();
  }
  if (j.contains("port") && j["port"].is_number_integer()) d.port_hint = j["port"].get<int>();
  if (j.contains("description") && j["description"].is_string()) d.description = j["description"].get<std::string>();

  if (!ValidateDescriptor(d, err)) return std::nullopt;
  return d;
}

std::optional<std::vector<BackendDescriptor>> ParseBackendDescriptors(const std::string& json_text, std::string* err) {
  auto j = nlohmann::json::parse(json_text, nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "backends: invalid json";
    return std::nullopt;
  }
  if (!j.is_array()) {
    if (err) *err = "backends: expected a json array";
    return std::nullopt;
  }
  std::vector<BackendDescriptor> out;
  std::set<std::string> seen;
  for (const auto& item : j) {
    auto d = ParseBackendDescriptor(item, err);
    if (!d) return std::nullopt;
    if (!seen.insert(d->name).second) {
      if (err) *err = "backends: duplicate name '" + d->name + "'";
      return std::nullopt;
    }
    out.push_back(std::move(*d));
  }
  return out;
}

nlohmann::json DescriptorToJson(const BackendDescriptor& d) {
  nlohmann::json j;
  j["name"] = d.name;
  j["command"] = d.command;
  j["args"] = d.args;
  j["transport"] = TransportKindName(d.transport);
  j["timeout_ms"] = d.timeout_ms;
  j["auto_restart"] = d.auto_restart;
  j["max_restarts"] = d.max_restarts;
  j["restart_backoff_ms"] = d.restart_backoff_ms;
  if (d.port_hint) j["port"] = *d.port_hint;
  if (!d.description.empty()) j["description"] = d.description;
  return j;
}

std::optional<ExternalEndpoint> ParseExternalEndpoint(const nlohmann::json& j, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "registration must be an object";
    return std::nullopt;
  }
  ExternalEndpoint e;
  if (j.contains("server_name") && j["server_name"].is_string()) {
    e.name = j["server_name"].get<std::string>();
  } else if (j.contains("name") && j["name"].is_string()) {
    e.name = j["name"].get<std::string>();
  }
  if (!IsValidServiceName(e.name)) {
    if (err) *err = "invalid server_name: '" + e.name + "'";
    return std::nullopt;
  }
  if (j.contains("host") && j["host"].is_string() && !j["host"].get<std::string>().empty()) {
    e.host = j["host"].get<std::string>();
  }
  if (j.contains("port")) {
    if (j["port"].is_number_integer()) {
      e.port = j["port"].get<int>();
    } else if (j["port"].is_string()) {
      const auto text = j["port"].get<std::string>();
      char* end = nullptr;
      const long n = std::strtol(text.c_str(), &end, 10);
      if (end != text.c_str() && *end == '\0') e.port = static_cast<int>(n);
    }
  }
  if (e.port <= 0 || e.port > 65535) {
    if (err) *err = e.name + ": port is required and must be in 1-65535";
    return std::nullopt;
  }
  if (j.contains("transport") && j["transport"].is_string()) {
    auto kind = ParseTransportKind(j["transport"].get<std::string>());
    if (!kind) {
      if (err) *err = e.name + ": unknown transport '" + j["transport"].get<std::string>() + "'";
      return std::nullopt;
    }
    e.transport = *kind;
  }
  if (j.contains("pid") && j["pid"].is_number_integer()) e.pid = j["pid"].get<int64_t>();
  return e;
}

nlohmann::json ExternalEndpointToJson(const ExternalEndpoint& e) {
  nlohmann::json j;
  j["name"] = e.name;
  j["host"] = e.host;
  j["port"] = e.port;
  j["transport"] = TransportKindName(e.transport);
  if (e.pid > 0) j["pid"] = e.pid;
  return j;
}

GatewayConfig LoadConfigFromEnv() {
  GatewayConfig cfg;

  if (auto host = GetEnvStr("GATEWAY_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = GetEnvInt("GATEWAY_LISTEN_PORT")) cfg.listen.port = *port;
  if (auto host = GetEnvStr("GATEWAY_BRIDGE_HOST"); !host.empty()) cfg.bridge_host = host;

  if (auto range = GetEnvStr("GATEWAY_PORT_RANGE"); !range.empty()) {
    if (auto r = ParsePortRange(range)) {
      cfg.ports = *r;
    } else {
      std::cout << "[config] ignoring invalid GATEWAY_PORT_RANGE=" << range << "\n";
    }
  }

  if (auto v = GetEnvInt("GATEWAY_HEALTH_INTERVAL_MS"); v && *v > 0) cfg.health_interval_ms = *v;
  if (auto v = GetEnvInt("GATEWAY_UNHEALTHY_THRESHOLD"); v && *v > 0) cfg.unhealthy_threshold = *v;
  if (auto v = GetEnvInt("GATEWAY_STOP_GRACE_MS"); v && *v >= 0) cfg.stop_grace_ms = *v;
  if (auto v = GetEnvInt("GATEWAY_MAX_BACKOFF_MS"); v && *v > 0) cfg.max_backoff_ms = *v;
  if (auto v = GetEnvInt("GATEWAY_RESTART_RESET_MS"); v && *v > 0) cfg.restart_reset_ms = *v;
  if (auto v = GetEnvInt("GATEWAY_UPSTREAM_TIMEOUT_S"); v && *v > 0) cfg.upstream_timeout_seconds = *v;
  if (auto v = GetEnvInt("GATEWAY_CONNECT_TIMEOUT_S"); v && *v > 0) cfg.connect_timeout_seconds = *v;

  if (auto raw = GetEnvStr("GATEWAY_BACKENDS"); !raw.empty()) {
    std::string err;
    auto list = ParseBackendDescriptors(raw, &err);
    if (list) {
      cfg.backends = std::move(*list);
    } else {
      cfg.backends_error = err;
    }
  }

  if (auto v = GetEnvStr("GATEWAY_AUTO_RESTART"); !v.empty()) {
    bool b = true;
    if (TryParseBool(v, &b)) {
      for (auto& d : cfg.backends) d.auto_restart = b;
    }
  }

  return cfg;
}

}  // namespace mcpgw
