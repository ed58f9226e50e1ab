#pragma once

#include "config.hpp"
#include "errors.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mcpgw {

// Hands out ports from a fixed range. In-process reservations are tracked here; ports held by other
// processes are detected with a bind probe.
class PortAllocator {
 public:
  explicit PortAllocator(PortRange range, std::string bind_host = "127.0.0.1");

  std::optional<int> Reserve(const std::string& owner, std::optional<int> hint, GatewayError* err);
  bool Release(int port);
  bool IsReserved(int port) const;
  std::optional<std::string> OwnerOf(int port) const;
  std::map<int, std::string> Reserved() const;
  const PortRange& Range() const { return range_; }

  static bool ProbeBindable(const std::string& host, int port);

 private:
  PortRange range_;
  std::string bind_host_;

  mutable std::mutex mu_;
  std::map<int, std::string> reserved_;
  int cursor_;
};

}  // namespace mcpgw
