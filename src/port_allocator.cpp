#include "port_allocator.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <iostream>
#include <utility>

namespace mcpgw {

PortAllocator::PortAllocator(PortRange range, std::string bind_host)
    : range_(range), bind_host_(std::move(bind_host)), cursor_(range.first) {}

bool PortAllocator::ProbeBindable(const std::string& host, int port) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return false;
  int one = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  if (host.empty() || host == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  }
  const bool ok = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
  ::close(fd);
  return ok;
}

std::optional<int> PortAllocator::Reserve(const std::string& owner, std::optional<int> hint, GatewayError* err) {
  std::lock_guard<std::mutex> lock(mu_);

  if (hint) {
    const int port = *hint;
    auto it = reserved_.find(port);
    if (it != reserved_.end()) {
      SetError(err, ErrorCode::kPortConflict,
               "port " + std::to_string(port) + " already reserved by " + it->second);
      return std::nullopt;
    }
    if (ProbeBindable(bind_host_, port)) {
      reserved_[port] = owner;
      std::cout << "[ports] reserved port=" << port << " owner=" << owner << " hint=true\n";
      return port;
    }
    std::cout << "[ports] hint port=" << port << " busy owner=" << owner << " scanning\n";
  }

  const int span = range_.last - range_.first + 1;
  for (int i = 0; i < span; i++) {
    const int port = range_.first + (cursor_ - range_.first + i) % span;
    if (reserved_.count(port)) continue;
    if (!ProbeBindable(bind_host_, port)) continue;
    reserved_[port] = owner;
    cursor_ = port + 1 > range_.last ? range_.first : port + 1;
    std::cout << "[ports] reserved port=" << port << " owner=" << owner << "\n";
    return port;
  }

  SetError(err, ErrorCode::kNoPortsAvailable,
           "no free port in " + std::to_string(range_.first) + "-" + std::to_string(range_.last));
  return std::nullopt;
}

bool PortAllocator::Release(int port) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = reserved_.find(port);
  if (it == reserved_.end()) return false;
  std::cout << "[ports] released port=" << port << " owner=" << it->second << "\n";
  reserved_.erase(it);
  return true;
}

bool PortAllocator::IsReserved(int port) const {
  std::lock_guard<std::mutex> lock(mu_);
  return reserved_.count(port) > 0;
}

std::optional<std::string> PortAllocator::OwnerOf(int port) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = reserved_.find(port);
  if (it == reserved_.end()) return std::nullopt;
  return it->second;
}

std::map<int, std::string> PortAllocator::Reserved() const {
  std::lock_guard<std::mutex> lock(mu_);
  return reserved_;
}

}  // namespace mcpgw
