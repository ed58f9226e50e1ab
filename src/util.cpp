#include "util.hpp"

#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <random>
#include <sstream>

namespace mcpgw {
namespace {

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

}  // namespace

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

std::string SanitizeJsonForLog(const nlohmann::json& body) {
  if (body.is_null()) return "null";
  if (!body.is_object()) return body.dump();
  auto j = body;
  for (const auto& key : {"api_key", "api-key", "authorization", "apiKey", "token", "password"}) {
    if (j.contains(key)) j.erase(key);
  }
  if (j.contains("params") && j["params"].is_object() && j["params"].contains("arguments") &&
      j["params"]["arguments"].is_object()) {
    auto& args = j["params"]["arguments"];
    for (const auto& key : {"api_key", "api-key", "authorization", "apiKey", "token", "password"}) {
      if (args.contains(key)) args[key] = "***";
    }
  }
  return j.dump();
}

std::string NewId(const std::string& prefix) {
  auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
          .count());
  return prefix + "-" + Hex(now) + "-" + Hex(Rand64());
}

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

}  // namespace mcpgw
