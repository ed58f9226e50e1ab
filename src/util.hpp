#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace mcpgw {

std::string TruncateForLog(std::string s, size_t max_chars);

// Drops credential-looking keys before a payload is written to the log.
std::string SanitizeJsonForLog(const nlohmann::json& body);

// "<prefix>-<ms since epoch, hex>-<random hex>"
std::string NewId(const std::string& prefix);

bool StartsWith(const std::string& s, const std::string& prefix);
std::string ToLower(std::string s);

}  // namespace mcpgw
