#pragma once

#include <string>
#include <utility>

namespace mcpgw {

enum class ErrorCode {
  kNone = 0,
  kSpawnFailure,
  kProtocolError,
  kTimeout,
  kChannelClosed,
  kNoPortsAvailable,
  kPortConflict,
  kBackendUnrecoverable,
  kToolNotFound,
  kUpstreamError,
  kInvalidArgument,
  kAlreadyExists,
  kNotFound,
};

const char* ErrorCodeName(ErrorCode code);

struct GatewayError {
  ErrorCode code = ErrorCode::kNone;
  std::string message;

  bool ok() const { return code == ErrorCode::kNone; }
  std::string ToString() const;
};

inline void SetError(GatewayError* err, ErrorCode code, std::string message) {
  if (!err) return;
  err->code = code;
  err->message = std::move(message);
}

// Backend-fatal errors end the current attempt and hand control to the restart policy.
bool IsBackendFatal(ErrorCode code);

}  // namespace mcpgw
