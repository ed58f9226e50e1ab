#include "errors.hpp"

namespace mcpgw {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "None";
    case ErrorCode::kSpawnFailure:
      return "SpawnFailure";
    case ErrorCode::kProtocolError:
      return "ProtocolError";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kChannelClosed:
      return "ChannelClosed";
    case ErrorCode::kNoPortsAvailable:
      return "NoPortsAvailable";
    case ErrorCode::kPortConflict:
      return "PortConflict";
    case ErrorCode::kBackendUnrecoverable:
      return "BackendUnrecoverable";
    case ErrorCode::kToolNotFound:
      return "ToolNotFound";
    case ErrorCode::kUpstreamError:
      return "UpstreamError";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kAlreadyExists:
      return "AlreadyExists";
    case ErrorCode::kNotFound:
      return "NotFound";
  }
  return "Unknown";
}

std::string GatewayError::ToString() const {
  if (message.empty()) return ErrorCodeName(code);
  return std::string(ErrorCodeName(code)) + ": " + message;
}

bool IsBackendFatal(ErrorCode code) {
  return code == ErrorCode::kChannelClosed || code == ErrorCode::kProtocolError ||
         code == ErrorCode::kSpawnFailure;
}

}  // namespace mcpgw
