#include "gateway_error.hpp"

#include <utility>

namespace gateway {

const char* ErrorKindName(GatewayErrorKind kind) {
  switch (kind) {
    case GatewayErrorKind::kNone:
      return "none";
    case GatewayErrorKind::kSpawnFailure:
      return "spawn_failure";
    case GatewayErrorKind::kReadinessTimeout:
      return "readiness_timeout";
    case GatewayErrorKind::kHandshakeFailure:
      return "handshake_failure";
    case GatewayErrorKind::kRequestTimeout:
      return "request_timeout";
    case GatewayErrorKind::kRemoteToolError:
      return "remote_tool_error";
    case GatewayErrorKind::kSuperseded:
      return "superseded";
    case GatewayErrorKind::kProcessExit:
      return "process_exit";
    case GatewayErrorKind::kNotReady:
      return "tools_unavailable";
    case GatewayErrorKind::kTransport:
      return "transport_error";
    case GatewayErrorKind::kInvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

bool SetError(GatewayError* err, GatewayErrorKind kind, std::string message) {
  if (err) {
    err->kind = kind;
    err->message = std::move(message);
  }
  return false;
}

}  // namespace gateway
