#pragma once

#include <string>

namespace gateway {

enum class GatewayErrorKind {
  kNone,
  kSpawnFailure,
  kReadinessTimeout,
  kHandshakeFailure,
  kRequestTimeout,
  kRemoteToolError,
  kSuperseded,
  kProcessExit,
  kNotReady,
  kTransport,
  kInvalidArgument,
};

struct GatewayError {
  GatewayErrorKind kind = GatewayErrorKind::kNone;
  std::string message;

  bool ok() const { return kind == GatewayErrorKind::kNone; }
};

const char* ErrorKindName(GatewayErrorKind kind);

// Writes into *err when err is non-null. Returns false so callers can `return SetError(...)`.
bool SetError(GatewayError* err, GatewayErrorKind kind, std::string message);

}  // namespace gateway
