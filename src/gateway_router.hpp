#pragma once

#include "tool_gateway.hpp"

#include <httplib.h>

namespace gateway {

// HTTP surface for the chat front end. The caller identity comes from the X-User-Id
// header, which the authenticating proxy in front of the gateway is trusted to set.
class GatewayRouter {
 public:
  explicit GatewayRouter(ToolGateway* gateway);
  void Register(httplib::Server* server);

 private:
  ToolGateway* gateway_;
};

// HTTP status used for a failed gateway operation.
int HttpStatusForError(GatewayErrorKind kind);

}  // namespace gateway
