#pragma once

#include "gateway_error.hpp"
#include "tool_catalog.hpp"
#include "tool_reply.hpp"
#include "worker_supervisor.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace gateway {

struct ToolInvocation {
  std::string name;
  nlohmann::json arguments = nlohmann::json::object();
};

struct ToolInvocationResult {
  std::string text;
  ToolReply reply;
};

struct GatewayStatus {
  SupervisorStatus supervisor;
  CatalogSource catalog_source = CatalogSource::kBuiltin;
  size_t tool_count = 0;

  nlohmann::json ToJson() const;
};

// Entry point used by the HTTP layer: tool discovery and invocation against the
// supervised worker.
class ToolGateway {
 public:
  ToolGateway(WorkerSupervisor* supervisor, ToolCatalog* catalog);

  bool EnsureReady(const std::string& user_id, GatewayError* err);
  std::vector<ToolDescriptor> ListTools() const;

  // Never starts the worker. Fails with kNotReady without touching the worker when it
  // is not Ready.
  std::optional<ToolInvocationResult> Invoke(const ToolInvocation& call, GatewayError* err);

  // EnsureReady for user_id, then Invoke. The call is only written to a worker that is
  // still bound to user_id; losing it to another user fails with kSuperseded.
  std::optional<ToolInvocationResult> InvokeAs(const std::string& user_id,
                                               const ToolInvocation& call,
                                               GatewayError* err);

  bool IsReady() const;
  GatewayStatus Status() const;
  void Restart();
  void Shutdown();

 private:
  std::optional<ToolInvocationResult> Call(const std::string* user_id, const ToolInvocation& call, GatewayError* err);

  WorkerSupervisor* supervisor_;
  ToolCatalog* catalog_;
};

}  // namespace gateway
