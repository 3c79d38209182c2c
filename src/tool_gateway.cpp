#include "tool_gateway.hpp"

#include "log_util.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace gateway {

nlohmann::json GatewayStatus::ToJson() const {
  nlohmann::json j;
  j["state"] = SupervisorStateName(supervisor.state);
  j["isReady"] = supervisor.ready;
  j["userId"] = supervisor.bound_user.empty() ? nlohmann::json(nullptr) : nlohmann::json(supervisor.bound_user);
  j["processRunning"] = supervisor.process_running;
  j["pid"] = supervisor.pid > 0 ? nlohmann::json(supervisor.pid) : nlohmann::json(nullptr);
  j["generation"] = supervisor.generation;
  j["pendingRequests"] = supervisor.pending_requests;
  j["initializationStatus"] = supervisor.readiness.ToJson();
  j["toolSource"] = CatalogSourceName(catalog_source);
  j["toolCount"] = tool_count;
  if (!supervisor.last_error.ok()) {
    j["lastError"] = {{"type", ErrorKindName(supervisor.last_error.kind)}, {"message", supervisor.last_error.message}};
  }
  return j;
}

ToolGateway::ToolGateway(WorkerSupervisor* supervisor, ToolCatalog* catalog)
    : supervisor_(supervisor), catalog_(catalog) {}

bool ToolGateway::EnsureReady(const std::string& user_id, GatewayError* err) {
  return supervisor_->EnsureReady(user_id, err);
}

std::vector<ToolDescriptor> ToolGateway::ListTools() const {
  return catalog_->List();
}

std::optional<ToolInvocationResult> ToolGateway::Invoke(const ToolInvocation& call, GatewayError* err) {
  return Call(nullptr, call, err);
}

std::optional<ToolInvocationResult> ToolGateway::InvokeAs(const std::string& user_id,
                                                          const ToolInvocation& call,
                                                          GatewayError* err) {
  if (call.name.empty()) {
    SetError(err, GatewayErrorKind::kInvalidArgument, "tool name is required");
    return std::nullopt;
  }
  if (!supervisor_->EnsureReady(user_id, err)) return std::nullopt;
  return Call(&user_id, call, err);
}

std::optional<ToolInvocationResult> ToolGateway::Call(const std::string* user_id,
                                                      const ToolInvocation& call,
                                                      GatewayError* err) {
  if (call.name.empty()) {
    SetError(err, GatewayErrorKind::kInvalidArgument, "tool name is required");
    return std::nullopt;
  }
  if (!supervisor_->IsReady()) {
    SetError(err, GatewayErrorKind::kNotReady, "tools unavailable: worker not ready");
    return std::nullopt;
  }

  nlohmann::json params;
  params["name"] = call.name;
  params["arguments"] = call.arguments.is_null() ? nlohmann::json::object() : call.arguments;

  std::cout << "[tool-call] name=" << call.name
            << " args=" << TruncateForLog(SanitizeJsonForLog(params["arguments"]), 2000) << "\n";
  const auto start = std::chrono::steady_clock::now();

  GatewayError cause;
  auto result = user_id ? supervisor_->RequestAs(*user_id, "tools/call", params, &cause)
                        : supervisor_->Request("tools/call", params, &cause);
  const auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
  if (!result) {
    std::cout << "[tool-result] name=" << call.name << " ok=0 ms=" << elapsed_ms
              << " kind=" << ErrorKindName(cause.kind) << " error=" << cause.message << "\n";
    SetError(err, cause.kind, "tool " + call.name + " failed: " + cause.message);
    return std::nullopt;
  }

  ToolInvocationResult out;
  out.reply = ParseToolReply(*result);
  out.text = RenderToolReplyText(out.reply);
  std::cout << "[tool-result] name=" << call.name << " ok=1 ms=" << elapsed_ms
            << " is_error=" << (out.reply.is_error ? 1 : 0) << " text=" << TruncateForLog(out.text, 500) << "\n";
  return out;
}

bool ToolGateway::IsReady() const {
  return supervisor_->IsReady();
}

GatewayStatus ToolGateway::Status() const {
  GatewayStatus s;
  s.supervisor = supervisor_->Status();
  s.catalog_source = catalog_->source();
  s.tool_count = catalog_->size();
  return s;
}

void ToolGateway::Restart() {
  supervisor_->Restart();
}

void ToolGateway::Shutdown() {
  supervisor_->Shutdown();
}

}  // namespace gateway
