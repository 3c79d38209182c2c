#include "gateway_router.hpp"

#include "log_util.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <map>
#include <string>

namespace gateway {
namespace {

static const char* const kToolCategories[] = {"drive", "gmail", "calendar", "docs", "sheets"};

static nlohmann::json MakeError(const std::string& message, const std::string& type) {
  nlohmann::json j;
  j["error"] = {{"message", message}, {"type", type}};
  return j;
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(), "application/json");
}

static void SendGatewayError(httplib::Response* res, const GatewayError& err) {
  SendJson(res, HttpStatusForError(err.kind), MakeError(err.message, ErrorKindName(err.kind)));
}

static nlohmann::json ParseJsonBody(const httplib::Request& req) {
  if (req.body.empty()) return nlohmann::json::object();
  return nlohmann::json::parse(req.body, nullptr, false);
}

static std::string UserIdFrom(const httplib::Request& req) {
  return req.get_header_value("X-User-Id");
}

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static nlohmann::json ToolNames(const std::vector<ToolDescriptor>& tools) {
  nlohmann::json names = nlohmann::json::array();
  for (const auto& t : tools) names.push_back(t.name);
  return names;
}

static nlohmann::json CountCategories(const std::vector<ToolDescriptor>& tools) {
  nlohmann::json out = nlohmann::json::object();
  for (const char* category : kToolCategories) {
    const std::string prefix = std::string(category) + "_";
    int n = 0;
    for (const auto& t : tools) {
      if (StartsWith(t.name, prefix)) n++;
    }
    out[category] = n;
  }
  return out;
}

}  // namespace

int HttpStatusForError(GatewayErrorKind kind) {
  switch (kind) {
    case GatewayErrorKind::kNone:
      return 200;
    case GatewayErrorKind::kInvalidArgument:
      return 400;
    case GatewayErrorKind::kRemoteToolError:
    case GatewayErrorKind::kTransport:
      return 502;
    case GatewayErrorKind::kRequestTimeout:
    case GatewayErrorKind::kReadinessTimeout:
      return 504;
    case GatewayErrorKind::kNotReady:
    case GatewayErrorKind::kSpawnFailure:
    case GatewayErrorKind::kHandshakeFailure:
    case GatewayErrorKind::kSuperseded:
    case GatewayErrorKind::kProcessExit:
      return 503;
  }
  return 500;
}

GatewayRouter::GatewayRouter(ToolGateway* gateway) : gateway_(gateway) {}

void GatewayRouter::Register(httplib::Server* server) {
  server->Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
    const auto tools = gateway_->ListTools();
    const bool ready = gateway_->IsReady();
    nlohmann::json j;
    j["status"] = "ok";
    j["mcpReady"] = ready;
    j["availableTools"] = tools.size();
    j["tools"] = ToolNames(tools);
    j["toolCategories"] = CountCategories(tools);
    j["timestamp"] = Iso8601UtcNow();
    SendJson(&res, 200, j);
  });

  server->Get("/api/tools", [this](const httplib::Request&, httplib::Response& res) {
    const auto tools = gateway_->ListTools();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& t : tools) list.push_back(ToFunctionToolJson(t));
    nlohmann::json j;
    j["tools"] = std::move(list);
    j["mcpReady"] = gateway_->IsReady();
    j["totalTools"] = tools.size();
    SendJson(&res, 200, j);
  });

  server->Get("/api/mcp/status", [this](const httplib::Request&, httplib::Response& res) {
    auto j = gateway_->Status().ToJson();
    j["tools"] = ToolNames(gateway_->ListTools());
    j["timestamp"] = Iso8601UtcNow();
    SendJson(&res, 200, j);
  });

  server->Post("/api/mcp/initialize", [this](const httplib::Request& req, httplib::Response& res) {
    const auto user_id = UserIdFrom(req);
    if (user_id.empty()) return SendJson(&res, 401, MakeError("missing X-User-Id header", "authentication_error"));
    std::cout << "[http] initialize user=" << user_id << "\n";
    GatewayError err;
    if (!gateway_->EnsureReady(user_id, &err)) return SendGatewayError(&res, err);
    auto j = gateway_->Status().ToJson();
    j["success"] = true;
    j["message"] = "worker initialized";
    SendJson(&res, 200, j);
  });

  server->Post("/api/mcp/restart", [this](const httplib::Request& req, httplib::Response& res) {
    const auto user_id = UserIdFrom(req);
    std::cout << "[http] restart user=" << (user_id.empty() ? "-" : user_id) << "\n";
    gateway_->Restart();
    if (!user_id.empty()) {
      GatewayError err;
      if (!gateway_->EnsureReady(user_id, &err)) return SendGatewayError(&res, err);
    }
    auto j = gateway_->Status().ToJson();
    j["success"] = true;
    j["message"] = user_id.empty() ? "worker stopped" : "worker restarted";
    SendJson(&res, 200, j);
  });

  server->Post("/api/tools/call", [this](const httplib::Request& req, httplib::Response& res) {
    // The worker carries one user's Google tokens, so every call names its user.
    const auto user_id = UserIdFrom(req);
    if (user_id.empty()) return SendJson(&res, 401, MakeError("missing X-User-Id header", "authentication_error"));
    auto body = ParseJsonBody(req);
    if (body.is_discarded() || !body.is_object()) {
      return SendJson(&res, 400, MakeError("invalid JSON body", "invalid_request_error"));
    }
    ToolInvocation call;
    if (body.contains("name") && body["name"].is_string()) call.name = body["name"].get<std::string>();
    if (call.name.empty()) return SendJson(&res, 400, MakeError("missing tool name", "invalid_request_error"));
    if (body.contains("arguments")) {
      if (!body["arguments"].is_object() && !body["arguments"].is_null()) {
        return SendJson(&res, 400, MakeError("arguments must be an object", "invalid_request_error"));
      }
      if (body["arguments"].is_object()) call.arguments = body["arguments"];
    }

    GatewayError err;
    auto out = gateway_->InvokeAs(user_id, call, &err);
    if (!out) return SendGatewayError(&res, err);

    nlohmann::json j;
    j["name"] = call.name;
    j["result"] = out->text;
    j["isError"] = out->reply.is_error;
    SendJson(&res, 200, j);
  });

  server->set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    try {
      if (ep) std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      message = e.what();
    } catch (...) {
      message = "non-standard exception";
    }
    std::cout << "[http] handler exception: " << message << "\n";
    SendJson(&res, 500, MakeError(message, "server_error"));
  });

  server->set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    std::string type = "invalid_request_error";
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "internal error";
      type = "server_error";
    } else {
      message = "bad request";
    }
    res.set_content(MakeError(message, type).dump(), "application/json");
  });
}

}  // namespace gateway
