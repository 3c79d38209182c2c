// Stand-in for the workspace worker: same boot markers and line protocol, no Google calls.

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static void Reply(const nlohmann::json& id, nlohmann::json result) {
  nlohmann::json j;
  j["jsonrpc"] = "2.0";
  j["id"] = id;
  j["result"] = std::move(result);
  std::cout << j.dump() << "\n" << std::flush;
}

static void ReplyError(const nlohmann::json& id, int code, const std::string& message) {
  nlohmann::json j;
  j["jsonrpc"] = "2.0";
  j["id"] = id;
  j["error"] = {{"code", code}, {"message", message}};
  std::cout << j.dump() << "\n" << std::flush;
}

static nlohmann::json TextContent(const std::string& text) {
  return {{"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}};
}

static nlohmann::json ToolList() {
  auto object_schema = [](nlohmann::json properties, nlohmann::json required) {
    return nlohmann::json{{"type", "object"}, {"properties", std::move(properties)}, {"required", std::move(required)}};
  };
  nlohmann::json tools = nlohmann::json::array();
  tools.push_back({{"name", "echo"},
                   {"description", "Return the given text unchanged"},
                   {"inputSchema", object_schema({{"text", {{"type", "string"}}}}, {"text"})}});
  tools.push_back({{"name", "whoami"},
                   {"description", "Return the user this worker was started for"},
                   {"inputSchema", object_schema(nlohmann::json::object(), nlohmann::json::array())}});
  tools.push_back({{"name", "fail"},
                   {"description", "Always fails with a JSON-RPC error"},
                   {"inputSchema", object_schema(nlohmann::json::object(), nlohmann::json::array())}});
  return {{"tools", std::move(tools)}};
}

static void HandleToolCall(const nlohmann::json& id, const nlohmann::json& params) {
  if (!params.is_object()) return ReplyError(id, -32602, "invalid params");
  const std::string name = params.value("name", "");
  const nlohmann::json args = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();
  if (name == "echo") {
    std::string text;
    if (args.is_object() && args.contains("text") && args["text"].is_string()) text = args["text"].get<std::string>();
    return Reply(id, TextContent(text));
  }
  if (name == "whoami") return Reply(id, TextContent(GetEnvStr("SESSION_USER_ID")));
  if (name == "fail") return ReplyError(id, -32000, "tool failed on purpose");
  nlohmann::json r = TextContent("Unknown tool: " + name);
  r["isError"] = true;
  Reply(id, std::move(r));
}

}  // namespace

int main() {
  if (GetEnvStr("GOOGLE_ACCESS_TOKEN").empty()) {
    std::cerr << "GOOGLE_ACCESS_TOKEN is not set" << std::endl;
    return 2;
  }

  std::cerr << "Google Drive service initialized" << std::endl;
  std::cerr << "Gmail service initialized" << std::endl;
  std::cerr << "Google Calendar service initialized" << std::endl;
  std::cerr << "Google Docs service initialized" << std::endl;
  std::cerr << "Server ready with Google Drive, Gmail, Calendar and Docs" << std::endl;

  std::string line;
  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    auto msg = nlohmann::json::parse(line, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
      std::cerr << "ignoring malformed line" << std::endl;
      continue;
    }
    const std::string method = msg.value("method", "");
    if (!msg.contains("id")) continue;  // notification
    const auto& id = msg["id"];
    const nlohmann::json params = msg.contains("params") ? msg["params"] : nlohmann::json::object();

    if (method == "initialize") {
      std::string version = "2024-11-05";
      if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        version = params["protocolVersion"].get<std::string>();
      }
      Reply(id, {{"protocolVersion", version},
                 {"capabilities", {{"tools", nlohmann::json::object()}}},
                 {"serverInfo", {{"name", "mock-workspace-worker"}, {"version", "1.0.0"}}}});
    } else if (method == "tools/list") {
      Reply(id, ToolList());
    } else if (method == "tools/call") {
      HandleToolCall(id, params);
    } else {
      ReplyError(id, -32601, "method not found: " + method);
    }
  }
  return 0;
}
