#include "config.hpp"

#include <cstdlib>
#include <string>
#include <vector>

namespace gateway {
namespace {

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  for (auto& v : out) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
  }
  std::vector<std::string> filtered;
  for (auto& v : out) {
    if (!v.empty()) filtered.push_back(std::move(v));
  }
  return filtered;
}

static bool TryParseInt(const std::string& s, int* out) {
  if (!out || s.empty()) return false;
  char* end = nullptr;
  long n = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  if (n < 0 || n > 24L * 3600 * 1000) return false;
  *out = static_cast<int>(n);
  return true;
}

static void ReadIntEnv(const char* name, int* target) {
  auto v = GetEnvStr(name);
  if (v.empty()) return;
  int parsed = 0;
  if (TryParseInt(v, &parsed)) *target = parsed;
}

}  // namespace

GatewayConfig LoadConfigFromEnv() {
  GatewayConfig cfg;

  if (auto host = GetEnvStr("GATEWAY_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = GetEnvStr("GATEWAY_LISTEN_PORT"); !port.empty()) {
    int p = 0;
    if (TryParseInt(port, &p) && p > 0 && p < 65536) cfg.listen.port = p;
  } else if (auto port2 = GetEnvStr("PORT"); !port2.empty()) {
    int p = 0;
    if (TryParseInt(port2, &p) && p > 0 && p < 65536) cfg.listen.port = p;
  }

  if (auto cmd = GetEnvStr("WORKER_COMMAND"); !cmd.empty()) cfg.worker.command = cmd;
  if (auto script = GetEnvStr("WORKER_SCRIPT"); !script.empty()) {
    cfg.worker.script_path = script;
    cfg.worker.args = {script};
  }
  if (auto args = GetEnvStr("WORKER_ARGS"); !args.empty()) cfg.worker.args = SplitCsv(args);
  if (auto cwd = GetEnvStr("WORKER_CWD"); !cwd.empty()) cfg.worker.working_dir = cwd;
  ReadIntEnv("WORKER_READINESS_TIMEOUT_MS", &cfg.worker.readiness_timeout_ms);
  ReadIntEnv("WORKER_REQUEST_TIMEOUT_MS", &cfg.worker.request_timeout_ms);
  ReadIntEnv("WORKER_HANDSHAKE_DELAY_MS", &cfg.worker.handshake_delay_ms);
  ReadIntEnv("WORKER_TERMINATE_GRACE_MS", &cfg.worker.terminate_grace_ms);

  cfg.google.client_id = GetEnvStr("GOOGLE_CLIENT_ID");
  cfg.google.client_secret = GetEnvStr("GOOGLE_CLIENT_SECRET");

  if (auto v = GetEnvStr("MCP_PROTOCOL_VERSION"); !v.empty()) cfg.handshake.protocol_version = v;
  if (auto v = GetEnvStr("MCP_CLIENT_NAME"); !v.empty()) cfg.handshake.client_name = v;
  if (auto v = GetEnvStr("MCP_CLIENT_VERSION"); !v.empty()) cfg.handshake.client_version = v;

  if (auto f = GetEnvStr("CREDENTIALS_FILE"); !f.empty()) cfg.credentials_file = f;

  return cfg;
}

}  // namespace gateway
