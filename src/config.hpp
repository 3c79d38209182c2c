#pragma once

#include <string>
#include <vector>

namespace gateway {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 3000;
};

struct WorkerConfig {
  std::string command = "python3";
  std::vector<std::string> args = {"mcp_toolkit.py"};
  // Checked for existence before spawning when non-empty.
  std::string script_path;
  std::string working_dir;
  int readiness_timeout_ms = 25000;
  int request_timeout_ms = 30000;
  int handshake_delay_ms = 1000;
  int terminate_grace_ms = 2000;
};

struct ClientIdentity {
  std::string client_id;
  std::string client_secret;
};

struct HandshakeConfig {
  std::string protocol_version = "2024-11-05";
  std::string client_name = "google-workspace-client";
  std::string client_version = "1.0.0";
};

struct GatewayConfig {
  HttpListenConfig listen;
  WorkerConfig worker;
  ClientIdentity google;
  HandshakeConfig handshake;
  std::string credentials_file = "credentials.json";
};

GatewayConfig LoadConfigFromEnv();

}  // namespace gateway
