#include "config.hpp"
#include "credentials.hpp"
#include "gateway_router.hpp"
#include "posix_worker_launcher.hpp"
#include "tool_catalog.hpp"
#include "tool_gateway.hpp"
#include "worker_supervisor.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <signal.h>

#include <chrono>
#include <iostream>
#include <thread>

int main() {
  std::cout.setf(std::ios::unitbuf);
  auto cfg = gateway::LoadConfigFromEnv();

  // SIGINT/SIGTERM are taken by a dedicated thread so the worker is shut down cleanly.
  // Threads created below inherit the mask; the launcher clears it in the child.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

  std::cout << "[gateway] worker command=" << cfg.worker.command << " args=" << cfg.worker.args.size()
            << " readiness_timeout_ms=" << cfg.worker.readiness_timeout_ms
            << " request_timeout_ms=" << cfg.worker.request_timeout_ms << "\n";
  std::cout << "[gateway] credentials file=" << cfg.credentials_file << "\n";

  gateway::FileCredentialStore credentials(cfg.credentials_file);
  gateway::PosixWorkerLauncher launcher;
  gateway::ToolCatalog catalog;

  gateway::SupervisorOptions options;
  options.worker = cfg.worker;
  options.client = cfg.google;
  options.handshake = cfg.handshake;
  gateway::WorkerSupervisor supervisor(options, &launcher, &credentials, &catalog);
  gateway::ToolGateway tools(&supervisor, &catalog);

  httplib::Server server;
  gateway::GatewayRouter router(&tools);
  router.Register(&server);

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  // Tool calls can take up to the request timeout plus worker startup.
  server.set_write_timeout(120);

  server.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    res.status = 200;
    res.set_content(j.dump(), "application/json");
  });

  std::thread signal_thread([&server, stop_signals]() {
    int sig = 0;
    if (sigwait(&stop_signals, &sig) == 0) {
      std::cout << "[gateway] signal " << sig << " received, stopping\n";
      server.stop();
    }
  });
  signal_thread.detach();

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";

  tools.Shutdown();
  return ok ? 0 : 1;
}
