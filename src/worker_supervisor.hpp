#pragma once

#include "config.hpp"
#include "credentials.hpp"
#include "gateway_error.hpp"
#include "line_codec.hpp"
#include "readiness_detector.hpp"
#include "request_multiplexer.hpp"
#include "tool_catalog.hpp"
#include "worker_process.hpp"

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gateway {

enum class SupervisorState {
  kIdle,
  kStarting,
  kAwaitingReadiness,
  kHandshaking,
  kReady,
  kTerminating,
  kError,
};

const char* SupervisorStateName(SupervisorState state);

struct SupervisorOptions {
  WorkerConfig worker;
  ClientIdentity client;
  HandshakeConfig handshake;
  // Pass the gateway's own environment through to the worker (PATH, HOME, ...).
  bool inherit_environment = true;
};

struct SupervisorStatus {
  SupervisorState state = SupervisorState::kIdle;
  bool ready = false;
  std::string bound_user;
  bool process_running = false;
  int64_t pid = 0;
  uint64_t generation = 0;
  size_t pending_requests = 0;
  ReadinessState readiness;
  GatewayError last_error;
};

// Owns the single worker process. At most one worker is alive and at most one
// initialization is in flight; a request for another user tears the current worker
// down first, so users are served one at a time.
//
// Worker events (output chunks, exit) arrive on the worker's monitor thread and are
// applied under mu_, tagged with the generation of the worker they belong to. Events
// from a worker that is no longer current are dropped.
class WorkerSupervisor {
 public:
  WorkerSupervisor(SupervisorOptions options,
                   IWorkerLauncher* launcher,
                   ICredentialStore* credentials,
                   ToolCatalog* catalog,
                   ReadinessDetectorFactory detector_factory = {});
  ~WorkerSupervisor();

  WorkerSupervisor(const WorkerSupervisor&) = delete;
  WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

  // Blocks until the worker bound to user_id is Ready or the attempt fails. Concurrent
  // calls for the same user share one attempt and its outcome.
  bool EnsureReady(const std::string& user_id, GatewayError* err);

  // Sends a request to the Ready worker and waits for its reply.
  std::optional<nlohmann::json> Request(const std::string& method, const nlohmann::json& params, GatewayError* err);
  // As Request, but fails with kSuperseded unless the Ready worker is bound to user_id.
  std::optional<nlohmann::json> RequestAs(const std::string& user_id,
                                          const std::string& method,
                                          const nlohmann::json& params,
                                          GatewayError* err);

  bool IsReady() const;
  bool IsReadyFor(const std::string& user_id) const;
  SupervisorStatus Status() const;

  // Tears the worker down (pending calls fail as superseded). The next EnsureReady spawns again.
  void Restart();
  void Shutdown();

  // Called under the supervisor lock on every state change; must not call back in.
  void SetStateObserver(std::function<void(SupervisorState)> observer);

 private:
  struct ProcessHandle {
    std::mutex mu;
    std::shared_ptr<IWorkerProcess> process;
  };

  struct WorkerInstance {
    uint64_t generation = 0;
    std::string user_id;
    std::shared_ptr<ProcessHandle> handle;
    std::shared_ptr<RequestMultiplexer> mux;
    std::unique_ptr<IReadinessDetector> detector;
    LineFramer stdout_framer;
    LineFramer stderr_framer;
    bool ready_event = false;
    std::string recent_output;
  };

  struct Attempt {
    uint64_t generation = 0;
    std::string user_id;
    std::promise<GatewayError> promise;
    std::shared_future<GatewayError> outcome;
    bool aborted = false;
    GatewayError abort_error;
  };

  void RunAttempt(const std::shared_ptr<Attempt>& attempt);
  GatewayError ExecuteAttempt(const std::shared_ptr<Attempt>& attempt);
  GatewayError PerformHandshake(const std::shared_ptr<Attempt>& attempt, const std::shared_ptr<RequestMultiplexer>& mux);
  void RefreshCatalog(const std::shared_ptr<RequestMultiplexer>& mux);
  std::optional<nlohmann::json> Dispatch(const std::string* user_id,
                                         const std::string& method,
                                         const nlohmann::json& params,
                                         GatewayError* err);

  void HandleOutput(uint64_t generation, WorkerStream stream, const std::string& chunk);
  void HandleExit(uint64_t generation, int exit_code);
  void ProcessLinesLocked(WorkerStream stream,
                          const std::vector<std::string>& lines,
                          std::vector<nlohmann::json>* messages);

  bool IsCurrentLocked(const std::shared_ptr<Attempt>& attempt) const;
  GatewayError AbortErrorLocked(const std::shared_ptr<Attempt>& attempt) const;
  void TeardownLocked(GatewayErrorKind kind, const std::string& reason);
  void SetStateLocked(SupervisorState next);
  void ReapRetired();

  const SupervisorOptions options_;
  IWorkerLauncher* launcher_;
  ICredentialStore* credentials_;
  ToolCatalog* catalog_;
  ReadinessDetectorFactory detector_factory_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  SupervisorState state_ = SupervisorState::kIdle;
  std::string bound_user_;
  uint64_t generation_ = 0;
  bool shutdown_ = false;
  std::unique_ptr<WorkerInstance> worker_;
  std::shared_ptr<Attempt> attempt_;
  std::vector<std::shared_ptr<IWorkerProcess>> retired_;
  GatewayError last_error_;
  std::function<void(SupervisorState)> observer_;
};

}  // namespace gateway
