#include "worker_supervisor.hpp"

#include "log_util.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>
#include <utility>

namespace gateway {
namespace {

constexpr size_t kRecentOutputCap = 4096;
constexpr size_t kTimeoutTailChars = 500;
constexpr int kMaxToolListPages = 64;

static GatewayError MakeError(GatewayErrorKind kind, std::string message) {
  GatewayError e;
  e.kind = kind;
  e.message = std::move(message);
  return e;
}

static std::string Tail(const std::string& s, size_t n) {
  if (s.size() <= n) return s;
  return s.substr(s.size() - n);
}

}  // namespace

const char* SupervisorStateName(SupervisorState state) {
  switch (state) {
    case SupervisorState::kIdle:
      return "idle";
    case SupervisorState::kStarting:
      return "starting";
    case SupervisorState::kAwaitingReadiness:
      return "awaiting_readiness";
    case SupervisorState::kHandshaking:
      return "handshaking";
    case SupervisorState::kReady:
      return "ready";
    case SupervisorState::kTerminating:
      return "terminating";
    case SupervisorState::kError:
      return "error";
  }
  return "unknown";
}

WorkerSupervisor::WorkerSupervisor(SupervisorOptions options,
                                   IWorkerLauncher* launcher,
                                   ICredentialStore* credentials,
                                   ToolCatalog* catalog,
                                   ReadinessDetectorFactory detector_factory)
    : options_(std::move(options)),
      launcher_(launcher),
      credentials_(credentials),
      catalog_(catalog),
      detector_factory_(std::move(detector_factory)) {
  if (!detector_factory_) detector_factory_ = MakeMarkerDetectorFactory(WorkspaceReadinessProfile());
}

WorkerSupervisor::~WorkerSupervisor() {
  Shutdown();
  // Monitor callbacks point at this supervisor; wait out any write still holding a process.
  for (;;) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (retired_.empty()) break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    ReapRetired();
  }
}

bool WorkerSupervisor::EnsureReady(const std::string& user_id, GatewayError* err) {
  if (user_id.empty()) return SetError(err, GatewayErrorKind::kInvalidArgument, "user id is required");
  ReapRetired();

  std::shared_ptr<Attempt> mine;
  std::shared_future<GatewayError> shared;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shutdown_) return SetError(err, GatewayErrorKind::kNotReady, "gateway is shutting down");
    if (state_ == SupervisorState::kReady && worker_ && bound_user_ == user_id) return true;

    if (attempt_ && attempt_->user_id == user_id) {
      std::cout << "[gateway] initialization already in progress for user=" << user_id << ", waiting\n";
      shared = attempt_->outcome;
    } else {
      if (worker_ || attempt_) {
        const std::string prev = attempt_ ? attempt_->user_id : bound_user_;
        std::cout << "[gateway] switching worker from user=" << (prev.empty() ? "-" : prev) << " to user=" << user_id
                  << "\n";
        TeardownLocked(GatewayErrorKind::kSuperseded, "superseded by initialization for another user");
      }
      mine = std::make_shared<Attempt>();
      mine->generation = ++generation_;
      mine->user_id = user_id;
      mine->outcome = mine->promise.get_future().share();
      attempt_ = mine;
      shared = mine->outcome;
      std::cout << "[gateway] initialization requested user=" << user_id << " generation=" << mine->generation << "\n";
      SetStateLocked(SupervisorState::kStarting);
    }
  }

  if (mine) {
    // The previous worker has to be gone before its successor is spawned.
    ReapRetired();
    RunAttempt(mine);
  }

  GatewayError outcome = shared.get();
  if (!outcome.ok()) {
    if (err) *err = std::move(outcome);
    return false;
  }
  return true;
}

void WorkerSupervisor::RunAttempt(const std::shared_ptr<Attempt>& attempt) {
  GatewayError result = ExecuteAttempt(attempt);
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!result.ok()) {
      std::cout << "[gateway] initialization failed user=" << attempt->user_id << " kind=" << ErrorKindName(result.kind)
                << " error=" << result.message << "\n";
      last_error_ = result;
      if (attempt_ == attempt) {
        // Still the current attempt, so the worker (if any) is ours to tear down.
        SetStateLocked(SupervisorState::kError);
        TeardownLocked(result.kind, result.message);
      }
    } else {
      last_error_ = GatewayError();
    }
    if (attempt_ == attempt) attempt_.reset();
  }
  ReapRetired();
  attempt->promise.set_value(std::move(result));
}

GatewayError WorkerSupervisor::ExecuteAttempt(const std::shared_ptr<Attempt>& attempt) {
  const auto& user_id = attempt->user_id;

  std::string cred_err;
  auto creds = credentials_ ? credentials_->Load(user_id, &cred_err) : std::nullopt;
  if (!creds) {
    std::string msg = "no credentials found for user " + user_id;
    if (!cred_err.empty()) msg += ": " + cred_err;
    return MakeError(GatewayErrorKind::kSpawnFailure, msg);
  }

  if (!options_.worker.script_path.empty()) {
    std::error_code ec;
    if (!std::filesystem::exists(options_.worker.script_path, ec)) {
      return MakeError(GatewayErrorKind::kSpawnFailure, "worker script not found: " + options_.worker.script_path);
    }
  }

  WorkerLaunchSpec spec;
  spec.executable = options_.worker.command;
  spec.args = options_.worker.args;
  spec.working_dir = options_.worker.working_dir;
  spec.terminate_grace = std::chrono::milliseconds(options_.worker.terminate_grace_ms);
  spec.env = BuildWorkerEnvironment(options_.inherit_environment ? CurrentEnvironment() : EnvironmentList{}, user_id,
                                    *creds, options_.client);

  auto handle = std::make_shared<ProcessHandle>();
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!IsCurrentLocked(attempt)) return AbortErrorLocked(attempt);
    auto w = std::make_unique<WorkerInstance>();
    w->generation = attempt->generation;
    w->user_id = user_id;
    w->handle = handle;
    w->detector = detector_factory_();
    std::weak_ptr<ProcessHandle> weak = handle;
    w->mux = std::make_shared<RequestMultiplexer>([weak](const std::string& line, std::chrono::milliseconds timeout,
                                                       std::string* werr) {
      auto h = weak.lock();
      std::shared_ptr<IWorkerProcess> p;
      if (h) {
        std::lock_guard<std::mutex> hl(h->mu);
        p = h->process;
      }
      if (!p) {
        if (werr) *werr = "worker process is not running";
        return false;
      }
      return p->Write(line, timeout, werr);
    });
    worker_ = std::move(w);
  }

  std::cout << "[gateway] starting worker user=" << user_id << " command=" << spec.executable << " env_vars="
            << spec.env.size() << "\n";

  const uint64_t gen = attempt->generation;
  WorkerCallbacks callbacks;
  callbacks.on_output = [this, gen](WorkerStream stream, const std::string& chunk) { HandleOutput(gen, stream, chunk); };
  callbacks.on_exit = [this, gen](int code) { HandleExit(gen, code); };

  std::string launch_err;
  std::unique_ptr<IWorkerProcess> launched = launcher_->Launch(spec, std::move(callbacks), &launch_err);
  if (!launched) {
    return MakeError(GatewayErrorKind::kSpawnFailure,
                     "failed to spawn worker: " + (launch_err.empty() ? std::string("unknown error") : launch_err));
  }
  std::shared_ptr<IWorkerProcess> process(std::move(launched));

  std::shared_ptr<RequestMultiplexer> mux;
  {
    std::unique_lock<std::mutex> lock(mu_);
    if (!IsCurrentLocked(attempt) || !worker_) {
      process->RequestStop();
      retired_.push_back(std::move(process));
      return AbortErrorLocked(attempt);
    }
    {
      std::lock_guard<std::mutex> hl(handle->mu);
      handle->process = process;
    }
    std::cout << "[gateway] worker pid=" << process->pid() << " user=" << user_id << "\n";
    SetStateLocked(SupervisorState::kAwaitingReadiness);

    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.worker.readiness_timeout_ms);
    cv_.wait_until(lock, deadline, [&] { return !IsCurrentLocked(attempt) || !worker_ || worker_->ready_event; });
    if (!IsCurrentLocked(attempt) || !worker_) return AbortErrorLocked(attempt);

    if (!worker_->ready_event) {
      std::cout << "[gateway] readiness timeout check user=" << user_id
                << " services=" << worker_->detector->State().ToJson().dump() << "\n";
      std::cout << "[gateway] recent worker output: " << Tail(worker_->recent_output, kTimeoutTailChars) << "\n";
      if (!worker_->detector->RequiredSatisfied()) {
        return MakeError(GatewayErrorKind::kReadinessTimeout, "worker initialization timeout for user " + user_id);
      }
      // The readiness event can be missed when markers race the timer; the flags decide.
      std::cout << "[gateway] required services initialized, proceeding after timeout\n";
      worker_->ready_event = true;
      worker_->mux->Open();
    }

    SetStateLocked(SupervisorState::kHandshaking);
    if (options_.worker.handshake_delay_ms > 0) {
      cv_.wait_for(lock, std::chrono::milliseconds(options_.worker.handshake_delay_ms),
                   [&] { return !IsCurrentLocked(attempt) || !worker_; });
      if (!IsCurrentLocked(attempt) || !worker_) return AbortErrorLocked(attempt);
    }
    mux = worker_->mux;
  }

  auto hs = PerformHandshake(attempt, mux);
  if (!hs.ok()) return hs;

  std::lock_guard<std::mutex> lock(mu_);
  if (!IsCurrentLocked(attempt) || !worker_) return AbortErrorLocked(attempt);
  bound_user_ = user_id;
  SetStateLocked(SupervisorState::kReady);
  std::cout << "[gateway] worker ready user=" << user_id << " tools=" << (catalog_ ? catalog_->size() : 0) << "\n";
  return GatewayError();
}

GatewayError WorkerSupervisor::PerformHandshake(const std::shared_ptr<Attempt>& attempt,
                                                const std::shared_ptr<RequestMultiplexer>& mux) {
  const auto timeout = std::chrono::milliseconds(options_.worker.request_timeout_ms);
  auto aborted = [&](GatewayError* out) {
    std::lock_guard<std::mutex> lock(mu_);
    if (IsCurrentLocked(attempt) && worker_) return false;
    *out = AbortErrorLocked(attempt);
    return true;
  };

  nlohmann::json params;
  params["protocolVersion"] = options_.handshake.protocol_version;
  params["capabilities"] = {{"roots", {{"listChanged", true}}}, {"sampling", nlohmann::json::object()}};
  params["clientInfo"] = {{"name", options_.handshake.client_name}, {"version", options_.handshake.client_version}};

  std::cout << "[gateway] handshake start user=" << attempt->user_id << "\n";
  GatewayError e;
  auto init = mux->Send("initialize", params, timeout, &e);
  if (!init) {
    GatewayError abort;
    if (aborted(&abort)) return abort;
    return MakeError(GatewayErrorKind::kHandshakeFailure, "initialize failed: " + e.message);
  }
  std::cout << "[gateway] initialize result=" << TruncateForLog(SanitizeJsonForLog(*init), 500) << "\n";

  if (!mux->Notify("notifications/initialized", nlohmann::json::object(), &e)) {
    GatewayError abort;
    if (aborted(&abort)) return abort;
    return MakeError(GatewayErrorKind::kHandshakeFailure, "initialized notification failed: " + e.message);
  }

  RefreshCatalog(mux);
  GatewayError abort;
  if (aborted(&abort)) return abort;
  std::cout << "[gateway] handshake complete user=" << attempt->user_id << "\n";
  return GatewayError();
}

void WorkerSupervisor::RefreshCatalog(const std::shared_ptr<RequestMultiplexer>& mux) {
  if (!catalog_) return;
  const auto timeout = std::chrono::milliseconds(options_.worker.request_timeout_ms);
  std::vector<ToolDescriptor> tools;
  std::string cursor;
  std::string failure;
  for (int page = 0; page < kMaxToolListPages; page++) {
    nlohmann::json params = nlohmann::json::object();
    if (!cursor.empty()) params["cursor"] = cursor;
    GatewayError e;
    auto r = mux->Send("tools/list", params, timeout, &e);
    if (!r) {
      failure = e.message;
      break;
    }
    if (!ParseToolListPage(*r, &tools, &cursor)) {
      failure = "no tools received from worker";
      break;
    }
    if (cursor.empty()) break;
  }
  if (failure.empty() && tools.empty()) failure = "worker returned an empty tool list";

  if (!failure.empty()) {
    catalog_->ResetToBuiltin();
    std::cout << "[catalog] tools/list failed (" << failure << "), using " << catalog_->size() << " builtin tools\n";
    return;
  }
  catalog_->Replace(std::move(tools), CatalogSource::kWorker);
  std::cout << "[catalog] loaded " << catalog_->size() << " tools from worker\n";
}

std::optional<nlohmann::json> WorkerSupervisor::Request(const std::string& method,
                                                        const nlohmann::json& params,
                                                        GatewayError* err) {
  return Dispatch(nullptr, method, params, err);
}

std::optional<nlohmann::json> WorkerSupervisor::RequestAs(const std::string& user_id,
                                                          const std::string& method,
                                                          const nlohmann::json& params,
                                                          GatewayError* err) {
  return Dispatch(&user_id, method, params, err);
}

std::optional<nlohmann::json> WorkerSupervisor::Dispatch(const std::string* user_id,
                                                         const std::string& method,
                                                         const nlohmann::json& params,
                                                         GatewayError* err) {
  std::shared_ptr<RequestMultiplexer> mux;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != SupervisorState::kReady || !worker_) {
      SetError(err, GatewayErrorKind::kNotReady, "worker process not ready");
      return std::nullopt;
    }
    // Checked together with taking the channel so a switch cannot slip in between.
    if (user_id && bound_user_ != *user_id) {
      std::cout << "[gateway] refusing " << method << " for user=" << *user_id << ": worker bound to user="
                << bound_user_ << "\n";
      SetError(err, GatewayErrorKind::kSuperseded, "worker is no longer bound to user " + *user_id);
      return std::nullopt;
    }
    mux = worker_->mux;
  }
  return mux->Send(method, params, std::chrono::milliseconds(options_.worker.request_timeout_ms), err);
}

bool WorkerSupervisor::IsReady() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_ == SupervisorState::kReady && worker_ != nullptr;
}

bool WorkerSupervisor::IsReadyFor(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_ == SupervisorState::kReady && worker_ != nullptr && bound_user_ == user_id;
}

SupervisorStatus WorkerSupervisor::Status() const {
  std::lock_guard<std::mutex> lock(mu_);
  SupervisorStatus s;
  s.state = state_;
  s.ready = state_ == SupervisorState::kReady && worker_ != nullptr;
  s.bound_user = bound_user_;
  s.generation = generation_;
  s.last_error = last_error_;
  if (worker_) {
    s.readiness = worker_->detector->State();
    s.pending_requests = worker_->mux->PendingCount();
    std::lock_guard<std::mutex> hl(worker_->handle->mu);
    if (worker_->handle->process) {
      s.process_running = worker_->handle->process->IsRunning();
      s.pid = worker_->handle->process->pid();
    }
  }
  return s;
}

void WorkerSupervisor::Restart() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    std::cout << "[gateway] restart requested\n";
    TeardownLocked(GatewayErrorKind::kSuperseded, "worker restart requested");
  }
  ReapRetired();
}

void WorkerSupervisor::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    shutdown_ = true;
    TeardownLocked(GatewayErrorKind::kSuperseded, "gateway shutting down");
  }
  ReapRetired();
}

void WorkerSupervisor::SetStateObserver(std::function<void(SupervisorState)> observer) {
  std::lock_guard<std::mutex> lock(mu_);
  observer_ = std::move(observer);
}

void WorkerSupervisor::HandleOutput(uint64_t generation, WorkerStream stream, const std::string& chunk) {
  std::vector<nlohmann::json> messages;
  std::shared_ptr<RequestMultiplexer> mux;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!worker_ || worker_->generation != generation) return;
    worker_->recent_output += chunk;
    if (worker_->recent_output.size() > kRecentOutputCap) {
      worker_->recent_output.erase(0, worker_->recent_output.size() - kRecentOutputCap);
    }
    auto& framer = stream == WorkerStream::kStdout ? worker_->stdout_framer : worker_->stderr_framer;
    ProcessLinesLocked(stream, framer.Feed(chunk), &messages);
    if (worker_) mux = worker_->mux;
  }
  // Routing may write an error reply to the worker, so it happens outside the lock.
  if (!mux) return;
  for (const auto& m : messages) mux->Route(m);
}

void WorkerSupervisor::HandleExit(uint64_t generation, int exit_code) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!worker_ || worker_->generation != generation) {
    std::cout << "[gateway] stale worker generation=" << generation << " exited with code " << exit_code << "\n";
    return;
  }
  std::vector<nlohmann::json> messages;
  for (auto stream : {WorkerStream::kStdout, WorkerStream::kStderr}) {
    auto& framer = stream == WorkerStream::kStdout ? worker_->stdout_framer : worker_->stderr_framer;
    auto rest = framer.Flush();
    if (!rest.empty()) ProcessLinesLocked(stream, {rest}, &messages);
    if (!worker_) return;
  }
  // The process is gone; nothing can block on a write here.
  for (const auto& m : messages) worker_->mux->Route(m);

  std::cout << "[gateway] worker for user=" << worker_->user_id << " exited with code " << exit_code << "\n";
  TeardownLocked(GatewayErrorKind::kProcessExit, "worker process exited with code " + std::to_string(exit_code));
}

void WorkerSupervisor::ProcessLinesLocked(WorkerStream stream,
                                          const std::vector<std::string>& lines,
                                          std::vector<nlohmann::json>* messages) {
  const char* tag = stream == WorkerStream::kStdout ? "[worker-out" : "[worker-err";
  for (const auto& line : lines) {
    if (!worker_) return;
    auto c = ClassifyLine(line);
    if (c.kind == LineKind::kBlank) continue;
    if (c.kind == LineKind::kJson) {
      messages->push_back(std::move(c.message));
      continue;
    }

    if (!IsNoisyDiagnostic(line, stream)) {
      std::cout << tag << " user=" << worker_->user_id << "] " << line << "\n";
    }
    auto u = worker_->detector->Observe(line);
    for (const auto& s : u.newly_set) std::cout << "[readiness] " << s << " initialized\n";

    if (u.fatal && state_ != SupervisorState::kReady) {
      TeardownLocked(GatewayErrorKind::kSpawnFailure, "worker reported fatal startup error: " + line);
      return;
    }
    if (u.became_ready) {
      std::cout << "[readiness] worker ready user=" << worker_->user_id << "\n";
      worker_->ready_event = true;
      worker_->mux->Open();
      cv_.notify_all();
    }
  }
}

bool WorkerSupervisor::IsCurrentLocked(const std::shared_ptr<Attempt>& attempt) const {
  return attempt_ == attempt && !attempt->aborted && !shutdown_;
}

GatewayError WorkerSupervisor::AbortErrorLocked(const std::shared_ptr<Attempt>& attempt) const {
  if (attempt->aborted) return attempt->abort_error;
  return MakeError(GatewayErrorKind::kSuperseded, "initialization superseded");
}

void WorkerSupervisor::TeardownLocked(GatewayErrorKind kind, const std::string& reason) {
  if (attempt_) {
    attempt_->aborted = true;
    attempt_->abort_error = MakeError(kind, reason);
    attempt_.reset();
  }
  if (!worker_) {
    bound_user_.clear();
    if (state_ != SupervisorState::kIdle) SetStateLocked(SupervisorState::kIdle);
    cv_.notify_all();
    return;
  }

  SetStateLocked(SupervisorState::kTerminating);
  std::unique_ptr<WorkerInstance> w = std::move(worker_);
  std::cout << "[gateway] tearing down worker user=" << w->user_id << " generation=" << w->generation
            << " reason=" << reason << "\n";
  w->mux->Shutdown(kind, reason);
  std::shared_ptr<IWorkerProcess> process;
  {
    std::lock_guard<std::mutex> hl(w->handle->mu);
    process = std::move(w->handle->process);
  }
  if (process) {
    process->RequestStop();
    retired_.push_back(std::move(process));
  }
  bound_user_.clear();
  SetStateLocked(SupervisorState::kIdle);
  cv_.notify_all();
}

void WorkerSupervisor::SetStateLocked(SupervisorState next) {
  if (state_ == next) return;
  std::cout << "[gateway] state " << SupervisorStateName(state_) << " -> " << SupervisorStateName(next) << "\n";
  state_ = next;
  if (observer_) observer_(next);
}

void WorkerSupervisor::ReapRetired() {
  std::vector<std::shared_ptr<IWorkerProcess>> doomed;
  {
    std::lock_guard<std::mutex> lock(mu_);
    // A process still referenced by an in-flight write is left for a later pass so the
    // last reference is never dropped on its own monitor thread.
    std::vector<std::shared_ptr<IWorkerProcess>> busy;
    for (auto& p : retired_) {
      if (p.use_count() == 1) {
        doomed.push_back(std::move(p));
      } else {
        busy.push_back(std::move(p));
      }
    }
    retired_.swap(busy);
  }
  // Destruction waits for the process to exit and joins its monitor thread.
  doomed.clear();
}

}  // namespace gateway
