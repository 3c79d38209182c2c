#pragma once

#include "worker_process.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace gateway {
namespace fake {

// What a fake worker prints at boot and how it answers requests.
struct FakeWorkerScript {
  std::vector<std::pair<WorkerStream, std::string>> boot_output = {
      {WorkerStream::kStderr, "Google Drive service initialized\n"},
      {WorkerStream::kStderr, "Gmail service initialized\n"},
      {WorkerStream::kStderr, "Google Calendar service initialized\n"},
      {WorkerStream::kStderr, "Google Docs service initialized\n"},
      {WorkerStream::kStderr, "Server ready with Google Drive, Gmail, Calendar and Docs\n"},
  };
  // method -> result. tools/call without an entry echoes its arguments as text.
  std::map<std::string, nlohmann::json> results = {
      {"initialize", {{"protocolVersion", "2024-11-05"}, {"capabilities", {{"tools", nlohmann::json::object()}}}}},
      {"tools/list",
       {{"tools",
         {{{"name", "echo"}, {"description", "Echo"}, {"inputSchema", {{"type", "object"}}}},
          {{"name", "drive_search_files"}, {"description", "Search Drive"}}}}}},
  };
  // method -> JSON-RPC error object.
  std::map<std::string, nlohmann::json> errors;
  // Consulted first. Returns the complete reply object, or null to fall through.
  std::function<nlohmann::json(const nlohmann::json& request)> responder;
  // Requests for these methods are recorded but never answered.
  std::set<std::string> silent_methods;
  // Exit as soon as stdin is closed. When false the worker only exits on Exit() or destruction.
  bool exit_on_stop = true;
  int stop_exit_code = -15;
  // Keep the worker alive after the supervisor releases it, like a monitor thread that
  // still has output to deliver. The test drives it through the launcher.
  bool linger_after_release = false;
};

// Shared state of one fake worker. Events are delivered from its own thread, in order,
// with the exit event last, like the POSIX monitor thread.
class FakeWorkerCore {
 public:
  FakeWorkerCore(int64_t pid, FakeWorkerScript script, WorkerLaunchSpec spec, WorkerCallbacks callbacks)
      : pid_(pid), script_(std::move(script)), spec_(std::move(spec)), callbacks_(std::move(callbacks)) {}

  ~FakeWorkerCore() { Shutdown(); }

  void Start() {
    thread_ = std::thread([this]() { Run(); });
    for (const auto& [stream, text] : script_.boot_output) Emit(stream, text);
  }

  int64_t pid() const { return pid_; }
  const WorkerLaunchSpec& spec() const { return spec_; }

  std::string Env(const std::string& key) const {
    std::string value;
    for (const auto& [k, v] : spec_.env) {
      if (k == key) value = v;
    }
    return value;
  }

  bool HasEnv(const std::string& key) const {
    for (const auto& kv : spec_.env) {
      if (kv.first == key) return true;
    }
    return false;
  }

  void Emit(WorkerStream stream, std::string chunk) {
    std::lock_guard<std::mutex> lock(mu_);
    if (exit_queued_) return;
    queue_.push_back(Event{false, stream, std::move(chunk), 0});
    cv_.notify_all();
  }

  void EmitLine(WorkerStream stream, const std::string& line) { Emit(stream, line + "\n"); }

  void Reply(int64_t id, const nlohmann::json& result) {
    EmitLine(WorkerStream::kStdout, nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}}.dump());
  }

  void Exit(int code) {
    std::lock_guard<std::mutex> lock(mu_);
    QueueExitLocked(code);
  }

  bool Write(const std::string& data, std::string* err) {
    std::lock_guard<std::mutex> lock(mu_);
    if (stdin_closed_ || exit_queued_) {
      if (err) *err = "broken pipe";
      return false;
    }
    write_count_++;
    pending_input_ += data;
    size_t pos;
    while ((pos = pending_input_.find('\n')) != std::string::npos) {
      auto line = pending_input_.substr(0, pos);
      pending_input_.erase(0, pos + 1);
      auto msg = nlohmann::json::parse(line, nullptr, false);
      received_.push_back(msg);
      if (!msg.is_discarded()) AnswerLocked(msg);
    }
    cv_.notify_all();
    return true;
  }

  void RequestStop() {
    std::lock_guard<std::mutex> lock(mu_);
    stdin_closed_ = true;
    stop_requested_ = true;
    if (script_.exit_on_stop) QueueExitLocked(script_.stop_exit_code);
  }

  bool IsRunning() const {
    std::lock_guard<std::mutex> lock(mu_);
    return !exit_queued_;
  }

  bool stop_requested() const {
    std::lock_guard<std::mutex> lock(mu_);
    return stop_requested_;
  }

  size_t write_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return write_count_;
  }

  std::vector<nlohmann::json> Received() const {
    std::lock_guard<std::mutex> lock(mu_);
    return received_;
  }

  std::vector<std::string> ReceivedMethods() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> out;
    for (const auto& m : received_) {
      if (m.is_object() && m.contains("method")) out.push_back(m["method"].get<std::string>());
    }
    return out;
  }

  // Waits until a request for method has been written; returns its id or -1.
  int64_t WaitForRequest(const std::string& method, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    int64_t id = -1;
    cv_.wait_for(lock, timeout, [&]() {
      for (const auto& m : received_) {
        if (m.is_object() && m.value("method", "") == method && m.contains("id")) {
          id = m["id"].get<int64_t>();
          return true;
        }
      }
      return false;
    });
    return id;
  }

  bool WaitForExitDelivered(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [&]() { return exit_delivered_; });
  }

  void Shutdown() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stdin_closed_ = true;
      QueueExitLocked(script_.stop_exit_code);
    }
    if (!thread_.joinable()) return;
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
    } else {
      thread_.join();
    }
  }

 private:
  struct Event {
    bool exit = false;
    WorkerStream stream = WorkerStream::kStdout;
    std::string chunk;
    int code = 0;
  };

  void QueueExitLocked(int code) {
    if (exit_queued_) return;
    exit_queued_ = true;
    queue_.push_back(Event{true, WorkerStream::kStdout, {}, code});
    cv_.notify_all();
  }

  void AnswerLocked(const nlohmann::json& msg) {
    if (!msg.is_object() || !msg.contains("id") || !msg.contains("method")) return;
    const auto id = msg["id"];
    const auto method = msg["method"].get<std::string>();
    if (script_.silent_methods.count(method) || exit_queued_) return;
    if (script_.responder) {
      auto custom = script_.responder(msg);
      if (!custom.is_null()) {
        queue_.push_back(Event{false, WorkerStream::kStdout, custom.dump() + "\n", 0});
        return;
      }
    }

    nlohmann::json reply{{"jsonrpc", "2.0"}, {"id", id}};
    if (auto e = script_.errors.find(method); e != script_.errors.end()) {
      reply["error"] = e->second;
    } else if (auto r = script_.results.find(method); r != script_.results.end()) {
      reply["result"] = r->second;
    } else if (method == "tools/call") {
      const auto& params = msg.contains("params") ? msg["params"] : nlohmann::json::object();
      const std::string text = params.contains("arguments") ? params["arguments"].dump() : "{}";
      reply["result"] = {{"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}};
    } else {
      reply["error"] = {{"code", -32601}, {"message", "method not found"}};
    }
    queue_.push_back(Event{false, WorkerStream::kStdout, reply.dump() + "\n", 0});
  }

  void Run() {
    for (;;) {
      Event ev;
      {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [&]() { return !queue_.empty(); });
        ev = std::move(queue_.front());
        queue_.pop_front();
      }
      if (ev.exit) {
        if (callbacks_.on_exit) callbacks_.on_exit(ev.code);
        std::lock_guard<std::mutex> lock(mu_);
        exit_delivered_ = true;
        cv_.notify_all();
        return;
      }
      if (callbacks_.on_output) callbacks_.on_output(ev.stream, ev.chunk);
    }
  }

  const int64_t pid_;
  const FakeWorkerScript script_;
  const WorkerLaunchSpec spec_;
  const WorkerCallbacks callbacks_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Event> queue_;
  bool exit_queued_ = false;
  bool exit_delivered_ = false;
  bool stdin_closed_ = false;
  bool stop_requested_ = false;
  size_t write_count_ = 0;
  std::string pending_input_;
  std::vector<nlohmann::json> received_;
  std::thread thread_;
};

class FakeWorkerProcess : public IWorkerProcess {
 public:
  FakeWorkerProcess(std::shared_ptr<FakeWorkerCore> core, bool linger) : core_(std::move(core)), linger_(linger) {}
  ~FakeWorkerProcess() override {
    if (!linger_) core_->Shutdown();
  }

  int64_t pid() const override { return core_->pid(); }
  bool Write(const std::string& data, std::chrono::milliseconds, std::string* err) override {
    return core_->Write(data, err);
  }
  void RequestStop() override { core_->RequestStop(); }
  bool IsRunning() const override { return core_->IsRunning(); }

 private:
  std::shared_ptr<FakeWorkerCore> core_;
  const bool linger_;
};

class FakeWorkerLauncher : public IWorkerLauncher {
 public:
  void SetScript(FakeWorkerScript script) {
    std::lock_guard<std::mutex> lock(mu_);
    script_ = std::move(script);
  }

  void FailLaunches(std::string error) {
    std::lock_guard<std::mutex> lock(mu_);
    fail_with_ = std::move(error);
  }

  std::unique_ptr<IWorkerProcess> Launch(const WorkerLaunchSpec& spec, WorkerCallbacks callbacks,
                                         std::string* err) override {
    launch_attempts_++;
    std::shared_ptr<FakeWorkerCore> core;
    bool linger = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      linger = script_.linger_after_release;
      if (!fail_with_.empty()) {
        if (err) *err = fail_with_;
        return nullptr;
      }
      core = std::make_shared<FakeWorkerCore>(1000 + static_cast<int64_t>(workers_.size()), script_, spec,
                                              std::move(callbacks));
      workers_.push_back(core);
    }
    core->Start();
    return std::make_unique<FakeWorkerProcess>(core, linger);
  }

  size_t launch_attempts() const { return launch_attempts_.load(); }

  size_t launch_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return workers_.size();
  }

  std::shared_ptr<FakeWorkerCore> worker(size_t i) const {
    std::lock_guard<std::mutex> lock(mu_);
    return i < workers_.size() ? workers_[i] : nullptr;
  }

  std::shared_ptr<FakeWorkerCore> last() const {
    std::lock_guard<std::mutex> lock(mu_);
    return workers_.empty() ? nullptr : workers_.back();
  }

 private:
  mutable std::mutex mu_;
  FakeWorkerScript script_;
  std::string fail_with_;
  std::atomic<size_t> launch_attempts_{0};
  std::vector<std::shared_ptr<FakeWorkerCore>> workers_;
};

}  // namespace fake
}  // namespace gateway
