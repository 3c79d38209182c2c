#pragma once

#include "line_codec.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gateway {

using EnvironmentList = std::vector<std::pair<std::string, std::string>>;

struct WorkerLaunchSpec {
  std::string executable;
  std::vector<std::string> args;
  // Complete child environment. Credentials travel here, never in args.
  EnvironmentList env;
  std::string working_dir;
  std::chrono::milliseconds terminate_grace{2000};
};

// Invoked from the worker's monitor thread, one event at a time, in arrival order.
// on_exit is always the last event delivered for a worker.
struct WorkerCallbacks {
  std::function<void(WorkerStream stream, const std::string& chunk)> on_output;
  std::function<void(int exit_code)> on_exit;
};

class IWorkerProcess {
 public:
  // Destruction runs the full shutdown sequence and blocks until the monitor thread is
  // done, so it must not happen on the monitor thread or under a lock its callbacks take.
  virtual ~IWorkerProcess() = default;

  virtual int64_t pid() const = 0;
  // Gives up once timeout elapses or RequestStop() is called. A write that fails after
  // part of data went out leaves stdin closed, since the stream can no longer be framed.
  virtual bool Write(const std::string& data, std::chrono::milliseconds timeout, std::string* err) = 0;
  // Non-blocking: asks the process to exit and closes stdin. A Write in progress gives up
  // within one poll slice instead of holding this up.
  virtual void RequestStop() = 0;
  virtual bool IsRunning() const = 0;
};

// Snapshot of this process's environment.
EnvironmentList CurrentEnvironment();

class IWorkerLauncher {
 public:
  virtual ~IWorkerLauncher() = default;
  virtual std::unique_ptr<IWorkerProcess> Launch(const WorkerLaunchSpec& spec,
                                                 WorkerCallbacks callbacks,
                                                 std::string* err) = 0;
};

}  // namespace gateway
