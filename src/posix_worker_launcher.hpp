#pragma once

#include "worker_process.hpp"

#include <optional>
#include <string>

namespace gateway {

// fork/exec launcher with stdin/stdout/stderr pipes and one monitor thread per child.
class PosixWorkerLauncher : public IWorkerLauncher {
 public:
  std::unique_ptr<IWorkerProcess> Launch(const WorkerLaunchSpec& spec,
                                         WorkerCallbacks callbacks,
                                         std::string* err) override;
};

// Resolves a bare command name against PATH (taken from env when present).
std::optional<std::string> ResolveExecutable(const std::string& command, const EnvironmentList& env);

}  // namespace gateway
