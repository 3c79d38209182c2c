#pragma once

#include "config.hpp"
#include "worker_process.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace gateway {

struct WorkerCredentials {
  std::string access_token;
  std::string refresh_token;
  // Epoch milliseconds.
  int64_t expires_at_ms = 0;
};

// Token records are produced by the OAuth flow elsewhere; the gateway only reads them.
class ICredentialStore {
 public:
  virtual ~ICredentialStore() = default;
  // nullopt with an empty *err means "no record for this user".
  virtual std::optional<WorkerCredentials> Load(const std::string& user_id, std::string* err) = 0;
};

class InMemoryCredentialStore : public ICredentialStore {
 public:
  void Put(const std::string& user_id, WorkerCredentials creds);
  void Remove(const std::string& user_id);
  std::optional<WorkerCredentials> Load(const std::string& user_id, std::string* err) override;

 private:
  std::mutex mu_;
  std::unordered_map<std::string, WorkerCredentials> records_;
};

// {"users": {"<user id>": {"access_token": "...", "refresh_token": "...", "expires_at": 1700000000000}}}
// The file is re-read on every Load so refreshed tokens are picked up without a restart.
class FileCredentialStore : public ICredentialStore {
 public:
  explicit FileCredentialStore(std::string path);
  std::optional<WorkerCredentials> Load(const std::string& user_id, std::string* err) override;

 private:
  std::string path_;
};

EnvironmentList BuildWorkerEnvironment(const EnvironmentList& base,
                                       const std::string& user_id,
                                       const WorkerCredentials& creds,
                                       const ClientIdentity& client);

}  // namespace gateway
