#include "credentials.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <utility>

namespace gateway {
namespace {

static std::optional<int64_t> ParseExpiry(const nlohmann::json& v) {
  if (v.is_number_integer()) return v.get<int64_t>();
  if (v.is_number_unsigned()) {
    const auto u = v.get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
    return static_cast<int64_t>(u);
  }
  if (v.is_number_float()) {
    const double d = v.get<double>();
    // 2^63 is exactly representable; anything at or past it does not fit.
    if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) return std::nullopt;
    return static_cast<int64_t>(d);
  }
  if (v.is_string()) {
    const auto s = v.get<std::string>();
    if (s.empty() || s.size() > 18) return std::nullopt;
    for (char c : s) {
      if (c < '0' || c > '9') return std::nullopt;
    }
    return std::stoll(s);
  }
  return std::nullopt;
}

static std::string JsonString(const nlohmann::json& obj, const char* key) {
  if (obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
  return {};
}

}  // namespace

void InMemoryCredentialStore::Put(const std::string& user_id, WorkerCredentials creds) {
  std::lock_guard<std::mutex> lock(mu_);
  records_[user_id] = std::move(creds);
}

void InMemoryCredentialStore::Remove(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mu_);
  records_.erase(user_id);
}

std::optional<WorkerCredentials> InMemoryCredentialStore::Load(const std::string& user_id, std::string*) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = records_.find(user_id);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

FileCredentialStore::FileCredentialStore(std::string path) : path_(std::move(path)) {}

std::optional<WorkerCredentials> FileCredentialStore::Load(const std::string& user_id, std::string* err) {
  std::filesystem::path p(path_);
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) {
    if (err) *err = "credential file not found: " + path_;
    return std::nullopt;
  }
  std::ifstream in(p, std::ios::binary);
  if (!in) {
    if (err) *err = "cannot open credential file: " + path_;
    return std::nullopt;
  }
  std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "credential file is not valid json: " + path_;
    return std::nullopt;
  }
  if (!j.contains("users") || !j["users"].is_object()) return std::nullopt;
  const auto& users = j["users"];
  auto it = users.find(user_id);
  if (it == users.end() || !it->is_object()) return std::nullopt;

  WorkerCredentials c;
  c.access_token = JsonString(*it, "access_token");
  c.refresh_token = JsonString(*it, "refresh_token");
  if (it->contains("expires_at")) {
    if (auto e = ParseExpiry((*it)["expires_at"])) c.expires_at_ms = *e;
  }
  if (c.access_token.empty() && c.refresh_token.empty()) {
    if (err) *err = "credential record for user has no tokens";
    return std::nullopt;
  }
  return c;
}

EnvironmentList BuildWorkerEnvironment(const EnvironmentList& base,
                                       const std::string& user_id,
                                       const WorkerCredentials& creds,
                                       const ClientIdentity& client) {
  const EnvironmentList overrides = {
      {"PYTHONUNBUFFERED", "1"},
      {"PYTHONIOENCODING", "utf-8"},
      {"GOOGLE_ACCESS_TOKEN", creds.access_token},
      {"GOOGLE_REFRESH_TOKEN", creds.refresh_token},
      {"GOOGLE_TOKEN_EXPIRES_AT", std::to_string(creds.expires_at_ms)},
      {"GOOGLE_CLIENT_ID", client.client_id},
      {"GOOGLE_CLIENT_SECRET", client.client_secret},
      {"SESSION_USER_ID", user_id},
  };
  EnvironmentList out;
  out.reserve(base.size() + overrides.size());
  for (const auto& kv : base) {
    bool overridden = false;
    for (const auto& o : overrides) {
      if (o.first == kv.first) {
        overridden = true;
        break;
      }
    }
    if (!overridden) out.push_back(kv);
  }
  for (const auto& o : overrides) out.push_back(o);
  return out;
}

}  // namespace gateway
