#include "log_util.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace gateway {
namespace {

static bool IsSecretKey(const std::string& key) {
  std::string lower;
  lower.reserve(key.size());
  for (char c : key) lower.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));
  for (const char* needle : {"token", "secret", "authorization", "api_key", "api-key", "apikey", "password"}) {
    if (lower.find(needle) != std::string::npos) return true;
  }
  return false;
}

static void Scrub(nlohmann::json* j) {
  if (j->is_object()) {
    for (auto it = j->begin(); it != j->end();) {
      if (IsSecretKey(it.key())) {
        it = j->erase(it);
        continue;
      }
      Scrub(&it.value());
      ++it;
    }
  } else if (j->is_array()) {
    for (auto& v : *j) Scrub(&v);
  }
}

}  // namespace

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

std::string SanitizeJsonForLog(const nlohmann::json& body) {
  if (body.is_null()) return "null";
  if (!body.is_object() && !body.is_array()) return body.dump();
  auto j = body;
  Scrub(&j);
  return j.dump();
}

std::string Iso8601UtcNow() {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
  return out;
}

}  // namespace gateway
