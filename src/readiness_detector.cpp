#include "readiness_detector.hpp"

#include <utility>

namespace gateway {
namespace {

static bool ContainsAny(const std::string& line, const std::vector<std::string>& markers) {
  for (const auto& m : markers) {
    if (!m.empty() && line.find(m) != std::string::npos) return true;
  }
  return false;
}

}  // namespace

ReadinessProfile WorkspaceReadinessProfile() {
  ReadinessProfile p;
  p.services = {
      {"drive", {"Google Drive service initialized"}},
      {"gmail", {"Gmail service initialized"}},
      {"calendar", {"Google Calendar service initialized"}},
      {"docs", {"Google Docs service initialized"}},
  };
  p.server_ready_markers = {"Server ready with Google Drive", "Waiting for initialization command"};
  p.required_services = {"drive", "calendar", "docs"};
  p.fatal_markers = {"ModuleNotFoundError", "ImportError", "SyntaxError"};
  return p;
}

nlohmann::json ReadinessState::ToJson() const {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& [name, on] : services) j[name] = on;
  j["serverReady"] = server_ready;
  j["ready"] = ready;
  return j;
}

MarkerReadinessDetector::MarkerReadinessDetector(ReadinessProfile profile) : profile_(std::move(profile)) {
  for (const auto& s : profile_.services) state_.services[s.service] = false;
  for (const auto& r : profile_.required_services) state_.services.emplace(r, false);
}

ReadinessUpdate MarkerReadinessDetector::Observe(const std::string& line) {
  ReadinessUpdate u;
  for (const auto& s : profile_.services) {
    auto& flag = state_.services[s.service];
    if (!flag && ContainsAny(line, s.markers)) {
      flag = true;
      u.newly_set.push_back(s.service);
    }
  }
  if (!state_.server_ready && ContainsAny(line, profile_.server_ready_markers)) {
    state_.server_ready = true;
    u.newly_set.push_back("serverReady");
  }
  for (const auto& m : profile_.fatal_markers) {
    if (!m.empty() && line.find(m) != std::string::npos) {
      u.fatal = true;
      u.fatal_marker = m;
      break;
    }
  }
  if (!state_.ready && RequiredSatisfied()) {
    state_.ready = true;
    u.became_ready = true;
  }
  return u;
}

bool MarkerReadinessDetector::RequiredSatisfied() const {
  if (!state_.server_ready) return false;
  for (const auto& r : profile_.required_services) {
    auto it = state_.services.find(r);
    if (it == state_.services.end() || !it->second) return false;
  }
  return true;
}

ReadinessDetectorFactory MakeMarkerDetectorFactory(ReadinessProfile profile) {
  return [profile = std::move(profile)]() -> std::unique_ptr<IReadinessDetector> {
    return std::make_unique<MarkerReadinessDetector>(profile);
  };
}

}  // namespace gateway
