#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gateway {

struct ServiceMarkers {
  std::string service;
  std::vector<std::string> markers;
};

// Substring markers that the worker prints while booting. Matching is case-sensitive.
struct ReadinessProfile {
  std::vector<ServiceMarkers> services;
  std::vector<std::string> server_ready_markers;
  std::vector<std::string> required_services;
  std::vector<std::string> fatal_markers;
};

// Markers printed by the Google Workspace worker. Gmail is tracked but not required.
ReadinessProfile WorkspaceReadinessProfile();

struct ReadinessState {
  std::map<std::string, bool> services;
  bool server_ready = false;
  bool ready = false;

  nlohmann::json ToJson() const;
};

struct ReadinessUpdate {
  std::vector<std::string> newly_set;
  bool became_ready = false;
  bool fatal = false;
  std::string fatal_marker;
};

class IReadinessDetector {
 public:
  virtual ~IReadinessDetector() = default;

  // Flags are monotone. became_ready is reported at most once per detector instance.
  virtual ReadinessUpdate Observe(const std::string& line) = 0;
  virtual const ReadinessState& State() const = 0;
  // True when every required service flag and server_ready are set, whether or not
  // the became_ready event has fired yet.
  virtual bool RequiredSatisfied() const = 0;
};

using ReadinessDetectorFactory = std::function<std::unique_ptr<IReadinessDetector>()>;

class MarkerReadinessDetector : public IReadinessDetector {
 public:
  explicit MarkerReadinessDetector(ReadinessProfile profile);

  ReadinessUpdate Observe(const std::string& line) override;
  const ReadinessState& State() const override { return state_; }
  bool RequiredSatisfied() const override;

 private:
  ReadinessProfile profile_;
  ReadinessState state_;
};

ReadinessDetectorFactory MakeMarkerDetectorFactory(ReadinessProfile profile);

}  // namespace gateway
