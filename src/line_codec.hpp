#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace gateway {

enum class WorkerStream { kStdout, kStderr };

const char* WorkerStreamName(WorkerStream stream);

// Splits an arbitrarily chunked byte stream into '\n'-terminated lines. A trailing
// fragment stays buffered until the chunk that completes it arrives.
class LineFramer {
 public:
  std::vector<std::string> Feed(const std::string& chunk);

  // Returns and clears the buffered fragment (used when the stream closes).
  std::string Flush();

  const std::string& pending() const { return buffer_; }
  void Reset() { buffer_.clear(); }

 private:
  std::string buffer_;
};

enum class LineKind {
  kBlank,
  kJson,
  kLog,
};

struct ClassifiedLine {
  LineKind kind = LineKind::kBlank;
  nlohmann::json message;
  std::string text;
};

// A line that parses as one JSON value is a JSON-RPC candidate; anything else is log text.
ClassifiedLine ClassifyLine(const std::string& line);

// Known noisy diagnostics (deprecation notices, discovery cache warnings) that are kept
// out of operator logs. They are still fed to readiness detection.
bool IsNoisyDiagnostic(const std::string& line, WorkerStream stream);

}  // namespace gateway
