#include "line_codec.hpp"

#include <cctype>

namespace gateway {
namespace {

static bool IsBlank(const std::string& s) {
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

static bool Contains(const std::string& s, const char* needle) {
  return s.find(needle) != std::string::npos;
}

}  // namespace

const char* WorkerStreamName(WorkerStream stream) {
  return stream == WorkerStream::kStdout ? "stdout" : "stderr";
}

std::vector<std::string> LineFramer::Feed(const std::string& chunk) {
  std::vector<std::string> out;
  if (chunk.empty()) return out;
  buffer_ += chunk;

  size_t start = 0;
  for (;;) {
    const auto nl = buffer_.find('\n', start);
    if (nl == std::string::npos) break;
    size_t end = nl;
    if (end > start && buffer_[end - 1] == '\r') end--;
    out.emplace_back(buffer_, start, end - start);
    start = nl + 1;
  }
  buffer_.erase(0, start);
  return out;
}

std::string LineFramer::Flush() {
  std::string rest;
  rest.swap(buffer_);
  if (!rest.empty() && rest.back() == '\r') rest.pop_back();
  return rest;
}

ClassifiedLine ClassifyLine(const std::string& line) {
  ClassifiedLine out;
  out.text = line;
  if (IsBlank(line)) {
    out.kind = LineKind::kBlank;
    return out;
  }
  auto j = nlohmann::json::parse(line, nullptr, false);
  if (j.is_discarded()) {
    out.kind = LineKind::kLog;
    return out;
  }
  out.kind = LineKind::kJson;
  out.message = std::move(j);
  return out;
}

bool IsNoisyDiagnostic(const std::string& line, WorkerStream stream) {
  if (Contains(line, "DeprecationWarning")) return true;
  if (Contains(line, "file_cache is only supported")) return true;
  if (Contains(line, "oauth2client")) return true;
  // Python warnings land on stdout when the worker redirects its warning stream.
  if (stream == WorkerStream::kStdout && Contains(line, "WARNING")) return true;
  return false;
}

}  // namespace gateway
