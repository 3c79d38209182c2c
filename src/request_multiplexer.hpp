#pragma once

#include "gateway_error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace gateway {

enum class MessageRoute {
  kResponse,
  kStaleResponse,
  kWorkerRequest,
  kWorkerNotification,
  kMalformed,
};

// Correlates JSON-RPC 2.0 requests written to one worker's stdin with the replies read
// from its stdout. One instance lives exactly as long as one worker process.
class RequestMultiplexer {
 public:
  // Writes one already-framed line ("...\n") within timeout. Must not call back into
  // the multiplexer.
  using LineWriter =
      std::function<bool(const std::string& line, std::chrono::milliseconds timeout, std::string* err)>;

  explicit RequestMultiplexer(LineWriter writer);
  ~RequestMultiplexer();

  RequestMultiplexer(const RequestMultiplexer&) = delete;
  RequestMultiplexer& operator=(const RequestMultiplexer&) = delete;

  // Requests are refused until the worker has been observed ready.
  void Open();
  bool is_open() const;

  // Blocks until the matching reply, the timeout, or Shutdown(). The timeout covers
  // waiting for the channel and writing the request as well as the reply.
  std::optional<nlohmann::json> Send(const std::string& method,
                                     const nlohmann::json& params,
                                     std::chrono::milliseconds timeout,
                                     GatewayError* err);

  // Fire-and-forget; succeeds once the line is written.
  bool Notify(const std::string& method, const nlohmann::json& params, GatewayError* err);

  MessageRoute Route(const nlohmann::json& message);

  // Refuses new requests and fails every outstanding one. Returns how many were failed.
  size_t Shutdown(GatewayErrorKind kind, const std::string& reason);

  size_t PendingCount() const;
  int64_t last_issued_id() const;

 private:
  struct Outcome {
    nlohmann::json result;
    GatewayError error;
  };

  struct Pending {
    int64_t id = 0;
    std::string method;
    std::chrono::steady_clock::time_point created;
    std::promise<Outcome> promise;
  };

  bool Resolve(int64_t id, Outcome outcome);
  void ReplyMethodNotFound(const nlohmann::json& id, const std::string& method);

  LineWriter writer_;
  std::timed_mutex write_mu_;
  mutable std::mutex mu_;
  bool open_ = false;
  bool closed_ = false;
  int64_t next_id_ = 1;
  std::unordered_map<int64_t, std::shared_ptr<Pending>> pending_;
};

}  // namespace gateway
