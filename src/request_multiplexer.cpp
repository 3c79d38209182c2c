#include "request_multiplexer.hpp"

#include "log_util.hpp"

#include <algorithm>
#include <iostream>
#include <utility>
#include <vector>

namespace gateway {
namespace {

static std::optional<int64_t> ResponseId(const nlohmann::json& message) {
  if (!message.contains("id")) return std::nullopt;
  const auto& id = message["id"];
  if (id.is_number_integer()) return id.get<int64_t>();
  if (id.is_number_unsigned()) return static_cast<int64_t>(id.get<uint64_t>());
  if (id.is_string()) {
    const auto s = id.get<std::string>();
    if (s.empty() || s.size() > 18) return std::nullopt;
    for (char c : s) {
      if (c < '0' || c > '9') return std::nullopt;
    }
    return std::stoll(s);
  }
  return std::nullopt;
}

// Bound for writes that are not tied to a caller's request timeout.
constexpr std::chrono::milliseconds kControlWriteTimeout{5000};

static std::string ExtractErrorMessage(const nlohmann::json& error) {
  if (error.is_object() && error.contains("message") && error["message"].is_string()) {
    auto msg = error["message"].get<std::string>();
    if (!msg.empty()) return msg;
  }
  if (error.is_string()) return error.get<std::string>();
  return error.dump();
}

}  // namespace

RequestMultiplexer::RequestMultiplexer(LineWriter writer) : writer_(std::move(writer)) {}

RequestMultiplexer::~RequestMultiplexer() {
  Shutdown(GatewayErrorKind::kSuperseded, "worker channel destroyed");
}

void RequestMultiplexer::Open() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!closed_) open_ = true;
}

bool RequestMultiplexer::is_open() const {
  std::lock_guard<std::mutex> lock(mu_);
  return open_ && !closed_;
}

std::optional<nlohmann::json> RequestMultiplexer::Send(const std::string& method,
                                                       const nlohmann::json& params,
                                                       std::chrono::milliseconds timeout,
                                                       GatewayError* err) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::shared_ptr<Pending> p;
  std::future<Outcome> fut;
  {
    // write_mu_ keeps ids in the same order as bytes on the wire.
    std::unique_lock<std::timed_mutex> write_lock(write_mu_, std::defer_lock);
    if (!write_lock.try_lock_until(deadline)) {
      SetError(err, GatewayErrorKind::kRequestTimeout, "request timeout for method: " + method + " (worker input busy)");
      return std::nullopt;
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_ || !open_) {
        SetError(err, GatewayErrorKind::kNotReady, "worker process not ready");
        return std::nullopt;
      }
      p = std::make_shared<Pending>();
      p->id = next_id_++;
      p->method = method;
      p->created = std::chrono::steady_clock::now();
      fut = p->promise.get_future();
      pending_[p->id] = p;
    }

    nlohmann::json req;
    req["jsonrpc"] = "2.0";
    req["id"] = p->id;
    req["method"] = method;
    req["params"] = params.is_null() ? nlohmann::json::object() : params;
    std::cout << "[mux] -> id=" << p->id << " method=" << method
              << " params=" << TruncateForLog(SanitizeJsonForLog(req["params"]), 1000) << "\n";

    const auto budget = std::max(std::chrono::milliseconds(0),
                                 std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()));
    std::string write_err;
    if (!writer_(req.dump() + "\n", budget, &write_err)) {
      Outcome o;
      if (std::chrono::steady_clock::now() >= deadline) {
        o.error.kind = GatewayErrorKind::kRequestTimeout;
        o.error.message = "request timeout for method: " + method + " (" + write_err + ")";
      } else {
        o.error.kind = GatewayErrorKind::kTransport;
        o.error.message = "failed to write request for method " + method + ": " +
                          (write_err.empty() ? std::string("write failed") : write_err);
      }
      Resolve(p->id, std::move(o));
    }
  }

  if (fut.wait_until(deadline) != std::future_status::ready) {
    Outcome o;
    o.error.kind = GatewayErrorKind::kRequestTimeout;
    o.error.message = "request timeout for method: " + method;
    if (Resolve(p->id, std::move(o))) {
      std::cout << "[mux] timeout id=" << p->id << " method=" << method << "\n";
    }
  }

  Outcome out = fut.get();
  if (!out.error.ok()) {
    if (err) *err = std::move(out.error);
    return std::nullopt;
  }
  return std::move(out.result);
}

bool RequestMultiplexer::Notify(const std::string& method, const nlohmann::json& params, GatewayError* err) {
  std::lock_guard<std::timed_mutex> write_lock(write_mu_);
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) return SetError(err, GatewayErrorKind::kNotReady, "worker process not available");
  }
  nlohmann::json note;
  note["jsonrpc"] = "2.0";
  note["method"] = method;
  note["params"] = params.is_null() ? nlohmann::json::object() : params;
  std::cout << "[mux] -> notify method=" << method << "\n";
  std::string write_err;
  if (!writer_(note.dump() + "\n", kControlWriteTimeout, &write_err)) {
    return SetError(err, GatewayErrorKind::kTransport, "failed to write notification " + method + ": " + write_err);
  }
  return true;
}

MessageRoute RequestMultiplexer::Route(const nlohmann::json& message) {
  if (!message.is_object()) {
    std::cout << "[mux] ignoring non-object json line\n";
    return MessageRoute::kMalformed;
  }

  if (message.contains("method") && message["method"].is_string()) {
    const auto method = message["method"].get<std::string>();
    if (message.contains("id") && !message["id"].is_null()) {
      std::cout << "[mux] worker request method=" << method << " (unsupported)\n";
      ReplyMethodNotFound(message["id"], method);
      return MessageRoute::kWorkerRequest;
    }
    std::cout << "[mux] worker notification method=" << method << "\n";
    return MessageRoute::kWorkerNotification;
  }

  auto id = ResponseId(message);
  if (!id || (!message.contains("result") && !message.contains("error"))) {
    std::cout << "[mux] ignoring malformed message " << TruncateForLog(message.dump(), 200) << "\n";
    return MessageRoute::kMalformed;
  }

  Outcome o;
  if (message.contains("error") && !message["error"].is_null()) {
    o.error.kind = GatewayErrorKind::kRemoteToolError;
    o.error.message = ExtractErrorMessage(message["error"]);
  } else {
    o.result = message.contains("result") ? message["result"] : nlohmann::json();
  }
  const bool remote_error = !o.error.ok();
  if (!Resolve(*id, std::move(o))) {
    std::cout << "[mux] <- id=" << *id << " has no pending request, dropped\n";
    return MessageRoute::kStaleResponse;
  }
  std::cout << "[mux] <- id=" << *id << " ok=" << (remote_error ? 0 : 1) << "\n";
  return MessageRoute::kResponse;
}

size_t RequestMultiplexer::Shutdown(GatewayErrorKind kind, const std::string& reason) {
  std::unordered_map<int64_t, std::shared_ptr<Pending>> failed;
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
    open_ = false;
    failed.swap(pending_);
  }
  for (auto& [id, p] : failed) {
    Outcome o;
    o.error.kind = kind;
    o.error.message = reason + " (method " + p->method + ")";
    p->promise.set_value(std::move(o));
  }
  if (!failed.empty()) {
    std::cout << "[mux] failed " << failed.size() << " pending request(s): " << reason << "\n";
  }
  return failed.size();
}

size_t RequestMultiplexer::PendingCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_.size();
}

int64_t RequestMultiplexer::last_issued_id() const {
  std::lock_guard<std::mutex> lock(mu_);
  return next_id_ - 1;
}

bool RequestMultiplexer::Resolve(int64_t id, Outcome outcome) {
  std::shared_ptr<Pending> p;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = pending_.find(id);
    if (it == pending_.end()) return false;
    p = std::move(it->second);
    pending_.erase(it);
  }
  p->promise.set_value(std::move(outcome));
  return true;
}

void RequestMultiplexer::ReplyMethodNotFound(const nlohmann::json& id, const std::string& method) {
  nlohmann::json reply;
  reply["jsonrpc"] = "2.0";
  reply["id"] = id;
  reply["error"] = {{"code", -32601}, {"message", "method not found: " + method}};
  std::lock_guard<std::timed_mutex> write_lock(write_mu_);
  std::string write_err;
  if (!writer_(reply.dump() + "\n", kControlWriteTimeout, &write_err)) {
    std::cout << "[mux] failed to answer worker request method=" << method << ": " << write_err << "\n";
  }
}

}  // namespace gateway
