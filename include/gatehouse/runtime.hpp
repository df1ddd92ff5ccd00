#pragma once

#include "dispatcher.hpp"
#include "error.hpp"
#include "events.hpp"
#include "extension.hpp"
#include "host.hpp"
#include "log.hpp"
#include "process.hpp"
#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <vector>

namespace gatehouse {

struct runtime_options {
  int in_fd = STDIN_FILENO;
  int out_fd = STDOUT_FILENO;
  /// Used for ctx.call() when the caller has no deadline.
  int call_timeout_ms = 300000;
  /// Exit when the parent process goes away.
  bool watch_parent = true;
};

/// Serves one extension inside a host process. Speaks NDJSON with the
/// gateway over stdin/stdout; everything else goes to stderr.
class host_runtime : public extension_context {
public:
  using json = nlohmann::json;

  explicit host_runtime(extension &ext, runtime_options options = {})
      : ext_(ext), options_(options), log_(ext.id()), events_("runtime:" + ext.id()) {
    if (const char *raw = std::getenv(kExtensionConfigEnv)) {
      try {
        config_ = json::parse(raw);
      } catch (const json::parse_error &e) {
        log_.warn("Ignoring unparsable extension config", {{"error", e.what()}});
      }
    }
    if (!config_.is_object()) {
      config_ = json::object();
    }
  }

  ~host_runtime() override { join_workers(); }

  host_runtime(const host_runtime &) = delete;
  host_runtime &operator=(const host_runtime &) = delete;

  /// Start the extension, register with the gateway and serve until stdin
  /// closes. Returns the process exit code.
  int run() {
    ignore_sigpipe();
    if (const char *expected = std::getenv(kExtensionIdEnv)) {
      if (ext_.id() != expected) {
        log_.warn("Extension id differs from the one the gateway expects",
                  {{"id", ext_.id()}, {"expected", expected}});
      }
    }

    running_.store(true);
    try {
      ext_.start(*this);
    } catch (const std::exception &e) {
      log_.error("Extension failed to start", {{"error", e.what()}});
      write({{"type", "error"}, {"error", std::string(e.what())}});
      return 1;
    }

    write({{"type", "register"}, {"extension", to_json(describe(ext_))}});
    log_.info("Extension host ready", {{"pid", static_cast<int>(::getpid())}});

    std::thread watchdog;
    if (options_.watch_parent) {
      watchdog = std::thread([this]() { watch_parent(); });
    }

    line_reader reader(options_.in_fd);
    std::string line;
    while (reader.read_line(line, &running_)) {
      handle_line(line);
    }

    running_.store(false);
    stop_cv_.notify_all();
    if (watchdog.joinable()) {
      watchdog.join();
    }

    fail_all_calls("gateway connection closed");
    join_workers();
    events_.stop();
    try {
      ext_.stop();
    } catch (const std::exception &e) {
      log_.error("Extension stop failed", {{"error", e.what()}});
    }
    log_.info("Extension host exiting");
    return 0;
  }

  // --- extension_context ---

  unsubscribe_fn on(const std::string &pattern, event_handler handler) override {
    uint64_t id = next_subscription_.fetch_add(1) + 1;
    {
      std::lock_guard<std::mutex> lock(subs_mu_);
      subscriptions_.push_back({id, pattern, std::move(handler)});
    }
    return [this, id]() {
      std::lock_guard<std::mutex> lock(subs_mu_);
      for (auto it = subscriptions_.begin(); it != subscriptions_.end(); ++it) {
        if (it->id == id) {
          subscriptions_.erase(it);
          return;
        }
      }
    };
  }

  /// Events emitted while handling a request inherit its connection id.
  void emit(const std::string &type, const json &payload,
            const emit_options &options = {}) override {
    json msg = {{"type", "event"}, {"event", type}, {"payload", payload}};
    if (options.source) {
      msg["source"] = *options.source;
    }
    auto connection_id = options.connection_id;
    if (!connection_id && current_ != nullptr) {
      connection_id = current_->connection_id;
    }
    if (connection_id) {
      msg["connectionId"] = *connection_id;
    }
    if (!options.tags.empty()) {
      msg["tags"] = options.tags;
    }
    write(msg);
  }

  const json &config() const override { return config_; }
  const logger &log() const override { return log_; }

  /// Nested call through the gateway. Depth grows by one; trace id and
  /// deadline are inherited from the request being handled.
  json call(const std::string &method, const json &params) override {
    call_context ctx;
    std::optional<std::string> connection_id;
    if (current_ != nullptr) {
      ctx = current_->ctx;
      connection_id = current_->connection_id;
    } else {
      ctx.trace_id = make_trace_id();
    }
    if (ctx.expired()) {
      throw gateway_error(error_code::timeout, "Call deadline exceeded for " + method);
    }

    auto id = "k" + std::to_string(next_call_.fetch_add(1) + 1);
    auto call = std::make_shared<pending_call>();
    {
      std::lock_guard<std::mutex> lock(calls_mu_);
      calls_[id] = call;
    }

    json msg = {{"type", "call"},
                {"id", id},
                {"method", method},
                {"params", params.is_object() ? params : json::object()},
                {"traceId", ctx.trace_id},
                {"depth", ctx.depth + 1}};
    if (ctx.deadline > 0) {
      msg["deadlineMs"] = ctx.deadline;
    }
    if (connection_id) {
      msg["connectionId"] = *connection_id;
    }
    if (!write(msg)) {
      remove_call(id);
      throw gateway_error(error_code::host_unavailable, "gateway connection closed");
    }

    int64_t deadline =
        ctx.deadline > 0 ? ctx.deadline : now_ms() + options_.call_timeout_ms;
    auto until = std::chrono::system_clock::time_point(std::chrono::milliseconds(deadline));
    std::unique_lock<std::mutex> lock(call->mu);
    bool done = call->cv.wait_until(lock, until, [&call]() { return call->done; });
    if (!done) {
      lock.unlock();
      remove_call(id);
      throw gateway_error(error_code::timeout, "ctx.call " + method + " timed out");
    }
    if (!call->ok) {
      throw gateway_error(call->code, call->error);
    }
    return call->result;
  }

private:
  struct subscription {
    uint64_t id;
    std::string pattern;
    event_handler handler;
  };

  struct pending_call {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    bool ok = false;
    error_code code = error_code::remote_error;
    std::string error;
    json result;
  };

  /// The request a worker thread is handling.
  struct request_scope {
    call_context ctx;
    std::optional<std::string> connection_id;
  };

  struct worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  static inline thread_local const request_scope *current_ = nullptr;

  bool write(const json &msg) {
    std::string line = msg.dump(-1, ' ', false, json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(write_mu_);
    return write_line(options_.out_fd, line);
  }

  void handle_line(const std::string &line) {
    json msg;
    try {
      msg = json::parse(line);
    } catch (const json::parse_error &e) {
      log_.warn("Invalid JSON from gateway", {{"error", e.what()}});
      return;
    }
    if (!msg.is_object()) {
      return;
    }

    try {
      auto type = msg.value("type", std::string());
      if (type == "req") {
        start_request(msg);
      } else if (type == "event") {
        dispatch_event(event_from_message(msg));
      } else if (type == "call_res") {
        complete_call(msg);
      } else {
        log_.warn("Unknown message from gateway", {{"type", type}});
      }
    } catch (const json::exception &e) {
      log_.warn("Malformed message from gateway", {{"error", e.what()}});
    }
  }

  void start_request(const json &msg) {
    auto id = msg.value("id", std::string());
    auto method = msg.value("method", std::string());
    json params = msg.contains("params") && msg["params"].is_object()
                      ? msg["params"]
                      : json::object();
    request_scope scope;
    scope.ctx.trace_id = msg.value("traceId", std::string());
    if (scope.ctx.trace_id.empty()) {
      scope.ctx.trace_id = make_trace_id();
    }
    scope.ctx.depth = msg.value("depth", 0);
    scope.ctx.deadline = msg.value("deadlineMs", static_cast<int64_t>(0));
    scope.connection_id = optional_string(msg, "connectionId");

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread t([this, id, method, params, scope, done]() {
      current_ = &scope;
      json reply = {{"type", "res"}, {"id", id}};
      try {
        reply["payload"] = handle_request(method, params);
        reply["ok"] = true;
      } catch (const gateway_error &e) {
        reply["ok"] = false;
        reply["error"] = e.what();
        reply["code"] = std::string(to_string(e.code()));
      } catch (const std::exception &e) {
        reply["ok"] = false;
        reply["error"] = e.what();
        reply["code"] = std::string(to_string(error_code::remote_error));
      }
      current_ = nullptr;
      if (!write(reply)) {
        log_.warn("Failed to write response", {{"id", id}, {"method", method}});
      }
      done->store(true);
    });

    std::lock_guard<std::mutex> lock(workers_mu_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (it->done->load()) {
        it->thread.join();
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
    workers_.push_back({std::move(t), done});
  }

  json handle_request(const std::string &method, const json &params) {
    if (method == "__health") {
      return to_json(ext_.health());
    }
    if (method == "__sourceResponse") {
      auto source = params.value("source", std::string());
      if (source.empty()) {
        throw gateway_error(error_code::invalid_request,
                            "__sourceResponse requires a source");
      }
      auto event = event_from_json(params.contains("event") ? params["event"]
                                                            : json::object());
      ext_.handle_source_response(source, event);
      return {{"delivered", true}};
    }
    return ext_.handle_method(method, params);
  }

  void dispatch_event(const gateway_event &event) {
    std::vector<event_handler> handlers;
    {
      std::lock_guard<std::mutex> lock(subs_mu_);
      for (const auto &sub : subscriptions_) {
        if (matches(event.type, sub.pattern)) {
          handlers.push_back(sub.handler);
        }
      }
    }
    if (handlers.empty()) {
      return;
    }

    auto shared = std::make_shared<const gateway_event>(event);
    for (auto &handler : handlers) {
      bool queued = events_.post([this, handler, shared]() {
        try {
          handler(*shared);
        } catch (const std::exception &e) {
          log_.error("Event handler failed",
                     {{"event", shared->type}, {"error", e.what()}});
        }
      });
      if (!queued) {
        log_.warn("Event queue full, dropping event", {{"event", event.type}});
      }
    }
  }

  void complete_call(const json &msg) {
    auto id = msg.value("id", std::string());
    std::shared_ptr<pending_call> call;
    {
      std::lock_guard<std::mutex> lock(calls_mu_);
      auto it = calls_.find(id);
      if (it == calls_.end()) {
        log_.debug("Dropping late call result", {{"id", id}});
        return;
      }
      call = it->second;
      calls_.erase(it);
    }

    std::lock_guard<std::mutex> lock(call->mu);
    call->ok = msg.value("ok", false);
    if (call->ok) {
      call->result = msg.contains("payload") ? msg["payload"] : json();
    } else {
      const auto &err = msg.contains("error") ? msg["error"] : json();
      call->error = err.is_string() ? err.get<std::string>() : "ctx.call failed";
      call->code = error_code_from_string(msg.value("code", std::string()),
                                          error_code::remote_error);
    }
    call->done = true;
    call->cv.notify_all();
  }

  void remove_call(const std::string &id) {
    std::lock_guard<std::mutex> lock(calls_mu_);
    calls_.erase(id);
  }

  void fail_all_calls(const std::string &reason) {
    std::unordered_map<std::string, std::shared_ptr<pending_call>> snapshot;
    {
      std::lock_guard<std::mutex> lock(calls_mu_);
      snapshot.swap(calls_);
    }
    for (auto &kv : snapshot) {
      auto &call = kv.second;
      std::lock_guard<std::mutex> lock(call->mu);
      call->done = true;
      call->ok = false;
      call->code = error_code::host_unavailable;
      call->error = reason;
      call->cv.notify_all();
    }
  }

  void join_workers() {
    std::list<worker> workers;
    {
      std::lock_guard<std::mutex> lock(workers_mu_);
      workers.swap(workers_);
    }
    for (auto &w : workers) {
      if (w.thread.joinable()) {
        w.thread.join();
      }
    }
  }

  /// PR_SET_PDEATHSIG covers Linux; this also catches re-parenting elsewhere.
  void watch_parent() {
    pid_t parent = ::getppid();
    std::unique_lock<std::mutex> lock(stop_mu_);
    while (running_.load()) {
      stop_cv_.wait_for(lock, std::chrono::seconds(1));
      if (running_.load() && ::getppid() != parent) {
        log_.warn("Gateway process went away, shutting down");
        running_.store(false);
      }
    }
  }

  extension &ext_;
  runtime_options options_;
  logger log_;
  json config_ = json::object();

  std::atomic<bool> running_{false};
  std::mutex stop_mu_;
  std::condition_variable stop_cv_;
  std::mutex write_mu_;

  std::mutex subs_mu_;
  std::vector<subscription> subscriptions_;
  std::atomic<uint64_t> next_subscription_{0};
  serial_dispatcher events_;

  std::mutex calls_mu_;
  std::unordered_map<std::string, std::shared_ptr<pending_call>> calls_;
  std::atomic<uint64_t> next_call_{0};

  std::mutex workers_mu_;
  std::list<worker> workers_;
};

/// Entry point for extension host executables:
///   int main() { my_extension ext; return gatehouse::serve(ext); }
inline int serve(extension &ext, runtime_options options = {}) {
  host_runtime runtime(ext, options);
  return runtime.run();
}

} // namespace gatehouse
