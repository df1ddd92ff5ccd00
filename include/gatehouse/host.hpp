#pragma once

#include "dispatcher.hpp"
#include "error.hpp"
#include "events.hpp"
#include "extension.hpp"
#include "log.hpp"
#include "process.hpp"
#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace gatehouse {

/// Manager-side view of an out-of-process extension.
class remote_host {
public:
  virtual ~remote_host() = default;

  /// Throws timeout, host_unavailable or remote_error.
  virtual nlohmann::json
  call_method(const std::string &method, const nlohmann::json &params,
              const std::optional<std::string> &connection_id = std::nullopt,
              const std::optional<call_context> &ctx = std::nullopt,
              const std::vector<std::string> &tags = {}) = 0;

  /// Fire-and-forget; never blocks the caller.
  virtual void send_event(const gateway_event &event) = 0;

  /// False when the host rejected the event or could not be reached.
  virtual bool route_to_source(const std::string &address,
                               const gateway_event &event) = 0;

  virtual bool is_running() const = 0;

  /// Fail in-flight calls and refuse new ones. Run across every host
  /// before kill() so nested calls between hosts unwind first.
  virtual void interrupt() {}

  /// Graceful stop; returns once the process exited or was killed.
  virtual void kill() = 0;

  /// Immediate termination, for the exit path.
  virtual void force_kill() = 0;
};

struct host_options {
  /// argv of the host executable.
  std::vector<std::string> command;
  /// Scoped extension config handed to the child.
  nlohmann::json config = nlohmann::json::object();
  int request_timeout_ms = 300000;
  int route_timeout_ms = 10000;
  int health_timeout_ms = 5000;
  int register_timeout_ms = 10000;
  int kill_grace_ms = 3000;
  int restart_delay_ms = 2000;
  int max_restarts = 5;
  size_t max_in_flight_calls = 50;
  size_t outbound_queue_capacity = 1024;
};

/// Environment variables the child reads its identity and config from.
constexpr const char *kExtensionIdEnv = "GATEHOUSE_EXTENSION_ID";
constexpr const char *kExtensionConfigEnv = "GATEHOUSE_EXTENSION_CONFIG";

/// Runs one extension in a child process and speaks NDJSON over its
/// stdin/stdout. The child registers itself on startup; unexpected exits
/// are restarted up to `max_restarts` times.
class process_host : public remote_host {
public:
  using json = nlohmann::json;
  using event_fn = std::function<void(const gateway_event &)>;
  using register_fn = std::function<void(const extension_registration &)>;
  using call_fn = std::function<json(
      const std::string &caller, const std::string &method, const json &params,
      const std::optional<std::string> &connection_id, const call_context &ctx)>;

  process_host(std::string extension_id, host_options options,
               event_fn on_event = nullptr, register_fn on_register = nullptr,
               call_fn on_call = nullptr)
      : id_(std::move(extension_id)), options_(std::move(options)),
        on_event_(std::move(on_event)), on_register_(std::move(on_register)),
        on_call_(std::move(on_call)), log_("ExtensionHost") {}

  ~process_host() override {
    bool was_killed = false;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      was_killed = killed_;
    }
    if (!was_killed) {
      force_kill();
    } else {
      join_threads();
    }
    // Workers capture this; none may outlive it.
    reap_workers(-1);
  }

  process_host(const process_host &) = delete;
  process_host &operator=(const process_host &) = delete;

  const std::string &extension_id() const { return id_; }

  /// Launch the child and wait for its registration.
  extension_registration spawn() {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (killed_) {
        throw gateway_error(error_code::host_unavailable,
                            "Extension host " + id_ + " was killed");
      }
      if (current_) {
        throw gateway_error(error_code::invalid_request,
                            "Extension host " + id_ + " already spawned");
      }
    }

    log_.info("Spawning extension host",
              {{"extensionId", id_}, {"command", options_.command}});
    launch();

    std::unique_lock<std::mutex> lock(state_mu_);
    bool ready = state_cv_.wait_for(
        lock, std::chrono::milliseconds(options_.register_timeout_ms),
        [this]() { return registered_ || exit_pending_ || killed_; });

    if (!ready || !registered_) {
      auto inst = std::move(current_);
      bool exited = exit_pending_;
      exit_pending_ = false;
      lock.unlock();
      teardown(inst);
      throw gateway_error(
          error_code::host_unavailable,
          exited ? "Extension host " + id_ + " exited before registering"
                 : "Extension host " + id_ + " failed to register within " +
                       std::to_string(options_.register_timeout_ms) + "ms");
    }

    auto registration = *registration_;
    if (!supervisor_.joinable()) {
      supervisor_ = std::thread([this]() { supervise(); });
    }
    return registration;
  }

  std::optional<extension_registration> registration() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return registration_;
  }

  json call_method(const std::string &method, const json &params,
                   const std::optional<std::string> &connection_id = std::nullopt,
                   const std::optional<call_context> &ctx = std::nullopt,
                   const std::vector<std::string> &tags = {}) override {
    int64_t deadline = ctx && ctx->deadline > 0
                           ? ctx->deadline
                           : now_ms() + options_.request_timeout_ms;
    return request(method, params, deadline, connection_id, ctx, tags);
  }

  void send_event(const gateway_event &event) override {
    auto inst = current();
    if (!inst || !inst->proc->running()) {
      log_.debug("Dropping event for stopped host",
                 {{"extensionId", id_}, {"event", event.type}});
      return;
    }

    json msg = event_message(event);
    if (!post(*inst, msg)) {
      log_.warn("Outbound queue full, dropping event",
                {{"extensionId", id_}, {"event", event.type}});
    }
  }

  bool route_to_source(const std::string &address,
                       const gateway_event &event) override {
    try {
      request("__sourceResponse", {{"source", address}, {"event", to_json(event)}},
              now_ms() + options_.route_timeout_ms, std::nullopt, std::nullopt, {});
      return true;
    } catch (const gateway_error &e) {
      log_.warn("Source response not delivered",
                {{"extensionId", id_}, {"source", address}, {"error", e.what()}});
      return false;
    }
  }

  /// Asks the child for its own health report.
  health_status health() {
    if (!is_running()) {
      return {false, {{"status", "not_running"}, {"remote", true}}};
    }
    try {
      auto result = request("__health", json::object(),
                            now_ms() + options_.health_timeout_ms, std::nullopt,
                            std::nullopt, {});
      health_status status;
      if (!result.is_object()) {
        return {false, {{"status", "invalid_health_report"}, {"remote", true}}};
      }
      status.ok = result.value("ok", false);
      status.details = result.contains("details") ? result["details"] : json();
      return status;
    } catch (const gateway_error &) {
      return {false, {{"status", "health_check_failed"}, {"remote", true}}};
    }
  }

  bool is_running() const override {
    std::lock_guard<std::mutex> lock(state_mu_);
    return !killed_ && current_ && current_->proc->running();
  }

  int restart_count() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return restarts_;
  }

  size_t pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mu_);
    return pending_.size();
  }

  void interrupt() override {
    mark_killed();
    fail_all_pending(error_code::host_unavailable,
                     "Extension host " + id_ + " shutting down");
  }

  /// Close stdin, then SIGTERM, then SIGKILL, each after part of the grace
  /// period.
  void kill() override {
    auto inst = mark_killed();
    if (inst) {
      int half = std::max(1, options_.kill_grace_ms / 2);
      bool closed = inst->proc->close_stdin();
      if (!closed || !inst->proc->wait_exit(half)) {
        inst->proc->signal(SIGTERM);
        if (!inst->proc->wait_exit(half)) {
          log_.warn("Extension host ignored SIGTERM, killing",
                    {{"extensionId", id_}, {"pid", inst->proc->pid()}});
          inst->proc->signal(SIGKILL);
          inst->proc->wait_exit(options_.kill_grace_ms);
        }
      }
      log_.info("Extension host stopped",
                {{"extensionId", id_}, {"exitCode", inst->proc->exit_code()}});
    }
    fail_all_pending(error_code::host_unavailable,
                     "Extension host " + id_ + " killed");
    join_threads();
  }

  void force_kill() override {
    auto inst = mark_killed();
    if (inst) {
      inst->proc->signal(SIGKILL);
      inst->proc->wait_exit(options_.kill_grace_ms);
    }
    fail_all_pending(error_code::host_unavailable,
                     "Extension host " + id_ + " killed");
    join_threads();
  }

private:
  struct pending_call {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    bool ok = false;
    error_code code = error_code::remote_error;
    std::string message;
    json result;
  };

  /// One launched child and the threads serving it.
  struct instance {
    std::unique_ptr<child_process> proc;
    std::unique_ptr<serial_dispatcher> writer;
    std::thread reader;
    std::thread errors;
  };

  struct call_worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  std::shared_ptr<instance> current() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return current_;
  }

  void launch() {
    uint64_t generation = 0;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      generation = ++generation_;
      registered_ = false;
      exit_pending_ = false;
    }

    auto inst = std::make_shared<instance>();
    inst->proc = child_process::spawn(
        options_.command,
        {std::string(kExtensionIdEnv) + "=" + id_,
         std::string(kExtensionConfigEnv) + "=" + options_.config.dump()},
        [this, generation](int code) { on_exit(generation, code); });
    inst->writer = std::make_unique<serial_dispatcher>(
        "host:" + id_, options_.outbound_queue_capacity);

    instance *raw = inst.get();
    inst->reader = std::thread([this, raw]() { read_stdout(*raw); });
    inst->errors = std::thread([this, raw]() { read_stderr(*raw); });

    std::lock_guard<std::mutex> lock(state_mu_);
    current_ = inst;
  }

  void teardown(std::shared_ptr<instance> &inst) {
    if (!inst) {
      return;
    }
    inst->proc->signal(SIGKILL);
    inst->proc->wait_exit(options_.kill_grace_ms);
    inst->writer->stop();
    if (inst->reader.joinable()) {
      inst->reader.join();
    }
    if (inst->errors.joinable()) {
      inst->errors.join();
    }
    inst.reset();
  }

  std::shared_ptr<instance> mark_killed() {
    std::shared_ptr<instance> inst;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      killed_ = true;
      inst = current_;
    }
    state_cv_.notify_all();
    return inst;
  }

  void join_threads() {
    if (supervisor_.joinable() &&
        supervisor_.get_id() != std::this_thread::get_id()) {
      supervisor_.join();
    }

    std::shared_ptr<instance> inst;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      inst = std::move(current_);
    }
    teardown(inst);
    reap_workers(options_.kill_grace_ms);
  }

  /// Join finished ctx.call workers, waiting up to `timeout_ms` (-1: no
  /// limit) for the rest. Workers still running stay queued for the
  /// destructor.
  void reap_workers(int timeout_ms) {
    auto until = std::chrono::steady_clock::now() +
                 std::chrono::milliseconds(std::max(timeout_ms, 0));
    while (true) {
      std::list<call_worker> finished;
      bool busy = false;
      {
        std::lock_guard<std::mutex> lock(workers_mu_);
        for (auto it = workers_.begin(); it != workers_.end();) {
          if (it->done->load()) {
            finished.splice(finished.end(), workers_, it++);
          } else {
            ++it;
          }
        }
        busy = !workers_.empty();
      }
      for (auto &worker : finished) {
        if (worker.thread.joinable()) {
          worker.thread.join();
        }
      }
      if (!busy) {
        return;
      }
      if (timeout_ms >= 0 && std::chrono::steady_clock::now() >= until) {
        log_.warn("ctx.call workers still running after kill",
                  {{"extensionId", id_}, {"timeoutMs", timeout_ms}});
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  void on_exit(uint64_t generation, int code) {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (generation != generation_) {
        return;
      }
      exit_pending_ = true;
      last_exit_code_ = code;
    }
    state_cv_.notify_all();
    fail_all_pending(error_code::host_unavailable,
                     "Extension host " + id_ + " exited with code " +
                         std::to_string(code));
  }

  void supervise() {
    while (true) {
      std::shared_ptr<instance> old;
      int code = -1;
      {
        std::unique_lock<std::mutex> lock(state_mu_);
        state_cv_.wait(lock, [this]() { return killed_ || exit_pending_; });
        if (killed_) {
          return;
        }
        exit_pending_ = false;
        old = std::move(current_);
        code = last_exit_code_;
      }
      teardown(old);
      log_.info("Extension host exited", {{"extensionId", id_}, {"exitCode", code}});

      int attempt = 0;
      {
        std::unique_lock<std::mutex> lock(state_mu_);
        if (restarts_ >= options_.max_restarts) {
          lock.unlock();
          log_.error("Extension host exceeded max restarts",
                     {{"extensionId", id_}, {"maxRestarts", options_.max_restarts}});
          return;
        }
        attempt = ++restarts_;
        bool killed = state_cv_.wait_for(
            lock, std::chrono::milliseconds(options_.restart_delay_ms),
            [this]() { return killed_; });
        if (killed) {
          return;
        }
      }

      log_.info("Auto-restarting extension host",
                {{"extensionId", id_},
                 {"attempt", attempt},
                 {"maxRestarts", options_.max_restarts}});
      try {
        launch();
      } catch (const std::exception &e) {
        log_.error("Failed to restart extension host",
                   {{"extensionId", id_}, {"error", e.what()}});
        std::lock_guard<std::mutex> lock(state_mu_);
        exit_pending_ = true;
      }
    }
  }

  bool post(instance &inst, const json &msg) {
    child_process *proc = inst.proc.get();
    std::string line = msg.dump(-1, ' ', false, json::error_handler_t::replace);
    return inst.writer->post([this, proc, line = std::move(line)]() {
      if (!proc->write_stdin(line)) {
        log_.warn("Failed to write to extension host stdin", {{"extensionId", id_}});
      }
    });
  }

  json request(const std::string &method, const json &params, int64_t deadline,
               const std::optional<std::string> &connection_id,
               const std::optional<call_context> &ctx,
               const std::vector<std::string> &tags) {
    auto inst = current();
    if (!inst || !is_running()) {
      throw gateway_error(error_code::host_unavailable,
                          "Extension host " + id_ + " is not running");
    }

    if (now_ms() >= deadline) {
      throw gateway_error(error_code::timeout,
                          "Call deadline exceeded for " + method);
    }

    auto id = "r" + std::to_string(next_id_.fetch_add(1) + 1);
    auto call = std::make_shared<pending_call>();
    {
      std::lock_guard<std::mutex> lock(pending_mu_);
      pending_[id] = call;
    }
    // interrupt() may have run between the check above and the insert.
    if (!is_running()) {
      remove_pending(id);
      throw gateway_error(error_code::host_unavailable,
                          "Extension host " + id_ + " is not running");
    }

    json msg = {{"type", "req"},
                {"id", id},
                {"method", method},
                {"params", params.is_object() ? params : json::object()}};
    if (connection_id) {
      msg["connectionId"] = *connection_id;
    }
    if (ctx) {
      msg["traceId"] = ctx->trace_id;
      msg["depth"] = ctx->depth;
      if (ctx->deadline > 0) {
        msg["deadlineMs"] = ctx->deadline;
      }
    }
    if (!tags.empty()) {
      msg["tags"] = tags;
    }

    if (!post(*inst, msg)) {
      remove_pending(id);
      throw gateway_error(error_code::host_unavailable,
                          "Extension host " + id_ + " outbound queue is full");
    }

    auto until = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(deadline));
    std::unique_lock<std::mutex> lock(call->mu);
    bool done = call->cv.wait_until(lock, until, [&call]() { return call->done; });
    if (!done) {
      lock.unlock();
      remove_pending(id);
      throw gateway_error(error_code::timeout,
                          "Request " + method + " to " + id_ + " timed out",
                          {{"method", method}, {"deadlineMs", deadline}});
    }
    if (!call->ok) {
      throw gateway_error(call->code, call->message);
    }
    return call->result;
  }

  void remove_pending(const std::string &id) {
    std::lock_guard<std::mutex> lock(pending_mu_);
    pending_.erase(id);
  }

  void fail_all_pending(error_code code, const std::string &message) {
    std::unordered_map<std::string, std::shared_ptr<pending_call>> snapshot;
    {
      std::lock_guard<std::mutex> lock(pending_mu_);
      snapshot.swap(pending_);
    }

    for (auto &kv : snapshot) {
      auto &call = kv.second;
      std::lock_guard<std::mutex> lock(call->mu);
      call->done = true;
      call->ok = false;
      call->code = code;
      call->message = message;
      call->cv.notify_all();
    }
  }

  void read_stdout(instance &inst) {
    line_reader reader(inst.proc->stdout_fd());
    std::string line;
    while (reader.read_line(line)) {
      handle_line(inst, line);
    }
  }

  void read_stderr(instance &inst) {
    line_reader reader(inst.proc->stderr_fd());
    std::string line;
    while (reader.read_line(line)) {
      if (line.size() > 500) {
        line.resize(500);
      }
      log_.warn("[" + id_ + "] stderr", {{"text", line}});
    }
  }

  void handle_line(instance &inst, const std::string &line) {
    json msg;
    try {
      msg = json::parse(line);
    } catch (const json::parse_error &) {
      log_.warn("Invalid JSON from extension host",
                {{"extensionId", id_}, {"line", line.substr(0, 100)}});
      return;
    }
    if (!msg.is_object()) {
      return;
    }

    try {
      auto type = msg.value("type", std::string());
      if (type == "register") {
        handle_register(msg);
      } else if (type == "res") {
        handle_response(msg);
      } else if (type == "call") {
        handle_call(inst, msg);
      } else if (type == "event") {
        handle_event(msg);
      } else if (type == "error") {
        log_.error("Extension host error",
                   {{"extensionId", id_}, {"error", msg.value("error", json())}});
      } else {
        log_.warn("Unknown message from extension host",
                  {{"extensionId", id_}, {"type", type}});
      }
    } catch (const json::exception &e) {
      log_.warn("Malformed message from extension host",
                {{"extensionId", id_}, {"error", e.what()}});
    }
  }

  void handle_register(const json &msg) {
    extension_registration reg;
    try {
      reg = registration_from_json(msg.value("extension", json()));
    } catch (const gateway_error &e) {
      log_.error("Invalid registration from extension host",
                 {{"extensionId", id_}, {"error", e.what()}});
      return;
    }

    std::vector<std::string> names;
    for (const auto &m : reg.methods) {
      names.push_back(m.name);
    }
    log_.info("Extension registered",
              {{"id", reg.id}, {"name", reg.name}, {"methods", names}});

    {
      std::lock_guard<std::mutex> lock(state_mu_);
      registration_ = reg;
    }

    // spawn() returns only after the manager has seen the registration.
    if (on_register_) {
      try {
        on_register_(reg);
      } catch (const std::exception &e) {
        log_.error("Registration callback failed",
                   {{"extensionId", id_}, {"error", e.what()}});
      }
    }

    {
      std::lock_guard<std::mutex> lock(state_mu_);
      registered_ = true;
    }
    state_cv_.notify_all();
  }

  void handle_response(const json &msg) {
    std::string id = msg.value("id", std::string());

    std::shared_ptr<pending_call> call;
    {
      std::lock_guard<std::mutex> lock(pending_mu_);
      auto it = pending_.find(id);
      if (it == pending_.end()) {
        log_.debug("Dropping late response", {{"extensionId", id_}, {"id", id}});
        return;
      }
      call = it->second;
      pending_.erase(it);
    }

    std::lock_guard<std::mutex> lock(call->mu);
    call->ok = msg.value("ok", false);
    if (call->ok) {
      call->result = msg.contains("payload") ? msg["payload"] : json();
    } else {
      call->code = error_code_from_string(msg.value("code", std::string()),
                                          error_code::remote_error);
      const auto &err = msg.contains("error") ? msg["error"] : json();
      call->message = err.is_string() ? err.get<std::string>()
                                      : "Extension " + id_ + " returned an error";
    }
    call->done = true;
    call->cv.notify_all();
  }

  void handle_event(const json &msg) {
    auto type = msg.value("event", std::string());
    if (type.empty()) {
      log_.warn("Event without a name from extension host", {{"extensionId", id_}});
      return;
    }
    auto event = make_event(type, msg.contains("payload") ? msg["payload"] : json());
    event.origin = "extension:" + id_;
    event.source = optional_string(msg, "source");
    event.connection_id = optional_string(msg, "connectionId");
    event.tags = string_list(msg, "tags");
    if (auto session = optional_string(msg, "sessionId")) {
      event.session_id = session;
    }

    if (on_event_) {
      try {
        on_event_(event);
      } catch (const std::exception &e) {
        log_.error("Event callback failed",
                   {{"extensionId", id_}, {"event", type}, {"error", e.what()}});
      }
    }
  }

  void send_call_result(instance &inst, const std::string &call_id,
                        const json &payload) {
    post(inst, {{"type", "call_res"}, {"id", call_id}, {"ok", true},
                {"payload", payload}});
  }

  void send_call_error(instance &inst, const std::string &call_id,
                       error_code code, const std::string &message) {
    post(inst, {{"type", "call_res"},
                {"id", call_id},
                {"ok", false},
                {"error", message},
                {"code", std::string(to_string(code))}});
  }

  /// A ctx.call() from the child, answered with call_res.
  void handle_call(instance &inst, const json &msg) {
    auto call_id = msg.value("id", std::string());
    auto method = msg.value("method", std::string());
    json params = msg.contains("params") && msg["params"].is_object()
                      ? msg["params"]
                      : json::object();

    call_context ctx;
    ctx.trace_id = msg.value("traceId", std::string());
    if (ctx.trace_id.empty()) {
      ctx.trace_id = make_trace_id();
    }
    ctx.depth = msg.value("depth", 0);
    ctx.deadline = msg.value("deadlineMs", static_cast<int64_t>(0));
    auto connection_id = optional_string(msg, "connectionId");

    if (ctx.depth > kMaxCallDepth) {
      send_call_error(inst, call_id, error_code::depth_exceeded,
                      "Call depth " + std::to_string(ctx.depth) +
                          " exceeds max (" + std::to_string(kMaxCallDepth) +
                          "), possible cycle");
      return;
    }
    if (ctx.expired()) {
      send_call_error(inst, call_id, error_code::timeout,
                      "Call deadline exceeded for " + method);
      return;
    }
    if (!on_call_) {
      send_call_error(inst, call_id, error_code::not_supported,
                      "ctx.call not supported: no call handler registered");
      return;
    }
    if (in_flight_.load() >= options_.max_in_flight_calls) {
      send_call_error(inst, call_id, error_code::host_unavailable,
                      "Extension " + id_ + " busy: " +
                          std::to_string(in_flight_.load()) + " calls in flight");
      return;
    }

    ++in_flight_;
    auto self = current();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread worker([this, self, done, call_id, method, params, connection_id,
                        ctx]() {
      auto started = std::chrono::steady_clock::now();
      try {
        auto result = on_call_(id_, method, params, connection_id, ctx);
        send_call_result(*self, call_id, result);
      } catch (const gateway_error &e) {
        send_call_error(*self, call_id, e.code(), e.what());
      } catch (const std::exception &e) {
        send_call_error(*self, call_id, error_code::remote_error, e.what());
      }
      --in_flight_;
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - started)
                         .count();
      log_.info("ctx.call completed", {{"traceId", ctx.trace_id},
                                       {"caller", id_},
                                       {"method", method},
                                       {"depth", ctx.depth},
                                       {"durationMs", elapsed}});
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
    workers_.push_back({std::move(worker), done});
  }

  std::string id_;
  host_options options_;
  event_fn on_event_;
  register_fn on_register_;
  call_fn on_call_;
  logger log_;

  mutable std::mutex state_mu_;
  std::condition_variable state_cv_;
  std::shared_ptr<instance> current_;
  std::optional<extension_registration> registration_;
  uint64_t generation_ = 0;
  bool registered_ = false;
  bool exit_pending_ = false;
  bool killed_ = false;
  int last_exit_code_ = -1;
  int restarts_ = 0;
  std::thread supervisor_;

  mutable std::mutex pending_mu_;
  std::unordered_map<std::string, std::shared_ptr<pending_call>> pending_;
  std::atomic<uint64_t> next_id_{0};

  std::atomic<size_t> in_flight_{0};
  std::mutex workers_mu_;
  std::list<call_worker> workers_;
};

} // namespace gatehouse
