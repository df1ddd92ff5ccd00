#pragma once

#include "dispatcher.hpp"
#include "error.hpp"
#include "events.hpp"
#include "log.hpp"
#include "manager.hpp"
#include "schema.hpp"
#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace gatehouse {

/// Methods answered by the gateway itself.
inline const std::vector<method_definition> &builtin_methods() {
  static const std::vector<method_definition> methods = [] {
    object_schema subscribe;
    subscribe.optional("events", param_type::array, "Event patterns")
        .optional("sessionId", param_type::string, "Only events for this session")
        .optional("extensionId", param_type::string,
                  "Only events emitted by this extension")
        .optional("exclusive", param_type::boolean,
                  "Last subscriber wins: only one client receives");
    object_schema unsubscribe;
    unsubscribe.optional("events", param_type::array, "Event patterns");

    return std::vector<method_definition>{
        {"gateway.list_methods",
         "List all gateway and extension methods with schemas", {}},
        {"gateway.list_extensions", "List loaded extensions and their methods", {}},
        {"gateway.health", "Gateway, client and extension health", {}},
        {"gateway.subscribe", "Subscribe to events", subscribe},
        {"gateway.unsubscribe", "Unsubscribe from events", unsubscribe},
    };
  }();
  return methods;
}

/// One client connection: its subscriptions and a bounded outbound queue
/// so a slow reader never blocks the broadcaster.
class client_session {
public:
  using json = nlohmann::json;

  client_session(std::string id, connection conn, size_t queue_capacity = 1024)
      : id_(std::move(id)), conn_(std::move(conn)),
        outbound_("client:" + id_, queue_capacity), log_("Connection") {}

  ~client_session() {
    outbound_.stop();
    close_connection(conn_);
  }

  client_session(const client_session &) = delete;
  client_session &operator=(const client_session &) = delete;

  const std::string &id() const { return id_; }
  const connection &conn() const { return conn_; }

  /// Replaces the subscription set and both scoping filters.
  void subscribe(const std::vector<std::string> &patterns,
                 const std::optional<std::string> &session_id,
                 const std::optional<std::string> &extension_id) {
    std::lock_guard<std::mutex> lock(mu_);
    patterns_ = std::set<std::string>(patterns.begin(), patterns.end());
    session_filter_ = session_id;
    extension_filter_ = extension_id;
  }

  void unsubscribe(const std::vector<std::string> &patterns) {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto &pattern : patterns) {
      patterns_.erase(pattern);
    }
  }

  std::vector<std::string> subscriptions() const {
    std::lock_guard<std::mutex> lock(mu_);
    return {patterns_.begin(), patterns_.end()};
  }

  /// Subscription match plus session and extension scoping.
  bool wants(const gateway_event &event) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!matches_any(event.type, patterns_)) {
      return false;
    }
    if (session_filter_ && event.session_id && *event.session_id != *session_filter_) {
      return false;
    }
    if (extension_filter_ &&
        event.origin.value_or("") != "extension:" + *extension_filter_) {
      return false;
    }
    return true;
  }

  /// Queue one message. False when the queue is full or closing.
  bool send(const json &msg) {
    std::string line = msg.dump(-1, ' ', false, json::error_handler_t::replace);
    bool queued = outbound_.post([this, line = std::move(line)]() {
      if (!write_line(conn_.write_fd, line)) {
        log_.debug("Write to client failed", {{"connectionId", id_}});
      }
    });
    if (!queued) {
      log_.warn("Client queue full, dropping message", {{"connectionId", id_}});
    }
    return queued;
  }

  /// Wait until queued messages are written.
  void flush() { outbound_.drain(); }

  /// Wake the reader; the connection thread finishes the teardown.
  void close() { shutdown_connection(conn_); }

private:
  std::string id_;
  connection conn_;
  serial_dispatcher outbound_;
  logger log_;

  mutable std::mutex mu_;
  std::set<std::string> patterns_;
  std::optional<std::string> session_filter_;
  std::optional<std::string> extension_filter_;
};

struct server_options {
  size_t client_queue_capacity = 1024;
  /// How often blocked readers and the acceptor check for shutdown.
  int poll_interval_ms = 200;
};

/// Client-facing side of the gateway: accepts connections, answers
/// req/ping messages and fans events out to subscribed clients.
class gateway_server {
public:
  using json = nlohmann::json;

  explicit gateway_server(extension_manager &manager, server_options options = {})
      : manager_(manager), options_(options), log_("Gateway") {}

  ~gateway_server() { stop(); }

  gateway_server(const gateway_server &) = delete;
  gateway_server &operator=(const gateway_server &) = delete;

  /// Bind `uri` and start accepting. Returns the bound address.
  std::string start(const std::string &uri) {
    if (running_.exchange(true)) {
      throw gateway_error(error_code::invalid_request, "gateway already started");
    }

    manager_.set_event_sink([this](const gateway_event &event) { deliver(event); });
    listener_ = listen(uri);
    auto address = describe(listener_);

    if (std::holds_alternative<stdio_listener>(listener_) ||
        std::holds_alternative<mem_listener>(listener_)) {
      serve_connection(accept(listener_));
    } else {
      acceptor_ = std::thread([this]() { accept_loop(); });
    }
    log_.info("Gateway listening", {{"address", address}});
    return address;
  }

  /// Client side of a mem:// listener.
  connection dial_mem() { return mem_dial(listener_); }

  /// Serve an already-connected stream on its own thread.
  std::string serve_connection(connection conn) {
    auto id = "conn-" + std::to_string(next_connection_.fetch_add(1) + 1);
    auto session = std::make_shared<client_session>(id, std::move(conn),
                                                    options_.client_queue_capacity);
    {
      std::lock_guard<std::mutex> lock(mu_);
      sessions_[id] = session;
    }
    log_.info("Client connected", {{"connectionId", id}, {"transport", session->conn().scheme}});

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread worker([this, session, done]() {
      run_session(session);
      done->store(true);
    });

    std::lock_guard<std::mutex> lock(threads_mu_);
    reap_finished();
    threads_.push_back({std::move(worker), done});
    return id;
  }

  void stop() {
    if (!running_.exchange(false)) {
      return;
    }
    manager_.set_event_sink(nullptr);
    close_listener(listener_);
    if (acceptor_.joinable()) {
      acceptor_.join();
    }

    std::vector<std::shared_ptr<client_session>> sessions;
    {
      std::lock_guard<std::mutex> lock(mu_);
      for (auto &kv : sessions_) {
        sessions.push_back(kv.second);
      }
    }
    for (auto &session : sessions) {
      session->close();
    }

    std::list<session_thread> threads;
    {
      std::lock_guard<std::mutex> lock(threads_mu_);
      threads.swap(threads_);
    }
    for (auto &t : threads) {
      if (t.thread.joinable()) {
        t.thread.join();
      }
    }
    log_.info("Gateway stopped");
  }

  size_t client_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return sessions_.size();
  }

  /// Send `event` to the clients that should see it. A connection id
  /// targets exactly one client; exclusive patterns restrict delivery to
  /// their owner.
  void deliver(const gateway_event &event) {
    std::vector<std::shared_ptr<client_session>> sessions;
    std::set<std::string> owners;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (event.connection_id) {
        auto it = sessions_.find(*event.connection_id);
        if (it != sessions_.end()) {
          it->second->send(event_message(event));
        }
        return;
      }
      for (const auto &kv : exclusive_) {
        if (matches(event.type, kv.first)) {
          owners.insert(kv.second);
        }
      }
      for (const auto &kv : sessions_) {
        sessions.push_back(kv.second);
      }
    }

    auto msg = event_message(event);
    for (auto &session : sessions) {
      if (!owners.empty() && owners.count(session->id()) == 0) {
        continue;
      }
      if (session->wants(event)) {
        session->send(msg);
      }
    }
  }

  /// Answer one inbound message. Exposed for tests; connection threads
  /// call it in arrival order.
  void handle_line(client_session &session, const std::string &line) {
    json msg;
    try {
      msg = json::parse(line);
    } catch (const json::parse_error &e) {
      log_.warn("Invalid JSON from client",
                {{"connectionId", session.id()}, {"error", e.what()}});
      session.send(error_response("unknown", error_code::invalid_request,
                                  "Invalid JSON"));
      return;
    }
    if (!msg.is_object()) {
      session.send(error_response("unknown", error_code::invalid_request,
                                  "Message must be a JSON object"));
      return;
    }

    json id = msg.contains("id") && (msg["id"].is_string() || msg["id"].is_number())
                  ? msg["id"]
                  : json("unknown");
    auto type = msg.value("type", std::string());
    if (type == "ping") {
      session.send({{"type", "pong"}, {"id", id}});
      return;
    }
    if (type != "req") {
      session.send(error_response(id, error_code::invalid_request,
                                  "Unsupported message type: " + type));
      return;
    }

    auto method = msg.value("method", std::string());
    if (method.empty()) {
      session.send(error_response(id, error_code::invalid_request, "Missing method"));
      return;
    }
    json params = msg.contains("params") && !msg["params"].is_null()
                      ? msg["params"]
                      : json::object();

    try {
      auto payload = dispatch(session, method, params);
      session.send({{"type", "res"}, {"id", id}, {"ok", true}, {"payload", payload}});
    } catch (const gateway_error &e) {
      log_.debug("Request failed", {{"connectionId", session.id()},
                                    {"method", method},
                                    {"code", to_string(e.code())},
                                    {"error", e.what()}});
      session.send(error_response(id, e.code(), e.what()));
    } catch (const std::exception &e) {
      log_.error("Request handler threw", {{"connectionId", session.id()},
                                           {"method", method},
                                           {"error", e.what()}});
      session.send(error_response(id, error_code::internal, e.what()));
    }
  }

private:
  struct session_thread {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  static json error_response(const json &id, error_code code,
                             const std::string &message) {
    return {{"type", "res"},
            {"id", id},
            {"ok", false},
            {"error", message},
            {"code", to_string(code)}};
  }

  void accept_loop() {
    int fd = listener_fd(listener_);
    while (running_.load()) {
      if (!wait_readable(fd, options_.poll_interval_ms)) {
        continue;
      }
      if (!running_.load()) {
        break;
      }
      try {
        serve_connection(accept(listener_));
      } catch (const std::exception &e) {
        if (running_.load()) {
          log_.warn("Accept failed", {{"error", e.what()}});
        }
      }
    }
  }

  void run_session(const std::shared_ptr<client_session> &session) {
    line_reader reader(session->conn().read_fd);
    std::string line;
    while (reader.read_line(line, &running_, options_.poll_interval_ms)) {
      handle_line(*session, line);
    }

    session->flush();
    {
      std::lock_guard<std::mutex> lock(mu_);
      sessions_.erase(session->id());
      release_exclusive(session->id());
    }
    log_.info("Client disconnected", {{"connectionId", session->id()}});
  }

  /// Caller holds mu_.
  void release_exclusive(const std::string &connection_id) {
    for (auto it = exclusive_.begin(); it != exclusive_.end();) {
      if (it->second == connection_id) {
        it = exclusive_.erase(it);
      } else {
        ++it;
      }
    }
  }

  /// Joins connection threads that have already finished.
  void reap_finished() {
    for (auto it = threads_.begin(); it != threads_.end();) {
      if (it->done->load()) {
        it->thread.join();
        it = threads_.erase(it);
      } else {
        ++it;
      }
    }
  }

  json dispatch(client_session &session, const std::string &method,
                const json &params) {
    if (method == "subscribe" || method == "gateway.subscribe") {
      validate(method, builtin_schema("gateway.subscribe"), params);
      auto events = string_list(params, "events");
      session.subscribe(events, optional_string(params, "sessionId"),
                        optional_string(params, "extensionId"));
      {
        std::lock_guard<std::mutex> lock(mu_);
        release_exclusive(session.id());
        if (params.value("exclusive", false)) {
          for (const auto &pattern : events) {
            exclusive_[pattern] = session.id();
          }
        }
      }
      log_.debug("Client subscribed",
                 {{"connectionId", session.id()}, {"events", events}});
      return {{"subscribed", events}};
    }

    if (method == "unsubscribe" || method == "gateway.unsubscribe") {
      validate(method, builtin_schema("gateway.unsubscribe"), params);
      auto events = string_list(params, "events");
      session.unsubscribe(events);
      std::lock_guard<std::mutex> lock(mu_);
      for (const auto &pattern : events) {
        auto it = exclusive_.find(pattern);
        if (it != exclusive_.end() && it->second == session.id()) {
          exclusive_.erase(it);
        }
      }
      return {{"unsubscribed", events}};
    }

    if (method == "gateway.list_methods") {
      return list_methods();
    }

    if (method == "gateway.list_extensions" || method == "extension.list") {
      json extensions = json::array();
      for (const auto &ext : manager_.extension_list()) {
        extensions.push_back(
            {{"id", ext.id}, {"name", ext.name}, {"methods", ext.methods}});
      }
      return {{"extensions", extensions}};
    }

    if (method == "gateway.health") {
      json extensions = json::object();
      for (const auto &[id, status] : manager_.health()) {
        extensions[id] = to_json(status);
      }
      json routes = json::object();
      for (const auto &[prefix, owner] : manager_.source_routes()) {
        routes[prefix] = owner;
      }
      return {{"status", "ok"},
              {"clients", client_count()},
              {"extensions", extensions},
              {"sourceRoutes", routes}};
    }

    return manager_.handle_method(method, params, session.id());
  }

  static const object_schema &builtin_schema(const std::string &name) {
    static const object_schema empty;
    for (const auto &method : builtin_methods()) {
      if (method.name == name) {
        return method.input_schema;
      }
    }
    return empty;
  }

  json list_methods() const {
    json methods = json::array();
    for (const auto &method : builtin_methods()) {
      auto entry = to_json(method);
      entry["source"] = "gateway";
      methods.push_back(entry);
    }
    for (const auto &info : manager_.method_definitions()) {
      auto entry = to_json(info.method);
      entry["source"] = "extension";
      entry["extensionId"] = info.extension_id;
      methods.push_back(entry);
    }
    return {{"methods", methods}};
  }

  extension_manager &manager_;
  server_options options_;
  logger log_;

  std::atomic<bool> running_{false};
  listener listener_ = stdio_listener{true};
  std::thread acceptor_;
  std::atomic<uint64_t> next_connection_{0};

  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<client_session>> sessions_;
  /// pattern -> owning connection id
  std::map<std::string, std::string> exclusive_;

  std::mutex threads_mu_;
  std::list<session_thread> threads_;
};

/// Blocking client for the gateway wire protocol.
class gateway_client {
public:
  using json = nlohmann::json;
  using event_fn = std::function<void(const gateway_event &)>;

  explicit gateway_client(int request_timeout_ms = 10000)
      : request_timeout_ms_(request_timeout_ms) {}

  ~gateway_client() { close(); }

  gateway_client(const gateway_client &) = delete;
  gateway_client &operator=(const gateway_client &) = delete;

  void connect(const std::string &uri) { attach(dial(uri)); }

  /// Take over an already-connected stream (e.g. from mem_dial()).
  void attach(connection conn) {
    close();
    conn_ = std::move(conn);
    running_.store(true);
    io_thread_ = std::thread([this]() { io_loop(); });
  }

  void on_event(event_fn handler) {
    std::lock_guard<std::mutex> lock(events_mu_);
    on_event_ = std::move(handler);
  }

  /// Send a req and wait for its res. Failed responses are rethrown as
  /// gateway_error with the server's code.
  json invoke(const std::string &method, const json &params = json::object(),
              int timeout_ms = -1) {
    auto id = "c" + std::to_string(next_id_.fetch_add(1) + 1);
    auto reply = round_trip(id, {{"type", "req"},
                                 {"id", id},
                                 {"method", method},
                                 {"params", params}},
                            timeout_ms);
    if (!reply.value("ok", false)) {
      auto message = reply.contains("error") && reply["error"].is_string()
                         ? reply["error"].get<std::string>()
                         : std::string("request failed");
      throw gateway_error(error_code_from_string(reply.value("code", std::string())),
                          message);
    }
    return reply.contains("payload") ? reply["payload"] : json();
  }

  void ping(int timeout_ms = -1) {
    auto id = "p" + std::to_string(next_id_.fetch_add(1) + 1);
    round_trip(id, {{"type", "ping"}, {"id", id}}, timeout_ms);
  }

  /// Write a raw line, for exercising malformed input.
  bool send_raw(const std::string &line) {
    std::lock_guard<std::mutex> lock(write_mu_);
    return write_line(conn_.write_fd, line);
  }

  void close() {
    if (!running_.exchange(false) && !io_thread_.joinable()) {
      return;
    }
    shutdown_connection(conn_);
    if (io_thread_.joinable()) {
      io_thread_.join();
    }
    close_connection(conn_);
    fail_all_pending("gateway client closed");
  }

private:
  struct pending_call {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    bool failed = false;
    std::string error;
    json reply;
  };

  json round_trip(const std::string &id, const json &msg, int timeout_ms) {
    auto call = std::make_shared<pending_call>();
    {
      std::lock_guard<std::mutex> lock(pending_mu_);
      pending_[id] = call;
    }
    if (!send_raw(msg.dump())) {
      remove_pending(id);
      throw gateway_error(error_code::host_unavailable, "gateway connection closed");
    }

    int timeout = timeout_ms > 0 ? timeout_ms : request_timeout_ms_;
    std::unique_lock<std::mutex> lock(call->mu);
    bool done = call->cv.wait_for(lock, std::chrono::milliseconds(timeout),
                                  [&call]() { return call->done; });
    if (!done) {
      lock.unlock();
      remove_pending(id);
      throw gateway_error(error_code::timeout, "gateway request timed out");
    }
    if (call->failed) {
      throw gateway_error(error_code::host_unavailable, call->error);
    }
    return call->reply;
  }

  void io_loop() {
    line_reader reader(conn_.read_fd);
    std::string line;
    while (reader.read_line(line, &running_)) {
      json msg;
      try {
        msg = json::parse(line);
      } catch (const json::parse_error &) {
        continue;
      }
      if (!msg.is_object()) {
        continue;
      }

      auto type = msg.value("type", std::string());
      if (type == "event") {
        event_fn handler;
        {
          std::lock_guard<std::mutex> lock(events_mu_);
          handler = on_event_;
        }
        if (handler) {
          handler(event_from_message(msg));
        }
        continue;
      }
      if (type == "res" || type == "pong") {
        auto id = msg.contains("id") ? msg["id"] : json();
        complete(id.is_string() ? id.get<std::string>() : id.dump(), msg);
      }
    }
    fail_all_pending("gateway connection closed");
  }

  void complete(const std::string &id, const json &msg) {
    std::shared_ptr<pending_call> call;
    {
      std::lock_guard<std::mutex> lock(pending_mu_);
      auto it = pending_.find(id);
      if (it == pending_.end()) {
        return;
      }
      call = it->second;
      pending_.erase(it);
    }
    std::lock_guard<std::mutex> lock(call->mu);
    call->reply = msg;
    call->done = true;
    call->cv.notify_all();
  }

  void remove_pending(const std::string &id) {
    std::lock_guard<std::mutex> lock(pending_mu_);
    pending_.erase(id);
  }

  void fail_all_pending(const std::string &reason) {
    std::unordered_map<std::string, std::shared_ptr<pending_call>> snapshot;
    {
      std::lock_guard<std::mutex> lock(pending_mu_);
      snapshot.swap(pending_);
    }
    for (auto &kv : snapshot) {
      auto &call = kv.second;
      std::lock_guard<std::mutex> lock(call->mu);
      call->done = true;
      call->failed = true;
      call->error = reason;
      call->cv.notify_all();
    }
  }

  int request_timeout_ms_;
  connection conn_;
  std::atomic<bool> running_{false};
  std::thread io_thread_;
  std::mutex write_mu_;

  std::mutex events_mu_;
  event_fn on_event_;

  std::mutex pending_mu_;
  std::unordered_map<std::string, std::shared_ptr<pending_call>> pending_;
  std::atomic<uint64_t> next_id_{0};
};

} // namespace gatehouse
