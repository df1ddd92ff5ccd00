#pragma once

#include "config.hpp"
#include "dispatcher.hpp"
#include "error.hpp"
#include "events.hpp"
#include "extension.hpp"
#include "host.hpp"
#include "log.hpp"
#include "schema.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace gatehouse {

class extension_manager;

namespace detail {

/// Context handed to in-process extensions. Subscriptions and emissions
/// go straight to the manager; nested calls are refused.
class local_context : public extension_context {
public:
  local_context(extension_manager &manager, std::string extension_id,
                uint64_t sequence, nlohmann::json config)
      : manager_(manager), id_(std::move(extension_id)), sequence_(sequence),
        config_(std::move(config)), log_(id_) {}

  unsubscribe_fn on(const std::string &pattern, event_handler handler) override;
  void emit(const std::string &type, const nlohmann::json &payload,
            const emit_options &options = {}) override;

  const nlohmann::json &config() const override { return config_; }
  const logger &log() const override { return log_; }

  nlohmann::json call(const std::string &method,
                      const nlohmann::json &params) override {
    (void)params;
    throw gateway_error(error_code::not_supported,
                        "ctx.call is not supported for in-process extension " +
                            id_ + " (calling " + method + ")");
  }

private:
  extension_manager &manager_;
  std::string id_;
  uint64_t sequence_;
  nlohmann::json config_;
  logger log_;
};

} // namespace detail

struct local_handle {
  std::shared_ptr<extension> ext;
  std::shared_ptr<detail::local_context> ctx;
  /// Serialises event delivery to this extension.
  std::shared_ptr<serial_dispatcher> events;
};

struct remote_handle {
  std::shared_ptr<remote_host> host;
};

using extension_handle = std::variant<local_handle, remote_handle>;

struct method_info {
  std::string extension_id;
  std::string extension_name;
  method_definition method;
};

struct extension_summary {
  std::string id;
  std::string name;
  std::vector<std::string> methods;
};

/// Registry of every extension, local or remote. Owns the method table,
/// the source route table and the subscription registry; all three only
/// change together under one exclusive lock.
class extension_manager {
public:
  using json = nlohmann::json;
  using event_sink = std::function<void(const gateway_event &)>;

  explicit extension_manager(config_provider provider = nullptr)
      : provider_(std::move(provider)), log_("ExtensionManager") {}

  ~extension_manager() {
    stop_all();
    force_kill_remote_hosts();
  }

  extension_manager(const extension_manager &) = delete;
  extension_manager &operator=(const extension_manager &) = delete;

  /// Receives every published event; the protocol layer fans it out to
  /// client connections. Returns once no call into the old sink is in
  /// flight, so the sink's owner may be destroyed afterwards.
  void set_event_sink(event_sink sink) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    sink_ = std::move(sink);
  }

  // --- registration ---

  /// Start `ext` and add it. Replaces an extension with the same id;
  /// throws registration_error if a method belongs to another extension
  /// or start() fails.
  void register_extension(std::shared_ptr<extension> ext) {
    if (!ext) {
      throw gateway_error(error_code::registration_error, "extension is null");
    }
    auto id = ext->id();
    if (id.empty()) {
      throw gateway_error(error_code::registration_error,
                          "extension id must not be empty");
    }

    auto cfg = lookup_config(id);
    auto reg = describe(*ext);
    if (cfg) {
      merge_routes(reg.source_routes, cfg->source_routes);
    }
    {
      std::shared_lock<std::shared_mutex> lock(mu_);
      check_conflicts(reg);
    }

    uint64_t sequence = next_sequence_.fetch_add(1) + 1;
    auto ctx = std::make_shared<detail::local_context>(
        *this, id, sequence, cfg ? cfg->config : json::object());
    auto events = std::make_shared<serial_dispatcher>("ext:" + id);

    try {
      ext->start(*ctx);
    } catch (const std::exception &e) {
      drop_subscriptions(sequence);
      events->stop();
      log_.error("Extension failed to start", {{"id", id}, {"error", e.what()}});
      throw gateway_error(error_code::registration_error,
                          "Extension " + id + " failed to start: " + e.what());
    }

    std::optional<entry> previous;
    try {
      previous = commit(reg, local_handle{ext, ctx, events}, sequence);
    } catch (const gateway_error &) {
      drop_subscriptions(sequence);
      events->stop();
      stop_quietly(*ext);
      throw;
    }

    log_.info("Registered local extension",
              {{"id", id}, {"methods", method_names(reg)},
               {"sourceRoutes", reg.source_routes}});
    if (previous) {
      auto *local = std::get_if<local_handle>(&previous->handle);
      if (local != nullptr && local->ext == ext) {
        // The same object again: it now runs under the new entry.
        local->events->stop();
      } else {
        dispose(*previous, nullptr);
      }
    }
  }

  /// Add an out-of-process extension. Re-registration under the same id
  /// (after a host restart) replaces the earlier entry.
  void register_remote(extension_registration reg,
                       std::shared_ptr<remote_host> host) {
    if (!host) {
      throw gateway_error(error_code::registration_error, "remote host is null");
    }
    if (reg.id.empty()) {
      throw gateway_error(error_code::registration_error,
                          "extension id must not be empty");
    }

    auto cfg = lookup_config(reg.id);
    if (cfg) {
      merge_routes(reg.source_routes, cfg->source_routes);
    }

    uint64_t sequence = next_sequence_.fetch_add(1) + 1;
    auto previous = commit(reg, remote_handle{host}, sequence);
    if (previous) {
      log_.info("Re-registering remote extension", {{"id", reg.id}});
    }
    log_.info("Registered remote extension",
              {{"id", reg.id}, {"methods", method_names(reg)},
               {"sourceRoutes", reg.source_routes}});
    if (previous) {
      dispose(*previous, host.get());
    }
  }

  /// Stop and remove `id`. Unknown ids are ignored.
  void unregister_extension(const std::string &id) {
    std::optional<entry> removed;
    {
      std::unique_lock<std::shared_mutex> lock(mu_);
      removed = remove_locked(id);
    }
    if (!removed) {
      return;
    }
    log_.info("Unregistered extension", {{"id", id}});
    dispose(*removed, nullptr);
  }

  void unregister_remote(const std::string &id) { unregister_extension(id); }

  // --- discovery ---

  bool has_extension(const std::string &id) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return entries_.count(id) != 0;
  }

  bool has_method(const std::string &method) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return methods_.count(method) != 0;
  }

  /// Accepts either "prefix" or a full "prefix/id" address.
  bool has_source_route(const std::string &address) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return routes_.count(source_prefix(address)) != 0;
  }

  std::optional<std::string> source_handler(const std::string &address) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = routes_.find(source_prefix(address));
    if (it == routes_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::map<std::string, std::string> source_routes() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return {routes_.begin(), routes_.end()};
  }

  std::vector<method_info> method_definitions() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<method_info> out;
    for (const auto &[id, e] : entries_) {
      for (const auto &method : e.registration.methods) {
        out.push_back({id, e.registration.name, method});
      }
    }
    return out;
  }

  std::vector<extension_summary> extension_list() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<extension_summary> out;
    for (const auto &[id, e] : entries_) {
      out.push_back({id, e.registration.name, method_names(e.registration)});
    }
    return out;
  }

  // --- dispatch ---

  /// Run `method` on its owner. Local params are validated against the
  /// declared schema; remote params are forwarded untouched together with
  /// the connection and call metadata.
  json handle_method(const std::string &method, const json &params,
                     const std::optional<std::string> &connection_id = std::nullopt,
                     const std::optional<call_context> &ctx = std::nullopt,
                     const std::vector<std::string> &tags = {}) {
    if (ctx && ctx->depth > kMaxCallDepth) {
      throw gateway_error(error_code::depth_exceeded,
                          "Call depth " + std::to_string(ctx->depth) +
                              " exceeds max (" + std::to_string(kMaxCallDepth) +
                              ") for " + method,
                          {{"traceId", ctx->trace_id}});
    }
    if (ctx && ctx->expired()) {
      throw gateway_error(error_code::timeout,
                          "Call deadline exceeded for " + method,
                          {{"traceId", ctx->trace_id}});
    }

    extension_handle handle;
    method_definition definition;
    {
      std::shared_lock<std::shared_mutex> lock(mu_);
      auto it = methods_.find(method);
      if (it == methods_.end()) {
        throw unknown_method_error(method);
      }
      auto owner = entries_.find(it->second.extension_id);
      if (owner == entries_.end()) {
        throw unknown_method_error(method);
      }
      handle = owner->second.handle;
      definition = it->second.definition;
    }

    const json args = params.is_null() ? json::object() : params;
    if (auto *local = std::get_if<local_handle>(&handle)) {
      validate(method, definition.input_schema, args);
      return local->ext->handle_method(method, args);
    }
    auto &remote = std::get<remote_handle>(handle);
    return remote.host->call_method(method, args, connection_id, ctx, tags);
  }

  /// Entry point for ctx.call() arriving from a host process.
  json call_from(const std::string &caller, const std::string &method,
                 const json &params, const std::optional<std::string> &connection_id,
                 const call_context &ctx) {
    log_.debug("Nested call", {{"caller", caller},
                               {"method", method},
                               {"traceId", ctx.trace_id},
                               {"depth", ctx.depth}});
    return handle_method(method, params, connection_id, ctx);
  }

  // --- events ---

  /// Deliver `event` to every remote host and every matching local
  /// subscription, except those owned by `skip_extension_id`. Each target
  /// is isolated: failures are logged and never reach the caller.
  void broadcast(const gateway_event &event,
                 const std::optional<std::string> &skip_extension_id = std::nullopt) {
    struct local_target {
      std::shared_ptr<serial_dispatcher> queue;
      std::string extension_id;
      event_handler handler;
    };
    std::vector<std::pair<std::string, std::shared_ptr<remote_host>>> remotes;
    std::vector<local_target> locals;
    {
      std::shared_lock<std::shared_mutex> lock(mu_);
      for (const auto &[id, e] : entries_) {
        if (skip_extension_id && id == *skip_extension_id) {
          continue;
        }
        if (auto *remote = std::get_if<remote_handle>(&e.handle)) {
          remotes.emplace_back(id, remote->host);
        }
      }
      for (const auto &sub : subscriptions_) {
        if (skip_extension_id && sub.extension_id == *skip_extension_id) {
          continue;
        }
        auto owner = entries_.find(sub.extension_id);
        if (owner == entries_.end() || owner->second.sequence != sub.owner) {
          continue;
        }
        if (!matches(event.type, sub.pattern)) {
          continue;
        }
        auto &local = std::get<local_handle>(owner->second.handle);
        locals.push_back({local.events, sub.extension_id, sub.handler});
      }
    }

    for (auto &[id, host] : remotes) {
      try {
        host->send_event(event);
      } catch (const std::exception &e) {
        log_.error("Failed to forward event to remote extension",
                   {{"id", id}, {"event", event.type}, {"error", e.what()}});
      }
    }

    auto shared = std::make_shared<const gateway_event>(event);
    for (auto &target : locals) {
      auto handler = std::move(target.handler);
      auto id = target.extension_id;
      bool queued = target.queue->post([this, handler, shared, id]() {
        try {
          handler(*shared);
        } catch (const std::exception &e) {
          log_.error("Event handler failed",
                     {{"id", id}, {"event", shared->type}, {"error", e.what()}});
        }
      });
      if (!queued) {
        log_.warn("Event queue full, dropping event",
                  {{"id", id}, {"event", event.type}});
      }
    }
  }

  /// Send `event` to client connections and to extensions.
  void publish(const gateway_event &event,
               const std::optional<std::string> &skip_extension_id = std::nullopt) {
    {
      // Held across the call; the sink must not call back into the manager.
      std::shared_lock<std::shared_mutex> lock(mu_);
      if (sink_) {
        try {
          sink_(event);
        } catch (const std::exception &e) {
          log_.error("Event sink failed", {{"event", event.type}, {"error", e.what()}});
        }
      }
    }
    broadcast(event, skip_extension_id);
  }

  /// Emission from a local extension's context.
  void emit_from(const std::string &extension_id, const std::string &type,
                 const json &payload, const emit_options &options) {
    auto event = make_event(type, payload);
    event.origin = "extension:" + extension_id;
    event.source = options.source;
    event.connection_id = options.connection_id;
    event.tags = options.tags;
    publish(event, extension_id);
  }

  /// Hand `event` to the extension owning the address prefix. False when no
  /// route matches or the owner failed; never throws.
  bool route_to_source(const std::string &address, const gateway_event &event) {
    auto prefix = source_prefix(address);
    std::string owner_id;
    extension_handle handle;
    {
      std::shared_lock<std::shared_mutex> lock(mu_);
      auto route = routes_.find(prefix);
      if (route == routes_.end()) {
        log_.debug("No source route", {{"source", address}});
        return false;
      }
      auto owner = entries_.find(route->second);
      if (owner == entries_.end()) {
        return false;
      }
      owner_id = owner->first;
      handle = owner->second.handle;
    }

    try {
      if (auto *local = std::get_if<local_handle>(&handle)) {
        local->ext->handle_source_response(address, event);
        return true;
      }
      return std::get<remote_handle>(handle).host->route_to_source(address, event);
    } catch (const std::exception &e) {
      log_.error("Failed to route to source",
                 {{"source", address}, {"extensionId", owner_id}, {"error", e.what()}});
      return false;
    }
  }

  // --- health & lifecycle ---

  std::map<std::string, health_status> health() const {
    std::vector<std::pair<std::string, extension_handle>> handles;
    {
      std::shared_lock<std::shared_mutex> lock(mu_);
      for (const auto &[id, e] : entries_) {
        handles.emplace_back(id, e.handle);
      }
    }

    std::map<std::string, health_status> out;
    for (const auto &[id, handle] : handles) {
      if (auto *local = std::get_if<local_handle>(&handle)) {
        try {
          out[id] = local->ext->health();
        } catch (const std::exception &e) {
          out[id] = {false, {{"error", e.what()}}};
        }
        continue;
      }
      const auto &host = std::get<remote_handle>(handle).host;
      out[id] = {host->is_running(), {{"remote", true}}};
    }
    return out;
  }

  /// Gracefully stop every remote host, escalating to force_kill() for
  /// hosts whose kill() fails or that are still alive afterwards. All hosts
  /// are interrupted first so calls nested across hosts fail fast.
  void kill_remote_hosts() {
    auto hosts = take_remote_hosts();
    interrupt_all(hosts);
    for (auto &[id, host] : hosts) {
      log_.info("Killing remote extension host", {{"id", id}});
      bool escalate = false;
      try {
        host->kill();
        escalate = host->is_running();
      } catch (const std::exception &e) {
        log_.error("Graceful kill failed, forcing",
                   {{"id", id}, {"error", e.what()}});
        escalate = true;
      }
      if (escalate) {
        force_kill_quietly(id, *host);
      }
    }
  }

  void force_kill_remote_hosts() {
    auto hosts = take_remote_hosts();
    interrupt_all(hosts);
    for (auto &[id, host] : hosts) {
      force_kill_quietly(id, *host);
    }
  }

  /// Stop every local extension in id order.
  void stop_all() {
    std::vector<entry> removed;
    {
      std::unique_lock<std::shared_mutex> lock(mu_);
      std::vector<std::string> ids;
      for (const auto &[id, e] : entries_) {
        if (std::holds_alternative<local_handle>(e.handle)) {
          ids.push_back(id);
        }
      }
      for (const auto &id : ids) {
        if (auto e = remove_locked(id)) {
          removed.push_back(std::move(*e));
        }
      }
    }
    for (auto &e : removed) {
      dispose(e, nullptr);
    }
  }

  /// Wait for queued local event deliveries.
  void drain() {
    std::vector<std::shared_ptr<serial_dispatcher>> queues;
    {
      std::shared_lock<std::shared_mutex> lock(mu_);
      for (const auto &[id, e] : entries_) {
        if (auto *local = std::get_if<local_handle>(&e.handle)) {
          queues.push_back(local->events);
        }
      }
    }
    for (auto &queue : queues) {
      queue->drain();
    }
  }

private:
  friend class detail::local_context;

  struct entry {
    extension_registration registration;
    extension_handle handle;
    uint64_t sequence = 0;
  };

  struct method_entry {
    std::string extension_id;
    method_definition definition;
  };

  struct subscription {
    uint64_t id = 0;
    std::string extension_id;
    uint64_t owner = 0;
    std::string pattern;
    event_handler handler;
  };

  std::optional<extension_config> lookup_config(const std::string &id) const {
    if (!provider_) {
      return std::nullopt;
    }
    auto cfg = provider_(id);
    if (cfg && !cfg->enabled) {
      throw gateway_error(error_code::registration_error,
                          "Extension " + id + " is disabled in config");
    }
    return cfg;
  }

  static void merge_routes(std::vector<std::string> &routes,
                           const std::vector<std::string> &extra) {
    for (const auto &prefix : extra) {
      if (std::find(routes.begin(), routes.end(), prefix) == routes.end()) {
        routes.push_back(prefix);
      }
    }
  }

  static std::vector<std::string> method_names(const extension_registration &reg) {
    std::vector<std::string> names;
    for (const auto &method : reg.methods) {
      names.push_back(method.name);
    }
    return names;
  }

  void check_conflicts(const extension_registration &reg) const {
    for (size_t i = 0; i < reg.methods.size(); ++i) {
      const auto &name = reg.methods[i].name;
      for (size_t j = 0; j < i; ++j) {
        if (reg.methods[j].name == name) {
          throw gateway_error(error_code::registration_error,
                              "Extension " + reg.id + " declares method " + name +
                                  " twice");
        }
      }
      auto it = methods_.find(name);
      if (it != methods_.end() && it->second.extension_id != reg.id) {
        throw gateway_error(error_code::registration_error,
                            "Method " + name + " is already registered by " +
                                it->second.extension_id,
                            {{"method", name}, {"owner", it->second.extension_id}});
      }
    }
  }

  /// Atomically install `reg`, returning the entry it replaced.
  std::optional<entry> commit(const extension_registration &reg,
                              extension_handle handle, uint64_t sequence) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    check_conflicts(reg);
    auto previous = remove_locked(reg.id);

    for (const auto &method : reg.methods) {
      methods_[method.name] = {reg.id, method};
    }
    for (const auto &prefix : reg.source_routes) {
      auto it = routes_.find(prefix);
      if (it != routes_.end() && it->second != reg.id) {
        log_.info("Source route taken over",
                  {{"prefix", prefix}, {"from", it->second}, {"to", reg.id}});
      }
      routes_[prefix] = reg.id;
    }
    entries_[reg.id] = entry{reg, std::move(handle), sequence};
    return previous;
  }

  /// Remove `id` and everything it owns. Source routes fall back to the
  /// most recently registered extension that also declares the prefix.
  std::optional<entry> remove_locked(const std::string &id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    entry removed = std::move(it->second);
    entries_.erase(it);

    for (const auto &method : removed.registration.methods) {
      auto m = methods_.find(method.name);
      if (m != methods_.end() && m->second.extension_id == id) {
        methods_.erase(m);
      }
    }

    for (const auto &prefix : removed.registration.source_routes) {
      auto route = routes_.find(prefix);
      if (route == routes_.end() || route->second != id) {
        continue;
      }
      const entry *fallback = nullptr;
      std::string fallback_id;
      for (const auto &[other_id, other] : entries_) {
        const auto &prefixes = other.registration.source_routes;
        if (std::find(prefixes.begin(), prefixes.end(), prefix) == prefixes.end()) {
          continue;
        }
        if (!fallback || other.sequence > fallback->sequence) {
          fallback = &other;
          fallback_id = other_id;
        }
      }
      if (fallback) {
        route->second = fallback_id;
      } else {
        routes_.erase(route);
      }
    }

    subscriptions_.erase(
        std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                       [&](const subscription &s) { return s.owner == removed.sequence; }),
        subscriptions_.end());
    return removed;
  }

  /// Release a removed entry outside the lock. A remote host that is being
  /// re-registered (`keep`) is left running.
  void dispose(entry &removed, const remote_host *keep) {
    if (auto *local = std::get_if<local_handle>(&removed.handle)) {
      local->events->stop();
      stop_quietly(*local->ext);
      return;
    }
    auto &host = std::get<remote_handle>(removed.handle).host;
    if (host.get() == keep) {
      return;
    }
    try {
      host->kill();
    } catch (const std::exception &e) {
      log_.error("Graceful kill failed, forcing",
                 {{"id", removed.registration.id}, {"error", e.what()}});
      force_kill_quietly(removed.registration.id, *host);
    }
  }

  void interrupt_all(
      const std::vector<std::pair<std::string, std::shared_ptr<remote_host>>> &hosts) {
    for (const auto &[id, host] : hosts) {
      try {
        host->interrupt();
      } catch (const std::exception &e) {
        log_.error("Interrupt failed", {{"id", id}, {"error", e.what()}});
      }
    }
  }

  void stop_quietly(extension &ext) {
    try {
      ext.stop();
    } catch (const std::exception &e) {
      log_.error("Extension stop failed", {{"id", ext.id()}, {"error", e.what()}});
    }
  }

  void force_kill_quietly(const std::string &id, remote_host &host) {
    try {
      host.force_kill();
    } catch (const std::exception &e) {
      log_.error("Force kill failed", {{"id", id}, {"error", e.what()}});
    }
  }

  std::vector<std::pair<std::string, std::shared_ptr<remote_host>>>
  take_remote_hosts() {
    std::vector<std::pair<std::string, std::shared_ptr<remote_host>>> hosts;
    std::unique_lock<std::shared_mutex> lock(mu_);
    std::vector<std::string> ids;
    for (const auto &[id, e] : entries_) {
      if (std::holds_alternative<remote_handle>(e.handle)) {
        ids.push_back(id);
      }
    }
    for (const auto &id : ids) {
      if (auto e = remove_locked(id)) {
        hosts.emplace_back(id, std::get<remote_handle>(e->handle).host);
      }
    }
    return hosts;
  }

  unsubscribe_fn subscribe(const std::string &extension_id, uint64_t owner,
                           const std::string &pattern, event_handler handler) {
    uint64_t id = next_subscription_.fetch_add(1) + 1;
    {
      std::unique_lock<std::shared_mutex> lock(mu_);
      subscriptions_.push_back({id, extension_id, owner, pattern, std::move(handler)});
    }
    return [this, id]() {
      std::unique_lock<std::shared_mutex> lock(mu_);
      subscriptions_.erase(
          std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                         [id](const subscription &s) { return s.id == id; }),
          subscriptions_.end());
    };
  }

  void drop_subscriptions(uint64_t owner) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    subscriptions_.erase(
        std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                       [owner](const subscription &s) { return s.owner == owner; }),
        subscriptions_.end());
  }

  config_provider provider_;
  logger log_;

  mutable std::shared_mutex mu_;
  std::map<std::string, entry> entries_;
  std::unordered_map<std::string, method_entry> methods_;
  std::unordered_map<std::string, std::string> routes_;
  std::vector<subscription> subscriptions_;
  event_sink sink_;

  std::atomic<uint64_t> next_sequence_{0};
  std::atomic<uint64_t> next_subscription_{0};
};

namespace detail {

inline unsubscribe_fn local_context::on(const std::string &pattern,
                                        event_handler handler) {
  return manager_.subscribe(id_, sequence_, pattern, std::move(handler));
}

inline void local_context::emit(const std::string &type,
                                const nlohmann::json &payload,
                                const emit_options &options) {
  manager_.emit_from(id_, type, payload, options);
}

} // namespace detail

} // namespace gatehouse
