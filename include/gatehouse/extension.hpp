#pragma once

#include "error.hpp"
#include "events.hpp"
#include "log.hpp"
#include "schema.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace gatehouse {

/// Nested calls deeper than this fail with depth_exceeded.
constexpr int kMaxCallDepth = 8;

/// Propagated along extension-to-extension call chains.
struct call_context {
  std::string trace_id;
  int depth = 0;
  /// Absolute deadline in ms since epoch; 0 means none.
  int64_t deadline = 0;

  bool expired() const { return deadline != 0 && now_ms() > deadline; }
};

/// Random 128-bit hex correlation id for a new call chain.
inline std::string make_trace_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static const char digits[] = "0123456789abcdef";
  std::string out(32, '0');
  for (size_t i = 0; i < out.size(); i += 16) {
    uint64_t bits = rng();
    for (size_t j = 0; j < 16; ++j) {
      out[i + j] = digits[bits & 0xF];
      bits >>= 4;
    }
  }
  return out;
}

struct health_status {
  bool ok = true;
  nlohmann::json details = nullptr;
};

inline nlohmann::json to_json(const health_status &health) {
  nlohmann::json j = {{"ok", health.ok}};
  if (!health.details.is_null()) {
    j["details"] = health.details;
  }
  return j;
}

struct emit_options {
  std::optional<std::string> source;
  std::optional<std::string> connection_id;
  std::vector<std::string> tags;
};

using event_handler = std::function<void(const gateway_event &)>;
using unsubscribe_fn = std::function<void()>;

/// Capabilities handed to an extension in start().
class extension_context {
public:
  virtual ~extension_context() = default;

  virtual unsubscribe_fn on(const std::string &pattern,
                            event_handler handler) = 0;
  virtual void emit(const std::string &type, const nlohmann::json &payload,
                    const emit_options &options = {}) = 0;
  virtual const nlohmann::json &config() const = 0;
  virtual const logger &log() const = 0;
  /// Invoke another extension's method. Only extensions running in a host
  /// process can do this; in-process contexts throw not_supported.
  virtual nlohmann::json call(const std::string &method,
                              const nlohmann::json &params) = 0;
};

/// Capability provider exposing methods and emitting events.
class extension {
public:
  virtual ~extension() = default;

  virtual std::string id() const = 0;
  virtual std::string name() const = 0;
  virtual std::vector<method_definition> methods() const = 0;
  virtual std::vector<std::string> events() const { return {}; }
  virtual std::vector<std::string> source_routes() const { return {}; }

  virtual void start(extension_context &ctx) = 0;
  virtual void stop() = 0;

  /// Throws unknown_method for names not listed in methods().
  virtual nlohmann::json handle_method(const std::string &method,
                                       const nlohmann::json &params) = 0;

  virtual void handle_source_response(const std::string &source,
                                      const gateway_event &event) {
    (void)event;
    throw gateway_error(error_code::not_supported,
                        "Extension " + id() +
                            " does not handle source responses for " + source);
  }

  virtual health_status health() const { return {}; }
};

/// What an extension provides; sent by host processes when they start.
struct extension_registration {
  std::string id;
  std::string name;
  std::vector<method_definition> methods;
  std::vector<std::string> events;
  std::vector<std::string> source_routes;
};

inline extension_registration describe(const extension &ext) {
  return {ext.id(), ext.name(), ext.methods(), ext.events(),
          ext.source_routes()};
}

inline nlohmann::json to_json(const extension_registration &reg) {
  nlohmann::json methods = nlohmann::json::array();
  for (const auto &method : reg.methods) {
    methods.push_back(to_json(method));
  }
  return {{"id", reg.id},
          {"name", reg.name},
          {"methods", methods},
          {"events", reg.events},
          {"sourceRoutes", reg.source_routes}};
}

inline extension_registration registration_from_json(const nlohmann::json &j) {
  if (!j.is_object() || !j.contains("id") || !j["id"].is_string() ||
      j["id"].get<std::string>().empty()) {
    throw gateway_error(error_code::invalid_request,
                        "registration requires a non-empty id");
  }

  extension_registration reg;
  reg.id = j["id"].get<std::string>();
  reg.name = j.value("name", reg.id);
  if (j.contains("methods") && j["methods"].is_array()) {
    for (const auto &m : j["methods"]) {
      if (!m.is_object() || !m.contains("name") || !m["name"].is_string()) {
        continue;
      }
      method_definition def;
      def.name = m["name"].get<std::string>();
      def.description = m.value("description", std::string());
      def.schema_json = m.contains("inputSchema") ? m["inputSchema"]
                                                  : nlohmann::json::object();
      reg.methods.push_back(std::move(def));
    }
  }
  reg.events = string_list(j, "events");
  reg.source_routes = string_list(j, "sourceRoutes");
  return reg;
}

inline const method_definition *find_method(const std::vector<method_definition> &methods,
                                            const std::string &name) {
  for (const auto &method : methods) {
    if (method.name == name) {
      return &method;
    }
  }
  return nullptr;
}

/// Source addresses look like "<prefix>/<channel id>".
inline std::string source_prefix(const std::string &address) {
  return address.substr(0, address.find('/'));
}

} // namespace gatehouse
