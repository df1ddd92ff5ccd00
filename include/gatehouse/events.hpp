#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gatehouse {

/// Event routed through the gateway. Never mutated after emission.
struct gateway_event {
  std::string type;
  nlohmann::json payload = nullptr;
  int64_t timestamp = 0;
  std::optional<std::string> origin;
  std::optional<std::string> source;
  std::optional<std::string> session_id;
  std::optional<std::string> connection_id;
  std::vector<std::string> tags;
};

inline int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline gateway_event make_event(std::string type, nlohmann::json payload) {
  gateway_event event;
  event.type = std::move(type);
  event.payload = std::move(payload);
  event.timestamp = now_ms();
  if (event.payload.is_object() && event.payload.contains("sessionId") &&
      event.payload["sessionId"].is_string()) {
    event.session_id = event.payload["sessionId"].get<std::string>();
  }
  return event;
}

inline std::vector<std::string_view> split_segments(std::string_view text) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    auto dot = text.find('.', start);
    if (dot == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, dot - start));
    start = dot + 1;
  }
}

/// Match a dot-delimited event type against a subscription pattern.
///   "*"          matches everything
///   "a.b"        exact match
///   "a.*"        any event under "a", at any depth
///   "a.*.c"      "*" stands for exactly one segment
inline bool matches(std::string_view event_type, std::string_view pattern) {
  if (pattern == "*") {
    return true;
  }
  if (pattern == event_type) {
    return true;
  }

  auto pattern_parts = split_segments(pattern);
  auto event_parts = split_segments(event_type);

  if (pattern_parts.size() == 2 && pattern_parts[1] == "*") {
    return event_parts[0] == pattern_parts[0];
  }

  if (pattern_parts.size() != event_parts.size()) {
    return false;
  }
  for (size_t i = 0; i < pattern_parts.size(); ++i) {
    if (pattern_parts[i] != "*" && pattern_parts[i] != event_parts[i]) {
      return false;
    }
  }
  return true;
}

template <typename Patterns>
bool matches_any(std::string_view event_type, const Patterns &patterns) {
  for (const auto &pattern : patterns) {
    if (matches(event_type, pattern)) {
      return true;
    }
  }
  return false;
}

// --- json conversion (wire names are camelCase) ---

inline nlohmann::json to_json(const gateway_event &event) {
  nlohmann::json j = {{"type", event.type},
                      {"payload", event.payload},
                      {"timestamp", event.timestamp}};
  if (event.origin) {
    j["origin"] = *event.origin;
  }
  if (event.source) {
    j["source"] = *event.source;
  }
  if (event.session_id) {
    j["sessionId"] = *event.session_id;
  }
  if (event.connection_id) {
    j["connectionId"] = *event.connection_id;
  }
  if (!event.tags.empty()) {
    j["tags"] = event.tags;
  }
  return j;
}

/// Wire form sent to clients and hosts: {type:"event", event, payload, ...}.
inline nlohmann::json event_message(const gateway_event &event) {
  nlohmann::json msg = to_json(event);
  msg["event"] = event.type;
  msg["type"] = "event";
  return msg;
}

inline std::optional<std::string> optional_string(const nlohmann::json &j,
                                                  const char *key) {
  if (j.is_object() && j.contains(key) && j[key].is_string()) {
    return j[key].get<std::string>();
  }
  return std::nullopt;
}

inline std::vector<std::string> string_list(const nlohmann::json &j,
                                            const char *key) {
  std::vector<std::string> out;
  if (!j.is_object() || !j.contains(key) || !j[key].is_array()) {
    return out;
  }
  for (const auto &item : j[key]) {
    if (item.is_string()) {
      out.push_back(item.get<std::string>());
    }
  }
  return out;
}

inline gateway_event event_from_json(const nlohmann::json &j) {
  gateway_event event;
  event.type = j.value("type", std::string());
  event.payload = j.contains("payload") ? j["payload"] : nlohmann::json();
  event.timestamp = j.contains("timestamp") && j["timestamp"].is_number()
                        ? j["timestamp"].get<int64_t>()
                        : now_ms();
  event.origin = optional_string(j, "origin");
  event.source = optional_string(j, "source");
  event.session_id = optional_string(j, "sessionId");
  event.connection_id = optional_string(j, "connectionId");
  event.tags = string_list(j, "tags");
  return event;
}

inline gateway_event event_from_message(const nlohmann::json &msg) {
  auto event = event_from_json(msg);
  event.type = msg.value("event", std::string());
  return event;
}

} // namespace gatehouse
