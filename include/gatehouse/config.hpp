#pragma once

#include "log.hpp"
#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace gatehouse {

/// Per-extension entry under "extensions" in the config file.
struct extension_config {
  bool enabled = false;
  std::vector<std::string> source_routes;
  /// argv of the host process for out-of-process extensions.
  std::vector<std::string> command;
  nlohmann::json config = nlohmann::json::object();
};

struct gateway_settings {
  std::string listen = std::string(kDefaultListenURI);
  std::string log_file;
  std::string log_level = "info";
  int request_timeout_ms = 300000;
};

struct gatehouse_config {
  gateway_settings gateway;
  std::map<std::string, extension_config> extensions;
  /// Path the config was read from, empty when defaults were used.
  std::string loaded_from;
};

/// Looked up once per extension at registration time.
using config_provider =
    std::function<std::optional<extension_config>(const std::string &id)>;

/// Replace ${VAR} in every string of `value`. Unset variables expand to
/// an empty string and are reported through `unset`.
inline nlohmann::json interpolate_env(const nlohmann::json &value,
                                      std::vector<std::string> *unset = nullptr) {
  if (value.is_string()) {
    const auto &text = value.get_ref<const std::string &>();
    std::string out;
    size_t pos = 0;
    while (pos < text.size()) {
      auto open = text.find("${", pos);
      if (open == std::string::npos) {
        out.append(text, pos, std::string::npos);
        break;
      }
      auto close = text.find('}', open + 2);
      if (close == std::string::npos) {
        out.append(text, pos, std::string::npos);
        break;
      }
      out.append(text, pos, open - pos);
      std::string var = text.substr(open + 2, close - open - 2);
      const char *env = std::getenv(var.c_str());
      if (env != nullptr) {
        out.append(env);
      } else if (unset != nullptr) {
        unset->push_back(var);
      }
      pos = close + 1;
    }
    return out;
  }

  if (value.is_array()) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &item : value) {
      out.push_back(interpolate_env(item, unset));
    }
    return out;
  }

  if (value.is_object()) {
    nlohmann::json out = nlohmann::json::object();
    for (auto it = value.begin(); it != value.end(); ++it) {
      out[it.key()] = interpolate_env(it.value(), unset);
    }
    return out;
  }

  return value;
}

inline std::vector<std::string> json_strings(const nlohmann::json &value,
                                             const std::string &what) {
  std::vector<std::string> out;
  if (value.is_null()) {
    return out;
  }
  if (!value.is_array()) {
    throw std::runtime_error(what + " must be an array of strings");
  }
  for (const auto &item : value) {
    if (!item.is_string()) {
      throw std::runtime_error(what + " must be an array of strings");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

inline gatehouse_config parse_config(const nlohmann::json &raw) {
  if (!raw.is_object()) {
    throw std::runtime_error("config root must be an object");
  }

  gatehouse_config config;
  if (raw.contains("gateway")) {
    const auto &gw = raw["gateway"];
    if (!gw.is_object()) {
      throw std::runtime_error("gateway must be an object");
    }
    config.gateway.listen = gw.value("listen", config.gateway.listen);
    if (gw.contains("port") && gw["port"].is_number_integer()) {
      config.gateway.listen =
          "tcp://" + gw.value("host", std::string("127.0.0.1")) + ":" +
          std::to_string(gw["port"].get<int>());
    }
    config.gateway.log_file = gw.value("logFile", config.gateway.log_file);
    config.gateway.log_level = gw.value("logLevel", config.gateway.log_level);
    config.gateway.request_timeout_ms =
        gw.value("requestTimeoutMs", config.gateway.request_timeout_ms);
  }

  if (raw.contains("extensions")) {
    const auto &exts = raw["extensions"];
    if (!exts.is_object()) {
      throw std::runtime_error("extensions must be an object");
    }
    for (auto it = exts.begin(); it != exts.end(); ++it) {
      const auto &entry = it.value();
      if (!entry.is_object()) {
        throw std::runtime_error("extensions." + it.key() +
                                 " must be an object");
      }
      extension_config ext;
      ext.enabled = entry.value("enabled", false);
      ext.source_routes =
          json_strings(entry.value("sourceRoutes", nlohmann::json()),
                       "extensions." + it.key() + ".sourceRoutes");
      ext.command = json_strings(entry.value("command", nlohmann::json()),
                                 "extensions." + it.key() + ".command");
      ext.config = entry.value("config", nlohmann::json::object());
      config.extensions[it.key()] = std::move(ext);
    }
  }
  return config;
}

inline bool file_exists(const std::string &path) {
  struct stat st {};
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

inline gatehouse_config read_config_file(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("cannot open: " + path);
  }

  nlohmann::json raw;
  try {
    raw = nlohmann::json::parse(file, nullptr, true, true);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error(path + ": " + e.what());
  }

  std::vector<std::string> unset;
  auto config = parse_config(interpolate_env(raw, &unset));
  config.loaded_from = path;
  for (const auto &var : unset) {
    logger("Config").warn("Environment variable is not set",
                          {{"variable", var}, {"path", path}});
  }
  return config;
}

/// Search order: explicit path, $GATEHOUSE_CONFIG,
/// ~/.gatehouse/gatehouse.json. Falls back to defaults.
inline gatehouse_config load_config(const std::string &explicit_path = "") {
  std::vector<std::string> candidates;
  if (!explicit_path.empty()) {
    if (!file_exists(explicit_path)) {
      throw std::runtime_error("cannot open: " + explicit_path);
    }
    candidates.push_back(explicit_path);
  }
  if (const char *env = std::getenv("GATEHOUSE_CONFIG")) {
    candidates.emplace_back(env);
  }
  if (const char *home = std::getenv("HOME")) {
    candidates.push_back(std::string(home) + "/.gatehouse/gatehouse.json");
  }

  for (const auto &path : candidates) {
    if (file_exists(path)) {
      return read_config_file(path);
    }
  }
  return gatehouse_config{};
}

inline std::vector<std::pair<std::string, extension_config>>
enabled_extensions(const gatehouse_config &config) {
  std::vector<std::pair<std::string, extension_config>> out;
  for (const auto &[id, ext] : config.extensions) {
    if (ext.enabled) {
      out.emplace_back(id, ext);
    }
  }
  return out;
}

inline config_provider make_config_provider(const gatehouse_config &config) {
  auto extensions = config.extensions;
  return [extensions](const std::string &id) -> std::optional<extension_config> {
    auto it = extensions.find(id);
    if (it == extensions.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

struct cli_options {
  std::string listen;
  std::string config_path;
};

/// Parse --listen, --port and --config from command-line args.
inline cli_options parse_flags(const std::vector<std::string> &args) {
  cli_options options;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--listen" && i + 1 < args.size()) {
      options.listen = args[++i];
    } else if (args[i] == "--port" && i + 1 < args.size()) {
      options.listen = "tcp://127.0.0.1:" + args[++i];
    } else if (args[i] == "--config" && i + 1 < args.size()) {
      options.config_path = args[++i];
    }
  }
  return options;
}

} // namespace gatehouse
