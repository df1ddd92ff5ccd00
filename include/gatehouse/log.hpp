#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gatehouse {

struct log_options {
  std::string level = "info";
  /// Empty disables file output.
  std::string file;
  size_t max_file_size = 10 * 1024 * 1024;
  size_t max_files = 2;
};

namespace detail {

struct log_state {
  std::mutex mu;
  std::vector<spdlog::sink_ptr> sinks;
  spdlog::level::level_enum level = spdlog::level::info;
};

inline log_state &logging() {
  static log_state state;
  return state;
}

inline std::vector<spdlog::sink_ptr> &default_sinks(log_state &state) {
  if (state.sinks.empty()) {
    state.sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  return state.sinks;
}

} // namespace detail

/// Configure the sinks shared by every component logger. stdout is never
/// used because extension hosts reserve it for the IPC protocol.
inline void configure_logging(const log_options &options) {
  auto &state = detail::logging();
  std::lock_guard<std::mutex> lock(state.mu);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!options.file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        options.file, options.max_file_size, options.max_files));
  }
  state.sinks = sinks;
  state.level = spdlog::level::from_str(options.level);

  spdlog::apply_all([&](std::shared_ptr<spdlog::logger> l) {
    l->sinks() = sinks;
    l->set_level(state.level);
  });
}

/// Structured component logger: `info("Registered", {{"id", id}})`.
class logger {
public:
  using json = nlohmann::json;

  explicit logger(const std::string &component) {
    auto &state = detail::logging();
    std::lock_guard<std::mutex> lock(state.mu);
    log_ = spdlog::get(component);
    if (!log_) {
      auto &sinks = detail::default_sinks(state);
      log_ = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                              sinks.end());
      log_->set_level(state.level);
      log_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
      spdlog::register_logger(log_);
    }
  }

  void debug(const std::string &message, const json &meta = nullptr) const {
    write(spdlog::level::debug, message, meta);
  }
  void info(const std::string &message, const json &meta = nullptr) const {
    write(spdlog::level::info, message, meta);
  }
  void warn(const std::string &message, const json &meta = nullptr) const {
    write(spdlog::level::warn, message, meta);
  }
  void error(const std::string &message, const json &meta = nullptr) const {
    write(spdlog::level::err, message, meta);
  }

  const std::string &name() const { return log_->name(); }

private:
  void write(spdlog::level::level_enum level, const std::string &message,
             const json &meta) const {
    if (!log_->should_log(level)) {
      return;
    }
    if (meta.is_null() || (meta.is_object() && meta.empty())) {
      log_->log(level, "{}", message);
      return;
    }
    log_->log(level, "{} {}",
              message, meta.dump(-1, ' ', false, json::error_handler_t::replace));
  }

  std::shared_ptr<spdlog::logger> log_;
};

} // namespace gatehouse
