#include "gatehouse/gatehouse.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

/// Spawn one out-of-process extension and wire it into the manager.
std::shared_ptr<gatehouse::process_host>
start_remote_extension(gatehouse::extension_manager &manager, const std::string &id,
                       const gatehouse::extension_config &ext,
                       const gatehouse::gateway_settings &settings,
                       const gatehouse::logger &log) {
  gatehouse::host_options options;
  options.command = ext.command;
  options.config = ext.config;
  options.request_timeout_ms = settings.request_timeout_ms;

  auto self = std::make_shared<std::weak_ptr<gatehouse::process_host>>();
  auto host = std::make_shared<gatehouse::process_host>(
      id, options,
      [&manager, id](const gatehouse::gateway_event &event) {
        manager.publish(event, id);
      },
      [&manager, &log, id, self](const gatehouse::extension_registration &reg) {
        if (reg.id != id) {
          log.warn("Extension registered under a different id",
                   {{"configured", id}, {"registered", reg.id}});
        }
        if (auto h = self->lock()) {
          manager.register_remote(reg, h);
        }
      },
      [&manager](const std::string &caller, const std::string &method,
                 const nlohmann::json &params,
                 const std::optional<std::string> &connection_id,
                 const gatehouse::call_context &ctx) {
        return manager.call_from(caller, method, params, connection_id, ctx);
      });
  *self = host;

  auto reg = host->spawn();
  if (!manager.has_extension(reg.id)) {
    host->kill();
    throw gatehouse::gateway_error(gatehouse::error_code::registration_error,
                                   "Extension " + id + " was not accepted");
  }
  return host;
}

} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  auto flags = gatehouse::parse_flags(args);

  gatehouse::gatehouse_config config;
  try {
    config = gatehouse::load_config(flags.config_path);
  } catch (const std::exception &e) {
    std::fprintf(stderr, "gatehouse: %s\n", e.what());
    return 1;
  }

  gatehouse::log_options log_options;
  log_options.level = config.gateway.log_level;
  log_options.file = config.gateway.log_file;
  gatehouse::configure_logging(log_options);
  gatehouse::logger log("Gateway");
  if (!config.loaded_from.empty()) {
    log.info("Loaded config", {{"path", config.loaded_from}});
  }

  gatehouse::ignore_sigpipe();
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  gatehouse::extension_manager manager(gatehouse::make_config_provider(config));
  gatehouse::gateway_server server(manager);

  std::vector<std::shared_ptr<gatehouse::process_host>> hosts;
  for (const auto &[id, ext] : gatehouse::enabled_extensions(config)) {
    if (ext.command.empty()) {
      log.warn("Extension has no command, skipping", {{"id", id}});
      continue;
    }
    try {
      hosts.push_back(start_remote_extension(manager, id, ext, config.gateway, log));
    } catch (const std::exception &e) {
      log.error("Failed to start extension", {{"id", id}, {"error", e.what()}});
    }
  }

  auto listen_uri = flags.listen.empty() ? config.gateway.listen : flags.listen;
  int status = 0;
  try {
    server.start(listen_uri);
    while (!g_stop.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    log.info("Shutting down");
  } catch (const std::exception &e) {
    log.error("Gateway failed", {{"listen", listen_uri}, {"error", e.what()}});
    status = 1;
  }

  server.stop();
  manager.kill_remote_hosts();
  manager.stop_all();
  manager.force_kill_remote_hosts();
  for (auto &host : hosts) {
    if (host->is_running()) {
      host->force_kill();
    }
  }
  return status;
}
