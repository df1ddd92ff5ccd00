// Extension host used by the host adapter tests. Methods are prefixed with
// the extension id so several instances can share one gateway.

#include "gatehouse/gatehouse.hpp"

#include <chrono>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>

namespace {

using json = nlohmann::json;

class fixture_extension : public gatehouse::extension {
public:
  explicit fixture_extension(std::string id) : id_(std::move(id)) {}

  std::string id() const override { return id_; }
  std::string name() const override { return "Fixture " + id_; }

  std::vector<gatehouse::method_definition> methods() const override {
    std::vector<gatehouse::method_definition> out;
    for (const char *suffix : {"echo", "sleep", "emit", "call", "fail", "config",
                               "last_event", "last_source", "crash", "pid"}) {
      out.push_back({id_ + "." + suffix, std::string("fixture ") + suffix, {}});
    }
    return out;
  }

  std::vector<std::string> events() const override { return {"*"}; }
  std::vector<std::string> source_routes() const override { return {id_}; }

  void start(gatehouse::extension_context &ctx) override {
    ctx_ = &ctx;
    if (ctx.config().value("failStart", false)) {
      throw std::runtime_error("configured to fail");
    }
    unsubscribe_ = ctx.on("*", [this](const gatehouse::gateway_event &event) {
      std::lock_guard<std::mutex> lock(mu_);
      last_event_ = gatehouse::to_json(event);
      ++events_seen_;
    });
  }

  void stop() override {
    if (unsubscribe_) {
      unsubscribe_();
    }
  }

  json handle_method(const std::string &method, const json &params) override {
    auto action = method.substr(method.find('.') + 1);
    if (action == "echo") {
      return params;
    }
    if (action == "sleep") {
      int ms = params.value("ms", 0);
      std::this_thread::sleep_for(std::chrono::milliseconds(ms));
      return {{"slept", ms}};
    }
    if (action == "emit") {
      gatehouse::emit_options options;
      options.source = gatehouse::optional_string(params, "source");
      ctx_->emit(params.value("event", std::string("fixture.emitted")),
                 params.value("payload", json::object()), options);
      return {{"emitted", true}};
    }
    if (action == "call") {
      auto result = ctx_->call(params.value("method", std::string()),
                               params.value("params", json::object()));
      return {{"result", result}};
    }
    if (action == "fail") {
      throw std::runtime_error(params.value("message", std::string("fixture failure")));
    }
    if (action == "config") {
      return ctx_->config();
    }
    if (action == "last_event") {
      std::lock_guard<std::mutex> lock(mu_);
      return {{"event", last_event_}, {"count", events_seen_}};
    }
    if (action == "last_source") {
      std::lock_guard<std::mutex> lock(mu_);
      return {{"source", last_source_}, {"event", last_source_event_}};
    }
    if (action == "crash") {
      ::_exit(params.value("code", 3));
    }
    if (action == "pid") {
      return {{"pid", static_cast<int>(::getpid())}};
    }
    throw gatehouse::unknown_method_error(method);
  }

  void handle_source_response(const std::string &source,
                              const gatehouse::gateway_event &event) override {
    if (source.find("/reject") != std::string::npos) {
      throw std::runtime_error("source rejected: " + source);
    }
    std::lock_guard<std::mutex> lock(mu_);
    last_source_ = source;
    last_source_event_ = gatehouse::to_json(event);
  }

  gatehouse::health_status health() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return {true, {{"eventsSeen", events_seen_}}};
  }

private:
  std::string id_;
  gatehouse::extension_context *ctx_ = nullptr;
  gatehouse::unsubscribe_fn unsubscribe_;

  mutable std::mutex mu_;
  json last_event_;
  int events_seen_ = 0;
  std::string last_source_;
  json last_source_event_;
};

} // namespace

int main() {
  const char *id = std::getenv(gatehouse::kExtensionIdEnv);
  fixture_extension ext(id != nullptr && *id != '\0' ? id : "fixture");
  return gatehouse::serve(ext);
}
