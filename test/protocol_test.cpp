#include "../include/gatehouse/host.hpp"
#include "../include/gatehouse/protocol.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <vector>

#ifndef GATEHOUSE_TEST_EXTENSION_PATH
#error "GATEHOUSE_TEST_EXTENSION_PATH must name the fixture executable"
#endif

namespace {

using json = nlohmann::json;

bool wait_for(const std::function<bool()> &pred, int timeout_ms = 5000) {
  auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < until) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return pred();
}

template <typename Fn>
gatehouse::gateway_error expect_error(Fn &&fn) {
  try {
    fn();
  } catch (const gatehouse::gateway_error &e) {
    return e;
  }
  assert(false && "expected gateway_error");
  return gatehouse::gateway_error(gatehouse::error_code::internal, "unreachable");
}

/// Emits "<id>.added" for every note; `sessionId` in params scopes the event.
class notes_extension : public gatehouse::extension {
public:
  explicit notes_extension(std::string id) : id_(std::move(id)) {}

  std::string id() const override { return id_; }
  std::string name() const override { return "Notes " + id_; }

  std::vector<gatehouse::method_definition> methods() const override {
    gatehouse::object_schema add;
    add.required("text", gatehouse::param_type::string, "Note body")
        .optional("sessionId", gatehouse::param_type::string);
    return {{id_ + ".add", "Add a note", add}, {id_ + ".fail", "Always fails", {}}};
  }

  void start(gatehouse::extension_context &ctx) override { ctx_ = &ctx; }
  void stop() override {}

  json handle_method(const std::string &method, const json &params) override {
    if (method == id_ + ".fail") {
      throw std::runtime_error("notes are broken");
    }
    ctx_->emit(id_ + ".added", params);
    return {{"stored", params["text"]}};
  }

private:
  std::string id_;
  gatehouse::extension_context *ctx_ = nullptr;
};

/// Client plus the events it has seen.
struct watcher {
  gatehouse::gateway_client client;
  std::mutex mu;
  std::vector<gatehouse::gateway_event> events;

  watcher() {
    client.on_event([this](const gatehouse::gateway_event &event) {
      std::lock_guard<std::mutex> lock(mu);
      events.push_back(event);
    });
  }

  size_t count() {
    std::lock_guard<std::mutex> lock(mu);
    return events.size();
  }

  size_t count(const std::string &type) {
    std::lock_guard<std::mutex> lock(mu);
    size_t n = 0;
    for (const auto &event : events) {
      n += event.type == type ? 1 : 0;
    }
    return n;
  }

  gatehouse::gateway_event last() {
    std::lock_guard<std::mutex> lock(mu);
    return events.back();
  }
};

/// Connect `w` to the server over a private socket pair; returns the
/// connection id the server assigned.
std::string connect_pair(gatehouse::gateway_server &server, watcher &w) {
  int fds[2];
  int rc = ::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds);
  assert(rc == 0);
  (void)rc;
  auto id = server.serve_connection(gatehouse::connection{fds[0], fds[0], "mem", true});
  w.client.attach(gatehouse::connection{fds[1], fds[1], "mem", true});
  return id;
}

json read_json(gatehouse::line_reader &reader) {
  std::string line;
  bool ok = reader.read_line(line);
  assert(ok);
  (void)ok;
  return json::parse(line);
}

} // namespace

int main() {
  int passed = 0;
  using gatehouse::error_code;
  gatehouse::ignore_sigpipe();

  gatehouse::extension_manager manager;
  manager.register_extension(std::make_shared<notes_extension>("notes"));
  manager.register_extension(std::make_shared<notes_extension>("alerts"));

  gatehouse::gateway_server server(manager);
  auto address = server.start("tcp://127.0.0.1:0");
  assert(address.rfind("tcp://127.0.0.1:", 0) == 0);
  ++passed;

  watcher a;
  a.client.connect(address);
  watcher b;
  auto b_id = connect_pair(server, b);
  assert(wait_for([&] { return server.client_count() == 2; }));
  ++passed;

  // --- ping and built-in methods ---
  {
    a.client.ping();
    ++passed;

    auto methods = a.client.invoke("gateway.list_methods")["methods"];
    bool saw_builtin = false;
    bool saw_extension = false;
    for (const auto &m : methods) {
      if (m["name"] == "gateway.subscribe" && m["source"] == "gateway") {
        saw_builtin = true;
      }
      if (m["name"] == "notes.add" && m["source"] == "extension" &&
          m["extensionId"] == "notes") {
        saw_extension = true;
        assert(m["inputSchema"]["required"][0] == "text");
      }
    }
    assert(saw_builtin && saw_extension);
    ++passed;

    auto extensions = a.client.invoke("gateway.list_extensions")["extensions"];
    assert(extensions.size() == 2);
    ++passed;
    assert(extensions[0]["id"] == "alerts" && extensions[1]["id"] == "notes");
    ++passed;
    assert(a.client.invoke("extension.list")["extensions"].size() == 2);
    ++passed;

    auto health = a.client.invoke("gateway.health");
    assert(health["status"] == "ok");
    ++passed;
    assert(health["clients"] == 2);
    ++passed;
    assert(health["extensions"]["notes"]["ok"] == true);
    ++passed;
  }

  // --- method errors keep their codes ---
  {
    assert(expect_error([&] { a.client.invoke("notes.add", json::object()); }).code() ==
           error_code::validation_error);
    ++passed;
    assert(expect_error([&] { a.client.invoke("notes.add", {{"text", 5}}); }).code() ==
           error_code::validation_error);
    ++passed;
    auto unknown = expect_error([&] { a.client.invoke("nobody.home"); });
    assert(unknown.code() == error_code::unknown_method);
    ++passed;
    assert(std::string(unknown.what()) == "No extension found for method: nobody.home");
    ++passed;
    auto failed = expect_error([&] { a.client.invoke("notes.fail"); });
    assert(failed.code() == error_code::internal);
    ++passed;
    assert(std::string(failed.what()) == "notes are broken");
    ++passed;
    assert(expect_error([&] {
             a.client.invoke("gateway.subscribe", {{"events", "notes.*"}});
           }).code() == error_code::validation_error);
    ++passed;
  }

  // --- subscriptions and extension scoping ---
  {
    auto subscribed = a.client.invoke("subscribe", {{"events", {"notes.*"}}});
    assert(subscribed["subscribed"][0] == "notes.*");
    ++passed;
    b.client.invoke("gateway.subscribe", {{"events", {"alerts.*"}}});

    watcher c;
    auto c_id = connect_pair(server, c);
    (void)c_id;
    c.client.invoke("subscribe", {{"events", {"*"}}, {"extensionId", "alerts"}});

    auto stored = a.client.invoke("notes.add", {{"text", "first"}});
    assert(stored["stored"] == "first");
    ++passed;
    assert(a.count("notes.added") == 1);
    ++passed;
    auto event = a.last();
    assert(event.origin && *event.origin == "extension:notes");
    ++passed;
    assert(event.payload["text"] == "first");
    ++passed;

    b.client.ping();
    c.client.ping();
    assert(b.count() == 0);
    ++passed;
    assert(c.count() == 0);
    ++passed;

    b.client.invoke("alerts.add", {{"text", "fire"}});
    assert(b.count("alerts.added") == 1);
    ++passed;
    assert(wait_for([&] { return c.count("alerts.added") == 1; }));
    ++passed;
    a.client.ping();
    assert(a.count() == 1);
    ++passed;

    // Subscribing again replaces the set.
    a.client.invoke("subscribe", {{"events", {"alerts.*"}}});
    b.client.invoke("alerts.add", {{"text", "again"}});
    assert(wait_for([&] { return a.count("alerts.added") == 1; }));
    ++passed;
    a.client.invoke("notes.add", {{"text", "unheard"}});
    assert(a.count("notes.added") == 1);
    ++passed;

    a.client.invoke("unsubscribe", {{"events", {"alerts.*"}}});
    b.client.invoke("alerts.add", {{"text", "quiet"}});
    a.client.ping();
    assert(a.count("alerts.added") == 1);
    ++passed;
    a.client.invoke("subscribe", {{"events", {"notes.*"}}});
  }

  // --- session scoping ---
  {
    watcher d;
    connect_pair(server, d);
    d.client.invoke("subscribe", {{"events", {"notes.*"}}, {"sessionId", "s1"}});

    a.client.invoke("notes.add", {{"text", "other"}, {"sessionId", "s2"}});
    d.client.ping();
    assert(d.count() == 0);
    ++passed;

    a.client.invoke("notes.add", {{"text", "mine"}, {"sessionId", "s1"}});
    assert(wait_for([&] { return d.count() == 1; }));
    ++passed;
    assert(d.last().session_id && *d.last().session_id == "s1");
    ++passed;

    a.client.invoke("notes.add", {{"text", "unscoped"}});
    assert(wait_for([&] { return d.count() == 2; }));
    ++passed;
  }

  // --- connection-targeted events ---
  {
    auto before = a.count();
    auto event = gatehouse::make_event("notes.private", {{"for", "b"}});
    event.connection_id = b_id;
    manager.publish(event);
    assert(wait_for([&] { return b.count("notes.private") == 1; }));
    ++passed;
    a.client.ping();
    assert(a.count() == before);
    ++passed;
    assert(b.last().connection_id && *b.last().connection_id == b_id);
    ++passed;

    event.connection_id = std::string("conn-does-not-exist");
    manager.publish(event);
    b.client.ping();
    assert(b.count("notes.private") == 1);
    ++passed;
  }

  // --- exclusive subscriptions: last subscriber wins ---
  {
    assert(wait_for([&] { return server.client_count() == 2; }));
    a.client.invoke("subscribe", {{"events", {"job.*"}}, {"exclusive", true}});
    auto e = std::make_unique<watcher>();
    connect_pair(server, *e);
    e->client.invoke("subscribe", {{"events", {"job.*"}}, {"exclusive", true}});

    manager.publish(gatehouse::make_event("job.ready", json::object()));
    assert(wait_for([&] { return e->count("job.ready") == 1; }));
    ++passed;
    a.client.ping();
    assert(a.count("job.ready") == 0);
    ++passed;

    e->client.close();
    assert(wait_for([&] { return server.client_count() == 2; }));
    e.reset();

    manager.publish(gatehouse::make_event("job.next", json::object()));
    assert(wait_for([&] { return a.count("job.next") == 1; }));
    ++passed;
  }

  // --- raw framing: malformed lines, one res per req ---
  {
    int fds[2];
    int rc = ::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds);
    assert(rc == 0);
    server.serve_connection(gatehouse::connection{fds[0], fds[0], "mem", true});
    gatehouse::connection raw{fds[1], fds[1], "mem", true};
    gatehouse::line_reader reader(raw.read_fd);

    assert(gatehouse::write_line(raw.write_fd, "{not json"));
    auto bad = read_json(reader);
    assert(bad["id"] == "unknown" && bad["ok"] == false);
    ++passed;
    assert(bad["code"] == "InvalidRequest");
    ++passed;

    assert(gatehouse::write_line(raw.write_fd, "[1,2]"));
    assert(read_json(reader)["id"] == "unknown");
    ++passed;

    assert(gatehouse::write_line(raw.write_fd, R"({"type":"req","id":"m1"})"));
    auto missing = read_json(reader);
    assert(missing["id"] == "m1" && missing["error"] == "Missing method");
    ++passed;

    assert(gatehouse::write_line(raw.write_fd, R"({"type":"hello","id":"h1"})"));
    auto unsupported = read_json(reader);
    assert(unsupported["id"] == "h1" && unsupported["ok"] == false);
    ++passed;

    assert(gatehouse::write_line(raw.write_fd, R"({"type":"ping","id":7})"));
    auto pong = read_json(reader);
    assert(pong["type"] == "pong" && pong["id"] == 7);
    ++passed;

    for (int i = 0; i < 3; ++i) {
      json req = {{"type", "req"},
                  {"id", "r" + std::to_string(i)},
                  {"method", i == 1 ? "nobody.home" : "gateway.health"}};
      assert(gatehouse::write_line(raw.write_fd, req.dump()));
    }
    for (int i = 0; i < 3; ++i) {
      auto res = read_json(reader);
      assert(res["type"] == "res");
      assert(res["id"] == "r" + std::to_string(i));
      assert(res["ok"] == (i != 1));
    }
    ++passed;

    gatehouse::close_connection(raw);
  }

  // --- remote extension behind the gateway ---
  {
    gatehouse::host_options options;
    options.command = {GATEHOUSE_TEST_EXTENSION_PATH};
    options.request_timeout_ms = 5000;
    auto self = std::make_shared<std::weak_ptr<gatehouse::process_host>>();
    auto host = std::make_shared<gatehouse::process_host>(
        "fx", options,
        [&manager](const gatehouse::gateway_event &event) { manager.publish(event, "fx"); },
        [&manager, self](const gatehouse::extension_registration &reg) {
          if (auto h = self->lock()) {
            manager.register_remote(reg, h);
          }
        },
        [&manager](const std::string &caller, const std::string &method,
                   const json &params, const std::optional<std::string> &connection_id,
                   const gatehouse::call_context &ctx) {
          return manager.call_from(caller, method, params, connection_id, ctx);
        });
    *self = host;
    host->spawn();
    assert(manager.has_extension("fx"));
    ++passed;

    auto echoed = a.client.invoke("fx.echo", {{"hello", "world"}});
    assert(echoed["hello"] == "world");
    ++passed;

    // Emitted while serving a's request, so only a sees it.
    a.client.invoke("subscribe", {{"events", {"fixture.*", "notes.*"}}});
    b.client.invoke("subscribe", {{"events", {"fixture.*"}}});
    a.client.invoke("fx.emit", {{"event", "fixture.reply"}, {"payload", {{"n", 1}}}});
    assert(wait_for([&] { return a.count("fixture.reply") == 1; }));
    ++passed;
    b.client.ping();
    assert(b.count("fixture.reply") == 0);
    ++passed;

    // Nested call from the host process into an in-process extension.
    auto before = a.count("notes.added");
    auto nested = a.client.invoke(
        "fx.call", {{"method", "notes.add"}, {"params", {{"text", "via fx"}}}});
    assert(nested["result"]["stored"] == "via fx");
    ++passed;
    assert(wait_for([&] { return a.count("notes.added") == before + 1; }));
    ++passed;

    auto health = a.client.invoke("gateway.health");
    assert(health["extensions"]["fx"]["ok"] == true);
    ++passed;
    assert(health["sourceRoutes"]["fx"] == "fx");
    ++passed;

    // Codes survive the hop through the host process and back.
    assert(expect_error([&] {
             a.client.invoke("fx.call", {{"method", "nobody.home"}});
           }).code() == error_code::unknown_method);
    ++passed;
    assert(expect_error([&] {
             a.client.invoke("fx.call", {{"method", "notes.add"}, {"params", json::object()}});
           }).code() == error_code::validation_error);
    ++passed;

    manager.kill_remote_hosts();
    assert(!host->is_running());
    ++passed;
    assert(expect_error([&] { a.client.invoke("fx.echo"); }).code() ==
           error_code::unknown_method);
    ++passed;
  }

  // --- mem:// listener ---
  {
    gatehouse::extension_manager mem_manager;
    mem_manager.register_extension(std::make_shared<notes_extension>("memo"));
    gatehouse::gateway_server mem_server(mem_manager);
    auto mem_address = mem_server.start("mem://");
    assert(mem_address == "mem://");
    ++passed;

    watcher m;
    m.client.attach(mem_server.dial_mem());
    m.client.invoke("subscribe", {{"events", {"memo.*"}}});
    m.client.invoke("memo.add", {{"text", "in memory"}});
    assert(m.count("memo.added") == 1);
    ++passed;
    m.client.close();
    mem_server.stop();
    assert(mem_server.client_count() == 0);
    ++passed;
  }

  // --- server torn down while events are being published ---
  {
    gatehouse::extension_manager shared_manager;
    auto doomed = std::make_unique<gatehouse::gateway_server>(shared_manager);
    doomed->start("mem://");
    watcher w;
    w.client.attach(doomed->dial_mem());
    w.client.invoke("subscribe", {{"events", {"tick"}}});

    std::atomic<bool> publishing{true};
    std::atomic<int> published{0};
    std::thread publisher([&] {
      while (publishing.load()) {
        shared_manager.publish(gatehouse::make_event("tick", {{"n", published.load()}}));
        ++published;
      }
    });
    assert(wait_for([&] { return w.count("tick") > 0; }));
    ++passed;

    w.client.close();
    doomed->stop();
    doomed.reset();
    int after_stop = published.load();
    assert(wait_for([&] { return published.load() > after_stop + 100; }));
    ++passed;
    publishing.store(false);
    publisher.join();
  }

  a.client.close();
  b.client.close();
  server.stop();
  assert(server.client_count() == 0);
  ++passed;

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
