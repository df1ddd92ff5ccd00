#include "../include/gatehouse/config.hpp"
#include "../include/gatehouse/transport.hpp"

#include <arpa/inet.h>
#include <atomic>
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

std::string make_temp_socket_path() {
  char tmpl[] = "/tmp/gatehouse_transport_XXXXXX";
  int fd = ::mkstemp(tmpl);
  assert(fd >= 0);
  ::close(fd);
  std::remove(tmpl);
  return std::string(tmpl) + ".sock";
}

} // namespace

int main() {
  int passed = 0;

  // --- scheme ---
  assert(gatehouse::scheme("tcp://127.0.0.1:30086") == "tcp");
  ++passed;
  assert(gatehouse::scheme("unix:///tmp/x.sock") == "unix");
  ++passed;
  assert(gatehouse::scheme("stdio://") == "stdio");
  ++passed;
  assert(gatehouse::scheme("mem://") == "mem");
  ++passed;

  // --- default URI ---
  assert(gatehouse::kDefaultListenURI == "tcp://127.0.0.1:30086");
  ++passed;

  // --- parse_endpoint ---
  {
    auto parsed = gatehouse::parse_endpoint("tcp://:9000");
    assert(parsed.scheme == "tcp");
    ++passed;
    assert(parsed.host == "0.0.0.0");
    ++passed;
    assert(parsed.port == 9000);
    ++passed;

    auto unix_uri = gatehouse::parse_endpoint("unix:///tmp/gw.sock");
    assert(unix_uri.path == "/tmp/gw.sock");
    ++passed;

    auto no_port = gatehouse::parse_endpoint("tcp://127.0.0.1");
    assert(no_port.host == "127.0.0.1" && no_port.port == gatehouse::kDefaultPort);
    ++passed;

    assert(gatehouse::parse_endpoint("mem://unit").path == "unit");
    ++passed;

    for (const char *bad : {"tcp://127.0.0.1:http", "tcp://127.0.0.1:70000",
                            "127.0.0.1:9000", "unix://"}) {
      try {
        (void)gatehouse::parse_endpoint(bad);
        assert(false && "malformed URI should throw");
      } catch (const std::invalid_argument &) {
        ++passed;
      }
    }

    try {
      (void)gatehouse::parse_endpoint("unix:///tmp/" + std::string(200, 'x'));
      assert(false && "long unix path should throw");
    } catch (const std::invalid_argument &) {
      ++passed;
    }
  }

  // --- tcp listen, dial and line framing ---
  {
    auto lis = gatehouse::listen("tcp://127.0.0.1:0");
    auto *tcp = std::get_if<gatehouse::tcp_listener>(&lis);
    assert(tcp != nullptr);
    ++passed;
    assert(tcp->port > 0);
    ++passed;
    assert(gatehouse::describe(lis) ==
           "tcp://127.0.0.1:" + std::to_string(tcp->port));
    ++passed;

    auto client = gatehouse::dial(gatehouse::describe(lis));
    assert(gatehouse::wait_readable(gatehouse::listener_fd(lis), 1000));
    ++passed;
    auto server_conn = gatehouse::accept(lis);
    assert(server_conn.scheme == "tcp");
    ++passed;

    assert(gatehouse::write_line(client.write_fd, "{\"type\":\"ping\"}"));
    ++passed;
    assert(gatehouse::write_all(client.write_fd, "\r\n  \nsecond\r\n", 13));
    ++passed;

    gatehouse::line_reader reader(server_conn.read_fd);
    std::string line;
    assert(reader.read_line(line));
    ++passed;
    assert(line == "{\"type\":\"ping\"}");
    ++passed;
    assert(reader.read_line(line));
    ++passed;
    assert(line == "second");
    ++passed;

    gatehouse::close_connection(client);
    assert(!reader.read_line(line));
    ++passed;

    gatehouse::close_connection(server_conn);
    gatehouse::close_listener(lis);
  }

  // --- localhost resolves to loopback ---
  {
    auto lis = gatehouse::listen("tcp://localhost:0");
    auto port = std::get<gatehouse::tcp_listener>(lis).port;
    auto client = gatehouse::dial("tcp://localhost:" + std::to_string(port));
    auto server_conn = gatehouse::accept(lis);
    assert(gatehouse::write_line(client.write_fd, "lo"));
    gatehouse::line_reader reader(server_conn.read_fd);
    std::string line;
    assert(reader.read_line(line) && line == "lo");
    ++passed;
    gatehouse::close_connection(client);
    gatehouse::close_connection(server_conn);
    gatehouse::close_listener(lis);
  }

  // --- unix listen + dial ---
  {
    auto path = make_temp_socket_path();
    auto lis = gatehouse::listen("unix://" + path);
    assert(std::holds_alternative<gatehouse::unix_listener>(lis));
    ++passed;

    auto client = gatehouse::dial("unix://" + path);
    auto server_conn = gatehouse::accept(lis);
    assert(server_conn.scheme == "unix");
    ++passed;

    assert(gatehouse::write_line(server_conn.write_fd, "hello"));
    gatehouse::line_reader reader(client.read_fd);
    std::string line;
    assert(reader.read_line(line) && line == "hello");
    ++passed;

    gatehouse::close_connection(client);
    gatehouse::close_connection(server_conn);
    gatehouse::close_listener(lis);
    assert(::access(path.c_str(), F_OK) != 0);
    ++passed;
  }

  // --- stdio and mem ---
  {
    auto stdio_lis = gatehouse::listen("stdio://");
    assert(std::holds_alternative<gatehouse::stdio_listener>(stdio_lis));
    ++passed;

    auto stdio_conn = gatehouse::accept(stdio_lis);
    assert(stdio_conn.scheme == "stdio");
    ++passed;
    assert(!stdio_conn.owns_fds);
    ++passed;
    gatehouse::close_connection(stdio_conn);

    try {
      (void)gatehouse::accept(stdio_lis);
      assert(false && "stdio second accept should throw");
    } catch (const std::runtime_error &) {
      ++passed;
    }

    auto mem_lis = gatehouse::listen("mem://unit");
    assert(std::holds_alternative<gatehouse::mem_listener>(mem_lis));
    ++passed;

    auto mem_client = gatehouse::mem_dial(mem_lis);
    auto mem_server = gatehouse::accept(mem_lis);
    assert(mem_client.scheme == "mem");
    ++passed;
    assert(mem_server.scheme == "mem");
    ++passed;

    assert(gatehouse::write_line(mem_client.write_fd, "mem"));
    gatehouse::line_reader reader(mem_server.read_fd);
    std::string line;
    assert(reader.read_line(line) && line == "mem");
    ++passed;

    try {
      (void)gatehouse::mem_dial(mem_lis);
      assert(false && "mem second dial should throw");
    } catch (const std::runtime_error &) {
      ++passed;
    }

    gatehouse::close_connection(mem_server);
    gatehouse::close_connection(mem_client);
    gatehouse::close_listener(mem_lis);
  }

  // --- read_line gives up when the running flag drops ---
  {
    auto mem_lis = gatehouse::listen("mem://");
    auto client = gatehouse::mem_dial(mem_lis);
    auto server_conn = gatehouse::accept(mem_lis);

    std::atomic<bool> running{false};
    gatehouse::line_reader reader(server_conn.read_fd);
    std::string line;
    assert(!reader.read_line(line, &running, 10));
    ++passed;

    gatehouse::close_connection(client);
    gatehouse::close_connection(server_conn);
    gatehouse::close_listener(mem_lis);
  }

  // --- unsupported URI ---
  try {
    (void)gatehouse::listen("ftp://host");
    assert(false && "should have thrown");
  } catch (const std::invalid_argument &) {
    ++passed;
  }

  try {
    (void)gatehouse::dial("stdio://");
    assert(false && "should have thrown");
  } catch (const std::invalid_argument &) {
    ++passed;
  }

  // --- parse_flags ---
  assert(gatehouse::parse_flags({"--listen", "unix:///tmp/gw.sock"}).listen ==
         "unix:///tmp/gw.sock");
  ++passed;
  assert(gatehouse::parse_flags({"--port", "3000"}).listen == "tcp://127.0.0.1:3000");
  ++passed;
  assert(gatehouse::parse_flags({"--config", "/etc/gw.json"}).config_path ==
         "/etc/gw.json");
  ++passed;
  assert(gatehouse::parse_flags({}).listen.empty());
  ++passed;

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
