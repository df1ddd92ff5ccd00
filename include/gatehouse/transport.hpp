#pragma once

#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <variant>

namespace gatehouse {

/// Default listen URI when neither config nor flags name one.
constexpr std::string_view kDefaultListenURI = "tcp://127.0.0.1:30086";
constexpr int kDefaultPort = 30086;

/// Listen and dial addresses, one per supported scheme:
///   tcp://host:port   host defaults to 0.0.0.0, port to kDefaultPort
///   unix:///path      filesystem socket, removed again on close
///   stdio://          this process's stdin/stdout, one connection
///   mem://[name]      in-process socket pair
struct endpoint {
  std::string scheme;
  std::string host;
  int port = 0;
  /// unix socket path, or the name of a mem:// pair.
  std::string path;
};

struct tcp_listener {
  int fd = -1;
  std::string host;
  int port = 0;
};

struct unix_listener {
  int fd = -1;
  std::string path;
};

struct stdio_listener {
  bool consumed = false;
};

/// In-process socket pair; the client side is taken with mem_dial().
struct mem_listener {
  int server_fd = -1;
  int client_fd = -1;
};

using listener =
    std::variant<tcp_listener, unix_listener, stdio_listener, mem_listener>;

/// One bidirectional byte stream. stdio connections do not own their fds.
struct connection {
  int read_fd = -1;
  int write_fd = -1;
  std::string scheme;
  bool owns_fds = true;
};

/// The part before "://", or the whole string when there is none.
inline std::string scheme(std::string_view uri) {
  auto pos = uri.find("://");
  return std::string(pos == std::string_view::npos ? uri : uri.substr(0, pos));
}

namespace detail {

constexpr int kListenBacklog = 64;

inline std::runtime_error os_error(const std::string &what) {
  return std::runtime_error(what + ": " + std::strerror(errno));
}

inline int parse_port(const std::string &text, const std::string &uri) {
  if (text.empty()) {
    return kDefaultPort;
  }
  int port = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      throw std::invalid_argument("invalid port in " + uri);
    }
    port = port * 10 + (c - '0');
    if (port > 65535) {
      throw std::invalid_argument("port out of range in " + uri);
    }
  }
  return port;
}

/// Closes the descriptor unless release() took it.
class fd_guard {
public:
  explicit fd_guard(int fd) : fd_(fd) {}
  ~fd_guard() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  fd_guard(const fd_guard &) = delete;
  fd_guard &operator=(const fd_guard &) = delete;

  int get() const { return fd_; }
  int release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

private:
  int fd_;
};

struct socket_address {
  sockaddr_storage storage{};
  socklen_t length = 0;

  int family() const { return storage.ss_family; }
  const sockaddr *get() const {
    return reinterpret_cast<const sockaddr *>(&storage);
  }
};

/// Dialing the wildcard address reaches the loopback listener.
inline socket_address socket_address_for(const endpoint &ep, bool dialing) {
  socket_address out;
  if (ep.scheme == "unix") {
    auto *un = reinterpret_cast<sockaddr_un *>(&out.storage);
    un->sun_family = AF_UNIX;
    std::memcpy(un->sun_path, ep.path.c_str(), ep.path.size() + 1);
    out.length = sizeof(sockaddr_un);
    return out;
  }

  std::string host = ep.host;
  if (host == "localhost" || (dialing && host == "0.0.0.0")) {
    host = "127.0.0.1";
  }
  auto *in = reinterpret_cast<sockaddr_in *>(&out.storage);
  in->sin_family = AF_INET;
  in->sin_port = htons(static_cast<uint16_t>(ep.port));
  if (::inet_pton(AF_INET, host.c_str(), &in->sin_addr) != 1) {
    throw std::invalid_argument("invalid tcp host: " + ep.host);
  }
  out.length = sizeof(sockaddr_in);
  return out;
}

inline int open_stream_socket(int family) {
  int fd = ::socket(family, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    throw os_error("socket");
  }
  return fd;
}

inline int bound_port(int fd) {
  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &len) != 0) {
    throw os_error("getsockname");
  }
  return ntohs(bound.sin_port);
}

} // namespace detail

/// Throws std::invalid_argument for unknown schemes and malformed
/// addresses.
inline endpoint parse_endpoint(const std::string &uri) {
  auto sep = uri.find("://");
  if (sep == std::string::npos) {
    throw std::invalid_argument("missing scheme in transport URI: " + uri);
  }
  endpoint ep;
  ep.scheme = uri.substr(0, sep);
  std::string rest = uri.substr(sep + 3);

  if (ep.scheme == "tcp") {
    auto colon = rest.rfind(':');
    ep.host = rest.substr(0, colon);
    ep.port = detail::parse_port(
        colon == std::string::npos ? std::string() : rest.substr(colon + 1), uri);
    if (ep.host.empty()) {
      ep.host = "0.0.0.0";
    }
  } else if (ep.scheme == "unix") {
    if (rest.empty()) {
      throw std::invalid_argument("unix URI needs a socket path: " + uri);
    }
    if (rest.size() >= sizeof(sockaddr_un{}.sun_path)) {
      throw std::invalid_argument("unix socket path too long: " + uri);
    }
    ep.path = rest;
  } else if (ep.scheme == "mem") {
    ep.path = rest;
  } else if (ep.scheme != "stdio") {
    throw std::invalid_argument("unsupported transport URI: " + uri);
  }
  return ep;
}

inline listener listen(const std::string &uri) {
  auto ep = parse_endpoint(uri);

  if (ep.scheme == "stdio") {
    return stdio_listener{};
  }
  if (ep.scheme == "mem") {
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
      throw detail::os_error("socketpair " + uri);
    }
    return mem_listener{fds[0], fds[1]};
  }

  auto address = detail::socket_address_for(ep, false);
  detail::fd_guard sock(detail::open_stream_socket(address.family()));
  if (ep.scheme == "tcp") {
    int one = 1;
    ::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  } else {
    // A stale socket file from an earlier run would fail bind().
    ::unlink(ep.path.c_str());
  }

  if (::bind(sock.get(), address.get(), address.length) != 0) {
    throw detail::os_error("bind " + uri);
  }
  if (::listen(sock.get(), detail::kListenBacklog) != 0) {
    throw detail::os_error("listen " + uri);
  }

  if (ep.scheme == "unix") {
    return unix_listener{sock.release(), ep.path};
  }
  int port = detail::bound_port(sock.get());
  return tcp_listener{sock.release(), ep.host, port};
}

/// Address a listener is bound to, for logging.
inline std::string describe(const listener &lis) {
  if (auto *tcp = std::get_if<tcp_listener>(&lis)) {
    return "tcp://" + tcp->host + ":" + std::to_string(tcp->port);
  }
  if (auto *unix_lis = std::get_if<unix_listener>(&lis)) {
    return "unix://" + unix_lis->path;
  }
  if (std::holds_alternative<stdio_listener>(lis)) {
    return "stdio://";
  }
  return "mem://";
}

/// Accept one connection from a listener.
/// - tcp/unix: OS socket accept
/// - stdio: single connection over stdin/stdout
/// - mem: server side of the in-process pair, once
inline connection accept(listener &lis) {
  if (auto *tcp = std::get_if<tcp_listener>(&lis)) {
    int fd = ::accept4(tcp->fd, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0) {
      throw std::runtime_error("accept(tcp) failed: " +
                               std::string(std::strerror(errno)));
    }
    return connection{fd, fd, "tcp", true};
  }

  if (auto *unix_lis = std::get_if<unix_listener>(&lis)) {
    int fd = ::accept4(unix_lis->fd, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0) {
      throw std::runtime_error("accept(unix) failed: " +
                               std::string(std::strerror(errno)));
    }
    return connection{fd, fd, "unix", true};
  }

  if (auto *stdio = std::get_if<stdio_listener>(&lis)) {
    if (stdio->consumed) {
      throw std::runtime_error("stdio:// accepts exactly one connection");
    }
    stdio->consumed = true;
    return connection{STDIN_FILENO, STDOUT_FILENO, "stdio", false};
  }

  auto &mem = std::get<mem_listener>(lis);
  if (mem.server_fd < 0) {
    throw std::runtime_error("mem:// server side already consumed");
  }
  int fd = mem.server_fd;
  mem.server_fd = -1;
  return connection{fd, fd, "mem", true};
}

/// Dial the client side of a mem:// listener.
inline connection mem_dial(listener &lis) {
  auto *mem = std::get_if<mem_listener>(&lis);
  if (mem == nullptr) {
    throw std::invalid_argument("mem_dial() requires mem:// listener");
  }
  if (mem->client_fd < 0) {
    throw std::runtime_error("mem:// client side already consumed");
  }
  int fd = mem->client_fd;
  mem->client_fd = -1;
  return connection{fd, fd, "mem", true};
}

/// Connect to a tcp:// or unix:// listener.
inline connection dial(const std::string &uri) {
  auto ep = parse_endpoint(uri);
  if (ep.scheme != "tcp" && ep.scheme != "unix") {
    throw std::invalid_argument("dial() supports tcp:// and unix:// only: " + uri);
  }

  auto address = detail::socket_address_for(ep, true);
  detail::fd_guard sock(detail::open_stream_socket(address.family()));
  if (::connect(sock.get(), address.get(), address.length) != 0) {
    throw detail::os_error("connect " + uri);
  }
  int fd = sock.release();
  return connection{fd, fd, ep.scheme, true};
}

/// Wait until `fd` is readable or `timeout_ms` passes.
inline bool wait_readable(int fd, int timeout_ms) {
  pollfd pfd{fd, POLLIN, 0};
  int rc = ::poll(&pfd, 1, timeout_ms);
  return rc > 0;
}

inline int listener_fd(const listener &lis) {
  if (auto *tcp = std::get_if<tcp_listener>(&lis)) {
    return tcp->fd;
  }
  if (auto *unix_lis = std::get_if<unix_listener>(&lis)) {
    return unix_lis->fd;
  }
  if (auto *mem = std::get_if<mem_listener>(&lis)) {
    return mem->server_fd;
  }
  return -1;
}

inline bool write_all(int fd, const void *data, size_t size) {
  const auto *ptr = static_cast<const char *>(data);
  size_t sent = 0;
  while (sent < size) {
    ssize_t n = ::write(fd, ptr + sent, size - sent);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    sent += static_cast<size_t>(n);
  }
  return true;
}

/// Write one newline-terminated message.
inline bool write_line(int fd, const std::string &line) {
  std::string framed = line;
  framed.push_back('\n');
  return write_all(fd, framed.data(), framed.size());
}

/// Buffered newline-delimited reader over a file descriptor.
class line_reader {
public:
  explicit line_reader(int fd) : fd_(fd) {}

  /// Returns false on EOF or read error. Blank lines are skipped.
  bool read_line(std::string &out) { return read_line(out, nullptr); }

  /// As above, but gives up once `running` turns false. The flag is
  /// checked every `poll_ms` while no input is pending.
  bool read_line(std::string &out, const std::atomic<bool> *running,
                 int poll_ms = 200) {
    while (true) {
      auto nl = buffer_.find('\n');
      if (nl != std::string::npos) {
        out = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);
        if (!out.empty() && out.back() == '\r') {
          out.pop_back();
        }
        if (out.find_first_not_of(" \t") == std::string::npos) {
          continue;
        }
        return true;
      }

      if (running != nullptr) {
        while (running->load() && !wait_readable(fd_, poll_ms)) {
        }
        if (!running->load()) {
          return false;
        }
      }

      char chunk[4096];
      ssize_t n = ::read(fd_, chunk, sizeof(chunk));
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n <= 0) {
        return false;
      }
      buffer_.append(chunk, static_cast<size_t>(n));
    }
  }

private:
  int fd_;
  std::string buffer_;
};

/// Unblock a reader on another thread without releasing the descriptor.
inline void shutdown_connection(const connection &conn) {
  if (conn.owns_fds && conn.read_fd >= 0) {
    ::shutdown(conn.read_fd, SHUT_RDWR);
  }
}

inline void close_connection(connection &conn) {
  if (!conn.owns_fds) {
    conn.read_fd = -1;
    conn.write_fd = -1;
    return;
  }
  if (conn.read_fd >= 0) {
    ::close(conn.read_fd);
  }
  if (conn.write_fd >= 0 && conn.write_fd != conn.read_fd) {
    ::close(conn.write_fd);
  }
  conn.read_fd = -1;
  conn.write_fd = -1;
}

inline void close_listener(listener &lis) {
  if (auto *tcp = std::get_if<tcp_listener>(&lis)) {
    if (tcp->fd >= 0) {
      ::shutdown(tcp->fd, SHUT_RDWR);
      ::close(tcp->fd);
      tcp->fd = -1;
    }
    return;
  }
  if (auto *unix_lis = std::get_if<unix_listener>(&lis)) {
    if (unix_lis->fd >= 0) {
      ::shutdown(unix_lis->fd, SHUT_RDWR);
      ::close(unix_lis->fd);
      unix_lis->fd = -1;
    }
    if (!unix_lis->path.empty()) {
      ::unlink(unix_lis->path.c_str());
    }
    return;
  }
  if (auto *mem = std::get_if<mem_listener>(&lis)) {
    if (mem->server_fd >= 0) {
      ::close(mem->server_fd);
      mem->server_fd = -1;
    }
    if (mem->client_fd >= 0) {
      ::close(mem->client_fd);
      mem->client_fd = -1;
    }
  }
}

} // namespace gatehouse
