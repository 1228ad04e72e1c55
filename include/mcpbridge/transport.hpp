#pragma once

#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <tuple>
#include <unistd.h>
#include <variant>

namespace mcpbridge {

/// Default transport URI when --listen is omitted.
constexpr std::string_view kDefaultURI = "tcp://:8000";

/// Extract the scheme from a transport URI.
inline std::string scheme(std::string_view uri) {
  auto pos = uri.find("://");
  return pos != std::string_view::npos ? std::string(uri.substr(0, pos))
                                       : std::string(uri);
}

/// Parsed transport URI.
struct parsed_uri {
  std::string raw;
  std::string scheme;
  std::string host;
  int port = 0;
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

using listener = std::variant<tcp_listener, unix_listener>;

/// One accepted stream socket. The fd is used for both directions.
struct connection {
  int fd = -1;
  std::string scheme;
  std::string peer;
};

inline std::tuple<std::string, int> split_host_port(const std::string &addr,
                                                     int default_port) {
  if (addr.empty())
    return {"0.0.0.0", default_port};

  auto pos = addr.rfind(':');
  if (pos == std::string::npos)
    return {addr, default_port};

  std::string host = addr.substr(0, pos);
  if (host.empty())
    host = "0.0.0.0";
  std::string port_text = addr.substr(pos + 1);
  int port = default_port;
  if (!port_text.empty()) {
    try {
      port = std::stoi(port_text);
    } catch (const std::exception &) {
      throw std::invalid_argument("invalid port: " + port_text);
    }
  }
  if (port < 0 || port > 65535)
    throw std::invalid_argument("port out of range: " + port_text);
  return {host, port};
}

inline parsed_uri parse_uri(const std::string &uri) {
  std::string s = scheme(uri);

  if (s == "tcp") {
    if (uri.rfind("tcp://", 0) != 0)
      throw std::invalid_argument("invalid tcp URI: " + uri);
    auto [host, port] = split_host_port(uri.substr(6), 8000);
    return {uri, "tcp", host, port, ""};
  }

  if (s == "unix") {
    if (uri.rfind("unix://", 0) != 0)
      throw std::invalid_argument("invalid unix URI: " + uri);
    auto path = uri.substr(7);
    if (path.empty())
      throw std::invalid_argument("invalid unix URI: " + uri);
    return {uri, "unix", "", 0, path};
  }

  throw std::invalid_argument("unsupported transport URI: " + uri);
}

inline listener listen(const std::string &uri) {
  auto parsed = parse_uri(uri);

  if (parsed.scheme == "tcp") {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
      throw std::runtime_error("socket() failed");

    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(parsed.port));
    if (parsed.host == "0.0.0.0") {
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, parsed.host.c_str(), &addr.sin_addr) != 1) {
      ::close(fd);
      throw std::runtime_error("invalid tcp host: " + parsed.host);
    }

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
      int err = errno;
      ::close(fd);
      throw std::runtime_error("bind() failed: " +
                               std::string(std::strerror(err)));
    }
    if (::listen(fd, 64) < 0) {
      ::close(fd);
      throw std::runtime_error("listen() failed");
    }

    // Port 0 asks the kernel for an ephemeral port; report the real one.
    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &len) == 0)
      parsed.port = ntohs(bound.sin_port);

    return tcp_listener{fd, parsed.host, parsed.port};
  }

  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0)
    throw std::runtime_error("socket() failed");

  ::unlink(parsed.path.c_str());
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", parsed.path.c_str());

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    ::close(fd);
    throw std::runtime_error("bind(unix) failed");
  }
  if (::listen(fd, 64) < 0) {
    ::close(fd);
    throw std::runtime_error("listen(unix) failed");
  }
  return unix_listener{fd, parsed.path};
}

inline int listener_fd(const listener &lis) {
  if (auto *tcp = std::get_if<tcp_listener>(&lis))
    return tcp->fd;
  return std::get<unix_listener>(lis).fd;
}

/// Human-readable listen address for log lines.
inline std::string describe(const listener &lis) {
  if (auto *tcp = std::get_if<tcp_listener>(&lis))
    return "tcp://" + tcp->host + ":" + std::to_string(tcp->port);
  return "unix://" + std::get<unix_listener>(lis).path;
}

/// Accept one connection from a listener.
/// Throws once the listener has been shut down or closed.
inline connection accept(listener &lis) {
  if (auto *tcp = std::get_if<tcp_listener>(&lis)) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    int fd = -1;
    do {
      fd = ::accept4(tcp->fd, reinterpret_cast<sockaddr *>(&addr), &len,
                     SOCK_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
      throw std::runtime_error("accept(tcp) failed: " +
                               std::string(std::strerror(errno)));
    }
    char ip[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return connection{fd, "tcp",
                      std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port))};
  }

  auto &unix_lis = std::get<unix_listener>(lis);
  int fd = -1;
  do {
    fd = ::accept4(unix_lis.fd, nullptr, nullptr, SOCK_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    throw std::runtime_error("accept(unix) failed: " +
                             std::string(std::strerror(errno)));
  }
  return connection{fd, "unix", unix_lis.path};
}

/// Wake a thread blocked in accept() without releasing the fd.
inline void shutdown_listener(listener &lis) {
  int fd = listener_fd(lis);
  if (fd >= 0)
    ::shutdown(fd, SHUT_RDWR);
}

inline void close_connection(connection &conn) {
  if (conn.fd >= 0) {
    ::close(conn.fd);
    conn.fd = -1;
  }
}

inline void close_listener(listener &lis) {
  if (auto *tcp = std::get_if<tcp_listener>(&lis)) {
    if (tcp->fd >= 0) {
      ::close(tcp->fd);
      tcp->fd = -1;
    }
    return;
  }
  auto &unix_lis = std::get<unix_listener>(lis);
  if (unix_lis.fd >= 0) {
    ::close(unix_lis.fd);
    unix_lis.fd = -1;
  }
  if (!unix_lis.path.empty())
    ::unlink(unix_lis.path.c_str());
}

inline bool send_all(int fd, const void *data, size_t size) {
  const auto *ptr = static_cast<const uint8_t *>(data);
  size_t sent = 0;
  while (sent < size) {
    ssize_t n = ::send(fd, ptr + sent, size - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      return false;
    sent += static_cast<size_t>(n);
  }
  return true;
}

inline bool read_exact(int fd, void *data, size_t size) {
  auto *ptr = static_cast<uint8_t *>(data);
  size_t got = 0;
  while (got < size) {
    ssize_t n = ::recv(fd, ptr + got, size - got, 0);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      return false;
    got += static_cast<size_t>(n);
  }
  return true;
}

} // namespace mcpbridge
