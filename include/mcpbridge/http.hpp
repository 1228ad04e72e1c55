#pragma once

#include "transport.hpp"

#include <cctype>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace mcpbridge {

/// Largest request head accepted before the connection is dropped.
constexpr size_t kMaxRequestHead = 16384;

struct http_request {
  std::string method;
  std::string target;
  std::string version;
  /// Header names are lowercased.
  std::map<std::string, std::string> headers;

  std::string header(const std::string &name) const {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
  }
};

inline std::string to_lower(std::string s) {
  for (auto &c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

/// True if a comma-separated header value lists `token` (case-insensitive).
inline bool header_has_token(const std::string &value, std::string_view token) {
  std::istringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto start = item.find_first_not_of(" \t");
    auto end = item.find_last_not_of(" \t");
    if (start == std::string::npos)
      continue;
    if (to_lower(item.substr(start, end - start + 1)) == to_lower(std::string(token)))
      return true;
  }
  return false;
}

/// Parse a request head (everything before the blank line).
inline std::optional<http_request> parse_request_head(std::string_view head) {
  http_request req;

  auto line_end = head.find("\r\n");
  auto request_line = head.substr(0, line_end);
  auto sp1 = request_line.find(' ');
  if (sp1 == std::string_view::npos)
    return std::nullopt;
  auto sp2 = request_line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos)
    return std::nullopt;
  req.method = std::string(request_line.substr(0, sp1));
  req.target = std::string(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
  req.version = std::string(request_line.substr(sp2 + 1));
  if (req.method.empty() || req.target.empty() ||
      req.version.rfind("HTTP/", 0) != 0)
    return std::nullopt;

  while (line_end != std::string_view::npos) {
    auto start = line_end + 2;
    line_end = head.find("\r\n", start);
    auto line = head.substr(start, line_end == std::string_view::npos
                                       ? std::string_view::npos
                                       : line_end - start);
    if (line.empty())
      continue;
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
      return std::nullopt;
    std::string name = to_lower(std::string(line.substr(0, colon)));
    auto value = line.substr(colon + 1);
    auto vstart = value.find_first_not_of(" \t");
    auto vend = value.find_last_not_of(" \t");
    req.headers[name] = vstart == std::string_view::npos
                            ? std::string()
                            : std::string(value.substr(vstart, vend - vstart + 1));
  }
  return req;
}

/// Read a request head from `fd`. Returns nullopt on EOF, overflow or a
/// malformed head. Stops exactly at the blank line so no frame bytes are
/// consumed.
inline std::optional<http_request> read_request(int fd) {
  std::string head;
  head.reserve(1024);
  char ch = 0;
  while (head.size() < 4 || head.compare(head.size() - 4, 4, "\r\n\r\n") != 0) {
    if (!read_exact(fd, &ch, 1))
      return std::nullopt;
    head.push_back(ch);
    if (head.size() > kMaxRequestHead)
      return std::nullopt;
  }
  head.resize(head.size() - 4);
  return parse_request_head(head);
}

inline std::string_view status_text(int status) {
  switch (status) {
  case 101:
    return "Switching Protocols";
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  default:
    return "Internal Server Error";
  }
}

/// Write a complete response and mark the connection for closing.
inline bool write_response(int fd, int status, std::string_view content_type,
                           std::string_view body) {
  std::ostringstream res;
  res << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n";
  if (!content_type.empty())
    res << "Content-Type: " << content_type << "\r\n";
  res << "Content-Length: " << body.size() << "\r\n";
  res << "Connection: close\r\n\r\n";
  res << body;
  auto out = res.str();
  return send_all(fd, out.data(), out.size());
}

/// Write the 101 response that completes a WebSocket upgrade.
inline bool write_upgrade_response(int fd, const std::string &accept_key) {
  std::ostringstream res;
  res << "HTTP/1.1 101 Switching Protocols\r\n";
  res << "Upgrade: websocket\r\n";
  res << "Connection: Upgrade\r\n";
  res << "Sec-WebSocket-Accept: " << accept_key << "\r\n\r\n";
  auto out = res.str();
  return send_all(fd, out.data(), out.size());
}

} // namespace mcpbridge
