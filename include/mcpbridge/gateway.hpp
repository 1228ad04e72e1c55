#pragma once

#include "http.hpp"
#include "options.hpp"
#include "registry.hpp"
#include "route.hpp"
#include "session.hpp"
#include "transport.hpp"
#include "websocket.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mcpbridge {

/// HTTP + WebSocket front door. Serves /health and /servers and turns every
/// accepted /mcp/<name> upgrade into a session on its own thread.
class gateway {
public:
  using json = nlohmann::json;

  gateway(registry reg, const options &opts)
      : registry_(std::move(reg)), listen_uri_(opts.listen_uri),
        session_opts_{opts.kill_grace, opts.idle_timeout} {}

  ~gateway() {
    stop();
    if (listener_)
      close_listener(*listener_);
  }

  gateway(const gateway &) = delete;
  gateway &operator=(const gateway &) = delete;

  /// Bind the listener. Throws on failure.
  void start() {
    if (listener_)
      throw std::logic_error("gateway already started");
    listener_ = listen(listen_uri_);
    running_.store(true);
    spdlog::info("MCP Bridge Server listening on {}", describe(*listener_));
  }

  /// Bound TCP port, or 0 for a unix listener.
  int port() const {
    if (!listener_)
      return 0;
    if (auto *tcp = std::get_if<tcp_listener>(&*listener_))
      return tcp->port;
    return 0;
  }

  const registry &servers() const { return registry_; }

  size_t active_sessions() const {
    std::lock_guard<std::mutex> lock(mu_);
    return sessions_.size();
  }

  /// Accept connections until stop(). Each connection runs on its own
  /// worker thread; finished workers are joined as new ones start, the
  /// rest by stop().
  void serve() {
    if (!listener_)
      throw std::logic_error("gateway not started");

    while (running_.load()) {
      connection conn;
      try {
        conn = accept(*listener_);
      } catch (const std::exception &e) {
        if (!running_.load())
          break;
        spdlog::error("{}", e.what());
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        continue;
      }

      join_finished();

      std::lock_guard<std::mutex> lock(mu_);
      // stop() flips running_ under mu_, so a connection registered here is
      // always seen by its shutdown sweep.
      if (!running_.load()) {
        close_connection(conn);
        break;
      }
      uint64_t id = ++next_id_;
      try {
        workers_.emplace(id, std::thread([this, id, conn]() mutable {
                           handle(id, conn);
                         }));
        connections_[id] = conn.fd;
      } catch (const std::system_error &e) {
        spdlog::error("cannot start connection thread: {}", e.what());
        close_connection(conn);
      }
    }
  }

  /// Stop accepting, tear down every live session and join all connection
  /// workers. Safe to call more than once.
  void stop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      running_.store(false);
    }
    if (listener_)
      shutdown_listener(*listener_);

    std::vector<std::shared_ptr<session>> live;
    {
      std::lock_guard<std::mutex> lock(mu_);
      for (const auto &kv : sessions_)
        live.push_back(kv.second);
    }
    for (auto &s : live)
      s->shutdown(kCloseGoingAway, "Gateway shutting down");

    std::unordered_map<uint64_t, std::thread> workers;
    {
      std::lock_guard<std::mutex> lock(mu_);
      for (const auto &kv : connections_)
        ::shutdown(kv.second, SHUT_RDWR);
      workers.swap(workers_);
      finished_.clear();
    }
    for (auto &kv : workers)
      kv.second.join();
  }

private:
  void handle(uint64_t id, connection conn) {
    try {
      auto req = read_request(conn.fd);
      if (!req) {
        write_response(conn.fd, 400, "text/plain", "Bad Request");
      } else if (header_has_token(req->header("upgrade"), "websocket")) {
        handle_upgrade(id, conn, *req);
      } else {
        handle_http(conn, *req);
      }
    } catch (const std::exception &e) {
      spdlog::error("connection from {} failed: {}", conn.peer, e.what());
    }
    finish(id, conn);
  }

  void handle_http(const connection &conn, const http_request &req) {
    auto path = request_path(req.target);
    if (req.method == "GET" && path == "/health") {
      json body = {{"status", "ok"}, {"servers", registry_.names()}};
      write_response(conn.fd, 200, "application/json", body.dump());
      return;
    }
    if (req.method == "GET" && path == "/servers") {
      write_response(conn.fd, 200, "application/json",
                     registry_.to_json().dump());
      return;
    }
    write_response(conn.fd, 404, "text/plain", "Not Found");
  }

  void handle_upgrade(uint64_t id, const connection &conn,
                      const http_request &req) {
    const spawn_spec *spec = resolve_route(registry_, req.target);
    if (spec == nullptr) {
      if (auto name = route_name(req.target))
        spdlog::info("Connection rejected: Unknown server '{}'", *name);
      else
        spdlog::info("Connection rejected: no route for '{}'",
                     std::string(request_path(req.target)));
      write_response(conn.fd, 404, "text/plain", "Not Found");
      return;
    }

    auto key = req.header("sec-websocket-key");
    if (req.method != "GET" || key.empty() ||
        req.header("sec-websocket-version") != "13") {
      write_response(conn.fd, 400, "text/plain", "Bad WebSocket handshake");
      return;
    }
    if (!write_upgrade_response(conn.fd, websocket_accept_key(key)))
      return;

    auto s = std::make_shared<session>(*spec, conn.fd, session_opts_);
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!running_.load()) {
        websocket_stream ws(conn.fd, websocket_stream::role::server);
        ws.send_close(kCloseGoingAway, "Gateway shutting down");
        return;
      }
      sessions_[id] = s;
    }
    s->run();
  }

  void finish(uint64_t id, connection &conn) {
    std::lock_guard<std::mutex> lock(mu_);
    sessions_.erase(id);
    connections_.erase(id);
    close_connection(conn);
    finished_.push_back(id);
  }

  void join_finished() {
    std::vector<std::thread> done;
    {
      std::lock_guard<std::mutex> lock(mu_);
      for (auto id : finished_) {
        auto it = workers_.find(id);
        if (it == workers_.end())
          continue;
        done.push_back(std::move(it->second));
        workers_.erase(it);
      }
      finished_.clear();
    }
    for (auto &t : done)
      t.join();
  }

  registry registry_;
  std::string listen_uri_;
  session_options session_opts_;
  std::optional<listener> listener_;
  std::atomic<bool> running_{false};

  mutable std::mutex mu_;
  uint64_t next_id_ = 0;
  std::unordered_map<uint64_t, std::thread> workers_;
  std::vector<uint64_t> finished_;
  std::unordered_map<uint64_t, int> connections_;
  std::unordered_map<uint64_t, std::shared_ptr<session>> sessions_;
};

} // namespace mcpbridge
